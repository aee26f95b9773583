#include "xor_sigmoid.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <stdexcept>

namespace nodal {

namespace {

constexpr std::array<std::array<double, 3>, 4> kPatterns = {{
    { 0.0, 0.0, 0.0 },
    { 0.0, 1.0, 1.0 },
    { 1.0, 0.0, 1.0 },
    { 1.0, 1.0, 0.0 },
}};

} // namespace

XorSigmoidExperiment::XorSigmoidExperiment(const ExperimentConfig& cfg)
    : Experiment(cfg) {}

void XorSigmoidExperiment::setup() {
    const size_t rows = std::max<size_t>(cfg_.samples, kPatterns.size());

    std::vector<double> inputs;
    std::vector<double> targets;
    inputs.reserve(rows * 2);
    targets.reserve(rows);
    for (size_t r = 0; r < rows; ++r) {
        const auto& p = kPatterns[r % kPatterns.size()];
        inputs.push_back(p[0]);
        inputs.push_back(p[1]);
        targets.push_back(p[2]);
    }
    data_ = std::make_unique<TrainingSet>(2, 1, std::move(inputs), std::move(targets));

    graph_ = std::make_unique<Graph>(uniform_weight_init(cfg_.seed));
    Graph& g = *graph_;

    const NodeHandle x1   = g.create_input("x1");
    const NodeHandle x2   = g.create_input("x2");
    const NodeHandle bias = g.create_constant("bias", 1.0);
    const NodeHandle h1   = g.create_sigmoid("h1");
    const NodeHandle h2   = g.create_sigmoid("h2");
    output_               = g.create_sigmoid("y");

    for (NodeHandle h : { h1, h2 })
        for (NodeHandle src : { x1, x2, bias })
            g.connect(src, h);
    for (NodeHandle src : { h1, h2, bias })
        g.connect(src, output_);

    inputs_  = { x1, x2 };
    trainer_ = std::make_unique<Trainer>(g, inputs_,
                                         std::vector<NodeHandle>{ output_ },
                                         *data_, learning_rate_or(0.5));
}

double XorSigmoidExperiment::pattern_accuracy() {
    if (!graph_) throw std::runtime_error("XorSigmoidExperiment: setup() has not run");
    size_t correct = 0;
    for (const auto& p : kPatterns) {
        graph_->set_value(inputs_[0], p[0]);
        graph_->set_value(inputs_[1], p[1]);
        const double y = graph_->activation(output_);
        if ((y >= 0.5 ? 1.0 : 0.0) == p[2]) ++correct;
    }
    return static_cast<double>(correct) / static_cast<double>(kPatterns.size());
}

double XorSigmoidExperiment::run_epoch(size_t epoch) {
    const double loss = trainer_->run_epoch();
    fmt::print("epoch {:3d}  loss={:.6f}  acc={:.2f}\n", epoch, loss, pattern_accuracy());
    return loss;
}

} // namespace nodal
