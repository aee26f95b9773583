#include "linear_sum.hpp"

#include <fmt/core.h>

#include <random>
#include <stdexcept>
#include <vector>

namespace nodal {

LinearSumExperiment::LinearSumExperiment(const ExperimentConfig& cfg)
    : Experiment(cfg) {}

double LinearSumExperiment::weight_a() const {
    if (!graph_) throw std::runtime_error("LinearSumExperiment: setup() has not run");
    return graph_->weight(a_, sum_);
}

double LinearSumExperiment::weight_b() const {
    if (!graph_) throw std::runtime_error("LinearSumExperiment: setup() has not run");
    return graph_->weight(b_, sum_);
}

// ---------------------------------------------------------------------------
// setup: generate rows and build the graph
// ---------------------------------------------------------------------------
void LinearSumExperiment::setup() {
    if (cfg_.samples == 0)
        throw std::invalid_argument("LinearSumExperiment: samples must be > 0");

    std::mt19937_64 rng(cfg_.seed);
    std::uniform_real_distribution<double> dist(0.0, 5.0);

    std::vector<double> inputs;
    std::vector<double> targets;
    inputs.reserve(cfg_.samples * 2);
    targets.reserve(cfg_.samples);
    for (size_t i = 0; i < cfg_.samples; ++i) {
        const double a = dist(rng);
        const double b = dist(rng);
        inputs.push_back(a);
        inputs.push_back(b);
        targets.push_back(a + 2.0 * b);
    }
    data_ = std::make_unique<TrainingSet>(2, 1, std::move(inputs), std::move(targets));

    graph_ = std::make_unique<Graph>(uniform_weight_init(cfg_.seed));
    a_   = graph_->create_input("a", 0.6);
    b_   = graph_->create_input("b", 1.0);
    sum_ = graph_->create_sum("s1");
    graph_->connect(a_, sum_, 1.0);
    graph_->connect(b_, sum_, 0.2);

    trainer_ = std::make_unique<Trainer>(*graph_,
                                         std::vector<NodeHandle>{ a_, b_ },
                                         std::vector<NodeHandle>{ sum_ },
                                         *data_,
                                         learning_rate_or(0.01));
}

// ---------------------------------------------------------------------------
// run_epoch
// ---------------------------------------------------------------------------
double LinearSumExperiment::run_epoch(size_t epoch) {
    const double loss = trainer_->run_epoch();
    fmt::print("epoch {:3d}  loss={:.6f}  w_a={:.4f}  w_b={:.4f}\n",
               epoch, loss, weight_a(), weight_b());
    return loss;
}

} // namespace nodal
