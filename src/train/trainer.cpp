#include "trainer.hpp"
#include "../core/loss.hpp"
#include "../stats/event_bus.hpp"
#include "../stats/events.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace nodal {

Trainer::Trainer(Graph& graph,
                 std::vector<NodeHandle> inputs,
                 std::vector<NodeHandle> outputs,
                 const TrainingSet& data,
                 double learning_rate)
    : graph_(graph)
    , inputs_(std::move(inputs))
    , outputs_(std::move(outputs))
    , data_(data)
{
    if (inputs_.size() != data_.num_inputs())
        throw std::invalid_argument("Trainer: input node count does not match training set");
    if (outputs_.size() != data_.num_outputs())
        throw std::invalid_argument("Trainer: output node count does not match training set");
    for (NodeHandle h : inputs_)
        if (graph_.node(h).kind != NodeKind::Input)
            throw std::invalid_argument("Trainer: '" + graph_.node(h).id + "' is not an input node");
    set_learning_rate(learning_rate);
}

void Trainer::set_learning_rate(double lr) {
    if (!std::isfinite(lr) || lr < 0.0)
        throw std::invalid_argument("Trainer: learning rate must be finite and >= 0");
    lr_ = lr;
}

double Trainer::step(size_t iteration) {
    data_.apply_inputs(graph_, inputs_, iteration);
    const std::vector<double> activations = graph_.evaluate(outputs_);
    const std::vector<double> targets     = data_.targets(iteration);
    const double loss = mse(activations, targets);

    const uint64_t token = graph_.next_iteration();
    last_backward_ = propagate_all(graph_, graph_.source_handles(), token, outputs_,
                                   mse_derivative(graph_, outputs_, targets));
    last_update_   = apply_updates(graph_, lr_);

    ema_.update(loss);
    EventBus::instance().emit(LossEvent{ step_, loss, ema_.mean() });
    ++step_;
    return loss;
}

double Trainer::run_epoch() {
    double total = 0.0;
    for (size_t r = 0; r < data_.num_rows(); ++r) total += step(r);
    return total / static_cast<double>(data_.num_rows());
}

std::vector<double> Trainer::predict(size_t iteration) {
    data_.apply_inputs(graph_, inputs_, iteration);
    return graph_.evaluate(outputs_);
}

double Trainer::average_loss() {
    double total = 0.0;
    for (size_t r = 0; r < data_.num_rows(); ++r)
        total += mse(predict(r), data_.targets(r));
    return total / static_cast<double>(data_.num_rows());
}

} // namespace nodal
