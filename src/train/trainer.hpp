#pragma once

#include "../core/backprop.hpp"
#include "../core/graph.hpp"
#include "../core/updater.hpp"
#include "../io/training_set.hpp"
#include "../stats/ema.hpp"

#include <cstddef>
#include <vector>

namespace nodal {

// ---------------------------------------------------------------------------
// Trainer: drives one graph through a TrainingSet with MSE loss and plain
// gradient descent.
//
// One step(iteration):
//   1. assign row 'iteration' to the input nodes
//   2. evaluate the output nodes
//   3. seed d(mse)/d(output) under a fresh iteration token
//   4. propagate_all() from every source node
//   5. apply_updates() over the whole graph
//
// The Trainer holds a reference to the graph and the training set; both
// must outlive it.
// ---------------------------------------------------------------------------
class Trainer {
public:
    Trainer(Graph& graph,
            std::vector<NodeHandle> inputs,
            std::vector<NodeHandle> outputs,
            const TrainingSet& data,
            double learning_rate);

    // One training step on row 'iteration'. Returns the pre-update loss.
    double step(size_t iteration);

    // One pass over every row in order. Returns the mean pre-update loss.
    double run_epoch();

    // Mean loss over every row, without touching the weights.
    double average_loss();

    // Output activations for row 'iteration', without touching the weights.
    std::vector<double> predict(size_t iteration);

    void   set_learning_rate(double lr);
    double learning_rate() const noexcept { return lr_; }

    size_t steps()       const noexcept { return step_; }
    double smoothed_loss() const noexcept { return ema_.mean(); }

    const BackwardStats& last_backward() const noexcept { return last_backward_; }
    const UpdateStats&   last_update()   const noexcept { return last_update_; }

private:
    Graph&                  graph_;
    std::vector<NodeHandle> inputs_;
    std::vector<NodeHandle> outputs_;
    const TrainingSet&      data_;
    double                  lr_   = 0.0;
    size_t                  step_ = 0;
    EmaScalar               ema_{0.05};

    BackwardStats last_backward_;
    UpdateStats   last_update_;
};

} // namespace nodal
