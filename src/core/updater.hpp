#pragma once

#include "graph.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace nodal {

struct UpdateStats {
    uint64_t iteration     = 0;
    size_t   edges_updated = 0;
    double   max_abs_delta = 0.0;
};

// ---------------------------------------------------------------------------
// apply_updates: one gradient-descent step on every input edge of 'nodes'.
//
// For a consumer c with cached dloss and an input edge (p, w):
//
//   gradient = c.dloss * local_gradient(c) * p.last_activation()
//   w       <- w - learning_rate * gradient
//
// local_gradient is 1 for Sum and a * (1 - a) for Sigmoid. Input and
// Constant nodes own no edges and are skipped.
//
// Must run after propagate_all() for the same iteration; running it against
// an older pass's dloss is not detected. Weights are read only by the
// forward pass, so the order in which nodes are updated does not matter.
// Throws std::invalid_argument for a negative or non-finite learning rate.
// Emits a WeightUpdateEvent.
// ---------------------------------------------------------------------------
UpdateStats apply_updates(Graph& graph, const std::vector<NodeHandle>& nodes,
                          double learning_rate);

// Every node in the graph.
UpdateStats apply_updates(Graph& graph, double learning_rate);

} // namespace nodal
