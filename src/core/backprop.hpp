#pragma once

#include "graph.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nodal {

// ---------------------------------------------------------------------------
// LossSeed: boundary condition of one backward pass.
//
//   iteration          - token identifying this pass (Graph::next_iteration())
//   output_derivatives - d(loss)/d(activation) for each terminal node, by id
// ---------------------------------------------------------------------------
struct LossSeed {
    uint64_t                                iteration = 0;
    std::unordered_map<std::string, double> output_derivatives;
};

// Strategy returning d(loss)/d(activation) for the named output node.
// Typically reads graph.last_activation(graph.lookup(id)).
using LossDerivativeFn = std::function<double(const Graph& graph, const std::string& node_id)>;

// Evaluate 'fn' for every handle in 'outputs' and collect the results.
LossSeed make_seed(const Graph& graph, uint64_t iteration,
                   const std::vector<NodeHandle>& outputs,
                   const LossDerivativeFn& fn);

struct BackwardStats {
    uint64_t iteration       = 0;
    size_t   nodes_evaluated = 0;
    size_t   memo_hits       = 0;
    size_t   stale_terminals = 0;
};

// ---------------------------------------------------------------------------
// propagate: d(loss)/d(activation of h), reverse mode.
//
//   d(loss)/d(n) = sum over consumers c of d(loss)/d(c) * d(c)/d(n)
//
// Terminal nodes take their value from the seed; a terminal missing from the
// seed gets 0.0 and a StaleGradientEvent is emitted. Each node is evaluated
// at most once per seed.iteration: later requests return the memoised dloss.
//
// The traversal uses an explicit stack, so graph depth is not bounded by the
// call stack. A consumer chain that loops back onto itself throws
// CycleDetectedError. Forward evaluation of every reachable Sigmoid node
// must have happened first (its local derivative uses the cached activation).
// ---------------------------------------------------------------------------
double propagate(Graph& graph, NodeHandle h, const LossSeed& seed,
                 BackwardStats* stats = nullptr);

// Run propagate() from every node in 'starts' (normally the Input nodes) and
// emit a BackwardPassEvent. Throws std::invalid_argument for iteration 0.
BackwardStats propagate_all(Graph& graph, const std::vector<NodeHandle>& starts,
                            const LossSeed& seed);

// Same, with the seed built from a loss-derivative strategy.
BackwardStats propagate_all(Graph& graph, const std::vector<NodeHandle>& starts,
                            uint64_t iteration,
                            const std::vector<NodeHandle>& outputs,
                            const LossDerivativeFn& loss_derivative);

} // namespace nodal
