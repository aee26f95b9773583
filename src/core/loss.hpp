#pragma once

#include "backprop.hpp"
#include "graph.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nodal {

// ---------------------------------------------------------------------------
// mse: mean squared error between output activations and targets.
// ---------------------------------------------------------------------------
inline double mse(const std::vector<double>& activations,
                  const std::vector<double>& targets) {
    if (activations.size() != targets.size())
        throw std::invalid_argument("mse: activations and targets differ in length");
    if (activations.empty()) return 0.0;

    double total = 0.0;
    for (size_t i = 0; i < activations.size(); ++i) {
        const double diff = activations[i] - targets[i];
        total += diff * diff;
    }
    return total / static_cast<double>(activations.size());
}

// ---------------------------------------------------------------------------
// mse_derivative: loss-derivative strategy matching mse().
//
//   d(mse)/d(a_k) = 2 * (a_k - t_k) / n
//
// 'outputs' and 'targets' are parallel. The returned function reads each
// node's last activation by id, so the forward pass must have run first.
// Asking for a node that is not one of 'outputs' throws std::out_of_range.
// ---------------------------------------------------------------------------
inline LossDerivativeFn mse_derivative(const Graph& graph,
                                       const std::vector<NodeHandle>& outputs,
                                       const std::vector<double>& targets) {
    if (outputs.size() != targets.size())
        throw std::invalid_argument("mse_derivative: outputs and targets differ in length");

    std::unordered_map<std::string, double> by_id;
    for (size_t i = 0; i < outputs.size(); ++i)
        by_id[graph.node(outputs[i]).id] = targets[i];
    const double n = static_cast<double>(outputs.size());

    return [by_id = std::move(by_id), n](const Graph& g, const std::string& id) {
        const double target = by_id.at(id);
        return 2.0 * (g.last_activation(g.lookup(id)) - target) / n;
    };
}

} // namespace nodal
