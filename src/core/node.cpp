#include "node.hpp"
#include "errors.hpp"

#include <cmath>
#include <stdexcept>

namespace nodal {

const char* kind_name(NodeKind k) {
    switch (k) {
        case NodeKind::Input:    return "input";
        case NodeKind::Constant: return "constant";
        case NodeKind::Sum:      return "sum";
        case NodeKind::Sigmoid:  return "sigmoid";
    }
    throw std::invalid_argument("Unknown NodeKind");
}

double logistic(double z) {
    // Evaluate on the side where exp() cannot overflow.
    if (z >= 0.0) {
        return 1.0 / (1.0 + std::exp(-z));
    }
    const double e = std::exp(z);
    return e / (1.0 + e);
}

// ---------------------------------------------------------------------------
// Edges
// ---------------------------------------------------------------------------
const InputEdge* Node::find_input(NodeHandle producer) const {
    for (const auto& e : inputs)
        if (e.producer == producer) return &e;
    return nullptr;
}

InputEdge* Node::find_input(NodeHandle producer) {
    for (auto& e : inputs)
        if (e.producer == producer) return &e;
    return nullptr;
}

bool Node::add_input(NodeHandle producer, double weight) {
    if (!accepts_inputs())
        throw UnsupportedOperationError(
            std::string("Cannot wire an input into ") + kind_name(kind) +
            " node '" + id + "'");

    if (InputEdge* e = find_input(producer)) {
        e->weight = weight;
        return false;
    }
    inputs.push_back({ producer, weight });
    return true;
}

// ---------------------------------------------------------------------------
// Transfer functions and local derivatives
// ---------------------------------------------------------------------------
double Node::transfer(double z) const {
    switch (kind) {
        case NodeKind::Sum:     return z;
        case NodeKind::Sigmoid: return logistic(z);
        case NodeKind::Input:
        case NodeKind::Constant:
            break;
    }
    throw UnsupportedOperationError(
        std::string("transfer: ") + kind_name(kind) + " node '" + id +
        "' has no transfer function");
}

double Node::local_gradient() const {
    switch (kind) {
        case NodeKind::Sum:
            return 1.0;
        case NodeKind::Sigmoid: {
            const double a = cached_activation;
            return a * (1.0 - a);
        }
        case NodeKind::Input:
        case NodeKind::Constant:
            break;
    }
    throw NoInputsError(id);
}

double Node::derivative_against(NodeHandle producer) const {
    if (is_source()) throw NoInputsError(id);

    const InputEdge* e = find_input(producer);
    if (!e) throw NotAnInputError(id, "#" + std::to_string(producer));

    return local_gradient() * e->weight;
}

} // namespace nodal
