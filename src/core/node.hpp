#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace nodal {

// Index of a node inside its owning Graph's arena.
using NodeHandle = int;
static constexpr NodeHandle INVALID_NODE = -1;

// ---------------------------------------------------------------------------
// Node kind tag. The set is closed: traversal and update code switch over
// it exhaustively and there is no extension point for user-defined kinds.
// ---------------------------------------------------------------------------
enum class NodeKind : uint8_t {
    Input    = 0,   // externally assigned value, no inputs
    Constant = 1,   // fixed value (e.g. a bias source), no inputs
    Sum      = 2,   // weighted sum of inputs
    Sigmoid  = 3,   // logistic(weighted sum of inputs)
};

const char* kind_name(NodeKind k);

// Numerically stable 1 / (1 + e^-z).
double logistic(double z);

// ---------------------------------------------------------------------------
// InputEdge: producer -> this node, with the weight applied to the
// producer's activation. Stored on the consumer side.
// ---------------------------------------------------------------------------
struct InputEdge {
    NodeHandle producer = INVALID_NODE;
    double     weight   = 0.0;
};

// ---------------------------------------------------------------------------
// TrainingState: per-node memo for the backward pass.
//
// last_derivative_iteration == token of the pass that last touched dloss.
// Token 0 is reserved: a freshly created node has never been propagated.
// on_stack is set while the node's consumers are still being accumulated.
// ---------------------------------------------------------------------------
struct TrainingState {
    uint64_t last_derivative_iteration = 0;
    double   dloss                     = 0.0;   // d(loss) / d(activation)
    bool     on_stack                  = false;
};

// ---------------------------------------------------------------------------
// Node: one scalar unit of the graph.
//
// Only the owning Graph creates nodes and mediates wiring between them;
// inputs and outputs refer to peers by handle, never by pointer.
// ---------------------------------------------------------------------------
struct Node {
    std::string             id;
    NodeKind                kind  = NodeKind::Sum;
    double                  value = 0.0;        // Input / Constant only
    std::vector<InputEdge>  inputs;             // unique per producer
    std::vector<NodeHandle> outputs;            // consumer back-links
    double                  cached_activation = 0.0;
    TrainingState           training;

    bool is_source() const noexcept {
        return kind == NodeKind::Input || kind == NodeKind::Constant;
    }
    bool accepts_inputs() const noexcept { return !is_source(); }

    // Edge from 'producer', or nullptr when not wired.
    const InputEdge* find_input(NodeHandle producer) const;
    InputEdge*       find_input(NodeHandle producer);

    // Register or overwrite the edge from 'producer'.
    // Returns true when a new edge was created, false when only the weight
    // changed. Throws UnsupportedOperationError on source nodes.
    bool add_input(NodeHandle producer, double weight);

    // Append a consumer back-link. Never fails, never deduplicates.
    void add_output(NodeHandle consumer) { outputs.push_back(consumer); }

    // Transfer function applied to the weighted input sum.
    double transfer(double z) const;

    // d(activation) / d(weighted sum), evaluated at cached_activation.
    double local_gradient() const;

    // Partial derivative of this node's activation with respect to the
    // activation of 'producer'. Sum: w. Sigmoid: a * (1 - a) * w.
    // Throws NoInputsError on source nodes and NotAnInputError when
    // 'producer' is not wired.
    double derivative_against(NodeHandle producer) const;
};

} // namespace nodal
