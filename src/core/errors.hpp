#pragma once

#include <stdexcept>
#include <string>

namespace nodal {

// ---------------------------------------------------------------------------
// Graph error taxonomy.
//
// Structural / setup errors are thrown immediately. Numerical bookkeeping
// gaps (a terminal node with no seeded loss derivative) are not errors: they
// are reported as a StaleGradientEvent and contribute zero gradient.
// ---------------------------------------------------------------------------
class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A node id is already present in the graph's registry.
class DuplicateNameError : public GraphError {
public:
    explicit DuplicateNameError(const std::string& id)
        : GraphError("Duplicate node id: " + id) {}
};

// Wiring or value assignment attempted against a node kind that forbids it.
class UnsupportedOperationError : public GraphError {
public:
    using GraphError::GraphError;
};

// Derivative requested against a producer that is not wired into the node.
class NotAnInputError : public GraphError {
public:
    NotAnInputError(const std::string& node_id, const std::string& input_id)
        : GraphError("Node '" + node_id + "' has no input '" + input_id + "'") {}
};

// Derivative requested on a source node (Input / Constant).
class NoInputsError : public GraphError {
public:
    explicit NoInputsError(const std::string& node_id)
        : GraphError("Node '" + node_id + "' has no inputs to differentiate against") {}
};

// A traversal found a back-edge.
class CycleDetectedError : public GraphError {
public:
    using GraphError::GraphError;
};

class UnknownNodeError : public GraphError {
public:
    explicit UnknownNodeError(const std::string& id)
        : GraphError("Unknown node id: " + id) {}
};

} // namespace nodal
