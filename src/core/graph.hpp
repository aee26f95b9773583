#pragma once

#include "node.hpp"
#include "weight_init.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace nodal {

// ---------------------------------------------------------------------------
// Graph: arena of scalar nodes plus the name -> handle registry.
//
// Nodes are never removed, so handles stay valid for the graph's lifetime.
// Every edge is stored twice: as an InputEdge on the consumer and as a
// back-link in the producer's outputs. connect() is the only way to create
// an edge and keeps both sides in sync.
//
// A Graph is not synchronised. Wiring, forward passes, backward passes and
// weight updates MUST NOT run concurrently on the same graph.
// ---------------------------------------------------------------------------
class Graph {
public:
    Graph();
    explicit Graph(WeightInit weight_init);

    // Non-copyable: a copy would share the WeightInit's generator state.
    Graph(const Graph&)            = delete;
    Graph& operator=(const Graph&) = delete;
    Graph(Graph&&)                 = default;
    Graph& operator=(Graph&&)      = default;

    // Node construction. Throws DuplicateNameError if 'id' already exists.
    NodeHandle create_input   (const std::string& id, double initial_value = 0.0);
    NodeHandle create_constant(const std::string& id, double value);
    NodeHandle create_sum     (const std::string& id);
    NodeHandle create_sigmoid (const std::string& id);

    // Wire producer -> consumer. Without an explicit weight the graph's
    // WeightInit supplies one. Re-wiring an existing pair overwrites its
    // weight. Throws UnsupportedOperationError (graph unchanged) when the
    // consumer is an Input or Constant node.
    void connect(NodeHandle producer, NodeHandle consumer);
    void connect(NodeHandle producer, NodeHandle consumer, double weight);

    // Registry lookup.
    NodeHandle lookup(const std::string& id) const;
    bool       contains(const std::string& id) const;

    // Assign the value of an Input node for the current training row.
    void set_value(NodeHandle h, double value);

    // Forward evaluation. Recomputes every ancestor of 'h' from scratch,
    // caches each visited node's activation and returns h's activation.
    // Throws CycleDetectedError if the ancestors contain a cycle.
    double activation(NodeHandle h);

    // Cached activation from the last forward pass that visited 'h'.
    double last_activation(NodeHandle h) const;

    // Force evaluation of each handle in order; returns their activations.
    std::vector<double> evaluate(const std::vector<NodeHandle>& handles);

    // d(activation of consumer) / d(activation of the node named input_id).
    double derivative_against(NodeHandle consumer, const std::string& input_id) const;

    // Weight stored on the consumer for the edge producer -> consumer.
    double weight(NodeHandle producer, NodeHandle consumer) const;

    // All Input nodes; all Input and Constant nodes; all non-source nodes
    // with no consumers.
    std::vector<NodeHandle> input_handles() const;
    std::vector<NodeHandle> source_handles() const;
    std::vector<NodeHandle> terminal_handles() const;

    // Kahn's algorithm over every node. Throws CycleDetectedError.
    std::vector<NodeHandle> topological_order() const;

    // Fresh iteration token for a backward pass. Never returns 0.
    uint64_t next_iteration() noexcept { return ++iteration_; }
    uint64_t current_iteration() const noexcept { return iteration_; }

    size_t size()       const noexcept { return nodes_.size(); }
    size_t num_edges()  const noexcept { return num_edges_; }

    const Node& node(NodeHandle h) const;
    Node&       node(NodeHandle h);

private:
    std::vector<Node>                           nodes_;
    std::unordered_map<std::string, NodeHandle> index_;
    WeightInit                                  weight_init_;
    uint64_t                                    iteration_ = 0;
    size_t                                      num_edges_ = 0;

    NodeHandle add_node(const std::string& id, NodeKind kind, double value);
    void       validate_handle(NodeHandle h) const;

    // Ancestors of 'h' (inclusive) in dependency order.
    std::vector<NodeHandle> ancestors_in_order(NodeHandle h) const;

    // Evaluate one node from its producers' cached activations.
    void compute_activation(Node& n);
};

} // namespace nodal
