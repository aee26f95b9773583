#include "graph.hpp"
#include "errors.hpp"

#include <algorithm>
#include <queue>
#include <stdexcept>
#include <utility>

namespace nodal {

Graph::Graph() : Graph(uniform_weight_init(kDefaultWeightSeed)) {}

Graph::Graph(WeightInit weight_init) : weight_init_(std::move(weight_init)) {
    if (!weight_init_) throw std::invalid_argument("Graph: null WeightInit");
}

// ---------------------------------------------------------------------------
// Validation helpers
// ---------------------------------------------------------------------------
void Graph::validate_handle(NodeHandle h) const {
    if (h < 0 || static_cast<size_t>(h) >= nodes_.size())
        throw std::out_of_range("Invalid node handle: " + std::to_string(h));
}

const Node& Graph::node(NodeHandle h) const { validate_handle(h); return nodes_[h]; }
Node&       Graph::node(NodeHandle h)       { validate_handle(h); return nodes_[h]; }

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
NodeHandle Graph::add_node(const std::string& id, NodeKind kind, double value) {
    if (index_.count(id)) throw DuplicateNameError(id);

    const NodeHandle h = static_cast<NodeHandle>(nodes_.size());
    Node n;
    n.id                = id;
    n.kind              = kind;
    n.value             = value;
    n.cached_activation = value;
    nodes_.push_back(std::move(n));
    index_.emplace(id, h);
    return h;
}

NodeHandle Graph::create_input(const std::string& id, double initial_value) {
    return add_node(id, NodeKind::Input, initial_value);
}

NodeHandle Graph::create_constant(const std::string& id, double value) {
    return add_node(id, NodeKind::Constant, value);
}

NodeHandle Graph::create_sum(const std::string& id) {
    return add_node(id, NodeKind::Sum, 0.0);
}

NodeHandle Graph::create_sigmoid(const std::string& id) {
    return add_node(id, NodeKind::Sigmoid, 0.0);
}

// ---------------------------------------------------------------------------
// Wiring
// ---------------------------------------------------------------------------
void Graph::connect(NodeHandle producer, NodeHandle consumer) {
    validate_handle(producer);
    validate_handle(consumer);
    // Reject before drawing so a failed call leaves the generator untouched.
    if (!nodes_[consumer].accepts_inputs())
        throw UnsupportedOperationError(
            std::string("connect: ") + kind_name(nodes_[consumer].kind) +
            " node '" + nodes_[consumer].id + "' cannot consume '" +
            nodes_[producer].id + "'");
    connect(producer, consumer, weight_init_());
}

void Graph::connect(NodeHandle producer, NodeHandle consumer, double weight) {
    validate_handle(producer);
    validate_handle(consumer);
    Node& dst = nodes_[consumer];
    if (!dst.accepts_inputs())
        throw UnsupportedOperationError(
            std::string("connect: ") + kind_name(dst.kind) + " node '" + dst.id +
            "' cannot consume '" + nodes_[producer].id + "'");

    // The consumer side decides whether this is a new edge; the back-link
    // is added only then, so each edge has exactly one back-link.
    if (dst.add_input(producer, weight)) {
        nodes_[producer].add_output(consumer);
        ++num_edges_;
    }
}

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------
NodeHandle Graph::lookup(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) throw UnknownNodeError(id);
    return it->second;
}

bool Graph::contains(const std::string& id) const {
    return index_.count(id) != 0;
}

void Graph::set_value(NodeHandle h, double value) {
    Node& n = node(h);
    if (n.kind != NodeKind::Input)
        throw UnsupportedOperationError(
            std::string("set_value: ") + kind_name(n.kind) + " node '" + n.id +
            "' is not an input");
    n.value             = value;
    n.cached_activation = value;
}

// ---------------------------------------------------------------------------
// Forward pass
// ---------------------------------------------------------------------------
std::vector<NodeHandle> Graph::ancestors_in_order(NodeHandle h) const {
    enum : uint8_t { Unvisited = 0, OnPath = 1, Done = 2 };
    std::vector<uint8_t> state(nodes_.size(), Unvisited);

    // Iterative post-order DFS over input edges.
    std::vector<std::pair<NodeHandle, size_t>> stack;
    std::vector<NodeHandle> order;

    stack.emplace_back(h, 0);
    state[h] = OnPath;

    while (!stack.empty()) {
        auto& [cur, next] = stack.back();
        const Node& n = nodes_[cur];

        if (next < n.inputs.size()) {
            const NodeHandle p = n.inputs[next++].producer;
            if (state[p] == OnPath)
                throw CycleDetectedError("Cycle through node '" + nodes_[p].id +
                                         "' during forward evaluation");
            if (state[p] == Unvisited) {
                state[p] = OnPath;
                stack.emplace_back(p, 0);
            }
            continue;
        }

        state[cur] = Done;
        order.push_back(cur);
        stack.pop_back();
    }
    return order;
}

void Graph::compute_activation(Node& n) {
    if (n.is_source()) {
        n.cached_activation = n.value;
        return;
    }
    double z = 0.0;
    for (const auto& e : n.inputs)
        z += nodes_[e.producer].cached_activation * e.weight;
    n.cached_activation = n.transfer(z);
}

double Graph::activation(NodeHandle h) {
    validate_handle(h);
    for (NodeHandle a : ancestors_in_order(h))
        compute_activation(nodes_[a]);
    return nodes_[h].cached_activation;
}

double Graph::last_activation(NodeHandle h) const {
    return node(h).cached_activation;
}

std::vector<double> Graph::evaluate(const std::vector<NodeHandle>& handles) {
    std::vector<double> out;
    out.reserve(handles.size());
    for (NodeHandle h : handles) out.push_back(activation(h));
    return out;
}

// ---------------------------------------------------------------------------
// Edge queries
// ---------------------------------------------------------------------------
double Graph::derivative_against(NodeHandle consumer, const std::string& input_id) const {
    const Node& n = node(consumer);
    if (n.is_source()) throw NoInputsError(n.id);

    auto it = index_.find(input_id);
    if (it == index_.end() || !n.find_input(it->second))
        throw NotAnInputError(n.id, input_id);
    return n.derivative_against(it->second);
}

double Graph::weight(NodeHandle producer, NodeHandle consumer) const {
    const Node& dst = node(consumer);
    const InputEdge* e = dst.find_input(producer);
    if (!e) throw NotAnInputError(dst.id, node(producer).id);
    return e->weight;
}

std::vector<NodeHandle> Graph::input_handles() const {
    std::vector<NodeHandle> out;
    for (NodeHandle h = 0; h < static_cast<NodeHandle>(nodes_.size()); ++h)
        if (nodes_[h].kind == NodeKind::Input) out.push_back(h);
    return out;
}

std::vector<NodeHandle> Graph::source_handles() const {
    std::vector<NodeHandle> out;
    for (NodeHandle h = 0; h < static_cast<NodeHandle>(nodes_.size()); ++h)
        if (nodes_[h].is_source()) out.push_back(h);
    return out;
}

std::vector<NodeHandle> Graph::terminal_handles() const {
    std::vector<NodeHandle> out;
    for (NodeHandle h = 0; h < static_cast<NodeHandle>(nodes_.size()); ++h)
        if (nodes_[h].accepts_inputs() && nodes_[h].outputs.empty()) out.push_back(h);
    return out;
}

// ---------------------------------------------------------------------------
// Topological sort (Kahn's algorithm)
// ---------------------------------------------------------------------------
std::vector<NodeHandle> Graph::topological_order() const {
    const int n = static_cast<int>(nodes_.size());
    std::vector<size_t> deg(n, 0);
    for (int i = 0; i < n; ++i) deg[i] = nodes_[i].inputs.size();

    std::queue<NodeHandle> q;
    for (int i = 0; i < n; ++i)
        if (deg[i] == 0) q.push(i);

    std::vector<NodeHandle> order;
    order.reserve(n);
    while (!q.empty()) {
        NodeHandle u = q.front(); q.pop();
        order.push_back(u);
        for (NodeHandle c : nodes_[u].outputs)
            if (--deg[c] == 0) q.push(c);
    }

    if (static_cast<int>(order.size()) != n)
        throw CycleDetectedError("Graph has a cycle; no topological order exists");
    return order;
}

} // namespace nodal
