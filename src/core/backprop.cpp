#include "backprop.hpp"
#include "errors.hpp"
#include "../stats/event_bus.hpp"
#include "../stats/events.hpp"

#include <stdexcept>

namespace nodal {

namespace {

struct Frame {
    NodeHandle node           = INVALID_NODE;
    size_t     next           = 0;      // next index into node.outputs
    double     acc            = 0.0;    // partial chain-rule sum
    bool       child_returned = false;  // outputs[next] was just finalised
};

void check_iteration(uint64_t iteration) {
    if (iteration == 0)
        throw std::invalid_argument("propagate: iteration token 0 is reserved");
}

} // namespace

LossSeed make_seed(const Graph& graph, uint64_t iteration,
                   const std::vector<NodeHandle>& outputs,
                   const LossDerivativeFn& fn) {
    if (!fn) throw std::invalid_argument("make_seed: null loss derivative");
    LossSeed seed;
    seed.iteration = iteration;
    for (NodeHandle h : outputs) {
        const std::string& id = graph.node(h).id;
        seed.output_derivatives[id] = fn(graph, id);
    }
    return seed;
}

double propagate(Graph& graph, NodeHandle h, const LossSeed& seed,
                 BackwardStats* stats) {
    check_iteration(seed.iteration);
    BackwardStats local;
    BackwardStats& st = stats ? *stats : local;
    st.iteration = seed.iteration;

    Node& start = graph.node(h);
    if (start.training.last_derivative_iteration == seed.iteration) {
        ++st.memo_hits;
        return start.training.dloss;
    }

    std::vector<Frame> stack;
    auto enter = [&](NodeHandle n) {
        TrainingState& ts = graph.node(n).training;
        ts.last_derivative_iteration = seed.iteration;
        ts.on_stack                  = true;
        stack.push_back({ n, 0, 0.0, false });
    };

    enter(h);
    try {
        while (!stack.empty()) {
            Frame& f = stack.back();
            Node&  n = graph.node(f.node);

            if (f.next < n.outputs.size()) {
                const NodeHandle c  = n.outputs[f.next];
                const Node&      cn = graph.node(c);

                if (cn.training.last_derivative_iteration != seed.iteration) {
                    enter(c);   // invalidates f
                    continue;
                }
                if (cn.training.on_stack)
                    throw CycleDetectedError("Cycle through node '" + cn.id +
                                             "' during backward pass");
                if (!f.child_returned) ++st.memo_hits;

                f.acc += cn.training.dloss * cn.derivative_against(f.node);
                f.child_returned = false;
                ++f.next;
                continue;
            }

            // All consumers accumulated: finalise this node.
            if (n.outputs.empty()) {
                auto it = seed.output_derivatives.find(n.id);
                if (it != seed.output_derivatives.end()) {
                    n.training.dloss = it->second;
                } else {
                    n.training.dloss = 0.0;
                    ++st.stale_terminals;
                    EventBus::instance().emit(StaleGradientEvent{ seed.iteration, n.id });
                }
            } else {
                n.training.dloss = f.acc;
            }
            n.training.on_stack = false;
            ++st.nodes_evaluated;
            stack.pop_back();
            if (!stack.empty()) stack.back().child_returned = true;
        }
    } catch (const std::exception&) {
        // Unwind marks of unfinished nodes so a later pass starts clean.
        for (const Frame& fr : stack) {
            TrainingState& ts = graph.node(fr.node).training;
            ts.on_stack                  = false;
            ts.last_derivative_iteration = 0;
        }
        throw;
    }
    return start.training.dloss;
}

BackwardStats propagate_all(Graph& graph, const std::vector<NodeHandle>& starts,
                            const LossSeed& seed) {
    check_iteration(seed.iteration);
    BackwardStats st;
    st.iteration = seed.iteration;
    for (NodeHandle h : starts) propagate(graph, h, seed, &st);

    EventBus::instance().emit(BackwardPassEvent{
        st.iteration, st.nodes_evaluated, st.memo_hits, st.stale_terminals });
    return st;
}

BackwardStats propagate_all(Graph& graph, const std::vector<NodeHandle>& starts,
                            uint64_t iteration,
                            const std::vector<NodeHandle>& outputs,
                            const LossDerivativeFn& loss_derivative) {
    return propagate_all(graph, starts,
                         make_seed(graph, iteration, outputs, loss_derivative));
}

} // namespace nodal
