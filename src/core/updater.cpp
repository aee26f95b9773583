#include "updater.hpp"
#include "../stats/event_bus.hpp"
#include "../stats/events.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace nodal {

UpdateStats apply_updates(Graph& graph, const std::vector<NodeHandle>& nodes,
                          double learning_rate) {
    if (!std::isfinite(learning_rate) || learning_rate < 0.0)
        throw std::invalid_argument("apply_updates: learning rate must be finite and >= 0");

    UpdateStats st;
    st.iteration = graph.current_iteration();

    for (NodeHandle h : nodes) {
        Node& n = graph.node(h);
        if (n.is_source()) continue;

        const double delta_z = n.training.dloss * n.local_gradient();
        for (auto& e : n.inputs) {
            const double gradient = delta_z * graph.last_activation(e.producer);
            const double delta    = learning_rate * gradient;
            e.weight -= delta;
            st.max_abs_delta = std::max(st.max_abs_delta, std::fabs(delta));
            ++st.edges_updated;
        }
    }

    EventBus::instance().emit(WeightUpdateEvent{
        st.iteration, st.edges_updated, learning_rate, st.max_abs_delta });
    return st;
}

UpdateStats apply_updates(Graph& graph, double learning_rate) {
    std::vector<NodeHandle> all(graph.size());
    for (size_t i = 0; i < all.size(); ++i) all[i] = static_cast<NodeHandle>(i);
    return apply_updates(graph, all, learning_rate);
}

} // namespace nodal
