#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace nodal {

// ---------------------------------------------------------------------------
// Event types emitted on the EventBus during training.
// All events are small, copyable value types.
// ---------------------------------------------------------------------------

// Emitted once per propagate_all() call.
struct BackwardPassEvent {
    uint64_t iteration        = 0;
    size_t   nodes_evaluated  = 0;   // nodes whose dloss was accumulated
    size_t   memo_hits        = 0;   // consumer reads served from the memo
    size_t   stale_terminals  = 0;   // terminals without a seeded derivative
};

// Emitted for each terminal node that had no seeded loss derivative.
// The node's dloss defaulted to zero for this iteration.
struct StaleGradientEvent {
    uint64_t    iteration = 0;
    std::string node_id;
};

// Emitted once per apply_updates() call.
struct WeightUpdateEvent {
    uint64_t iteration      = 0;     // token of the pass the gradients came from
    size_t   edges_updated  = 0;
    double   learning_rate  = 0.0;
    double   max_abs_delta  = 0.0;   // largest |weight change| applied
};

// Emitted by the Trainer after each training step.
struct LossEvent {
    size_t step     = 0;
    double loss     = 0.0;
    double ema_loss = 0.0;
};

// Emitted at the start and end of each epoch by the Experiment runner.
struct EpochEvent {
    size_t epoch        = 0;
    bool   begin        = true;   // true = epoch start, false = epoch end
    double metric_value = 0.0;    // mean training loss at epoch end
};

} // namespace nodal
