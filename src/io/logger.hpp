#pragma once

#include "../stats/event_bus.hpp"
#include "../stats/events.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <mutex>
#include <string>

namespace nodal {

// ---------------------------------------------------------------------------
// Logger: subscribes to the EventBus (async) and writes one JSON object per
// line (JSONL) to a log file.
//
// Each entry carries a "type" field: "backward", "stale_gradient",
// "weight_update", "loss" or "epoch".
//
// File is flushed every flush_every entries and on destruction.
// ---------------------------------------------------------------------------
class Logger {
public:
    // Opens the log file (truncating if it exists).
    explicit Logger(const std::string& path, size_t flush_every = 100);
    ~Logger();

    // Start / stop receiving events.
    void attach();
    void detach();

    void flush();

    size_t entries_written() const;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    void write(const nlohmann::json& entry);

    void on_backward_pass (const BackwardPassEvent& ev);
    void on_stale_gradient(const StaleGradientEvent& ev);
    void on_weight_update (const WeightUpdateEvent& ev);
    void on_loss          (const LossEvent& ev);
    void on_epoch         (const EpochEvent& ev);

    std::string        path_;
    std::ofstream      file_;
    mutable std::mutex mutex_;
    size_t             flush_every_;
    size_t             write_count_ = 0;

    SubID sub_backward_ = INVALID_SUB_ID;
    SubID sub_stale_    = INVALID_SUB_ID;
    SubID sub_update_   = INVALID_SUB_ID;
    SubID sub_loss_     = INVALID_SUB_ID;
    SubID sub_epoch_    = INVALID_SUB_ID;
};

} // namespace nodal
