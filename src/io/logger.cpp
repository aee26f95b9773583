#include "logger.hpp"

#include <stdexcept>

namespace nodal {

Logger::Logger(const std::string& path, size_t flush_every)
    : path_(path), flush_every_(flush_every == 0 ? 1 : flush_every) {
    file_.open(path, std::ios::out | std::ios::trunc);
    if (!file_)
        throw std::runtime_error("Logger: cannot open " + path);
}

Logger::~Logger() {
    detach();
    flush();
}

void Logger::attach() {
    if (sub_backward_ != INVALID_SUB_ID) return;
    auto& bus = EventBus::instance();
    sub_backward_ = bus.subscribe<BackwardPassEvent>(
        [this](const BackwardPassEvent& ev)  { on_backward_pass(ev); },
        DispatchMode::Async);
    sub_stale_    = bus.subscribe<StaleGradientEvent>(
        [this](const StaleGradientEvent& ev) { on_stale_gradient(ev); },
        DispatchMode::Async);
    sub_update_   = bus.subscribe<WeightUpdateEvent>(
        [this](const WeightUpdateEvent& ev)  { on_weight_update(ev); },
        DispatchMode::Async);
    sub_loss_     = bus.subscribe<LossEvent>(
        [this](const LossEvent& ev)          { on_loss(ev); },
        DispatchMode::Async);
    sub_epoch_    = bus.subscribe<EpochEvent>(
        [this](const EpochEvent& ev)         { on_epoch(ev); },
        DispatchMode::Async);
}

void Logger::detach() {
    auto& bus = EventBus::instance();
    for (SubID* id : { &sub_backward_, &sub_stale_, &sub_update_,
                       &sub_loss_, &sub_epoch_ }) {
        if (*id != INVALID_SUB_ID) bus.unsubscribe(*id);
        *id = INVALID_SUB_ID;
    }
    // Drain handlers that were already queued; they reference this object.
    bus.flush();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.flush();
}

size_t Logger::entries_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_count_;
}

void Logger::write(const nlohmann::json& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_ << entry.dump() << '\n';
    ++write_count_;
    if (write_count_ % flush_every_ == 0) file_.flush();
}

// ---------------------------------------------------------------------------
// Event handlers
// ---------------------------------------------------------------------------
void Logger::on_backward_pass(const BackwardPassEvent& ev) {
    nlohmann::json j;
    j["type"]            = "backward";
    j["iteration"]       = ev.iteration;
    j["nodes_evaluated"] = ev.nodes_evaluated;
    j["memo_hits"]       = ev.memo_hits;
    j["stale_terminals"] = ev.stale_terminals;
    write(j);
}

void Logger::on_stale_gradient(const StaleGradientEvent& ev) {
    nlohmann::json j;
    j["type"]      = "stale_gradient";
    j["iteration"] = ev.iteration;
    j["node"]      = ev.node_id;
    write(j);
}

void Logger::on_weight_update(const WeightUpdateEvent& ev) {
    nlohmann::json j;
    j["type"]          = "weight_update";
    j["iteration"]     = ev.iteration;
    j["edges"]         = ev.edges_updated;
    j["learning_rate"] = ev.learning_rate;
    j["max_abs_delta"] = ev.max_abs_delta;
    write(j);
}

void Logger::on_loss(const LossEvent& ev) {
    nlohmann::json j;
    j["type"]     = "loss";
    j["step"]     = ev.step;
    j["loss"]     = ev.loss;
    j["ema_loss"] = ev.ema_loss;
    write(j);
}

void Logger::on_epoch(const EpochEvent& ev) {
    nlohmann::json j;
    j["type"]  = "epoch";
    j["epoch"] = ev.epoch;
    j["begin"] = ev.begin;
    if (!ev.begin) j["metric"] = ev.metric_value;
    write(j);
}

} // namespace nodal
