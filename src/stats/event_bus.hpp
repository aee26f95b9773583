#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace nodal {

using SubID = uint64_t;
static constexpr SubID INVALID_SUB_ID = ~SubID{0};

enum class DispatchMode : uint8_t {
    // Handler runs inline in the thread that called emit().
    Sync  = 0,
    // Handler is posted to the background worker queue.
    Async = 1,
};

// ---------------------------------------------------------------------------
// EventBus: process-wide, type-erased publish-subscribe bus.
//
// The graph engine emits diagnostics (backward-pass summaries, stale
// gradients, weight updates) here instead of printing them; the Logger and
// tests subscribe to whichever event types they need.
//
// Thread-safe for concurrent emit() calls. A Sync handler must not call
// back into the bus (emit, subscribe, unsubscribe) from its own body.
//
// Usage:
//   auto& bus = EventBus::instance();
//   SubID id = bus.subscribe<StaleGradientEvent>(
//       [](const StaleGradientEvent& e) { ... }, DispatchMode::Sync);
//   ...
//   bus.unsubscribe(id);
// ---------------------------------------------------------------------------
class EventBus {
public:
    static EventBus& instance();

    template<typename EventT>
    SubID subscribe(std::function<void(const EventT&)> handler,
                    DispatchMode mode = DispatchMode::Sync);

    // Safe to call with an unknown or already removed id.
    void unsubscribe(SubID id);

    template<typename EventT>
    void emit(const EventT& event);

    // Block until every async task queued before this call has run.
    void flush();

    // Number of live subscriptions for EventT.
    template<typename EventT>
    size_t subscriber_count() const;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    ~EventBus();

private:
    EventBus();

    struct HandlerEntry {
        SubID                            id;
        DispatchMode                     mode;
        std::function<void(const void*)> handler;
    };

    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    mutable std::mutex handlers_mutex_;
    SubID next_id_ = 0;

    // Async dispatch worker.
    std::queue<std::function<void()>> async_queue_;
    std::mutex                        async_mutex_;
    std::condition_variable           async_cv_;
    std::thread                       async_worker_;
    bool                              stop_ = false;

    void async_worker_loop();
    void post(std::function<void()> task);
};

// ---------------------------------------------------------------------------
// Template implementations
// ---------------------------------------------------------------------------
template<typename EventT>
SubID EventBus::subscribe(std::function<void(const EventT&)> handler,
                          DispatchMode mode) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    const SubID id = next_id_++;
    handlers_[std::type_index(typeid(EventT))].push_back({
        id,
        mode,
        [h = std::move(handler)](const void* ptr) {
            h(*static_cast<const EventT*>(ptr));
        }
    });
    return id;
}

template<typename EventT>
void EventBus::emit(const EventT& event) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto it = handlers_.find(std::type_index(typeid(EventT)));
    if (it == handlers_.end()) return;

    for (const auto& entry : it->second) {
        if (entry.mode == DispatchMode::Sync) {
            entry.handler(&event);
        } else {
            // The queued task owns a copy of both the event and the handler,
            // so unsubscribing before the worker runs is safe.
            auto copy = std::make_shared<EventT>(event);
            post([copy, h = entry.handler]() { h(copy.get()); });
        }
    }
}

template<typename EventT>
size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto it = handlers_.find(std::type_index(typeid(EventT)));
    return it == handlers_.end() ? 0 : it->second.size();
}

} // namespace nodal
