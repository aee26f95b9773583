#include "event_bus.hpp"

#include <algorithm>
#include <future>

namespace nodal {

EventBus& EventBus::instance() {
    static EventBus bus;
    return bus;
}

EventBus::EventBus() {
    async_worker_ = std::thread([this]() { async_worker_loop(); });
}

EventBus::~EventBus() {
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        stop_ = true;
    }
    async_cv_.notify_all();
    if (async_worker_.joinable()) async_worker_.join();
}

// ---------------------------------------------------------------------------
// Async worker: drains the queue, then exits once stop_ is set.
// ---------------------------------------------------------------------------
void EventBus::async_worker_loop() {
    for (;;) {
        std::unique_lock<std::mutex> lock(async_mutex_);
        async_cv_.wait(lock, [this]() { return stop_ || !async_queue_.empty(); });
        if (stop_ && async_queue_.empty()) return;

        std::function<void()> task = std::move(async_queue_.front());
        async_queue_.pop();
        lock.unlock();

        task();
    }
}

void EventBus::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        async_queue_.push(std::move(task));
    }
    async_cv_.notify_one();
}

// ---------------------------------------------------------------------------
// unsubscribe
// ---------------------------------------------------------------------------
void EventBus::unsubscribe(SubID id) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    for (auto& [type, entries] : handlers_) {
        auto it = std::find_if(entries.begin(), entries.end(),
                               [id](const HandlerEntry& e) { return e.id == id; });
        if (it != entries.end()) {
            entries.erase(it);
            return;
        }
    }
}

// ---------------------------------------------------------------------------
// flush: the marker task runs after everything queued ahead of it.
// ---------------------------------------------------------------------------
void EventBus::flush() {
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> fut = done->get_future();
    post([done]() { done->set_value(); });
    fut.wait();
}

} // namespace nodal
