#include "event_bus.hpp"

#include <algorithm>
#include <future>

namespace digitset {

// ---------------------------------------------------------------------------
// Singleton
// ---------------------------------------------------------------------------
EventBus& EventBus::instance() {
    static EventBus bus;
    return bus;
}

// ---------------------------------------------------------------------------
// Constructor / destructor
// ---------------------------------------------------------------------------
EventBus::EventBus() {
    async_worker_ = std::thread([this]() { async_worker_loop(); });
}

// Pending async handlers still run before the worker exits.
EventBus::~EventBus() {
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        stop_ = true;
    }
    async_cv_.notify_all();
    if (async_worker_.joinable()) async_worker_.join();
}

// ---------------------------------------------------------------------------
// Async worker
// ---------------------------------------------------------------------------
void EventBus::post(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        async_queue_.push(std::move(fn));
    }
    async_cv_.notify_one();
}

void EventBus::async_worker_loop() {
    while (true) {
        std::unique_lock<std::mutex> lock(async_mutex_);
        async_cv_.wait(lock, [this]() { return stop_ || !async_queue_.empty(); });
        if (stop_ && async_queue_.empty()) return;

        std::function<void()> fn = std::move(async_queue_.front());
        async_queue_.pop();
        lock.unlock();

        fn();
    }
}

// ---------------------------------------------------------------------------
// unsubscribe
// ---------------------------------------------------------------------------
void EventBus::unsubscribe(SubID id) {
    if (id == INVALID_SUB_ID) return;
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
// flush: block until every queued async handler has run
// ---------------------------------------------------------------------------
void EventBus::flush() {
    // shared_ptr keeps the lambda copyable for std::function.
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> fut = done->get_future();
    post([done]() { done->set_value(); });
    fut.wait();
}

} // namespace digitset
