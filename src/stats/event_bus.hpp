#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace digitset {

using SubID = uint64_t;
static constexpr SubID INVALID_SUB_ID = ~SubID{0};

enum class DispatchMode : uint8_t {
    // Handler is called inline in the thread that called emit().
    Sync  = 0,
    // Handler is posted to a background worker queue.
    Async = 1,
};

// ---------------------------------------------------------------------------
// EventBus: process-wide, type-erased publish-subscribe bus for diagnostics.
//
// MnistDataset emits HeaderParsedEvent / RecordsDecodedEvent from its pool
// workers and DatasetLoadEvent from the loading thread; Logger consumes them
// asynchronously. emit() is safe from any thread.
//
//   auto& bus = EventBus::instance();
//   SubID id = bus.subscribe<DatasetLoadEvent>([](const DatasetLoadEvent& e) {
//       ...
//   }, DispatchMode::Async);
//   bus.unsubscribe(id);
// ---------------------------------------------------------------------------
class EventBus {
public:
    static EventBus& instance();

    template<typename EventT>
    SubID subscribe(std::function<void(const EventT&)> handler,
                    DispatchMode mode = DispatchMode::Sync);

    // Unknown or already removed ids are ignored.
    void unsubscribe(SubID id);

    template<typename EventT>
    void emit(const EventT& event);

    // Block until every async handler queued so far has run.
    void flush();

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

    void post(std::function<void()> fn);
    void async_worker_loop();

    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    std::mutex handlers_mutex_;
    SubID      next_id_ = 0;

    std::queue<std::function<void()>> async_queue_;
    std::mutex                        async_mutex_;
    std::condition_variable           async_cv_;
    std::thread                       async_worker_;
    bool                              stop_ = false;
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

    std::shared_ptr<const EventT> copy;
    for (const auto& entry : it->second) {
        if (entry.mode == DispatchMode::Sync) {
            entry.handler(&event);
            continue;
        }
        // Async handlers see a shared copy; the caller's event may be gone.
        if (!copy) copy = std::make_shared<const EventT>(event);
        post([copy, h = entry.handler]() { h(copy.get()); });
    }
}

} // namespace digitset
