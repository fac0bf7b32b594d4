// =============================================================================
// Rampart - Event Bus
// =============================================================================
// Thread-safe publish/subscribe channel for bot lifecycle events.
// Two delivery styles:
//   - subscribe(): synchronous callback on the publishing thread
//   - openChannel(): bounded per-subscriber queue, oldest event dropped when
//     the consumer falls behind (a slow consumer never blocks the bot loop)
// Usage:
//   EventBus bus;
//   auto sub = bus.subscribe([](const BotEvent& e) { ... });
//   auto ch  = bus.openChannel(64);
//   bus.publish(EventType::BotStarted, {{"device_id", id}});
//   while (auto e = ch->poll()) { ... }
// =============================================================================
#pragma once
#include <functional>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <vector>
#include <memory>
#include <string>
#include <cstdint>
#include <chrono>
#include <optional>
#include <algorithm>

#include <nlohmann/json.hpp>

#include "rampart_log.hpp"

namespace rampart {

// =============================================================================
// Event Types
// =============================================================================

enum class EventType {
    StatusChanged,
    BotStarted,
    BotStopped,
    BotPaused,
    BotResumed,
    ErrorOccurred,
    DeviceConnected,
    DeviceDisconnected,
    ActionPerformed
};

inline const char* eventTypeName(EventType t) {
    switch (t) {
        case EventType::StatusChanged:      return "status_changed";
        case EventType::BotStarted:         return "bot_started";
        case EventType::BotStopped:         return "bot_stopped";
        case EventType::BotPaused:          return "bot_paused";
        case EventType::BotResumed:         return "bot_resumed";
        case EventType::ErrorOccurred:      return "error_occurred";
        case EventType::DeviceConnected:    return "device_connected";
        case EventType::DeviceDisconnected: return "device_disconnected";
        case EventType::ActionPerformed:    return "action_performed";
    }
    return "unknown";
}

inline int64_t wallClockMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BotEvent {
    EventType type = EventType::StatusChanged;
    int64_t timestamp_ms = 0;    // wall clock, ms since epoch
    nlohmann::json data = nlohmann::json::object();

    nlohmann::json toJson() const {
        return {{"type", eventTypeName(type)},
                {"timestamp", timestamp_ms},
                {"data", data}};
    }
};

// =============================================================================
// SubscriptionHandle - RAII unsubscribe
// =============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { if (unsub_) unsub_(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::move(o.unsub_)) { o.unsub_ = nullptr; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (unsub_) unsub_();
        unsub_ = std::move(o.unsub_);
        o.unsub_ = nullptr;
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    void release() { unsub_ = nullptr; }

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventChannel - bounded queue owned by one consumer
// =============================================================================

class EventChannel {
public:
    explicit EventChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    void push(const BotEvent& e) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped_++;
        }
        queue_.push_back(e);
        cv_.notify_one();
    }

    // Non-blocking
    std::optional<BotEvent> poll() {
        std::lock_guard<std::mutex> lk(mutex_);
        if (queue_.empty()) return std::nullopt;
        BotEvent e = std::move(queue_.front());
        queue_.pop_front();
        return e;
    }

    // Blocks up to timeout; nullopt on timeout
    std::optional<BotEvent> waitNext(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mutex_);
        if (!cv_.wait_for(lk, timeout, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        BotEvent e = std::move(queue_.front());
        queue_.pop_front();
        return e;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return queue_.size();
    }

    uint64_t dropped() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return dropped_;
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<BotEvent> queue_;
    uint64_t dropped_ = 0;
};

// =============================================================================
// EventBus - Thread-safe publish/subscribe
// =============================================================================

class EventBus {
public:
    using HandlerId = uint64_t;
    using Handler = std::function<void(const BotEvent&)>;

    SubscriptionHandle subscribe(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        handlers_.push_back({id, std::move(handler)});
        RLOG_DEBUG("eventbus", "Subscribed handler %llu", (unsigned long long)id);

        return SubscriptionHandle([this, id]() {
            std::lock_guard<std::mutex> lock(mutex_);
            handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(),
                [id](const HandlerEntry& h) { return h.id == id; }), handlers_.end());
        });
    }

    // The channel stays registered while the caller holds the shared_ptr
    std::shared_ptr<EventChannel> openChannel(size_t capacity) {
        auto ch = std::make_shared<EventChannel>(capacity);
        std::lock_guard<std::mutex> lock(mutex_);
        channels_.push_back(ch);
        return ch;
    }

    void publish(const BotEvent& event) {
        std::vector<HandlerEntry> snapshot;
        std::vector<std::shared_ptr<EventChannel>> live;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = handlers_;
            channels_.erase(std::remove_if(channels_.begin(), channels_.end(),
                [](const std::weak_ptr<EventChannel>& w) { return w.expired(); }), channels_.end());
            for (auto& w : channels_) {
                if (auto ch = w.lock()) live.push_back(std::move(ch));
            }
        }

        for (auto& ch : live) ch->push(event);

        for (auto& entry : snapshot) {
            try {
                entry.fn(event);
            } catch (const std::exception& e) {
                RLOG_ERROR("eventbus", "Handler %llu threw: %s",
                           (unsigned long long)entry.id, e.what());
            }
        }
    }

    void publish(EventType type, nlohmann::json data = nlohmann::json::object()) {
        BotEvent e;
        e.type = type;
        e.timestamp_ms = wallClockMs();
        e.data = std::move(data);
        publish(e);
    }

    bool has_subscribers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !handlers_.empty() || !channels_.empty();
    }

private:
    struct HandlerEntry {
        HandlerId id;
        Handler fn;
    };

    mutable std::mutex mutex_;
    std::vector<HandlerEntry> handlers_;
    std::vector<std::weak_ptr<EventChannel>> channels_;
    HandlerId next_id_ = 1;
};

} // namespace rampart
