/**
 * Events.hpp - Typed events and the bounded channel the Orchestrator consumes
 *
 * Background workers (WakeListener, CameraMonitor, console) push events;
 * only the Orchestrator event loop pops them.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <utility>

namespace aegis {

enum class EventKind {
    WakeDetected,
    CameraBlocked,
    CameraRestored,
    Shutdown
};

const char* toString(EventKind kind);

struct Event {
    EventKind kind = EventKind::WakeDetected;
    std::string source;   // "wake_listener", "camera_monitor", "console", ...
    std::string detail;   // wake phrase, "obstructed" / "unavailable", ...
    std::chrono::steady_clock::time_point at = std::chrono::steady_clock::now();
};

template <typename T>
class EventChannel {
public:
    static constexpr size_t DEFAULT_CAPACITY = 64;

    explicit EventChannel(size_t capacity = DEFAULT_CAPACITY)
        : capacity_(capacity) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    // Returns false when the channel is full or closed; the item is dropped.
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || queue_.size() >= capacity_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || closed_;
        });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<T> queue_;
    bool closed_ = false;
};

} // namespace aegis
