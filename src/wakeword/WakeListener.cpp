/**
 * WakeListener.cpp - Wake word worker thread
 *
 * The worker holds mutex_ for a whole read+detect iteration, so once
 * onPreempt() returns no further audio is consumed and no event is emitted
 * until onRestore().
 */

#include "aegis/wakeword/WakeListener.hpp"

#include <iostream>
#include <utility>
#include <vector>

namespace aegis::wakeword {

constexpr size_t READ_CHUNK = 512;
constexpr auto READ_TIMEOUT = std::chrono::milliseconds(100);
constexpr auto IDLE_WAIT = std::chrono::milliseconds(100);

const char* toString(ListenerState state) {
    switch (state) {
        case ListenerState::Active:  return "Active";
        case ListenerState::Paused:  return "Paused";
        case ListenerState::Stopped: return "Stopped";
    }
    return "Unknown";
}

WakeListener::WakeListener(resource::ResourceGuard& mic,
                           audio::CaptureSource& source,
                           WakeEngine& engine,
                           EventChannel<Event>& events,
                           std::string phrase)
    : mic_(mic)
    , source_(source)
    , engine_(engine)
    , events_(events)
    , phrase_(std::move(phrase)) {
}

WakeListener::~WakeListener() {
    stop();
}

bool WakeListener::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ListenerState::Stopped) {
            return true;
        }
        state_ = ListenerState::Paused;
        stop_requested_ = false;
    }

    if (!engine_.isReady()) {
        std::cerr << "[WakeListener] Wake engine not ready" << std::endl;
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ListenerState::Stopped;
        return false;
    }

    // Granted Active, or Paused if a session already holds the mic
    auto acquired = mic_.acquireBackground("wake_listener", *this);
    if (!acquired.granted()) {
        std::cerr << "[WakeListener] Cannot open mic: "
                  << resource::toString(acquired.status) << std::endl;
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ListenerState::Stopped;
        return false;
    }
    lease_ = std::move(acquired.lease);

    worker_ = std::thread(&WakeListener::run, this);

    std::cout << "[WakeListener] Listening for \"" << phrase_ << "\" ("
              << toString(state()) << ")" << std::endl;
    return true;
}

void WakeListener::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ListenerState::Stopped && !worker_.joinable()) {
            return;
        }
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    lease_.release();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ListenerState::Stopped;
    }
    std::cout << "[WakeListener] Stopped (" << detections_ << " detections)" << std::endl;
}

bool WakeListener::pause() {
    if (!lease_.valid()) return false;
    return mic_.pause(lease_);
}

bool WakeListener::resume() {
    if (!lease_.valid()) return false;
    return mic_.resume(lease_);
}

ListenerState WakeListener::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void WakeListener::onPreempt() {
    // Blocks until the worker finishes its current read
    preempt_requested_ = true;
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ListenerState::Active) {
        state_ = ListenerState::Paused;
    }
    preempt_requested_ = false;
}

bool WakeListener::onRestore() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_requested_) {
        return true;
    }
    if (!source_.isCapturing()) {
        std::cerr << "[WakeListener] Mic stream is not running" << std::endl;
        return false;
    }
    // Command audio and our own speech must not reach the detector
    source_.discard();
    engine_.resetStream();
    state_ = ListenerState::Active;
    cv_.notify_all();
    return true;
}

void WakeListener::run() {
    std::vector<float> buffer(READ_CHUNK);

    while (true) {
        if (preempt_requested_) {
            std::this_thread::yield();
            continue;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_requested_) {
            break;
        }
        if (state_ != ListenerState::Active) {
            cv_.wait_for(lock, IDLE_WAIT);
            continue;
        }

        size_t n = source_.read(buffer.data(), buffer.size(), READ_TIMEOUT);
        if (n == 0) {
            continue;
        }

        int keyword = engine_.processFloat(buffer.data(), n);
        if (keyword < 0) {
            continue;
        }

        detections_++;
        std::cout << "[WakeListener] Wake word detected: \"" << phrase_ << "\"" << std::endl;

        Event event;
        event.kind = EventKind::WakeDetected;
        event.source = "wake_listener";
        event.detail = phrase_;
        if (!events_.push(std::move(event))) {
            std::cerr << "[WakeListener] Event channel full, wake dropped" << std::endl;
        }
    }
}

} // namespace aegis::wakeword
