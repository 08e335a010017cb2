/**
 * CameraMonitor.cpp - Camera sampling worker
 *
 * Frames are read under mutex_, so once onPreempt() returns the device is
 * closed and no further frame is read until onRestore().
 */

#include "aegis/camera/CameraMonitor.hpp"

#include <iostream>
#include <utility>

namespace aegis::camera {

constexpr auto IDLE_WAIT = std::chrono::milliseconds(100);

const char* toString(MonitorState state) {
    switch (state) {
        case MonitorState::Running: return "Running";
        case MonitorState::Paused:  return "Paused";
        case MonitorState::Stopped: return "Stopped";
    }
    return "Unknown";
}

CameraMonitor::CameraMonitor(resource::ResourceGuard& camera,
                             FrameSource& source,
                             EventChannel<Event>& events,
                             const CameraMonitorConfig& config)
    : camera_(camera)
    , source_(source)
    , events_(events)
    , config_(config)
    , detector_(ObstructionConfig{config.dark_threshold,
                                  config.dark_frames_required,
                                  config.max_read_failures}) {
}

CameraMonitor::~CameraMonitor() {
    stop();
}

bool CameraMonitor::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != MonitorState::Stopped) {
            return true;
        }
        stop_requested_ = false;
        state_ = MonitorState::Paused;
    }

    if (!acquireLease()) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = MonitorState::Stopped;
        return false;
    }

    worker_ = std::thread(&CameraMonitor::run, this);

    std::cout << "[CameraMonitor] Started (dark_threshold=" << config_.dark_threshold
              << ", frames=" << config_.dark_frames_required
              << ", interval=" << config_.poll_interval.count() << "ms, "
              << toString(state()) << ")" << std::endl;
    return true;
}

void CameraMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == MonitorState::Stopped && !worker_.joinable()) {
            return;
        }
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    lease_.release();
    source_.close();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = MonitorState::Stopped;
    }
    std::cout << "[CameraMonitor] Stopped (" << frames_ << " frames)" << std::endl;
}

bool CameraMonitor::pause() {
    if (!lease_.valid()) {
        return state() == MonitorState::Paused;
    }

    // Guard-level pause runs onPreempt (closing the device), then drop the lease
    camera_.pause(lease_);
    lease_.release();

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = MonitorState::Paused;
    source_.close();
    std::cout << "[CameraMonitor] Paused, camera released" << std::endl;
    return true;
}

bool CameraMonitor::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == MonitorState::Stopped) {
            return false;
        }
    }

    if (lease_.valid()) {
        return camera_.resume(lease_);
    }
    return acquireLease();
}

MonitorState CameraMonitor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ObstructionState CameraMonitor::obstruction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return detector_.state();
}

void CameraMonitor::onPreempt() {
    preempt_requested_ = true;
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == MonitorState::Running) {
        state_ = MonitorState::Paused;
    }
    source_.close();
    preempt_requested_ = false;
}

bool CameraMonitor::onRestore() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_requested_) {
        return true;
    }
    if (!source_.open()) {
        std::cerr << "[CameraMonitor] Camera could not be reopened" << std::endl;
        return false;
    }
    detector_.resetCounters();
    state_ = MonitorState::Running;
    cv_.notify_all();
    return true;
}

bool CameraMonitor::acquireLease() {
    auto acquired = camera_.acquireBackground("camera_monitor", *this);
    if (!acquired.granted()) {
        std::cerr << "[CameraMonitor] Cannot acquire camera: "
                  << resource::toString(acquired.status) << std::endl;
        return false;
    }
    lease_ = std::move(acquired.lease);
    return true;
}

void CameraMonitor::publish(EventKind kind, const char* detail) {
    Event event;
    event.kind = kind;
    event.source = "camera_monitor";
    event.detail = detail;
    if (!events_.push(std::move(event))) {
        std::cerr << "[CameraMonitor] Event channel full, " << toString(kind)
                  << " dropped" << std::endl;
    }
}

void CameraMonitor::run() {
    while (true) {
        if (preempt_requested_) {
            std::this_thread::yield();
            continue;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_requested_) {
            break;
        }
        if (state_ != MonitorState::Running) {
            cv_.wait_for(lock, IDLE_WAIT);
            continue;
        }

        Frame frame;
        bool ok = source_.read(frame, config_.read_timeout) && !frame.empty();
        Transition transition = ok
            ? detector_.onFrame(meanBrightness(frame))
            : detector_.onReadFailure();
        frames_++;

        if (transition == Transition::Blocked) {
            if (detector_.cause() == BlockCause::Unavailable) {
                std::cerr << "[CameraMonitor] Camera read failed " << detector_.failureStreak()
                          << " times in a row, treating as obstructed" << std::endl;
            } else {
                std::cerr << "[CameraMonitor] Camera obstructed (" << detector_.darkStreak()
                          << " consecutive dark frames)" << std::endl;
            }
            publish(EventKind::CameraBlocked, toString(detector_.cause()));
        } else if (transition == Transition::Restored) {
            std::cout << "[CameraMonitor] Camera view restored" << std::endl;
            publish(EventKind::CameraRestored, "clear");
        }

        auto wait = ok ? config_.poll_interval : config_.failure_retry;
        cv_.wait_for(lock, wait, [this]() {
            return stop_requested_ || state_ != MonitorState::Running;
        });
    }
}

} // namespace aegis::camera
