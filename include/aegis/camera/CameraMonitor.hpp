/**
 * CameraMonitor.hpp - Always-on camera tamper watch
 *
 * Holds a Background camera lease and samples frames at a fixed cadence.
 * Emits CameraBlocked / CameraRestored on transitions only. Face
 * verification preempts it through the camera guard.
 */

#pragma once

#include "aegis/Events.hpp"
#include "aegis/camera/FrameSource.hpp"
#include "aegis/camera/ObstructionDetector.hpp"
#include "aegis/resource/ResourceGuard.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace aegis::camera {

enum class MonitorState { Running, Paused, Stopped };

const char* toString(MonitorState state);

struct CameraMonitorConfig {
    double dark_threshold = 60.0;
    int dark_frames_required = 5;
    int max_read_failures = 10;
    std::chrono::milliseconds poll_interval{200};
    std::chrono::milliseconds failure_retry{100};
    std::chrono::milliseconds read_timeout{500};
};

class CameraMonitor : public resource::Preemptible {
public:
    CameraMonitor(resource::ResourceGuard& camera,
                  FrameSource& source,
                  EventChannel<Event>& events,
                  const CameraMonitorConfig& config = {});
    ~CameraMonitor() override;

    CameraMonitor(const CameraMonitor&) = delete;
    CameraMonitor& operator=(const CameraMonitor&) = delete;

    // false if the camera cannot be opened
    bool start();
    void stop();

    // Releases the lease and the device.
    bool pause();

    // Reacquires the lease (or resumes a preempted one). false if the camera
    // cannot be reopened.
    bool resume();

    MonitorState state() const;
    ObstructionState obstruction() const;
    uint64_t framesProcessed() const { return frames_; }

    void onPreempt() override;
    bool onRestore() override;

private:
    void run();
    bool acquireLease();
    void publish(EventKind kind, const char* detail);

    resource::ResourceGuard& camera_;
    FrameSource& source_;
    EventChannel<Event>& events_;
    const CameraMonitorConfig config_;

    resource::Lease lease_;
    std::thread worker_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    MonitorState state_ = MonitorState::Stopped;
    ObstructionDetector detector_;
    bool stop_requested_ = false;
    std::atomic<bool> preempt_requested_{false};
    std::atomic<uint64_t> frames_{0};
};

} // namespace aegis::camera
