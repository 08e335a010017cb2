/**
 * WakeListener.hpp - Background wake word listening on the shared mic
 *
 * Holds a Background mic lease. While paused (Exclusive lease outstanding,
 * hold flag set, or explicit pause) it neither reads audio nor emits events.
 */

#pragma once

#include "aegis/Events.hpp"
#include "aegis/audio/AudioDevice.hpp"
#include "aegis/resource/ResourceGuard.hpp"
#include "aegis/wakeword/WakeEngine.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace aegis::wakeword {

enum class ListenerState { Active, Paused, Stopped };

const char* toString(ListenerState state);

class WakeListener : public resource::Preemptible {
public:
    WakeListener(resource::ResourceGuard& mic,
                 audio::CaptureSource& source,
                 WakeEngine& engine,
                 EventChannel<Event>& events,
                 std::string phrase);
    ~WakeListener() override;

    WakeListener(const WakeListener&) = delete;
    WakeListener& operator=(const WakeListener&) = delete;

    /**
     * Acquire the Background mic lease and start the worker.
     * @return false if the mic cannot be opened
     */
    bool start();

    // Idempotent. Releases the lease.
    void stop();

    bool pause();

    // false if the mic could not be reopened (resource marked Degraded)
    bool resume();

    ListenerState state() const;
    uint64_t detections() const { return detections_; }
    const std::string& phrase() const { return phrase_; }

    // Preemptible, called by the mic guard
    void onPreempt() override;
    bool onRestore() override;

private:
    void run();

    resource::ResourceGuard& mic_;
    audio::CaptureSource& source_;
    WakeEngine& engine_;
    EventChannel<Event>& events_;
    const std::string phrase_;

    resource::Lease lease_;
    std::thread worker_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ListenerState state_ = ListenerState::Stopped;
    bool stop_requested_ = false;
    std::atomic<bool> preempt_requested_{false};
    std::atomic<uint64_t> detections_{0};
};

} // namespace aegis::wakeword
