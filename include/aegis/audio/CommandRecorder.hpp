/**
 * CommandRecorder.hpp - Fixed-duration command capture under an Exclusive mic lease
 */

#pragma once

#include "aegis/Errors.hpp"
#include "aegis/audio/AudioDevice.hpp"
#include "aegis/resource/ResourceGuard.hpp"

#include <chrono>
#include <vector>

namespace aegis::audio {

class VADProcessor;

struct Recording {
    resource::AcquireStatus status = resource::AcquireStatus::Granted;
    ErrorKind error = ErrorKind::None;
    std::vector<float> samples;      // always duration * sample_rate long when ok()
    int sample_rate = 0;
    size_t captured = 0;             // samples actually read from the device
    bool speech_detected = true;     // true when no VAD is configured

    bool ok() const { return error == ErrorKind::None; }
};

class CommandRecorder {
public:
    CommandRecorder(resource::ResourceGuard& mic, CaptureSource& source,
                    VADProcessor* vad = nullptr);
    virtual ~CommandRecorder() = default;

    /**
     * Acquire an Exclusive mic lease, record, release. Never blocks on a
     * busy mic: returns status Busy and ErrorKind::ResourceBusy instead.
     */
    virtual Recording record(std::chrono::milliseconds duration);

    // Record under a lease the caller already holds.
    virtual Recording recordWith(const resource::Lease& lease,
                                 std::chrono::milliseconds duration);

private:
    resource::ResourceGuard& mic_;
    CaptureSource& source_;
    VADProcessor* vad_;
};

} // namespace aegis::audio
