/**
 * CommandRecorder.cpp - Command capture
 */

#include "aegis/audio/CommandRecorder.hpp"
#include "aegis/audio/VADProcessor.hpp"

#include <algorithm>
#include <iostream>

namespace aegis::audio {

// Extra time allowed past the nominal duration before giving up on the device
constexpr auto READ_SLACK = std::chrono::milliseconds(1000);
constexpr auto READ_TIMEOUT = std::chrono::milliseconds(100);
constexpr size_t READ_CHUNK = 1024;

CommandRecorder::CommandRecorder(resource::ResourceGuard& mic, CaptureSource& source,
                                 VADProcessor* vad)
    : mic_(mic)
    , source_(source)
    , vad_(vad) {
}

Recording CommandRecorder::record(std::chrono::milliseconds duration) {
    auto acquired = mic_.acquireExclusive("command_recorder");
    if (!acquired.granted()) {
        Recording rec;
        rec.status = acquired.status;
        rec.error = acquired.status == resource::AcquireStatus::Busy
            ? ErrorKind::ResourceBusy
            : ErrorKind::DeviceUnavailable;
        std::cerr << "[CommandRecorder] Mic not available: "
                  << resource::toString(acquired.status) << std::endl;
        return rec;
    }

    return recordWith(acquired.lease, duration);
}

Recording CommandRecorder::recordWith(const resource::Lease& lease,
                                      std::chrono::milliseconds duration) {
    Recording rec;
    rec.sample_rate = source_.sampleRate();

    if (!lease.valid() || lease.kind() != resource::ResourceKind::Mic) {
        rec.status = resource::AcquireStatus::Busy;
        rec.error = ErrorKind::ResourceBusy;
        std::cerr << "[CommandRecorder] Recording requested without a mic lease" << std::endl;
        return rec;
    }

    if (!source_.isCapturing()) {
        rec.error = ErrorKind::DeviceUnavailable;
        std::cerr << "[CommandRecorder] Capture device is not running" << std::endl;
        return rec;
    }

    const size_t target = static_cast<size_t>(
        static_cast<int64_t>(rec.sample_rate) * duration.count() / 1000);
    rec.samples.assign(target, 0.0f);

    // Audio buffered before the lease belongs to the wake word, not the command
    source_.discard();

    std::cout << "[CommandRecorder] Recording " << duration.count() << "ms..." << std::endl;

    auto deadline = std::chrono::steady_clock::now() + duration + READ_SLACK;
    while (rec.captured < target && std::chrono::steady_clock::now() < deadline) {
        size_t want = std::min(READ_CHUNK, target - rec.captured);
        size_t got = source_.read(rec.samples.data() + rec.captured, want, READ_TIMEOUT);
        rec.captured += got;
    }

    if (rec.captured == 0) {
        rec.error = ErrorKind::DeviceUnavailable;
        rec.samples.clear();
        std::cerr << "[CommandRecorder] No audio captured" << std::endl;
        return rec;
    }

    if (rec.captured < target) {
        std::cerr << "[CommandRecorder] Short capture: " << rec.captured << "/" << target
                  << " samples, padded with silence" << std::endl;
    }

    if (vad_ && vad_->isReady()) {
        rec.speech_detected = vad_->containsSpeech(rec.samples);
    }

    std::cout << "[CommandRecorder] Captured " << rec.captured << " samples"
              << (rec.speech_detected ? "" : " (no speech)") << std::endl;
    return rec;
}

} // namespace aegis::audio
