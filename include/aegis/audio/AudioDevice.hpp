/**
 * AudioDevice.hpp - Capture and playback seams
 *
 * AudioEngine implements both against PortAudio; tests substitute
 * scripted sources and recording sinks.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

namespace aegis::audio {

class CaptureSource {
public:
    virtual ~CaptureSource() = default;

    virtual int sampleRate() const = 0;
    virtual bool isCapturing() const = 0;

    /**
     * Read up to count mono float samples, waiting at most timeout for the
     * first ones to arrive. Returns the number of samples written to out.
     */
    virtual size_t read(float* out, size_t count, std::chrono::milliseconds timeout) = 0;

    // Drop everything buffered so far.
    virtual void discard() = 0;
};

class PlaybackSink {
public:
    virtual ~PlaybackSink() = default;

    virtual int sampleRate() const = 0;

    // Blocks until the samples have been played or stopPlayback() is called.
    virtual bool play(const std::vector<float>& samples) = 0;

    virtual void stopPlayback() = 0;
};

} // namespace aegis::audio
