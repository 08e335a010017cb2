/**
 * AudioEngine.hpp - PortAudio capture and playback
 *
 * Owns one input and one output stream. Captured samples land in a ring
 * buffer that CommandRecorder and WakeListener drain through CaptureSource;
 * SpeechOutput plays through PlaybackSink.
 */

#pragma once

#include "aegis/audio/AudioDevice.hpp"

#include <memory>
#include <string>
#include <vector>

namespace aegis::audio {

struct AudioConfig {
    int sample_rate = 16000;
    int frames_per_buffer = 512;
    int channels = 1;
    int input_device = -1;    // -1 = system default
    int output_device = -1;
};

class AudioEngine : public CaptureSource, public PlaybackSink {
public:
    explicit AudioEngine(const AudioConfig& config = {});
    ~AudioEngine() override;

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    bool initialize();
    bool start();
    void stop();
    bool isRunning() const;

    // CaptureSource
    int sampleRate() const override { return config_.sample_rate; }
    bool isCapturing() const override;
    size_t read(float* out, size_t count, std::chrono::milliseconds timeout) override;
    void discard() override;

    // PlaybackSink
    bool play(const std::vector<float>& samples) override;
    void stopPlayback() override;
    bool isPlaying() const;

    static std::vector<std::string> listInputDevices();
    static std::vector<std::string> listOutputDevices();

    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
    AudioConfig config_;
};

} // namespace aegis::audio
