/**
 * VADProcessor.hpp - Voice Activity Detection via libfvad
 *
 * Used to tell a silent command recording from one that contains speech.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace aegis::audio {

enum class VADMode {
    Quality = 0,
    LowBitrate = 1,
    Aggressive = 2,
    VeryAggressive = 3
};

class VADProcessor {
public:
    /**
     * @param sample_rate 8000, 16000, 32000 or 48000
     * @param frame_ms 10, 20 or 30
     */
    explicit VADProcessor(int sample_rate = 16000,
                          VADMode mode = VADMode::Aggressive,
                          int frame_ms = 30);
    ~VADProcessor();

    VADProcessor(const VADProcessor&) = delete;
    VADProcessor& operator=(const VADProcessor&) = delete;

    bool isReady() const;
    int sampleRate() const;

    // Total duration of frames classified as speech.
    int voicedMilliseconds(const std::vector<float>& samples);

    bool containsSpeech(const std::vector<float>& samples, int min_speech_ms = 200);

    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace aegis::audio
