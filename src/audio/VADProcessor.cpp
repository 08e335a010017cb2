/**
 * VADProcessor.cpp - Voice Activity Detection via libfvad
 *
 * Classifies fixed-size frames of a finished recording and sums the voiced
 * ones. Requires libfvad to be installed.
 */

#include "aegis/audio/VADProcessor.hpp"

#include <fvad.h>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <mutex>

namespace aegis::audio {

struct VADProcessor::Impl {
    Fvad* vad = nullptr;
    std::mutex mutex;

    int sample_rate;
    int frame_ms;
    int frame_samples;

    std::vector<int16_t> frame16;
};

VADProcessor::VADProcessor(int sample_rate, VADMode mode, int frame_ms)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->sample_rate = sample_rate;
    pImpl_->frame_ms = frame_ms;
    pImpl_->frame_samples = (sample_rate * frame_ms) / 1000;
    pImpl_->frame16.resize(pImpl_->frame_samples);

    pImpl_->vad = fvad_new();
    if (!pImpl_->vad) {
        std::cerr << "[VADProcessor] Failed to create fvad instance" << std::endl;
        return;
    }

    if (fvad_set_sample_rate(pImpl_->vad, sample_rate) < 0) {
        std::cerr << "[VADProcessor] Invalid sample rate: " << sample_rate << std::endl;
        fvad_free(pImpl_->vad);
        pImpl_->vad = nullptr;
        return;
    }

    if (fvad_set_mode(pImpl_->vad, static_cast<int>(mode)) < 0) {
        std::cerr << "[VADProcessor] Invalid mode" << std::endl;
    }

    std::cout << "[VADProcessor] Initialized (sample_rate=" << sample_rate
              << "Hz, frame=" << frame_ms << "ms, mode=" << static_cast<int>(mode) << ")"
              << std::endl;
}

VADProcessor::~VADProcessor() {
    if (pImpl_->vad) {
        fvad_free(pImpl_->vad);
    }
}

bool VADProcessor::isReady() const {
    return pImpl_->vad != nullptr;
}

int VADProcessor::sampleRate() const {
    return pImpl_->sample_rate;
}

int VADProcessor::voicedMilliseconds(const std::vector<float>& samples) {
    if (!pImpl_->vad || pImpl_->frame_samples <= 0) return 0;

    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    fvad_reset(pImpl_->vad);

    const size_t frame = static_cast<size_t>(pImpl_->frame_samples);
    int voiced_frames = 0;

    // Trailing partial frame is ignored
    for (size_t offset = 0; offset + frame <= samples.size(); offset += frame) {
        for (size_t i = 0; i < frame; ++i) {
            float sample = std::clamp(samples[offset + i], -1.0f, 1.0f);
            pImpl_->frame16[i] = static_cast<int16_t>(sample * 32767.0f);
        }

        int result = fvad_process(pImpl_->vad, pImpl_->frame16.data(), frame);
        if (result == 1) {
            voiced_frames++;
        } else if (result < 0) {
            std::cerr << "[VADProcessor] fvad_process rejected frame" << std::endl;
            break;
        }
    }

    return voiced_frames * pImpl_->frame_ms;
}

bool VADProcessor::containsSpeech(const std::vector<float>& samples, int min_speech_ms) {
    return voicedMilliseconds(samples) >= min_speech_ms;
}

void VADProcessor::reset() {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    if (pImpl_->vad) {
        fvad_reset(pImpl_->vad);
    }
}

} // namespace aegis::audio
