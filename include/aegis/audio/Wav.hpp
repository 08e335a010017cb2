/**
 * Wav.hpp - RIFF/WAVE decoding and sample-rate conversion
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace aegis::audio {

struct WavData {
    std::vector<float> samples;   // mono, [-1, 1]
    int sample_rate = 0;
    int channels = 0;             // before downmix
};

/**
 * Decode an in-memory WAV file. Supports 16-bit PCM and 32-bit IEEE float;
 * multi-channel input is averaged to mono. Returns nullopt on malformed or
 * unsupported input.
 */
std::optional<WavData> decodeWav(const std::string& bytes);

std::optional<WavData> loadWavFile(const std::string& path);

// Linear interpolation resampler, good enough for speech.
std::vector<float> resampleLinear(const std::vector<float>& samples, int from_rate, int to_rate);

} // namespace aegis::audio
