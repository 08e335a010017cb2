/**
 * Wav.cpp - WAV decoding for synthesized speech and enrollment clips
 */

#include "aegis/audio/Wav.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <utility>

namespace aegis::audio {

namespace {

template <typename T>
T readLE(const std::string& bytes, size_t offset) {
    T value;
    std::memcpy(&value, bytes.data() + offset, sizeof(T));
    return value;
}

} // anonymous namespace

std::optional<WavData> decodeWav(const std::string& bytes) {
    if (bytes.size() < 44 ||
        bytes.compare(0, 4, "RIFF") != 0 ||
        bytes.compare(8, 4, "WAVE") != 0) {
        std::cerr << "[Wav] Invalid WAV: no RIFF/WAVE header" << std::endl;
        return std::nullopt;
    }

    uint16_t audio_format = 0;
    uint16_t num_channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    bool have_fmt = false;

    size_t data_offset = 0;
    size_t data_size = 0;

    // Walk the chunk list; "fmt " must precede "data"
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        std::string id = bytes.substr(pos, 4);
        uint32_t size = readLE<uint32_t>(bytes, pos + 4);
        size_t body = pos + 8;

        if (id == "fmt " && body + 16 <= bytes.size()) {
            audio_format = readLE<uint16_t>(bytes, body);
            num_channels = readLE<uint16_t>(bytes, body + 2);
            sample_rate = readLE<uint32_t>(bytes, body + 4);
            bits_per_sample = readLE<uint16_t>(bytes, body + 14);
            have_fmt = true;
        } else if (id == "data") {
            data_offset = body;
            data_size = std::min<size_t>(size, bytes.size() - body);
            break;
        }

        pos = body + size + (size & 1);
    }

    if (!have_fmt || data_offset == 0) {
        std::cerr << "[Wav] Invalid WAV: missing fmt or data chunk" << std::endl;
        return std::nullopt;
    }
    if (num_channels == 0 || sample_rate == 0) {
        std::cerr << "[Wav] Invalid WAV: zero channels or sample rate" << std::endl;
        return std::nullopt;
    }

    WavData wav;
    wav.sample_rate = static_cast<int>(sample_rate);
    wav.channels = num_channels;

    std::vector<float> interleaved;
    if (bits_per_sample == 16 && audio_format == 1) {
        size_t count = data_size / 2;
        interleaved.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            int16_t s = readLE<int16_t>(bytes, data_offset + i * 2);
            interleaved.push_back(static_cast<float>(s) / 32768.0f);
        }
    } else if (bits_per_sample == 32 && audio_format == 3) {
        size_t count = data_size / 4;
        interleaved.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            interleaved.push_back(readLE<float>(bytes, data_offset + i * 4));
        }
    } else {
        std::cerr << "[Wav] Unsupported WAV format: " << bits_per_sample
                  << " bits, format " << audio_format << std::endl;
        return std::nullopt;
    }

    if (num_channels == 1) {
        wav.samples = std::move(interleaved);
        return wav;
    }

    size_t frames = interleaved.size() / num_channels;
    wav.samples.resize(frames);
    for (size_t f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (uint16_t c = 0; c < num_channels; ++c) {
            sum += interleaved[f * num_channels + c];
        }
        wav.samples[f] = sum / num_channels;
    }
    return wav;
}

std::optional<WavData> loadWavFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.good()) {
        std::cerr << "[Wav] Cannot open: " << path << std::endl;
        return std::nullopt;
    }
    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return decodeWav(bytes);
}

std::vector<float> resampleLinear(const std::vector<float>& samples, int from_rate, int to_rate) {
    if (from_rate == to_rate || samples.empty() || from_rate <= 0 || to_rate <= 0) {
        return samples;
    }

    double ratio = static_cast<double>(from_rate) / to_rate;
    size_t out_len = static_cast<size_t>(samples.size() / ratio);
    std::vector<float> out(out_len);

    for (size_t i = 0; i < out_len; ++i) {
        double src = i * ratio;
        size_t idx = static_cast<size_t>(src);
        double frac = src - idx;
        if (idx + 1 < samples.size()) {
            out[i] = static_cast<float>(samples[idx] * (1.0 - frac) + samples[idx + 1] * frac);
        } else {
            out[i] = samples.back();
        }
    }
    return out;
}

} // namespace aegis::audio
