/**
 * test_wav.cpp - WAV decoding and resampling tests
 */

#include "aegis/audio/Wav.hpp"
#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace aegis::audio;

namespace {

template <typename T>
void put(std::string& out, T value) {
    char buf[sizeof(T)];
    std::memcpy(buf, &value, sizeof(T));
    out.append(buf, sizeof(T));
}

std::string makeWav(uint16_t format, uint16_t channels, uint32_t rate, uint16_t bits,
                    const std::string& payload, bool extra_chunk = false) {
    std::string fmt;
    put<uint16_t>(fmt, format);
    put<uint16_t>(fmt, channels);
    put<uint32_t>(fmt, rate);
    put<uint32_t>(fmt, rate * channels * bits / 8);
    put<uint16_t>(fmt, static_cast<uint16_t>(channels * bits / 8));
    put<uint16_t>(fmt, bits);

    std::string body = "WAVE";
    body += "fmt ";
    put<uint32_t>(body, static_cast<uint32_t>(fmt.size()));
    body += fmt;
    if (extra_chunk) {
        // Odd-sized LIST chunk, padded to even length
        body += "LIST";
        put<uint32_t>(body, 3);
        body += "abc";
        body += '\0';
    }
    body += "data";
    put<uint32_t>(body, static_cast<uint32_t>(payload.size()));
    body += payload;

    std::string wav = "RIFF";
    put<uint32_t>(wav, static_cast<uint32_t>(body.size()));
    return wav + body;
}

} // namespace

void test_pcm16_mono() {
    std::string payload;
    for (int16_t s : {0, 16384, -16384, 32767}) put<int16_t>(payload, s);

    auto wav = decodeWav(makeWav(1, 1, 24000, 16, payload));
    assert(wav);
    assert(wav->sample_rate == 24000);
    assert(wav->channels == 1);
    assert(wav->samples.size() == 4);
    assert(wav->samples[0] == 0.0f);
    assert(std::fabs(wav->samples[1] - 0.5f) < 1e-4f);
    assert(std::fabs(wav->samples[2] + 0.5f) < 1e-4f);

    std::cout << "[PASS] test_pcm16_mono" << std::endl;
}

void test_stereo_downmix_and_chunk_walk() {
    std::string payload;
    // L=0.5, R=-0.5 → 0 ; L=0.5, R=0.5 → 0.5
    for (int16_t s : {16384, -16384, 16384, 16384}) put<int16_t>(payload, s);

    auto wav = decodeWav(makeWav(1, 2, 16000, 16, payload, true));
    assert(wav);
    assert(wav->channels == 2);
    assert(wav->samples.size() == 2);
    assert(std::fabs(wav->samples[0]) < 1e-4f);
    assert(std::fabs(wav->samples[1] - 0.5f) < 1e-4f);

    std::cout << "[PASS] test_stereo_downmix_and_chunk_walk" << std::endl;
}

void test_float32() {
    std::string payload;
    for (float s : {0.25f, -0.75f}) put<float>(payload, s);

    auto wav = decodeWav(makeWav(3, 1, 22050, 32, payload));
    assert(wav);
    assert(wav->samples.size() == 2);
    assert(wav->samples[0] == 0.25f);
    assert(wav->samples[1] == -0.75f);

    std::cout << "[PASS] test_float32" << std::endl;
}

void test_rejects_malformed() {
    assert(!decodeWav(""));
    assert(!decodeWav(std::string(64, 'x')));

    std::string payload(8, '\0');
    assert(!decodeWav(makeWav(1, 1, 16000, 8, payload)));      // 8-bit unsupported
    assert(!decodeWav(makeWav(1, 0, 16000, 16, payload)));     // zero channels

    assert(!loadWavFile("/nonexistent/voice.wav"));

    std::cout << "[PASS] test_rejects_malformed" << std::endl;
}

void test_resample() {
    std::vector<float> ramp(4800);
    for (size_t i = 0; i < ramp.size(); ++i) ramp[i] = static_cast<float>(i) / ramp.size();

    auto down = resampleLinear(ramp, 48000, 16000);
    assert(down.size() == 1600);
    assert(std::fabs(down[800] - ramp[2400]) < 1e-3f);

    auto up = resampleLinear(ramp, 24000, 48000);
    assert(up.size() == 9600);

    auto same = resampleLinear(ramp, 16000, 16000);
    assert(same == ramp);
    assert(resampleLinear({}, 24000, 16000).empty());

    std::cout << "[PASS] test_resample" << std::endl;
}

int main() {
    std::cout << "=== WAV Tests ===" << std::endl;

    test_pcm16_mono();
    test_stereo_downmix_and_chunk_walk();
    test_float32();
    test_rejects_malformed();
    test_resample();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
