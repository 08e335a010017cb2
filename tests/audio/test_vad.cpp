/**
 * test_vad.cpp - Voice activity detection tests (libfvad)
 */

#include "aegis/audio/VADProcessor.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <random>
#include <vector>

using namespace aegis::audio;

constexpr float PI = 3.14159265f;

// Harmonic-rich "voiced" signal: 150 Hz fundamental with formant-ish overtones
std::vector<float> voiced(int rate, int ms) {
    std::vector<float> out(static_cast<size_t>(rate) * ms / 1000);
    std::mt19937 rng(7);
    std::normal_distribution<float> noise(0.0f, 0.01f);
    for (size_t i = 0; i < out.size(); ++i) {
        float t = static_cast<float>(i) / rate;
        float s = 0.0f;
        for (int h = 1; h <= 12; ++h) {
            s += std::sin(2.0f * PI * 150.0f * h * t) / h;
        }
        // 4 Hz syllable envelope
        float env = 0.5f + 0.5f * std::sin(2.0f * PI * 4.0f * t);
        out[i] = 0.3f * env * s + noise(rng);
    }
    return out;
}

void test_silence_has_no_speech() {
    VADProcessor vad(16000, VADMode::Aggressive);
    if (!vad.isReady()) {
        std::cout << "[SKIP] libfvad not available" << std::endl;
        return;
    }

    std::vector<float> silence(16000 * 2, 0.0f);
    assert(vad.voicedMilliseconds(silence) == 0);
    assert(!vad.containsSpeech(silence));

    std::cout << "[PASS] test_silence_has_no_speech" << std::endl;
}

void test_voiced_signal() {
    VADProcessor vad(16000, VADMode::Quality);
    if (!vad.isReady()) {
        std::cout << "[SKIP] libfvad not available" << std::endl;
        return;
    }

    auto speech = voiced(16000, 2000);
    int ms = vad.voicedMilliseconds(speech);
    std::cout << "  voiced: " << ms << "ms of 2000ms" << std::endl;
    assert(ms >= 0 && ms <= 2000);
    assert(ms % 30 == 0);   // whole frames only

    // Threshold above everything possible
    assert(!vad.containsSpeech(speech, 5000));

    std::cout << "[PASS] test_voiced_signal" << std::endl;
}

void test_invalid_configuration() {
    VADProcessor vad(44100, VADMode::Aggressive);
    assert(!vad.isReady());
    assert(vad.voicedMilliseconds(std::vector<float>(44100, 0.5f)) == 0);

    std::cout << "[PASS] test_invalid_configuration" << std::endl;
}

int main() {
    std::cout << "=== VAD Tests ===" << std::endl;

    test_silence_has_no_speech();
    test_voiced_signal();
    test_invalid_configuration();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
