/**
 * test_audio.cpp - Audio device test
 * Lists devices, captures for a second through the CaptureSource
 * interface, then interrupts a playback. Skips when no audio hardware is present.
 */

#include "aegis/audio/AudioEngine.hpp"
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

using namespace aegis::audio;

int main() {
    std::cout << "=== Aegis Audio Device Test ===" << std::endl;

    std::cout << "\n--- Input Devices ---" << std::endl;
    auto inputs = AudioEngine::listInputDevices();
    for (size_t i = 0; i < inputs.size(); ++i) {
        std::cout << "  [" << i << "] " << inputs[i] << std::endl;
    }

    std::cout << "\n--- Output Devices ---" << std::endl;
    auto outputs = AudioEngine::listOutputDevices();
    for (size_t i = 0; i < outputs.size(); ++i) {
        std::cout << "  [" << i << "] " << outputs[i] << std::endl;
    }

    if (inputs.empty()) {
        std::cout << "[SKIP] No input devices" << std::endl;
        return 0;
    }

    AudioConfig config;
    config.sample_rate = 16000;
    config.frames_per_buffer = 512;

    AudioEngine engine(config);
    if (!engine.initialize() || !engine.start()) {
        std::cout << "[SKIP] Audio engine unavailable: " << engine.lastError() << std::endl;
        return 0;
    }

    std::cout << "\n--- Capturing (1 second) ---" << std::endl;
    engine.discard();

    std::vector<float> chunk(1024);
    size_t total = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (std::chrono::steady_clock::now() < deadline) {
        total += engine.read(chunk.data(), chunk.size(), std::chrono::milliseconds(100));
    }

    bool playback_ok = true;
    if (outputs.empty()) {
        std::cout << "[SKIP] No output devices, playback not tested" << std::endl;
    } else {
        std::cout << "\n--- Interrupted Playback ---" << std::endl;
        std::vector<float> tone(config.sample_rate * 2);
        for (size_t i = 0; i < tone.size(); ++i) {
            tone[i] = 0.05f * std::sin(2.0f * 3.14159265f * 440.0f * i / config.sample_rate);
        }

        bool played = true;
        std::thread player([&]() { played = engine.play(tone); });
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        engine.stopPlayback();
        player.join();

        // The output callback drops what was queued
        auto flush_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
        while (engine.isPlaying() && std::chrono::steady_clock::now() < flush_deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        std::vector<float> blip(tone.begin(), tone.begin() + config.sample_rate / 10);
        bool next_played = engine.play(blip);

        playback_ok = !played && !engine.isPlaying() && next_played;
        std::cout << (playback_ok ? "[PASS]" : "[FAIL]")
                  << " stopPlayback() flushes queued audio" << std::endl;
    }

    engine.stop();
    if (engine.isCapturing()) {
        std::cerr << "[FAIL] Still capturing after stop()" << std::endl;
        return 1;
    }

    float seconds = static_cast<float>(total) / config.sample_rate;
    std::cout << "  Samples captured: " << total << " (" << seconds << "s)" << std::endl;

    bool success = seconds >= 0.8f && seconds <= 1.5f && playback_ok;
    std::cout << "\n" << (success ? "[PASS]" : "[FAIL]") << " Audio capture test" << std::endl;
    return success ? 0 : 1;
}
