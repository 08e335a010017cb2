/**
 * TTSEngine.hpp - HTTP client for the XTTS-compatible speech server
 *
 * POST /synthesize {"text", "language", "speaker_wav"} -> WAV
 */

#pragma once

#include "aegis/tts/SpeechSynthesizer.hpp"

#include <memory>
#include <string>

namespace aegis::tts {

struct TTSConfig {
    std::string server_url = "http://localhost:5050";
    std::string reference_voice;    // speaker_wav passed to the server, may be empty
    std::string language = "en";
    int timeout_ms = 30000;
};

class TTSEngine : public SpeechSynthesizer {
public:
    explicit TTSEngine(const TTSConfig& config = {});
    ~TTSEngine() override;

    TTSEngine(const TTSEngine&) = delete;
    TTSEngine& operator=(const TTSEngine&) = delete;

    bool isServerAvailable();

    SynthesizedAudio synthesize(const std::string& text) override;
    void cancel() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace aegis::tts
