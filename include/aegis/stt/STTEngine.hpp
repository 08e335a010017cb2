/**
 * STTEngine.hpp - Speech-to-Text Engine using whisper.cpp
 *
 * Model is loaded once at startup and stays resident.
 */

#pragma once

#include "aegis/stt/Transcriber.hpp"

#include <memory>
#include <string>
#include <vector>

namespace aegis::stt {

class STTEngine : public Transcriber {
public:
    STTEngine(const std::string& model_path,
              const std::string& language = "en",
              int n_threads = 4);
    ~STTEngine() override;

    STTEngine(const STTEngine&) = delete;
    STTEngine& operator=(const STTEngine&) = delete;

    // Input other than 16 kHz is resampled first.
    std::string transcribe(const std::vector<float>& samples, int sample_rate) override;

    bool isReady() const;
    std::string modelInfo() const;

    static constexpr int sampleRate() { return 16000; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace aegis::stt
