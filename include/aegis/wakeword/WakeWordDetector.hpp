/**
 * WakeWordDetector.hpp - Porcupine wake word detection
 *
 * Only built when Porcupine is found (AEGIS_HAS_PORCUPINE).
 */

#pragma once

#include "aegis/wakeword/WakeEngine.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace aegis::wakeword {

class WakeWordDetector : public WakeEngine {
public:
    /**
     * @param access_key Picovoice access key
     * @param model_path porcupine_params.pv
     * @param keyword_paths one .ppn file per wake phrase
     * @param sensitivities per keyword, defaults to 0.5
     */
    WakeWordDetector(const std::string& access_key,
                     const std::string& model_path,
                     const std::vector<std::string>& keyword_paths,
                     const std::vector<float>& sensitivities = {});
    ~WakeWordDetector() override;

    WakeWordDetector(const WakeWordDetector&) = delete;
    WakeWordDetector& operator=(const WakeWordDetector&) = delete;

    bool isReady() const override;
    int sampleRate() const override;
    int frameLength() const;

    // One frame of exactly frameLength() samples.
    int process(const int16_t* samples);

    int processFloat(const float* samples, size_t count) override;
    void resetStream() override;

    static std::string version();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace aegis::wakeword
