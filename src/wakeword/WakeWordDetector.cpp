/**
 * WakeWordDetector.cpp - Porcupine wake word detection
 */

#include "aegis/wakeword/WakeWordDetector.hpp"

#include <iostream>

extern "C" {
#include "pv_porcupine.h"
}

namespace aegis::wakeword {

struct WakeWordDetector::Impl {
    pv_porcupine_t* porcupine = nullptr;
    int frame_length = 512;
    bool ready = false;
    std::vector<int16_t> accumulator;

    Impl(const std::string& access_key,
         const std::string& model_path,
         const std::vector<std::string>& keyword_paths,
         const std::vector<float>& sensitivities) {

        if (keyword_paths.empty()) {
            std::cerr << "[WakeWord] No keyword paths provided" << std::endl;
            return;
        }

        std::vector<const char*> kw_paths;
        for (const auto& p : keyword_paths) {
            kw_paths.push_back(p.c_str());
        }

        std::vector<float> sens = sensitivities;
        sens.resize(keyword_paths.size(), 0.5f);

        pv_status_t status = pv_porcupine_init(
            access_key.c_str(),
            model_path.c_str(),
            "cpu",
            static_cast<int32_t>(keyword_paths.size()),
            kw_paths.data(),
            sens.data(),
            &porcupine
        );

        if (status != PV_STATUS_SUCCESS) {
            std::cerr << "[WakeWord] Failed to initialize Porcupine: "
                      << pv_status_to_string(status) << std::endl;
            porcupine = nullptr;
            return;
        }

        frame_length = pv_porcupine_frame_length();
        accumulator.reserve(frame_length * 4);
        ready = true;

        std::cout << "[WakeWord] Porcupine initialized (version: "
                  << pv_porcupine_version()
                  << ", frame_length: " << frame_length
                  << ", keywords: " << keyword_paths.size() << ")" << std::endl;
    }

    ~Impl() {
        if (porcupine) {
            pv_porcupine_delete(porcupine);
        }
    }

    int process(const int16_t* samples) {
        if (!ready || !porcupine) return -1;

        int32_t keyword_index = -1;
        pv_status_t status = pv_porcupine_process(porcupine, samples, &keyword_index);

        if (status != PV_STATUS_SUCCESS) {
            std::cerr << "[WakeWord] Process error: " << pv_status_to_string(status) << std::endl;
            return -1;
        }

        return keyword_index;
    }

    int processFloat(const float* samples, size_t count) {
        if (!ready || !porcupine) return -1;

        for (size_t i = 0; i < count; i++) {
            float sample = samples[i];
            if (sample > 1.0f) sample = 1.0f;
            if (sample < -1.0f) sample = -1.0f;
            accumulator.push_back(static_cast<int16_t>(sample * 32767.0f));
        }

        int result = -1;
        size_t consumed = 0;
        while (accumulator.size() - consumed >= static_cast<size_t>(frame_length)) {
            int idx = process(accumulator.data() + consumed);
            if (idx >= 0) {
                result = idx;
            }
            consumed += frame_length;
        }
        accumulator.erase(accumulator.begin(), accumulator.begin() + consumed);

        return result;
    }
};

WakeWordDetector::WakeWordDetector(
    const std::string& access_key,
    const std::string& model_path,
    const std::vector<std::string>& keyword_paths,
    const std::vector<float>& sensitivities
) : impl_(std::make_unique<Impl>(access_key, model_path, keyword_paths, sensitivities)) {
}

WakeWordDetector::~WakeWordDetector() = default;

bool WakeWordDetector::isReady() const {
    return impl_->ready;
}

int WakeWordDetector::sampleRate() const {
    return pv_sample_rate();
}

int WakeWordDetector::frameLength() const {
    return impl_->frame_length;
}

int WakeWordDetector::process(const int16_t* samples) {
    return impl_->process(samples);
}

int WakeWordDetector::processFloat(const float* samples, size_t count) {
    return impl_->processFloat(samples, count);
}

void WakeWordDetector::resetStream() {
    impl_->accumulator.clear();
}

std::string WakeWordDetector::version() {
    return pv_porcupine_version();
}

} // namespace aegis::wakeword
