/**
 * SpeechSynthesizer.hpp - Text-to-speech seam
 */

#pragma once

#include <string>
#include <vector>

namespace aegis::tts {

struct SynthesizedAudio {
    std::vector<float> samples;
    int sample_rate = 0;
};

class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;

    // Throws CollaboratorError on failure.
    virtual SynthesizedAudio synthesize(const std::string& text) = 0;

    // Abort an in-flight synthesize() if the backend can.
    virtual void cancel() {}
};

} // namespace aegis::tts
