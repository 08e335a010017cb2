/**
 * TranscriptionRelay.hpp - Forwards a recording to the transcriber
 *
 * Returns trimmed text with non-speech markers such as "[BLANK_AUDIO]" or
 * "(music)" removed. Empty means nothing was understood.
 */

#pragma once

#include "aegis/stt/Transcriber.hpp"

#include <string>
#include <vector>

namespace aegis::stt {

class TranscriptionRelay {
public:
    explicit TranscriptionRelay(Transcriber& transcriber);
    virtual ~TranscriptionRelay() = default;

    // Exceptions from the transcriber propagate.
    virtual std::string relay(const std::vector<float>& samples, int sample_rate);

    static std::string clean(const std::string& raw);

private:
    Transcriber& transcriber_;
};

} // namespace aegis::stt
