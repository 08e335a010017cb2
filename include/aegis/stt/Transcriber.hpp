/**
 * Transcriber.hpp - Speech-to-text seam
 */

#pragma once

#include <string>
#include <vector>

namespace aegis::stt {

class Transcriber {
public:
    virtual ~Transcriber() = default;

    /**
     * @return recognized text, empty when nothing was understood
     * @throws CollaboratorError on engine failure
     */
    virtual std::string transcribe(const std::vector<float>& samples, int sample_rate) = 0;
};

} // namespace aegis::stt
