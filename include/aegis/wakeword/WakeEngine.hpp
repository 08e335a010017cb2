/**
 * WakeEngine.hpp - Keyword spotter seam used by WakeListener
 */

#pragma once

#include <cstddef>

namespace aegis::wakeword {

class WakeEngine {
public:
    virtual ~WakeEngine() = default;

    virtual bool isReady() const = 0;
    virtual int sampleRate() const = 0;

    /**
     * Feed mono float samples of any length.
     * @return keyword index if detected in this chunk, -1 otherwise
     */
    virtual int processFloat(const float* samples, size_t count) = 0;

    // Forget partially accumulated frames (called after a pause).
    virtual void resetStream() {}
};

} // namespace aegis::wakeword
