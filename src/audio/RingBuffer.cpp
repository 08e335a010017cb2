/**
 * RingBuffer.cpp - Lock-free SPSC implementation
 * Note: Most logic is in header (template class)
 */

#include "aegis/audio/RingBuffer.hpp"

namespace aegis::audio {

// Capture/playback use float, wake word frames use int16_t
template class RingBuffer<float>;
template class RingBuffer<int16_t>;

} // namespace aegis::audio
