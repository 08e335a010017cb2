/**
 * Frame.hpp - Camera frame in 8-bit BGR (or single-channel gray)
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace aegis::camera {

struct Frame {
    int width = 0;
    int height = 0;
    int channels = 3;               // 3 = BGR, 1 = gray
    std::vector<uint8_t> pixels;    // row-major, tightly packed

    bool empty() const {
        return width <= 0 || height <= 0 ||
               pixels.size() < static_cast<size_t>(width) * height * channels;
    }
};

// Mean luma in [0, 255] using BT.601 weights; 0 for an empty frame.
double meanBrightness(const Frame& frame);

// Uniform frame, handy for tests and placeholders.
Frame solidFrame(int width, int height, uint8_t value);

} // namespace aegis::camera
