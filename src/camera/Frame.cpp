/**
 * Frame.cpp - Frame helpers
 */

#include "aegis/camera/Frame.hpp"

#include <cstddef>

namespace aegis::camera {

double meanBrightness(const Frame& frame) {
    if (frame.empty()) return 0.0;

    const size_t count = static_cast<size_t>(frame.width) * frame.height;
    double sum = 0.0;

    if (frame.channels == 1) {
        for (size_t i = 0; i < count; ++i) {
            sum += frame.pixels[i];
        }
        return sum / count;
    }

    const size_t stride = static_cast<size_t>(frame.channels);
    for (size_t i = 0; i < count; ++i) {
        const uint8_t* px = &frame.pixels[i * stride];
        sum += 0.114 * px[0] + 0.587 * px[1] + 0.299 * px[2];
    }
    return sum / count;
}

Frame solidFrame(int width, int height, uint8_t value) {
    Frame frame;
    frame.width = width;
    frame.height = height;
    frame.channels = 3;
    frame.pixels.assign(static_cast<size_t>(width) * height * 3, value);
    return frame;
}

} // namespace aegis::camera
