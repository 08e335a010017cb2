/**
 * OpenCvCamera.hpp - V4L2 webcam through cv::VideoCapture
 */

#pragma once

#include "aegis/camera/FrameSource.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace cv {
class VideoCapture;
}

namespace aegis::camera {

class OpenCvCamera : public FrameSource {
public:
    explicit OpenCvCamera(int index = 0, int width = 640, int height = 480);
    ~OpenCvCamera() override;

    OpenCvCamera(const OpenCvCamera&) = delete;
    OpenCvCamera& operator=(const OpenCvCamera&) = delete;

    bool open() override;
    void close() override;
    bool isOpen() const override;

    // Waits at most `timeout` for the next frame
    bool read(Frame& frame, std::chrono::milliseconds timeout) override;

private:
    const int index_;
    const int width_;
    const int height_;
    mutable std::mutex mutex_;
    std::unique_ptr<cv::VideoCapture> capture_;
    bool wait_any_ = true;          // false once the backend rejects waitAny()
    std::chrono::milliseconds applied_timeout_{0};
};

} // namespace aegis::camera
