/**
 * OpenCvCamera.cpp - cv::VideoCapture backend
 */

#include "aegis/camera/OpenCvCamera.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <vector>

namespace aegis::camera {

OpenCvCamera::OpenCvCamera(int index, int width, int height)
    : index_(index)
    , width_(width)
    , height_(height) {
}

OpenCvCamera::~OpenCvCamera() {
    close();
}

bool OpenCvCamera::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capture_ && capture_->isOpened()) {
        return true;
    }

    capture_ = std::make_unique<cv::VideoCapture>();
    capture_->open(index_, cv::CAP_V4L2);

    if (!capture_->isOpened()) {
        std::cerr << "[Camera] Failed to open camera index " << index_ << std::endl;
        capture_.reset();
        return false;
    }

    wait_any_ = true;
    applied_timeout_ = std::chrono::milliseconds(0);
    capture_->set(cv::CAP_PROP_FRAME_WIDTH, width_);
    capture_->set(cv::CAP_PROP_FRAME_HEIGHT, height_);

    std::cout << "[Camera] Opened index " << index_ << " ("
              << static_cast<int>(capture_->get(cv::CAP_PROP_FRAME_WIDTH)) << "x"
              << static_cast<int>(capture_->get(cv::CAP_PROP_FRAME_HEIGHT)) << ")" << std::endl;
    return true;
}

void OpenCvCamera::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capture_) {
        capture_->release();
        capture_.reset();
        std::cout << "[Camera] Released index " << index_ << std::endl;
    }
}

bool OpenCvCamera::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capture_ && capture_->isOpened();
}

bool OpenCvCamera::read(Frame& frame, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!capture_ || !capture_->isOpened()) {
        return false;
    }

    timeout = std::max(timeout, std::chrono::milliseconds(1));
    bool grabbed = false;

    if (wait_any_) {
        // V4L2: select() on the device, grabbing only when a frame is ready
        std::vector<cv::VideoCapture> streams{*capture_};
        std::vector<int> ready;
        int64_t timeout_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(timeout).count();
        try {
            if (!cv::VideoCapture::waitAny(streams, ready, timeout_ns) || ready.empty()) {
                std::cerr << "[Camera] No frame within " << timeout.count() << "ms" << std::endl;
                return false;
            }
            grabbed = true;
        } catch (const cv::Exception& e) {
            std::cerr << "[Camera] waitAny unsupported, using read timeout: " << e.what() << std::endl;
            wait_any_ = false;
        }
    }

    if (!grabbed) {
        if (timeout != applied_timeout_) {
            capture_->set(cv::CAP_PROP_READ_TIMEOUT_MSEC, static_cast<double>(timeout.count()));
            applied_timeout_ = timeout;
        }
        if (!capture_->grab()) {
            return false;
        }
    }

    cv::Mat mat;
    if (!capture_->retrieve(mat) || mat.empty()) {
        return false;
    }

    cv::Mat bgr;
    if (mat.channels() == 1) {
        cv::cvtColor(mat, bgr, cv::COLOR_GRAY2BGR);
    } else if (mat.channels() == 4) {
        cv::cvtColor(mat, bgr, cv::COLOR_BGRA2BGR);
    } else {
        bgr = mat;
    }
    if (!bgr.isContinuous()) {
        bgr = bgr.clone();
    }

    frame.width = bgr.cols;
    frame.height = bgr.rows;
    frame.channels = 3;
    frame.pixels.assign(bgr.data, bgr.data + bgr.total() * bgr.elemSize());
    return true;
}

} // namespace aegis::camera
