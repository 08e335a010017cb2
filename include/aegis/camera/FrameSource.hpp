/**
 * FrameSource.hpp - Camera device seam
 *
 * Opened by whoever holds the camera lease: CameraMonitor while sampling,
 * IdentityVerifier and Enrollment under an Exclusive lease.
 */

#pragma once

#include "aegis/camera/Frame.hpp"

#include <chrono>

namespace aegis::camera {

class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /**
     * Grab one frame. Returns false on read failure or timeout.
     */
    virtual bool read(Frame& frame, std::chrono::milliseconds timeout) = 0;
};

/**
 * Opens on construction (check isOpen()), closes on scope exit.
 */
class ScopedFrameSource {
public:
    explicit ScopedFrameSource(FrameSource& source) : source_(source) {
        opened_ = source_.isOpen() || source_.open();
    }
    ~ScopedFrameSource() {
        if (opened_) {
            source_.close();
        }
    }

    ScopedFrameSource(const ScopedFrameSource&) = delete;
    ScopedFrameSource& operator=(const ScopedFrameSource&) = delete;

    bool isOpen() const { return opened_; }
    FrameSource* operator->() { return &source_; }

private:
    FrameSource& source_;
    bool opened_ = false;
};

} // namespace aegis::camera
