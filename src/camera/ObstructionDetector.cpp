/**
 * ObstructionDetector.cpp - Obstruction classification
 */

#include "aegis/camera/ObstructionDetector.hpp"

namespace aegis::camera {

const char* toString(ObstructionState state) {
    return state == ObstructionState::Obstructed ? "Obstructed" : "Clear";
}

const char* toString(BlockCause cause) {
    switch (cause) {
        case BlockCause::None:        return "none";
        case BlockCause::Obstructed:  return "obstructed";
        case BlockCause::Unavailable: return "unavailable";
    }
    return "unknown";
}

ObstructionDetector::ObstructionDetector(const ObstructionConfig& config)
    : config_(config) {
}

Transition ObstructionDetector::onFrame(double brightness) {
    failure_streak_ = 0;

    if (brightness < config_.dark_threshold) {
        dark_streak_++;
        if (state_ == ObstructionState::Clear && dark_streak_ >= config_.dark_frames_required) {
            state_ = ObstructionState::Obstructed;
            cause_ = BlockCause::Obstructed;
            return Transition::Blocked;
        }
        return Transition::None;
    }

    dark_streak_ = 0;
    if (state_ == ObstructionState::Obstructed) {
        state_ = ObstructionState::Clear;
        cause_ = BlockCause::None;
        return Transition::Restored;
    }
    return Transition::None;
}

Transition ObstructionDetector::onReadFailure() {
    failure_streak_++;
    if (state_ == ObstructionState::Clear && failure_streak_ >= config_.max_read_failures) {
        state_ = ObstructionState::Obstructed;
        cause_ = BlockCause::Unavailable;
        return Transition::Blocked;
    }
    return Transition::None;
}

void ObstructionDetector::resetCounters() {
    dark_streak_ = 0;
    failure_streak_ = 0;
}

} // namespace aegis::camera
