/**
 * ObstructionDetector.hpp - Dark-frame / read-failure classifier
 *
 * Pure state machine, no device access. Obstructed after K consecutive dark
 * frames or M consecutive read failures; Clear again on the first bright frame.
 */

#pragma once

namespace aegis::camera {

enum class ObstructionState { Clear, Obstructed };

enum class BlockCause { None, Obstructed, Unavailable };

enum class Transition { None, Blocked, Restored };

const char* toString(ObstructionState state);
const char* toString(BlockCause cause);

struct ObstructionConfig {
    double dark_threshold = 60.0;
    int dark_frames_required = 5;
    int max_read_failures = 10;
};

class ObstructionDetector {
public:
    explicit ObstructionDetector(const ObstructionConfig& config = {});

    Transition onFrame(double brightness);
    Transition onReadFailure();

    // Streak counters only; the Clear/Obstructed state is kept.
    void resetCounters();

    ObstructionState state() const { return state_; }
    BlockCause cause() const { return cause_; }
    int darkStreak() const { return dark_streak_; }
    int failureStreak() const { return failure_streak_; }

private:
    ObstructionConfig config_;
    ObstructionState state_ = ObstructionState::Clear;
    BlockCause cause_ = BlockCause::None;
    int dark_streak_ = 0;
    int failure_streak_ = 0;
};

} // namespace aegis::camera
