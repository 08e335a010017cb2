/**
 * Session.hpp - Pipeline stages, security overlay and per-wake session state
 */

#pragma once

#include "aegis/Errors.hpp"
#include "aegis/identity/Biometrics.hpp"
#include "aegis/resource/ResourceGuard.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace aegis {

enum class PipelineStage {
    Idle,
    Awake,
    Recording,
    VerifyingVoice,
    VerifyingFace,
    Transcribing,
    Dispatching,
    Speaking
};

enum class SecurityLevel { Normal, Elevated, Lockdown };

struct SecurityState {
    SecurityLevel level = SecurityLevel::Normal;
    std::string reason;     // "identity", "camera", "user request", "camera unavailable"

    bool operator==(const SecurityState& other) const {
        return level == other.level && reason == other.reason;
    }
    bool operator!=(const SecurityState& other) const { return !(*this == other); }
};

enum class SessionOutcome {
    Completed,      // command dispatched and answered
    NoSpeech,       // silent recording
    NotUnderstood,  // empty transcript
    Denied,         // identity check failed
    Aborted,        // mic busy / degraded
    Failed          // a collaborator threw
};

const char* toString(PipelineStage stage);
const char* toString(SecurityLevel level);
const char* toString(SessionOutcome outcome);

/**
 * Working state of the one active session. Owned by the orchestrator
 * thread; never shared.
 */
struct PipelineSession {
    uint64_t id = 0;
    PipelineStage stage = PipelineStage::Idle;
    resource::Lease mic_lease;
    std::vector<float> samples;
    int sample_rate = 0;
    std::vector<identity::VerificationResult> verifications;
    std::string transcript;
    std::string reply;
};

// Published through OrchestratorCallbacks::onSessionComplete
struct SessionReport {
    uint64_t id = 0;
    SessionOutcome outcome = SessionOutcome::Completed;
    std::vector<identity::VerificationResult> verifications;
    std::string transcript;
    std::string reply;
    ErrorKind error = ErrorKind::None;
};

} // namespace aegis
