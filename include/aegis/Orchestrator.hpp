/**
 * Orchestrator.hpp - Wake → record → verify → transcribe → dispatch → speak
 *
 * Single event-loop thread. Background workers push events into the shared
 * channel; all PipelineSession and SecurityState mutation happens here.
 */

#pragma once

#include "aegis/Events.hpp"
#include "aegis/Session.hpp"
#include "aegis/identity/Biometrics.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace aegis {

namespace resource { class ResourceGuard; }
namespace audio { class CommandRecorder; }
namespace identity { class IdentityVerifier; }
namespace stt { class TranscriptionRelay; }
namespace commands { class CommandDispatcher; }
namespace tts { class SpeechOutput; }
namespace camera { class CameraMonitor; }

struct OrchestratorMessages {
    std::string greeting;  // spoken once when the event loop starts; empty = silent
    std::string no_speech = "I didn't catch anything. Please try again.";
    std::string intruder = "Intruder alert. Access denied.";
    std::string error = "Sorry, I had trouble understanding that. Something went wrong.";
    std::string camera_blocked = "Camera obstructed. Security lockdown engaged.";
    std::string camera_restored = "Camera feed restored.";
};

struct OrchestratorConfig {
    std::chrono::milliseconds command_duration{3000};
    bool require_speech = true;
    int face_max_attempts = 10;
    std::chrono::milliseconds face_frame_timeout{500};
    std::chrono::milliseconds speech_drain_timeout{15000};
    OrchestratorMessages messages;
};

struct OrchestratorCallbacks {
    std::function<void(PipelineStage)> onStageChange;
    std::function<void(const SecurityState&)> onSecurityChange;
    std::function<void(const SessionReport&)> onSessionComplete;
    std::function<void(const std::string&)> onUserUtterance;
    std::function<void(const std::string&)> onAssistantResponse;
    std::function<void(const std::string&)> onError;
};

// Collaborators are borrowed; they must outlive the Orchestrator.
struct OrchestratorDeps {
    resource::ResourceGuard& mic;
    resource::ResourceGuard& camera;
    audio::CommandRecorder& recorder;
    identity::IdentityVerifier& verifier;
    stt::TranscriptionRelay& transcription;
    commands::CommandDispatcher& dispatcher;
    tts::SpeechOutput& speech;
    EventChannel<Event>& events;
    identity::ProfileSet profiles;
    camera::CameraMonitor* monitor = nullptr;
};

class Orchestrator {
public:
    Orchestrator(OrchestratorDeps deps, const OrchestratorConfig& config = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Start the event loop thread
    void start();

    // Stop after the current session (if any) finishes. Idempotent.
    void stop();

    bool isRunning() const;

    // Enqueue an event; false when the channel is full or closed
    bool submit(Event event);

    PipelineStage stage() const;
    SecurityState securityState() const;
    uint64_t sessionsStarted() const;
    uint64_t droppedWakeEvents() const;

    // Set before start()
    void setCallbacks(OrchestratorCallbacks callbacks);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace aegis
