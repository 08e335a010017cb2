/**
 * Orchestrator.cpp - Session state machine and security overlay
 *
 * Connects: WakeListener → CommandRecorder → IdentityVerifier →
 *           TranscriptionRelay → CommandDispatcher → SpeechOutput
 */

#include "aegis/Orchestrator.hpp"
#include "aegis/audio/CommandRecorder.hpp"
#include "aegis/camera/CameraMonitor.hpp"
#include "aegis/commands/CommandDispatcher.hpp"
#include "aegis/identity/IdentityVerifier.hpp"
#include "aegis/resource/ResourceGuard.hpp"
#include "aegis/stt/TranscriptionRelay.hpp"
#include "aegis/tts/SpeechOutput.hpp"

#include <atomic>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>

namespace aegis {

constexpr auto EVENT_POLL = std::chrono::milliseconds(100);
constexpr auto MIC_RETRY = std::chrono::seconds(2);

const char* toString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Idle:           return "Idle";
        case PipelineStage::Awake:          return "Awake";
        case PipelineStage::Recording:      return "Recording";
        case PipelineStage::VerifyingVoice: return "VerifyingVoice";
        case PipelineStage::VerifyingFace:  return "VerifyingFace";
        case PipelineStage::Transcribing:   return "Transcribing";
        case PipelineStage::Dispatching:    return "Dispatching";
        case PipelineStage::Speaking:       return "Speaking";
    }
    return "Unknown";
}

const char* toString(SecurityLevel level) {
    switch (level) {
        case SecurityLevel::Normal:   return "Normal";
        case SecurityLevel::Elevated: return "Elevated";
        case SecurityLevel::Lockdown: return "Lockdown";
    }
    return "Unknown";
}

const char* toString(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::Completed:     return "Completed";
        case SessionOutcome::NoSpeech:      return "NoSpeech";
        case SessionOutcome::NotUnderstood: return "NotUnderstood";
        case SessionOutcome::Denied:        return "Denied";
        case SessionOutcome::Aborted:       return "Aborted";
        case SessionOutcome::Failed:        return "Failed";
    }
    return "Unknown";
}

struct Orchestrator::Impl {
    OrchestratorDeps deps;
    OrchestratorConfig config;
    OrchestratorCallbacks callbacks;

    // State
    std::atomic<bool> running{false};
    std::atomic<PipelineStage> stage{PipelineStage::Idle};
    std::thread worker_thread;

    mutable std::mutex security_mutex;
    SecurityState security;

    std::atomic<uint64_t> sessions{0};
    std::atomic<uint64_t> dropped_wakes{0};
    std::chrono::steady_clock::time_point last_session_end{};
    std::chrono::steady_clock::time_point last_mic_retry{};

    Impl(OrchestratorDeps d, const OrchestratorConfig& c)
        : deps(std::move(d)), config(c) {}

    void setStage(PipelineSession& session, PipelineStage new_stage) {
        session.stage = new_stage;
        setStage(new_stage);
    }

    void setStage(PipelineStage new_stage) {
        stage = new_stage;
        if (callbacks.onStageChange) {
            callbacks.onStageChange(new_stage);
        }
    }

    SecurityState currentSecurity() const {
        std::lock_guard<std::mutex> lock(security_mutex);
        return security;
    }

    void setSecurity(SecurityLevel level, const std::string& reason) {
        SecurityState next{level, level == SecurityLevel::Normal ? std::string() : reason};
        {
            std::lock_guard<std::mutex> lock(security_mutex);
            if (security == next) return;
            security = next;
        }
        std::cout << "[Orchestrator] Security: " << toString(next.level);
        if (!next.reason.empty()) std::cout << " (" << next.reason << ")";
        std::cout << std::endl;
        if (callbacks.onSecurityChange) {
            callbacks.onSecurityChange(next);
        }
    }

    bool inLockdown(const char* reason) const {
        auto s = currentSecurity();
        return s.level == SecurityLevel::Lockdown && s.reason == reason;
    }

    void clearMicUnavailable() {
        auto s = currentSecurity();
        if (s.level == SecurityLevel::Elevated && s.reason == "mic unavailable") {
            setSecurity(SecurityLevel::Normal, "");
        }
    }

    void reportError(const std::string& message) {
        std::cerr << "[Orchestrator] " << message << std::endl;
        if (callbacks.onError) {
            callbacks.onError(message);
        }
    }

    void say(const std::string& text) {
        if (text.empty()) return;
        if (callbacks.onAssistantResponse) {
            callbacks.onAssistantResponse(text);
        }
        if (!deps.speech.speak(text)) {
            std::cerr << "[Orchestrator] Speech output rejected: " << text << std::endl;
        }
    }

    void waitForSpeech() {
        if (!deps.speech.waitUntilDrained(config.speech_drain_timeout)) {
            std::cerr << "[Orchestrator] Speech did not finish within "
                      << config.speech_drain_timeout.count() << "ms" << std::endl;
        }
    }

    // Step 9: enqueue and wait for playback so the listener never hears the reply
    void announce(PipelineSession& session, const std::string& text) {
        setStage(session, PipelineStage::Speaking);
        session.reply = text;
        say(text);
        waitForSpeech();
    }

    // Outside a session: the listener stays paused until the alert has played
    void speakAlert(const std::string& text) {
        if (text.empty()) return;
        {
            resource::ScopedHold hold(deps.mic);
            say(text);
            waitForSpeech();
        }
        resumeWakeListener();
    }

    // ========================================================================
    // Events
    // ========================================================================

    // In a session the mic hold is already set and announce() drains the queue
    void handleCameraEvent(const Event& event, bool in_session) {
        const std::string* alert = nullptr;
        if (event.kind == EventKind::CameraBlocked) {
            if (inLockdown("camera")) return;
            std::cerr << "[Orchestrator] Camera blocked (" << event.detail
                      << "), locking down" << std::endl;
            setSecurity(SecurityLevel::Lockdown, "camera");
            alert = &config.messages.camera_blocked;
        } else if (event.kind == EventKind::CameraRestored) {
            if (!inLockdown("camera")) return;
            std::cout << "[Orchestrator] Camera restored" << std::endl;
            setSecurity(SecurityLevel::Normal, "");
            alert = &config.messages.camera_restored;
        }
        if (!alert) return;

        if (in_session) {
            say(*alert);
        } else {
            speakAlert(*alert);
        }
    }

    // Called at stage boundaries: wakes are dropped, camera events applied
    void drainPending() {
        while (auto event = deps.events.tryPop()) {
            if (event->kind == EventKind::WakeDetected) {
                dropped_wakes++;
                std::cout << "[Orchestrator] Session active, wake from "
                          << event->source << " dropped" << std::endl;
            } else if (event->kind == EventKind::Shutdown) {
                running = false;
            } else {
                handleCameraEvent(*event, true);
            }
        }
    }

    void handleEvent(const Event& event) {
        switch (event.kind) {
            case EventKind::WakeDetected:
                if (event.at < last_session_end) {
                    dropped_wakes++;
                    std::cout << "[Orchestrator] Stale wake from " << event.source
                              << " dropped" << std::endl;
                    return;
                }
                if (inLockdown("camera")) {
                    dropped_wakes++;
                    std::cerr << "[Orchestrator] Camera lockdown, wake ignored" << std::endl;
                    return;
                }
                runSession(event);
                break;
            case EventKind::CameraBlocked:
            case EventKind::CameraRestored:
                handleCameraEvent(event, false);
                break;
            case EventKind::Shutdown:
                running = false;
                break;
        }
    }

    void run() {
        std::cout << "[Orchestrator] Event loop started" << std::endl;
        speakAlert(config.messages.greeting);
        while (running) {
            retryMic();
            auto event = deps.events.pop(EVENT_POLL);
            if (!event) {
                if (deps.events.closed()) break;
                continue;
            }
            handleEvent(*event);
        }
        std::cout << "[Orchestrator] Event loop stopped" << std::endl;
    }

    // ========================================================================
    // Session
    // ========================================================================

    void runSession(const Event& wake) {
        PipelineSession session;
        session.id = ++sessions;

        SessionReport report;
        report.id = session.id;

        std::cout << "\n[Orchestrator] Session " << session.id << " (wake from "
                  << wake.source << ")" << std::endl;
        setStage(session, PipelineStage::Awake);

        {
            // Keeps WakeListener paused until the reply has been spoken
            resource::ScopedHold hold(deps.mic);
            try {
                runStages(session, report);
            } catch (const std::exception& e) {
                session.mic_lease.release();
                report.outcome = SessionOutcome::Failed;
                report.error = ErrorKind::CollaboratorError;
                reportError(std::string("Session failed in ") + toString(session.stage)
                            + ": " + e.what());
                announce(session, config.messages.error);
            }
            session.mic_lease.release();
        }

        // Step 10: WakeListener resumes when the hold drops
        if (!resumeWakeListener() && report.error == ErrorKind::None) {
            report.error = ErrorKind::DeviceUnavailable;
        }
        resumeCamera();

        report.verifications = session.verifications;
        report.transcript = session.transcript;
        report.reply = session.reply;

        last_session_end = std::chrono::steady_clock::now();
        setStage(session, PipelineStage::Idle);

        std::cout << "[Orchestrator] Session " << report.id << " finished: "
                  << toString(report.outcome);
        if (report.error != ErrorKind::None) {
            std::cout << " (" << toString(report.error) << ")";
        }
        std::cout << std::endl;

        if (callbacks.onSessionComplete) {
            callbacks.onSessionComplete(report);
        }
    }

    void runStages(PipelineSession& session, SessionReport& report) {
        // A listener that failed to reopen must not block the session itself
        if (deps.mic.degraded()) {
            deps.mic.reset();
        }
        auto acquired = deps.mic.acquireExclusive("orchestrator");
        if (acquired.status == resource::AcquireStatus::Busy) {
            std::cerr << "[Orchestrator] Mic busy, session aborted" << std::endl;
            report.outcome = SessionOutcome::Aborted;
            report.error = ErrorKind::ResourceBusy;
            return;
        }
        if (!acquired.granted()) {
            report.outcome = SessionOutcome::Aborted;
            report.error = ErrorKind::DeviceUnavailable;
            reportError(std::string("Mic unavailable: ") + resource::toString(acquired.status));
            announce(session, config.messages.error);
            return;
        }
        session.mic_lease = std::move(acquired.lease);

        setStage(session, PipelineStage::Recording);
        auto recording = deps.recorder.recordWith(session.mic_lease, config.command_duration);
        session.mic_lease.release();
        drainPending();

        if (!recording.ok()) {
            report.outcome = SessionOutcome::Aborted;
            report.error = recording.error;
            reportError(std::string("Recording failed: ") + toString(recording.error));
            announce(session, config.messages.error);
            return;
        }

        session.samples = std::move(recording.samples);
        session.sample_rate = recording.sample_rate;

        if (config.require_speech && !recording.speech_detected) {
            std::cout << "[Orchestrator] No speech in recording" << std::endl;
            report.outcome = SessionOutcome::NoSpeech;
            report.error = ErrorKind::TranscriptionEmpty;
            announce(session, config.messages.no_speech);
            return;
        }

        if (!verifyIdentity(session)) {
            std::cerr << "[Orchestrator] Identity mismatch, intruder declared" << std::endl;
            setSecurity(SecurityLevel::Lockdown, "identity");
            report.outcome = SessionOutcome::Denied;
            report.error = ErrorKind::VerificationFailed;
            announce(session, config.messages.intruder);
            return;
        }
        if (inLockdown("identity")) {
            setSecurity(SecurityLevel::Normal, "");
        }
        drainPending();

        setStage(session, PipelineStage::Transcribing);
        session.transcript = deps.transcription.relay(session.samples, session.sample_rate);
        drainPending();

        if (session.transcript.empty()) {
            std::cout << "[Orchestrator] Nothing understood" << std::endl;
            report.outcome = SessionOutcome::NotUnderstood;
            report.error = ErrorKind::TranscriptionEmpty;
            announce(session, config.messages.no_speech);
            return;
        }

        std::cout << "[Orchestrator] You said: \"" << session.transcript << "\"" << std::endl;
        if (callbacks.onUserUtterance) {
            callbacks.onUserUtterance(session.transcript);
        }

        setStage(session, PipelineStage::Dispatching);
        auto result = deps.dispatcher.dispatch(session.transcript);
        std::cout << "[Orchestrator] Intent: " << commands::toString(result.intent)
                  << (result.intent_executed ? "" : " (not executed)") << std::endl;
        applyDirective(result.security);
        drainPending();

        report.error = result.error;
        report.outcome = result.error == ErrorKind::None
            ? SessionOutcome::Completed
            : SessionOutcome::Failed;

        announce(session, result.spoken_message.empty()
            ? config.messages.error
            : result.spoken_message);
    }

    /**
     * No profile for a modality means the check is skipped. Voice failure
     * escalates to face only when a face profile exists.
     */
    bool verifyIdentity(PipelineSession& session) {
        const auto& profiles = deps.profiles;
        if (profiles.empty()) {
            std::cout << "[Orchestrator] No biometric profiles enrolled, skipping verification"
                      << std::endl;
            return true;
        }

        if (profiles.voice) {
            setStage(session, PipelineStage::VerifyingVoice);
            auto voice = deps.verifier.verifyVoice(session.samples, session.sample_rate,
                                                   *profiles.voice);
            session.verifications.push_back(voice);
            if (voice.matched) {
                return true;
            }
            if (!profiles.face) {
                return false;
            }
            std::cout << "[Orchestrator] Voice mismatch (" << std::fixed << std::setprecision(3)
                      << voice.similarity << "), trying face" << std::endl;
        }

        setStage(session, PipelineStage::VerifyingFace);
        auto face = deps.verifier.verifyFace(*profiles.face, config.face_frame_timeout,
                                             config.face_max_attempts);
        session.verifications.push_back(face);
        return face.matched;
    }

    void applyDirective(commands::SecurityDirective directive) {
        switch (directive) {
            case commands::SecurityDirective::Elevate:
                setSecurity(SecurityLevel::Elevated, "user request");
                break;
            case commands::SecurityDirective::Normalize:
                setSecurity(SecurityLevel::Normal, "");
                break;
            case commands::SecurityDirective::None:
                break;
        }
    }

    /**
     * The listener reopens its stream when the hold drops. If that fails the
     * mic guard is Degraded; one reset is tried before reporting it.
     */
    bool resumeWakeListener() {
        if (!deps.mic.degraded() || deps.mic.reset()) {
            clearMicUnavailable();
            return true;
        }

        reportError("Wake listener could not be resumed");
        if (currentSecurity().level != SecurityLevel::Lockdown) {
            setSecurity(SecurityLevel::Elevated, "mic unavailable");
        }
        last_mic_retry = std::chrono::steady_clock::now();
        return false;
    }

    // Idle loop: keep trying to reopen a Degraded mic
    void retryMic() {
        auto now = std::chrono::steady_clock::now();
        if (now - last_mic_retry < MIC_RETRY || !deps.mic.degraded()) {
            return;
        }
        last_mic_retry = now;
        if (deps.mic.reset()) {
            std::cout << "[Orchestrator] Wake listener resumed" << std::endl;
            clearMicUnavailable();
        }
    }

    void resumeCamera() {
        auto* monitor = deps.monitor;
        if (!monitor || monitor->state() != camera::MonitorState::Paused) {
            return;
        }

        bool resumed = deps.camera.degraded() ? deps.camera.reset() : monitor->resume();
        if (resumed && monitor->state() == camera::MonitorState::Running) {
            std::cout << "[Orchestrator] Camera monitor resumed" << std::endl;
            return;
        }

        reportError("Camera monitor could not be resumed");
        if (currentSecurity().level != SecurityLevel::Lockdown) {
            setSecurity(SecurityLevel::Elevated, "camera unavailable");
        }
    }
};

Orchestrator::Orchestrator(OrchestratorDeps deps, const OrchestratorConfig& config)
    : impl_(std::make_unique<Impl>(std::move(deps), config)) {}

Orchestrator::~Orchestrator() { stop(); }

void Orchestrator::start() {
    if (impl_->running.exchange(true)) {
        return;
    }
    impl_->worker_thread = std::thread([this]() { impl_->run(); });
}

void Orchestrator::stop() {
    impl_->running = false;
    if (impl_->worker_thread.joinable()) {
        impl_->worker_thread.join();
    }
}

bool Orchestrator::isRunning() const { return impl_->running; }

bool Orchestrator::submit(Event event) {
    return impl_->deps.events.push(std::move(event));
}

PipelineStage Orchestrator::stage() const { return impl_->stage; }

SecurityState Orchestrator::securityState() const { return impl_->currentSecurity(); }

uint64_t Orchestrator::sessionsStarted() const { return impl_->sessions; }

uint64_t Orchestrator::droppedWakeEvents() const { return impl_->dropped_wakes; }

void Orchestrator::setCallbacks(OrchestratorCallbacks callbacks) {
    impl_->callbacks = std::move(callbacks);
}

} // namespace aegis
