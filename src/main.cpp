/**
 * Aegis - Main Entry Point
 *
 * Wake-word voice assistant with voice/face owner verification and a
 * camera obstruction watchdog.
 */

#include "aegis/Config.hpp"
#include "aegis/Events.hpp"
#include "aegis/Orchestrator.hpp"
#include "aegis/audio/AudioEngine.hpp"
#include "aegis/audio/CommandRecorder.hpp"
#include "aegis/audio/VADProcessor.hpp"
#include "aegis/camera/CameraMonitor.hpp"
#include "aegis/camera/OpenCvCamera.hpp"
#include "aegis/commands/CommandEngine.hpp"
#include "aegis/commands/NoteStore.hpp"
#include "aegis/commands/ProcessLauncher.hpp"
#include "aegis/identity/EmbeddingClient.hpp"
#include "aegis/identity/Enrollment.hpp"
#include "aegis/identity/IdentityVerifier.hpp"
#include "aegis/identity/ProfileStore.hpp"
#include "aegis/resource/ResourceGuard.hpp"
#include "aegis/stt/STTEngine.hpp"
#include "aegis/stt/TranscriptionRelay.hpp"
#include "aegis/tts/SpeechOutput.hpp"
#include "aegis/tts/TTSEngine.hpp"

#ifdef AEGIS_HAS_PORCUPINE
#include "aegis/wakeword/WakeListener.hpp"
#include "aegis/wakeword/WakeWordDetector.hpp"
#endif

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace aegis;

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

namespace {

struct Options {
    std::string config_path = "config/aegis.json";
    bool list_devices = false;
    bool enroll_voice = false;
    bool enroll_face = false;
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0
              << " [--config path] [--list-devices] [--enroll-voice] [--enroll-face]" << std::endl;
}

bool parseArgs(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--list-devices") {
            opts.list_devices = true;
        } else if (arg == "--enroll-voice") {
            opts.enroll_voice = true;
        } else if (arg == "--enroll-face") {
            opts.enroll_face = true;
        } else {
            printUsage(argv[0]);
            return false;
        }
    }
    return true;
}

int listDevices() {
    std::cout << "Input devices:" << std::endl;
    for (const auto& name : audio::AudioEngine::listInputDevices()) {
        std::cout << "  " << name << std::endl;
    }
    std::cout << "Output devices:" << std::endl;
    for (const auto& name : audio::AudioEngine::listOutputDevices()) {
        std::cout << "  " << name << std::endl;
    }
    return 0;
}

audio::VADMode vadMode(int mode) {
    return static_cast<audio::VADMode>(std::clamp(mode, 0, 3));
}

int enroll(const Config& config, const Options& opts) {
    identity::ProfileStore store(config.identity.profile_dir);
    identity::EmbeddingClient embedder(config.embedding.server_url, config.embedding.timeout_ms);
    if (!embedder.isHealthy()) {
        std::cerr << "[Aegis] Embedding server not reachable at " << embedder.baseUrl() << std::endl;
        return 1;
    }

    resource::ResourceGuard mic(resource::ResourceKind::Mic);
    resource::ResourceGuard camera_guard(resource::ResourceKind::Camera);
    camera::OpenCvCamera cam(config.camera.index);
    identity::Enrollment enrollment(store, embedder, embedder, camera_guard, cam);

    int status = 0;

    if (opts.enroll_voice) {
        audio::AudioEngine engine(config.audio);
        if (!engine.initialize() || !engine.start()) {
            std::cerr << "[Aegis] Audio unavailable: " << engine.lastError() << std::endl;
            return 1;
        }
        audio::CommandRecorder recorder(mic, engine);

        auto profile = enrollment.enrollVoice(
            recorder,
            config.identity.enroll_voice_samples,
            std::chrono::milliseconds(config.identity.enroll_voice_duration_ms),
            [](int index, int total) {
                std::cout << "\n[Aegis] Sample " << index << "/" << total
                          << ": speak now..." << std::endl;
            });
        engine.stop();

        if (!profile) {
            std::cerr << "[Aegis] Voice enrollment failed: " << enrollment.lastError() << std::endl;
            status = 1;
        } else {
            std::cout << "[Aegis] Voiceprint saved to " << store.pathFor(identity::Modality::Voice)
                      << " (" << profile->samples << " samples)" << std::endl;
        }
    }

    if (opts.enroll_face) {
        std::cout << "[Aegis] Look at the camera..." << std::endl;
        auto profile = enrollment.enrollFace(
            config.identity.enroll_face_frames,
            config.identity.enroll_face_max_reads,
            config.orchestrator.face_frame_timeout);

        if (!profile) {
            std::cerr << "[Aegis] Face enrollment failed: " << enrollment.lastError() << std::endl;
            status = 1;
        } else {
            std::cout << "[Aegis] Faceprint saved to " << store.pathFor(identity::Modality::Face)
                      << " (" << profile->samples << " frames)" << std::endl;
        }
    }

    return status;
}

#ifdef AEGIS_HAS_PORCUPINE
std::string readAccessKey(const std::string& path) {
    std::string access_key;
    std::ifstream key_file(path);
    if (key_file.good()) {
        std::getline(key_file, access_key);
        while (!access_key.empty() && (access_key.back() == '\n' || access_key.back() == '\r' || access_key.back() == ' ')) {
            access_key.pop_back();
        }
    }
    return access_key;
}
#endif

// Non-blocking console line read, so signals are noticed within ~100ms
bool readConsoleLine(std::string& line) {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    if (poll(&pfd, 1, 100) <= 0 || !(pfd.revents & (POLLIN | POLLHUP))) {
        return false;
    }
    if (!std::getline(std::cin, line)) {
        g_running = false;
        return false;
    }
    return true;
}

int runAssistant(const Config& config) {
    // Profiles first: a corrupt profile is a startup error
    identity::ProfileStore store(config.identity.profile_dir);
    identity::ProfileSet profiles;
    try {
        profiles = store.loadAll();
    } catch (const std::exception& e) {
        std::cerr << "[Aegis] Cannot load biometric profiles: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "[Aegis] Profiles: voice=" << (profiles.voice ? "enrolled" : "none")
              << ", face=" << (profiles.face ? "enrolled" : "none") << std::endl;
    if (profiles.empty()) {
        std::cout << "[Aegis] No biometrics enrolled, commands are accepted without verification"
                  << std::endl;
    }

    resource::ResourceGuard mic(resource::ResourceKind::Mic);
    resource::ResourceGuard speaker(resource::ResourceKind::Speaker);
    resource::ResourceGuard camera_guard(resource::ResourceKind::Camera);
    EventChannel<Event> events;

    audio::AudioEngine engine(config.audio);
    if (!engine.initialize() || !engine.start()) {
        std::cerr << "[Aegis] Audio unavailable: " << engine.lastError() << std::endl;
        return 1;
    }

    audio::VADProcessor vad(config.audio.sample_rate, vadMode(config.vad_mode));
    audio::CommandRecorder recorder(mic, engine, vad.isReady() ? &vad : nullptr);

    stt::STTEngine whisper(config.stt.model_path, config.stt.language, config.stt.threads);
    if (!whisper.isReady()) {
        std::cerr << "[Aegis] Whisper model not loaded: " << config.stt.model_path << std::endl;
        return 1;
    }
    stt::TranscriptionRelay relay(whisper);

    tts::TTSEngine tts_engine(config.tts);
    if (!tts_engine.isServerAvailable()) {
        std::cerr << "[Aegis] TTS server not reachable at " << config.tts.server_url
                  << ", replies will only be printed" << std::endl;
    }
    tts::SpeechOutput speech(tts_engine, engine, speaker);

    identity::EmbeddingClient embedder(config.embedding.server_url, config.embedding.timeout_ms);
    if (!profiles.empty() && !embedder.isHealthy()) {
        std::cerr << "[Aegis] Embedding server not reachable at " << embedder.baseUrl() << std::endl;
    }

    camera::OpenCvCamera cam(config.camera.index);
    identity::IdentityVerifier verifier(embedder, embedder, camera_guard, cam,
                                        config.identity.verifier);

    commands::PosixLauncher launcher;
    commands::NoteStore notes(config.notes_file);
    commands::CommandEngine dispatcher(config.commands, launcher, notes);

    std::unique_ptr<camera::CameraMonitor> monitor;
    if (config.camera.enabled) {
        monitor = std::make_unique<camera::CameraMonitor>(camera_guard, cam, events,
                                                          config.camera.monitor);
        if (!monitor->start()) {
            std::cerr << "[Aegis] Camera monitor disabled" << std::endl;
            monitor.reset();
        }
    }

#ifdef AEGIS_HAS_PORCUPINE
    std::unique_ptr<wakeword::WakeWordDetector> detector;
    std::unique_ptr<wakeword::WakeListener> listener;
    std::string access_key = readAccessKey(config.wake.access_key_file);
    if (access_key.empty()) {
        std::cerr << "[Aegis] No Porcupine access key found in " << config.wake.access_key_file << std::endl;
    } else {
        std::vector<float> sensitivities(config.wake.keyword_paths.size(), config.wake.sensitivity);
        detector = std::make_unique<wakeword::WakeWordDetector>(
            access_key, config.wake.model_path, config.wake.keyword_paths, sensitivities);
        if (detector->isReady()) {
            listener = std::make_unique<wakeword::WakeListener>(mic, engine, *detector, events,
                                                                config.wake.phrase);
            if (!listener->start()) {
                std::cerr << "[Aegis] Wake listener could not start" << std::endl;
                listener.reset();
            }
        }
    }
#else
    std::cout << "[Aegis] Built without Porcupine, press Enter to wake" << std::endl;
#endif

    OrchestratorConfig orchestrator_config = config.orchestrator;
    orchestrator_config.messages.greeting = config.greetingText();

    Orchestrator orchestrator(OrchestratorDeps{
        mic, camera_guard, recorder, verifier, relay, dispatcher, speech, events,
        profiles, monitor.get()}, orchestrator_config);

    orchestrator.setCallbacks({
        .onStageChange = nullptr,
        .onSecurityChange = [](const SecurityState& state) {
            std::cout << "[Aegis] Security state: " << toString(state.level)
                      << (state.reason.empty() ? "" : " (" + state.reason + ")") << std::endl;
        },
        .onSessionComplete = nullptr,
        .onUserUtterance = [](const std::string& text) {
            std::cout << "You: " << text << std::endl;
        },
        .onAssistantResponse = [](const std::string& text) {
            std::cout << "Aegis: " << text << std::endl;
        },
        .onError = [](const std::string& err) {
            std::cerr << "[Aegis] " << err << std::endl;
        }
    });
    orchestrator.start();

    std::cout << "[Aegis] Ready. Say \"" << config.wake.phrase
              << "\" or press Enter. Type 'reset' to retry failed devices, 'quit' to exit."
              << std::endl;

    std::string line;
    while (g_running) {
        if (!readConsoleLine(line)) {
            continue;
        }
        if (line == "quit" || line == "exit") {
            break;
        }
        if (line == "reset") {
            mic.reset();
            camera_guard.reset();
            continue;
        }

        Event wake;
        wake.kind = EventKind::WakeDetected;
        wake.source = "console";
        wake.detail = config.wake.phrase;
        if (!orchestrator.submit(std::move(wake))) {
            std::cerr << "[Aegis] Event queue full, wake dropped" << std::endl;
        }
    }

    std::cout << "\n[Aegis] Shutting down..." << std::endl;

    // Reverse order of start
    orchestrator.stop();
#ifdef AEGIS_HAS_PORCUPINE
    if (listener) listener->stop();
#endif
    if (monitor) monitor->stop();
    speech.shutdown(std::chrono::milliseconds(config.shutdown_grace_ms));
    events.close();
    engine.stop();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << R"(
    ╔═══════════════════════════════════════════════╗
    ║                 AEGIS v0.1.0                  ║
    ║   Voice assistant with biometric gatekeeping  ║
    ╚═══════════════════════════════════════════════╝
    )" << std::endl;

    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        return 2;
    }

    if (opts.list_devices) {
        return listDevices();
    }

    Config config = Config::load(opts.config_path);

    if (opts.enroll_voice || opts.enroll_face) {
        return enroll(config, opts);
    }

    int status = runAssistant(config);
    std::cout << "[Aegis] Goodbye!" << std::endl;
    return status;
}
