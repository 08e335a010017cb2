/**
 * Config.hpp - Startup configuration (JSON, read once)
 */

#pragma once

#include "aegis/Orchestrator.hpp"
#include "aegis/audio/AudioEngine.hpp"
#include "aegis/camera/CameraMonitor.hpp"
#include "aegis/commands/CommandEngine.hpp"
#include "aegis/identity/IdentityVerifier.hpp"
#include "aegis/tts/TTSEngine.hpp"

#include <string>
#include <vector>

namespace aegis {

struct WakeSettings {
    std::string phrase = "vortex";
    std::string access_key_file = ".porcupine_key";
    std::string model_path = "external/porcupine/lib/common/porcupine_params.pv";
    std::vector<std::string> keyword_paths;
    float sensitivity = 0.5f;
};

struct IdentitySettings {
    std::string profile_dir = "data/profiles";
    identity::VerifierConfig verifier;
    int enroll_voice_samples = 5;
    int enroll_voice_duration_ms = 3000;
    int enroll_face_frames = 10;
    int enroll_face_max_reads = 100;
};

struct CameraSettings {
    bool enabled = true;
    int index = 0;
    camera::CameraMonitorConfig monitor;
};

struct SttSettings {
    std::string model_path = "models/whisper/ggml-base.en.bin";
    std::string language = "en";
    int threads = 4;
};

struct EmbeddingSettings {
    std::string server_url = "http://localhost:8090";
    int timeout_ms = 10000;
};

struct Config {
    std::string owner_name = "Owner";
    WakeSettings wake;
    audio::AudioConfig audio;
    int vad_mode = 2;
    IdentitySettings identity;
    CameraSettings camera;
    SttSettings stt;
    tts::TTSConfig tts;
    EmbeddingSettings embedding;
    OrchestratorConfig orchestrator;
    int shutdown_grace_ms = 1000;
    commands::CommandConfig commands;
    std::string notes_file = "data/notes.json";
    std::string greeting = "Aegis online. Welcome back, {owner}.";

    // greeting with {owner} replaced by owner_name
    std::string greetingText() const;

    /**
     * Missing file: defaults plus a warning. Malformed file: defaults plus
     * an error line. Missing keys keep their defaults.
     */
    static Config load(const std::string& path);

    // Same rules, from an in-memory document
    static Config parse(const std::string& json_text);
};

} // namespace aegis
