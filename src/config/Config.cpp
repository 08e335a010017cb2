/**
 * Config.cpp - JSON configuration loader
 */

#include "aegis/Config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <map>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace aegis {

namespace {

const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

std::chrono::milliseconds millis(const json& j, const char* key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(j.value(key, static_cast<int64_t>(fallback.count())));
}

std::map<std::string, std::string> stringMap(const json& j, const char* key) {
    std::map<std::string, std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) {
        return out;
    }
    for (auto& [name, value] : it->items()) {
        out[name] = value.get<std::string>();
    }
    return out;
}

void apply(Config& c, const json& root) {
    c.owner_name = root.value("owner_name", c.owner_name);
    c.commands.owner_name = c.owner_name;

    const auto& wake = section(root, "wake");
    c.wake.phrase = wake.value("phrase", c.wake.phrase);
    c.wake.access_key_file = wake.value("access_key_file", c.wake.access_key_file);
    c.wake.model_path = wake.value("model_path", c.wake.model_path);
    c.wake.keyword_paths = wake.value("keyword_paths", c.wake.keyword_paths);
    c.wake.sensitivity = wake.value("sensitivity", c.wake.sensitivity);
    c.commands.wake_phrase = c.wake.phrase;

    const auto& audio = section(root, "audio");
    c.audio.sample_rate = audio.value("sample_rate", c.audio.sample_rate);
    c.audio.frames_per_buffer = audio.value("frames_per_buffer", c.audio.frames_per_buffer);
    c.audio.input_device = audio.value("input_device", c.audio.input_device);
    c.audio.output_device = audio.value("output_device", c.audio.output_device);
    c.orchestrator.command_duration =
        millis(audio, "command_duration_ms", c.orchestrator.command_duration);
    c.orchestrator.require_speech = audio.value("require_speech", c.orchestrator.require_speech);
    c.vad_mode = audio.value("vad_mode", c.vad_mode);

    const auto& id = section(root, "identity");
    c.identity.profile_dir = id.value("profile_dir", c.identity.profile_dir);
    c.identity.verifier.voice_threshold =
        id.value("voice_threshold", c.identity.verifier.voice_threshold);
    c.identity.verifier.face_threshold =
        id.value("face_threshold", c.identity.verifier.face_threshold);
    c.orchestrator.face_max_attempts = id.value("face_max_attempts", c.orchestrator.face_max_attempts);
    c.orchestrator.face_frame_timeout =
        millis(id, "face_frame_timeout_ms", c.orchestrator.face_frame_timeout);
    c.identity.enroll_voice_samples = id.value("enroll_voice_samples", c.identity.enroll_voice_samples);
    c.identity.enroll_voice_duration_ms =
        id.value("enroll_voice_duration_ms", c.identity.enroll_voice_duration_ms);
    c.identity.enroll_face_frames = id.value("enroll_face_frames", c.identity.enroll_face_frames);
    c.identity.enroll_face_max_reads = id.value("enroll_face_max_reads", c.identity.enroll_face_max_reads);

    const auto& cam = section(root, "camera");
    auto& mon = c.camera.monitor;
    c.camera.enabled = cam.value("enabled", c.camera.enabled);
    c.camera.index = cam.value("index", c.camera.index);
    mon.dark_threshold = cam.value("dark_threshold", mon.dark_threshold);
    mon.dark_frames_required = cam.value("dark_frames_required", mon.dark_frames_required);
    mon.max_read_failures = cam.value("max_read_failures", mon.max_read_failures);
    mon.poll_interval = millis(cam, "poll_interval_ms", mon.poll_interval);
    mon.failure_retry = millis(cam, "failure_retry_ms", mon.failure_retry);

    const auto& stt = section(root, "stt");
    c.stt.model_path = stt.value("model_path", c.stt.model_path);
    c.stt.language = stt.value("language", c.stt.language);
    c.stt.threads = stt.value("threads", c.stt.threads);

    const auto& tts = section(root, "tts");
    c.tts.server_url = tts.value("server_url", c.tts.server_url);
    c.tts.reference_voice = tts.value("reference_voice", c.tts.reference_voice);
    c.tts.language = tts.value("language", c.tts.language);
    c.tts.timeout_ms = tts.value("timeout_ms", c.tts.timeout_ms);

    const auto& emb = section(root, "embedding");
    c.embedding.server_url = emb.value("server_url", c.embedding.server_url);
    c.embedding.timeout_ms = emb.value("timeout_ms", c.embedding.timeout_ms);

    const auto& speech = section(root, "speech");
    c.orchestrator.speech_drain_timeout =
        millis(speech, "drain_timeout_ms", c.orchestrator.speech_drain_timeout);
    c.shutdown_grace_ms = speech.value("shutdown_grace_ms", c.shutdown_grace_ms);

    const auto& cmd = section(root, "commands");
    c.commands.apps = stringMap(cmd, "apps");
    c.commands.aliases = stringMap(cmd, "aliases");
    c.notes_file = cmd.value("notes_file", c.notes_file);

    const auto& msg = section(root, "messages");
    auto& m = c.orchestrator.messages;
    m.no_speech = msg.value("no_speech", m.no_speech);
    m.intruder = msg.value("intruder", m.intruder);
    m.error = msg.value("error", m.error);
    m.camera_blocked = msg.value("camera_blocked", m.camera_blocked);
    m.camera_restored = msg.value("camera_restored", m.camera_restored);
    c.greeting = msg.value("greeting", c.greeting);
}

} // namespace

std::string Config::greetingText() const {
    static const std::string placeholder = "{owner}";
    std::string text = greeting;
    size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.size(), owner_name);
        pos += owner_name.size();
    }
    return text;
}

Config Config::parse(const std::string& json_text) {
    Config config;
    try {
        auto root = json::parse(json_text);
        if (!root.is_object()) {
            std::cerr << "[Config] Top level must be an object, using defaults" << std::endl;
            return config;
        }
        Config loaded;
        aegis::apply(loaded, root);
        return loaded;
    } catch (const json::exception& e) {
        std::cerr << "[Config] Invalid configuration, using defaults: " << e.what() << std::endl;
    }
    return config;
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] " << path << " not found, using defaults" << std::endl;
        return Config{};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::cout << "[Config] Loaded " << path << std::endl;
    return parse(buffer.str());
}

} // namespace aegis
