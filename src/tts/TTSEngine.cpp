/**
 * TTSEngine.cpp - XTTS server client
 *
 * The server keeps the model and speaker embedding cached; we only send text
 * and decode the returned WAV.
 */

#include "aegis/tts/TTSEngine.hpp"
#include "aegis/Errors.hpp"
#include "aegis/audio/Wav.hpp"

#include <atomic>
#include <iostream>
#include <utility>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace aegis::tts {

struct TTSEngine::Impl {
    TTSConfig config;
    std::unique_ptr<httplib::Client> client;
    std::atomic<bool> cancelled{false};
    bool server_available = false;

    explicit Impl(const TTSConfig& cfg) : config(cfg) {
        client = std::make_unique<httplib::Client>(config.server_url);
        int t = config.timeout_ms;
        client->set_connection_timeout(t / 1000, (t % 1000) * 1000);
        client->set_read_timeout(t / 1000, (t % 1000) * 1000);
        client->set_write_timeout(t / 1000, (t % 1000) * 1000);
    }

    bool checkServer() {
        auto res = client->Get("/health");
        server_available = res && res->status == 200;
        if (server_available) {
            std::cout << "[TTSEngine] Connected to TTS server at " << config.server_url << std::endl;
        } else {
            std::cerr << "[TTSEngine] TTS server not reachable at " << config.server_url << std::endl;
        }
        return server_available;
    }
};

TTSEngine::TTSEngine(const TTSConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

TTSEngine::~TTSEngine() = default;

bool TTSEngine::isServerAvailable() {
    return impl_->checkServer();
}

SynthesizedAudio TTSEngine::synthesize(const std::string& text) {
    SynthesizedAudio out;
    if (text.empty()) {
        return out;
    }

    impl_->cancelled = false;

    json req_json = {
        {"text", text},
        {"language", impl_->config.language}
    };
    if (!impl_->config.reference_voice.empty()) {
        req_json["speaker_wav"] = impl_->config.reference_voice;
    }

    auto res = impl_->client->Post("/synthesize", req_json.dump(), "application/json");

    if (impl_->cancelled) {
        return out;
    }
    if (!res) {
        throw CollaboratorError("TTS server unreachable: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw CollaboratorError("TTS server returned " + std::to_string(res->status));
    }

    auto wav = audio::decodeWav(res->body);
    if (!wav) {
        throw CollaboratorError("TTS server returned invalid WAV");
    }

    out.samples = std::move(wav->samples);
    out.sample_rate = wav->sample_rate;
    return out;
}

void TTSEngine::cancel() {
    // Closes the socket of an in-flight request
    impl_->cancelled = true;
    impl_->client->stop();
}

} // namespace aegis::tts
