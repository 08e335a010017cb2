/**
 * Fakes.hpp - Deterministic stand-ins for devices and collaborators
 */

#pragma once

#include "aegis/Errors.hpp"
#include "aegis/audio/AudioDevice.hpp"
#include "aegis/audio/CommandRecorder.hpp"
#include "aegis/camera/FrameSource.hpp"
#include "aegis/commands/CommandDispatcher.hpp"
#include "aegis/commands/ProcessLauncher.hpp"
#include "aegis/identity/Embedder.hpp"
#include "aegis/stt/Transcriber.hpp"
#include "aegis/tts/SpeechSynthesizer.hpp"
#include "aegis/wakeword/WakeEngine.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace aegis::testing {

using namespace std::chrono_literals;

// Polls `pred` until it holds or `timeout` passes.
inline bool waitFor(const std::function<bool()>& pred,
                    std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

// Embedding at `similarity` to {1, 0} (both unit length)
inline identity::Embedding embeddingAt(float similarity) {
    return {similarity, std::sqrt(std::max(0.0f, 1.0f - similarity * similarity))};
}

// ============================================================================
// Audio
// ============================================================================

/**
 * Endless constant-level capture. Reads return immediately (after a short
 * sleep) so recordings finish quickly.
 */
class ScriptedCaptureSource : public audio::CaptureSource {
public:
    explicit ScriptedCaptureSource(int sample_rate = 16000) : rate_(sample_rate) {}

    int sampleRate() const override { return rate_; }
    bool isCapturing() const override { return capturing; }

    size_t read(float* out, size_t count, std::chrono::milliseconds timeout) override {
        if (!capturing || starve) {
            std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(5)));
            return 0;
        }
        std::this_thread::sleep_for(1ms);
        std::fill(out, out + count, level.load());
        reads++;
        samples_read += count;
        return count;
    }

    void discard() override { discards++; }

    std::atomic<bool> capturing{true};
    std::atomic<bool> starve{false};
    std::atomic<float> level{0.1f};
    std::atomic<int> reads{0};
    std::atomic<size_t> samples_read{0};
    std::atomic<int> discards{0};

private:
    int rate_;
};

class RecordingSink : public audio::PlaybackSink {
public:
    explicit RecordingSink(int sample_rate = 16000) : rate_(sample_rate) {}

    int sampleRate() const override { return rate_; }

    bool play(const std::vector<float>& samples) override {
        stopped = false;
        auto deadline = std::chrono::steady_clock::now() + play_time.load();
        while (std::chrono::steady_clock::now() < deadline) {
            if (stopped) return false;
            std::this_thread::sleep_for(1ms);
        }
        plays++;
        samples_played += samples.size();
        return true;
    }

    void stopPlayback() override {
        stopped = true;
        stops++;
    }

    std::atomic<std::chrono::milliseconds> play_time{5ms};
    std::atomic<int> plays{0};
    std::atomic<size_t> samples_played{0};
    std::atomic<int> stops{0};
    std::atomic<bool> stopped{false};

private:
    int rate_;
};

// Detects once each time trigger() is called.
class FakeWakeEngine : public wakeword::WakeEngine {
public:
    bool isReady() const override { return true; }
    int sampleRate() const override { return 16000; }

    int processFloat(const float*, size_t count) override {
        processed += count;
        return pending.exchange(false) ? 0 : -1;
    }

    void resetStream() override { resets++; }

    void trigger() { pending = true; }

    std::atomic<bool> pending{false};
    std::atomic<size_t> processed{0};
    std::atomic<int> resets{0};
};

/**
 * CommandRecorder whose recordings are scripted. With gated=true each
 * recording blocks until open() is called.
 */
class ScriptedRecorder : public audio::CommandRecorder {
public:
    ScriptedRecorder(resource::ResourceGuard& mic, audio::CaptureSource& source)
        : audio::CommandRecorder(mic, source) {}

    audio::Recording recordWith(const resource::Lease& lease,
                                std::chrono::milliseconds duration) override {
        calls++;
        if (gated) {
            std::unique_lock<std::mutex> lock(mutex_);
            entered_ = true;
            cv_.notify_all();
            cv_.wait(lock, [this]() { return open_; });
            open_ = false;
            entered_ = false;
        }

        audio::Recording rec;
        if (!lease.valid() || lease.kind() != resource::ResourceKind::Mic) {
            rec.status = resource::AcquireStatus::Busy;
            rec.error = ErrorKind::ResourceBusy;
            return rec;
        }
        rec.error = error;
        rec.sample_rate = 16000;
        rec.samples.assign(static_cast<size_t>(duration.count()) * 16, 0.1f);
        rec.captured = rec.samples.size();
        rec.speech_detected = speech;
        return rec;
    }

    bool waitUntilEntered(std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return entered_; });
    }

    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

    std::atomic<bool> gated{false};
    std::atomic<bool> speech{true};
    ErrorKind error = ErrorKind::None;
    std::atomic<int> calls{0};

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool open_ = false;
};

// ============================================================================
// Camera
// ============================================================================

class FakeFrameSource : public camera::FrameSource {
public:
    bool open() override {
        opens++;
        if (!openable) return false;
        is_open = true;
        return true;
    }

    void close() override {
        if (is_open.exchange(false)) closes++;
    }

    bool isOpen() const override { return is_open; }

    bool read(camera::Frame& frame, std::chrono::milliseconds) override {
        std::this_thread::sleep_for(1ms);
        reads++;
        if (!is_open || fail_reads) return false;
        frame = camera::solidFrame(8, 8, brightness);
        return true;
    }

    std::atomic<bool> openable{true};
    std::atomic<bool> is_open{false};
    std::atomic<bool> fail_reads{false};
    std::atomic<uint8_t> brightness{128};
    std::atomic<int> opens{0};
    std::atomic<int> closes{0};
    std::atomic<int> reads{0};
};

// ============================================================================
// Identity
// ============================================================================

class FakeVoiceEmbedder : public identity::VoiceEmbedder {
public:
    std::optional<identity::Embedding> embedVoice(const std::vector<float>&, int) override {
        calls++;
        if (fail) throw CollaboratorError("voice embedder failed");
        std::lock_guard<std::mutex> lock(mutex);
        return embedding;
    }

    void set(std::optional<identity::Embedding> e) {
        std::lock_guard<std::mutex> lock(mutex);
        embedding = std::move(e);
    }

    std::mutex mutex;
    std::optional<identity::Embedding> embedding = identity::Embedding{1.0f, 0.0f};
    std::atomic<bool> fail{false};
    std::atomic<int> calls{0};
};

class FakeFaceEmbedder : public identity::FaceEmbedder {
public:
    std::vector<identity::DetectedFace> detectFaces(const camera::Frame&) override {
        calls++;
        if (fail) throw CollaboratorError("face embedder failed");
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<identity::DetectedFace> faces;
        if (face) {
            identity::DetectedFace small;
            small.box = {0, 0, 2, 2};
            small.embedding = {0.0f, 1.0f};   // a bystander, never the owner
            faces.push_back(small);

            identity::DetectedFace main;
            main.box = {2, 2, 6, 6};
            main.embedding = *face;
            faces.push_back(main);
        }
        return faces;
    }

    void set(std::optional<identity::Embedding> e) {
        std::lock_guard<std::mutex> lock(mutex);
        face = std::move(e);
    }

    std::mutex mutex;
    std::optional<identity::Embedding> face = identity::Embedding{1.0f, 0.0f};
    std::atomic<bool> fail{false};
    std::atomic<int> calls{0};
};

// ============================================================================
// Speech
// ============================================================================

class FakeTranscriber : public stt::Transcriber {
public:
    std::string transcribe(const std::vector<float>&, int) override {
        calls++;
        if (fail) throw CollaboratorError("whisper failed");
        std::lock_guard<std::mutex> lock(mutex);
        return text;
    }

    void set(const std::string& t) {
        std::lock_guard<std::mutex> lock(mutex);
        text = t;
    }

    std::mutex mutex;
    std::string text = "what time is it";
    std::atomic<bool> fail{false};
    std::atomic<int> calls{0};
};

class FakeSynthesizer : public tts::SpeechSynthesizer {
public:
    tts::SynthesizedAudio synthesize(const std::string& text) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            texts.push_back(text);
        }
        if (delay.load().count() > 0) {
            std::this_thread::sleep_for(delay.load());
        }
        if (fail) throw CollaboratorError("tts server down");
        tts::SynthesizedAudio audio;
        audio.sample_rate = rate;
        audio.samples.assign(static_cast<size_t>(rate / 10), 0.2f);
        return audio;
    }

    void cancel() override { cancels++; }

    std::vector<std::string> spoken() {
        std::lock_guard<std::mutex> lock(mutex);
        return texts;
    }

    size_t count(const std::string& text) {
        auto all = spoken();
        return static_cast<size_t>(std::count(all.begin(), all.end(), text));
    }

    std::mutex mutex;
    std::vector<std::string> texts;
    int rate = 16000;
    std::atomic<std::chrono::milliseconds> delay{0ms};
    std::atomic<bool> fail{false};
    std::atomic<int> cancels{0};
};

// ============================================================================
// Commands
// ============================================================================

class FakeLauncher : public commands::ProcessLauncher {
public:
    std::optional<pid_t> launch(const std::vector<std::string>& argv) override {
        launched.push_back(argv);
        if (fail) return std::nullopt;
        pid_t pid = next_pid++;
        running.insert(pid);
        return pid;
    }

    bool terminate(pid_t pid) override {
        terminated.push_back(pid);
        return running.erase(pid) > 0;
    }

    bool isRunning(pid_t pid) override { return running.count(pid) > 0; }

    std::vector<std::vector<std::string>> launched;
    std::vector<pid_t> terminated;
    std::set<pid_t> running;
    pid_t next_pid = 4242;
    bool fail = false;
};

class FakeDispatcher : public commands::CommandDispatcher {
public:
    commands::DispatchResult dispatch(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex);
        texts.push_back(text);
        if (fail) throw CollaboratorError("dispatcher failed");
        return result;
    }

    size_t calls() {
        std::lock_guard<std::mutex> lock(mutex);
        return texts.size();
    }

    void set(commands::DispatchResult r) {
        std::lock_guard<std::mutex> lock(mutex);
        result = std::move(r);
    }

    std::mutex mutex;
    std::vector<std::string> texts;
    commands::DispatchResult result{"It is 12:00.", true, ErrorKind::None,
                                    commands::SecurityDirective::None,
                                    commands::Intent::Time};
    bool fail = false;
};

} // namespace aegis::testing
