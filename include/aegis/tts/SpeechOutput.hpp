/**
 * SpeechOutput.hpp - Serialized speech queue
 *
 * speak() enqueues and returns immediately. One worker synthesizes and plays
 * each utterance to completion, in FIFO order, under an Exclusive speaker
 * lease.
 */

#pragma once

#include "aegis/audio/AudioDevice.hpp"
#include "aegis/resource/ResourceGuard.hpp"
#include "aegis/tts/SpeechSynthesizer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace aegis::tts {

class SpeechOutput {
public:
    SpeechOutput(SpeechSynthesizer& synth,
                 audio::PlaybackSink& sink,
                 resource::ResourceGuard& speaker);
    virtual ~SpeechOutput();

    SpeechOutput(const SpeechOutput&) = delete;
    SpeechOutput& operator=(const SpeechOutput&) = delete;

    // false for empty text or after shutdown()
    virtual bool speak(const std::string& text);

    // true once the queue is empty and nothing is playing
    virtual bool waitUntilDrained(std::chrono::milliseconds timeout);

    /**
     * Drop queued utterances, give the in-flight one `grace` to finish,
     * then cancel it and join the worker. Idempotent.
     */
    void shutdown(std::chrono::milliseconds grace = std::chrono::milliseconds(1000));

    size_t pending() const;
    bool busy() const;
    bool isShutdown() const;
    uint64_t spokenCount() const { return spoken_; }
    uint64_t failedCount() const { return failed_; }

private:
    void startWorker();
    void run();
    void say(const std::string& text);

    SpeechSynthesizer& synth_;
    audio::PlaybackSink& sink_;
    resource::ResourceGuard& speaker_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable drained_cv_;
    std::deque<std::string> queue_;
    bool in_flight_ = false;
    bool stopping_ = false;
    std::thread worker_;

    std::atomic<uint64_t> spoken_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace aegis::tts
