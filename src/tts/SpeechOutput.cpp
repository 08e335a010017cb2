/**
 * SpeechOutput.cpp - Speech queue worker
 */

#include "aegis/tts/SpeechOutput.hpp"
#include "aegis/audio/Wav.hpp"

#include <cctype>
#include <iostream>
#include <utility>
#include <vector>

namespace aegis::tts {

// Speaker contention is brief (another utterance finishing), so retry a little
constexpr int SPEAKER_RETRIES = 20;
constexpr auto SPEAKER_RETRY_DELAY = std::chrono::milliseconds(50);

namespace {

bool isBlank(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // anonymous namespace

SpeechOutput::SpeechOutput(SpeechSynthesizer& synth,
                           audio::PlaybackSink& sink,
                           resource::ResourceGuard& speaker)
    : synth_(synth)
    , sink_(sink)
    , speaker_(speaker) {
}

SpeechOutput::~SpeechOutput() {
    shutdown(std::chrono::milliseconds(0));
}

bool SpeechOutput::speak(const std::string& text) {
    if (isBlank(text)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            std::cerr << "[SpeechOutput] Shut down, dropping: \"" << text << "\"" << std::endl;
            return false;
        }
        queue_.push_back(text);
        startWorker();
    }
    work_cv_.notify_one();
    return true;
}

bool SpeechOutput::waitUntilDrained(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_cv_.wait_for(lock, timeout, [this]() {
        return queue_.empty() && !in_flight_;
    });
}

void SpeechOutput::shutdown(std::chrono::milliseconds grace) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) {
            return;
        }
        stopping_ = true;
        if (!queue_.empty()) {
            std::cout << "[SpeechOutput] Discarding " << queue_.size()
                      << " queued utterance(s)" << std::endl;
            queue_.clear();
        }
        work_cv_.notify_all();

        bool finished = drained_cv_.wait_for(lock, grace, [this]() { return !in_flight_; });
        if (!finished) {
            std::cout << "[SpeechOutput] Interrupting current utterance" << std::endl;
            synth_.cancel();
            sink_.stopPlayback();
        }
    }

    if (worker_.joinable()) {
        worker_.join();
    }
}

size_t SpeechOutput::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool SpeechOutput::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_ || !queue_.empty();
}

bool SpeechOutput::isShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopping_;
}

void SpeechOutput::startWorker() {
    if (!worker_.joinable()) {
        worker_ = std::thread(&SpeechOutput::run, this);
    }
}

void SpeechOutput::run() {
    while (true) {
        std::string text;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this]() { return !queue_.empty() || stopping_; });
            if (stopping_) {
                break;
            }
            text = std::move(queue_.front());
            queue_.pop_front();
            in_flight_ = true;
        }

        say(text);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_ = false;
        }
        drained_cv_.notify_all();
    }
}

void SpeechOutput::say(const std::string& text) {
    std::cout << "[SpeechOutput] Speaking: \"" << text << "\"" << std::endl;

    try {
        SynthesizedAudio audio = synth_.synthesize(text);
        if (audio.samples.empty()) {
            std::cerr << "[SpeechOutput] Synthesizer returned no audio" << std::endl;
            failed_++;
            return;
        }

        std::vector<float> samples = audio::resampleLinear(
            audio.samples, audio.sample_rate, sink_.sampleRate());

        resource::AcquireResult acquired;
        for (int attempt = 0; attempt < SPEAKER_RETRIES; ++attempt) {
            acquired = speaker_.acquireExclusive("speech_output");
            if (acquired.granted() || acquired.status == resource::AcquireStatus::Degraded) {
                break;
            }
            std::this_thread::sleep_for(SPEAKER_RETRY_DELAY);
        }
        if (!acquired.granted()) {
            std::cerr << "[SpeechOutput] Speaker not available: "
                      << resource::toString(acquired.status) << std::endl;
            failed_++;
            return;
        }

        if (!sink_.play(samples)) {
            std::cerr << "[SpeechOutput] Playback interrupted" << std::endl;
            failed_++;
            return;
        }
        spoken_++;
    } catch (const std::exception& e) {
        std::cerr << "[SpeechOutput] Synthesis failed: " << e.what() << std::endl;
        failed_++;
    }
}

} // namespace aegis::tts
