/**
 * AudioEngine.cpp - PortAudio wrapper implementation
 *
 * The input callback feeds a capture ring buffer; the output callback drains
 * a playback ring buffer. Everything else runs on caller threads.
 */

#include "aegis/audio/AudioEngine.hpp"
#include "aegis/audio/RingBuffer.hpp"

#include <portaudio.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <iostream>
#include <thread>

namespace aegis::audio {

// Capture keeps the last 30 seconds; playback is fed in chunks
constexpr size_t CAPTURE_BUFFER_SECONDS = 30;
constexpr size_t PLAYBACK_BUFFER_SECONDS = 10;
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(5);

struct AudioEngineImpl {
    PaStream* inputStream = nullptr;
    PaStream* outputStream = nullptr;

    std::unique_ptr<RingBuffer<float>> captureBuffer;
    std::unique_ptr<RingBuffer<float>> playbackBuffer;

    std::atomic<bool> running{false};
    std::atomic<bool> initialized{false};
    std::atomic<bool> stopRequested{false};
    std::atomic<bool> discardRequested{false};
    std::atomic<bool> flushRequested{false};    // playback buffer, cleared by outputCallback
    std::atomic<uint64_t> overruns{0};

    std::string lastError;
};

static int inputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
);

static int outputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
);

struct AudioEngine::Impl : public AudioEngineImpl {};

AudioEngine::AudioEngine(const AudioConfig& config)
    : pImpl_(std::make_unique<Impl>())
    , config_(config)
{
    pImpl_->captureBuffer = std::make_unique<RingBuffer<float>>(
        static_cast<size_t>(config.sample_rate) * CAPTURE_BUFFER_SECONDS);
    pImpl_->playbackBuffer = std::make_unique<RingBuffer<float>>(
        static_cast<size_t>(config.sample_rate) * PLAYBACK_BUFFER_SECONDS);
}

AudioEngine::~AudioEngine() {
    stop();

    if (pImpl_->initialized) {
        Pa_Terminate();
    }
}

bool AudioEngine::initialize() {
    if (pImpl_->initialized) {
        return true;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        pImpl_->lastError = std::string("Pa_Initialize failed: ") + Pa_GetErrorText(err);
        std::cerr << "[AudioEngine] " << pImpl_->lastError << std::endl;
        return false;
    }

    pImpl_->initialized = true;

    int numDevices = Pa_GetDeviceCount();
    std::cout << "[AudioEngine] Found " << numDevices << " audio devices" << std::endl;

    int defaultInput = Pa_GetDefaultInputDevice();
    int defaultOutput = Pa_GetDefaultOutputDevice();

    if (defaultInput >= 0) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(defaultInput);
        std::cout << "[AudioEngine] Default input: " << info->name << std::endl;
    }

    if (defaultOutput >= 0) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(defaultOutput);
        std::cout << "[AudioEngine] Default output: " << info->name << std::endl;
    }

    return true;
}

bool AudioEngine::start() {
    if (pImpl_->running) {
        return true;
    }

    if (!pImpl_->initialized && !initialize()) {
        return false;
    }

    PaError err;

    PaStreamParameters inputParams;
    inputParams.device = (config_.input_device >= 0)
        ? config_.input_device
        : Pa_GetDefaultInputDevice();

    if (inputParams.device == paNoDevice) {
        pImpl_->lastError = "No input device available";
        std::cerr << "[AudioEngine] " << pImpl_->lastError << std::endl;
        return false;
    }

    inputParams.channelCount = config_.channels;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = Pa_GetDeviceInfo(inputParams.device)->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    err = Pa_OpenStream(
        &pImpl_->inputStream,
        &inputParams,
        nullptr,
        config_.sample_rate,
        config_.frames_per_buffer,
        paClipOff,
        inputCallback,
        static_cast<AudioEngineImpl*>(pImpl_.get())
    );

    if (err != paNoError) {
        pImpl_->lastError = std::string("Pa_OpenStream (input) failed: ") + Pa_GetErrorText(err);
        std::cerr << "[AudioEngine] " << pImpl_->lastError << std::endl;
        return false;
    }

    PaStreamParameters outputParams;
    outputParams.device = (config_.output_device >= 0)
        ? config_.output_device
        : Pa_GetDefaultOutputDevice();

    if (outputParams.device == paNoDevice) {
        pImpl_->lastError = "No output device available";
        std::cerr << "[AudioEngine] " << pImpl_->lastError << std::endl;
        Pa_CloseStream(pImpl_->inputStream);
        pImpl_->inputStream = nullptr;
        return false;
    }

    outputParams.channelCount = config_.channels;
    outputParams.sampleFormat = paFloat32;
    outputParams.suggestedLatency = Pa_GetDeviceInfo(outputParams.device)->defaultLowOutputLatency;
    outputParams.hostApiSpecificStreamInfo = nullptr;

    err = Pa_OpenStream(
        &pImpl_->outputStream,
        nullptr,
        &outputParams,
        config_.sample_rate,
        config_.frames_per_buffer,
        paClipOff,
        outputCallback,
        static_cast<AudioEngineImpl*>(pImpl_.get())
    );

    if (err != paNoError) {
        pImpl_->lastError = std::string("Pa_OpenStream (output) failed: ") + Pa_GetErrorText(err);
        std::cerr << "[AudioEngine] " << pImpl_->lastError << std::endl;
        Pa_CloseStream(pImpl_->inputStream);
        pImpl_->inputStream = nullptr;
        return false;
    }

    err = Pa_StartStream(pImpl_->inputStream);
    if (err != paNoError) {
        pImpl_->lastError = std::string("Pa_StartStream (input) failed: ") + Pa_GetErrorText(err);
        std::cerr << "[AudioEngine] " << pImpl_->lastError << std::endl;
        Pa_CloseStream(pImpl_->inputStream);
        Pa_CloseStream(pImpl_->outputStream);
        pImpl_->inputStream = nullptr;
        pImpl_->outputStream = nullptr;
        return false;
    }

    err = Pa_StartStream(pImpl_->outputStream);
    if (err != paNoError) {
        pImpl_->lastError = std::string("Pa_StartStream (output) failed: ") + Pa_GetErrorText(err);
        std::cerr << "[AudioEngine] " << pImpl_->lastError << std::endl;
        Pa_StopStream(pImpl_->inputStream);
        Pa_CloseStream(pImpl_->inputStream);
        Pa_CloseStream(pImpl_->outputStream);
        pImpl_->inputStream = nullptr;
        pImpl_->outputStream = nullptr;
        return false;
    }

    pImpl_->running = true;
    std::cout << "[AudioEngine] Started (sample_rate=" << config_.sample_rate
              << "Hz, buffer=" << config_.frames_per_buffer << " frames)" << std::endl;

    return true;
}

void AudioEngine::stop() {
    if (!pImpl_->running) {
        return;
    }

    pImpl_->running = false;
    pImpl_->stopRequested = true;

    if (pImpl_->inputStream) {
        Pa_StopStream(pImpl_->inputStream);
        Pa_CloseStream(pImpl_->inputStream);
        pImpl_->inputStream = nullptr;
    }

    if (pImpl_->outputStream) {
        Pa_StopStream(pImpl_->outputStream);
        Pa_CloseStream(pImpl_->outputStream);
        pImpl_->outputStream = nullptr;
    }

    if (pImpl_->overruns > 0) {
        std::cout << "[AudioEngine] Capture overruns: " << pImpl_->overruns << std::endl;
    }
    std::cout << "[AudioEngine] Stopped" << std::endl;
}

bool AudioEngine::isRunning() const {
    return pImpl_->running;
}

bool AudioEngine::isCapturing() const {
    return pImpl_->running && pImpl_->inputStream != nullptr;
}

size_t AudioEngine::read(float* out, size_t count, std::chrono::milliseconds timeout) {
    if (pImpl_->discardRequested.exchange(false)) {
        pImpl_->captureBuffer->clear();
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (pImpl_->captureBuffer->available() == 0) {
        if (!pImpl_->running || std::chrono::steady_clock::now() >= deadline) {
            return 0;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    return pImpl_->captureBuffer->pop(out, count);
}

void AudioEngine::discard() {
    // Cleared by the reading thread on its next read()
    pImpl_->discardRequested = true;
}

bool AudioEngine::play(const std::vector<float>& samples) {
    if (!pImpl_->running) {
        pImpl_->lastError = "Playback requested while audio engine is stopped";
        return false;
    }

    // A pending flush would also drop the samples pushed below
    while (pImpl_->flushRequested) {
        if (!pImpl_->running) {
            return false;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    pImpl_->stopRequested = false;

    size_t offset = 0;
    while (offset < samples.size()) {
        if (pImpl_->stopRequested) {
            pImpl_->flushRequested = true;
            return false;
        }
        size_t pushed = pImpl_->playbackBuffer->push(samples.data() + offset,
                                                     samples.size() - offset);
        offset += pushed;
        if (pushed == 0) {
            std::this_thread::sleep_for(POLL_INTERVAL);
        }
    }

    while (pImpl_->playbackBuffer->available() > 0) {
        if (pImpl_->stopRequested || !pImpl_->running) {
            pImpl_->flushRequested = true;
            return false;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
    return true;
}

void AudioEngine::stopPlayback() {
    pImpl_->stopRequested = true;
}

bool AudioEngine::isPlaying() const {
    return pImpl_->playbackBuffer->available() > 0;
}

std::vector<std::string> AudioEngine::listInputDevices() {
    std::vector<std::string> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    for (int i = 0; i < numDevices; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) {
            devices.push_back(info->name);
        }
    }

    Pa_Terminate();
    return devices;
}

std::vector<std::string> AudioEngine::listOutputDevices() {
    std::vector<std::string> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    for (int i = 0; i < numDevices; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxOutputChannels > 0) {
            devices.push_back(info->name);
        }
    }

    Pa_Terminate();
    return devices;
}

std::string AudioEngine::lastError() const {
    return pImpl_->lastError;
}

// ============================================================================
// PortAudio Callbacks
// ============================================================================

static int inputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
) {
    auto* impl = static_cast<AudioEngineImpl*>(userData);
    const float* samples = static_cast<const float*>(input);

    if (samples) {
        size_t written = impl->captureBuffer->push(samples, frameCount);
        if (written < frameCount) {
            impl->overruns++;
        }
    }

    return paContinue;
}

static int outputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
) {
    auto* impl = static_cast<AudioEngineImpl*>(userData);
    float* out = static_cast<float*>(output);

    // Only the consumer may clear the ring buffer
    if (impl->flushRequested.load(std::memory_order_acquire)) {
        impl->playbackBuffer->clear();
        impl->flushRequested.store(false, std::memory_order_release);
    }

    size_t read = impl->playbackBuffer->pop(out, frameCount);

    if (read < frameCount) {
        std::memset(out + read, 0, (frameCount - read) * sizeof(float));
    }

    return paContinue;
}

} // namespace aegis::audio
