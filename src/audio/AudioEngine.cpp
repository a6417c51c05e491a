/**
 * AudioEngine.cpp - PortAudio wrapper implementation
 *
 * Provides low-latency audio capture and playback for the parley binary.
 * Uses PortAudio for cross-platform audio I/O.
 */

#include "parley/audio/AudioEngine.hpp"
#include "parley/audio/RingBuffer.hpp"

#include <portaudio.h>
#include <atomic>
#include <cstring>
#include <iostream>
#include <mutex>

namespace parley::audio {

struct AudioEngine::Impl {
    PaStream* inputStream = nullptr;
    PaStream* outputStream = nullptr;

    AudioCallback userCallback;
    std::unique_ptr<RingBuffer<int16_t>> playbackBuffer;

    std::atomic<bool> running{false};
    std::atomic<bool> initialized{false};
    std::atomic<bool> flushRequested{false};

    std::mutex callbackMutex;
    std::string lastError;
};

namespace {

int inputCallback(const void* input, void* /*output*/, unsigned long frameCount,
                  const PaStreamCallbackTimeInfo* /*timeInfo*/, PaStreamCallbackFlags /*statusFlags*/,
                  void* userData) {
    auto* impl = static_cast<AudioEngine::Impl*>(userData);
    const auto* samples = static_cast<const int16_t*>(input);

    std::lock_guard<std::mutex> lock(impl->callbackMutex);
    if (impl->userCallback && samples) {
        impl->userCallback(samples, frameCount);
    }
    return paContinue;
}

int outputCallback(const void* /*input*/, void* output, unsigned long frameCount,
                   const PaStreamCallbackTimeInfo* /*timeInfo*/, PaStreamCallbackFlags /*statusFlags*/,
                   void* userData) {
    auto* impl = static_cast<AudioEngine::Impl*>(userData);
    auto* out = static_cast<int16_t*>(output);

    // The output thread is the consumer, so it is the one that clears
    if (impl->flushRequested.exchange(false)) {
        impl->playbackBuffer->clear();
    }

    size_t read = impl->playbackBuffer->pop(out, frameCount);
    if (read < frameCount) {
        std::memset(out + read, 0, (frameCount - read) * sizeof(int16_t));
    }
    return paContinue;
}

} // anonymous namespace

AudioEngine::AudioEngine(const AudioConfig& config)
    : pImpl_(std::make_unique<Impl>())
    , config_(config)
{
    pImpl_->playbackBuffer = std::make_unique<RingBuffer<int16_t>>(
        static_cast<size_t>(config.playback_rate) * config.playback_buffer_seconds);
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
    inputParams.sampleFormat = paInt16;
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
        pImpl_.get()
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

    // Playback is always mono
    outputParams.channelCount = 1;
    outputParams.sampleFormat = paInt16;
    outputParams.suggestedLatency = Pa_GetDeviceInfo(outputParams.device)->defaultLowOutputLatency;
    outputParams.hostApiSpecificStreamInfo = nullptr;

    err = Pa_OpenStream(
        &pImpl_->outputStream,
        nullptr,
        &outputParams,
        config_.playback_rate,
        paFramesPerBufferUnspecified,
        paClipOff,
        outputCallback,
        pImpl_.get()
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
    std::cout << "[AudioEngine] Started (capture=" << config_.sample_rate << "Hz, playback="
              << config_.playback_rate << "Hz, buffer=" << config_.frames_per_buffer << " frames)" << std::endl;

    return true;
}

void AudioEngine::stop() {
    if (!pImpl_->running) {
        return;
    }

    pImpl_->running = false;

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

    std::cout << "[AudioEngine] Stopped" << std::endl;
}

bool AudioEngine::isRunning() const {
    return pImpl_->running;
}

void AudioEngine::setInputCallback(AudioCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl_->callbackMutex);
    pImpl_->userCallback = std::move(callback);
}

size_t AudioEngine::queuePlayback(const int16_t* samples, size_t count, int sample_rate) {
    if (sample_rate == config_.playback_rate) {
        return pImpl_->playbackBuffer->push(samples, count);
    }
    auto converted = convertRate(samples, count, sample_rate, config_.playback_rate);
    return pImpl_->playbackBuffer->push(converted.data(), converted.size());
}

void AudioEngine::clearPlayback() {
    pImpl_->flushRequested = true;
}

bool AudioEngine::isPlaying() const {
    return pImpl_->playbackBuffer->available() > 0;
}

std::vector<int16_t> AudioEngine::convertRate(const int16_t* samples, size_t count, int from_rate, int to_rate) {
    if (from_rate == to_rate || count == 0 || from_rate <= 0 || to_rate <= 0) {
        return std::vector<int16_t>(samples, samples + count);
    }
    double ratio = static_cast<double>(from_rate) / to_rate;
    size_t out_size = static_cast<size_t>(count / ratio);
    std::vector<int16_t> out(out_size);
    for (size_t i = 0; i < out_size; ++i) {
        double src = i * ratio;
        size_t idx = static_cast<size_t>(src);
        double frac = src - idx;
        if (idx + 1 < count) {
            out[i] = static_cast<int16_t>(samples[idx] * (1.0 - frac) + samples[idx + 1] * frac);
        } else {
            out[i] = samples[count - 1];
        }
    }
    return out;
}

std::vector<std::string> AudioEngine::listInputDevices() {
    std::vector<std::string> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "[AudioEngine] Pa_Initialize failed: " << Pa_GetErrorText(err) << std::endl;
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
        std::cerr << "[AudioEngine] Pa_Initialize failed: " << Pa_GetErrorText(err) << std::endl;
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

} // namespace parley::audio
