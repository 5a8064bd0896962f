/**
 * AudioEngine.cpp - PortAudio capture/playback for the voice front end
 *
 * The microphone stream feeds the capture router; the speaker stream drains
 * the ring buffer the playback controller fills.
 */

#include "hpv/audio/AudioEngine.hpp"
#include "hpv/audio/RingBuffer.hpp"

#include <portaudio.h>
#include <algorithm>
#include <atomic>
#include <cstring>
#include <iostream>
#include <mutex>

namespace hpv::audio {

namespace {

enum class Direction {
    Capture,
    Render
};

const char* toString(Direction direction) {
    return direction == Direction::Capture ? "input" : "output";
}

// Capture problems stop the conversation; render problems only cost audio
core::ErrorKind errorKindFor(Direction direction) {
    return direction == Direction::Capture ? core::ErrorKind::Acquisition
                                           : core::ErrorKind::Playback;
}

} // namespace

struct AudioEngine::Impl {
    Impl(const AudioConfig& c)
        : config(c)
        , speaker(static_cast<size_t>(c.sample_rate) * static_cast<size_t>(c.playback_buffer_seconds)) {}

    AudioConfig config;
    PaStream* microphone = nullptr;
    PaStream* output = nullptr;
    RingBuffer<float> speaker;

    std::mutex sinkMutex;
    AudioCallback sink;

    std::atomic<bool> paReady{false};
    std::atomic<bool> streaming{false};
    std::atomic<size_t> overflows{0};

    std::string lastError;
    core::ErrorKind lastErrorKind = core::ErrorKind::Acquisition;

    bool fail(core::ErrorKind kind, const std::string& message) {
        lastError = message;
        lastErrorKind = kind;
        std::cerr << "[AudioEngine] " << core::toString(kind) << ": " << message << std::endl;
        return false;
    }

    bool fail(Direction direction, const std::string& what, PaError err) {
        return fail(errorKindFor(direction),
                    what + " (" + toString(direction) + ") failed: " + Pa_GetErrorText(err));
    }

    PaDeviceIndex pickDevice(Direction direction) const {
        int configured = direction == Direction::Capture ? config.input_device : config.output_device;
        if (configured >= 0) {
            return configured < Pa_GetDeviceCount() ? configured : paNoDevice;
        }
        return direction == Direction::Capture ? Pa_GetDefaultInputDevice()
                                               : Pa_GetDefaultOutputDevice();
    }

    bool open(Direction direction, PaStream** stream) {
        PaDeviceIndex device = pickDevice(direction);
        if (device == paNoDevice) {
            return fail(errorKindFor(direction), std::string("No ") + toString(direction) + " device available");
        }

        const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
        PaStreamParameters params;
        std::memset(&params, 0, sizeof(params));
        params.device = device;
        params.channelCount = config.channels;
        params.sampleFormat = paFloat32;
        params.suggestedLatency = direction == Direction::Capture ? info->defaultLowInputLatency
                                                                  : info->defaultLowOutputLatency;

        bool capture = direction == Direction::Capture;
        PaError err = Pa_OpenStream(stream,
                                    capture ? &params : nullptr,
                                    capture ? nullptr : &params,
                                    config.sample_rate,
                                    static_cast<unsigned long>(config.frames_per_buffer),
                                    paClipOff,
                                    capture ? &Impl::onCapture : &Impl::onRender,
                                    this);
        if (err != paNoError) {
            *stream = nullptr;
            return fail(direction, "Pa_OpenStream", err);
        }

        std::cout << "[AudioEngine] Opened " << toString(direction) << ": " << info->name << std::endl;
        return true;
    }

    void close(PaStream*& stream, bool started) {
        if (!stream) return;
        if (started) Pa_StopStream(stream);
        Pa_CloseStream(stream);
        stream = nullptr;
    }

    static int onCapture(const void* input, void* /*output*/, unsigned long frames,
                         const PaStreamCallbackTimeInfo* /*time*/,
                         PaStreamCallbackFlags flags, void* user) {
        auto* self = static_cast<Impl*>(user);

        // Dropped capture frames make VAD timing drift; counted for diagnostics
        if (flags & paInputOverflow) {
            self->overflows++;
        }

        const auto* samples = static_cast<const float*>(input);
        std::lock_guard<std::mutex> lock(self->sinkMutex);
        if (samples && self->sink) {
            self->sink(samples, frames);
        }
        return paContinue;
    }

    static int onRender(const void* /*input*/, void* output, unsigned long frames,
                        const PaStreamCallbackTimeInfo* /*time*/,
                        PaStreamCallbackFlags /*flags*/, void* user) {
        auto* self = static_cast<Impl*>(user);
        auto* out = static_cast<float*>(output);

        size_t got = self->speaker.pop(out, frames);
        if (got < frames) {
            std::fill(out + got, out + frames, 0.0f);
        }
        return paContinue;
    }
};

AudioEngine::AudioEngine(const AudioConfig& config)
    : pImpl_(std::make_unique<Impl>(config))
    , config_(config)
{
}

AudioEngine::~AudioEngine() {
    stop();
    if (pImpl_->paReady) {
        Pa_Terminate();
    }
}

bool AudioEngine::initialize() {
    if (pImpl_->paReady) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return pImpl_->fail(core::ErrorKind::Acquisition,
                            std::string("Pa_Initialize failed: ") + Pa_GetErrorText(err));
    }
    pImpl_->paReady = true;

    std::cout << "[AudioEngine] PortAudio ready, " << Pa_GetDeviceCount() << " devices ("
              << config_.sample_rate << "Hz, " << config_.frames_per_buffer
              << " frames per buffer)" << std::endl;
    return true;
}

bool AudioEngine::start() {
    if (pImpl_->streaming) return true;
    if (!initialize()) return false;

    auto& impl = *pImpl_;
    if (!impl.open(Direction::Capture, &impl.microphone)) {
        return false;
    }
    if (!impl.open(Direction::Render, &impl.output)) {
        impl.close(impl.microphone, false);
        return false;
    }

    PaError err = Pa_StartStream(impl.microphone);
    if (err != paNoError) {
        impl.close(impl.microphone, false);
        impl.close(impl.output, false);
        return impl.fail(Direction::Capture, "Pa_StartStream", err);
    }

    err = Pa_StartStream(impl.output);
    if (err != paNoError) {
        impl.close(impl.microphone, true);
        impl.close(impl.output, false);
        return impl.fail(Direction::Render, "Pa_StartStream", err);
    }

    impl.speaker.clear();
    impl.streaming = true;
    std::cout << "[AudioEngine] Streaming" << std::endl;
    return true;
}

void AudioEngine::stop() {
    if (!pImpl_->streaming) return;
    pImpl_->streaming = false;

    pImpl_->close(pImpl_->microphone, true);
    pImpl_->close(pImpl_->output, true);

    std::cout << "[AudioEngine] Stopped";
    if (pImpl_->overflows > 0) {
        std::cout << " (" << pImpl_->overflows << " input overflows)";
    }
    std::cout << std::endl;
}

bool AudioEngine::isRunning() const {
    return pImpl_->streaming;
}

void AudioEngine::setInputCallback(AudioCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl_->sinkMutex);
    pImpl_->sink = std::move(callback);
}

size_t AudioEngine::queue(const float* samples, size_t count) {
    size_t accepted = pImpl_->speaker.push(samples, count);
    if (accepted < count) {
        std::cerr << "[AudioEngine] Playback buffer full, dropped "
                  << (count - accepted) << " samples" << std::endl;
    }
    return accepted;
}

void AudioEngine::clear() {
    pImpl_->speaker.clear();
}

size_t AudioEngine::queuedSamples() const {
    return pImpl_->speaker.available();
}

bool AudioEngine::isPlaying() const {
    return queuedSamples() > 0;
}

namespace {

std::vector<std::string> deviceNames(Direction direction) {
    std::vector<std::string> names;
    if (Pa_Initialize() != paNoError) {
        return names;
    }

    for (PaDeviceIndex i = 0; i < Pa_GetDeviceCount(); ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        int channels = direction == Direction::Capture ? info->maxInputChannels
                                                       : info->maxOutputChannels;
        if (channels > 0) names.emplace_back(info->name);
    }

    Pa_Terminate();
    return names;
}

} // namespace

std::vector<std::string> AudioEngine::listInputDevices() {
    return deviceNames(Direction::Capture);
}

std::vector<std::string> AudioEngine::listOutputDevices() {
    return deviceNames(Direction::Render);
}

size_t AudioEngine::inputOverflows() const {
    return pImpl_->overflows.load();
}

std::string AudioEngine::lastError() const {
    return pImpl_->lastError;
}

core::Error AudioEngine::lastErrorInfo() const {
    return core::Error{pImpl_->lastErrorKind, "AudioEngine", pImpl_->lastError};
}

} // namespace hpv::audio
