/**
 * EchoCanceller.cpp - AEC3 render/capture framing
 */

#include "hpv/audio/EchoCanceller.hpp"

#include "audio_processing/aec3/echo_canceller3.h"
#include "audio_processing/audio_buffer.h"

#include <iostream>

namespace hpv::audio {

namespace {

// AEC3 processes in 10ms frames
constexpr int kFrameMs = 10;

/**
 * Collects arbitrary-sized writes into whole AEC3 frames.
 */
class FrameAccumulator {
public:
    explicit FrameAccumulator(size_t frame) : frame_(frame) {}

    void append(const float* samples, size_t count) {
        pending_.insert(pending_.end(), samples, samples + count);
    }

    // Calls fn(frame_ptr) for every complete frame, then drops them
    template <typename Fn>
    size_t drain(Fn&& fn) {
        size_t offset = 0;
        size_t frames = 0;
        while (pending_.size() - offset >= frame_) {
            fn(pending_.data() + offset);
            offset += frame_;
            ++frames;
        }
        pending_.erase(pending_.begin(), pending_.begin() + offset);
        return frames;
    }

    void clear() { pending_.clear(); }

private:
    size_t frame_;
    std::vector<float> pending_;
};

} // namespace

struct EchoCanceller::Impl {
    explicit Impl(size_t frame) : render(frame), capture(frame), frameSamples(frame) {}

    std::unique_ptr<webrtc::EchoCanceller3> aec3;
    std::unique_ptr<webrtc::AudioBuffer> renderBuffer;
    std::unique_ptr<webrtc::AudioBuffer> captureBuffer;

    FrameAccumulator render;
    FrameAccumulator capture;
    size_t frameSamples;

    size_t renderFrames = 0;
    size_t captureFrames = 0;
    int sampleRate = 16000;
};

EchoCanceller::EchoCanceller(int sample_rate)
    : pImpl_(std::make_unique<Impl>(static_cast<size_t>(sample_rate * kFrameMs / 1000)))
{
    pImpl_->sampleRate = sample_rate;

    if (sample_rate != 16000 && sample_rate != 32000 && sample_rate != 48000) {
        std::cerr << "[EchoCanceller] Unsupported sample rate " << sample_rate
                  << ", capture passes through" << std::endl;
        return;
    }

    try {
        webrtc::EchoCanceller3Config config;
        pImpl_->aec3 = std::make_unique<webrtc::EchoCanceller3>(config, sample_rate, 1, 1);
        pImpl_->renderBuffer = std::make_unique<webrtc::AudioBuffer>(
            sample_rate, 1, sample_rate, 1, sample_rate, 1);
        pImpl_->captureBuffer = std::make_unique<webrtc::AudioBuffer>(
            sample_rate, 1, sample_rate, 1, sample_rate, 1);

        std::cout << "[EchoCanceller] AEC3 active (" << sample_rate << "Hz, "
                  << pImpl_->frameSamples << " samples/frame)" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[EchoCanceller] AEC3 unavailable: " << e.what()
                  << ", capture passes through" << std::endl;
        pImpl_->aec3.reset();
    }
}

EchoCanceller::~EchoCanceller() = default;

bool EchoCanceller::isActive() const {
    return pImpl_->aec3 != nullptr;
}

void EchoCanceller::feedRender(const float* samples, size_t count) {
    if (!pImpl_->aec3) return;

    pImpl_->render.append(samples, count);
    pImpl_->renderFrames += pImpl_->render.drain([this](const float* frame) {
        float* const* channels = pImpl_->renderBuffer->channels_f();
        std::copy(frame, frame + pImpl_->frameSamples, channels[0]);
        pImpl_->aec3->AnalyzeRender(pImpl_->renderBuffer.get());
    });
}

std::vector<float> EchoCanceller::processCapture(const float* samples, size_t count) {
    if (!pImpl_->aec3) {
        return std::vector<float>(samples, samples + count);
    }

    std::vector<float> output;
    output.reserve(count + pImpl_->frameSamples);

    pImpl_->capture.append(samples, count);
    pImpl_->captureFrames += pImpl_->capture.drain([this, &output](const float* frame) {
        float* const* channels = pImpl_->captureBuffer->channels_f();
        std::copy(frame, frame + pImpl_->frameSamples, channels[0]);

        pImpl_->aec3->AnalyzeCapture(pImpl_->captureBuffer.get());
        pImpl_->aec3->ProcessCapture(pImpl_->captureBuffer.get(), false);

        const float* const* processed = pImpl_->captureBuffer->channels_const_f();
        output.insert(output.end(), processed[0], processed[0] + pImpl_->frameSamples);
    });

    return output;
}

size_t EchoCanceller::renderFrames() const {
    return pImpl_->renderFrames;
}

size_t EchoCanceller::captureFrames() const {
    return pImpl_->captureFrames;
}

void EchoCanceller::reset() {
    pImpl_->render.clear();
    pImpl_->capture.clear();
    pImpl_->renderFrames = 0;
    pImpl_->captureFrames = 0;
}

} // namespace hpv::audio
