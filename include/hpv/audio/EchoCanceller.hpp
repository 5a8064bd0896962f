/**
 * EchoCanceller.hpp - WebRTC AEC3 between playback and the microphone
 *
 * Playback audio is fed as the render reference; microphone audio runs
 * through processCapture() before it reaches the VAD or a recognizer, so the
 * assistant hears less of its own voice. Without AEC3 the capture path is a
 * pass-through.
 */

#pragma once

#include <memory>
#include <vector>

namespace hpv::audio {

class EchoCanceller {
public:
    explicit EchoCanceller(int sample_rate = 16000);
    ~EchoCanceller();

    EchoCanceller(const EchoCanceller&) = delete;
    EchoCanceller& operator=(const EchoCanceller&) = delete;

    bool isActive() const;

    void feedRender(const float* samples, size_t count);

    /**
     * Returns echo-reduced audio. AEC3 works on 10ms frames, so output can
     * lag input by up to one frame.
     */
    std::vector<float> processCapture(const float* samples, size_t count);

    size_t renderFrames() const;
    size_t captureFrames() const;

    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace hpv::audio
