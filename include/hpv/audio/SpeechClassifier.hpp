/**
 * SpeechClassifier.hpp - Per-frame speech probability
 */

#pragma once

#include <cstddef>
#include <memory>

namespace hpv::audio {

class SpeechClassifier {
public:
    virtual ~SpeechClassifier() = default;

    /**
     * Probability in [0, 1] that the frame contains speech.
     */
    virtual float classify(const float* frame, size_t count) = 0;

    virtual void reset() {}

    virtual bool isValid() const { return true; }
};

/**
 * Aggressiveness levels of libfvad (0 = quality, 3 = very aggressive)
 */
enum class FvadMode {
    Quality = 0,
    LowBitrate = 1,
    Aggressive = 2,
    VeryAggressive = 3
};

/**
 * WebRTC VAD via libfvad. fvad only gives a binary vote per 10/20/30ms
 * frame, so each frame is split into 10ms slices and the probability is
 * the fraction of slices voted as speech.
 */
class FvadClassifier : public SpeechClassifier {
public:
    FvadClassifier(int sample_rate = 16000, FvadMode mode = FvadMode::Aggressive);
    ~FvadClassifier() override;

    FvadClassifier(const FvadClassifier&) = delete;
    FvadClassifier& operator=(const FvadClassifier&) = delete;

    float classify(const float* frame, size_t count) override;
    void reset() override;
    bool isValid() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace hpv::audio
