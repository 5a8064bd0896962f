/**
 * VoiceActivityDetector.cpp - Frame hysteresis, pre-roll and segment filters
 */

#include "hpv/audio/VoiceActivityDetector.hpp"

#include <algorithm>
#include <deque>
#include <iostream>

namespace hpv::audio {

namespace {

enum class Phase {
    Idle,       // Waiting for a frame above the positive threshold
    Candidate,  // Above threshold, not yet long enough to be speech
    Speaking,   // Confirmed, onSpeechStart delivered
    Ignored     // Started inside the debounce window, tracked until it ends
};

} // namespace

struct VoiceActivityDetector::Impl {
    VadConfig config;
    std::unique_ptr<SpeechClassifier> classifier;

    bool listening = false;
    bool destroyed = false;

    int frame_ms = 30;
    std::vector<float> frameBuffer;

    // Stream position
    std::int64_t frameIndex = 0;

    // Segment
    Phase phase = Phase::Idle;
    std::deque<std::vector<float>> preRoll;
    std::vector<float> segment;
    std::int64_t firstFrame = 0;
    std::int64_t lastPositiveFrame = 0;
    int positiveFrames = 0;
    int redemptionCount = 0;

    bool hasLastEnd = false;
    std::int64_t lastSpeechEndMs = 0;

    StartCallback onStart;
    EndCallback onEnd;
    MisfireCallback onMisfire;
    Guard guard;

    std::int64_t frameStartMs(std::int64_t index) const {
        return index * frame_ms;
    }

    void clearSegment() {
        phase = Phase::Idle;
        segment.clear();
        positiveFrames = 0;
        redemptionCount = 0;
    }

    void processFrame(const std::vector<float>& frame);
    void beginSegment(const std::vector<float>& frame);
    void tryConfirm();
    void endSegment();
};

VoiceActivityDetector::VoiceActivityDetector(const VadConfig& config,
                                             std::unique_ptr<SpeechClassifier> classifier)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->config = config;
    pImpl_->classifier = std::move(classifier);
    pImpl_->frame_ms = config.sample_rate > 0
        ? std::max(1, config.frame_samples * 1000 / config.sample_rate)
        : 30;
    pImpl_->frameBuffer.reserve(config.frame_samples);

    std::cout << "[VAD] Initialized (frame=" << pImpl_->frame_ms
              << "ms, thresholds=" << config.positive_threshold << "/"
              << config.negative_threshold << ", min_speech="
              << config.min_speech_duration_ms << "ms, debounce="
              << config.debounce_ms << "ms)" << std::endl;
}

VoiceActivityDetector::~VoiceActivityDetector() = default;

std::unique_ptr<VoiceActivityDetector> VoiceActivityDetector::withFvad(
    const VadConfig& config, FvadMode mode)
{
    return std::make_unique<VoiceActivityDetector>(
        config, std::make_unique<FvadClassifier>(config.sample_rate, mode));
}

void VoiceActivityDetector::start() {
    if (pImpl_->destroyed) {
        std::cerr << "[VAD] start() after destroy() ignored" << std::endl;
        return;
    }
    if (!pImpl_->classifier || !pImpl_->classifier->isValid()) {
        std::cerr << "[VAD] No usable classifier, detector stays idle" << std::endl;
        return;
    }
    pImpl_->listening = true;
}

void VoiceActivityDetector::pause() {
    pImpl_->listening = false;
    pImpl_->frameBuffer.clear();
    pImpl_->preRoll.clear();
    pImpl_->clearSegment();
}

void VoiceActivityDetector::destroy() {
    pause();
    pImpl_->destroyed = true;
    pImpl_->classifier.reset();
    pImpl_->onStart = nullptr;
    pImpl_->onEnd = nullptr;
    pImpl_->onMisfire = nullptr;
    pImpl_->guard = nullptr;
}

bool VoiceActivityDetector::isListening() const {
    return pImpl_->listening;
}

void VoiceActivityDetector::process(const float* samples, size_t count) {
    if (!pImpl_->listening) return;

    const size_t frameSamples = static_cast<size_t>(pImpl_->config.frame_samples);

    for (size_t i = 0; i < count; ++i) {
        pImpl_->frameBuffer.push_back(samples[i]);

        if (pImpl_->frameBuffer.size() >= frameSamples) {
            std::vector<float> frame;
            frame.swap(pImpl_->frameBuffer);
            pImpl_->frameBuffer.reserve(frameSamples);
            pImpl_->processFrame(frame);

            // A callback may have paused or destroyed us
            if (!pImpl_->listening) return;
        }
    }
}

void VoiceActivityDetector::Impl::processFrame(const std::vector<float>& frame) {
    float probability = classifier->classify(frame.data(), frame.size());
    bool positive = probability >= config.positive_threshold;
    bool negative = probability < config.negative_threshold;

    if (phase == Phase::Idle) {
        if (positive) {
            beginSegment(frame);
            ++frameIndex;
            if (phase == Phase::Candidate) {
                tryConfirm();
            }
            return;
        } else {
            preRoll.push_back(frame);
            while (static_cast<int>(preRoll.size()) > config.pre_speech_pad_frames) {
                preRoll.pop_front();
            }
        }
        ++frameIndex;
        return;
    }

    if (phase != Phase::Ignored) {
        segment.insert(segment.end(), frame.begin(), frame.end());
    }

    if (phase == Phase::Speaking && config.max_segment_ms > 0 &&
        (frameIndex - firstFrame + 1) * frame_ms >= config.max_segment_ms) {
        std::cout << "[VAD] Segment reached " << config.max_segment_ms
                  << "ms, ending it" << std::endl;
        ++frameIndex;
        endSegment();
        return;
    }

    if (positive) {
        ++positiveFrames;
        lastPositiveFrame = frameIndex;
        redemptionCount = 0;
        ++frameIndex;
        if (phase == Phase::Candidate) {
            tryConfirm();
        }
        return;
    }

    ++frameIndex;
    if (negative && ++redemptionCount >= config.redemption_frames) {
        endSegment();
    }
}

void VoiceActivityDetector::Impl::beginSegment(const std::vector<float>& frame) {
    std::int64_t startMs = frameStartMs(frameIndex);

    if (hasLastEnd && startMs - lastSpeechEndMs < config.debounce_ms) {
        std::cout << "[VAD] Speech start " << (startMs - lastSpeechEndMs)
                  << "ms after previous segment, debounced" << std::endl;
        phase = Phase::Ignored;
        preRoll.clear();
        redemptionCount = 0;
        return;
    }

    phase = Phase::Candidate;
    segment.clear();
    for (const auto& padded : preRoll) {
        segment.insert(segment.end(), padded.begin(), padded.end());
    }
    preRoll.clear();
    segment.insert(segment.end(), frame.begin(), frame.end());

    firstFrame = frameIndex;
    lastPositiveFrame = frameIndex;
    positiveFrames = 1;
    redemptionCount = 0;
}

void VoiceActivityDetector::Impl::tryConfirm() {
    std::int64_t durationMs = (lastPositiveFrame - firstFrame + 1) * frame_ms;
    if (positiveFrames < config.min_speech_frames ||
        durationMs < config.min_speech_duration_ms) {
        return;
    }

    if (guard && !guard()) {
        std::cout << "[VAD] Speech start vetoed by guard" << std::endl;
        hasLastEnd = true;
        lastSpeechEndMs = frameStartMs(frameIndex);
        clearSegment();
        if (onMisfire) onMisfire();
        return;
    }

    phase = Phase::Speaking;
    if (onStart) onStart();
}

void VoiceActivityDetector::Impl::endSegment() {
    Phase ended = phase;
    std::vector<float> audio;
    audio.swap(segment);
    clearSegment();

    if (ended == Phase::Ignored) {
        return;
    }

    if (ended == Phase::Candidate) {
        // Shorter than the minimum: noise, no callback
        return;
    }

    hasLastEnd = true;
    lastSpeechEndMs = frameStartMs(frameIndex);
    if (onEnd) onEnd(audio);
}

void VoiceActivityDetector::setOnSpeechStart(StartCallback callback) {
    pImpl_->onStart = std::move(callback);
}

void VoiceActivityDetector::setOnSpeechEnd(EndCallback callback) {
    pImpl_->onEnd = std::move(callback);
}

void VoiceActivityDetector::setOnMisfire(MisfireCallback callback) {
    pImpl_->onMisfire = std::move(callback);
}

void VoiceActivityDetector::setGuard(Guard guard) {
    pImpl_->guard = std::move(guard);
}

void VoiceActivityDetector::setRedemptionFrames(int frames) {
    pImpl_->config.redemption_frames = frames > 0 ? frames : 1;
}

void VoiceActivityDetector::setDebounce(int ms) {
    pImpl_->config.debounce_ms = ms > 0 ? ms : 0;
}

void VoiceActivityDetector::setMaxSegmentMs(int ms) {
    pImpl_->config.max_segment_ms = ms > 0 ? ms : 0;
}

bool VoiceActivityDetector::isSpeaking() const {
    return pImpl_->phase == Phase::Speaking;
}

int VoiceActivityDetector::currentSpeechDuration() const {
    if (pImpl_->phase != Phase::Speaking && pImpl_->phase != Phase::Candidate) {
        return 0;
    }
    return static_cast<int>((pImpl_->frameIndex - pImpl_->firstFrame) * pImpl_->frame_ms);
}

std::int64_t VoiceActivityDetector::streamTimeMs() const {
    return pImpl_->frameStartMs(pImpl_->frameIndex);
}

const VadConfig& VoiceActivityDetector::config() const {
    return pImpl_->config;
}

void VoiceActivityDetector::reset() {
    pImpl_->frameBuffer.clear();
    pImpl_->preRoll.clear();
    pImpl_->clearSegment();
    pImpl_->hasLastEnd = false;
    if (pImpl_->classifier) {
        pImpl_->classifier->reset();
    }
}

} // namespace hpv::audio
