/**
 * VoiceActivityDetector.hpp - Speech segmentation over classifier frames
 *
 * Consumes capture audio, scores fixed-size frames with a SpeechClassifier
 * and turns the probabilities into speech segments with hysteresis
 * (positive/negative thresholds), a redemption window, pre-roll, a minimum
 * duration filter and a debounce between segments.
 *
 * onSpeechStart fires only once a segment has lasted min_speech_duration_ms,
 * so clicks and other short bursts never produce a start. All times are
 * stream time (samples consumed), not wall time.
 */

#pragma once

#include "hpv/audio/SpeechClassifier.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace hpv::audio {

struct VadConfig {
    int sample_rate = 16000;
    int frame_samples = 480;             // 30ms at 16kHz
    float positive_threshold = 0.85f;    // High, to reject background voices
    float negative_threshold = 0.35f;
    int min_speech_frames = 5;           // Frames above positive_threshold
    int pre_speech_pad_frames = 2;
    int redemption_frames = 10;
    int min_speech_duration_ms = 300;
    int debounce_ms = 500;
    int max_segment_ms = 0;              // Longer speech is cut into segments; 0 = no limit
};

class VoiceActivityDetector {
public:
    using StartCallback = std::function<void()>;
    using EndCallback = std::function<void(const std::vector<float>& audio)>;
    using MisfireCallback = std::function<void()>;
    // Return false to veto a speech start
    using Guard = std::function<bool()>;

    VoiceActivityDetector(const VadConfig& config,
                          std::unique_ptr<SpeechClassifier> classifier);
    ~VoiceActivityDetector();

    VoiceActivityDetector(const VoiceActivityDetector&) = delete;
    VoiceActivityDetector& operator=(const VoiceActivityDetector&) = delete;

    /**
     * Convenience constructor backed by libfvad.
     */
    static std::unique_ptr<VoiceActivityDetector> withFvad(
        const VadConfig& config, FvadMode mode = FvadMode::Aggressive);

    void start();
    // Stops evaluating audio; an open segment is dropped without callbacks
    void pause();
    // Releases the classifier; the detector ignores audio afterwards
    void destroy();

    bool isListening() const;

    void process(const float* samples, size_t count);

    void setOnSpeechStart(StartCallback callback);
    void setOnSpeechEnd(EndCallback callback);
    void setOnMisfire(MisfireCallback callback);
    void setGuard(Guard guard);

    /**
     * Redemption window in frames; used to map end-silence timeouts.
     */
    void setRedemptionFrames(int frames);
    void setDebounce(int ms);
    void setMaxSegmentMs(int ms);

    bool isSpeaking() const;             // A confirmed segment is open
    int currentSpeechDuration() const;   // ms, 0 when idle
    std::int64_t streamTimeMs() const;

    const VadConfig& config() const;

    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace hpv::audio
