/**
 * StreamingTranscriber.hpp - Continuous and single-shot recognition sessions
 *
 * A session holds the microphone lease, segments audio with its own
 * endpointing VAD and decodes segments on the background executor:
 *
 *   - startStreaming(): continuous; every segment yields interim results
 *     while speech lasts and one final result after end-silence.
 *   - recognizeOnce(): one segment, or an empty result after the
 *     initial-silence timeout.
 *
 * Only one session exists at a time. Results from a stopped or replaced
 * session are dropped, so no transcript is delivered after stopStreaming().
 */

#pragma once

#include "hpv/audio/CaptureRouter.hpp"
#include "hpv/audio/VoiceActivityDetector.hpp"
#include "hpv/core/BackgroundExecutor.hpp"
#include "hpv/core/Error.hpp"
#include "hpv/core/EventLoop.hpp"
#include "hpv/stt/RecognitionEngine.hpp"
#include "hpv/stt/TranscriptFormatter.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hpv::stt {

struct TranscriberConfig {
    int initial_silence_timeout_ms = 5000;
    int end_silence_timeout_ms = 1000;
    int interim_interval_ms = 1000;      // 0 disables partial decodes
    float low_confidence_threshold = 0.9f;
    int max_segment_ms = 20000;
    std::vector<std::string> phrases;
    FormatterOptions formatting;
};

struct TranscriptResult {
    std::string text;
    bool isFinal = false;
    float confidence = 0.0f;
    bool lowConfidence = false;
};

class StreamingTranscriber {
public:
    using EngineFactory = std::function<std::unique_ptr<RecognitionEngine>()>;
    using InterimCallback = std::function<void(const std::string& text)>;
    using FinalCallback = std::function<void(const std::string& text, float confidence)>;
    using ErrorCallback = std::function<void(const core::Error& error)>;
    using SessionCallback = std::function<void()>;
    using OnceCallback = std::function<void(const TranscriptResult& result)>;

    /**
     * vad is the endpointing detector; its redemption window is derived from
     * end_silence_timeout_ms.
     */
    StreamingTranscriber(core::EventLoop& loop,
                         core::BackgroundExecutor& executor,
                         audio::CaptureRouter& router,
                         EngineFactory factory,
                         std::unique_ptr<audio::VoiceActivityDetector> vad,
                         TranscriberConfig config = {});
    ~StreamingTranscriber();

    StreamingTranscriber(const StreamingTranscriber&) = delete;
    StreamingTranscriber& operator=(const StreamingTranscriber&) = delete;

    bool initialize(const std::string& key, const std::string& region, const std::string& locale);

    bool startStreaming();
    void stopStreaming();

    /**
     * Capture one utterance. done receives an empty result on no-speech or
     * recognition failure.
     */
    bool recognizeOnce(OnceCallback done);

    /**
     * Recreate the engine for a new locale; an active streaming session is
     * stopped and resumed around the switch.
     */
    bool setLanguage(const std::string& locale);

    void destroy();

    bool isInitialized() const;
    bool isStreaming() const;   // Continuous session active
    bool isActive() const;      // Any session (continuous or single-shot)
    std::string locale() const;
    std::string engineName() const;

    void setOnInterimTranscript(InterimCallback callback);
    void setOnFinalTranscript(FinalCallback callback);
    void setOnError(ErrorCallback callback);
    void setOnSessionStarted(SessionCallback callback);
    void setOnSessionStopped(SessionCallback callback);

    static constexpr const char* kCaptureOwner = "transcriber";

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace hpv::stt
