/**
 * AttentionDetector.hpp - Wake phrase detection and utterance capture
 *
 * States: KEYWORD -> CAPTURING -> KEYWORD ... or STOPPED.
 *
 * With a keyword engine the microphone goes to the spotter while in
 * KEYWORD; a detection hands the microphone to the transcriber for the
 * user's utterance and takes it back once the utterance is delivered.
 *
 * Without one (ModelLoad failure, or no engine in this build) the
 * transcriber streams all the time and every final transcript is run
 * through the WakeMatcher. In both modes fragments after the wake phrase
 * are buffered and flushed to onUserFinal after a quiet period.
 */

#pragma once

#include "hpv/audio/CaptureRouter.hpp"
#include "hpv/core/Error.hpp"
#include "hpv/core/EventLoop.hpp"
#include "hpv/core/RetryPolicy.hpp"
#include "hpv/core/SessionContext.hpp"
#include "hpv/stt/StreamingTranscriber.hpp"
#include "hpv/wake/KeywordSpotter.hpp"
#include "hpv/wake/WakeMatcher.hpp"

#include <functional>
#include <memory>
#include <string>

namespace hpv::wake {

enum class AttentionState {
    Keyword,
    Capturing,
    Stopped
};

const char* toString(AttentionState state);

struct AttentionConfig {
    KeywordModel keyword_model;
    WakeMatcherConfig matcher;

    int capture_quiet_ms = 800;        // Flush after this much quiet
    int capture_quick_ms = 300;        // ...or this much once the utterance is long
    int long_utterance_words = 12;
    int capture_timeout_ms = 8000;     // Wake with nothing said afterwards
    int wake_debounce_ms = 2000;       // Repeated wakes inside collapse to one
    int echo_tail_ms = 1500;           // Self-trigger checks continue this long after AI speech
    int errors_before_restart = 3;

    core::RetryPolicy restart{0, 400, 2.0, 8000};
};

struct AttentionDebugEvent {
    std::string engine;   // "porcupine", "transcription"
    std::string phase;    // "keyword", "wake", "capture", "flush", "echo", ...
    std::string text;
    bool hasWake = false;
};

class AttentionDetector {
public:
    using WakeCallback = std::function<void()>;
    using TextCallback = std::function<void(const std::string& text)>;
    using DebugCallback = std::function<void(const AttentionDebugEvent& event)>;
    using ErrorCallback = std::function<void(const core::Error& error)>;

    /**
     * spotter may be null; the transcription fallback is used then.
     */
    AttentionDetector(core::EventLoop& loop,
                      audio::CaptureRouter& router,
                      stt::StreamingTranscriber& transcriber,
                      std::unique_ptr<KeywordSpotter> spotter,
                      core::SessionContext& session,
                      AttentionConfig config = {});
    ~AttentionDetector();

    AttentionDetector(const AttentionDetector&) = delete;
    AttentionDetector& operator=(const AttentionDetector&) = delete;

    /**
     * Load the keyword model. A load failure is reported as ModelLoad and
     * selects the fallback; only a missing transcriber fails initialization.
     */
    bool initialize();

    bool start();
    void stop();
    void dispose();
    bool isActive() const;

    AttentionState state() const;
    bool usingKeywordEngine() const;

    /**
     * Text the assistant is about to speak; transcripts that mostly repeat
     * it are treated as echo and never wake the detector. The text stays in
     * effect after clearAISpeech() until the next wake.
     */
    void setAISpeech(const std::string& text);
    void clearAISpeech();
    bool isAISpeaking() const;

    void setOnWake(WakeCallback callback);
    void setOnUserFinal(TextCallback callback);
    void setOnUserPartial(TextCallback callback);
    void setOnDebug(DebugCallback callback);
    void setOnError(ErrorCallback callback);

    static constexpr const char* kCaptureOwner = "keyword-spotter";

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hpv::wake
