/**
 * AttentionDetector.cpp - KEYWORD/CAPTURING state machine
 */

#include "hpv/wake/AttentionDetector.hpp"
#include "hpv/stt/TranscriptFormatter.hpp"

#include <iostream>
#include <sstream>

namespace hpv::wake {

const char* toString(AttentionState state) {
    switch (state) {
        case AttentionState::Keyword:   return "KEYWORD";
        case AttentionState::Capturing: return "CAPTURING";
        case AttentionState::Stopped:   return "STOPPED";
    }
    return "UNKNOWN";
}

namespace {

size_t wordCount(const std::string& text) {
    std::istringstream stream(text);
    std::string word;
    size_t count = 0;
    while (stream >> word) ++count;
    return count;
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

struct AttentionDetector::Impl {
    Impl(core::EventLoop& l, audio::CaptureRouter& r, stt::StreamingTranscriber& t,
         std::unique_ptr<KeywordSpotter> s, core::SessionContext& ctx, AttentionConfig c)
        : loop(l), router(r), transcriber(t), spotter(std::move(s)), session(ctx)
        , config(std::move(c)), matcher(config.matcher), retry(config.restart)
        , completionTimer(l), captureTimer(l), restartTimer(l) {}

    core::EventLoop& loop;
    audio::CaptureRouter& router;
    stt::StreamingTranscriber& transcriber;
    std::unique_ptr<KeywordSpotter> spotter;
    core::SessionContext& session;
    AttentionConfig config;
    WakeMatcher matcher;

    AttentionState state = AttentionState::Stopped;
    bool initialized = false;
    bool disposed = false;
    bool keywordReady = false;
    bool stoppingTranscriber = false;

    std::string captureBuffer;
    bool hasLastWake = false;
    core::Millis lastWakeAt = 0;

    std::string aiText;
    bool aiSpeaking = false;
    core::Millis aiStartedAt = 0;
    core::Millis aiEndedAt = 0;

    int consecutiveErrors = 0;
    core::RetryState retry;

    core::ScopedTimer completionTimer;
    core::ScopedTimer captureTimer;
    core::ScopedTimer restartTimer;

    WakeCallback onWake;
    TextCallback onUserFinal;
    TextCallback onUserPartial;
    DebugCallback onDebug;
    ErrorCallback onError;

    std::string engineName() const {
        return keywordReady ? spotter->name() : "transcription";
    }

    void debug(const std::string& phase, const std::string& text = "", bool hasWake = false) {
        if (onDebug) {
            onDebug(AttentionDebugEvent{engineName(), phase, text, hasWake});
        }
    }

    void report(core::ErrorKind kind, const std::string& message) {
        std::cerr << "[AttentionDetector] " << core::toString(kind) << " in "
                  << toString(state) << ": " << message << std::endl;
        if (onError) {
            onError(core::Error{kind, "AttentionDetector", message});
        }
    }

    void stopTranscriber() {
        if (!transcriber.isActive()) return;
        stoppingTranscriber = true;
        transcriber.stopStreaming();
        stoppingTranscriber = false;
    }

    bool enterKeyword() {
        state = AttentionState::Keyword;
        captureBuffer.clear();
        completionTimer.cancel();
        captureTimer.cancel();

        if (keywordReady) {
            // The transcriber must let go of the microphone first
            stopTranscriber();
            spotter->reset();
            bool acquired = router.acquire(kCaptureOwner, [this](const float* samples, size_t count) {
                onKeywordAudio(samples, count);
            });
            if (!acquired) {
                scheduleRestart("microphone busy");
                return false;
            }
        } else if (!transcriber.isStreaming()) {
            if (!transcriber.startStreaming()) {
                scheduleRestart("transcription session failed to start");
                return false;
            }
        }

        retry.reset();
        debug("keyword");
        return true;
    }

    void scheduleRestart(const std::string& reason) {
        if (disposed || state == AttentionState::Stopped) return;

        if (!retry.next()) {
            report(core::ErrorKind::Recognition, "giving up restarting after " +
                   std::to_string(retry.attempt() - 1) + " attempts (" + reason + ")");
            return;
        }

        core::Millis delay = retry.currentDelay();
        std::cout << "[AttentionDetector] Restarting in " << delay << "ms ("
                  << reason << ", attempt " << retry.attempt() << ")" << std::endl;
        debug("restart", reason);

        restartTimer.start(delay, [this]() {
            if (disposed || state == AttentionState::Stopped) return;
            router.release(kCaptureOwner);
            stopTranscriber();
            enterKeyword();
        });
    }

    bool acceptWake() {
        core::Millis now = loop.now();
        if (hasLastWake && now - lastWakeAt < config.wake_debounce_ms) {
            debug("wake-debounced", "", true);
            return false;
        }
        hasLastWake = true;
        lastWakeAt = now;
        return true;
    }

    void emitWake(bool fallback, const std::string& detail) {
        session.recordWake(fallback);
        // A new user turn; the last AI line no longer counts as echo
        if (!aiSpeaking) aiText.clear();
        std::cout << "[AttentionDetector] Wake (" << engineName() << ": " << detail << ")" << std::endl;
        debug("wake", detail, true);
        if (onWake) onWake();
    }

    void beginCapture(const std::string& initial) {
        state = AttentionState::Capturing;
        captureBuffer = trim(initial);
        captureTimer.start(config.capture_timeout_ms, [this]() { onCaptureTimeout(); });
        if (!captureBuffer.empty()) {
            armCompletion();
        }
        debug("capture", captureBuffer);
    }

    void armCompletion() {
        int delay = wordCount(captureBuffer) >= static_cast<size_t>(config.long_utterance_words)
            ? config.capture_quick_ms
            : config.capture_quiet_ms;
        completionTimer.start(delay, [this]() { flush(); });
    }

    void flush() {
        std::string text = stt::TranscriptFormatter::restorePunctuation(trim(captureBuffer));
        debug("flush", text);
        enterKeyword();
        // May stop or dispose us
        if (!text.empty() && onUserFinal) onUserFinal(text);
    }

    void onCaptureTimeout() {
        if (!trim(captureBuffer).empty()) {
            flush();
            return;
        }
        std::cout << "[AttentionDetector] Nothing said after wake, back to keyword mode" << std::endl;
        debug("capture-timeout");
        enterKeyword();
    }

    void onKeywordAudio(const float* samples, size_t count) {
        if (state != AttentionState::Keyword) return;

        int index = spotter->process(samples, count);
        if (index < 0 || !acceptWake()) return;

        router.release(kCaptureOwner);
        emitWake(false, "keyword #" + std::to_string(index));
        if (state != AttentionState::Keyword) return;

        beginCapture("");
        if (!transcriber.startStreaming()) {
            scheduleRestart("capture session failed to start");
        }
    }

    bool aiEchoWindow() const {
        if (aiText.empty()) return false;
        return aiSpeaking || loop.now() - aiEndedAt <= config.echo_tail_ms;
    }

    bool isEcho(const std::string& text) {
        if (aiText.empty() || !matcher.isEcho(text, aiText)) return false;
        session.recordSuppressedEcho();
        std::cout << "[AttentionDetector] Suppressed echo: \"" << text << "\"" << std::endl;
        debug("echo", text);
        return true;
    }

    void onFinal(const std::string& text, float /*confidence*/) {
        if (state == AttentionState::Stopped) return;
        consecutiveErrors = 0;

        if (isEcho(text)) return;

        if (state == AttentionState::Keyword) {
            if (keywordReady) return;

            if (aiSpeaking && !matcher.passesEarlyFilter(text)) {
                return;
            }

            WakeDetection detection = matcher.detect(text);
            debug("final", text, detection.hasWakeWord);
            if (!detection.hasWakeWord) return;

            if (aiEchoWindow() &&
                matcher.suppressIfAIMatch(detection.tokens, aiText, loop.now() - aiStartedAt)) {
                session.recordSuppressedEcho();
                debug("echo", text, true);
                return;
            }

            if (!acceptWake()) return;
            emitWake(true, detection.matched->phrase + "/" + toString(detection.matched->kind));
            if (state != AttentionState::Keyword) return;
            beginCapture(matcher.stripWakePhrase(text));
            return;
        }

        // CAPTURING
        if (matcher.isWakeOnly(text)) {
            debug("wake-repeat", text, true);
            return;
        }

        captureTimer.cancel();
        captureBuffer = trim(captureBuffer.empty() ? text : captureBuffer + " " + text);
        armCompletion();
        debug("capture", captureBuffer);
    }

    void onInterim(const std::string& text) {
        if (state != AttentionState::Capturing) return;

        // Still talking: hold the flush back
        if (completionTimer.isPending()) {
            armCompletion();
        }
        if (onUserPartial) {
            onUserPartial(trim(captureBuffer + " " + text));
        }
    }

    void onTranscriberError(const core::Error& error) {
        if (state == AttentionState::Stopped) return;

        session.recordRecognitionError();
        if (onError) onError(error);

        if (++consecutiveErrors >= config.errors_before_restart) {
            consecutiveErrors = 0;
            stopTranscriber();
            scheduleRestart("repeated recognition errors");
        }
    }

    void onSessionStopped() {
        if (stoppingTranscriber || state == AttentionState::Stopped) return;
        if (keywordReady && state == AttentionState::Keyword) return;
        scheduleRestart("transcription session ended unexpectedly");
    }
};

AttentionDetector::AttentionDetector(core::EventLoop& loop,
                                     audio::CaptureRouter& router,
                                     stt::StreamingTranscriber& transcriber,
                                     std::unique_ptr<KeywordSpotter> spotter,
                                     core::SessionContext& session,
                                     AttentionConfig config)
    : impl_(std::make_unique<Impl>(loop, router, transcriber, std::move(spotter),
                                   session, std::move(config)))
{
}

AttentionDetector::~AttentionDetector() {
    dispose();
}

bool AttentionDetector::initialize() {
    if (impl_->disposed) return false;
    if (impl_->initialized) return true;

    if (!impl_->transcriber.isInitialized()) {
        impl_->report(core::ErrorKind::Recognition, "transcriber is not initialized");
        return false;
    }

    if (!impl_->spotter) {
        impl_->report(core::ErrorKind::ModelLoad, "no keyword engine, using transcription fallback");
    } else if (impl_->spotter->load(impl_->config.keyword_model)) {
        impl_->keywordReady = true;
    } else {
        impl_->report(core::ErrorKind::ModelLoad,
                      impl_->spotter->lastError().message + ", using transcription fallback");
    }

    impl_->session.setKeywordActive(impl_->keywordReady);
    impl_->session.setEngine(impl_->engineName());

    auto& t = impl_->transcriber;
    t.setOnFinalTranscript([this](const std::string& text, float confidence) {
        impl_->onFinal(text, confidence);
    });
    t.setOnInterimTranscript([this](const std::string& text) { impl_->onInterim(text); });
    t.setOnError([this](const core::Error& error) { impl_->onTranscriberError(error); });
    t.setOnSessionStopped([this]() { impl_->onSessionStopped(); });

    impl_->initialized = true;
    std::cout << "[AttentionDetector] Initialized (" << impl_->engineName() << ")" << std::endl;
    return true;
}

bool AttentionDetector::start() {
    if (impl_->disposed) return false;
    if (!impl_->initialized && !initialize()) return false;
    if (impl_->state != AttentionState::Stopped) return true;

    impl_->retry.reset();
    impl_->consecutiveErrors = 0;
    impl_->enterKeyword();
    return true;
}

void AttentionDetector::stop() {
    if (impl_->state == AttentionState::Stopped) return;

    impl_->state = AttentionState::Stopped;
    impl_->completionTimer.cancel();
    impl_->captureTimer.cancel();
    impl_->restartTimer.cancel();
    impl_->captureBuffer.clear();
    impl_->router.release(kCaptureOwner);
    impl_->stopTranscriber();

    std::cout << "[AttentionDetector] Stopped" << std::endl;
    impl_->debug("stopped");
}

void AttentionDetector::dispose() {
    if (impl_->disposed) return;

    stop();
    impl_->disposed = true;

    if (impl_->initialized) {
        auto& t = impl_->transcriber;
        t.setOnFinalTranscript(nullptr);
        t.setOnInterimTranscript(nullptr);
        t.setOnError(nullptr);
        t.setOnSessionStopped(nullptr);
    }

    impl_->onWake = nullptr;
    impl_->onUserFinal = nullptr;
    impl_->onUserPartial = nullptr;
    impl_->onDebug = nullptr;
    impl_->onError = nullptr;
}

bool AttentionDetector::isActive() const {
    return impl_->state != AttentionState::Stopped;
}

AttentionState AttentionDetector::state() const {
    return impl_->state;
}

bool AttentionDetector::usingKeywordEngine() const {
    return impl_->keywordReady;
}

void AttentionDetector::setAISpeech(const std::string& text) {
    impl_->aiText = text;
    impl_->aiSpeaking = true;
    impl_->aiStartedAt = impl_->loop.now();
}

void AttentionDetector::clearAISpeech() {
    if (!impl_->aiSpeaking) return;
    impl_->aiSpeaking = false;
    impl_->aiEndedAt = impl_->loop.now();
}

bool AttentionDetector::isAISpeaking() const {
    return impl_->aiSpeaking;
}

void AttentionDetector::setOnWake(WakeCallback callback) {
    impl_->onWake = std::move(callback);
}

void AttentionDetector::setOnUserFinal(TextCallback callback) {
    impl_->onUserFinal = std::move(callback);
}

void AttentionDetector::setOnUserPartial(TextCallback callback) {
    impl_->onUserPartial = std::move(callback);
}

void AttentionDetector::setOnDebug(DebugCallback callback) {
    impl_->onDebug = std::move(callback);
}

void AttentionDetector::setOnError(ErrorCallback callback) {
    impl_->onError = std::move(callback);
}

} // namespace hpv::wake
