/**
 * StreamingTranscriber.cpp - Session management over a RecognitionEngine
 */

#include "hpv/stt/StreamingTranscriber.hpp"

#include <algorithm>
#include <iostream>

namespace hpv::stt {

namespace {

enum class Mode {
    Idle,
    Continuous,
    Once
};

const char* toString(Mode mode) {
    switch (mode) {
        case Mode::Idle:       return "idle";
        case Mode::Continuous: return "continuous";
        case Mode::Once:       return "once";
    }
    return "unknown";
}

} // namespace

struct StreamingTranscriber::Impl : std::enable_shared_from_this<StreamingTranscriber::Impl> {
    Impl(core::EventLoop& l, core::BackgroundExecutor& e, audio::CaptureRouter& r,
         EngineFactory f, std::unique_ptr<audio::VoiceActivityDetector> v,
         TranscriberConfig c)
        : loop(l), executor(e), router(r), factory(std::move(f)), vad(std::move(v))
        , config(std::move(c)), formatter(config.formatting)
        , interimTimer(l), initialSilenceTimer(l) {}

    core::EventLoop& loop;
    core::BackgroundExecutor& executor;
    audio::CaptureRouter& router;
    EngineFactory factory;
    std::unique_ptr<audio::VoiceActivityDetector> vad;
    TranscriberConfig config;
    TranscriptFormatter formatter;

    std::shared_ptr<RecognitionEngine> engine;
    RecognitionSettings settings;
    bool destroyed = false;

    Mode mode = Mode::Idle;
    std::uint64_t generation = 0;   // Bumped on every session start and stop
    std::uint64_t segment = 0;      // Bumped when a segment is finalized
    std::vector<float> recent;      // Audio of the current segment, for interims
    bool interimInFlight = false;
    bool awaitingFinal = false;

    core::ScopedTimer interimTimer;
    core::ScopedTimer initialSilenceTimer;
    OnceCallback onceDone;

    InterimCallback onInterim;
    FinalCallback onFinal;
    ErrorCallback onError;
    SessionCallback onStarted;
    SessionCallback onStopped;

    void report(const std::string& message) {
        std::cerr << "[Transcriber] RecognitionError (" << toString(mode) << "): "
                  << message << std::endl;
        if (onError) {
            onError(core::Error{core::ErrorKind::Recognition, "Transcriber", message});
        }
    }

    void wireVad() {
        const auto& vc = vad->config();
        int frameMs = vc.sample_rate > 0 ? std::max(1, vc.frame_samples * 1000 / vc.sample_rate) : 30;
        vad->setRedemptionFrames((config.end_silence_timeout_ms + frameMs - 1) / frameMs);

        // Endpointing only; a debounce here would swallow the next utterance
        vad->setDebounce(0);
        vad->setMaxSegmentMs(config.max_segment_ms);

        vad->setOnSpeechStart([this]() { onSpeechStart(); });
        vad->setOnSpeechEnd([this](const std::vector<float>& audio) { onSpeechEnd(audio); });
    }

    bool beginSession(Mode next) {
        if (destroyed) return false;
        if (!engine || !engine->isReady()) {
            std::cerr << "[Transcriber] Not initialized" << std::endl;
            return false;
        }
        if (mode != Mode::Idle) {
            std::cerr << "[Transcriber] StateViolation: " << toString(next)
                      << " session requested while " << toString(mode)
                      << " session is active" << std::endl;
            return false;
        }

        std::weak_ptr<Impl> weak = weak_from_this();
        bool acquired = router.acquire(kCaptureOwner, [weak](const float* samples, size_t count) {
            if (auto self = weak.lock()) self->onAudio(samples, count);
        });
        if (!acquired) {
            return false;
        }

        mode = next;
        ++generation;
        recent.clear();
        interimInFlight = false;
        awaitingFinal = false;
        vad->reset();
        vad->start();

        std::cout << "[Transcriber] Session started (" << toString(mode) << ", "
                  << engine->name() << ", " << settings.locale << ")" << std::endl;
        if (onStarted) onStarted();
        return true;
    }

    void endSession() {
        if (mode == Mode::Idle) return;

        router.release(kCaptureOwner);
        vad->pause();
        interimTimer.cancel();
        initialSilenceTimer.cancel();
        recent.clear();
        awaitingFinal = false;

        Mode ended = mode;
        mode = Mode::Idle;
        ++generation;

        std::cout << "[Transcriber] Session stopped (" << toString(ended) << ")" << std::endl;
        if (onStopped) onStopped();
    }

    void onAudio(const float* samples, size_t count) {
        if (mode == Mode::Idle || awaitingFinal) return;

        recent.insert(recent.end(), samples, samples + count);
        size_t cap = static_cast<size_t>(vad->config().sample_rate) *
                     static_cast<size_t>(config.max_segment_ms) / 1000;
        if (recent.size() > cap) {
            recent.erase(recent.begin(), recent.end() - cap);
        }

        vad->process(samples, count);
    }

    void onSpeechStart() {
        initialSilenceTimer.cancel();
        if (config.interim_interval_ms > 0 && engine->supportsInterim()) {
            scheduleInterim();
        }
    }

    void scheduleInterim() {
        interimTimer.start(config.interim_interval_ms, [this]() {
            requestInterim();
            if (vad->isSpeaking()) scheduleInterim();
        });
    }

    void requestInterim() {
        if (interimInFlight || !vad->isSpeaking() || recent.empty()) return;

        interimInFlight = true;
        std::uint64_t gen = generation;
        std::uint64_t seg = segment;
        auto eng = engine;
        std::vector<float> audio = recent;
        std::weak_ptr<Impl> weak = weak_from_this();

        executor.submit<RecognitionResult>(loop,
            [eng, audio = std::move(audio)]() { return eng->recognize(audio, true); },
            [weak, gen, seg](RecognitionResult result) {
                auto self = weak.lock();
                if (!self) return;
                self->interimInFlight = false;
                if (self->generation != gen || self->segment != seg) return;
                if (!result.ok || result.text.empty()) return;

                std::string text = self->formatter.removeDisfluencies(result.text);
                if (!text.empty() && self->onInterim) self->onInterim(text);
            });
    }

    void onSpeechEnd(const std::vector<float>& audio) {
        interimTimer.cancel();
        ++segment;
        recent.clear();

        if (mode == Mode::Once) {
            // One utterance only; ignore the microphone until it is decoded
            awaitingFinal = true;
            vad->pause();
        }

        std::uint64_t gen = generation;
        auto eng = engine;
        std::weak_ptr<Impl> weak = weak_from_this();

        executor.submit<RecognitionResult>(loop,
            [eng, audio]() { return eng->recognize(audio, false); },
            [weak, gen](RecognitionResult result) {
                auto self = weak.lock();
                if (!self || self->generation != gen) return;
                self->deliverFinal(result);
            });
    }

    void deliverFinal(const RecognitionResult& result) {
        if (!result.ok) {
            report(result.error.empty() ? "decode failed" : result.error);
            if (mode == Mode::Once) finishOnce(TranscriptResult{});
            return;
        }

        std::string text = formatter.format(result.text);
        if (text.empty()) {
            if (mode == Mode::Once) finishOnce(TranscriptResult{});
            return;
        }

        TranscriptResult transcript;
        transcript.text = text;
        transcript.isFinal = true;
        transcript.confidence = result.confidence;
        transcript.lowConfidence = result.confidence < config.low_confidence_threshold;

        if (transcript.lowConfidence) {
            std::cout << "[Transcriber] Low confidence (" << result.confidence
                      << "): \"" << text << "\"" << std::endl;
        }

        if (mode == Mode::Once) {
            finishOnce(transcript);
        } else if (onFinal) {
            onFinal(transcript.text, transcript.confidence);
        }
    }

    void finishOnce(const TranscriptResult& result) {
        OnceCallback done = std::move(onceDone);
        onceDone = nullptr;
        endSession();
        if (done) done(result);
    }
};

StreamingTranscriber::StreamingTranscriber(core::EventLoop& loop,
                                           core::BackgroundExecutor& executor,
                                           audio::CaptureRouter& router,
                                           EngineFactory factory,
                                           std::unique_ptr<audio::VoiceActivityDetector> vad,
                                           TranscriberConfig config)
    : impl_(std::make_shared<Impl>(loop, executor, router, std::move(factory),
                                   std::move(vad), std::move(config)))
{
    impl_->wireVad();
}

StreamingTranscriber::~StreamingTranscriber() {
    destroy();
}

bool StreamingTranscriber::initialize(const std::string& key, const std::string& region,
                                      const std::string& locale) {
    if (impl_->destroyed) return false;

    impl_->settings.key = key;
    impl_->settings.region = region;
    impl_->settings.locale = locale;
    impl_->settings.phrases = impl_->config.phrases;

    std::shared_ptr<RecognitionEngine> engine = impl_->factory ? impl_->factory() : nullptr;
    if (!engine) {
        impl_->report("no recognition engine configured");
        return false;
    }
    if (!engine->open(impl_->settings)) {
        impl_->report(engine->name() + " failed to open: " + engine->lastError());
        return false;
    }

    impl_->engine = std::move(engine);
    std::cout << "[Transcriber] Initialized (" << impl_->engine->name()
              << ", locale=" << locale << ", end_silence="
              << impl_->config.end_silence_timeout_ms << "ms)" << std::endl;
    return true;
}

bool StreamingTranscriber::startStreaming() {
    return impl_->beginSession(Mode::Continuous);
}

void StreamingTranscriber::stopStreaming() {
    impl_->onceDone = nullptr;
    impl_->endSession();
}

bool StreamingTranscriber::recognizeOnce(OnceCallback done) {
    if (!impl_->beginSession(Mode::Once)) {
        return false;
    }
    impl_->onceDone = std::move(done);

    std::weak_ptr<Impl> weak = impl_;
    impl_->initialSilenceTimer.start(impl_->config.initial_silence_timeout_ms, [weak]() {
        auto self = weak.lock();
        if (!self || self->mode != Mode::Once || self->vad->isSpeaking()) return;
        std::cout << "[Transcriber] No speech within "
                  << self->config.initial_silence_timeout_ms << "ms" << std::endl;
        self->finishOnce(TranscriptResult{});
    });
    return true;
}

bool StreamingTranscriber::setLanguage(const std::string& locale) {
    if (impl_->destroyed) return false;
    if (locale == impl_->settings.locale && impl_->engine) return true;

    bool wasStreaming = impl_->mode == Mode::Continuous;
    stopStreaming();

    std::cout << "[Transcriber] Switching locale " << impl_->settings.locale
              << " -> " << locale << std::endl;

    auto previous = impl_->engine;
    RecognitionSettings previousSettings = impl_->settings;
    impl_->engine.reset();
    if (!initialize(impl_->settings.key, impl_->settings.region, locale)) {
        std::cerr << "[Transcriber] Keeping locale " << previousSettings.locale << std::endl;
        impl_->engine = previous;
        impl_->settings = previousSettings;
        if (wasStreaming && !startStreaming()) {
            impl_->report("could not resume streaming after a failed locale switch");
        }
        return false;
    }

    if (wasStreaming) {
        return startStreaming();
    }
    return true;
}

void StreamingTranscriber::destroy() {
    if (impl_->destroyed) return;

    impl_->onceDone = nullptr;
    impl_->endSession();
    impl_->destroyed = true;
    impl_->engine.reset();
    impl_->vad->destroy();
}

bool StreamingTranscriber::isInitialized() const {
    return impl_->engine && impl_->engine->isReady();
}

bool StreamingTranscriber::isStreaming() const {
    return impl_->mode == Mode::Continuous;
}

bool StreamingTranscriber::isActive() const {
    return impl_->mode != Mode::Idle;
}

std::string StreamingTranscriber::locale() const {
    return impl_->settings.locale;
}

std::string StreamingTranscriber::engineName() const {
    return impl_->engine ? impl_->engine->name() : "none";
}

void StreamingTranscriber::setOnInterimTranscript(InterimCallback callback) {
    impl_->onInterim = std::move(callback);
}

void StreamingTranscriber::setOnFinalTranscript(FinalCallback callback) {
    impl_->onFinal = std::move(callback);
}

void StreamingTranscriber::setOnError(ErrorCallback callback) {
    impl_->onError = std::move(callback);
}

void StreamingTranscriber::setOnSessionStarted(SessionCallback callback) {
    impl_->onStarted = std::move(callback);
}

void StreamingTranscriber::setOnSessionStopped(SessionCallback callback) {
    impl_->onStopped = std::move(callback);
}

} // namespace hpv::stt
