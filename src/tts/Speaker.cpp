/**
 * Speaker.cpp - Synthesis with fallback, then playback
 */

#include "hpv/tts/Speaker.hpp"
#include "hpv/audio/WavCodec.hpp"

#include <iostream>

namespace hpv::tts {

namespace {

std::string preview(const std::string& text) {
    return text.size() > 40 ? text.substr(0, 40) + "..." : text;
}

} // namespace

struct Speaker::Impl : std::enable_shared_from_this<Speaker::Impl> {
    Impl(core::EventLoop& l, core::BackgroundExecutor& e, audio::PlaybackController& p,
         std::shared_ptr<SpeechSynthesizer> a, std::shared_ptr<SpeechSynthesizer> b)
        : loop(l), executor(e), playback(p), primary(std::move(a)), secondary(std::move(b)) {}

    core::EventLoop& loop;
    core::BackgroundExecutor& executor;
    audio::PlaybackController& playback;
    std::shared_ptr<SpeechSynthesizer> primary;
    std::shared_ptr<SpeechSynthesizer> secondary;

    std::uint64_t request = 0;
    bool synthesizing = false;
    ErrorCallback onError;

    void report(const std::string& message) {
        std::cerr << "[Speaker] PlaybackError: " << message << std::endl;
        if (onError) {
            onError(core::Error{core::ErrorKind::Playback, "Speaker", message});
        }
    }
};

Speaker::Speaker(core::EventLoop& loop,
                 core::BackgroundExecutor& executor,
                 audio::PlaybackController& playback,
                 std::shared_ptr<SpeechSynthesizer> primary,
                 std::shared_ptr<SpeechSynthesizer> secondary)
    : impl_(std::make_shared<Impl>(loop, executor, playback, std::move(primary), std::move(secondary)))
{
}

Speaker::~Speaker() {
    cancel();
}

void Speaker::speak(const std::string& text, StartedCallback started, DoneCallback done) {
    std::uint64_t id = ++impl_->request;
    impl_->synthesizing = true;

    auto primary = impl_->primary;
    auto secondary = impl_->secondary;
    int outputRate = impl_->playback.sampleRate();
    std::weak_ptr<Impl> weak = impl_;

    // Failures are collected on the worker and reported on the loop
    struct Outcome {
        SynthesisResult result;
        std::string source;
        std::vector<std::string> failures;
    };

    impl_->executor.submit<Outcome>(impl_->loop,
        [text, primary, secondary, outputRate]() {
            Outcome outcome;
            for (const auto& engine : {primary, secondary}) {
                if (!engine) continue;
                SynthesisResult result = engine->synthesize(text);
                if (result.ok && !result.samples.empty()) {
                    result.samples = audio::resample(result.samples, result.sample_rate, outputRate);
                    result.sample_rate = outputRate;
                    outcome.result = std::move(result);
                    outcome.source = engine->name();
                    return outcome;
                }
                outcome.failures.push_back(engine->name() + ": " + result.error);
            }
            return outcome;
        },
        [weak, id, text, started = std::move(started), done = std::move(done)](Outcome outcome) {
            auto self = weak.lock();
            if (!self || self->request != id) return;
            self->synthesizing = false;

            for (const auto& failure : outcome.failures) {
                self->report(failure);
            }

            if (!outcome.result.ok) {
                std::cerr << "[Speaker] No synthesis path for \"" << preview(text)
                          << "\", skipping" << std::endl;
                if (done) done(SpeakOutcome::Failed);
                return;
            }

            auto handle = self->playback.play(
                std::move(outcome.result.samples),
                outcome.source + ": " + preview(text),
                [done]() { if (done) done(SpeakOutcome::Completed); });
            if (started) started(handle);
        });
}

void Speaker::cancel() {
    ++impl_->request;
    impl_->synthesizing = false;
}

bool Speaker::isBusy() const {
    return impl_->synthesizing;
}

void Speaker::setOnError(ErrorCallback callback) {
    impl_->onError = std::move(callback);
}

} // namespace hpv::tts
