/**
 * Fakes.hpp - Scriptable stand-ins for devices, engines and services
 *
 * Shared by the unit tests; everything runs on a manual-clock EventLoop
 * with an inline BackgroundExecutor so results are deterministic.
 */

#pragma once

#include "hpv/audio/AudioOutput.hpp"
#include "hpv/audio/SpeechClassifier.hpp"
#include "hpv/audio/VoiceActivityDetector.hpp"
#include "hpv/core/EventLoop.hpp"
#include "hpv/llm/ResponseGenerator.hpp"
#include "hpv/stt/RecognitionEngine.hpp"
#include "hpv/tts/SpeechSynthesizer.hpp"
#include "hpv/wake/KeywordSpotter.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace hpv::test {

/**
 * Returns whatever *level says for every frame.
 */
class LevelClassifier : public audio::SpeechClassifier {
public:
    explicit LevelClassifier(std::shared_ptr<float> level) : level_(std::move(level)) {}
    float classify(const float*, size_t) override { return *level_; }

private:
    std::shared_ptr<float> level_;
};

struct VadRig {
    std::shared_ptr<float> level = std::make_shared<float>(0.0f);
    std::unique_ptr<audio::VoiceActivityDetector> vad;

    explicit VadRig(audio::VadConfig config = {}) {
        vad = std::make_unique<audio::VoiceActivityDetector>(
            config, std::make_unique<LevelClassifier>(level));
    }

    // Feed `frames` frames classified at probability p
    void feed(float p, int frames) {
        *level = p;
        std::vector<float> frame(static_cast<size_t>(vad->config().frame_samples), 0.1f);
        for (int i = 0; i < frames; ++i) {
            vad->process(frame.data(), frame.size());
        }
    }

    void feedMs(float p, int ms) {
        const auto& c = vad->config();
        feed(p, ms / (c.frame_samples * 1000 / c.sample_rate));
    }
};

class FakeOutput : public audio::AudioOutput {
public:
    explicit FakeOutput(int rate = 16000) : rate_(rate) {}

    size_t queue(const float* samples, size_t count) override {
        queued.insert(queued.end(), samples, samples + count);
        played.insert(played.end(), samples, samples + count);
        return count;
    }
    void clear() override {
        queued.clear();
        ++clears;
    }
    size_t queuedSamples() const override { return queued.size(); }
    int sampleRate() const override { return rate_; }

    // Device side: consume n samples
    void drain(size_t n) {
        n = std::min(n, queued.size());
        queued.erase(queued.begin(), queued.begin() + static_cast<std::ptrdiff_t>(n));
    }

    std::deque<float> queued;
    std::vector<float> played;
    int clears = 0;

private:
    int rate_;
};

/**
 * Finals are served from `finals` in order, then `fallback`.
 */
class FakeEngine : public stt::RecognitionEngine {
public:
    struct State {
        bool openOk = true;
        std::deque<stt::RecognitionResult> finals;
        stt::RecognitionResult fallback{true, "", 0.95f, ""};
        stt::RecognitionResult interim{true, "partial", 0.5f, ""};
        int finalCalls = 0;
        int interimCalls = 0;
        int opened = 0;
        stt::RecognitionSettings settings;
    };

    explicit FakeEngine(std::shared_ptr<State> state) : state_(std::move(state)) {}

    bool open(const stt::RecognitionSettings& settings) override {
        ++state_->opened;
        state_->settings = settings;
        ready_ = state_->openOk;
        return ready_;
    }
    bool isReady() const override { return ready_; }

    stt::RecognitionResult recognize(const std::vector<float>&, bool interim) override {
        if (interim) {
            ++state_->interimCalls;
            return state_->interim;
        }
        ++state_->finalCalls;
        if (state_->finals.empty()) return state_->fallback;
        auto result = state_->finals.front();
        state_->finals.pop_front();
        return result;
    }

    std::string name() const override { return "fake"; }
    std::string lastError() const override { return ready_ ? "" : "open refused"; }

private:
    std::shared_ptr<State> state_;
    bool ready_ = false;
};

inline stt::RecognitionResult recognized(const std::string& text, float confidence = 0.95f) {
    return stt::RecognitionResult{true, text, confidence, ""};
}

class FakeSynth : public tts::SpeechSynthesizer {
public:
    FakeSynth(std::string name, bool ok, size_t samples = 1600, int rate = 16000)
        : name_(std::move(name)), ok_(ok), samples_(samples), rate_(rate) {}

    tts::SynthesisResult synthesize(const std::string& text) override {
        texts.push_back(text);
        if (!ok_) return tts::SynthesisResult{false, {}, 0, name_ + " unavailable"};
        return tts::SynthesisResult{true, std::vector<float>(samples_, 0.5f), rate_, ""};
    }
    bool isReady() const override { return true; }
    std::string name() const override { return name_; }

    std::vector<std::string> texts;

private:
    std::string name_;
    bool ok_;
    size_t samples_;
    int rate_;
};

/**
 * Holds each ask() until answer()/fail() is called, like a slow backend.
 */
class FakeGenerator : public llm::ResponseGenerator {
public:
    explicit FakeGenerator(core::EventLoop& loop) : loop_(loop) {}

    void ask(const std::string& question, const std::vector<llm::Exchange>& history,
             Callback done) override {
        questions.push_back(question);
        lastHistory = history;
        pending_.push_back(std::move(done));
        if (autoAnswer) answer("Answer " + std::to_string(questions.size()));
    }
    std::string name() const override { return "fake"; }

    void answer(const std::string& text) { resolve(llm::ResponseResult{true, text, ""}); }
    void fail() { resolve(llm::ResponseResult{false, "", "backend down"}); }
    bool hasPending() const { return !pending_.empty(); }

    bool autoAnswer = false;
    std::vector<std::string> questions;
    std::vector<llm::Exchange> lastHistory;

private:
    void resolve(llm::ResponseResult result) {
        if (pending_.empty()) return;
        auto done = std::move(pending_.front());
        pending_.pop_front();
        loop_.post([done, result]() { done(result); });
    }

    core::EventLoop& loop_;
    std::deque<Callback> pending_;
};

class FakeSpotter : public wake::KeywordSpotter {
public:
    struct State {
        bool loadOk = true;
        bool fireNext = false;   // Next process() reports keyword 0
        int processed = 0;
    };

    explicit FakeSpotter(std::shared_ptr<State> state) : state_(std::move(state)) {}

    bool load(const wake::KeywordModel&) override {
        ready_ = state_->loadOk;
        return ready_;
    }
    bool isReady() const override { return ready_; }
    int process(const float*, size_t) override {
        ++state_->processed;
        if (state_->fireNext) {
            state_->fireNext = false;
            return 0;
        }
        return -1;
    }
    void reset() override {}
    int frameLength() const override { return 512; }
    std::string name() const override { return "fake-spotter"; }
    core::Error lastError() const override {
        return core::Error{core::ErrorKind::ModelLoad, "FakeSpotter", ready_ ? "" : "model missing"};
    }

private:
    std::shared_ptr<State> state_;
    bool ready_ = false;
};

} // namespace hpv::test
