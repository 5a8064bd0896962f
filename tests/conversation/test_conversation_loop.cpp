/**
 * test_conversation_loop.cpp - Whole turns through the real components
 *
 * Microphone frames go through the CaptureRouter to the transcriber and
 * the barge-in VAD; speech comes out of a FakeOutput drained in 10ms
 * steps. Only the classifier, recognizer, voice and backend are scripted.
 */

#include "hpv/conversation/ConversationLoop.hpp"
#include "../support/Fakes.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace hpv;
using namespace hpv::conversation;
using hpv::test::FakeEngine;
using hpv::test::FakeGenerator;
using hpv::test::FakeOutput;
using hpv::test::FakeSynth;
using hpv::test::LevelClassifier;
using hpv::test::recognized;

struct Rig {
    ConversationConfig config;
    std::vector<std::string> utterances;
    std::vector<std::string> replies;
    int ended = 0;

    core::EventLoop loop{core::EventLoop::ClockMode::Manual};
    core::BackgroundExecutor executor{"test", core::BackgroundExecutor::Mode::Inline};
    core::SessionContext session;
    audio::CaptureRouter router{loop};
    FakeOutput output;
    audio::PlaybackController playback{loop, output};

    std::shared_ptr<float> level = std::make_shared<float>(0.0f);
    std::shared_ptr<FakeEngine::State> engine = std::make_shared<FakeEngine::State>();
    std::shared_ptr<FakeSynth> voice;

    std::unique_ptr<stt::StreamingTranscriber> transcriber;
    std::unique_ptr<wake::AttentionDetector> attention;
    std::unique_ptr<tts::Speaker> speaker;
    std::unique_ptr<FakeGenerator> generator;
    std::unique_ptr<InterruptManager> interrupts;
    std::unique_ptr<audio::VoiceActivityDetector> bargeIn;
    std::unique_ptr<ConversationLoop> conversation;

    // Every line the voice speaks lasts one second
    explicit Rig(ConversationConfig c = {}, bool voiceWorks = true)
        : config(std::move(c))
        , voice(std::make_shared<FakeSynth>("voice", voiceWorks, 16000)) {
        stt::TranscriberConfig tc;
        tc.end_silence_timeout_ms = 300;
        tc.interim_interval_ms = 0;

        auto state = engine;
        transcriber = std::make_unique<stt::StreamingTranscriber>(
            loop, executor, router,
            [state]() { return std::make_unique<FakeEngine>(state); },
            std::make_unique<audio::VoiceActivityDetector>(
                audio::VadConfig{}, std::make_unique<LevelClassifier>(level)),
            tc);
        bool ok = transcriber->initialize("", "", "en-US");
        assert(ok);

        attention = std::make_unique<wake::AttentionDetector>(
            loop, router, *transcriber, nullptr, session);
        ok = attention->initialize();
        assert(ok);

        speaker = std::make_unique<tts::Speaker>(loop, executor, playback, voice);
        generator = std::make_unique<FakeGenerator>(loop);
        interrupts = std::make_unique<InterruptManager>(loop, session);

        bargeIn = std::make_unique<audio::VoiceActivityDetector>(
            audio::VadConfig{}, std::make_unique<LevelClassifier>(level));
        router.addMonitor([this](const float* samples, size_t count) {
            bargeIn->process(samples, count);
        });

        conversation = std::make_unique<ConversationLoop>(
            loop, *attention, *transcriber, *speaker, *generator, *interrupts, *bargeIn,
            session, config);
        conversation->setOnUserUtterance([this](const std::string& t) { utterances.push_back(t); });
        conversation->setOnAssistantReply([this](const std::string& t) { replies.push_back(t); });
        conversation->setOnEnded([this]() { ++ended; });
    }

    // Run posted work until nothing is left, including work it posts
    void settle() {
        for (int i = 0; i < 20 && loop.runPending() > 0; ++i) {
        }
    }

    // Device consumes audio while the clock runs
    void play(int ms) {
        for (int t = 0; t < ms; t += 10) {
            output.drain(160);
            loop.advance(10);
        }
    }

    void audio(float p, int frames) {
        *level = p;
        std::vector<float> frame(480, 0.1f);
        for (int i = 0; i < frames; ++i) {
            router.deliver(frame.data(), frame.size());
        }
    }

    // 450ms of speech, then 900ms of quiet
    void say(const std::string& text) {
        engine->finals.push_back(recognized(text));
        audio(0.9f, 15);
        audio(0.0f, 30);
        settle();
    }

    // Wake phrase plus question, then the capture quiet period
    void ask(const std::string& question) {
        say("Hey pal " + question);
        loop.advance(800);
    }

    // Start and let the greeting finish
    void begin() {
        bool ok = conversation->start();
        assert(ok);
        settle();
        play(1500);
        assert(conversation->phase() == LoopPhase::Listening);
    }

    size_t spoken(const std::string& line) const {
        return static_cast<size_t>(std::count(voice->texts.begin(), voice->texts.end(), line));
    }
};

ConversationConfig directMode() {
    ConversationConfig config;
    config.listen_mode = ListenMode::Direct;
    config.speak_greeting = false;
    return config;
}

void test_end_phrases() {
    std::vector<std::string> phrases = ConversationConfig{}.end_phrases;
    assert(ConversationLoop::isEndPhrase("Okay bye.", phrases));
    assert(ConversationLoop::isEndPhrase("That's all, thanks", phrases));
    assert(ConversationLoop::isEndPhrase("Please END conversation!", phrases));
    assert(!ConversationLoop::isEndPhrase("Thanks for explaining that", phrases));
    assert(!ConversationLoop::isEndPhrase("What is a byte?", phrases));
    assert(!ConversationLoop::isEndPhrase("Tell me about the endocrine system", phrases));

    assert(parseListenMode("direct") == ListenMode::Direct);
    assert(!parseListenMode("push-to-talk"));

    std::cout << "[PASS] test_end_phrases" << std::endl;
}

void test_wake_mode_turn() {
    Rig rig;
    rig.begin();
    assert(rig.voice->texts.size() == 1);
    assert(rig.voice->texts[0] == rig.config.greeting);
    assert(rig.conversation->turnCount() == 0);

    rig.ask("what is photosynthesis");
    assert(rig.conversation->phase() == LoopPhase::Thinking);
    assert(rig.generator->questions.size() == 1);
    assert(rig.generator->questions[0] == "What is photosynthesis.");
    assert(rig.generator->lastHistory.empty());
    assert(rig.utterances.size() == 1);

    rig.generator->answer("Plants turn light into food.");
    rig.settle();
    assert(rig.conversation->phase() == LoopPhase::Speaking);
    assert(rig.replies.size() == 1);
    assert(rig.interrupts->state() == TurnState::AiSpeaking);

    rig.play(1500);
    assert(rig.conversation->phase() == LoopPhase::Listening);
    assert(rig.conversation->turnCount() == 1);
    assert(rig.conversation->history().size() == 1);

    // The next question carries the history
    rig.ask("why is it green");
    assert(rig.generator->questions.size() == 2);
    assert(rig.generator->lastHistory.size() == 1);
    assert(rig.generator->lastHistory[0].answer == "Plants turn light into food.");

    auto stats = rig.session.snapshot();
    assert(stats.user_turns == 2);
    assert(stats.wake_detections == 2);

    // Already running
    assert(!rig.conversation->start());

    std::cout << "[PASS] test_wake_mode_turn" << std::endl;
}

void test_goodbye_ends_conversation() {
    Rig rig;
    rig.begin();

    rig.ask("okay bye");
    assert(rig.conversation->phase() == LoopPhase::Ending);
    assert(rig.generator->questions.empty());
    assert(rig.spoken(rig.config.closing_line) == 1);

    rig.play(1500);
    assert(!rig.conversation->isActive());
    assert(rig.conversation->phase() == LoopPhase::Inactive);
    assert(rig.ended == 1);
    assert(!rig.transcriber->isActive());

    // Nothing listens any more
    rig.loop.advance(2000);
    rig.ask("what is a noun");
    rig.play(2000);
    assert(rig.generator->questions.empty());
    assert(rig.spoken(rig.config.closing_line) == 1);
    assert(rig.voice->texts.size() == 2);
    assert(rig.ended == 1);

    std::cout << "[PASS] test_goodbye_ends_conversation" << std::endl;
}

void test_question_while_thinking_waits() {
    Rig rig;
    rig.generator->autoAnswer = false;
    rig.begin();

    rig.ask("what is a noun");
    assert(rig.conversation->phase() == LoopPhase::Thinking);

    // Past the wake debounce, still waiting for the backend
    rig.loop.advance(2000);
    rig.ask("what is a verb");
    assert(rig.generator->questions.size() == 1);

    rig.generator->answer("A naming word.");
    rig.settle();
    rig.play(1500);

    assert(rig.generator->questions.size() == 2);
    assert(rig.generator->questions[1] == "What is a verb.");
    assert(rig.conversation->phase() == LoopPhase::Thinking);

    std::cout << "[PASS] test_question_while_thinking_waits" << std::endl;
}

void test_barge_in() {
    Rig rig;
    rig.begin();
    rig.ask("what is gravity");
    rig.generator->answer("Gravity pulls masses together.");
    rig.settle();
    assert(rig.conversation->phase() == LoopPhase::Speaking);

    // Too soon after the reply started: treated as our own audio
    rig.audio(0.9f, 15);
    rig.audio(0.0f, 30);
    rig.settle();
    assert(rig.conversation->phase() == LoopPhase::Speaking);
    assert(rig.session.snapshot().interrupts == 0);

    rig.play(500);
    assert(rig.playback.isPlaying());

    rig.audio(0.9f, 15);
    rig.settle();
    assert(rig.conversation->phase() == LoopPhase::Interrupted);
    assert(rig.interrupts->isFading());
    assert(rig.session.snapshot().interrupts == 1);
    assert(rig.conversation->turnCount() == 1);

    rig.audio(0.0f, 30);
    rig.play(400);
    assert(!rig.playback.isPlaying());
    assert(rig.conversation->phase() == LoopPhase::Listening);

    // The interrupted reply still counts as an exchange
    assert(rig.conversation->history().size() == 1);

    std::cout << "[PASS] test_barge_in" << std::endl;
}

void test_pause_and_resume() {
    Rig rig;
    rig.begin();

    rig.conversation->pause();
    assert(rig.conversation->isPaused());
    assert(rig.conversation->phase() == LoopPhase::Paused);
    assert(!rig.attention->isActive());

    rig.ask("what is a noun");
    rig.engine->finals.clear();
    assert(rig.generator->questions.empty());

    rig.conversation->resume();
    rig.loop.advance(499);
    assert(rig.conversation->phase() == LoopPhase::Paused);
    rig.loop.advance(1);
    assert(rig.conversation->phase() == LoopPhase::Listening);
    assert(!rig.conversation->isPaused());
    assert(rig.attention->isActive());

    rig.loop.advance(2000);
    rig.ask("what is a noun");
    assert(rig.generator->questions.size() == 1);

    std::cout << "[PASS] test_pause_and_resume" << std::endl;
}

void test_pause_while_speaking() {
    Rig rig;
    bool ok = rig.conversation->start();
    assert(ok);
    rig.settle();
    assert(rig.conversation->phase() == LoopPhase::Speaking);
    assert(rig.attention->isAISpeaking());
    assert(rig.playback.isPlaying());

    rig.conversation->pause();
    assert(rig.conversation->phase() == LoopPhase::Paused);
    assert(!rig.attention->isAISpeaking());
    assert(!rig.playback.isPlaying());
    assert(rig.output.queued.empty());

    // The cut greeting neither plays on nor finishes the turn
    size_t played = rig.output.played.size();
    rig.play(1500);
    assert(rig.output.played.size() == played);
    assert(rig.conversation->phase() == LoopPhase::Paused);

    rig.conversation->resume();
    rig.loop.advance(500);
    assert(rig.conversation->phase() == LoopPhase::Listening);

    rig.ask("what is a noun");
    assert(rig.generator->questions.size() == 1);

    std::cout << "[PASS] test_pause_while_speaking" << std::endl;
}

void test_inactivity_pauses() {
    ConversationConfig config;
    config.inactivity_timeout_ms = 10000;
    Rig rig(config);
    rig.begin();

    rig.loop.advance(9000);
    assert(!rig.conversation->isPaused());
    rig.loop.advance(1000);
    assert(rig.conversation->isPaused());
    assert(rig.conversation->isActive());
    assert(rig.ended == 0);

    std::cout << "[PASS] test_inactivity_pauses" << std::endl;
}

void test_end_request() {
    {
        Rig rig;
        rig.begin();
        rig.conversation->end();
        assert(rig.conversation->phase() == LoopPhase::Ending);
        assert(rig.spoken(rig.config.end_request_line) == 1);
        rig.settle();
        rig.play(1500);
        assert(!rig.conversation->isActive());
        assert(rig.ended == 1);
    }
    {
        Rig rig;
        rig.begin();
        rig.conversation->end(false);
        assert(!rig.conversation->isActive());
        assert(rig.ended == 1);
        assert(rig.voice->texts.size() == 1);
        rig.conversation->end(false);
        assert(rig.ended == 1);
    }

    std::cout << "[PASS] test_end_request" << std::endl;
}

void test_direct_mode_turn() {
    Rig rig(directMode());
    bool started = rig.conversation->start();
    assert(started);
    rig.settle();
    assert(rig.conversation->phase() == LoopPhase::Listening);
    assert(rig.transcriber->isActive());
    assert(!rig.attention->isActive());

    rig.say("what is an atom");
    assert(rig.generator->questions.size() == 1);
    assert(rig.generator->questions[0] == "What is an atom?");

    rig.generator->answer("The smallest unit of matter.");
    rig.settle();
    rig.play(1500);
    assert(rig.conversation->turnCount() == 1);
    assert(rig.conversation->phase() == LoopPhase::Listening);
    assert(rig.transcriber->isActive());

    std::cout << "[PASS] test_direct_mode_turn" << std::endl;
}

void test_empty_utterance_not_counted() {
    Rig rig(directMode());
    rig.conversation->start();
    rig.settle();

    // Initial silence ends the recognition with nothing heard
    rig.loop.advance(5000);
    assert(rig.generator->questions.empty());
    assert(rig.utterances.empty());
    assert(rig.conversation->turnCount() == 0);
    assert(rig.session.snapshot().user_turns == 0);

    rig.loop.advance(200);
    assert(rig.conversation->phase() == LoopPhase::Listening);
    assert(rig.transcriber->isActive());
    assert(rig.voice->texts.empty());

    std::cout << "[PASS] test_empty_utterance_not_counted" << std::endl;
}

void test_backend_failure_uses_fallback() {
    Rig rig(directMode());
    rig.conversation->start();
    rig.settle();

    rig.say("what is an atom");
    rig.generator->fail();
    rig.settle();
    assert(rig.spoken(rig.config.fallback_line) == 1);
    assert(rig.replies.size() == 1 && rig.replies[0] == rig.config.fallback_line);

    rig.play(1500);
    assert(rig.conversation->isActive());
    assert(rig.conversation->phase() == LoopPhase::Listening);
    assert(rig.conversation->history().empty());

    std::cout << "[PASS] test_backend_failure_uses_fallback" << std::endl;
}

void test_listen_timeout_apologises() {
    ConversationConfig config = directMode();
    config.listen_timeout_ms = 3000;
    Rig rig(config);
    rig.conversation->start();
    rig.settle();

    rig.loop.advance(3000);
    assert(!rig.transcriber->isActive());
    assert(rig.spoken(rig.config.apology_line) == 1);
    rig.settle();
    rig.play(1500);
    assert(rig.conversation->phase() == LoopPhase::Listening);
    assert(rig.conversation->turnCount() == 0);

    std::cout << "[PASS] test_listen_timeout_apologises" << std::endl;
}

void test_speech_failure_continues() {
    Rig rig(directMode(), false);
    rig.conversation->start();
    rig.settle();
    rig.say("what is an atom");
    rig.generator->answer("The smallest unit of matter.");
    rig.settle();
    rig.loop.advance(200);

    assert(rig.conversation->isActive());
    assert(rig.conversation->phase() == LoopPhase::Listening);
    assert(rig.conversation->turnCount() == 1);

    std::cout << "[PASS] test_speech_failure_continues" << std::endl;
}

int main() {
    std::cout << "=== ConversationLoop Tests ===" << std::endl;

    test_end_phrases();
    test_wake_mode_turn();
    test_goodbye_ends_conversation();
    test_question_while_thinking_waits();
    test_barge_in();
    test_pause_and_resume();
    test_pause_while_speaking();
    test_inactivity_pauses();
    test_end_request();
    test_direct_mode_turn();
    test_empty_utterance_not_counted();
    test_backend_failure_uses_fallback();
    test_listen_timeout_apologises();
    test_speech_failure_continues();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
