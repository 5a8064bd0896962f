/**
 * ConversationLoop.cpp - Turn sequencing, pause/resume and barge-in handling
 */

#include "hpv/conversation/ConversationLoop.hpp"
#include "hpv/wake/WakeMatcher.hpp"

#include <deque>
#include <iostream>

namespace hpv::conversation {

const char* toString(LoopPhase phase) {
    switch (phase) {
        case LoopPhase::Inactive:    return "inactive";
        case LoopPhase::Speaking:    return "speaking";
        case LoopPhase::Listening:   return "listening";
        case LoopPhase::Thinking:    return "thinking";
        case LoopPhase::Interrupted: return "interrupted";
        case LoopPhase::Paused:      return "paused";
        case LoopPhase::Ending:      return "ending";
    }
    return "unknown";
}

const char* toString(ListenMode mode) {
    return mode == ListenMode::Wake ? "wake" : "direct";
}

std::optional<ListenMode> parseListenMode(const std::string& name) {
    if (name == "wake") return ListenMode::Wake;
    if (name == "direct") return ListenMode::Direct;
    return std::nullopt;
}

bool ConversationLoop::isEndPhrase(const std::string& text, const std::vector<std::string>& phrases) {
    std::string padded = " " + wake::WakeMatcher::normalize(text) + " ";
    for (const auto& phrase : phrases) {
        std::string needle = wake::WakeMatcher::normalize(phrase);
        if (needle.empty()) continue;
        if (padded.find(" " + needle + " ") != std::string::npos) {
            return true;
        }
    }
    return false;
}

namespace {

enum class MessageKind {
    Utterance,
    ListenTimeout,
    Reply,
    SpeechDone,
    Interrupted,
    FadeComplete,
    InactivityTimeout,
    Fatal
};

struct Message {
    MessageKind kind;
    std::uint64_t turn = 0;
    std::string text;
    bool ok = true;
    core::Error error;
};

// What follows the line being spoken
enum class AfterSpeech {
    Listen,
    CountTurnThenListen,
    Terminate
};

} // namespace

struct ConversationLoop::Impl : std::enable_shared_from_this<ConversationLoop::Impl> {
    Impl(core::EventLoop& l, wake::AttentionDetector& a, stt::StreamingTranscriber& t,
         tts::Speaker& s, llm::ResponseGenerator& g, InterruptManager& i,
         audio::VoiceActivityDetector& b, core::SessionContext& sc, ConversationConfig c)
        : loop(l), attention(a), transcriber(t), speaker(s), generator(g)
        , interrupts(i), bargeIn(b), session(sc), config(std::move(c))
        , history(config.history_window), listenRetry(config.listen_retry)
        , inactivityTimer(l), listenTimer(l), nextTurnTimer(l) {}

    core::EventLoop& loop;
    wake::AttentionDetector& attention;
    stt::StreamingTranscriber& transcriber;
    tts::Speaker& speaker;
    llm::ResponseGenerator& generator;
    InterruptManager& interrupts;
    audio::VoiceActivityDetector& bargeIn;
    core::SessionContext& session;
    ConversationConfig config;

    llm::ConversationHistory history;
    core::RetryState listenRetry;

    bool active = false;
    bool paused = false;
    LoopPhase phase = LoopPhase::Inactive;
    int turns = 0;
    std::uint64_t turn = 0;            // Bumped whenever earlier callbacks must be ignored
    AfterSpeech afterSpeech = AfterSpeech::Listen;
    core::Millis speakingSince = -1;
    std::string question;
    std::optional<std::string> pending;   // Wake-mode utterance that arrived early

    std::deque<Message> queue;
    bool drainPosted = false;

    core::ScopedTimer inactivityTimer;
    core::ScopedTimer listenTimer;
    core::ScopedTimer nextTurnTimer;

    TextCallback onUserUtterance;
    TextCallback onAssistantReply;
    PhaseCallback onPhaseChange;
    EndedCallback onEnded;
    ErrorCallback onError;

    // ------------------------------------------------------------------
    // Message queue
    // ------------------------------------------------------------------

    void enqueue(Message message) {
        queue.push_back(std::move(message));
        if (drainPosted) return;
        drainPosted = true;

        std::weak_ptr<Impl> weak = weak_from_this();
        loop.post([weak]() {
            if (auto self = weak.lock()) self->drain();
        });
    }

    void drain() {
        drainPosted = false;
        while (!queue.empty()) {
            Message message = std::move(queue.front());
            queue.pop_front();
            handle(message);
        }
    }

    void handle(const Message& m) {
        // Fatal errors end the conversation whatever turn they belong to
        if (m.kind == MessageKind::Fatal) {
            if (!active) return;
            std::cerr << "[ConversationLoop] " << m.error.describe()
                      << " (phase=" << toString(phase) << "), ending conversation" << std::endl;
            if (onError) onError(m.error);
            terminate();
            return;
        }

        if (!active || m.turn != turn) {
            return;
        }

        switch (m.kind) {
            case MessageKind::Utterance:         handleUtterance(m.text); break;
            case MessageKind::ListenTimeout:     handleListenTimeout(); break;
            case MessageKind::Reply:             handleReply(m.ok, m.text); break;
            case MessageKind::SpeechDone:        handleSpeechDone(m.ok); break;
            case MessageKind::Interrupted:       handleInterrupted(); break;
            case MessageKind::FadeComplete:      handleFadeComplete(); break;
            case MessageKind::InactivityTimeout: handleInactivity(); break;
            case MessageKind::Fatal:             break;
        }
    }

    Message message(MessageKind kind) const {
        Message m;
        m.kind = kind;
        m.turn = turn;
        return m;
    }

    // ------------------------------------------------------------------
    // Phases
    // ------------------------------------------------------------------

    void setPhase(LoopPhase next) {
        if (phase == next) return;
        std::cout << "[ConversationLoop] " << toString(phase) << " -> " << toString(next)
                  << " (turns=" << turns << ")" << std::endl;
        phase = next;
        if (onPhaseChange) onPhaseChange(phase);
    }

    void say(const std::string& text, AfterSpeech after) {
        ++turn;
        afterSpeech = after;
        speakingSince = -1;
        setPhase(after == AfterSpeech::Terminate ? LoopPhase::Ending : LoopPhase::Speaking);
        attention.setAISpeech(text);

        std::weak_ptr<Impl> weak = weak_from_this();
        std::uint64_t expected = turn;
        speaker.speak(text,
            [weak, expected](std::shared_ptr<audio::PlaybackHandle> handle) {
                auto self = weak.lock();
                if (!self || !self->active || self->turn != expected) return;
                self->speakingSince = self->loop.now();
                self->interrupts.setAISpeaking(std::move(handle));
            },
            [weak, expected](tts::SpeakOutcome outcome) {
                auto self = weak.lock();
                if (!self) return;
                Message m;
                m.kind = MessageKind::SpeechDone;
                m.turn = expected;
                m.ok = outcome == tts::SpeakOutcome::Completed;
                self->enqueue(std::move(m));
            });
    }

    void scheduleNextTurn(int delay_ms) {
        std::weak_ptr<Impl> weak = weak_from_this();
        nextTurnTimer.start(delay_ms, [weak]() {
            if (auto self = weak.lock()) self->beginListening();
        });
    }

    void beginListening() {
        if (!active || paused) return;

        ++turn;
        setPhase(LoopPhase::Listening);
        interrupts.setIdle();

        std::weak_ptr<Impl> weak = weak_from_this();
        std::uint64_t expected = turn;
        inactivityTimer.start(config.inactivity_timeout_ms, [weak, expected]() {
            auto self = weak.lock();
            if (!self) return;
            Message m;
            m.kind = MessageKind::InactivityTimeout;
            m.turn = expected;
            self->enqueue(std::move(m));
        });

        if (config.listen_mode == ListenMode::Wake) {
            if (!attention.isActive() && !attention.start()) {
                fatal(core::ErrorKind::Acquisition, "attention detector could not restart");
                return;
            }
            if (pending) {
                Message m = message(MessageKind::Utterance);
                m.text = std::move(*pending);
                pending.reset();
                enqueue(std::move(m));
            }
            return;
        }

        listenTimer.start(config.listen_timeout_ms, [weak, expected]() {
            auto self = weak.lock();
            if (!self) return;
            Message m;
            m.kind = MessageKind::ListenTimeout;
            m.turn = expected;
            self->enqueue(std::move(m));
        });

        bool started = transcriber.recognizeOnce([weak, expected](const stt::TranscriptResult& result) {
            auto self = weak.lock();
            if (!self) return;
            Message m;
            m.kind = MessageKind::Utterance;
            m.turn = expected;
            m.text = result.text;
            self->enqueue(std::move(m));
        });

        if (started) {
            listenRetry.reset();
            return;
        }

        listenTimer.cancel();
        inactivityTimer.cancel();
        session.recordRecognitionError();
        if (!listenRetry.next()) {
            fatal(core::ErrorKind::Recognition, "transcriber unavailable, giving up");
            return;
        }
        std::cerr << "[ConversationLoop] RecognitionError: could not start listening (attempt "
                  << listenRetry.attempt() << "), retrying in "
                  << listenRetry.currentDelay() << "ms" << std::endl;
        scheduleNextTurn(static_cast<int>(listenRetry.currentDelay()));
    }

    void stopListening() {
        listenTimer.cancel();
        inactivityTimer.cancel();
        if (config.listen_mode == ListenMode::Direct) {
            transcriber.stopStreaming();
        }
    }

    // ------------------------------------------------------------------
    // Message handlers
    // ------------------------------------------------------------------

    void handleUtterance(const std::string& raw) {
        if (phase != LoopPhase::Listening) return;
        listenTimer.cancel();
        inactivityTimer.cancel();

        std::string text = raw;
        size_t first = text.find_first_not_of(" \t\r\n");
        text = first == std::string::npos ? "" : text.substr(first, text.find_last_not_of(" \t\r\n") - first + 1);

        if (text.empty()) {
            std::cout << "[ConversationLoop] Empty input, continuing" << std::endl;
            scheduleNextTurn(config.inter_turn_pause_ms);
            return;
        }

        std::cout << "[ConversationLoop] User: \"" << text << "\"" << std::endl;
        session.recordUserTurn();
        if (onUserUtterance) onUserUtterance(text);

        if (isEndPhrase(text, config.end_phrases)) {
            std::cout << "[ConversationLoop] End phrase heard" << std::endl;
            if (config.listen_mode == ListenMode::Wake) attention.stop();
            say(config.closing_line, AfterSpeech::Terminate);
            return;
        }

        ++turn;
        question = text;
        setPhase(LoopPhase::Thinking);

        std::weak_ptr<Impl> weak = weak_from_this();
        std::uint64_t expected = turn;
        generator.ask(text, history.recent(), [weak, expected](const llm::ResponseResult& result) {
            auto self = weak.lock();
            if (!self) return;
            Message m;
            m.kind = MessageKind::Reply;
            m.turn = expected;
            m.ok = result.ok;
            m.text = result.answer;
            self->enqueue(std::move(m));
        });
    }

    void handleListenTimeout() {
        if (phase != LoopPhase::Listening) return;
        std::cout << "[ConversationLoop] Listening timed out" << std::endl;
        stopListening();
        say(config.apology_line, AfterSpeech::Listen);
    }

    void handleReply(bool ok, const std::string& answer) {
        if (phase != LoopPhase::Thinking) return;

        std::string reply = answer;
        if (!ok || reply.empty()) {
            std::cerr << "[ConversationLoop] Response generator failed, using fallback line" << std::endl;
            reply = config.fallback_line;
        } else {
            history.add(question, reply);
        }

        if (onAssistantReply) onAssistantReply(reply);
        say(reply, AfterSpeech::CountTurnThenListen);
    }

    void handleSpeechDone(bool ok) {
        if (phase != LoopPhase::Speaking && phase != LoopPhase::Ending) return;

        attention.clearAISpeech();
        interrupts.setIdle();
        if (!ok) {
            std::cerr << "[ConversationLoop] Playback failed, continuing" << std::endl;
        }

        switch (afterSpeech) {
            case AfterSpeech::Terminate:
                terminate();
                return;
            case AfterSpeech::CountTurnThenListen:
                ++turns;
                break;
            case AfterSpeech::Listen:
                break;
        }
        scheduleNextTurn(config.inter_turn_pause_ms);
    }

    void handleInterrupted() {
        if (phase != LoopPhase::Speaking && phase != LoopPhase::Ending) return;

        speaker.cancel();
        attention.clearAISpeech();

        if (afterSpeech == AfterSpeech::Terminate) {
            terminate();
            return;
        }
        if (afterSpeech == AfterSpeech::CountTurnThenListen) {
            ++turns;
        }

        std::cout << "[ConversationLoop] Barge-in, waiting for fade" << std::endl;
        setPhase(LoopPhase::Interrupted);
        if (!interrupts.isFading()) {
            beginListening();
        }
    }

    void handleFadeComplete() {
        if (phase != LoopPhase::Interrupted) return;
        beginListening();
    }

    void handleInactivity() {
        if (phase != LoopPhase::Listening) return;
        std::cout << "[ConversationLoop] Auto-pausing due to inactivity" << std::endl;
        pause();
    }

    // ------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------

    void fatal(core::ErrorKind kind, const std::string& text) {
        Message m;
        m.kind = MessageKind::Fatal;
        m.error = core::Error{kind, "ConversationLoop", text};
        enqueue(std::move(m));
    }

    void pause() {
        if (!active || paused) return;

        paused = true;
        ++turn;
        nextTurnTimer.cancel();
        pending.reset();
        stopListening();
        if (config.listen_mode == ListenMode::Wake) {
            attention.stop();
        }

        // A line cut short by pause is not resumed
        if (phase == LoopPhase::Speaking || phase == LoopPhase::Interrupted) {
            speaker.cancel();
            interrupts.hardStop();
            interrupts.setIdle();
        }
        attention.clearAISpeech();
        setPhase(LoopPhase::Paused);
    }

    void silence() {
        ++turn;
        queue.clear();
        pending.reset();
        inactivityTimer.cancel();
        listenTimer.cancel();
        nextTurnTimer.cancel();

        attention.stop();
        transcriber.stopStreaming();
        speaker.cancel();
        interrupts.hardStop();
        attention.clearAISpeech();
    }

    void terminate() {
        if (!active) return;

        silence();
        interrupts.reset();
        bargeIn.pause();

        active = false;
        paused = false;
        setPhase(LoopPhase::Inactive);

        auto stats = session.snapshot();
        std::cout << "[ConversationLoop] Conversation ended (turns=" << turns
                  << ", wakes=" << stats.wake_detections
                  << ", interrupts=" << stats.interrupts << ")" << std::endl;
        if (onEnded) onEnded();
    }
};

ConversationLoop::ConversationLoop(core::EventLoop& loop,
                                   wake::AttentionDetector& attention,
                                   stt::StreamingTranscriber& transcriber,
                                   tts::Speaker& speaker,
                                   llm::ResponseGenerator& generator,
                                   InterruptManager& interrupts,
                                   audio::VoiceActivityDetector& barge_in,
                                   core::SessionContext& session,
                                   ConversationConfig config)
    : impl_(std::make_shared<Impl>(loop, attention, transcriber, speaker, generator,
                                   interrupts, barge_in, session, std::move(config)))
{
    std::weak_ptr<Impl> weak = impl_;

    barge_in.setOnSpeechStart([weak]() {
        if (auto self = weak.lock()) self->interrupts.onSpeechDetected();
    });
    barge_in.setOnSpeechEnd([weak](const std::vector<float>&) {
        if (auto self = weak.lock()) self->interrupts.onSpeechEnded();
    });
    // Playback that just started is still ringing in the room
    barge_in.setGuard([weak]() {
        auto self = weak.lock();
        if (!self || self->speakingSince < 0) return true;
        return self->loop.now() - self->speakingSince >= self->config.barge_in_guard_ms;
    });

    interrupts.setOnInterrupt([weak](InterruptKind kind) {
        auto self = weak.lock();
        if (!self || !self->active) return;
        if (kind == InterruptKind::WhileThinking) {
            std::cout << "[ConversationLoop] User spoke while thinking" << std::endl;
            return;
        }
        self->enqueue(self->message(MessageKind::Interrupted));
    });
    interrupts.setOnFadeComplete([weak]() {
        auto self = weak.lock();
        if (!self || !self->active) return;
        self->enqueue(self->message(MessageKind::FadeComplete));
    });

    attention.setOnUserFinal([weak](const std::string& text) {
        auto self = weak.lock();
        if (!self || !self->active || self->paused) return;
        if (self->config.listen_mode != ListenMode::Wake) return;

        if (self->phase == LoopPhase::Listening) {
            Message m = self->message(MessageKind::Utterance);
            m.text = text;
            self->enqueue(std::move(m));
        } else if (self->phase != LoopPhase::Ending) {
            if (self->pending) {
                std::cout << "[ConversationLoop] Replacing pending utterance" << std::endl;
            }
            self->pending = text;
        }
    });
    attention.setOnError([weak](const core::Error& error) {
        auto self = weak.lock();
        if (!self || !error.isFatal()) return;
        Message m;
        m.kind = MessageKind::Fatal;
        m.error = error;
        self->enqueue(std::move(m));
    });
}

ConversationLoop::~ConversationLoop() {
    impl_->onEnded = nullptr;
    impl_->terminate();
}

bool ConversationLoop::start() {
    if (impl_->active) {
        std::cerr << "[ConversationLoop] StateViolation: conversation already active" << std::endl;
        return false;
    }

    if (impl_->config.listen_mode == ListenMode::Wake && !impl_->attention.start()) {
        core::Error error{core::ErrorKind::Acquisition, "ConversationLoop",
                          "attention detector failed to start"};
        std::cerr << "[ConversationLoop] " << error.describe() << std::endl;
        if (impl_->onError) impl_->onError(error);
        return false;
    }

    impl_->active = true;
    impl_->paused = false;
    impl_->turns = 0;
    impl_->history.clear();
    impl_->pending.reset();
    impl_->listenRetry.reset();
    impl_->interrupts.reset();
    impl_->bargeIn.reset();
    impl_->bargeIn.start();

    std::cout << "[ConversationLoop] Conversation started (mode="
              << toString(impl_->config.listen_mode) << ")" << std::endl;

    if (impl_->config.speak_greeting && !impl_->config.greeting.empty()) {
        impl_->say(impl_->config.greeting, AfterSpeech::Listen);
    } else {
        impl_->scheduleNextTurn(0);
    }
    return true;
}

void ConversationLoop::pause() {
    impl_->pause();
}

void ConversationLoop::resume() {
    if (!impl_->active || !impl_->paused) return;

    std::cout << "[ConversationLoop] Resuming" << std::endl;
    impl_->paused = false;
    impl_->scheduleNextTurn(impl_->config.resume_delay_ms);
}

void ConversationLoop::end(bool announce) {
    if (!impl_->active) return;

    std::cout << "[ConversationLoop] End requested" << std::endl;
    if (!announce || impl_->config.end_request_line.empty()) {
        impl_->terminate();
        return;
    }

    impl_->silence();
    impl_->paused = false;
    impl_->say(impl_->config.end_request_line, AfterSpeech::Terminate);
}

bool ConversationLoop::isActive() const {
    return impl_->active;
}

bool ConversationLoop::isPaused() const {
    return impl_->paused;
}

LoopPhase ConversationLoop::phase() const {
    return impl_->phase;
}

int ConversationLoop::turnCount() const {
    return impl_->turns;
}

const llm::ConversationHistory& ConversationLoop::history() const {
    return impl_->history;
}

void ConversationLoop::setOnUserUtterance(TextCallback callback) {
    impl_->onUserUtterance = std::move(callback);
}

void ConversationLoop::setOnAssistantReply(TextCallback callback) {
    impl_->onAssistantReply = std::move(callback);
}

void ConversationLoop::setOnPhaseChange(PhaseCallback callback) {
    impl_->onPhaseChange = std::move(callback);
}

void ConversationLoop::setOnEnded(EndedCallback callback) {
    impl_->onEnded = std::move(callback);
}

void ConversationLoop::setOnError(ErrorCallback callback) {
    impl_->onError = std::move(callback);
}

} // namespace hpv::conversation
