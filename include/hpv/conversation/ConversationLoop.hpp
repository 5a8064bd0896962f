/**
 * ConversationLoop.hpp - Turn-taking driver for a spoken conversation
 *
 * One turn: listen -> utterance -> response generator -> speak -> pause.
 * Collaborators report back through an internal message queue drained on
 * the EventLoop; every message carries the turn it belongs to, and
 * messages from an older turn (or arriving after end()) are dropped.
 *
 * Only an end phrase, end() or an Acquisition error terminates the
 * conversation. Recognition and playback failures are logged and the
 * loop carries on.
 */

#pragma once

#include "hpv/audio/VoiceActivityDetector.hpp"
#include "hpv/conversation/InterruptManager.hpp"
#include "hpv/core/Error.hpp"
#include "hpv/core/EventLoop.hpp"
#include "hpv/core/RetryPolicy.hpp"
#include "hpv/core/SessionContext.hpp"
#include "hpv/llm/ConversationHistory.hpp"
#include "hpv/llm/ResponseGenerator.hpp"
#include "hpv/stt/StreamingTranscriber.hpp"
#include "hpv/tts/Speaker.hpp"
#include "hpv/wake/AttentionDetector.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hpv::conversation {

enum class LoopPhase {
    Inactive,
    Speaking,      // Greeting, reply, apology or closing line
    Listening,
    Thinking,      // Waiting for the response generator
    Interrupted,   // User barged in; waiting for the fade to finish
    Paused,
    Ending         // Closing line playing, nothing else accepted
};

enum class ListenMode {
    Wake,     // Utterances come from the attention detector
    Direct    // One recognizeOnce() per turn
};

const char* toString(LoopPhase phase);
const char* toString(ListenMode mode);
std::optional<ListenMode> parseListenMode(const std::string& name);

struct ConversationConfig {
    ListenMode listen_mode = ListenMode::Wake;

    // Matched on word boundaries; "thanks" is not an end phrase
    std::vector<std::string> end_phrases = {
        "bye", "goodbye", "exit", "quit", "stop", "end conversation",
        "end", "that's all", "finish"
    };

    std::string greeting =
        "Hi! I'm Pal, your AI tutor. I'm ready for our conversation - "
        "what would you like to learn about today?";
    std::string closing_line =
        "Goodbye! Thanks for our conversation. Feel free to chat with me anytime!";
    std::string end_request_line = "Ending our conversation. Goodbye!";
    std::string fallback_line =
        "I heard what you said and I'd love to continue our conversation. "
        "What would you like to talk about next?";
    std::string apology_line = "Sorry, I didn't catch that. Could you try again?";

    bool speak_greeting = true;
    int inactivity_timeout_ms = 300000;
    int inter_turn_pause_ms = 200;
    int resume_delay_ms = 500;
    int listen_timeout_ms = 30000;      // Direct mode: give up and apologise
    int barge_in_guard_ms = 400;        // No barge-in this soon after audio starts
    size_t history_window = 5;

    core::RetryPolicy listen_retry{0, 400, 2.0, 8000};
};

class ConversationLoop {
public:
    using TextCallback = std::function<void(const std::string& text)>;
    using PhaseCallback = std::function<void(LoopPhase phase)>;
    using EndedCallback = std::function<void()>;
    using ErrorCallback = std::function<void(const core::Error& error)>;

    /**
     * barge_in is the always-on detector fed from the capture monitors; the
     * loop wires it to the interrupt manager.
     */
    ConversationLoop(core::EventLoop& loop,
                     wake::AttentionDetector& attention,
                     stt::StreamingTranscriber& transcriber,
                     tts::Speaker& speaker,
                     llm::ResponseGenerator& generator,
                     InterruptManager& interrupts,
                     audio::VoiceActivityDetector& barge_in,
                     core::SessionContext& session,
                     ConversationConfig config = {});
    ~ConversationLoop();

    ConversationLoop(const ConversationLoop&) = delete;
    ConversationLoop& operator=(const ConversationLoop&) = delete;

    /**
     * Begin a conversation (greeting, then the first turn). Fails if one
     * is already active or capture cannot be started.
     */
    bool start();

    /**
     * Stop listening and the inactivity timer; history is kept.
     */
    void pause();
    void resume();

    /**
     * Explicit end request: silence everything, optionally say goodbye,
     * then terminate.
     */
    void end(bool announce = true);

    bool isActive() const;
    bool isPaused() const;
    LoopPhase phase() const;
    int turnCount() const;
    const llm::ConversationHistory& history() const;

    static bool isEndPhrase(const std::string& text, const std::vector<std::string>& phrases);

    void setOnUserUtterance(TextCallback callback);
    void setOnAssistantReply(TextCallback callback);
    void setOnPhaseChange(PhaseCallback callback);
    void setOnEnded(EndedCallback callback);
    void setOnError(ErrorCallback callback);

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace hpv::conversation
