/**
 * InterruptManager.hpp - Whose turn it is, and silencing the AI when it isn't
 *
 * Transitions are looked up in a fixed table:
 *
 *   IDLE           speech detected  -> USER_SPEAKING   notify speech start
 *   USER_SPEAKING  speech ended     -> PROCESSING      notify speech end
 *   PROCESSING     speech detected  -> USER_SPEAKING   interrupt while thinking
 *   AI_SPEAKING    speech detected  -> USER_SPEAKING   fade out AI audio, interrupt
 *   (any)          set AI speaking  -> AI_SPEAKING     attach audio handle
 *   (any)          set idle         -> IDLE            clear audio handle
 *
 * Events with no row are ignored. The audio handle is only referenced;
 * the PlaybackController owns it.
 */

#pragma once

#include "hpv/audio/PlaybackController.hpp"
#include "hpv/core/EventLoop.hpp"
#include "hpv/core/SessionContext.hpp"

#include <functional>
#include <memory>
#include <optional>

namespace hpv::conversation {

enum class TurnState {
    Idle,
    UserSpeaking,
    Processing,
    AiSpeaking
};

enum class TurnEvent {
    SpeechDetected,
    SpeechEnded,
    SetAiSpeaking,
    SetIdle
};

enum class TurnEffect {
    None,
    NotifySpeechStart,
    NotifySpeechEnd,
    InterruptThinking,
    FadeAndInterrupt,
    AttachHandle,
    ClearHandle
};

enum class InterruptKind {
    WhileThinking,
    WhileSpeaking
};

const char* toString(TurnState state);
const char* toString(TurnEvent event);

struct TurnTransition {
    TurnState next;
    TurnEffect effect;
};

struct InterruptConfig {
    int fade_duration_ms = 300;
    int fade_step_ms = 10;
    float silence_volume = 0.01f;   // Fade ends at or below this volume
};

class InterruptManager {
public:
    using Callback = std::function<void()>;
    using InterruptCallback = std::function<void(InterruptKind kind)>;
    using StateCallback = std::function<void(TurnState from, TurnState to)>;

    InterruptManager(core::EventLoop& loop, core::SessionContext& session,
                     InterruptConfig config = {});
    ~InterruptManager();

    InterruptManager(const InterruptManager&) = delete;
    InterruptManager& operator=(const InterruptManager&) = delete;

    /**
     * The transition table. nullopt when the event is ignored in state.
     */
    static std::optional<TurnTransition> lookup(TurnState state, TurnEvent event);

    TurnState state() const { return state_; }

    void onSpeechDetected();
    void onSpeechEnded();
    void setAISpeaking(std::shared_ptr<audio::PlaybackHandle> handle);
    void setIdle();

    /**
     * Linear fade of the attached handle over duration_ms (configured
     * duration when negative), then pause, rewind and restore volume.
     * A fade already in progress is cancelled first.
     */
    void fadeOut(int duration_ms = -1);

    /**
     * Silence the attached handle now, cancelling any fade.
     */
    void hardStop();

    bool isFading() const { return fadeTimer_.isPending(); }

    /**
     * Back to IDLE with no handle and no pending fade.
     */
    void reset();

    void setOnSpeechStart(Callback callback) { onSpeechStart_ = std::move(callback); }
    void setOnSpeechEnd(Callback callback) { onSpeechEnd_ = std::move(callback); }
    void setOnInterrupt(InterruptCallback callback) { onInterrupt_ = std::move(callback); }
    void setOnFadeComplete(Callback callback) { onFadeComplete_ = std::move(callback); }
    void setOnStateChange(StateCallback callback) { onStateChange_ = std::move(callback); }

private:
    void dispatch(TurnEvent event, std::shared_ptr<audio::PlaybackHandle> handle = nullptr);
    void fadeStep(float step);
    void finishFade(const std::shared_ptr<audio::PlaybackHandle>& handle);

    core::SessionContext& session_;
    InterruptConfig config_;

    TurnState state_ = TurnState::Idle;
    std::weak_ptr<audio::PlaybackHandle> handle_;
    core::ScopedTimer fadeTimer_;

    Callback onSpeechStart_;
    Callback onSpeechEnd_;
    InterruptCallback onInterrupt_;
    Callback onFadeComplete_;
    StateCallback onStateChange_;
};

} // namespace hpv::conversation
