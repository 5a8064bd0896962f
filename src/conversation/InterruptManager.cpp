/**
 * InterruptManager.cpp - Turn state machine and AI audio fade-out
 */

#include "hpv/conversation/InterruptManager.hpp"

#include <iostream>

namespace hpv::conversation {

const char* toString(TurnState state) {
    switch (state) {
        case TurnState::Idle:         return "IDLE";
        case TurnState::UserSpeaking: return "USER_SPEAKING";
        case TurnState::Processing:   return "PROCESSING";
        case TurnState::AiSpeaking:   return "AI_SPEAKING";
    }
    return "UNKNOWN";
}

const char* toString(TurnEvent event) {
    switch (event) {
        case TurnEvent::SpeechDetected: return "speech-detected";
        case TurnEvent::SpeechEnded:    return "speech-ended";
        case TurnEvent::SetAiSpeaking:  return "set-ai-speaking";
        case TurnEvent::SetIdle:        return "set-idle";
    }
    return "unknown";
}

namespace {

struct Row {
    TurnState from;
    TurnEvent event;
    TurnState next;
    TurnEffect effect;
};

constexpr Row kTransitions[] = {
    {TurnState::Idle,         TurnEvent::SpeechDetected, TurnState::UserSpeaking, TurnEffect::NotifySpeechStart},
    {TurnState::UserSpeaking, TurnEvent::SpeechEnded,    TurnState::Processing,   TurnEffect::NotifySpeechEnd},
    {TurnState::Processing,   TurnEvent::SpeechDetected, TurnState::UserSpeaking, TurnEffect::InterruptThinking},
    {TurnState::AiSpeaking,   TurnEvent::SpeechDetected, TurnState::UserSpeaking, TurnEffect::FadeAndInterrupt},
};

} // namespace

std::optional<TurnTransition> InterruptManager::lookup(TurnState state, TurnEvent event) {
    // Wildcard rows
    if (event == TurnEvent::SetAiSpeaking) {
        return TurnTransition{TurnState::AiSpeaking, TurnEffect::AttachHandle};
    }
    if (event == TurnEvent::SetIdle) {
        return TurnTransition{TurnState::Idle, TurnEffect::ClearHandle};
    }

    for (const auto& row : kTransitions) {
        if (row.from == state && row.event == event) {
            return TurnTransition{row.next, row.effect};
        }
    }
    return std::nullopt;
}

InterruptManager::InterruptManager(core::EventLoop& loop, core::SessionContext& session,
                                   InterruptConfig config)
    : session_(session)
    , config_(config)
    , fadeTimer_(loop)
{
    if (config_.fade_step_ms <= 0) config_.fade_step_ms = 10;
}

InterruptManager::~InterruptManager() = default;

void InterruptManager::onSpeechDetected() {
    dispatch(TurnEvent::SpeechDetected);
}

void InterruptManager::onSpeechEnded() {
    dispatch(TurnEvent::SpeechEnded);
}

void InterruptManager::setAISpeaking(std::shared_ptr<audio::PlaybackHandle> handle) {
    dispatch(TurnEvent::SetAiSpeaking, std::move(handle));
}

void InterruptManager::setIdle() {
    dispatch(TurnEvent::SetIdle);
}

void InterruptManager::dispatch(TurnEvent event, std::shared_ptr<audio::PlaybackHandle> handle) {
    auto transition = lookup(state_, event);
    if (!transition) {
        return;
    }

    TurnState from = state_;
    state_ = transition->next;
    if (from != state_) {
        std::cout << "[InterruptManager] " << toString(from) << " -> " << toString(state_)
                  << " (" << toString(event) << ")" << std::endl;
        if (onStateChange_) onStateChange_(from, state_);
    }

    switch (transition->effect) {
        case TurnEffect::None:
            break;

        case TurnEffect::NotifySpeechStart:
            if (onSpeechStart_) onSpeechStart_();
            break;

        case TurnEffect::NotifySpeechEnd:
            if (onSpeechEnd_) onSpeechEnd_();
            break;

        case TurnEffect::InterruptThinking:
            session_.recordInterrupt();
            if (onInterrupt_) onInterrupt_(InterruptKind::WhileThinking);
            break;

        case TurnEffect::FadeAndInterrupt:
            session_.recordInterrupt();
            fadeOut();
            if (onInterrupt_) onInterrupt_(InterruptKind::WhileSpeaking);
            break;

        case TurnEffect::AttachHandle:
            // A fade still running belongs to the previous handle
            fadeTimer_.cancel();
            handle_ = handle;
            break;

        case TurnEffect::ClearHandle:
            fadeTimer_.cancel();
            handle_.reset();
            break;
    }
}

void InterruptManager::fadeOut(int duration_ms) {
    fadeTimer_.cancel();

    auto handle = handle_.lock();
    if (!handle || handle->status() == audio::PlaybackStatus::Stopped) {
        if (onFadeComplete_) onFadeComplete_();
        return;
    }

    int duration = duration_ms >= 0 ? duration_ms : config_.fade_duration_ms;
    int steps = duration / config_.fade_step_ms;
    if (steps <= 0) {
        finishFade(handle);
        return;
    }

    handle->beginFade();
    float step = handle->volume() / static_cast<float>(steps);
    std::cout << "[InterruptManager] Fading \"" << handle->source() << "\" over "
              << duration << "ms" << std::endl;
    fadeTimer_.start(config_.fade_step_ms, [this, step]() { fadeStep(step); });
}

void InterruptManager::fadeStep(float step) {
    auto handle = handle_.lock();
    if (!handle || handle->status() == audio::PlaybackStatus::Stopped) {
        if (onFadeComplete_) onFadeComplete_();
        return;
    }

    handle->setVolume(handle->volume() - step);
    if (handle->volume() <= config_.silence_volume) {
        finishFade(handle);
        return;
    }
    fadeTimer_.start(config_.fade_step_ms, [this, step]() { fadeStep(step); });
}

void InterruptManager::finishFade(const std::shared_ptr<audio::PlaybackHandle>& handle) {
    handle->pause();
    handle->rewind();
    handle->setVolume(1.0f);
    if (onFadeComplete_) onFadeComplete_();
}

void InterruptManager::hardStop() {
    fadeTimer_.cancel();
    if (auto handle = handle_.lock()) {
        std::cout << "[InterruptManager] Hard stop \"" << handle->source() << "\"" << std::endl;
        handle->pause();
        handle->rewind();
        handle->setVolume(1.0f);
    }
}

void InterruptManager::reset() {
    fadeTimer_.cancel();
    handle_.reset();
    state_ = TurnState::Idle;
}

} // namespace hpv::conversation
