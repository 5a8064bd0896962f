/**
 * Speaker.hpp - Text in, audible speech out
 *
 * Synthesis runs on the background executor (primary engine first, the
 * secondary one if that fails); the audio is resampled to the output rate
 * and handed to the PlaybackController on the loop thread.
 */

#pragma once

#include "hpv/audio/PlaybackController.hpp"
#include "hpv/core/BackgroundExecutor.hpp"
#include "hpv/core/Error.hpp"
#include "hpv/core/EventLoop.hpp"
#include "hpv/tts/SpeechSynthesizer.hpp"

#include <functional>
#include <memory>
#include <string>

namespace hpv::tts {

enum class SpeakOutcome {
    Completed,   // Played to the end
    Failed       // No synthesis path produced audio
};

class Speaker {
public:
    using StartedCallback = std::function<void(std::shared_ptr<audio::PlaybackHandle> handle)>;
    using DoneCallback = std::function<void(SpeakOutcome outcome)>;
    using ErrorCallback = std::function<void(const core::Error& error)>;

    Speaker(core::EventLoop& loop,
            core::BackgroundExecutor& executor,
            audio::PlaybackController& playback,
            std::shared_ptr<SpeechSynthesizer> primary,
            std::shared_ptr<SpeechSynthesizer> secondary = nullptr);
    ~Speaker();

    Speaker(const Speaker&) = delete;
    Speaker& operator=(const Speaker&) = delete;

    /**
     * started fires when audio begins; done fires once when playback ends
     * or synthesis fails. Neither fires after cancel() or an interrupted
     * playback.
     */
    void speak(const std::string& text, StartedCallback started, DoneCallback done);

    /**
     * Forget the pending request. Playback itself is stopped through the
     * PlaybackController.
     */
    void cancel();

    bool isBusy() const;

    void setOnError(ErrorCallback callback);

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace hpv::tts
