/**
 * PlaybackController.hpp - Synthesized speech playback with interruptible handles
 *
 * The controller owns every PlaybackHandle it creates; other components
 * (the interrupt manager) only keep weak references for fading. Audio is
 * pumped into the AudioOutput a few chunks ahead of the device on EventLoop
 * ticks, scaled by the handle's current volume, so a fade is audible within
 * one lead interval.
 */

#pragma once

#include "hpv/audio/AudioOutput.hpp"
#include "hpv/core/EventLoop.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hpv::audio {

enum class PlaybackStatus {
    Playing,
    Fading,
    Stopped
};

const char* toString(PlaybackStatus status);

class PlaybackHandle {
public:
    PlaybackHandle(std::uint64_t id, std::string source, std::vector<float> samples);

    std::uint64_t id() const { return id_; }
    const std::string& source() const { return source_; }

    float volume() const { return volume_; }
    void setVolume(float volume);

    PlaybackStatus status() const { return status_; }
    void beginFade();

    /**
     * Stop output now. Completion is never reported for a paused handle.
     */
    void pause();
    void rewind() { position_ = 0; }

    size_t position() const { return position_; }
    size_t size() const { return samples_.size(); }
    bool finished() const { return position_ >= samples_.size(); }

private:
    friend class PlaybackController;

    std::uint64_t id_;
    std::string source_;
    std::vector<float> samples_;
    size_t position_ = 0;
    float volume_ = 1.0f;
    PlaybackStatus status_ = PlaybackStatus::Playing;
    std::function<void()> onPause_;
};

struct PlaybackOptions {
    int chunk_ms = 20;
    int lead_ms = 100;  // How far ahead of the device samples are queued
};

class PlaybackController {
public:
    using CompletionCallback = std::function<void()>;
    using RenderTap = std::function<void(const float* samples, size_t count)>;

    PlaybackController(core::EventLoop& loop, AudioOutput& output,
                       PlaybackOptions options = {});
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    /**
     * Start playing samples (at the output rate). Any current handle is
     * stopped first without completion. on_complete runs once, after the
     * last sample has left the output buffer.
     */
    std::shared_ptr<PlaybackHandle> play(std::vector<float> samples,
                                         std::string source,
                                         CompletionCallback on_complete = nullptr);

    /**
     * Silence output at once and forget the current handle.
     */
    void stopImmediately();

    std::shared_ptr<PlaybackHandle> current() const;
    bool isPlaying() const;
    int sampleRate() const { return output_.sampleRate(); }

    // Everything queued to the device is also handed here (echo reference)
    void setRenderTap(RenderTap tap);

private:
    void schedulePump();
    void pump();
    void halt(std::uint64_t id);

    core::EventLoop& loop_;
    AudioOutput& output_;
    PlaybackOptions options_;
    core::ScopedTimer pumpTimer_;

    std::shared_ptr<PlaybackHandle> current_;
    CompletionCallback onComplete_;
    RenderTap renderTap_;
    std::uint64_t nextId_ = 1;
    std::vector<float> scratch_;
};

} // namespace hpv::audio
