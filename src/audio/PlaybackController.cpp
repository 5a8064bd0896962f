/**
 * PlaybackController.cpp - Chunked, volume-scaled playback pump
 */

#include "hpv/audio/PlaybackController.hpp"

#include <algorithm>
#include <iostream>

namespace hpv::audio {

const char* toString(PlaybackStatus status) {
    switch (status) {
        case PlaybackStatus::Playing: return "playing";
        case PlaybackStatus::Fading:  return "fading";
        case PlaybackStatus::Stopped: return "stopped";
    }
    return "unknown";
}

PlaybackHandle::PlaybackHandle(std::uint64_t id, std::string source, std::vector<float> samples)
    : id_(id)
    , source_(std::move(source))
    , samples_(std::move(samples))
{
}

void PlaybackHandle::setVolume(float volume) {
    volume_ = std::clamp(volume, 0.0f, 1.0f);
}

void PlaybackHandle::beginFade() {
    if (status_ == PlaybackStatus::Playing) {
        status_ = PlaybackStatus::Fading;
    }
}

void PlaybackHandle::pause() {
    if (status_ == PlaybackStatus::Stopped) return;
    status_ = PlaybackStatus::Stopped;
    if (onPause_) {
        auto hook = std::move(onPause_);
        onPause_ = nullptr;
        hook();
    }
}

PlaybackController::PlaybackController(core::EventLoop& loop, AudioOutput& output,
                                       PlaybackOptions options)
    : loop_(loop)
    , output_(output)
    , options_(options)
    , pumpTimer_(loop)
{
}

PlaybackController::~PlaybackController() {
    if (current_) {
        current_->onPause_ = nullptr;
    }
}

std::shared_ptr<PlaybackHandle> PlaybackController::play(std::vector<float> samples,
                                                         std::string source,
                                                         CompletionCallback on_complete)
{
    if (current_) {
        std::cout << "[Playback] Replacing \"" << current_->source() << "\"" << std::endl;
        stopImmediately();
    }

    auto handle = std::make_shared<PlaybackHandle>(nextId_++, std::move(source), std::move(samples));
    std::uint64_t id = handle->id();
    handle->onPause_ = [this, id]() { halt(id); };

    current_ = handle;
    onComplete_ = std::move(on_complete);

    std::cout << "[Playback] Playing \"" << handle->source() << "\" ("
              << handle->size() * 1000 / static_cast<size_t>(output_.sampleRate())
              << "ms)" << std::endl;

    pump();
    return handle;
}

void PlaybackController::stopImmediately() {
    pumpTimer_.cancel();
    output_.clear();

    if (current_) {
        current_->onPause_ = nullptr;
        current_->status_ = PlaybackStatus::Stopped;
        std::cout << "[Playback] Stopped \"" << current_->source() << "\" at "
                  << current_->position() << "/" << current_->size() << std::endl;
    }
    current_.reset();
    onComplete_ = nullptr;
}

void PlaybackController::halt(std::uint64_t id) {
    if (!current_ || current_->id() != id) return;
    stopImmediately();
}

std::shared_ptr<PlaybackHandle> PlaybackController::current() const {
    return current_;
}

bool PlaybackController::isPlaying() const {
    return current_ && current_->status() != PlaybackStatus::Stopped;
}

void PlaybackController::setRenderTap(RenderTap tap) {
    renderTap_ = std::move(tap);
}

void PlaybackController::schedulePump() {
    pumpTimer_.start(options_.chunk_ms, [this]() { pump(); });
}

void PlaybackController::pump() {
    if (!current_) return;

    auto active = current_;
    auto& handle = *active;
    const size_t rate = static_cast<size_t>(output_.sampleRate());
    const size_t chunk = rate * static_cast<size_t>(options_.chunk_ms) / 1000;
    const size_t lead = rate * static_cast<size_t>(options_.lead_ms) / 1000;

    while (!handle.finished() && output_.queuedSamples() < lead) {
        size_t count = std::min(chunk, handle.size() - handle.position_);
        scratch_.assign(handle.samples_.begin() + handle.position_,
                        handle.samples_.begin() + handle.position_ + count);
        for (auto& sample : scratch_) {
            sample *= handle.volume_;
        }

        size_t accepted = output_.queue(scratch_.data(), count);
        if (renderTap_ && accepted > 0) {
            renderTap_(scratch_.data(), accepted);
        }
        handle.position_ += accepted;
        if (accepted < count) break;
    }

    if (handle.finished() && output_.queuedSamples() == 0) {
        handle.onPause_ = nullptr;
        handle.status_ = PlaybackStatus::Stopped;
        auto done = std::move(onComplete_);
        onComplete_ = nullptr;
        current_.reset();
        std::cout << "[Playback] Finished \"" << handle.source() << "\"" << std::endl;
        if (done) done();
        return;
    }

    schedulePump();
}

} // namespace hpv::audio
