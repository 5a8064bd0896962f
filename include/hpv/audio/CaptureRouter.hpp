/**
 * CaptureRouter.hpp - Single-owner access to the microphone stream
 *
 * The device callback hands frames to the router, which re-posts them on the
 * EventLoop. Monitors (the barge-in VAD) see every frame. Recognition
 * sessions must hold the capture lease to receive audio, and only one can
 * hold it at a time, so switching from keyword spotting to transcription
 * has to release before the next acquire.
 */

#pragma once

#include "hpv/core/EventLoop.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hpv::audio {

class EchoCanceller;

using FrameSink = std::function<void(const float* samples, size_t count)>;

class CaptureRouter {
public:
    explicit CaptureRouter(core::EventLoop& loop);
    ~CaptureRouter();

    CaptureRouter(const CaptureRouter&) = delete;
    CaptureRouter& operator=(const CaptureRouter&) = delete;

    /**
     * Device thread entry point: copies the samples and posts them.
     */
    void onDeviceAudio(const float* samples, size_t count);

    /**
     * Loop thread: route one block of audio now.
     */
    void deliver(const float* samples, size_t count);

    void setEchoCanceller(EchoCanceller* aec);
    void addMonitor(FrameSink sink);

    /**
     * Take the capture lease. Fails (and logs) while another owner holds it.
     */
    bool acquire(const std::string& owner, FrameSink sink);
    void release(const std::string& owner);

    bool isHeld() const;
    std::string holder() const;

private:
    core::EventLoop& loop_;
    EchoCanceller* aec_ = nullptr;
    std::vector<FrameSink> monitors_;
    std::string holder_;
    FrameSink sink_;
};

} // namespace hpv::audio
