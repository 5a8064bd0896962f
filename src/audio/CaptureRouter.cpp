/**
 * CaptureRouter.cpp - Microphone fan-out and capture lease
 */

#include "hpv/audio/CaptureRouter.hpp"
#include "hpv/audio/EchoCanceller.hpp"

#include <iostream>

namespace hpv::audio {

CaptureRouter::CaptureRouter(core::EventLoop& loop) : loop_(loop) {}

CaptureRouter::~CaptureRouter() = default;

void CaptureRouter::onDeviceAudio(const float* samples, size_t count) {
    auto block = std::make_shared<std::vector<float>>(samples, samples + count);
    loop_.post([this, block]() {
        deliver(block->data(), block->size());
    });
}

void CaptureRouter::deliver(const float* samples, size_t count) {
    std::vector<float> cleaned;
    if (aec_) {
        cleaned = aec_->processCapture(samples, count);
        samples = cleaned.data();
        count = cleaned.size();
        if (count == 0) return;
    }

    for (auto& monitor : monitors_) {
        monitor(samples, count);
    }

    if (sink_) {
        // Copy: the sink may release (and replace) itself while running
        FrameSink sink = sink_;
        sink(samples, count);
    }
}

void CaptureRouter::setEchoCanceller(EchoCanceller* aec) {
    aec_ = aec;
}

void CaptureRouter::addMonitor(FrameSink sink) {
    monitors_.push_back(std::move(sink));
}

bool CaptureRouter::acquire(const std::string& owner, FrameSink sink) {
    if (!holder_.empty()) {
        if (holder_ == owner) {
            sink_ = std::move(sink);
            return true;
        }
        std::cerr << "[CaptureRouter] StateViolation: " << owner
                  << " requested the microphone while " << holder_
                  << " holds it" << std::endl;
        return false;
    }

    holder_ = owner;
    sink_ = std::move(sink);
    return true;
}

void CaptureRouter::release(const std::string& owner) {
    if (holder_ != owner) {
        return;
    }
    holder_.clear();
    sink_ = nullptr;
}

bool CaptureRouter::isHeld() const {
    return !holder_.empty();
}

std::string CaptureRouter::holder() const {
    return holder_;
}

} // namespace hpv::audio
