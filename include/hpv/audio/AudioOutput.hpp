/**
 * AudioOutput.hpp - Sink the playback controller writes samples into
 */

#pragma once

#include <cstddef>

namespace hpv::audio {

class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    /**
     * Queue samples for playback. Returns how many were accepted.
     */
    virtual size_t queue(const float* samples, size_t count) = 0;

    /**
     * Drop everything not yet played.
     */
    virtual void clear() = 0;

    virtual size_t queuedSamples() const = 0;
    virtual int sampleRate() const = 0;
};

} // namespace hpv::audio
