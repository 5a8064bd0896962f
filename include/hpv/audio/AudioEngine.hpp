/**
 * AudioEngine.hpp - PortAudio capture and playback
 */

#pragma once

#include "hpv/audio/AudioOutput.hpp"
#include "hpv/core/Error.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hpv::audio {

struct AudioConfig {
    int sample_rate = 16000;
    int channels = 1;
    int frames_per_buffer = 480;   // 30ms at 16kHz
    int input_device = -1;         // -1 = system default
    int output_device = -1;
    int playback_buffer_seconds = 10;
};

// Called on the PortAudio thread
using AudioCallback = std::function<void(const float* samples, size_t count)>;

class AudioEngine : public AudioOutput {
public:
    explicit AudioEngine(const AudioConfig& config = AudioConfig{});
    ~AudioEngine() override;

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    bool initialize();

    /**
     * Open and start both streams. A missing or refused input device is an
     * acquisition error (see lastError()).
     */
    bool start();
    void stop();
    bool isRunning() const;

    void setInputCallback(AudioCallback callback);

    // AudioOutput
    size_t queue(const float* samples, size_t count) override;
    void clear() override;
    size_t queuedSamples() const override;
    int sampleRate() const override { return config_.sample_rate; }

    bool isPlaying() const;

    size_t inputOverflows() const;

    static std::vector<std::string> listInputDevices();
    static std::vector<std::string> listOutputDevices();

    std::string lastError() const;
    core::Error lastErrorInfo() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
    AudioConfig config_;
};

} // namespace hpv::audio
