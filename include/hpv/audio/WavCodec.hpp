/**
 * WavCodec.hpp - RIFF/WAVE decode and PCM16 encode
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hpv::audio {

struct DecodedAudio {
    std::vector<float> samples;  // Mono, [-1, 1]
    int sample_rate = 0;
    bool ok = false;
    std::string error;
};

/**
 * Decode PCM16, PCM24 or float32 WAV data. Multi-channel input is mixed
 * down to mono. The data chunk is located by scanning, so headers longer
 * than 44 bytes are handled.
 */
DecodedAudio decodeWav(const std::vector<uint8_t>& bytes);
DecodedAudio decodeWav(const std::string& bytes);
DecodedAudio loadWavFile(const std::string& path);

/**
 * Linear interpolation resampling.
 */
std::vector<float> resample(const std::vector<float>& input, int from_rate, int to_rate);

/**
 * 16-bit PCM mono WAV, used to upload audio to recognition services.
 */
std::vector<uint8_t> encodeWavPcm16(const std::vector<float>& samples, int sample_rate);

} // namespace hpv::audio
