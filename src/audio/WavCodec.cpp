/**
 * WavCodec.cpp - WAV parsing for synthesized speech and cached prompts
 */

#include "hpv/audio/WavCodec.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>

namespace hpv::audio {

namespace {

uint16_t readU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

void writeU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void writeU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
    }
}

void writeTag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

DecodedAudio fail(const std::string& message) {
    DecodedAudio result;
    result.error = message;
    return result;
}

} // namespace

DecodedAudio decodeWav(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 44) {
        return fail("WAV too short");
    }
    if (std::memcmp(bytes.data(), "RIFF", 4) != 0 || std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        return fail("no RIFF/WAVE header");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t rate = 0;
    uint16_t bits = 0;
    size_t dataOffset = 0;
    size_t dataSize = 0;

    // Walk the chunk list
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        uint32_t size = readU32(chunk + 4);

        if (std::memcmp(chunk, "fmt ", 4) == 0 && pos + 8 + 16 <= bytes.size()) {
            format = readU16(chunk + 8);
            channels = readU16(chunk + 10);
            rate = readU32(chunk + 12);
            bits = readU16(chunk + 22);
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            dataOffset = pos + 8;
            // Streaming servers write 0 or 0xFFFFFFFF for unknown length
            dataSize = std::min<size_t>(size, bytes.size() - dataOffset);
            break;
        }

        pos += 8 + size + (size & 1);
    }

    if (dataOffset == 0) return fail("no data chunk");
    if (channels == 0 || rate == 0) return fail("no fmt chunk");

    // WAVE_FORMAT_EXTENSIBLE carries the real format in its sub-format GUID
    if (format == 0xFFFE) {
        format = (bits == 32) ? 3 : 1;
    }

    DecodedAudio result;
    result.sample_rate = static_cast<int>(rate);

    const uint8_t* data = bytes.data() + dataOffset;
    const size_t bytesPerSample = bits / 8;
    if (bytesPerSample == 0) return fail("invalid bit depth");
    const size_t frames = dataSize / (bytesPerSample * channels);
    result.samples.reserve(frames);

    for (size_t f = 0; f < frames; ++f) {
        float mixed = 0.0f;
        for (uint16_t c = 0; c < channels; ++c) {
            const uint8_t* s = data + (f * channels + c) * bytesPerSample;
            float value = 0.0f;
            if (format == 1 && bits == 16) {
                value = static_cast<int16_t>(readU16(s)) / 32768.0f;
            } else if (format == 1 && bits == 24) {
                int32_t v = (s[0] << 8) | (s[1] << 16) | (s[2] << 24);
                value = static_cast<float>(v >> 8) / 8388608.0f;
            } else if (format == 3 && bits == 32) {
                std::memcpy(&value, s, sizeof(float));
            } else {
                return fail("unsupported WAV format " + std::to_string(format) +
                            "/" + std::to_string(bits) + " bits");
            }
            mixed += value;
        }
        result.samples.push_back(mixed / channels);
    }

    result.ok = true;
    return result;
}

DecodedAudio decodeWav(const std::string& bytes) {
    return decodeWav(std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

DecodedAudio loadWavFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.good()) {
        return fail("cannot open " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    return decodeWav(bytes);
}

std::vector<float> resample(const std::vector<float>& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty() || from_rate <= 0 || to_rate <= 0) {
        return input;
    }

    double ratio = static_cast<double>(from_rate) / to_rate;
    size_t outLen = static_cast<size_t>(input.size() / ratio);
    std::vector<float> output(outLen);

    for (size_t i = 0; i < outLen; ++i) {
        double src = i * ratio;
        size_t idx = static_cast<size_t>(src);
        double frac = src - idx;
        float a = input[std::min(idx, input.size() - 1)];
        float b = input[std::min(idx + 1, input.size() - 1)];
        output[i] = static_cast<float>(a + (b - a) * frac);
    }
    return output;
}

std::vector<uint8_t> encodeWavPcm16(const std::vector<float>& samples, int sample_rate) {
    const uint32_t dataBytes = static_cast<uint32_t>(samples.size() * 2);
    std::vector<uint8_t> out;
    out.reserve(44 + dataBytes);

    writeTag(out, "RIFF");
    writeU32(out, 36 + dataBytes);
    writeTag(out, "WAVE");
    writeTag(out, "fmt ");
    writeU32(out, 16);
    writeU16(out, 1);                                   // PCM
    writeU16(out, 1);                                   // mono
    writeU32(out, static_cast<uint32_t>(sample_rate));
    writeU32(out, static_cast<uint32_t>(sample_rate) * 2);
    writeU16(out, 2);
    writeU16(out, 16);
    writeTag(out, "data");
    writeU32(out, dataBytes);

    for (float sample : samples) {
        float clamped = std::clamp(sample, -1.0f, 1.0f);
        writeU16(out, static_cast<uint16_t>(static_cast<int16_t>(clamped * 32767.0f)));
    }
    return out;
}

} // namespace hpv::audio
