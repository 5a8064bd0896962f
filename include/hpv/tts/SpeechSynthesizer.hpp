/**
 * SpeechSynthesizer.hpp - Text-to-speech adapter interface
 */

#pragma once

#include <string>
#include <vector>

namespace hpv::tts {

struct SynthesisResult {
    bool ok = false;
    std::vector<float> samples;  // Mono
    int sample_rate = 0;
    std::string error;
};

class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;

    /**
     * Blocking; called from the background executor.
     */
    virtual SynthesisResult synthesize(const std::string& text) = 0;

    virtual bool isReady() const = 0;
    virtual std::string name() const = 0;
};

} // namespace hpv::tts
