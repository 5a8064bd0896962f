/**
 * RecognitionEngine.hpp - Speech-to-text adapter interface
 *
 * An engine decodes one buffer of 16kHz mono audio at a time. recognize()
 * blocks and is only ever called from the background executor, one call at
 * a time.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace hpv::stt {

struct RecognitionSettings {
    std::string key;      // Provider subscription key
    std::string region;
    std::string locale = "en-US";
    std::vector<std::string> phrases;  // Vocabulary biasing
};

struct RecognitionResult {
    bool ok = false;
    std::string text;
    float confidence = 0.0f;
    std::string error;
};

class RecognitionEngine {
public:
    virtual ~RecognitionEngine() = default;

    virtual bool open(const RecognitionSettings& settings) = 0;
    virtual bool isReady() const = 0;

    virtual RecognitionResult recognize(const std::vector<float>& pcm, bool interim) = 0;

    // Engines billed per request skip partial decodes
    virtual bool supportsInterim() const { return true; }

    virtual std::string name() const = 0;
    virtual std::string lastError() const = 0;
};

/**
 * "en-US" -> "en"
 */
std::string languageFromLocale(const std::string& locale);

} // namespace hpv::stt
