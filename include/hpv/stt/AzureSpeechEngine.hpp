/**
 * AzureSpeechEngine.hpp - Cloud recognition over the short-audio REST API
 *
 * Each utterance is uploaded as a PCM16 WAV and the detailed result format
 * is requested so NBest confidence is available.
 */

#pragma once

#include "hpv/stt/RecognitionEngine.hpp"

namespace hpv::stt {

class AzureSpeechEngine : public RecognitionEngine {
public:
    /**
     * host_override replaces "https://<region>.stt.speech.microsoft.com",
     * e.g. for a local proxy.
     */
    explicit AzureSpeechEngine(int timeout_ms = 10000, std::string host_override = "");
    ~AzureSpeechEngine() override;

    AzureSpeechEngine(const AzureSpeechEngine&) = delete;
    AzureSpeechEngine& operator=(const AzureSpeechEngine&) = delete;

    bool open(const RecognitionSettings& settings) override;
    bool isReady() const override;
    RecognitionResult recognize(const std::vector<float>& pcm, bool interim) override;
    bool supportsInterim() const override { return false; }
    std::string name() const override { return "azure"; }
    std::string lastError() const override;

    /**
     * Parse a detailed-format response body.
     */
    static RecognitionResult parseResponse(const std::string& body);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hpv::stt
