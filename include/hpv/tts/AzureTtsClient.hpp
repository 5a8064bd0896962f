/**
 * AzureTtsClient.hpp - Cloud neural voice over the REST text-to-speech API
 */

#pragma once

#include "hpv/tts/SpeechSynthesizer.hpp"

#include <memory>

namespace hpv::tts {

struct AzureTtsConfig {
    std::string key;
    std::string region;
    std::string locale = "en-US";
    std::string voice = "en-US-AriaNeural";
    std::string style = "friendly";   // mstts:express-as; empty disables
    std::string rate = "medium";
    std::string pitch = "medium";
    int timeout_ms = 10000;
    std::string host_override;        // Replaces https://<region>.tts.speech.microsoft.com
};

class AzureTtsClient : public SpeechSynthesizer {
public:
    explicit AzureTtsClient(AzureTtsConfig config);
    ~AzureTtsClient() override;

    AzureTtsClient(const AzureTtsClient&) = delete;
    AzureTtsClient& operator=(const AzureTtsClient&) = delete;

    SynthesisResult synthesize(const std::string& text) override;
    bool isReady() const override;
    std::string name() const override { return "azure-tts"; }

    static std::string buildSsml(const std::string& text, const AzureTtsConfig& config);
    static std::string escapeXml(const std::string& text);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hpv::tts
