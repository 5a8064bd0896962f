/**
 * XttsClient.hpp - XTTS v2 synthesis through the local HTTP server
 *
 * The server keeps the model and speaker embedding cached; text is sent a
 * sentence at a time.
 */

#pragma once

#include "hpv/tts/SpeechSynthesizer.hpp"

#include <memory>

namespace hpv::tts {

class XttsClient : public SpeechSynthesizer {
public:
    explicit XttsClient(std::string server_url = "http://localhost:5050", int timeout_ms = 30000);
    ~XttsClient() override;

    XttsClient(const XttsClient&) = delete;
    XttsClient& operator=(const XttsClient&) = delete;

    SynthesisResult synthesize(const std::string& text) override;
    bool isReady() const override;
    std::string name() const override { return "xtts"; }

    bool checkServer();

    static std::vector<std::string> splitSentences(const std::string& text);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hpv::tts
