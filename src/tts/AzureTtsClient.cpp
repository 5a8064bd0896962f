/**
 * AzureTtsClient.cpp - SSML synthesis with cpp-httplib
 */

#include "hpv/tts/AzureTtsClient.hpp"
#include "hpv/audio/WavCodec.hpp"

#include <iostream>
#include <sstream>

#include <httplib.h>

namespace hpv::tts {

struct AzureTtsClient::Impl {
    AzureTtsConfig config;
    std::unique_ptr<httplib::Client> client;
};

AzureTtsClient::AzureTtsClient(AzureTtsConfig config)
    : impl_(std::make_unique<Impl>())
{
    impl_->config = std::move(config);
    const auto& c = impl_->config;

    if (c.key.empty() || (c.region.empty() && c.host_override.empty())) {
        std::cerr << "[AzureTTS] Speech key/region missing, synthesis disabled" << std::endl;
        return;
    }

    std::string host = c.host_override.empty()
        ? "https://" + c.region + ".tts.speech.microsoft.com"
        : c.host_override;

    impl_->client = std::make_unique<httplib::Client>(host);
    impl_->client->set_connection_timeout(c.timeout_ms / 1000, (c.timeout_ms % 1000) * 1000);
    impl_->client->set_read_timeout(c.timeout_ms / 1000, (c.timeout_ms % 1000) * 1000);

    std::cout << "[AzureTTS] Voice " << c.voice << " via " << host << std::endl;
}

AzureTtsClient::~AzureTtsClient() = default;

bool AzureTtsClient::isReady() const {
    return impl_->client != nullptr;
}

std::string AzureTtsClient::escapeXml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c;
        }
    }
    return out;
}

std::string AzureTtsClient::buildSsml(const std::string& text, const AzureTtsConfig& config) {
    std::ostringstream ssml;
    ssml << "<speak version=\"1.0\" xmlns=\"http://www.w3.org/2001/10/synthesis\" "
         << "xmlns:mstts=\"https://www.w3.org/2001/mstts\" xml:lang=\"" << config.locale << "\">"
         << "<voice name=\"" << config.voice << "\">";
    if (!config.style.empty()) {
        ssml << "<mstts:express-as style=\"" << config.style << "\">";
    }
    ssml << "<prosody rate=\"" << config.rate << "\" pitch=\"" << config.pitch << "\">"
         << escapeXml(text)
         << "</prosody>";
    if (!config.style.empty()) {
        ssml << "</mstts:express-as>";
    }
    ssml << "</voice></speak>";
    return ssml.str();
}

SynthesisResult AzureTtsClient::synthesize(const std::string& text) {
    SynthesisResult result;
    if (!impl_->client) {
        result.error = "not configured";
        return result;
    }

    httplib::Headers headers = {
        {"Ocp-Apim-Subscription-Key", impl_->config.key},
        {"X-Microsoft-OutputFormat", "riff-16khz-16bit-mono-pcm"},
        {"User-Agent", "highpal-voice"}
    };

    auto res = impl_->client->Post("/cognitiveservices/v1", headers,
                                   buildSsml(text, impl_->config), "application/ssml+xml");
    if (!res) {
        result.error = "request failed: " + httplib::to_string(res.error());
        return result;
    }
    if (res->status != 200) {
        result.error = "HTTP " + std::to_string(res->status);
        return result;
    }

    auto decoded = audio::decodeWav(res->body);
    if (!decoded.ok) {
        result.error = "bad audio: " + decoded.error;
        return result;
    }

    result.ok = true;
    result.samples = std::move(decoded.samples);
    result.sample_rate = decoded.sample_rate;
    return result;
}

} // namespace hpv::tts
