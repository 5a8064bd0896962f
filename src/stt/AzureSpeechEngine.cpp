/**
 * AzureSpeechEngine.cpp - REST recognition with cpp-httplib
 */

#include "hpv/stt/AzureSpeechEngine.hpp"
#include "hpv/audio/WavCodec.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hpv::stt {

namespace {

constexpr const char* kRecognitionPath =
    "/speech/recognition/conversation/cognitiveservices/v1";

} // namespace

struct AzureSpeechEngine::Impl {
    std::unique_ptr<httplib::Client> client;
    RecognitionSettings settings;
    std::string host_override;
    int timeout_ms;
    std::string error;

    Impl(int timeout, std::string host) : host_override(std::move(host)), timeout_ms(timeout) {}
};

AzureSpeechEngine::AzureSpeechEngine(int timeout_ms, std::string host_override)
    : impl_(std::make_unique<Impl>(timeout_ms, std::move(host_override))) {
}

AzureSpeechEngine::~AzureSpeechEngine() = default;

bool AzureSpeechEngine::open(const RecognitionSettings& settings) {
    if (settings.key.empty() || (settings.region.empty() && impl_->host_override.empty())) {
        impl_->error = "speech key and region are required";
        std::cerr << "[AzureSpeech] " << impl_->error << std::endl;
        return false;
    }

    impl_->settings = settings;

    std::string host = impl_->host_override.empty()
        ? "https://" + settings.region + ".stt.speech.microsoft.com"
        : impl_->host_override;

    impl_->client = std::make_unique<httplib::Client>(host);
    const int t = impl_->timeout_ms;
    impl_->client->set_connection_timeout(t / 1000, (t % 1000) * 1000);
    impl_->client->set_read_timeout(t / 1000, (t % 1000) * 1000);
    impl_->client->set_write_timeout(t / 1000, (t % 1000) * 1000);

    if (!settings.phrases.empty()) {
        std::cout << "[AzureSpeech] Short-audio endpoint ignores phrase lists ("
                  << settings.phrases.size() << " phrases not sent)" << std::endl;
    }

    std::cout << "[AzureSpeech] Ready (" << host << ", locale=" << settings.locale << ")" << std::endl;
    return true;
}

bool AzureSpeechEngine::isReady() const {
    return impl_->client != nullptr;
}

RecognitionResult AzureSpeechEngine::parseResponse(const std::string& body) {
    RecognitionResult result;

    try {
        json res = json::parse(body);
        std::string status = res.value("RecognitionStatus", "");

        if (status == "NoMatch" || status == "InitialSilenceTimeout" ||
            status == "BabbleTimeout") {
            result.ok = true;
            return result;
        }
        if (status != "Success") {
            result.error = "recognition status " + status;
            return result;
        }

        result.ok = true;
        result.text = res.value("DisplayText", "");

        if (res.contains("NBest") && res["NBest"].is_array() && !res["NBest"].empty()) {
            const auto& best = res["NBest"][0];
            result.confidence = best.value("Confidence", 0.0f);
            if (result.text.empty()) {
                result.text = best.value("Display", "");
            }
        }
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

RecognitionResult AzureSpeechEngine::recognize(const std::vector<float>& pcm, bool interim) {
    RecognitionResult result;
    if (!impl_->client) {
        result.error = "engine not opened";
        return result;
    }
    if (interim || pcm.empty()) {
        result.ok = true;
        return result;
    }

    auto wav = audio::encodeWavPcm16(pcm, 16000);
    std::string body(wav.begin(), wav.end());

    httplib::Headers headers = {
        {"Ocp-Apim-Subscription-Key", impl_->settings.key},
        {"Accept", "application/json"}
    };
    std::string path = std::string(kRecognitionPath) + "?language=" +
                       impl_->settings.locale + "&format=detailed";

    auto res = impl_->client->Post(path, headers, body,
                                   "audio/wav; codecs=audio/pcm; samplerate=16000");

    if (!res) {
        result.error = "request failed: " + httplib::to_string(res.error());
        impl_->error = result.error;
        return result;
    }
    if (res->status != 200) {
        result.error = "HTTP " + std::to_string(res->status);
        impl_->error = result.error;
        return result;
    }

    result = parseResponse(res->body);
    if (!result.ok) {
        impl_->error = result.error;
    }
    return result;
}

std::string AzureSpeechEngine::lastError() const {
    return impl_->error;
}

} // namespace hpv::stt
