/**
 * XttsClient.cpp - XTTS v2 wrapper using HTTP server
 */

#include "hpv/tts/XttsClient.hpp"
#include "hpv/audio/WavCodec.hpp"

#include <iostream>
#include <regex>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hpv::tts {

struct XttsClient::Impl {
    std::string server_url;
    std::unique_ptr<httplib::Client> client;
    bool server_available = false;

    Impl(std::string url, int timeout_ms) : server_url(std::move(url)) {
        client = std::make_unique<httplib::Client>(server_url);
        client->set_connection_timeout(2, 0);
        client->set_read_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
    }
};

XttsClient::XttsClient(std::string server_url, int timeout_ms)
    : impl_(std::make_unique<Impl>(std::move(server_url), timeout_ms)) {
}

XttsClient::~XttsClient() = default;

bool XttsClient::checkServer() {
    auto res = impl_->client->Get("/health");
    impl_->server_available = res && res->status == 200;
    if (impl_->server_available) {
        std::cout << "[XTTS] Connected to server at " << impl_->server_url << std::endl;
    } else {
        std::cout << "[XTTS] Server not running at " << impl_->server_url << std::endl;
    }
    return impl_->server_available;
}

bool XttsClient::isReady() const {
    return impl_->server_available;
}

std::vector<std::string> XttsClient::splitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::regex sentence_regex(R"([^.!?]+[.!?]+\s*)");

    auto begin = std::sregex_iterator(text.begin(), text.end(), sentence_regex);
    auto end = std::sregex_iterator();

    size_t consumed = 0;
    for (auto it = begin; it != end; ++it) {
        sentences.push_back(it->str());
        consumed = static_cast<size_t>(it->position() + it->length());
    }

    // Trailing text without a terminal mark
    if (consumed < text.size()) {
        std::string tail = text.substr(consumed);
        if (tail.find_first_not_of(" \t\r\n") != std::string::npos) {
            sentences.push_back(tail);
        }
    }

    return sentences;
}

SynthesisResult XttsClient::synthesize(const std::string& text) {
    SynthesisResult result;
    if (text.empty()) {
        result.error = "empty text";
        return result;
    }

    // The server may have been started after us
    if (!impl_->server_available && !checkServer()) {
        result.error = "XTTS server not available";
        return result;
    }

    for (const auto& sentence : splitSentences(text)) {
        json body = {{"text", sentence}};
        auto res = impl_->client->Post("/synthesize", body.dump(), "application/json");

        if (!res || res->status != 200) {
            impl_->server_available = false;
            result.error = res ? "HTTP " + std::to_string(res->status)
                               : "request failed: " + httplib::to_string(res.error());
            return result;
        }

        auto decoded = audio::decodeWav(res->body);
        if (!decoded.ok) {
            result.error = "bad audio: " + decoded.error;
            return result;
        }

        if (result.sample_rate == 0) {
            result.sample_rate = decoded.sample_rate;
        }
        auto samples = audio::resample(decoded.samples, decoded.sample_rate, result.sample_rate);
        result.samples.insert(result.samples.end(), samples.begin(), samples.end());
    }

    result.ok = !result.samples.empty();
    if (!result.ok) result.error = "no audio returned";
    return result;
}

} // namespace hpv::tts
