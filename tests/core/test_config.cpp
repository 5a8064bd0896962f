/**
 * test_config.cpp - JSON configuration parsing
 */

#include "hpv/core/Config.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using namespace hpv;
using namespace hpv::core;

void test_defaults() {
    Config config;

    assert(config.audio.sample_rate == 16000);
    assert(config.vad.min_speech_duration_ms == 300);
    assert(config.vad.positive_threshold > 0.8f);
    assert(config.conversation.listen_mode == conversation::ListenMode::Wake);
    assert(config.conversation.history_window == 5);
    assert(config.interrupts.fade_duration_ms == 300);
    assert(config.transcriber.low_confidence_threshold == 0.9f);
    assert(config.responder.base_url == "http://localhost:8003");
    assert(config.speech.recognizer == "whisper");

    bool hasHeyPal = false;
    for (const auto& phrase : config.transcriber.phrases) {
        if (phrase == "Hey Pal") hasHeyPal = true;
    }
    assert(hasHeyPal);

    std::cout << "[PASS] test_defaults" << std::endl;
}

void test_overrides() {
    const std::string text = R"({
        "audio": { "sample_rate": 48000, "echo_cancellation": false },
        "vad": { "positive_threshold": 0.9, "debounce_ms": 250 },
        "speech": { "recognizer": "azure", "voice": "en-GB-SoniaNeural" },
        "transcriber": { "end_silence_timeout_ms": 1500, "phrases": ["Pal"] },
        "wake": {
            "wake_words": ["pal"],
            "bigrams": [["okay", "pal"]],
            "keyword_paths": ["a.ppn", "b.ppn"],
            "sensitivity": 0.7
        },
        "conversation": {
            "listen_mode": "direct",
            "end_phrases": ["bye"],
            "fade_duration_ms": 500,
            "history_window": 3
        },
        "responder": { "base_url": "http://tutor:9000" }
    })";

    Config config;
    std::string error;
    bool ok = parseConfig(text, config, &error);
    assert(ok);
    assert(error.empty());

    assert(config.audio.sample_rate == 48000);
    assert(config.vad.sample_rate == 48000);
    assert(!config.echo_cancellation);
    assert(config.vad.positive_threshold == 0.9f);
    assert(config.vad.debounce_ms == 250);
    assert(config.vad.min_speech_frames == 5);   // Untouched

    assert(config.speech.recognizer == "azure");
    assert(config.speech.voice == "en-GB-SoniaNeural");
    assert(config.speech.locale == "en-US");

    assert(config.transcriber.end_silence_timeout_ms == 1500);
    assert(config.transcriber.phrases.size() == 1);

    assert(config.attention.matcher.wake_words.size() == 1);
    assert(config.attention.matcher.bigrams.size() == 1);
    assert(config.attention.matcher.bigrams[0].first == "okay");
    assert(config.attention.keyword_model.sensitivities.size() == 2);
    assert(config.attention.keyword_model.sensitivities[1] == 0.7f);

    assert(config.conversation.listen_mode == conversation::ListenMode::Direct);
    assert(config.conversation.end_phrases.size() == 1);
    assert(config.conversation.history_window == 3);
    assert(config.interrupts.fade_duration_ms == 500);

    assert(config.responder.base_url == "http://tutor:9000");
    assert(config.responder.path == "/ask_question/");

    std::cout << "[PASS] test_overrides" << std::endl;
}

void test_rejects_bad_input() {
    Config config;
    config.responder.base_url = "http://keep";
    std::string error;

    assert(!parseConfig("{ not json", config, &error));
    assert(!error.empty());

    error.clear();
    assert(!parseConfig(R"({"conversation": {"listen_mode": "always"}})", config, &error));
    assert(error.find("listen_mode") != std::string::npos);

    error.clear();
    assert(!parseConfig(R"({"vad": {"debounce_ms": "soon"}})", config, &error));
    assert(!error.empty());

    assert(!parseConfig("[1, 2]", config, nullptr));

    // A failed parse leaves the previous values alone
    assert(config.responder.base_url == "http://keep");
    assert(config.vad.debounce_ms == 500);

    std::cout << "[PASS] test_rejects_bad_input" << std::endl;
}

void test_rejects_out_of_range() {
    Config config;
    std::string error;

    // Each of these used to reach a division by zero in the VAD
    assert(!parseConfig(R"({"audio": {"sample_rate": 0}})", config, &error));
    assert(error.find("audio.sample_rate") != std::string::npos);

    error.clear();
    assert(!parseConfig(R"({"vad": {"frame_samples": 10}})", config, &error));
    assert(error.find("vad.frame_samples") != std::string::npos);

    error.clear();
    assert(!parseConfig(R"({"audio": {"sample_rate": 8000}, "vad": {"frame_samples": 40}})",
                        config, &error));
    assert(error.find("vad.frame_samples") != std::string::npos);

    error.clear();
    assert(!parseConfig(R"({"vad": {"positive_threshold": 1.5}})", config, &error));
    assert(error.find("vad.positive_threshold") != std::string::npos);

    error.clear();
    assert(!parseConfig(R"({"vad": {"positive_threshold": 0.5, "negative_threshold": 0.7}})",
                        config, &error));
    assert(error.find("vad.negative_threshold") != std::string::npos);

    error.clear();
    assert(!parseConfig(R"({"vad": {"redemption_frames": 0}})", config, &error));
    assert(error.find("vad.redemption_frames") != std::string::npos);

    error.clear();
    assert(!parseConfig(R"({"transcriber": {"end_silence_timeout_ms": -5}})", config, &error));
    assert(error.find("transcriber.end_silence_timeout_ms") != std::string::npos);

    error.clear();
    assert(!parseConfig(R"({"conversation": {"fade_duration_ms": -1}})", config, &error));
    assert(error.find("conversation.fade_duration_ms") != std::string::npos);

    error.clear();
    assert(!parseConfig(R"({"audio": {"frames_per_buffer": 0}})", config, &error));
    assert(error.find("audio.frames_per_buffer") != std::string::npos);

    // Nothing from the rejected files was applied
    assert(config.audio.sample_rate == 16000);
    assert(config.vad.frame_samples == 480);
    assert(config.vad.redemption_frames == 10);

    // Boundary values are accepted
    error.clear();
    assert(parseConfig(R"({"audio": {"sample_rate": 8000}, "vad": {"frame_samples": 80}})",
                       config, &error));
    assert(error.empty());
    assert(config.vad.sample_rate == 8000);

    std::cout << "[PASS] test_rejects_out_of_range" << std::endl;
}

void test_load_missing_file() {
    Config config;
    std::string error;
    assert(loadConfig("/nonexistent/highpal.json", config, &error));
    assert(error.empty());
    assert(config.audio.sample_rate == 16000);

    std::cout << "[PASS] test_load_missing_file" << std::endl;
}

void test_load_file_and_key() {
    const std::string configPath = "test_config_tmp.json";
    const std::string keyPath = "test_config_tmp.key";

    {
        std::ofstream out(configPath);
        out << R"({"conversation": {"speak_greeting": false}})";
    }
    {
        std::ofstream out(keyPath);
        out << "abc123  \r\nsecond line\n";
    }

    Config config;
    assert(loadConfig(configPath, config));
    assert(!config.conversation.speak_greeting);

    assert(readKeyFile(keyPath) == "abc123");
    assert(readKeyFile("/nonexistent/key").empty());

    std::remove(configPath.c_str());
    std::remove(keyPath.c_str());

    std::cout << "[PASS] test_load_file_and_key" << std::endl;
}

void test_environment() {
    setenv("HPV_SPEECH_KEY", "env-key", 1);
    setenv("HPV_SPEECH_REGION", "westeurope", 1);

    Config config;
    config.speech.key = "file-key";
    applyEnvironment(config);
    assert(config.speech.key == "env-key");
    assert(config.speech.region == "westeurope");

    unsetenv("HPV_SPEECH_KEY");
    unsetenv("HPV_SPEECH_REGION");

    std::cout << "[PASS] test_environment" << std::endl;
}

int main() {
    std::cout << "=== Config Tests ===" << std::endl;

    test_defaults();
    test_overrides();
    test_rejects_bad_input();
    test_rejects_out_of_range();
    test_load_missing_file();
    test_load_file_and_key();
    test_environment();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
