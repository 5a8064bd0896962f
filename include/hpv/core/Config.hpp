/**
 * Config.hpp - Runtime configuration for highpal-voice
 *
 * Loaded from a JSON file; every key is optional and missing ones keep the
 * defaults below. Secrets come from the environment (HPV_SPEECH_KEY,
 * HPV_SPEECH_REGION) and the Porcupine key file rather than the JSON.
 */

#pragma once

#include "hpv/audio/AudioEngine.hpp"
#include "hpv/audio/PlaybackController.hpp"
#include "hpv/audio/VoiceActivityDetector.hpp"
#include "hpv/conversation/ConversationLoop.hpp"
#include "hpv/conversation/InterruptManager.hpp"
#include "hpv/stt/StreamingTranscriber.hpp"
#include "hpv/wake/AttentionDetector.hpp"

#include <string>

namespace hpv::core {

struct SpeechSettings {
    std::string key;
    std::string region;
    std::string locale = "en-US";
    std::string recognizer = "whisper";          // "whisper" or "azure"
    std::string voice = "en-US-AriaNeural";
    std::string style = "friendly";
    std::string fallback_tts_url = "http://localhost:5050";   // XTTS server; empty disables
    int timeout_ms = 10000;
};

struct WhisperSettings {
    std::string model_path = "models/whisper/ggml-small-q5_1.bin";
    int threads = 4;
};

struct ResponderSettings {
    std::string base_url = "http://localhost:8003";
    std::string path = "/ask_question/";
    int timeout_ms = 30000;
};

struct Config {
    audio::AudioConfig audio;
    bool echo_cancellation = true;
    audio::PlaybackOptions playback;
    audio::VadConfig vad;

    SpeechSettings speech;
    WhisperSettings whisper;
    stt::TranscriberConfig transcriber = defaultTranscriber();

    std::string porcupine_key_file = ".porcupine_key";
    wake::AttentionConfig attention;

    conversation::ConversationConfig conversation;
    conversation::InterruptConfig interrupts;
    ResponderSettings responder;

    static stt::TranscriberConfig defaultTranscriber();
};

/**
 * Parse JSON text over the defaults. Returns false (and sets error) on
 * malformed JSON or a value of the wrong type.
 */
bool parseConfig(const std::string& text, Config& config, std::string* error = nullptr);

/**
 * Read and parse path. A missing file is not an error: defaults are kept.
 */
bool loadConfig(const std::string& path, Config& config, std::string* error = nullptr);

/**
 * HPV_SPEECH_KEY / HPV_SPEECH_REGION override the file.
 */
void applyEnvironment(Config& config);

/**
 * First line of a key file, trailing whitespace trimmed; empty if unreadable.
 */
std::string readKeyFile(const std::string& path);

} // namespace hpv::core
