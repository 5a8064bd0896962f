/**
 * Config.cpp - JSON configuration via nlohmann_json
 */

#include "hpv/core/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hpv::core {

stt::TranscriberConfig Config::defaultTranscriber() {
    stt::TranscriberConfig t;
    t.phrases = {
        // Wake variants twice for extra weight
        "Pal", "Hey Pal", "Listen Pal",
        "Pal", "Hey Pal", "Listen Pal",
        "sine", "cosine", "tangent", "theta", "alpha", "beta", "gamma",
        "derivative", "integral", "equation", "formula", "calculate",
        "square root", "factorial", "exponential", "logarithm",
        "photosynthesis", "mitochondria", "DNA", "RNA", "chromosome",
        "molecule", "atom", "electron", "proton", "neutron",
        "explain", "understand", "clarify", "example", "practice",
        "homework", "assignment", "test", "exam", "quiz"
    };
    return t;
}

namespace {

// Overwrite target only when the key is present
template <typename T>
void readKey(const json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    return (it != root.end() && it->is_object()) ? *it : empty;
}

void readAudio(const json& j, Config& c) {
    readKey(j, "sample_rate", c.audio.sample_rate);
    readKey(j, "frames_per_buffer", c.audio.frames_per_buffer);
    readKey(j, "input_device", c.audio.input_device);
    readKey(j, "output_device", c.audio.output_device);
    readKey(j, "playback_buffer_seconds", c.audio.playback_buffer_seconds);
    readKey(j, "echo_cancellation", c.echo_cancellation);
    readKey(j, "playback_chunk_ms", c.playback.chunk_ms);
    readKey(j, "playback_lead_ms", c.playback.lead_ms);
}

void readVad(const json& j, Config& c) {
    readKey(j, "frame_samples", c.vad.frame_samples);
    readKey(j, "positive_threshold", c.vad.positive_threshold);
    readKey(j, "negative_threshold", c.vad.negative_threshold);
    readKey(j, "min_speech_frames", c.vad.min_speech_frames);
    readKey(j, "pre_speech_pad_frames", c.vad.pre_speech_pad_frames);
    readKey(j, "redemption_frames", c.vad.redemption_frames);
    readKey(j, "min_speech_duration_ms", c.vad.min_speech_duration_ms);
    readKey(j, "debounce_ms", c.vad.debounce_ms);
}

void readSpeech(const json& j, Config& c) {
    readKey(j, "key", c.speech.key);
    readKey(j, "region", c.speech.region);
    readKey(j, "locale", c.speech.locale);
    readKey(j, "recognizer", c.speech.recognizer);
    readKey(j, "voice", c.speech.voice);
    readKey(j, "style", c.speech.style);
    readKey(j, "fallback_tts_url", c.speech.fallback_tts_url);
    readKey(j, "timeout_ms", c.speech.timeout_ms);
}

void readTranscriber(const json& j, Config& c) {
    auto& t = c.transcriber;
    readKey(j, "initial_silence_timeout_ms", t.initial_silence_timeout_ms);
    readKey(j, "end_silence_timeout_ms", t.end_silence_timeout_ms);
    readKey(j, "interim_interval_ms", t.interim_interval_ms);
    readKey(j, "low_confidence_threshold", t.low_confidence_threshold);
    readKey(j, "max_segment_ms", t.max_segment_ms);
    readKey(j, "phrases", t.phrases);
    readKey(j, "remove_disfluencies", t.formatting.remove_disfluencies);
    readKey(j, "restore_punctuation", t.formatting.restore_punctuation);
    readKey(j, "fillers", t.formatting.fillers);
}

void readWake(const json& j, Config& c) {
    auto& a = c.attention;
    readKey(j, "porcupine_key_file", c.porcupine_key_file);
    readKey(j, "params_path", a.keyword_model.params_path);
    readKey(j, "keyword_paths", a.keyword_model.keyword_paths);

    auto sens = j.find("sensitivity");
    if (sens != j.end() && sens->is_number()) {
        a.keyword_model.sensitivities.assign(a.keyword_model.keyword_paths.size(),
                                             sens->get<float>());
    }

    readKey(j, "wake_words", a.matcher.wake_words);
    readKey(j, "fuzzy_candidates", a.matcher.fuzzy_candidates);
    readKey(j, "echo_overlap_threshold", a.matcher.echo_overlap_threshold);

    auto bigrams = j.find("bigrams");
    if (bigrams != j.end() && bigrams->is_array()) {
        a.matcher.bigrams.clear();
        for (const auto& pair : *bigrams) {
            a.matcher.bigrams.emplace_back(pair.at(0).get<std::string>(),
                                           pair.at(1).get<std::string>());
        }
    }

    readKey(j, "capture_quiet_ms", a.capture_quiet_ms);
    readKey(j, "capture_quick_ms", a.capture_quick_ms);
    readKey(j, "long_utterance_words", a.long_utterance_words);
    readKey(j, "capture_timeout_ms", a.capture_timeout_ms);
    readKey(j, "wake_debounce_ms", a.wake_debounce_ms);
    readKey(j, "echo_tail_ms", a.echo_tail_ms);
    readKey(j, "errors_before_restart", a.errors_before_restart);
    readKey(j, "restart_delay_ms", a.restart.initial_delay_ms);
    readKey(j, "restart_max_delay_ms", a.restart.max_delay_ms);
}

void readConversation(const json& j, Config& c) {
    auto& v = c.conversation;

    auto mode = j.find("listen_mode");
    if (mode != j.end()) {
        auto parsed = conversation::parseListenMode(mode->get<std::string>());
        if (!parsed) {
            throw std::invalid_argument("conversation.listen_mode must be \"wake\" or \"direct\"");
        }
        v.listen_mode = *parsed;
    }

    readKey(j, "end_phrases", v.end_phrases);
    readKey(j, "greeting", v.greeting);
    readKey(j, "closing_line", v.closing_line);
    readKey(j, "end_request_line", v.end_request_line);
    readKey(j, "fallback_line", v.fallback_line);
    readKey(j, "apology_line", v.apology_line);
    readKey(j, "speak_greeting", v.speak_greeting);
    readKey(j, "inactivity_timeout_ms", v.inactivity_timeout_ms);
    readKey(j, "inter_turn_pause_ms", v.inter_turn_pause_ms);
    readKey(j, "resume_delay_ms", v.resume_delay_ms);
    readKey(j, "listen_timeout_ms", v.listen_timeout_ms);
    readKey(j, "barge_in_guard_ms", v.barge_in_guard_ms);
    readKey(j, "history_window", v.history_window);
    readKey(j, "fade_duration_ms", c.interrupts.fade_duration_ms);
}

void require(bool ok, const std::string& message) {
    if (!ok) throw std::invalid_argument(message);
}

void requireRange(double value, double lo, double hi, const char* key) {
    std::ostringstream message;
    message << key << " must be between " << lo << " and " << hi << " (got " << value << ")";
    require(value >= lo && value <= hi, message.str());
}

// Values that would otherwise divide by zero or stall a component
void validate(const Config& c) {
    int rate = c.audio.sample_rate;
    require(rate == 8000 || rate == 16000 || rate == 32000 || rate == 48000,
            "audio.sample_rate must be 8000, 16000, 32000 or 48000 (got " + std::to_string(rate) + ")");
    requireRange(c.audio.frames_per_buffer, 1, rate, "audio.frames_per_buffer");
    requireRange(c.audio.playback_buffer_seconds, 1, 600, "audio.playback_buffer_seconds");
    requireRange(c.playback.chunk_ms, 1, 1000, "audio.playback_chunk_ms");
    requireRange(c.playback.lead_ms, 1, 5000, "audio.playback_lead_ms");

    // libfvad scores 10ms slices
    requireRange(c.vad.frame_samples, rate / 100, rate, "vad.frame_samples");
    requireRange(c.vad.positive_threshold, 0.0, 1.0, "vad.positive_threshold");
    requireRange(c.vad.negative_threshold, 0.0, c.vad.positive_threshold, "vad.negative_threshold");
    requireRange(c.vad.min_speech_frames, 1, 1000, "vad.min_speech_frames");
    requireRange(c.vad.pre_speech_pad_frames, 0, 1000, "vad.pre_speech_pad_frames");
    requireRange(c.vad.redemption_frames, 1, 1000, "vad.redemption_frames");
    requireRange(c.vad.min_speech_duration_ms, 0, 60000, "vad.min_speech_duration_ms");
    requireRange(c.vad.debounce_ms, 0, 60000, "vad.debounce_ms");

    const auto& t = c.transcriber;
    requireRange(t.initial_silence_timeout_ms, 1, 600000, "transcriber.initial_silence_timeout_ms");
    requireRange(t.end_silence_timeout_ms, 1, 60000, "transcriber.end_silence_timeout_ms");
    requireRange(t.interim_interval_ms, 0, 60000, "transcriber.interim_interval_ms");
    requireRange(t.low_confidence_threshold, 0.0, 1.0, "transcriber.low_confidence_threshold");
    requireRange(t.max_segment_ms, 1000, 600000, "transcriber.max_segment_ms");

    const auto& a = c.attention;
    requireRange(a.matcher.echo_overlap_threshold, 0.0, 1.0, "wake.echo_overlap_threshold");
    requireRange(a.capture_quiet_ms, 1, 60000, "wake.capture_quiet_ms");
    requireRange(a.capture_quick_ms, 1, 60000, "wake.capture_quick_ms");
    requireRange(a.capture_timeout_ms, 1, 600000, "wake.capture_timeout_ms");
    requireRange(a.wake_debounce_ms, 0, 60000, "wake.wake_debounce_ms");
    requireRange(a.echo_tail_ms, 0, 60000, "wake.echo_tail_ms");
    requireRange(a.errors_before_restart, 1, 1000, "wake.errors_before_restart");
    requireRange(static_cast<double>(a.restart.initial_delay_ms), 1, 600000, "wake.restart_delay_ms");
    requireRange(static_cast<double>(a.restart.max_delay_ms),
                 static_cast<double>(a.restart.initial_delay_ms), 600000, "wake.restart_max_delay_ms");

    const auto& v = c.conversation;
    requireRange(v.inactivity_timeout_ms, 1, 86400000, "conversation.inactivity_timeout_ms");
    requireRange(v.inter_turn_pause_ms, 0, 60000, "conversation.inter_turn_pause_ms");
    requireRange(v.resume_delay_ms, 0, 60000, "conversation.resume_delay_ms");
    requireRange(v.listen_timeout_ms, 1, 600000, "conversation.listen_timeout_ms");
    requireRange(v.barge_in_guard_ms, 0, 60000, "conversation.barge_in_guard_ms");
    requireRange(c.interrupts.fade_duration_ms, 0, 10000, "conversation.fade_duration_ms");

    requireRange(c.whisper.threads, 1, 256, "whisper.threads");
    requireRange(c.speech.timeout_ms, 1, 600000, "speech.timeout_ms");
    requireRange(c.responder.timeout_ms, 1, 600000, "responder.timeout_ms");
}

void readResponder(const json& j, Config& c) {
    readKey(j, "base_url", c.responder.base_url);
    readKey(j, "path", c.responder.path);
    readKey(j, "timeout_ms", c.responder.timeout_ms);
}

} // namespace

bool parseConfig(const std::string& text, Config& config, std::string* error) {
    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            throw std::invalid_argument("top level must be an object");
        }

        Config parsed = config;
        readAudio(section(root, "audio"), parsed);
        readVad(section(root, "vad"), parsed);
        readSpeech(section(root, "speech"), parsed);
        readKey(section(root, "whisper"), "model_path", parsed.whisper.model_path);
        readKey(section(root, "whisper"), "threads", parsed.whisper.threads);
        readTranscriber(section(root, "transcriber"), parsed);
        readWake(section(root, "wake"), parsed);
        readConversation(section(root, "conversation"), parsed);
        readResponder(section(root, "responder"), parsed);

        parsed.vad.sample_rate = parsed.audio.sample_rate;
        validate(parsed);
        config = std::move(parsed);
        return true;
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        return false;
    }
}

bool loadConfig(const std::string& path, Config& config, std::string* error) {
    std::ifstream file(path);
    if (!file.good()) {
        std::cout << "[Config] " << path << " not found, using defaults" << std::endl;
        return true;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string message;
    if (!parseConfig(buffer.str(), config, &message)) {
        std::cerr << "[Config] " << path << ": " << message << std::endl;
        if (error) *error = message;
        return false;
    }

    std::cout << "[Config] Loaded " << path << std::endl;
    return true;
}

void applyEnvironment(Config& config) {
    if (const char* key = std::getenv("HPV_SPEECH_KEY")) {
        config.speech.key = key;
    }
    if (const char* region = std::getenv("HPV_SPEECH_REGION")) {
        config.speech.region = region;
    }
}

std::string readKeyFile(const std::string& path) {
    std::string key;
    std::ifstream key_file(path);
    if (key_file.good()) {
        std::getline(key_file, key);
        while (!key.empty() && (key.back() == '\n' || key.back() == '\r' || key.back() == ' ')) {
            key.pop_back();
        }
    }
    return key;
}

} // namespace hpv::core
