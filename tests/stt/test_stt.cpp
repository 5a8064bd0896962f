/**
 * test_stt.cpp - Recognition engine tests
 */

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "hpv/stt/AzureSpeechEngine.hpp"
#include "hpv/stt/WhisperEngine.hpp"

using namespace hpv::stt;

static const char* kModelPath = "models/whisper/ggml-small-q5_1.bin";

void test_language_from_locale() {
    std::cout << "--- Test: Locale to Language ---" << std::endl;

    assert(languageFromLocale("en-US") == "en");
    assert(languageFromLocale("pt_BR") == "pt");
    assert(languageFromLocale("DE") == "de");
    assert(languageFromLocale("") == "en");

    std::cout << "[PASS] Locale mapping" << std::endl;
}

void test_whisper_initialization() {
    std::cout << "\n--- Test: WhisperEngine Initialization ---" << std::endl;

    WhisperEngine missing("/nonexistent/model.bin", 2);
    RecognitionSettings settings;
    assert(!missing.open(settings));
    assert(!missing.isReady());
    assert(!missing.lastError().empty());
    assert(!missing.recognize(std::vector<float>(1600, 0.0f), false).ok);

    WhisperEngine engine(kModelPath, 4);
    if (engine.open(settings)) {
        std::cout << "[PASS] Model loaded successfully" << std::endl;
        std::cout << "  Info: " << engine.getModelInfo() << std::endl;
    } else {
        std::cout << "[SKIP] Model not available - download with:" << std::endl;
        std::cout << "  ./scripts/download_models.sh whisper-small" << std::endl;
    }
}

void test_whisper_silence() {
    std::cout << "\n--- Test: Transcription with Silence ---" << std::endl;

    WhisperEngine engine(kModelPath, 4);
    RecognitionSettings settings;
    settings.phrases = {"Hey Pal", "photosynthesis"};
    if (!engine.open(settings)) {
        std::cout << "[SKIP] Model not available" << std::endl;
        return;
    }

    // 1 second of silence (16kHz)
    std::vector<float> silence(16000, 0.0f);
    RecognitionResult result = engine.recognize(silence, false);

    assert(result.ok);
    assert(result.confidence >= 0.0f && result.confidence <= 1.0f);
    std::cout << "  Result: \"" << result.text << "\" (confidence "
              << result.confidence << ")" << std::endl;
    std::cout << "[PASS] Transcription of silence works" << std::endl;
}

void test_whisper_tone() {
    std::cout << "\n--- Test: Transcription with Tone ---" << std::endl;

    WhisperEngine engine(kModelPath, 4);
    if (!engine.open(RecognitionSettings{})) {
        std::cout << "[SKIP] Model not available" << std::endl;
        return;
    }

    // 2 seconds of 440Hz tone (A4 note)
    const int sample_rate = 16000;
    const float freq = 440.0f;
    const int duration_samples = sample_rate * 2;

    std::vector<float> tone(duration_samples);
    for (int i = 0; i < duration_samples; ++i) {
        tone[i] = 0.3f * std::sin(2.0f * static_cast<float>(M_PI) * freq * i / sample_rate);
    }

    RecognitionResult result = engine.recognize(tone, true);
    assert(result.ok);

    std::cout << "  Result: \"" << result.text << "\"" << std::endl;
    std::cout << "[PASS] Transcription of tone works" << std::endl;
}

void test_azure_parse_response() {
    std::cout << "\n--- Test: Azure Response Parsing ---" << std::endl;

    auto success = AzureSpeechEngine::parseResponse(R"({
        "RecognitionStatus": "Success",
        "DisplayText": "What is photosynthesis?",
        "NBest": [{"Confidence": 0.93, "Display": "What is photosynthesis?"}]
    })");
    assert(success.ok);
    assert(success.text == "What is photosynthesis?");
    assert(std::fabs(success.confidence - 0.93f) < 1e-4f);

    auto fromNBest = AzureSpeechEngine::parseResponse(R"({
        "RecognitionStatus": "Success",
        "NBest": [{"Confidence": 0.5, "Display": "hello"}]
    })");
    assert(fromNBest.ok && fromNBest.text == "hello");

    // No speech is a successful empty result, not an error
    auto silence = AzureSpeechEngine::parseResponse(R"({"RecognitionStatus": "InitialSilenceTimeout"})");
    assert(silence.ok);
    assert(silence.text.empty());

    auto failed = AzureSpeechEngine::parseResponse(R"({"RecognitionStatus": "Error"})");
    assert(!failed.ok);
    assert(failed.error.find("Error") != std::string::npos);

    auto garbage = AzureSpeechEngine::parseResponse("<html>");
    assert(!garbage.ok);
    assert(garbage.error.find("JSON") != std::string::npos);

    std::cout << "[PASS] Azure response parsing" << std::endl;
}

void test_azure_requires_credentials() {
    std::cout << "\n--- Test: Azure Credentials ---" << std::endl;

    AzureSpeechEngine engine;
    RecognitionSettings settings;
    assert(!engine.open(settings));
    assert(!engine.isReady());
    assert(!engine.lastError().empty());
    assert(!engine.supportsInterim());

    auto result = engine.recognize(std::vector<float>(1600, 0.0f), false);
    assert(!result.ok);

    settings.key = "test-key";
    settings.region = "westus";
    assert(engine.open(settings));
    assert(engine.isReady());

    // Partial decodes are never uploaded
    auto interim = engine.recognize(std::vector<float>(1600, 0.0f), true);
    assert(interim.ok && interim.text.empty());

    std::cout << "[PASS] Azure credentials" << std::endl;
}

int main() {
    std::cout << "=== Recognition Engine Tests ===" << std::endl;

    test_language_from_locale();
    test_whisper_initialization();
    test_whisper_silence();
    test_whisper_tone();
    test_azure_parse_response();
    test_azure_requires_credentials();

    std::cout << "\nTests complete!" << std::endl;
    return 0;
}
