/**
 * test_live_wake.cpp - Live microphone wake phrase demo
 *
 * Connects: AudioEngine → CaptureRouter → StreamingTranscriber (whisper)
 * → AttentionDetector. Say "Hey Pal" and a question while it runs.
 *
 * Usage: test_live_wake [seconds]   (default 5; Ctrl+C stops early)
 */

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>

#include "hpv/audio/AudioEngine.hpp"
#include "hpv/audio/CaptureRouter.hpp"
#include "hpv/core/BackgroundExecutor.hpp"
#include "hpv/core/Config.hpp"
#include "hpv/stt/WhisperEngine.hpp"
#include "hpv/wake/AttentionDetector.hpp"
#include "hpv/wake/KeywordSpotter.hpp"

static std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

int main(int argc, char* argv[]) {
    int seconds = argc > 1 ? std::atoi(argv[1]) : 5;

    std::cout << "=== Live Wake Test ===" << std::endl;

    hpv::core::Config config;
    if (!std::filesystem::exists(config.whisper.model_path)) {
        std::cout << "[SKIP] Whisper model not found: " << config.whisper.model_path << std::endl;
        return 0;
    }
    if (hpv::audio::AudioEngine::listInputDevices().empty()) {
        std::cout << "[SKIP] No input device" << std::endl;
        return 0;
    }

    std::signal(SIGINT, signal_handler);

    hpv::core::EventLoop loop(hpv::core::EventLoop::ClockMode::Steady);
    hpv::core::BackgroundExecutor worker("recognition");
    hpv::core::SessionContext session;

    hpv::audio::AudioEngine audio(config.audio);
    if (!audio.initialize()) {
        std::cout << "[SKIP] " << audio.lastErrorInfo().describe() << std::endl;
        return 0;
    }

    hpv::audio::CaptureRouter router(loop);
    audio.setInputCallback([&router](const float* samples, size_t count) {
        router.onDeviceAudio(samples, count);
    });

    auto whisper = config.whisper;
    hpv::stt::StreamingTranscriber transcriber(
        loop, worker, router,
        [whisper]() -> std::unique_ptr<hpv::stt::RecognitionEngine> {
            return std::make_unique<hpv::stt::WhisperEngine>(whisper.model_path, whisper.threads);
        },
        hpv::audio::VoiceActivityDetector::withFvad(config.vad),
        config.transcriber);
    if (!transcriber.initialize("", "", config.speech.locale)) {
        std::cerr << "[Error] Could not open the recognizer" << std::endl;
        return 1;
    }

    hpv::wake::AttentionConfig attentionConfig = config.attention;
    attentionConfig.keyword_model.access_key = hpv::core::readKeyFile(config.porcupine_key_file);
    hpv::wake::AttentionDetector attention(loop, router, transcriber,
                                           hpv::wake::createKeywordSpotter(), session,
                                           attentionConfig);
    attention.initialize();
    attention.setOnWake([]() { std::cout << "\n>>> Wake! <<<" << std::endl; });
    attention.setOnUserPartial([](const std::string& text) {
        std::cout << "\r[Partial] " << text << "   " << std::flush;
    });
    attention.setOnUserFinal([](const std::string& text) {
        std::cout << "\n[Question] \"" << text << "\"" << std::endl;
    });

    if (!audio.start()) {
        std::cout << "[SKIP] " << audio.lastErrorInfo().describe() << std::endl;
        return 0;
    }
    if (!attention.start()) {
        std::cerr << "[Error] Attention detector did not start" << std::endl;
        audio.stop();
        return 1;
    }

    std::cout << "\n>>> Listening for " << seconds << "s... say \"Hey Pal\" <<<\n" << std::endl;

    std::function<void()> poll = [&]() {
        if (!g_running) {
            loop.stop();
            return;
        }
        loop.schedule(100, poll);
    };
    loop.schedule(100, poll);
    loop.schedule(static_cast<hpv::core::Millis>(seconds) * 1000, [&loop]() { loop.stop(); });
    loop.run();

    attention.dispose();
    transcriber.destroy();
    audio.stop();
    worker.shutdown();

    auto stats = session.snapshot();
    std::cout << "\n[Stats] wakes=" << stats.wake_detections
              << " fallback=" << stats.fallback_detections
              << " echoes=" << stats.suppressed_echoes
              << " recognition_errors=" << stats.recognition_errors << std::endl;
    std::cout << "[PASS] Live wake session ran" << std::endl;
    return 0;
}
