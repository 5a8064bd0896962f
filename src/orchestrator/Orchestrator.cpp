/**
 * Orchestrator.cpp - Composition root for the voice conversation
 *
 * Connects: AudioEngine → CaptureRouter → {barge-in VAD, keyword spotter |
 * transcriber} → ConversationLoop → ResponseGenerator → Speaker →
 * PlaybackController → AudioEngine
 */

#include "hpv/Orchestrator.hpp"
#include "hpv/audio/AudioEngine.hpp"
#include "hpv/audio/CaptureRouter.hpp"
#include "hpv/audio/EchoCanceller.hpp"
#include "hpv/audio/PlaybackController.hpp"
#include "hpv/audio/VoiceActivityDetector.hpp"
#include "hpv/conversation/InterruptManager.hpp"
#include "hpv/core/BackgroundExecutor.hpp"
#include "hpv/llm/HttpResponseGenerator.hpp"
#include "hpv/stt/AzureSpeechEngine.hpp"
#include "hpv/stt/StreamingTranscriber.hpp"
#include "hpv/stt/WhisperEngine.hpp"
#include "hpv/tts/AzureTtsClient.hpp"
#include "hpv/tts/Speaker.hpp"
#include "hpv/tts/XttsClient.hpp"
#include "hpv/wake/AttentionDetector.hpp"
#include "hpv/wake/KeywordSpotter.hpp"

#include <iostream>

namespace hpv {

struct Orchestrator::Impl {
    explicit Impl(core::Config c)
        : config(std::move(c))
        , loop(core::EventLoop::ClockMode::Steady)
        , recognitionWorker("recognition")
        , networkWorker("network") {}

    core::Config config;

    // Declared in dependency order; destroyed in reverse
    core::EventLoop loop;
    core::BackgroundExecutor recognitionWorker;
    core::BackgroundExecutor networkWorker;
    core::SessionContext session;

    std::unique_ptr<audio::AudioEngine> audio;
    std::unique_ptr<audio::EchoCanceller> aec;
    std::unique_ptr<audio::CaptureRouter> router;
    std::unique_ptr<audio::PlaybackController> playback;
    std::unique_ptr<audio::VoiceActivityDetector> bargeIn;

    std::unique_ptr<stt::StreamingTranscriber> transcriber;
    std::unique_ptr<wake::AttentionDetector> attention;
    std::unique_ptr<tts::Speaker> speaker;
    std::unique_ptr<llm::HttpResponseGenerator> generator;
    std::unique_ptr<conversation::InterruptManager> interrupts;
    std::unique_ptr<conversation::ConversationLoop> conversation;

    OrchestratorCallbacks callbacks;
    bool initialized = false;
    bool running = false;

    stt::StreamingTranscriber::EngineFactory engineFactory() const {
        core::SpeechSettings speech = config.speech;
        core::WhisperSettings whisper = config.whisper;

        if (speech.recognizer == "azure") {
            return [speech]() -> std::unique_ptr<stt::RecognitionEngine> {
                return std::make_unique<stt::AzureSpeechEngine>(speech.timeout_ms);
            };
        }
        return [whisper]() -> std::unique_ptr<stt::RecognitionEngine> {
            return std::make_unique<stt::WhisperEngine>(whisper.model_path, whisper.threads);
        };
    }

    bool initAudio() {
        audio = std::make_unique<audio::AudioEngine>(config.audio);
        if (!audio->initialize()) {
            std::cerr << "[Orchestrator] AudioEngine init failed: "
                      << audio->lastErrorInfo().describe() << std::endl;
            return false;
        }
        std::cout << "[Orchestrator] AudioEngine OK" << std::endl;

        router = std::make_unique<audio::CaptureRouter>(loop);
        playback = std::make_unique<audio::PlaybackController>(loop, *audio, config.playback);

        if (config.echo_cancellation) {
            aec = std::make_unique<audio::EchoCanceller>(config.audio.sample_rate);
            if (aec->isActive()) {
                router->setEchoCanceller(aec.get());
                playback->setRenderTap([this](const float* samples, size_t count) {
                    aec->feedRender(samples, count);
                });
                std::cout << "[Orchestrator] EchoCanceller OK" << std::endl;
            } else {
                std::cerr << "[Orchestrator] EchoCanceller unavailable, capture is unprocessed" << std::endl;
                aec.reset();
            }
        }

        audio->setInputCallback([this](const float* samples, size_t count) {
            router->onDeviceAudio(samples, count);
        });

        bargeIn = audio::VoiceActivityDetector::withFvad(config.vad);
        router->addMonitor([this](const float* samples, size_t count) {
            bargeIn->process(samples, count);
        });
        std::cout << "[Orchestrator] Barge-in VAD OK" << std::endl;
        return true;
    }

    bool initRecognition() {
        transcriber = std::make_unique<stt::StreamingTranscriber>(
            loop, recognitionWorker, *router, engineFactory(),
            audio::VoiceActivityDetector::withFvad(config.vad), config.transcriber);

        if (!transcriber->initialize(config.speech.key, config.speech.region, config.speech.locale)) {
            std::cerr << "[Orchestrator] StreamingTranscriber init failed" << std::endl;
            return false;
        }
        session.setEngine(transcriber->engineName());
        std::cout << "[Orchestrator] StreamingTranscriber OK (" << transcriber->engineName() << ")" << std::endl;

        wake::AttentionConfig attentionConfig = config.attention;
        attentionConfig.keyword_model.access_key = core::readKeyFile(config.porcupine_key_file);
        if (attentionConfig.keyword_model.access_key.empty()) {
            std::cout << "[Orchestrator] No Porcupine access key found in "
                      << config.porcupine_key_file << std::endl;
        }

        attention = std::make_unique<wake::AttentionDetector>(
            loop, *router, *transcriber, wake::createKeywordSpotter(), session, attentionConfig);
        if (!attention->initialize()) {
            std::cerr << "[Orchestrator] AttentionDetector init failed" << std::endl;
            return false;
        }
        attention->setOnWake([]() {
            std::cout << "[Orchestrator] Wake phrase detected" << std::endl;
        });
        std::cout << "[Orchestrator] AttentionDetector OK ("
                  << (attention->usingKeywordEngine() ? "keyword engine" : "transcription fallback")
                  << ")" << std::endl;
        return true;
    }

    bool initSynthesis() {
        std::shared_ptr<tts::SpeechSynthesizer> primary;
        std::shared_ptr<tts::SpeechSynthesizer> secondary;

        if (!config.speech.key.empty() && !config.speech.region.empty()) {
            tts::AzureTtsConfig ttsConfig;
            ttsConfig.key = config.speech.key;
            ttsConfig.region = config.speech.region;
            ttsConfig.locale = config.speech.locale;
            ttsConfig.voice = config.speech.voice;
            ttsConfig.style = config.speech.style;
            ttsConfig.timeout_ms = config.speech.timeout_ms;
            primary = std::make_shared<tts::AzureTtsClient>(ttsConfig);
        }

        if (!config.speech.fallback_tts_url.empty()) {
            auto xtts = std::make_shared<tts::XttsClient>(config.speech.fallback_tts_url);
            if (primary) {
                secondary = xtts;
            } else {
                primary = xtts;
            }
        }

        if (!primary) {
            std::cerr << "[Orchestrator] No synthesis path: set a speech key/region or fallback_tts_url"
                      << std::endl;
            return false;
        }

        speaker = std::make_unique<tts::Speaker>(loop, networkWorker, *playback, primary, secondary);
        std::cout << "[Orchestrator] Speaker OK (" << primary->name()
                  << (secondary ? ", fallback " + secondary->name() : std::string()) << ")" << std::endl;
        return true;
    }

    bool initialize() {
        std::cout << "[Orchestrator] Initializing components..." << std::endl;

        if (!initAudio() || !initRecognition() || !initSynthesis()) {
            return false;
        }

        generator = std::make_unique<llm::HttpResponseGenerator>(
            loop, networkWorker, config.responder.base_url, config.responder.path,
            config.responder.timeout_ms);

        interrupts = std::make_unique<conversation::InterruptManager>(loop, session, config.interrupts);
        conversation = std::make_unique<conversation::ConversationLoop>(
            loop, *attention, *transcriber, *speaker, *generator, *interrupts, *bargeIn,
            session, config.conversation);

        conversation->setOnUserUtterance([this](const std::string& text) {
            if (callbacks.onUserUtterance) callbacks.onUserUtterance(text);
        });
        conversation->setOnAssistantReply([this](const std::string& text) {
            std::cout << "[Orchestrator] Pal: " << text << std::endl;
            if (callbacks.onAssistantResponse) callbacks.onAssistantResponse(text);
        });
        conversation->setOnPhaseChange([this](conversation::LoopPhase phase) {
            if (callbacks.onPhaseChange) callbacks.onPhaseChange(phase);
        });
        conversation->setOnEnded([this]() {
            if (callbacks.onEnded) callbacks.onEnded();
            // Let the goodbye drain from the output buffer before the loop stops
            loop.schedule(300, [this]() { loop.stop(); });
        });
        conversation->setOnError([](const core::Error& error) {
            std::cerr << "[Orchestrator] " << error.describe() << std::endl;
        });

        initialized = true;
        std::cout << "[Orchestrator] All components initialized!" << std::endl;
        return true;
    }

    void teardown() {
        if (conversation) {
            conversation->setOnEnded(nullptr);
            conversation->end(false);
        }
        if (attention) attention->dispose();
        if (transcriber) transcriber->destroy();
        if (audio) audio->stop();
        recognitionWorker.shutdown();
        networkWorker.shutdown();
        running = false;
    }
};

Orchestrator::Orchestrator(core::Config config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

Orchestrator::~Orchestrator() {
    shutdown();
}

bool Orchestrator::initialize() {
    if (impl_->initialized) return true;
    return impl_->initialize();
}

bool Orchestrator::start() {
    if (!impl_->initialized && !initialize()) {
        return false;
    }
    if (impl_->running) return true;

    if (!impl_->audio->start()) {
        std::cerr << "[Orchestrator] " << impl_->audio->lastErrorInfo().describe() << std::endl;
        return false;
    }

    if (!impl_->conversation->start()) {
        impl_->audio->stop();
        return false;
    }

    impl_->running = true;
    std::cout << "[Orchestrator] Running... ("
              << (impl_->config.conversation.listen_mode == conversation::ListenMode::Wake
                      ? "say 'Hey Pal' to ask a question"
                      : "just start talking")
              << ")" << std::endl;
    return true;
}

void Orchestrator::run() {
    impl_->loop.run();
}

void Orchestrator::end(bool announce) {
    if (impl_->conversation) {
        impl_->conversation->end(announce);
    }
}

void Orchestrator::shutdown() {
    impl_->loop.stop();
    impl_->teardown();
}

void Orchestrator::pause() {
    if (impl_->conversation) impl_->conversation->pause();
}

void Orchestrator::resume() {
    if (impl_->conversation) impl_->conversation->resume();
}

bool Orchestrator::isRunning() const {
    return impl_->running;
}

core::SessionStats Orchestrator::stats() const {
    return impl_->session.snapshot();
}

core::EventLoop& Orchestrator::loop() {
    return impl_->loop;
}

void Orchestrator::setCallbacks(OrchestratorCallbacks callbacks) {
    impl_->callbacks = std::move(callbacks);
}

} // namespace hpv
