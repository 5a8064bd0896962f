/**
 * HighPal Voice - Main Entry Point
 *
 * Spoken front end for the HighPal tutor: wake phrase, transcription,
 * tutoring backend, synthesized reply, barge-in.
 */

#include <atomic>
#include <csignal>
#include <functional>
#include <iostream>
#include <string>

#include "hpv/Orchestrator.hpp"
#include "hpv/audio/AudioEngine.hpp"
#include "hpv/core/Config.hpp"

std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    g_running = false;
}

static void printDevices() {
    std::cout << "Input devices:" << std::endl;
    for (const auto& name : hpv::audio::AudioEngine::listInputDevices()) {
        std::cout << "  " << name << std::endl;
    }
    std::cout << "Output devices:" << std::endl;
    for (const auto& name : hpv::audio::AudioEngine::listOutputDevices()) {
        std::cout << "  " << name << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << R"(
    ╔═══════════════════════════════════════════════╗
    ║            HIGHPAL VOICE (HPV) v0.1.0         ║
    ║     Talk to Pal, your AI tutor, hands-free    ║
    ╚═══════════════════════════════════════════════╝
    )" << std::endl;

    std::string config_path = "config/highpal.json";
    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "--list-devices") {
            printDevices();
            return 0;
        }
        if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [config.json | --list-devices]" << std::endl;
            return 0;
        }
        config_path = arg;
    }

    hpv::core::Config config;
    if (!hpv::core::loadConfig(config_path, config)) {
        return 1;
    }
    hpv::core::applyEnvironment(config);

    std::cout << "[HPV] Initializing..." << std::endl;

    hpv::Orchestrator orchestrator(config);
    orchestrator.setCallbacks({
        [](const std::string& text) { std::cout << "[HPV] You: " << text << std::endl; },
        nullptr,
        nullptr,
        []() { std::cout << "[HPV] Conversation over" << std::endl; }
    });

    if (!orchestrator.start()) {
        std::cerr << "[HPV] Failed to start" << std::endl;
        return 1;
    }

    // Signals only flip a flag; the loop notices it here
    auto& loop = orchestrator.loop();
    std::function<void()> watchSignals = [&]() {
        if (!g_running) {
            std::cout << "\n[HPV] Shutting down..." << std::endl;
            loop.stop();
            return;
        }
        loop.schedule(100, watchSignals);
    };
    loop.schedule(100, watchSignals);

    orchestrator.run();
    orchestrator.shutdown();

    auto stats = orchestrator.stats();
    std::cout << "[HPV] Turns: " << stats.user_turns
              << ", wakes: " << stats.wake_detections
              << " (fallback " << stats.fallback_detections << ")"
              << ", interrupts: " << stats.interrupts << std::endl;
    std::cout << "[HPV] Goodbye!" << std::endl;
    return 0;
}
