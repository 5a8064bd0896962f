/**
 * Orchestrator.hpp - Builds and runs the voice conversation
 *
 * Owns every component, wires the microphone and speaker through the
 * capture router and playback controller, and drives the EventLoop.
 */

#pragma once

#include "hpv/conversation/ConversationLoop.hpp"
#include "hpv/core/Config.hpp"
#include "hpv/core/EventLoop.hpp"
#include "hpv/core/SessionContext.hpp"

#include <functional>
#include <memory>
#include <string>

namespace hpv {

struct OrchestratorCallbacks {
    std::function<void(const std::string& text)> onUserUtterance;
    std::function<void(const std::string& text)> onAssistantResponse;
    std::function<void(conversation::LoopPhase phase)> onPhaseChange;
    std::function<void()> onEnded;
};

class Orchestrator {
public:
    explicit Orchestrator(core::Config config);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * Create the engines. Fails on anything the conversation cannot run
     * without (audio device layer, recognizer, any synthesis path).
     */
    bool initialize();

    /**
     * Open the audio streams and begin the conversation. An input device
     * that cannot be opened is an Acquisition error and fails here.
     */
    bool start();

    /**
     * Dispatch on the calling thread until the conversation ends or
     * shutdown() is called.
     */
    void run();

    /**
     * Ask the conversation to end. announce speaks the goodbye line first.
     * Loop thread only.
     */
    void end(bool announce = true);

    /**
     * Stop the loop, the audio streams and the workers.
     */
    void shutdown();

    void pause();
    void resume();

    bool isRunning() const;
    core::SessionStats stats() const;
    core::EventLoop& loop();

    void setCallbacks(OrchestratorCallbacks callbacks);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hpv
