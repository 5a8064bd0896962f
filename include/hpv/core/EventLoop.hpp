/**
 * EventLoop.hpp - Single-threaded cooperative scheduler
 *
 * All voice components run on one loop thread. Device and worker threads hand
 * work over with post(); timers are cancellable and a cancelled timer never
 * fires. A manual clock mode lets tests drive time explicitly.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace hpv::core {

using TimerId = std::uint64_t;
using Millis = std::int64_t;

constexpr TimerId kNoTimer = 0;

class EventLoop {
public:
    using Task = std::function<void()>;

    enum class ClockMode {
        Steady,  // Wall-clock time, run() blocks and waits for work
        Manual   // Time only moves through advance()
    };

    explicit EventLoop(ClockMode mode = ClockMode::Steady);
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * Queue a task for the loop thread. Safe to call from any thread.
     */
    void post(Task task);

    /**
     * Run task once after delay_ms. Loop thread only.
     */
    TimerId schedule(Millis delay_ms, Task task);

    /**
     * Cancel a pending timer. Unknown or already-fired ids are ignored.
     */
    void cancel(TimerId id);

    bool isPending(TimerId id) const;
    size_t pendingTimers() const;

    /**
     * Milliseconds since the loop was created (or manual clock value).
     */
    Millis now() const;

    /**
     * Block and dispatch until stop() is called (Steady mode).
     */
    void run();
    void stop();
    bool isRunning() const;

    /**
     * Dispatch posted tasks and due timers once without blocking.
     * Returns the number of callbacks executed.
     */
    size_t runPending();

    /**
     * Manual mode: move the clock forward, firing every timer that falls due
     * on the way in deadline order.
     */
    void advance(Millis ms);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Owns at most one timer at a time; rescheduling cancels the previous one and
 * destruction cancels whatever is pending.
 */
class ScopedTimer {
public:
    explicit ScopedTimer(EventLoop& loop) : loop_(loop) {}
    ~ScopedTimer() { cancel(); }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    void start(Millis delay_ms, EventLoop::Task task);
    void cancel();
    bool isPending() const;

private:
    EventLoop& loop_;
    TimerId id_ = kNoTimer;
};

} // namespace hpv::core
