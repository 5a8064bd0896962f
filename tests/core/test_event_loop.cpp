/**
 * test_event_loop.cpp - Timers, posting, workers and backoff
 */

#include "hpv/core/BackgroundExecutor.hpp"
#include "hpv/core/Error.hpp"
#include "hpv/core/EventLoop.hpp"
#include "hpv/core/RetryPolicy.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace hpv::core;

void test_timers_fire_in_deadline_order() {
    EventLoop loop(EventLoop::ClockMode::Manual);
    std::vector<int> order;

    loop.schedule(30, [&]() { order.push_back(3); });
    loop.schedule(10, [&]() { order.push_back(1); });
    loop.schedule(20, [&]() { order.push_back(2); });
    loop.schedule(20, [&]() { order.push_back(22); });

    loop.advance(15);
    assert(order.size() == 1);
    assert(loop.now() == 15);

    loop.advance(100);
    assert((order == std::vector<int>{1, 2, 22, 3}));
    assert(loop.pendingTimers() == 0);

    std::cout << "[PASS] test_timers_fire_in_deadline_order" << std::endl;
}

void test_cancelled_timer_never_fires() {
    EventLoop loop(EventLoop::ClockMode::Manual);
    bool fired = false;

    TimerId id = loop.schedule(50, [&]() { fired = true; });
    assert(loop.isPending(id));
    loop.cancel(id);
    assert(!loop.isPending(id));
    loop.cancel(id);            // Second cancel is harmless
    loop.cancel(kNoTimer);

    loop.advance(1000);
    assert(!fired);

    std::cout << "[PASS] test_cancelled_timer_never_fires" << std::endl;
}

void test_timer_scheduled_from_timer() {
    EventLoop loop(EventLoop::ClockMode::Manual);
    int ticks = 0;

    std::function<void()> tick = [&]() {
        ++ticks;
        if (ticks < 5) loop.schedule(10, tick);
    };
    loop.schedule(10, tick);

    loop.advance(35);
    assert(ticks == 3);
    loop.advance(100);
    assert(ticks == 5);

    std::cout << "[PASS] test_timer_scheduled_from_timer" << std::endl;
}

void test_posted_tasks() {
    EventLoop loop(EventLoop::ClockMode::Manual);
    std::vector<std::string> seen;

    loop.post([&]() {
        seen.push_back("first");
        loop.post([&]() { seen.push_back("nested"); });
    });
    loop.post([&]() { seen.push_back("second"); });

    size_t ran = loop.runPending();
    assert(ran == 3);
    assert((seen == std::vector<std::string>{"first", "second", "nested"}));

    std::cout << "[PASS] test_posted_tasks" << std::endl;
}

void test_scoped_timer() {
    EventLoop loop(EventLoop::ClockMode::Manual);
    int fired = 0;

    {
        ScopedTimer timer(loop);
        timer.start(100, [&]() { fired += 1; });
        assert(timer.isPending());

        // Restart replaces the pending timer
        timer.start(50, [&]() { fired += 10; });
        loop.advance(60);
        assert(fired == 10);
        assert(!timer.isPending());

        timer.start(100, [&]() { fired += 100; });
    }
    // Destruction cancelled the last one
    loop.advance(500);
    assert(fired == 10);
    assert(loop.pendingTimers() == 0);

    std::cout << "[PASS] test_scoped_timer" << std::endl;
}

void test_steady_loop_stop() {
    EventLoop loop(EventLoop::ClockMode::Steady);
    int fired = 0;

    loop.schedule(20, [&]() { ++fired; });
    loop.schedule(40, [&]() { loop.stop(); });
    loop.schedule(5000, [&]() { fired += 100; });

    loop.run();
    assert(fired == 1);
    assert(!loop.isRunning());

    std::cout << "[PASS] test_steady_loop_stop" << std::endl;
}

void test_executor_inline() {
    EventLoop loop(EventLoop::ClockMode::Manual);
    BackgroundExecutor executor("test", BackgroundExecutor::Mode::Inline);

    int result = 0;
    executor.submit<int>(loop, []() { return 6 * 7; }, [&](int value) { result = value; });

    // Delivered through the loop, never synchronously
    assert(result == 0);
    loop.runPending();
    assert(result == 42);

    std::cout << "[PASS] test_executor_inline" << std::endl;
}

void test_executor_thread() {
    EventLoop loop(EventLoop::ClockMode::Steady);
    BackgroundExecutor executor("test");

    std::thread::id loopThread = std::this_thread::get_id();
    std::thread::id workThread;
    std::thread::id doneThread;

    executor.submit<std::string>(loop,
        [&]() {
            workThread = std::this_thread::get_id();
            return std::string("decoded");
        },
        [&](std::string text) {
            doneThread = std::this_thread::get_id();
            assert(text == "decoded");
            loop.stop();
        });

    loop.schedule(5000, [&]() { loop.stop(); });
    loop.run();

    assert(workThread != loopThread);
    assert(doneThread == loopThread);

    executor.shutdown();
    executor.submit([]() { assert(false && "job after shutdown"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    std::cout << "[PASS] test_executor_thread" << std::endl;
}

void test_retry_backoff() {
    RetryPolicy policy;
    policy.max_attempts = 4;
    policy.initial_delay_ms = 400;
    policy.multiplier = 2.0;
    policy.max_delay_ms = 2000;

    assert(policy.delayFor(1) == 400);
    assert(policy.delayFor(2) == 800);
    assert(policy.delayFor(3) == 1600);
    assert(policy.delayFor(4) == 2000);

    RetryState state(policy);
    assert(state.next() && state.currentDelay() == 400);
    assert(state.next() && state.currentDelay() == 800);
    assert(state.next());
    assert(state.next());
    assert(!state.next());

    state.reset();
    assert(state.attempt() == 0);
    assert(state.next());

    RetryPolicy unlimited;
    unlimited.max_attempts = 0;
    assert(unlimited.allows(1000));

    std::cout << "[PASS] test_retry_backoff" << std::endl;
}

void test_error_describe() {
    Error fatal{ErrorKind::Acquisition, "AudioEngine", "device busy"};
    assert(fatal.isFatal());
    assert(fatal.describe() == "AcquisitionError [AudioEngine]: device busy");

    Error glitch{ErrorKind::Recognition, "Transcriber", ""};
    assert(!glitch.isFatal());
    assert(glitch.describe() == "RecognitionError [Transcriber]");

    std::cout << "[PASS] test_error_describe" << std::endl;
}

int main() {
    std::cout << "=== EventLoop Tests ===" << std::endl;

    test_timers_fire_in_deadline_order();
    test_cancelled_timer_never_fires();
    test_timer_scheduled_from_timer();
    test_posted_tasks();
    test_scoped_timer();
    test_steady_loop_stop();
    test_executor_inline();
    test_executor_thread();
    test_retry_backoff();
    test_error_describe();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
