/**
 * EventLoop.cpp - Timer queue and task dispatch
 */

#include "hpv/core/EventLoop.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace hpv::core {

struct EventLoop::Impl {
    ClockMode mode;
    std::chrono::steady_clock::time_point origin = std::chrono::steady_clock::now();
    Millis manual_now = 0;

    mutable std::mutex mutex;
    std::condition_variable wakeup;
    std::deque<Task> posted;

    // Ordered by (deadline, id) so equal deadlines fire in scheduling order
    std::map<std::pair<Millis, TimerId>, Task> timers;
    std::unordered_map<TimerId, Millis> deadlines;
    TimerId next_id = 1;

    std::atomic<bool> running{false};

    explicit Impl(ClockMode m) : mode(m) {}

    Millis now() const {
        if (mode == ClockMode::Manual) {
            return manual_now;
        }
        auto elapsed = std::chrono::steady_clock::now() - origin;
        return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    }

    size_t runPosted() {
        std::deque<Task> batch;
        {
            std::lock_guard<std::mutex> lock(mutex);
            batch.swap(posted);
        }
        for (auto& task : batch) {
            if (task) task();
        }
        return batch.size();
    }

    std::optional<Millis> nextDeadline() const {
        std::lock_guard<std::mutex> lock(mutex);
        if (timers.empty()) return std::nullopt;
        return timers.begin()->first.first;
    }

    size_t runDueTimers() {
        size_t executed = 0;
        TimerId bound;
        {
            std::lock_guard<std::mutex> lock(mutex);
            bound = next_id;
        }

        for (;;) {
            Task task;
            {
                std::lock_guard<std::mutex> lock(mutex);
                Millis current = now();
                auto it = timers.begin();
                // Timers created while this pass runs wait for the next pass
                while (it != timers.end() && it->first.first <= current && it->first.second >= bound) {
                    ++it;
                }
                if (it == timers.end() || it->first.first > current) {
                    break;
                }
                task = std::move(it->second);
                deadlines.erase(it->first.second);
                timers.erase(it);
            }
            if (task) task();
            ++executed;
        }
        return executed;
    }
};

EventLoop::EventLoop(ClockMode mode) : impl_(std::make_unique<Impl>(mode)) {}

EventLoop::~EventLoop() = default;

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->posted.push_back(std::move(task));
    }
    impl_->wakeup.notify_one();
}

TimerId EventLoop::schedule(Millis delay_ms, Task task) {
    if (delay_ms < 0) delay_ms = 0;
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        id = impl_->next_id++;
        Millis deadline = impl_->now() + delay_ms;
        impl_->timers.emplace(std::make_pair(deadline, id), std::move(task));
        impl_->deadlines.emplace(id, deadline);
    }
    impl_->wakeup.notify_one();
    return id;
}

void EventLoop::cancel(TimerId id) {
    if (id == kNoTimer) return;
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->deadlines.find(id);
    if (it == impl_->deadlines.end()) return;
    impl_->timers.erase(std::make_pair(it->second, id));
    impl_->deadlines.erase(it);
}

bool EventLoop::isPending(TimerId id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->deadlines.count(id) > 0;
}

size_t EventLoop::pendingTimers() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->timers.size();
}

Millis EventLoop::now() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->now();
}

void EventLoop::run() {
    if (impl_->mode == ClockMode::Manual) {
        std::cerr << "[EventLoop] run() is not available with a manual clock" << std::endl;
        return;
    }

    impl_->running = true;
    while (impl_->running) {
        impl_->runPosted();
        impl_->runDueTimers();

        std::unique_lock<std::mutex> lock(impl_->mutex);
        if (!impl_->running) break;
        if (!impl_->posted.empty()) continue;

        if (impl_->timers.empty()) {
            impl_->wakeup.wait(lock, [this]() {
                return !impl_->posted.empty() || !impl_->timers.empty() || !impl_->running;
            });
        } else {
            Millis wait_ms = impl_->timers.begin()->first.first - impl_->now();
            if (wait_ms > 0) {
                impl_->wakeup.wait_for(lock, std::chrono::milliseconds(wait_ms));
            }
        }
    }
}

void EventLoop::stop() {
    impl_->running = false;
    impl_->wakeup.notify_all();
}

bool EventLoop::isRunning() const {
    return impl_->running;
}

size_t EventLoop::runPending() {
    size_t executed = impl_->runPosted();
    executed += impl_->runDueTimers();
    executed += impl_->runPosted();
    return executed;
}

void EventLoop::advance(Millis ms) {
    if (impl_->mode != ClockMode::Manual) {
        std::cerr << "[EventLoop] advance() requires a manual clock" << std::endl;
        return;
    }

    Millis target = impl_->manual_now + ms;
    for (;;) {
        impl_->runPosted();
        auto next = impl_->nextDeadline();
        if (!next || *next > target) break;
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            if (*next > impl_->manual_now) impl_->manual_now = *next;
        }
        impl_->runDueTimers();
    }
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->manual_now = target;
    }
    runPending();
}

void ScopedTimer::start(Millis delay_ms, EventLoop::Task task) {
    cancel();
    id_ = loop_.schedule(delay_ms, [this, task = std::move(task)]() {
        id_ = kNoTimer;
        task();
    });
}

void ScopedTimer::cancel() {
    if (id_ != kNoTimer) {
        loop_.cancel(id_);
        id_ = kNoTimer;
    }
}

bool ScopedTimer::isPending() const {
    return id_ != kNoTimer && loop_.isPending(id_);
}

} // namespace hpv::core
