/**
 * BackgroundExecutor.cpp - Single worker thread with a job queue
 */

#include "hpv/core/BackgroundExecutor.hpp"

#include <atomic>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>

namespace hpv::core {

struct BackgroundExecutor::Impl {
    std::string name;
    Mode mode;
    std::queue<Job> jobs;
    mutable std::mutex queue_mutex;
    std::condition_variable job_cv;
    std::thread worker;
    std::atomic<bool> running{false};
    std::atomic<bool> busy{false};

    Impl(std::string n, Mode m) : name(std::move(n)), mode(m) {}

    void start() {
        if (running) return;
        running = true;
        worker = std::thread([this]() { workerLoop(); });
    }

    void workerLoop() {
        while (running) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                job_cv.wait(lock, [this]() { return !jobs.empty() || !running; });
                if (!running) break;
                job = std::move(jobs.front());
                jobs.pop();
                busy = true;
            }

            try {
                job();
            } catch (const std::exception& e) {
                std::cerr << "[" << name << "] Job failed: " << e.what() << std::endl;
            }
            busy = false;
        }
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            if (!running) return;
            running = false;
            std::queue<Job> empty;
            jobs.swap(empty);
        }
        job_cv.notify_all();
        if (worker.joinable()) {
            worker.join();
        }
    }
};

BackgroundExecutor::BackgroundExecutor(std::string name, Mode mode)
    : impl_(std::make_unique<Impl>(std::move(name), mode)) {
    if (mode == Mode::Thread) {
        impl_->start();
    }
}

BackgroundExecutor::~BackgroundExecutor() {
    shutdown();
}

void BackgroundExecutor::submit(Job job) {
    if (impl_->mode == Mode::Inline) {
        job();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->queue_mutex);
        if (!impl_->running) {
            std::cerr << "[" << impl_->name << "] Rejected job after shutdown" << std::endl;
            return;
        }
        impl_->jobs.push(std::move(job));
    }
    impl_->job_cv.notify_one();
}

void BackgroundExecutor::shutdown() {
    impl_->stop();
}

size_t BackgroundExecutor::queued() const {
    std::lock_guard<std::mutex> lock(impl_->queue_mutex);
    return impl_->jobs.size();
}

bool BackgroundExecutor::isBusy() const {
    return impl_->busy;
}

} // namespace hpv::core
