/**
 * BackgroundExecutor.hpp - Worker thread for blocking I/O boundaries
 *
 * Speech decoding, synthesis requests and response generation block for
 * hundreds of milliseconds. They run here, and their results are handed back
 * to the EventLoop so component state is only touched on the loop thread.
 */

#pragma once

#include "hpv/core/EventLoop.hpp"

#include <functional>
#include <memory>
#include <string>

namespace hpv::core {

class BackgroundExecutor {
public:
    using Job = std::function<void()>;

    enum class Mode {
        Thread,  // Jobs run on the worker thread
        Inline   // Jobs run immediately on the caller (deterministic tests)
    };

    explicit BackgroundExecutor(std::string name = "worker", Mode mode = Mode::Thread);
    ~BackgroundExecutor();

    BackgroundExecutor(const BackgroundExecutor&) = delete;
    BackgroundExecutor& operator=(const BackgroundExecutor&) = delete;

    /**
     * Queue a job for the worker thread. Jobs run in submission order.
     */
    void submit(Job job);

    /**
     * Run work() on the worker and deliver its result to done() on the loop.
     */
    template <typename Result>
    void submit(EventLoop& loop,
                std::function<Result()> work,
                std::function<void(Result)> done) {
        submit([&loop, work = std::move(work), done = std::move(done)]() mutable {
            auto result = std::make_shared<Result>(work());
            loop.post([done = std::move(done), result]() mutable {
                done(std::move(*result));
            });
        });
    }

    /**
     * Stop accepting jobs, drop queued ones and join the worker.
     */
    void shutdown();

    size_t queued() const;
    bool isBusy() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hpv::core
