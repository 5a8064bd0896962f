/**
 * RetryPolicy.hpp - Exponential backoff for session (re)starts
 */

#pragma once

#include "hpv/core/EventLoop.hpp"

namespace hpv::core {

struct RetryPolicy {
    int max_attempts = 5;          // 0 means unlimited
    Millis initial_delay_ms = 400;
    double multiplier = 2.0;
    Millis max_delay_ms = 8000;

    /**
     * Delay before the given attempt (1-based).
     */
    Millis delayFor(int attempt) const;
    bool allows(int attempt) const;
};

/**
 * Tracks consecutive attempts against a policy. reset() after a success.
 */
class RetryState {
public:
    explicit RetryState(RetryPolicy policy = {}) : policy_(policy) {}

    /**
     * Record another failure. Returns false once max_attempts is reached.
     */
    bool next();
    Millis currentDelay() const { return policy_.delayFor(attempt_); }
    int attempt() const { return attempt_; }
    void reset() { attempt_ = 0; }
    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    int attempt_ = 0;
};

} // namespace hpv::core
