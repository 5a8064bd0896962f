/**
 * RetryPolicy.cpp
 */

#include "hpv/core/RetryPolicy.hpp"

#include <algorithm>
#include <cmath>

namespace hpv::core {

Millis RetryPolicy::delayFor(int attempt) const {
    if (attempt <= 1) {
        return std::min(initial_delay_ms, max_delay_ms);
    }
    double delay = static_cast<double>(initial_delay_ms) * std::pow(multiplier, attempt - 1);
    return static_cast<Millis>(std::min(delay, static_cast<double>(max_delay_ms)));
}

bool RetryPolicy::allows(int attempt) const {
    return max_attempts <= 0 || attempt <= max_attempts;
}

bool RetryState::next() {
    ++attempt_;
    return policy_.allows(attempt_);
}

} // namespace hpv::core
