/**
 * @file retry_backoff.cpp
 * @brief RetryBackoff implementation.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#include "airvol/core/retry_backoff.hpp"

#include <algorithm>

namespace airvol {
namespace core {

using std::chrono::milliseconds;

RetryBackoff::RetryBackoff(const RetryPolicy& policy)
    : RetryBackoff(policy, std::random_device{}())
{}

RetryBackoff::RetryBackoff(const RetryPolicy& policy, uint32_t seed)
    : policy_(policy)
    , current_(policy.min_delay)
    , rng_(seed)
{
    if (policy_.max_delay < policy_.min_delay) {
        policy_.max_delay = policy_.min_delay;
    }
}

milliseconds RetryBackoff::sleepDuration() {
    auto jitter = policy_.jitter.count();
    if (jitter <= 0) {
        return current_;
    }
    std::uniform_int_distribution<long long> dist(-jitter, jitter);
    return std::max(milliseconds(0), current_ + milliseconds(dist(rng_)));
}

void RetryBackoff::advance() {
    auto grown = milliseconds(static_cast<long long>(
        static_cast<double>(current_.count()) * policy_.multiplier));
    current_ = std::min(policy_.max_delay, std::max(policy_.min_delay, grown));
}

void RetryBackoff::reset() {
    current_ = policy_.min_delay;
}

}  // namespace core
}  // namespace airvol
