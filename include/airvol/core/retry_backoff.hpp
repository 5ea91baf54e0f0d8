/**
 * @file retry_backoff.hpp
 * @brief Delay policy between failed rounds of connection attempts.
 *
 * @copyright Copyright (c) 2025 AirVol Contributors
 * @license MIT License
 */

#pragma once

#include "airvol/core/export.hpp"

#include <chrono>
#include <cstdint>
#include <random>

namespace airvol {
namespace core {

/**
 * @struct RetryPolicy
 * @brief Bounds and growth of the retry delay.
 */
struct AIRVOL_CORE_API RetryPolicy {
    std::chrono::milliseconds min_delay{50};
    std::chrono::milliseconds max_delay{1000};
    double multiplier = 1.5;
    std::chrono::milliseconds jitter{50};   ///< Symmetric, added when sleeping
};

/**
 * @class RetryBackoff
 * @brief Multiplicative backoff with jitter.
 *
 * current() always lies in [min_delay, max_delay] and never decreases
 * between resets. The jitter only affects sleepDuration().
 *
 * Not thread-safe; owned by the supervisor thread.
 */
class AIRVOL_CORE_API RetryBackoff {
public:
    explicit RetryBackoff(const RetryPolicy& policy = RetryPolicy());

    RetryBackoff(const RetryPolicy& policy, uint32_t seed);

    /// Base delay of the next wait.
    std::chrono::milliseconds current() const { return current_; }

    /// current() plus random jitter, floored at zero.
    std::chrono::milliseconds sleepDuration();

    /// Grow the delay after a failed round.
    void advance();

    /// Back to min_delay after a session opened.
    void reset();

    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    std::chrono::milliseconds current_;
    std::mt19937 rng_;
};

}  // namespace core
}  // namespace airvol
