/**
 * @file retry.hpp
 * @brief Bounded polling combinator shared by the readiness and completion waiters
 *
 * Both waiters poll a remote service at a fixed cadence with a hard attempt
 * ceiling; neither grows its delay. PollUntil captures that shape once and
 * reports whether the probe was satisfied, leaving the caller to choose
 * which exhaustion error to raise.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>

namespace stratus {
namespace core {

/// Suspends the caller; injected so tests never sleep
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Sleeper backed by std::this_thread::sleep_for
Sleeper ThreadSleeper();

/**
 * @struct RetryPolicy
 * @brief Fixed-delay, fixed-ceiling retry policy
 */
struct RetryPolicy {
    int max_attempts{1};                        ///< Probes issued at most (>= 1)
    std::chrono::milliseconds delay{0};         ///< Pause between probes (no growth)
    std::optional<std::chrono::milliseconds> deadline;  ///< Optional wall-clock budget from the first probe
};

/**
 * @struct PollResult
 * @brief How a polling loop ended
 */
struct PollResult {
    bool satisfied{false};   ///< Probe returned true
    int attempts{0};         ///< Probes issued
};

/**
 * @brief Call probe until it returns true or the policy is exhausted
 *
 * The sleeper runs only between probes, never after the last one. When a
 * deadline is set, no further probe starts once it has passed.
 *
 * @param policy Attempt ceiling, delay and optional deadline
 * @param sleeper Suspension point
 * @param probe Returns true when the awaited condition holds; exceptions propagate
 */
template <typename Probe>
PollResult PollUntil(const RetryPolicy& policy, const Sleeper& sleeper, Probe&& probe) {
    PollResult result;
    const int max_attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    const auto started = std::chrono::steady_clock::now();

    while (result.attempts < max_attempts) {
        ++result.attempts;
        if (probe()) {
            result.satisfied = true;
            return result;
        }

        if (result.attempts >= max_attempts) {
            break;
        }
        if (policy.deadline &&
            std::chrono::steady_clock::now() - started >= *policy.deadline) {
            break;
        }
        sleeper(policy.delay);
    }

    return result;
}

} // namespace core
} // namespace stratus
