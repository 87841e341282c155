#pragma once

#include <mcpbridge/core/types.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <type_traits>

namespace mcpbridge::session {

/**
 * @brief Attempt budget for a bounded retry loop.
 *
 * The delay before attempt n+1 is interval * multiplier^(n-1), capped at maxInterval.
 */
struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds interval{1000};
    double backoffMultiplier{1.0};
    std::chrono::milliseconds maxInterval{30000};

    std::chrono::milliseconds delayAfter(int attempt) const;
};

template <typename T> struct RetryOutcome {
    Result<T> result;
    int attempts{0};
};

/**
 * @brief Sleep for @p delay unless @p stop is requested first.
 * @return false when interrupted
 */
bool interruptibleSleep(std::chrono::milliseconds delay, std::stop_token stop);

/**
 * @brief Run @p attempt until it succeeds, the budget is spent, or retrying is pointless.
 *
 * @p attempt receives the 1-based attempt number. @p shouldRetry decides whether a
 * failure is worth another attempt; a false answer ends the loop with that error.
 */
template <typename T, typename F, typename ShouldRetry>
RetryOutcome<T> retryWithBudget(const RetryPolicy& policy, F&& attempt, ShouldRetry&& shouldRetry,
                                std::stop_token stop = {}) {
    const int budget = policy.maxAttempts < 1 ? 1 : policy.maxAttempts;
    RetryOutcome<T> outcome{Error{ErrorCode::InvalidState, "No attempt made"}, 0};

    for (int n = 1; n <= budget; ++n) {
        if (stop.stop_requested()) {
            outcome.result = Error{ErrorCode::OperationCancelled, "Retry loop cancelled"};
            return outcome;
        }
        outcome.attempts = n;
        outcome.result = attempt(n);
        if (outcome.result) {
            return outcome;
        }
        if (n == budget || !shouldRetry(outcome.result.error())) {
            return outcome;
        }
        if (!interruptibleSleep(policy.delayAfter(n), stop)) {
            outcome.result = Error{ErrorCode::OperationCancelled, "Retry loop cancelled"};
            return outcome;
        }
    }
    return outcome;
}

struct ProbeOutcome {
    bool ready{false};
    int attempts{0};
    nlohmann::json result;
    Error lastError;
};

/**
 * @brief Repeats a readiness check until it succeeds or the attempt budget is exhausted.
 *
 * A single failed attempt is never fatal. Transport loss and cancellation end
 * probing immediately without consuming the rest of the budget.
 */
class ReadinessProbe {
public:
    using Attempt = std::function<Result<nlohmann::json>(int attempt)>;

    explicit ReadinessProbe(RetryPolicy policy) : policy_(policy) {}

    ProbeOutcome run(const Attempt& attempt, std::stop_token stop = {}) const;

    const RetryPolicy& policy() const noexcept { return policy_; }

private:
    RetryPolicy policy_;
};

} // namespace mcpbridge::session
