/**
 * RetryPolicy.hpp - Attempt budget and exponential backoff for collaborator calls
 *
 * One policy object per collaborator type (ASR, LLM, TTS), configured from
 * PipelineConfig. Backoff sleeps are interruptible through the token.
 */

#pragma once

#include "parley/Errors.hpp"
#include "parley/core/CancellationToken.hpp"

#include <chrono>
#include <functional>

namespace parley::core {

struct RetryPolicy {
    int max_retries = 1;
    std::chrono::milliseconds initial_backoff{200};
    double multiplier = 2.0;
    std::chrono::milliseconds max_backoff{2000};

    int maxAttempts() const { return max_retries + 1; }

    /**
     * Delay before retry number `retry` (1-based).
     */
    std::chrono::milliseconds backoffFor(int retry) const;

    static bool isRetryable(ErrorCode code);

    /**
     * Run `attempt(n)` for n = 1..maxAttempts() until it returns a result
     * whose `error` is not retryable, or the token is cancelled.
     * `on_failure(n, result)` is called after every failed attempt.
     */
    template <typename Attempt, typename OnFailure>
    auto execute(Attempt&& attempt, const CancellationToken& cancel, OnFailure&& on_failure) const
        -> decltype(attempt(1)) {
        auto retryable = [](const auto& result) { return isRetryable(result.error); };
        return executeIf(attempt, retryable, cancel, on_failure);
    }

    /**
     * As execute(), with the caller deciding which results are retried.
     */
    template <typename Attempt, typename Retryable, typename OnFailure>
    auto executeIf(Attempt&& attempt, Retryable&& retryable, const CancellationToken& cancel,
                   OnFailure&& on_failure) const -> decltype(attempt(1)) {
        auto result = attempt(1);
        for (int n = 2; n <= maxAttempts(); ++n) {
            if (!retryable(result)) {
                break;
            }
            on_failure(n - 1, result);
            if (cancel.isCancelled() || cancel.waitFor(backoffFor(n - 1))) {
                return result;
            }
            result = attempt(n);
        }
        if (retryable(result)) {
            on_failure(maxAttempts(), result);
        }
        return result;
    }
};

} // namespace parley::core
