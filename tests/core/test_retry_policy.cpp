/**
 * test_retry_policy.cpp - Attempt budget and backoff
 */

#include "parley/core/RetryPolicy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

using namespace parley;
using namespace parley::core;
using namespace std::chrono_literals;

struct Outcome {
    ErrorCode error = ErrorCode::None;
    int attempt = 0;
};

void test_backoff_curve() {
    RetryPolicy policy{3, 100ms, 2.0, 300ms};

    assert(policy.maxAttempts() == 4);
    assert(policy.backoffFor(1) == 100ms);
    assert(policy.backoffFor(2) == 200ms);
    assert(policy.backoffFor(3) == 300ms);  // capped
    assert(policy.backoffFor(0) == 0ms);

    std::cout << "[PASS] test_backoff_curve" << std::endl;
}

void test_retries_until_success() {
    RetryPolicy policy{2, 1ms, 1.0, 1ms};
    CancellationToken token;
    int failures = 0;

    auto result = policy.execute([](int n) {
        return Outcome{n < 3 ? ErrorCode::RecognitionTimeout : ErrorCode::None, n};
    }, token, [&failures](int, const Outcome&) { ++failures; });

    assert(result.error == ErrorCode::None);
    assert(result.attempt == 3);
    assert(failures == 2);

    std::cout << "[PASS] test_retries_until_success" << std::endl;
}

void test_budget_exhausted() {
    RetryPolicy policy{1, 1ms, 1.0, 1ms};
    CancellationToken token;
    int attempts = 0;
    int failures = 0;

    auto result = policy.execute([&attempts](int n) {
        ++attempts;
        return Outcome{ErrorCode::SynthesisError, n};
    }, token, [&failures](int, const Outcome&) { ++failures; });

    assert(result.error == ErrorCode::SynthesisError);
    assert(attempts == 2);
    assert(failures == 2);  // every failed attempt is reported

    std::cout << "[PASS] test_budget_exhausted" << std::endl;
}

void test_non_retryable_stops() {
    RetryPolicy policy{5, 1ms, 1.0, 1ms};
    CancellationToken token;
    int attempts = 0;

    auto result = policy.execute([&attempts](int n) {
        ++attempts;
        return Outcome{ErrorCode::CancellationRace, n};
    }, token, [](int, const Outcome&) {});

    assert(result.error == ErrorCode::CancellationRace);
    assert(attempts == 1);
    assert(!RetryPolicy::isRetryable(ErrorCode::SessionClosed));
    assert(RetryPolicy::isRetryable(ErrorCode::GenerationTimeout));

    std::cout << "[PASS] test_non_retryable_stops" << std::endl;
}

void test_custom_predicate() {
    RetryPolicy policy{3, 1ms, 1.0, 1ms};
    CancellationToken token;
    int attempts = 0;

    // Retry only the first failure
    auto result = policy.executeIf([&attempts](int n) {
        ++attempts;
        return Outcome{ErrorCode::GenerationError, n};
    }, [&attempts](const Outcome&) { return attempts < 2; }, token, [](int, const Outcome&) {});

    assert(result.attempt == 2);
    assert(attempts == 2);

    std::cout << "[PASS] test_custom_predicate" << std::endl;
}

void test_cancel_interrupts_backoff() {
    RetryPolicy policy{3, 10s, 1.0, 10s};
    CancellationToken token;

    auto start = std::chrono::steady_clock::now();
    auto result = policy.execute([&token](int n) {
        token.cancel();
        return Outcome{ErrorCode::RecognitionError, n};
    }, token, [](int, const Outcome&) {});

    assert(result.attempt == 1);
    assert(std::chrono::steady_clock::now() - start < 1s);

    std::cout << "[PASS] test_cancel_interrupts_backoff" << std::endl;
}

int main() {
    std::cout << "=== RetryPolicy Tests ===" << std::endl;

    test_backoff_curve();
    test_retries_until_success();
    test_budget_exhausted();
    test_non_retryable_stops();
    test_custom_predicate();
    test_cancel_interrupts_backoff();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
