/**
 * RetryPolicy.cpp - Backoff curve
 */

#include "parley/core/RetryPolicy.hpp"

#include <algorithm>
#include <cmath>

namespace parley::core {

std::chrono::milliseconds RetryPolicy::backoffFor(int retry) const {
    if (retry < 1) {
        return std::chrono::milliseconds(0);
    }
    double delay = static_cast<double>(initial_backoff.count()) * std::pow(multiplier, retry - 1);
    delay = std::min(delay, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

bool RetryPolicy::isRetryable(ErrorCode code) {
    switch (code) {
        case ErrorCode::RecognitionTimeout:
        case ErrorCode::RecognitionError:
        case ErrorCode::GenerationTimeout:
        case ErrorCode::GenerationError:
        case ErrorCode::SynthesisError:
            return true;
        default:
            return false;
    }
}

} // namespace parley::core
