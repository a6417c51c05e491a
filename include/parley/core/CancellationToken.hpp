/**
 * CancellationToken.hpp - Cooperative cancellation shared across stages
 *
 * Copies share state. A child token is cancelled whenever its parent is,
 * but cancelling a child leaves the parent untouched.
 */

#pragma once

#include <chrono>
#include <memory>

namespace parley::core {

class CancellationToken {
public:
    CancellationToken();

    void cancel();
    bool isCancelled() const;

    /**
     * Sleep up to `duration`, waking early on cancellation.
     * Returns true if the token is cancelled.
     */
    bool waitFor(std::chrono::milliseconds duration) const;

    CancellationToken child() const;

private:
    struct State;
    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

} // namespace parley::core
