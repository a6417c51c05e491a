/**
 * CancellationToken.cpp - Shared cancellation state with parent/child links
 */

#include "parley/core/CancellationToken.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace parley::core {

struct CancellationToken::State {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::weak_ptr<State>> children;

    void cancel() {
        std::vector<std::weak_ptr<State>> to_cancel;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled.exchange(true)) {
                return;
            }
            to_cancel.swap(children);
        }
        cv.notify_all();

        for (auto& weak : to_cancel) {
            if (auto child = weak.lock()) {
                child->cancel();
            }
        }
    }
};

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken::CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

void CancellationToken::cancel() {
    state_->cancel();
}

bool CancellationToken::isCancelled() const {
    return state_->cancelled.load();
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, duration, [this]() { return state_->cancelled.load(); });
}

CancellationToken CancellationToken::child() const {
    auto child_state = std::make_shared<State>();
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            // Prune links to children that are already gone
            auto& kids = state_->children;
            for (auto it = kids.begin(); it != kids.end();) {
                it = it->expired() ? kids.erase(it) : it + 1;
            }
            kids.push_back(child_state);
            return CancellationToken(child_state);
        }
    }
    child_state->cancelled = true;
    return CancellationToken(child_state);
}

} // namespace parley::core
