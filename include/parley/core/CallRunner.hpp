/**
 * CallRunner.hpp - Runs a blocking collaborator call under a deadline
 *
 * The call runs on its own thread with a child cancellation token. When
 * the deadline passes or the parent token is cancelled, the child token is
 * cancelled and the thread is parked; parked threads are joined once they
 * return, and all of them on destruction. Threads are never detached.
 */

#pragma once

#include "parley/core/CancellationToken.hpp"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace parley::core {

enum class CallStatus {
    Completed,
    TimedOut,
    Cancelled,
    Failed  // the call threw
};

template <typename R>
struct TimedResult {
    CallStatus status = CallStatus::Failed;
    std::optional<R> value;
    std::string error;
};

class CallRunner {
public:
    CallRunner() = default;
    ~CallRunner() { joinAll(); }

    CallRunner(const CallRunner&) = delete;
    CallRunner& operator=(const CallRunner&) = delete;

    template <typename R>
    TimedResult<R> run(std::function<R(const CancellationToken&)> fn,
                       std::chrono::milliseconds timeout,
                       const CancellationToken& parent) {
        auto state = std::make_shared<CallState<R>>();
        CancellationToken token = parent.child();

        std::thread worker([state, token, fn = std::move(fn)]() {
            std::optional<R> value;
            std::string error;
            try {
                value = fn(token);
            } catch (const std::exception& e) {
                error = e.what();
            } catch (...) {
                error = "unknown exception";
            }
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->value = std::move(value);
                state->error = std::move(error);
                state->done = true;
            }
            state->cv.notify_all();
        });

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        TimedResult<R> result;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            while (!state->done) {
                if (parent.isCancelled()) {
                    result.status = CallStatus::Cancelled;
                    break;
                }
                if (std::chrono::steady_clock::now() >= deadline) {
                    result.status = CallStatus::TimedOut;
                    break;
                }
                // Short slices so parent cancellation is seen promptly
                state->cv.wait_for(lock, std::chrono::milliseconds(5));
            }
            if (state->done) {
                result.value = std::move(state->value);
                result.error = state->error;
                result.status = result.value ? CallStatus::Completed : CallStatus::Failed;
            }
        }

        if (result.status == CallStatus::Completed || result.status == CallStatus::Failed) {
            worker.join();
        } else {
            token.cancel();
            park(std::move(worker), [state]() {
                std::lock_guard<std::mutex> lock(state->mutex);
                return state->done;
            });
        }
        reapFinished();
        return result;
    }

    /**
     * Join every parked call. Blocks until each one returns.
     */
    void joinAll() {
        std::vector<Parked> parked;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            parked.swap(parked_);
        }
        for (auto& p : parked) {
            if (p.thread.joinable()) {
                p.thread.join();
            }
        }
    }

    size_t parkedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return parked_.size();
    }

private:
    template <typename R>
    struct CallState {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        std::optional<R> value;
        std::string error;
    };

    struct Parked {
        std::thread thread;
        std::function<bool()> finished;
    };

    void park(std::thread thread, std::function<bool()> finished) {
        std::lock_guard<std::mutex> lock(mutex_);
        parked_.push_back({std::move(thread), std::move(finished)});
    }

    void reapFinished() {
        std::vector<std::thread> done;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = parked_.begin(); it != parked_.end();) {
                if (it->finished()) {
                    done.push_back(std::move(it->thread));
                    it = parked_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& t : done) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    mutable std::mutex mutex_;
    std::vector<Parked> parked_;
};

} // namespace parley::core
