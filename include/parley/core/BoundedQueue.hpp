/**
 * BoundedQueue.hpp - Fixed-capacity queue between pipeline stages
 *
 * Every operation is either non-blocking or has an explicit bounded wait.
 * Pushes take an rvalue and only move from it on success, so a rejected
 * item is still owned by the caller.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace parley::core {

template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * Push if there is room. Returns false when full or closed.
     */
    bool tryPush(T&& item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || items_.size() >= capacity_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * Push, waiting up to `wait` for room.
     */
    bool pushFor(T&& item, std::chrono::milliseconds wait) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!not_full_.wait_for(lock, wait, [this]() {
                    return closed_ || items_.size() < capacity_;
                })) {
                return false;
            }
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * Push past capacity. Only a closed queue rejects the item.
     */
    bool forcePush(T&& item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * Push, evicting the oldest queued item if full. Returns the evicted
     * item, if any. A closed queue rejects the item and returns nothing.
     */
    std::optional<T> pushDropOldest(T&& item) {
        std::optional<T> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return dropped;
            }
            if (items_.size() >= capacity_) {
                dropped = std::move(items_.front());
                items_.pop_front();
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return dropped;
    }

    std::optional<T> tryPop() {
        std::optional<T> out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.empty()) {
                return out;
            }
            out = std::move(items_.front());
            items_.pop_front();
        }
        not_full_.notify_one();
        return out;
    }

    /**
     * Pop, waiting up to `wait` for an item. Returns nothing on timeout or
     * when the queue is closed and drained.
     */
    std::optional<T> popFor(std::chrono::milliseconds wait) {
        std::optional<T> out;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait_for(lock, wait, [this]() { return closed_ || !items_.empty(); });
            if (items_.empty()) {
                return out;
            }
            out = std::move(items_.front());
            items_.pop_front();
        }
        not_full_.notify_one();
        return out;
    }

    /**
     * Remove every queued item matching `pred`. Returns how many were removed.
     */
    template <typename Pred>
    size_t removeIf(Pred pred) {
        size_t removed = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = items_.begin(); it != items_.end();) {
                if (pred(*it)) {
                    it = items_.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }
        if (removed > 0) {
            not_full_.notify_all();
        }
        return removed;
    }

    void clear() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.clear();
        }
        not_full_.notify_all();
    }

    /**
     * Reject further pushes and wake every waiter. Queued items can still
     * be drained.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::deque<T> items_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

} // namespace parley::core
