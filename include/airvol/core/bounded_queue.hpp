/**
 * @file bounded_queue.hpp
 * @brief Bounded hand-off queue between producer and consumer threads.
 *
 * Discovery publishes candidates through this queue instead of calling the
 * selector directly, so neither side holds a reference to the other.
 *
 * Copyright (c) 2025 AirVol Contributors
 * License: MIT
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace airvol {
namespace core {

/**
 * @brief What to do with a new item when the queue is full.
 */
enum class OverflowPolicy {
    DROP_OLDEST,  ///< Remove oldest item to make room (default)
    DROP_NEWEST   ///< Reject the new item
};

/**
 * @brief Result of an enqueue operation.
 */
enum class EnqueueResult {
    ENQUEUED,        ///< Item stored
    DROPPED_OLDEST,  ///< Item stored, oldest item discarded
    DROPPED_NEWEST,  ///< Item rejected (queue full)
    CLOSED           ///< Queue closed, item discarded
};

/**
 * @brief Counters for a bounded queue.
 */
struct QueueStats {
    size_t current_depth = 0;
    size_t limit = 0;
    uint64_t total_enqueued = 0;
    uint64_t total_delivered = 0;
    uint64_t dropped_oldest = 0;
    uint64_t dropped_newest = 0;
    size_t high_watermark = 0;
};

/**
 * @brief Thread-safe bounded FIFO with blocking, timed dequeue.
 *
 * @tparam T Item type (e.g., core::Target)
 */
template<typename T>
class BoundedQueue {
public:
    /**
     * @param limit Maximum items held (0 = unlimited).
     * @param policy Overflow policy when full.
     */
    explicit BoundedQueue(size_t limit = 64,
                          OverflowPolicy policy = OverflowPolicy::DROP_OLDEST)
        : limit_(limit)
        , policy_(policy)
    {}

    ~BoundedQueue() {
        close();
    }

    // Non-copyable
    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Append an item, applying the overflow policy when full.
     */
    EnqueueResult enqueue(T item) {
        if (closed_.load()) {
            return EnqueueResult::CLOSED;
        }

        EnqueueResult result = EnqueueResult::ENQUEUED;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (limit_ > 0 && items_.size() >= limit_) {
                if (policy_ == OverflowPolicy::DROP_NEWEST) {
                    stats_.dropped_newest++;
                    return EnqueueResult::DROPPED_NEWEST;
                }
                items_.pop_front();
                stats_.dropped_oldest++;
                result = EnqueueResult::DROPPED_OLDEST;
            }

            items_.push_back(std::move(item));
            stats_.total_enqueued++;

            if (items_.size() > stats_.high_watermark) {
                stats_.high_watermark = items_.size();
            }
        }

        cv_.notify_one();
        return result;
    }

    /**
     * @brief Take the next item without waiting.
     */
    std::optional<T> tryDequeue() {
        std::lock_guard<std::mutex> lock(mutex_);
        return popLocked();
    }

    /**
     * @brief Wait up to @p timeout for an item.
     * @return The item, or nullopt on timeout or when the queue is closed and empty.
     */
    template<typename Rep, typename Period>
    std::optional<T> dequeueFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() {
            return closed_.load() || !items_.empty();
        });
        return popLocked();
    }

    QueueStats getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        QueueStats result = stats_;
        result.current_depth = items_.size();
        result.limit = limit_;
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    /**
     * @brief Reject further items and wake all waiters.
     *
     * Items already queued can still be dequeued.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_.store(true);
        }
        cv_.notify_all();
    }

    bool isClosed() const {
        return closed_.load();
    }

private:
    size_t limit_;
    OverflowPolicy policy_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    std::atomic<bool> closed_{false};
    QueueStats stats_;

    std::optional<T> popLocked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        stats_.total_delivered++;
        return item;
    }
};

}  // namespace core
}  // namespace airvol
