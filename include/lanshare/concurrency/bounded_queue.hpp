/**
 * @file bounded_queue.hpp
 * @brief Thread-safe FIFO with an optional capacity limit
 *
 * WHY THIS FILE EXISTS:
 * Worker pools hand tasks to their threads through this queue. A capacity
 * turns an unbounded backlog into backpressure: producers either block
 * (push) or are told to back off (try_push).
 *
 * EXAMPLE:
 * BoundedQueue<int> queue(100);
 * if (!queue.try_push(42)) { ... reject ... }
 * auto item = queue.pop();  // Blocks until available or shutdown
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace lanshare::concurrency {

/**
 * @brief Thread-safe FIFO queue with capacity
 *
 * THREAD SAFETY:
 * - Multiple producers can push concurrently
 * - Multiple consumers can pop concurrently
 * - capacity == 0 means unbounded
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    // Non-copyable
    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Push item, waiting while the queue is full
     *
     * RETURNS: false if the queue was shut down before space was available
     * BLOCKS: Yes, while full
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]() {
                return shutdown_ || capacity_ == 0 || queue_.size() < capacity_;
            });
            if (shutdown_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Push item only if there is room
     *
     * RETURNS: false if full or shut down (item is dropped)
     * BLOCKS: No
     */
    bool try_push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (shutdown_ || (capacity_ != 0 && queue_.size() >= capacity_)) {
                return false;
            }
            queue_.push(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Try to pop item (non-blocking)
     */
    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Pop item (blocking)
     *
     * RETURNS: Item, or nullopt once shut down and drained
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);

        not_empty_.wait(lock, [this]() {
            return !queue_.empty() || shutdown_;
        });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Pop item with timeout
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);

        if (!not_empty_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || shutdown_;
        })) {
            return std::nullopt;  // Timeout
        }

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    std::size_t capacity() const noexcept { return capacity_; }

    /**
     * @brief Signal shutdown (wake up all waiting threads)
     *
     * Items already queued can still be popped.
     */
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_shutdown() const {
        std::unique_lock lock(mutex_);
        return shutdown_;
    }

private:
    std::queue<T> queue_;
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool shutdown_ = false;
};

} // namespace lanshare::concurrency
