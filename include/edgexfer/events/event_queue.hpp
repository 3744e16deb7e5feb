/**
 * @file event_queue.hpp
 * @brief Blocking work queue shared by transfer workers
 *
 * The orchestrator pushes chunk indices; a pool of workers pops them until
 * the queue is shut down.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace edgexfer::events {

/**
 * @brief Thread-safe FIFO queue
 *
 * THREAD SAFETY:
 * - Multiple producers and consumers
 * - After shutdown(), consumers drain what is left and then receive nullopt
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    void push(T item) {
        {
            std::lock_guard lock(mutex_);
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    void push_all(std::vector<T> items) {
        {
            std::lock_guard lock(mutex_);
            for (auto& item : items) {
                queue_.push(std::move(item));
            }
        }
        cv_.notify_all();
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return take_locked();
    }

    /// Blocks until an item arrives or the queue is shut down and empty.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || shutdown_; });
        return take_locked();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || shutdown_; })) {
            return std::nullopt;
        }
        return take_locked();
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard lock(mutex_);
        return queue_.empty();
    }

    /// Wakes every waiting consumer.
    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    /// Drops queued items and wakes consumers; used when a run is aborted.
    void abort() {
        {
            std::lock_guard lock(mutex_);
            std::queue<T>().swap(queue_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard lock(mutex_);
        return shutdown_;
    }

private:
    std::optional<T> take_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace edgexfer::events
