/**
 * @file blocking_queue.hpp
 * @brief Thread-safe FIFO feeding the transfer worker pool
 *
 * EXAMPLE:
 * BlockingQueue<Task> queue;
 * queue.push(task);            // Scheduler thread
 * auto next = queue.pop();     // Worker (blocks until available or shutdown)
 */

#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace rup {

/**
 * @brief Multi-producer, multi-consumer FIFO
 *
 * After shutdown() the queue drains: pop() keeps returning queued items and
 * yields nullopt only once the queue is empty.
 */
template<typename T>
class BlockingQueue {
public:
    BlockingQueue() = default;

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    /// Returns false if the queue is already shut down; the item is dropped.
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (shutdown_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || shutdown_; });

        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
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

    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    bool is_shutdown() const {
        std::unique_lock lock(mutex_);
        return shutdown_;
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace rup
