#pragma once

#include "rup/core/blocking_queue.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace rup::upload {

/**
 * @brief Fixed pool of worker threads draining a BlockingQueue of tasks
 *
 * The pool size is the hard cap on concurrently running tasks. The
 * transfer scheduler sizes it to the global in-flight chunk limit.
 * shutdown() lets queued tasks finish and joins every worker.
 */
class TaskExecutor {
public:
    using Task = std::function<void()>;

    explicit TaskExecutor(std::size_t workers);
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    /// Returns false once shutdown() has been called.
    bool submit(Task task);

    void shutdown();

    std::size_t worker_count() const noexcept { return workers_.size(); }
    std::size_t pending() const { return queue_.size(); }
    std::size_t running() const noexcept { return running_.load(); }

private:
    void worker_loop();

    BlockingQueue<Task> queue_;
    std::vector<std::thread> workers_;
    std::atomic<std::size_t> running_{0};
};

} // namespace rup::upload
