#include "rup/upload/task_executor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace rup::upload {

TaskExecutor::TaskExecutor(std::size_t workers) {
    const auto count = std::max<std::size_t>(1, workers);
    workers_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

TaskExecutor::~TaskExecutor() {
    shutdown();
}

bool TaskExecutor::submit(Task task) {
    return queue_.push(std::move(task));
}

void TaskExecutor::shutdown() {
    queue_.shutdown();
    for (auto& worker : workers_) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }
}

void TaskExecutor::worker_loop() {
    while (auto task = queue_.pop()) {
        ++running_;
        try {
            (*task)();
        } catch (const std::exception& e) {
            spdlog::error("Transfer task failed: {}", e.what());
        }
        --running_;
    }
}

} // namespace rup::upload
