#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace rup {

/**
 * @brief Cooperative cancellation flag shared between a controller and workers
 *
 * Workers poll is_cancelled() between steps and use wait_for() instead of
 * sleeping so that backoff delays end as soon as the owner cancels.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool is_cancelled() const noexcept { return cancelled_.load(); }

    /// Blocks up to @p timeout. Returns true if the token was cancelled.
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace rup
