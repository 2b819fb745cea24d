#pragma once

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace rup::upload {

namespace asio = boost::asio;

/**
 * @brief Debounces completion notices into one refresh per batch
 *
 * Every notice re-arms a steady_timer; the callback fires once the quiet
 * period passes with no further notice, carrying every destination folder
 * seen since the last flush. The timer lives on a private io_context run
 * by one background thread, so the callback runs on that thread.
 */
class RefreshCoalescer {
public:
    using Callback = std::function<void(const std::vector<std::string>& base_paths, std::size_t completed)>;

    RefreshCoalescer(std::chrono::milliseconds quiet_period, Callback on_refresh);
    ~RefreshCoalescer();

    RefreshCoalescer(const RefreshCoalescer&) = delete;
    RefreshCoalescer& operator=(const RefreshCoalescer&) = delete;

    void notify_completed(const std::string& base_path);

    /// Fire now if anything is pending. Blocks until the callback has run;
    /// must not be called from the callback itself.
    void flush();

    /// Cancel the timer and join the thread. Pending notices are dropped.
    void stop();

    std::size_t refresh_count() const noexcept { return refreshes_.load(); }

private:
    void arm();
    void fire();

    std::chrono::milliseconds quiet_period_;
    Callback on_refresh_;

    asio::io_context io_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
    asio::steady_timer timer_;
    std::thread thread_;

    // Touched only on the io_context thread
    std::set<std::string> pending_paths_;
    std::size_t pending_count_ = 0;
    std::atomic<std::size_t> refreshes_{0};
};

} // namespace rup::upload
