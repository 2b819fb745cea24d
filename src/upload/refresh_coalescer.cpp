#include "rup/upload/refresh_coalescer.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <future>

namespace rup::upload {

RefreshCoalescer::RefreshCoalescer(std::chrono::milliseconds quiet_period, Callback on_refresh)
    : quiet_period_(quiet_period),
      on_refresh_(std::move(on_refresh)),
      work_(asio::make_work_guard(io_)),
      timer_(io_) {
    thread_ = std::thread([this]() { io_.run(); });
}

RefreshCoalescer::~RefreshCoalescer() {
    stop();
}

void RefreshCoalescer::notify_completed(const std::string& base_path) {
    asio::post(io_, [this, base_path]() {
        pending_paths_.insert(base_path);
        ++pending_count_;
        arm();
    });
}

void RefreshCoalescer::arm() {
    // Re-arming aborts the previous wait
    timer_.expires_after(quiet_period_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            spdlog::warn("Refresh timer failed: {}", ec.message());
        }
        fire();
    });
}

void RefreshCoalescer::fire() {
    if (pending_count_ == 0) {
        return;
    }
    std::vector<std::string> paths(pending_paths_.begin(), pending_paths_.end());
    const auto completed = pending_count_;
    pending_paths_.clear();
    pending_count_ = 0;
    ++refreshes_;

    spdlog::debug("Directory refresh after {} completion(s) in {} folder(s)", completed, paths.size());
    if (on_refresh_) {
        try {
            on_refresh_(paths, completed);
        } catch (const std::exception& e) {
            spdlog::error("Directory refresh callback threw: {}", e.what());
        }
    }
}

void RefreshCoalescer::flush() {
    if (!thread_.joinable() || io_.stopped()) {
        return;
    }
    std::promise<void> done;
    auto finished = done.get_future();
    asio::post(io_, [this, &done]() {
        timer_.cancel();
        fire();
        done.set_value();
    });
    finished.wait();
}

void RefreshCoalescer::stop() {
    if (!thread_.joinable()) {
        return;
    }
    asio::post(io_, [this]() { timer_.cancel(); });
    work_.reset();
    thread_.join();
}

} // namespace rup::upload
