#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>

namespace rup::upload {

/// Per-session rates in bytes per second, frozen at one instant.
struct ThroughputSnapshot {
    std::map<std::string, double> per_session;
    double aggregate = 0.0;

    double rate_for(const std::string& session_id) const {
        auto it = per_session.find(session_id);
        return it == per_session.end() ? 0.0 : it->second;
    }
};

/**
 * @brief Sliding-window transfer rate
 *
 * rate = bytes acknowledged inside the window / min(window, time since the
 * session started). Old samples fall out of the window, so the estimate
 * follows changing network conditions instead of averaging the whole
 * lifetime.
 */
class ThroughputMeter {
public:
    using SteadyClock = std::chrono::steady_clock;

    explicit ThroughputMeter(std::chrono::milliseconds window = std::chrono::milliseconds(10000));

    /// Marks the moment a session started (or resumed) transferring.
    void start(const std::string& session_id, SteadyClock::time_point at = SteadyClock::now());

    void record(const std::string& session_id, std::uint64_t bytes, SteadyClock::time_point at = SteadyClock::now());

    void forget(const std::string& session_id);

    double bytes_per_second(const std::string& session_id, SteadyClock::time_point now = SteadyClock::now()) const;

    ThroughputSnapshot snapshot(SteadyClock::time_point now = SteadyClock::now()) const;

    std::chrono::milliseconds window() const noexcept { return window_; }

private:
    struct Sample {
        SteadyClock::time_point at;
        std::uint64_t bytes = 0;
    };

    struct Track {
        SteadyClock::time_point started;
        std::deque<Sample> samples;
    };

    double rate_locked(const Track& track, SteadyClock::time_point now) const;
    void prune_locked(Track& track, SteadyClock::time_point now) const;

    std::chrono::milliseconds window_;
    std::map<std::string, Track> tracks_;
    mutable std::mutex mutex_;
};

} // namespace rup::upload
