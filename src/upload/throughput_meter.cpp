#include "rup/upload/throughput_meter.hpp"

#include <algorithm>

namespace rup::upload {

ThroughputMeter::ThroughputMeter(std::chrono::milliseconds window)
    : window_(std::max(window, std::chrono::milliseconds(1))) {}

void ThroughputMeter::start(const std::string& session_id, SteadyClock::time_point at) {
    std::lock_guard lock(mutex_);
    auto& track = tracks_[session_id];
    track.started = at;
    track.samples.clear();
}

void ThroughputMeter::record(const std::string& session_id, std::uint64_t bytes, SteadyClock::time_point at) {
    std::lock_guard lock(mutex_);
    auto it = tracks_.find(session_id);
    if (it == tracks_.end()) {
        it = tracks_.emplace(session_id, Track{at, {}}).first;
    }
    it->second.samples.push_back(Sample{at, bytes});
    prune_locked(it->second, at);
}

void ThroughputMeter::forget(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    tracks_.erase(session_id);
}

double ThroughputMeter::bytes_per_second(const std::string& session_id, SteadyClock::time_point now) const {
    std::lock_guard lock(mutex_);
    auto it = tracks_.find(session_id);
    return it == tracks_.end() ? 0.0 : rate_locked(it->second, now);
}

ThroughputSnapshot ThroughputMeter::snapshot(SteadyClock::time_point now) const {
    std::lock_guard lock(mutex_);
    ThroughputSnapshot result;
    for (const auto& [id, track] : tracks_) {
        const double rate = rate_locked(track, now);
        result.per_session[id] = rate;
        result.aggregate += rate;
    }
    return result;
}

double ThroughputMeter::rate_locked(const Track& track, SteadyClock::time_point now) const {
    const auto cutoff = now - window_;
    std::uint64_t bytes = 0;
    for (const auto& sample : track.samples) {
        if (sample.at > cutoff && sample.at <= now) {
            bytes += sample.bytes;
        }
    }
    if (bytes == 0) {
        return 0.0;
    }

    const auto since_start = std::chrono::duration_cast<std::chrono::milliseconds>(now - track.started);
    const auto span = std::min(window_, since_start);
    if (span.count() <= 0) {
        return 0.0;
    }
    return static_cast<double>(bytes) * 1000.0 / static_cast<double>(span.count());
}

void ThroughputMeter::prune_locked(Track& track, SteadyClock::time_point now) const {
    const auto cutoff = now - window_;
    while (!track.samples.empty() && track.samples.front().at <= cutoff) {
        track.samples.pop_front();
    }
}

} // namespace rup::upload
