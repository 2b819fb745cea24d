#pragma once

#include "rup/upload/throughput_meter.hpp"
#include "rup/upload/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rup::upload {

struct Progress {
    std::string session_id;          ///< Empty for the aggregate
    std::string relative_path;
    UploadStatus status = UploadStatus::Queued;
    std::uint32_t uploaded_chunks = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t uploaded_bytes = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t remaining_bytes = 0;
    double fraction = 0.0;           ///< uploaded_chunks / total_chunks
    double bytes_per_second = 0.0;
    std::optional<std::uint64_t> estimated_seconds_remaining;  ///< nullopt while nothing is moving
};

struct ProgressReport {
    std::vector<Progress> per_session;
    Progress aggregate;
};

/**
 * @brief Derives progress and ETA from a snapshot of session records
 *
 * Pure: reads the sessions and the throughput snapshot, mutates nothing,
 * safe to call on every UI tick.
 *
 * The aggregate spans every session except cancelled ones. Its ETA covers
 * the bytes still owed by queued, uploading and paused sessions.
 */
class ProgressAggregator {
public:
    static ProgressReport compute(const std::vector<UploadSession>& sessions, const ThroughputSnapshot& throughput);

    static Progress for_session(const UploadSession& session, double bytes_per_second);
};

/// "0s", "42s", "3m 5s", "2h 10m".
std::string format_duration(std::uint64_t seconds);

} // namespace rup::upload
