#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace rup::upload {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class UploadStatus {
    Initialized,
    Queued,
    Uploading,
    Paused,
    Completed,
    Error,
    Cancelled
};

const char* to_string(UploadStatus status) noexcept;
std::optional<UploadStatus> parse_status(std::string_view text) noexcept;

/// Completed, Cancelled and Error. Error leaves this set only via a manual retry.
bool is_terminal(UploadStatus status) noexcept;

/**
 * @brief Byte range covered by one chunk
 */
struct ChunkRange {
    std::uint64_t offset = 0;
    std::uint32_t length = 0;
};

/**
 * @brief Durable record tracking one file's upload progress
 *
 * Keyed by id everywhere: the session store, the scheduler and the server's
 * chunk addresses. uploaded_chunks only grows, except on cancel.
 */
struct UploadSession {
    std::string id;
    std::string file_name;
    std::string relative_path;
    std::string base_path;                 ///< Destination folder on the server
    std::string source_locator;            ///< Re-acquirable handle, empty if ephemeral
    std::uint64_t total_size = 0;
    std::uint32_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::set<std::uint32_t> uploaded_chunks;
    UploadStatus status = UploadStatus::Initialized;
    std::map<std::uint32_t, std::uint32_t> chunk_retries;  ///< Retries spent per chunk index
    std::uint32_t retry_count = 0;         ///< Total retries spent on this session
    std::string last_error;                ///< Populated when status == Error
    TimePoint created_at{};
    TimePoint last_activity_at{};

    [[nodiscard]] bool all_chunks_uploaded() const noexcept {
        return total_chunks > 0 && uploaded_chunks.size() == total_chunks;
    }

    [[nodiscard]] ChunkRange chunk_range(std::uint32_t index) const noexcept;

    /// Sum of the lengths of acknowledged chunks (the final chunk may be short).
    [[nodiscard]] std::uint64_t uploaded_bytes() const noexcept;

    /// Lowest index not yet acknowledged, or nullopt when every chunk is.
    [[nodiscard]] std::optional<std::uint32_t> first_missing_chunk() const noexcept;
};

} // namespace rup::upload
