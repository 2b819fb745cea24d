#include "rup/upload/types.hpp"

#include <algorithm>

namespace rup::upload {

const char* to_string(UploadStatus status) noexcept {
    switch (status) {
        case UploadStatus::Initialized: return "initialized";
        case UploadStatus::Queued: return "queued";
        case UploadStatus::Uploading: return "uploading";
        case UploadStatus::Paused: return "paused";
        case UploadStatus::Completed: return "completed";
        case UploadStatus::Error: return "error";
        case UploadStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<UploadStatus> parse_status(std::string_view text) noexcept {
    static constexpr UploadStatus all[] = {
        UploadStatus::Initialized, UploadStatus::Queued, UploadStatus::Uploading, UploadStatus::Paused,
        UploadStatus::Completed, UploadStatus::Error, UploadStatus::Cancelled,
    };
    for (auto status : all) {
        if (text == to_string(status)) {
            return status;
        }
    }
    return std::nullopt;
}

bool is_terminal(UploadStatus status) noexcept {
    return status == UploadStatus::Completed || status == UploadStatus::Cancelled ||
           status == UploadStatus::Error;
}

ChunkRange UploadSession::chunk_range(std::uint32_t index) const noexcept {
    ChunkRange range;
    if (chunk_size == 0 || index >= total_chunks) {
        return range;
    }
    range.offset = static_cast<std::uint64_t>(index) * chunk_size;
    const std::uint64_t remaining = total_size - range.offset;
    range.length = static_cast<std::uint32_t>(std::min<std::uint64_t>(remaining, chunk_size));
    return range;
}

std::uint64_t UploadSession::uploaded_bytes() const noexcept {
    std::uint64_t bytes = 0;
    for (auto index : uploaded_chunks) {
        bytes += chunk_range(index).length;
    }
    return bytes;
}

std::optional<std::uint32_t> UploadSession::first_missing_chunk() const noexcept {
    std::uint32_t expected = 0;
    for (auto index : uploaded_chunks) {
        if (index != expected) {
            break;
        }
        ++expected;
    }
    if (expected >= total_chunks) {
        return std::nullopt;
    }
    return expected;
}

} // namespace rup::upload
