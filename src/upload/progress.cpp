#include "rup/upload/progress.hpp"

#include <algorithm>
#include <cmath>

namespace rup::upload {
namespace {

std::optional<std::uint64_t> eta(std::uint64_t remaining_bytes, double bytes_per_second) {
    if (remaining_bytes == 0) {
        return std::uint64_t{0};
    }
    if (bytes_per_second <= 0.0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(std::ceil(static_cast<double>(remaining_bytes) / bytes_per_second));
}

bool still_owes_bytes(UploadStatus status) {
    return status == UploadStatus::Initialized || status == UploadStatus::Queued ||
           status == UploadStatus::Uploading || status == UploadStatus::Paused;
}

} // namespace

Progress ProgressAggregator::for_session(const UploadSession& session, double bytes_per_second) {
    Progress progress;
    progress.session_id = session.id;
    progress.relative_path = session.relative_path;
    progress.status = session.status;
    progress.uploaded_chunks = static_cast<std::uint32_t>(session.uploaded_chunks.size());
    progress.total_chunks = session.total_chunks;
    progress.uploaded_bytes = session.uploaded_bytes();
    progress.total_bytes = session.total_size;
    progress.remaining_bytes = session.total_size - std::min(progress.uploaded_bytes, session.total_size);
    progress.fraction = session.total_chunks == 0
        ? 0.0
        : static_cast<double>(progress.uploaded_chunks) / static_cast<double>(session.total_chunks);

    // Only an uploading session has a meaningful rate
    progress.bytes_per_second = session.status == UploadStatus::Uploading ? bytes_per_second : 0.0;
    progress.estimated_seconds_remaining = eta(progress.remaining_bytes, progress.bytes_per_second);
    return progress;
}

ProgressReport ProgressAggregator::compute(const std::vector<UploadSession>& sessions,
                                           const ThroughputSnapshot& throughput) {
    ProgressReport report;
    auto& total = report.aggregate;
    std::uint64_t owed_bytes = 0;

    for (const auto& session : sessions) {
        if (session.status == UploadStatus::Cancelled) {
            continue;
        }
        auto progress = for_session(session, throughput.rate_for(session.id));

        total.uploaded_chunks += progress.uploaded_chunks;
        total.total_chunks += progress.total_chunks;
        total.uploaded_bytes += progress.uploaded_bytes;
        total.total_bytes += progress.total_bytes;
        total.bytes_per_second += progress.bytes_per_second;
        if (still_owes_bytes(session.status)) {
            owed_bytes += progress.remaining_bytes;
        }
        report.per_session.push_back(std::move(progress));
    }

    total.status = UploadStatus::Queued;
    total.remaining_bytes = total.total_bytes - total.uploaded_bytes;
    total.fraction = total.total_chunks == 0
        ? 0.0
        : static_cast<double>(total.uploaded_chunks) / static_cast<double>(total.total_chunks);
    total.estimated_seconds_remaining = eta(owed_bytes, total.bytes_per_second);
    return report;
}

std::string format_duration(std::uint64_t seconds) {
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }
    if (seconds < 3600) {
        return std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) + "s";
    }
    return std::to_string(seconds / 3600) + "h " + std::to_string((seconds % 3600) / 60) + "m";
}

} // namespace rup::upload
