#include "rup/upload/chunk_planner.hpp"

#include <iomanip>
#include <limits>
#include <mutex>
#include <random>
#include <sstream>

namespace rup::upload {

ChunkPlanner::ChunkPlanner(std::uint64_t max_file_size) : max_file_size_(max_file_size) {}

Result<UploadSession> ChunkPlanner::plan(const FileSource& source, std::uint32_t chunk_size,
                                         const std::string& base_path) const {
    const auto size = source.size();
    if (size == 0) {
        return Err<UploadSession>(ErrorCode::Validation,
                                  "zero-byte file cannot be uploaded in chunks: " + source.relative_path());
    }
    if (chunk_size == 0) {
        return Err<UploadSession>(ErrorCode::Validation, "chunk size must be > 0");
    }
    if (size > max_file_size_) {
        return Err<UploadSession>(ErrorCode::Validation,
                                  source.relative_path() + " exceeds the maximum file size of " +
                                      std::to_string(max_file_size_) + " bytes");
    }
    const auto chunks = chunk_count(size, chunk_size);
    if (chunks > std::numeric_limits<std::uint32_t>::max()) {
        return Err<UploadSession>(ErrorCode::Validation, "too many chunks for " + source.relative_path());
    }

    UploadSession session;
    session.id = generate_session_id();
    session.file_name = source.file_name();
    session.relative_path = source.relative_path();
    session.base_path = base_path;
    session.source_locator = source.reacquirable() ? source.locator() : std::string();
    session.total_size = size;
    session.chunk_size = chunk_size;
    session.total_chunks = static_cast<std::uint32_t>(chunks);
    session.status = UploadStatus::Initialized;
    session.created_at = Clock::now();
    session.last_activity_at = session.created_at;
    return Ok(std::move(session));
}

std::uint64_t ChunkPlanner::chunk_count(std::uint64_t size, std::uint32_t chunk_size) noexcept {
    if (chunk_size == 0) {
        return 0;
    }
    return (size + chunk_size - 1) / chunk_size;
}

std::string ChunkPlanner::generate_session_id() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    std::uint64_t high = 0;
    std::uint64_t low = 0;
    {
        std::lock_guard lock(mutex);
        high = engine();
        low = engine();
    }
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;    // variant 10

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (high >> 32) << '-'
        << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (high & 0xFFFF) << '-'
        << std::setw(4) << (low >> 48) << '-'
        << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

} // namespace rup::upload
