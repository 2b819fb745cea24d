#pragma once

#include "rup/core/result.hpp"
#include "rup/upload/file_source.hpp"
#include "rup/upload/types.hpp"

#include <cstdint>
#include <string>

namespace rup::upload {

/**
 * @brief Turns a FileSource into an initialized UploadSession
 *
 * Zero-byte files are rejected: they are never uploaded as chunked
 * sessions, and callers filter them out before planning.
 */
class ChunkPlanner {
public:
    explicit ChunkPlanner(std::uint64_t max_file_size = 50ULL * 1024 * 1024 * 1024);

    Result<UploadSession> plan(const FileSource& source, std::uint32_t chunk_size, const std::string& base_path) const;

    /// ceil(size / chunk_size); 0 when chunk_size is 0.
    static std::uint64_t chunk_count(std::uint64_t size, std::uint32_t chunk_size) noexcept;

    /// Random RFC 4122 version 4 identifier.
    static std::string generate_session_id();

private:
    std::uint64_t max_file_size_;
};

} // namespace rup::upload
