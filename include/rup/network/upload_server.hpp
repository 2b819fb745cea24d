#pragma once

#include "rup/core/cancellation.hpp"
#include "rup/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace rup::network {

struct CreateUploadRequest {
    std::string file_name;
    std::string relative_path;
    std::string base_path;
    std::uint64_t total_size = 0;
    std::uint32_t chunk_size = 0;
    std::string client_upload_id;  ///< Proposed id; the server may replace it
};

struct CreateUploadResponse {
    std::string upload_id;         ///< Canonical id used for every later call
    std::uint32_t chunk_size = 0;  ///< 0 if the server did not echo it
    std::uint32_t total_chunks = 0;
};

enum class ChunkOutcome {
    Acked,
    AlreadyAcked  ///< 409: the server already holds this index
};

struct ChunkReply {
    ChunkOutcome outcome = ChunkOutcome::Acked;
    std::uint32_t acked_index = 0;
};

struct RemoteUploadStatus {
    std::string upload_id;
    std::string status;
    std::uint32_t total_chunks = 0;
    std::vector<std::uint32_t> acked_chunks;
};

/**
 * @brief Chunk-receiving server
 *
 * POST   /uploads                      -> { uploadId }
 * PUT    /uploads/{id}/chunks/{index}  -> 200 { ackedIndex } | 409 | 4xx | network error
 * GET    /uploads/{id}                 -> session status
 * DELETE /uploads/{id}                 -> discard partial data
 *
 * Implementations map failures to ErrorCode: network faults and 5xx to
 * Transient/Timeout, 401/403 to Authentication, 404 to NotFound, other
 * 4xx to Validation. put_chunk must give up with ErrorCode::Cancelled
 * as soon as @p cancel fires.
 */
class UploadServer {
public:
    virtual ~UploadServer() = default;

    virtual Result<CreateUploadResponse> create_upload(const CreateUploadRequest& request) = 0;

    virtual Result<ChunkReply> put_chunk(const std::string& upload_id, std::uint32_t index,
                                         const std::vector<std::uint8_t>& bytes,
                                         std::chrono::milliseconds timeout, const CancellationToken& cancel) = 0;

    virtual Result<RemoteUploadStatus> get_status(const std::string& upload_id) = 0;

    virtual Result<void> discard(const std::string& upload_id) = 0;
};

/// Maps a non-2xx status (other than 409 on chunk upload) to the error taxonomy.
Error classify_http_status(int status_code, const std::string& detail);

} // namespace rup::network
