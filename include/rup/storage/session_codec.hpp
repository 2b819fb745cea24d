#pragma once

#include "rup/core/result.hpp"
#include "rup/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace rup::storage {

/**
 * Persisted record layout (one JSON object per session):
 *
 * { uploadId, fileName, relativePath, basePath, sourceLocator,
 *   totalSize, chunkSize, totalChunks, uploadedChunks: [int],
 *   status, retryCount, chunkRetries: {"<index>": n}, lastError,
 *   createdAt, lastActivityAt }          (timestamps: ms since epoch)
 */
nlohmann::json session_to_json(const upload::UploadSession& session);

/// Rejects records that break the session invariants.
Result<upload::UploadSession> session_from_json(const nlohmann::json& j);

std::string encode_session(const upload::UploadSession& session);
Result<upload::UploadSession> decode_session(const std::string& text);

} // namespace rup::storage
