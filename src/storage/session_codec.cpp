#include "rup/storage/session_codec.hpp"

#include <chrono>
#include <vector>

namespace rup::storage {
namespace {

using json = nlohmann::json;
using upload::TimePoint;
using upload::UploadSession;

std::int64_t to_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_millis(std::int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

} // namespace

json session_to_json(const UploadSession& session) {
    json j;
    j["uploadId"] = session.id;
    j["fileName"] = session.file_name;
    j["relativePath"] = session.relative_path;
    j["basePath"] = session.base_path;
    j["sourceLocator"] = session.source_locator;
    j["totalSize"] = session.total_size;
    j["chunkSize"] = session.chunk_size;
    j["totalChunks"] = session.total_chunks;
    j["uploadedChunks"] = std::vector<std::uint32_t>(session.uploaded_chunks.begin(), session.uploaded_chunks.end());
    j["status"] = upload::to_string(session.status);
    j["retryCount"] = session.retry_count;

    json retries = json::object();
    for (const auto& [index, count] : session.chunk_retries) {
        retries[std::to_string(index)] = count;
    }
    j["chunkRetries"] = retries;
    j["lastError"] = session.last_error;
    j["createdAt"] = to_millis(session.created_at);
    j["lastActivityAt"] = to_millis(session.last_activity_at);
    return j;
}

Result<UploadSession> session_from_json(const json& j) {
    UploadSession session;
    try {
        session.id = j.at("uploadId").get<std::string>();
        session.file_name = j.at("fileName").get<std::string>();
        session.relative_path = j.value("relativePath", std::string());
        session.base_path = j.value("basePath", std::string());
        session.source_locator = j.value("sourceLocator", std::string());
        session.total_size = j.at("totalSize").get<std::uint64_t>();
        session.chunk_size = j.at("chunkSize").get<std::uint32_t>();
        session.total_chunks = j.at("totalChunks").get<std::uint32_t>();
        for (auto index : j.at("uploadedChunks").get<std::vector<std::uint32_t>>()) {
            session.uploaded_chunks.insert(index);
        }

        const auto status_text = j.at("status").get<std::string>();
        const auto status = upload::parse_status(status_text);
        if (!status) {
            return Err<UploadSession>(ErrorCode::Validation, "unknown status '" + status_text + "'");
        }
        session.status = *status;

        session.retry_count = j.value("retryCount", 0u);
        if (j.contains("chunkRetries")) {
            for (const auto& [index, count] : j.at("chunkRetries").items()) {
                session.chunk_retries[static_cast<std::uint32_t>(std::stoul(index))] = count.get<std::uint32_t>();
            }
        }
        session.last_error = j.value("lastError", std::string());
        session.created_at = from_millis(j.value("createdAt", std::int64_t{0}));
        session.last_activity_at = from_millis(j.value("lastActivityAt", std::int64_t{0}));
    } catch (const json::exception& e) {
        return Err<UploadSession>(ErrorCode::Validation, std::string("malformed session record: ") + e.what());
    } catch (const std::logic_error& e) {
        return Err<UploadSession>(ErrorCode::Validation, std::string("malformed chunk index: ") + e.what());
    }

    if (session.id.empty()) {
        return Err<UploadSession>(ErrorCode::Validation, "session record without uploadId");
    }
    if (session.chunk_size == 0 || session.total_chunks == 0) {
        return Err<UploadSession>(ErrorCode::Validation, "session " + session.id + " has no chunks");
    }
    const auto expected_chunks = (session.total_size + session.chunk_size - 1) / session.chunk_size;
    if (expected_chunks != session.total_chunks) {
        return Err<UploadSession>(ErrorCode::Validation, "session " + session.id + " chunk count mismatch");
    }
    if (!session.uploaded_chunks.empty() && *session.uploaded_chunks.rbegin() >= session.total_chunks) {
        return Err<UploadSession>(ErrorCode::Validation, "session " + session.id + " has out-of-range chunk index");
    }
    if (session.status == upload::UploadStatus::Completed && !session.all_chunks_uploaded()) {
        return Err<UploadSession>(ErrorCode::Validation, "session " + session.id + " completed with missing chunks");
    }
    if (session.all_chunks_uploaded() && session.status != upload::UploadStatus::Completed &&
        session.status != upload::UploadStatus::Cancelled) {
        // All acks persisted but the completion write was lost
        session.status = upload::UploadStatus::Completed;
    }
    return Ok(std::move(session));
}

std::string encode_session(const UploadSession& session) {
    return session_to_json(session).dump();
}

Result<UploadSession> decode_session(const std::string& text) {
    try {
        return session_from_json(json::parse(text));
    } catch (const json::parse_error& e) {
        return Err<UploadSession>(ErrorCode::Validation, std::string("unparseable session record: ") + e.what());
    }
}

} // namespace rup::storage
