/**
 * @file events.hpp
 * @brief Upload engine events
 *
 * NAMING CONVENTION:
 * Events are past-tense: SessionQueuedEvent, ChunkAckedEvent.
 * All events are emitted on the coordinator's EventBus; handlers run on
 * whichever thread produced the event (usually a transfer worker).
 */

#pragma once

#include "rup/core/result.hpp"
#include "rup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace rup::events {

/**
 * @brief A session entered the scheduler queue
 *
 * WHO EMITS: TransferScheduler::enqueue, retry
 */
struct SessionQueuedEvent {
    std::string session_id;
    std::string relative_path;
    std::uint64_t total_size = 0;
    std::uint32_t total_chunks = 0;
};

/**
 * @brief The server acknowledged one chunk
 *
 * WHO EMITS: TransferScheduler after the ack is persisted
 * WHO SUBSCRIBES: ThroughputMeter (via the coordinator), MetricsComponent
 */
struct ChunkAckedEvent {
    std::string session_id;
    std::uint32_t chunk_index = 0;
    std::uint64_t bytes = 0;
    std::uint32_t uploaded_chunks = 0;
    std::uint32_t total_chunks = 0;
    bool already_acked = false;  ///< 409 from the server
};

/**
 * @brief A chunk request failed transiently and will be attempted again
 *
 * WHO EMITS: ChunkTransmitter
 */
struct ChunkRetryEvent {
    std::string session_id;
    std::uint32_t chunk_index = 0;
    std::uint32_t attempt = 0;  ///< Attempt that just failed, 1-based
    std::chrono::milliseconds backoff{0};
    std::string reason;
};

struct SessionStatusChangedEvent {
    std::string session_id;
    upload::UploadStatus from = upload::UploadStatus::Initialized;
    upload::UploadStatus to = upload::UploadStatus::Initialized;
};

/**
 * @brief Every chunk of a session is acknowledged
 *
 * WHO SUBSCRIBES: RefreshCoalescer (one directory refresh per batch)
 */
struct SessionCompletedEvent {
    std::string session_id;
    std::string relative_path;
    std::string base_path;
    std::uint64_t total_size = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief A session moved to error
 *
 * Always carries a human-readable reason for the UI layer.
 */
struct SessionFailedEvent {
    std::string session_id;
    std::string relative_path;
    ErrorCode code = ErrorCode::Transient;
    std::string reason;
};

struct SessionCancelledEvent {
    std::string session_id;
    std::string relative_path;
};

/**
 * @brief Coalesced notification for the external file-listing collaborator
 *
 * Emitted once per quiet period, never once per completed file.
 */
struct DirectoryRefreshEvent {
    std::vector<std::string> base_paths;  ///< Distinct destinations, sorted
    std::size_t completed_sessions = 0;
};

/**
 * @brief The durable store rejected a write
 *
 * The session keeps transferring with in-memory tracking only.
 */
struct PersistenceDegradedEvent {
    std::string session_id;
    std::string reason;
};

} // namespace rup::events
