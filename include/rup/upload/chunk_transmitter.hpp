#pragma once

#include "rup/core/cancellation.hpp"
#include "rup/core/config.hpp"
#include "rup/core/result.hpp"
#include "rup/events/event_bus.hpp"
#include "rup/network/upload_server.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace rup::upload {

struct ChunkAck {
    std::uint32_t index = 0;
    bool already_acked = false;  ///< Server answered 409
    std::uint32_t attempts = 1;  ///< Requests issued, including the successful one
};

/**
 * @brief Sends one chunk with a timeout and bounded exponential backoff
 *
 * Only Transient and Timeout failures are retried. Authentication and
 * Validation errors return on first occurrence. A 409 counts as success,
 * so re-sending an index the server already holds is harmless.
 *
 * Backoff waits on the session's CancellationToken; a pause or cancel ends
 * the wait at once and send() returns ErrorCode::Cancelled. Other sessions
 * are unaffected because each has its own token.
 */
class ChunkTransmitter {
public:
    ChunkTransmitter(network::UploadServer& server, RetryConfig config, events::EventBus* bus = nullptr);

    Result<ChunkAck> send(const std::string& session_id, std::uint32_t index,
                          const std::vector<std::uint8_t>& bytes, const CancellationToken& cancel) const;

    const RetryConfig& config() const noexcept { return config_; }

private:
    network::UploadServer& server_;
    RetryConfig config_;
    events::EventBus* bus_;
};

} // namespace rup::upload
