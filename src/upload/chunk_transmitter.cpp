#include "rup/upload/chunk_transmitter.hpp"

#include "rup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace rup::upload {

ChunkTransmitter::ChunkTransmitter(network::UploadServer& server, RetryConfig config, events::EventBus* bus)
    : server_(server), config_(std::move(config)), bus_(bus) {}

Result<ChunkAck> ChunkTransmitter::send(const std::string& session_id, std::uint32_t index,
                                        const std::vector<std::uint8_t>& bytes,
                                        const CancellationToken& cancel) const {
    const auto max_attempts = std::max<std::uint32_t>(1, config_.max_attempts);
    const auto where = "chunk " + std::to_string(index) + " of " + session_id;

    for (std::uint32_t attempt = 1;; ++attempt) {
        if (cancel.is_cancelled()) {
            return Err<ChunkAck>(ErrorCode::Cancelled, where + " aborted");
        }

        auto reply = server_.put_chunk(session_id, index, bytes, config_.chunk_timeout, cancel);
        if (reply.is_ok()) {
            const auto& value = reply.value();
            if (value.outcome == network::ChunkOutcome::Acked && value.acked_index != index) {
                return Err<ChunkAck>(ErrorCode::Validation,
                                     where + ": server acknowledged index " + std::to_string(value.acked_index));
            }
            ChunkAck ack;
            ack.index = index;
            ack.already_acked = value.outcome == network::ChunkOutcome::AlreadyAcked;
            ack.attempts = attempt;
            return Ok(ack);
        }

        const Error& error = reply.error();
        if (error.code == ErrorCode::Cancelled || cancel.is_cancelled()) {
            return Err<ChunkAck>(ErrorCode::Cancelled, where + " aborted");
        }
        if (!is_retryable(error.code)) {
            spdlog::warn("{} rejected: {}", where, error.describe());
            return Err<ChunkAck>(error);
        }
        if (attempt >= max_attempts) {
            return Err<ChunkAck>(error.code, where + " failed after " + std::to_string(attempt) +
                                                 " attempts: " + error.message);
        }

        const auto delay = config_.backoff_for(attempt);
        spdlog::debug("{} attempt {} failed ({}), retrying in {}ms", where, attempt, error.message, delay.count());
        if (bus_) {
            bus_->emit(events::ChunkRetryEvent{session_id, index, attempt, delay, error.message});
        }
        if (cancel.wait_for(delay)) {
            return Err<ChunkAck>(ErrorCode::Cancelled, where + " aborted during backoff");
        }
    }
}

} // namespace rup::upload
