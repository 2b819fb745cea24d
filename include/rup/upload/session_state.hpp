#pragma once

#include "rup/core/result.hpp"
#include "rup/upload/types.hpp"

#include <cstdint>
#include <vector>

namespace rup::upload {

[[nodiscard]] bool can_transition(UploadStatus current, UploadStatus target) noexcept;

/**
 * @brief Moves @p session to @p target if the state machine allows it
 *
 * Re-applying the current status is a no-op success. Leaving Error clears
 * last_error; last_activity_at is stamped on every real change.
 */
Result<void> transition(UploadSession& session, UploadStatus target);

/// Records @p reason and moves the session to Error.
Result<void> mark_failed(UploadSession& session, std::string reason);

/// Adds acknowledged indices below total_chunks; returns how many were new.
std::size_t merge_acked(UploadSession& session, const std::vector<std::uint32_t>& acked);

} // namespace rup::upload
