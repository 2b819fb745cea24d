#include "rup/upload/session_state.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace rup::upload {
namespace {

bool is_allowed(UploadStatus current, UploadStatus target) {
    static const std::unordered_map<UploadStatus, std::vector<UploadStatus>> transitions {
        {UploadStatus::Initialized, {UploadStatus::Queued}},
        {UploadStatus::Queued, {UploadStatus::Uploading, UploadStatus::Cancelled, UploadStatus::Completed}},
        {UploadStatus::Uploading, {UploadStatus::Paused, UploadStatus::Completed, UploadStatus::Cancelled}},
        {UploadStatus::Paused, {UploadStatus::Uploading, UploadStatus::Completed, UploadStatus::Cancelled}},
        {UploadStatus::Error, {UploadStatus::Queued, UploadStatus::Cancelled, UploadStatus::Completed}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

bool can_transition(UploadStatus current, UploadStatus target) noexcept {
    if (current == target) {
        return true;
    }
    if (current == UploadStatus::Completed || current == UploadStatus::Cancelled) {
        return false;
    }
    // Any live session can fail
    if (target == UploadStatus::Error) {
        return true;
    }
    return is_allowed(current, target);
}

Result<void> transition(UploadSession& session, UploadStatus target) {
    if (session.status == target) {
        return Ok();
    }
    if (!can_transition(session.status, target)) {
        return Err<void>(ErrorCode::InvalidState,
                         std::string("illegal transition ") + to_string(session.status) + " -> " +
                             to_string(target) + " for session " + session.id);
    }
    if (target == UploadStatus::Completed && !session.all_chunks_uploaded()) {
        return Err<void>(ErrorCode::InvalidState,
                         "session " + session.id + " cannot complete with missing chunks");
    }

    if (session.status == UploadStatus::Error) {
        session.last_error.clear();
    }
    session.status = target;
    session.last_activity_at = Clock::now();
    return Ok();
}

Result<void> mark_failed(UploadSession& session, std::string reason) {
    if (!can_transition(session.status, UploadStatus::Error)) {
        return Err<void>(ErrorCode::InvalidState,
                         std::string("cannot fail session ") + session.id + " in state " + to_string(session.status));
    }
    session.last_error = std::move(reason);
    session.status = UploadStatus::Error;
    session.last_activity_at = Clock::now();
    return Ok();
}

std::size_t merge_acked(UploadSession& session, const std::vector<std::uint32_t>& acked) {
    std::size_t added = 0;
    for (auto index : acked) {
        if (index < session.total_chunks && session.uploaded_chunks.insert(index).second) {
            ++added;
        }
    }
    return added;
}

} // namespace rup::upload
