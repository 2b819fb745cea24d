#include "rup/storage/session_store.hpp"

#include "rup/storage/session_codec.hpp"
#include "rup/upload/session_state.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace rup::storage {
namespace {

using upload::UploadSession;
using upload::UploadStatus;

constexpr const char* kDetachedReason = "file handle unavailable after restart; select the file again to continue";

void sort_oldest_first(std::vector<UploadSession>& sessions) {
    std::sort(sessions.begin(), sessions.end(), [](const UploadSession& a, const UploadSession& b) {
        if (a.created_at != b.created_at) {
            return a.created_at < b.created_at;
        }
        return a.id < b.id;
    });
}

} // namespace

SessionStore::SessionStore(KeyValueStore& backend) : backend_(backend) {}

Result<void> SessionStore::put(const UploadSession& session) {
    std::unique_lock lock(mutex_);
    return write_locked(session);
}

Result<void> SessionStore::write_locked(const UploadSession& session) {
    records_[session.id] = session;

    auto written = backend_.put(session.id, encode_session(session));
    if (written.is_error()) {
        if (degraded_.insert(session.id).second) {
            spdlog::warn("Session {} is now tracked in memory only: {}", session.id, written.error().message);
        }
        return Err<void>(ErrorCode::Storage, written.error().message);
    }

    if (degraded_.erase(session.id) > 0) {
        spdlog::info("Session {} is persisted again", session.id);
    }
    return Ok();
}

Result<UploadSession> SessionStore::get(const std::string& id) const {
    std::shared_lock lock(mutex_);
    const auto it = records_.find(id);
    if (it == records_.end()) {
        return Err<UploadSession>(ErrorCode::NotFound, "unknown session " + id);
    }
    return Ok(it->second);
}

std::vector<UploadSession> SessionStore::get_all() const {
    std::vector<UploadSession> sessions;
    {
        std::shared_lock lock(mutex_);
        sessions.reserve(records_.size());
        for (const auto& [id, session] : records_) {
            sessions.push_back(session);
        }
    }
    sort_oldest_first(sessions);
    return sessions;
}

Result<void> SessionStore::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    records_.erase(id);
    degraded_.erase(id);
    return backend_.remove(id);
}

bool SessionStore::contains(const std::string& id) const {
    std::shared_lock lock(mutex_);
    return records_.find(id) != records_.end();
}

std::vector<UploadSession> SessionStore::load_backend_locked() const {
    std::vector<UploadSession> sessions;
    auto keys = backend_.keys();
    if (keys.is_error()) {
        spdlog::error("Cannot list persisted sessions: {}", keys.error().message);
        return sessions;
    }

    for (const auto& key : keys.value()) {
        auto raw = backend_.get(key);
        if (raw.is_error()) {
            spdlog::warn("Cannot read session record {}: {}", key, raw.error().message);
            continue;
        }
        auto decoded = decode_session(raw.value());
        if (decoded.is_error()) {
            spdlog::warn("Skipping unreadable session record {}: {}", key, decoded.error().message);
            continue;
        }
        sessions.push_back(std::move(decoded.value()));
    }
    return sessions;
}

std::vector<RestoredSession> SessionStore::restore_all(const upload::FileSourceResolver& resolver) {
    std::unique_lock lock(mutex_);
    for (auto& session : load_backend_locked()) {
        // A newer in-memory copy (degraded write) wins over the stale disk record
        records_.try_emplace(session.id, std::move(session));
    }

    std::vector<UploadSession> sessions;
    sessions.reserve(records_.size());
    for (const auto& [id, session] : records_) {
        sessions.push_back(session);
    }
    sort_oldest_first(sessions);

    std::vector<RestoredSession> restored;
    restored.reserve(sessions.size());
    for (auto& session : sessions) {
        if (upload::is_terminal(session.status)) {
            restored.push_back({std::move(session), nullptr});
            continue;
        }

        auto source = resolver.reacquire(session);
        if (!source || !source->available()) {
            spdlog::warn("Session {} ({}) cannot resume without its file; marking as error", session.id,
                         session.relative_path);
            if (auto failed = upload::mark_failed(session, kDetachedReason); failed.is_error()) {
                spdlog::error("{}", failed.error().message);
            }
            if (auto persisted = write_locked(session); persisted.is_error()) {
                spdlog::debug("Detached session {} kept in memory: {}", session.id, persisted.error().message);
            }
            restored.push_back({std::move(session), nullptr});
            continue;
        }
        restored.push_back({std::move(session), std::move(source)});
    }

    spdlog::info("Restored {} upload sessions", restored.size());
    return restored;
}

std::size_t SessionStore::clear_completed() {
    std::unique_lock lock(mutex_);
    std::size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second.status != UploadStatus::Completed) {
            ++it;
            continue;
        }
        if (auto res = backend_.remove(it->first); res.is_error()) {
            spdlog::warn("Cannot remove completed session {}: {}", it->first, res.error().message);
        }
        degraded_.erase(it->first);
        it = records_.erase(it);
        ++removed;
    }
    return removed;
}

std::size_t SessionStore::purge_older_than(std::chrono::hours max_age, upload::TimePoint now) {
    std::unique_lock lock(mutex_);
    const auto cutoff = now - max_age;

    auto sessions = load_backend_locked();
    for (const auto& [id, session] : records_) {
        sessions.push_back(session);
    }

    std::size_t removed = 0;
    std::unordered_set<std::string> seen;
    for (const auto& session : sessions) {
        if (!seen.insert(session.id).second || session.created_at >= cutoff) {
            continue;
        }
        if (session.status == UploadStatus::Uploading || session.status == UploadStatus::Paused) {
            continue;
        }
        if (auto res = backend_.remove(session.id); res.is_error()) {
            spdlog::warn("Cannot purge session {}: {}", session.id, res.error().message);
            continue;
        }
        records_.erase(session.id);
        degraded_.erase(session.id);
        ++removed;
    }
    if (removed > 0) {
        spdlog::info("Purged {} upload sessions older than {}h", removed, max_age.count());
    }
    return removed;
}

bool SessionStore::is_degraded(const std::string& id) const {
    std::shared_lock lock(mutex_);
    return degraded_.count(id) > 0;
}

std::size_t SessionStore::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

} // namespace rup::storage
