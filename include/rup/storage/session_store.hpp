#pragma once

/**
 * @file session_store.hpp
 * @brief Durable mirror of every upload session record
 *
 * WHY THIS FILE EXISTS:
 * The session store is the single source of truth for upload progress.
 * The scheduler keeps its own in-memory view, but that view must always
 * be rebuildable from what is stored here: tear the scheduler down,
 * call restore_all(), and every session picks up where it stopped.
 *
 * HOW IT WORKS:
 * - Every put() encodes the whole record and writes it to the backing
 *   KeyValueStore in one call. There is no delta log to replay.
 * - A write-through cache answers get()/get_all() without touching disk.
 * - If the backend rejects a write (quota, disk full) the record stays in
 *   the cache only. The session keeps uploading, a warning is logged and
 *   put() reports ErrorCode::Storage so the caller can surface it.
 *
 * RESTORE POLICY:
 * Terminal records come back for display only. A live record whose file
 * cannot be re-acquired is moved to error: it cannot make progress until
 * the user selects the file again.
 *
 * THREAD SAFETY:
 * All methods may be called concurrently. Writes for one id are applied in
 * call order.
 */

#include "rup/core/result.hpp"
#include "rup/storage/key_value_store.hpp"
#include "rup/upload/file_source.hpp"
#include "rup/upload/types.hpp"

#include <chrono>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rup::storage {

struct RestoredSession {
    upload::UploadSession session;
    upload::FileSourcePtr source;  ///< nullptr for terminal or detached sessions
};

class SessionStore {
public:
    explicit SessionStore(KeyValueStore& backend);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /**
     * Insert or replace the record for session.id
     *
     * The cache is updated even when the backend write fails.
     *
     * @return ErrorCode::Storage if the record is held in memory only
     */
    Result<void> put(const upload::UploadSession& session);

    Result<upload::UploadSession> get(const std::string& id) const;

    /// Every cached record, oldest first.
    std::vector<upload::UploadSession> get_all() const;

    Result<void> remove(const std::string& id);

    bool contains(const std::string& id) const;

    /**
     * Load every record from the backend and apply the restore policy
     *
     * Records that fail to decode are skipped with a warning and left in
     * the backend untouched.
     *
     * @param resolver Re-opens the file behind each live session
     * @return Restored sessions, oldest first
     */
    std::vector<RestoredSession> restore_all(const upload::FileSourceResolver& resolver);

    /// Remove every completed record. Returns the number removed.
    std::size_t clear_completed();

    /// Remove records created before now - max_age, except uploading and paused
    /// ones. Returns the number removed.
    std::size_t purge_older_than(std::chrono::hours max_age, upload::TimePoint now = upload::Clock::now());

    /// True if the last write for @p id only reached the in-memory cache.
    bool is_degraded(const std::string& id) const;

    std::size_t size() const;

private:
    Result<void> write_locked(const upload::UploadSession& session);
    std::vector<upload::UploadSession> load_backend_locked() const;

    KeyValueStore& backend_;
    std::unordered_map<std::string, upload::UploadSession> records_;
    std::unordered_set<std::string> degraded_;
    mutable std::shared_mutex mutex_;
};

} // namespace rup::storage
