#pragma once

/**
 * @file transfer_scheduler.hpp
 * @brief Owns the session state machine and drives chunk transfers
 *
 * HOW IT WORKS:
 * - Queued sessions are admitted to uploading in FIFO order while fewer
 *   than max_active_sessions are uploading.
 * - Uploading sessions receive chunk slots round-robin. A slot is granted
 *   while the global in-flight count is below global_chunk_limit and the
 *   session's own in-flight count is below per_session_chunk_limit.
 * - The next index for a session is always the lowest one that is neither
 *   acknowledged nor in flight, so resume never re-sends an ack and never
 *   skips a gap.
 * - Each chunk runs on a TaskExecutor worker: read bytes, send through the
 *   ChunkTransmitter, then apply the result under the scheduler lock. Every
 *   ack is persisted as one whole-record write before the next ack is
 *   applied.
 *
 * PAUSE AND CANCEL:
 * Each admission gets a fresh CancellationToken. pause() and cancel() fire
 * it, which aborts that session's requests and backoff waits only. An ack
 * that arrives after a pause is still recorded. After cancel() the record
 * is gone and late results are dropped.
 *
 * THREAD SAFETY:
 * Every public method may be called from any thread. Events are emitted
 * after the scheduler lock is released.
 */

#include "rup/core/cancellation.hpp"
#include "rup/core/config.hpp"
#include "rup/core/result.hpp"
#include "rup/events/event_bus.hpp"
#include "rup/network/upload_server.hpp"
#include "rup/storage/session_store.hpp"
#include "rup/upload/chunk_transmitter.hpp"
#include "rup/upload/file_source.hpp"
#include "rup/upload/task_executor.hpp"
#include "rup/upload/types.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace rup::upload {

class TransferScheduler {
public:
    TransferScheduler(storage::SessionStore& store, ChunkTransmitter& transmitter, network::UploadServer& server,
                      SchedulerConfig config, events::EventBus& bus);
    ~TransferScheduler();

    TransferScheduler(const TransferScheduler&) = delete;
    TransferScheduler& operator=(const TransferScheduler&) = delete;

    /**
     * Take ownership of a freshly planned session and queue it
     *
     * @return InvalidState if the id is already live in this scheduler or
     *         the session is past initialized/queued
     */
    Result<void> enqueue(UploadSession session, FileSourcePtr source);

    /**
     * Take over a session rebuilt from the store after a restart
     *
     * initialized sessions are queued, queued and uploading ones resume
     * scheduling, paused ones wait for resume(). Terminal sessions are kept
     * for display and for retry().
     */
    Result<void> adopt(UploadSession session, FileSourcePtr source);

    /// uploading -> paused. Aborts in-flight requests for this session.
    Result<void> pause(const std::string& id);

    /// paused -> uploading once the file handle is re-validated; otherwise the session fails.
    Result<void> resume(const std::string& id);

    /// Delete the record, stop all requests and ask the server to discard partial data.
    Result<void> cancel(const std::string& id);

    /**
     * error -> queued
     *
     * @param replacement File re-selected by the user; must have the
     *        session's size. nullptr keeps the current handle.
     */
    Result<void> retry(const std::string& id, FileSourcePtr replacement = nullptr);

    /// Drop completed sessions here and in the store in one step; returns the records removed.
    std::size_t clear_completed();

    std::optional<UploadSession> session(const std::string& id) const;
    std::vector<UploadSession> sessions() const;

    /// True if any session is uploading or paused.
    bool has_active_sessions() const;

    std::size_t in_flight() const;

    /// Block until nothing is queued, uploading or in flight and every chunk event has been emitted.
    bool wait_until_idle(std::chrono::milliseconds timeout) const;

    /**
     * Stop dispatching and abort requests without touching session status
     *
     * Uploading sessions stay uploading in the store, so a new scheduler
     * built from restore_all() continues them.
     */
    void shutdown();

private:
    struct Entry {
        UploadSession session;
        FileSourcePtr source;
        CancellationTokenPtr token;
        std::set<std::uint32_t> in_flight;
        std::uint32_t cursor = 0;  // No index below this is missing
        bool degraded = false;
    };

    using Notifications = std::vector<std::function<void()>>;

    void pump_locked(Notifications& out);
    bool dispatch_one_locked(const std::string& id, Entry& entry);
    std::optional<std::uint32_t> next_index_locked(Entry& entry) const;
    void run_chunk(const std::string& id, std::uint32_t index, ChunkRange range, FileSourcePtr source,
                   CancellationTokenPtr token);
    void on_chunk_result(const std::string& id, std::uint32_t index, std::uint64_t bytes, const Result<ChunkAck>& result);

    void record_ack_locked(Entry& entry, const ChunkAck& ack, std::uint64_t bytes, Notifications& out);
    void fail_locked(Entry& entry, ErrorCode code, const std::string& reason, Notifications& out);
    bool change_status_locked(Entry& entry, UploadStatus target, Notifications& out);
    void persist_locked(Entry& entry, Notifications& out);
    void complete_if_done_locked(Entry& entry, Notifications& out);
    void drop_from_queues_locked(const std::string& id);
    Entry* find_locked(const std::string& id);

    template<typename Event>
    void notify(Notifications& out, Event event);

    void flush(Notifications& notifications) const;

    storage::SessionStore& store_;
    ChunkTransmitter& transmitter_;
    network::UploadServer& server_;
    SchedulerConfig config_;
    events::EventBus& bus_;

    std::unordered_map<std::string, Entry> entries_;
    std::deque<std::string> queued_;
    std::list<std::string> uploading_;     // Admission order, drives round-robin
    std::size_t in_flight_total_ = 0;
    std::size_t delivering_ = 0;           // Chunk results whose events are not emitted yet
    bool stopping_ = false;

    mutable std::mutex mutex_;
    mutable std::condition_variable idle_cv_;

    // Declared last: workers must be joined before the state above goes away
    TaskExecutor executor_;
};

} // namespace rup::upload
