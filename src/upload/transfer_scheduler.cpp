#include "rup/upload/transfer_scheduler.hpp"

#include "rup/events/events.hpp"
#include "rup/upload/session_state.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace rup::upload {
namespace {

constexpr const char* kHandleLost = "file handle unavailable; select the file again to continue";

std::chrono::milliseconds elapsed_since(TimePoint start) {
    const auto elapsed = Clock::now() - start;
    if (elapsed.count() < 0) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
}

} // namespace

TransferScheduler::TransferScheduler(storage::SessionStore& store, ChunkTransmitter& transmitter,
                                     network::UploadServer& server, SchedulerConfig config, events::EventBus& bus)
    : store_(store),
      transmitter_(transmitter),
      server_(server),
      config_(config),
      bus_(bus),
      executor_(std::max<std::size_t>(1, config.global_chunk_limit)) {
    config_.global_chunk_limit = std::max<std::size_t>(1, config_.global_chunk_limit);
    config_.per_session_chunk_limit = std::max<std::size_t>(1, config_.per_session_chunk_limit);
    config_.max_active_sessions = std::max<std::size_t>(1, config_.max_active_sessions);
}

TransferScheduler::~TransferScheduler() {
    shutdown();
}

template<typename Event>
void TransferScheduler::notify(Notifications& out, Event event) {
    out.push_back([this, event = std::move(event)]() { bus_.emit(event); });
}

void TransferScheduler::flush(Notifications& notifications) const {
    for (auto& notification : notifications) {
        notification();
    }
    notifications.clear();
}

TransferScheduler::Entry* TransferScheduler::find_locked(const std::string& id) {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

// ════════════════════════════════════════════════════════
// Public operations
// ════════════════════════════════════════════════════════

Result<void> TransferScheduler::enqueue(UploadSession session, FileSourcePtr source) {
    if (!source) {
        return Err<void>(ErrorCode::Validation, "session " + session.id + " has no file source");
    }
    if (session.status != UploadStatus::Initialized && session.status != UploadStatus::Queued) {
        return Err<void>(ErrorCode::InvalidState, std::string("cannot enqueue session ") + session.id +
                                                      " in state " + to_string(session.status));
    }

    Notifications out;
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return Err<void>(ErrorCode::InvalidState, "scheduler is shut down");
        }
        if (auto* existing = find_locked(session.id); existing && !is_terminal(existing->session.status)) {
            return Err<void>(ErrorCode::InvalidState, "session " + session.id + " is already scheduled");
        }

        const std::string id = session.id;
        Entry entry;
        entry.session = std::move(session);
        entry.source = std::move(source);
        auto& stored = entries_[id] = std::move(entry);

        change_status_locked(stored, UploadStatus::Queued, out);
        persist_locked(stored, out);
        queued_.push_back(id);
        notify(out, events::SessionQueuedEvent{id, stored.session.relative_path, stored.session.total_size,
                                               stored.session.total_chunks});
        pump_locked(out);
    }
    flush(out);
    return Ok();
}

Result<void> TransferScheduler::adopt(UploadSession session, FileSourcePtr source) {
    Notifications out;
    {
        std::lock_guard lock(mutex_);
        if (auto* existing = find_locked(session.id); existing && !is_terminal(existing->session.status)) {
            return Err<void>(ErrorCode::InvalidState, "session " + session.id + " is already scheduled");
        }

        const std::string id = session.id;
        if (session.status == UploadStatus::Cancelled) {
            // A cancel whose delete did not reach the backend
            auto removed = store_.remove(id);
            if (removed.is_error()) {
                spdlog::warn("Could not remove cancelled session {}: {}", id, removed.error().message);
            }
            return Ok();
        }

        Entry entry;
        entry.session = std::move(session);
        entry.source = std::move(source);
        auto& stored = entries_[id] = std::move(entry);
        auto& record = stored.session;

        if (record.all_chunks_uploaded() && record.status != UploadStatus::Completed) {
            complete_if_done_locked(stored, out);
            persist_locked(stored, out);
        } else {
            switch (record.status) {
                case UploadStatus::Initialized:
                    change_status_locked(stored, UploadStatus::Queued, out);
                    persist_locked(stored, out);
                    queued_.push_back(id);
                    break;
                case UploadStatus::Queued:
                    queued_.push_back(id);
                    break;
                case UploadStatus::Uploading:
                    if (!stored.source || !stored.source->available()) {
                        fail_locked(stored, ErrorCode::Io, kHandleLost, out);
                    } else {
                        stored.token = std::make_shared<CancellationToken>();
                        uploading_.push_back(id);
                    }
                    break;
                case UploadStatus::Paused:
                case UploadStatus::Completed:
                case UploadStatus::Error:
                case UploadStatus::Cancelled:
                    break;
            }
        }

        spdlog::debug("Adopted session {} ({}, {}/{} chunks)", id, to_string(record.status),
                      record.uploaded_chunks.size(), record.total_chunks);
        pump_locked(out);
    }
    flush(out);
    return Ok();
}

Result<void> TransferScheduler::pause(const std::string& id) {
    Notifications out;
    {
        std::lock_guard lock(mutex_);
        auto* entry = find_locked(id);
        if (!entry) {
            return Err<void>(ErrorCode::NotFound, "unknown session " + id);
        }
        if (entry->session.status != UploadStatus::Uploading) {
            return Err<void>(ErrorCode::InvalidState, std::string("cannot pause session ") + id + " in state " +
                                                          to_string(entry->session.status));
        }

        if (entry->token) {
            entry->token->cancel();
        }
        drop_from_queues_locked(id);
        change_status_locked(*entry, UploadStatus::Paused, out);
        persist_locked(*entry, out);
        pump_locked(out);
    }
    idle_cv_.notify_all();
    flush(out);
    return Ok();
}

Result<void> TransferScheduler::resume(const std::string& id) {
    Notifications out;
    Result<void> outcome = Ok();
    {
        std::lock_guard lock(mutex_);
        auto* entry = find_locked(id);
        if (!entry) {
            return Err<void>(ErrorCode::NotFound, "unknown session " + id);
        }
        if (entry->session.status != UploadStatus::Paused) {
            return Err<void>(ErrorCode::InvalidState, std::string("cannot resume session ") + id + " in state " +
                                                          to_string(entry->session.status));
        }

        if (!entry->source || !entry->source->available()) {
            fail_locked(*entry, ErrorCode::Io, kHandleLost, out);
            outcome = Err<void>(ErrorCode::Io, "session " + id + ": " + kHandleLost);
        } else {
            entry->token = std::make_shared<CancellationToken>();
            change_status_locked(*entry, UploadStatus::Uploading, out);
            persist_locked(*entry, out);
            uploading_.push_back(id);
            pump_locked(out);
        }
    }
    idle_cv_.notify_all();
    flush(out);
    return outcome;
}

Result<void> TransferScheduler::cancel(const std::string& id) {
    Notifications out;
    {
        std::lock_guard lock(mutex_);
        auto* entry = find_locked(id);
        if (!entry) {
            return Err<void>(ErrorCode::NotFound, "unknown session " + id);
        }
        if (!can_transition(entry->session.status, UploadStatus::Cancelled)) {
            return Err<void>(ErrorCode::InvalidState, std::string("cannot cancel session ") + id + " in state " +
                                                          to_string(entry->session.status));
        }

        if (entry->token) {
            entry->token->cancel();
        }
        drop_from_queues_locked(id);
        change_status_locked(*entry, UploadStatus::Cancelled, out);
        notify(out, events::SessionCancelledEvent{id, entry->session.relative_path});

        auto removed = store_.remove(id);
        if (removed.is_error()) {
            spdlog::warn("Session {} cancelled but its record could not be deleted: {}", id,
                         removed.error().message);
        }
        entries_.erase(id);

        const bool submitted = executor_.submit([this, id]() {
            auto discarded = server_.discard(id);
            if (discarded.is_error()) {
                spdlog::warn("Server did not discard upload {}: {}", id, discarded.error().describe());
            }
        });
        if (!submitted) {
            spdlog::warn("Scheduler stopping; discard notice for {} not sent", id);
        }
        pump_locked(out);
    }
    idle_cv_.notify_all();
    flush(out);
    return Ok();
}

Result<void> TransferScheduler::retry(const std::string& id, FileSourcePtr replacement) {
    Notifications out;
    {
        std::lock_guard lock(mutex_);
        auto* entry = find_locked(id);
        if (!entry) {
            return Err<void>(ErrorCode::NotFound, "unknown session " + id);
        }
        if (entry->session.status != UploadStatus::Error) {
            return Err<void>(ErrorCode::InvalidState, std::string("cannot retry session ") + id + " in state " +
                                                          to_string(entry->session.status));
        }
        if (replacement) {
            if (replacement->size() != entry->session.total_size) {
                return Err<void>(ErrorCode::Validation,
                                 "replacement for " + id + " has " + std::to_string(replacement->size()) +
                                     " bytes, expected " + std::to_string(entry->session.total_size));
            }
            entry->source = std::move(replacement);
            entry->session.source_locator = entry->source->reacquirable() ? entry->source->locator() : "";
        }
        if (!entry->source || !entry->source->available()) {
            return Err<void>(ErrorCode::Io, "session " + id + ": " + kHandleLost);
        }

        entry->session.chunk_retries.clear();
        entry->cursor = 0;
        change_status_locked(*entry, UploadStatus::Queued, out);
        persist_locked(*entry, out);
        queued_.push_back(id);
        notify(out, events::SessionQueuedEvent{id, entry->session.relative_path, entry->session.total_size,
                                               entry->session.total_chunks});
        pump_locked(out);
    }
    flush(out);
    return Ok();
}

std::size_t TransferScheduler::clear_completed() {
    std::lock_guard lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.session.status == UploadStatus::Completed) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    // Completion only happens under mutex_, so no session can finish between the two sweeps
    return store_.clear_completed();
}

std::optional<UploadSession> TransferScheduler::session(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.session;
}

std::vector<UploadSession> TransferScheduler::sessions() const {
    std::vector<UploadSession> result;
    {
        std::lock_guard lock(mutex_);
        result.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            result.push_back(entry.session);
        }
    }
    std::sort(result.begin(), result.end(), [](const UploadSession& a, const UploadSession& b) {
        if (a.created_at != b.created_at) {
            return a.created_at < b.created_at;
        }
        return a.id < b.id;
    });
    return result;
}

bool TransferScheduler::has_active_sessions() const {
    std::lock_guard lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(), [](const auto& item) {
        const auto status = item.second.session.status;
        return status == UploadStatus::Uploading || status == UploadStatus::Paused;
    });
}

std::size_t TransferScheduler::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_total_;
}

bool TransferScheduler::wait_until_idle(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() {
        return in_flight_total_ == 0 && delivering_ == 0 && queued_.empty() && uploading_.empty();
    });
}

void TransferScheduler::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (!stopping_) {
            stopping_ = true;
            for (auto& [id, entry] : entries_) {
                if (entry.token) {
                    entry.token->cancel();
                }
            }
        }
    }
    executor_.shutdown();
    idle_cv_.notify_all();
}

// ════════════════════════════════════════════════════════
// Admission and dispatch
// ════════════════════════════════════════════════════════

void TransferScheduler::pump_locked(Notifications& out) {
    if (stopping_) {
        return;
    }

    while (!queued_.empty() && uploading_.size() < config_.max_active_sessions) {
        const std::string id = queued_.front();
        queued_.pop_front();

        auto* entry = find_locked(id);
        if (!entry || entry->session.status != UploadStatus::Queued) {
            continue;
        }
        if (!entry->source || !entry->source->available()) {
            fail_locked(*entry, ErrorCode::Io, kHandleLost, out);
            continue;
        }
        entry->token = std::make_shared<CancellationToken>();
        change_status_locked(*entry, UploadStatus::Uploading, out);
        persist_locked(*entry, out);
        uploading_.push_back(id);
    }

    // One chunk per session per round, rotating sessions that got a slot to the back
    bool progressed = true;
    while (progressed && in_flight_total_ < config_.global_chunk_limit) {
        progressed = false;
        const std::vector<std::string> round(uploading_.begin(), uploading_.end());
        for (const auto& id : round) {
            if (in_flight_total_ >= config_.global_chunk_limit) {
                break;
            }
            auto* entry = find_locked(id);
            if (entry && dispatch_one_locked(id, *entry)) {
                progressed = true;
                uploading_.remove(id);
                uploading_.push_back(id);
            }
        }
    }
}

std::optional<std::uint32_t> TransferScheduler::next_index_locked(Entry& entry) const {
    const auto& record = entry.session;
    while (entry.cursor < record.total_chunks && record.uploaded_chunks.count(entry.cursor) > 0) {
        ++entry.cursor;
    }
    for (std::uint32_t index = entry.cursor; index < record.total_chunks; ++index) {
        if (record.uploaded_chunks.count(index) == 0 && entry.in_flight.count(index) == 0) {
            return index;
        }
    }
    return std::nullopt;
}

bool TransferScheduler::dispatch_one_locked(const std::string& id, Entry& entry) {
    if (entry.session.status != UploadStatus::Uploading) {
        return false;
    }
    if (entry.in_flight.size() >= config_.per_session_chunk_limit) {
        return false;
    }
    const auto next = next_index_locked(entry);
    if (!next) {
        return false;
    }

    const auto index = *next;
    const auto range = entry.session.chunk_range(index);
    entry.in_flight.insert(index);
    ++in_flight_total_;

    const bool submitted = executor_.submit([this, id, index, range, source = entry.source, token = entry.token]() {
        run_chunk(id, index, range, source, token);
    });
    if (!submitted) {
        entry.in_flight.erase(index);
        --in_flight_total_;
        return false;
    }
    return true;
}

void TransferScheduler::run_chunk(const std::string& id, std::uint32_t index, ChunkRange range,
                                  FileSourcePtr source, CancellationTokenPtr token) {
    if (token->is_cancelled()) {
        on_chunk_result(id, index, 0, Err<ChunkAck>(ErrorCode::Cancelled, "aborted before send"));
        return;
    }

    auto bytes = source->read_chunk(range.offset, range.length);
    if (bytes.is_error()) {
        on_chunk_result(id, index, 0,
                        Err<ChunkAck>(ErrorCode::Io, "cannot read chunk " + std::to_string(index) + ": " +
                                                         bytes.error().message));
        return;
    }

    auto result = transmitter_.send(id, index, bytes.value(), *token);
    on_chunk_result(id, index, range.length, result);
}

void TransferScheduler::on_chunk_result(const std::string& id, std::uint32_t index, std::uint64_t bytes,
                                        const Result<ChunkAck>& result) {
    Notifications out;
    {
        std::lock_guard lock(mutex_);
        --in_flight_total_;
        ++delivering_;

        auto* entry = find_locked(id);
        if (!entry) {
            spdlog::debug("Dropping result for chunk {} of removed session {}", index, id);
        } else {
            entry->in_flight.erase(index);
            if (result.is_ok()) {
                record_ack_locked(*entry, result.value(), bytes, out);
            } else {
                const Error& error = result.error();
                entry->cursor = std::min(entry->cursor, index);
                if (error.code == ErrorCode::Cancelled) {
                    spdlog::debug("Chunk {} of {} aborted", index, id);
                } else if (entry->session.status == UploadStatus::Uploading) {
                    if (is_retryable(error.code)) {
                        const auto spent = std::max<std::uint32_t>(1, transmitter_.config().max_attempts) - 1;
                        entry->session.chunk_retries[index] += spent;
                        entry->session.retry_count += spent;
                    }
                    fail_locked(*entry, error.code, error.message, out);
                } else {
                    spdlog::debug("Ignoring failure of chunk {} for {} session {}: {}", index,
                                  to_string(entry->session.status), id, error.message);
                }
            }
        }
        pump_locked(out);
    }
    flush(out);
    {
        std::lock_guard lock(mutex_);
        --delivering_;
    }
    idle_cv_.notify_all();
}

// ════════════════════════════════════════════════════════
// State changes
// ════════════════════════════════════════════════════════

void TransferScheduler::record_ack_locked(Entry& entry, const ChunkAck& ack, std::uint64_t bytes,
                                          Notifications& out) {
    auto& record = entry.session;
    if (record.status == UploadStatus::Cancelled || record.status == UploadStatus::Completed) {
        return;
    }

    const bool inserted = record.uploaded_chunks.insert(ack.index).second;
    if (ack.attempts > 1) {
        record.chunk_retries[ack.index] += ack.attempts - 1;
        record.retry_count += ack.attempts - 1;
    }
    record.last_activity_at = Clock::now();

    if (inserted) {
        notify(out, events::ChunkAckedEvent{record.id, ack.index, bytes,
                                            static_cast<std::uint32_t>(record.uploaded_chunks.size()),
                                            record.total_chunks, ack.already_acked});
    }
    // Final chunk and completed status go out in one record write
    complete_if_done_locked(entry, out);
    persist_locked(entry, out);
}

void TransferScheduler::complete_if_done_locked(Entry& entry, Notifications& out) {
    auto& record = entry.session;
    if (!record.all_chunks_uploaded() || record.status == UploadStatus::Completed) {
        return;
    }
    if (!change_status_locked(entry, UploadStatus::Completed, out)) {
        return;
    }
    drop_from_queues_locked(record.id);
    notify(out, events::SessionCompletedEvent{record.id, record.relative_path, record.base_path, record.total_size,
                                              elapsed_since(record.created_at)});
}

void TransferScheduler::fail_locked(Entry& entry, ErrorCode code, const std::string& reason, Notifications& out) {
    auto& record = entry.session;
    const auto from = record.status;
    auto failed = mark_failed(record, reason);
    if (failed.is_error()) {
        spdlog::error("{}", failed.error().message);
        return;
    }
    if (entry.token) {
        entry.token->cancel();
    }
    drop_from_queues_locked(record.id);
    persist_locked(entry, out);

    notify(out, events::SessionStatusChangedEvent{record.id, from, UploadStatus::Error});
    notify(out, events::SessionFailedEvent{record.id, record.relative_path, code, reason});
}

bool TransferScheduler::change_status_locked(Entry& entry, UploadStatus target, Notifications& out) {
    const auto from = entry.session.status;
    if (from == target) {
        return true;
    }
    auto changed = transition(entry.session, target);
    if (changed.is_error()) {
        spdlog::error("{}", changed.error().message);
        return false;
    }
    notify(out, events::SessionStatusChangedEvent{entry.session.id, from, target});
    return true;
}

void TransferScheduler::persist_locked(Entry& entry, Notifications& out) {
    auto written = store_.put(entry.session);
    if (written.is_ok()) {
        entry.degraded = false;
        return;
    }
    if (!entry.degraded) {
        entry.degraded = true;
        notify(out, events::PersistenceDegradedEvent{entry.session.id, written.error().message});
    }
}

void TransferScheduler::drop_from_queues_locked(const std::string& id) {
    queued_.erase(std::remove(queued_.begin(), queued_.end(), id), queued_.end());
    uploading_.remove(id);
}

} // namespace rup::upload
