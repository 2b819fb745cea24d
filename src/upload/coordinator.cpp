#include "rup/upload/coordinator.hpp"

#include "rup/events/events.hpp"
#include "rup/upload/session_state.hpp"

#include <spdlog/spdlog.h>

#include <limits>
#include <optional>

namespace rup::upload {

UploadCoordinator::UploadCoordinator(EngineConfig config, storage::KeyValueStore& backend,
                                     network::UploadServer& server, events::EventBus& bus,
                                     std::shared_ptr<FileSourceResolver> resolver)
    : config_(std::move(config)),
      server_(server),
      bus_(bus),
      resolver_(resolver ? std::move(resolver) : std::make_shared<NullFileSourceResolver>()),
      store_(backend),
      planner_(config_.max_file_size),
      meter_(config_.throughput_window),
      transmitter_(server_, config_.retry, &bus_),
      refresh_(config_.refresh_quiet_period,
               [this](const std::vector<std::string>& paths, std::size_t completed) {
                   bus_.emit(events::DirectoryRefreshEvent{paths, completed});
               }),
      scheduler_(store_, transmitter_, server_, config_.scheduler, bus_) {
    const auto acked = bus_.subscribe<events::ChunkAckedEvent>([this](const events::ChunkAckedEvent& e) {
        meter_.record(e.session_id, e.bytes);
    });
    unsubscribers_.push_back([this, acked]() { bus_.unsubscribe<events::ChunkAckedEvent>(acked); });

    const auto changed = bus_.subscribe<events::SessionStatusChangedEvent>(
        [this](const events::SessionStatusChangedEvent& e) {
            if (e.to == UploadStatus::Uploading) {
                meter_.start(e.session_id);
            } else if (e.to == UploadStatus::Error || e.to == UploadStatus::Cancelled) {
                meter_.forget(e.session_id);
            }
        });
    unsubscribers_.push_back([this, changed]() { bus_.unsubscribe<events::SessionStatusChangedEvent>(changed); });

    const auto completed = bus_.subscribe<events::SessionCompletedEvent>([this](const events::SessionCompletedEvent& e) {
        meter_.forget(e.session_id);
        refresh_.notify_completed(e.base_path);
    });
    unsubscribers_.push_back([this, completed]() { bus_.unsubscribe<events::SessionCompletedEvent>(completed); });
}

UploadCoordinator::~UploadCoordinator() {
    scheduler_.shutdown();
    for (auto& unsubscribe : unsubscribers_) {
        unsubscribe();
    }
    refresh_.stop();
}

// ════════════════════════════════════════════════════════
// Scan and submit
// ════════════════════════════════════════════════════════

ScanResult UploadCoordinator::scan(const Selection& selection, FolderScanner::ProgressCallback on_progress) {
    auto scanner = std::make_shared<FolderScanner>(std::move(on_progress));
    {
        std::lock_guard lock(scan_mutex_);
        active_scan_ = scanner;
    }

    auto result = scanner->scan(selection);

    {
        std::lock_guard lock(scan_mutex_);
        if (active_scan_ == scanner) {
            active_scan_.reset();
        }
    }
    spdlog::info("Scan found {} file(s), {} bytes, {} skipped{}", result.files.size(), result.total_size,
                 result.skipped.size(), result.cancelled ? " (cancelled)" : "");
    return result;
}

void UploadCoordinator::cancel_scan() {
    std::lock_guard lock(scan_mutex_);
    if (active_scan_) {
        active_scan_->cancel();
    }
}

BatchReport UploadCoordinator::submit_batch(const ScanResult& scanned, const std::string& base_path) {
    BatchReport report;
    for (const auto& source : scanned.files) {
        if (!source) {
            continue;
        }
        if (source->size() == 0) {
            spdlog::debug("Skipping empty file {}", source->relative_path());
            report.skipped_empty.push_back(source->relative_path());
            continue;
        }

        auto registered = register_file(source, base_path);
        if (registered.is_error()) {
            spdlog::warn("Cannot upload {}: {}", source->relative_path(), registered.error().describe());
            report.failures.emplace_back(source->relative_path(), registered.error());
            continue;
        }
        report.session_ids.push_back(registered.value());
    }

    spdlog::info("Submitted {} file(s) to {} ({} empty skipped, {} failed)", report.session_ids.size(),
                 base_path.empty() ? "/" : base_path, report.skipped_empty.size(), report.failures.size());
    return report;
}

Result<std::string> UploadCoordinator::register_file(const FileSourcePtr& source, const std::string& base_path) {
    auto planned = planner_.plan(*source, config_.chunk_size, base_path);
    if (planned.is_error()) {
        return Err<std::string>(planned.error());
    }
    UploadSession session = std::move(planned.value());

    network::CreateUploadRequest request;
    request.file_name = session.file_name;
    request.relative_path = session.relative_path;
    request.base_path = session.base_path;
    request.total_size = session.total_size;
    request.chunk_size = session.chunk_size;
    request.client_upload_id = session.id;

    auto created = server_.create_upload(request);
    if (created.is_error()) {
        return Err<std::string>(created.error());
    }
    const auto& reply = created.value();

    // The server's answer is canonical for id and chunking
    if (reply.chunk_size != 0 && reply.chunk_size != session.chunk_size) {
        const auto count = ChunkPlanner::chunk_count(session.total_size, reply.chunk_size);
        if (count > std::numeric_limits<std::uint32_t>::max()) {
            return Err<std::string>(ErrorCode::Validation, "server chunk size " + std::to_string(reply.chunk_size) +
                                                               " gives too many chunks");
        }
        session.chunk_size = reply.chunk_size;
        session.total_chunks = static_cast<std::uint32_t>(count);
    }
    if (reply.total_chunks != 0 && reply.total_chunks != session.total_chunks) {
        return Err<std::string>(ErrorCode::Validation,
                                "server expects " + std::to_string(reply.total_chunks) + " chunks, planned " +
                                    std::to_string(session.total_chunks));
    }
    if (reply.upload_id != session.id) {
        spdlog::debug("Server assigned id {} to {} (proposed {})", reply.upload_id, session.relative_path,
                      session.id);
        session.id = reply.upload_id;
    }

    const auto id = session.id;
    auto queued = scheduler_.enqueue(std::move(session), source);
    if (queued.is_error()) {
        if (auto discarded = server_.discard(id); discarded.is_error()) {
            spdlog::debug("Discard of unscheduled upload {} failed: {}", id, discarded.error().message);
        }
        return Err<std::string>(queued.error());
    }
    return Ok(id);
}

// ════════════════════════════════════════════════════════
// Session control
// ════════════════════════════════════════════════════════

Result<void> UploadCoordinator::pause(const std::string& id) {
    return scheduler_.pause(id);
}

Result<void> UploadCoordinator::resume(const std::string& id) {
    return scheduler_.resume(id);
}

Result<void> UploadCoordinator::cancel(const std::string& id) {
    auto cancelled = scheduler_.cancel(id);
    if (cancelled.is_ok()) {
        meter_.forget(id);
    }
    return cancelled;
}

std::size_t UploadCoordinator::cancel_all() {
    std::size_t cancelled = 0;
    for (const auto& session : scheduler_.sessions()) {
        if (session.status == UploadStatus::Completed || session.status == UploadStatus::Cancelled) {
            continue;
        }
        auto outcome = cancel(session.id);
        if (outcome.is_error()) {
            // Finished or cancelled on another thread since the snapshot
            spdlog::debug("Skipping {}: {}", session.id, outcome.error().message);
            continue;
        }
        ++cancelled;
    }
    spdlog::info("Cancelled {} upload(s)", cancelled);
    return cancelled;
}

Result<void> UploadCoordinator::retry(const std::string& id, FileSourcePtr replacement) {
    if (!replacement) {
        if (auto session = scheduler_.session(id)) {
            replacement = resolver_->reacquire(*session);
        }
    }
    return scheduler_.retry(id, std::move(replacement));
}

// ════════════════════════════════════════════════════════
// Restore
// ════════════════════════════════════════════════════════

std::vector<UploadSession> UploadCoordinator::restore_all() {
    store_.purge_older_than(config_.session_max_age);

    for (auto& restored : store_.restore_all(*resolver_)) {
        if (!is_terminal(restored.session.status)) {
            reconcile(restored.session);
        }
        const auto id = restored.session.id;
        auto adopted = scheduler_.adopt(std::move(restored.session), std::move(restored.source));
        if (adopted.is_error()) {
            spdlog::warn("Cannot restore session {}: {}", id, adopted.error().message);
        }
    }
    return scheduler_.sessions();
}

void UploadCoordinator::reconcile(UploadSession& session) {
    auto remote = server_.get_status(session.id);
    if (remote.is_error()) {
        const auto& error = remote.error();
        if (error.code == ErrorCode::NotFound) {
            reject_restored(session, "server does not know upload id");
        } else {
            spdlog::warn("Could not reconcile session {} with the server: {}", session.id, error.describe());
        }
        return;
    }

    const auto& status = remote.value();
    if (status.total_chunks != 0 && status.total_chunks != session.total_chunks) {
        reject_restored(session, "server expects " + std::to_string(status.total_chunks) + " chunks, local " +
                                     std::to_string(session.total_chunks));
        return;
    }

    const auto added = merge_acked(session, status.acked_chunks);
    if (added == 0) {
        return;
    }
    spdlog::info("Session {}: server already holds {} more chunk(s)", session.id, added);
    if (auto persisted = store_.put(session); persisted.is_error()) {
        spdlog::warn("Merged acks for {} kept in memory: {}", session.id, persisted.error().message);
    }
}

void UploadCoordinator::reject_restored(UploadSession& session, const std::string& reason) {
    if (auto failed = mark_failed(session, reason); failed.is_error()) {
        spdlog::warn("{}", failed.error().message);
        return;
    }
    spdlog::warn("Session {} ({}) cannot resume: {}", session.id, session.relative_path, reason);
    if (auto persisted = store_.put(session); persisted.is_error()) {
        spdlog::warn("Failed session {} kept in memory: {}", session.id, persisted.error().message);
    }
}

// ════════════════════════════════════════════════════════
// Queries
// ════════════════════════════════════════════════════════

ProgressReport UploadCoordinator::progress() const {
    return ProgressAggregator::compute(store_.get_all(), meter_.snapshot());
}

std::vector<UploadSession> UploadCoordinator::sessions() const {
    return store_.get_all();
}

bool UploadCoordinator::has_active_sessions() const {
    return scheduler_.has_active_sessions();
}

std::size_t UploadCoordinator::clear_completed() {
    return scheduler_.clear_completed();
}

bool UploadCoordinator::wait_until_idle(std::chrono::milliseconds timeout) const {
    return scheduler_.wait_until_idle(timeout);
}

void UploadCoordinator::shutdown() {
    scheduler_.shutdown();
    refresh_.flush();
}

} // namespace rup::upload
