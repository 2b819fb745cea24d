#pragma once

/**
 * @file coordinator.hpp
 * @brief Entry point of the upload engine
 *
 * Wires scan -> plan -> schedule for a batch and rebuilds the scheduler
 * from the session store on startup. Every collaborator is injected: the
 * key-value backend, the server, the event bus and the resolver that
 * re-opens files after a restart, so tests substitute doubles for each.
 *
 * EXAMPLE:
 * events::EventBus bus;
 * storage::FileKeyValueStore backend(config.store_directory);
 * network::HttpUploadServer server(config.server);
 * UploadCoordinator coordinator(config, backend, server, bus);
 * coordinator.restore_all();
 * auto scanned = coordinator.scan(Selection::from_paths({"photos"}));
 * coordinator.submit_batch(scanned, "/backups");
 */

#include "rup/core/config.hpp"
#include "rup/core/result.hpp"
#include "rup/events/event_bus.hpp"
#include "rup/network/upload_server.hpp"
#include "rup/storage/key_value_store.hpp"
#include "rup/storage/session_store.hpp"
#include "rup/upload/chunk_planner.hpp"
#include "rup/upload/chunk_transmitter.hpp"
#include "rup/upload/file_source.hpp"
#include "rup/upload/folder_scanner.hpp"
#include "rup/upload/progress.hpp"
#include "rup/upload/refresh_coalescer.hpp"
#include "rup/upload/throughput_meter.hpp"
#include "rup/upload/transfer_scheduler.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace rup::upload {

struct BatchReport {
    std::vector<std::string> session_ids;                     ///< Canonical (server) ids, selection order
    std::vector<std::string> skipped_empty;                   ///< Zero-byte files, never uploaded
    std::vector<std::pair<std::string, Error>> failures;      ///< Files that could not be planned or registered
};

class UploadCoordinator {
public:
    UploadCoordinator(EngineConfig config, storage::KeyValueStore& backend, network::UploadServer& server,
                      events::EventBus& bus,
                      std::shared_ptr<FileSourceResolver> resolver = std::make_shared<NullFileSourceResolver>());
    ~UploadCoordinator();

    UploadCoordinator(const UploadCoordinator&) = delete;
    UploadCoordinator& operator=(const UploadCoordinator&) = delete;

    ScanResult scan(const Selection& selection, FolderScanner::ProgressCallback on_progress = {});

    /// Stops a scan running on another thread.
    void cancel_scan();

    /**
     * Plan, register with the server and enqueue every non-empty file
     *
     * A file that fails to plan or register is reported in
     * BatchReport::failures; the rest of the batch still goes ahead.
     */
    BatchReport submit_batch(const ScanResult& scanned, const std::string& base_path);

    Result<void> pause(const std::string& id);
    Result<void> resume(const std::string& id);
    Result<void> cancel(const std::string& id);

    /// Cancel every session that is not completed yet; returns how many were cancelled.
    std::size_t cancel_all();

    /// error -> queued. Without @p replacement the resolver gets one more try at the file.
    Result<void> retry(const std::string& id, FileSourcePtr replacement = nullptr);

    /**
     * Purge expired records, reload the rest and hand them to the scheduler
     *
     * Live sessions are reconciled with the server before any chunk is
     * scheduled: chunks it already holds are merged in, an id it does not
     * know or a chunk count it disagrees with fails the session, and an
     * unreachable server leaves the local record as it is.
     */
    std::vector<UploadSession> restore_all();

    ProgressReport progress() const;

    std::vector<UploadSession> sessions() const;

    bool has_active_sessions() const;

    std::size_t clear_completed();

    bool wait_until_idle(std::chrono::milliseconds timeout) const;

    /// Stop transfers without changing any session status; restore_all() picks them up later.
    void shutdown();

    events::EventBus& event_bus() noexcept { return bus_; }
    const EngineConfig& config() const noexcept { return config_; }

private:
    Result<std::string> register_file(const FileSourcePtr& source, const std::string& base_path);
    void reconcile(UploadSession& session);
    void reject_restored(UploadSession& session, const std::string& reason);

    EngineConfig config_;
    network::UploadServer& server_;
    events::EventBus& bus_;
    std::shared_ptr<FileSourceResolver> resolver_;

    storage::SessionStore store_;
    ChunkPlanner planner_;
    ThroughputMeter meter_;
    ChunkTransmitter transmitter_;
    RefreshCoalescer refresh_;
    TransferScheduler scheduler_;

    std::vector<std::function<void()>> unsubscribers_;

    std::mutex scan_mutex_;
    std::shared_ptr<FolderScanner> active_scan_;
};

} // namespace rup::upload
