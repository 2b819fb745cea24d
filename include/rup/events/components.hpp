/**
 * @file components.hpp
 * @brief Event-driven components attached to the upload engine's bus
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "rup/events/event_bus.hpp"
#include "rup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace rup::events {

/**
 * @brief Logs every upload event through spdlog
 *
 * Unsubscribes on destruction so the bus may outlive the component.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        ids_.push_back(bus_.subscribe<SessionQueuedEvent>([](const SessionQueuedEvent& e) {
            spdlog::info("[SessionQueued] session={} path={} bytes={} chunks={}",
                         e.session_id, e.relative_path, e.total_size, e.total_chunks);
        }));

        ids_.push_back(bus_.subscribe<ChunkAckedEvent>([](const ChunkAckedEvent& e) {
            spdlog::debug("[ChunkAcked] session={} chunk={} progress={}/{}{}",
                          e.session_id, e.chunk_index, e.uploaded_chunks, e.total_chunks,
                          e.already_acked ? " (already held)" : "");
        }));

        ids_.push_back(bus_.subscribe<ChunkRetryEvent>([](const ChunkRetryEvent& e) {
            spdlog::info("[ChunkRetry] session={} chunk={} attempt={} backoff={}ms reason={}",
                         e.session_id, e.chunk_index, e.attempt, e.backoff.count(), e.reason);
        }));

        ids_.push_back(bus_.subscribe<SessionStatusChangedEvent>([](const SessionStatusChangedEvent& e) {
            spdlog::debug("[StatusChanged] session={} {} -> {}",
                          e.session_id, upload::to_string(e.from), upload::to_string(e.to));
        }));

        ids_.push_back(bus_.subscribe<SessionCompletedEvent>([](const SessionCompletedEvent& e) {
            spdlog::info("[SessionCompleted] session={} path={} bytes={} duration={}ms",
                         e.session_id, e.relative_path, e.total_size, e.duration.count());
        }));

        ids_.push_back(bus_.subscribe<SessionFailedEvent>([](const SessionFailedEvent& e) {
            spdlog::warn("[SessionFailed] session={} path={} code={} reason={}",
                         e.session_id, e.relative_path, to_string(e.code), e.reason);
        }));

        ids_.push_back(bus_.subscribe<SessionCancelledEvent>([](const SessionCancelledEvent& e) {
            spdlog::info("[SessionCancelled] session={} path={}", e.session_id, e.relative_path);
        }));

        ids_.push_back(bus_.subscribe<DirectoryRefreshEvent>([](const DirectoryRefreshEvent& e) {
            spdlog::info("[DirectoryRefresh] completed={} folders={}",
                         e.completed_sessions, e.base_paths.size());
        }));

        ids_.push_back(bus_.subscribe<PersistenceDegradedEvent>([](const PersistenceDegradedEvent& e) {
            spdlog::warn("[PersistenceDegraded] session={} tracking in memory only: {}",
                         e.session_id, e.reason);
        }));
    }

    ~LoggerComponent() {
        bus_.unsubscribe<SessionQueuedEvent>(ids_[0]);
        bus_.unsubscribe<ChunkAckedEvent>(ids_[1]);
        bus_.unsubscribe<ChunkRetryEvent>(ids_[2]);
        bus_.unsubscribe<SessionStatusChangedEvent>(ids_[3]);
        bus_.unsubscribe<SessionCompletedEvent>(ids_[4]);
        bus_.unsubscribe<SessionFailedEvent>(ids_[5]);
        bus_.unsubscribe<SessionCancelledEvent>(ids_[6]);
        bus_.unsubscribe<DirectoryRefreshEvent>(ids_[7]);
        bus_.unsubscribe<PersistenceDegradedEvent>(ids_[8]);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    EventBus& bus_;
    std::vector<size_t> ids_;
};

/**
 * @brief Counts transfer outcomes for monitoring
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto& stats = metrics.get_stats();
 * spdlog::info("Chunks acked: {}", stats.chunks_acked.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sessions_queued{0};
        std::atomic<uint64_t> sessions_completed{0};
        std::atomic<uint64_t> sessions_failed{0};
        std::atomic<uint64_t> sessions_cancelled{0};
        std::atomic<uint64_t> chunks_acked{0};
        std::atomic<uint64_t> bytes_acked{0};
        std::atomic<uint64_t> chunk_retries{0};
        std::atomic<uint64_t> directory_refreshes{0};
        std::atomic<uint64_t> persistence_failures{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        ids_.push_back(bus_.subscribe<SessionQueuedEvent>([this](const SessionQueuedEvent&) {
            stats_.sessions_queued++;
        }));

        ids_.push_back(bus_.subscribe<ChunkAckedEvent>([this](const ChunkAckedEvent& e) {
            stats_.chunks_acked++;
            stats_.bytes_acked += e.bytes;
        }));

        ids_.push_back(bus_.subscribe<ChunkRetryEvent>([this](const ChunkRetryEvent&) {
            stats_.chunk_retries++;
        }));

        ids_.push_back(bus_.subscribe<SessionCompletedEvent>([this](const SessionCompletedEvent&) {
            stats_.sessions_completed++;
        }));

        ids_.push_back(bus_.subscribe<SessionFailedEvent>([this](const SessionFailedEvent&) {
            stats_.sessions_failed++;
        }));

        ids_.push_back(bus_.subscribe<SessionCancelledEvent>([this](const SessionCancelledEvent&) {
            stats_.sessions_cancelled++;
        }));

        ids_.push_back(bus_.subscribe<DirectoryRefreshEvent>([this](const DirectoryRefreshEvent&) {
            stats_.directory_refreshes++;
        }));

        ids_.push_back(bus_.subscribe<PersistenceDegradedEvent>([this](const PersistenceDegradedEvent&) {
            stats_.persistence_failures++;
        }));
    }

    ~MetricsComponent() {
        bus_.unsubscribe<SessionQueuedEvent>(ids_[0]);
        bus_.unsubscribe<ChunkAckedEvent>(ids_[1]);
        bus_.unsubscribe<ChunkRetryEvent>(ids_[2]);
        bus_.unsubscribe<SessionCompletedEvent>(ids_[3]);
        bus_.unsubscribe<SessionFailedEvent>(ids_[4]);
        bus_.unsubscribe<SessionCancelledEvent>(ids_[5]);
        bus_.unsubscribe<DirectoryRefreshEvent>(ids_[6]);
        bus_.unsubscribe<PersistenceDegradedEvent>(ids_[7]);
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("Upload statistics:");
        spdlog::info("  Sessions queued:    {}", stats_.sessions_queued.load());
        spdlog::info("  Sessions completed: {}", stats_.sessions_completed.load());
        spdlog::info("  Sessions failed:    {}", stats_.sessions_failed.load());
        spdlog::info("  Sessions cancelled: {}", stats_.sessions_cancelled.load());
        spdlog::info("  Chunks acked:       {}", stats_.chunks_acked.load());
        spdlog::info("  Bytes acked:        {}", stats_.bytes_acked.load());
        spdlog::info("  Chunk retries:      {}", stats_.chunk_retries.load());
        spdlog::info("  Refreshes:          {}", stats_.directory_refreshes.load());
        spdlog::info("  Store failures:     {}", stats_.persistence_failures.load());
    }

private:
    EventBus& bus_;
    Stats stats_;
    std::vector<size_t> ids_;
};

} // namespace rup::events
