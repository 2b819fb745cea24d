#include "rup/events/components.hpp"

#include <gtest/gtest.h>

using namespace rup::events;

TEST(MetricsComponent, CountsUploadEvents) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(SessionQueuedEvent{"s-1", "a.bin", 300, 3});
    bus.emit(ChunkAckedEvent{"s-1", 0, 100, 1, 3, false});
    bus.emit(ChunkAckedEvent{"s-1", 1, 100, 2, 3, true});
    bus.emit(ChunkRetryEvent{"s-1", 2, 1, std::chrono::milliseconds(500), "HTTP 503"});
    bus.emit(SessionCompletedEvent{"s-1", "a.bin", "/backups", 300, std::chrono::milliseconds(20)});
    bus.emit(SessionFailedEvent{"s-2", "b.bin", rup::ErrorCode::Authentication, "HTTP 401"});
    bus.emit(SessionCancelledEvent{"s-3", "c.bin"});
    bus.emit(DirectoryRefreshEvent{{"/backups"}, 1});
    bus.emit(PersistenceDegradedEvent{"s-1", "quota exceeded"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.sessions_queued.load(), 1u);
    EXPECT_EQ(stats.chunks_acked.load(), 2u);
    EXPECT_EQ(stats.bytes_acked.load(), 200u);
    EXPECT_EQ(stats.chunk_retries.load(), 1u);
    EXPECT_EQ(stats.sessions_completed.load(), 1u);
    EXPECT_EQ(stats.sessions_failed.load(), 1u);
    EXPECT_EQ(stats.sessions_cancelled.load(), 1u);
    EXPECT_EQ(stats.directory_refreshes.load(), 1u);
    EXPECT_EQ(stats.persistence_failures.load(), 1u);
    EXPECT_NO_THROW(metrics.print_stats());
}

TEST(MetricsComponent, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        EXPECT_EQ(bus.subscriber_count<ChunkAckedEvent>(), 1u);
    }
    EXPECT_EQ(bus.subscriber_count<ChunkAckedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<SessionQueuedEvent>(), 0u);
}

TEST(LoggerComponent, SubscribesToEveryEventAndCleansUp) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<SessionStatusChangedEvent>(), 1u);
        EXPECT_EQ(bus.subscriber_count<PersistenceDegradedEvent>(), 1u);

        EXPECT_NO_THROW(bus.emit(SessionStatusChangedEvent{
            "s-1", rup::upload::UploadStatus::Queued, rup::upload::UploadStatus::Uploading}));
        EXPECT_NO_THROW(bus.emit(DirectoryRefreshEvent{{"/a", "/b"}, 2}));
    }
    EXPECT_EQ(bus.subscriber_count<SessionStatusChangedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<DirectoryRefreshEvent>(), 0u);
}
