#include "rup/upload/chunk_transmitter.hpp"

#include "rup/events/events.hpp"
#include "support/fake_upload_server.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace rup::upload;
using rup::CancellationToken;
using rup::Error;
using rup::ErrorCode;
using rup::testing::FakeUploadServer;

namespace {

rup::RetryConfig fast_retry(std::uint32_t attempts = 3) {
    rup::RetryConfig retry;
    retry.max_attempts = attempts;
    retry.initial_backoff = std::chrono::milliseconds(1);
    retry.max_backoff = std::chrono::milliseconds(4);
    retry.chunk_timeout = std::chrono::milliseconds(1000);
    return retry;
}

const std::vector<std::uint8_t> kBytes{1, 2, 3};

} // namespace

TEST(ChunkTransmitter, SucceedsFirstTime) {
    FakeUploadServer server;
    ChunkTransmitter transmitter(server, fast_retry());
    CancellationToken token;

    auto ack = transmitter.send("u-1", 0, kBytes, token);
    ASSERT_TRUE(ack.is_ok()) << ack.error().describe();
    EXPECT_EQ(ack.value().index, 0u);
    EXPECT_EQ(ack.value().attempts, 1u);
    EXPECT_FALSE(ack.value().already_acked);
    EXPECT_EQ(server.acked("u-1"), (std::set<std::uint32_t>{0}));
}

TEST(ChunkTransmitter, RetriesTransientFailuresThenSucceeds) {
    FakeUploadServer server;
    server.fail_chunk("u-1", 2, 2, Error{ErrorCode::Transient, "connection reset"});

    rup::events::EventBus bus;
    std::vector<rup::events::ChunkRetryEvent> retries;
    bus.subscribe<rup::events::ChunkRetryEvent>(
        [&](const rup::events::ChunkRetryEvent& e) { retries.push_back(e); });

    ChunkTransmitter transmitter(server, fast_retry(), &bus);
    CancellationToken token;

    auto ack = transmitter.send("u-1", 2, kBytes, token);
    ASSERT_TRUE(ack.is_ok());
    EXPECT_EQ(ack.value().attempts, 3u);
    EXPECT_EQ(server.sent("u-1"), (std::vector<std::uint32_t>{2, 2, 2}));

    ASSERT_EQ(retries.size(), 2u);
    EXPECT_EQ(retries[0].attempt, 1u);
    EXPECT_EQ(retries[1].attempt, 2u);
    EXPECT_EQ(retries[0].reason, "connection reset");
}

TEST(ChunkTransmitter, GivesUpAfterMaxAttempts) {
    FakeUploadServer server;
    server.fail_chunk("u-1", 0, 10, Error{ErrorCode::Timeout, "deadline"});
    ChunkTransmitter transmitter(server, fast_retry(3));
    CancellationToken token;

    auto ack = transmitter.send("u-1", 0, kBytes, token);
    ASSERT_TRUE(ack.is_error());
    EXPECT_EQ(ack.error().code, ErrorCode::Timeout);
    EXPECT_NE(ack.error().message.find("after 3 attempts"), std::string::npos);
    EXPECT_EQ(server.put_calls(), 3u);
}

TEST(ChunkTransmitter, AuthenticationFailureIsNotRetried) {
    FakeUploadServer server;
    server.fail_chunk("u-1", 0, 1, Error{ErrorCode::Authentication, "HTTP 401"});
    ChunkTransmitter transmitter(server, fast_retry());
    CancellationToken token;

    auto ack = transmitter.send("u-1", 0, kBytes, token);
    ASSERT_TRUE(ack.is_error());
    EXPECT_EQ(ack.error().code, ErrorCode::Authentication);
    EXPECT_EQ(server.put_calls(), 1u);
}

TEST(ChunkTransmitter, ConflictCountsAsAck) {
    FakeUploadServer server;
    server.preload("u-1", 4, {1});
    ChunkTransmitter transmitter(server, fast_retry());
    CancellationToken token;

    auto ack = transmitter.send("u-1", 1, kBytes, token);
    ASSERT_TRUE(ack.is_ok());
    EXPECT_TRUE(ack.value().already_acked);
}

TEST(ChunkTransmitter, CancelDuringBackoffStopsImmediately) {
    FakeUploadServer server;
    server.fail_chunk("u-1", 0, 10, Error{ErrorCode::Transient, "HTTP 503"});

    auto retry = fast_retry(10);
    retry.initial_backoff = std::chrono::seconds(30);
    retry.max_backoff = std::chrono::seconds(30);
    ChunkTransmitter transmitter(server, retry);
    CancellationToken token;

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    auto ack = transmitter.send("u-1", 0, kBytes, token);
    canceller.join();

    ASSERT_TRUE(ack.is_error());
    EXPECT_EQ(ack.error().code, ErrorCode::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_EQ(server.put_calls(), 1u);
}

TEST(ChunkTransmitter, AlreadyCancelledTokenSendsNothing) {
    FakeUploadServer server;
    ChunkTransmitter transmitter(server, fast_retry());
    CancellationToken token;
    token.cancel();

    auto ack = transmitter.send("u-1", 0, kBytes, token);
    ASSERT_TRUE(ack.is_error());
    EXPECT_EQ(ack.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(server.put_calls(), 0u);
}
