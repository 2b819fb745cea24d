#include "rup/core/config.hpp"

#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <fstream>

using rup::EngineConfig;
using rup::ErrorCode;
using rup::RetryConfig;

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    EngineConfig config;
    EXPECT_EQ(config.chunk_size, 2u * 1024 * 1024);
    EXPECT_EQ(config.scheduler.global_chunk_limit, 4u);
    EXPECT_EQ(config.scheduler.per_session_chunk_limit, 2u);
    EXPECT_EQ(config.scheduler.max_active_sessions, 3u);
    EXPECT_EQ(config.retry.max_attempts, 3u);
    EXPECT_EQ(config.refresh_quiet_period.count(), 1500);
    EXPECT_EQ(config.session_max_age.count(), 24 * 7);
    EXPECT_TRUE(rup::validate_config(config).is_ok());
}

TEST(ConfigTest, ParsesNestedSectionsAndKeepsMissingDefaults) {
    auto parsed = rup::parse_config(R"({
        "chunk_size": 1048576,
        "refresh_quiet_period_ms": 250,
        "scheduler": { "global_chunk_limit": 8 },
        "retry": { "max_attempts": 5, "initial_backoff_ms": 100 },
        "server": { "host": "uploads.local", "port": 9000, "base_path": "/api" },
        "logging": { "level": "debug" }
    })");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().message;

    const auto& config = parsed.value();
    EXPECT_EQ(config.chunk_size, 1048576u);
    EXPECT_EQ(config.refresh_quiet_period.count(), 250);
    EXPECT_EQ(config.scheduler.global_chunk_limit, 8u);
    EXPECT_EQ(config.scheduler.per_session_chunk_limit, 2u);
    EXPECT_EQ(config.retry.max_attempts, 5u);
    EXPECT_EQ(config.retry.initial_backoff.count(), 100);
    EXPECT_EQ(config.retry.max_backoff.count(), 8000);
    EXPECT_EQ(config.server.host, "uploads.local");
    EXPECT_EQ(config.server.port, 9000);
    EXPECT_EQ(config.server.base_path, "/api");
    EXPECT_EQ(config.logging.level, "debug");
}

TEST(ConfigTest, MalformedJsonIsValidationError) {
    auto parsed = rup::parse_config("{ not json");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::Validation);
}

TEST(ConfigTest, WrongTypeIsValidationError) {
    auto parsed = rup::parse_config(R"({ "chunk_size": "big" })");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::Validation);
}

TEST(ConfigTest, RejectsZeroLimits) {
    EXPECT_TRUE(rup::parse_config(R"({ "chunk_size": 0 })").is_error());
    EXPECT_TRUE(rup::parse_config(R"({ "scheduler": { "global_chunk_limit": 0 } })").is_error());
    EXPECT_TRUE(rup::parse_config(R"({ "retry": { "max_attempts": 0 } })").is_error());
}

TEST(ConfigTest, MissingFileFallsBackToDefaults) {
    auto loaded = rup::load_config("/nonexistent/rup/config.json");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().chunk_size, EngineConfig{}.chunk_size);
}

TEST(ConfigTest, LoadsFromFile) {
    rup::testing::TempDir dir;
    const auto path = dir.path() / "engine.json";
    {
        std::ofstream out(path);
        out << R"({ "store_directory": "/var/lib/rup", "session_max_age_hours": 48 })";
    }

    auto loaded = rup::load_config(path.string());
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().store_directory, "/var/lib/rup");
    EXPECT_EQ(loaded.value().session_max_age.count(), 48);
}

TEST(ConfigTest, BackoffGrowsAndIsCapped) {
    RetryConfig retry;
    retry.initial_backoff = std::chrono::milliseconds(500);
    retry.backoff_multiplier = 2.0;
    retry.max_backoff = std::chrono::milliseconds(3000);

    EXPECT_EQ(retry.backoff_for(1).count(), 500);
    EXPECT_EQ(retry.backoff_for(2).count(), 1000);
    EXPECT_EQ(retry.backoff_for(3).count(), 2000);
    EXPECT_EQ(retry.backoff_for(4).count(), 3000);
    EXPECT_EQ(retry.backoff_for(10).count(), 3000);
}
