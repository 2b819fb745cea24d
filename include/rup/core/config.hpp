#pragma once

#include "rup/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace rup {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
    std::string file;                       ///< Empty: console only
    std::size_t max_file_bytes = 5 * 1024 * 1024;
    std::size_t max_files = 3;
};

/**
 * @brief Chunk-level retry budget
 *
 * max_attempts counts the first try, so 3 means one send plus two retries.
 */
struct RetryConfig {
    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_backoff{500};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_backoff{8000};
    std::chrono::milliseconds chunk_timeout{30000};

    /// Delay before retry number @p retry (1-based), capped at max_backoff.
    std::chrono::milliseconds backoff_for(std::uint32_t retry) const;
};

struct SchedulerConfig {
    std::size_t global_chunk_limit = 4;       ///< In-flight chunk requests across all sessions
    std::size_t per_session_chunk_limit = 2;  ///< In-flight chunk requests within one session
    std::size_t max_active_sessions = 3;      ///< Sessions admitted to uploading at once
};

struct ServerConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = 8080;
    std::string base_path;                    ///< Prefix before /uploads, e.g. "/api"
    std::string auth_token;                   ///< Sent as "Authorization: Bearer <token>"
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds request_timeout{30000};
};

struct EngineConfig {
    std::uint32_t chunk_size = 2 * 1024 * 1024;
    std::uint64_t max_file_size = 50ULL * 1024 * 1024 * 1024;
    SchedulerConfig scheduler;
    RetryConfig retry;
    std::chrono::milliseconds refresh_quiet_period{1500};
    std::chrono::milliseconds throughput_window{10000};
    std::chrono::hours session_max_age{24 * 7};
    std::string store_directory = "./upload_sessions";
    ServerConfig server;
    LoggingConfig logging;
};

/// Parses a JSON document. Absent keys keep their defaults.
Result<EngineConfig> parse_config(const std::string& json_text);

/// Reads @p path. A missing file logs a warning and returns defaults.
Result<EngineConfig> load_config(const std::string& path);

Result<void> validate_config(const EngineConfig& config);

} // namespace rup
