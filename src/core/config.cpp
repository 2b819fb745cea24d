#include "rup/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace rup {
namespace {

using json = nlohmann::json;

std::chrono::milliseconds millis_or(const json& j, const char* key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(j.value(key, static_cast<std::int64_t>(fallback.count())));
}

void apply_scheduler(const json& j, SchedulerConfig& cfg) {
    cfg.global_chunk_limit = j.value("global_chunk_limit", cfg.global_chunk_limit);
    cfg.per_session_chunk_limit = j.value("per_session_chunk_limit", cfg.per_session_chunk_limit);
    cfg.max_active_sessions = j.value("max_active_sessions", cfg.max_active_sessions);
}

void apply_retry(const json& j, RetryConfig& cfg) {
    cfg.max_attempts = j.value("max_attempts", cfg.max_attempts);
    cfg.initial_backoff = millis_or(j, "initial_backoff_ms", cfg.initial_backoff);
    cfg.backoff_multiplier = j.value("backoff_multiplier", cfg.backoff_multiplier);
    cfg.max_backoff = millis_or(j, "max_backoff_ms", cfg.max_backoff);
    cfg.chunk_timeout = millis_or(j, "chunk_timeout_ms", cfg.chunk_timeout);
}

void apply_server(const json& j, ServerConfig& cfg) {
    cfg.host = j.value("host", cfg.host);
    cfg.port = j.value("port", cfg.port);
    cfg.base_path = j.value("base_path", cfg.base_path);
    cfg.auth_token = j.value("auth_token", cfg.auth_token);
    cfg.connect_timeout = millis_or(j, "connect_timeout_ms", cfg.connect_timeout);
    cfg.request_timeout = millis_or(j, "request_timeout_ms", cfg.request_timeout);
}

void apply_logging(const json& j, LoggingConfig& cfg) {
    cfg.level = j.value("level", cfg.level);
    cfg.pattern = j.value("pattern", cfg.pattern);
    cfg.file = j.value("file", cfg.file);
    cfg.max_file_bytes = j.value("max_file_bytes", cfg.max_file_bytes);
    cfg.max_files = j.value("max_files", cfg.max_files);
}

} // namespace

std::chrono::milliseconds RetryConfig::backoff_for(std::uint32_t retry) const {
    if (retry == 0) {
        return std::chrono::milliseconds(0);
    }
    const double factor = std::pow(backoff_multiplier, static_cast<double>(retry - 1));
    const double delay = static_cast<double>(initial_backoff.count()) * factor;
    const double capped = std::min(delay, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

Result<EngineConfig> parse_config(const std::string& json_text) {
    EngineConfig config;
    try {
        const json root = json::parse(json_text);
        if (!root.is_object()) {
            return Err<EngineConfig>(ErrorCode::Validation, "config root must be a JSON object");
        }

        config.chunk_size = root.value("chunk_size", config.chunk_size);
        config.max_file_size = root.value("max_file_size", config.max_file_size);
        config.refresh_quiet_period = millis_or(root, "refresh_quiet_period_ms", config.refresh_quiet_period);
        config.throughput_window = millis_or(root, "throughput_window_ms", config.throughput_window);
        config.session_max_age = std::chrono::hours(
            root.value("session_max_age_hours", static_cast<std::int64_t>(config.session_max_age.count())));
        config.store_directory = root.value("store_directory", config.store_directory);

        if (root.contains("scheduler")) {
            apply_scheduler(root.at("scheduler"), config.scheduler);
        }
        if (root.contains("retry")) {
            apply_retry(root.at("retry"), config.retry);
        }
        if (root.contains("server")) {
            apply_server(root.at("server"), config.server);
        }
        if (root.contains("logging")) {
            apply_logging(root.at("logging"), config.logging);
        }
    } catch (const json::exception& e) {
        return Err<EngineConfig>(ErrorCode::Validation, std::string("invalid config: ") + e.what());
    }

    if (auto valid = validate_config(config); valid.is_error()) {
        return Err<EngineConfig>(valid.error());
    }
    return Ok(config);
}

Result<EngineConfig> load_config(const std::string& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        spdlog::warn("Unable to open config file {}, falling back to defaults", path);
        return Ok(EngineConfig{});
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

Result<void> validate_config(const EngineConfig& config) {
    if (config.chunk_size == 0) {
        return Err<void>(ErrorCode::Validation, "chunk_size must be > 0");
    }
    if (config.max_file_size == 0) {
        return Err<void>(ErrorCode::Validation, "max_file_size must be > 0");
    }
    if (config.scheduler.global_chunk_limit == 0 || config.scheduler.per_session_chunk_limit == 0 ||
        config.scheduler.max_active_sessions == 0) {
        return Err<void>(ErrorCode::Validation, "scheduler limits must be > 0");
    }
    if (config.retry.max_attempts == 0) {
        return Err<void>(ErrorCode::Validation, "retry.max_attempts must be >= 1");
    }
    if (config.retry.backoff_multiplier < 1.0) {
        return Err<void>(ErrorCode::Validation, "retry.backoff_multiplier must be >= 1.0");
    }
    if (config.retry.chunk_timeout.count() <= 0) {
        return Err<void>(ErrorCode::Validation, "retry.chunk_timeout_ms must be > 0");
    }
    return Ok();
}

} // namespace rup
