#include "rup/core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace rup {

Result<void> configure_logging(const LoggingConfig& config) {
    const auto level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        return Err<void>(ErrorCode::Validation, "unknown log level: " + config.level);
    }

    if (!config.file.empty()) {
        try {
            std::vector<spdlog::sink_ptr> sinks;
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.max_file_bytes, config.max_files));
            auto logger = std::make_shared<spdlog::logger>("rup", sinks.begin(), sinks.end());
            spdlog::set_default_logger(logger);
        } catch (const spdlog::spdlog_ex& e) {
            return Err<void>(ErrorCode::Io, std::string("failed to open log file: ") + e.what());
        }
    }

    spdlog::set_level(level);
    spdlog::set_pattern(config.pattern);
    return Ok();
}

} // namespace rup
