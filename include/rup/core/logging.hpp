#pragma once

#include "rup/core/config.hpp"
#include "rup/core/result.hpp"

namespace rup {

/**
 * @brief Configures the default spdlog logger
 *
 * Console output always; a rotating file sink is added when
 * LoggingConfig::file is set.
 */
Result<void> configure_logging(const LoggingConfig& config);

} // namespace rup
