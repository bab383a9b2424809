#pragma once

#include "mip/core/config.hpp"

#include <string>

namespace mip {

/**
 * @brief Install the process-wide spdlog logger named "mip"
 *
 * Colored stderr sink always; a size-rotated file sink when
 * LoggingConfig::file is set. MIP_LOG_LEVEL overrides the configured level.
 * Returns an error only when the log file cannot be opened.
 */
Status init_logging(const LoggingConfig& config);

void shutdown_logging();

/**
 * @brief Human readable byte count ("1.5 GB"), used in transfer logs
 */
std::string format_bytes(std::uint64_t bytes);

} // namespace mip
