/**
 * @file config.hpp
 * @brief Runtime configuration for idforge hosts.
 *
 * Values come from defaults or the process environment:
 * - IDFORGE_LOG_LEVEL  TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF
 * - IDFORGE_LOG_COLOR  1/true/on/yes enables ANSI colours
 * - IDFORGE_POOL_SIZE  entries per Pool refill (positive integer)
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include "idforge/utils/export.hpp"
#include "idforge/utils/logger.hpp"

#include <cstddef>
#include <string>

namespace idforge {
namespace utils {

/**
 * @brief Library configuration structure
 */
struct IDFORGE_UTILS_API Config {
    std::string log_level = "WARN";
    bool log_color = false;
    size_t pool_size = 256;    ///< Entries generated per Pool refill
};

/**
 * @brief Convert a log level string to LogLevel (case-insensitive)
 * @param level_str Log level string
 * @return LogLevel value (defaults to INFO if invalid)
 */
IDFORGE_UTILS_API LogLevel parseLogLevel(const std::string& level_str);

/**
 * @brief Build a Config from defaults overridden by IDFORGE_* variables.
 *
 * Malformed values are ignored with a warning and the default is kept.
 */
IDFORGE_UTILS_API Config loadConfigFromEnv();

/**
 * @brief Push logging settings from @p config into the Logger.
 */
IDFORGE_UTILS_API void applyConfig(const Config& config);

}  // namespace utils
}  // namespace idforge
