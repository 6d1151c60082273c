/**
 * @file config.cpp
 * @brief Environment-driven configuration.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#include "idforge/utils/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace idforge {
namespace utils {

namespace {

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

const char* envValue(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

}  // namespace

LogLevel parseLogLevel(const std::string& level_str) {
    const std::string level = toUpper(level_str);
    if (level == "TRACE") return LogLevel::TRACE;
    if (level == "DEBUG") return LogLevel::DEBUG;
    if (level == "INFO") return LogLevel::INFO;
    if (level == "WARN") return LogLevel::WARN;
    if (level == "ERROR") return LogLevel::ERROR;
    if (level == "FATAL") return LogLevel::FATAL;
    if (level == "OFF") return LogLevel::OFF;
    return LogLevel::INFO;
}

Config loadConfigFromEnv() {
    Config config;

    if (const char* level = envValue("IDFORGE_LOG_LEVEL")) {
        config.log_level = level;
    }

    if (const char* color = envValue("IDFORGE_LOG_COLOR")) {
        const std::string value = toUpper(color);
        config.log_color = (value == "1" || value == "TRUE" || value == "ON" || value == "YES");
    }

    if (const char* size = envValue("IDFORGE_POOL_SIZE")) {
        try {
            size_t pos = 0;
            long long parsed = std::stoll(size, &pos);
            if (pos != std::char_traits<char>::length(size) || parsed <= 0) {
                throw std::invalid_argument("not a positive integer");
            }
            config.pool_size = static_cast<size_t>(parsed);
        } catch (const std::exception& e) {
            LOG_WARN("Config", "Ignoring IDFORGE_POOL_SIZE='{}': {}", size, e.what());
        }
    }

    return config;
}

void applyConfig(const Config& config) {
    Logger& logger = Logger::instance();
    logger.setLevel(parseLogLevel(config.log_level));
    logger.setColorEnabled(config.log_color);
    LOG_DEBUG("Config", "Applied log_level={} log_color={} pool_size={}",
              config.log_level, config.log_color, config.pool_size);
}

}  // namespace utils
}  // namespace idforge
