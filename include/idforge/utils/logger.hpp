/**
 * @file logger.hpp
 * @brief Thread-safe native logging framework for idforge.
 *
 * Structured logging with configurable levels, component tags and
 * timestamps. The library itself stays quiet at the default level (WARN);
 * only unrecoverable faults are written unconditionally.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#pragma once

#include "idforge/utils/export.hpp"

#include <atomic>
#include <cstdlib>
#include <iosfwd>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace idforge {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @class Logger
 * @brief Thread-safe singleton logger with configurable output.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_DEBUG("Pool", "Refilled {} entries", size);
 * LOG_FATAL("Random", "RAND_bytes failed: {}", reason);  // never returns
 * @endcode
 */
class IDFORGE_UTILS_API Logger {
public:
    /**
     * @brief Get the process-wide logger instance.
     */
    static Logger& instance();

    /**
     * @brief Unpadded name of a level ("TRACE", "INFO", ...).
     */
    static std::string levelName(LogLevel level);

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    /**
     * @brief Check if a level would be logged.
     */
    bool isEnabled(LogLevel level) const {
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable colored output (ANSI terminals).
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    bool isColorEnabled() const {
        return colorEnabled_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output. Passing nullptr restores std::cerr.
     *
     * The stream must outlive every log call made while it is installed.
     */
    void setOutput(std::ostream* out);

    /**
     * @brief Log a message with the given level and component.
     *
     * Each "{}" in @p format is replaced by the next argument.
     */
    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (level == LogLevel::FATAL) {
            fatal(component, format, std::forward<Args>(args)...);
        }
        if (!isEnabled(level)) {
            return;
        }
        write(level, component, formatMessage(format, std::forward<Args>(args)...));
    }

    /**
     * @brief Log an unrecoverable fault and abort the process.
     *
     * Written regardless of the configured level.
     */
    template<typename... Args>
    [[noreturn]] void fatal(const char* component, const char* format, Args&&... args) {
        write(LogLevel::FATAL, component, formatMessage(format, std::forward<Args>(args)...));
        std::abort();
    }

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const char* component, const std::string& message);

    std::string formatMessage(const char* format) {
        return std::string(format);
    }

    template<typename T, typename... Args>
    std::string formatMessage(const char* format, T&& value, Args&&... args) {
        std::ostringstream oss;

        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                return oss.str() + formatMessage(format + 2, std::forward<Args>(args)...);
            }
            oss << *format++;
        }

        return oss.str();
    }

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    std::ostream* out_;
};

}  // namespace utils
}  // namespace idforge

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::idforge::utils::Logger::instance().log(::idforge::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::idforge::utils::Logger::instance().log(::idforge::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::idforge::utils::Logger::instance().log(::idforge::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::idforge::utils::Logger::instance().log(::idforge::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::idforge::utils::Logger::instance().log(::idforge::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::idforge::utils::Logger::instance().fatal(component, __VA_ARGS__)
