/**
 * @file logger.cpp
 * @brief Logger output path: line layout, colours and the sink.
 *
 * @copyright Copyright (c) 2024 idforge Contributors
 * @license MIT License
 */

#include "idforge/utils/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace idforge {
namespace utils {

namespace {

const char* paddedLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
        default:              return "?????";
    }
}

const char* colorCode(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";    // Gray
        case LogLevel::DEBUG: return "\033[36m";    // Cyan
        case LogLevel::INFO:  return "\033[32m";    // Green
        case LogLevel::WARN:  return "\033[33m";    // Yellow
        case LogLevel::ERROR: return "\033[31m";    // Red
        case LogLevel::FATAL: return "\033[35;1m";  // Bold Magenta
        default:              return "";
    }
}

}  // namespace

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(static_cast<int>(LogLevel::WARN))
    , colorEnabled_(false)
    , out_(&std::cerr)
{}

std::string Logger::levelName(LogLevel level) {
    std::string name = paddedLevelName(level);
    while (!name.empty() && name.back() == ' ') {
        name.pop_back();
    }
    return name;
}

void Logger::setOutput(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out ? out : &std::cerr;
}

void Logger::write(LogLevel level, const char* component, const std::string& message) {
    std::ostringstream oss;

    // Timestamp: [YYYY-MM-DD HH:MM:SS.mmm]
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    oss << "["
        << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count()
        << "] ";

    const bool color = isColorEnabled();
    if (color) {
        oss << colorCode(level);
    }
    oss << "[" << paddedLevelName(level) << "]";
    if (color) {
        oss << "\033[0m";
    }

    oss << " [" << component << "] " << message;

    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << oss.str() << std::endl;
}

}  // namespace utils
}  // namespace idforge
