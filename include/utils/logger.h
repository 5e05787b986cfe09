#pragma once
/**
 * @file logger.h
 * @brief Logging utilities
 */

#include <optional>
#include <string>

namespace eps_monitor {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @brief Set minimum log level (call once from main)
 */
void setLogLevel(LogLevel level);

LogLevel getLogLevel();

/**
 * @brief Parse "debug", "info", "warning"/"warn" or "error"
 */
std::optional<LogLevel> parseLogLevel(const std::string& name);

/**
 * @brief Log a message
 */
void log(LogLevel level, const std::string& message);

/**
 * @brief Convenience logging functions
 */
void logDebug(const std::string& message);
void logInfo(const std::string& message);
void logWarning(const std::string& message);
void logError(const std::string& message);

} // namespace eps_monitor
