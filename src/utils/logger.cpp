/**
 * @file logger.cpp
 * @brief Logging utilities
 */

#include "utils/logger.h"

#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace eps_monitor {

namespace {
LogLevel g_minLogLevel = LogLevel::INFO;
}

void setLogLevel(LogLevel level) {
    g_minLogLevel = level;
}

LogLevel getLogLevel() {
    return g_minLogLevel;
}

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    return std::nullopt;
}

static std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tmLocal{};
    localtime_r(&time, &tmLocal);

    std::ostringstream oss;
    oss << std::put_time(&tmLocal, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

void log(LogLevel level, const std::string& message) {
    if (level < g_minLogLevel) return;

    const char* levelStr = "";
    switch (level) {
        case LogLevel::DEBUG:   levelStr = "[DEBUG]"; break;
        case LogLevel::INFO:    levelStr = "[INFO]"; break;
        case LogLevel::WARNING: levelStr = "[WARN]"; break;
        case LogLevel::ERROR:   levelStr = "[ERROR]"; break;
    }

    std::cerr << getTimestamp() << " " << levelStr << " " << message << std::endl;
}

void logDebug(const std::string& message) { log(LogLevel::DEBUG, message); }
void logInfo(const std::string& message) { log(LogLevel::INFO, message); }
void logWarning(const std::string& message) { log(LogLevel::WARNING, message); }
void logError(const std::string& message) { log(LogLevel::ERROR, message); }

} // namespace eps_monitor
