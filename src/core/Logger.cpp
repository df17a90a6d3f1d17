/**
 * @file Logger.cpp
 * @brief Console and trace-file Logger implementations
 */

#include "ftpcore/Logger.h"
#include "ftpcore/Debug.h"
#include "ftpcore/ThreadSafeLog.h"

#include <algorithm>
#include <cctype>

namespace FtpCore {

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "info";
}

std::optional<LogLevel> parseLogLevel(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "debug") {
        return LogLevel::Debug;
    }
    if (lower == "info") {
        return LogLevel::Info;
    }
    if (lower == "warning" || lower == "warn") {
        return LogLevel::Warning;
    }
    if (lower == "error") {
        return LogLevel::Error;
    }
    return std::nullopt;
}

void ConsoleLogger::write(LogLevel level, const std::string& message) {
    if (level < m_minLevel) {
        return;
    }

    switch (level) {
        case LogLevel::Debug:   LOG_DEBUG(message); break;
        case LogLevel::Info:    LOG_INFO(message); break;
        case LogLevel::Warning: LOG_WARNING(message); break;
        case LogLevel::Error:   LOG_ERROR(message); break;
    }
}

void TraceFileLogger::write(LogLevel level, const std::string& message) {
    if (level < m_minLevel) {
        return;
    }
    ThreadSafeLog::log(std::string("[") + logLevelToString(level) + "] " + message);
}

void TeeLogger::write(LogLevel level, const std::string& message) {
    if (m_first) {
        m_first->write(level, message);
    }
    if (m_second) {
        m_second->write(level, message);
    }
}

}  // namespace FtpCore
