/**
 * @file Logger.h
 * @brief Injectable logging capability for the listener and port pool
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace FtpCore {

/**
 * @brief Severity of a log line, ordered from most to least verbose
 */
enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error
};

/**
 * @brief Convert a LogLevel to its lowercase name
 */
const char* logLevelToString(LogLevel level);

/**
 * @brief Parse "debug", "info", "warning"/"warn" or "error" (case-insensitive)
 * @return The level, or std::nullopt for anything else
 */
std::optional<LogLevel> parseLogLevel(const std::string& text);

/**
 * @brief Minimal logging interface
 *
 * Components take a std::shared_ptr<Logger> that may be null; a null logger
 * means "do not log". Implementations must be safe to call from any thread.
 */
class Logger {
public:
    virtual ~Logger() = default;
    virtual void write(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& message) { write(LogLevel::Debug, message); }
    void info(const std::string& message) { write(LogLevel::Info, message); }
    void warning(const std::string& message) { write(LogLevel::Warning, message); }
    void error(const std::string& message) { write(LogLevel::Error, message); }
};

/**
 * @brief Logger writing timestamped lines to stderr (shares the LOG_* mutex)
 */
class ConsoleLogger final : public Logger {
public:
    explicit ConsoleLogger(LogLevel minLevel = LogLevel::Info) : m_minLevel(minLevel) {}

    void write(LogLevel level, const std::string& message) override;

    LogLevel getMinLevel() const { return m_minLevel; }

private:
    LogLevel m_minLevel;
};

/**
 * @brief Logger appending to the ThreadSafeLog trace file
 *
 * The trace file must be set with ThreadSafeLog::initialize(); until then
 * lines are dropped.
 */
class TraceFileLogger final : public Logger {
public:
    explicit TraceFileLogger(LogLevel minLevel = LogLevel::Debug) : m_minLevel(minLevel) {}

    void write(LogLevel level, const std::string& message) override;

private:
    LogLevel m_minLevel;
};

/**
 * @brief Logger forwarding each line to two other loggers (either may be null)
 */
class TeeLogger final : public Logger {
public:
    TeeLogger(std::shared_ptr<Logger> first, std::shared_ptr<Logger> second)
        : m_first(std::move(first)), m_second(std::move(second)) {}

    void write(LogLevel level, const std::string& message) override;

private:
    std::shared_ptr<Logger> m_first;
    std::shared_ptr<Logger> m_second;
};

}  // namespace FtpCore
