/**
 * @file ThreadSafeLog.h
 * @brief Thread-safe file logging for trace diagnostics
 *
 * (c) 2026 FtpCore Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace FtpCore {

/**
 * @brief Thread-safe append-only logging to a trace file
 *
 * Every writer of the trace file goes through this class so that lines from
 * the main loop, acceptor threads and session threads never interleave.
 *
 * Note: initialize() must be called before any worker threads start.
 * log() is a no-op until then.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Set the trace file path (call before starting worker threads)
     * @param logPath Path of the file to append to
     */
    static void initialize(const std::filesystem::path& logPath);

    /**
     * @brief Forget the trace file path; later log() calls are dropped
     */
    static void reset();

    /**
     * @brief Whether initialize() has been called with a non-empty path
     */
    static bool isInitialized();

    /**
     * @brief Append one timestamped line
     * @param message Message to log
     *
     * Thread-safe: locks the global mutex before writing to file.
     */
    static void log(const std::string& message);

    /**
     * @brief Append one timestamped line (string literal overload)
     */
    static void log(const char* message);

private:
    /// Global mutex for synchronizing file access across all threads
    static std::mutex s_mutex;

    /// Trace file path (set by initialize())
    static std::filesystem::path s_logPath;
};

} // namespace FtpCore
