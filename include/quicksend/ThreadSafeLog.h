/**
 * @file ThreadSafeLog.h
 * @brief Thread-safe trace file logging
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace QuickSend {

/**
 * @brief Thread-safe append-only trace log
 *
 * Records session lifecycle events (server start/stop, broadcaster
 * start/stop, session outcome) to a file so that a failed unattended
 * transfer can be diagnosed afterwards. Console output goes through the
 * LOG_* macros in Debug.h instead.
 *
 * Uses a global static mutex to synchronize file access across the
 * broadcaster thread and the session thread.
 *
 * Note: initialize() must be called before any worker thread starts.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Set the log file path
     * @param logPath Path to the log file (created on first write)
     *
     * Calling log() before initialize(), or after initialize() with an empty
     * path, is a no-op.
     */
    static void initialize(const std::filesystem::path& logPath);

    /**
     * @brief Append a timestamped line to the log file
     * @param message Message to log
     *
     * Thread-safe: locks the global mutex before writing to file.
     */
    static void log(const std::string& message);

    /**
     * @brief Log a const char* message
     *
     * This overload prevents ambiguity when passing string literals.
     */
    static void log(const char* message);

    /**
     * @brief Check whether a log file has been configured
     */
    static bool isEnabled();

private:
    /// Global mutex for synchronizing file access across all threads
    static std::mutex s_mutex;

    /// Log file path (set by initialize())
    static std::filesystem::path s_logPath;
};

} // namespace QuickSend
