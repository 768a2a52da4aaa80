/**
 * @file ThreadSafeLog.h
 * @brief Thread-safe file logging for session traces
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include <mutex>
#include <string>

namespace FastDrop {

/**
 * @brief Thread-safe append-only trace log
 *
 * Every module that records session milestones (listener, dialer, radio
 * adapters, transfer engine workers) goes through this class so concurrent
 * writers never interleave partial lines.
 *
 * Note: initialize() should be called from main() before any worker
 * threads start. Until then log() is a no-op.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Set the log path (call before worker threads start)
     * @param logPath Path to the log file; empty disables logging
     */
    static void initialize(const std::string& logPath);

    /**
     * @brief Append one timestamped line
     * @param message Message to log
     *
     * Thread-safe: locks a global mutex before writing to the file.
     */
    static void log(const std::string& message);

    /**
     * @brief Log a const char* message
     *
     * This overload prevents ambiguity when passing string literals.
     */
    static void log(const char* message);

private:
    /// Global mutex for synchronizing file access across all threads
    static std::mutex s_mutex;

    /// Log file path (set by initialize())
    static std::string s_logPath;
};

} // namespace FastDrop
