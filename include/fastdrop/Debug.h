/**
 * @file Debug.h
 * @brief Debug logging utilities with timestamps
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace FastDrop {

// Serializes writes to std::cerr from radio, accept and streaming threads
inline std::mutex g_logMutex;

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

// Messages below this level are dropped; the tools raise it to Info unless --verbose
inline std::atomic<int> g_logLevel{static_cast<int>(LogLevel::Debug)};

inline void setLogLevel(LogLevel level) {
    g_logLevel.store(static_cast<int>(level));
}

inline bool logEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_logLevel.load();
}

/**
 * @brief Get current timestamp as formatted string
 * @return Timestamp in format [HH:MM:SS.mmm]
 */
inline std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm;
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << "[" << std::setfill('0') << std::setw(2) << tm.tm_hour
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_min
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_sec
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    return oss.str();
}

/**
 * @brief Thread-safe logging macros with timestamp
 *
 * Usage: LOG_INFO("Bound " << endpoint << " for " << protocol);
 */
#define LOG_INFO(msg) \
    do { \
        if (FastDrop::logEnabled(FastDrop::LogLevel::Info)) { \
            std::lock_guard<std::mutex> lock(FastDrop::g_logMutex); \
            std::cerr << FastDrop::getTimestamp() << " [INFO] " << msg << std::endl; \
        } \
    } while(0)

#define LOG_DEBUG(msg) \
    do { \
        if (FastDrop::logEnabled(FastDrop::LogLevel::Debug)) { \
            std::lock_guard<std::mutex> lock(FastDrop::g_logMutex); \
            std::cerr << FastDrop::getTimestamp() << " [DEBUG] " << msg << std::endl; \
        } \
    } while(0)

#define LOG_ERROR(msg) \
    do { \
        if (FastDrop::logEnabled(FastDrop::LogLevel::Error)) { \
            std::lock_guard<std::mutex> lock(FastDrop::g_logMutex); \
            std::cerr << FastDrop::getTimestamp() << " [ERROR] " << msg << std::endl; \
        } \
    } while(0)

#define LOG_WARNING(msg) \
    do { \
        if (FastDrop::logEnabled(FastDrop::LogLevel::Warning)) { \
            std::lock_guard<std::mutex> lock(FastDrop::g_logMutex); \
            std::cerr << FastDrop::getTimestamp() << " [WARNING] " << msg << std::endl; \
        } \
    } while(0)

} // namespace FastDrop
