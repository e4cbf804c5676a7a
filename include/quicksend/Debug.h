/**
 * @file Debug.h
 * @brief Console logging utilities with timestamps
 *
 * (c) 2026 QuickSend Project
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

namespace QuickSend {

// Serializes writes to std::cerr; the broadcaster thread and the session
// thread log concurrently.
inline std::mutex g_logMutex;

// LOG_DEBUG is silent unless this is set (CLI -v).
inline std::atomic<bool> g_verboseLogging{false};

inline void setVerboseLogging(bool enabled) {
    g_verboseLogging.store(enabled);
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

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << "[" << std::setfill('0') << std::setw(2) << tm.tm_hour
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_min
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_sec
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    return oss.str();
}

#define LOG_INFO(msg) \
    do { \
        std::lock_guard<std::mutex> lock(QuickSend::g_logMutex); \
        std::cerr << QuickSend::getTimestamp() << " [INFO] " << msg << std::endl; \
    } while(0)

#define LOG_DEBUG(msg) \
    do { \
        if (QuickSend::g_verboseLogging.load()) { \
            std::lock_guard<std::mutex> lock(QuickSend::g_logMutex); \
            std::cerr << QuickSend::getTimestamp() << " [DEBUG] " << msg << std::endl; \
        } \
    } while(0)

#define LOG_ERROR(msg) \
    do { \
        std::lock_guard<std::mutex> lock(QuickSend::g_logMutex); \
        std::cerr << QuickSend::getTimestamp() << " [ERROR] " << msg << std::endl; \
    } while(0)

#define LOG_WARNING(msg) \
    do { \
        std::lock_guard<std::mutex> lock(QuickSend::g_logMutex); \
        std::cerr << QuickSend::getTimestamp() << " [WARNING] " << msg << std::endl; \
    } while(0)

} // namespace QuickSend
