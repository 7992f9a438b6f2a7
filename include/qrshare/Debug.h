/**
 * @file Debug.h
 * @brief Timestamped stderr logging shared by the server and the tool
 *
 * (c) 2026 QrShare Project
 * Licensed under MIT License
 */

#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>

namespace QrShare {

// Handler threads log concurrently; one line per lock
inline std::mutex g_logMutex;

/**
 * @brief Local wall-clock time as "[HH:MM:SS.mmm]"
 */
inline std::string logTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const long millis = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000);

    std::tm tm{};
    localtime_r(&seconds, &tm);

    char buf[24];
    std::snprintf(buf, sizeof(buf), "[%02d:%02d:%02d.%03ld]",
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

} // namespace QrShare

// msg may be a stream expression: LOG_INFO("port " << port)
#define QRSHARE_LOG_AT(level, msg) \
    do { \
        std::lock_guard<std::mutex> qrshareLogLock(QrShare::g_logMutex); \
        std::cerr << QrShare::logTimestamp() << " [" level "] " << msg << std::endl; \
    } while (0)

#define LOG_INFO(msg)    QRSHARE_LOG_AT("INFO", msg)
#define LOG_DEBUG(msg)   QRSHARE_LOG_AT("DEBUG", msg)
#define LOG_WARNING(msg) QRSHARE_LOG_AT("WARNING", msg)
#define LOG_ERROR(msg)   QRSHARE_LOG_AT("ERROR", msg)
