/**
 * @file ThreadSafeLog.h
 * @brief Thread-safe file logging for session traces
 *
 * (c) 2026 QrShare Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace QrShare {

/**
 * @brief Thread-safe logging to an optional trace file
 *
 * Used by the download server (listener thread and every client handler
 * thread) and by the share controller. A single static mutex serializes all
 * appends so concurrent handlers never interleave partial lines.
 *
 * Note: initialize() must be called before any worker threads start.
 * Until then (or after shutdown()) log() is a silent no-op.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Set the log file path (call before starting worker threads)
     * @param logPath Path to the log file (appended to, created if missing)
     */
    static void initialize(const std::filesystem::path& logPath);

    /**
     * @brief Stop logging. Subsequent log() calls are no-ops.
     */
    static void shutdown();

    /**
     * @brief True once initialize() has been called with a non-empty path
     */
    static bool isEnabled();

    /**
     * @brief Log a std::string message
     *
     * Thread-safe: locks the global mutex before writing to the file.
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

    /// Log file path (empty while disabled)
    static std::filesystem::path s_logPath;
};

} // namespace QrShare
