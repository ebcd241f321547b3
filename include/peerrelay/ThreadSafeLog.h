/**
 * @file ThreadSafeLog.h
 * @brief Thread-safe trace file logging for connection lifecycle diagnostics
 *
 * (c) 2026 PeerRelay Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace PeerRelay {

/**
 * @brief Thread-safe append-only logging to a trace file
 *
 * Used for lifecycle tracing that should survive a crash of the process:
 * - RelayServer (listener/cleanup threads)
 * - Connection reader threads (open/close, uncaught exceptions)
 *
 * Uses a global static mutex to serialize file access across threads.
 *
 * Note: initialize() MUST be called from the main thread before any
 * worker threads start.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Set the trace file path (call from main thread ONLY)
     * @param logPath Path to the log file; empty disables tracing
     *
     * Calling log() before initialize() silently does nothing.
     */
    static void initialize(const std::filesystem::path& logPath);

    /**
     * @brief Append a timestamped line to the trace file
     * @param message Message to log
     *
     * Thread-safe: locks global mutex before writing to file.
     */
    static void log(const std::string& message);

    /**
     * @brief Log a const char* message
     *
     * This overload prevents ambiguity when passing string literals.
     */
    static void log(const char* message);

    /**
     * @brief Whether a trace path has been configured
     */
    static bool isEnabled();

private:
    /// Global mutex for synchronizing file access across all threads
    static std::mutex s_mutex;

    /// Trace file path (set by initialize(), never changes after that)
    static std::filesystem::path s_logPath;
};

} // namespace PeerRelay
