/**
 * UtilityEngine.h - Unified logging for the stage controller
 *
 * One engine per process, reachable through the global `engine` pointer:
 *   engine->info("..."), engine->warn("..."), engine->error("..."), engine->debug("...")
 *
 * Sinks:
 *  1. Console (stderr), on by default
 *  2. Optional append-only log file, buffered and flushed every
 *     LOG_FILE_BUFFER_LINES lines, on WARN/ERROR, or on flushLogBuffer(true)
 *  3. In-memory history of the last LOG_HISTORY_SIZE entries (tests, diagnostics)
 *
 * Entries below the configured level are dropped before formatting reaches
 * any sink. Guard expensive debug messages with isDebugEnabled().
 */

#pragma once

#include <atomic>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

#include "core/Config.h"

enum class LogLevel {
    LOG_DEBUG = 0,
    LOG_INFO = 1,
    LOG_WARNING = 2,
    LOG_ERROR = 3
};

struct LogEntry {
    LogLevel level;
    unsigned long timestampMs;   // TimeUtils::millis() at emission
    std::string message;
};

class UtilityEngine {
public:
    UtilityEngine();
    ~UtilityEngine();

    UtilityEngine(const UtilityEngine&) = delete;
    UtilityEngine& operator=(const UtilityEngine&) = delete;

    // ========================================================================
    // LOGGING
    // ========================================================================

    void debug(const std::string& message) { log(LogLevel::LOG_DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::LOG_INFO, message); }
    void warn(const std::string& message) { log(LogLevel::LOG_WARNING, message); }
    void error(const std::string& message) { log(LogLevel::LOG_ERROR, message); }

    void log(LogLevel level, const std::string& message);

    bool isDebugEnabled() const { return m_level.load() == LogLevel::LOG_DEBUG; }

    // ========================================================================
    // CONFIGURATION
    // ========================================================================

    void setLogLevel(LogLevel level) { m_level = level; }
    LogLevel getLogLevel() const { return m_level.load(); }

    void setConsoleOutput(bool enabled) { m_consoleEnabled = enabled; }

    /**
     * Append log lines to a file (created if missing)
     * @return true if the file could be opened
     */
    bool openLogFile(const std::string& path);

    void closeLogFile();

    /**
     * Write buffered file lines
     * @param force Write even if the buffer is not full
     */
    void flushLogBuffer(bool force = false);

    // ========================================================================
    // HISTORY
    // ========================================================================

    std::vector<LogEntry> recentEntries() const;
    void clearHistory();

    /** True if any retained entry at `level` contains `fragment` */
    bool historyContains(LogLevel level, const std::string& fragment) const;

    static const char* levelName(LogLevel level);

    /**
     * Parse "debug" / "info" / "warn" / "error" (case-sensitive)
     * @return false if the name is unknown (level untouched)
     */
    static bool parseLogLevel(const std::string& name, LogLevel& level);

private:
    void flushLocked();

    mutable std::mutex m_mutex;
    std::atomic<LogLevel> m_level{LogLevel::LOG_INFO};
    std::atomic<bool> m_consoleEnabled{true};
    std::ofstream m_file;
    std::vector<std::string> m_fileBuffer;
    std::deque<LogEntry> m_history;
};

// Process-wide engine; never null (points at a default instance until replaced)
extern UtilityEngine* engine;
