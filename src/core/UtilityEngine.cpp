// ============================================================================
// UTILITY ENGINE - Logging Implementation
// ============================================================================

#include "core/UtilityEngine.h"

#include <iostream>

#include "core/TimeUtils.h"

// ============================================================================
// GLOBAL INSTANCE
// ============================================================================

namespace {
UtilityEngine defaultEngine;
}

UtilityEngine* engine = &defaultEngine;

// ============================================================================
// LIFECYCLE
// ============================================================================

UtilityEngine::UtilityEngine() = default;

UtilityEngine::~UtilityEngine() {
    closeLogFile();
}

// ============================================================================
// LOGGING
// ============================================================================

void UtilityEngine::log(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(m_level.load())) return;

    std::lock_guard<std::mutex> lock(m_mutex);

    LogEntry entry{level, TimeUtils::millis(), message};
    m_history.push_back(entry);
    while (m_history.size() > LOG_HISTORY_SIZE) {
        m_history.pop_front();
    }

    std::string line = "[" + TimeUtils::format("%Y-%m-%d %H:%M:%S") + "] [" +
                       levelName(level) + "] " + message;

    if (m_consoleEnabled) {
        std::cerr << line << '\n';
    }

    if (m_file.is_open()) {
        m_fileBuffer.push_back(line);
        // Warnings and errors must survive a crash right after them
        if (m_fileBuffer.size() >= LOG_FILE_BUFFER_LINES || level >= LogLevel::LOG_WARNING) {
            flushLocked();
        }
    }
}

// ============================================================================
// FILE SINK
// ============================================================================

bool UtilityEngine::openLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        flushLocked();
        m_file.close();
    }
    m_file.open(path, std::ios::out | std::ios::app);
    return m_file.is_open();
}

void UtilityEngine::closeLogFile() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_file.is_open()) return;
    flushLocked();
    m_file.close();
}

void UtilityEngine::flushLogBuffer(bool force) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!force && m_fileBuffer.size() < LOG_FILE_BUFFER_LINES) return;
    flushLocked();
}

void UtilityEngine::flushLocked() {
    if (!m_file.is_open()) {
        m_fileBuffer.clear();
        return;
    }
    for (const auto& line : m_fileBuffer) {
        m_file << line << '\n';
    }
    m_file.flush();
    m_fileBuffer.clear();
}

// ============================================================================
// HISTORY
// ============================================================================

std::vector<LogEntry> UtilityEngine::recentEntries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<LogEntry>(m_history.begin(), m_history.end());
}

void UtilityEngine::clearHistory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_history.clear();
}

bool UtilityEngine::historyContains(LogLevel level, const std::string& fragment) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& entry : m_history) {
        if (entry.level == level && entry.message.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// LEVEL NAMES
// ============================================================================

const char* UtilityEngine::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG:   return "DEBUG";
        case LogLevel::LOG_INFO:    return "INFO";
        case LogLevel::LOG_WARNING: return "WARN";
        case LogLevel::LOG_ERROR:   return "ERROR";
        default:                    return "?";
    }
}

bool UtilityEngine::parseLogLevel(const std::string& name, LogLevel& level) {
    if (name == "debug") { level = LogLevel::LOG_DEBUG; return true; }
    if (name == "info")  { level = LogLevel::LOG_INFO; return true; }
    if (name == "warn")  { level = LogLevel::LOG_WARNING; return true; }
    if (name == "error") { level = LogLevel::LOG_ERROR; return true; }
    return false;
}
