// ============================================================================
// TIMEUTILS.H - Centralized time operations using std::chrono
// ============================================================================
// Wall-clock formatting for log timestamps, a monotonic millisecond clock,
// and Deadline: the timeout budget every poll loop re-evaluates per iteration.
//
// Usage:
//   TimeUtils::format("%Y-%m-%d %H:%M:%S")   → "2026-02-21 14:30:00"
//   TimeUtils::millis()                       → ms since first call
//   TimeUtils::Deadline d(5000); d.remainingMs()
// ============================================================================

#pragma once

#include <array>
#include <chrono>
#include <ctime>
#include <string>
#include <thread>

namespace TimeUtils {

using SteadyClock = std::chrono::steady_clock;

/**
 * Get current time as epoch seconds via std::chrono
 */
inline time_t epochSeconds() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::system_clock::to_time_t(now);
}

/**
 * Format current time with strftime pattern
 * @param fmt strftime format string (e.g. "%Y-%m-%d %H:%M:%S")
 * @return Formatted time string
 */
inline std::string format(const char* fmt) {
    auto t = epochSeconds();
    struct tm timeinfo;
    localtime_r(&t, &timeinfo);
    std::array<char, 64> buffer{};
    strftime(buffer.data(), buffer.size(), fmt, &timeinfo);
    return std::string(buffer.data());
}

/**
 * Monotonic milliseconds since the first call in this process
 */
inline unsigned long millis() {
    static const auto origin = SteadyClock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - origin);
    return static_cast<unsigned long>(elapsed.count());
}

/**
 * Block the calling thread (no-op for 0)
 */
inline void sleepMs(unsigned long ms) {
    if (ms == 0) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

// ============================================================================
// DEADLINE - timeout budget measured from construction
// ============================================================================

class Deadline {
public:
    explicit Deadline(unsigned long budgetMs) :
        m_start(SteadyClock::now()),
        m_budgetMs(budgetMs) {}

    unsigned long elapsedMs() const {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - m_start);
        return static_cast<unsigned long>(elapsed.count());
    }

    /** Budget left, 0 once expired */
    unsigned long remainingMs() const {
        unsigned long elapsed = elapsedMs();
        return elapsed >= m_budgetMs ? 0 : m_budgetMs - elapsed;
    }

    bool expired() const { return remainingMs() == 0; }

    unsigned long budgetMs() const { return m_budgetMs; }

private:
    SteadyClock::time_point m_start;
    unsigned long m_budgetMs;
};

} // namespace TimeUtils
