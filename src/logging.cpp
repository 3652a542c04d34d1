#include "storyguard/logging.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace storyguard {

namespace {

std::mutex g_log_mutex;
std::atomic<int> g_threshold{-1};

LogLevel parse_level(const char* raw) {
    if (!raw) {
        return LogLevel::Info;
    }
    const std::string value(raw);
    if (value == "debug") {
        return LogLevel::Debug;
    }
    if (value == "warning" || value == "warn") {
        return LogLevel::Warning;
    }
    if (value == "error") {
        return LogLevel::Error;
    }
    return LogLevel::Info;
}

const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warning: return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace

std::string timestamp_now() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

LogLevel log_threshold() {
    int current = g_threshold.load(std::memory_order_relaxed);
    if (current < 0) {
        current = static_cast<int>(parse_level(std::getenv("STORYGUARD_LOG_LEVEL")));
        int expected = -1;
        if (!g_threshold.compare_exchange_strong(expected, current)) {
            current = expected;
        }
    }
    return static_cast<LogLevel>(current);
}

void set_log_threshold(LogLevel level) {
    g_threshold.store(static_cast<int>(level), std::memory_order_relaxed);
}

void log_message(LogLevel level, std::string_view component, std::string_view message) noexcept {
    try {
        if (static_cast<int>(level) < static_cast<int>(log_threshold())) {
            return;
        }
        std::ostringstream line;
        line << '[' << component << ' ' << timestamp_now() << "] " << level_label(level) << ' ' << message << '\n';
        std::scoped_lock lock(g_log_mutex);
        std::clog << line.str();
        std::clog.flush();
    } catch (const std::exception&) {
        // Diagnostics must never take down a validation call.
    }
}

} // namespace storyguard
