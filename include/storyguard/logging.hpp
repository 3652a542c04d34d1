#pragma once

#include <string>
#include <string_view>

namespace storyguard {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error
};

// Threshold is read from STORYGUARD_LOG_LEVEL the first time it is needed.
LogLevel log_threshold();
void set_log_threshold(LogLevel level);

void log_message(LogLevel level, std::string_view component, std::string_view message) noexcept;

std::string timestamp_now();

} // namespace storyguard
