#pragma once

#include "safety_config.hpp"

#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace storyguard {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;

struct SessionRateState {
    std::string session_id;
    std::size_t violation_count = 0;
    TimePoint window_start{};
    std::optional<TimePoint> cooldown_until;
    TimePoint last_seen{};
};

struct ViolationOutcome {
    std::size_t violation_count = 0;
    bool cooling = false;
    // True only for the violation that moved the session into Cooling.
    bool cooldown_started = false;
};

// Violation counter per session. A session reaches Cooling when `threshold`
// violations land inside one window and returns to Normal, with a fresh
// counter, once the cooldown has elapsed. Idle sessions are evicted.
class RateLimiter {
public:
    explicit RateLimiter(RateLimitSettings settings);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    bool is_cooling(const std::string& session_id, TimePoint now);
    ViolationOutcome record_violation(const std::string& session_id, TimePoint now);

    std::optional<SessionRateState> snapshot(const std::string& session_id) const;
    std::size_t session_count() const;

    // Drops sessions idle for longer than the TTL. Returns the number evicted.
    std::size_t sweep(TimePoint now);

    const RateLimitSettings& settings() const noexcept { return m_settings; }

private:
    struct Entry {
        SessionRateState state;
        std::list<std::string>::iterator recency;
    };

    RateLimitSettings m_settings;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_sessions;
    // Session ids, most recently seen first.
    std::list<std::string> m_recency;
    std::size_t m_operations_since_sweep = 0;

    bool expire_cooldown_locked(SessionRateState& state, TimePoint now) const;
    std::size_t sweep_locked(TimePoint now);
    void enforce_capacity_locked();
    void note_operation_locked(TimePoint now);
};

} // namespace storyguard
