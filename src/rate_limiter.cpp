#include "storyguard/rate_limiter.hpp"
#include "storyguard/logging.hpp"

namespace storyguard {

namespace {

constexpr std::size_t kSweepInterval = 256;

} // namespace

RateLimiter::RateLimiter(RateLimitSettings settings) : m_settings(settings) {
    if (m_settings.threshold == 0 || m_settings.window.count() <= 0 || m_settings.cooldown.count() <= 0) {
        throw ConfigurationError("configuration: rate limiter needs a positive threshold, window and cooldown");
    }
}

bool RateLimiter::expire_cooldown_locked(SessionRateState& state, TimePoint now) const {
    if (state.cooldown_until && now >= *state.cooldown_until) {
        state.cooldown_until.reset();
        state.violation_count = 0;
        state.window_start = now;
        return true;
    }
    return false;
}

bool RateLimiter::is_cooling(const std::string& session_id, TimePoint now) {
    std::scoped_lock lock(m_mutex);
    note_operation_locked(now);
    const auto it = m_sessions.find(session_id);
    if (it == m_sessions.end()) {
        return false;
    }
    SessionRateState& state = it->second.state;
    expire_cooldown_locked(state, now);
    return state.cooldown_until.has_value();
}

ViolationOutcome RateLimiter::record_violation(const std::string& session_id, TimePoint now) {
    std::scoped_lock lock(m_mutex);
    note_operation_locked(now);

    auto [it, inserted] = m_sessions.try_emplace(session_id);
    Entry& entry = it->second;
    SessionRateState& state = entry.state;
    if (inserted) {
        state.session_id = session_id;
        state.window_start = now;
        m_recency.push_front(session_id);
        entry.recency = m_recency.begin();
    } else {
        m_recency.splice(m_recency.begin(), m_recency, entry.recency);
    }
    state.last_seen = now;

    ViolationOutcome outcome;
    expire_cooldown_locked(state, now);
    if (state.cooldown_until) {
        // Raced with the violation that started the cooldown.
        outcome.violation_count = state.violation_count;
        outcome.cooling = true;
        return outcome;
    }

    if (now - state.window_start >= m_settings.window) {
        state.violation_count = 0;
        state.window_start = now;
    }
    ++state.violation_count;
    outcome.violation_count = state.violation_count;
    if (state.violation_count >= m_settings.threshold) {
        state.cooldown_until = now + m_settings.cooldown;
        outcome.cooling = true;
        outcome.cooldown_started = true;
    }

    if (inserted) {
        enforce_capacity_locked();
    }
    return outcome;
}

std::optional<SessionRateState> RateLimiter::snapshot(const std::string& session_id) const {
    std::scoped_lock lock(m_mutex);
    const auto it = m_sessions.find(session_id);
    if (it == m_sessions.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

std::size_t RateLimiter::session_count() const {
    std::scoped_lock lock(m_mutex);
    return m_sessions.size();
}

std::size_t RateLimiter::sweep(TimePoint now) {
    std::scoped_lock lock(m_mutex);
    return sweep_locked(now);
}

std::size_t RateLimiter::sweep_locked(TimePoint now) {
    m_operations_since_sweep = 0;
    std::size_t evicted = 0;
    for (auto it = m_sessions.begin(); it != m_sessions.end();) {
        SessionRateState& state = it->second.state;
        expire_cooldown_locked(state, now);
        if (!state.cooldown_until && now - state.last_seen >= m_settings.idle_ttl) {
            m_recency.erase(it->second.recency);
            it = m_sessions.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    if (evicted > 0) {
        log_message(LogLevel::Debug, "RateLimiter", "evicted " + std::to_string(evicted) + " idle sessions");
    }
    return evicted;
}

void RateLimiter::enforce_capacity_locked() {
    // Least recently seen Normal session goes first; cooling sessions are
    // kept so a flood of new ids cannot lift a cooldown.
    auto candidate = m_recency.end();
    while (m_sessions.size() > m_settings.max_sessions) {
        while (candidate != m_recency.begin()) {
            --candidate;
            if (!m_sessions.at(*candidate).state.cooldown_until) {
                break;
            }
        }
        const auto it = m_sessions.find(*candidate);
        if (it->second.state.cooldown_until) {
            log_message(LogLevel::Warning, "RateLimiter", "session table full of cooling sessions");
            return;
        }
        candidate = m_recency.erase(candidate);
        m_sessions.erase(it);
    }
}

void RateLimiter::note_operation_locked(TimePoint now) {
    if (++m_operations_since_sweep >= kSweepInterval) {
        sweep_locked(now);
    }
}

} // namespace storyguard
