#pragma once

#include "audit.hpp"
#include "bypass_detector.hpp"
#include "combination_validator.hpp"
#include "pattern_matcher.hpp"
#include "rate_limiter.hpp"
#include "safety_config.hpp"
#include "text_normalizer.hpp"
#include "validation.hpp"

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace storyguard {

struct CharacterInput {
    std::string name;
    std::string pronouns;
};

struct StoryRequest {
    std::vector<CharacterInput> characters;
    std::string topic;
    Selection words;
    Selection categories;
};

struct StoryRequestReport {
    bool is_valid = false;
    // Set when is_valid is false: the first check that failed.
    std::optional<ValidationResult> failure;
    std::vector<std::string> sanitized_names;
    std::string topic;
    Selection words;
};

// Entry point for every check. No operation throws: each outcome, including
// internal faults, comes back as a ValidationResult.
class SafetyController {
public:
    using Clock = std::function<TimePoint()>;
    using UsageRecorder = std::function<void(const std::string& category, const std::string& word)>;

    // Throws ConfigurationError when the configuration cannot be compiled.
    SafetyController(SharedConfig config, AuditSinkPtr audit_sink);

    SafetyController(const SafetyController&) = delete;
    SafetyController& operator=(const SafetyController&) = delete;

    ValidationResult validate_name(const std::string& raw_name, const std::string& session_id);
    ValidationResult validate_selection(const Selection& words,
                                        const Selection& claimed_categories,
                                        const std::string& session_id);

    ValidationResult validate_pronouns(const std::string& pronouns) const;
    ValidationResult validate_topic(const std::string& topic) const;
    ValidationResult validate_character(const std::string& raw_name,
                                        const std::string& pronouns,
                                        const std::string& session_id);
    StoryRequestReport validate_story_request(const StoryRequest& request, const std::string& session_id);

    // Screens generated prose; no session, rate limit or audit involved.
    ValidationResult screen_story_text(const std::string& text) const;

    void set_clock(Clock clock);
    void set_usage_recorder(UsageRecorder recorder);

    const SafetyConfig& config() const noexcept { return *m_config; }
    const RateLimiter& rate_limiter() const noexcept { return m_rate_limiter; }

private:
    SharedConfig m_config;
    AuditSinkPtr m_audit_sink;
    TextNormalizer m_normalizer;
    PatternMatcher m_matcher;
    BypassDetector m_bypass;
    CombinationValidator m_combinations;
    RateLimiter m_rate_limiter;
    Clock m_clock;
    UsageRecorder m_usage_recorder;

    TimePoint now() const;
    ValidationResult check_name(const std::string& raw_name) const;
    ValidationResult record_rejection(ValidationResult result, const std::string& session_id);
    void emit_event(SecurityEventKind kind, const std::string& session_id, const std::set<std::string>& rule_ids);
    void record_usage(const Selection& words, const Selection& categories);
};

} // namespace storyguard
