#include "storyguard/safety_controller.hpp"
#include "storyguard/logging.hpp"
#include "storyguard/unicode.hpp"

#include <algorithm>

namespace storyguard {

namespace {

// Upper bound on UTF-8 bytes per code point; anything longer is rejected
// before it is decoded.
constexpr std::size_t kMaxBytesPerCodePoint = 4;

std::optional<SecurityEventKind> event_kind_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::PromptInjection: return SecurityEventKind::PromptInjection;
    case ErrorKind::InappropriateContent: return SecurityEventKind::InappropriateContent;
    case ErrorKind::CharacterRuleViolation: return SecurityEventKind::CharacterRuleViolation;
    case ErrorKind::InappropriateCombination: return SecurityEventKind::InappropriateCombination;
    default: return std::nullopt;
    }
}

// Code points between the first and last non-whitespace code point, marks
// and invisible code points included.
std::size_t trimmed_length(std::string_view raw) {
    const std::u32string points = decode_utf8(raw);
    std::size_t begin = 0;
    std::size_t end = points.size();
    while (begin < end && is_whitespace(points[begin])) {
        ++begin;
    }
    while (end > begin && is_whitespace(points[end - 1])) {
        --end;
    }
    return end - begin;
}

bool is_allowed_name_char(char32_t cp) {
    return cp == ' ' || cp == '-' || cp == '\'' || is_name_letter(cp);
}

ValidationResult internal_fault(const char* operation, const std::string& reason) {
    log_message(LogLevel::Error, "SafetyController", std::string(operation) + " failed closed: " + reason);
    return ValidationResult::reject(ErrorKind::CharacterRuleViolation, {"engine.fault"});
}

std::string join_words(const Selection& words) {
    std::string joined;
    for (const auto& word : words) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined += word;
    }
    return joined;
}

} // namespace

SafetyController::SafetyController(SharedConfig config, AuditSinkPtr audit_sink)
    : m_config(std::move(config)),
      m_audit_sink(std::move(audit_sink)),
      m_matcher(m_config),
      m_bypass(m_config),
      m_combinations(m_config),
      m_rate_limiter(m_config->rate_limit),
      m_clock([] { return SteadyClock::now(); }) {
    log_message(LogLevel::Info, "SafetyController",
                "ready with " + std::to_string(m_matcher.rule_count()) + " pattern rules and "
                    + std::to_string(m_config->categories.size()) + " word categories");
}

void SafetyController::set_clock(Clock clock) {
    m_clock = clock ? std::move(clock) : Clock([] { return SteadyClock::now(); });
}

void SafetyController::set_usage_recorder(UsageRecorder recorder) {
    m_usage_recorder = std::move(recorder);
}

TimePoint SafetyController::now() const {
    return m_clock();
}

ValidationResult SafetyController::validate_name(const std::string& raw_name, const std::string& session_id) {
    try {
        if (m_rate_limiter.is_cooling(session_id, now())) {
            return ValidationResult::reject(ErrorKind::RateLimited, {"rate_limit.cooling"});
        }
        ValidationResult result = check_name(raw_name);
        if (result.is_valid) {
            return result;
        }
        return record_rejection(std::move(result), session_id);
    } catch (const std::exception& ex) {
        return internal_fault("validate_name", ex.what());
    } catch (...) {
        return internal_fault("validate_name", "unknown exception");
    }
}

ValidationResult SafetyController::check_name(const std::string& raw_name) const {
    const auto& limits = m_config->limits;
    if (raw_name.size() > limits.max_raw_length * kMaxBytesPerCodePoint
        || count_code_points(raw_name) > limits.max_raw_length) {
        return ValidationResult::reject(ErrorKind::CharacterRuleViolation, {"length.raw_exceeded"});
    }

    const NormalizedText text = m_normalizer.project(raw_name);
    const std::u32string display = decode_utf8(text.display);

    std::set<std::string> charset_flags;
    if (display.empty()) {
        charset_flags.insert("charset.empty");
    } else if (display.size() > limits.max_sanitized_length
               || trimmed_length(raw_name) > limits.max_sanitized_length) {
        charset_flags.insert("length.sanitized_exceeded");
    } else if (!std::all_of(display.begin(), display.end(), is_allowed_name_char)) {
        charset_flags.insert("charset.disallowed");
    } else if (std::none_of(display.begin(), display.end(), is_name_letter)) {
        charset_flags.insert("charset.no_letters");
    }

    const std::set<BypassFlag> bypass = m_bypass.detect(raw_name, text);
    std::set<std::string> bypass_flags;
    for (BypassFlag flag : bypass) {
        bypass_flags.insert(to_string(flag));
    }

    if (!charset_flags.empty()) {
        // Structural signals ride along for the audit trail.
        charset_flags.insert(bypass_flags.begin(), bypass_flags.end());
        return ValidationResult::reject(ErrorKind::CharacterRuleViolation, std::move(charset_flags));
    }
    if (!bypass_flags.empty()) {
        return ValidationResult::reject(ErrorKind::CharacterRuleViolation, std::move(bypass_flags));
    }

    MatchResult match = m_matcher.match(text);
    if (match.matched) {
        const ErrorKind kind =
            match.kind == MatchKind::PromptInjection ? ErrorKind::PromptInjection : ErrorKind::InappropriateContent;
        return ValidationResult::reject(kind, std::move(match.rule_ids));
    }

    return ValidationResult::accept(text.display);
}

ValidationResult SafetyController::record_rejection(ValidationResult result, const std::string& session_id) {
    if (!result.error_kind || !is_security_relevant(*result.error_kind)) {
        return result;
    }
    const auto kind = event_kind_for(*result.error_kind);
    if (!kind) {
        return result;
    }
    const ViolationOutcome outcome = m_rate_limiter.record_violation(session_id, now());
    log_message(LogLevel::Info, "SafetyController",
                std::string("rejected ") + to_string(*result.error_kind) + " for session " + session_id + " ("
                    + std::to_string(outcome.violation_count) + "/"
                    + std::to_string(m_config->rate_limit.threshold) + ")");
    emit_event(*kind, session_id, result.security_flags);
    if (outcome.cooldown_started) {
        log_message(LogLevel::Warning, "SafetyController", "session " + session_id + " entered cooldown");
        emit_event(SecurityEventKind::CooldownStarted, session_id, result.security_flags);
    }
    return result;
}

void SafetyController::emit_event(SecurityEventKind kind,
                                  const std::string& session_id,
                                  const std::set<std::string>& rule_ids) {
    if (!m_audit_sink) {
        return;
    }
    SecurityEvent event;
    event.timestamp = std::chrono::system_clock::now();
    event.session_id = session_id;
    event.event_kind = kind;
    event.matched_rule_ids = rule_ids;
    try {
        m_audit_sink->emit(event);
    } catch (const std::exception& ex) {
        log_message(LogLevel::Warning, "SafetyController", std::string("audit sink failed: ") + ex.what());
    } catch (...) {
        log_message(LogLevel::Warning, "SafetyController", "audit sink failed with an unknown exception");
    }
}

ValidationResult SafetyController::validate_selection(const Selection& words,
                                                      const Selection& claimed_categories,
                                                      const std::string& session_id) {
    try {
        if (m_rate_limiter.is_cooling(session_id, now())) {
            return ValidationResult::reject(ErrorKind::RateLimited, {"rate_limit.cooling"});
        }
        SelectionOutcome outcome = m_combinations.validate(words, claimed_categories);
        if (outcome.error) {
            ValidationResult result = ValidationResult::reject(*outcome.error, std::move(outcome.rule_ids));
            return record_rejection(std::move(result), session_id);
        }
        record_usage(outcome.words, claimed_categories);
        return ValidationResult::accept(join_words(outcome.words));
    } catch (const std::exception& ex) {
        return internal_fault("validate_selection", ex.what());
    } catch (...) {
        return internal_fault("validate_selection", "unknown exception");
    }
}

void SafetyController::record_usage(const Selection& words, const Selection& categories) {
    if (!m_usage_recorder) {
        return;
    }
    for (std::size_t i = 0; i < kSelectionSize; ++i) {
        try {
            m_usage_recorder(canonical_word(categories[i]), words[i]);
        } catch (const std::exception& ex) {
            log_message(LogLevel::Warning, "SafetyController", std::string("usage recorder failed: ") + ex.what());
        } catch (...) {
            log_message(LogLevel::Warning, "SafetyController", "usage recorder failed with an unknown exception");
        }
    }
}

ValidationResult SafetyController::validate_pronouns(const std::string& pronouns) const {
    const std::string wanted = canonical_word(pronouns);
    const auto& allowed = m_config->pronouns;
    if (std::find(allowed.begin(), allowed.end(), wanted) != allowed.end()) {
        return ValidationResult::accept(wanted);
    }
    return ValidationResult::reject(ErrorKind::UnsupportedPronouns);
}

ValidationResult SafetyController::validate_topic(const std::string& topic) const {
    const std::string wanted = canonical_word(topic);
    const auto& allowed = m_config->topics;
    if (std::find(allowed.begin(), allowed.end(), wanted) != allowed.end()) {
        return ValidationResult::accept(wanted);
    }
    return ValidationResult::reject(ErrorKind::UnsupportedTopic);
}

ValidationResult SafetyController::validate_character(const std::string& raw_name,
                                                      const std::string& pronouns,
                                                      const std::string& session_id) {
    ValidationResult name = validate_name(raw_name, session_id);
    if (!name.is_valid) {
        return name;
    }
    ValidationResult pronoun_check = validate_pronouns(pronouns);
    if (!pronoun_check.is_valid) {
        return pronoun_check;
    }
    return name;
}

StoryRequestReport SafetyController::validate_story_request(const StoryRequest& request,
                                                            const std::string& session_id) {
    StoryRequestReport report;
    const std::size_t count = request.characters.size();
    if (count == 0 || count > m_config->limits.max_characters) {
        report.failure = ValidationResult::reject(ErrorKind::CharacterCountOutOfRange);
        return report;
    }

    ValidationResult topic = validate_topic(request.topic);
    if (!topic.is_valid) {
        report.failure = std::move(topic);
        return report;
    }
    report.topic = *topic.sanitized_text;

    for (const auto& character : request.characters) {
        ValidationResult result = validate_character(character.name, character.pronouns, session_id);
        if (!result.is_valid) {
            report.sanitized_names.clear();
            report.failure = std::move(result);
            return report;
        }
        report.sanitized_names.push_back(*result.sanitized_text);
    }

    ValidationResult selection = validate_selection(request.words, request.categories, session_id);
    if (!selection.is_valid) {
        report.sanitized_names.clear();
        report.failure = std::move(selection);
        return report;
    }
    for (std::size_t i = 0; i < kSelectionSize; ++i) {
        report.words[i] = canonical_word(request.words[i]);
    }
    report.is_valid = true;
    return report;
}

ValidationResult SafetyController::screen_story_text(const std::string& text) const {
    try {
        const std::size_t limit = m_config->limits.max_story_length;
        if (text.size() > limit * kMaxBytesPerCodePoint || count_code_points(text) > limit) {
            return ValidationResult::reject(ErrorKind::CharacterRuleViolation, {"length.story_exceeded"});
        }
        MatchResult match = m_matcher.match_content(m_normalizer.project(text));
        if (match.matched) {
            return ValidationResult::reject(ErrorKind::InappropriateContent, std::move(match.rule_ids));
        }
        return ValidationResult::accept(text);
    } catch (const std::exception& ex) {
        return internal_fault("screen_story_text", ex.what());
    } catch (...) {
        return internal_fault("screen_story_text", "unknown exception");
    }
}

} // namespace storyguard
