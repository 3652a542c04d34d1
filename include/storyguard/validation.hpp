#pragma once

#include <optional>
#include <set>
#include <string>

namespace storyguard {

enum class ErrorKind {
    PromptInjection,
    InappropriateContent,
    CharacterRuleViolation,
    DuplicateSelection,
    UnapprovedSelection,
    InappropriateCombination,
    RateLimited,
    UnsupportedPronouns,
    UnsupportedTopic,
    CharacterCountOutOfRange
};

struct ValidationResult {
    bool is_valid = false;
    std::optional<ErrorKind> error_kind;
    std::optional<std::string> child_message;
    std::optional<std::string> sanitized_text;
    std::set<std::string> security_flags;

    static ValidationResult accept(std::string sanitized);
    static ValidationResult reject(ErrorKind kind, std::set<std::string> flags = {});
};

const char* to_string(ErrorKind kind) noexcept;

// Fixed wording shown to the child; never names the rule that fired.
const std::string& child_message_for(ErrorKind kind);

// Kinds that count towards a session's rate limit. Selection slips
// (duplicate or unapproved words) and request-shape errors do not.
bool is_security_relevant(ErrorKind kind) noexcept;

} // namespace storyguard
