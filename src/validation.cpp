#include "storyguard/validation.hpp"

#include <array>

namespace storyguard {

namespace {

const std::array<std::string, 10> kChildMessages = {
    "Let's pick a different name for our story friend!",
    "Hmm, that name isn't quite right for our story. Can you think of another one?",
    "Names can use letters, spaces, hyphens and apostrophes. Let's try again!",
    "Oops! Each magic word can only be picked once. Try a different one!",
    "Please pick your magic words from the list.",
    "Those magic words don't go together in a story. Let's try a different mix!",
    "Let's take a little break and try again in a moment.",
    "Please choose he/him, she/her or they/them for your story friend.",
    "Please choose one of the story adventures from the list.",
    "Stories can have between one and five friends. Let's try again!",
};

} // namespace

ValidationResult ValidationResult::accept(std::string sanitized) {
    ValidationResult result;
    result.is_valid = true;
    result.sanitized_text = std::move(sanitized);
    return result;
}

ValidationResult ValidationResult::reject(ErrorKind kind, std::set<std::string> flags) {
    ValidationResult result;
    result.is_valid = false;
    result.error_kind = kind;
    result.child_message = child_message_for(kind);
    result.security_flags = std::move(flags);
    return result;
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::PromptInjection: return "prompt_injection";
    case ErrorKind::InappropriateContent: return "inappropriate_content";
    case ErrorKind::CharacterRuleViolation: return "character_rule_violation";
    case ErrorKind::DuplicateSelection: return "duplicate_selection";
    case ErrorKind::UnapprovedSelection: return "unapproved_selection";
    case ErrorKind::InappropriateCombination: return "inappropriate_combination";
    case ErrorKind::RateLimited: return "rate_limited";
    case ErrorKind::UnsupportedPronouns: return "unsupported_pronouns";
    case ErrorKind::UnsupportedTopic: return "unsupported_topic";
    case ErrorKind::CharacterCountOutOfRange: return "character_count_out_of_range";
    }
    return "unknown";
}

const std::string& child_message_for(ErrorKind kind) {
    return kChildMessages[static_cast<std::size_t>(kind)];
}

bool is_security_relevant(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::PromptInjection:
    case ErrorKind::InappropriateContent:
    case ErrorKind::CharacterRuleViolation:
    case ErrorKind::InappropriateCombination:
        return true;
    default:
        return false;
    }
}

} // namespace storyguard
