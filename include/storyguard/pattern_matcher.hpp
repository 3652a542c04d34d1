#pragma once

#include "safety_config.hpp"
#include "text_normalizer.hpp"

#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace storyguard {

enum class MatchKind {
    None,
    PromptInjection,
    InappropriateContent
};

struct MatchResult {
    bool matched = false;
    MatchKind kind = MatchKind::None;
    std::set<std::string> rule_ids;
};

class PatternMatcher {
public:
    // Compiles every rule up front. Throws ConfigurationError when a pattern
    // is unbounded or does not compile.
    explicit PatternMatcher(SharedConfig config);

    // Injection rules, then literal, leetspeak and homophone terms. The first
    // category with a hit ends the scan; all hits inside it are reported.
    MatchResult match(const NormalizedText& text) const;

    // Same scan without the injection category, for generated prose.
    MatchResult match_content(const NormalizedText& text) const;

    std::size_t rule_count() const noexcept;

private:
    struct CompiledRule {
        std::string id;
        std::regex spaced;
        std::optional<std::regex> compact;
    };

    struct CompiledCategory {
        MatchKind kind;
        std::vector<CompiledRule> rules;
    };

    SharedConfig m_config;
    std::vector<CompiledCategory> m_categories;

    static CompiledCategory compile(MatchKind kind, const std::vector<PatternRule>& rules, bool with_compact);
    MatchResult scan(const NormalizedText& text, std::size_t first_category) const;
};

const char* to_string(MatchKind kind) noexcept;

} // namespace storyguard
