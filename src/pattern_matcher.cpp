#include "storyguard/pattern_matcher.hpp"

#include <algorithm>

namespace storyguard {

namespace {

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::optimize;

std::regex compile_rule(const PatternRule& rule, const std::string& source) {
    try {
        return std::regex(source, kRegexFlags);
    } catch (const std::regex_error& ex) {
        throw ConfigurationError("configuration: pattern '" + rule.id + "' does not compile: " + ex.what());
    }
}

} // namespace

PatternMatcher::PatternMatcher(SharedConfig config) : m_config(std::move(config)) {
    if (!m_config) {
        throw ConfigurationError("configuration: pattern matcher requires a configuration");
    }
    const auto& tables = m_config->patterns;
    m_categories.reserve(4);
    m_categories.push_back(compile(MatchKind::PromptInjection, tables.injection, true));
    m_categories.push_back(compile(MatchKind::InappropriateContent, tables.inappropriate, false));
    m_categories.push_back(compile(MatchKind::InappropriateContent, tables.leetspeak, false));
    m_categories.push_back(compile(MatchKind::InappropriateContent, tables.homophones, false));
}

PatternMatcher::CompiledCategory PatternMatcher::compile(MatchKind kind,
                                                         const std::vector<PatternRule>& rules,
                                                         bool with_compact) {
    CompiledCategory category{kind, {}};
    category.rules.reserve(rules.size());
    for (const auto& rule : rules) {
        check_bounded_pattern(rule.id, rule.pattern);
        CompiledRule compiled{rule.id, compile_rule(rule, rule.pattern), std::nullopt};
        if (with_compact) {
            // Phrases are written with single literal spaces; dropping them
            // yields the pattern for "ignoreallprevious"-style input.
            std::string squeezed = rule.pattern;
            squeezed.erase(std::remove(squeezed.begin(), squeezed.end(), ' '), squeezed.end());
            compiled.compact = compile_rule(rule, squeezed);
        }
        category.rules.push_back(std::move(compiled));
    }
    return category;
}

MatchResult PatternMatcher::match(const NormalizedText& text) const {
    return scan(text, 0);
}

MatchResult PatternMatcher::match_content(const NormalizedText& text) const {
    return scan(text, 1);
}

MatchResult PatternMatcher::scan(const NormalizedText& text, std::size_t first_category) const {
    MatchResult result;
    for (std::size_t index = first_category; index < m_categories.size(); ++index) {
        const auto& category = m_categories[index];
        for (const auto& rule : category.rules) {
            bool hit = std::regex_search(text.detection, rule.spaced);
            if (!hit && rule.compact && !text.compact.empty()) {
                hit = std::regex_search(text.compact, *rule.compact);
            }
            if (hit) {
                result.rule_ids.insert(rule.id);
            }
        }
        if (!result.rule_ids.empty()) {
            result.matched = true;
            result.kind = category.kind;
            break;
        }
    }
    return result;
}

std::size_t PatternMatcher::rule_count() const noexcept {
    std::size_t total = 0;
    for (const auto& category : m_categories) {
        total += category.rules.size();
    }
    return total;
}

const char* to_string(MatchKind kind) noexcept {
    switch (kind) {
    case MatchKind::None: return "none";
    case MatchKind::PromptInjection: return "prompt_injection";
    case MatchKind::InappropriateContent: return "inappropriate_content";
    }
    return "none";
}

} // namespace storyguard
