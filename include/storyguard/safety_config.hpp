#pragma once

#include "json.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace storyguard {

class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PatternRule {
    std::string id;
    std::string pattern;
};

// Evaluated in declaration order; injection first.
struct PatternTables {
    std::vector<PatternRule> injection;
    std::vector<PatternRule> inappropriate;
    std::vector<PatternRule> leetspeak;
    std::vector<PatternRule> homophones;
};

struct KeywordCategory {
    std::string name;
    std::set<std::string> approved_words;
};

struct ForbiddenCombination {
    std::string id;
    std::vector<std::string> words;
};

struct LimitSettings {
    std::size_t max_raw_length = 200;
    std::size_t max_sanitized_length = 50;
    std::size_t repeat_run_threshold = 5;
    std::size_t max_story_length = 20000;
    std::size_t max_characters = 5;
};

struct RateLimitSettings {
    std::size_t threshold = 3;
    std::chrono::seconds window{300};
    std::chrono::seconds cooldown{120};
    std::chrono::seconds idle_ttl{1800};
    std::size_t max_sessions = 100000;
};

struct SafetyConfig {
    LimitSettings limits;
    RateLimitSettings rate_limit;
    PatternTables patterns;
    std::vector<KeywordCategory> categories;
    std::vector<ForbiddenCombination> forbidden_combinations;
    std::vector<std::string> pronouns;
    std::vector<std::string> topics;
    std::size_t min_words_per_category = 20;

    const KeywordCategory* find_category(std::string_view name) const;
};

using SharedConfig = std::shared_ptr<const SafetyConfig>;

SafetyConfig default_config();

// Sections present in the document replace the matching default section.
SafetyConfig config_from_json(const Json& root);
SafetyConfig load_config(const std::filesystem::path& path);
void apply_env_overrides(SafetyConfig& config);

void validate_config(const SafetyConfig& config);
// Rejects '*', '+', open-ended '{m,}', repetition bounds above 64 and back-references.
void check_bounded_pattern(const std::string& rule_id, const std::string& pattern);

// Validates and freezes a configuration for sharing between components.
SharedConfig make_shared_config(SafetyConfig config);

// Trimmed, ASCII lower-cased form used for approved-word lookups.
std::string canonical_word(std::string_view word);

} // namespace storyguard
