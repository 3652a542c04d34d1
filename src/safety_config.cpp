#include "storyguard/safety_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <unordered_set>

namespace storyguard {

namespace {

constexpr std::size_t kMaxRepetitionBound = 64;

PatternTables default_patterns() {
    PatternTables tables;
    tables.injection = {
        {"injection.ignore_instructions",
         R"re(\b(ignore|disregard|forget|skip|override) (all |any |the |your |my ){0,2}(previous |prior |above |earlier |preceding |past )?(instructions?|rules?|prompts?|directions?|commands?|guidelines?)\b)re"},
        {"injection.role_reassignment", R"re(\byou( a|')?re (now|no longer)\b)re"},
        {"injection.act_as", R"re(\b(act|behave|pretend|roleplay) (as|like|to be)\b)re"},
        {"injection.system_prompt",
         R"re(\b(system|developer|hidden|secret|initial|original) (prompt|message|instructions?|mode)\b)re"},
        {"injection.reveal",
         R"re(\b(reveal|show|print|repeat|output|display|tell me) (me )?(your |the )?(system |hidden |secret |initial )?(prompt|instructions|rules)\b)re"},
        {"injection.jailbreak", R"re(\b(jailbreak|jailbroken|dan mode|do anything now|god mode)\b)re"},
        {"injection.new_instructions", R"re(\b(new|updated|different) (instructions?|rules|persona)\b)re"},
        {"injection.exit_story",
         R"re(\b(stop|end|exit|leave|break out of) (the |this |your )?(story|game|roleplay|role play|simulation)\b)re"},
        {"injection.instead", R"re(\binstead (say|write|tell|generate|output|draw)\b)re"},
        {"injection.disable_safety",
         R"re(\b(bypass|disable|turn off|switch off|remove) (the |your |all )?(filters?|safety|rules|restrictions|guidelines|moderation)\b)re"},
    };
    tables.inappropriate = {
        {"inappropriate.violence", R"re(\b(kill|murder|stab|shoot|strangle|torture|behead)(s|ed|er|ers|ing)?\b)re"},
        {"inappropriate.death", R"re(\b(dead|death|suicide|corpse)\b)re"},
        {"inappropriate.gore", R"re(\b(blood|bloody|gore|gory)\b)re"},
        {"inappropriate.weapons", R"re(\b(weapons?|guns?|knife|knives|bombs?|grenades?|rifles?|pistols?)\b)re"},
        {"inappropriate.hate", R"re(\b(hate|hater|haters|hatred)\b)re"},
        {"inappropriate.harm", R"re(\b(hurt|hurts|fight|fights|fighting|violent|violence)\b)re"},
        {"inappropriate.insult", R"re(\b(stupid|idiot|dumb|moron|loser|ugly|fatso|retard|retarded)\b)re"},
        {"inappropriate.profanity",
         R"re(\b(fuck|fucking|fucker|shit|shitty|bitch|bastard|damn|crap|piss|cock|cunt|whore|slut|ass|asshole)\b)re"},
        {"inappropriate.adult", R"re(\b(sex|sexy|porn|nude|naked|boobs?|penis|vagina)\b)re"},
        {"inappropriate.substances", R"re(\b(drugs?|cocaine|heroin|weed|beer|vodka|whiskey|cigarettes?)\b)re"},
    };
    tables.leetspeak = {
        {"leetspeak.f_word", R"re(\b(ph|f)(v|uu|oo)(c|k|ck|kk|q){1,2}(ing|er|ed|s)?\b)re"},
        {"leetspeak.s_word", R"re(\b(s|z)h(y|ii|ee)t{1,2}(s|z|ty)?\b)re"},
        {"leetspeak.b_word", R"re(\bb(y|ee|ia|ya)tch(es)?\b)re"},
        {"leetspeak.a_word", R"re(\ba(z|sz|zs|zz)(hole)?\b)re"},
        {"leetspeak.kill", R"re(\bk(y|ii|ee)l{1,2}(s|ed|er|ing)?\b)re"},
    };
    tables.homophones = {
        {"homophone.f_word", R"re(\b(fuk|fuq|phuk|phuck|fawk|fok|fack)\b)re"},
        {"homophone.s_word", R"re(\b(shite|shiet|sheit|sheeit|shizzle)\b)re"},
        {"homophone.b_word", R"re(\b(biatch|beyotch|biotch|beeyotch)\b)re"},
        {"homophone.a_word", R"re(\b(arse|azzhole|ashole)\b)re"},
        {"homophone.damn", R"re(\b(dayum|daym|dang it)\b)re"},
        {"homophone.adult", R"re(\b(seks|secks|sexxy|sexi)\b)re"},
    };
    return tables;
}

KeywordCategory make_category(std::string name, std::initializer_list<const char*> words) {
    KeywordCategory category;
    category.name = std::move(name);
    for (const char* word : words) {
        category.approved_words.insert(word);
    }
    return category;
}

std::vector<KeywordCategory> default_categories() {
    std::vector<KeywordCategory> categories;
    categories.push_back(make_category(
        "nature", {"tree", "sun", "moon", "star", "rain", "cloud", "rainbow", "river", "ocean", "mountain", "forest",
                   "flower", "garden", "snow", "wind", "leaf", "sky", "lake", "island", "meadow", "dark", "night",
                   "storm", "volcano", "cave"}));
    categories.push_back(make_category(
        "creatures", {"dragon", "fairy", "unicorn", "puppy", "kitten", "bunny", "owl", "bear", "fox", "turtle",
                      "dolphin", "butterfly", "penguin", "elephant", "lion", "monkey", "robot", "giant", "wizard",
                      "mermaid", "monster", "ghost", "alien", "dinosaur"}));
    categories.push_back(make_category(
        "feelings", {"happy", "brave", "kind", "silly", "curious", "gentle", "proud", "calm", "excited",
                     "friendly", "helpful", "sleepy", "shy", "cheerful", "clever", "hopeful", "lonely", "grumpy",
                     "surprised", "scary", "nervous", "sad", "angry", "mysterious"}));
    categories.push_back(make_category(
        "objects", {"treasure", "map", "castle", "boat", "rocket", "balloon", "lantern", "key", "crown", "book",
                    "hat", "kite", "bicycle", "train", "blanket", "cookie", "cake", "bell", "compass", "telescope",
                    "wand", "shield", "drum", "backpack"}));
    return categories;
}

std::vector<ForbiddenCombination> default_combinations() {
    return {
        {"combination.scary_monster_dark", {"scary", "monster", "dark"}},
        {"combination.scary_ghost_night", {"scary", "ghost", "night"}},
        {"combination.lonely_dark_night", {"lonely", "dark", "night"}},
        {"combination.angry_giant_storm", {"angry", "giant", "storm"}},
        {"combination.nervous_ghost_cave", {"nervous", "ghost", "cave"}},
        {"combination.angry_monster", {"angry", "monster"}},
    };
}

std::string trim_ascii(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

[[noreturn]] void fail(const std::string& message) {
    throw ConfigurationError("configuration: " + message);
}

std::size_t read_count(const JsonObject& obj, const std::string& key, std::size_t fallback) {
    const auto it = obj.find(key);
    if (it == obj.end()) {
        return fallback;
    }
    if (!it->second.is_number()) {
        fail("'" + key + "' must be a number");
    }
    const double value = it->second.as_number();
    if (value < 0.0 || std::floor(value) != value || value > 1e12) {
        fail("'" + key + "' must be a non-negative integer");
    }
    return static_cast<std::size_t>(value);
}

const JsonObject& require_object(const Json& value, const std::string& what) {
    if (!value.is_object()) {
        fail("'" + what + "' must be an object");
    }
    return value.as_object();
}

std::vector<std::string> read_string_list(const Json& value, const std::string& what) {
    if (!value.is_array()) {
        fail("'" + what + "' must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : value.as_array()) {
        if (!item.is_string()) {
            fail("'" + what + "' must contain only strings");
        }
        out.push_back(item.as_string());
    }
    return out;
}

std::vector<PatternRule> read_rules(const Json& value, const std::string& what) {
    if (!value.is_array()) {
        fail("'" + what + "' must be an array of rules");
    }
    std::vector<PatternRule> rules;
    for (const auto& item : value.as_array()) {
        const auto& obj = require_object(item, what + "[]");
        auto id = string_member(obj, "id");
        auto pattern = string_member(obj, "pattern");
        if (!id || !pattern) {
            fail("every rule in '" + what + "' needs string 'id' and 'pattern'");
        }
        rules.push_back({std::move(*id), std::move(*pattern)});
    }
    return rules;
}

void read_limits(const JsonObject& obj, LimitSettings& limits) {
    limits.max_raw_length = read_count(obj, "max_raw_length", limits.max_raw_length);
    limits.max_sanitized_length = read_count(obj, "max_sanitized_length", limits.max_sanitized_length);
    limits.repeat_run_threshold = read_count(obj, "repeat_run_threshold", limits.repeat_run_threshold);
    limits.max_story_length = read_count(obj, "max_story_length", limits.max_story_length);
    limits.max_characters = read_count(obj, "max_characters", limits.max_characters);
}

void read_rate_limit(const JsonObject& obj, RateLimitSettings& rate) {
    rate.threshold = read_count(obj, "threshold", rate.threshold);
    rate.window = std::chrono::seconds(read_count(obj, "window_seconds", static_cast<std::size_t>(rate.window.count())));
    rate.cooldown =
        std::chrono::seconds(read_count(obj, "cooldown_seconds", static_cast<std::size_t>(rate.cooldown.count())));
    rate.idle_ttl =
        std::chrono::seconds(read_count(obj, "idle_ttl_seconds", static_cast<std::size_t>(rate.idle_ttl.count())));
    rate.max_sessions = read_count(obj, "max_sessions", rate.max_sessions);
}

std::vector<ForbiddenCombination> read_combinations(const Json& value) {
    if (!value.is_array()) {
        fail("'forbidden_combinations' must be an array");
    }
    std::vector<ForbiddenCombination> combinations;
    std::size_t index = 0;
    for (const auto& item : value.as_array()) {
        ++index;
        ForbiddenCombination combination;
        if (item.is_array()) {
            combination.id = "combination." + std::to_string(index);
            combination.words = read_string_list(item, "forbidden_combinations[]");
        } else {
            const auto& obj = require_object(item, "forbidden_combinations[]");
            combination.id = string_member(obj, "id").value_or("combination." + std::to_string(index));
            const auto words = obj.find("words");
            if (words == obj.end()) {
                fail("forbidden combination '" + combination.id + "' has no 'words'");
            }
            combination.words = read_string_list(words->second, "words");
        }
        for (auto& word : combination.words) {
            word = canonical_word(word);
        }
        combinations.push_back(std::move(combination));
    }
    return combinations;
}

std::optional<std::string> read_env(const char* name) {
#ifdef _WIN32
    size_t required = 0;
    char* buffer = nullptr;
    if (_dupenv_s(&buffer, &required, name) != 0) {
        return std::nullopt;
    }
    std::unique_ptr<char, decltype(&std::free)> holder(buffer, &std::free);
    if (!buffer) {
        return std::nullopt;
    }
    return std::string(buffer);
#else
    if (const char* value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
#endif
}

std::optional<std::size_t> parse_size_env(const char* name) {
    auto value = read_env(name);
    if (!value) {
        return std::nullopt;
    }
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(*value, &consumed);
    } catch (const std::exception&) {
        fail(std::string(name) + " is not a number: '" + *value + "'");
    }
    if (consumed != value->size() || value->front() == '-') {
        fail(std::string(name) + " is not a non-negative integer: '" + *value + "'");
    }
    return static_cast<std::size_t>(parsed);
}

void check_rules(const std::vector<PatternRule>& rules, std::unordered_set<std::string>& seen_ids) {
    for (const auto& rule : rules) {
        if (rule.id.empty()) {
            fail("pattern rule with empty id");
        }
        if (!seen_ids.insert(rule.id).second) {
            fail("duplicate pattern rule id '" + rule.id + "'");
        }
        if (rule.pattern.empty()) {
            fail("pattern rule '" + rule.id + "' is empty");
        }
        check_bounded_pattern(rule.id, rule.pattern);
    }
}

} // namespace

const KeywordCategory* SafetyConfig::find_category(std::string_view name) const {
    const std::string key = canonical_word(name);
    for (const auto& category : categories) {
        if (category.name == key) {
            return &category;
        }
    }
    return nullptr;
}

std::string canonical_word(std::string_view word) {
    std::string result = trim_ascii(word);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

SafetyConfig default_config() {
    SafetyConfig config;
    config.patterns = default_patterns();
    config.categories = default_categories();
    config.forbidden_combinations = default_combinations();
    config.pronouns = {"he/him", "she/her", "they/them"};
    config.topics = {"space", "community", "dragons", "fairies"};
    return config;
}

SafetyConfig config_from_json(const Json& root) {
    SafetyConfig config = default_config();
    const auto& obj = require_object(root, "root");

    if (const Json* limits = root.find("limits")) {
        read_limits(require_object(*limits, "limits"), config.limits);
    }
    if (const Json* rate = root.find("rate_limit")) {
        read_rate_limit(require_object(*rate, "rate_limit"), config.rate_limit);
    }
    if (const Json* patterns = root.find("patterns")) {
        require_object(*patterns, "patterns");
        if (const Json* rules = patterns->find("injection")) {
            config.patterns.injection = read_rules(*rules, "patterns.injection");
        }
        if (const Json* rules = patterns->find("inappropriate")) {
            config.patterns.inappropriate = read_rules(*rules, "patterns.inappropriate");
        }
        if (const Json* rules = patterns->find("leetspeak")) {
            config.patterns.leetspeak = read_rules(*rules, "patterns.leetspeak");
        }
        if (const Json* rules = patterns->find("homophones")) {
            config.patterns.homophones = read_rules(*rules, "patterns.homophones");
        }
    }
    if (const Json* categories = root.find("categories")) {
        config.categories.clear();
        for (const auto& [name, words] : require_object(*categories, "categories")) {
            KeywordCategory category;
            category.name = canonical_word(name);
            for (const auto& word : read_string_list(words, "categories." + name)) {
                category.approved_words.insert(canonical_word(word));
            }
            config.categories.push_back(std::move(category));
        }
    }
    if (const Json* combinations = root.find("forbidden_combinations")) {
        config.forbidden_combinations = read_combinations(*combinations);
    }
    if (const Json* pronouns = root.find("pronouns")) {
        config.pronouns = read_string_list(*pronouns, "pronouns");
    }
    if (const Json* topics = root.find("topics")) {
        config.topics = read_string_list(*topics, "topics");
    }
    config.min_words_per_category = read_count(obj, "min_words_per_category", config.min_words_per_category);
    return config;
}

SafetyConfig load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        fail("unable to open " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    try {
        return config_from_json(Json::parse(buffer.str()));
    } catch (const JsonParseError& ex) {
        fail(path.string() + ": " + ex.what());
    }
}

void apply_env_overrides(SafetyConfig& config) {
    if (auto value = parse_size_env("STORYGUARD_MAX_RAW_LENGTH")) {
        config.limits.max_raw_length = *value;
    }
    if (auto value = parse_size_env("STORYGUARD_RATE_THRESHOLD")) {
        config.rate_limit.threshold = *value;
    }
    if (auto value = parse_size_env("STORYGUARD_RATE_WINDOW_SECONDS")) {
        config.rate_limit.window = std::chrono::seconds(*value);
    }
    if (auto value = parse_size_env("STORYGUARD_RATE_COOLDOWN_SECONDS")) {
        config.rate_limit.cooldown = std::chrono::seconds(*value);
    }
    if (auto value = parse_size_env("STORYGUARD_SESSION_TTL_SECONDS")) {
        config.rate_limit.idle_ttl = std::chrono::seconds(*value);
    }
}

void check_bounded_pattern(const std::string& rule_id, const std::string& pattern) {
    bool in_class = false;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '\\') {
            if (i + 1 >= pattern.size()) {
                fail("pattern '" + rule_id + "' ends with a dangling escape");
            }
            const char next = pattern[i + 1];
            if (!in_class && next >= '1' && next <= '9') {
                fail("pattern '" + rule_id + "' uses a back-reference");
            }
            ++i;
            continue;
        }
        if (in_class) {
            if (c == ']') {
                in_class = false;
            }
            continue;
        }
        if (c == '[') {
            in_class = true;
            continue;
        }
        if (c == '*' || c == '+') {
            fail("pattern '" + rule_id + "' uses unbounded repetition");
        }
        if (c == '{') {
            const std::size_t close = pattern.find('}', i);
            if (close == std::string::npos) {
                fail("pattern '" + rule_id + "' has an unterminated repetition bound");
            }
            const std::string bounds = pattern.substr(i + 1, close - i - 1);
            const std::size_t comma = bounds.find(',');
            const std::string upper = comma == std::string::npos ? bounds : bounds.substr(comma + 1);
            if (upper.empty() || !std::all_of(upper.begin(), upper.end(), [](char ch) {
                    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
                })) {
                fail("pattern '" + rule_id + "' uses an open-ended repetition bound");
            }
            if (upper.size() > 3 || std::stoul(upper) > kMaxRepetitionBound) {
                fail("pattern '" + rule_id + "' repetition bound exceeds " + std::to_string(kMaxRepetitionBound));
            }
            i = close;
        }
    }
    if (in_class) {
        fail("pattern '" + rule_id + "' has an unterminated character class");
    }
}

void validate_config(const SafetyConfig& config) {
    const auto& limits = config.limits;
    if (limits.max_raw_length == 0 || limits.max_sanitized_length == 0) {
        fail("length limits must be positive");
    }
    if (limits.max_sanitized_length > limits.max_raw_length) {
        fail("max_sanitized_length must not exceed max_raw_length");
    }
    if (limits.repeat_run_threshold < 2) {
        fail("repeat_run_threshold must be at least 2");
    }
    if (limits.max_story_length == 0 || limits.max_characters == 0) {
        fail("story limits must be positive");
    }

    const auto& rate = config.rate_limit;
    if (rate.threshold == 0) {
        fail("rate_limit.threshold must be at least 1");
    }
    if (rate.window.count() <= 0 || rate.cooldown.count() <= 0 || rate.idle_ttl.count() <= 0) {
        fail("rate_limit durations must be positive");
    }
    if (rate.max_sessions == 0) {
        fail("rate_limit.max_sessions must be positive");
    }

    std::unordered_set<std::string> rule_ids;
    check_rules(config.patterns.injection, rule_ids);
    check_rules(config.patterns.inappropriate, rule_ids);
    check_rules(config.patterns.leetspeak, rule_ids);
    check_rules(config.patterns.homophones, rule_ids);

    if (config.categories.empty()) {
        fail("at least one keyword category is required");
    }
    std::unordered_set<std::string> category_names;
    for (const auto& category : config.categories) {
        if (category.name.empty() || !category_names.insert(category.name).second) {
            fail("keyword category names must be unique and non-empty");
        }
        if (category.approved_words.size() < config.min_words_per_category) {
            fail("category '" + category.name + "' has " + std::to_string(category.approved_words.size())
                 + " words; at least " + std::to_string(config.min_words_per_category) + " are required");
        }
        for (const auto& word : category.approved_words) {
            if (word.empty() || word != canonical_word(word)) {
                fail("category '" + category.name + "' contains a blank or non-canonical word");
            }
        }
    }

    std::unordered_set<std::string> combination_ids;
    for (const auto& combination : config.forbidden_combinations) {
        if (!combination_ids.insert(combination.id).second) {
            fail("duplicate forbidden combination id '" + combination.id + "'");
        }
        const std::set<std::string> distinct(combination.words.begin(), combination.words.end());
        if (combination.words.size() < 2 || combination.words.size() > 3 || distinct.size() != combination.words.size()) {
            fail("forbidden combination '" + combination.id + "' must list 2 or 3 distinct words");
        }
    }

    if (config.pronouns.empty() || config.topics.empty()) {
        fail("pronouns and topics must not be empty");
    }
}

SharedConfig make_shared_config(SafetyConfig config) {
    validate_config(config);
    return std::make_shared<const SafetyConfig>(std::move(config));
}

} // namespace storyguard
