#include "storyguard/combination_validator.hpp"

#include <algorithm>

namespace storyguard {

namespace {

constexpr char kKeySeparator = '\x1f';

} // namespace

CombinationValidator::CombinationValidator(SharedConfig config) : m_config(std::move(config)) {
    if (!m_config) {
        throw ConfigurationError("configuration: combination validator requires a configuration");
    }
    for (const auto& combination : m_config->forbidden_combinations) {
        m_forbidden.emplace(combination_key(combination.words), combination.id);
    }
}

std::string CombinationValidator::combination_key(std::vector<std::string> words) {
    std::sort(words.begin(), words.end());
    std::string key;
    for (const auto& word : words) {
        if (!key.empty()) {
            key.push_back(kKeySeparator);
        }
        key += word;
    }
    return key;
}

bool CombinationValidator::is_approved(const std::string& word, const std::string& category) const {
    const KeywordCategory* found = m_config->find_category(category);
    return found && found->approved_words.count(canonical_word(word)) != 0;
}

std::optional<std::string> CombinationValidator::forbidden_id(const Selection& words) const {
    if (auto it = m_forbidden.find(combination_key({words[0], words[1], words[2]})); it != m_forbidden.end()) {
        return it->second;
    }
    for (std::size_t i = 0; i < kSelectionSize; ++i) {
        for (std::size_t j = i + 1; j < kSelectionSize; ++j) {
            if (auto it = m_forbidden.find(combination_key({words[i], words[j]})); it != m_forbidden.end()) {
                return it->second;
            }
        }
    }
    return std::nullopt;
}

SelectionOutcome CombinationValidator::validate(const Selection& words, const Selection& claimed_categories) const {
    SelectionOutcome outcome;
    for (std::size_t i = 0; i < kSelectionSize; ++i) {
        outcome.words[i] = canonical_word(words[i]);
    }

    for (std::size_t i = 0; i < kSelectionSize; ++i) {
        for (std::size_t j = i + 1; j < kSelectionSize; ++j) {
            if (outcome.words[i] == outcome.words[j]) {
                outcome.error = ErrorKind::DuplicateSelection;
                outcome.rule_ids.insert("selection.duplicate");
            }
        }
    }
    if (outcome.error) {
        return outcome;
    }

    for (std::size_t i = 0; i < kSelectionSize; ++i) {
        const KeywordCategory* category = m_config->find_category(claimed_categories[i]);
        if (!category) {
            outcome.rule_ids.insert("selection.unknown_category." + std::to_string(i));
        } else if (outcome.words[i].empty() || category->approved_words.count(outcome.words[i]) == 0) {
            outcome.rule_ids.insert("selection.unapproved." + std::to_string(i));
        }
    }
    if (!outcome.rule_ids.empty()) {
        outcome.error = ErrorKind::UnapprovedSelection;
        return outcome;
    }

    if (auto id = forbidden_id(outcome.words)) {
        outcome.error = ErrorKind::InappropriateCombination;
        outcome.rule_ids.insert(*id);
    }
    return outcome;
}

} // namespace storyguard
