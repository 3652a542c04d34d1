#pragma once

#include "safety_config.hpp"
#include "validation.hpp"

#include <array>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace storyguard {

constexpr std::size_t kSelectionSize = 3;
using Selection = std::array<std::string, kSelectionSize>;

struct SelectionOutcome {
    std::optional<ErrorKind> error;
    std::set<std::string> rule_ids;
    Selection words;
};

class CombinationValidator {
public:
    explicit CombinationValidator(SharedConfig config);

    // Duplicate check first, then membership of every word in the category
    // it claims (position independent), then the forbidden table.
    SelectionOutcome validate(const Selection& words, const Selection& claimed_categories) const;

    bool is_approved(const std::string& word, const std::string& category) const;

private:
    SharedConfig m_config;
    std::unordered_map<std::string, std::string> m_forbidden;

    static std::string combination_key(std::vector<std::string> words);
    std::optional<std::string> forbidden_id(const Selection& words) const;
};

} // namespace storyguard
