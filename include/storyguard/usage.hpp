#pragma once

#include "json.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace storyguard {

// In-memory counts of accepted selection words, keyed "category/word".
class WordUsageTally {
public:
    void record(const std::string& category, const std::string& word);

    std::size_t count(const std::string& category, const std::string& word) const;
    std::size_t total() const;
    std::map<std::string, std::size_t> snapshot() const;

    Json to_json() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::size_t> m_counts;
    std::size_t m_total = 0;

    static std::string key(const std::string& category, const std::string& word);
};

} // namespace storyguard
