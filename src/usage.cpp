#include "storyguard/usage.hpp"

namespace storyguard {

std::string WordUsageTally::key(const std::string& category, const std::string& word) {
    return category + '/' + word;
}

void WordUsageTally::record(const std::string& category, const std::string& word) {
    std::scoped_lock lock(m_mutex);
    ++m_counts[key(category, word)];
    ++m_total;
}

std::size_t WordUsageTally::count(const std::string& category, const std::string& word) const {
    std::scoped_lock lock(m_mutex);
    auto it = m_counts.find(key(category, word));
    return it == m_counts.end() ? 0 : it->second;
}

std::size_t WordUsageTally::total() const {
    std::scoped_lock lock(m_mutex);
    return m_total;
}

std::map<std::string, std::size_t> WordUsageTally::snapshot() const {
    std::scoped_lock lock(m_mutex);
    return m_counts;
}

Json WordUsageTally::to_json() const {
    JsonObject counts;
    for (const auto& [name, value] : snapshot()) {
        counts[name] = Json(value);
    }
    JsonObject obj;
    obj["total"] = Json(total());
    obj["words"] = Json(std::move(counts));
    return Json(std::move(obj));
}

} // namespace storyguard
