#pragma once

#include "safety_config.hpp"
#include "text_normalizer.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <string_view>

namespace storyguard {

enum class BypassFlag {
    Repetition,
    MixedScript,
    InvisibleCharacters,
    AllNumeric,
    StackedMarks
};

// More combining marks than this on one base letter reads as stacking.
constexpr std::size_t kMaxMarksPerBase = 2;

class BypassDetector {
public:
    explicit BypassDetector(SharedConfig config);

    // Some signals only exist in the raw form (invisible code points are
    // gone after normalization), others are clearer after folding, so both
    // forms are inspected.
    std::set<BypassFlag> detect(std::string_view raw, const NormalizedText& text) const;

    bool has_repetition(std::u32string_view text) const;
    static bool has_mixed_script_token(std::u32string_view text);
    static bool has_invisible(std::u32string_view text);
    static bool has_numeric_token(std::u32string_view text);
    static bool has_stacked_marks(std::u32string_view text);

private:
    SharedConfig m_config;
};

const char* to_string(BypassFlag flag) noexcept;

} // namespace storyguard
