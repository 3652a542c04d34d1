#pragma once

#include <string>
#include <string_view>

namespace storyguard {

// Two projections of one raw input. `display` keeps the user's spelling and
// casing and is the only form that may leave the engine; `detection` and
// `compact` exist only for matching.
struct NormalizedText {
    std::string display;
    std::string detection;
    std::string compact;
};

class TextNormalizer {
public:
    // Detection projection: invisible code points and combining marks
    // removed, full-width forms and case folded, Cyrillic and Greek
    // look-alike letters mapped to Latin, Latin accents stripped, look-alike
    // digits and symbols substituted, whitespace collapsed.
    // Idempotent.
    std::string normalize(std::string_view raw) const;

    // Light cleaning for output: trims, collapses whitespace, removes
    // invisible code points and combining marks, canonicalises curly
    // apostrophes and dash variants. Case is preserved.
    std::string clean(std::string_view raw) const;

    NormalizedText project(std::string_view raw) const;

    // Detection text with spaces, hyphens and apostrophes removed.
    static std::string compact(std::string_view detection);

    static char32_t substitute(char32_t cp) noexcept;
};

} // namespace storyguard
