#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace storyguard {

enum class Script {
    Common,
    Latin,
    Greek,
    Cyrillic,
    Armenian,
    Hebrew,
    Arabic,
    Devanagari,
    Thai,
    Hangul,
    Hiragana,
    Katakana,
    Han,
    Other
};

constexpr char32_t kReplacementCharacter = 0xFFFD;

// Decodes UTF-8 leniently: every malformed, overlong or surrogate sequence
// becomes one U+FFFD so the result is always well formed.
std::u32string decode_utf8(std::string_view text);
std::size_t count_code_points(std::string_view text);

void append_utf8(char32_t code, std::string& out);
std::string encode_utf8(std::u32string_view text);

bool is_whitespace(char32_t cp) noexcept;
bool is_zero_width(char32_t cp) noexcept;
bool is_bidi_control(char32_t cp) noexcept;
// Zero-width, bidi controls, variation selectors, tag characters and other
// format code points that render as nothing.
bool is_invisible(char32_t cp) noexcept;
bool is_combining_mark(char32_t cp) noexcept;
bool is_ascii_digit(char32_t cp) noexcept;

// Letters accepted in a character name: Latin (with precomposed accents),
// Greek and Cyrillic.
bool is_name_letter(char32_t cp) noexcept;

Script script_of(char32_t cp) noexcept;
const char* script_name(Script script) noexcept;

char32_t fold_case(char32_t cp) noexcept;
char32_t fold_fullwidth(char32_t cp) noexcept;
// Maps a lower-case precomposed Latin letter to its unaccented ASCII base.
char32_t strip_diacritic(char32_t cp) noexcept;
// Maps a lower-case Cyrillic or Greek letter that renders like a Latin
// letter to that Latin letter; everything else is returned unchanged.
char32_t fold_confusable(char32_t cp) noexcept;
char32_t canonical_punctuation(char32_t cp) noexcept;

} // namespace storyguard
