#include "storyguard/unicode.hpp"

namespace storyguard {

namespace {

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

bool in_range(char32_t cp, char32_t lo, char32_t hi) {
    return cp >= lo && cp <= hi;
}

// Unaccented base letter for U+00C0..U+00FF; '?' keeps the code point.
constexpr char kLatin1Base[] =
    "aaaaaa?ceeeeiiii"
    "dnooooo?ouuuuy??"
    "aaaaaa?ceeeeiiii"
    "dnooooo?ouuuuy?y";

// Unaccented base letter for U+0100..U+017F.
constexpr char kLatinExtendedABase[] =
    "aaaaaaccccccccdd"
    "ddeeeeeeeeeegggg"
    "gggghhhhiiiiiiii"
    "ii??jjkkklllllll"
    "lllnnnnnnnnnoooo"
    "oo??rrrrrrssssss"
    "ssttttttuuuuuuuu"
    "uuuuwwyyyzzzzzzs";

} // namespace

std::u32string decode_utf8(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());
    const auto* ptr = reinterpret_cast<const unsigned char*>(text.data());
    const auto* end = ptr + text.size();
    while (ptr < end) {
        const unsigned char lead = *ptr;
        char32_t code = 0;
        std::size_t length = 0;
        char32_t minimum = 0;
        if (lead < 0x80) {
            out.push_back(lead);
            ++ptr;
            continue;
        }
        if ((lead >> 5) == 0x6) {
            code = lead & 0x1F;
            length = 2;
            minimum = 0x80;
        } else if ((lead >> 4) == 0xE) {
            code = lead & 0x0F;
            length = 3;
            minimum = 0x800;
        } else if ((lead >> 3) == 0x1E) {
            code = lead & 0x07;
            length = 4;
            minimum = 0x10000;
        } else {
            out.push_back(kReplacementCharacter);
            ++ptr;
            continue;
        }

        std::size_t consumed = 1;
        bool valid = true;
        while (consumed < length) {
            if (ptr + consumed >= end || !is_continuation(ptr[consumed])) {
                valid = false;
                break;
            }
            code = (code << 6) | (ptr[consumed] & 0x3F);
            ++consumed;
        }
        if (valid && (code < minimum || code > 0x10FFFF || in_range(code, 0xD800, 0xDFFF))) {
            valid = false;
        }
        out.push_back(valid ? code : kReplacementCharacter);
        ptr += consumed;
    }
    return out;
}

std::size_t count_code_points(std::string_view text) {
    std::size_t count = 0;
    for (char ch : text) {
        if (!is_continuation(static_cast<unsigned char>(ch))) {
            ++count;
        }
    }
    return count;
}

void append_utf8(char32_t code, std::string& out) {
    if (code > 0x10FFFF || in_range(code, 0xD800, 0xDFFF)) {
        code = kReplacementCharacter;
    }
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

std::string encode_utf8(std::u32string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : text) {
        append_utf8(cp, out);
    }
    return out;
}

bool is_whitespace(char32_t cp) noexcept {
    return cp == ' ' || in_range(cp, 0x09, 0x0D) || cp == 0x85 || cp == 0xA0 || cp == 0x1680
           || in_range(cp, 0x2000, 0x200A) || cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F
           || cp == 0x3000;
}

bool is_zero_width(char32_t cp) noexcept {
    return in_range(cp, 0x200B, 0x200D) || cp == 0x2060 || cp == 0xFEFF;
}

bool is_bidi_control(char32_t cp) noexcept {
    return cp == 0x061C || cp == 0x200E || cp == 0x200F || in_range(cp, 0x202A, 0x202E)
           || in_range(cp, 0x2066, 0x2069);
}

bool is_invisible(char32_t cp) noexcept {
    if (is_zero_width(cp) || is_bidi_control(cp)) {
        return true;
    }
    return cp == 0x00AD || cp == 0x034F || cp == 0x115F || cp == 0x1160 || cp == 0x17B4 || cp == 0x17B5
           || in_range(cp, 0x180B, 0x180F) || in_range(cp, 0x2061, 0x2064) || in_range(cp, 0x206A, 0x206F)
           || cp == 0x3164 || in_range(cp, 0xFE00, 0xFE0F) || cp == 0xFFA0 || in_range(cp, 0xFFF9, 0xFFFB)
           || in_range(cp, 0x1D173, 0x1D17A) || in_range(cp, 0xE0000, 0xE007F) || in_range(cp, 0xE0100, 0xE01EF);
}

bool is_combining_mark(char32_t cp) noexcept {
    return in_range(cp, 0x0300, 0x036F) || in_range(cp, 0x0483, 0x0489) || in_range(cp, 0x1AB0, 0x1AFF)
           || in_range(cp, 0x1DC0, 0x1DFF) || in_range(cp, 0x20D0, 0x20FF) || in_range(cp, 0xFE20, 0xFE2F);
}

bool is_ascii_digit(char32_t cp) noexcept {
    return cp >= '0' && cp <= '9';
}

bool is_name_letter(char32_t cp) noexcept {
    if (in_range(cp, 'a', 'z') || in_range(cp, 'A', 'Z')) {
        return true;
    }
    if (in_range(cp, 0x00C0, 0x00FF)) {
        return cp != 0x00D7 && cp != 0x00F7;
    }
    if (in_range(cp, 0x0100, 0x024F) || in_range(cp, 0x1E00, 0x1EFF)) {
        return true;
    }
    if (cp == 0x0386 || in_range(cp, 0x0388, 0x038A) || cp == 0x038C || in_range(cp, 0x038E, 0x03A1)
        || in_range(cp, 0x03A3, 0x03CE)) {
        return true;
    }
    return in_range(cp, 0x0400, 0x0481) || in_range(cp, 0x048A, 0x04FF);
}

Script script_of(char32_t cp) noexcept {
    if (in_range(cp, 'a', 'z') || in_range(cp, 'A', 'Z') || in_range(cp, 0x00C0, 0x024F)
        || in_range(cp, 0x1E00, 0x1EFF) || in_range(cp, 0xFF21, 0xFF3A) || in_range(cp, 0xFF41, 0xFF5A)) {
        return (cp == 0x00D7 || cp == 0x00F7) ? Script::Common : Script::Latin;
    }
    if (in_range(cp, 0x0370, 0x03FF) || in_range(cp, 0x1F00, 0x1FFF)) {
        return Script::Greek;
    }
    if (in_range(cp, 0x0400, 0x052F) || in_range(cp, 0x2DE0, 0x2DFF) || in_range(cp, 0xA640, 0xA69F)) {
        return Script::Cyrillic;
    }
    if (in_range(cp, 0x0530, 0x058F)) {
        return Script::Armenian;
    }
    if (in_range(cp, 0x0590, 0x05FF)) {
        return Script::Hebrew;
    }
    if (in_range(cp, 0x0600, 0x06FF) || in_range(cp, 0x0750, 0x077F)) {
        return Script::Arabic;
    }
    if (in_range(cp, 0x0900, 0x097F)) {
        return Script::Devanagari;
    }
    if (in_range(cp, 0x0E00, 0x0E7F)) {
        return Script::Thai;
    }
    if (in_range(cp, 0x1100, 0x11FF) || in_range(cp, 0xAC00, 0xD7AF)) {
        return Script::Hangul;
    }
    if (in_range(cp, 0x3040, 0x309F)) {
        return Script::Hiragana;
    }
    if (in_range(cp, 0x30A0, 0x30FF)) {
        return Script::Katakana;
    }
    if (in_range(cp, 0x4E00, 0x9FFF) || in_range(cp, 0x3400, 0x4DBF)) {
        return Script::Han;
    }
    if (cp < 0x0250 || is_whitespace(cp) || is_combining_mark(cp) || is_invisible(cp)
        || in_range(cp, 0x2000, 0x2BFF) || in_range(cp, 0x3000, 0x303F) || in_range(cp, 0xFF00, 0xFF20)) {
        return Script::Common;
    }
    return Script::Other;
}

const char* script_name(Script script) noexcept {
    switch (script) {
    case Script::Common: return "common";
    case Script::Latin: return "latin";
    case Script::Greek: return "greek";
    case Script::Cyrillic: return "cyrillic";
    case Script::Armenian: return "armenian";
    case Script::Hebrew: return "hebrew";
    case Script::Arabic: return "arabic";
    case Script::Devanagari: return "devanagari";
    case Script::Thai: return "thai";
    case Script::Hangul: return "hangul";
    case Script::Hiragana: return "hiragana";
    case Script::Katakana: return "katakana";
    case Script::Han: return "han";
    case Script::Other: return "other";
    }
    return "other";
}

char32_t fold_case(char32_t cp) noexcept {
    if (in_range(cp, 'A', 'Z')) {
        return cp + 0x20;
    }
    if (cp < 0x00C0) {
        return cp;
    }
    if (in_range(cp, 0x00C0, 0x00DE)) {
        return cp == 0x00D7 ? cp : cp + 0x20;
    }
    if (in_range(cp, 0x0100, 0x017F)) {
        if (cp == 0x0130) {
            return 'i';
        }
        if (cp == 0x0178) {
            return 0x00FF;
        }
        if (cp == 0x017F) {
            return 's';
        }
        // Ext-A alternates upper/lower pairs; the parity flips at U+0139 and U+0179.
        const bool odd_upper = in_range(cp, 0x0139, 0x0148) || in_range(cp, 0x0179, 0x017E);
        if (cp == 0x0131 || cp == 0x0138 || cp == 0x0149) {
            return cp;
        }
        const bool is_upper = odd_upper ? (cp % 2 == 1) : (cp % 2 == 0);
        return is_upper ? cp + 1 : cp;
    }
    if (in_range(cp, 0x0391, 0x03A9) && cp != 0x03A2) {
        return cp + 0x20;
    }
    switch (cp) {
    case 0x0386: return 0x03AC;
    case 0x0388: return 0x03AD;
    case 0x0389: return 0x03AE;
    case 0x038A: return 0x03AF;
    case 0x038C: return 0x03CC;
    case 0x038E: return 0x03CD;
    case 0x038F: return 0x03CE;
    case 0x03C2: return 0x03C3;
    default: break;
    }
    if (in_range(cp, 0x0410, 0x042F)) {
        return cp + 0x20;
    }
    if (in_range(cp, 0x0400, 0x040F)) {
        return cp + 0x50;
    }
    if (in_range(cp, 0x0460, 0x0481) || in_range(cp, 0x048A, 0x04BF) || in_range(cp, 0x04D0, 0x04FF)) {
        return cp % 2 == 0 ? cp + 1 : cp;
    }
    if (cp == 0x04C0) {
        return 0x04CF;
    }
    if (in_range(cp, 0x04C1, 0x04CE)) {
        return cp % 2 == 1 ? cp + 1 : cp;
    }
    return cp;
}

char32_t fold_fullwidth(char32_t cp) noexcept {
    if (in_range(cp, 0xFF01, 0xFF5E)) {
        return cp - 0xFEE0;
    }
    return cp == 0x3000 ? U' ' : cp;
}

char32_t strip_diacritic(char32_t cp) noexcept {
    char base = '?';
    if (in_range(cp, 0x00C0, 0x00FF)) {
        base = kLatin1Base[cp - 0x00C0];
    } else if (in_range(cp, 0x0100, 0x017F)) {
        base = kLatinExtendedABase[cp - 0x0100];
    }
    return base == '?' ? cp : static_cast<char32_t>(base);
}

char32_t fold_confusable(char32_t cp) noexcept {
    switch (cp) {
    case 0x0430: // а
    case 0x03B1: // α
    case 0x03AC: // ά
        return 'a';
    case 0x0432: // в
        return 'b';
    case 0x0441: // с
        return 'c';
    case 0x0435: // е
    case 0x0450: // ѐ
    case 0x0451: // ё
        return 'e';
    case 0x043D: // н
        return 'h';
    case 0x0456: // і
    case 0x0457: // ї
    case 0x03B9: // ι
    case 0x03AF: // ί
        return 'i';
    case 0x0458: // ј
        return 'j';
    case 0x043A: // к
    case 0x03BA: // κ
        return 'k';
    case 0x043C: // м
        return 'm';
    case 0x043E: // о
    case 0x03BF: // ο
    case 0x03CC: // ό
        return 'o';
    case 0x0440: // р
    case 0x03C1: // ρ
        return 'p';
    case 0x0455: // ѕ
        return 's';
    case 0x0442: // т
    case 0x03C4: // τ
        return 't';
    case 0x03BD: // ν
        return 'v';
    case 0x0445: // х
        return 'x';
    case 0x0443: // у
        return 'y';
    default:
        return cp;
    }
}

char32_t canonical_punctuation(char32_t cp) noexcept {
    switch (cp) {
    case 0x2018:
    case 0x2019:
    case 0x02BC:
    case 0xFF07:
        return '\'';
    case 0x2010:
    case 0x2011:
    case 0x2012:
    case 0x2013:
    case 0x2014:
    case 0x2212:
    case 0xFE63:
    case 0xFF0D:
        return '-';
    default:
        return cp;
    }
}

} // namespace storyguard
