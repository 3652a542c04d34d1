#include "storyguard/text_normalizer.hpp"
#include "storyguard/unicode.hpp"

namespace storyguard {

namespace {

// Appends `cp`, turning any whitespace into a single pending separator that
// is only written once a following non-space code point arrives.
class CollapsingWriter {
public:
    explicit CollapsingWriter(std::size_t reserve) { m_out.reserve(reserve); }

    void put(char32_t cp) {
        if (is_whitespace(cp)) {
            m_pending_space = !m_out.empty();
            return;
        }
        if (m_pending_space) {
            m_out.push_back(' ');
            m_pending_space = false;
        }
        append_utf8(cp, m_out);
    }

    std::string take() { return std::move(m_out); }

private:
    std::string m_out;
    bool m_pending_space = false;
};

} // namespace

char32_t TextNormalizer::substitute(char32_t cp) noexcept {
    switch (cp) {
    case '4':
    case '@':
        return 'a';
    case '8':
        return 'b';
    case '3':
        return 'e';
    case '9':
        return 'g';
    case '1':
    case '!':
    case '|':
        return 'i';
    case '0':
        return 'o';
    case '5':
    case '$':
        return 's';
    case '7':
    case '+':
        return 't';
    case '2':
        return 'z';
    default:
        return cp;
    }
}

std::string TextNormalizer::normalize(std::string_view raw) const {
    CollapsingWriter writer(raw.size());
    for (char32_t cp : decode_utf8(raw)) {
        if (is_invisible(cp) || is_combining_mark(cp)) {
            continue;
        }
        cp = fold_fullwidth(cp);
        cp = fold_case(cp);
        cp = fold_confusable(cp);
        cp = strip_diacritic(cp);
        cp = canonical_punctuation(cp);
        cp = substitute(cp);
        writer.put(cp);
    }
    return writer.take();
}

std::string TextNormalizer::clean(std::string_view raw) const {
    CollapsingWriter writer(raw.size());
    for (char32_t cp : decode_utf8(raw)) {
        if (is_invisible(cp) || is_combining_mark(cp)) {
            continue;
        }
        writer.put(canonical_punctuation(cp));
    }
    return writer.take();
}

std::string TextNormalizer::compact(std::string_view detection) {
    std::string out;
    out.reserve(detection.size());
    for (char ch : detection) {
        if (ch != ' ' && ch != '-' && ch != '\'') {
            out.push_back(ch);
        }
    }
    return out;
}

NormalizedText TextNormalizer::project(std::string_view raw) const {
    NormalizedText text;
    text.display = clean(raw);
    text.detection = normalize(raw);
    text.compact = compact(text.detection);
    return text;
}

} // namespace storyguard
