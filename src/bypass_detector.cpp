#include "storyguard/bypass_detector.hpp"
#include "storyguard/unicode.hpp"

namespace storyguard {

namespace {

// Calls `visit(begin, end)` for every whitespace-separated token.
template <typename Visitor>
bool any_token(std::u32string_view text, Visitor visit) {
    std::size_t start = 0;
    while (start < text.size()) {
        while (start < text.size() && is_whitespace(text[start])) {
            ++start;
        }
        std::size_t end = start;
        while (end < text.size() && !is_whitespace(text[end])) {
            ++end;
        }
        if (end > start && visit(text.substr(start, end - start))) {
            return true;
        }
        start = end;
    }
    return false;
}

} // namespace

BypassDetector::BypassDetector(SharedConfig config) : m_config(std::move(config)) {
    if (!m_config) {
        throw ConfigurationError("configuration: bypass detector requires a configuration");
    }
}

std::set<BypassFlag> BypassDetector::detect(std::string_view raw, const NormalizedText& text) const {
    std::set<BypassFlag> flags;
    const std::u32string raw_points = decode_utf8(raw);
    const std::u32string display = decode_utf8(text.display);
    const std::u32string detection = decode_utf8(text.detection);

    if (has_repetition(raw_points) || has_repetition(detection)) {
        flags.insert(BypassFlag::Repetition);
    }
    if (has_mixed_script_token(display)) {
        flags.insert(BypassFlag::MixedScript);
    }
    if (has_invisible(raw_points)) {
        flags.insert(BypassFlag::InvisibleCharacters);
    }
    if (has_numeric_token(display)) {
        flags.insert(BypassFlag::AllNumeric);
    }
    if (has_stacked_marks(raw_points)) {
        flags.insert(BypassFlag::StackedMarks);
    }
    return flags;
}

bool BypassDetector::has_repetition(std::u32string_view text) const {
    const std::size_t threshold = m_config->limits.repeat_run_threshold;
    std::size_t run = 0;
    char32_t previous = 0;
    for (char32_t cp : text) {
        if (is_whitespace(cp)) {
            run = 0;
            continue;
        }
        run = (run > 0 && cp == previous) ? run + 1 : 1;
        previous = cp;
        if (run >= threshold) {
            return true;
        }
    }
    return false;
}

bool BypassDetector::has_mixed_script_token(std::u32string_view text) {
    return any_token(text, [](std::u32string_view token) {
        bool seen = false;
        Script first = Script::Common;
        for (char32_t cp : token) {
            const Script script = script_of(cp);
            if (script == Script::Common) {
                continue;
            }
            if (!seen) {
                first = script;
                seen = true;
            } else if (script != first) {
                return true;
            }
        }
        return false;
    });
}

bool BypassDetector::has_invisible(std::u32string_view text) {
    for (char32_t cp : text) {
        if (is_invisible(cp)) {
            return true;
        }
    }
    return false;
}

bool BypassDetector::has_numeric_token(std::u32string_view text) {
    return any_token(text, [](std::u32string_view token) {
        for (char32_t cp : token) {
            if (!is_ascii_digit(fold_fullwidth(cp))) {
                return false;
            }
        }
        return true;
    });
}

bool BypassDetector::has_stacked_marks(std::u32string_view text) {
    std::size_t run = 0;
    for (char32_t cp : text) {
        run = is_combining_mark(cp) ? run + 1 : 0;
        if (run > kMaxMarksPerBase) {
            return true;
        }
    }
    return false;
}

const char* to_string(BypassFlag flag) noexcept {
    switch (flag) {
    case BypassFlag::Repetition: return "bypass.repetition";
    case BypassFlag::MixedScript: return "bypass.mixed_script";
    case BypassFlag::InvisibleCharacters: return "bypass.invisible_characters";
    case BypassFlag::AllNumeric: return "bypass.all_numeric";
    case BypassFlag::StackedMarks: return "bypass.stacked_marks";
    }
    return "bypass.unknown";
}

} // namespace storyguard
