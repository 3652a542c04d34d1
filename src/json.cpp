#include "storyguard/json.hpp"
#include "storyguard/unicode.hpp"

#include <iomanip>
#include <type_traits>

namespace storyguard {

namespace {

constexpr int kMaxDepth = 64;

unsigned read_hex4(std::string_view text, std::size_t& pos) {
    if (pos + 4 > text.size()) {
        throw JsonParseError("truncated unicode escape", pos);
    }
    unsigned code = 0;
    for (int i = 0; i < 4; ++i) {
        const char h = text[pos];
        code <<= 4;
        if (h >= '0' && h <= '9') {
            code |= static_cast<unsigned>(h - '0');
        } else if (h >= 'a' && h <= 'f') {
            code |= static_cast<unsigned>(h - 'a' + 10);
        } else if (h >= 'A' && h <= 'F') {
            code |= static_cast<unsigned>(h - 'A' + 10);
        } else {
            throw JsonParseError("invalid unicode escape", pos);
        }
        ++pos;
    }
    return code;
}

} // namespace

const Json* Json::find(const std::string& key) const {
    if (!is_object()) {
        return nullptr;
    }
    const auto& obj = as_object();
    const auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->second;
}

std::optional<std::string> string_member(const JsonObject& obj, const std::string& key) {
    if (auto it = obj.find(key); it != obj.end() && it->second.is_string()) {
        return it->second.as_string();
    }
    return std::nullopt;
}

void Json::dump_string(std::ostringstream& oss, const std::string& text) {
    oss << '"';
    for (char c : text) {
        switch (c) {
        case '"': oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\n': oss << "\\n"; break;
        case '\r': oss << "\\r"; break;
        case '\t': oss << "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec << std::setfill(' ');
            } else {
                oss << c;
            }
        }
    }
    oss << '"';
}

void Json::dump_internal(std::ostringstream& oss) const {
    std::visit(
        [&oss](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                oss << "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                oss << (value ? "true" : "false");
            } else if constexpr (std::is_same_v<T, double>) {
                oss << value;
            } else if constexpr (std::is_same_v<T, std::string>) {
                dump_string(oss, value);
            } else if constexpr (std::is_same_v<T, JsonArray>) {
                oss << '[';
                bool first = true;
                for (const auto& item : value) {
                    if (!first) {
                        oss << ',';
                    }
                    first = false;
                    item.dump_internal(oss);
                }
                oss << ']';
            } else if constexpr (std::is_same_v<T, JsonObject>) {
                oss << '{';
                bool first = true;
                for (const auto& [key, val] : value) {
                    if (!first) {
                        oss << ',';
                    }
                    first = false;
                    dump_string(oss, key);
                    oss << ':';
                    val.dump_internal(oss);
                }
                oss << '}';
            }
        },
        m_value);
}

void Json::skip_ws(std::string_view text, std::size_t& pos) {
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\n' || text[pos] == '\r')) {
        ++pos;
    }
}

Json Json::parse(std::string_view text) {
    std::size_t pos = 0;
    skip_ws(text, pos);
    Json value = parse_value(text, pos, 0);
    skip_ws(text, pos);
    if (pos != text.size()) {
        throw JsonParseError("unexpected trailing characters", pos);
    }
    return value;
}

Json Json::parse_value(std::string_view text, std::size_t& pos, int depth) {
    if (depth > kMaxDepth) {
        throw JsonParseError("nesting too deep", pos);
    }
    skip_ws(text, pos);
    if (pos >= text.size()) {
        throw JsonParseError("unexpected end of input", pos);
    }
    const char c = text[pos];
    if (c == '"') {
        return Json(parse_string(text, pos));
    }
    if (c == '[') {
        return parse_array(text, pos, depth + 1);
    }
    if (c == '{') {
        return parse_object(text, pos, depth + 1);
    }
    if ((c >= '0' && c <= '9') || c == '-') {
        return parse_number(text, pos);
    }
    if (text.substr(pos, 4) == "true") {
        pos += 4;
        return Json(true);
    }
    if (text.substr(pos, 5) == "false") {
        pos += 5;
        return Json(false);
    }
    if (text.substr(pos, 4) == "null") {
        pos += 4;
        return Json(nullptr);
    }
    throw JsonParseError("invalid token", pos);
}

Json Json::parse_number(std::string_view text, std::size_t& pos) {
    const std::size_t start = pos;
    ++pos;
    while (pos < text.size()) {
        const char ch = text[pos];
        if ((ch >= '0' && ch <= '9') || ch == '.' || ch == 'e' || ch == 'E' || ch == '+' || ch == '-') {
            ++pos;
        } else {
            break;
        }
    }
    const std::string literal(text.substr(start, pos - start));
    std::size_t consumed = 0;
    double number = 0.0;
    try {
        number = std::stod(literal, &consumed);
    } catch (const std::exception&) {
        throw JsonParseError("invalid number", start);
    }
    if (consumed != literal.size()) {
        throw JsonParseError("invalid number", start);
    }
    return Json(number);
}

std::string Json::parse_string(std::string_view text, std::size_t& pos) {
    if (pos >= text.size() || text[pos] != '"') {
        throw JsonParseError("expected string", pos);
    }
    ++pos;
    std::string result;
    while (true) {
        if (pos >= text.size()) {
            throw JsonParseError("unterminated string", pos);
        }
        const char c = text[pos++];
        if (c == '"') {
            break;
        }
        if (c != '\\') {
            result.push_back(c);
            continue;
        }
        if (pos >= text.size()) {
            throw JsonParseError("invalid escape", pos);
        }
        const char esc = text[pos++];
        switch (esc) {
        case '"': result.push_back('"'); break;
        case '\\': result.push_back('\\'); break;
        case '/': result.push_back('/'); break;
        case 'b': result.push_back('\b'); break;
        case 'f': result.push_back('\f'); break;
        case 'n': result.push_back('\n'); break;
        case 'r': result.push_back('\r'); break;
        case 't': result.push_back('\t'); break;
        case 'u': {
            char32_t code = read_hex4(text, pos);
            if (code >= 0xD800 && code <= 0xDBFF) {
                // High surrogate must be followed by an escaped low surrogate.
                if (pos + 2 > text.size() || text[pos] != '\\' || text[pos + 1] != 'u') {
                    throw JsonParseError("unpaired surrogate", pos);
                }
                pos += 2;
                const char32_t low = read_hex4(text, pos);
                if (low < 0xDC00 || low > 0xDFFF) {
                    throw JsonParseError("invalid low surrogate", pos);
                }
                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
            } else if (code >= 0xDC00 && code <= 0xDFFF) {
                throw JsonParseError("unpaired surrogate", pos);
            }
            append_utf8(code, result);
            break;
        }
        default:
            throw JsonParseError("invalid escape", pos - 1);
        }
    }
    return result;
}

Json Json::parse_array(std::string_view text, std::size_t& pos, int depth) {
    ++pos;
    JsonArray arr;
    skip_ws(text, pos);
    if (pos < text.size() && text[pos] == ']') {
        ++pos;
        return Json(std::move(arr));
    }
    while (true) {
        arr.emplace_back(parse_value(text, pos, depth));
        skip_ws(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == ']') {
            ++pos;
            break;
        }
        throw JsonParseError("expected comma or closing bracket", pos);
    }
    return Json(std::move(arr));
}

Json Json::parse_object(std::string_view text, std::size_t& pos, int depth) {
    ++pos;
    JsonObject obj;
    skip_ws(text, pos);
    if (pos < text.size() && text[pos] == '}') {
        ++pos;
        return Json(std::move(obj));
    }
    while (true) {
        skip_ws(text, pos);
        std::string key = parse_string(text, pos);
        skip_ws(text, pos);
        if (pos >= text.size() || text[pos] != ':') {
            throw JsonParseError("expected colon", pos);
        }
        ++pos;
        obj.insert_or_assign(std::move(key), parse_value(text, pos, depth));
        skip_ws(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == '}') {
            ++pos;
            break;
        }
        throw JsonParseError("expected comma or closing brace", pos);
    }
    return Json(std::move(obj));
}

} // namespace storyguard
