#pragma once

#include "result.hpp"
#include "value.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace apicat::serde {

constexpr int kMaxNestingDepth = 512;

inline std::string_view trim_view(std::string_view sv) noexcept {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

struct json_cursor {
    const char* ptr;
    const char* end;
    const char* start; // Track start for position calculation

    json_cursor(const char* p, const char* e) : ptr(p), end(e), start(p) {}

    bool eof() const noexcept { return ptr >= end; }

    size_t pos() const noexcept { return static_cast<size_t>(ptr - start); }

    void skip_ws() noexcept {
        while (!eof() && std::isspace(static_cast<unsigned char>(*ptr))) {
            ++ptr;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (eof() || *ptr != c) {
            return false;
        }
        ++ptr;
        return true;
    }

    bool consume_literal(std::string_view lit) noexcept {
        skip_ws();
        if (static_cast<size_t>(end - ptr) < lit.size() ||
            std::string_view(ptr, lit.size()) != lit) {
            return false;
        }
        ptr += lit.size();
        return true;
    }

    // Raw string body between quotes, escapes left untouched.
    std::optional<std::string_view> string() noexcept {
        skip_ws();
        if (eof() || *ptr != '\"') {
            return std::nullopt;
        }
        ++ptr;
        const char* str_start = ptr;
        while (!eof() && *ptr != '\"') {
            if (*ptr == '\\' && (ptr + 1) < end) {
                ptr += 2;
                continue;
            }
            ++ptr;
        }
        if (eof()) {
            return std::nullopt;
        }
        const char* stop = ptr;
        ++ptr; // consume closing quote
        return std::string_view(str_start, static_cast<size_t>(stop - str_start));
    }

    bool try_object_start() noexcept { return consume('{'); }
    bool try_object_end() noexcept { return consume('}'); }
    bool try_array_start() noexcept { return consume('['); }
    bool try_array_end() noexcept { return consume(']'); }
    bool try_comma() noexcept { return consume(','); }
};

inline void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline std::optional<uint32_t> parse_hex4(std::string_view sv) noexcept {
    if (sv.size() < 4) {
        return std::nullopt;
    }
    uint32_t cp = 0;
    auto fc = std::from_chars(sv.data(), sv.data() + 4, cp, 16);
    if (fc.ec != std::errc() || fc.ptr != sv.data() + 4) {
        return std::nullopt;
    }
    return cp;
}

inline std::optional<std::string> unescape_json_string(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (++i >= raw.size()) {
            return std::nullopt;
        }
        switch (raw[i]) {
        case '\"':
            out.push_back('\"');
            break;
        case '\\':
            out.push_back('\\');
            break;
        case '/':
            out.push_back('/');
            break;
        case 'b':
            out.push_back('\b');
            break;
        case 'f':
            out.push_back('\f');
            break;
        case 'n':
            out.push_back('\n');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'u': {
            auto cp = parse_hex4(raw.substr(i + 1));
            if (!cp) {
                return std::nullopt;
            }
            i += 4;
            if (*cp >= 0xD800 && *cp <= 0xDBFF && i + 6 < raw.size() &&
                raw.substr(i + 1, 2) == "\\u") {
                if (auto low = parse_hex4(raw.substr(i + 3)); low && *low >= 0xDC00 && *low <= 0xDFFF) {
                    *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                    i += 6;
                }
            }
            append_utf8(out, *cp);
            break;
        }
        default:
            return std::nullopt;
        }
    }
    return out;
}

inline std::string escape_json_string(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '\"':
            out += "\\\"";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                constexpr char kHex[] = "0123456789abcdef";
                out += "\\u00";
                out.push_back(kHex[(c >> 4) & 0x0F]);
                out.push_back(kHex[c & 0x0F]);
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// JSON

inline void set_json_error(diagnostic* diag, const json_cursor& cur, std::string_view message) {
    set_diagnostic(diag, "offset " + std::to_string(cur.pos()), message);
}

inline std::optional<value> parse_json_value(json_cursor& cur, int depth, diagnostic* diag);

inline std::optional<value> parse_json_object(json_cursor& cur, int depth, diagnostic* diag) {
    // precondition: '{' consumed
    value obj = value::object_node();
    if (cur.try_object_end()) {
        return obj;
    }
    while (true) {
        auto raw_key = cur.string();
        if (!raw_key) {
            set_json_error(diag, cur, "expected object key");
            return std::nullopt;
        }
        auto key = unescape_json_string(*raw_key);
        if (!key) {
            set_json_error(diag, cur, "invalid escape in object key");
            return std::nullopt;
        }
        if (!cur.consume(':')) {
            set_json_error(diag, cur, "expected ':' after object key");
            return std::nullopt;
        }
        auto child = parse_json_value(cur, depth + 1, diag);
        if (!child) {
            return std::nullopt;
        }
        obj.set(std::move(*key), std::move(*child));
        if (cur.try_comma()) {
            continue;
        }
        if (cur.try_object_end()) {
            return obj;
        }
        set_json_error(diag, cur, "expected ',' or '}'");
        return std::nullopt;
    }
}

inline std::optional<value> parse_json_array(json_cursor& cur, int depth, diagnostic* diag) {
    // precondition: '[' consumed
    value arr = value::array_node();
    if (cur.try_array_end()) {
        return arr;
    }
    while (true) {
        auto item = parse_json_value(cur, depth + 1, diag);
        if (!item) {
            return std::nullopt;
        }
        arr.array.push_back(std::move(*item));
        if (cur.try_comma()) {
            continue;
        }
        if (cur.try_array_end()) {
            return arr;
        }
        set_json_error(diag, cur, "expected ',' or ']'");
        return std::nullopt;
    }
}

inline std::optional<value> parse_json_number(json_cursor& cur, diagnostic* diag) {
    const char* p = cur.ptr;
    while (p < cur.end && (std::isdigit(static_cast<unsigned char>(*p)) || *p == '-' ||
                           *p == '+' || *p == '.' || *p == 'e' || *p == 'E')) {
        ++p;
    }
    double d = 0.0;
    auto fc = std::from_chars(cur.ptr, p, d);
    if (fc.ec != std::errc() || fc.ptr != p || p == cur.ptr) {
        set_json_error(diag, cur, "invalid number");
        return std::nullopt;
    }
    cur.ptr = p;
    return value::number_node(d);
}

inline std::optional<value> parse_json_value(json_cursor& cur, int depth, diagnostic* diag) {
    if (depth > kMaxNestingDepth) {
        set_json_error(diag, cur, "nesting too deep");
        return std::nullopt;
    }
    cur.skip_ws();
    if (cur.eof()) {
        set_json_error(diag, cur, "unexpected end of input");
        return std::nullopt;
    }
    if (cur.try_object_start()) {
        return parse_json_object(cur, depth, diag);
    }
    if (cur.try_array_start()) {
        return parse_json_array(cur, depth, diag);
    }
    if (*cur.ptr == '\"') {
        auto raw = cur.string();
        if (!raw) {
            set_json_error(diag, cur, "unterminated string");
            return std::nullopt;
        }
        auto text = unescape_json_string(*raw);
        if (!text) {
            set_json_error(diag, cur, "invalid escape sequence");
            return std::nullopt;
        }
        return value::string_node(std::move(*text));
    }
    if (cur.consume_literal("true")) {
        return value::bool_node(true);
    }
    if (cur.consume_literal("false")) {
        return value::bool_node(false);
    }
    if (cur.consume_literal("null")) {
        return value::null_node();
    }
    return parse_json_number(cur, diag);
}

inline std::optional<value> decode_json(std::string_view text, diagnostic* diag = nullptr) {
    json_cursor cur{text.data(), text.data() + text.size()};
    auto root = parse_json_value(cur, 0, diag);
    if (!root) {
        return std::nullopt;
    }
    cur.skip_ws();
    if (!cur.eof()) {
        set_json_error(diag, cur, "trailing characters after document");
        return std::nullopt;
    }
    return root;
}

// ---------------------------------------------------------------------------
// YAML (block subset used by API descriptions)

struct yaml_line {
    int indent;
    std::string_view content;
    size_t line_no;
};

inline void set_yaml_error(diagnostic* diag, size_t line, std::string_view message) {
    set_diagnostic(diag, "line " + std::to_string(line == 0 ? 1 : line), message);
}

inline std::vector<yaml_line> tokenize_yaml(std::string_view text) {
    std::vector<yaml_line> lines;
    size_t pos = 0;
    size_t line_no = 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(pos, end - pos);
        pos = end + 1;
        ++line_no;
        if (line.empty()) {
            continue;
        }
        int indent = 0;
        for (char c : line) {
            if (c == ' ') {
                ++indent;
            } else {
                break;
            }
        }
        std::string_view content = line.substr(static_cast<size_t>(indent));
        content = trim_view(content);
        if (content.empty() || content.front() == '#' || content == "---" || content == "...") {
            continue;
        }
        lines.push_back({indent, content, line_no});
    }
    return lines;
}

inline bool is_quoted(std::string_view sv) noexcept {
    return sv.size() >= 2 && ((sv.front() == '\"' && sv.back() == '\"') ||
                              (sv.front() == '\'' && sv.back() == '\''));
}

inline std::string normalize_key(std::string_view key) {
    auto trimmed = trim_view(key);
    if (is_quoted(trimmed)) {
        trimmed = trimmed.substr(1, trimmed.size() - 2);
    }
    return std::string(trimmed);
}

// Position of the ':' separating key and value (followed by a space or the end
// of line, outside quotes), or npos.
inline size_t find_mapping_colon(std::string_view content) noexcept {
    bool in_single = false;
    bool in_double = false;
    int depth = 0;
    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (c == '\'' && !in_double) {
            in_single = !in_single;
        } else if (c == '\"' && !in_single) {
            in_double = !in_double;
        } else if (!in_single && !in_double) {
            if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                --depth;
            } else if (c == ':' && depth == 0 &&
                       (i + 1 == content.size() || content[i + 1] == ' ')) {
                return i;
            }
        }
    }
    return std::string_view::npos;
}

inline std::string_view strip_comment(std::string_view sv) noexcept {
    if (sv.empty() || sv.front() == '\"' || sv.front() == '\'') {
        return sv;
    }
    auto hash = sv.find(" #");
    if (hash != std::string_view::npos) {
        sv = sv.substr(0, hash);
    }
    return trim_view(sv);
}

inline value yaml_scalar(std::string_view raw) {
    auto sv = strip_comment(trim_view(raw));
    if (is_quoted(sv)) {
        auto inner = sv.substr(1, sv.size() - 2);
        if (sv.front() == '\"') {
            if (auto text = unescape_json_string(inner)) {
                return value::string_node(std::move(*text));
            }
        }
        std::string out;
        for (size_t i = 0; i < inner.size(); ++i) {
            out.push_back(inner[i]);
            if (sv.front() == '\'' && inner[i] == '\'' && i + 1 < inner.size() &&
                inner[i + 1] == '\'') {
                ++i;
            }
        }
        return value::string_node(std::move(out));
    }
    if (sv == "true" || sv == "True" || sv == "TRUE") {
        return value::bool_node(true);
    }
    if (sv == "false" || sv == "False" || sv == "FALSE") {
        return value::bool_node(false);
    }
    if (sv.empty() || sv == "null" || sv == "Null" || sv == "NULL" || sv == "~") {
        return value::null_node();
    }
    double d = 0.0;
    auto fc = std::from_chars(sv.data(), sv.data() + sv.size(), d);
    if (fc.ec == std::errc() && fc.ptr == sv.data() + sv.size()) {
        return value::number_node(d);
    }
    return value::string_node(std::string(sv));
}

inline std::vector<std::string_view> split_top_level(std::string_view input,
                                                     char delimiter = ',') noexcept {
    std::vector<std::string_view> parts;
    size_t start = 0;
    int depth = 0;
    bool in_single = false;
    bool in_double = false;

    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '\'' && !in_double) {
            in_single = !in_single;
        } else if (c == '\"' && !in_single) {
            in_double = !in_double;
        } else if (!in_single && !in_double) {
            if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                --depth;
            } else if (c == delimiter && depth == 0) {
                parts.push_back(trim_view(input.substr(start, i - start)));
                start = i + 1;
            }
        }
    }

    auto tail = trim_view(input.substr(start));
    if (!tail.empty()) {
        parts.push_back(tail);
    }
    return parts;
}

inline value parse_yaml_block(const std::vector<yaml_line>& lines,
                              size_t& idx,
                              int indent,
                              int depth,
                              diagnostic* diag);

inline value parse_inline_map(std::string_view text, diagnostic* diag, size_t line_no);
inline value parse_inline_sequence(std::string_view text, diagnostic* diag, size_t line_no);

inline value parse_inline_value(std::string_view text, diagnostic* diag, size_t line_no) {
    auto trimmed = trim_view(text);
    if (trimmed.size() >= 2 && trimmed.front() == '{' && trimmed.back() == '}') {
        return parse_inline_map(trimmed, diag, line_no);
    }
    if (trimmed.size() >= 2 && trimmed.front() == '[' && trimmed.back() == ']') {
        return parse_inline_sequence(trimmed, diag, line_no);
    }
    return yaml_scalar(trimmed);
}

inline value parse_inline_map(std::string_view text, diagnostic* diag, size_t line_no) {
    value obj = value::object_node();
    auto inner = trim_view(text.substr(1, text.size() - 2));
    std::unordered_set<std::string> seen;
    for (auto part : split_top_level(inner)) {
        if (part.empty()) {
            continue;
        }
        auto colon = find_mapping_colon(part);
        if (colon == std::string_view::npos) {
            colon = part.find(':');
        }
        if (colon == std::string_view::npos) {
            continue;
        }
        auto key = normalize_key(part.substr(0, colon));
        auto val = trim_view(part.substr(colon + 1));
        if (seen.contains(key)) {
            set_yaml_error(diag, line_no, "duplicate key '" + key + "' in inline map");
        }
        seen.insert(key);
        obj.set(std::move(key), parse_inline_value(val, diag, line_no));
    }
    return obj;
}

inline value parse_inline_sequence(std::string_view text, diagnostic* diag, size_t line_no) {
    value arr = value::array_node();
    auto inner = trim_view(text.substr(1, text.size() - 2));
    for (auto part : split_top_level(inner)) {
        if (part.empty()) {
            continue;
        }
        arr.array.push_back(parse_inline_value(part, diag, line_no));
    }
    return arr;
}

inline bool is_block_scalar_indicator(std::string_view sv) noexcept {
    return sv == "|" || sv == "|-" || sv == "|+" || sv == ">" || sv == ">-" || sv == ">+";
}

inline value parse_block_scalar(std::string_view indicator,
                                const std::vector<yaml_line>& lines,
                                size_t& idx,
                                int indent) {
    const bool folded = indicator.front() == '>';
    std::string text;
    while (idx < lines.size() && lines[idx].indent > indent) {
        if (!text.empty()) {
            text.push_back(folded ? ' ' : '\n');
        }
        text.append(lines[idx].content);
        ++idx;
    }
    if (indicator.size() == 1 || indicator[1] == '+') {
        text.push_back('\n');
    }
    return value::string_node(std::move(text));
}

inline value parse_yaml_value(std::string_view raw,
                              const std::vector<yaml_line>& lines,
                              size_t& idx,
                              int indent,
                              int depth,
                              diagnostic* diag,
                              size_t line_no) {
    auto trimmed = strip_comment(trim_view(raw));
    if (trimmed.empty()) {
        if (idx < lines.size() && lines[idx].indent > indent) {
            return parse_yaml_block(lines, idx, lines[idx].indent, depth + 1, diag);
        }
        // "key:" followed by a sequence at the same indentation
        if (idx < lines.size() && lines[idx].indent == indent &&
            lines[idx].content.starts_with("- ")) {
            return parse_yaml_block(lines, idx, indent, depth + 1, diag);
        }
        return value::null_node();
    }
    if (is_block_scalar_indicator(trimmed)) {
        return parse_block_scalar(trimmed, lines, idx, indent);
    }
    if ((trimmed.front() == '{' && trimmed.back() == '}') ||
        (trimmed.front() == '[' && trimmed.back() == ']')) {
        return parse_inline_value(trimmed, diag, line_no);
    }
    if (idx < lines.size() && lines[idx].indent > indent) {
        // plain or quoted scalar wrapped over several lines
        std::string text(trim_view(raw));
        while (idx < lines.size() && lines[idx].indent > indent) {
            text.push_back(' ');
            text.append(lines[idx].content);
            ++idx;
        }
        return yaml_scalar(text);
    }
    return yaml_scalar(trimmed);
}

inline value parse_yaml_block(const std::vector<yaml_line>& lines,
                              size_t& idx,
                              int indent,
                              int depth,
                              diagnostic* diag) {
    value node = value::object_node();
    if (depth > kMaxNestingDepth) {
        set_yaml_error(diag, idx < lines.size() ? lines[idx].line_no : 0, "nesting too deep");
        idx = lines.size();
        return node;
    }
    bool started = false;
    std::unordered_set<std::string> seen_keys;

    while (idx < lines.size()) {
        const auto& ln = lines[idx];
        if (ln.indent < indent) {
            break;
        }
        if (ln.indent > indent) {
            set_yaml_error(diag, ln.line_no, "unexpected indentation");
            ++idx;
            continue;
        }

        std::string_view content = ln.content;
        const bool is_item = content == "-" || content.starts_with("- ");
        if (started && is_item != node.is_array()) {
            break;
        }

        if (is_item) {
            if (!started) {
                node = value::array_node();
                started = true;
            }

            std::string_view item = content.size() > 1 ? trim_view(content.substr(2)) : "";
            size_t line_no = ln.line_no;
            // Column of the item body: nested keys of a "- key: v" item align with it.
            int item_indent = indent + static_cast<int>(content.size() - item.size());
            ++idx;

            if (item.empty()) {
                if (idx < lines.size() && lines[idx].indent > indent) {
                    node.array.push_back(
                        parse_yaml_block(lines, idx, lines[idx].indent, depth + 1, diag));
                } else {
                    node.array.push_back(value::null_node());
                }
                continue;
            }

            auto colon_pos = find_mapping_colon(item);
            if (colon_pos != std::string_view::npos && item.front() != '{' &&
                item.front() != '[') {
                value obj = value::object_node();
                std::string key = normalize_key(item.substr(0, colon_pos));
                std::string_view val = item.substr(colon_pos + 1);
                obj.set(std::move(key),
                        parse_yaml_value(val, lines, idx, item_indent, depth + 1, diag, line_no));
                if (idx < lines.size() && lines[idx].indent > indent) {
                    value extra =
                        parse_yaml_block(lines, idx, lines[idx].indent, depth + 1, diag);
                    if (extra.is_object()) {
                        for (auto& m : extra.object) {
                            if (obj.contains(m.key)) {
                                set_yaml_error(
                                    diag, line_no, "duplicate key '" + m.key + "' in sequence item");
                            }
                            obj.set(std::move(m.key), std::move(m.val));
                        }
                    }
                }
                node.array.push_back(std::move(obj));
            } else {
                node.array.push_back(
                    parse_yaml_value(item, lines, idx, item_indent, depth + 1, diag, line_no));
            }
        } else {
            auto colon_pos = find_mapping_colon(content);
            if (colon_pos == std::string_view::npos) {
                set_yaml_error(diag, ln.line_no, "expected 'key: value'");
                ++idx;
                continue;
            }
            started = true;
            std::string key = normalize_key(content.substr(0, colon_pos));
            std::string_view val = content.substr(colon_pos + 1);
            size_t line_no = ln.line_no;
            ++idx;

            value child = parse_yaml_value(val, lines, idx, indent, depth, diag, line_no);
            if (seen_keys.contains(key)) {
                set_yaml_error(diag, line_no, "duplicate key '" + key + "'");
            }
            seen_keys.insert(key);
            node.set(std::move(key), std::move(child));
        }
    }

    return node;
}

inline std::optional<value> decode_yaml(std::string_view text, diagnostic* diag = nullptr) {
    auto lines = tokenize_yaml(text);
    if (lines.empty()) {
        set_yaml_error(diag, 0, "empty document");
        return std::nullopt;
    }
    size_t idx = 0;
    diagnostic local;
    value root = parse_yaml_block(lines, idx, lines.front().indent, 0, &local);
    if (local.message.empty() && idx < lines.size()) {
        set_yaml_error(&local, lines[idx].line_no, "content outside the root block");
    }
    if (!local.message.empty()) {
        set_diagnostic(diag, local.location, local.message);
        return std::nullopt;
    }
    return root;
}

} // namespace apicat::serde
