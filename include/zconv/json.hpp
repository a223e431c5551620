#pragma once
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace zconv {

// ---------------------------------------------------------------------------
// JSON value types
// ---------------------------------------------------------------------------

struct JsonValue;
/// Key-ordered object. Lookups accept std::string_view without allocating.
using JsonObject = std::map<std::string, JsonValue, std::less<>>;
using JsonArray  = std::vector<JsonValue>;

struct JsonValue {
    std::variant<
        std::nullptr_t,
        bool,
        double,
        std::string,
        JsonArray,
        JsonObject
    > data = nullptr;

    JsonValue() = default;
    JsonValue(std::nullptr_t)        : data(nullptr) {}
    JsonValue(bool v)                : data(v) {}
    JsonValue(double v)              : data(v) {}
    JsonValue(int v)                 : data(static_cast<double>(v)) {}
    JsonValue(std::int64_t v)        : data(static_cast<double>(v)) {}
    JsonValue(std::uint64_t v)       : data(static_cast<double>(v)) {}
    JsonValue(const char* v)         : data(std::string(v)) {}
    JsonValue(std::string v)         : data(std::move(v)) {}
    JsonValue(std::string_view v)    : data(std::string(v)) {}
    JsonValue(JsonArray v)           : data(std::move(v)) {}
    JsonValue(JsonObject v)          : data(std::move(v)) {}

    [[nodiscard]] bool is_null()   const noexcept { return std::holds_alternative<std::nullptr_t>(data); }
    [[nodiscard]] bool is_bool()   const noexcept { return std::holds_alternative<bool>(data); }
    [[nodiscard]] bool is_number() const noexcept { return std::holds_alternative<double>(data); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(data); }
    [[nodiscard]] bool is_array()  const noexcept { return std::holds_alternative<JsonArray>(data); }
    [[nodiscard]] bool is_object() const noexcept { return std::holds_alternative<JsonObject>(data); }

    // Accessors throw std::bad_variant_access on the wrong alternative.
    [[nodiscard]] bool               as_bool()   const { return std::get<bool>(data); }
    [[nodiscard]] double             as_number() const { return std::get<double>(data); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data); }
    [[nodiscard]] const JsonArray&   as_array()  const { return std::get<JsonArray>(data); }
    [[nodiscard]] const JsonObject&  as_object() const { return std::get<JsonObject>(data); }

    [[nodiscard]] std::string& as_string() { return std::get<std::string>(data); }
    [[nodiscard]] JsonArray&   as_array()  { return std::get<JsonArray>(data); }
    [[nodiscard]] JsonObject&  as_object() { return std::get<JsonObject>(data); }

    template <typename T = std::int64_t>
    [[nodiscard]] T as_int() const { return static_cast<T>(as_number()); }

    /// True if this is a number with no fractional part.
    [[nodiscard]] bool is_integral() const noexcept {
        if (!is_number()) return false;
        double d = std::get<double>(data);
        return std::isfinite(d) && d == std::trunc(d);
    }

    /// Pointer to the value under key, or nullptr if absent / not an object.
    [[nodiscard]] const JsonValue* find(std::string_view key) const noexcept {
        if (!is_object()) return nullptr;
        const auto& obj = std::get<JsonObject>(data);
        auto it = obj.find(key);
        return it == obj.end() ? nullptr : &it->second;
    }

    [[nodiscard]] const JsonValue& get(std::string_view key, const JsonValue& fallback) const noexcept {
        if (auto* p = find(key)) return *p;
        return fallback;
    }

    /// Number of elements (array) or entries (object); 0 otherwise.
    [[nodiscard]] std::size_t size() const noexcept {
        if (is_array())  return as_array().size();
        if (is_object()) return as_object().size();
        return 0;
    }

    [[nodiscard]] bool empty() const noexcept {
        if (is_null()) return true;
        return size() == 0;
    }

    friend bool operator==(const JsonValue& a, const JsonValue& b) {
        return a.data == b.data;
    }
};

[[nodiscard]] inline std::string_view json_type_name(const JsonValue& v) noexcept {
    if (v.is_null())   return "null";
    if (v.is_bool())   return "boolean";
    if (v.is_number()) return "number";
    if (v.is_string()) return "string";
    if (v.is_array())  return "array";
    return "object";
}

// ---------------------------------------------------------------------------
// JSON parser (strict recursive descent)
// ---------------------------------------------------------------------------

namespace json_detail {

[[noreturn]] inline void fail(std::string_view what) {
    throw std::runtime_error("json: " + std::string(what));
}

inline void skip_ws(std::string_view& s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' ||
                          s.front() == '\n' || s.front() == '\r'))
        s.remove_prefix(1);
}

inline void expect(std::string_view& s, char c) {
    skip_ws(s);
    if (s.empty() || s.front() != c) fail(std::string("expected '") + c + "'");
    s.remove_prefix(1);
}

inline unsigned parse_hex4(std::string_view& s) {
    if (s.size() < 4) fail("incomplete \\u escape");
    unsigned cp = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        char c = s[i];
        cp <<= 4;
        if (c >= '0' && c <= '9')      cp |= static_cast<unsigned>(c - '0');
        else if (c >= 'a' && c <= 'f') cp |= static_cast<unsigned>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') cp |= static_cast<unsigned>(c - 'A' + 10);
        else fail("invalid \\u hex digit");
    }
    s.remove_prefix(4);
    return cp;
}

inline void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

inline std::string parse_string(std::string_view& s) {
    expect(s, '"');
    std::string out;
    while (!s.empty() && s.front() != '"') {
        char c = s.front();
        s.remove_prefix(1);
        if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
        if (c != '\\') {
            out += c;
            continue;
        }
        if (s.empty()) fail("unexpected end of string escape");
        char e = s.front();
        s.remove_prefix(1);
        switch (e) {
            case '"':  out += '"';  break;
            case '\\': out += '\\'; break;
            case '/':  out += '/';  break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u': {
                unsigned cp = parse_hex4(s);
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (s.size() < 2 || s[0] != '\\' || s[1] != 'u')
                        fail("unpaired surrogate");
                    s.remove_prefix(2);
                    unsigned lo = parse_hex4(s);
                    if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    fail("unpaired surrogate");
                }
                append_utf8(out, cp);
                break;
            }
            default: fail("invalid escape");
        }
    }
    if (s.empty()) fail("unterminated string");
    s.remove_prefix(1);
    return out;
}

inline double parse_number(std::string_view& s) {
    std::size_t len = 0;
    if (!s.empty() && s[0] == '-') ++len;
    while (len < s.size() && ((s[len] >= '0' && s[len] <= '9') ||
           s[len] == '.' || s[len] == 'e' || s[len] == 'E' ||
           ((s[len] == '+' || s[len] == '-') && len > 0 && (s[len - 1] == 'e' || s[len - 1] == 'E'))))
        ++len;
    double val = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + len, val);
    if (ec != std::errc{} || ptr != s.data() + len)
        fail("bad number");
    s.remove_prefix(len);
    return val;
}

inline JsonValue parse_value(std::string_view& s, int depth);

inline JsonObject parse_object(std::string_view& s, int depth) {
    expect(s, '{');
    JsonObject obj;
    skip_ws(s);
    if (!s.empty() && s.front() == '}') {
        s.remove_prefix(1);
        return obj;
    }
    for (;;) {
        skip_ws(s);
        auto key = parse_string(s);
        expect(s, ':');
        obj.insert_or_assign(std::move(key), parse_value(s, depth + 1));
        skip_ws(s);
        if (s.empty()) fail("unterminated object");
        if (s.front() == ',') { s.remove_prefix(1); continue; }
        if (s.front() == '}') { s.remove_prefix(1); return obj; }
        fail("expected ',' or '}' in object");
    }
}

inline JsonArray parse_array(std::string_view& s, int depth) {
    expect(s, '[');
    JsonArray arr;
    skip_ws(s);
    if (!s.empty() && s.front() == ']') {
        s.remove_prefix(1);
        return arr;
    }
    for (;;) {
        arr.push_back(parse_value(s, depth + 1));
        skip_ws(s);
        if (s.empty()) fail("unterminated array");
        if (s.front() == ',') { s.remove_prefix(1); continue; }
        if (s.front() == ']') { s.remove_prefix(1); return arr; }
        fail("expected ',' or ']' in array");
    }
}

inline constexpr int max_depth = 512;

inline JsonValue parse_value(std::string_view& s, int depth) {
    if (depth > max_depth) fail("nesting too deep");
    skip_ws(s);
    if (s.empty()) fail("unexpected end of input");

    switch (s.front()) {
        case '"': return JsonValue{parse_string(s)};
        case '{': return JsonValue{parse_object(s, depth)};
        case '[': return JsonValue{parse_array(s, depth)};
        default: break;
    }
    if (s.starts_with("true"))  { s.remove_prefix(4); return JsonValue{true}; }
    if (s.starts_with("false")) { s.remove_prefix(5); return JsonValue{false}; }
    if (s.starts_with("null"))  { s.remove_prefix(4); return JsonValue{nullptr}; }
    return JsonValue{parse_number(s)};
}

} // namespace json_detail

/// Parse JSON text. Throws std::runtime_error on malformed input,
/// including trailing non-whitespace content.
[[nodiscard]] inline JsonValue json_parse(std::string_view text) {
    auto v = json_detail::parse_value(text, 0);
    json_detail::skip_ws(text);
    if (!text.empty()) json_detail::fail("trailing content after value");
    return v;
}

// ---------------------------------------------------------------------------
// JSON serializer
// ---------------------------------------------------------------------------

namespace json_detail {

inline void escape_string(std::string& out, std::string_view sv) {
    out += '"';
    for (char c : sv) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

inline void serialize_number(std::string& out, double d) {
    if (!std::isfinite(d)) {
        // JSON has no representation for NaN/Inf.
        out += "null";
        return;
    }
    if (d == std::trunc(d) && std::abs(d) < 1e15) {
        out += std::to_string(static_cast<std::int64_t>(d));
        return;
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    out.append(buf, static_cast<std::size_t>(ptr - buf));
}

inline void serialize_impl(std::string& out, const JsonValue& v, int indent, int depth) {
    const bool pretty = indent > 0;
    auto newline_pad = [&](int level) {
        if (!pretty) return;
        out += '\n';
        out.append(static_cast<std::size_t>(level * indent), ' ');
    };

    if (v.is_null()) {
        out += "null";
    } else if (v.is_bool()) {
        out += v.as_bool() ? "true" : "false";
    } else if (v.is_number()) {
        serialize_number(out, v.as_number());
    } else if (v.is_string()) {
        escape_string(out, v.as_string());
    } else if (v.is_array()) {
        const auto& arr = v.as_array();
        if (arr.empty()) { out += "[]"; return; }
        out += '[';
        bool first = true;
        for (const auto& item : arr) {
            if (!first) out += ',';
            first = false;
            newline_pad(depth + 1);
            serialize_impl(out, item, indent, depth + 1);
        }
        newline_pad(depth);
        out += ']';
    } else {
        const auto& obj = v.as_object();
        if (obj.empty()) { out += "{}"; return; }
        out += '{';
        bool first = true;
        for (const auto& [k, item] : obj) {
            if (!first) out += ',';
            first = false;
            newline_pad(depth + 1);
            escape_string(out, k);
            out += pretty ? ": " : ":";
            serialize_impl(out, item, indent, depth + 1);
        }
        newline_pad(depth);
        out += '}';
    }
}

} // namespace json_detail

/// Serialize to JSON text. indent > 0 pretty-prints with that many spaces
/// per level; object keys appear in map order.
[[nodiscard]] inline std::string json_serialize(const JsonValue& v, int indent = 0) {
    std::string out;
    json_detail::serialize_impl(out, v, indent, 0);
    return out;
}

// ---------------------------------------------------------------------------
// Builder helpers
// ---------------------------------------------------------------------------

[[nodiscard]] inline JsonValue json_object(std::initializer_list<std::pair<std::string, JsonValue>> pairs) {
    JsonObject obj;
    for (const auto& [k, v] : pairs) obj.insert_or_assign(k, v);
    return JsonValue{std::move(obj)};
}

[[nodiscard]] inline JsonValue json_array(std::initializer_list<JsonValue> values) {
    return JsonValue{JsonArray(values)};
}

} // namespace zconv
