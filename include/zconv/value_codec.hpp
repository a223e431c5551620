#pragma once
#include "error.hpp"
#include "json.hpp"
#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace zconv {

// ---------------------------------------------------------------------------
// Typed conversion between C++ values and JsonValue
//
// Supported out of the box: JsonValue, JsonObject, JsonArray, bool,
// arithmetic types, std::string, std::vector<T>, std::map<std::string, T>,
// and any type with `JsonValue to_json() const` / `static T from_json(const JsonValue&)`.
// Decoding failures raise ConventionError(decode_mismatch).
// ---------------------------------------------------------------------------

template <typename T>
concept JsonWritable = requires(const T& t) {
    { t.to_json() } -> std::convertible_to<JsonValue>;
};

template <typename T>
concept JsonReadable = requires(const JsonValue& v) {
    { T::from_json(v) } -> std::same_as<T>;
};

namespace codec_detail {

template <typename T>
struct is_vector : std::false_type {};
template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T>
struct is_string_map : std::false_type {};
template <typename T, typename C, typename A>
struct is_string_map<std::map<std::string, T, C, A>> : std::true_type {};

[[noreturn]] inline void mismatch(std::string_view expected, const JsonValue& got) {
    throw ConventionError(ErrorKind::decode_mismatch,
                          "expected " + std::string(expected) + ", got " +
                          std::string(json_type_name(got)));
}

} // namespace codec_detail

template <typename T>
[[nodiscard]] JsonValue to_json_value(const T& value) {
    if constexpr (std::same_as<T, JsonValue>) {
        return value;
    } else if constexpr (std::same_as<T, JsonObject> || std::same_as<T, JsonArray>) {
        return JsonValue{value};
    } else if constexpr (std::same_as<T, bool>) {
        return JsonValue{value};
    } else if constexpr (std::is_arithmetic_v<T>) {
        return JsonValue{static_cast<double>(value)};
    } else if constexpr (std::convertible_to<const T&, std::string_view>) {
        return JsonValue{std::string_view(value)};
    } else if constexpr (codec_detail::is_vector<T>::value) {
        JsonArray arr;
        arr.reserve(value.size());
        for (const auto& item : value) arr.push_back(to_json_value(item));
        return JsonValue{std::move(arr)};
    } else if constexpr (codec_detail::is_string_map<T>::value) {
        JsonObject obj;
        for (const auto& [k, item] : value) obj.emplace(k, to_json_value(item));
        return JsonValue{std::move(obj)};
    } else if constexpr (JsonWritable<T>) {
        return JsonValue{value.to_json()};
    } else {
        static_assert(sizeof(T) == 0, "zconv: no JSON encoding for this type");
    }
}

template <typename T>
[[nodiscard]] T from_json_value(const JsonValue& v) {
    if constexpr (std::same_as<T, JsonValue>) {
        return v;
    } else if constexpr (std::same_as<T, JsonObject>) {
        if (!v.is_object()) codec_detail::mismatch("object", v);
        return v.as_object();
    } else if constexpr (std::same_as<T, JsonArray>) {
        if (!v.is_array()) codec_detail::mismatch("array", v);
        return v.as_array();
    } else if constexpr (std::same_as<T, bool>) {
        if (!v.is_bool()) codec_detail::mismatch("boolean", v);
        return v.as_bool();
    } else if constexpr (std::is_floating_point_v<T>) {
        if (!v.is_number()) codec_detail::mismatch("number", v);
        return static_cast<T>(v.as_number());
    } else if constexpr (std::is_integral_v<T>) {
        if (!v.is_integral()) codec_detail::mismatch("integer", v);
        double d = v.as_number();
        // max() may round up to 2^digits as a double, so the upper bound is
        // exclusive on that power of two.
        if (d < static_cast<double>(std::numeric_limits<T>::min()) ||
            d >= std::ldexp(1.0, std::numeric_limits<T>::digits))
            throw ConventionError(ErrorKind::decode_mismatch, "integer out of range");
        return static_cast<T>(d);
    } else if constexpr (std::same_as<T, std::string>) {
        if (!v.is_string()) codec_detail::mismatch("string", v);
        return v.as_string();
    } else if constexpr (codec_detail::is_vector<T>::value) {
        if (!v.is_array()) codec_detail::mismatch("array", v);
        T out;
        out.reserve(v.size());
        for (const auto& item : v.as_array())
            out.push_back(from_json_value<typename T::value_type>(item));
        return out;
    } else if constexpr (codec_detail::is_string_map<T>::value) {
        if (!v.is_object()) codec_detail::mismatch("object", v);
        T out;
        for (const auto& [k, item] : v.as_object())
            out.emplace(k, from_json_value<typename T::mapped_type>(item));
        return out;
    } else if constexpr (JsonReadable<T>) {
        return T::from_json(v);
    } else {
        static_assert(sizeof(T) == 0, "zconv: no JSON decoding for this type");
    }
}

// ---------------------------------------------------------------------------
// Object field helpers for convention authors
// ---------------------------------------------------------------------------

/// Object view of v; decode_mismatch naming `what` if v is not an object.
[[nodiscard]] inline const JsonObject& expect_object(const JsonValue& v, std::string_view what) {
    if (!v.is_object())
        throw ConventionError(ErrorKind::decode_mismatch,
                              std::string(what) + " must be an object, got " +
                              std::string(json_type_name(v)));
    return v.as_object();
}

template <typename T>
[[nodiscard]] T required_field(const JsonValue& obj, std::string_view key) {
    const JsonValue* p = obj.find(key);
    if (!p)
        throw ConventionError(ErrorKind::decode_mismatch,
                              "missing required field '" + std::string(key) + "'");
    try {
        return from_json_value<T>(*p);
    } catch (const ConventionError& e) {
        throw ConventionError(ErrorKind::decode_mismatch,
                              "field '" + std::string(key) + "': " + e.message());
    }
}

/// Absent and null both decode to std::nullopt.
template <typename T>
[[nodiscard]] std::optional<T> optional_field(const JsonValue& obj, std::string_view key) {
    const JsonValue* p = obj.find(key);
    if (!p || p->is_null()) return std::nullopt;
    try {
        return from_json_value<T>(*p);
    } catch (const ConventionError& e) {
        throw ConventionError(ErrorKind::decode_mismatch,
                              "field '" + std::string(key) + "': " + e.message());
    }
}

/// Writes the field only when it holds a value.
template <typename T>
void put_optional(JsonObject& obj, std::string_view key, const std::optional<T>& value) {
    if (value) obj.insert_or_assign(std::string(key), to_json_value(*value));
}

} // namespace zconv
