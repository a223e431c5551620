#pragma once
#include "convention.hpp"
#include "error.hpp"
#include "json.hpp"
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace zconv {

// ===========================================================================
// Layout strategies
//
//   nested:   { "proj": { "code": "EPSG:4326" } }
//   prefixed: { "proj:code": "EPSG:4326" }
// ===========================================================================

// ---------------------------------------------------------------------------
// Key scans
// ---------------------------------------------------------------------------

[[nodiscard]] inline bool has_nested(const JsonObject& attrs, std::string_view key) {
    return attrs.find(key) != attrs.end();
}

/// Keys starting with prefix, in map order. A key equal to the prefix counts
/// (its field name is empty).
[[nodiscard]] inline std::vector<std::string> prefixed_keys(const JsonObject& attrs,
                                                            std::string_view prefix) {
    std::vector<std::string> out;
    for (auto it = attrs.lower_bound(prefix);
         it != attrs.end() && std::string_view(it->first).starts_with(prefix); ++it)
        out.push_back(it->first);
    return out;
}

[[nodiscard]] inline bool has_prefixed(const JsonObject& attrs, std::string_view prefix) {
    auto it = attrs.lower_bound(prefix);
    return it != attrs.end() && std::string_view(it->first).starts_with(prefix);
}

/// Collect every key under prefix into one object, with the prefix stripped.
[[nodiscard]] inline JsonObject nest_prefixed(const JsonObject& attrs, std::string_view prefix) {
    JsonObject out;
    for (auto it = attrs.lower_bound(prefix);
         it != attrs.end() && std::string_view(it->first).starts_with(prefix); ++it)
        out.emplace(it->first.substr(prefix.size()), it->second);
    return out;
}

/// Inverse of nest_prefixed. The payload must be an object.
[[nodiscard]] inline JsonObject flatten_prefixed(std::string_view prefix, const JsonValue& payload) {
    if (!payload.is_object())
        throw ConventionError(ErrorKind::decode_mismatch,
                              "prefixed payload for '" + std::string(prefix) +
                              "' must serialize to an object, got " +
                              std::string(json_type_name(payload)));
    JsonObject out;
    for (const auto& [field, value] : payload.as_object())
        out.emplace(std::string(prefix) + field, value);
    return out;
}

// ---------------------------------------------------------------------------
// Typed decode
// ---------------------------------------------------------------------------

namespace layout_detail {

template <ConventionType T>
[[nodiscard]] T decode_payload(const JsonValue& payload, LayoutStrategy layout) {
    const auto context = [&] {
        return "convention '" + std::string(T::definition.name) + "' (" +
               std::string(layout_name(layout)) + "): ";
    };
    try {
        return T::from_json(payload);
    } catch (const ConventionError& e) {
        throw ConventionError(ErrorKind::decode_mismatch, context() + e.message());
    } catch (const std::exception& e) {
        // JsonValue accessors report shape errors as std::bad_variant_access
        // or std::out_of_range.
        throw ConventionError(ErrorKind::decode_mismatch, context() + e.what());
    }
}

} // namespace layout_detail

/// std::nullopt if the key is absent; decode_mismatch if present but not an
/// object or rejected by T::from_json.
template <NestedConvention T>
[[nodiscard]] std::optional<T> decode_nested(const JsonObject& attrs) {
    auto it = attrs.find(std::string_view(T::nested_key));
    if (it == attrs.end()) return std::nullopt;
    if (!it->second.is_object())
        throw ConventionError(ErrorKind::decode_mismatch,
                              "convention '" + std::string(T::definition.name) + "' (nested): key '" +
                              std::string(T::nested_key) + "' must hold an object, got " +
                              std::string(json_type_name(it->second)));
    return layout_detail::decode_payload<T>(it->second, LayoutStrategy::nested);
}

/// std::nullopt if no key carries the prefix; decode_mismatch if the
/// collected fields are rejected by T::from_json.
template <PrefixedConvention T>
[[nodiscard]] std::optional<T> decode_prefixed(const JsonObject& attrs) {
    if (!has_prefixed(attrs, T::prefix)) return std::nullopt;
    return layout_detail::decode_payload<T>(JsonValue{nest_prefixed(attrs, T::prefix)},
                                            LayoutStrategy::prefixed);
}

/// Which of T's supported layouts is present; representation_conflict if
/// both are.
template <ConventionType T>
[[nodiscard]] std::optional<LayoutStrategy> detect_layout(const JsonObject& attrs) {
    bool nested = false;
    bool prefixed = false;
    if constexpr (NestedConvention<T>) nested = has_nested(attrs, T::nested_key);
    if constexpr (PrefixedConvention<T>) prefixed = has_prefixed(attrs, T::prefix);

    if (nested && prefixed) {
        std::string msg = "convention '" + std::string(T::definition.name) +
                          "' is present both nested and prefixed";
        if constexpr (NestedConvention<T> && PrefixedConvention<T>)
            msg += " ('" + std::string(T::nested_key) + "' and '" + std::string(T::prefix) + "*')";
        throw ConventionError(ErrorKind::representation_conflict, msg);
    }
    if (nested) return LayoutStrategy::nested;
    if (prefixed) return LayoutStrategy::prefixed;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Typed encode (key/value pairs only; collisions are the builder's concern)
// ---------------------------------------------------------------------------

template <NestedConvention T>
[[nodiscard]] std::pair<std::string, JsonValue> encode_nested(const T& value) {
    JsonValue payload = value.to_json();
    if (!payload.is_object())
        throw ConventionError(ErrorKind::decode_mismatch,
                              "convention '" + std::string(T::definition.name) +
                              "' must serialize to an object for the nested layout");
    return {std::string(T::nested_key), std::move(payload)};
}

template <PrefixedConvention T>
[[nodiscard]] JsonObject encode_prefixed(const T& value) {
    return flatten_prefixed(T::prefix, value.to_json());
}

} // namespace zconv
