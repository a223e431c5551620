#pragma once
#include "error.hpp"
#include "identifiers.hpp"
#include "json.hpp"
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace zconv {

// ---------------------------------------------------------------------------
// ConventionDefinition -- static identity of a convention
// ---------------------------------------------------------------------------

/// Declared once per convention type as a `static constexpr` member.
/// String members refer to static storage (literals).
struct ConventionDefinition {
    Uuid uuid;
    std::string_view schema_url;
    std::string_view spec_url;
    std::string_view name;
    std::string_view description;

    [[nodiscard]] ConventionId id_uuid() const { return uuid; }
    [[nodiscard]] ConventionId id_schema() const { return SchemaUrl{std::string(schema_url)}; }
    [[nodiscard]] ConventionId id_spec() const { return SpecUrl{std::string(spec_url)}; }

    friend constexpr bool operator==(const ConventionDefinition&, const ConventionDefinition&) = default;
};

// ---------------------------------------------------------------------------
// LayoutStrategy
// ---------------------------------------------------------------------------

enum class LayoutStrategy : std::uint8_t {
    /// One key holding the payload object.
    nested,
    /// One key per payload field, all sharing a prefix.
    prefixed
};

[[nodiscard]] constexpr std::string_view layout_name(LayoutStrategy s) noexcept {
    return s == LayoutStrategy::nested ? "nested" : "prefixed";
}

// ---------------------------------------------------------------------------
// Convention type concepts
// ---------------------------------------------------------------------------

/// A convention payload type: identity, plus conversion to/from JsonValue.
/// Types also declare `nested_key`, `prefix`, or both.
template <typename T>
concept ConventionType = requires(const T& t, const JsonValue& v) {
    { T::definition } -> std::convertible_to<ConventionDefinition>;
    { t.to_json() } -> std::convertible_to<JsonValue>;
    { T::from_json(v) } -> std::same_as<T>;
};

template <typename T>
concept NestedConvention = ConventionType<T> && requires {
    { T::nested_key } -> std::convertible_to<std::string_view>;
};

/// The prefix includes its delimiter, e.g. "proj:".
template <typename T>
concept PrefixedConvention = ConventionType<T> && requires {
    { T::prefix } -> std::convertible_to<std::string_view>;
};

template <ConventionType T>
[[nodiscard]] constexpr bool supports_layout(LayoutStrategy s) noexcept {
    return s == LayoutStrategy::nested ? NestedConvention<T> : PrefixedConvention<T>;
}

// ---------------------------------------------------------------------------
// ManifestEntry -- one element of "zarr_conventions"
// ---------------------------------------------------------------------------

/// Subset of a ConventionDefinition as written into a document. At least one
/// of uuid, schema_url, spec_url is always set.
class ManifestEntry final {
public:
    struct Fields {
        std::optional<Uuid> uuid;
        std::optional<std::string> schema_url;
        std::optional<std::string> spec_url;
        std::optional<std::string> name;
        std::optional<std::string> description;
    };

    /// Throws malformed_manifest_entry if no identifier is set or a URL is
    /// not absolute.
    explicit ManifestEntry(Fields fields) : f_(std::move(fields)) {
        if (!f_.uuid && !f_.schema_url && !f_.spec_url)
            throw ConventionError(ErrorKind::malformed_manifest_entry,
                                  "manifest entry needs at least one of uuid, schema_url, spec_url");
        check_url(f_.schema_url, "schema_url");
        check_url(f_.spec_url, "spec_url");
    }

    /// All fields of the definition.
    [[nodiscard]] static ManifestEntry from_definition(const ConventionDefinition& def) {
        return ManifestEntry{Fields{
            def.uuid,
            std::string(def.schema_url),
            std::string(def.spec_url),
            std::string(def.name),
            std::string(def.description)}};
    }

    /// Parse one manifest element. Unknown fields are ignored.
    [[nodiscard]] static ManifestEntry from_json(const JsonValue& v) {
        if (!v.is_object())
            throw ConventionError(ErrorKind::malformed_manifest_entry,
                                  "manifest entry must be an object, got " +
                                  std::string(json_type_name(v)));
        Fields f;
        if (auto* p = v.find("uuid")) {
            if (!p->is_string())
                throw ConventionError(ErrorKind::malformed_manifest_entry, "'uuid' must be a string");
            f.uuid = Uuid::parse(p->as_string());
            if (!f.uuid)
                throw ConventionError(ErrorKind::malformed_manifest_entry,
                                      "'uuid' is not a canonical UUID: " + p->as_string());
        }
        f.schema_url = string_field(v, "schema_url");
        f.spec_url = string_field(v, "spec_url");
        f.name = string_field(v, "name");
        f.description = string_field(v, "description");
        return ManifestEntry{std::move(f)};
    }

    [[nodiscard]] JsonValue to_json() const {
        JsonObject obj;
        if (f_.uuid) obj["uuid"] = JsonValue{f_.uuid->to_string()};
        if (f_.schema_url) obj["schema_url"] = JsonValue{*f_.schema_url};
        if (f_.spec_url) obj["spec_url"] = JsonValue{*f_.spec_url};
        if (f_.name) obj["name"] = JsonValue{*f_.name};
        if (f_.description) obj["description"] = JsonValue{*f_.description};
        return JsonValue{std::move(obj)};
    }

    [[nodiscard]] const std::optional<Uuid>& uuid() const noexcept { return f_.uuid; }
    [[nodiscard]] const std::optional<std::string>& schema_url() const noexcept { return f_.schema_url; }
    [[nodiscard]] const std::optional<std::string>& spec_url() const noexcept { return f_.spec_url; }
    [[nodiscard]] const std::optional<std::string>& name() const noexcept { return f_.name; }
    [[nodiscard]] const std::optional<std::string>& description() const noexcept { return f_.description; }

    /// Preferred identifier: uuid, then schema_url, then spec_url.
    [[nodiscard]] ConventionId id() const {
        if (f_.uuid) return *f_.uuid;
        if (f_.schema_url) return SchemaUrl{*f_.schema_url};
        return SpecUrl{*f_.spec_url};
    }

    /// True if any identifier present here equals the definition's.
    [[nodiscard]] bool refers_to(const ConventionDefinition& def) const noexcept {
        return (f_.uuid && *f_.uuid == def.uuid) ||
               (f_.schema_url && *f_.schema_url == def.schema_url) ||
               (f_.spec_url && *f_.spec_url == def.spec_url);
    }

    friend bool operator==(const ManifestEntry& a, const ManifestEntry& b) {
        return a.f_.uuid == b.f_.uuid && a.f_.schema_url == b.f_.schema_url &&
               a.f_.spec_url == b.f_.spec_url && a.f_.name == b.f_.name &&
               a.f_.description == b.f_.description;
    }

private:
    static void check_url(const std::optional<std::string>& url, std::string_view field) {
        if (url && !is_absolute_uri(*url))
            throw ConventionError(ErrorKind::malformed_manifest_entry,
                                  "'" + std::string(field) + "' is not an absolute URI: " + *url);
    }

    static std::optional<std::string> string_field(const JsonValue& v, std::string_view key) {
        const JsonValue* p = v.find(key);
        if (!p) return std::nullopt;
        if (!p->is_string())
            throw ConventionError(ErrorKind::malformed_manifest_entry,
                                  "'" + std::string(key) + "' must be a string");
        return p->as_string();
    }

    Fields f_;
};

} // namespace zconv
