#pragma once
#include "convention.hpp"
#include "error.hpp"
#include "json.hpp"
#include "layout.hpp"
#include "log.hpp"
#include "registry.hpp"
#include "value_codec.hpp"
#include <cstddef>
#include <exception>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace zconv {

/// Reserved attribute key holding the convention manifest.
inline constexpr std::string_view manifest_key = "zarr_conventions";

// ===========================================================================
// AttributesParser -- typed and untyped reads from an attributes map
// ===========================================================================
//
// Presence of a convention is decided by the attribute keys actually in the
// document. The manifest is a discovery aid: in_use<T>() reports what it
// lists, but parse_*() neither requires nor cross-checks an entry.

class AttributesParser final {
public:
    /// Throws decode_mismatch if attributes is not an object, and
    /// malformed_manifest_entry if zarr_conventions is present but not an
    /// array of valid entries.
    explicit AttributesParser(JsonValue attributes,
                              const ConventionRegistry& registry = default_registry())
        : registry_(&registry)
    {
        if (!attributes.is_object())
            throw ConventionError(ErrorKind::decode_mismatch,
                                  "attributes must be an object, got " +
                                  std::string(json_type_name(attributes)));
        fields_ = std::move(attributes.as_object());

        auto it = fields_.find(manifest_key);
        if (it == fields_.end()) return;

        const JsonValue& list = it->second;
        if (!list.is_array())
            throw ConventionError(ErrorKind::malformed_manifest_entry,
                                  std::string(manifest_key) + " must be an array, got " +
                                  std::string(json_type_name(list)));
        manifest_.reserve(list.size());
        for (std::size_t i = 0; i < list.size(); ++i) {
            try {
                manifest_.push_back(ManifestEntry::from_json(list.as_array()[i]));
            } catch (const ConventionError& e) {
                throw ConventionError(ErrorKind::malformed_manifest_entry,
                                      std::string(manifest_key) + "[" + std::to_string(i) +
                                      "]: " + e.message());
            }
        }
        fields_.erase(it);

        for (const auto& entry : manifest_) {
            if (!registry_->resolve(entry))
                Logger::debug("parser", "manifest lists unknown convention ({}); left unstructured",
                              to_string(entry.id()));
        }
    }

    /// Parse JSON text, then construct. Malformed text is a decode_mismatch.
    [[nodiscard]] static AttributesParser from_json_text(
        std::string_view text, const ConventionRegistry& registry = default_registry())
    {
        JsonValue v;
        try {
            v = json_parse(text);
        } catch (const std::runtime_error& e) {
            throw ConventionError(ErrorKind::decode_mismatch,
                                  std::string("attributes are not valid JSON: ") + e.what());
        }
        return AttributesParser{std::move(v), registry};
    }

    // -- Manifest -------------------------------------------------------------

    [[nodiscard]] const std::vector<ManifestEntry>& manifest() const noexcept { return manifest_; }

    /// Whether the manifest lists T by uuid, schema_url or spec_url.
    template <ConventionType T>
    [[nodiscard]] bool in_use() const noexcept
    {
        for (const auto& entry : manifest_)
            if (entry.refers_to(T::definition)) return true;
        return false;
    }

    /// Manifest entries the registry can resolve, as full definitions.
    [[nodiscard]] std::vector<ConventionDefinition> known_conventions() const
    {
        std::vector<ConventionDefinition> out;
        for (const auto& entry : manifest_)
            if (auto def = registry_->resolve(entry)) out.push_back(*def);
        return out;
    }

    /// Manifest entries the registry does not know.
    [[nodiscard]] std::vector<ManifestEntry> unknown_conventions() const
    {
        std::vector<ManifestEntry> out;
        for (const auto& entry : manifest_)
            if (!registry_->resolve(entry)) out.push_back(entry);
        return out;
    }

    // -- Typed conventions ----------------------------------------------------

    // A layout T does not declare is never present: parse_nested on a
    // prefix-only type (or the reverse) returns std::nullopt.

    template <ConventionType T>
    [[nodiscard]] std::optional<T> parse_nested() const
    {
        if constexpr (NestedConvention<T>) {
            return decode_nested<T>(fields_);
        } else {
            return std::nullopt;
        }
    }

    template <ConventionType T>
    [[nodiscard]] std::optional<T> parse_prefixed() const
    {
        if constexpr (PrefixedConvention<T>) {
            return decode_prefixed<T>(fields_);
        } else {
            return std::nullopt;
        }
    }

    /// Decodes whichever supported layout is present. Both present is a
    /// representation_conflict; no precedence is assumed.
    template <ConventionType T>
    [[nodiscard]] std::optional<T> parse() const
    {
        auto layout = detect_layout<T>(fields_);
        if (!layout) return std::nullopt;
        if (*layout == LayoutStrategy::nested) return parse_nested<T>();
        return parse_prefixed<T>();
    }

    template <ConventionType T>
    [[nodiscard]] std::optional<LayoutStrategy> layout_of() const
    {
        return detect_layout<T>(fields_);
    }

    // -- Unstructured attributes ----------------------------------------------

    /// std::nullopt if absent; decode_mismatch if the value has the wrong shape.
    template <typename T = JsonValue>
    [[nodiscard]] std::optional<T> get(std::string_view key) const
    {
        auto it = fields_.find(key);
        if (it == fields_.end()) return std::nullopt;
        try {
            return from_json_value<T>(it->second);
        } catch (const ConventionError& e) {
            throw ConventionError(ErrorKind::decode_mismatch,
                                  "attribute '" + std::string(key) + "': " + e.message());
        } catch (const std::exception& e) {
            // A user from_json may reach the JsonValue accessors directly.
            throw ConventionError(ErrorKind::decode_mismatch,
                                  "attribute '" + std::string(key) + "': " + e.what());
        }
    }

    /// Every attribute except the manifest.
    [[nodiscard]] const JsonObject& fields() const noexcept { return fields_; }

private:
    const ConventionRegistry* registry_;
    JsonObject fields_;
    std::vector<ManifestEntry> manifest_;
};

// ===========================================================================
// AttributesBuilder -- assemble an attributes map plus its manifest
// ===========================================================================

/// Which definition fields are copied into each manifest entry. At least
/// one of uuid, schema_url, spec_url must stay enabled once a convention is
/// added.
struct BuilderConfig {
    bool include_uuid        = true;
    bool include_schema_url  = true;
    bool include_spec_url    = true;
    bool include_name        = true;
    bool include_description = true;

    [[nodiscard]] constexpr bool has_identifier() const noexcept {
        return include_uuid || include_schema_url || include_spec_url;
    }

    /// Throws invalid_builder_configuration if no identifier is enabled.
    void require_identifier(const ConventionDefinition& def) const {
        if (!has_identifier())
            throw ConventionError(ErrorKind::invalid_builder_configuration,
                                  "convention '" + std::string(def.name) +
                                  "': at least one of uuid, schema_url, spec_url must be included");
    }

    /// Throws invalid_builder_configuration if no identifier is enabled.
    [[nodiscard]] ManifestEntry entry_for(const ConventionDefinition& def) const {
        require_identifier(def);
        ManifestEntry::Fields f;
        if (include_uuid) f.uuid = def.uuid;
        if (include_schema_url) f.schema_url = std::string(def.schema_url);
        if (include_spec_url) f.spec_url = std::string(def.spec_url);
        if (include_name) f.name = std::string(def.name);
        if (include_description) f.description = std::string(def.description);
        return ManifestEntry{std::move(f)};
    }
};

class AttributesBuilder final {
public:
    AttributesBuilder() = default;
    explicit AttributesBuilder(BuilderConfig config) : config_(config) {}

    // -- Configuration --------------------------------------------------------

    AttributesBuilder& config(BuilderConfig config) noexcept { config_ = config; return *this; }
    AttributesBuilder& include_uuid(bool enable) noexcept { config_.include_uuid = enable; return *this; }
    AttributesBuilder& include_schema_url(bool enable) noexcept { config_.include_schema_url = enable; return *this; }
    AttributesBuilder& include_spec_url(bool enable) noexcept { config_.include_spec_url = enable; return *this; }
    AttributesBuilder& include_name(bool enable) noexcept { config_.include_name = enable; return *this; }
    AttributesBuilder& include_description(bool enable) noexcept { config_.include_description = enable; return *this; }

    [[nodiscard]] const BuilderConfig& config() const noexcept { return config_; }

    // -- Conventions ----------------------------------------------------------

    template <ConventionType T>
    AttributesBuilder& add_nested(const T& value)
    {
        return add(value, LayoutStrategy::nested);
    }

    template <ConventionType T>
    AttributesBuilder& add_prefixed(const T& value)
    {
        return add(value, LayoutStrategy::prefixed);
    }

    /// Writes value in the given layout and records T for the manifest.
    /// On failure the builder is unchanged.
    template <ConventionType T>
    AttributesBuilder& add(const T& value, LayoutStrategy layout)
    {
        const ConventionDefinition& def = T::definition;
        config_.require_identifier(def);

        if (!supports_layout<T>(layout))
            throw ConventionError(ErrorKind::unsupported_layout,
                                  "convention '" + std::string(def.name) + "' has no " +
                                  std::string(layout_name(layout)) + " layout");

        Payload p;
        p.layout = layout;
        if constexpr (NestedConvention<T>) p.nested_claim = std::string(T::nested_key);
        if constexpr (PrefixedConvention<T>) p.prefix_claim = std::string(T::prefix);
        if (layout == LayoutStrategy::nested) {
            if constexpr (NestedConvention<T>) {
                auto kv = encode_nested(value);
                p.keys.emplace(std::move(kv.first), std::move(kv.second));
            }
        } else {
            if constexpr (PrefixedConvention<T>) {
                p.keys = encode_prefixed(value);
                if (p.keys.empty())
                    throw ConventionError(ErrorKind::decode_mismatch,
                                          "convention '" + std::string(def.name) +
                                          "' has no fields to write in the prefixed layout");
            }
        }
        place(def, std::move(p));
        return *this;
    }

    // -- Unstructured attributes ----------------------------------------------

    /// key_collision if key is reserved, already written, or is the nested
    /// key of an added convention or falls under its prefix.
    template <typename V>
    AttributesBuilder& add_attribute(std::string key, const V& value)
    {
        JsonValue encoded = to_json_value(value);
        check_free(key, nullptr);
        untyped_.insert_or_assign(std::move(key), std::move(encoded));
        return *this;
    }

    // -- Build ----------------------------------------------------------------

    /// Consumes the builder. The manifest lists each added convention once,
    /// in the order first added; it is omitted when none was added.
    [[nodiscard]] JsonValue build() &&
    {
        JsonArray manifest;
        manifest.reserve(conventions_.size());
        for (const auto& c : conventions_)
            manifest.push_back(config_.entry_for(c.def).to_json());

        JsonObject out = std::move(untyped_);
        for (auto& c : conventions_)
            for (auto& [k, v] : c.payload.keys) out.insert_or_assign(k, std::move(v));
        if (!manifest.empty())
            out.insert_or_assign(std::string(manifest_key), JsonValue{std::move(manifest)});

        conventions_.clear();
        return JsonValue{std::move(out)};
    }

private:
    /// A convention owns its nested key and its prefix, whichever it
    /// declares, in both layouts; an empty claim owns nothing.
    struct Payload {
        LayoutStrategy layout = LayoutStrategy::nested;
        std::string nested_claim;
        std::string prefix_claim;
        JsonObject keys;

        [[nodiscard]] bool claims(std::string_view key) const
        {
            if (keys.find(key) != keys.end()) return true;
            if (!nested_claim.empty() && key == nested_claim) return true;
            return !prefix_claim.empty() && key.starts_with(prefix_claim);
        }

        [[nodiscard]] const std::string& claim() const
        {
            return layout == LayoutStrategy::nested ? nested_claim : prefix_claim;
        }
    };

    struct Added {
        ConventionDefinition def;
        Payload payload;
    };

    [[nodiscard]] static ConventionError collision(std::string_view key, const std::string& why)
    {
        return ConventionError(ErrorKind::key_collision,
                               "key '" + std::string(key) + "' " + why);
    }

    /// Throws key_collision if key is reserved or owned by anything other
    /// than `self`.
    void check_free(std::string_view key, const Added* self) const
    {
        if (key == manifest_key)
            throw collision(key, "is reserved for the convention manifest");
        if (untyped_.find(key) != untyped_.end())
            throw collision(key, "is already set as an attribute");
        for (const auto& c : conventions_) {
            if (&c == self) continue;
            if (c.payload.claims(key))
                throw collision(key, "is owned by convention '" + std::string(c.def.name) + "'");
        }
    }

    void place(const ConventionDefinition& def, Payload p)
    {
        Added* self = nullptr;
        for (auto& c : conventions_) {
            if (c.def.uuid != def.uuid) continue;
            if (c.payload.layout != p.layout)
                throw collision(p.claim(), "would add convention '" + std::string(def.name) +
                                         "' in the " + std::string(layout_name(p.layout)) +
                                         " layout, but it is already written " +
                                         std::string(layout_name(c.payload.layout)));
            self = &c;
        }

        for (const auto& [k, v] : p.keys) check_free(k, self);
        for (const auto& [k, v] : untyped_)
            if (p.claims(k))
                throw collision(k, "is an attribute owned by convention '" + std::string(def.name) + "'");
        for (const auto& c : conventions_) {
            if (&c == self) continue;
            for (const auto& [k, v] : c.payload.keys)
                if (p.claims(k))
                    throw collision(k, "of convention '" + std::string(c.def.name) +
                                       "' is owned by convention '" + std::string(def.name) + "'");
        }

        if (self) {
            self->payload = std::move(p);
            Logger::trace("builder", "replaced payload of convention '{}'", def.name);
        } else {
            conventions_.push_back(Added{def, std::move(p)});
            Logger::trace("builder", "added convention '{}'", def.name);
        }
    }

    BuilderConfig config_;
    JsonObject untyped_;
    std::vector<Added> conventions_;
};

} // namespace zconv
