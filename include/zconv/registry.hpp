#pragma once
#include "convention.hpp"
#include "error.hpp"
#include "log.hpp"
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace zconv {

// ---------------------------------------------------------------------------
// ConventionRegistry -- append-only, thread-safe lookup of known conventions
//
// Writes are expected during start-up; reads may then happen concurrently.
// Registering an identical definition again is a no-op, so static
// registration from several translation units is harmless.
// ---------------------------------------------------------------------------

class ConventionRegistry final {
public:
    ConventionRegistry() = default;

    ConventionRegistry(const ConventionRegistry&)            = delete;
    ConventionRegistry& operator=(const ConventionRegistry&) = delete;
    ConventionRegistry(ConventionRegistry&&)                 = delete;
    ConventionRegistry& operator=(ConventionRegistry&&)      = delete;

    /// Returns true if inserted, false if an identical definition was
    /// already present. Throws registry_conflict (leaving the registry
    /// unchanged) if any identifier is taken by a different definition.
    /// Logging happens after the lock is released, so a log sink may query
    /// the registry.
    bool register_definition(const ConventionDefinition& def)
    {
        bool inserted = false;
        std::string conflict;
        std::string_view owner;
        {
            std::unique_lock lock{mutex_};

            bool same = false;
            auto check = [&](const auto& index, const auto& key, std::string what) {
                if (!conflict.empty()) return;
                auto it = index.find(key);
                if (it == index.end()) return;
                const ConventionDefinition& existing = defs_[it->second];
                if (existing == def) {
                    same = true;
                    return;
                }
                conflict = std::move(what);
                owner = existing.name;
            };
            check(by_uuid_, def.uuid, "uuid " + def.uuid.to_string());
            check(by_schema_, def.schema_url, "schema_url " + std::string(def.schema_url));
            check(by_spec_, def.spec_url, "spec_url " + std::string(def.spec_url));

            if (conflict.empty() && !same) {
                const std::size_t idx = defs_.size();
                defs_.push_back(def);
                by_uuid_.emplace(def.uuid, idx);
                by_schema_.emplace(std::string(def.schema_url), idx);
                by_spec_.emplace(std::string(def.spec_url), idx);
                inserted = true;
            }
        }

        if (!conflict.empty()) {
            Logger::warn("registry", "refusing to register '{}': {} already belongs to '{}'",
                         def.name, conflict, owner);
            throw ConventionError(ErrorKind::registry_conflict,
                                  "convention '" + std::string(def.name) + "': " + conflict +
                                  " is already registered for '" + std::string(owner) + "'");
        }
        if (inserted)
            Logger::debug("registry", "registered convention '{}' ({})", def.name, def.uuid.to_string());
        else
            Logger::debug("registry", "convention '{}' already registered", def.name);
        return inserted;
    }

    template <ConventionType T>
    bool register_convention()
    {
        return register_definition(T::definition);
    }

    [[nodiscard]] std::optional<ConventionDefinition> find_by_uuid(const Uuid& id) const
    {
        std::shared_lock lock{mutex_};
        return lookup(by_uuid_, id);
    }

    [[nodiscard]] std::optional<ConventionDefinition> find_by_schema_url(std::string_view url) const
    {
        std::shared_lock lock{mutex_};
        return lookup(by_schema_, url);
    }

    [[nodiscard]] std::optional<ConventionDefinition> find_by_spec_url(std::string_view url) const
    {
        std::shared_lock lock{mutex_};
        return lookup(by_spec_, url);
    }

    [[nodiscard]] std::optional<ConventionDefinition> find(const ConventionId& id) const
    {
        if (auto* u = std::get_if<Uuid>(&id)) return find_by_uuid(*u);
        if (auto* s = std::get_if<SchemaUrl>(&id)) return find_by_schema_url(s->url);
        return find_by_spec_url(std::get<SpecUrl>(id).url);
    }

    [[nodiscard]] bool contains(const ConventionId& id) const { return find(id).has_value(); }

    /// Looks up by uuid, then schema_url, then spec_url; first hit wins.
    [[nodiscard]] std::optional<ConventionDefinition> resolve(const ManifestEntry& entry) const
    {
        std::shared_lock lock{mutex_};
        if (entry.uuid())
            if (auto d = lookup(by_uuid_, *entry.uuid())) return d;
        if (entry.schema_url())
            if (auto d = lookup(by_schema_, std::string_view(*entry.schema_url()))) return d;
        if (entry.spec_url())
            if (auto d = lookup(by_spec_, std::string_view(*entry.spec_url()))) return d;
        return std::nullopt;
    }

    /// Snapshot in registration order.
    [[nodiscard]] std::vector<ConventionDefinition> conventions() const
    {
        std::shared_lock lock{mutex_};
        return defs_;
    }

    [[nodiscard]] std::size_t size() const
    {
        std::shared_lock lock{mutex_};
        return defs_.size();
    }

private:
    template <typename Index, typename Key>
    [[nodiscard]] std::optional<ConventionDefinition> lookup(const Index& index, const Key& key) const
    {
        auto it = index.find(key);
        if (it == index.end()) return std::nullopt;
        return defs_[it->second];
    }

    mutable std::shared_mutex mutex_;
    std::vector<ConventionDefinition> defs_;
    std::map<Uuid, std::size_t> by_uuid_;
    std::map<std::string, std::size_t, std::less<>> by_schema_;
    std::map<std::string, std::size_t, std::less<>> by_spec_;
};

/// Process-wide registry consulted by AttributesParser by default.
[[nodiscard]] inline ConventionRegistry& default_registry()
{
    static ConventionRegistry r;
    return r;
}

// ---------------------------------------------------------------------------
// Constructor registration
// ---------------------------------------------------------------------------

template <ConventionType T>
struct ConventionRegistrar {
    ConventionRegistrar() { default_registry().register_convention<T>(); }
};

#define ZCONV_CAT2(a, b) a##b
#define ZCONV_CAT(a, b) ZCONV_CAT2(a, b)

/// Registers T with default_registry() during static initialization.
/// Use at namespace scope in a source file, at most once per line. A
/// conflicting definition escapes static initialization and terminates.
#define ZCONV_REGISTER_CONVENTION(T)                                           \
    static const ::zconv::ConventionRegistrar<T>                               \
        ZCONV_CAT(zconv_convention_registrar_, __LINE__) {}

} // namespace zconv
