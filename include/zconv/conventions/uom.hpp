#pragma once
#include "../convention.hpp"
#include "../error.hpp"
#include "../identifiers.hpp"
#include "../value_codec.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace zconv::conventions {

// ---------------------------------------------------------------------------
// UnitOfMeasurement -- units for numerical arrays
//
//   "uom": { "ucum": { "unit": "mm", "version": "2.1" }, "description": "depth" }
// ---------------------------------------------------------------------------

/// Unified Code for Units of Measure (https://ucum.org/ucum).
struct Ucum {
    /// Case-sensitive UCUM unit string, possibly with a magnitude term.
    /// Absent means an arbitrary unit of magnitude 1.
    std::optional<std::string> unit;
    std::optional<std::string> version;

    friend bool operator==(const Ucum&, const Ucum&) = default;
};

struct UnitOfMeasurement {
    static constexpr ConventionDefinition definition{
        uuid_literal("3bbe438d-df37-49fe-8e2b-739296d46dfb"),
        "https://raw.githubusercontent.com/clbarnes/zarr-convention-uom/refs/tags/v1/schema.json",
        "https://github.com/clbarnes/zarr-convention-uom/blob/v1/README.md",
        "uom",
        "Units of measurement for Zarr arrays",
    };
    static constexpr std::string_view nested_key = "uom";

    Ucum ucum;
    std::optional<std::string> description;

    [[nodiscard]] JsonValue to_json() const {
        JsonObject u;
        put_optional(u, "unit", ucum.unit);
        put_optional(u, "version", ucum.version);
        JsonObject obj;
        obj["ucum"] = JsonValue{std::move(u)};
        put_optional(obj, "description", description);
        return JsonValue{std::move(obj)};
    }

    [[nodiscard]] static UnitOfMeasurement from_json(const JsonValue& v) {
        (void)expect_object(v, "uom");
        const JsonValue* u = v.find("ucum");
        if (!u)
            throw ConventionError(ErrorKind::decode_mismatch, "missing required field 'ucum'");
        (void)expect_object(*u, "uom.ucum");

        UnitOfMeasurement out;
        out.ucum.unit = optional_field<std::string>(*u, "unit");
        out.ucum.version = optional_field<std::string>(*u, "version");
        out.description = optional_field<std::string>(v, "description");
        return out;
    }

    friend bool operator==(const UnitOfMeasurement&, const UnitOfMeasurement&) = default;
};

} // namespace zconv::conventions
