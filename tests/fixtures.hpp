#pragma once
#include "zconv/zconv.hpp"
#include <cstdint>
#include <exception>
#include <optional>
#include <string>

// Convention types shared by the test executables.

namespace fixtures {

using namespace zconv;

struct MustBeNested {
    static constexpr ConventionDefinition definition{
        uuid_literal("11111111-1111-1111-1111-111111111111"),
        "https://example.com/schemas/must_be_nested.json",
        "https://example.com/specs/must_be_nested",
        "must_be_nested",
        "A convention that must be represented in nested form.",
    };
    static constexpr std::string_view nested_key = "must_be_nested";

    std::uint8_t a = 0;
    std::uint8_t b = 0;

    JsonValue to_json() const { return json_object({{"a", a}, {"b", b}}); }
    static MustBeNested from_json(const JsonValue& v) {
        return {required_field<std::uint8_t>(v, "a"), required_field<std::uint8_t>(v, "b")};
    }
    friend bool operator==(const MustBeNested&, const MustBeNested&) = default;
};

struct MustBePrefixed {
    static constexpr ConventionDefinition definition{
        uuid_literal("22222222-2222-2222-2222-222222222222"),
        "https://example.com/schemas/must_be_prefixed.json",
        "https://example.com/specs/must_be_prefixed",
        "must_be_prefixed",
        "A convention that must be represented in prefixed form.",
    };
    static constexpr std::string_view prefix = "must_be_prefixed:";

    std::uint8_t x = 0;
    std::uint8_t y = 0;

    JsonValue to_json() const { return json_object({{"x", x}, {"y", y}}); }
    static MustBePrefixed from_json(const JsonValue& v) {
        return {required_field<std::uint8_t>(v, "x"), required_field<std::uint8_t>(v, "y")};
    }
    friend bool operator==(const MustBePrefixed&, const MustBePrefixed&) = default;
};

struct CanBeEither {
    static constexpr ConventionDefinition definition{
        uuid_literal("33333333-3333-3333-3333-333333333333"),
        "https://example.com/schemas/can_be_either.json",
        "https://example.com/specs/can_be_either",
        "can_be_either",
        "A convention that can be represented in either nested or prefixed form.",
    };
    static constexpr std::string_view nested_key = "can_be_either";
    static constexpr std::string_view prefix = "can_be_either:";

    std::uint8_t foo = 0;
    std::uint8_t bar = 0;

    JsonValue to_json() const { return json_object({{"foo", foo}, {"bar", bar}}); }
    static CanBeEither from_json(const JsonValue& v) {
        return {required_field<std::uint8_t>(v, "foo"), required_field<std::uint8_t>(v, "bar")};
    }
    friend bool operator==(const CanBeEither&, const CanBeEither&) = default;
};

// Geospatial projection, nested under "proj" or flattened to "proj:code".
struct Proj {
    static constexpr ConventionDefinition definition{
        uuid_literal("ef154843-db6c-41c3-8ccf-64294a8fa889"),
        "https://raw.githubusercontent.com/zarr-experimental/proj-nested-key/refs/tags/v1/schema.json",
        "https://example.com/specs/proj",
        "proj",
        "Coordinate reference system information for geospatial data, using keyed namespacing.",
    };
    static constexpr std::string_view nested_key = "proj";
    static constexpr std::string_view prefix = "proj:";

    std::string code;

    JsonValue to_json() const { return json_object({{"code", code}}); }
    static Proj from_json(const JsonValue& v) { return {required_field<std::string>(v, "code")}; }
    friend bool operator==(const Proj&, const Proj&) = default;
};

struct Nested {
    static constexpr ConventionDefinition definition{
        uuid_literal("44444444-4444-4444-4444-444444444444"),
        "https://example.com/schema/nested.json",
        "https://example.com/spec/nested",
        "nested",
        "Single-field nested convention.",
    };
    static constexpr std::string_view nested_key = "nested";

    std::string bouba;

    JsonValue to_json() const { return json_object({{"bouba", bouba}}); }
    static Nested from_json(const JsonValue& v) { return {required_field<std::string>(v, "bouba")}; }
    friend bool operator==(const Nested&, const Nested&) = default;
};

struct Either {
    static constexpr ConventionDefinition definition{
        uuid_literal("55555555-5555-5555-5555-555555555555"),
        "https://example.com/schema/either.json",
        "https://example.com/spec/either",
        "either",
        "Convention with both layouts and optional fields.",
    };
    static constexpr std::string_view nested_key = "either";
    static constexpr std::string_view prefix = "either:";

    std::optional<std::string> alice;
    std::optional<std::string> charlie;

    JsonValue to_json() const {
        JsonObject obj;
        put_optional(obj, "alice", alice);
        put_optional(obj, "charlie", charlie);
        return JsonValue{std::move(obj)};
    }
    static Either from_json(const JsonValue& v) {
        return {optional_field<std::string>(v, "alice"), optional_field<std::string>(v, "charlie")};
    }
    friend bool operator==(const Either&, const Either&) = default;
};

// Serializes to a bare string, which neither layout can hold.
struct Scalar {
    static constexpr ConventionDefinition definition{
        uuid_literal("66666666-6666-6666-6666-666666666666"),
        "https://example.com/schema/scalar.json",
        "https://example.com/spec/scalar",
        "scalar",
        "Convention whose payload is not an object.",
    };
    static constexpr std::string_view nested_key = "scalar";
    static constexpr std::string_view prefix = "scalar:";

    JsonValue to_json() const { return JsonValue{"flat"}; }
    static Scalar from_json(const JsonValue&) { return {}; }
};

/// Registry holding every fixture type above.
inline ConventionRegistry& fixture_registry() {
    static ConventionRegistry r;
    static const bool once = [] {
        r.register_convention<MustBeNested>();
        r.register_convention<MustBePrefixed>();
        r.register_convention<CanBeEither>();
        r.register_convention<Proj>();
        r.register_convention<Nested>();
        r.register_convention<Either>();
        return true;
    }();
    (void)once;
    return r;
}

/// Name of the ErrorKind f throws, "nothing" if it returns, or
/// "other: <what>" for a non-ConventionError exception.
template <typename F>
std::string thrown_kind(F&& f) {
    try {
        f();
    } catch (const ConventionError& e) {
        return std::string(error_kind_name(e.kind()));
    } catch (const std::exception& e) {
        return std::string("other: ") + e.what();
    }
    return "nothing";
}

} // namespace fixtures
