#include "fixtures.hpp"
#include <zconv/test.hpp>
#include <string>
#include <vector>

using namespace zconv;
using namespace fixtures;

namespace {

// Claims Proj's nested key under a different identity.
struct ProjLookalike {
    static constexpr ConventionDefinition definition{
        uuid_literal("abababab-abab-abab-abab-abababababab"),
        "https://example.com/schema/lookalike.json",
        "https://example.com/spec/lookalike",
        "lookalike",
        "Shares a key with proj.",
    };
    static constexpr std::string_view nested_key = "proj";
    static constexpr std::string_view prefix = "proj:";

    JsonValue to_json() const { return json_object({{"code", "x"}}); }
    static ProjLookalike from_json(const JsonValue&) { return {}; }
};

AttributesParser reparse(JsonValue document) {
    return AttributesParser{std::move(document), fixture_registry()};
}

std::vector<std::string> manifest_names(const JsonValue& document) {
    std::vector<std::string> names;
    for (const auto& entry : document.find(manifest_key)->as_array())
        names.push_back(entry.find("name")->as_string());
    return names;
}

} // namespace

// ===========================================================================
// Round trips
// ===========================================================================

TEST_CASE("builder: round trip in every supported layout") {
    SECTION("nested") {
        AttributesBuilder b;
        b.add_nested(MustBeNested{1, 2});
        auto doc = std::move(b).build();
        REQUIRE(reparse(doc).parse_nested<MustBeNested>() == (MustBeNested{1, 2}));
    }
    SECTION("prefixed") {
        AttributesBuilder b;
        b.add_prefixed(MustBePrefixed{3, 4});
        auto doc = std::move(b).build();
        REQUIRE(doc.find("must_be_prefixed:x") != nullptr);
        REQUIRE(reparse(doc).parse_prefixed<MustBePrefixed>() == (MustBePrefixed{3, 4}));
    }
    SECTION("either, nested") {
        AttributesBuilder b;
        b.add_nested(Either{"bob", "dan"});
        auto doc = std::move(b).build();
        REQUIRE(reparse(doc).parse<Either>() == (Either{"bob", "dan"}));
    }
    SECTION("either, prefixed with an empty field") {
        AttributesBuilder b;
        b.add_prefixed(Either{std::nullopt, "dan"});
        auto doc = std::move(b).build();
        REQUIRE(doc.find("either:alice") == nullptr);
        REQUIRE(reparse(doc).parse_prefixed<Either>() == (Either{std::nullopt, "dan"}));
    }
}

TEST_CASE("builder: everything together survives JSON text") {
    AttributesBuilder b;
    b.add_nested(MustBeNested{1, 2})
     .add_prefixed(MustBePrefixed{3, 4})
     .add_attribute("other_key", "other_value")
     .add_prefixed(CanBeEither{5, 6});
    auto text = json_serialize(std::move(b).build(), 2);

    auto parser = AttributesParser::from_json_text(text, fixture_registry());
    REQUIRE(parser.in_use<MustBeNested>());
    REQUIRE(parser.in_use<MustBePrefixed>());
    REQUIRE(parser.in_use<CanBeEither>());
    REQUIRE(parser.parse_nested<MustBeNested>() == (MustBeNested{1, 2}));
    REQUIRE(parser.parse_prefixed<MustBePrefixed>() == (MustBePrefixed{3, 4}));
    REQUIRE(parser.parse<CanBeEither>() == (CanBeEither{5, 6}));
    REQUIRE_EQ(parser.get<std::string>("other_key"), std::optional<std::string>("other_value"));
}

TEST_CASE("builder: empty build has no manifest") {
    auto doc = AttributesBuilder{}.build();
    REQUIRE(doc.is_object());
    REQUIRE(doc.empty());

    AttributesBuilder b;
    b.add_attribute("k", 1);
    auto untyped_only = std::move(b).build();
    REQUIRE(untyped_only == json_object({{"k", 1}}));

    auto parser = reparse(doc);
    REQUIRE(!parser.parse_nested<Proj>().has_value());
    REQUIRE(!parser.parse_prefixed<Proj>().has_value());
    REQUIRE(!parser.parse<Proj>().has_value());
}

// ===========================================================================
// Manifest
// ===========================================================================

TEST_CASE("builder: one manifest entry per convention, in order added") {
    AttributesBuilder b;
    b.add_prefixed(Proj{"EPSG:4326"})
     .add_attribute("title", "scan")
     .add_nested(Nested{"kiki"})
     .add_prefixed(Proj{"EPSG:3857"})
     .add_nested(MustBeNested{0, 0});
    auto doc = std::move(b).build();

    auto names = manifest_names(doc);
    REQUIRE_EQ(names.size(), std::size_t{3});
    REQUIRE_EQ(names[0], std::string("proj"));
    REQUIRE_EQ(names[1], std::string("nested"));
    REQUIRE_EQ(names[2], std::string("must_be_nested"));

    // The second Proj replaced the first payload.
    REQUIRE(doc.find("proj:code")->as_string() == "EPSG:3857");
}

TEST_CASE("builder: default entries carry every definition field") {
    AttributesBuilder b;
    b.add_nested(Nested{"kiki"});
    auto doc = std::move(b).build();
    const auto& entry = doc.find(manifest_key)->as_array().at(0);
    REQUIRE(entry == ManifestEntry::from_definition(Nested::definition).to_json());
}

TEST_CASE("builder: configuration selects manifest fields") {
    AttributesBuilder b;
    b.include_uuid(false)
     .include_spec_url(false)
     .include_name(false)
     .include_description(false)
     .add_nested(Nested{"bouba"});
    auto doc = std::move(b).build();
    const auto& entry = doc.find(manifest_key)->as_array().at(0);
    REQUIRE(entry == json_object({{"schema_url", "https://example.com/schema/nested.json"}}));

    AttributesBuilder only_uuid{BuilderConfig{
        .include_uuid = true,
        .include_schema_url = false,
        .include_spec_url = false,
        .include_name = false,
        .include_description = false,
    }};
    only_uuid.add_prefixed(Proj{"EPSG:4326"});
    auto uuid_only = std::move(only_uuid).build();
    REQUIRE(uuid_only.find(manifest_key)->as_array().at(0) ==
            json_object({{"uuid", "ef154843-db6c-41c3-8ccf-64294a8fa889"}}));
}

TEST_CASE("builder: config defaults") {
    BuilderConfig c;
    REQUIRE(c.include_uuid && c.include_schema_url && c.include_spec_url);
    REQUIRE(c.include_name && c.include_description);
    REQUIRE(c.has_identifier());
}

TEST_CASE("builder: no identifier fields is an invalid configuration") {
    AttributesBuilder b;
    b.include_uuid(false).include_schema_url(false).include_spec_url(false);

    REQUIRE_EQ(thrown_kind([&] { b.add_nested(Nested{"kiki"}); }),
               std::string("invalid_builder_configuration"));
    REQUIRE_EQ(thrown_kind([&] { b.add_prefixed(Proj{"EPSG:4326"}); }),
               std::string("invalid_builder_configuration"));

    // Untyped attributes need no manifest entry.
    REQUIRE_NOTHROW(b.add_attribute("k", true));
    REQUIRE(std::move(b).build() == json_object({{"k", true}}));
}

TEST_CASE("builder: disabling identifiers after adding fails the build") {
    AttributesBuilder b;
    b.add_nested(Nested{"kiki"});
    b.config(BuilderConfig{.include_uuid = false, .include_schema_url = false, .include_spec_url = false});
    REQUIRE_EQ(thrown_kind([&] { (void)std::move(b).build(); }),
               std::string("invalid_builder_configuration"));
}

// ===========================================================================
// Collisions
// ===========================================================================

TEST_CASE("builder: add_attribute collisions") {
    const std::string collision = "key_collision";

    SECTION("reserved manifest key") {
        AttributesBuilder b;
        CHECK_EQ(thrown_kind([&] { b.add_attribute("zarr_conventions", json_array({})); }), collision);
    }
    SECTION("repeated key") {
        AttributesBuilder b;
        b.add_attribute("k", 1);
        CHECK_EQ(thrown_kind([&] { b.add_attribute("k", 2); }), collision);
    }
    SECTION("nested convention key") {
        AttributesBuilder b;
        b.add_nested(Proj{"EPSG:4326"});
        CHECK_EQ(thrown_kind([&] { b.add_attribute("proj", 1); }), collision);
        // The unused prefixed form stays reserved.
        CHECK_EQ(thrown_kind([&] { b.add_attribute("proj:other", 1); }), collision);
        CHECK_EQ(thrown_kind([&] { b.add_attribute("projection", 1); }), std::string("nothing"));
    }
    SECTION("under a prefixed convention") {
        AttributesBuilder b;
        b.add_prefixed(Proj{"EPSG:4326"});
        CHECK_EQ(thrown_kind([&] { b.add_attribute("proj:code", 1); }), collision);
        CHECK_EQ(thrown_kind([&] { b.add_attribute("proj:wkt2", 1); }), collision);
        // The unused nested form stays reserved.
        CHECK_EQ(thrown_kind([&] { b.add_attribute("proj", 1); }), collision);
    }
    SECTION("nested-only conventions reserve no prefix") {
        AttributesBuilder b;
        b.add_nested(MustBeNested{1, 2});
        CHECK_EQ(thrown_kind([&] { b.add_attribute("must_be_nested:a", 1); }), std::string("nothing"));
    }
}

TEST_CASE("builder: output never holds both layouts of one convention") {
    SECTION("attribute after the convention") {
        AttributesBuilder b;
        b.add_nested(Proj{"EPSG:4326"});
        CHECK_THROWS(b.add_attribute("proj:other", 1));
        auto doc = std::move(b).build();
        REQUIRE(reparse(doc).parse<Proj>() == (Proj{"EPSG:4326"}));
    }
    SECTION("attribute before the convention") {
        AttributesBuilder b;
        b.add_attribute("proj:other", 1);
        REQUIRE_EQ(thrown_kind([&] { b.add_nested(Proj{"EPSG:4326"}); }), std::string("key_collision"));
        auto doc = std::move(b).build();
        REQUIRE(doc.find(manifest_key) == nullptr);
        REQUIRE(!reparse(doc).parse<Proj>().has_value());
    }
    SECTION("prefixed convention, then a nested attribute") {
        AttributesBuilder b;
        b.add_prefixed(Either{"bob", std::nullopt});
        REQUIRE_EQ(thrown_kind([&] { b.add_attribute("either", json_object({})); }),
                   std::string("key_collision"));
        auto doc = std::move(b).build();
        REQUIRE(reparse(doc).parse<Either>() == (Either{"bob", std::nullopt}));
    }
    SECTION("different conventions sharing a key") {
        AttributesBuilder b;
        b.add_nested(Proj{"EPSG:4326"});
        REQUIRE_EQ(thrown_kind([&] { b.add_prefixed(ProjLookalike{}); }), std::string("key_collision"));
    }
}

TEST_CASE("builder: convention collisions") {
    const std::string collision = "key_collision";

    SECTION("nested key already an attribute") {
        AttributesBuilder b;
        b.add_attribute("proj", "EPSG:4326");
        CHECK_EQ(thrown_kind([&] { b.add_nested(Proj{"EPSG:4326"}); }), collision);
    }
    SECTION("prefix covers an existing attribute") {
        AttributesBuilder b;
        b.add_attribute("either:alice", "eve");
        // Only either:charlie would be written, but either:alice sits under the prefix.
        CHECK_EQ(thrown_kind([&] { b.add_prefixed(Either{std::nullopt, "dan"}); }), collision);
    }
    SECTION("nested key owned by a different convention") {
        AttributesBuilder b;
        b.add_nested(Proj{"EPSG:4326"});
        CHECK_EQ(thrown_kind([&] { b.add_nested(ProjLookalike{}); }), collision);
    }
    SECTION("prefix owned by a different convention") {
        AttributesBuilder b;
        b.add_prefixed(Proj{"EPSG:4326"});
        CHECK_EQ(thrown_kind([&] { b.add_prefixed(ProjLookalike{}); }), collision);
    }
    SECTION("same convention in the other layout") {
        AttributesBuilder b;
        b.add_nested(CanBeEither{1, 2});
        CHECK_EQ(thrown_kind([&] { b.add_prefixed(CanBeEither{1, 2}); }), collision);
    }
}

TEST_CASE("builder: unsupported layouts") {
    AttributesBuilder b;
    REQUIRE_EQ(thrown_kind([&] { b.add_prefixed(MustBeNested{1, 2}); }), std::string("unsupported_layout"));
    REQUIRE_EQ(thrown_kind([&] { b.add_nested(MustBePrefixed{1, 2}); }), std::string("unsupported_layout"));
    REQUIRE_EQ(thrown_kind([&] { b.add(Nested{"k"}, LayoutStrategy::prefixed); }),
               std::string("unsupported_layout"));
}

TEST_CASE("builder: a prefixed payload with no fields is rejected") {
    AttributesBuilder b;
    REQUIRE_EQ(thrown_kind([&] { b.add_prefixed(Either{}); }), std::string("decode_mismatch"));

    // Nothing was recorded, so the document stays consistent.
    auto doc = std::move(b).build();
    REQUIRE(doc.empty());

    // The nested form of the same value is still an object and round-trips.
    AttributesBuilder nested;
    nested.add_nested(Either{});
    auto nested_doc = std::move(nested).build();
    REQUIRE(reparse(nested_doc).parse_nested<Either>() == Either{});
}

TEST_CASE("builder: non-object payloads are rejected") {
    AttributesBuilder b;
    REQUIRE_EQ(thrown_kind([&] { b.add_nested(Scalar{}); }), std::string("decode_mismatch"));
    REQUIRE_EQ(thrown_kind([&] { b.add_prefixed(Scalar{}); }), std::string("decode_mismatch"));
}

TEST_CASE("builder: a failed add leaves the builder usable and unchanged") {
    AttributesBuilder b;
    b.add_prefixed(Proj{"EPSG:4326"});
    b.add_attribute("title", "scan");

    CHECK_THROWS(b.add_nested(Proj{"EPSG:3857"}));
    CHECK_THROWS(b.add_attribute("proj:code", "EPSG:3857"));
    CHECK_THROWS(b.add_nested(MustBePrefixed{}));

    b.add_nested(Nested{"kiki"});
    auto doc = std::move(b).build();

    REQUIRE_EQ(manifest_names(doc).size(), std::size_t{2});
    REQUIRE(doc.find("proj:code")->as_string() == "EPSG:4326");
    REQUIRE(doc.find("proj") == nullptr);
    REQUIRE(reparse(doc).parse<Nested>() == (Nested{"kiki"}));
}

TEST_CASE("builder: additions are traced") {
    std::vector<std::string> lines;
    ScopedLogLevel level(LogLevel::trace);
    Logger::set_stderr(false);
    Logger::set_sink([&](LogLevel, std::string_view line) { lines.emplace_back(line); });
    AttributesBuilder b;
    b.add_nested(Nested{"a"});
    b.add_nested(Nested{"b"});
    Logger::set_sink(nullptr);
    Logger::set_stderr(true);

    REQUIRE_EQ(lines.size(), std::size_t{2});
    REQUIRE(lines[0].find("zconv.builder: added convention 'nested'") != std::string::npos);
    REQUIRE(lines[1].find("zconv.builder: replaced payload of convention 'nested'") != std::string::npos);
}

ZCONV_TEST_MAIN()
