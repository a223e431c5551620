#pragma once
#include "../convention.hpp"
#include "../error.hpp"
#include "../identifiers.hpp"
#include "../value_codec.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace zconv::conventions {

// ---------------------------------------------------------------------------
// License -- dataset licensing information
//
//   "license": { "spdx": "CC-BY-4.0" }
//
// At least one of spdx, url, text, file, path is set; the preferred order is
// spdx > url > text > file > path.
// ---------------------------------------------------------------------------

class License final {
public:
    static constexpr ConventionDefinition definition{
        uuid_literal("b77365e5-2b0c-4141-b917-c03b7c68e935"),
        "https://raw.githubusercontent.com/clbarnes/zarr-convention-license/refs/tags/v1/schema.json",
        "https://github.com/clbarnes/zarr-convention-license/blob/v1/README.md",
        "license",
        "Dataset licensing information.",
    };
    static constexpr std::string_view nested_key = "license";

    struct Fields {
        std::optional<std::string> spdx;
        std::optional<std::string> url;
        std::optional<std::string> text;
        std::optional<std::string> file;
        std::optional<std::string> path;
    };

    /// Throws decode_mismatch if no field is set or url is not absolute.
    explicit License(Fields fields) : f_(std::move(fields)) {
        if (!f_.spdx && !f_.url && !f_.text && !f_.file && !f_.path)
            throw ConventionError(ErrorKind::decode_mismatch,
                                  "license needs one of spdx, url, text, file, path");
        if (f_.url && !is_absolute_uri(*f_.url))
            throw ConventionError(ErrorKind::decode_mismatch,
                                  "license url is not an absolute URI: " + *f_.url);
    }

    /// SPDX identifier; should not be a multi-license expression.
    [[nodiscard]] static License spdx(std::string identifier) { return License{Fields{.spdx = std::move(identifier)}}; }
    /// URL of the full license text.
    [[nodiscard]] static License url(std::string url) { return License{Fields{.url = std::move(url)}}; }
    /// Full license text.
    [[nodiscard]] static License text(std::string text) { return License{Fields{.text = std::move(text)}}; }
    /// Relative path to an object holding the license text.
    [[nodiscard]] static License file(std::string file) { return License{Fields{.file = std::move(file)}}; }
    /// Relative path to a Zarr node whose license also applies here.
    [[nodiscard]] static License path(std::string path) { return License{Fields{.path = std::move(path)}}; }

    [[nodiscard]] const Fields& fields() const noexcept { return f_; }

    /// Copy keeping only the most preferred form that is set.
    [[nodiscard]] License shortest() const {
        Fields f;
        if (f_.spdx) f.spdx = f_.spdx;
        else if (f_.url) f.url = f_.url;
        else if (f_.text) f.text = f_.text;
        else if (f_.file) f.file = f_.file;
        else f.path = f_.path;
        return License{std::move(f)};
    }

    [[nodiscard]] JsonValue to_json() const {
        JsonObject obj;
        put_optional(obj, "spdx", f_.spdx);
        put_optional(obj, "url", f_.url);
        put_optional(obj, "text", f_.text);
        put_optional(obj, "file", f_.file);
        put_optional(obj, "path", f_.path);
        return JsonValue{std::move(obj)};
    }

    [[nodiscard]] static License from_json(const JsonValue& v) {
        (void)expect_object(v, "license");
        return License{Fields{
            optional_field<std::string>(v, "spdx"),
            optional_field<std::string>(v, "url"),
            optional_field<std::string>(v, "text"),
            optional_field<std::string>(v, "file"),
            optional_field<std::string>(v, "path"),
        }};
    }

    friend bool operator==(const License& a, const License& b) {
        return a.f_.spdx == b.f_.spdx && a.f_.url == b.f_.url && a.f_.text == b.f_.text &&
               a.f_.file == b.f_.file && a.f_.path == b.f_.path;
    }

private:
    Fields f_;
};

} // namespace zconv::conventions
