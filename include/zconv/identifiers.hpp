#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace zconv {

// ---------------------------------------------------------------------------
// Uuid -- 128-bit identifier in canonical 8-4-4-4-12 text form
// ---------------------------------------------------------------------------

class Uuid final {
public:
    static constexpr std::size_t text_size = 36;

    constexpr Uuid() noexcept = default;
    constexpr explicit Uuid(const std::array<std::uint8_t, 16>& bytes) noexcept : bytes_(bytes) {}

    /// Parse canonical text ("xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx", hex digits
    /// in either case). Returns std::nullopt on anything else.
    [[nodiscard]] static constexpr std::optional<Uuid> parse(std::string_view text) noexcept {
        if (text.size() != text_size) return std::nullopt;
        std::array<std::uint8_t, 16> bytes{};
        std::size_t out = 0;
        for (std::size_t i = 0; i < text_size;) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (text[i] != '-') return std::nullopt;
                ++i;
                continue;
            }
            int hi = hex_value(text[i]);
            int lo = hex_value(text[i + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            bytes[out++] = static_cast<std::uint8_t>((hi << 4) | lo);
            i += 2;
        }
        return Uuid{bytes};
    }

    [[nodiscard]] constexpr const std::array<std::uint8_t, 16>& bytes() const noexcept { return bytes_; }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_)
            if (b != 0) return false;
        return true;
    }

    /// Lowercase canonical text.
    [[nodiscard]] std::string to_string() const {
        constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(text_size);
        for (std::size_t i = 0; i < bytes_.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
            out += digits[bytes_[i] >> 4];
            out += digits[bytes_[i] & 0x0F];
        }
        return out;
    }

    friend constexpr bool operator==(const Uuid&, const Uuid&) = default;
    friend constexpr auto operator<=>(const Uuid&, const Uuid&) = default;

private:
    static constexpr int hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    std::array<std::uint8_t, 16> bytes_{};
};

/// Compile-time UUID literal; malformed text fails to compile.
consteval Uuid uuid_literal(std::string_view text) {
    auto id = Uuid::parse(text);
    if (!id) throw std::invalid_argument("malformed UUID literal");
    return *id;
}

// ---------------------------------------------------------------------------
// Absolute URI check (RFC 3986 scheme followed by a non-empty remainder)
// ---------------------------------------------------------------------------

[[nodiscard]] constexpr bool is_absolute_uri(std::string_view text) noexcept {
    auto alpha = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); };
    auto digit = [](char c) { return c >= '0' && c <= '9'; };

    auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size())
        return false;
    if (!alpha(text[0])) return false;
    for (std::size_t i = 1; i < colon; ++i) {
        char c = text[i];
        if (!alpha(c) && !digit(c) && c != '+' && c != '-' && c != '.') return false;
    }
    for (char c : text) {
        if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7F) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// ConventionId -- one identifying field of a convention
// ---------------------------------------------------------------------------

struct SchemaUrl {
    std::string url;
    friend bool operator==(const SchemaUrl&, const SchemaUrl&) = default;
};

struct SpecUrl {
    std::string url;
    friend bool operator==(const SpecUrl&, const SpecUrl&) = default;
};

using ConventionId = std::variant<Uuid, SchemaUrl, SpecUrl>;

[[nodiscard]] inline std::string to_string(const ConventionId& id) {
    if (auto* u = std::get_if<Uuid>(&id)) return "uuid " + u->to_string();
    if (auto* s = std::get_if<SchemaUrl>(&id)) return "schema_url " + s->url;
    return "spec_url " + std::get<SpecUrl>(id).url;
}

} // namespace zconv
