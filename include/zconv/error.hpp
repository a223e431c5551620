#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace zconv {

// ---------------------------------------------------------------------------
// ErrorKind
// ---------------------------------------------------------------------------

enum class ErrorKind : std::uint8_t {
    /// A zarr_conventions entry has the wrong shape or no identifier.
    malformed_manifest_entry,
    /// Convention data is present but does not decode as the requested type.
    decode_mismatch,
    /// Both the nested and the prefixed form of one convention are present.
    representation_conflict,
    /// A builder write targets a key that is already taken.
    key_collision,
    /// The builder configuration leaves a manifest entry without identifiers.
    invalid_builder_configuration,
    /// The convention type does not declare the requested layout.
    unsupported_layout,
    /// An identifier is already registered with a different definition.
    registry_conflict
};

[[nodiscard]] constexpr std::string_view error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::malformed_manifest_entry:      return "malformed_manifest_entry";
        case ErrorKind::decode_mismatch:               return "decode_mismatch";
        case ErrorKind::representation_conflict:       return "representation_conflict";
        case ErrorKind::key_collision:                 return "key_collision";
        case ErrorKind::invalid_builder_configuration: return "invalid_builder_configuration";
        case ErrorKind::unsupported_layout:            return "unsupported_layout";
        case ErrorKind::registry_conflict:             return "registry_conflict";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// ConventionError
// ---------------------------------------------------------------------------

class ConventionError final : public std::runtime_error {
public:
    ConventionError(ErrorKind kind, const std::string& message)
        : std::runtime_error("zconv: " + message), kind_(kind), message_(message) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    /// The message without the "zconv: " prefix, for wrapping into outer errors.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    ErrorKind kind_;
    std::string message_;
};

} // namespace zconv
