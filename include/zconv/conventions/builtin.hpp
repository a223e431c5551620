#pragma once
#include "../registry.hpp"
#include "license.hpp"
#include "uom.hpp"

namespace zconv::conventions {

/// Registers the bundled conventions. Idempotent; call once at start-up
/// before parsing documents that should resolve them.
inline void register_builtin(ConventionRegistry& registry = default_registry()) {
    registry.register_convention<License>();
    registry.register_convention<UnitOfMeasurement>();
}

} // namespace zconv::conventions
