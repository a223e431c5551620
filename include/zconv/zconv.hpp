#pragma once

// Umbrella header: everything except the test harness.

#include "json.hpp"
#include "log.hpp"
#include "error.hpp"
#include "identifiers.hpp"
#include "value_codec.hpp"
#include "convention.hpp"
#include "registry.hpp"
#include "layout.hpp"
#include "attributes.hpp"
#include "node_io.hpp"
#include "conventions/license.hpp"
#include "conventions/uom.hpp"
#include "conventions/builtin.hpp"
