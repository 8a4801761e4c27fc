#pragma once

/// @file core.hpp
/// @brief Main include file for brine_core module
///
/// This header includes all brine_core components in dependency order.

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include "type_registry.hpp"

/// @namespace brine_core
/// @brief Shared infrastructure for the brine pickler engine
///
/// - **Error Handling**: Error variant with context, Result<T>
/// - **Logging**: spdlog named loggers and level management
/// - **Type Registry**: demangled type names and stable type naming
///
/// Example usage:
/// @code
/// #include <brine/core/core.hpp>
///
/// using namespace brine_core;
///
/// TypeRegistry registry;
/// register_builtin_types(registry);
/// if (auto r = registry.register_with_name<Point>("geo.Point"); r.is_err()) {
///     get_logger("geo")->error("{}", build_error_chain(r.error()));
/// }
/// @endcode

namespace brine_core {

/// Library version string
[[nodiscard]] inline const char* version_string() noexcept {
    return "brine_core 0.1.0";
}

} // namespace brine_core
