#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for brine_core module

#include <cstdint>

namespace brine_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct PicklerError;
struct FormatError;
struct TypeRegistryError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

enum class LogChannel : std::uint8_t;
struct LogConfig;

// =============================================================================
// Type Registry
// =============================================================================

struct TypeInfo;
class TypeRegistry;

} // namespace brine_core
