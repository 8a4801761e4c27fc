#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for brine_pickle module

#include <cstdint>
#include <memory>

namespace brine_pickle {

// =============================================================================
// Errors
// =============================================================================

class PicklerException;

// =============================================================================
// Formatters
// =============================================================================

class FormatWriter;
class FormatReader;
class BinaryFormatWriter;
class BinaryFormatReader;
class JsonFormatWriter;
class JsonFormatReader;

// =============================================================================
// State Objects
// =============================================================================

class WriteState;
class ReadState;
class CloneState;
class VisitState;
class ObjectVisitor;

// =============================================================================
// Runtime Values
// =============================================================================

class ObjectRef;
class MethodInfo;
class MethodRegistry;
using MethodHandle = std::shared_ptr<const MethodInfo>;

template<typename Signature>
class Delegate;

// =============================================================================
// Picklers
// =============================================================================

enum class PicklerInfo : std::uint8_t;
class PicklerBase;

template<typename T>
class Pickler;

template<typename T>
class CompositePickler;

template<typename T>
class ForwardingPickler;

class PicklerResolver;

// =============================================================================
// Facade
// =============================================================================

enum class FormatKind : std::uint8_t;
struct SerializerConfig;
class Serializer;

} // namespace brine_pickle
