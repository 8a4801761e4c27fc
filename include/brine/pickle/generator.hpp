#pragma once

/// @file generator.hpp
/// @brief Shape selection: which combinator builds the pickler for T
///
/// The shape is a compile-time property of T, decided once per type when
/// the resolver misses its cache. Custom factories take precedence and are
/// handled by the resolver before the generator runs.

#include "abstract_pickler.hpp"
#include "delegate_pickler.hpp"
#include "enum_pickler.hpp"
#include "nullable_pickler.hpp"
#include "object_pickler.hpp"
#include "primitive_pickler.hpp"
#include "reference_pickler.hpp"
#include "resolver.hpp"
#include "sequence_pickler.hpp"
#include <memory>
#include <optional>
#include <type_traits>
#include <vector>

namespace brine_pickle {

// =============================================================================
// Type Traits
// =============================================================================

template<typename T>
struct is_optional : std::false_type {};

template<typename V>
struct is_optional<std::optional<V>> : std::true_type {};

template<typename T>
struct is_shared_ptr : std::false_type {};

template<typename V>
struct is_shared_ptr<std::shared_ptr<V>> : std::true_type {};

template<typename T>
struct is_vector : std::false_type {};

template<typename V>
struct is_vector<std::vector<V>> : std::true_type {};

template<typename T>
struct is_delegate : std::false_type {};

template<typename Sig>
struct is_delegate<Delegate<Sig>> : std::true_type {};

// =============================================================================
// PicklerShape
// =============================================================================

enum class PicklerShape : std::uint8_t {
    Primitive,
    Enum,
    Optional,
    Delegate,
    Object,
    Method,
    SharedReference,
    Abstract,
    Sequence,
    Unsupported,
};

[[nodiscard]] inline const char* pickler_shape_name(PicklerShape shape) {
    switch (shape) {
        case PicklerShape::Primitive: return "primitive";
        case PicklerShape::Enum: return "enum";
        case PicklerShape::Optional: return "optional";
        case PicklerShape::Delegate: return "delegate";
        case PicklerShape::Object: return "object reference";
        case PicklerShape::Method: return "method descriptor";
        case PicklerShape::SharedReference: return "shared reference";
        case PicklerShape::Abstract: return "abstract placeholder";
        case PicklerShape::Sequence: return "sequence";
        case PicklerShape::Unsupported: return "unsupported";
        default: return "unknown";
    }
}

template<typename T>
[[nodiscard]] constexpr PicklerShape shape_of() {
    if constexpr (is_primitive_v<T>) {
        return PicklerShape::Primitive;
    } else if constexpr (std::is_enum_v<T>) {
        return PicklerShape::Enum;
    } else if constexpr (std::is_same_v<T, ObjectRef>) {
        return PicklerShape::Object;
    } else if constexpr (std::is_same_v<T, MethodHandle>) {
        return PicklerShape::Method;
    } else if constexpr (is_optional<T>::value) {
        return PicklerShape::Optional;
    } else if constexpr (is_delegate<T>::value) {
        return PicklerShape::Delegate;
    } else if constexpr (is_shared_ptr<T>::value) {
        using V = typename T::element_type;
        if constexpr (std::is_void_v<V> || std::is_function_v<V> || std::is_array_v<V>) {
            return PicklerShape::Unsupported;
        } else if constexpr (std::is_abstract_v<V>) {
            return PicklerShape::Abstract;
        } else {
            return PicklerShape::SharedReference;
        }
    } else if constexpr (is_vector<T>::value) {
        return PicklerShape::Sequence;
    } else {
        return PicklerShape::Unsupported;
    }
}

// =============================================================================
// generate_pickler
// =============================================================================

template<typename T>
std::shared_ptr<Pickler<T>> generate_pickler(PicklerResolver& resolver) {
    constexpr PicklerShape shape = shape_of<T>();
    const std::string name = brine_core::type_name_of<T>();
    resolver_log()->debug("Generating {} pickler for '{}'", pickler_shape_name(shape), name);

    if constexpr (shape == PicklerShape::Primitive) {
        return PrimitivePickler::create<T>();
    } else if constexpr (shape == PicklerShape::Enum) {
        return EnumPickler::create<T>(resolver);
    } else if constexpr (shape == PicklerShape::Object) {
        return ObjectPickler::create(resolver);
    } else if constexpr (shape == PicklerShape::Method) {
        return MethodPickler::create(resolver);
    } else if constexpr (shape == PicklerShape::Optional) {
        using V = typename T::value_type;
        if constexpr (std::is_pointer_v<V>) {
            throw PicklerException(brine_core::PicklerError::generation_failed(
                name, "raw pointers are not supported"));
        } else if constexpr (!std::is_default_constructible_v<V>) {
            throw PicklerException(brine_core::PicklerError::generation_failed(
                name, "no accessible constructor"));
        } else {
            return NullMarkerPickler::create_optional<V>(resolver);
        }
    } else if constexpr (shape == PicklerShape::Delegate) {
        return DelegatePickler::create<T>(resolver);
    } else if constexpr (shape == PicklerShape::Abstract) {
        return AbstractPickler<typename T::element_type>::create();
    } else if constexpr (shape == PicklerShape::SharedReference) {
        return ReferencePickler::create<typename T::element_type>(resolver);
    } else if constexpr (shape == PicklerShape::Sequence) {
        return SequencePickler::create<typename T::value_type>(resolver);
    } else if constexpr (std::is_pointer_v<T>) {
        throw PicklerException(brine_core::PicklerError::generation_failed(
            name, "raw pointers are not supported"));
    } else if constexpr (!std::is_default_constructible_v<T>) {
        throw PicklerException(brine_core::PicklerError::generation_failed(
            name, "no accessible constructor"));
    } else {
        throw PicklerException(brine_core::PicklerError::generation_failed(
            name, "no pickler factory registered"));
    }
}

} // namespace brine_pickle
