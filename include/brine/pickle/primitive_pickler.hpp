#pragma once

/// @file primitive_pickler.hpp
/// @brief Leaf picklers for bool, integral types, float, double and std::string

#include "pickler.hpp"
#include <cstdint>
#include <string>
#include <type_traits>

namespace brine_pickle {

template<typename T>
inline constexpr bool is_primitive_v =
    std::is_same_v<T, bool> ||
    std::is_integral_v<T> ||
    std::is_same_v<T, float> ||
    std::is_same_v<T, double> ||
    std::is_same_v<T, std::string>;

namespace detail {

/// Integral types are encoded by width and signedness
template<typename T>
void write_primitive(FormatWriter& out, std::string_view tag, const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        out.write_boolean(tag, value);
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) {
            out.write_int8(tag, static_cast<std::int8_t>(value));
        } else if constexpr (sizeof(T) == 2) {
            out.write_int16(tag, static_cast<std::int16_t>(value));
        } else if constexpr (sizeof(T) == 4) {
            out.write_int32(tag, static_cast<std::int32_t>(value));
        } else {
            static_assert(sizeof(T) == 8, "unsupported integral width");
            out.write_int64(tag, static_cast<std::int64_t>(value));
        }
    } else if constexpr (std::is_integral_v<T>) {
        if constexpr (sizeof(T) == 1) {
            out.write_uint8(tag, static_cast<std::uint8_t>(value));
        } else if constexpr (sizeof(T) == 2) {
            out.write_uint16(tag, static_cast<std::uint16_t>(value));
        } else if constexpr (sizeof(T) == 4) {
            out.write_uint32(tag, static_cast<std::uint32_t>(value));
        } else {
            static_assert(sizeof(T) == 8, "unsupported integral width");
            out.write_uint64(tag, static_cast<std::uint64_t>(value));
        }
    } else if constexpr (std::is_same_v<T, float>) {
        out.write_single(tag, value);
    } else if constexpr (std::is_same_v<T, double>) {
        out.write_double(tag, value);
    } else {
        out.write_string(tag, value);
    }
}

template<typename T>
T read_primitive(FormatReader& in, std::string_view tag) {
    if constexpr (std::is_same_v<T, bool>) {
        return in.read_boolean(tag);
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) {
            return static_cast<T>(in.read_int8(tag));
        } else if constexpr (sizeof(T) == 2) {
            return static_cast<T>(in.read_int16(tag));
        } else if constexpr (sizeof(T) == 4) {
            return static_cast<T>(in.read_int32(tag));
        } else {
            return static_cast<T>(in.read_int64(tag));
        }
    } else if constexpr (std::is_integral_v<T>) {
        if constexpr (sizeof(T) == 1) {
            return static_cast<T>(in.read_uint8(tag));
        } else if constexpr (sizeof(T) == 2) {
            return static_cast<T>(in.read_uint16(tag));
        } else if constexpr (sizeof(T) == 4) {
            return static_cast<T>(in.read_uint32(tag));
        } else {
            return static_cast<T>(in.read_uint64(tag));
        }
    } else if constexpr (std::is_same_v<T, float>) {
        return in.read_single(tag);
    } else if constexpr (std::is_same_v<T, double>) {
        return in.read_double(tag);
    } else {
        return in.read_string(tag);
    }
}

} // namespace detail

// =============================================================================
// PrimitivePickler
// =============================================================================

struct PrimitivePickler {
    template<typename T>
    [[nodiscard]] static std::shared_ptr<Pickler<T>> create() {
        static_assert(is_primitive_v<T>, "not a primitive type");

        return CompositePickler<T>::create(
            [](ReadState& state, std::string_view tag) -> T {
                return detail::read_primitive<T>(state.formatter(), tag);
            },
            [](WriteState& state, std::string_view tag, const T& value) {
                detail::write_primitive<T>(state.formatter(), tag, value);
            },
            [](CloneState&, const T& value) -> T { return value; },
            [](VisitState&, const T&) {},
            PicklerInfo::Primitive, false, false);
    }
};

} // namespace brine_pickle
