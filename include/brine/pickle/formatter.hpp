#pragma once

/// @file formatter.hpp
/// @brief Primitive wire formatter boundary
///
/// Formatters write and read primitive fields strictly in sequence. Every
/// field carries a tag; self-describing formats record and verify it,
/// compact formats ignore it.

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace brine_pickle {

// =============================================================================
// FormatWriter
// =============================================================================

/// Sequential primitive writer
class FormatWriter {
public:
    virtual ~FormatWriter() = default;

    virtual void write_boolean(std::string_view tag, bool value) = 0;

    virtual void write_int8(std::string_view tag, std::int8_t value) = 0;
    virtual void write_int16(std::string_view tag, std::int16_t value) = 0;
    virtual void write_int32(std::string_view tag, std::int32_t value) = 0;
    virtual void write_int64(std::string_view tag, std::int64_t value) = 0;

    virtual void write_uint8(std::string_view tag, std::uint8_t value) = 0;
    virtual void write_uint16(std::string_view tag, std::uint16_t value) = 0;
    virtual void write_uint32(std::string_view tag, std::uint32_t value) = 0;
    virtual void write_uint64(std::string_view tag, std::uint64_t value) = 0;

    virtual void write_single(std::string_view tag, float value) = 0;
    virtual void write_double(std::string_view tag, double value) = 0;

    virtual void write_string(std::string_view tag, std::string_view value) = 0;
};

// =============================================================================
// FormatReader
// =============================================================================

/// Sequential primitive reader. Implementations throw PicklerException
/// carrying a FormatError on truncated or malformed input.
class FormatReader {
public:
    virtual ~FormatReader() = default;

    [[nodiscard]] virtual bool read_boolean(std::string_view tag) = 0;

    [[nodiscard]] virtual std::int8_t read_int8(std::string_view tag) = 0;
    [[nodiscard]] virtual std::int16_t read_int16(std::string_view tag) = 0;
    [[nodiscard]] virtual std::int32_t read_int32(std::string_view tag) = 0;
    [[nodiscard]] virtual std::int64_t read_int64(std::string_view tag) = 0;

    [[nodiscard]] virtual std::uint8_t read_uint8(std::string_view tag) = 0;
    [[nodiscard]] virtual std::uint16_t read_uint16(std::string_view tag) = 0;
    [[nodiscard]] virtual std::uint32_t read_uint32(std::string_view tag) = 0;
    [[nodiscard]] virtual std::uint64_t read_uint64(std::string_view tag) = 0;

    [[nodiscard]] virtual float read_single(std::string_view tag) = 0;
    [[nodiscard]] virtual double read_double(std::string_view tag) = 0;

    [[nodiscard]] virtual std::string read_string(std::string_view tag) = 0;

    /// True once every field has been consumed
    [[nodiscard]] virtual bool at_end() const = 0;
};

} // namespace brine_pickle
