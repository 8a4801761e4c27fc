#pragma once

/// @file binary_formatter.hpp
/// @brief Compact little-endian formatter (tags are not stored)

#include "formatter.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace brine_pickle {

/// Binary writer: fixed-width little-endian integers, IEEE floats,
/// strings as u32 length + bytes
class BinaryFormatWriter final : public FormatWriter {
public:
    BinaryFormatWriter() = default;

    void write_boolean(std::string_view tag, bool value) override;

    void write_int8(std::string_view tag, std::int8_t value) override;
    void write_int16(std::string_view tag, std::int16_t value) override;
    void write_int32(std::string_view tag, std::int32_t value) override;
    void write_int64(std::string_view tag, std::int64_t value) override;

    void write_uint8(std::string_view tag, std::uint8_t value) override;
    void write_uint16(std::string_view tag, std::uint16_t value) override;
    void write_uint32(std::string_view tag, std::uint32_t value) override;
    void write_uint64(std::string_view tag, std::uint64_t value) override;

    void write_single(std::string_view tag, float value) override;
    void write_double(std::string_view tag, double value) override;

    void write_string(std::string_view tag, std::string_view value) override;

    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const noexcept { return m_buffer; }
    [[nodiscard]] std::size_t size() const noexcept { return m_buffer.size(); }

    /// Move the buffer out, leaving the writer empty
    [[nodiscard]] std::vector<std::uint8_t> take() {
        return std::move(m_buffer);
    }

private:
    void put(std::uint64_t bits, std::size_t width);

    std::vector<std::uint8_t> m_buffer;
};

/// Binary reader over a borrowed byte span
class BinaryFormatReader final : public FormatReader {
public:
    explicit BinaryFormatReader(std::span<const std::uint8_t> data)
        : m_data(data), m_offset(0) {}

    [[nodiscard]] bool read_boolean(std::string_view tag) override;

    [[nodiscard]] std::int8_t read_int8(std::string_view tag) override;
    [[nodiscard]] std::int16_t read_int16(std::string_view tag) override;
    [[nodiscard]] std::int32_t read_int32(std::string_view tag) override;
    [[nodiscard]] std::int64_t read_int64(std::string_view tag) override;

    [[nodiscard]] std::uint8_t read_uint8(std::string_view tag) override;
    [[nodiscard]] std::uint16_t read_uint16(std::string_view tag) override;
    [[nodiscard]] std::uint32_t read_uint32(std::string_view tag) override;
    [[nodiscard]] std::uint64_t read_uint64(std::string_view tag) override;

    [[nodiscard]] float read_single(std::string_view tag) override;
    [[nodiscard]] double read_double(std::string_view tag) override;

    [[nodiscard]] std::string read_string(std::string_view tag) override;

    [[nodiscard]] bool at_end() const override { return m_offset == m_data.size(); }

    [[nodiscard]] std::size_t remaining() const noexcept { return m_data.size() - m_offset; }

private:
    [[nodiscard]] std::uint64_t take(std::string_view tag, std::size_t width);

    std::span<const std::uint8_t> m_data;
    std::size_t m_offset;
};

} // namespace brine_pickle
