/// @file binary_formatter.cpp
/// @brief Little-endian binary formatter

#include <brine/pickle/binary_formatter.hpp>
#include <brine/pickle/exception.hpp>
#include <bit>
#include <limits>

namespace brine_pickle {

// =============================================================================
// BinaryFormatWriter
// =============================================================================

void BinaryFormatWriter::put(std::uint64_t bits, std::size_t width) {
    for (std::size_t i = 0; i < width; ++i) {
        m_buffer.push_back(static_cast<std::uint8_t>((bits >> (i * 8)) & 0xFF));
    }
}

void BinaryFormatWriter::write_boolean(std::string_view, bool value) {
    m_buffer.push_back(value ? 1 : 0);
}

void BinaryFormatWriter::write_int8(std::string_view, std::int8_t value) {
    put(static_cast<std::uint8_t>(value), 1);
}

void BinaryFormatWriter::write_int16(std::string_view, std::int16_t value) {
    put(static_cast<std::uint16_t>(value), 2);
}

void BinaryFormatWriter::write_int32(std::string_view, std::int32_t value) {
    put(static_cast<std::uint32_t>(value), 4);
}

void BinaryFormatWriter::write_int64(std::string_view, std::int64_t value) {
    put(static_cast<std::uint64_t>(value), 8);
}

void BinaryFormatWriter::write_uint8(std::string_view, std::uint8_t value) {
    put(value, 1);
}

void BinaryFormatWriter::write_uint16(std::string_view, std::uint16_t value) {
    put(value, 2);
}

void BinaryFormatWriter::write_uint32(std::string_view, std::uint32_t value) {
    put(value, 4);
}

void BinaryFormatWriter::write_uint64(std::string_view, std::uint64_t value) {
    put(value, 8);
}

void BinaryFormatWriter::write_single(std::string_view, float value) {
    put(std::bit_cast<std::uint32_t>(value), 4);
}

void BinaryFormatWriter::write_double(std::string_view, double value) {
    put(std::bit_cast<std::uint64_t>(value), 8);
}

void BinaryFormatWriter::write_string(std::string_view tag, std::string_view value) {
    if (value.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw PicklerException(brine_core::FormatError::invalid_data(
            std::string(tag), "string longer than 4 GiB"));
    }
    put(static_cast<std::uint32_t>(value.size()), 4);
    m_buffer.insert(m_buffer.end(), value.begin(), value.end());
}

// =============================================================================
// BinaryFormatReader
// =============================================================================

std::uint64_t BinaryFormatReader::take(std::string_view tag, std::size_t width) {
    if (remaining() < width) {
        throw PicklerException(brine_core::FormatError::unexpected_end(std::string(tag)));
    }

    std::uint64_t bits = 0;
    for (std::size_t i = 0; i < width; ++i) {
        bits |= static_cast<std::uint64_t>(m_data[m_offset + i]) << (i * 8);
    }
    m_offset += width;
    return bits;
}

bool BinaryFormatReader::read_boolean(std::string_view tag) {
    auto byte = take(tag, 1);
    if (byte > 1) {
        throw PicklerException(brine_core::FormatError::invalid_data(
            std::string(tag), "boolean byte out of range"));
    }
    return byte == 1;
}

std::int8_t BinaryFormatReader::read_int8(std::string_view tag) {
    return static_cast<std::int8_t>(static_cast<std::uint8_t>(take(tag, 1)));
}

std::int16_t BinaryFormatReader::read_int16(std::string_view tag) {
    return static_cast<std::int16_t>(static_cast<std::uint16_t>(take(tag, 2)));
}

std::int32_t BinaryFormatReader::read_int32(std::string_view tag) {
    return static_cast<std::int32_t>(static_cast<std::uint32_t>(take(tag, 4)));
}

std::int64_t BinaryFormatReader::read_int64(std::string_view tag) {
    return static_cast<std::int64_t>(take(tag, 8));
}

std::uint8_t BinaryFormatReader::read_uint8(std::string_view tag) {
    return static_cast<std::uint8_t>(take(tag, 1));
}

std::uint16_t BinaryFormatReader::read_uint16(std::string_view tag) {
    return static_cast<std::uint16_t>(take(tag, 2));
}

std::uint32_t BinaryFormatReader::read_uint32(std::string_view tag) {
    return static_cast<std::uint32_t>(take(tag, 4));
}

std::uint64_t BinaryFormatReader::read_uint64(std::string_view tag) {
    return take(tag, 8);
}

float BinaryFormatReader::read_single(std::string_view tag) {
    return std::bit_cast<float>(static_cast<std::uint32_t>(take(tag, 4)));
}

double BinaryFormatReader::read_double(std::string_view tag) {
    return std::bit_cast<double>(take(tag, 8));
}

std::string BinaryFormatReader::read_string(std::string_view tag) {
    auto len = static_cast<std::size_t>(take(tag, 4));
    if (remaining() < len) {
        throw PicklerException(brine_core::FormatError::unexpected_end(std::string(tag)));
    }

    std::string s(reinterpret_cast<const char*>(m_data.data() + m_offset), len);
    m_offset += len;
    return s;
}

} // namespace brine_pickle
