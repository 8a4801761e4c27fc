/// @file json_formatter.cpp
/// @brief JSON formatter on nlohmann::json

#include <brine/pickle/json_formatter.hpp>
#include <brine/pickle/exception.hpp>
#include <limits>

namespace brine_pickle {

using brine_core::FormatError;

// =============================================================================
// JsonFormatWriter
// =============================================================================

void JsonFormatWriter::append(std::string_view tag, nlohmann::json value) {
    nlohmann::json field = nlohmann::json::object();
    field[std::string(tag)] = std::move(value);
    m_fields.push_back(std::move(field));
}

void JsonFormatWriter::write_boolean(std::string_view tag, bool value) { append(tag, value); }

void JsonFormatWriter::write_int8(std::string_view tag, std::int8_t value) { append(tag, value); }
void JsonFormatWriter::write_int16(std::string_view tag, std::int16_t value) { append(tag, value); }
void JsonFormatWriter::write_int32(std::string_view tag, std::int32_t value) { append(tag, value); }
void JsonFormatWriter::write_int64(std::string_view tag, std::int64_t value) { append(tag, value); }

void JsonFormatWriter::write_uint8(std::string_view tag, std::uint8_t value) { append(tag, value); }
void JsonFormatWriter::write_uint16(std::string_view tag, std::uint16_t value) { append(tag, value); }
void JsonFormatWriter::write_uint32(std::string_view tag, std::uint32_t value) { append(tag, value); }
void JsonFormatWriter::write_uint64(std::string_view tag, std::uint64_t value) { append(tag, value); }

void JsonFormatWriter::write_single(std::string_view tag, float value) { append(tag, value); }
void JsonFormatWriter::write_double(std::string_view tag, double value) { append(tag, value); }

void JsonFormatWriter::write_string(std::string_view tag, std::string_view value) {
    append(tag, std::string(value));
}

std::string JsonFormatWriter::to_string(int indent) const {
    return m_fields.dump(indent);
}

// =============================================================================
// JsonFormatReader
// =============================================================================

JsonFormatReader::JsonFormatReader(const std::string& text) {
    try {
        m_fields = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw PicklerException(FormatError::invalid_data("<document>", e.what()));
    }
    if (!m_fields.is_array()) {
        throw PicklerException(FormatError::invalid_data("<document>", "expected a field array"));
    }
}

JsonFormatReader::JsonFormatReader(nlohmann::json document)
    : m_fields(std::move(document)) {
    if (!m_fields.is_array()) {
        throw PicklerException(FormatError::invalid_data("<document>", "expected a field array"));
    }
}

const nlohmann::json& JsonFormatReader::next(std::string_view tag) {
    if (at_end()) {
        throw PicklerException(FormatError::unexpected_end(std::string(tag)));
    }

    const auto& field = m_fields[m_index];
    if (!field.is_object() || field.size() != 1) {
        throw PicklerException(FormatError::invalid_data(std::string(tag), "expected a single-key object"));
    }

    const auto it = field.begin();
    if (it.key() != tag) {
        throw PicklerException(FormatError::tag_mismatch(std::string(tag), it.key()));
    }

    ++m_index;
    return it.value();
}

template<typename I>
I JsonFormatReader::read_integer(std::string_view tag) {
    const auto& value = next(tag);
    if (!value.is_number_integer()) {
        throw PicklerException(FormatError::invalid_data(std::string(tag), "expected an integer"));
    }

    if constexpr (std::is_signed_v<I>) {
        auto v = value.get<std::int64_t>();
        if (value.is_number_unsigned() && value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<I>::max())) {
            throw PicklerException(FormatError::invalid_data(std::string(tag), "integer out of range"));
        }
        if (v < std::numeric_limits<I>::min() || v > std::numeric_limits<I>::max()) {
            throw PicklerException(FormatError::invalid_data(std::string(tag), "integer out of range"));
        }
        return static_cast<I>(v);
    } else {
        if (!value.is_number_unsigned()) {
            throw PicklerException(FormatError::invalid_data(std::string(tag), "expected an unsigned integer"));
        }
        auto v = value.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<I>::max())) {
            throw PicklerException(FormatError::invalid_data(std::string(tag), "integer out of range"));
        }
        return static_cast<I>(v);
    }
}

bool JsonFormatReader::read_boolean(std::string_view tag) {
    const auto& value = next(tag);
    if (!value.is_boolean()) {
        throw PicklerException(FormatError::invalid_data(std::string(tag), "expected a boolean"));
    }
    return value.get<bool>();
}

std::int8_t JsonFormatReader::read_int8(std::string_view tag) { return read_integer<std::int8_t>(tag); }
std::int16_t JsonFormatReader::read_int16(std::string_view tag) { return read_integer<std::int16_t>(tag); }
std::int32_t JsonFormatReader::read_int32(std::string_view tag) { return read_integer<std::int32_t>(tag); }
std::int64_t JsonFormatReader::read_int64(std::string_view tag) { return read_integer<std::int64_t>(tag); }

std::uint8_t JsonFormatReader::read_uint8(std::string_view tag) { return read_integer<std::uint8_t>(tag); }
std::uint16_t JsonFormatReader::read_uint16(std::string_view tag) { return read_integer<std::uint16_t>(tag); }
std::uint32_t JsonFormatReader::read_uint32(std::string_view tag) { return read_integer<std::uint32_t>(tag); }
std::uint64_t JsonFormatReader::read_uint64(std::string_view tag) { return read_integer<std::uint64_t>(tag); }

float JsonFormatReader::read_single(std::string_view tag) {
    const auto& value = next(tag);
    if (!value.is_number()) {
        throw PicklerException(FormatError::invalid_data(std::string(tag), "expected a number"));
    }
    return value.get<float>();
}

double JsonFormatReader::read_double(std::string_view tag) {
    const auto& value = next(tag);
    if (!value.is_number()) {
        throw PicklerException(FormatError::invalid_data(std::string(tag), "expected a number"));
    }
    return value.get<double>();
}

std::string JsonFormatReader::read_string(std::string_view tag) {
    const auto& value = next(tag);
    if (!value.is_string()) {
        throw PicklerException(FormatError::invalid_data(std::string(tag), "expected a string"));
    }
    return value.get<std::string>();
}

} // namespace brine_pickle
