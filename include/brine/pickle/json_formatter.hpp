#pragma once

/// @file json_formatter.hpp
/// @brief Self-describing JSON formatter
///
/// Fields are stored as a JSON array of single-key objects in write order:
/// @code
/// [{"type": "Color"}, {"value": 1}]
/// @endcode
/// The reader verifies each tag against the one it is asked for.

#include "formatter.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace brine_pickle {

class JsonFormatWriter final : public FormatWriter {
public:
    JsonFormatWriter() : m_fields(nlohmann::json::array()) {}

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

    [[nodiscard]] const nlohmann::json& document() const noexcept { return m_fields; }

    /// Serialize the document; indent < 0 gives compact output
    [[nodiscard]] std::string to_string(int indent = -1) const;

private:
    void append(std::string_view tag, nlohmann::json value);

    nlohmann::json m_fields;
};

class JsonFormatReader final : public FormatReader {
public:
    /// Parse text; malformed input throws PicklerException (FormatError)
    explicit JsonFormatReader(const std::string& text);
    explicit JsonFormatReader(nlohmann::json document);

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

    [[nodiscard]] bool at_end() const override { return m_index == m_fields.size(); }

private:
    /// Next field value after checking its tag
    [[nodiscard]] const nlohmann::json& next(std::string_view tag);

    template<typename I>
    [[nodiscard]] I read_integer(std::string_view tag);

    nlohmann::json m_fields;
    std::size_t m_index = 0;
};

} // namespace brine_pickle
