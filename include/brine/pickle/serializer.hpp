#pragma once

/// @file serializer.hpp
/// @brief Top-level pickle, unpickle, clone and visit entry points
///
/// A pickled root is framed as the string "type" naming T, followed by the
/// value under "value".

#include "fwd.hpp"
#include "binary_formatter.hpp"
#include "config.hpp"
#include "json_formatter.hpp"
#include "resolver.hpp"
#include "state.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace brine_pickle {

class Serializer {
public:
    explicit Serializer(PicklerResolver& resolver, SerializerConfig config = {})
        : m_resolver(resolver), m_config(std::move(config)) {}

    [[nodiscard]] PicklerResolver& resolver() noexcept { return m_resolver; }
    [[nodiscard]] const SerializerConfig& config() const noexcept { return m_config; }

    /// Encode value in the configured format
    template<typename T>
    [[nodiscard]] std::vector<std::uint8_t> pickle(const T& value) {
        if (m_config.format == FormatKind::Json) {
            JsonFormatWriter writer;
            serialize(writer, value);
            const std::string text = writer.to_string(m_config.json_indent);
            return std::vector<std::uint8_t>(text.begin(), text.end());
        }

        BinaryFormatWriter writer;
        serialize(writer, value);
        return writer.take();
    }

    /// Decode bytes produced by pickle<T>(); trailing data is an error
    template<typename T>
    [[nodiscard]] T unpickle(std::span<const std::uint8_t> bytes) {
        if (m_config.format == FormatKind::Json) {
            JsonFormatReader reader(std::string(bytes.begin(), bytes.end()));
            return deserialize_all<T>(reader);
        }

        BinaryFormatReader reader(bytes);
        return deserialize_all<T>(reader);
    }

    template<typename T>
    void serialize(FormatWriter& writer, const T& value) {
        auto pickler = m_resolver.resolve<T>();
        WriteState state(writer, m_config.track_references);
        writer.write_string("type", root_name<T>());
        pickler->write(state, "value", value);
    }

    /// Read one root; throws FormatError::TypeMismatch when another type was written
    template<typename T>
    [[nodiscard]] T deserialize(FormatReader& reader) {
        auto pickler = m_resolver.resolve<T>();
        ReadState state(reader);
        const std::string expected = root_name<T>();
        const std::string found = reader.read_string("type");
        if (found != expected) {
            throw PicklerException(brine_core::FormatError::type_mismatch(expected, found));
        }
        return pickler->read(state, "value");
    }

    /// Structural copy with aliasing preserved inside value
    template<typename T>
    [[nodiscard]] T clone(const T& value) {
        auto pickler = m_resolver.resolve<T>();
        CloneState state;
        return pickler->clone(state, value);
    }

    template<typename T>
    void visit(const T& value, ObjectVisitor& visitor) {
        auto pickler = m_resolver.resolve<T>();
        VisitState state(visitor);
        pickler->accept(state, value);
    }

private:
    template<typename T>
    T deserialize_all(FormatReader& reader) {
        T value = deserialize<T>(reader);
        if (!reader.at_end()) {
            throw PicklerException(brine_core::FormatError::invalid_data("<document>", "trailing data after root value"));
        }
        return value;
    }

    template<typename T>
    std::string root_name() const {
        return m_resolver.types().name_of(std::type_index(typeid(T)));
    }

    PicklerResolver& m_resolver;
    SerializerConfig m_config;
};

} // namespace brine_pickle
