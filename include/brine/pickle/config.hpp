#pragma once

/// @file config.hpp
/// @brief Serializer configuration
///
/// JSON layout:
/// @code
/// {
///   "format": "binary",
///   "track_references": true,
///   "json_indent": -1,
///   "logging": {
///     "level": "info",
///     "channels": { "resolver": "debug" },
///     "console": true, "file": false, "directory": "logs"
///   }
/// }
/// @endcode
/// Every key is optional.

#include "fwd.hpp"
#include <brine/core/error.hpp>
#include <brine/core/log.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace brine_pickle {

/// Wire format used by Serializer::pickle
enum class FormatKind : std::uint8_t {
    Binary,
    Json,
};

[[nodiscard]] const char* format_kind_name(FormatKind kind);
[[nodiscard]] std::optional<FormatKind> parse_format_kind(const std::string& name);

struct SerializerConfig {
    FormatKind format = FormatKind::Binary;
    bool track_references = true;  // Preserve aliasing of shared values
    int json_indent = -1;          // < 0: compact
    brine_core::LogConfig logging;

    [[nodiscard]] static brine_core::Result<SerializerConfig> from_json(const nlohmann::json& j);
    [[nodiscard]] static brine_core::Result<SerializerConfig> from_json_string(const std::string& text);
    [[nodiscard]] static brine_core::Result<SerializerConfig> load(const std::filesystem::path& path);

    [[nodiscard]] nlohmann::json to_json() const;
};

/// Forward the logging block to brine_core::configure_logging
void apply_logging(const SerializerConfig& config);

} // namespace brine_pickle
