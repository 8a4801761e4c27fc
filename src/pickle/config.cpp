/// @file config.cpp
/// @brief SerializerConfig parsing

#include <brine/pickle/config.hpp>
#include <fstream>
#include <iterator>

namespace brine_pickle {

using brine_core::ConfigError;
using brine_core::Result;

const char* format_kind_name(FormatKind kind) {
    switch (kind) {
        case FormatKind::Binary: return "binary";
        case FormatKind::Json: return "json";
        default: return "unknown";
    }
}

std::optional<FormatKind> parse_format_kind(const std::string& name) {
    if (name == "binary") return FormatKind::Binary;
    if (name == "json") return FormatKind::Json;
    return std::nullopt;
}

// =============================================================================
// Parsing
// =============================================================================

namespace {

Result<brine_core::LogConfig> parse_logging(const nlohmann::json& j, brine_core::LogConfig config) {
    if (!j.is_object()) {
        return brine_core::Err<brine_core::LogConfig>(ConfigError::invalid_value("logging", "must be an object"));
    }

    if (j.contains("level")) {
        if (!j["level"].is_string()) {
            return brine_core::Err<brine_core::LogConfig>(ConfigError::invalid_value("logging.level", "must be a string"));
        }
        const auto level_name = j["level"].get<std::string>();
        auto level = brine_core::parse_log_level(level_name);
        if (!level) {
            return brine_core::Err<brine_core::LogConfig>(
                ConfigError::invalid_value("logging.level", "unknown level '" + level_name + "'"));
        }
        config.level = *level;
    }

    if (j.contains("channels")) {
        const auto& channels = j["channels"];
        if (!channels.is_object()) {
            return brine_core::Err<brine_core::LogConfig>(
                ConfigError::invalid_value("logging.channels", "must be an object"));
        }
        for (const auto& item : channels.items()) {
            const std::string& name = item.key();
            const auto& value = item.value();
            const std::string key = "logging.channels." + name;
            auto channel = brine_core::parse_log_channel(name);
            if (!channel) {
                return brine_core::Err<brine_core::LogConfig>(ConfigError::invalid_value(key, "unknown channel"));
            }
            auto level = value.is_string() ? brine_core::parse_log_level(value.get<std::string>()) : std::nullopt;
            if (!level) {
                return brine_core::Err<brine_core::LogConfig>(
                    ConfigError::invalid_value(key, "must be a level name"));
            }
            config.channel_levels[*channel] = *level;
        }
    }

    if (j.contains("console")) {
        if (!j["console"].is_boolean()) {
            return brine_core::Err<brine_core::LogConfig>(ConfigError::invalid_value("logging.console", "must be a boolean"));
        }
        config.console_enabled = j["console"].get<bool>();
    }

    if (j.contains("file")) {
        if (!j["file"].is_boolean()) {
            return brine_core::Err<brine_core::LogConfig>(ConfigError::invalid_value("logging.file", "must be a boolean"));
        }
        config.file_enabled = j["file"].get<bool>();
    }

    if (j.contains("directory")) {
        if (!j["directory"].is_string()) {
            return brine_core::Err<brine_core::LogConfig>(ConfigError::invalid_value("logging.directory", "must be a string"));
        }
        config.log_directory = j["directory"].get<std::string>();
    }

    if (config.file_enabled && config.log_directory.empty()) {
        return brine_core::Err<brine_core::LogConfig>(
            ConfigError::invalid_value("logging.directory", "required when file logging is enabled"));
    }

    return brine_core::Ok(std::move(config));
}

} // namespace

Result<SerializerConfig> SerializerConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return brine_core::Err<SerializerConfig>(ConfigError::parse_failed("configuration must be an object"));
    }

    SerializerConfig config;

    if (j.contains("format")) {
        if (!j["format"].is_string()) {
            return brine_core::Err<SerializerConfig>(ConfigError::invalid_value("format", "must be a string"));
        }
        const auto name = j["format"].get<std::string>();
        auto kind = parse_format_kind(name);
        if (!kind) {
            return brine_core::Err<SerializerConfig>(
                ConfigError::invalid_value("format", "expected 'binary' or 'json', got '" + name + "'"));
        }
        config.format = *kind;
    }

    if (j.contains("track_references")) {
        if (!j["track_references"].is_boolean()) {
            return brine_core::Err<SerializerConfig>(ConfigError::invalid_value("track_references", "must be a boolean"));
        }
        config.track_references = j["track_references"].get<bool>();
    }

    if (j.contains("json_indent")) {
        if (!j["json_indent"].is_number_integer()) {
            return brine_core::Err<SerializerConfig>(ConfigError::invalid_value("json_indent", "must be an integer"));
        }
        config.json_indent = j["json_indent"].get<int>();
    }

    if (j.contains("logging")) {
        auto logging = parse_logging(j["logging"], config.logging);
        if (!logging) {
            return brine_core::Err<SerializerConfig>(logging.error());
        }
        config.logging = std::move(*logging);
    }

    return brine_core::Ok(std::move(config));
}

Result<SerializerConfig> SerializerConfig::from_json_string(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        return brine_core::Err<SerializerConfig>(ConfigError::parse_failed(e.what()));
    }
    return from_json(j);
}

Result<SerializerConfig> SerializerConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return brine_core::Err<SerializerConfig>(ConfigError::file_not_found(path.string()));
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    auto result = from_json_string(content);
    if (!result) {
        result.error().with_context("file", path.string());
    }
    return result;
}

nlohmann::json SerializerConfig::to_json() const {
    nlohmann::json logging_json = {
        {"level", brine_core::log_level_name(logging.level)},
        {"console", logging.console_enabled},
        {"file", logging.file_enabled},
    };
    if (!logging.log_directory.empty()) {
        logging_json["directory"] = logging.log_directory;
    }
    if (!logging.channel_levels.empty()) {
        nlohmann::json channels = nlohmann::json::object();
        for (const auto& [channel, level] : logging.channel_levels) {
            channels[brine_core::log_channel_name(channel)] = brine_core::log_level_name(level);
        }
        logging_json["channels"] = std::move(channels);
    }

    return nlohmann::json{
        {"format", format_kind_name(format)},
        {"track_references", track_references},
        {"json_indent", json_indent},
        {"logging", std::move(logging_json)},
    };
}

void apply_logging(const SerializerConfig& config) {
    brine_core::configure_logging(config.logging);
}

} // namespace brine_pickle
