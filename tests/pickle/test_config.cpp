// brine_pickle configuration tests

#include <catch2/catch_test_macros.hpp>
#include <brine/pickle/config.hpp>
#include <filesystem>
#include <fstream>

using namespace brine_pickle;
using brine_core::ConfigError;
using brine_core::ErrorCode;

TEST_CASE("FormatKind names", "[pickle][config]") {
    REQUIRE(std::string(format_kind_name(FormatKind::Binary)) == "binary");
    REQUIRE(std::string(format_kind_name(FormatKind::Json)) == "json");
    REQUIRE(parse_format_kind("json") == FormatKind::Json);
    REQUIRE_FALSE(parse_format_kind("xml").has_value());
}

TEST_CASE("SerializerConfig defaults", "[pickle][config]") {
    auto result = SerializerConfig::from_json(nlohmann::json::object());
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    REQUIRE(config.format == FormatKind::Binary);
    REQUIRE(config.track_references);
    REQUIRE(config.json_indent == -1);
}

TEST_CASE("SerializerConfig from JSON", "[pickle][config]") {
    auto result = SerializerConfig::from_json_string(R"({
        "format": "json",
        "track_references": false,
        "json_indent": 2,
        "logging": { "level": "debug", "console": false, "channels": { "methods": "off" } }
    })");
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    REQUIRE(config.format == FormatKind::Json);
    REQUIRE_FALSE(config.track_references);
    REQUIRE(config.json_indent == 2);
    REQUIRE(config.logging.level == spdlog::level::debug);
    REQUIRE_FALSE(config.logging.console_enabled);
    REQUIRE(config.logging.level_for(brine_core::LogChannel::Methods) == spdlog::level::off);
    REQUIRE(config.logging.level_for(brine_core::LogChannel::Resolver) == spdlog::level::debug);
}

TEST_CASE("SerializerConfig validation", "[pickle][config]") {
    SECTION("unknown format") {
        auto result = SerializerConfig::from_json_string(R"({"format": "xml"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(result.error().as<ConfigError>()->key == "format");
    }

    SECTION("mistyped value") {
        auto result = SerializerConfig::from_json_string(R"({"track_references": "yes"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "track_references");
    }

    SECTION("unknown log level") {
        auto result = SerializerConfig::from_json_string(R"({"logging": {"level": "chatty"}})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "logging.level");
    }

    SECTION("unknown log channel") {
        auto result = SerializerConfig::from_json_string(R"({"logging": {"channels": {"network": "debug"}}})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "logging.channels.network");
    }

    SECTION("channel level must be a level name") {
        auto result = SerializerConfig::from_json_string(R"({"logging": {"channels": {"resolver": 3}}})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "logging.channels.resolver");
    }

    SECTION("file logging needs a directory") {
        auto result = SerializerConfig::from_json_string(R"({"logging": {"file": true, "directory": ""}})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "logging.directory");
    }

    SECTION("not an object") {
        auto result = SerializerConfig::from_json_string("[1, 2]");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("malformed text") {
        auto result = SerializerConfig::from_json_string("{\"format\": ");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->kind == ConfigError::Kind::ParseFailed);
    }
}

TEST_CASE("SerializerConfig to_json", "[pickle][config]") {
    SerializerConfig config;
    config.format = FormatKind::Json;
    config.json_indent = 4;
    config.logging.channel_levels[brine_core::LogChannel::Resolver] = spdlog::level::trace;

    auto j = config.to_json();
    REQUIRE(j["format"] == "json");
    REQUIRE(j["json_indent"] == 4);
    REQUIRE(j["logging"]["channels"]["resolver"] == "trace");

    auto parsed = SerializerConfig::from_json(j);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().format == FormatKind::Json);
    REQUIRE(parsed.value().json_indent == 4);
    REQUIRE(parsed.value().logging.level_for(brine_core::LogChannel::Resolver) == spdlog::level::trace);
}

TEST_CASE("SerializerConfig load", "[pickle][config]") {
    const auto path = std::filesystem::temp_directory_path() / "brine_config_test.json";

    SECTION("missing file") {
        std::filesystem::remove(path);
        auto result = SerializerConfig::load(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("file on disk") {
        {
            std::ofstream out(path);
            out << R"({"format": "json"})";
        }
        auto result = SerializerConfig::load(path);
        REQUIRE(result.is_ok());
        REQUIRE(result.value().format == FormatKind::Json);
        std::filesystem::remove(path);
    }

    SECTION("parse errors name the file") {
        {
            std::ofstream out(path);
            out << "not json";
        }
        auto result = SerializerConfig::load(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().get_context("file") != nullptr);
        std::filesystem::remove(path);
    }
}
