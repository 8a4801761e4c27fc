// brine_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <brine/core/log.hpp>

using namespace brine_core;

namespace {

/// Restores the logging configuration a test started with
struct ConfigRestore {
    LogConfig saved = current_log_config();
    ~ConfigRestore() { configure_logging(saved); }
};

} // namespace

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());

    for (auto level : {spdlog::level::debug, spdlog::level::err, spdlog::level::critical}) {
        REQUIRE(parse_log_level(log_level_name(level)) == level);
    }
}

TEST_CASE("Log channels", "[core][log]") {
    REQUIRE(std::string(log_channel_name(LogChannel::Resolver)) == "resolver");
    REQUIRE(parse_log_channel("methods") == LogChannel::Methods);
    REQUIRE(parse_log_channel("types") == LogChannel::Types);
    REQUIRE_FALSE(parse_log_channel("brine.resolver").has_value());

    auto resolver = channel_logger(LogChannel::Resolver);
    REQUIRE(resolver == channel_logger(LogChannel::Resolver));
    REQUIRE(resolver->name() == "brine.resolver");
    REQUIRE(channel_logger(LogChannel::Types)->name() == "brine.types");
}

TEST_CASE("LogConfig levels", "[core][log]") {
    LogConfig config;
    config.level = spdlog::level::warn;
    config.channel_levels[LogChannel::Resolver] = spdlog::level::trace;

    REQUIRE(config.level_for(LogChannel::Resolver) == spdlog::level::trace);
    REQUIRE(config.level_for(LogChannel::Methods) == spdlog::level::warn);
}

TEST_CASE("configure_logging reaches existing loggers", "[core][log]") {
    ConfigRestore restore;
    auto resolver = channel_logger(LogChannel::Resolver);
    auto methods = channel_logger(LogChannel::Methods);
    auto tool = get_logger("brine_log_test");
    REQUIRE(tool == get_logger("brine_log_test"));

    LogConfig config;
    config.level = spdlog::level::err;
    config.channel_levels[LogChannel::Resolver] = spdlog::level::debug;
    config.console_enabled = false;
    configure_logging(config);

    REQUIRE(resolver->level() == spdlog::level::debug);
    REQUIRE(methods->level() == spdlog::level::err);
    REQUIRE(tool->level() == spdlog::level::err);
    REQUIRE(resolver->sinks().empty());
    REQUIRE(current_log_config().level_for(LogChannel::Resolver) == spdlog::level::debug);
}
