/// @file log.cpp
/// @brief Channel logger registry

#include <brine/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <array>
#include <filesystem>
#include <mutex>
#include <vector>

namespace brine_core {

namespace {

constexpr std::array<LogChannel, 3> ALL_CHANNELS{
    LogChannel::Types, LogChannel::Resolver, LogChannel::Methods};

struct LoggerRegistry {
    std::mutex mutex;
    LogConfig config;
    std::map<LogChannel, std::shared_ptr<spdlog::logger>> channels;
    std::map<std::string, std::shared_ptr<spdlog::logger>> others;
};

LoggerRegistry& registry() {
    static LoggerRegistry instance;
    return instance;
}

std::string logger_name(LogChannel channel) {
    return std::string("brine.") + log_channel_name(channel);
}

/// Sinks for one logger under the given configuration. File sinks write
/// to <directory>/<logger name>.log.
std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(std::move(console));
    }

    if (config.file_enabled && !config.log_directory.empty()) {
        const auto path = std::filesystem::path(config.log_directory) / (name + ".log");
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::warn("Cannot open {}, '{}' logs to console only: {}", path.string(), name, ex.what());
        }
    }

    return sinks;
}

std::shared_ptr<spdlog::logger> make_logger(const LogConfig& config, const std::string& name,
                                            spdlog::level::level_enum level) {
    auto sinks = make_sinks(config, name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }
    return logger;
}

} // namespace

// =============================================================================
// Channels
// =============================================================================

const char* log_channel_name(LogChannel channel) {
    switch (channel) {
        case LogChannel::Types: return "types";
        case LogChannel::Resolver: return "resolver";
        case LogChannel::Methods: return "methods";
        default: return "unknown";
    }
}

std::optional<LogChannel> parse_log_channel(std::string_view name) {
    for (LogChannel channel : ALL_CHANNELS) {
        if (name == log_channel_name(channel)) {
            return channel;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Configuration
// =============================================================================

spdlog::level::level_enum LogConfig::level_for(LogChannel channel) const {
    auto it = channel_levels.find(channel);
    return it != channel_levels.end() ? it->second : level;
}

void configure_logging(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.config = config;

    for (auto& [channel, logger] : reg.channels) {
        logger->sinks() = make_sinks(config, logger->name());
        logger->set_level(config.level_for(channel));
    }
    for (auto& [name, logger] : reg.others) {
        logger->sinks() = make_sinks(config, name);
        logger->set_level(config.level);
    }
}

LogConfig current_log_config() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config;
}

// =============================================================================
// Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> channel_logger(LogChannel channel) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto& logger = reg.channels[channel];
    if (!logger) {
        logger = make_logger(reg.config, logger_name(channel), reg.config.level_for(channel));
    }
    return logger;
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto& logger = reg.others[name];
    if (!logger) {
        logger = make_logger(reg.config, name, reg.config.level);
    }
    return logger;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

void shutdown_logging() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto retire = [](const std::shared_ptr<spdlog::logger>& logger) {
        logger->flush();
        spdlog::drop(logger->name());
    };
    for (auto& [channel, logger] : reg.channels) {
        retire(logger);
    }
    for (auto& [name, logger] : reg.others) {
        retire(logger);
    }
    reg.channels.clear();
    reg.others.clear();
}

} // namespace brine_core
