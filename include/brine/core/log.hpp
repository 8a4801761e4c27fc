#pragma once

/// @file log.hpp
/// @brief Channel loggers for brine
///
/// Every subsystem logs through the spdlog logger of its channel
/// ("brine.resolver", ...), so verbosity can be tuned per subsystem.
/// configure_logging() replaces sinks and levels of loggers already created
/// and of those created afterwards.

#include <spdlog/spdlog.h>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace brine_core {

// =============================================================================
// Channels
// =============================================================================

enum class LogChannel : std::uint8_t {
    Types,     // Type registry
    Resolver,  // Pickler resolution and generation
    Methods,   // Method registry
};

/// Short channel name as used in configuration ("resolver")
const char* log_channel_name(LogChannel channel);

std::optional<LogChannel> parse_log_channel(std::string_view name);

// =============================================================================
// Configuration
// =============================================================================

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::map<LogChannel, spdlog::level::level_enum> channel_levels;  // Overrides level
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 5;

    [[nodiscard]] spdlog::level::level_enum level_for(LogChannel channel) const;
};

void configure_logging(const LogConfig& config);

/// Configuration last passed to configure_logging()
LogConfig current_log_config();

// =============================================================================
// Loggers
// =============================================================================

/// Logger of a library channel, named "brine.<channel>"
std::shared_ptr<spdlog::logger> channel_logger(LogChannel channel);

/// Logger for code outside the library channels; uses the configured sinks
/// and the default level
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

const char* log_level_name(spdlog::level::level_enum level);

/// Flush and drop every logger created through this module
void shutdown_logging();

} // namespace brine_core
