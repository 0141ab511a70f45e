#pragma once

/// @file log.hpp
/// @brief spdlog setup and named loggers for navkit

#include "fwd.hpp"

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

// Default logger, used by the demo and other host-side code
#define NAVKIT_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define NAVKIT_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define NAVKIT_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define NAVKIT_LOG_ERROR(...) spdlog::error(__VA_ARGS__)

namespace navkit_core {

/// @brief Console-only setup used before a configuration is loaded
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Configuration
// =============================================================================

/// Sinks and level applied to every navkit logger
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;           ///< Rotating files go here when file_enabled
    std::size_t max_file_size = 4 * 1024 * 1024;
    std::size_t max_files = 3;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// @brief Apply a configuration
///
/// Loggers created afterwards get the configured sinks; existing loggers
/// and the default logger only pick up the level.
void configure_logging(const LogConfig& config);

/// "trace", "debug", "info", "warn", "error", "critical" or "off"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a logger with the configured sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Mesh registry, agents and drivers log here
std::shared_ptr<spdlog::logger> nav_logger();

/// Flush and drop every navkit logger
void shutdown_logging();

} // namespace navkit_core
