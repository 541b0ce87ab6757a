#pragma once

/// @file log.hpp
/// @brief Named spdlog loggers for the devloop subsystems

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace devloop_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Sinks and level shared by every devloop logger
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Apply a configuration. Loggers created earlier get the new sinks and level;
/// call before the subsystems start logging from their own threads.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Layer composition
std::shared_ptr<spdlog::logger> layer_logger();

/// Change detection, resource sync and scan coordination
std::shared_ptr<spdlog::logger> scan_logger();

/// Live redefinition
std::shared_ptr<spdlog::logger> hot_swap_logger();

/// Compiler collaborators
std::shared_ptr<spdlog::logger> compiler_logger();

// =============================================================================
// Levels
// =============================================================================

/// "trace", "debug", "info", "warn", "error", "critical", "off" and a few aliases
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

/// Flush every devloop logger
void flush_all_loggers();

} // namespace devloop_core
