#pragma once

/// @file log.hpp
/// @brief spdlog loggers used by octant
///
/// Every octant logger writes through one shared fan-out sink.
/// `configure_logging` swaps the sinks behind it, so it may run while other
/// threads are logging through loggers they already hold.

#include "fwd.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace octant_core {

/// Console-only output at info, with octant's line pattern
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// LogConfig
// =============================================================================

/// Sink and level settings, usually read from a `[logging]` TOML table
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool console = true;

    /// Directory for `octant.log`; empty disables file output
    std::string directory;
    std::size_t max_file_size = 4 * 1024 * 1024;
    std::size_t max_files = 3;

    [[nodiscard]] bool writes_file() const { return !directory.empty(); }
};

/// Replace the shared sinks and level of every octant logger
void configure_logging(const LogConfig& config);

/// Settings last passed to configure_logging (defaults before that)
[[nodiscard]] LogConfig current_log_config();

// =============================================================================
// Loggers
// =============================================================================

/// Logger called `name`, created on first use with the shared sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// "octant_core": configuration loading
std::shared_ptr<spdlog::logger> core_logger();

/// "octant_spatial": index mutations and plane queries
std::shared_ptr<spdlog::logger> spatial_logger();

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

/// Override one logger; a later set_global_log_level resets it
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Accepts spdlog's names plus "warning" and "fatal"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flush, then unregister every octant logger from spdlog
void shutdown_logging();

} // namespace octant_core
