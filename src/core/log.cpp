/// @file log.cpp
/// @brief Shared-sink logger registry for octant

#include <octant/core/log.hpp>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

namespace octant_core {

namespace {

constexpr const char* CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [tid %t] %v";
constexpr const char* LOG_FILE_NAME = "octant.log";

/// Every octant logger writes to `fanout`. Reconfiguring swaps the sinks
/// behind it under the fan-out sink's own mutex, so loggers in use on other
/// threads never see a sink destroyed mid-write.
struct Registry {
    std::mutex mutex;
    LogConfig config;
    std::shared_ptr<spdlog::sinks::dist_sink_mt> fanout;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
};

Registry& registry() {
    static Registry instance;
    return instance;
}

std::vector<spdlog::sink_ptr> build_sinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern(CONSOLE_PATTERN);
        sinks.push_back(std::move(console));
    }

    if (config.writes_file()) {
        auto path = std::filesystem::path(config.directory) / LOG_FILE_NAME;
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            file->set_pattern(FILE_PATTERN);
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& ex) {
            // Console output, if enabled, still works
            spdlog::warn("octant: cannot open {}: {}", path.string(), ex.what());
        }
    }

    return sinks;
}

/// Caller holds the registry mutex
const std::shared_ptr<spdlog::sinks::dist_sink_mt>& fanout(Registry& reg) {
    if (!reg.fanout) {
        reg.fanout = std::make_shared<spdlog::sinks::dist_sink_mt>(build_sinks(reg.config));
    }
    return reg.fanout;
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config = config;
    fanout(reg)->flush();
    fanout(reg)->set_sinks(build_sinks(config));

    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(config.level);
    }
    spdlog::set_level(config.level);
}

LogConfig current_log_config() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config;
}

// =============================================================================
// Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.loggers.find(name); it != reg.loggers.end()) {
        return it->second;
    }

    std::shared_ptr<spdlog::logger> logger = spdlog::get(name);
    if (!logger) {
        logger = std::make_shared<spdlog::logger>(name, fanout(reg));
        logger->set_level(reg.config.level);
        spdlog::register_logger(logger);
    }

    reg.loggers.emplace(name, logger);
    return logger;
}

// Looked up on every call so a logger recreated after shutdown_logging is found
std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("octant_core");
}

std::shared_ptr<spdlog::logger> spatial_logger() {
    return get_logger("octant_spatial");
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config.level = level;
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
    spdlog::set_level(level);
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.loggers.find(name); it != reg.loggers.end()) {
        it->second->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "warning") return spdlog::level::warn;
    if (str == "fatal") return spdlog::level::critical;

    // spdlog maps unknown names to off, so only trust an explicit "off"
    auto level = spdlog::level::from_str(str);
    if (level == spdlog::level::off && str != "off") {
        return std::nullopt;
    }
    return level;
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

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
}

void shutdown_logging() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
        spdlog::drop(name);
    }
    reg.loggers.clear();
}

} // namespace octant_core
