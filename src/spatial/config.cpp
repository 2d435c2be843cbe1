/// @file config.cpp
/// @brief Plane query configuration parsing

#include <octant/spatial/config.hpp>
#include <octant/core/log.hpp>

#include <toml++/toml.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

namespace octant_spatial {

namespace {

/// Read an optional float key. Integers are accepted.
octant_core::Result<void> read_float(const toml::table& tbl, const char* key, float& out) {
    auto node = tbl[key];
    if (!node) {
        return octant_core::Ok();
    }

    std::optional<double> value = node.value<double>();
    if (!value) {
        return octant_core::Error{octant_core::ConfigError::invalid_value(key, "expected a number")};
    }

    out = static_cast<float>(*value);
    return octant_core::Ok();
}

octant_core::Result<void> read_bool(const toml::table& tbl, const char* key, bool& out) {
    auto node = tbl[key];
    if (!node) {
        return octant_core::Ok();
    }

    std::optional<bool> value = node.value<bool>();
    if (!value) {
        return octant_core::Error{octant_core::ConfigError::invalid_value(key, "expected a boolean")};
    }

    out = *value;
    return octant_core::Ok();
}

octant_core::Result<void> read_string(const toml::table& tbl, const char* key, std::string& out) {
    auto node = tbl[key];
    if (!node) {
        return octant_core::Ok();
    }

    std::optional<std::string> value = node.value<std::string>();
    if (!value) {
        return octant_core::Error{octant_core::ConfigError::invalid_value(key, "expected a string")};
    }

    out = std::move(*value);
    return octant_core::Ok();
}

/// Read an optional positive integer key
octant_core::Result<void> read_count(const toml::table& tbl, const char* key, std::size_t& out) {
    auto node = tbl[key];
    if (!node) {
        return octant_core::Ok();
    }

    std::optional<std::int64_t> value = node.value<std::int64_t>();
    if (!value) {
        return octant_core::Error{octant_core::ConfigError::invalid_value(key, "expected an integer")};
    }
    if (*value <= 0) {
        return octant_core::Error{octant_core::ConfigError::invalid_value(key, "must be positive")};
    }

    out = static_cast<std::size_t>(*value);
    return octant_core::Ok();
}

octant_core::Result<toml::table> parse_document(const std::string& content, const std::string& source_name) {
    try {
        return toml::parse(content, source_name);
    } catch (const toml::parse_error& err) {
        octant_core::core_logger()->warn("Failed to parse {}: {}", source_name, err.description());
        return octant_core::Error{
            octant_core::ConfigError::parse_error(source_name, std::string(err.description()))};
    }
}

octant_core::Result<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return octant_core::Error{octant_core::ConfigError::io_error(path.string())};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

octant_core::Result<void> check_non_negative(const char* key, float value) {
    if (!std::isfinite(value)) {
        return octant_core::Error{octant_core::ConfigError::invalid_value(key, "must be finite")};
    }
    if (value < 0.0f) {
        return octant_core::Error{octant_core::ConfigError::invalid_value(key, "must not be negative")};
    }
    return octant_core::Ok();
}

} // anonymous namespace

// =============================================================================
// PlaneQueryConfig
// =============================================================================

octant_core::Result<void> PlaneQueryConfig::validate() const {
    if (!std::isfinite(default_tolerance)) {
        return octant_core::Error{octant_core::ConfigError::invalid_value("default_tolerance", "must be finite")};
    }
    if (auto result = check_non_negative("on_plane_epsilon", on_plane_epsilon); !result) {
        return result;
    }
    if (auto result = check_non_negative("tree_margin", tree_margin); !result) {
        return result;
    }
    return octant_core::Ok();
}

// =============================================================================
// Parsing
// =============================================================================

octant_core::Result<PlaneQueryConfig> parse_plane_query_config(
    const std::string& content,
    const std::string& source_name)
{
    PlaneQueryConfig config;

    auto document = parse_document(content, source_name);
    if (!document) {
        return document.error();
    }

    const toml::table* section = (*document)["plane_query"].as_table();
    if (!section) {
        return config;
    }

    if (auto r = read_float(*section, "default_tolerance", config.default_tolerance); !r) {
        return r.error().with_context("source", source_name);
    }
    if (auto r = read_float(*section, "on_plane_epsilon", config.on_plane_epsilon); !r) {
        return r.error().with_context("source", source_name);
    }
    if (auto r = read_bool(*section, "sort_results", config.sort_results); !r) {
        return r.error().with_context("source", source_name);
    }
    if (auto r = read_float(*section, "tree_margin", config.tree_margin); !r) {
        return r.error().with_context("source", source_name);
    }

    if (auto r = config.validate(); !r) {
        return r.error().with_context("source", source_name);
    }

    return config;
}

octant_core::Result<PlaneQueryConfig> load_plane_query_config(const std::filesystem::path& path) {
    auto content = read_file(path);
    if (!content) {
        return content.error();
    }
    return parse_plane_query_config(*content, path.string());
}

// =============================================================================
// Logging
// =============================================================================

octant_core::Result<octant_core::LogConfig> parse_log_config(
    const std::string& content,
    const std::string& source_name)
{
    octant_core::LogConfig config;

    auto document = parse_document(content, source_name);
    if (!document) {
        return document.error();
    }

    const toml::table* section = (*document)["logging"].as_table();
    if (!section) {
        return config;
    }

    std::string level_name;
    if (auto r = read_string(*section, "level", level_name); !r) {
        return r.error().with_context("source", source_name);
    }
    if (!level_name.empty()) {
        auto level = octant_core::parse_log_level(level_name);
        if (!level) {
            return octant_core::Error{
                octant_core::ConfigError::invalid_value("level", "unknown log level '" + level_name + "'")}
                .with_context("source", source_name);
        }
        config.level = *level;
    }

    if (auto r = read_bool(*section, "console", config.console); !r) {
        return r.error().with_context("source", source_name);
    }
    if (auto r = read_string(*section, "directory", config.directory); !r) {
        return r.error().with_context("source", source_name);
    }
    if (auto r = read_count(*section, "max_file_size", config.max_file_size); !r) {
        return r.error().with_context("source", source_name);
    }
    if (auto r = read_count(*section, "max_files", config.max_files); !r) {
        return r.error().with_context("source", source_name);
    }

    return config;
}

octant_core::Result<void> apply_log_config_file(const std::filesystem::path& path) {
    auto content = read_file(path);
    if (!content) {
        return content.error();
    }

    auto config = parse_log_config(*content, path.string());
    if (!config) {
        return config.error();
    }

    octant_core::configure_logging(*config);
    octant_core::core_logger()->debug("logging configured from {} at level {}",
        path.string(), octant_core::log_level_name(config->level));
    return octant_core::Ok();
}

} // namespace octant_spatial
