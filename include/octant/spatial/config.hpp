#pragma once

/// @file config.hpp
/// @brief Plane query configuration
///
/// Loaded from the `[plane_query]` table of a TOML file:
/// @code
/// [plane_query]
/// default_tolerance = 0.5
/// on_plane_epsilon = 1e-6
/// sort_results = true
/// tree_margin = 0.05
///
/// [logging]
/// level = "debug"
/// console = true
/// directory = "logs"
/// @endcode

#include "fwd.hpp"

#include <octant/core/error.hpp>
#include <octant/core/log.hpp>

#include <filesystem>
#include <string>

namespace octant_spatial {

/// Settings applied by SpatialIndex plane queries
struct PlaneQueryConfig {
    /// Distance cut-off used when a query gives none; <= 0 keeps every entity
    float default_tolerance = 0.0f;

    /// Point entities within this distance of the plane are OnPlane
    float on_plane_epsilon = 1e-6f;

    /// Order results nearest-first
    bool sort_results = true;

    /// Fattening margin for entity tree leaves
    float tree_margin = 0.05f;

    /// Reject negative or non-finite values
    [[nodiscard]] octant_core::Result<void> validate() const;
};

/// Parse configuration from TOML text
/// @param source_name Label used in error messages
[[nodiscard]] octant_core::Result<PlaneQueryConfig> parse_plane_query_config(
    const std::string& content,
    const std::string& source_name = "<string>");

/// Load configuration from a TOML file
[[nodiscard]] octant_core::Result<PlaneQueryConfig> load_plane_query_config(
    const std::filesystem::path& path);

/// Parse the `[logging]` table; a missing table or key keeps LogConfig defaults
[[nodiscard]] octant_core::Result<octant_core::LogConfig> parse_log_config(
    const std::string& content,
    const std::string& source_name = "<string>");

/// Load `[logging]` from a file and apply it with octant_core::configure_logging
[[nodiscard]] octant_core::Result<void> apply_log_config_file(const std::filesystem::path& path);

} // namespace octant_spatial
