/// @file error.cpp
/// @brief Error formatting for octant_core

#include <octant/core/error.hpp>
#include <sstream>

namespace octant_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* spatial_error_kind_name(SpatialError::Kind kind) {
    switch (kind) {
        case SpatialError::Kind::DuplicateEntity: return "DuplicateEntity";
        case SpatialError::Kind::EntityNotFound: return "EntityNotFound";
        case SpatialError::Kind::InvalidBounds: return "InvalidBounds";
        default: return "Unknown";
    }
}

/// Format spatial error with full context
std::string format_spatial_error(const SpatialError& err) {
    std::ostringstream oss;
    oss << "[SpatialError:" << spatial_error_kind_name(err.kind) << "] " << err.message;

    if (!err.entity.empty()) {
        oss << " (entity: " << err.entity << ")";
    }

    return oss.str();
}

/// Format config error with full context
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.source.empty()) {
        oss << " (source: " << err.source << ")";
    }
    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, SpatialError>) {
            oss << detail::format_spatial_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

} // namespace octant_core
