#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for octant_core module

#include <cstdint>

namespace octant_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct SpatialError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// ID Types
// =============================================================================

struct EntityId;
class EntityIdGenerator;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace octant_core
