#pragma once

/// @file types.hpp
/// @brief Core type definitions for octant_math

#define GLM_FORCE_RADIANS

#include <glm/glm.hpp>

#include "fwd.hpp"
#include "constants.hpp"

namespace octant_math {

// =============================================================================
// Vector Constants
// =============================================================================

namespace vec3 {
    inline constexpr Vec3 ZERO  = Vec3(0.0f, 0.0f, 0.0f);
    inline constexpr Vec3 ONE   = Vec3(1.0f, 1.0f, 1.0f);
    inline constexpr Vec3 X     = Vec3(1.0f, 0.0f, 0.0f);
    inline constexpr Vec3 Y     = Vec3(0.0f, 1.0f, 0.0f);
    inline constexpr Vec3 Z     = Vec3(0.0f, 0.0f, 1.0f);
    inline constexpr Vec3 NEG_X = Vec3(-1.0f, 0.0f, 0.0f);
    inline constexpr Vec3 NEG_Y = Vec3(0.0f, -1.0f, 0.0f);
    inline constexpr Vec3 NEG_Z = Vec3(0.0f, 0.0f, -1.0f);

    inline constexpr Vec3 UP   = Y;
    inline constexpr Vec3 DOWN = NEG_Y;
}

} // namespace octant_math
