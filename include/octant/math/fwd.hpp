#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for octant_math types

#include <glm/fwd.hpp>

namespace octant_math {

// =============================================================================
// Vector Types (GLM aliases)
// =============================================================================
using Vec3 = glm::vec3;

// =============================================================================
// Forward Declarations (octant_math types)
// =============================================================================
struct AABB;
struct Plane;
struct DistanceRange;

} // namespace octant_math
