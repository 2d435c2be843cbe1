#pragma once

/// @file math.hpp
/// @brief Main include file for octant_math
///
/// @code
/// #include <octant/math/math.hpp>
/// using namespace octant_math;
///
/// Plane ground = Plane::from_point_normal(vec3::ZERO, vec3::UP);
/// float d = ground.distance_to_point(Vec3(0.0f, 2.0f, 0.0f));  // 2.0
/// @endcode

// Core type definitions and GLM integration
#include "types.hpp"

// Mathematical constants
#include "constants.hpp"

// Vector utilities
#include "vec.hpp"

// Plane
#include "plane.hpp"

// Bounding boxes and plane/box helpers
#include "bounds.hpp"

/// Short alias for octant_math namespace
namespace omath = octant_math;
