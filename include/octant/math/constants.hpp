#pragma once

/// @file constants.hpp
/// @brief Mathematical constants for octant_math

#include <limits>

namespace octant_math {

/// Mathematical constants
namespace consts {

/// Small epsilon for floating point comparisons
inline constexpr float EPSILON = 1e-6f;

/// Larger epsilon for less precise comparisons
inline constexpr float EPSILON_LOOSE = 1e-4f;

/// Infinity
inline constexpr float INFINITY_F = std::numeric_limits<float>::infinity();

} // namespace consts

} // namespace octant_math
