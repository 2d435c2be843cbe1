#pragma once

/// @file vec.hpp
/// @brief Vector utility functions for octant_math

#include "types.hpp"
#include <cmath>

namespace octant_math {

// =============================================================================
// Vec3 Utilities
// =============================================================================

/// Component-wise minimum
[[nodiscard]] inline Vec3 min(const Vec3& a, const Vec3& b) noexcept {
    return glm::min(a, b);
}

/// Component-wise maximum
[[nodiscard]] inline Vec3 max(const Vec3& a, const Vec3& b) noexcept {
    return glm::max(a, b);
}

/// Check if vector has any NaN or infinite components
[[nodiscard]] inline bool is_finite(const Vec3& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

/// Check if two vectors are approximately equal
template<typename T>
[[nodiscard]] inline bool approx_equal(const T& a, const T& b,
                                        float epsilon = consts::EPSILON) noexcept {
    return glm::all(glm::lessThan(glm::abs(a - b), T(epsilon)));
}

} // namespace octant_math
