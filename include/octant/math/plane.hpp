#pragma once

/// @file plane.hpp
/// @brief Infinite query plane for octant_math

#include "types.hpp"
#include "vec.hpp"
#include <cmath>

namespace octant_math {

// =============================================================================
// Plane
// =============================================================================

/// Infinite plane `dot(normal, p) + distance = 0`.
///
/// The positive side is the half-space the normal points into. Every
/// classification in octant_spatial reads signed distances from
/// distance_to_point, so flipping a plane swaps PositiveSide and NegativeSide
/// results without changing which entities intersect it.
struct Plane {
    Vec3 normal = vec3::Y;
    float distance = 0.0f;

    constexpr Plane() noexcept = default;

    /// @param n Normal, normalized here
    /// @param d Offset; the plane passes through `-d * normalize(n)`
    Plane(const Vec3& n, float d) noexcept
        : normal(glm::normalize(n)), distance(d) {}

    static Plane from_point_normal(const Vec3& point, const Vec3& n) noexcept {
        Vec3 unit = glm::normalize(n);
        return Plane(unit, -glm::dot(unit, point));
    }

    /// Normal is (b - a) x (c - a)
    static Plane from_points(const Vec3& a, const Vec3& b, const Vec3& c) noexcept {
        return from_point_normal(a, glm::cross(b - a, c - a));
    }

    [[nodiscard]] float distance_to_point(const Vec3& point) const noexcept {
        return glm::dot(normal, point) + distance;
    }

    /// Orthogonal projection of `point` onto the plane
    [[nodiscard]] Vec3 closest_point(const Vec3& point) const noexcept {
        return point - normal * distance_to_point(point);
    }

    [[nodiscard]] Plane flipped() const noexcept {
        Plane result;
        result.normal = -normal;
        result.distance = -distance;
        return result;
    }

    /// Finite terms and a unit normal
    [[nodiscard]] bool is_valid() const noexcept {
        return is_finite(normal) && std::isfinite(distance) &&
               std::abs(glm::length(normal) - 1.0f) <= consts::EPSILON_LOOSE;
    }

    bool operator==(const Plane& other) const noexcept {
        return normal == other.normal && distance == other.distance;
    }

    bool operator!=(const Plane& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace octant_math
