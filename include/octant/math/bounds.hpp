#pragma once

/// @file bounds.hpp
/// @brief Axis-aligned bounding box and plane/box helpers for octant_math

#include "types.hpp"
#include "vec.hpp"
#include "plane.hpp"
#include <array>
#include <cmath>

namespace octant_math {

// =============================================================================
// AABB
// =============================================================================

/// Axis-aligned box given by its min and max corners.
/// Entities without extent are stored as a zero-volume box (min == max).
struct AABB {
    Vec3 min = vec3::ZERO;
    Vec3 max = vec3::ZERO;

    constexpr AABB() noexcept = default;

    constexpr AABB(const Vec3& min_point, const Vec3& max_point) noexcept
        : min(min_point), max(max_point) {}

    static AABB from_point(const Vec3& point) noexcept {
        return AABB(point, point);
    }

    [[nodiscard]] Vec3 size() const noexcept { return max - min; }

    /// Cost metric for tree insertion
    [[nodiscard]] float surface_area() const noexcept {
        Vec3 s = size();
        return 2.0f * (s.x * s.y + s.y * s.z + s.z * s.x);
    }

    /// min <= max on every axis (NaN fails)
    [[nodiscard]] bool is_valid() const noexcept {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    /// Grown by `amount` on every side (fat tree leaves)
    [[nodiscard]] AABB expanded(float amount) const noexcept {
        return AABB(min - Vec3(amount), max + Vec3(amount));
    }

    [[nodiscard]] AABB translated(const Vec3& offset) const noexcept {
        return AABB(min + offset, max + offset);
    }

    [[nodiscard]] bool contains_aabb(const AABB& other) const noexcept {
        return glm::all(glm::lessThanEqual(min, other.min)) &&
               glm::all(glm::greaterThanEqual(max, other.max));
    }

    /// Touching boxes count as overlapping
    [[nodiscard]] bool intersects(const AABB& other) const noexcept {
        return glm::all(glm::lessThanEqual(min, other.max)) &&
               glm::all(glm::greaterThanEqual(max, other.min));
    }

    [[nodiscard]] Vec3 closest_point(const Vec3& point) const noexcept {
        return glm::clamp(point, min, max);
    }

    /// Corner i takes max on axis k when bit k of i is set
    [[nodiscard]] std::array<Vec3, 8> corners() const noexcept {
        std::array<Vec3, 8> result;
        for (int i = 0; i < 8; ++i) {
            result[i] = Vec3(
                (i & 1) ? max.x : min.x,
                (i & 2) ? max.y : min.y,
                (i & 4) ? max.z : min.z);
        }
        return result;
    }

    bool operator==(const AABB& other) const noexcept {
        return min == other.min && max == other.max;
    }

    bool operator!=(const AABB& other) const noexcept {
        return !(*this == other);
    }
};

// =============================================================================
// Plane / AABB Operations
// =============================================================================

/// Interval of signed plane distances covered by a box
struct DistanceRange {
    float min = 0.0f;
    float max = 0.0f;

    /// True if any part of the range lies within tolerance of zero
    [[nodiscard]] bool within(float tolerance) const noexcept {
        return min <= tolerance && max >= -tolerance;
    }

    [[nodiscard]] bool straddles_zero() const noexcept {
        return min * max <= 0.0f;
    }
};

/// Corner of the box furthest along the plane normal
[[nodiscard]] inline Vec3 positive_vertex(const Plane& plane, const AABB& aabb) noexcept {
    return Vec3(
        plane.normal.x >= 0.0f ? aabb.max.x : aabb.min.x,
        plane.normal.y >= 0.0f ? aabb.max.y : aabb.min.y,
        plane.normal.z >= 0.0f ? aabb.max.z : aabb.min.z
    );
}

/// Corner of the box furthest against the plane normal
[[nodiscard]] inline Vec3 negative_vertex(const Plane& plane, const AABB& aabb) noexcept {
    return Vec3(
        plane.normal.x >= 0.0f ? aabb.min.x : aabb.max.x,
        plane.normal.y >= 0.0f ? aabb.min.y : aabb.max.y,
        plane.normal.z >= 0.0f ? aabb.min.z : aabb.max.z
    );
}

/// Signed distance interval of the box relative to the plane
[[nodiscard]] inline DistanceRange signed_distance_range(const Plane& plane, const AABB& aabb) noexcept {
    return DistanceRange{
        plane.distance_to_point(negative_vertex(plane, aabb)),
        plane.distance_to_point(positive_vertex(plane, aabb))
    };
}

/// Smallest box enclosing both
[[nodiscard]] inline AABB combine(const AABB& a, const AABB& b) noexcept {
    return AABB(octant_math::min(a.min, b.min), octant_math::max(a.max, b.max));
}

[[nodiscard]] inline bool intersects(const AABB& a, const AABB& b) noexcept {
    return a.intersects(b);
}

} // namespace octant_math
