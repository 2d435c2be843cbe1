#pragma once

/// @file plane_query.hpp
/// @brief Plane classification of points and boxes
///
/// Produces PlaneIntersection results for single entities and provides the
/// sorting and side filters applied to a query's result list.

#include "plane_intersection.hpp"

#include <octant/math/plane.hpp>
#include <octant/math/bounds.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <optional>
#include <vector>

namespace octant_spatial {

// =============================================================================
// Constants
// =============================================================================

/// Point entities closer than this to the plane are classified OnPlane
constexpr float k_on_plane_epsilon = octant_math::consts::EPSILON;

// =============================================================================
// Closest Point
// =============================================================================

/// Corner of the box reported as closest to the plane for straddling boxes.
/// Per axis: min when the normal component is non-negative, else max.
[[nodiscard]] inline octant_math::Vec3 closest_point_on_aabb_to_plane(
    const octant_math::Plane& plane, const octant_math::AABB& bounds) noexcept {
    return octant_math::negative_vertex(plane, bounds);
}

// =============================================================================
// Classification
// =============================================================================

/// Classify a point entity against a plane
/// @param tolerance Results further than this are dropped (<= 0 keeps all)
/// @return Result with a zero-volume box at the point, or nullopt if culled
template<typename ID, typename Content>
[[nodiscard]] std::optional<PlaneIntersection<ID, Content>> classify_point(
    const octant_math::Plane& plane,
    const ID& entity_id,
    const Content& content,
    const octant_math::Vec3& point,
    float tolerance,
    float on_plane_epsilon = k_on_plane_epsilon)
{
    const float distance = plane.distance_to_point(point);

    if (tolerance > 0.0f && std::abs(distance) > tolerance) {
        return std::nullopt;
    }

    PlaneIntersectionType type;
    if (std::abs(distance) <= on_plane_epsilon) {
        type = PlaneIntersectionType::OnPlane;
    } else if (distance > 0.0f) {
        type = PlaneIntersectionType::PositiveSide;
    } else {
        type = PlaneIntersectionType::NegativeSide;
    }

    return PlaneIntersection<ID, Content>(entity_id, content, distance, point, type,
                                          octant_math::AABB::from_point(point));
}

/// Classify a bounded entity against a plane using its eight corners
/// @param tolerance Results further than this are dropped (<= 0 keeps all).
///                  Also the band within which a flat box counts as OnPlane.
template<typename ID, typename Content>
[[nodiscard]] std::optional<PlaneIntersection<ID, Content>> classify_aabb(
    const octant_math::Plane& plane,
    const ID& entity_id,
    const Content& content,
    const octant_math::AABB& bounds,
    float tolerance)
{
    float min_distance = octant_math::consts::INFINITY_F;
    float max_distance = -octant_math::consts::INFINITY_F;
    octant_math::Vec3 min_corner = bounds.min;
    octant_math::Vec3 max_corner = bounds.max;

    for (const auto& corner : bounds.corners()) {
        const float distance = plane.distance_to_point(corner);
        if (distance < min_distance) {
            min_distance = distance;
            min_corner = corner;
        }
        if (distance > max_distance) {
            max_distance = distance;
            max_corner = corner;
        }
    }

    PlaneIntersectionType type;
    float result_distance;

    if (std::abs(min_distance) <= tolerance && std::abs(max_distance) <= tolerance) {
        type = PlaneIntersectionType::OnPlane;
        result_distance = (min_distance + max_distance) / 2.0f;
    } else if (min_distance * max_distance <= 0.0f) {
        type = PlaneIntersectionType::Intersecting;
        result_distance = std::abs(min_distance) < std::abs(max_distance) ? min_distance : max_distance;
    } else if (min_distance > 0.0f) {
        type = PlaneIntersectionType::PositiveSide;
        result_distance = min_distance;
    } else {
        type = PlaneIntersectionType::NegativeSide;
        result_distance = max_distance;
    }

    if (tolerance > 0.0f && std::abs(result_distance) > tolerance) {
        return std::nullopt;
    }

    // Boxes behind the plane are nearest at their highest corner
    octant_math::Vec3 closest = min_corner;
    if (type == PlaneIntersectionType::Intersecting) {
        closest = closest_point_on_aabb_to_plane(plane, bounds);
    } else if (type == PlaneIntersectionType::NegativeSide) {
        closest = max_corner;
    }

    return PlaneIntersection<ID, Content>(entity_id, content, result_distance, closest, type, bounds);
}

// =============================================================================
// Result Lists
// =============================================================================

/// Sort nearest-first; entities at equal distance keep their input order
template<typename ID, typename Content, typename Bounds, typename Point>
void sort_by_distance(std::vector<PlaneIntersection<ID, Content, Bounds, Point>>& results) {
    std::stable_sort(results.begin(), results.end());
}

/// Keep results that may touch the positive half-space
template<typename ID, typename Content, typename Bounds, typename Point>
[[nodiscard]] std::vector<PlaneIntersection<ID, Content, Bounds, Point>> filter_positive_side(
    const std::vector<PlaneIntersection<ID, Content, Bounds, Point>>& results)
{
    std::vector<PlaneIntersection<ID, Content, Bounds, Point>> filtered;
    std::copy_if(results.begin(), results.end(), std::back_inserter(filtered),
        [](const auto& r) { return r.is_on_positive_side(); });
    return filtered;
}

/// Keep results that may touch the negative half-space
template<typename ID, typename Content, typename Bounds, typename Point>
[[nodiscard]] std::vector<PlaneIntersection<ID, Content, Bounds, Point>> filter_negative_side(
    const std::vector<PlaneIntersection<ID, Content, Bounds, Point>>& results)
{
    std::vector<PlaneIntersection<ID, Content, Bounds, Point>> filtered;
    std::copy_if(results.begin(), results.end(), std::back_inserter(filtered),
        [](const auto& r) { return r.is_on_negative_side(); });
    return filtered;
}

/// Keep results whose absolute distance is at most max_distance
template<typename ID, typename Content, typename Bounds, typename Point>
[[nodiscard]] std::vector<PlaneIntersection<ID, Content, Bounds, Point>> filter_within_distance(
    const std::vector<PlaneIntersection<ID, Content, Bounds, Point>>& results,
    float max_distance)
{
    std::vector<PlaneIntersection<ID, Content, Bounds, Point>> filtered;
    std::copy_if(results.begin(), results.end(), std::back_inserter(filtered),
        [max_distance](const auto& r) { return std::abs(r.distance_from_plane()) <= max_distance; });
    return filtered;
}

} // namespace octant_spatial
