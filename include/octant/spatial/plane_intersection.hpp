#pragma once

/// @file plane_intersection.hpp
/// @brief Result of testing an indexed entity against an infinite plane
///
/// One PlaneIntersection is produced per candidate entity by a plane query.
/// It carries the side classification, the signed distance, the closest
/// point on the entity and the entity bounds. Results order by absolute
/// distance so a query can hand back entities nearest the plane first.

#include "fwd.hpp"

#include <octant/math/vec.hpp>
#include <octant/math/bounds.hpp>

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <concepts>
#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace octant_spatial {

// =============================================================================
// PlaneIntersectionType
// =============================================================================

/// Classification of an entity relative to a plane
enum class PlaneIntersectionType : std::uint8_t {
    PositiveSide,  ///< Entirely on the side the normal points toward
    NegativeSide,  ///< Entirely on the opposite side
    Intersecting,  ///< Spans both sides
    OnPlane        ///< Within tolerance of the plane
};

[[nodiscard]] inline const char* to_string(PlaneIntersectionType type) noexcept {
    switch (type) {
        case PlaneIntersectionType::PositiveSide: return "POSITIVE_SIDE";
        case PlaneIntersectionType::NegativeSide: return "NEGATIVE_SIDE";
        case PlaneIntersectionType::Intersecting: return "INTERSECTING";
        case PlaneIntersectionType::OnPlane:      return "ON_PLANE";
    }
    return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& os, PlaneIntersectionType type) {
    return os << to_string(type);
}

namespace detail {

/// Three-way comparison of |a| and |b|.
/// NaN magnitudes are equal to each other and greater than any number.
[[nodiscard]] inline int compare_magnitude(float a, float b) noexcept {
    const float abs_a = std::abs(a);
    const float abs_b = std::abs(b);
    if (abs_a < abs_b) return -1;
    if (abs_a > abs_b) return 1;

    const bool nan_a = std::isnan(abs_a);
    const bool nan_b = std::isnan(abs_b);
    if (nan_a == nan_b) return 0;
    return nan_a ? 1 : -1;
}

} // namespace detail

// =============================================================================
// PlaneIntersection
// =============================================================================

/// Immutable plane query result for one entity
/// @tparam ID Entity identifier (equality-comparable)
/// @tparam Content Payload stored with the entity
/// @tparam Bounds Bounding volume type
/// @tparam Point 3D point type exposing x, y, z
template<typename ID, typename Content,
         typename Bounds = octant_math::AABB,
         typename Point = octant_math::Vec3>
class PlaneIntersection {
    static_assert(std::equality_comparable<ID>, "Entity ID must be equality-comparable");

public:
    using id_type = ID;
    using content_type = Content;
    using bounds_type = Bounds;
    using point_type = Point;

    /// Takes all fields as-is. Consistency between type and distance is
    /// the producer's responsibility and is not checked here.
    PlaneIntersection(ID entity_id,
                      Content content,
                      float distance_from_plane,
                      Point closest_point,
                      PlaneIntersectionType type,
                      Bounds bounds)
        : m_entity_id(std::move(entity_id))
        , m_content(std::move(content))
        , m_distance(distance_from_plane)
        , m_closest_point(std::move(closest_point))
        , m_type(type)
        , m_bounds(std::move(bounds)) {}

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] const ID& entity_id() const noexcept { return m_entity_id; }
    [[nodiscard]] const Content& content() const noexcept { return m_content; }

    /// Signed distance, positive on the side the plane normal points toward
    [[nodiscard]] float distance_from_plane() const noexcept { return m_distance; }

    [[nodiscard]] const Point& closest_point() const noexcept { return m_closest_point; }
    [[nodiscard]] PlaneIntersectionType intersection_type() const noexcept { return m_type; }
    [[nodiscard]] const Bounds& bounds() const noexcept { return m_bounds; }

    // =========================================================================
    // Side Predicates
    // =========================================================================

    /// True if the entity touches or crosses the plane
    [[nodiscard]] bool actually_intersects() const noexcept {
        return m_type == PlaneIntersectionType::Intersecting ||
               m_type == PlaneIntersectionType::OnPlane;
    }

    /// True if any part of the entity may lie in the positive half-space.
    /// Straddling and on-plane entities count for both sides.
    [[nodiscard]] bool is_on_positive_side() const noexcept {
        return m_type == PlaneIntersectionType::PositiveSide || actually_intersects();
    }

    /// True if any part of the entity may lie in the negative half-space
    [[nodiscard]] bool is_on_negative_side() const noexcept {
        return m_type == PlaneIntersectionType::NegativeSide || actually_intersects();
    }

    // =========================================================================
    // Ordering
    // =========================================================================

    /// Compare by absolute distance from the plane: -1, 0 or 1.
    /// Type and sign are ignored; equal magnitudes compare equal.
    [[nodiscard]] int compare(const PlaneIntersection& other) const noexcept {
        return detail::compare_magnitude(m_distance, other.m_distance);
    }

    bool operator<(const PlaneIntersection& other) const noexcept {
        return compare(other) < 0;
    }

    /// Field-wise value equality
    bool operator==(const PlaneIntersection& other) const = default;

    // =========================================================================
    // Diagnostics
    // =========================================================================

    /// Human-readable summary for logs, not meant to be parsed
    [[nodiscard]] std::string to_string() const {
        std::ostringstream id_stream;
        id_stream << m_entity_id;
        return fmt::format("PlaneIntersection[entity={}, distance={:.3f}, type={}, point=({}, {}, {})]",
                           id_stream.str(), m_distance, octant_spatial::to_string(m_type),
                           m_closest_point.x, m_closest_point.y, m_closest_point.z);
    }

    friend std::ostream& operator<<(std::ostream& os, const PlaneIntersection& result) {
        return os << result.to_string();
    }

private:
    ID m_entity_id;
    Content m_content;
    float m_distance;
    Point m_closest_point;
    PlaneIntersectionType m_type;
    Bounds m_bounds;
};

} // namespace octant_spatial
