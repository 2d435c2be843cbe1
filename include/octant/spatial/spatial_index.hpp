/// @file spatial_index.hpp
/// @brief Entity store with plane queries
///
/// SpatialIndex keeps each entity's position, optional bounding box and
/// content, and mirrors the boxes into an EntityTree. Plane queries walk the
/// tree, classify each candidate with classify_point / classify_aabb and
/// return results nearest the plane first.

#pragma once

#include "fwd.hpp"
#include "config.hpp"
#include "entity_tree.hpp"
#include "plane_intersection.hpp"
#include "plane_query.hpp"

#include <octant/core/error.hpp>
#include <octant/core/log.hpp>
#include <octant/math/bounds.hpp>
#include <octant/math/plane.hpp>
#include <octant/math/vec.hpp>

#include <algorithm>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace octant_spatial {

/// Thread-safe entity index supporting plane queries
/// @tparam ID Hashable, equality-comparable entity identifier
/// @tparam Content Payload copied into query results
template<typename ID, typename Content>
class SpatialIndex {
public:
    using QueryResult = PlaneIntersection<ID, Content>;

    /// A negative or NaN tree_margin is treated as 0; shrunken leaves would
    /// cull entities the plane query must report
    explicit SpatialIndex(PlaneQueryConfig config = {})
        : m_config(with_usable_margin(config))
        , m_tree(m_config.tree_margin) {}

    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    // =========================================================================
    // Entity Management
    // =========================================================================

    /// Insert a point entity
    [[nodiscard]] octant_core::Result<void> insert(const ID& id,
                                                   const octant_math::Vec3& position,
                                                   Content content) {
        return insert_entity(id, position, std::move(content), std::nullopt);
    }

    /// Insert a bounded entity
    [[nodiscard]] octant_core::Result<void> insert(const ID& id,
                                                   const octant_math::Vec3& position,
                                                   Content content,
                                                   const octant_math::AABB& bounds) {
        return insert_entity(id, position, std::move(content), bounds);
    }

    [[nodiscard]] octant_core::Result<void> remove(const ID& id) {
        std::unique_lock lock(m_mutex);

        auto it = m_entities.find(id);
        if (it == m_entities.end()) {
            octant_core::spatial_logger()->debug("remove: entity {} not found", format_id(id));
            return octant_core::Error{octant_core::SpatialError::entity_not_found(format_id(id))};
        }

        m_tree.remove(id);
        m_entities.erase(it);
        return octant_core::Ok();
    }

    /// Move an entity. Bounded entities keep their box offset from the position.
    [[nodiscard]] octant_core::Result<void> update_position(const ID& id, const octant_math::Vec3& position) {
        if (!octant_math::is_finite(position)) {
            return octant_core::Error{octant_core::SpatialError::invalid_bounds(format_id(id), "non-finite position")};
        }

        std::unique_lock lock(m_mutex);

        auto it = m_entities.find(id);
        if (it == m_entities.end()) {
            octant_core::spatial_logger()->debug("update_position: entity {} not found", format_id(id));
            return octant_core::Error{octant_core::SpatialError::entity_not_found(format_id(id))};
        }

        Entry& entry = it->second;
        if (entry.bounds) {
            entry.bounds = entry.bounds->translated(position - entry.position);
        }
        entry.position = position;
        m_tree.update(id, entry.tree_box());
        return octant_core::Ok();
    }

    void clear() {
        std::unique_lock lock(m_mutex);
        m_entities.clear();
        m_tree.clear();
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] bool contains(const ID& id) const {
        std::shared_lock lock(m_mutex);
        return m_entities.find(id) != m_entities.end();
    }

    [[nodiscard]] std::size_t size() const {
        std::shared_lock lock(m_mutex);
        return m_entities.size();
    }

    [[nodiscard]] bool empty() const {
        return size() == 0;
    }

    [[nodiscard]] std::optional<Content> content(const ID& id) const {
        std::shared_lock lock(m_mutex);
        auto it = m_entities.find(id);
        if (it == m_entities.end()) return std::nullopt;
        return it->second.content;
    }

    [[nodiscard]] std::optional<octant_math::Vec3> position(const ID& id) const {
        std::shared_lock lock(m_mutex);
        auto it = m_entities.find(id);
        if (it == m_entities.end()) return std::nullopt;
        return it->second.position;
    }

    /// Bounding box of a bounded entity; nullopt for point or unknown entities
    [[nodiscard]] std::optional<octant_math::AABB> bounds(const ID& id) const {
        std::shared_lock lock(m_mutex);
        auto it = m_entities.find(id);
        if (it == m_entities.end()) return std::nullopt;
        return it->second.bounds;
    }

    [[nodiscard]] const PlaneQueryConfig& config() const noexcept { return m_config; }

    // =========================================================================
    // Plane Queries
    // =========================================================================

    /// Classify every entity within tolerance of the plane
    /// @param tolerance Distance cut-off; <= 0 keeps every entity
    [[nodiscard]] std::vector<QueryResult> plane_intersect_all(const octant_math::Plane& plane,
                                                          float tolerance) const {
        std::vector<QueryResult> results;

        {
            std::shared_lock lock(m_mutex);
            results.reserve(m_entities.size());

            m_tree.query_plane(plane, tolerance, [&](const ID& id) {
                auto it = m_entities.find(id);
                if (it == m_entities.end()) {
                    return true;
                }

                const Entry& entry = it->second;
                std::optional<QueryResult> result = entry.bounds
                    ? classify_aabb(plane, id, entry.content, *entry.bounds, tolerance)
                    : classify_point(plane, id, entry.content, entry.position, tolerance,
                                     m_config.on_plane_epsilon);
                if (result) {
                    results.push_back(std::move(*result));
                }
                return true;
            });
        }

        if (m_config.sort_results) {
            sort_by_distance(results);
        }

        octant_core::spatial_logger()->trace("plane query: {} of {} entities within tolerance {}",
                                             results.size(), size(), tolerance);
        return results;
    }

    /// Plane query using the configured default tolerance
    [[nodiscard]] std::vector<QueryResult> plane_intersect_all(const octant_math::Plane& plane) const {
        return plane_intersect_all(plane, m_config.default_tolerance);
    }

    /// Entities on or crossing into the side opposite the normal.
    /// Runs without a distance cut-off so boxes keep their true classification.
    [[nodiscard]] std::vector<QueryResult> plane_intersect_negative_side(const octant_math::Plane& plane) const {
        return filter_negative_side(plane_intersect_all(plane, 0.0f));
    }

    /// Entities on or crossing into the side the normal points toward
    [[nodiscard]] std::vector<QueryResult> plane_intersect_positive_side(const octant_math::Plane& plane) const {
        return filter_positive_side(plane_intersect_all(plane, 0.0f));
    }

    /// Entities whose reported distance is at most max_distance, either side
    [[nodiscard]] std::vector<QueryResult> plane_intersect_within_distance(const octant_math::Plane& plane,
                                                                      float max_distance) const {
        return filter_within_distance(plane_intersect_all(plane, max_distance), max_distance);
    }

private:
    static PlaneQueryConfig with_usable_margin(PlaneQueryConfig config) {
        config.tree_margin = std::max(0.0f, config.tree_margin);
        return config;
    }

    struct Entry {
        octant_math::Vec3 position;
        std::optional<octant_math::AABB> bounds;
        Content content;

        /// Box mirrored into the tree; point entities use a zero-volume box
        [[nodiscard]] octant_math::AABB tree_box() const {
            return bounds ? *bounds : octant_math::AABB::from_point(position);
        }
    };

    octant_core::Result<void> insert_entity(const ID& id,
                                            const octant_math::Vec3& position,
                                            Content content,
                                            const std::optional<octant_math::AABB>& bounds) {
        if (!octant_math::is_finite(position)) {
            return octant_core::Error{octant_core::SpatialError::invalid_bounds(format_id(id), "non-finite position")};
        }
        if (bounds) {
            if (!octant_math::is_finite(bounds->min) || !octant_math::is_finite(bounds->max)) {
                return octant_core::Error{octant_core::SpatialError::invalid_bounds(format_id(id), "non-finite corner")};
            }
            if (!bounds->is_valid()) {
                return octant_core::Error{octant_core::SpatialError::invalid_bounds(format_id(id), "min exceeds max")};
            }
        }

        std::unique_lock lock(m_mutex);

        if (m_entities.find(id) != m_entities.end()) {
            octant_core::spatial_logger()->debug("insert: entity {} already indexed", format_id(id));
            return octant_core::Error{octant_core::SpatialError::duplicate_entity(format_id(id))};
        }

        auto it = m_entities.emplace(id, Entry{position, bounds, std::move(content)}).first;
        m_tree.insert(id, it->second.tree_box());
        return octant_core::Ok();
    }

    [[nodiscard]] static std::string format_id(const ID& id) {
        std::ostringstream oss;
        oss << id;
        return oss.str();
    }

    PlaneQueryConfig m_config;
    mutable std::shared_mutex m_mutex;
    std::unordered_map<ID, Entry> m_entities;
    EntityTree<ID> m_tree;
};

} // namespace octant_spatial
