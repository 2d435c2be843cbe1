#pragma once

/// @file spatial.hpp
/// @brief Main include file for octant_spatial module
///
/// @code
/// #include <octant/spatial/spatial.hpp>
///
/// octant_spatial::SpatialIndex<octant_core::EntityId, std::string> index;
/// auto ok = index.insert(id, octant_math::Vec3(0.0f, 2.0f, 0.0f), "lamp");
///
/// octant_math::Plane floor(octant_math::vec3::UP, 0.0f);
/// for (const auto& hit : index.plane_intersect_positive_side(floor)) {
///     // nearest first
/// }
/// @endcode

#include "fwd.hpp"
#include "plane_intersection.hpp"
#include "plane_query.hpp"
#include "entity_tree.hpp"
#include "config.hpp"
#include "spatial_index.hpp"
