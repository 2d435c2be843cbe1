#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for octant_spatial

#include <octant/math/fwd.hpp>
#include <cstdint>

namespace octant_spatial {

enum class PlaneIntersectionType : std::uint8_t;

template<typename ID, typename Content, typename Bounds, typename Point>
class PlaneIntersection;

template<typename ID>
class EntityTree;

template<typename ID, typename Content>
class SpatialIndex;

struct PlaneQueryConfig;

} // namespace octant_spatial
