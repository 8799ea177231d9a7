// === Geo Distance ============================================================
//
// Great-circle helpers shared by the tour optimizer and area adjacency checks.

#pragma once

#include "route_planner/types.hpp"

namespace route_planner {

/** @brief Mean Earth radius used for every geodesic calculation. */
inline constexpr double k_earth_radius_km{6'371.0};

/**
 * @brief Haversine distance between two coordinates in kilometres.
 *
 * Symmetric, zero for identical points, never fails.
 */
[[nodiscard]] double distance_km(const Coordinate& from, const Coordinate& to) noexcept;

}  // namespace route_planner
