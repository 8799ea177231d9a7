// === Tour Optimizer ==========================================================
//
// Nearest-neighbour re-sequencing of a route's stops. The anchor is the stop
// with the lowest current sequence and every tie is broken by the lowest stop
// identity, so identical input always yields the identical tour.

#pragma once

#include <vector>

#include "route_planner/route_model.hpp"

namespace route_planner {

/**
 * @brief Reorder @p stops with the nearest-neighbour heuristic.
 *
 * The returned stops are the input set with `sequence` rewritten to 1..N in
 * visiting order. Zero or one stop is returned unchanged.
 */
[[nodiscard]] std::vector<Stop> optimize_tour(std::vector<Stop> stops);

/**
 * @brief Total travel distance in kilometres along @p stops in their given order.
 */
[[nodiscard]] double route_distance_km(const std::vector<Stop>& stops) noexcept;

}  // namespace route_planner
