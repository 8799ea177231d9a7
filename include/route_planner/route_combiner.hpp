// === Route Combiner ==========================================================
//
// Absorbs whole candidate routes into a target route when their areas are
// adjacent and the combined cargo still fits the vehicle. Absorbed routes are
// left empty and cancelled.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "route_planner/area_adjacency.hpp"
#include "route_planner/fleet_plan.hpp"
#include "route_planner/logging.hpp"

namespace route_planner {

/** @brief What a combine pass did to the target route. */
struct CombineOutcome final {
    bool capacity_missing{};
    bool route_locked{};
    std::vector<RouteId> merged_route_ids{};  /**< Candidates absorbed and cancelled, ascending. */
    std::size_t stops_moved{};
};

class RouteCombiner final {
  public:
    RouteCombiner(FleetPlan& plan, AreaAdjacency adjacency);

    /**
     * @brief Merge qualifying @p candidates into @p route_id.
     *
     * Candidates are examined in ascending identity; each one is absorbed
     * whole or not at all. A candidate must be adjacent to every area already
     * served by the target, including areas gained from earlier merges.
     */
    CombineOutcome combine_adjacent(RouteId route_id,
                                    std::vector<RouteId> candidates,
                                    const std::optional<VehicleCapacity>& capacity);

  private:
    /** @brief Distinct stop areas of a route, or its own area when no stop has one. */
    [[nodiscard]] std::set<AreaId> served_areas(RouteId route_id) const;
    /** @brief True when every pair drawn from the two sets is adjacent; an empty set matches anything. */
    [[nodiscard]] bool all_adjacent(const std::set<AreaId>& lhs, const std::set<AreaId>& rhs) const;

    FleetPlan& plan_;
    AreaAdjacency adjacency_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace route_planner
