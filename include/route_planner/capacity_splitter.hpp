// === Capacity Splitter =======================================================
//
// Detects areas whose cargo on a route exceeds the vehicle capacity and spins
// the overflow off into new draft sub-routes. Stops are grouped by area, the
// oversized groups are ordered so urgent and early-deadline stops stay on the
// source route, and each group is cut into near-equal contiguous chunks.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "route_planner/fleet_plan.hpp"
#include "route_planner/logging.hpp"

namespace route_planner {

/** @brief What a split pass did to a route. */
struct SplitOutcome final {
    bool capacity_missing{};                     /**< No vehicle capacity was available; nothing was attempted. */
    bool route_locked{};                         /**< The route is past the planning states; nothing was attempted. */
    std::vector<RouteId> route_ids{};            /**< Source route followed by every sub-route created. */
    std::vector<RouteId> new_route_ids{};        /**< Sub-routes created by this pass. */
    std::vector<std::optional<AreaId>> split_areas{};  /**< Area groups that exceeded capacity. */
    std::vector<StopId> oversized_stops{};       /**< Stops whose own demand exceeds capacity. */
    std::size_t regrouped_areas{};               /**< Fitting area groups moved off a route whose total still overflowed. */
    std::size_t stops_moved{};
};

class CapacitySplitter final {
  public:
    explicit CapacitySplitter(FleetPlan& plan);

    /**
     * @brief Split @p route_id until every resulting route fits @p capacity.
     *
     * Area groups that overflow on their own are cut into chunks first. When
     * the source route still overflows, whole area groups are then moved to
     * further sub-routes in ascending area order. A route may only exceed
     * capacity when it holds a single stop. With no capacity the call is a
     * no-op flagged by `capacity_missing`.
     */
    SplitOutcome split_oversized_areas(RouteId route_id, const std::optional<VehicleCapacity>& capacity);

    /** @brief Minimum number of routes needed to carry @p load. Always at least 1. */
    [[nodiscard]] static std::size_t routes_needed(const CargoLoad& load, const VehicleCapacity& capacity) noexcept;

    /**
     * @brief Cut @p stops into @p parts contiguous chunks.
     *
     * Chunk sizes differ by at most one; earlier chunks take the remainder.
     */
    [[nodiscard]] static std::vector<std::vector<Stop>> partition(const std::vector<Stop>& stops, std::size_t parts);

    /** @brief Order stops by priority (desc), window start (asc, absent last), then identity. */
    static void sort_for_split(std::vector<Stop>& stops);

  private:
    /** @brief Move area groups off @p route_id while its total load overflows. */
    void regroup_remaining_areas(RouteId route_id, const VehicleCapacity& capacity, SplitOutcome& outcome);
    RouteId create_sub_route(RouteId source_id, std::optional<AreaId> area, const std::vector<StopId>& stop_ids);

    FleetPlan& plan_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace route_planner
