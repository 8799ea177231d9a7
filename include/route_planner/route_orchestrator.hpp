// === Route Orchestrator ======================================================
//
// Entry points used by dispatch tooling: distance optimization, capacity
// splitting, combining of nearby routes, the composite split/combine
// strategies, fleet-wide optimization, and route/stop lifecycle actions. Every
// call returns an OperationResult and leaves the plan satisfying the route and
// stop invariants.
//
// Locking: split, combine, build, and lifecycle actions change stop ownership
// across routes and hold the plan lock exclusively. Distance optimization only
// touches one route, so it holds the plan lock shared plus that route's lock,
// which lets the fleet-wide run fan out across worker threads.

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "route_planner/area_adjacency.hpp"
#include "route_planner/fleet_plan.hpp"
#include "route_planner/logging.hpp"
#include "route_planner/operation_result.hpp"
#include "route_planner/route_builder.hpp"

namespace route_planner {

/**
 * @brief Tunable parameters for the planning heuristics.
 *
 * Populated at startup from the configuration loader and treated as immutable
 * while the orchestrator runs.
 */
struct PlannerConfig final {
    double proximity_threshold_km{k_default_proximity_threshold_km};
    std::size_t worker_count{4};
};

class RouteOrchestrator final {
  public:
    RouteOrchestrator(FleetPlan& plan, PlannerConfig config);

    /** @brief Accessor for the immutable configuration bundle. */
    [[nodiscard]] const PlannerConfig& config() const noexcept;

    /** @brief Re-sequence one route by nearest neighbour without ever lengthening it. */
    OperationResult optimize_route_by_distance(RouteId route_id);
    /** @brief Spin oversized area groups off into new draft routes. */
    OperationResult split_route_by_area_capacity(RouteId route_id);
    /** @brief Absorb adjacent routes that still fit on the vehicle. */
    OperationResult combine_nearby_areas_route(RouteId route_id);
    /** @brief Split, then combine the resulting routes among themselves. */
    OperationResult split_combine_for_adjacent_areas(RouteId route_id);
    /** @brief Split, combine, then re-optimize every surviving route. */
    OperationResult smart_split_combine_route(RouteId route_id);
    /** @brief Optimize every draft or confirmed route, isolating failures per route. */
    OperationResult optimize_all_routes_for_distance();

    /** @brief Build the draft route for a delivery batch. */
    OperationResult build_route(const DeliveryBatch& batch);
    /** @brief Report batch orders that could never fit on the batch vehicle. */
    OperationResult check_split_requirements(const DeliveryBatch& batch) const;

    OperationResult confirm_route(RouteId route_id);
    OperationResult start_route(RouteId route_id);
    OperationResult deliver_route(RouteId route_id);
    OperationResult cancel_route(RouteId route_id);

    /**
     * @brief Move a stop and/or change its time window on dispatcher request.
     *
     * The stop is marked adjusted with @p reason; a new sequence is clamped to
     * the route length.
     */
    OperationResult adjust_stop(StopId stop_id,
                                AdjustmentReason reason,
                                std::optional<int> new_sequence,
                                std::optional<WallTimePoint> new_window_start = std::nullopt,
                                std::optional<WallTimePoint> new_window_end = std::nullopt);

  private:
    struct SplitCombineSummary final {
        OperationResult result{};
        std::vector<RouteId> surviving_route_ids{};
    };

    /** @brief Distance optimization; caller holds the locks. */
    OperationResult optimize_unlocked(RouteId route_id);
    SplitCombineSummary split_combine_unlocked(RouteId route_id);
    OperationResult transition_route(RouteId route_id, RouteState target, const std::string& title);
    std::mutex& route_mutex(RouteId route_id);

    FleetPlan& plan_;
    PlannerConfig config_;
    AreaAdjacency adjacency_;
    RouteBuilder route_builder_;
    mutable std::shared_mutex mutex_plan_;
    std::mutex mutex_route_locks_;
    std::map<RouteId, std::unique_ptr<std::mutex>> map_route_locks_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace route_planner
