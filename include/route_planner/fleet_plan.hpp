// === Fleet Plan ==============================================================
//
// In-memory arena owning every area, customer, vehicle, route, and stop of a
// planning session. Records live in ordered maps keyed by identity so that
// every traversal is deterministic. All cross-route ownership changes go
// through `move_stops`, which updates both routes and re-sequences them before
// returning.
//
// The plan itself performs no locking; RouteOrchestrator serializes writers.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "route_planner/route_model.hpp"

namespace route_planner {

/** @brief Input used to append a new stop to a route. */
struct StopRequest final {
    CustomerId customer{};
    CargoLoad demand{};
    std::optional<AreaId> area{};  /**< Defaults to the customer's area. */
    std::optional<WallTimePoint> time_window_start{};
    std::optional<WallTimePoint> time_window_end{};
    int priority{};
    std::vector<OrderId> orders{};
};

class FleetPlan final {
  public:
    /** @brief Register an area; an empty code is generated from the name. */
    AreaId add_area(std::string name, std::string code = {}, std::string description = {});
    CustomerId add_customer(std::string name, Coordinate location, std::optional<AreaId> area = std::nullopt);
    /** @brief Move a customer to another area and refresh both centroids. */
    void assign_customer_area(CustomerId customer_id, std::optional<AreaId> area_id);
    VehicleId add_vehicle(std::string name, VehicleCapacity capacity);

    RouteId create_route(BatchId batch, std::optional<AreaId> area, std::optional<VehicleId> vehicle);
    /** @brief Append a pending stop at the end of @p route_id. */
    StopId add_stop(RouteId route_id, const StopRequest& request);

    [[nodiscard]] const Area& area(AreaId area_id) const;
    [[nodiscard]] const Area* find_area(std::optional<AreaId> area_id) const;
    [[nodiscard]] std::optional<AreaId> find_area_by_code(const std::string& code) const;
    [[nodiscard]] const Customer& customer(CustomerId customer_id) const;
    [[nodiscard]] const Vehicle& vehicle(VehicleId vehicle_id) const;
    [[nodiscard]] const Route& route(RouteId route_id) const;
    [[nodiscard]] const Stop& stop(StopId stop_id) const;
    [[nodiscard]] bool has_customer(CustomerId customer_id) const;
    [[nodiscard]] bool has_route(RouteId route_id) const;
    [[nodiscard]] bool has_stop(StopId stop_id) const;

    /** @brief Copies of the route's stops ordered by sequence. */
    [[nodiscard]] std::vector<Stop> stops_of(RouteId route_id) const;
    [[nodiscard]] CargoLoad route_load(RouteId route_id) const;
    /** @brief Capacity of the assigned vehicle, absent when none is assigned. */
    [[nodiscard]] std::optional<VehicleCapacity> capacity_for(RouteId route_id) const;
    /** @brief All route identities in ascending order. */
    [[nodiscard]] std::vector<RouteId> route_ids() const;
    [[nodiscard]] std::optional<RouteId> route_for_batch(BatchId batch) const;

    /**
     * @brief Replace the visiting order of a route.
     *
     * @p ordered must be a permutation of the route's current stops; sequences
     * are rewritten to 1..N in that order.
     */
    void apply_sequence(RouteId route_id, const std::vector<StopId>& ordered);
    /**
     * @brief Transfer stops to @p destination, appended in the given order.
     *
     * Source and destination routes are both re-sequenced 1..N.
     */
    void move_stops(const std::vector<StopId>& stop_ids, RouteId destination);
    /** @brief Move a stop to @p new_sequence (clamped to 1..N) within its route. */
    void reposition_stop(StopId stop_id, int new_sequence);
    void set_stop_window(StopId stop_id,
                         std::optional<WallTimePoint> window_start,
                         std::optional<WallTimePoint> window_end);
    void set_stop_state(StopId stop_id, StopState state, std::optional<AdjustmentReason> reason = std::nullopt);

    void set_route_area(RouteId route_id, std::optional<AreaId> area_id);
    void set_route_vehicle(RouteId route_id, std::optional<VehicleId> vehicle_id);
    /**
     * @brief Advance the route state machine.
     *
     * Throws std::logic_error for illegal edges, and when confirming a route
     * without a vehicle or with cargo beyond capacity.
     */
    void transition(RouteId route_id, RouteState target);

    /** @brief True when the route's sequences form a contiguous 1..N permutation. */
    [[nodiscard]] bool sequence_is_contiguous(RouteId route_id) const;

  private:
    Route& mutable_route(RouteId route_id);
    Stop& mutable_stop(StopId stop_id);
    void resequence(Route& route);
    void refresh_representative(AreaId area_id);

    std::map<AreaId, Area> map_areas_;
    std::map<CustomerId, Customer> map_customers_;
    std::map<VehicleId, Vehicle> map_vehicles_;
    std::map<RouteId, Route> map_routes_;
    std::map<StopId, Stop> map_stops_;
    AreaId next_area_id_{1};
    CustomerId next_customer_id_{1};
    VehicleId next_vehicle_id_{1};
    RouteId next_route_id_{1};
    StopId next_stop_id_{1};
};

}  // namespace route_planner
