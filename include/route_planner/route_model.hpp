// === Route Model =============================================================
//
// Plain records for areas, customers, vehicles, stops, and routes. Records
// refer to one another by identity; the FleetPlan arena owns every instance
// and is the only place where ownership between routes and stops changes.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "route_planner/types.hpp"

namespace route_planner {

/**
 * @brief Named coverage region grouping nearby customers.
 *
 * The representative coordinate is the centroid of the member customers and is
 * refreshed by FleetPlan whenever membership changes.
 */
struct Area final {
    AreaId id{};
    std::string code{};
    std::string name{};
    std::string description{};
    bool active{true};
    std::vector<CustomerId> member_customers{};
    std::optional<Coordinate> representative{};  /**< Absent while the area has no members. */
};

/** @brief Delivery destination registered with the plan. */
struct Customer final {
    CustomerId id{};
    std::string name{};
    Coordinate location{};
    std::optional<AreaId> area{};
};

/** @brief Read-only vehicle description supplying capacity limits. */
struct Vehicle final {
    VehicleId id{};
    std::string name{};
    VehicleCapacity capacity{};
};

/** @brief One delivery location within a route. */
struct Stop final {
    StopId id{};
    RouteId route{};
    CustomerId customer{};
    Coordinate location{};
    int sequence{};  /**< 1-based visiting position within the owning route. */
    CargoLoad demand{};
    std::optional<AreaId> area{};
    std::optional<WallTimePoint> time_window_start{};
    std::optional<WallTimePoint> time_window_end{};
    int priority{};  /**< 0 (normal) to 4 (most urgent). */
    StopState state{StopState::Pending};
    std::vector<OrderId> orders{};
    std::optional<AdjustmentReason> adjustment_reason{};
};

/** @brief Aggregate root holding an ordered collection of owned stops. */
struct Route final {
    RouteId id{};
    BatchId batch{};
    std::optional<AreaId> area{};  /**< Absent when the route spans several areas. */
    std::optional<VehicleId> vehicle{};
    RouteState state{RouteState::Draft};
    std::vector<StopId> stops{};  /**< Stop identities ordered by sequence. */
};

/** @brief True for states in which stops may still be moved between routes. */
[[nodiscard]] bool is_plannable(RouteState state) noexcept;

/** @brief True for states that have not reached a terminal outcome. */
[[nodiscard]] bool is_active(RouteState state) noexcept;

/** @brief Legal edges of the route state machine. */
[[nodiscard]] bool can_transition(RouteState from, RouteState to) noexcept;

/**
 * @brief Derive an area code from its display name.
 *
 * "North Side-East" becomes "NORTH_SIDE_EAST"; an empty name yields
 * "UNNAMED_AREA".
 */
[[nodiscard]] std::string generate_area_code(std::string_view name);

}  // namespace route_planner
