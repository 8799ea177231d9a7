// === Route Builder ===========================================================
//
// Turns a picked delivery batch into its single draft route: one stop per
// customer, demand aggregated from the orders, the route area taken from the
// majority of orders, and an initial nearest-neighbour visiting order.
// Batches whose cargo cannot fit the assigned vehicle are rejected so that the
// warehouse can re-batch before a route exists.

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "route_planner/fleet_plan.hpp"
#include "route_planner/logging.hpp"
#include "route_planner/operation_result.hpp"

namespace route_planner {

/** @brief One customer order picked into a batch. */
struct DeliveryOrder final {
    OrderId id{};
    std::string name{};
    CustomerId customer{};
    CargoLoad demand{};
    int priority{};  /**< 0 (normal) to 4 (most urgent). */
    std::optional<WallTimePoint> deadline{};
};

/** @brief Orders picked together and dispatched on one vehicle. */
struct DeliveryBatch final {
    BatchId id{};
    std::string name{};
    std::optional<VehicleId> vehicle{};
    std::vector<DeliveryOrder> orders{};
};

using OrdersByArea = std::map<std::optional<AreaId>, std::vector<DeliveryOrder>>;

class RouteBuilder final {
  public:
    explicit RouteBuilder(FleetPlan& plan);

    /** @brief Create and sequence the draft route for @p batch. */
    OperationResult build_route(const DeliveryBatch& batch);

    /** @brief List orders that exceed the batch vehicle's capacity on their own. */
    [[nodiscard]] OperationResult check_split_requirements(const DeliveryBatch& batch) const;

    /** @brief Group orders by their customer's area, preserving order within a group. */
    [[nodiscard]] OrdersByArea group_orders_by_area(const std::vector<DeliveryOrder>& orders) const;

  private:
    [[nodiscard]] std::optional<AreaId> majority_area(const std::vector<DeliveryOrder>& orders) const;

    FleetPlan& plan_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace route_planner
