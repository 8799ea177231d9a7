#include <array>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "route_planner/configuration.hpp"
#include "route_planner/fleet_plan.hpp"
#include "route_planner/logging.hpp"
#include "route_planner/route_orchestrator.hpp"
#include "route_planner/version.hpp"

namespace {

using namespace route_planner;

constexpr VehicleCapacity k_demo_truck_capacity{1'000.0, 50.0}; /**< Box truck used for every demo batch. */
constexpr double k_demo_order_volume_m3{1.5};                   /**< Volume of each demo order. */

struct DemoCustomer final {
    const char* name;
    const char* area_code;
    Coordinate location;
    double order_weight_kg;
    int priority;
};

constexpr std::array<DemoCustomer, 7> k_demo_customers{{
    {"North Customer 1", "NORTH", {40.7128, -74.0060}, 320.0, 0},
    {"North Customer 2", "NORTH", {40.7228, -74.0160}, 280.0, 3},
    {"North Customer 3", "NORTH", {40.7180, -74.0010}, 300.0, 0},
    {"North Customer 4", "NORTH", {40.7300, -74.0100}, 350.0, 1},
    {"South Customer 1", "SOUTH", {40.6528, -74.0360}, 150.0, 0},
    {"South Customer 2", "SOUTH", {40.6600, -74.0300}, 100.0, 4},
    {"East Customer 1", "EAST", {40.7328, -73.9560}, 120.0, 0},
}}; /**< Customers seeded around lower Manhattan and Brooklyn. */

/**
 * @brief Register demo areas, customers, and the truck; return the truck id.
 */
VehicleId seed_demo_fleet(FleetPlan& plan) {
    plan.add_area("North Area", "NORTH", "Northern delivery area");
    plan.add_area("South Area", "SOUTH", "Southern delivery area");
    plan.add_area("East Area", "EAST", "Eastern delivery area");
    for (const DemoCustomer& customer : k_demo_customers) {
        plan.add_customer(customer.name, customer.location, plan.find_area_by_code(customer.area_code));
    }
    return plan.add_vehicle("Demo Box Truck", k_demo_truck_capacity);
}

/**
 * @brief Build one batch per area group of demo customers.
 */
std::vector<DeliveryBatch> make_demo_batches(VehicleId truck) {
    std::vector<DeliveryBatch> list_batches;
    for (const std::string_view area_code : {"NORTH", "SOUTH", "EAST"}) {
        DeliveryBatch batch{};
        batch.id = list_batches.size() + 1;
        batch.name = "Batch " + std::string{area_code};
        CustomerId customer_id = 1;
        for (const DemoCustomer& customer : k_demo_customers) {
            if (customer.area_code == area_code) {
                DeliveryOrder order{};
                order.id = customer_id;
                order.name = std::string{"Order for "} + customer.name;
                order.customer = customer_id;
                order.demand = CargoLoad{customer.order_weight_kg, k_demo_order_volume_m3};
                order.priority = customer.priority;
                batch.orders.push_back(order);
            }
            ++customer_id;
        }
        // The north batch is dispatched without a vehicle and receives one once it has been split.
        if (area_code != "NORTH") {
            batch.vehicle = truck;
        }
        list_batches.push_back(std::move(batch));
    }
    return list_batches;
}

void log_result(const std::shared_ptr<spdlog::logger>& logger, const OperationResult& result) {
    logger->info(R"({{"component":"cli","status":"{}","title":{:?},"message":{:?}}})", to_string(result.status), result.title, result.message);
    for (const OperationResult& route_result : result.per_route_results) {
        logger->info(R"({{"component":"cli","route":{},"status":"{}","title":{:?},"message":{:?}}})",
                     route_result.route_id.value_or(0),
                     to_string(route_result.status),
                     route_result.title,
                     route_result.message);
    }
}

}  // namespace

int main() {
    using namespace route_planner;

    try {
        const Configuration configuration = ConfigurationLoader::load();

        if (const char* desired_level = std::getenv("ROUTE_PLANNER_LOG_LEVEL"); desired_level != nullptr) {
            set_log_level(desired_level);
        }

        auto logger = get_logger();
        logger->info(R"({{"component":"cli","action":"start","version":"{}"}})", k_version);

        FleetPlan plan{};
        const VehicleId truck = seed_demo_fleet(plan);
        RouteOrchestrator orchestrator{plan, configuration.planner};

        std::vector<RouteId> list_routes;
        for (const DeliveryBatch& batch : make_demo_batches(truck)) {
            const OperationResult built = orchestrator.build_route(batch);
            log_result(logger, built);
            if (built.route_id.has_value()) {
                list_routes.push_back(*built.route_id);
            }
        }

        log_result(logger, orchestrator.optimize_all_routes_for_distance());

        for (const RouteId route_id : list_routes) {
            if (!plan.route(route_id).vehicle.has_value()) {
                plan.set_route_vehicle(route_id, truck);
            }
            log_result(logger, orchestrator.smart_split_combine_route(route_id));
        }

        for (const RouteId route_id : plan.route_ids()) {
            const Route& route = plan.route(route_id);
            if (route.state != RouteState::Draft) {
                continue;
            }
            log_result(logger, orchestrator.confirm_route(route_id));
            const CargoLoad load = plan.route_load(route_id);
            logger->info(R"({{"component":"cli","route":{},"stops":{},"weight_kg":{:.1f},"volume_m3":{:.1f},"state":"{}"}})",
                         route_id,
                         route.stops.size(),
                         load.weight_kg,
                         load.volume_m3,
                         to_string(plan.route(route_id).state));
        }
        logger->flush();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical(R"({{"component":"cli","action":"abort","error":{:?}}})", std::string_view{exc.what()});
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
