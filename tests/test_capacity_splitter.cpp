#include <algorithm>
#include <chrono>
#include <set>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "route_planner/capacity_splitter.hpp"

using namespace route_planner;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    route_planner::test::ensure_logger_initialized();
    return true;
}();

StopId add_weighted_stop(FleetPlan& plan, RouteId route, CustomerId customer, double weight_kg, int priority = 0) {
    StopRequest request{};
    request.customer = customer;
    request.demand = CargoLoad{weight_kg, 1.0};
    request.priority = priority;
    return plan.add_stop(route, request);
}

Stop make_stop(StopId stop_id, int priority, std::optional<WallTimePoint> window_start) {
    Stop stop{};
    stop.id = stop_id;
    stop.priority = priority;
    stop.time_window_start = window_start;
    return stop;
}

}  // namespace

TEST_CASE("CapacitySplitter splits an overloaded area into fitting routes") {
    FleetPlan plan{};
    const AreaId north = plan.add_area("North", "NORTH");
    const VehicleId truck = plan.add_vehicle("Truck", VehicleCapacity{1'000.0, 50.0});
    const RouteId route = plan.create_route(1, north, truck);

    std::set<StopId> expected_stops;
    const std::vector<Coordinate> list_locations{
        {40.7128, -74.0060}, {40.7228, -74.0160}, {40.7180, -74.0010}, {40.7300, -74.0100}};
    const std::vector<double> list_weights{320.0, 280.0, 300.0, 350.0};
    for (std::size_t index = 0; index < list_weights.size(); ++index) {
        const CustomerId customer = plan.add_customer("Customer", list_locations[index], north);
        expected_stops.insert(add_weighted_stop(plan, route, customer, list_weights[index]));
    }

    CapacitySplitter splitter{plan};
    const SplitOutcome outcome = splitter.split_oversized_areas(route, plan.capacity_for(route));

    REQUIRE_FALSE(outcome.capacity_missing);
    REQUIRE(outcome.route_ids.size() >= 2);
    REQUIRE(outcome.route_ids.front() == route);
    REQUIRE(outcome.split_areas.size() == 1);
    REQUIRE(outcome.oversized_stops.empty());

    std::multiset<StopId> covered_stops;
    for (const RouteId resulting : outcome.route_ids) {
        const Route& record = plan.route(resulting);
        REQUIRE(record.state == RouteState::Draft);
        REQUIRE(record.vehicle == truck);
        REQUIRE(record.area == north);
        REQUIRE(record.batch == 1);
        REQUIRE(plan.route_load(resulting).weight_kg <= 1'000.0);
        REQUIRE(plan.sequence_is_contiguous(resulting));
        covered_stops.insert(record.stops.begin(), record.stops.end());
    }
    REQUIRE(covered_stops.size() == expected_stops.size());
    REQUIRE(std::set<StopId>(covered_stops.begin(), covered_stops.end()) == expected_stops);
}

TEST_CASE("CapacitySplitter only splits the area groups that overflow") {
    FleetPlan plan{};
    const AreaId north = plan.add_area("North", "NORTH");
    const AreaId south = plan.add_area("South", "SOUTH");
    const VehicleId truck = plan.add_vehicle("Truck", VehicleCapacity{500.0, 0.0});
    const RouteId route = plan.create_route(1, std::nullopt, truck);

    const CustomerId north_customer = plan.add_customer("North Customer", {40.71, -74.00}, north);
    const CustomerId south_customer = plan.add_customer("South Customer", {40.65, -74.03}, south);
    add_weighted_stop(plan, route, north_customer, 300.0);
    add_weighted_stop(plan, route, north_customer, 300.0);
    add_weighted_stop(plan, route, south_customer, 200.0);

    CapacitySplitter splitter{plan};
    const SplitOutcome outcome = splitter.split_oversized_areas(route, plan.capacity_for(route));

    REQUIRE(outcome.split_areas.size() == 1);
    REQUIRE(outcome.split_areas.front() == north);
    REQUIRE(outcome.new_route_ids.size() == 1);
    REQUIRE(outcome.stops_moved == 1);
    REQUIRE(plan.route(route).stops.size() == 2);
}

TEST_CASE("CapacitySplitter keeps the source within capacity when several areas overflow") {
    FleetPlan plan{};
    const AreaId north = plan.add_area("North", "NORTH");
    const AreaId south = plan.add_area("South", "SOUTH");
    const VehicleId truck = plan.add_vehicle("Truck", VehicleCapacity{1'000.0, 0.0});
    const RouteId route = plan.create_route(1, std::nullopt, truck);
    const CustomerId north_customer = plan.add_customer("North Customer", {40.71, -74.00}, north);
    const CustomerId south_customer = plan.add_customer("South Customer", {40.65, -74.03}, south);
    for (int index = 0; index < 2; ++index) {
        add_weighted_stop(plan, route, north_customer, 700.0);
        add_weighted_stop(plan, route, south_customer, 700.0);
    }

    CapacitySplitter splitter{plan};
    const SplitOutcome outcome = splitter.split_oversized_areas(route, plan.capacity_for(route));

    REQUIRE(outcome.split_areas.size() == 2);
    REQUIRE(outcome.regrouped_areas == 1);
    REQUIRE(outcome.route_ids.size() == 4);
    std::size_t stop_count = 0;
    for (const RouteId resulting : outcome.route_ids) {
        REQUIRE(plan.route_load(resulting).weight_kg <= 1'000.0);
        REQUIRE(plan.sequence_is_contiguous(resulting));
        stop_count += plan.route(resulting).stops.size();
    }
    REQUIRE(stop_count == 4);
}

TEST_CASE("CapacitySplitter moves whole areas off a route that only overflows in total") {
    FleetPlan plan{};
    const AreaId north = plan.add_area("North", "NORTH");
    const AreaId south = plan.add_area("South", "SOUTH");
    const VehicleId truck = plan.add_vehicle("Truck", VehicleCapacity{1'000.0, 0.0});
    const RouteId route = plan.create_route(1, std::nullopt, truck);
    const CustomerId north_customer = plan.add_customer("North Customer", {40.71, -74.00}, north);
    const CustomerId south_customer = plan.add_customer("South Customer", {40.65, -74.03}, south);
    const StopId north_stop = add_weighted_stop(plan, route, north_customer, 625.0);
    const StopId south_stop = add_weighted_stop(plan, route, south_customer, 625.0);

    CapacitySplitter splitter{plan};
    const SplitOutcome outcome = splitter.split_oversized_areas(route, plan.capacity_for(route));

    REQUIRE(outcome.split_areas.empty());
    REQUIRE(outcome.regrouped_areas == 1);
    REQUIRE(outcome.new_route_ids.size() == 1);
    REQUIRE(outcome.stops_moved == 1);

    const RouteId sub_route = outcome.new_route_ids.front();
    REQUIRE(plan.route(route).stops == std::vector<StopId>{north_stop});
    REQUIRE(plan.route(sub_route).stops == std::vector<StopId>{south_stop});
    REQUIRE(plan.route(sub_route).area == south);
    REQUIRE(plan.route(sub_route).vehicle == truck);
    REQUIRE(plan.route_load(route).weight_kg <= 1'000.0);
    REQUIRE(plan.route_load(sub_route).weight_kg <= 1'000.0);
}

TEST_CASE("CapacitySplitter packs fitting area groups together when regrouping") {
    FleetPlan plan{};
    const VehicleId truck = plan.add_vehicle("Truck", VehicleCapacity{1'000.0, 0.0});
    const RouteId route = plan.create_route(1, std::nullopt, truck);
    for (const char* code : {"A", "B", "C", "D"}) {
        const AreaId area = plan.add_area(code, code);
        const CustomerId customer = plan.add_customer(code, {40.71, -74.00}, area);
        add_weighted_stop(plan, route, customer, 400.0);
    }

    CapacitySplitter splitter{plan};
    const SplitOutcome outcome = splitter.split_oversized_areas(route, plan.capacity_for(route));

    REQUIRE(outcome.new_route_ids.size() == 1);
    REQUIRE(outcome.regrouped_areas == 2);
    REQUIRE(plan.route_load(route).weight_kg == Approx(800.0));
    REQUIRE(plan.route_load(outcome.new_route_ids.front()).weight_kg == Approx(800.0));
    REQUIRE_FALSE(plan.route(outcome.new_route_ids.front()).area.has_value());
}

TEST_CASE("CapacitySplitter reports stops that are oversized on their own") {
    FleetPlan plan{};
    const VehicleId van = plan.add_vehicle("Van", VehicleCapacity{100.0, 0.0});
    const RouteId route = plan.create_route(1, std::nullopt, van);
    const CustomerId customer = plan.add_customer("Customer", {40.71, -74.00});
    const StopId heavy = add_weighted_stop(plan, route, customer, 250.0);
    add_weighted_stop(plan, route, customer, 50.0);

    CapacitySplitter splitter{plan};
    const SplitOutcome outcome = splitter.split_oversized_areas(route, plan.capacity_for(route));

    REQUIRE(outcome.oversized_stops == std::vector<StopId>{heavy});
    REQUIRE(outcome.route_ids.size() == 2);
    for (const RouteId resulting : outcome.route_ids) {
        REQUIRE(plan.route(resulting).stops.size() == 1);
    }
}

TEST_CASE("CapacitySplitter does nothing without a capacity") {
    FleetPlan plan{};
    const RouteId route = plan.create_route(1, std::nullopt, std::nullopt);
    const CustomerId customer = plan.add_customer("Customer", {40.71, -74.00});
    add_weighted_stop(plan, route, customer, 5'000.0);

    CapacitySplitter splitter{plan};
    const SplitOutcome outcome = splitter.split_oversized_areas(route, std::nullopt);

    REQUIRE(outcome.capacity_missing);
    REQUIRE(outcome.new_route_ids.empty());
    REQUIRE(plan.route_ids().size() == 1);
}

TEST_CASE("CapacitySplitter leaves locked routes alone") {
    FleetPlan plan{};
    const VehicleId truck = plan.add_vehicle("Truck", VehicleCapacity{1'000.0, 0.0});
    const RouteId route = plan.create_route(1, std::nullopt, truck);
    plan.transition(route, RouteState::Cancelled);

    CapacitySplitter splitter{plan};
    REQUIRE(splitter.split_oversized_areas(route, plan.capacity_for(route)).route_locked);
}

TEST_CASE("CapacitySplitter computes routes needed per constrained dimension") {
    const VehicleCapacity truck{1'000.0, 10.0};
    REQUIRE(CapacitySplitter::routes_needed(CargoLoad{1'250.0, 5.0}, truck) == 2);
    REQUIRE(CapacitySplitter::routes_needed(CargoLoad{900.0, 25.0}, truck) == 3);
    REQUIRE(CapacitySplitter::routes_needed(CargoLoad{0.0, 0.0}, truck) == 1);
    REQUIRE(CapacitySplitter::routes_needed(CargoLoad{5'000.0, 5'000.0}, VehicleCapacity{}) == 1);
}

TEST_CASE("CapacitySplitter partitions into balanced contiguous chunks") {
    std::vector<Stop> list_stops;
    for (StopId stop_id = 1; stop_id <= 7; ++stop_id) {
        list_stops.push_back(make_stop(stop_id, 0, std::nullopt));
    }
    const auto list_chunks = CapacitySplitter::partition(list_stops, 3);

    REQUIRE(list_chunks.size() == 3);
    REQUIRE(list_chunks[0].size() == 3);
    REQUIRE(list_chunks[1].size() == 2);
    REQUIRE(list_chunks[2].size() == 2);
    REQUIRE(list_chunks[0].front().id == 1);
    REQUIRE(list_chunks[1].front().id == 4);
    REQUIRE(list_chunks[2].back().id == 7);

    REQUIRE(CapacitySplitter::partition(list_stops, 20).size() == 7);
    REQUIRE(CapacitySplitter::partition({}, 3).empty());
}

TEST_CASE("CapacitySplitter orders stops by urgency before splitting") {
    const WallTimePoint morning = WallClock::now();
    const WallTimePoint noon = morning + std::chrono::hours{4};
    std::vector<Stop> list_stops{
        make_stop(1, 0, std::nullopt),
        make_stop(2, 0, noon),
        make_stop(3, 3, std::nullopt),
        make_stop(4, 0, morning),
        make_stop(5, 3, morning),
        make_stop(6, 0, noon),
    };
    CapacitySplitter::sort_for_split(list_stops);

    std::vector<StopId> list_ids;
    for (const Stop& stop : list_stops) {
        list_ids.push_back(stop.id);
    }
    REQUIRE(list_ids == std::vector<StopId>{5, 3, 4, 2, 6, 1});
}
