#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "route_planner/route_combiner.hpp"

using namespace route_planner;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    route_planner::test::ensure_logger_initialized();
    return true;
}();

struct CombineFixture {
    FleetPlan plan{};
    AreaId north{};
    AreaId south{};
    AreaId distant{};
    VehicleId truck{};
    CustomerId north_customer{};
    CustomerId south_customer{};
    CustomerId distant_customer{};

    CombineFixture() {
        north = plan.add_area("North", "NORTH");
        south = plan.add_area("South", "SOUTH");
        distant = plan.add_area("Boston", "BOSTON");
        truck = plan.add_vehicle("Truck", VehicleCapacity{1'000.0, 50.0});
        north_customer = plan.add_customer("North Customer", {40.7128, -74.0060}, north);
        south_customer = plan.add_customer("South Customer", {40.6528, -74.0360}, south);
        distant_customer = plan.add_customer("Boston Customer", {42.3601, -71.0589}, distant);
    }

    RouteId make_route(BatchId batch, AreaId area, CustomerId customer, double weight_kg) {
        const RouteId route = plan.create_route(batch, area, truck);
        StopRequest request{};
        request.customer = customer;
        request.demand = CargoLoad{weight_kg, 1.0};
        plan.add_stop(route, request);
        return route;
    }
};

}  // namespace

TEST_CASE_METHOD(CombineFixture, "RouteCombiner absorbs an adjacent route that fits") {
    const RouteId target = make_route(1, north, north_customer, 150.0);
    const RouteId candidate = make_route(2, south, south_customer, 100.0);

    RouteCombiner combiner{plan, AreaAdjacency{}};
    const CombineOutcome outcome = combiner.combine_adjacent(target, plan.route_ids(), plan.capacity_for(target));

    REQUIRE(outcome.merged_route_ids == std::vector<RouteId>{candidate});
    REQUIRE(outcome.stops_moved == 1);
    REQUIRE(plan.route_load(target).weight_kg == Approx(250.0));
    REQUIRE(plan.route(target).stops.size() == 2);
    REQUIRE(plan.sequence_is_contiguous(target));
    REQUIRE(plan.route(candidate).state == RouteState::Cancelled);
    REQUIRE(plan.route(candidate).stops.empty());
    REQUIRE_FALSE(plan.route(target).area.has_value());
}

TEST_CASE_METHOD(CombineFixture, "RouteCombiner keeps the area when merging the same area") {
    const RouteId target = make_route(1, north, north_customer, 150.0);
    make_route(2, north, north_customer, 100.0);

    RouteCombiner combiner{plan, AreaAdjacency{}};
    combiner.combine_adjacent(target, plan.route_ids(), plan.capacity_for(target));
    REQUIRE(plan.route(target).area == north);
}

TEST_CASE_METHOD(CombineFixture, "RouteCombiner refuses merges beyond capacity") {
    const RouteId target = make_route(1, north, north_customer, 700.0);
    const RouteId first = make_route(2, south, south_customer, 200.0);
    const RouteId second = make_route(3, south, south_customer, 200.0);

    RouteCombiner combiner{plan, AreaAdjacency{}};
    const CombineOutcome outcome = combiner.combine_adjacent(target, {second, first}, plan.capacity_for(target));

    REQUIRE(outcome.merged_route_ids == std::vector<RouteId>{first});
    REQUIRE(plan.route_load(target).weight_kg == Approx(900.0));
    REQUIRE(plan.route(second).state == RouteState::Draft);
    REQUIRE(plan.route(second).stops.size() == 1);
}

TEST_CASE_METHOD(CombineFixture, "RouteCombiner skips routes in distant areas") {
    const RouteId target = make_route(1, north, north_customer, 100.0);
    const RouteId remote = make_route(2, distant, distant_customer, 100.0);

    RouteCombiner combiner{plan, AreaAdjacency{}};
    const CombineOutcome outcome = combiner.combine_adjacent(target, plan.route_ids(), plan.capacity_for(target));

    REQUIRE(outcome.merged_route_ids.empty());
    REQUIRE(plan.route(remote).state == RouteState::Draft);
}

TEST_CASE_METHOD(CombineFixture, "RouteCombiner keeps checking adjacency after a cross-area merge") {
    const RouteId target = make_route(1, north, north_customer, 100.0);
    const RouteId nearby = make_route(2, south, south_customer, 100.0);
    const RouteId remote = make_route(3, distant, distant_customer, 100.0);

    RouteCombiner combiner{plan, AreaAdjacency{}};
    const CombineOutcome outcome = combiner.combine_adjacent(target, plan.route_ids(), plan.capacity_for(target));

    REQUIRE(outcome.merged_route_ids == std::vector<RouteId>{nearby});
    REQUIRE_FALSE(plan.route(target).area.has_value());
    REQUIRE(plan.route(remote).state == RouteState::Draft);
    REQUIRE(plan.route(remote).stops.size() == 1);

    const CombineOutcome repeated = combiner.combine_adjacent(target, plan.route_ids(), plan.capacity_for(target));
    REQUIRE(repeated.merged_route_ids.empty());
}

TEST_CASE_METHOD(CombineFixture, "RouteCombiner judges an area-less route by its stops") {
    const RouteId target = plan.create_route(1, std::nullopt, truck);
    StopRequest request{};
    request.customer = north_customer;
    request.demand = CargoLoad{100.0, 1.0};
    plan.add_stop(target, request);
    const RouteId remote = make_route(2, distant, distant_customer, 100.0);

    RouteCombiner combiner{plan, AreaAdjacency{}};
    const CombineOutcome outcome = combiner.combine_adjacent(target, plan.route_ids(), plan.capacity_for(target));

    REQUIRE(outcome.merged_route_ids.empty());
    REQUIRE(plan.route(remote).state == RouteState::Draft);
}

TEST_CASE_METHOD(CombineFixture, "RouteCombiner ignores locked and empty candidates") {
    const RouteId target = make_route(1, north, north_customer, 100.0);
    const RouteId locked = make_route(2, north, north_customer, 100.0);
    plan.transition(locked, RouteState::Confirmed);
    plan.transition(locked, RouteState::InTransit);
    const RouteId empty = plan.create_route(3, north, truck);

    RouteCombiner combiner{plan, AreaAdjacency{}};
    const CombineOutcome outcome = combiner.combine_adjacent(target, plan.route_ids(), plan.capacity_for(target));

    REQUIRE(outcome.merged_route_ids.empty());
    REQUIRE(plan.route(locked).state == RouteState::InTransit);
    REQUIRE(plan.route(empty).state == RouteState::Draft);
}

TEST_CASE_METHOD(CombineFixture, "RouteCombiner does nothing without a capacity") {
    const RouteId target = make_route(1, north, north_customer, 100.0);
    make_route(2, north, north_customer, 100.0);

    RouteCombiner combiner{plan, AreaAdjacency{}};
    const CombineOutcome outcome = combiner.combine_adjacent(target, plan.route_ids(), std::nullopt);

    REQUIRE(outcome.capacity_missing);
    REQUIRE(plan.route(target).stops.size() == 1);
}
