#include <algorithm>
#include <vector>

#include <catch2/catch.hpp>

#include "route_planner/tour_optimizer.hpp"

using namespace route_planner;

namespace {

Stop make_stop(StopId stop_id, int sequence, Coordinate location) {
    Stop stop{};
    stop.id = stop_id;
    stop.sequence = sequence;
    stop.location = location;
    return stop;
}

std::vector<StopId> ids_of(const std::vector<Stop>& stops) {
    std::vector<StopId> list_ids;
    for (const Stop& stop : stops) {
        list_ids.push_back(stop.id);
    }
    return list_ids;
}

}  // namespace

TEST_CASE("optimize_tour leaves empty and single-stop tours unchanged") {
    REQUIRE(optimize_tour({}).empty());

    const std::vector<Stop> list_single{make_stop(7, 3, {40.7128, -74.0060})};
    const std::vector<Stop> list_result = optimize_tour(list_single);
    REQUIRE(list_result.size() == 1);
    REQUIRE(list_result.front().id == 7);
    REQUIRE(list_result.front().sequence == 3);
    REQUIRE(route_distance_km(list_result) == Approx(0.0));
}

TEST_CASE("optimize_tour keeps the stop set and renumbers sequences") {
    const std::vector<Stop> list_stops{
        make_stop(1, 1, {40.7128, -74.0060}),
        make_stop(2, 2, {40.7300, -74.0100}),
        make_stop(3, 3, {40.7180, -74.0010}),
        make_stop(4, 4, {40.7228, -74.0160}),
    };
    const std::vector<Stop> list_tour = optimize_tour(list_stops);

    REQUIRE(list_tour.size() == list_stops.size());
    std::vector<StopId> tour_ids = ids_of(list_tour);
    std::sort(tour_ids.begin(), tour_ids.end());
    REQUIRE(tour_ids == std::vector<StopId>{1, 2, 3, 4});
    for (std::size_t index = 0; index < list_tour.size(); ++index) {
        REQUIRE(list_tour[index].sequence == static_cast<int>(index) + 1);
    }
    REQUIRE(list_tour.front().id == 1);
}

TEST_CASE("optimize_tour visits the nearest neighbour first") {
    // A zig-zag order: far east, back west, then slightly further west.
    const std::vector<Stop> list_stops{
        make_stop(1, 1, {40.7128, -74.0060}),
        make_stop(2, 2, {40.7328, -73.9560}),
        make_stop(3, 3, {40.7180, -74.0010}),
    };
    const std::vector<Stop> list_tour = optimize_tour(list_stops);

    REQUIRE(ids_of(list_tour) == std::vector<StopId>{1, 3, 2});
    REQUIRE(route_distance_km(list_tour) > 0.0);
    REQUIRE(route_distance_km(list_tour) <= route_distance_km(list_stops));
}

TEST_CASE("optimize_tour is never longer than the reversed visiting order") {
    const std::vector<Stop> list_stops{
        make_stop(1, 1, {40.7128, -74.0060}),
        make_stop(2, 2, {40.7228, -74.0160}),
        make_stop(3, 3, {40.6528, -74.0360}),
    };
    const std::vector<Stop> list_reversed{list_stops.rbegin(), list_stops.rend()};
    const std::vector<Stop> list_tour = optimize_tour(list_stops);

    REQUIRE(list_tour.size() == 3);
    REQUIRE(route_distance_km(list_tour) > 0.0);
    REQUIRE(route_distance_km(list_tour) <= route_distance_km(list_reversed) + 1e-9);
    REQUIRE(route_distance_km(list_tour) <= route_distance_km(list_stops) + 1e-9);
}

TEST_CASE("optimize_tour anchors on the lowest sequence rather than input order") {
    const std::vector<Stop> list_stops{
        make_stop(10, 2, {40.7300, -74.0100}),
        make_stop(11, 1, {40.7128, -74.0060}),
    };
    const std::vector<Stop> list_tour = optimize_tour(list_stops);
    REQUIRE(ids_of(list_tour) == std::vector<StopId>{11, 10});
}

TEST_CASE("optimize_tour breaks distance ties by lower stop identity") {
    const Coordinate shared_point{40.7128, -74.0060};
    const std::vector<Stop> list_stops{
        make_stop(1, 1, shared_point),
        make_stop(9, 2, shared_point),
        make_stop(4, 3, shared_point),
        make_stop(6, 4, shared_point),
    };
    const std::vector<Stop> list_tour = optimize_tour(list_stops);

    REQUIRE(ids_of(list_tour) == std::vector<StopId>{1, 4, 6, 9});
    REQUIRE(route_distance_km(list_tour) == Approx(0.0).margin(1e-12));
}

TEST_CASE("optimize_tour is deterministic") {
    const std::vector<Stop> list_stops{
        make_stop(1, 1, {40.7128, -74.0060}),
        make_stop(2, 2, {40.6528, -74.0360}),
        make_stop(3, 3, {40.7328, -73.9560}),
        make_stop(4, 4, {40.6600, -74.0300}),
        make_stop(5, 5, {40.7228, -74.0160}),
    };
    REQUIRE(ids_of(optimize_tour(list_stops)) == ids_of(optimize_tour(list_stops)));
}
