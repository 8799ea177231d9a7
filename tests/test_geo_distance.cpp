#include <catch2/catch.hpp>

#include "route_planner/geo_distance.hpp"

using namespace route_planner;

TEST_CASE("distance_km is zero for identical points") {
    const Coordinate point{40.7128, -74.0060};
    REQUIRE(distance_km(point, point) == Approx(0.0).margin(1e-12));
}

TEST_CASE("distance_km is symmetric") {
    const Coordinate manhattan{40.7128, -74.0060};
    const Coordinate brooklyn{40.6782, -73.9442};
    REQUIRE(distance_km(manhattan, brooklyn) == Approx(distance_km(brooklyn, manhattan)));
}

TEST_CASE("distance_km measures short city hops") {
    const Coordinate origin{40.7128, -74.0060};
    const Coordinate nearby{40.7228, -74.0160};
    const double hop_km = distance_km(origin, nearby);
    REQUIRE(hop_km > 0.0);
    REQUIRE(hop_km < 5.0);
}

TEST_CASE("distance_km matches a known long-haul distance") {
    const Coordinate new_york{40.7128, -74.0060};
    const Coordinate london{51.5074, -0.1278};
    REQUIRE(distance_km(new_york, london) == Approx(5'570.0).epsilon(0.01));
}

TEST_CASE("distance_km handles antipodal points") {
    const Coordinate north_pole{90.0, 0.0};
    const Coordinate south_pole{-90.0, 0.0};
    REQUIRE(distance_km(north_pole, south_pole) == Approx(k_earth_radius_km * 3.141592653589793).epsilon(1e-6));
}

TEST_CASE("distance_km respects the triangle inequality") {
    const Coordinate first{40.7128, -74.0060};
    const Coordinate second{40.7300, -74.0100};
    const Coordinate third{40.6528, -74.0360};
    REQUIRE(distance_km(first, third) <= distance_km(first, second) + distance_km(second, third) + 1e-9);
}
