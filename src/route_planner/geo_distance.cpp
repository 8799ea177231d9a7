#include "route_planner/geo_distance.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace route_planner {

namespace {
constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}
}  // namespace

double distance_km(const Coordinate& from, const Coordinate& to) noexcept {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    // Rounding can push a slightly past 1 for antipodal points.
    const double clamped_a = std::clamp(a, 0.0, 1.0);
    const double c = 2.0 * std::atan2(std::sqrt(clamped_a), std::sqrt(1.0 - clamped_a));
    return k_earth_radius_km * c;
}

}  // namespace route_planner
