#include "route_planner/area_adjacency.hpp"

#include <stdexcept>

#include "route_planner/geo_distance.hpp"

namespace route_planner {

AreaAdjacency::AreaAdjacency(double proximity_threshold_km)
    : proximity_threshold_km_(proximity_threshold_km) {
    if (proximity_threshold_km_ < 0.0) {
        throw std::invalid_argument("AreaAdjacency proximity threshold must be non-negative");
    }
}

double AreaAdjacency::proximity_threshold_km() const noexcept {
    return proximity_threshold_km_;
}

bool AreaAdjacency::adjacent(const Area* lhs, const Area* rhs) const noexcept {
    if (lhs == nullptr || rhs == nullptr) {
        return true;
    }
    if (lhs->code == rhs->code) {
        return true;
    }
    if (!lhs->representative.has_value() || !rhs->representative.has_value()) {
        return false;
    }
    return distance_km(*lhs->representative, *rhs->representative) <= proximity_threshold_km_;
}

}  // namespace route_planner
