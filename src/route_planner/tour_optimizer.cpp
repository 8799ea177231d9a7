#include "route_planner/tour_optimizer.hpp"

#include <algorithm>
#include <limits>

#include "route_planner/geo_distance.hpp"

namespace route_planner {

std::vector<Stop> optimize_tour(std::vector<Stop> stops) {
    if (stops.size() <= 1) {
        return stops;
    }

    std::sort(stops.begin(), stops.end(), [](const Stop& lhs, const Stop& rhs) {
        if (lhs.sequence != rhs.sequence) {
            return lhs.sequence < rhs.sequence;
        }
        return lhs.id < rhs.id;
    });

    std::vector<Stop> list_tour;
    list_tour.reserve(stops.size());
    std::vector<bool> visited(stops.size(), false);

    std::size_t current_index = 0;
    visited[current_index] = true;
    list_tour.push_back(stops[current_index]);

    while (list_tour.size() < stops.size()) {
        const Coordinate& origin = stops[current_index].location;
        std::size_t nearest_index = stops.size();
        double nearest_distance = std::numeric_limits<double>::infinity();
        for (std::size_t candidate = 0; candidate < stops.size(); ++candidate) {
            if (visited[candidate]) {
                continue;
            }
            const double candidate_distance = distance_km(origin, stops[candidate].location);
            const bool closer = candidate_distance < nearest_distance;
            const bool tie_with_lower_id = candidate_distance == nearest_distance
                && nearest_index < stops.size()
                && stops[candidate].id < stops[nearest_index].id;
            if (closer || tie_with_lower_id) {
                nearest_index = candidate;
                nearest_distance = candidate_distance;
            }
        }
        visited[nearest_index] = true;
        list_tour.push_back(stops[nearest_index]);
        current_index = nearest_index;
    }

    int sequence = 1;
    for (Stop& visited_stop : list_tour) {
        visited_stop.sequence = sequence++;
    }
    return list_tour;
}

double route_distance_km(const std::vector<Stop>& stops) noexcept {
    double total_km = 0.0;
    for (std::size_t index = 1; index < stops.size(); ++index) {
        total_km += distance_km(stops[index - 1].location, stops[index].location);
    }
    return total_km;
}

}  // namespace route_planner
