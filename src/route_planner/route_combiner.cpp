#include "route_planner/route_combiner.hpp"

#include <algorithm>

namespace route_planner {

RouteCombiner::RouteCombiner(FleetPlan& plan, AreaAdjacency adjacency)
    : plan_(plan),
      adjacency_(adjacency),
      logger_(get_logger()) {}

CombineOutcome RouteCombiner::combine_adjacent(RouteId route_id,
                                               std::vector<RouteId> candidates,
                                               const std::optional<VehicleCapacity>& capacity) {
    CombineOutcome outcome{};
    if (!capacity.has_value()) {
        outcome.capacity_missing = true;
        logger_->warn(R"({{"component":"combiner","route":{},"action":"skip","reason":"no_vehicle"}})", route_id);
        return outcome;
    }
    if (!is_plannable(plan_.route(route_id).state)) {
        outcome.route_locked = true;
        return outcome;
    }

    std::sort(candidates.begin(), candidates.end());
    candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());

    CargoLoad target_load = plan_.route_load(route_id);
    std::set<AreaId> target_areas = served_areas(route_id);
    for (const RouteId candidate_id : candidates) {
        if (candidate_id == route_id) {
            continue;
        }
        const Route& candidate = plan_.route(candidate_id);
        if (!is_plannable(candidate.state) || candidate.stops.empty()) {
            continue;
        }

        const Route& target = plan_.route(route_id);
        const std::set<AreaId> candidate_areas = served_areas(candidate_id);
        if (!all_adjacent(target_areas, candidate_areas)) {
            logger_->debug(R"({{"component":"combiner","route":{},"candidate":{},"action":"skip","reason":"not_adjacent"}})",
                           route_id, candidate_id);
            continue;
        }

        const CargoLoad combined_load = target_load + plan_.route_load(candidate_id);
        if (!capacity->fits(combined_load)) {
            logger_->debug(
                R"({{"component":"combiner","route":{},"candidate":{},"action":"skip","reason":"capacity","weight_kg":{},"volume_m3":{}}})",
                route_id, candidate_id, combined_load.weight_kg, combined_load.volume_m3);
            continue;
        }

        const std::vector<StopId> moving_stops = candidate.stops;
        const bool spans_other_area = target.area != candidate.area;
        plan_.move_stops(moving_stops, route_id);
        plan_.transition(candidate_id, RouteState::Cancelled);
        if (spans_other_area && target.area.has_value()) {
            plan_.set_route_area(route_id, std::nullopt);
        }

        target_load = combined_load;
        target_areas.insert(candidate_areas.begin(), candidate_areas.end());
        outcome.merged_route_ids.push_back(candidate_id);
        outcome.stops_moved += moving_stops.size();
        logger_->info(
            R"({{"component":"combiner","route":{},"absorbed":{},"stops":{},"weight_kg":{},"volume_m3":{}}})",
            route_id,
            candidate_id,
            moving_stops.size(),
            target_load.weight_kg,
            target_load.volume_m3
        );
    }
    return outcome;
}

std::set<AreaId> RouteCombiner::served_areas(RouteId route_id) const {
    const Route& subject = plan_.route(route_id);
    std::set<AreaId> set_areas;
    for (const StopId stop_id : subject.stops) {
        const std::optional<AreaId>& stop_area = plan_.stop(stop_id).area;
        if (stop_area.has_value()) {
            set_areas.insert(*stop_area);
        }
    }
    if (set_areas.empty() && subject.area.has_value()) {
        set_areas.insert(*subject.area);
    }
    return set_areas;
}

bool RouteCombiner::all_adjacent(const std::set<AreaId>& lhs, const std::set<AreaId>& rhs) const {
    for (const AreaId lhs_area : lhs) {
        for (const AreaId rhs_area : rhs) {
            if (!adjacency_.adjacent(plan_.find_area(lhs_area), plan_.find_area(rhs_area))) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace route_planner
