#include "route_planner/capacity_splitter.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <string>

namespace route_planner {

namespace {

using AreaKey = std::optional<AreaId>;

std::string describe_area(const AreaKey& area_key) {
    return area_key.has_value() ? std::to_string(*area_key) : std::string{"none"};
}

std::size_t chunks_for_dimension(double demand, double maximum) {
    if (maximum <= 0.0) {
        return 1;
    }
    return static_cast<std::size_t>(std::ceil(demand / maximum));
}

CargoLoad total_demand(const std::vector<Stop>& stops) {
    CargoLoad total{};
    for (const Stop& member : stops) {
        total += member.demand;
    }
    return total;
}

struct AreaGroup final {
    std::vector<StopId> stop_ids{};
    CargoLoad load{};
};

bool chunks_fit(const std::vector<std::vector<Stop>>& chunks, const VehicleCapacity& capacity) {
    return std::all_of(chunks.begin(), chunks.end(), [&capacity](const std::vector<Stop>& chunk) {
        return chunk.size() <= 1 || capacity.fits(total_demand(chunk));
    });
}

}  // namespace

CapacitySplitter::CapacitySplitter(FleetPlan& plan)
    : plan_(plan),
      logger_(get_logger()) {}

SplitOutcome CapacitySplitter::split_oversized_areas(RouteId route_id, const std::optional<VehicleCapacity>& capacity) {
    SplitOutcome outcome{};
    outcome.route_ids.push_back(route_id);

    if (!capacity.has_value()) {
        outcome.capacity_missing = true;
        logger_->warn(R"({{"component":"splitter","route":{},"action":"skip","reason":"no_vehicle"}})", route_id);
        return outcome;
    }
    if (!is_plannable(plan_.route(route_id).state)) {
        outcome.route_locked = true;
        return outcome;
    }

    std::map<AreaKey, std::vector<Stop>> map_area_stops;
    for (Stop& member : plan_.stops_of(route_id)) {
        const AreaKey area_key = member.area;
        map_area_stops[area_key].push_back(std::move(member));
    }

    for (auto& [area_key, list_stops] : map_area_stops) {
        const CargoLoad area_load = total_demand(list_stops);
        if (capacity->fits(area_load)) {
            continue;
        }
        outcome.split_areas.push_back(area_key);

        for (const Stop& member : list_stops) {
            if (!capacity->fits(member.demand)) {
                outcome.oversized_stops.push_back(member.id);
            }
        }

        sort_for_split(list_stops);
        std::size_t parts = std::min(routes_needed(area_load, *capacity), list_stops.size());
        std::vector<std::vector<Stop>> list_chunks = partition(list_stops, parts);
        while (!chunks_fit(list_chunks, *capacity) && parts < list_stops.size()) {
            ++parts;
            list_chunks = partition(list_stops, parts);
        }

        logger_->info(
            R"({{"component":"splitter","route":{},"area":"{}","weight_kg":{},"volume_m3":{},"parts":{}}})",
            route_id,
            describe_area(area_key),
            area_load.weight_kg,
            area_load.volume_m3,
            list_chunks.size()
        );

        for (std::size_t chunk_index = 1; chunk_index < list_chunks.size(); ++chunk_index) {
            std::vector<StopId> chunk_ids;
            chunk_ids.reserve(list_chunks[chunk_index].size());
            for (const Stop& member : list_chunks[chunk_index]) {
                chunk_ids.push_back(member.id);
            }
            const RouteId sub_route_id = create_sub_route(route_id, plan_.route(route_id).area, chunk_ids);
            outcome.route_ids.push_back(sub_route_id);
            outcome.new_route_ids.push_back(sub_route_id);
            outcome.stops_moved += chunk_ids.size();
        }
    }

    if (!capacity->fits(plan_.route_load(route_id))) {
        regroup_remaining_areas(route_id, *capacity, outcome);
    }

    if (!outcome.oversized_stops.empty()) {
        logger_->warn(
            R"({{"component":"splitter","route":{},"oversized_stops":{}}})",
            route_id,
            outcome.oversized_stops.size()
        );
    }
    return outcome;
}

std::size_t CapacitySplitter::routes_needed(const CargoLoad& load, const VehicleCapacity& capacity) noexcept {
    const std::size_t by_weight = chunks_for_dimension(load.weight_kg, capacity.max_weight_kg);
    const std::size_t by_volume = chunks_for_dimension(load.volume_m3, capacity.max_volume_m3);
    return std::max({by_weight, by_volume, std::size_t{1}});
}

std::vector<std::vector<Stop>> CapacitySplitter::partition(const std::vector<Stop>& stops, std::size_t parts) {
    std::vector<std::vector<Stop>> list_chunks;
    if (parts == 0 || stops.empty()) {
        return list_chunks;
    }
    parts = std::min(parts, stops.size());
    const std::size_t base_size = stops.size() / parts;
    const std::size_t remainder = stops.size() % parts;

    list_chunks.reserve(parts);
    auto iterator_begin = stops.begin();
    for (std::size_t chunk_index = 0; chunk_index < parts; ++chunk_index) {
        const std::size_t chunk_size = base_size + (chunk_index < remainder ? 1 : 0);
        const auto iterator_end = iterator_begin + static_cast<std::ptrdiff_t>(chunk_size);
        list_chunks.emplace_back(iterator_begin, iterator_end);
        iterator_begin = iterator_end;
    }
    return list_chunks;
}

void CapacitySplitter::sort_for_split(std::vector<Stop>& stops) {
    std::stable_sort(stops.begin(), stops.end(), [](const Stop& lhs, const Stop& rhs) {
        if (lhs.priority != rhs.priority) {
            return lhs.priority > rhs.priority;
        }
        if (lhs.time_window_start != rhs.time_window_start) {
            if (!lhs.time_window_start.has_value()) {
                return false;
            }
            if (!rhs.time_window_start.has_value()) {
                return true;
            }
            return *lhs.time_window_start < *rhs.time_window_start;
        }
        return lhs.id < rhs.id;
    });
}

void CapacitySplitter::regroup_remaining_areas(RouteId route_id, const VehicleCapacity& capacity, SplitOutcome& outcome) {
    std::map<AreaKey, AreaGroup> map_groups;
    for (const Stop& member : plan_.stops_of(route_id)) {
        AreaGroup& group = map_groups[member.area];
        group.stop_ids.push_back(member.id);
        group.load += member.demand;
    }

    // Next-fit packing: each group stays on the source while it fits, else
    // joins the newest sub-route or opens another one.
    CargoLoad kept_load{};
    bool kept_any = false;
    std::optional<RouteId> open_route_id;
    CargoLoad open_load{};
    for (const auto& [area_key, group] : map_groups) {
        if (!kept_any || capacity.fits(kept_load + group.load)) {
            kept_load += group.load;
            kept_any = true;
            continue;
        }

        if (open_route_id.has_value() && capacity.fits(open_load + group.load)) {
            plan_.move_stops(group.stop_ids, *open_route_id);
            if (plan_.route(*open_route_id).area != area_key) {
                plan_.set_route_area(*open_route_id, std::nullopt);
            }
            open_load += group.load;
        } else {
            open_route_id = create_sub_route(route_id, area_key, group.stop_ids);
            open_load = group.load;
            outcome.route_ids.push_back(*open_route_id);
            outcome.new_route_ids.push_back(*open_route_id);
        }
        outcome.stops_moved += group.stop_ids.size();
        ++outcome.regrouped_areas;

        logger_->info(
            R"({{"component":"splitter","route":{},"action":"regroup","area":"{}","target":{},"weight_kg":{},"volume_m3":{}}})",
            route_id,
            describe_area(area_key),
            *open_route_id,
            group.load.weight_kg,
            group.load.volume_m3
        );
    }
}

RouteId CapacitySplitter::create_sub_route(RouteId source_id, std::optional<AreaId> area, const std::vector<StopId>& stop_ids) {
    const Route& source = plan_.route(source_id);
    const RouteId sub_route_id = plan_.create_route(source.batch, area, source.vehicle);
    plan_.move_stops(stop_ids, sub_route_id);
    logger_->info(
        R"({{"component":"splitter","action":"create_sub_route","source":{},"route":{},"stops":{}}})",
        source_id,
        sub_route_id,
        stop_ids.size()
    );
    return sub_route_id;
}

}  // namespace route_planner
