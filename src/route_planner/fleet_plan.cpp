#include "route_planner/fleet_plan.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace route_planner {

namespace {
constexpr int k_min_priority{0};
constexpr int k_max_priority{4};

void validate_demand(const CargoLoad& demand) {
    if (demand.weight_kg < 0.0 || demand.volume_m3 < 0.0) {
        throw std::invalid_argument(
            fmt::format("Stop demand must be non-negative (weight {} kg, volume {} m3)", demand.weight_kg, demand.volume_m3)
        );
    }
}
}  // namespace

AreaId FleetPlan::add_area(std::string name, std::string code, std::string description) {
    if (code.empty()) {
        code = generate_area_code(name);
    }
    for (const auto& [existing_id, existing] : map_areas_) {
        if (existing.code == code) {
            throw std::invalid_argument(fmt::format("Area code {} must be unique", code));
        }
        if (existing.name == name) {
            throw std::invalid_argument(fmt::format("Area name {} must be unique", name));
        }
    }

    const AreaId area_id = next_area_id_++;
    Area area{};
    area.id = area_id;
    area.code = std::move(code);
    area.name = std::move(name);
    area.description = std::move(description);
    map_areas_.emplace(area_id, std::move(area));
    return area_id;
}

CustomerId FleetPlan::add_customer(std::string name, Coordinate location, std::optional<AreaId> area) {
    if (area.has_value() && map_areas_.count(*area) == 0) {
        throw std::out_of_range(fmt::format("Unknown area {}", *area));
    }
    const CustomerId customer_id = next_customer_id_++;
    map_customers_.emplace(customer_id, Customer{customer_id, std::move(name), location, area});
    if (area.has_value()) {
        map_areas_.at(*area).member_customers.push_back(customer_id);
        refresh_representative(*area);
    }
    return customer_id;
}

void FleetPlan::assign_customer_area(CustomerId customer_id, std::optional<AreaId> area_id) {
    if (area_id.has_value() && map_areas_.count(*area_id) == 0) {
        throw std::out_of_range(fmt::format("Unknown area {}", *area_id));
    }
    Customer& customer_record = map_customers_.at(customer_id);
    const std::optional<AreaId> previous_area = customer_record.area;
    if (previous_area == area_id) {
        return;
    }
    if (previous_area.has_value()) {
        auto& members = map_areas_.at(*previous_area).member_customers;
        members.erase(std::remove(members.begin(), members.end(), customer_id), members.end());
        refresh_representative(*previous_area);
    }
    customer_record.area = area_id;
    if (area_id.has_value()) {
        map_areas_.at(*area_id).member_customers.push_back(customer_id);
        refresh_representative(*area_id);
    }
}

VehicleId FleetPlan::add_vehicle(std::string name, VehicleCapacity capacity) {
    if (capacity.max_weight_kg < 0.0 || capacity.max_volume_m3 < 0.0) {
        throw std::invalid_argument(fmt::format("Vehicle {} capacity must be non-negative", name));
    }
    const VehicleId vehicle_id = next_vehicle_id_++;
    map_vehicles_.emplace(vehicle_id, Vehicle{vehicle_id, std::move(name), capacity});
    return vehicle_id;
}

RouteId FleetPlan::create_route(BatchId batch, std::optional<AreaId> area, std::optional<VehicleId> vehicle) {
    if (area.has_value() && map_areas_.count(*area) == 0) {
        throw std::out_of_range(fmt::format("Unknown area {}", *area));
    }
    if (vehicle.has_value() && map_vehicles_.count(*vehicle) == 0) {
        throw std::out_of_range(fmt::format("Unknown vehicle {}", *vehicle));
    }
    const RouteId route_id = next_route_id_++;
    Route route_record{};
    route_record.id = route_id;
    route_record.batch = batch;
    route_record.area = area;
    route_record.vehicle = vehicle;
    route_record.state = RouteState::Draft;
    map_routes_.emplace(route_id, std::move(route_record));
    return route_id;
}

StopId FleetPlan::add_stop(RouteId route_id, const StopRequest& request) {
    validate_demand(request.demand);
    if (request.priority < k_min_priority || request.priority > k_max_priority) {
        throw std::invalid_argument(fmt::format("Stop priority {} outside {}..{}", request.priority, k_min_priority, k_max_priority));
    }
    Route& owner = mutable_route(route_id);
    const Customer& destination = customer(request.customer);
    const std::optional<AreaId> stop_area = request.area.has_value() ? request.area : destination.area;
    if (stop_area.has_value() && map_areas_.count(*stop_area) == 0) {
        throw std::out_of_range(fmt::format("Unknown area {}", *stop_area));
    }

    const StopId stop_id = next_stop_id_++;
    Stop stop_record{};
    stop_record.id = stop_id;
    stop_record.route = route_id;
    stop_record.customer = destination.id;
    stop_record.location = destination.location;
    stop_record.sequence = static_cast<int>(owner.stops.size()) + 1;
    stop_record.demand = request.demand;
    stop_record.area = stop_area;
    stop_record.time_window_start = request.time_window_start;
    stop_record.time_window_end = request.time_window_end;
    stop_record.priority = request.priority;
    stop_record.orders = request.orders;
    map_stops_.emplace(stop_id, std::move(stop_record));
    owner.stops.push_back(stop_id);
    return stop_id;
}

const Area& FleetPlan::area(AreaId area_id) const {
    const auto iterator_area = map_areas_.find(area_id);
    if (iterator_area == map_areas_.end()) {
        throw std::out_of_range(fmt::format("Unknown area {}", area_id));
    }
    return iterator_area->second;
}

const Area* FleetPlan::find_area(std::optional<AreaId> area_id) const {
    if (!area_id.has_value()) {
        return nullptr;
    }
    const auto iterator_area = map_areas_.find(*area_id);
    return iterator_area == map_areas_.end() ? nullptr : &iterator_area->second;
}

std::optional<AreaId> FleetPlan::find_area_by_code(const std::string& code) const {
    for (const auto& [area_id, area_record] : map_areas_) {
        if (area_record.code == code) {
            return area_id;
        }
    }
    return std::nullopt;
}

const Customer& FleetPlan::customer(CustomerId customer_id) const {
    const auto iterator_customer = map_customers_.find(customer_id);
    if (iterator_customer == map_customers_.end()) {
        throw std::out_of_range(fmt::format("Unknown customer {}", customer_id));
    }
    return iterator_customer->second;
}

const Vehicle& FleetPlan::vehicle(VehicleId vehicle_id) const {
    const auto iterator_vehicle = map_vehicles_.find(vehicle_id);
    if (iterator_vehicle == map_vehicles_.end()) {
        throw std::out_of_range(fmt::format("Unknown vehicle {}", vehicle_id));
    }
    return iterator_vehicle->second;
}

const Route& FleetPlan::route(RouteId route_id) const {
    const auto iterator_route = map_routes_.find(route_id);
    if (iterator_route == map_routes_.end()) {
        throw std::out_of_range(fmt::format("Unknown route {}", route_id));
    }
    return iterator_route->second;
}

const Stop& FleetPlan::stop(StopId stop_id) const {
    const auto iterator_stop = map_stops_.find(stop_id);
    if (iterator_stop == map_stops_.end()) {
        throw std::out_of_range(fmt::format("Unknown stop {}", stop_id));
    }
    return iterator_stop->second;
}

bool FleetPlan::has_customer(CustomerId customer_id) const {
    return map_customers_.count(customer_id) != 0;
}

bool FleetPlan::has_route(RouteId route_id) const {
    return map_routes_.count(route_id) != 0;
}

bool FleetPlan::has_stop(StopId stop_id) const {
    return map_stops_.count(stop_id) != 0;
}

std::vector<Stop> FleetPlan::stops_of(RouteId route_id) const {
    const Route& owner = route(route_id);
    std::vector<Stop> list_stops;
    list_stops.reserve(owner.stops.size());
    for (const StopId stop_id : owner.stops) {
        list_stops.push_back(stop(stop_id));
    }
    return list_stops;
}

CargoLoad FleetPlan::route_load(RouteId route_id) const {
    CargoLoad total{};
    for (const StopId stop_id : route(route_id).stops) {
        total += stop(stop_id).demand;
    }
    return total;
}

std::optional<VehicleCapacity> FleetPlan::capacity_for(RouteId route_id) const {
    const Route& owner = route(route_id);
    if (!owner.vehicle.has_value()) {
        return std::nullopt;
    }
    return vehicle(*owner.vehicle).capacity;
}

std::vector<RouteId> FleetPlan::route_ids() const {
    std::vector<RouteId> list_ids;
    list_ids.reserve(map_routes_.size());
    for (const auto& [route_id, route_record] : map_routes_) {
        list_ids.push_back(route_id);
    }
    return list_ids;
}

std::optional<RouteId> FleetPlan::route_for_batch(BatchId batch) const {
    for (const auto& [route_id, route_record] : map_routes_) {
        if (route_record.batch == batch) {
            return route_id;
        }
    }
    return std::nullopt;
}

void FleetPlan::apply_sequence(RouteId route_id, const std::vector<StopId>& ordered) {
    Route& owner = mutable_route(route_id);
    const std::set<StopId> current(owner.stops.begin(), owner.stops.end());
    const std::set<StopId> proposed(ordered.begin(), ordered.end());
    if (ordered.size() != owner.stops.size() || current != proposed) {
        throw std::invalid_argument(fmt::format("Sequence for route {} is not a permutation of its stops", route_id));
    }
    owner.stops = ordered;
    resequence(owner);
}

void FleetPlan::move_stops(const std::vector<StopId>& stop_ids, RouteId destination) {
    Route& target = mutable_route(destination);
    if (!is_plannable(target.state)) {
        throw std::logic_error(fmt::format("Route {} is {} and cannot receive stops", destination, to_string(target.state)));
    }

    // Validate the whole transfer before touching any collection.
    std::set<RouteId> source_ids;
    for (const StopId stop_id : stop_ids) {
        const Stop& moving = stop(stop_id);
        if (moving.route == destination) {
            throw std::invalid_argument(fmt::format("Stop {} already belongs to route {}", stop_id, destination));
        }
        if (!is_plannable(route(moving.route).state)) {
            throw std::logic_error(fmt::format("Stop {} belongs to route {} which is no longer plannable", stop_id, moving.route));
        }
        source_ids.insert(moving.route);
    }
    if (std::set<StopId>(stop_ids.begin(), stop_ids.end()).size() != stop_ids.size()) {
        throw std::invalid_argument("Stop transfer lists a stop more than once");
    }

    for (const StopId stop_id : stop_ids) {
        Stop& moving = mutable_stop(stop_id);
        auto& source_stops = mutable_route(moving.route).stops;
        source_stops.erase(std::remove(source_stops.begin(), source_stops.end(), stop_id), source_stops.end());
        moving.route = destination;
        target.stops.push_back(stop_id);
    }
    for (const RouteId source_id : source_ids) {
        resequence(mutable_route(source_id));
    }
    resequence(target);
}

void FleetPlan::reposition_stop(StopId stop_id, int new_sequence) {
    const Stop& moving = stop(stop_id);
    Route& owner = mutable_route(moving.route);
    const int stop_count = static_cast<int>(owner.stops.size());
    const int target_index = std::clamp(new_sequence, 1, stop_count) - 1;

    owner.stops.erase(std::remove(owner.stops.begin(), owner.stops.end(), stop_id), owner.stops.end());
    owner.stops.insert(owner.stops.begin() + target_index, stop_id);
    resequence(owner);
}

void FleetPlan::set_stop_window(StopId stop_id,
                                std::optional<WallTimePoint> window_start,
                                std::optional<WallTimePoint> window_end) {
    if (window_start.has_value() && window_end.has_value() && *window_end < *window_start) {
        throw std::invalid_argument(fmt::format("Stop {} time window ends before it starts", stop_id));
    }
    Stop& target = mutable_stop(stop_id);
    target.time_window_start = window_start;
    target.time_window_end = window_end;
}

void FleetPlan::set_stop_state(StopId stop_id, StopState state, std::optional<AdjustmentReason> reason) {
    Stop& target = mutable_stop(stop_id);
    target.state = state;
    if (reason.has_value()) {
        target.adjustment_reason = reason;
    }
}

void FleetPlan::set_route_area(RouteId route_id, std::optional<AreaId> area_id) {
    if (area_id.has_value() && map_areas_.count(*area_id) == 0) {
        throw std::out_of_range(fmt::format("Unknown area {}", *area_id));
    }
    mutable_route(route_id).area = area_id;
}

void FleetPlan::set_route_vehicle(RouteId route_id, std::optional<VehicleId> vehicle_id) {
    if (vehicle_id.has_value() && map_vehicles_.count(*vehicle_id) == 0) {
        throw std::out_of_range(fmt::format("Unknown vehicle {}", *vehicle_id));
    }
    mutable_route(route_id).vehicle = vehicle_id;
}

void FleetPlan::transition(RouteId route_id, RouteState target) {
    Route& subject = mutable_route(route_id);
    if (!can_transition(subject.state, target)) {
        throw std::logic_error(fmt::format("Route {} cannot move from {} to {}", route_id, to_string(subject.state), to_string(target)));
    }
    if (target == RouteState::Confirmed) {
        const std::optional<VehicleCapacity> capacity = capacity_for(route_id);
        if (!capacity.has_value()) {
            throw std::logic_error(fmt::format("Route {} has no vehicle assigned", route_id));
        }
        if (!capacity->fits(route_load(route_id))) {
            throw std::logic_error(fmt::format("Route {} exceeds vehicle capacity", route_id));
        }
    }
    subject.state = target;
}

bool FleetPlan::sequence_is_contiguous(RouteId route_id) const {
    const Route& owner = route(route_id);
    for (std::size_t index = 0; index < owner.stops.size(); ++index) {
        const Stop& member = stop(owner.stops[index]);
        if (member.route != route_id || member.sequence != static_cast<int>(index) + 1) {
            return false;
        }
    }
    return true;
}

Route& FleetPlan::mutable_route(RouteId route_id) {
    const auto iterator_route = map_routes_.find(route_id);
    if (iterator_route == map_routes_.end()) {
        throw std::out_of_range(fmt::format("Unknown route {}", route_id));
    }
    return iterator_route->second;
}

Stop& FleetPlan::mutable_stop(StopId stop_id) {
    const auto iterator_stop = map_stops_.find(stop_id);
    if (iterator_stop == map_stops_.end()) {
        throw std::out_of_range(fmt::format("Unknown stop {}", stop_id));
    }
    return iterator_stop->second;
}

void FleetPlan::resequence(Route& route_record) {
    int sequence = 1;
    for (const StopId stop_id : route_record.stops) {
        mutable_stop(stop_id).sequence = sequence++;
    }
}

void FleetPlan::refresh_representative(AreaId area_id) {
    Area& target = map_areas_.at(area_id);
    if (target.member_customers.empty()) {
        target.representative.reset();
        return;
    }
    double latitude_sum = 0.0;
    double longitude_sum = 0.0;
    for (const CustomerId customer_id : target.member_customers) {
        const Coordinate& location = map_customers_.at(customer_id).location;
        latitude_sum += location.latitude_deg;
        longitude_sum += location.longitude_deg;
    }
    const auto member_count = static_cast<double>(target.member_customers.size());
    target.representative = Coordinate{latitude_sum / member_count, longitude_sum / member_count};
}

}  // namespace route_planner
