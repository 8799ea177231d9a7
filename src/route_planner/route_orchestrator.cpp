#include "route_planner/route_orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string_view>
#include <thread>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "route_planner/capacity_splitter.hpp"
#include "route_planner/route_combiner.hpp"
#include "route_planner/tour_optimizer.hpp"

namespace route_planner {

namespace {

constexpr char k_no_vehicle_title[] = "No Vehicle Assigned";
constexpr char k_no_vehicle_message[] = "No Vehicle Assigned: please assign a vehicle to check capacity constraints.";

OperationResult unknown_route(RouteId route_id) {
    return make_result(OperationStatus::ValidationError, "Route Not Found", fmt::format("Route {} does not exist.", route_id), route_id);
}

OperationResult no_vehicle(RouteId route_id) {
    return make_result(OperationStatus::ConfigurationError, k_no_vehicle_title, k_no_vehicle_message, route_id);
}

std::vector<StopId> stop_ids_of(const std::vector<Stop>& stops) {
    std::vector<StopId> list_ids;
    list_ids.reserve(stops.size());
    for (const Stop& member : stops) {
        list_ids.push_back(member.id);
    }
    return list_ids;
}

std::string join_ids(const std::vector<RouteId>& ids) {
    return fmt::format("{}", fmt::join(ids, ", "));
}

}  // namespace

RouteOrchestrator::RouteOrchestrator(FleetPlan& plan, PlannerConfig config)
    : plan_(plan),
      config_(config),
      adjacency_(config.proximity_threshold_km),
      route_builder_(plan),
      logger_(get_logger()) {
    if (config_.worker_count == 0) {
        config_.worker_count = 1;
    }
    logger_->info(R"({{"component":"orchestrator","action":"initialize","proximity_km":{},"workers":{}}})",
                  config_.proximity_threshold_km,
                  config_.worker_count);
}

const PlannerConfig& RouteOrchestrator::config() const noexcept {
    return config_;
}

OperationResult RouteOrchestrator::optimize_route_by_distance(RouteId route_id) {
    std::shared_lock lock_plan(mutex_plan_);
    if (!plan_.has_route(route_id)) {
        return unknown_route(route_id);
    }
    std::scoped_lock lock_route(route_mutex(route_id));
    return optimize_unlocked(route_id);
}

OperationResult RouteOrchestrator::split_route_by_area_capacity(RouteId route_id) {
    std::unique_lock lock_plan(mutex_plan_);
    if (!plan_.has_route(route_id)) {
        return unknown_route(route_id);
    }
    const std::optional<VehicleCapacity> capacity = plan_.capacity_for(route_id);
    if (!capacity.has_value()) {
        return no_vehicle(route_id);
    }

    CapacitySplitter splitter{plan_};
    const SplitOutcome outcome = splitter.split_oversized_areas(route_id, capacity);
    if (outcome.route_locked) {
        return make_result(OperationStatus::ValidationError,
                           "Route Locked",
                           fmt::format("Route {} is {} and can no longer be split.", route_id, to_string(plan_.route(route_id).state)),
                           route_id);
    }

    OperationResult result{};
    result.route_id = route_id;
    result.stops_affected = outcome.stops_moved;
    result.new_route_ids = outcome.new_route_ids;
    if (outcome.new_route_ids.empty()) {
        result.status = OperationStatus::NoOp;
        result.title = "No Split Needed";
        result.message = "No area on this route exceeds the vehicle capacity.";
    } else {
        result.status = OperationStatus::Success;
        result.title = "Route Split";
        result.message = fmt::format("Split {} area(s) exceeding capacity and moved {} area group(s) off the overloaded route; created routes {}.",
                                     outcome.split_areas.size(),
                                     outcome.regrouped_areas,
                                     join_ids(outcome.new_route_ids));
    }
    if (!outcome.oversized_stops.empty()) {
        result.message += fmt::format(" {} stop(s) exceed vehicle capacity on their own and need a larger vehicle.",
                                      outcome.oversized_stops.size());
    }
    return result;
}

OperationResult RouteOrchestrator::combine_nearby_areas_route(RouteId route_id) {
    std::unique_lock lock_plan(mutex_plan_);
    if (!plan_.has_route(route_id)) {
        return unknown_route(route_id);
    }
    const std::optional<VehicleCapacity> capacity = plan_.capacity_for(route_id);
    if (!capacity.has_value()) {
        return no_vehicle(route_id);
    }

    RouteCombiner combiner{plan_, adjacency_};
    const CombineOutcome outcome = combiner.combine_adjacent(route_id, plan_.route_ids(), capacity);
    if (outcome.route_locked) {
        return make_result(OperationStatus::ValidationError,
                           "Route Locked",
                           fmt::format("Route {} is {} and cannot absorb other routes.", route_id, to_string(plan_.route(route_id).state)),
                           route_id);
    }

    OperationResult result{};
    result.route_id = route_id;
    result.stops_affected = outcome.stops_moved;
    result.merged_route_ids = outcome.merged_route_ids;
    if (outcome.merged_route_ids.empty()) {
        result.status = OperationStatus::NoOp;
        result.title = "No Combination Possible";
        result.message = "No adjacent route fits within the remaining vehicle capacity.";
    } else {
        result.status = OperationStatus::Success;
        result.title = "Routes Combined";
        result.message = fmt::format("Merged routes {} into route {}.", join_ids(outcome.merged_route_ids), route_id);
    }
    return result;
}

OperationResult RouteOrchestrator::split_combine_for_adjacent_areas(RouteId route_id) {
    std::unique_lock lock_plan(mutex_plan_);
    return split_combine_unlocked(route_id).result;
}

OperationResult RouteOrchestrator::smart_split_combine_route(RouteId route_id) {
    std::unique_lock lock_plan(mutex_plan_);
    SplitCombineSummary summary = split_combine_unlocked(route_id);
    OperationResult& result = summary.result;
    if (result.status != OperationStatus::Success && result.status != OperationStatus::NoOp) {
        return result;
    }

    double distance_before_km = 0.0;
    double distance_after_km = 0.0;
    std::size_t routes_reordered = 0;
    for (const RouteId surviving_id : summary.surviving_route_ids) {
        OperationResult optimized = optimize_unlocked(surviving_id);
        distance_before_km += optimized.distance_before_km.value_or(0.0);
        distance_after_km += optimized.distance_after_km.value_or(0.0);
        if (optimized.status == OperationStatus::Success) {
            ++routes_reordered;
            result.status = OperationStatus::Success;
        }
        result.per_route_results.push_back(std::move(optimized));
    }

    result.title = "Smart Split/Combine Complete";
    result.distance_before_km = distance_before_km;
    result.distance_after_km = distance_after_km;
    result.message += fmt::format(" Re-optimized {} of {} route(s): {:.2f} km -> {:.2f} km.",
                                  routes_reordered,
                                  summary.surviving_route_ids.size(),
                                  distance_before_km,
                                  distance_after_km);
    return result;
}

OperationResult RouteOrchestrator::optimize_all_routes_for_distance() {
    std::shared_lock lock_plan(mutex_plan_);

    std::vector<RouteId> list_route_ids;
    for (const RouteId route_id : plan_.route_ids()) {
        if (is_plannable(plan_.route(route_id).state)) {
            list_route_ids.push_back(route_id);
        }
    }
    if (list_route_ids.empty()) {
        return make_result(OperationStatus::NoOp, "No Routes", "There are no draft or confirmed routes to optimize.");
    }

    std::vector<OperationResult> list_results(list_route_ids.size());
    std::atomic<std::size_t> next_index{0};
    const auto worker = [this, &list_route_ids, &list_results, &next_index]() {
        while (true) {
            const std::size_t index = next_index.fetch_add(1);
            if (index >= list_route_ids.size()) {
                return;
            }
            const RouteId route_id = list_route_ids[index];
            try {
                if (!plan_.capacity_for(route_id).has_value()) {
                    list_results[index] = no_vehicle(route_id);
                    continue;
                }
                std::scoped_lock lock_route(route_mutex(route_id));
                list_results[index] = optimize_unlocked(route_id);
            } catch (const std::exception& exc) {
                logger_->error(
                    R"({{"component":"orchestrator","operation":"optimize_all","route":{},"error":{:?}}})",
                    route_id,
                    std::string_view{exc.what()}
                );
                list_results[index] = make_result(OperationStatus::Failed, "Optimization Failed", exc.what(), route_id);
            }
        }
    };

    const std::size_t thread_count = std::min(config_.worker_count, list_route_ids.size());
    std::vector<std::thread> list_threads;
    list_threads.reserve(thread_count);
    for (std::size_t index = 0; index < thread_count; ++index) {
        list_threads.emplace_back(worker);
    }
    for (std::thread& thread : list_threads) {
        thread.join();
    }

    std::size_t optimized_count = 0;
    std::size_t unassigned_count = 0;
    std::size_t failed_count = 0;
    for (const OperationResult& route_result : list_results) {
        if (route_result.status == OperationStatus::Success) {
            ++optimized_count;
        } else if (route_result.status == OperationStatus::ConfigurationError) {
            ++unassigned_count;
        } else if (route_result.status == OperationStatus::Failed) {
            ++failed_count;
        }
    }

    OperationResult result{};
    result.title = "Fleet Optimization Complete";
    result.message = fmt::format("Optimized {} of {} route(s).", optimized_count, list_route_ids.size());
    if (unassigned_count > 0) {
        result.message += fmt::format(" {} route(s) skipped: {}.", unassigned_count, k_no_vehicle_title);
    }
    if (failed_count > 0) {
        result.message += fmt::format(" {} route(s) failed.", failed_count);
    }
    if (optimized_count > 0) {
        result.status = OperationStatus::Success;
    } else if (unassigned_count == list_route_ids.size()) {
        result.status = OperationStatus::ConfigurationError;
    } else if (failed_count > 0) {
        result.status = OperationStatus::Failed;
    } else {
        result.status = OperationStatus::NoOp;
    }
    for (const OperationResult& route_result : list_results) {
        result.stops_affected += route_result.stops_affected;
    }
    result.per_route_results = std::move(list_results);

    logger_->info(
        R"({{"component":"orchestrator","operation":"optimize_all","routes":{},"optimized":{},"unassigned":{},"failed":{}}})",
        list_route_ids.size(),
        optimized_count,
        unassigned_count,
        failed_count
    );
    return result;
}

OperationResult RouteOrchestrator::build_route(const DeliveryBatch& batch) {
    std::unique_lock lock_plan(mutex_plan_);
    try {
        return route_builder_.build_route(batch);
    } catch (const std::out_of_range& exc) {
        return make_result(OperationStatus::ValidationError, "Invalid Batch", exc.what());
    }
}

OperationResult RouteOrchestrator::check_split_requirements(const DeliveryBatch& batch) const {
    std::shared_lock lock_plan(mutex_plan_);
    try {
        return route_builder_.check_split_requirements(batch);
    } catch (const std::out_of_range& exc) {
        return make_result(OperationStatus::ValidationError, "Invalid Batch", exc.what());
    }
}

OperationResult RouteOrchestrator::confirm_route(RouteId route_id) {
    std::unique_lock lock_plan(mutex_plan_);
    if (!plan_.has_route(route_id)) {
        return unknown_route(route_id);
    }
    const std::optional<VehicleCapacity> capacity = plan_.capacity_for(route_id);
    if (!capacity.has_value()) {
        return no_vehicle(route_id);
    }
    const CargoLoad load = plan_.route_load(route_id);
    if (!capacity->fits(load)) {
        return make_result(OperationStatus::ValidationError,
                           "Capacity Exceeded",
                           fmt::format("Route {} carries {:.2f} kg / {:.2f} m3 which exceeds vehicle capacity; split it before confirming.",
                                       route_id,
                                       load.weight_kg,
                                       load.volume_m3),
                           route_id);
    }
    return transition_route(route_id, RouteState::Confirmed, "Route Confirmed");
}

OperationResult RouteOrchestrator::start_route(RouteId route_id) {
    std::unique_lock lock_plan(mutex_plan_);
    if (!plan_.has_route(route_id)) {
        return unknown_route(route_id);
    }
    return transition_route(route_id, RouteState::InTransit, "Route Started");
}

OperationResult RouteOrchestrator::deliver_route(RouteId route_id) {
    std::unique_lock lock_plan(mutex_plan_);
    if (!plan_.has_route(route_id)) {
        return unknown_route(route_id);
    }
    return transition_route(route_id, RouteState::Delivered, "Route Delivered");
}

OperationResult RouteOrchestrator::cancel_route(RouteId route_id) {
    std::unique_lock lock_plan(mutex_plan_);
    if (!plan_.has_route(route_id)) {
        return unknown_route(route_id);
    }
    return transition_route(route_id, RouteState::Cancelled, "Route Cancelled");
}

OperationResult RouteOrchestrator::adjust_stop(StopId stop_id,
                                               AdjustmentReason reason,
                                               std::optional<int> new_sequence,
                                               std::optional<WallTimePoint> new_window_start,
                                               std::optional<WallTimePoint> new_window_end) {
    std::unique_lock lock_plan(mutex_plan_);
    if (!plan_.has_stop(stop_id)) {
        return make_result(OperationStatus::ValidationError, "Stop Not Found", fmt::format("Stop {} does not exist.", stop_id));
    }
    const Stop& target = plan_.stop(stop_id);
    const RouteId route_id = target.route;
    if (!is_plannable(plan_.route(route_id).state)) {
        return make_result(OperationStatus::ValidationError,
                           "Route Locked",
                           fmt::format("Route {} is {} and its stops can no longer be adjusted.", route_id, to_string(plan_.route(route_id).state)),
                           route_id);
    }

    const std::optional<WallTimePoint> window_start = new_window_start.has_value() ? new_window_start : target.time_window_start;
    const std::optional<WallTimePoint> window_end = new_window_end.has_value() ? new_window_end : target.time_window_end;
    if (window_start.has_value() && window_end.has_value() && *window_end < *window_start) {
        return make_result(OperationStatus::ValidationError,
                           "Invalid Time Window",
                           fmt::format("Stop {} time window would end before it starts.", stop_id),
                           route_id);
    }

    if (new_sequence.has_value()) {
        plan_.reposition_stop(stop_id, *new_sequence);
    }
    plan_.set_stop_window(stop_id, window_start, window_end);
    plan_.set_stop_state(stop_id, StopState::Adjusted, reason);

    logger_->info(
        R"({{"component":"orchestrator","operation":"adjust_stop","stop":{},"route":{},"reason":"{}","sequence":{}}})",
        stop_id,
        route_id,
        to_string(reason),
        plan_.stop(stop_id).sequence
    );

    OperationResult result = make_result(OperationStatus::Success,
                                         "Stop Adjusted",
                                         fmt::format("Stop {} is now at position {} ({}).", stop_id, plan_.stop(stop_id).sequence, to_string(reason)),
                                         route_id);
    result.stops_affected = 1;
    return result;
}

OperationResult RouteOrchestrator::optimize_unlocked(RouteId route_id) {
    const Route& subject = plan_.route(route_id);
    if (!is_plannable(subject.state)) {
        return make_result(OperationStatus::ValidationError,
                           "Route Locked",
                           fmt::format("Route {} is {} and can no longer be re-sequenced.", route_id, to_string(subject.state)),
                           route_id);
    }

    const std::vector<Stop> list_current = plan_.stops_of(route_id);
    if (list_current.size() <= 1) {
        OperationResult result = make_result(OperationStatus::NoOp,
                                             "No Optimization Needed",
                                             "No Optimization Needed: the route has at most one stop.",
                                             route_id);
        result.distance_before_km = 0.0;
        result.distance_after_km = 0.0;
        return result;
    }

    const double distance_before_km = route_distance_km(list_current);
    const std::vector<Stop> list_tour = optimize_tour(list_current);
    const double distance_after_km = route_distance_km(list_tour);
    const std::vector<StopId> current_ids = stop_ids_of(list_current);
    const std::vector<StopId> tour_ids = stop_ids_of(list_tour);

    OperationResult result{};
    result.route_id = route_id;
    result.distance_before_km = distance_before_km;
    if (tour_ids == current_ids || distance_after_km > distance_before_km) {
        result.status = OperationStatus::NoOp;
        result.title = "Already Optimal";
        result.message = fmt::format("Route {} keeps its current order ({:.2f} km).", route_id, distance_before_km);
        result.distance_after_km = distance_before_km;
        return result;
    }

    plan_.apply_sequence(route_id, tour_ids);
    for (std::size_t index = 0; index < tour_ids.size(); ++index) {
        if (tour_ids[index] != current_ids[index]) {
            ++result.stops_affected;
        }
    }
    result.status = OperationStatus::Success;
    result.title = "Route Optimized";
    result.distance_after_km = distance_after_km;
    result.message = fmt::format("Route {} re-sequenced: {:.2f} km -> {:.2f} km.", route_id, distance_before_km, distance_after_km);
    logger_->info(
        R"({{"component":"optimizer","route":{},"before_km":{:.3f},"after_km":{:.3f},"stops_moved":{}}})",
        route_id,
        distance_before_km,
        distance_after_km,
        result.stops_affected
    );
    return result;
}

RouteOrchestrator::SplitCombineSummary RouteOrchestrator::split_combine_unlocked(RouteId route_id) {
    SplitCombineSummary summary{};
    if (!plan_.has_route(route_id)) {
        summary.result = unknown_route(route_id);
        return summary;
    }
    const std::optional<VehicleCapacity> capacity = plan_.capacity_for(route_id);
    if (!capacity.has_value()) {
        summary.result = no_vehicle(route_id);
        return summary;
    }

    CapacitySplitter splitter{plan_};
    const SplitOutcome split_outcome = splitter.split_oversized_areas(route_id, capacity);
    if (split_outcome.route_locked) {
        summary.result = make_result(OperationStatus::ValidationError,
                                     "Route Locked",
                                     fmt::format("Route {} is {} and can no longer be split.", route_id, to_string(plan_.route(route_id).state)),
                                     route_id);
        return summary;
    }

    std::vector<RouteId> list_resulting = split_outcome.route_ids;
    std::sort(list_resulting.begin(), list_resulting.end());

    RouteCombiner combiner{plan_, adjacency_};
    std::vector<RouteId> list_merged;
    std::size_t stops_combined = 0;
    for (const RouteId target_id : list_resulting) {
        const Route& target = plan_.route(target_id);
        if (!is_plannable(target.state) || target.stops.empty()) {
            continue;
        }
        const CombineOutcome combine_outcome = combiner.combine_adjacent(target_id, list_resulting, plan_.capacity_for(target_id));
        list_merged.insert(list_merged.end(), combine_outcome.merged_route_ids.begin(), combine_outcome.merged_route_ids.end());
        stops_combined += combine_outcome.stops_moved;
    }

    for (const RouteId resulting_id : list_resulting) {
        const Route& resulting = plan_.route(resulting_id);
        if (is_plannable(resulting.state)) {
            summary.surviving_route_ids.push_back(resulting_id);
        }
    }

    OperationResult& result = summary.result;
    result.route_id = route_id;
    result.merged_route_ids = list_merged;
    result.stops_affected = split_outcome.stops_moved + stops_combined;
    for (const RouteId new_id : split_outcome.new_route_ids) {
        if (is_plannable(plan_.route(new_id).state)) {
            result.new_route_ids.push_back(new_id);
        }
    }

    const bool changed = !split_outcome.new_route_ids.empty() || !list_merged.empty();
    result.status = changed ? OperationStatus::Success : OperationStatus::NoOp;
    result.title = "Split and Combine Complete";
    result.message = fmt::format("Split {} area(s) and moved {} area group(s) into {} new route(s); merged {} route(s); {} route(s) remain.",
                                 split_outcome.split_areas.size(),
                                 split_outcome.regrouped_areas,
                                 split_outcome.new_route_ids.size(),
                                 list_merged.size(),
                                 summary.surviving_route_ids.size());
    if (!split_outcome.oversized_stops.empty()) {
        result.message += fmt::format(" {} stop(s) exceed vehicle capacity on their own.", split_outcome.oversized_stops.size());
    }
    return summary;
}

OperationResult RouteOrchestrator::transition_route(RouteId route_id, RouteState target, const std::string& title) {
    const RouteState current = plan_.route(route_id).state;
    if (!can_transition(current, target)) {
        return make_result(OperationStatus::ValidationError,
                           "Invalid Transition",
                           fmt::format("Route {} cannot move from {} to {}.", route_id, to_string(current), to_string(target)),
                           route_id);
    }
    plan_.transition(route_id, target);
    logger_->info(
        R"({{"component":"orchestrator","route":{},"from":"{}","to":"{}"}})",
        route_id,
        to_string(current),
        to_string(target)
    );
    return make_result(OperationStatus::Success,
                       title,
                       fmt::format("Route {} is now {}.", route_id, to_string(target)),
                       route_id);
}

std::mutex& RouteOrchestrator::route_mutex(RouteId route_id) {
    std::scoped_lock lock(mutex_route_locks_);
    std::unique_ptr<std::mutex>& slot = map_route_locks_[route_id];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

}  // namespace route_planner
