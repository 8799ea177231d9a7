#include "route_planner/route_builder.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

#include "route_planner/tour_optimizer.hpp"

namespace route_planner {

namespace {

struct CustomerStopDraft final {
    CustomerId customer{};
    StopRequest request{};
};

std::vector<const DeliveryOrder*> oversized_orders(const std::vector<DeliveryOrder>& orders, const VehicleCapacity& capacity) {
    std::vector<const DeliveryOrder*> list_oversized;
    for (const DeliveryOrder& order : orders) {
        if (!capacity.fits(order.demand)) {
            list_oversized.push_back(&order);
        }
    }
    return list_oversized;
}

std::string describe_orders(const std::vector<const DeliveryOrder*>& orders) {
    std::string text;
    for (const DeliveryOrder* order : orders) {
        text += fmt::format("\n- {}: {:.2f}kg / {:.2f}m3", order->name, order->demand.weight_kg, order->demand.volume_m3);
    }
    return text;
}

}  // namespace

RouteBuilder::RouteBuilder(FleetPlan& plan)
    : plan_(plan),
      logger_(get_logger()) {}

OperationResult RouteBuilder::build_route(const DeliveryBatch& batch) {
    if (const std::optional<RouteId> existing = plan_.route_for_batch(batch.id); existing.has_value()) {
        return make_result(OperationStatus::NoOp,
                           "Route Already Exists",
                           "A route already exists for this batch. Each batch can only have one route.",
                           existing);
    }
    if (batch.orders.empty()) {
        return make_result(OperationStatus::ValidationError,
                           "Empty Batch",
                           fmt::format("Batch {} has no orders to deliver.", batch.name));
    }

    CargoLoad batch_load{};
    for (const DeliveryOrder& order : batch.orders) {
        if (order.demand.weight_kg < 0.0 || order.demand.volume_m3 < 0.0) {
            return make_result(OperationStatus::ValidationError,
                               "Invalid Order",
                               fmt::format("Order {} has negative weight or volume.", order.name));
        }
        if (order.priority < 0 || order.priority > 4) {
            return make_result(OperationStatus::ValidationError,
                               "Invalid Order",
                               fmt::format("Order {} priority {} is outside 0..4.", order.name, order.priority));
        }
        if (!plan_.has_customer(order.customer)) {
            return make_result(OperationStatus::ValidationError,
                               "Invalid Order",
                               fmt::format("Order {} references unknown customer {}.", order.name, order.customer));
        }
        batch_load += order.demand;
    }

    if (batch.vehicle.has_value()) {
        const VehicleCapacity capacity = plan_.vehicle(*batch.vehicle).capacity;
        if (!capacity.fits(batch_load)) {
            const auto list_oversized = oversized_orders(batch.orders, capacity);
            std::string message;
            if (!list_oversized.empty()) {
                message = "The following orders exceed vehicle capacity:" + describe_orders(list_oversized)
                    + "\n\nPlease split these orders at the warehouse level before creating a route.";
            } else {
                message = fmt::format(
                    "The total batch weight ({:.2f} kg) or volume ({:.2f} m3) exceeds vehicle capacity ({:.2f} kg, {:.2f} m3). "
                    "Please create smaller batches at the warehouse level before creating routes.",
                    batch_load.weight_kg,
                    batch_load.volume_m3,
                    capacity.max_weight_kg,
                    capacity.max_volume_m3
                );
            }
            logger_->warn(R"({{"component":"builder","batch":{},"action":"reject","reason":"capacity"}})", batch.id);
            return make_result(OperationStatus::ValidationError, "Capacity Exceeded", message);
        }
    }

    std::vector<CustomerStopDraft> list_drafts;
    for (const DeliveryOrder& order : batch.orders) {
        auto iterator_draft = std::find_if(list_drafts.begin(), list_drafts.end(), [&order](const CustomerStopDraft& draft) {
            return draft.customer == order.customer;
        });
        if (iterator_draft == list_drafts.end()) {
            CustomerStopDraft draft{};
            draft.customer = order.customer;
            draft.request.customer = order.customer;
            draft.request.area = plan_.customer(order.customer).area;
            list_drafts.push_back(std::move(draft));
            iterator_draft = std::prev(list_drafts.end());
        }
        StopRequest& request = iterator_draft->request;
        request.demand += order.demand;
        request.priority = std::max(request.priority, order.priority);
        request.orders.push_back(order.id);
        if (order.deadline.has_value()
            && (!request.time_window_start.has_value() || *order.deadline < *request.time_window_start)) {
            request.time_window_start = order.deadline;
        }
    }

    const RouteId route_id = plan_.create_route(batch.id, majority_area(batch.orders), batch.vehicle);
    for (const CustomerStopDraft& draft : list_drafts) {
        plan_.add_stop(route_id, draft.request);
    }

    std::vector<StopId> ordered_ids;
    for (const Stop& sequenced : optimize_tour(plan_.stops_of(route_id))) {
        ordered_ids.push_back(sequenced.id);
    }
    plan_.apply_sequence(route_id, ordered_ids);

    logger_->info(
        R"({{"component":"builder","batch":{},"route":{},"stops":{},"weight_kg":{},"volume_m3":{}}})",
        batch.id,
        route_id,
        list_drafts.size(),
        batch_load.weight_kg,
        batch_load.volume_m3
    );

    OperationResult result = make_result(OperationStatus::Success,
                                         "Route Created",
                                         fmt::format("Created route {} with {} stops for batch {}.", route_id, list_drafts.size(), batch.name),
                                         route_id);
    result.stops_affected = list_drafts.size();
    result.new_route_ids.push_back(route_id);
    return result;
}

OperationResult RouteBuilder::check_split_requirements(const DeliveryBatch& batch) const {
    if (!batch.vehicle.has_value()) {
        return make_result(OperationStatus::ConfigurationError,
                           "No Vehicle Assigned",
                           "Please assign a vehicle to the batch to check capacity requirements.");
    }
    const VehicleCapacity capacity = plan_.vehicle(*batch.vehicle).capacity;
    const auto list_oversized = oversized_orders(batch.orders, capacity);
    if (list_oversized.empty()) {
        return make_result(OperationStatus::Success,
                           "Capacity Check",
                           "All orders fit within vehicle capacity. Ready to create route.");
    }
    OperationResult result = make_result(OperationStatus::ValidationError,
                                         "Order Split Required",
                                         "The following orders exceed vehicle capacity and should be prepared separately:"
                                             + describe_orders(list_oversized));
    result.stops_affected = list_oversized.size();
    return result;
}

OrdersByArea RouteBuilder::group_orders_by_area(const std::vector<DeliveryOrder>& orders) const {
    OrdersByArea map_groups;
    for (const DeliveryOrder& order : orders) {
        map_groups[plan_.customer(order.customer).area].push_back(order);
    }
    return map_groups;
}

std::optional<AreaId> RouteBuilder::majority_area(const std::vector<DeliveryOrder>& orders) const {
    std::map<AreaId, std::size_t> map_counts;
    for (const DeliveryOrder& order : orders) {
        const std::optional<AreaId> area_id = plan_.customer(order.customer).area;
        if (area_id.has_value()) {
            ++map_counts[*area_id];
        }
    }
    std::optional<AreaId> best_area;
    std::size_t best_count = 0;
    // Ascending keys keep the lowest identity on ties.
    for (const auto& [area_id, count] : map_counts) {
        if (count > best_count) {
            best_area = area_id;
            best_count = count;
        }
    }
    return best_area;
}

}  // namespace route_planner
