#include "route_planner/types.hpp"

namespace route_planner {

std::string_view to_string(RouteState state) noexcept {
    switch (state) {
        case RouteState::Draft:
            return "draft";
        case RouteState::Confirmed:
            return "confirmed";
        case RouteState::InTransit:
            return "in_transit";
        case RouteState::Delivered:
            return "delivered";
        case RouteState::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

std::string_view to_string(StopState state) noexcept {
    switch (state) {
        case StopState::Pending:
            return "pending";
        case StopState::InProgress:
            return "in_progress";
        case StopState::Completed:
            return "completed";
        case StopState::Failed:
            return "failed";
        case StopState::Adjusted:
            return "adjusted";
    }
    return "unknown";
}

std::string_view to_string(AdjustmentReason reason) noexcept {
    switch (reason) {
        case AdjustmentReason::Traffic:
            return "traffic";
        case AdjustmentReason::Weather:
            return "weather";
        case AdjustmentReason::Customer:
            return "customer";
        case AdjustmentReason::Vehicle:
            return "vehicle";
        case AdjustmentReason::Other:
            return "other";
    }
    return "unknown";
}

}  // namespace route_planner
