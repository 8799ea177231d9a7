#include "route_planner/operation_result.hpp"

#include <utility>

namespace route_planner {

std::string_view to_string(OperationStatus status) noexcept {
    switch (status) {
        case OperationStatus::Success:
            return "success";
        case OperationStatus::NoOp:
            return "no_op";
        case OperationStatus::ConfigurationError:
            return "configuration_error";
        case OperationStatus::ValidationError:
            return "validation_error";
        case OperationStatus::Failed:
            return "failed";
    }
    return "unknown";
}

OperationResult make_result(OperationStatus status,
                            std::string title,
                            std::string message,
                            std::optional<RouteId> route_id) {
    OperationResult result{};
    result.status = status;
    result.title = std::move(title);
    result.message = std::move(message);
    result.route_id = route_id;
    return result;
}

}  // namespace route_planner
