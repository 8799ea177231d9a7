// === Operation Result ========================================================
//
// Structured outcome returned by every orchestration entry point. Expected
// conditions (nothing to do, missing vehicle, rejected input) are reported
// through `status` rather than exceptions so fleet-wide runs can continue past
// a single problematic route.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "route_planner/types.hpp"

namespace route_planner {

enum class OperationStatus {
    Success,             /**< The plan was changed as requested. */
    NoOp,                /**< Nothing needed doing; the plan is unchanged. */
    ConfigurationError,  /**< Blocked by missing setup such as an unassigned vehicle. */
    ValidationError,     /**< Rejected input or a request the model forbids. */
    Failed               /**< Unexpected failure, isolated to this result. */
};

[[nodiscard]] std::string_view to_string(OperationStatus status) noexcept;

struct OperationResult final {
    OperationStatus status{OperationStatus::NoOp};
    std::string title{};
    std::string message{};
    std::optional<RouteId> route_id{};
    std::size_t stops_affected{};
    std::optional<double> distance_before_km{};
    std::optional<double> distance_after_km{};
    std::vector<RouteId> new_route_ids{};
    std::vector<RouteId> merged_route_ids{};
    std::vector<OperationResult> per_route_results{};

    [[nodiscard]] bool ok() const noexcept {
        return status == OperationStatus::Success || status == OperationStatus::NoOp;
    }
};

/** @brief Build a result carrying only a status, title, and message. */
[[nodiscard]] OperationResult make_result(OperationStatus status,
                                          std::string title,
                                          std::string message,
                                          std::optional<RouteId> route_id = std::nullopt);

}  // namespace route_planner
