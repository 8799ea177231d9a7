// === Core Types ==============================================================
//
// Collects shared identifiers, value types, and enums used throughout the
// planner (coordinates, cargo loads, vehicle capacity, lifecycle states).

#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace route_planner {

/**
 * @brief Alias for the wall clock used for delivery time windows.
 */
using WallClock = std::chrono::system_clock;

/**
 * @brief Alias for timestamps on the wall clock.
 */
using WallTimePoint = std::chrono::time_point<WallClock>;

using AreaId = std::uint64_t;
using CustomerId = std::uint64_t;
using VehicleId = std::uint64_t;
using RouteId = std::uint64_t;
using StopId = std::uint64_t;
using BatchId = std::uint64_t;
using OrderId = std::uint64_t;

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct Coordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
};

/**
 * @brief Aggregated cargo demand carried to a stop or by a route.
 */
struct CargoLoad final {
    double weight_kg{};   /**< Total weight in kilograms. */
    double volume_m3{};   /**< Total volume in cubic metres. */

    CargoLoad& operator+=(const CargoLoad& other) noexcept {
        weight_kg += other.weight_kg;
        volume_m3 += other.volume_m3;
        return *this;
    }

    [[nodiscard]] friend CargoLoad operator+(CargoLoad lhs, const CargoLoad& rhs) noexcept {
        lhs += rhs;
        return lhs;
    }
};

/**
 * @brief Upper bound a vehicle imposes on route cargo.
 *
 * A dimension whose maximum is zero is not constrained.
 */
struct VehicleCapacity final {
    double max_weight_kg{};  /**< Maximum payload weight in kilograms. */
    double max_volume_m3{};  /**< Maximum payload volume in cubic metres. */

    [[nodiscard]] bool weight_constrained() const noexcept { return max_weight_kg > 0.0; }
    [[nodiscard]] bool volume_constrained() const noexcept { return max_volume_m3 > 0.0; }

    /** @brief True when @p load fits on the vehicle in every constrained dimension. */
    [[nodiscard]] bool fits(const CargoLoad& load) const noexcept {
        if (weight_constrained() && load.weight_kg > max_weight_kg) {
            return false;
        }
        if (volume_constrained() && load.volume_m3 > max_volume_m3) {
            return false;
        }
        return true;
    }
};

/**
 * @brief Lifecycle of a delivery route.
 */
enum class RouteState {
    Draft,      /**< Being planned; capacity not yet validated. */
    Confirmed,  /**< Capacity validated and ready for dispatch. */
    InTransit,  /**< Vehicle has left the depot. */
    Delivered,  /**< All stops served (terminal). */
    Cancelled   /**< Abandoned or absorbed by another route (terminal). */
};

/**
 * @brief Lifecycle of a single delivery stop.
 */
enum class StopState {
    Pending,     /**< Awaiting delivery. */
    InProgress,  /**< Driver is servicing the stop. */
    Completed,   /**< Delivery recorded. */
    Failed,      /**< Delivery attempt failed. */
    Adjusted     /**< Manually re-planned by a dispatcher. */
};

/**
 * @brief Why a dispatcher moved a stop or changed its time window.
 */
enum class AdjustmentReason {
    Traffic,
    Weather,
    Customer,
    Vehicle,
    Other
};

[[nodiscard]] std::string_view to_string(RouteState state) noexcept;
[[nodiscard]] std::string_view to_string(StopState state) noexcept;
[[nodiscard]] std::string_view to_string(AdjustmentReason reason) noexcept;

}  // namespace route_planner
