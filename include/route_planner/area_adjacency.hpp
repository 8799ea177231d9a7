// === Area Adjacency ==========================================================
//
// Decides whether two coverage areas are close enough for their stops to share
// one route. Areas are compared by code first and by the distance between
// their cached representative coordinates second.

#pragma once

#include "route_planner/route_model.hpp"

namespace route_planner {

/** @brief Default distance under which two area centroids count as adjacent. */
inline constexpr double k_default_proximity_threshold_km{10.0};

class AreaAdjacency final {
  public:
    explicit AreaAdjacency(double proximity_threshold_km = k_default_proximity_threshold_km);

    [[nodiscard]] double proximity_threshold_km() const noexcept;

    /**
     * @brief True when stops from @p lhs and @p rhs may be combined.
     *
     * A missing area (nullptr) is compatible with anything. Distinct areas
     * without a representative coordinate are never adjacent.
     */
    [[nodiscard]] bool adjacent(const Area* lhs, const Area* rhs) const noexcept;

  private:
    double proximity_threshold_km_;
};

}  // namespace route_planner
