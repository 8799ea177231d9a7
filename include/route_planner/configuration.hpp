// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the planner and the
// logging subsystem. `ConfigurationLoader` translates environment variables
// into these structures so downstream modules never touch `std::getenv`
// directly.

#pragma once

#include <string>

#include "route_planner/route_orchestrator.hpp"

namespace route_planner {

/**
 * @brief Immutable bundle of runtime knobs for a planning session.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};  /**< Destination directory for structured logs. */
    PlannerConfig planner{};      /**< Heuristic thresholds and worker pool size. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();
};

}  // namespace route_planner
