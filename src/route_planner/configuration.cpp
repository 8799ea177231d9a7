// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings for the
// planner. Values that cannot be parsed, or that are not positive, fall back
// to their defaults with a logged warning.
//
// Recognized variables
// - ROUTE_PLANNER_LOG_DIR       directory for the rotating log file
// - ROUTE_PLANNER_PROXIMITY_KM  centroid distance under which areas are adjacent
// - ROUTE_PLANNER_WORKERS       worker threads for fleet-wide optimization

#include "route_planner/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "route_planner/logging.hpp"

namespace route_planner {

namespace {
constexpr int k_default_worker_count{4};
constexpr std::string_view k_default_log_directory{"logs"};

double parse_double(const char* raw_value, double fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    double parsed_value{};
    try {
        parsed_value = std::stod(raw_value);
    } catch (const std::exception&) {
        parsed_value = 0.0;
    }
    if (parsed_value <= 0.0) {
        auto logger = get_logger();
        logger->warn(R"({{"component":"configuration","action":"fallback","type":"double","value":{:?},"fallback":{}}})", std::string_view{raw_value}, fallback);
        return fallback;
    }
    return parsed_value;
}

int parse_int(const char* raw_value, int fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    int parsed_value{};
    try {
        parsed_value = std::stoi(raw_value);
    } catch (const std::exception&) {
        parsed_value = 0;
    }
    if (parsed_value <= 0) {
        auto logger = get_logger();
        logger->warn(R"({{"component":"configuration","action":"fallback","type":"integer","value":{:?},"fallback":{}}})", std::string_view{raw_value}, fallback);
        return fallback;
    }
    return parsed_value;
}

std::string parse_log_directory() {
    const char* raw_directory = std::getenv("ROUTE_PLANNER_LOG_DIR");
    if (raw_directory == nullptr || std::string_view{raw_directory}.empty()) {
        return std::string{k_default_log_directory};
    }
    return std::string{raw_directory};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_log_directory();

    auto logger = initialize_logger(config.log_directory);
    logger->info(R"({{"component":"configuration","action":"load","source":"environment"}})");

    config.planner.proximity_threshold_km = parse_double(std::getenv("ROUTE_PLANNER_PROXIMITY_KM"), k_default_proximity_threshold_km);
    config.planner.worker_count = static_cast<std::size_t>(parse_int(std::getenv("ROUTE_PLANNER_WORKERS"), k_default_worker_count));

    logger->info(R"({{"component":"configuration","action":"loaded","proximity_threshold_km":{},"worker_count":{},"log_directory":{:?}}})",
                 config.planner.proximity_threshold_km,
                 config.planner.worker_count,
                 config.log_directory);

    return config;
}

}  // namespace route_planner
