#include "route_planner/route_model.hpp"

#include <cctype>

namespace route_planner {

namespace {
constexpr char k_unnamed_area_code[] = "UNNAMED_AREA";
}  // namespace

bool is_plannable(RouteState state) noexcept {
    return state == RouteState::Draft || state == RouteState::Confirmed;
}

bool is_active(RouteState state) noexcept {
    return state == RouteState::Draft || state == RouteState::Confirmed || state == RouteState::InTransit;
}

bool can_transition(RouteState from, RouteState to) noexcept {
    switch (to) {
        case RouteState::Confirmed:
            return from == RouteState::Draft;
        case RouteState::InTransit:
            return from == RouteState::Confirmed;
        case RouteState::Delivered:
            return from == RouteState::InTransit;
        case RouteState::Cancelled:
            return is_active(from);
        case RouteState::Draft:
            return false;
    }
    return false;
}

std::string generate_area_code(std::string_view name) {
    if (name.empty()) {
        return k_unnamed_area_code;
    }
    std::string code;
    code.reserve(name.size());
    for (const char character : name) {
        if (character == ' ' || character == '-') {
            code.push_back('_');
        } else {
            code.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(character))));
        }
    }
    return code;
}

}  // namespace route_planner
