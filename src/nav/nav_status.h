#pragma once

#include <cstdint>

namespace delve::nav {

enum class NavStatus : std::uint8_t {
    Ok = 0,
    GoalUnreachable = 1,
    SearchLimitReached = 2,
    Cancelled = 3,
    InputsNotAdjacent = 4,
    MoveBlocked = 5,
    // Up or down was given where a horizontal facing is required.
    InvalidFacing = 6
};

inline constexpr const char* navStatusName(NavStatus status) {
    switch (status) {
    case NavStatus::Ok: return "ok";
    case NavStatus::GoalUnreachable: return "goal-unreachable";
    case NavStatus::SearchLimitReached: return "search-limit-reached";
    case NavStatus::Cancelled: return "cancelled";
    case NavStatus::InputsNotAdjacent: return "inputs-not-adjacent";
    case NavStatus::MoveBlocked: return "move-blocked";
    case NavStatus::InvalidFacing: return "invalid-facing";
    }
    return "unknown";
}

} // namespace delve::nav
