#include "nav/pathfinder.h"

#include <cmath>
#include <cstdlib>
#include <optional>
#include <unordered_map>

#include "core/log.h"
#include "nav/orientation.h"
#include "nav/priority_queue.h"

namespace delve::nav {

namespace {

constexpr double kInfiniteCost = std::numeric_limits<double>::infinity();

// A cell can be reached with different facings at different costs, so the
// facing on arrival is part of the search key.
struct SearchState {
    core::Cell3i cell{};
    core::Dir6 facing = core::Dir6::NegZ;

    bool operator==(const SearchState&) const = default;
};

struct SearchStateHash {
    std::size_t operator()(const SearchState& state) const noexcept {
        return core::Cell3iHash{}(state.cell) ^ (static_cast<std::size_t>(core::dirIndex(state.facing)) * 2654435761u);
    }
};

struct StateRecord {
    double costSoFar = 0.0;
    // Priority of the newest queue entry; older entries for this state are stale.
    double priority = 0.0;
    SearchState cameFrom{};
};

} // namespace

double heuristicManhattan(const core::Cell3i& node, const core::Cell3i& goal) {
    const int dx = goal.x - node.x;
    const int dy = goal.y - node.y;
    const int dz = goal.z - node.z;
    // Covering both horizontal axes needs at least one quarter turn.
    const int turnBonus = (dx != 0 && dz != 0) ? 1 : 0;
    return static_cast<double>(std::abs(dx) + std::abs(dy) + std::abs(dz) + turnBonus);
}

double heuristicEuclidean(const core::Cell3i& node, const core::Cell3i& goal) {
    const double dx = static_cast<double>(goal.x - node.x);
    const double dy = static_cast<double>(goal.y - node.y);
    const double dz = static_cast<double>(goal.z - node.z);
    return std::sqrt((dx * dx) + (dy * dy) + (dz * dz));
}

double heuristicZero(const core::Cell3i&, const core::Cell3i&) {
    return 0.0;
}

CostFunction makeTimeCost(const world::WorldView& world, CostWeights weights) {
    return [&world, weights](const core::Cell3i& from, const core::Cell3i& to, core::Dir6 fromFacing) -> double {
        core::Dir6 afterFacing = fromFacing;
        if (!calcOrientation(from, to, fromFacing, false, afterFacing)) {
            return kInfiniteCost;
        }

        double total = weights.move;
        if (afterFacing != fromFacing) {
            total += isOppositeDirection(fromFacing, afterFacing) ? weights.turnAround : weights.turn;
        }
        if (world.blockAt(to) != world::BlockClass::Air) {
            total += weights.obstruction;
        }
        return total;
    };
}

bool isEnterable(const core::Cell3i& cell, const world::WorldView& world, const PathfinderConfig& config) {
    if (cell.y < config.minY || cell.y > config.maxY) {
        return false;
    }
    // Floor blocks only occur near the bottom of the world, so skip the lookup elsewhere.
    return cell.y >= config.floorCheckBelowY || world.blockAt(cell) != world::BlockClass::Floor;
}

std::vector<core::Cell3i> neighbours(
    const core::Cell3i& node,
    const world::WorldView& world,
    const PathfinderConfig& config
) {
    std::vector<core::Cell3i> result;
    result.reserve(core::kAllDir6.size());
    for (const core::Dir6 dir : core::kAllDir6) {
        const core::Cell3i next = core::neighborCell(node, dir);
        if (isEnterable(next, world, config)) {
            result.push_back(next);
        }
    }
    return result;
}

PathResult findPath(const PathRequest& request, const world::WorldView& world, const PathfinderConfig& config) {
    PathResult result{};
    if (request.start == request.goal) {
        result.status = NavStatus::Ok;
        result.totalCost = 0.0;
        return result;
    }
    if (core::isVertical(request.startFacing)) {
        DELVE_LOGE("path") << "start facing " << request.startFacing << " at " << request.start
                           << " is not horizontal";
        result.status = NavStatus::InvalidFacing;
        return result;
    }
    // The lattice is unbounded in x and z, so an unenterable goal would never exhaust the open set.
    if (!isEnterable(request.goal, world, config)) {
        DELVE_LOGW("path") << "goal " << request.goal << " can never be entered (y band [" << config.minY << ", "
                           << config.maxY << "] or floor)";
        result.status = NavStatus::GoalUnreachable;
        return result;
    }

    const CostFunction cost = request.cost ? request.cost : makeTimeCost(world);
    const HeuristicFunction heuristic = request.heuristic ? request.heuristic : HeuristicFunction{heuristicManhattan};

    MinPriorityQueue<SearchState> open;
    std::unordered_map<SearchState, StateRecord, SearchStateHash> records;

    const SearchState startState{request.start, request.startFacing};
    const double startPriority = heuristic(request.start, request.goal);
    records.emplace(startState, StateRecord{0.0, startPriority, startState});
    open.put(startState, startPriority);

    std::optional<SearchState> reached;
    while (!open.empty()) {
        if (core::isCancelled(request.cancel)) {
            DELVE_LOGI("path") << "search " << request.start << " -> " << request.goal << " cancelled after "
                               << result.expandedNodes << " expansions";
            result.status = NavStatus::Cancelled;
            return result;
        }

        const double priority = open.topPriority();
        const SearchState current = open.pop();
        const StateRecord currentRecord = records.at(current);
        if (priority > currentRecord.priority) {
            continue;
        }
        if (current.cell == request.goal) {
            reached = current;
            break;
        }

        ++result.expandedNodes;
        if (config.maxExpansions != 0 && result.expandedNodes > config.maxExpansions) {
            DELVE_LOGW("path") << "search " << request.start << " -> " << request.goal << " gave up after "
                               << config.maxExpansions << " expansions";
            result.status = NavStatus::SearchLimitReached;
            return result;
        }

        for (const core::Cell3i& next : neighbours(current.cell, world, config)) {
            const double stepCost = cost(current.cell, next, current.facing);
            if (!std::isfinite(stepCost)) {
                continue;
            }
            core::Dir6 nextFacing = current.facing;
            if (!calcOrientation(current.cell, next, current.facing, false, nextFacing)) {
                continue;
            }

            const SearchState nextState{next, nextFacing};
            const double newCost = currentRecord.costSoFar + stepCost;
            const auto it = records.find(nextState);
            if (it == records.end() || newCost < it->second.costSoFar) {
                const double nextPriority = newCost + heuristic(next, request.goal);
                records.insert_or_assign(nextState, StateRecord{newCost, nextPriority, current});
                open.put(nextState, nextPriority);
            }
        }
    }

    if (!reached.has_value()) {
        DELVE_LOGW("path") << "goal " << request.goal << " unreachable from " << request.start << " ("
                           << result.expandedNodes << " expansions)";
        result.status = NavStatus::GoalUnreachable;
        return result;
    }

    SearchState state = *reached;
    while (state != startState) {
        result.path.push_back(state.cell);
        state = records.at(state).cameFrom;
    }
    result.totalCost = records.at(*reached).costSoFar;
    result.status = NavStatus::Ok;
    DELVE_LOGD("path") << "path " << request.start << " -> " << request.goal << ": " << result.path.size()
                       << " steps, cost=" << result.totalCost << ", expanded=" << result.expandedNodes;
    return result;
}

double pathCost(
    const std::vector<core::Cell3i>& path,
    const core::Cell3i& start,
    core::Dir6 startFacing,
    const CostFunction& cost
) {
    double total = 0.0;
    core::Cell3i position = start;
    core::Dir6 facing = startFacing;
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        core::Dir6 nextFacing = facing;
        if (!calcOrientation(position, *it, facing, false, nextFacing)) {
            return kInfiniteCost;
        }
        total += cost(position, *it, facing);
        position = *it;
        facing = nextFacing;
    }
    return total;
}

} // namespace delve::nav
