#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <vector>

#include "core/cancel.h"
#include "core/grid3.h"
#include "nav/nav_status.h"
#include "world/block_class.h"

// Navigation Pathfinder subsystem
// Responsible for: A* search over the 6-connected cell lattice with facing-aware costs.
// Should NOT do: move the agent, mutate the world, or order multiple goals.
namespace delve::nav {

// Cost of stepping between adjacent cells while facing `fromFacing`; must be >= 0.
using CostFunction = std::function<double(const core::Cell3i& from, const core::Cell3i& to, core::Dir6 fromFacing)>;
// Estimate of the remaining cost; must not overestimate for the cost function in use.
using HeuristicFunction = std::function<double(const core::Cell3i& node, const core::Cell3i& goal)>;

struct CostWeights {
    double move = 1.0;
    double turn = 1.0;
    double turnAround = 2.0;
    // Clearing a non-air destination (unknown cells included).
    double obstruction = 1.555;
};

struct PathfinderConfig {
    // Open height band; cells outside [minY, maxY] are never entered.
    std::int32_t minY = 1;
    std::int32_t maxY = 255;
    // Below this height neighbors are checked against the world for impassable floor.
    std::int32_t floorCheckBelowY = 5;
    // 0 disables the limit. The lattice is unbounded in x and z, so an
    // unreachable goal is only detected by exhaustion when it is enclosed.
    std::size_t maxExpansions = 0;
};

struct PathRequest {
    core::Cell3i goal{};
    core::Cell3i start{};
    core::Dir6 startFacing = core::Dir6::NegZ;
    // Empty functions fall back to makeTimeCost(world) and heuristicManhattan.
    CostFunction cost;
    HeuristicFunction heuristic;
    const core::CancelToken* cancel = nullptr;
};

struct PathResult {
    NavStatus status = NavStatus::GoalUnreachable;
    // Goal first, start excluded: reverse of travel order.
    std::vector<core::Cell3i> path;
    double totalCost = std::numeric_limits<double>::infinity();
    std::size_t expandedNodes = 0;

    bool ok() const { return status == NavStatus::Ok; }
};

double heuristicManhattan(const core::Cell3i& node, const core::Cell3i& goal);
double heuristicEuclidean(const core::Cell3i& node, const core::Cell3i& goal);
double heuristicZero(const core::Cell3i& node, const core::Cell3i& goal);

CostFunction makeTimeCost(const world::WorldView& world, CostWeights weights = {});

// Whether the search may ever enter `cell`: inside the height band and not floor below the check height.
bool isEnterable(const core::Cell3i& cell, const world::WorldView& world, const PathfinderConfig& config = {});

std::vector<core::Cell3i> neighbours(
    const core::Cell3i& node,
    const world::WorldView& world,
    const PathfinderConfig& config = {});

// Goals that can never be entered fail immediately with GoalUnreachable; a
// vertical startFacing fails with InvalidFacing.
PathResult findPath(const PathRequest& request, const world::WorldView& world, const PathfinderConfig& config = {});

// Cost of executing a goal-first path from a start pose; infinity if the path is not contiguous.
double pathCost(
    const std::vector<core::Cell3i>& path,
    const core::Cell3i& start,
    core::Dir6 startFacing,
    const CostFunction& cost);

} // namespace delve::nav
