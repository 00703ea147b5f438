#pragma once

#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <vector>

#include "core/cancel.h"
#include "core/grid3.h"
#include "nav/nav_status.h"
#include "nav/pathfinder.h"
#include "world/chunk_store.h"

// Navigation Tour subsystem
// Responsible for: ordering a set of target cells into a short open or closed tour.
// Should NOT do: plan the individual legs or move the agent.
namespace delve::nav {

// Symmetric travel cost between two cells.
using DistanceFunction = std::function<double(const core::Cell3i& a, const core::Cell3i& b)>;

struct Tour {
    std::vector<core::Cell3i> nodes;
    double totalCost = 0.0;
    // Closed tours include the edge from the last node back to the first.
    bool closed = true;
    NavStatus status = NavStatus::Ok;
};

struct NearestNode {
    core::Cell3i cell{};
    double distance = std::numeric_limits<double>::infinity();
};

double tourCost(const std::vector<core::Cell3i>& nodes, bool closed, const DistanceFunction& distance);

// Nearest-neighbor construction. The tour is open (start first, end last, both
// added when missing) only when both anchors are given; otherwise it is closed
// and begins at `startNode` or the first input node. Duplicate nodes are collapsed.
Tour tourGreedy(
    const std::vector<core::Cell3i>& nodes,
    std::optional<core::Cell3i> startNode = std::nullopt,
    std::optional<core::Cell3i> endNode = std::nullopt,
    const DistanceFunction& distance = heuristicEuclidean);

// First-improvement 2-opt; restarts the scan after every applied reversal.
// Endpoints of open tours and the first node of closed tours stay in place.
Tour tourTwoOpt(
    Tour tour,
    const DistanceFunction& distance = heuristicEuclidean,
    const core::CancelToken* cancel = nullptr);

Tour shortestTour(
    const std::vector<core::Cell3i>& nodes,
    std::optional<core::Cell3i> startNode = std::nullopt,
    std::optional<core::Cell3i> endNode = std::nullopt,
    const DistanceFunction& distance = heuristicEuclidean,
    const core::CancelToken* cancel = nullptr);

std::optional<NearestNode> nearestNode(
    const std::vector<core::Cell3i>& nodes,
    const core::Cell3i& from,
    const HeuristicFunction& heuristic = heuristicManhattan);

template <typename T>
std::optional<NearestNode> nearestStoredCell(
    const world::ChunkStore<T>& store,
    const core::Cell3i& from,
    const HeuristicFunction& heuristic = heuristicManhattan
) {
    std::optional<NearestNode> best;
    store.forEach([&](const core::Cell3i& cell, const T&) {
        const double distance = heuristic(from, cell);
        if (!best.has_value() || distance < best->distance) {
            best = NearestNode{cell, distance};
        }
    });
    return best;
}

// Expansion limit for each pair search when the config leaves it unlimited.
inline constexpr std::size_t kDefaultPairExpansions = 200000;

// A* travel cost between cells, memoized per unordered pair so the result is symmetric.
// Unreachable, limited or cancelled pairs cost infinity. `cancel` must outlive the function.
DistanceFunction makePathDistance(
    const world::WorldView& world,
    const PathfinderConfig& config = {},
    CostWeights weights = {},
    core::Dir6 facing = core::Dir6::NegZ,
    const core::CancelToken* cancel = nullptr);

} // namespace delve::nav
