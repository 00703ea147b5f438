#include "nav/tour.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <unordered_map>
#include <utility>

#include "core/log.h"

namespace delve::nav {

namespace {

constexpr double kImprovementEpsilon = 1e-9;

bool containsCell(const std::vector<core::Cell3i>& cells, const core::Cell3i& cell) {
    return std::find(cells.begin(), cells.end(), cell) != cells.end();
}

std::vector<core::Cell3i> uniqueCells(const std::vector<core::Cell3i>& cells) {
    std::vector<core::Cell3i> unique;
    unique.reserve(cells.size());
    for (const core::Cell3i& cell : cells) {
        if (!containsCell(unique, cell)) {
            unique.push_back(cell);
        }
    }
    return unique;
}

struct CellPairHash {
    std::size_t operator()(const std::pair<core::Cell3i, core::Cell3i>& cells) const noexcept {
        const std::size_t first = core::Cell3iHash{}(cells.first);
        return first ^ (core::Cell3iHash{}(cells.second) + 0x9e3779b97f4a7c15ull + (first << 6u) + (first >> 2u));
    }
};

bool cellLess(const core::Cell3i& a, const core::Cell3i& b) {
    if (a.x != b.x) {
        return a.x < b.x;
    }
    if (a.y != b.y) {
        return a.y < b.y;
    }
    return a.z < b.z;
}

} // namespace

double tourCost(const std::vector<core::Cell3i>& nodes, bool closed, const DistanceFunction& distance) {
    double total = 0.0;
    for (std::size_t i = 1; i < nodes.size(); ++i) {
        total += distance(nodes[i - 1], nodes[i]);
    }
    if (closed && nodes.size() > 1) {
        total += distance(nodes.back(), nodes.front());
    }
    return total;
}

Tour tourGreedy(
    const std::vector<core::Cell3i>& nodes,
    std::optional<core::Cell3i> startNode,
    std::optional<core::Cell3i> endNode,
    const DistanceFunction& distance
) {
    Tour tour{};
    tour.closed = !(startNode.has_value() && endNode.has_value());

    std::vector<core::Cell3i> pool = uniqueCells(nodes);
    if (startNode.has_value() && !containsCell(pool, *startNode)) {
        pool.push_back(*startNode);
    }
    if (pool.empty()) {
        return tour;
    }

    core::Cell3i current = startNode.value_or(pool.front());
    pool.erase(std::find(pool.begin(), pool.end(), current));
    if (!tour.closed) {
        // The end anchor is appended last instead of competing for nearest.
        const auto endIt = std::find(pool.begin(), pool.end(), *endNode);
        if (endIt != pool.end()) {
            pool.erase(endIt);
        }
    }

    tour.nodes.reserve(pool.size() + 2);
    tour.nodes.push_back(current);
    while (!pool.empty()) {
        std::size_t bestIndex = 0;
        double bestDistance = distance(current, pool[0]);
        for (std::size_t i = 1; i < pool.size(); ++i) {
            const double candidate = distance(current, pool[i]);
            if (candidate < bestDistance) {
                bestDistance = candidate;
                bestIndex = i;
            }
        }
        current = pool[bestIndex];
        pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(bestIndex));
        tour.nodes.push_back(current);
    }
    if (!tour.closed) {
        tour.nodes.push_back(*endNode);
    }

    tour.totalCost = tourCost(tour.nodes, tour.closed, distance);
    DELVE_LOGD("tour") << "greedy " << (tour.closed ? "closed" : "open") << " tour over " << tour.nodes.size()
                       << " nodes, cost=" << tour.totalCost;
    return tour;
}

Tour tourTwoOpt(Tour tour, const DistanceFunction& distance, const core::CancelToken* cancel) {
    std::vector<core::Cell3i>& nodes = tour.nodes;
    const std::size_t count = nodes.size();
    tour.status = NavStatus::Ok;
    if (count < 4) {
        tour.totalCost = tourCost(nodes, tour.closed, distance);
        return tour;
    }

    // Positions [firstMovable, lastMovable] may be reversed.
    const std::size_t firstMovable = 1;
    const std::size_t lastMovable = tour.closed ? count - 1 : count - 2;

    std::size_t passes = 0;
    std::size_t reversals = 0;
    bool improved = true;
    while (improved) {
        improved = false;
        if (core::isCancelled(cancel)) {
            tour.status = NavStatus::Cancelled;
            DELVE_LOGI("tour") << "2-opt cancelled after " << passes << " passes";
            break;
        }
        ++passes;

        for (std::size_t i = firstMovable; i < lastMovable && !improved; ++i) {
            for (std::size_t k = i + 1; k <= lastMovable; ++k) {
                const core::Cell3i& before = nodes[i - 1];
                const core::Cell3i& first = nodes[i];
                const core::Cell3i& last = nodes[k];
                const core::Cell3i& after = (k + 1 < count) ? nodes[k + 1] : nodes[0];

                const double delta = distance(before, last) + distance(first, after) -
                                     distance(before, first) - distance(last, after);
                if (delta < -kImprovementEpsilon) {
                    std::reverse(nodes.begin() + static_cast<std::ptrdiff_t>(i),
                                 nodes.begin() + static_cast<std::ptrdiff_t>(k) + 1);
                    ++reversals;
                    improved = true;
                    break;
                }
            }
        }
    }

    tour.totalCost = tourCost(nodes, tour.closed, distance);
    DELVE_LOGD("tour") << "2-opt finished: passes=" << passes << ", reversals=" << reversals
                       << ", cost=" << tour.totalCost;
    return tour;
}

Tour shortestTour(
    const std::vector<core::Cell3i>& nodes,
    std::optional<core::Cell3i> startNode,
    std::optional<core::Cell3i> endNode,
    const DistanceFunction& distance,
    const core::CancelToken* cancel
) {
    return tourTwoOpt(tourGreedy(nodes, startNode, endNode, distance), distance, cancel);
}

std::optional<NearestNode> nearestNode(
    const std::vector<core::Cell3i>& nodes,
    const core::Cell3i& from,
    const HeuristicFunction& heuristic
) {
    std::optional<NearestNode> best;
    for (const core::Cell3i& node : nodes) {
        const double distance = heuristic(from, node);
        if (!best.has_value() || distance < best->distance) {
            best = NearestNode{node, distance};
        }
    }
    return best;
}

DistanceFunction makePathDistance(
    const world::WorldView& world,
    const PathfinderConfig& config,
    CostWeights weights,
    core::Dir6 facing,
    const core::CancelToken* cancel
) {
    PathfinderConfig pairConfig = config;
    if (pairConfig.maxExpansions == 0) {
        pairConfig.maxExpansions = kDefaultPairExpansions;
    }
    using Cache = std::unordered_map<std::pair<core::Cell3i, core::Cell3i>, double, CellPairHash>;
    auto cache = std::make_shared<Cache>();
    return [&world, pairConfig, weights, facing, cancel, cache](const core::Cell3i& a, const core::Cell3i& b) -> double {
        const bool ordered = !cellLess(b, a);
        const std::pair<core::Cell3i, core::Cell3i> key = ordered ? std::make_pair(a, b) : std::make_pair(b, a);
        const auto it = cache->find(key);
        if (it != cache->end()) {
            return it->second;
        }

        PathRequest request{};
        request.start = key.first;
        request.goal = key.second;
        request.startFacing = facing;
        request.cost = makeTimeCost(world, weights);
        request.cancel = cancel;
        const PathResult result = findPath(request, world, pairConfig);
        const double cost = result.ok() ? result.totalCost : std::numeric_limits<double>::infinity();
        // A cancelled search says nothing about the pair, so it is not remembered.
        if (result.status != NavStatus::Cancelled) {
            cache->emplace(key, cost);
        }
        return cost;
    };
}

} // namespace delve::nav
