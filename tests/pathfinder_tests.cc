#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <vector>

#include "core/cancel.h"
#include "core/grid3.h"
#include "core/rng.h"
#include "nav/pathfinder.h"
#include "test_world.h"

namespace {

delve::nav::PathRequest makeRequest(
    const delve::core::Cell3i& start,
    const delve::core::Cell3i& goal,
    delve::core::Dir6 facing = delve::core::Dir6::NegZ
) {
    delve::nav::PathRequest request{};
    request.start = start;
    request.goal = goal;
    request.startFacing = facing;
    return request;
}

bool isContiguous(const std::vector<delve::core::Cell3i>& path, const delve::core::Cell3i& start) {
    delve::core::Cell3i previous = start;
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        const delve::core::Cell3i delta = *it - previous;
        if (std::abs(delta.x) + std::abs(delta.y) + std::abs(delta.z) != 1) {
            return false;
        }
        previous = *it;
    }
    return true;
}

} // namespace

TEST(Pathfinder, StraightPathIsGoalFirstAndExcludesStart) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    const PathResult result = findPath(makeRequest(Cell3i{0, 10, 0}, Cell3i{0, 10, -3}), world);

    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result.totalCost, 3.0);
    EXPECT_EQ(result.path, (std::vector<Cell3i>{Cell3i{0, 10, -3}, Cell3i{0, 10, -2}, Cell3i{0, 10, -1}}));
}

TEST(Pathfinder, StartEqualToGoalNeedsNoSteps) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    const PathResult result = findPath(makeRequest(Cell3i{4, 20, 4}, Cell3i{4, 20, 4}), world);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.path.empty());
    EXPECT_DOUBLE_EQ(result.totalCost, 0.0);
}

TEST(Pathfinder, TurningCostsDependOnStartFacing) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    const Cell3i start{0, 10, 0};

    const PathResult behind = findPath(makeRequest(start, Cell3i{0, 10, 3}, Dir6::NegZ), world);
    ASSERT_TRUE(behind.ok());
    EXPECT_DOUBLE_EQ(behind.totalCost, 5.0);

    const PathResult ahead = findPath(makeRequest(start, Cell3i{0, 10, 3}, Dir6::PosZ), world);
    ASSERT_TRUE(ahead.ok());
    EXPECT_DOUBLE_EQ(ahead.totalCost, 3.0);

    const PathResult diagonal = findPath(makeRequest(start, Cell3i{2, 10, -2}, Dir6::NegZ), world);
    ASSERT_TRUE(diagonal.ok());
    EXPECT_DOUBLE_EQ(diagonal.totalCost, 5.0);

    // Vertical moves keep the facing and cost one move each.
    const PathResult climb = findPath(makeRequest(start, Cell3i{0, 14, 0}, Dir6::PosX), world);
    ASSERT_TRUE(climb.ok());
    EXPECT_DOUBLE_EQ(climb.totalCost, 4.0);
}

TEST(Pathfinder, ObstructionsAddClearingCost) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    const Cell3i start{0, 10, 0};
    const Cell3i wall{0, 10, -1};
    world.setBlock(wall, delve::world::BlockClass::Solid);

    const PathResult through = findPath(makeRequest(start, Cell3i{0, 10, -2}), world);
    ASSERT_TRUE(through.ok());
    EXPECT_DOUBLE_EQ(through.totalCost, 2.0 + CostWeights{}.obstruction);
    EXPECT_NE(std::find(through.path.begin(), through.path.end(), wall), through.path.end());

    CostWeights expensive{};
    expensive.obstruction = 10.0;
    PathRequest request = makeRequest(start, Cell3i{0, 10, -2});
    request.cost = makeTimeCost(world, expensive);
    const PathResult around = findPath(request, world);
    ASSERT_TRUE(around.ok());
    EXPECT_DOUBLE_EQ(around.totalCost, 4.0);
    EXPECT_EQ(std::find(around.path.begin(), around.path.end(), wall), around.path.end());
    EXPECT_TRUE(isContiguous(around.path, start));
}

TEST(Pathfinder, NeighboursRespectHeightBandAndFloor) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    world.setBlock(Cell3i{1, 2, 0}, delve::world::BlockClass::Floor);
    world.setBlock(Cell3i{0, 7, 1}, delve::world::BlockClass::Floor);

    EXPECT_EQ(neighbours(Cell3i{0, 1, 0}, world).size(), 5u);
    EXPECT_EQ(neighbours(Cell3i{0, 255, 0}, world).size(), 5u);
    EXPECT_EQ(neighbours(Cell3i{0, 2, 0}, world).size(), 5u);
    // Floor above the check band is treated as ordinary terrain.
    EXPECT_EQ(neighbours(Cell3i{0, 7, 0}, world).size(), 6u);
}

TEST(Pathfinder, FloorCellsAreRoutedAround) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    world.setBlock(Cell3i{0, 2, -1}, delve::world::BlockClass::Floor);

    const PathResult result = findPath(makeRequest(Cell3i{0, 2, 0}, Cell3i{0, 2, -2}), world);
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result.totalCost, 4.0);
    EXPECT_EQ(std::find(result.path.begin(), result.path.end(), Cell3i{0, 2, -1}), result.path.end());
}

TEST(Pathfinder, EnclosedStartReportsGoalUnreachable) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    const Cell3i start{0, 2, 0};
    for (const Dir6 dir : kAllDir6) {
        world.setBlock(neighborCell(start, dir), delve::world::BlockClass::Floor);
    }

    const PathResult result = findPath(makeRequest(start, Cell3i{5, 10, 5}), world);
    EXPECT_EQ(result.status, NavStatus::GoalUnreachable);
    EXPECT_TRUE(result.path.empty());
    EXPECT_EQ(result.expandedNodes, 1u);
}

TEST(Pathfinder, UnenterableGoalFailsWithoutExpanding) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    world.setBlock(Cell3i{3, 2, 0}, delve::world::BlockClass::Floor);
    EXPECT_FALSE(isEnterable(Cell3i{3, 0, 0}, world));
    EXPECT_FALSE(isEnterable(Cell3i{3, 2, 0}, world));
    EXPECT_TRUE(isEnterable(Cell3i{3, 3, 0}, world));

    for (const Cell3i& goal : {Cell3i{3, 0, 0}, Cell3i{3, 2, 0}, Cell3i{0, 256, 0}}) {
        const PathResult result = findPath(makeRequest(Cell3i{0, 10, 0}, goal), world);
        EXPECT_EQ(result.status, NavStatus::GoalUnreachable) << "goal " << goal;
        EXPECT_EQ(result.expandedNodes, 0u) << "goal " << goal;
        EXPECT_TRUE(result.path.empty());
    }
}

TEST(Pathfinder, VerticalStartFacingIsRejected) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    for (const Dir6 facing : {Dir6::PosY, Dir6::NegY}) {
        const PathResult result = findPath(makeRequest(Cell3i{0, 10, 0}, Cell3i{2, 10, 0}, facing), world);
        EXPECT_EQ(result.status, NavStatus::InvalidFacing);
        EXPECT_EQ(result.expandedNodes, 0u);
    }
}

TEST(Pathfinder, ExpansionLimitStopsUnboundedSearch) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    PathfinderConfig config{};
    config.maxExpansions = 50;

    const PathResult result = findPath(makeRequest(Cell3i{0, 10, 0}, Cell3i{1000, 10, 0}), world, config);
    EXPECT_EQ(result.status, NavStatus::SearchLimitReached);
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.path.empty());
}

TEST(Pathfinder, CancelledTokenStopsSearch) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    CancelToken token;
    token.cancel();
    PathRequest request = makeRequest(Cell3i{0, 10, 0}, Cell3i{30, 10, 30});
    request.cancel = &token;
    EXPECT_EQ(findPath(request, world).status, NavStatus::Cancelled);

    CancelToken expired(std::chrono::steady_clock::duration::zero());
    request.cancel = &expired;
    EXPECT_EQ(findPath(request, world).status, NavStatus::Cancelled);
}

TEST(Pathfinder, HeuristicSearchMatchesDijkstraCost) {
    using namespace delve::core;
    using namespace delve::nav;

    Pcg32 rng(1234u);
    delve::test::GridWorld world;
    const Cell3i start{0, 3, 0};
    for (std::int32_t x = -6; x <= 6; ++x) {
        for (std::int32_t z = -6; z <= 6; ++z) {
            for (std::int32_t y = 2; y <= 6; ++y) {
                const Cell3i cell{x, y, z};
                if (cell == start) {
                    continue;
                }
                if (rng.chance(1u, 4u)) {
                    world.setBlock(cell, y < 5 ? delve::world::BlockClass::Floor : delve::world::BlockClass::Solid);
                }
            }
        }
    }

    PathfinderConfig config{};
    config.maxExpansions = 400000;
    const std::vector<Cell3i> goals = {
        Cell3i{3, 3, 2}, Cell3i{-4, 3, 1}, Cell3i{0, 4, -5}, Cell3i{5, 6, 5}, Cell3i{-2, 2, -3}};
    for (const Cell3i& goal : goals) {
        world.setBlock(goal, delve::world::BlockClass::Air);
        for (const Dir6 facing : {Dir6::NegZ, Dir6::PosX}) {
            PathRequest reference = makeRequest(start, goal, facing);
            reference.heuristic = heuristicZero;
            const PathResult dijkstra = findPath(reference, world, config);

            for (const HeuristicFunction& heuristic :
                 {HeuristicFunction{heuristicManhattan}, HeuristicFunction{heuristicEuclidean}}) {
                PathRequest request = makeRequest(start, goal, facing);
                request.heuristic = heuristic;
                const PathResult result = findPath(request, world, config);
                ASSERT_EQ(result.status, dijkstra.status) << "goal " << goal;
                if (!result.ok()) {
                    continue;
                }
                EXPECT_NEAR(result.totalCost, dijkstra.totalCost, 1e-9) << "goal " << goal << " facing " << facing;
                EXPECT_TRUE(isContiguous(result.path, start));
                EXPECT_NEAR(pathCost(result.path, start, facing, makeTimeCost(world)), result.totalCost, 1e-9);
            }
        }
    }
}

TEST(Pathfinder, PathCostRejectsGaps) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    const std::vector<Cell3i> gapped = {Cell3i{0, 10, -3}, Cell3i{0, 10, -1}};
    EXPECT_FALSE(std::isfinite(pathCost(gapped, Cell3i{0, 10, 0}, Dir6::NegZ, makeTimeCost(world))));
}
