#include <gtest/gtest.h>

#include <unordered_map>
#include <vector>

#include "core/grid3.h"
#include "nav/orientation.h"
#include "nav/path_follower.h"
#include "nav/pathfinder.h"
#include "test_world.h"

namespace {

// Agent double; a cell can be made to refuse entry until it has been cleared N times.
class FakeActuator final : public delve::nav::Actuator {
public:
    FakeActuator(const delve::core::Cell3i& position, delve::core::Dir6 facing)
        : m_position(position), m_facing(facing) {}

    void requireClears(const delve::core::Cell3i& cell, int clears) {
        m_pendingClears[cell] = clears;
    }

    bool attemptMove(delve::core::Dir6 direction) override {
        if (!delve::core::isVertical(direction) && direction != m_facing) {
            ++m_wrongFacingMoves;
            return false;
        }
        const delve::core::Cell3i target = delve::core::neighborCell(m_position, direction);
        const auto it = m_pendingClears.find(target);
        if (it != m_pendingClears.end() && it->second > 0) {
            return false;
        }
        m_position = target;
        m_visited.push_back(target);
        return true;
    }

    bool clearObstruction(delve::core::Dir6 direction) override {
        ++m_clearCalls;
        const auto it = m_pendingClears.find(delve::core::neighborCell(m_position, direction));
        if (it == m_pendingClears.end() || it->second == 0) {
            return false;
        }
        --it->second;
        return true;
    }

    bool turn(delve::nav::RelativeSide side) override {
        ++m_turns;
        switch (side) {
        case delve::nav::RelativeSide::Left:
            m_facing = delve::nav::turnLeft(m_facing);
            return true;
        case delve::nav::RelativeSide::Right:
            m_facing = delve::nav::turnRight(m_facing);
            return true;
        case delve::nav::RelativeSide::Back:
            m_facing = delve::core::oppositeDir(m_facing);
            return true;
        default:
            return false;
        }
    }

    delve::core::Cell3i currentPosition() const override { return m_position; }
    delve::core::Dir6 currentFacing() const override { return m_facing; }

    int turns() const { return m_turns; }
    int clearCalls() const { return m_clearCalls; }
    int wrongFacingMoves() const { return m_wrongFacingMoves; }
    const std::vector<delve::core::Cell3i>& visited() const { return m_visited; }

private:
    delve::core::Cell3i m_position{};
    delve::core::Dir6 m_facing = delve::core::Dir6::NegZ;
    std::unordered_map<delve::core::Cell3i, int, delve::core::Cell3iHash> m_pendingClears;
    std::vector<delve::core::Cell3i> m_visited;
    int m_turns = 0;
    int m_clearCalls = 0;
    int m_wrongFacingMoves = 0;
};

} // namespace

TEST(PathFollower, FollowsPlannedPathAndMarksCellsCleared) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    const Cell3i start{0, 10, 0};
    PathRequest request{};
    request.start = start;
    request.goal = Cell3i{2, 11, -3};
    const PathResult planned = findPath(request, world);
    ASSERT_TRUE(planned.ok());

    FakeActuator actuator(start, Dir6::NegZ);
    const FollowResult result = followPath(planned.path, actuator, world);
    EXPECT_EQ(result.status, NavStatus::Ok);
    EXPECT_EQ(result.stepsTaken, planned.path.size());
    EXPECT_EQ(actuator.currentPosition(), request.goal);
    EXPECT_EQ(world.clearedCount(), planned.path.size());
    EXPECT_EQ(actuator.clearCalls(), 0);
    EXPECT_EQ(actuator.wrongFacingMoves(), 0);
    EXPECT_EQ(actuator.visited(), std::vector<Cell3i>(planned.path.rbegin(), planned.path.rend()));
}

TEST(PathFollower, TurnsBeforeHorizontalStepsOnly) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    FakeActuator actuator(Cell3i{0, 10, 0}, Dir6::NegZ);
    const std::vector<Cell3i> path = {Cell3i{1, 11, -1}, Cell3i{1, 10, -1}, Cell3i{1, 10, 0}};

    const FollowResult result = followPath(path, actuator, world);
    EXPECT_EQ(result.status, NavStatus::Ok);
    EXPECT_EQ(actuator.turns(), 2);
    EXPECT_EQ(actuator.currentFacing(), Dir6::NegZ);
    EXPECT_EQ(actuator.currentPosition(), (Cell3i{1, 11, -1}));
}

TEST(PathFollower, ClearsKnownObstructionBeforeMoving) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    const Cell3i target{0, 10, -1};
    world.setBlock(target, delve::world::BlockClass::Solid);
    FakeActuator actuator(Cell3i{0, 10, 0}, Dir6::NegZ);
    actuator.requireClears(target, 1);

    const FollowResult result = followPath({target}, actuator, world);
    EXPECT_EQ(result.status, NavStatus::Ok);
    EXPECT_EQ(actuator.clearCalls(), 1);
    EXPECT_EQ(actuator.currentPosition(), target);
    EXPECT_EQ(world.blockAt(target), delve::world::BlockClass::Air);
}

TEST(PathFollower, RetriesWhenUnexpectedBlocksRefill) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    const Cell3i target{0, 10, -1};
    FakeActuator actuator(Cell3i{0, 10, 0}, Dir6::NegZ);
    actuator.requireClears(target, 2);

    const FollowResult result = followPath({target}, actuator, world);
    EXPECT_EQ(result.status, NavStatus::Ok);
    EXPECT_EQ(result.stepsTaken, 1u);
    EXPECT_EQ(actuator.clearCalls(), 2);
}

TEST(PathFollower, GivesUpAfterMaxMoveAttempts) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    const Cell3i start{0, 10, 0};
    FakeActuator actuator(start, Dir6::NegZ);
    actuator.requireClears(Cell3i{0, 10, -1}, 100);

    FollowOptions options{};
    options.maxMoveAttempts = 3;
    const FollowResult result = followPath({Cell3i{0, 10, -2}, Cell3i{0, 10, -1}}, actuator, world, options);
    EXPECT_EQ(result.status, NavStatus::MoveBlocked);
    EXPECT_EQ(result.stepsTaken, 0u);
    EXPECT_EQ(actuator.currentPosition(), start);
    EXPECT_EQ(actuator.clearCalls(), 2);
    EXPECT_EQ(world.clearedCount(), 0u);
}

TEST(PathFollower, SkipGoalStopsAdjacentFacingTheGoal) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    FakeActuator actuator(Cell3i{0, 10, 0}, Dir6::NegZ);
    FollowOptions options{};
    options.skipGoal = true;

    const FollowResult result = followPath({Cell3i{1, 10, -1}, Cell3i{0, 10, -1}}, actuator, world, options);
    EXPECT_EQ(result.status, NavStatus::Ok);
    EXPECT_EQ(result.stepsTaken, 1u);
    EXPECT_EQ(actuator.currentPosition(), (Cell3i{0, 10, -1}));
    EXPECT_EQ(actuator.currentFacing(), Dir6::PosX);
}

TEST(PathFollower, RejectsPathsWithGaps) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    FakeActuator actuator(Cell3i{0, 10, 0}, Dir6::NegZ);
    const FollowResult result = followPath({Cell3i{0, 10, -3}}, actuator, world);
    EXPECT_EQ(result.status, NavStatus::InputsNotAdjacent);
    EXPECT_EQ(result.stepsTaken, 0u);
    EXPECT_EQ(actuator.currentPosition(), (Cell3i{0, 10, 0}));
}

TEST(PathFollower, VerticalAgentFacingIsRejectedBeforeMoving) {
    using namespace delve::core;
    using namespace delve::nav;

    delve::test::GridWorld world;
    FakeActuator actuator(Cell3i{0, 10, 0}, Dir6::PosY);
    const FollowResult result = followPath({Cell3i{1, 10, 0}}, actuator, world);
    EXPECT_EQ(result.status, NavStatus::InvalidFacing);
    EXPECT_EQ(result.stepsTaken, 0u);
    EXPECT_EQ(actuator.turns(), 0);
    EXPECT_EQ(actuator.currentPosition(), (Cell3i{0, 10, 0}));
    EXPECT_EQ(world.clearedCount(), 0u);
}
