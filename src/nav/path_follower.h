#pragma once

#include <cstddef>
#include <vector>

#include "core/grid3.h"
#include "nav/nav_status.h"
#include "nav/orientation.h"
#include "world/block_class.h"

// Navigation PathFollower subsystem
// Responsible for: executing a planned path through an agent's actuator and recording what it cleared.
// Should NOT do: plan paths, talk to hardware directly, or retry forever.
namespace delve::nav {

// Boundary to the agent's body; implemented outside this library.
class Actuator {
public:
    virtual ~Actuator() = default;

    // Moves one cell: forward when `direction` is the current facing, otherwise up or down.
    virtual bool attemptMove(core::Dir6 direction) = 0;
    virtual bool clearObstruction(core::Dir6 direction) = 0;
    // Accepts Left, Right and Back.
    virtual bool turn(RelativeSide side) = 0;
    virtual core::Cell3i currentPosition() const = 0;
    virtual core::Dir6 currentFacing() const = 0;
};

struct FollowOptions {
    // Stop next to the goal, facing it, instead of entering it.
    bool skipGoal = false;
    int maxMoveAttempts = 8;
};

struct FollowResult {
    NavStatus status = NavStatus::Ok;
    std::size_t stepsTaken = 0;
};

// Turns toward a horizontal direction with the fewest turns. Vertical directions need no turn.
bool faceDirection(Actuator& actuator, core::Dir6 direction);

// Follows a goal-first path as returned by findPath.
// The agent must face a horizontal direction, otherwise nothing moves and the status is InvalidFacing.
FollowResult followPath(
    const std::vector<core::Cell3i>& path,
    Actuator& actuator,
    world::WorldView& world,
    const FollowOptions& options = {});

} // namespace delve::nav
