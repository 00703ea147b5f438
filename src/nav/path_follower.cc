#include "nav/path_follower.h"

#include <optional>

#include "core/log.h"

namespace delve::nav {

bool faceDirection(Actuator& actuator, core::Dir6 direction) {
    if (core::isVertical(direction)) {
        return true;
    }

    const RelativeSide side = relativeSide(actuator.currentFacing(), direction);
    switch (side) {
    case RelativeSide::Left:
    case RelativeSide::Right:
    case RelativeSide::Back:
        if (!actuator.turn(side)) {
            DELVE_LOGW("follow") << "turn " << relativeSideName(side) << " toward " << direction << " failed";
            return false;
        }
        return true;
    default:
        return true;
    }
}

FollowResult followPath(
    const std::vector<core::Cell3i>& path,
    Actuator& actuator,
    world::WorldView& world,
    const FollowOptions& options
) {
    FollowResult result{};
    if (core::isVertical(actuator.currentFacing())) {
        DELVE_LOGE("follow") << "agent reports vertical facing " << actuator.currentFacing();
        result.status = NavStatus::InvalidFacing;
        return result;
    }
    const std::size_t lastIndex = options.skipGoal ? 1u : 0u;

    for (std::size_t i = path.size(); i > lastIndex; --i) {
        const core::Cell3i& target = path[i - 1];
        const core::Cell3i position = actuator.currentPosition();
        const std::optional<core::Dir6> step = stepDirection(position, target);
        if (!step.has_value()) {
            DELVE_LOGE("follow") << "inputs not adjacent: agent at " << position << ", next cell " << target;
            result.status = NavStatus::InputsNotAdjacent;
            return result;
        }
        if (!faceDirection(actuator, *step)) {
            result.status = NavStatus::MoveBlocked;
            return result;
        }

        if (world.blockAt(target) != world::BlockClass::Air && !actuator.clearObstruction(*step)) {
            DELVE_LOGD("follow") << "nothing cleared at " << target;
        }
        int attempts = 1;
        while (!actuator.attemptMove(*step)) {
            if (attempts >= options.maxMoveAttempts) {
                DELVE_LOGW("follow") << "move " << position << " -> " << target << " blocked after " << attempts
                                     << " attempts";
                result.status = NavStatus::MoveBlocked;
                return result;
            }
            ++attempts;
            if (!actuator.clearObstruction(*step)) {
                DELVE_LOGT("follow") << "clear attempt " << attempts << " at " << target << " found nothing";
            }
        }

        world.markCleared(target);
        ++result.stepsTaken;
    }

    if (options.skipGoal && !path.empty()) {
        const std::optional<core::Dir6> step = stepDirection(actuator.currentPosition(), path.front());
        if (!step.has_value()) {
            DELVE_LOGE("follow") << "inputs not adjacent: agent at " << actuator.currentPosition() << ", goal "
                                 << path.front();
            result.status = NavStatus::InputsNotAdjacent;
            return result;
        }
        if (!faceDirection(actuator, *step)) {
            result.status = NavStatus::MoveBlocked;
            return result;
        }
    }

    DELVE_LOGD("follow") << "followed " << result.stepsTaken << " steps, now at " << actuator.currentPosition();
    return result;
}

} // namespace delve::nav
