#include "nav/orientation.h"

#include <cstdlib>

#include "core/log.h"

namespace delve::nav {

const char* relativeSideName(RelativeSide side) {
    switch (side) {
    case RelativeSide::Front:
        return "front";
    case RelativeSide::Back:
        return "back";
    case RelativeSide::Left:
        return "left";
    case RelativeSide::Right:
        return "right";
    case RelativeSide::Up:
        return "up";
    case RelativeSide::Down:
        return "down";
    }
    return "front";
}

bool isOppositeDirection(core::Dir6 a, core::Dir6 b) {
    return core::areOpposite(a, b);
}

core::Dir6 turnRight(core::Dir6 facing) {
    // Clockwise from above: -z (north) -> +x (east) -> +z (south) -> -x (west).
    switch (facing) {
    case core::Dir6::NegZ: return core::Dir6::PosX;
    case core::Dir6::PosX: return core::Dir6::PosZ;
    case core::Dir6::PosZ: return core::Dir6::NegX;
    case core::Dir6::NegX: return core::Dir6::NegZ;
    default: return facing;
    }
}

core::Dir6 turnLeft(core::Dir6 facing) {
    switch (facing) {
    case core::Dir6::NegZ: return core::Dir6::NegX;
    case core::Dir6::NegX: return core::Dir6::PosZ;
    case core::Dir6::PosZ: return core::Dir6::PosX;
    case core::Dir6::PosX: return core::Dir6::NegZ;
    default: return facing;
    }
}

std::optional<core::Dir6> stepDirection(const core::Cell3i& from, const core::Cell3i& to) {
    const core::Cell3i delta = to - from;
    const int manhattan = std::abs(delta.x) + std::abs(delta.y) + std::abs(delta.z);
    if (manhattan != 1) {
        return std::nullopt;
    }
    for (const core::Dir6 dir : core::kAllDir6) {
        if (core::dirToOffset(dir) == delta) {
            return dir;
        }
    }
    return std::nullopt;
}

bool calcOrientation(
    const core::Cell3i& from,
    const core::Cell3i& to,
    core::Dir6 fromFacing,
    bool respectVertical,
    core::Dir6& outFacing
) {
    const std::optional<core::Dir6> step = stepDirection(from, to);
    if (!step.has_value()) {
        DELVE_LOGE("path") << "inputs not adjacent: " << from << " and " << to;
        return false;
    }

    if (core::isVertical(*step) && !respectVertical) {
        outFacing = fromFacing;
    } else {
        outFacing = *step;
    }
    return true;
}

RelativeSide relativeSide(core::Dir6 fromFacing, core::Dir6 toFacing) {
    if (toFacing == fromFacing) {
        return RelativeSide::Front;
    }
    if (toFacing == core::Dir6::PosY) {
        return RelativeSide::Up;
    }
    if (toFacing == core::Dir6::NegY) {
        return RelativeSide::Down;
    }
    if (isOppositeDirection(fromFacing, toFacing)) {
        return RelativeSide::Back;
    }
    if (turnRight(fromFacing) == toFacing) {
        return RelativeSide::Right;
    }
    if (turnLeft(fromFacing) == toFacing) {
        return RelativeSide::Left;
    }
    return RelativeSide::Front;
}

bool relativeOrientation(
    const core::Cell3i& from,
    const core::Cell3i& to,
    core::Dir6 fromFacing,
    RelativeSide& outSide,
    bool respectVertical
) {
    core::Dir6 toFacing = fromFacing;
    if (!calcOrientation(from, to, fromFacing, respectVertical, toFacing)) {
        return false;
    }
    outSide = relativeSide(fromFacing, toFacing);
    return true;
}

std::optional<core::Cell3i> coordsFromOffset(const core::Cell3i& base, const LocalOffset& offset, core::Dir6 facing) {
    const std::int32_t y = base.y + offset.up;
    switch (facing) {
    case core::Dir6::PosZ:
        return core::Cell3i{base.x - offset.right, y, base.z + offset.forward};
    case core::Dir6::NegZ:
        return core::Cell3i{base.x + offset.right, y, base.z - offset.forward};
    case core::Dir6::PosX:
        return core::Cell3i{base.x + offset.forward, y, base.z + offset.right};
    case core::Dir6::NegX:
        return core::Cell3i{base.x - offset.forward, y, base.z - offset.right};
    default:
        return std::nullopt;
    }
}

} // namespace delve::nav
