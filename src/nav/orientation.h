#pragma once

#include <cstdint>
#include <optional>

#include "core/grid3.h"

// Navigation Orientation subsystem
// Responsible for: converting between facings, turn actions, and unit moves on the grid.
// Should NOT do: hold agent state, query the world, or drive actuators.
namespace delve::nav {

// Turn action (or vertical move) needed to face a neighbor, relative to the current facing.
enum class RelativeSide : std::uint8_t {
    Front = 0,
    Back = 1,
    Left = 2,
    Right = 3,
    Up = 4,
    Down = 5
};

const char* relativeSideName(RelativeSide side);

// Offset in the agent's own frame.
struct LocalOffset {
    std::int32_t forward = 0;
    std::int32_t up = 0;
    std::int32_t right = 0;
};

bool isOppositeDirection(core::Dir6 a, core::Dir6 b);

// Quarter turns seen from above; vertical facings are returned unchanged.
core::Dir6 turnRight(core::Dir6 facing);
core::Dir6 turnLeft(core::Dir6 facing);

// Axis direction of a unit step, or nullopt when the cells are not face-adjacent.
std::optional<core::Dir6> stepDirection(const core::Cell3i& from, const core::Cell3i& to);

// Facing after moving from `from` to the adjacent `to`. Vertical moves keep
// `fromFacing` unless `respectVertical` is set. Returns false and logs both
// cells when they are not adjacent.
bool calcOrientation(
    const core::Cell3i& from,
    const core::Cell3i& to,
    core::Dir6 fromFacing,
    bool respectVertical,
    core::Dir6& outFacing);

RelativeSide relativeSide(core::Dir6 fromFacing, core::Dir6 toFacing);

bool relativeOrientation(
    const core::Cell3i& from,
    const core::Cell3i& to,
    core::Dir6 fromFacing,
    RelativeSide& outSide,
    bool respectVertical = true);

std::optional<core::Cell3i> coordsFromOffset(const core::Cell3i& base, const LocalOffset& offset, core::Dir6 facing);

} // namespace delve::nav
