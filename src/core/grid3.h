#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>

// Core Grid subsystem
// Responsible for: defining deterministic integer-grid primitives shared by world and navigation code.
// Should NOT do: world state ownership, path search, or file serialization.
namespace delve::core {

struct Cell3i {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t z = 0;

    constexpr Cell3i() = default;
    constexpr Cell3i(std::int32_t xIn, std::int32_t yIn, std::int32_t zIn) : x(xIn), y(yIn), z(zIn) {}

    constexpr bool operator==(const Cell3i&) const = default;

    constexpr Cell3i operator+(const Cell3i& rhs) const {
        return Cell3i{x + rhs.x, y + rhs.y, z + rhs.z};
    }

    constexpr Cell3i operator-(const Cell3i& rhs) const {
        return Cell3i{x - rhs.x, y - rhs.y, z - rhs.z};
    }

    constexpr Cell3i operator*(std::int32_t scalar) const {
        return Cell3i{x * scalar, y * scalar, z * scalar};
    }

    constexpr Cell3i& operator+=(const Cell3i& rhs) {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    constexpr Cell3i& operator-=(const Cell3i& rhs) {
        x -= rhs.x;
        y -= rhs.y;
        z -= rhs.z;
        return *this;
    }
};

inline constexpr Cell3i operator*(std::int32_t scalar, const Cell3i& cell) {
    return cell * scalar;
}

inline std::ostream& operator<<(std::ostream& out, const Cell3i& cell) {
    return out << "(" << cell.x << ", " << cell.y << ", " << cell.z << ")";
}

struct Cell3iHash {
    std::size_t operator()(const Cell3i& cell) const noexcept {
        const std::uint64_t hx = static_cast<std::uint64_t>(static_cast<std::uint32_t>(cell.x)) * 73856093u;
        const std::uint64_t hy = static_cast<std::uint64_t>(static_cast<std::uint32_t>(cell.y)) * 19349663u;
        const std::uint64_t hz = static_cast<std::uint64_t>(static_cast<std::uint32_t>(cell.z)) * 83492791u;
        return static_cast<std::size_t>(hx ^ hy ^ hz);
    }
};

// Division rounding toward negative infinity; divisor must be positive.
inline constexpr std::int32_t floorDiv(std::int32_t value, std::int32_t divisor) {
    const std::int32_t q = value / divisor;
    return (value % divisor != 0 && value < 0) ? q - 1 : q;
}

inline constexpr std::int32_t floorMod(std::int32_t value, std::int32_t divisor) {
    const std::int32_t m = value % divisor;
    return (m < 0) ? (m + divisor) : m;
}

enum class Dir6 : std::uint8_t {
    PosX = 0,
    NegX = 1,
    PosY = 2,
    NegY = 3,
    PosZ = 4,
    NegZ = 5
};

inline constexpr std::array<Dir6, 6> kAllDir6 = {
    Dir6::PosX,
    Dir6::NegX,
    Dir6::PosY,
    Dir6::NegY,
    Dir6::PosZ,
    Dir6::NegZ
};

inline constexpr std::uint8_t dirIndex(Dir6 dir) {
    return static_cast<std::uint8_t>(dir);
}

inline constexpr std::uint8_t dirBit(Dir6 dir) {
    return static_cast<std::uint8_t>(1u << dirIndex(dir));
}

inline constexpr Cell3i dirToOffset(Dir6 dir) {
    switch (dir) {
    case Dir6::PosX: return Cell3i{1, 0, 0};
    case Dir6::NegX: return Cell3i{-1, 0, 0};
    case Dir6::PosY: return Cell3i{0, 1, 0};
    case Dir6::NegY: return Cell3i{0, -1, 0};
    case Dir6::PosZ: return Cell3i{0, 0, 1};
    case Dir6::NegZ: return Cell3i{0, 0, -1};
    }
    return Cell3i{0, 0, 0};
}

inline constexpr Dir6 oppositeDir(Dir6 dir) {
    switch (dir) {
    case Dir6::PosX: return Dir6::NegX;
    case Dir6::NegX: return Dir6::PosX;
    case Dir6::PosY: return Dir6::NegY;
    case Dir6::NegY: return Dir6::PosY;
    case Dir6::PosZ: return Dir6::NegZ;
    case Dir6::NegZ: return Dir6::PosZ;
    }
    return Dir6::PosY;
}

inline constexpr bool areOpposite(Dir6 a, Dir6 b) {
    return oppositeDir(a) == b;
}

inline constexpr bool isVertical(Dir6 dir) {
    return dir == Dir6::PosY || dir == Dir6::NegY;
}

inline constexpr Cell3i neighborCell(const Cell3i& cell, Dir6 dir) {
    return cell + dirToOffset(dir);
}

inline constexpr const char* dirName(Dir6 dir) {
    switch (dir) {
    case Dir6::PosX: return "+x";
    case Dir6::NegX: return "-x";
    case Dir6::PosY: return "+y";
    case Dir6::NegY: return "-y";
    case Dir6::PosZ: return "+z";
    case Dir6::NegZ: return "-z";
    }
    return "?";
}

inline std::ostream& operator<<(std::ostream& out, Dir6 dir) {
    return out << dirName(dir);
}

} // namespace delve::core
