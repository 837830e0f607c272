#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

// Core Grid subsystem
// Responsible for: deterministic integer-grid primitives shared by geometry, indexing and meshing.
// Should NOT do: voxel storage, collision response, or mesh assembly.
namespace subvox::core {

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
};

// Ordering used wherever a deterministic iteration order over cells is required.
struct Cell3iLess {
    constexpr bool operator()(const Cell3i& lhs, const Cell3i& rhs) const {
        if (lhs.y != rhs.y) {
            return lhs.y < rhs.y;
        }
        if (lhs.z != rhs.z) {
            return lhs.z < rhs.z;
        }
        return lhs.x < rhs.x;
    }
};

struct Cell3iHash {
    std::size_t operator()(const Cell3i& cell) const {
        const std::uint32_t hx = static_cast<std::uint32_t>(cell.x) * 73856093u;
        const std::uint32_t hy = static_cast<std::uint32_t>(cell.y) * 19349663u;
        const std::uint32_t hz = static_cast<std::uint32_t>(cell.z) * 83492791u;
        return static_cast<std::size_t>(hx ^ hy ^ hz);
    }
};

// Division rounding toward negative infinity; divisor must be positive.
inline constexpr std::int32_t floorDiv(std::int32_t value, std::int32_t divisor) {
    const std::int32_t quotient = value / divisor;
    return (value % divisor != 0 && value < 0) ? quotient - 1 : quotient;
}

inline constexpr std::int32_t floorMod(std::int32_t value, std::int32_t divisor) {
    return value - (floorDiv(value, divisor) * divisor);
}

inline constexpr Cell3i floorDiv(const Cell3i& cell, std::int32_t divisor) {
    return Cell3i{floorDiv(cell.x, divisor), floorDiv(cell.y, divisor), floorDiv(cell.z, divisor)};
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

inline constexpr Cell3i neighborCell(const Cell3i& cell, Dir6 dir) {
    switch (dir) {
    case Dir6::PosX: return Cell3i{cell.x + 1, cell.y, cell.z};
    case Dir6::NegX: return Cell3i{cell.x - 1, cell.y, cell.z};
    case Dir6::PosY: return Cell3i{cell.x, cell.y + 1, cell.z};
    case Dir6::NegY: return Cell3i{cell.x, cell.y - 1, cell.z};
    case Dir6::PosZ: return Cell3i{cell.x, cell.y, cell.z + 1};
    case Dir6::NegZ: return Cell3i{cell.x, cell.y, cell.z - 1};
    }
    return cell;
}

} // namespace subvox::core
