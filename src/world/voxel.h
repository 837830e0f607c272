#pragma once

#include <cstdint>

#include "core/grid3.h"
#include "math/math.h"
#include "world/sub_voxel_geometry.h"

// World Voxel subsystem
// Responsible for: the voxel record handed over by the map loader and its resolved shape.
// Should NOT do: chunk storage management, collider bookkeeping, or meshing.
namespace subvox::world {

enum class VoxelType : std::uint8_t {
    Grass = 0,
    Dirt = 1,
    Stone = 2
};

// Raw record as supplied by the map-definition collaborator.
// Tags are kept raw so a corrupt value survives until resolveVoxelShape() decides what to do with it.
struct VoxelRecord {
    core::Cell3i position{};
    VoxelType type = VoxelType::Stone;
    std::uint8_t patternTag = static_cast<std::uint8_t>(SubVoxelPattern::Full);
    std::uint8_t rotationAxisTag = static_cast<std::uint8_t>(RotationAxis::Y);
    std::int32_t rotationDegrees = 0;

    bool operator==(const VoxelRecord&) const = default;
};

struct VoxelShape {
    SubVoxelPattern pattern = SubVoxelPattern::Full;
    RotationState rotation{};
    // True when a corrupt tag forced the Full fallback.
    bool fellBack = false;
};

[[nodiscard]] VoxelRecord makeVoxelRecord(
    const core::Cell3i& position,
    SubVoxelPattern pattern,
    VoxelType type = VoxelType::Stone,
    RotationState rotation = {}
);

[[nodiscard]] VoxelShape resolveVoxelShape(const VoxelRecord& record);

[[nodiscard]] inline std::uint8_t materialId(VoxelType type) {
    return static_cast<std::uint8_t>(type);
}

// A voxel at integer position p spans [p - 0.5, p + 0.5] on every axis.
[[nodiscard]] math::Aabb voxelWorldBounds(const core::Cell3i& voxel);
[[nodiscard]] math::Aabb subVoxelWorldBounds(const core::Cell3i& voxel, const SubVoxelCoord& subVoxel);

} // namespace subvox::world
