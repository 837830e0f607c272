#pragma once

#include <unordered_map>

#include "core/grid3.h"
#include "world/voxel.h"

// World VoxelMap subsystem
// Responsible for: the sparse voxel store and the voxel-to-chunk coordinate mapping.
// Should NOT do: meshing, collider bookkeeping, or dirty tracking.
namespace subvox::world {

constexpr int kChunkSize = 16;

// A voxel as kept by the world: its material plus the shape resolved once at placement.
struct PlacedVoxel {
    VoxelType type = VoxelType::Stone;
    VoxelShape shape{};
};

using VoxelMap = std::unordered_map<core::Cell3i, PlacedVoxel, core::Cell3iHash>;

[[nodiscard]] inline core::Cell3i chunkCoordOf(const core::Cell3i& voxel) {
    return core::floorDiv(voxel, kChunkSize);
}

[[nodiscard]] inline core::Cell3i chunkOrigin(const core::Cell3i& chunkCoord) {
    return chunkCoord * kChunkSize;
}

[[nodiscard]] inline core::Cell3i localVoxelCoord(const core::Cell3i& voxel) {
    return core::Cell3i{
        core::floorMod(voxel.x, kChunkSize),
        core::floorMod(voxel.y, kChunkSize),
        core::floorMod(voxel.z, kChunkSize)
    };
}

} // namespace subvox::world
