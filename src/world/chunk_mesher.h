#pragma once

#include "math/math.h"
#include "world/occupancy_grid.h"
#include "world/palette.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

// World ChunkMesher subsystem
// Responsible for: turning a chunk snapshot into culled, greedy-merged LOD meshes and collider boxes.
// Should NOT do: upload buffers, mutate the spatial grid, or choose which LOD is shown.
namespace subvox::world {

enum class MeshingMode : std::uint8_t {
    Naive = 0,
    Greedy = 1
};

struct MeshingOptions {
    MeshingMode mode = MeshingMode::Greedy;
};

// World-space vertex handed to the render collaborator.
// UVs are in world units along the quad so textures tile across merged faces.
struct ChunkVertex {
    math::Vector3 position{};
    math::Vector3 normal{};
    math::Vector2 uv{};
    math::Vector4 color{};
    std::uint8_t materialId = 0;
    std::uint8_t paletteIndex = 0;
    // 0..5 for +X, -X, +Y, -Y, +Z, -Z.
    std::uint8_t faceId = 0;
};

struct ChunkMeshData {
    std::vector<ChunkVertex> vertices;
    std::vector<std::uint32_t> indices;

    [[nodiscard]] bool empty() const { return indices.empty(); }
    [[nodiscard]] std::size_t quadCount() const { return indices.size() / 6u; }
    [[nodiscard]] std::size_t triangleCount() const { return indices.size() / 3u; }
};

struct ChunkLodMeshes {
    std::array<ChunkMeshData, kChunkLodCount> lodMeshes;
    // Set when a level came out empty and holds a copy of the level before it.
    std::array<bool, kChunkLodCount> reusedPreviousLevel{};
};

struct ChunkCollider {
    core::Cell3i voxel{};
    SubVoxelCoord subVoxel{};
    math::Aabb bounds{};
};

[[nodiscard]] ChunkMeshData buildChunkMesh(
    const OccupancyGrid& grid,
    const core::Cell3i& chunkCoord,
    const MaterialPalette& palette,
    MeshingOptions options = {}
);

[[nodiscard]] ChunkMeshData buildChunkMesh(
    const ChunkSnapshot& snapshot,
    std::uint32_t lodLevel,
    const MaterialPalette& palette,
    MeshingOptions options = {}
);

[[nodiscard]] ChunkLodMeshes buildChunkLodMeshes(
    const ChunkSnapshot& snapshot,
    const MaterialPalette& palette,
    MeshingOptions options = {}
);

// One box per occupied sub-voxel of every voxel inside the chunk, visible or not.
[[nodiscard]] std::vector<ChunkCollider> collectChunkColliders(const ChunkSnapshot& snapshot);

} // namespace subvox::world
