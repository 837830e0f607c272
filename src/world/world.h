#pragma once

#include "core/grid3.h"
#include "math/math.h"
#include "world/chunk.h"
#include "world/chunk_mesh_worker.h"
#include "world/chunk_mesher.h"
#include "world/palette.h"
#include "world/spatial_grid.h"
#include "world/voxel.h"
#include "world/voxel_map.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <span>
#include <unordered_map>
#include <vector>

// World VoxelWorld subsystem
// Responsible for: owning voxels, chunks, colliders and the palette, and keeping them in step with edits.
// Should NOT do: parse map files, drive characters, or submit GPU work.
namespace subvox::world {

struct WorldOptions {
    // 0 rebuilds meshes on the calling thread inside update().
    std::size_t meshWorkerCount = 0;
    LodConfig lod{};
    MeshingOptions meshing{};
};

struct WorldStats {
    std::size_t voxelCount = 0;
    std::size_t chunkCount = 0;
    std::size_t colliderCount = 0;
    std::size_t dirtyChunkCount = 0;
    std::size_t fallbackVoxelCount = 0;
    std::uint64_t staleMeshResults = 0;
    std::array<std::size_t, kChunkLodCount> quadCountPerLod{};
};

class VoxelWorld {
public:
    using ChunkMap = std::unordered_map<core::Cell3i, Chunk, core::Cell3iHash>;

    explicit VoxelWorld(WorldOptions options = {});
    ~VoxelWorld();

    VoxelWorld(const VoxelWorld&) = delete;
    VoxelWorld& operator=(const VoxelWorld&) = delete;

    // Replaces the whole world and builds every chunk before returning.
    // Later records win when two share a position. Returns the number of voxels placed.
    std::size_t loadVoxels(std::span<const VoxelRecord> records);

    // Edits only mark chunks dirty; colliders and meshes follow on the next update().
    // setVoxel returns false when the stored voxel is already identical.
    bool setVoxel(const VoxelRecord& record);
    bool removeVoxel(const core::Cell3i& position);
    void notifyVoxelsChanged(std::span<const core::Cell3i> positions);

    // Applies mesh results from the previous frame, then rebuilds every dirty chunk.
    // With workers, meshes trail colliders by at most one update.
    void update();

    // Returns the number of chunks whose active level changed.
    std::size_t updateLods(const math::Vector3& cameraPosition);

    void unload();

    [[nodiscard]] const PlacedVoxel* voxelAt(const core::Cell3i& position) const;
    [[nodiscard]] const Chunk* chunkAt(const core::Cell3i& chunkCoord) const;
    [[nodiscard]] const ChunkMap& chunks() const { return m_chunks; }
    [[nodiscard]] std::vector<core::Cell3i> chunkCoords() const;
    [[nodiscard]] bool isChunkDirty(const core::Cell3i& chunkCoord) const;

    [[nodiscard]] const SpatialGrid& spatialGrid() const { return m_spatialGrid; }
    [[nodiscard]] const MaterialPalette& palette() const { return m_palette; }
    [[nodiscard]] const WorldOptions& options() const { return m_options; }
    [[nodiscard]] WorldStats stats() const;

private:
    bool placeVoxel(const VoxelRecord& record);
    void markDirtyAround(const core::Cell3i& voxel);
    void markChunkDirty(const core::Cell3i& chunkCoord);
    void processDirtyChunks();
    void rebuildChunk(const core::Cell3i& chunkCoord);
    void rebuildColliders(Chunk& chunk, const ChunkSnapshot& snapshot);
    void releaseColliders(Chunk& chunk);
    void collectMeshResults();
    ColliderHandle allocateColliderHandle();

    WorldOptions m_options;
    MaterialPalette m_palette;
    VoxelMap m_voxels;
    SpatialGrid m_spatialGrid;
    ChunkMap m_chunks;
    std::set<core::Cell3i, core::Cell3iLess> m_dirtyChunks;
    std::unique_ptr<ChunkMeshWorker> m_meshWorker;

    std::uint64_t m_nextVersion = 0;
    ColliderHandle m_nextColliderHandle = 0;
    std::vector<ColliderHandle> m_freeColliderHandles;
    std::uint64_t m_staleMeshResults = 0;
};

} // namespace subvox::world
