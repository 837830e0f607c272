#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/grid3.h"
#include "world/sub_voxel_geometry.h"
#include "world/voxel_map.h"

// World OccupancyGrid subsystem
// Responsible for: immutable per-chunk voxel snapshots and the per-LOD material grids built from them.
// Should NOT do: emit geometry, touch the spatial grid, or read live world state after capture.
namespace subvox::world {

constexpr std::uint32_t kChunkLodCount = 4;
constexpr int kChunkSubVoxelsPerAxis = kChunkSize * kSubVoxelsPerAxis;

struct SnapshotVoxel {
    bool present = false;
    VoxelType type = VoxelType::Stone;
    // Final occupancy, fence rails included.
    SubVoxelGeometry geometry{};
};

// Copy of one chunk's voxels plus a one-voxel halo from its neighbours.
// Local coordinates run from -1 to kChunkSize on each axis.
class ChunkSnapshot {
public:
    ChunkSnapshot();

    [[nodiscard]] static ChunkSnapshot capture(const VoxelMap& voxels, const core::Cell3i& chunkCoord);

    [[nodiscard]] const core::Cell3i& chunkCoord() const { return m_chunkCoord; }
    [[nodiscard]] core::Cell3i origin() const { return chunkOrigin(m_chunkCoord); }

    [[nodiscard]] const SnapshotVoxel& at(int localX, int localY, int localZ) const;
    [[nodiscard]] bool isPresent(int localX, int localY, int localZ) const;

    // Voxels inside the chunk proper; the halo is not counted.
    [[nodiscard]] std::size_t voxelCount() const { return m_voxelCount; }
    [[nodiscard]] bool empty() const { return m_voxelCount == 0; }

    static constexpr int kPaddedSize = kChunkSize + 2;

private:
    [[nodiscard]] static bool inPaddedRange(int localX, int localY, int localZ);
    [[nodiscard]] static std::size_t paddedIndex(int localX, int localY, int localZ);

    core::Cell3i m_chunkCoord{};
    std::vector<SnapshotVoxel> m_voxels;
    std::size_t m_voxelCount = 0;
};

// Dense material grid for one LOD level. Cell size is 2^lod sub-voxels, so each cell lies inside a
// single voxel. A cell stores materialId + 1, or 0 when empty, and carries a one-cell halo.
class OccupancyGrid {
public:
    static constexpr std::uint16_t kEmptyCell = 0;

    [[nodiscard]] static OccupancyGrid build(const ChunkSnapshot& snapshot, std::uint32_t lodLevel);

    [[nodiscard]] std::uint32_t lodLevel() const { return m_lodLevel; }
    // Interior cells per axis, halo excluded.
    [[nodiscard]] int cellsPerAxis() const { return m_cellsPerAxis; }
    [[nodiscard]] int subVoxelsPerCell() const { return m_subVoxelsPerCell; }

    // Valid for -1..cellsPerAxis(); anything further out reads as empty.
    [[nodiscard]] std::uint16_t cellAt(int x, int y, int z) const;
    [[nodiscard]] bool isSolid(int x, int y, int z) const { return cellAt(x, y, z) != kEmptyCell; }
    [[nodiscard]] std::uint8_t materialAt(int x, int y, int z) const;

    // Chunk-local voxel that owns the interior cell (x, y, z).
    [[nodiscard]] core::Cell3i owningVoxel(int x, int y, int z) const;

    [[nodiscard]] std::size_t solidInteriorCount() const { return m_solidInteriorCount; }

private:
    OccupancyGrid(std::uint32_t lodLevel, int subVoxelsPerCell);

    [[nodiscard]] std::size_t paddedIndex(int x, int y, int z) const;
    void setIfEmpty(int x, int y, int z, std::uint16_t value);

    std::uint32_t m_lodLevel = 0;
    int m_subVoxelsPerCell = 1;
    int m_cellsPerAxis = 0;
    int m_stride = 0;
    std::size_t m_solidInteriorCount = 0;
    std::vector<std::uint16_t> m_cells;
};

} // namespace subvox::world
