#include "world/occupancy_grid.h"

#include <algorithm>

namespace subvox::world {

namespace {

const SnapshotVoxel kMissingVoxel{};

bool isFenceAt(const VoxelMap& voxels, const core::Cell3i& position) {
    const auto it = voxels.find(position);
    return it != voxels.end() && it->second.shape.pattern == SubVoxelPattern::Fence;
}

FenceConnections fenceConnectionsAt(const VoxelMap& voxels, const core::Cell3i& position) {
    FenceConnections connections{};
    connections.negX = isFenceAt(voxels, position + core::Cell3i{-1, 0, 0});
    connections.posX = isFenceAt(voxels, position + core::Cell3i{1, 0, 0});
    connections.negZ = isFenceAt(voxels, position + core::Cell3i{0, 0, -1});
    connections.posZ = isFenceAt(voxels, position + core::Cell3i{0, 0, 1});
    return connections;
}

} // namespace

ChunkSnapshot::ChunkSnapshot()
    : m_voxels(static_cast<std::size_t>(kPaddedSize * kPaddedSize * kPaddedSize)) {}

bool ChunkSnapshot::inPaddedRange(int localX, int localY, int localZ) {
    return localX >= -1 && localX <= kChunkSize &&
           localY >= -1 && localY <= kChunkSize &&
           localZ >= -1 && localZ <= kChunkSize;
}

std::size_t ChunkSnapshot::paddedIndex(int localX, int localY, int localZ) {
    return static_cast<std::size_t>((localX + 1) + (kPaddedSize * ((localZ + 1) + (kPaddedSize * (localY + 1)))));
}

ChunkSnapshot ChunkSnapshot::capture(const VoxelMap& voxels, const core::Cell3i& chunkCoord) {
    ChunkSnapshot snapshot{};
    snapshot.m_chunkCoord = chunkCoord;
    const core::Cell3i origin = chunkOrigin(chunkCoord);

    for (int localY = -1; localY <= kChunkSize; ++localY) {
        for (int localZ = -1; localZ <= kChunkSize; ++localZ) {
            for (int localX = -1; localX <= kChunkSize; ++localX) {
                const core::Cell3i position = origin + core::Cell3i{localX, localY, localZ};
                const auto it = voxels.find(position);
                if (it == voxels.end()) {
                    continue;
                }

                SnapshotVoxel& voxel = snapshot.m_voxels[paddedIndex(localX, localY, localZ)];
                voxel.present = true;
                voxel.type = it->second.type;
                if (it->second.shape.pattern == SubVoxelPattern::Fence) {
                    voxel.geometry = fenceGeometry(fenceConnectionsAt(voxels, position));
                } else {
                    voxel.geometry = shapeGeometry(it->second.shape.pattern, it->second.shape.rotation);
                }

                const bool interior = localX >= 0 && localX < kChunkSize &&
                                      localY >= 0 && localY < kChunkSize &&
                                      localZ >= 0 && localZ < kChunkSize;
                if (interior) {
                    ++snapshot.m_voxelCount;
                }
            }
        }
    }
    return snapshot;
}

const SnapshotVoxel& ChunkSnapshot::at(int localX, int localY, int localZ) const {
    if (!inPaddedRange(localX, localY, localZ)) {
        return kMissingVoxel;
    }
    return m_voxels[paddedIndex(localX, localY, localZ)];
}

bool ChunkSnapshot::isPresent(int localX, int localY, int localZ) const {
    return at(localX, localY, localZ).present;
}

OccupancyGrid::OccupancyGrid(std::uint32_t lodLevel, int subVoxelsPerCell)
    : m_lodLevel(lodLevel),
      m_subVoxelsPerCell(subVoxelsPerCell),
      m_cellsPerAxis(kChunkSubVoxelsPerAxis / subVoxelsPerCell),
      m_stride(m_cellsPerAxis + 2),
      m_cells(static_cast<std::size_t>(m_stride) * static_cast<std::size_t>(m_stride) * static_cast<std::size_t>(m_stride),
              kEmptyCell) {}

OccupancyGrid OccupancyGrid::build(const ChunkSnapshot& snapshot, std::uint32_t lodLevel) {
    const std::uint32_t clampedLod = std::min(lodLevel, kChunkLodCount - 1u);
    OccupancyGrid grid(clampedLod, 1 << clampedLod);
    const int cellSize = grid.m_subVoxelsPerCell;

    for (int localY = -1; localY <= kChunkSize; ++localY) {
        for (int localZ = -1; localZ <= kChunkSize; ++localZ) {
            for (int localX = -1; localX <= kChunkSize; ++localX) {
                const SnapshotVoxel& voxel = snapshot.at(localX, localY, localZ);
                if (!voxel.present) {
                    continue;
                }

                const std::uint16_t value = static_cast<std::uint16_t>(materialId(voxel.type) + 1u);
                for (const SubVoxelCoord& sub : voxel.geometry.occupiedPositions()) {
                    const int cellX = core::floorDiv((localX * kSubVoxelsPerAxis) + sub.x, cellSize);
                    const int cellY = core::floorDiv((localY * kSubVoxelsPerAxis) + sub.y, cellSize);
                    const int cellZ = core::floorDiv((localZ * kSubVoxelsPerAxis) + sub.z, cellSize);
                    grid.setIfEmpty(cellX, cellY, cellZ, value);
                }
            }
        }
    }
    return grid;
}

std::size_t OccupancyGrid::paddedIndex(int x, int y, int z) const {
    return static_cast<std::size_t>(x + 1) +
           (static_cast<std::size_t>(m_stride) * (static_cast<std::size_t>(z + 1) +
                                                  (static_cast<std::size_t>(m_stride) * static_cast<std::size_t>(y + 1))));
}

void OccupancyGrid::setIfEmpty(int x, int y, int z, std::uint16_t value) {
    if (x < -1 || x > m_cellsPerAxis || y < -1 || y > m_cellsPerAxis || z < -1 || z > m_cellsPerAxis) {
        return;
    }
    std::uint16_t& cell = m_cells[paddedIndex(x, y, z)];
    if (cell != kEmptyCell) {
        return;
    }
    cell = value;
    const bool interior = x >= 0 && x < m_cellsPerAxis &&
                          y >= 0 && y < m_cellsPerAxis &&
                          z >= 0 && z < m_cellsPerAxis;
    if (interior) {
        ++m_solidInteriorCount;
    }
}

std::uint16_t OccupancyGrid::cellAt(int x, int y, int z) const {
    if (x < -1 || x > m_cellsPerAxis || y < -1 || y > m_cellsPerAxis || z < -1 || z > m_cellsPerAxis) {
        return kEmptyCell;
    }
    return m_cells[paddedIndex(x, y, z)];
}

std::uint8_t OccupancyGrid::materialAt(int x, int y, int z) const {
    const std::uint16_t cell = cellAt(x, y, z);
    return cell == kEmptyCell ? 0u : static_cast<std::uint8_t>(cell - 1u);
}

core::Cell3i OccupancyGrid::owningVoxel(int x, int y, int z) const {
    return core::Cell3i{
        core::floorDiv(x * m_subVoxelsPerCell, kSubVoxelsPerAxis),
        core::floorDiv(y * m_subVoxelsPerCell, kSubVoxelsPerAxis),
        core::floorDiv(z * m_subVoxelsPerCell, kSubVoxelsPerAxis)
    };
}

} // namespace subvox::world
