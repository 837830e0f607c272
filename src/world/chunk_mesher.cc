#include "world/chunk_mesher.h"

#include "core/log.h"
#include "world/voxel.h"

#include <algorithm>
#include <array>
#include <cstddef>

namespace subvox::world {

namespace {

struct FaceNeighbor {
    int nx;
    int ny;
    int nz;
    std::uint8_t faceId;
};

constexpr std::array<FaceNeighbor, 6> kFaceNeighbors = {
    FaceNeighbor{+1, 0, 0, 0u},
    FaceNeighbor{-1, 0, 0, 1u},
    FaceNeighbor{0, +1, 0, 2u},
    FaceNeighbor{0, -1, 0, 3u},
    FaceNeighbor{0, 0, +1, 4u},
    FaceNeighbor{0, 0, -1, 5u},
};

constexpr std::uint16_t kEmptyMaskKey = 0u;

// Chunk-local placement of an LOD grid in world space.
struct GridFrame {
    math::Vector3 origin{};
    float cellWorldSize = kSubVoxelSize;
    core::Cell3i voxelOrigin{};
};

GridFrame makeGridFrame(const OccupancyGrid& grid, const core::Cell3i& chunkCoord) {
    GridFrame frame{};
    frame.voxelOrigin = chunkOrigin(chunkCoord);
    frame.origin = math::Vector3{
        static_cast<float>(frame.voxelOrigin.x) - 0.5f,
        static_cast<float>(frame.voxelOrigin.y) - 0.5f,
        static_cast<float>(frame.voxelOrigin.z) - 0.5f
    };
    frame.cellWorldSize = static_cast<float>(grid.subVoxelsPerCell()) * kSubVoxelSize;
    return frame;
}

math::Vector3 faceNormal(std::uint8_t faceId) {
    const FaceNeighbor& face = kFaceNeighbors[faceId];
    return math::Vector3{
        static_cast<float>(face.nx),
        static_cast<float>(face.ny),
        static_cast<float>(face.nz)
    };
}

void faceSliceCellToGrid(std::uint8_t faceId, int slice, int u, int v, int& outX, int& outY, int& outZ) {
    switch (faceId) {
    case 0u:
    case 1u:
        outX = slice;
        outY = u;
        outZ = v;
        break;
    case 2u:
    case 3u:
        outX = u;
        outY = slice;
        outZ = v;
        break;
    case 4u:
    case 5u:
    default:
        outX = u;
        outY = v;
        outZ = slice;
        break;
    }
}

void gridToFaceSliceCell(std::uint8_t faceId, int x, int y, int z, int& outSlice, int& outU, int& outV) {
    switch (faceId) {
    case 0u:
    case 1u:
        outSlice = x;
        outU = y;
        outV = z;
        break;
    case 2u:
    case 3u:
        outSlice = y;
        outU = x;
        outV = z;
        break;
    case 4u:
    case 5u:
    default:
        outSlice = z;
        outU = x;
        outV = y;
        break;
    }
}

void faceRectCornerGrid(
    std::uint8_t faceId,
    int slice,
    int u,
    int v,
    int width,
    int height,
    std::uint32_t corner,
    int& outX,
    int& outY,
    int& outZ
) {
    switch (faceId) {
    case 0u: // +X
        if (corner == 0u) { outX = slice + 1; outY = u; outZ = v; return; }
        if (corner == 1u) { outX = slice + 1; outY = u + width; outZ = v; return; }
        if (corner == 2u) { outX = slice + 1; outY = u + width; outZ = v + height; return; }
        outX = slice + 1; outY = u; outZ = v + height; return;
    case 1u: // -X
        if (corner == 0u) { outX = slice; outY = u; outZ = v + height; return; }
        if (corner == 1u) { outX = slice; outY = u + width; outZ = v + height; return; }
        if (corner == 2u) { outX = slice; outY = u + width; outZ = v; return; }
        outX = slice; outY = u; outZ = v; return;
    case 2u: // +Y
        if (corner == 0u) { outX = u; outY = slice + 1; outZ = v; return; }
        if (corner == 1u) { outX = u; outY = slice + 1; outZ = v + height; return; }
        if (corner == 2u) { outX = u + width; outY = slice + 1; outZ = v + height; return; }
        outX = u + width; outY = slice + 1; outZ = v; return;
    case 3u: // -Y
        if (corner == 0u) { outX = u; outY = slice; outZ = v + height; return; }
        if (corner == 1u) { outX = u; outY = slice; outZ = v; return; }
        if (corner == 2u) { outX = u + width; outY = slice; outZ = v; return; }
        outX = u + width; outY = slice; outZ = v + height; return;
    case 4u: // +Z
        if (corner == 0u) { outX = u + width; outY = v; outZ = slice + 1; return; }
        if (corner == 1u) { outX = u + width; outY = v + height; outZ = slice + 1; return; }
        if (corner == 2u) { outX = u; outY = v + height; outZ = slice + 1; return; }
        outX = u; outY = v; outZ = slice + 1; return;
    case 5u: // -Z
    default:
        if (corner == 0u) { outX = u; outY = v; outZ = slice; return; }
        if (corner == 1u) { outX = u; outY = v + height; outZ = slice; return; }
        if (corner == 2u) { outX = u + width; outY = v + height; outZ = slice; return; }
        outX = u + width; outY = v; outZ = slice; return;
    }
}

bool isFaceVisible(const OccupancyGrid& grid, int x, int y, int z, std::uint8_t faceId) {
    const FaceNeighbor& face = kFaceNeighbors[faceId];
    return !grid.isSolid(x + face.nx, y + face.ny, z + face.nz);
}

void appendFaceQuad(
    ChunkMeshData& mesh,
    const OccupancyGrid& grid,
    const GridFrame& frame,
    const MaterialPalette& palette,
    std::uint8_t faceId,
    int slice,
    int u,
    int v,
    int width,
    int height,
    std::uint8_t material
) {
    int startX = 0;
    int startY = 0;
    int startZ = 0;
    faceSliceCellToGrid(faceId, slice, u, v, startX, startY, startZ);
    const core::Cell3i voxel = frame.voxelOrigin + grid.owningVoxel(startX, startY, startZ);
    const std::uint8_t paletteIndex = MaterialPalette::indexFor(voxel);
    const math::Vector4& color = palette.color(paletteIndex);
    const math::Vector3 normal = faceNormal(faceId);

    const std::uint32_t baseVertex = static_cast<std::uint32_t>(mesh.vertices.size());
    for (std::uint32_t corner = 0; corner < 4u; ++corner) {
        int gridX = 0;
        int gridY = 0;
        int gridZ = 0;
        faceRectCornerGrid(faceId, slice, u, v, width, height, corner, gridX, gridY, gridZ);

        int cornerSlice = 0;
        int cornerU = 0;
        int cornerV = 0;
        gridToFaceSliceCell(faceId, gridX, gridY, gridZ, cornerSlice, cornerU, cornerV);

        ChunkVertex vertex{};
        vertex.position = frame.origin + math::Vector3{
            static_cast<float>(gridX) * frame.cellWorldSize,
            static_cast<float>(gridY) * frame.cellWorldSize,
            static_cast<float>(gridZ) * frame.cellWorldSize
        };
        vertex.normal = normal;
        vertex.uv = math::Vector2{
            static_cast<float>(cornerU - u) * frame.cellWorldSize,
            static_cast<float>(cornerV - v) * frame.cellWorldSize
        };
        vertex.color = color;
        vertex.materialId = material;
        vertex.paletteIndex = paletteIndex;
        vertex.faceId = faceId;
        mesh.vertices.push_back(vertex);
    }

    mesh.indices.push_back(baseVertex + 0u);
    mesh.indices.push_back(baseVertex + 1u);
    mesh.indices.push_back(baseVertex + 2u);
    mesh.indices.push_back(baseVertex + 0u);
    mesh.indices.push_back(baseVertex + 2u);
    mesh.indices.push_back(baseVertex + 3u);
}

ChunkMeshData buildGreedyMesh(const OccupancyGrid& grid, const GridFrame& frame, const MaterialPalette& palette) {
    ChunkMeshData mesh{};
    const int cellsPerAxis = grid.cellsPerAxis();
    std::vector<std::uint16_t> mask(static_cast<std::size_t>(cellsPerAxis * cellsPerAxis), kEmptyMaskKey);

    for (const FaceNeighbor& face : kFaceNeighbors) {
        const std::uint8_t faceId = face.faceId;
        for (int slice = 0; slice < cellsPerAxis; ++slice) {
            std::fill(mask.begin(), mask.end(), kEmptyMaskKey);
            bool sliceHasFaces = false;

            for (int v = 0; v < cellsPerAxis; ++v) {
                for (int u = 0; u < cellsPerAxis; ++u) {
                    int x = 0;
                    int y = 0;
                    int z = 0;
                    faceSliceCellToGrid(faceId, slice, u, v, x, y, z);

                    const std::uint16_t cell = grid.cellAt(x, y, z);
                    if (cell == OccupancyGrid::kEmptyCell || !isFaceVisible(grid, x, y, z, faceId)) {
                        continue;
                    }
                    // Cells store materialId + 1, which doubles as a non-zero mask key.
                    mask[static_cast<std::size_t>(u + (v * cellsPerAxis))] = cell;
                    sliceHasFaces = true;
                }
            }
            if (!sliceHasFaces) {
                continue;
            }

            for (int v = 0; v < cellsPerAxis; ++v) {
                for (int u = 0; u < cellsPerAxis;) {
                    const std::size_t startIndex = static_cast<std::size_t>(u + (v * cellsPerAxis));
                    const std::uint16_t key = mask[startIndex];
                    if (key == kEmptyMaskKey) {
                        ++u;
                        continue;
                    }

                    int width = 1;
                    while ((u + width) < cellsPerAxis) {
                        const std::size_t widthIndex = static_cast<std::size_t>((u + width) + (v * cellsPerAxis));
                        if (mask[widthIndex] != key) {
                            break;
                        }
                        ++width;
                    }

                    int height = 1;
                    bool canGrow = true;
                    while ((v + height) < cellsPerAxis && canGrow) {
                        for (int offsetU = 0; offsetU < width; ++offsetU) {
                            const std::size_t growIndex =
                                static_cast<std::size_t>((u + offsetU) + ((v + height) * cellsPerAxis));
                            if (mask[growIndex] != key) {
                                canGrow = false;
                                break;
                            }
                        }
                        if (canGrow) {
                            ++height;
                        }
                    }

                    const std::uint8_t material = static_cast<std::uint8_t>(key - 1u);
                    appendFaceQuad(mesh, grid, frame, palette, faceId, slice, u, v, width, height, material);

                    for (int clearV = 0; clearV < height; ++clearV) {
                        for (int clearU = 0; clearU < width; ++clearU) {
                            const std::size_t clearIndex =
                                static_cast<std::size_t>((u + clearU) + ((v + clearV) * cellsPerAxis));
                            mask[clearIndex] = kEmptyMaskKey;
                        }
                    }

                    u += width;
                }
            }
        }
    }

    return mesh;
}

ChunkMeshData buildNaiveMesh(const OccupancyGrid& grid, const GridFrame& frame, const MaterialPalette& palette) {
    ChunkMeshData mesh{};
    const int cellsPerAxis = grid.cellsPerAxis();

    for (int y = 0; y < cellsPerAxis; ++y) {
        for (int z = 0; z < cellsPerAxis; ++z) {
            for (int x = 0; x < cellsPerAxis; ++x) {
                if (!grid.isSolid(x, y, z)) {
                    continue;
                }
                const std::uint8_t material = grid.materialAt(x, y, z);
                for (const FaceNeighbor& face : kFaceNeighbors) {
                    if (!isFaceVisible(grid, x, y, z, face.faceId)) {
                        continue;
                    }
                    int slice = 0;
                    int u = 0;
                    int v = 0;
                    gridToFaceSliceCell(face.faceId, x, y, z, slice, u, v);
                    appendFaceQuad(mesh, grid, frame, palette, face.faceId, slice, u, v, 1, 1, material);
                }
            }
        }
    }

    return mesh;
}

} // namespace

ChunkMeshData buildChunkMesh(
    const OccupancyGrid& grid,
    const core::Cell3i& chunkCoord,
    const MaterialPalette& palette,
    MeshingOptions options
) {
    if (grid.solidInteriorCount() == 0) {
        return ChunkMeshData{};
    }

    const GridFrame frame = makeGridFrame(grid, chunkCoord);
    switch (options.mode) {
    case MeshingMode::Naive:
        return buildNaiveMesh(grid, frame, palette);
    case MeshingMode::Greedy:
    default:
        return buildGreedyMesh(grid, frame, palette);
    }
}

ChunkMeshData buildChunkMesh(
    const ChunkSnapshot& snapshot,
    std::uint32_t lodLevel,
    const MaterialPalette& palette,
    MeshingOptions options
) {
    if (snapshot.empty()) {
        return ChunkMeshData{};
    }
    const OccupancyGrid grid = OccupancyGrid::build(snapshot, lodLevel);
    return buildChunkMesh(grid, snapshot.chunkCoord(), palette, options);
}

ChunkLodMeshes buildChunkLodMeshes(
    const ChunkSnapshot& snapshot,
    const MaterialPalette& palette,
    MeshingOptions options
) {
    ChunkLodMeshes meshes{};
    if (snapshot.empty()) {
        return meshes;
    }

    for (std::uint32_t lod = 0; lod < kChunkLodCount; ++lod) {
        meshes.lodMeshes[lod] = buildChunkMesh(snapshot, lod, palette, options);
        if (lod > 0 && meshes.lodMeshes[lod].empty()) {
            meshes.lodMeshes[lod] = meshes.lodMeshes[lod - 1];
            meshes.reusedPreviousLevel[lod] = true;
        }
    }

    const core::Cell3i& coord = snapshot.chunkCoord();
    SUBVOX_LOGT("mesher") << "Chunk (" << coord.x << ", " << coord.y << ", " << coord.z << ") quads per LOD: "
                          << meshes.lodMeshes[0].quadCount() << "/" << meshes.lodMeshes[1].quadCount() << "/"
                          << meshes.lodMeshes[2].quadCount() << "/" << meshes.lodMeshes[3].quadCount();
    return meshes;
}

std::vector<ChunkCollider> collectChunkColliders(const ChunkSnapshot& snapshot) {
    std::vector<ChunkCollider> colliders;
    if (snapshot.empty()) {
        return colliders;
    }

    const core::Cell3i origin = snapshot.origin();
    for (int localY = 0; localY < kChunkSize; ++localY) {
        for (int localZ = 0; localZ < kChunkSize; ++localZ) {
            for (int localX = 0; localX < kChunkSize; ++localX) {
                const SnapshotVoxel& voxel = snapshot.at(localX, localY, localZ);
                if (!voxel.present) {
                    continue;
                }
                const core::Cell3i position = origin + core::Cell3i{localX, localY, localZ};
                for (const SubVoxelCoord& sub : voxel.geometry.occupiedPositions()) {
                    colliders.push_back(ChunkCollider{position, sub, subVoxelWorldBounds(position, sub)});
                }
            }
        }
    }
    return colliders;
}

} // namespace subvox::world
