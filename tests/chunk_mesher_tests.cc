#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "world/chunk_mesher.h"
#include "world/occupancy_grid.h"
#include "world/palette.h"
#include "world/voxel.h"
#include "world/voxel_map.h"

namespace {

void placeVoxel(
    subvox::world::VoxelMap& voxels,
    const subvox::core::Cell3i& position,
    subvox::world::SubVoxelPattern pattern,
    subvox::world::VoxelType type = subvox::world::VoxelType::Stone
) {
    const subvox::world::VoxelRecord record = subvox::world::makeVoxelRecord(position, pattern, type);
    voxels[position] = subvox::world::PlacedVoxel{type, subvox::world::resolveVoxelShape(record)};
}

subvox::world::ChunkMeshData buildLod(
    const subvox::world::VoxelMap& voxels,
    const subvox::core::Cell3i& chunkCoord,
    std::uint32_t lodLevel,
    subvox::world::MeshingMode mode = subvox::world::MeshingMode::Greedy
) {
    const subvox::world::MaterialPalette palette;
    const subvox::world::ChunkSnapshot snapshot = subvox::world::ChunkSnapshot::capture(voxels, chunkCoord);
    return subvox::world::buildChunkMesh(snapshot, lodLevel, palette, subvox::world::MeshingOptions{mode});
}

struct MeshBounds {
    subvox::math::Vector3 min{
        std::numeric_limits<float>::max(),
        std::numeric_limits<float>::max(),
        std::numeric_limits<float>::max()
    };
    subvox::math::Vector3 max{
        std::numeric_limits<float>::lowest(),
        std::numeric_limits<float>::lowest(),
        std::numeric_limits<float>::lowest()
    };
};

MeshBounds meshBounds(const subvox::world::ChunkMeshData& mesh) {
    MeshBounds bounds{};
    for (const subvox::world::ChunkVertex& vertex : mesh.vertices) {
        bounds.min.x = std::min(bounds.min.x, vertex.position.x);
        bounds.min.y = std::min(bounds.min.y, vertex.position.y);
        bounds.min.z = std::min(bounds.min.z, vertex.position.z);
        bounds.max.x = std::max(bounds.max.x, vertex.position.x);
        bounds.max.y = std::max(bounds.max.y, vertex.position.y);
        bounds.max.z = std::max(bounds.max.z, vertex.position.z);
    }
    return bounds;
}

std::size_t countFaces(const subvox::world::ChunkMeshData& mesh, std::uint8_t faceId) {
    std::size_t count = 0;
    for (std::size_t vertexIndex = 0; vertexIndex < mesh.vertices.size(); vertexIndex += 4u) {
        if (mesh.vertices[vertexIndex].faceId == faceId) {
            ++count;
        }
    }
    return count;
}

void expectMeshEqual(const subvox::world::ChunkMeshData& lhs, const subvox::world::ChunkMeshData& rhs) {
    ASSERT_EQ(lhs.vertices.size(), rhs.vertices.size());
    ASSERT_EQ(lhs.indices, rhs.indices);
    for (std::size_t i = 0; i < lhs.vertices.size(); ++i) {
        const subvox::world::ChunkVertex& a = lhs.vertices[i];
        const subvox::world::ChunkVertex& b = rhs.vertices[i];
        EXPECT_EQ(a.position, b.position) << "vertex " << i;
        EXPECT_EQ(a.normal, b.normal) << "vertex " << i;
        EXPECT_EQ(a.uv, b.uv) << "vertex " << i;
        EXPECT_EQ(a.materialId, b.materialId) << "vertex " << i;
        EXPECT_EQ(a.paletteIndex, b.paletteIndex) << "vertex " << i;
        EXPECT_EQ(a.faceId, b.faceId) << "vertex " << i;
    }
}

} // namespace

TEST(ChunkMesher, SingleFullVoxelProducesSixQuadsAtEveryLod) {
    subvox::world::VoxelMap voxels;
    placeVoxel(voxels, subvox::core::Cell3i{0, 0, 0}, subvox::world::SubVoxelPattern::Full);

    const subvox::world::MaterialPalette palette;
    const subvox::world::ChunkSnapshot snapshot = subvox::world::ChunkSnapshot::capture(voxels, subvox::core::Cell3i{0, 0, 0});
    const subvox::world::ChunkLodMeshes meshes = subvox::world::buildChunkLodMeshes(snapshot, palette);

    for (std::uint32_t lod = 0; lod < subvox::world::kChunkLodCount; ++lod) {
        const subvox::world::ChunkMeshData& mesh = meshes.lodMeshes[lod];
        EXPECT_EQ(mesh.quadCount(), 6u) << "lod " << lod;
        EXPECT_EQ(mesh.triangleCount(), 12u) << "lod " << lod;
        EXPECT_EQ(mesh.vertices.size(), 24u) << "lod " << lod;
        EXPECT_FALSE(meshes.reusedPreviousLevel[lod]);
        for (std::uint8_t faceId = 0; faceId < 6u; ++faceId) {
            EXPECT_EQ(countFaces(mesh, faceId), 1u);
        }
    }
}

TEST(ChunkMesher, VoxelMeshSpansCentredUnitCube) {
    subvox::world::VoxelMap voxels;
    placeVoxel(voxels, subvox::core::Cell3i{0, 0, 0}, subvox::world::SubVoxelPattern::Full);

    const subvox::world::ChunkMeshData mesh = buildLod(voxels, subvox::core::Cell3i{0, 0, 0}, 0u);
    const MeshBounds bounds = meshBounds(mesh);
    EXPECT_FLOAT_EQ(bounds.min.x, -0.5f);
    EXPECT_FLOAT_EQ(bounds.min.y, -0.5f);
    EXPECT_FLOAT_EQ(bounds.min.z, -0.5f);
    EXPECT_FLOAT_EQ(bounds.max.x, 0.5f);
    EXPECT_FLOAT_EQ(bounds.max.y, 0.5f);
    EXPECT_FLOAT_EQ(bounds.max.z, 0.5f);

    for (const subvox::world::ChunkVertex& vertex : mesh.vertices) {
        EXPECT_FLOAT_EQ(subvox::math::length(vertex.normal), 1.0f);
        EXPECT_GE(vertex.uv.x, 0.0f);
        EXPECT_LE(vertex.uv.x, 1.0f);
    }
}

TEST(ChunkMesher, NegativeChunkCoordinatesPlaceMeshAtVoxel) {
    subvox::world::VoxelMap voxels;
    placeVoxel(voxels, subvox::core::Cell3i{-1, -1, -1}, subvox::world::SubVoxelPattern::Full);

    const subvox::world::ChunkMeshData mesh = buildLod(voxels, subvox::core::Cell3i{-1, -1, -1}, 0u);
    ASSERT_EQ(mesh.quadCount(), 6u);
    const MeshBounds bounds = meshBounds(mesh);
    EXPECT_FLOAT_EQ(bounds.min.x, -1.5f);
    EXPECT_FLOAT_EQ(bounds.max.x, -0.5f);
    EXPECT_FLOAT_EQ(bounds.min.y, -1.5f);
    EXPECT_FLOAT_EQ(bounds.max.z, -0.5f);
}

TEST(ChunkMesher, FilledChunkCollapsesToSixQuads) {
    subvox::world::VoxelMap voxels;
    for (int y = 0; y < subvox::world::kChunkSize; ++y) {
        for (int z = 0; z < subvox::world::kChunkSize; ++z) {
            for (int x = 0; x < subvox::world::kChunkSize; ++x) {
                placeVoxel(voxels, subvox::core::Cell3i{x, y, z}, subvox::world::SubVoxelPattern::Full);
            }
        }
    }

    const subvox::world::ChunkMeshData mesh = buildLod(voxels, subvox::core::Cell3i{0, 0, 0}, 0u);
    EXPECT_EQ(mesh.quadCount(), 6u);
    const MeshBounds bounds = meshBounds(mesh);
    EXPECT_FLOAT_EQ(bounds.min.x, -0.5f);
    EXPECT_FLOAT_EQ(bounds.max.x, 15.5f);
}

TEST(ChunkMesher, NaiveMeshEmitsOneQuadPerExposedSubVoxelFace) {
    subvox::world::VoxelMap voxels;
    placeVoxel(voxels, subvox::core::Cell3i{0, 0, 0}, subvox::world::SubVoxelPattern::Full);

    const subvox::world::ChunkMeshData naive =
        buildLod(voxels, subvox::core::Cell3i{0, 0, 0}, 0u, subvox::world::MeshingMode::Naive);
    EXPECT_EQ(naive.quadCount(), 6u * 64u);
}

TEST(ChunkMesher, GreedyNeverEmitsMoreQuadsThanNaive) {
    subvox::world::VoxelMap voxels;
    placeVoxel(voxels, subvox::core::Cell3i{0, 0, 0}, subvox::world::SubVoxelPattern::Full);
    placeVoxel(voxels, subvox::core::Cell3i{1, 0, 0}, subvox::world::SubVoxelPattern::StaircaseX, subvox::world::VoxelType::Dirt);
    placeVoxel(voxels, subvox::core::Cell3i{2, 0, 0}, subvox::world::SubVoxelPattern::PlatformXZ);
    placeVoxel(voxels, subvox::core::Cell3i{0, 1, 0}, subvox::world::SubVoxelPattern::Pillar, subvox::world::VoxelType::Grass);
    placeVoxel(voxels, subvox::core::Cell3i{4, 0, 4}, subvox::world::SubVoxelPattern::Fence);
    placeVoxel(voxels, subvox::core::Cell3i{5, 0, 4}, subvox::world::SubVoxelPattern::Fence);

    for (std::uint32_t lod = 0; lod < subvox::world::kChunkLodCount; ++lod) {
        const subvox::world::ChunkMeshData greedy = buildLod(voxels, subvox::core::Cell3i{0, 0, 0}, lod);
        const subvox::world::ChunkMeshData naive =
            buildLod(voxels, subvox::core::Cell3i{0, 0, 0}, lod, subvox::world::MeshingMode::Naive);
        EXPECT_GT(greedy.quadCount(), 0u);
        EXPECT_LE(greedy.quadCount(), naive.quadCount()) << "lod " << lod;
    }
}

TEST(ChunkMesher, MeshingIsDeterministic) {
    subvox::world::VoxelMap voxels;
    placeVoxel(voxels, subvox::core::Cell3i{3, 2, 1}, subvox::world::SubVoxelPattern::StaircaseNegZ);
    placeVoxel(voxels, subvox::core::Cell3i{3, 3, 1}, subvox::world::SubVoxelPattern::PlatformYZ, subvox::world::VoxelType::Dirt);
    placeVoxel(voxels, subvox::core::Cell3i{7, 0, 7}, subvox::world::SubVoxelPattern::Full, subvox::world::VoxelType::Grass);

    for (std::uint32_t lod = 0; lod < subvox::world::kChunkLodCount; ++lod) {
        const subvox::world::ChunkMeshData first = buildLod(voxels, subvox::core::Cell3i{0, 0, 0}, lod);
        const subvox::world::ChunkMeshData second = buildLod(voxels, subvox::core::Cell3i{0, 0, 0}, lod);
        expectMeshEqual(first, second);
    }
}

TEST(ChunkMesher, EmptySnapshotYieldsNoGeometry) {
    const subvox::world::VoxelMap voxels;
    const subvox::world::MaterialPalette palette;
    const subvox::world::ChunkSnapshot snapshot = subvox::world::ChunkSnapshot::capture(voxels, subvox::core::Cell3i{2, 0, -3});
    EXPECT_TRUE(snapshot.empty());

    const subvox::world::ChunkLodMeshes meshes = subvox::world::buildChunkLodMeshes(snapshot, palette);
    for (const subvox::world::ChunkMeshData& mesh : meshes.lodMeshes) {
        EXPECT_TRUE(mesh.empty());
        EXPECT_TRUE(mesh.vertices.empty());
    }
    EXPECT_TRUE(subvox::world::collectChunkColliders(snapshot).empty());
}

TEST(ChunkMesher, HaloVoxelCullsFacesAcrossChunkBorder) {
    subvox::world::VoxelMap voxels;
    placeVoxel(voxels, subvox::core::Cell3i{15, 0, 0}, subvox::world::SubVoxelPattern::Full);
    placeVoxel(voxels, subvox::core::Cell3i{16, 0, 0}, subvox::world::SubVoxelPattern::Full);

    const subvox::world::ChunkMeshData left = buildLod(voxels, subvox::core::Cell3i{0, 0, 0}, 0u);
    EXPECT_EQ(left.quadCount(), 5u);
    EXPECT_EQ(countFaces(left, 0u), 0u);

    const subvox::world::ChunkMeshData right = buildLod(voxels, subvox::core::Cell3i{1, 0, 0}, 0u);
    EXPECT_EQ(right.quadCount(), 5u);
    EXPECT_EQ(countFaces(right, 1u), 0u);
}

TEST(ChunkMesher, PartialHaloNeighbourLeavesUncoveredFaceVisible) {
    subvox::world::VoxelMap voxels;
    placeVoxel(voxels, subvox::core::Cell3i{15, 0, 0}, subvox::world::SubVoxelPattern::Full);
    placeVoxel(voxels, subvox::core::Cell3i{16, 0, 0}, subvox::world::SubVoxelPattern::PlatformXZ);

    const subvox::world::ChunkMeshData left = buildLod(voxels, subvox::core::Cell3i{0, 0, 0}, 0u);
    // The platform only hides the bottom sub-voxel row of the +X face.
    EXPECT_EQ(countFaces(left, 0u), 1u);
    EXPECT_EQ(left.quadCount(), 6u);
}

TEST(ChunkMesher, MaterialBoundaryStopsMerging) {
    subvox::world::VoxelMap sameMaterial;
    placeVoxel(sameMaterial, subvox::core::Cell3i{0, 0, 0}, subvox::world::SubVoxelPattern::Full);
    placeVoxel(sameMaterial, subvox::core::Cell3i{1, 0, 0}, subvox::world::SubVoxelPattern::Full);
    EXPECT_EQ(buildLod(sameMaterial, subvox::core::Cell3i{0, 0, 0}, 0u).quadCount(), 6u);

    subvox::world::VoxelMap mixed;
    placeVoxel(mixed, subvox::core::Cell3i{0, 0, 0}, subvox::world::SubVoxelPattern::Full);
    placeVoxel(mixed, subvox::core::Cell3i{1, 0, 0}, subvox::world::SubVoxelPattern::Full, subvox::world::VoxelType::Dirt);
    EXPECT_EQ(buildLod(mixed, subvox::core::Cell3i{0, 0, 0}, 0u).quadCount(), 10u);
}

TEST(ChunkMesher, PlatformIsThinAtFineLodAndFillsCellAtCoarsestLod) {
    subvox::world::VoxelMap voxels;
    placeVoxel(voxels, subvox::core::Cell3i{0, 0, 0}, subvox::world::SubVoxelPattern::PlatformXZ);

    const subvox::world::ChunkMeshData fine = buildLod(voxels, subvox::core::Cell3i{0, 0, 0}, 0u);
    EXPECT_EQ(fine.quadCount(), 6u);
    EXPECT_FLOAT_EQ(meshBounds(fine).max.y, -0.375f);

    const subvox::world::ChunkMeshData coarse = buildLod(voxels, subvox::core::Cell3i{0, 0, 0}, 3u);
    EXPECT_EQ(coarse.quadCount(), 6u);
    EXPECT_FLOAT_EQ(meshBounds(coarse).max.y, 0.5f);
}

TEST(ChunkMesher, QuadsCarryOwningVoxelPaletteColour) {
    const subvox::core::Cell3i position{3, 5, 7};
    subvox::world::VoxelMap voxels;
    placeVoxel(voxels, position, subvox::world::SubVoxelPattern::StaircaseX, subvox::world::VoxelType::Grass);

    const subvox::world::MaterialPalette palette;
    const std::uint8_t expectedIndex = subvox::world::MaterialPalette::indexFor(position);
    ASSERT_LT(static_cast<std::size_t>(expectedIndex), subvox::world::kPaletteSize);

    const subvox::world::ChunkMeshData mesh = buildLod(voxels, subvox::core::Cell3i{0, 0, 0}, 0u);
    ASSERT_FALSE(mesh.empty());
    for (const subvox::world::ChunkVertex& vertex : mesh.vertices) {
        EXPECT_EQ(vertex.paletteIndex, expectedIndex);
        EXPECT_EQ(vertex.color, palette.color(expectedIndex));
        EXPECT_EQ(vertex.materialId, subvox::world::materialId(subvox::world::VoxelType::Grass));
    }
}

TEST(ChunkMesher, CollidersCoverEveryOccupiedSubVoxel) {
    subvox::world::VoxelMap voxels;
    placeVoxel(voxels, subvox::core::Cell3i{0, 0, 0}, subvox::world::SubVoxelPattern::Full);
    placeVoxel(voxels, subvox::core::Cell3i{2, 0, 0}, subvox::world::SubVoxelPattern::PlatformXZ);

    const subvox::world::ChunkSnapshot snapshot = subvox::world::ChunkSnapshot::capture(voxels, subvox::core::Cell3i{0, 0, 0});
    const std::vector<subvox::world::ChunkCollider> colliders = subvox::world::collectChunkColliders(snapshot);
    ASSERT_EQ(colliders.size(), 512u + 64u);

    const subvox::world::ChunkCollider& first = colliders.front();
    EXPECT_EQ(first.voxel, (subvox::core::Cell3i{0, 0, 0}));
    EXPECT_FLOAT_EQ(first.bounds.min.x, -0.5f);
    EXPECT_FLOAT_EQ(first.bounds.max.x, -0.375f);
    EXPECT_FLOAT_EQ(first.bounds.max.y, -0.375f);
}

TEST(ChunkMesher, HiddenInteriorSubVoxelsStillCollide) {
    subvox::world::VoxelMap voxels;
    for (int y = 0; y < 3; ++y) {
        for (int z = 0; z < 3; ++z) {
            for (int x = 0; x < 3; ++x) {
                placeVoxel(voxels, subvox::core::Cell3i{x, y, z}, subvox::world::SubVoxelPattern::Full);
            }
        }
    }

    const subvox::world::ChunkSnapshot snapshot = subvox::world::ChunkSnapshot::capture(voxels, subvox::core::Cell3i{0, 0, 0});
    EXPECT_EQ(subvox::world::collectChunkColliders(snapshot).size(), 27u * 512u);
    EXPECT_EQ(buildLod(voxels, subvox::core::Cell3i{0, 0, 0}, 0u).quadCount(), 6u);
}

TEST(ChunkMesher, AdjacentFencesGrowConnectingRails) {
    subvox::world::VoxelMap voxels;
    placeVoxel(voxels, subvox::core::Cell3i{4, 0, 4}, subvox::world::SubVoxelPattern::Fence);
    placeVoxel(voxels, subvox::core::Cell3i{5, 0, 4}, subvox::world::SubVoxelPattern::Fence);
    placeVoxel(voxels, subvox::core::Cell3i{6, 0, 4}, subvox::world::SubVoxelPattern::Full);

    const subvox::world::ChunkSnapshot snapshot = subvox::world::ChunkSnapshot::capture(voxels, subvox::core::Cell3i{0, 0, 0});
    // Fences join each other but not the full block beside them.
    EXPECT_EQ(subvox::world::collectChunkColliders(snapshot).size(), (2u * (32u + 12u)) + 512u);
}

TEST(OccupancyGrid, LodLevelsScaleCellSize) {
    subvox::world::VoxelMap voxels;
    placeVoxel(voxels, subvox::core::Cell3i{1, 0, 0}, subvox::world::SubVoxelPattern::Pillar);
    const subvox::world::ChunkSnapshot snapshot = subvox::world::ChunkSnapshot::capture(voxels, subvox::core::Cell3i{0, 0, 0});

    const subvox::world::OccupancyGrid fine = subvox::world::OccupancyGrid::build(snapshot, 0u);
    EXPECT_EQ(fine.cellsPerAxis(), 128);
    EXPECT_EQ(fine.subVoxelsPerCell(), 1);
    EXPECT_EQ(fine.solidInteriorCount(), 8u);
    EXPECT_TRUE(fine.isSolid(11, 3, 3));
    EXPECT_FALSE(fine.isSolid(8, 0, 0));
    EXPECT_EQ(fine.owningVoxel(11, 3, 3), (subvox::core::Cell3i{1, 0, 0}));

    const subvox::world::OccupancyGrid coarse = subvox::world::OccupancyGrid::build(snapshot, 3u);
    EXPECT_EQ(coarse.cellsPerAxis(), 16);
    EXPECT_EQ(coarse.subVoxelsPerCell(), 8);
    EXPECT_EQ(coarse.solidInteriorCount(), 1u);
    EXPECT_TRUE(coarse.isSolid(1, 0, 0));
    EXPECT_EQ(coarse.materialAt(1, 0, 0), subvox::world::materialId(subvox::world::VoxelType::Stone));
}

TEST(OccupancyGrid, SnapshotCarriesHaloButCountsInteriorOnly) {
    subvox::world::VoxelMap voxels;
    placeVoxel(voxels, subvox::core::Cell3i{-1, 0, 0}, subvox::world::SubVoxelPattern::Full);
    placeVoxel(voxels, subvox::core::Cell3i{0, 0, 0}, subvox::world::SubVoxelPattern::Full);

    const subvox::world::ChunkSnapshot snapshot = subvox::world::ChunkSnapshot::capture(voxels, subvox::core::Cell3i{0, 0, 0});
    EXPECT_EQ(snapshot.voxelCount(), 1u);
    EXPECT_TRUE(snapshot.isPresent(-1, 0, 0));
    EXPECT_FALSE(snapshot.isPresent(-2, 0, 0));

    const subvox::world::OccupancyGrid grid = subvox::world::OccupancyGrid::build(snapshot, 0u);
    EXPECT_TRUE(grid.isSolid(-1, 0, 0));
    EXPECT_EQ(grid.solidInteriorCount(), 512u);
}
