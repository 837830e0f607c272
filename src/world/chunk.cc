#include "world/chunk.h"

#include "world/voxel_map.h"

#include <utility>

namespace subvox::world {

std::uint32_t selectLodLevel(float distance, std::uint32_t currentLevel, const LodConfig& config) {
    std::uint32_t level = currentLevel < kChunkLodCount ? currentLevel : kChunkLodCount - 1u;
    while (level + 1u < kChunkLodCount && distance >= config.distanceThresholds[level] + config.hysteresis) {
        ++level;
    }
    while (level > 0u && distance < config.distanceThresholds[level - 1u] - config.hysteresis) {
        --level;
    }
    return level;
}

Chunk::Chunk(const core::Cell3i& coord)
    : m_coord(coord) {
    // Voxel p spans [p - 0.5, p + 0.5], so the chunk spans [origin - 0.5, origin + size - 0.5].
    const core::Cell3i origin = chunkOrigin(coord);
    const float halfSpan = (static_cast<float>(kChunkSize) * 0.5f) - 0.5f;
    m_centre = math::Vector3{
        static_cast<float>(origin.x) + halfSpan,
        static_cast<float>(origin.y) + halfSpan,
        static_cast<float>(origin.z) + halfSpan
    };
}

const ChunkMeshData* Chunk::activeMesh() const {
    if (!m_hasMesh) {
        return nullptr;
    }
    const ChunkMeshData& mesh = m_meshes.lodMeshes[m_activeLod];
    return mesh.empty() ? nullptr : &mesh;
}

const ChunkMeshData& Chunk::lodMesh(std::uint32_t lodLevel) const {
    return m_meshes.lodMeshes[lodLevel < kChunkLodCount ? lodLevel : kChunkLodCount - 1u];
}

bool Chunk::updateLod(const math::Vector3& cameraPosition, const LodConfig& config) {
    const std::uint32_t nextLod = selectLodLevel(math::distance(cameraPosition, m_centre), m_activeLod, config);
    if (nextLod == m_activeLod) {
        return false;
    }
    m_activeLod = nextLod;
    return true;
}

void Chunk::applyMeshes(ChunkLodMeshes meshes, std::uint64_t version) {
    m_meshes = std::move(meshes);
    m_meshVersion = version;
    m_hasMesh = true;
}

} // namespace subvox::world
