#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "core/grid3.h"
#include "math/math.h"
#include "world/chunk_mesher.h"
#include "world/spatial_grid.h"

// World Chunk subsystem
// Responsible for: per-chunk render state (LOD meshes, active level, rebuild versions, owned colliders).
// Should NOT do: store voxels, build meshes, or talk to the renderer.
namespace subvox::world {

struct LodConfig {
    // Distance at which level i hands over to level i + 1.
    std::array<float, kChunkLodCount - 1> distanceThresholds{20.0f, 50.0f, 100.0f};
    // A level change needs the distance to clear a threshold by this much.
    float hysteresis = 2.0f;
};

// Steps outward while the distance is past the current level's threshold plus the band,
// and inward while it is short of the previous threshold minus the band.
[[nodiscard]] std::uint32_t selectLodLevel(float distance, std::uint32_t currentLevel, const LodConfig& config = {});

class Chunk {
public:
    explicit Chunk(const core::Cell3i& coord);

    [[nodiscard]] const core::Cell3i& coord() const { return m_coord; }
    [[nodiscard]] const math::Vector3& centre() const { return m_centre; }

    [[nodiscard]] std::uint32_t activeLod() const { return m_activeLod; }
    // Null while the active level has no geometry; the renderer skips such chunks.
    [[nodiscard]] const ChunkMeshData* activeMesh() const;
    [[nodiscard]] const ChunkMeshData& lodMesh(std::uint32_t lodLevel) const;
    [[nodiscard]] const ChunkLodMeshes& lodMeshes() const { return m_meshes; }
    [[nodiscard]] bool hasMesh() const { return m_hasMesh; }

    // Returns true when the active level changed.
    bool updateLod(const math::Vector3& cameraPosition, const LodConfig& config);

    void applyMeshes(ChunkLodMeshes meshes, std::uint64_t version);

    [[nodiscard]] std::uint64_t requestedVersion() const { return m_requestedVersion; }
    [[nodiscard]] std::uint64_t meshVersion() const { return m_meshVersion; }
    void setRequestedVersion(std::uint64_t version) { m_requestedVersion = version; }

    [[nodiscard]] std::vector<ColliderHandle>& colliderHandles() { return m_colliderHandles; }
    [[nodiscard]] const std::vector<ColliderHandle>& colliderHandles() const { return m_colliderHandles; }

private:
    core::Cell3i m_coord{};
    math::Vector3 m_centre{};
    ChunkLodMeshes m_meshes{};
    bool m_hasMesh = false;
    std::uint32_t m_activeLod = 0;
    std::uint64_t m_requestedVersion = 0;
    std::uint64_t m_meshVersion = 0;
    std::vector<ColliderHandle> m_colliderHandles;
};

} // namespace subvox::world
