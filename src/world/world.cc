#include "world/world.h"

#include "core/log.h"

#include <algorithm>
#include <utility>

namespace subvox::world {

namespace {

bool isOnBorder(const core::Cell3i& local, core::Dir6 dir) {
    switch (dir) {
    case core::Dir6::PosX: return local.x == kChunkSize - 1;
    case core::Dir6::NegX: return local.x == 0;
    case core::Dir6::PosY: return local.y == kChunkSize - 1;
    case core::Dir6::NegY: return local.y == 0;
    case core::Dir6::PosZ: return local.z == kChunkSize - 1;
    case core::Dir6::NegZ: return local.z == 0;
    }
    return false;
}

bool samePlacedVoxel(const PlacedVoxel& lhs, const PlacedVoxel& rhs) {
    return lhs.type == rhs.type &&
           lhs.shape.pattern == rhs.shape.pattern &&
           lhs.shape.rotation == rhs.shape.rotation &&
           lhs.shape.fellBack == rhs.shape.fellBack;
}

} // namespace

VoxelWorld::VoxelWorld(WorldOptions options)
    : m_options(options) {
    if (m_options.meshWorkerCount > 0) {
        m_meshWorker = std::make_unique<ChunkMeshWorker>(m_options.meshWorkerCount, m_palette, m_options.meshing);
    }
}

VoxelWorld::~VoxelWorld() {
    if (m_meshWorker) {
        m_meshWorker->shutdown();
    }
}

std::size_t VoxelWorld::loadVoxels(std::span<const VoxelRecord> records) {
    unload();

    for (const VoxelRecord& record : records) {
        placeVoxel(record);
        m_dirtyChunks.insert(chunkCoordOf(record.position));
    }

    processDirtyChunks();
    if (m_meshWorker) {
        m_meshWorker->waitForIdle();
        collectMeshResults();
    }

    const WorldStats loaded = stats();
    SUBVOX_LOGI("world") << "Loaded " << loaded.voxelCount << " voxels into " << loaded.chunkCount << " chunks, "
                         << loaded.colliderCount << " colliders";
    if (loaded.fallbackVoxelCount > 0) {
        SUBVOX_LOGW("world") << loaded.fallbackVoxelCount << " voxel(s) fell back to the Full pattern";
    }
    return m_voxels.size();
}

bool VoxelWorld::placeVoxel(const VoxelRecord& record) {
    PlacedVoxel placed{};
    placed.type = record.type;
    placed.shape = resolveVoxelShape(record);

    const auto existing = m_voxels.find(record.position);
    if (existing != m_voxels.end()) {
        if (samePlacedVoxel(existing->second, placed)) {
            return false;
        }
        existing->second = placed;
        return true;
    }
    m_voxels.emplace(record.position, placed);
    return true;
}

bool VoxelWorld::setVoxel(const VoxelRecord& record) {
    if (!placeVoxel(record)) {
        return false;
    }
    markDirtyAround(record.position);
    return true;
}

bool VoxelWorld::removeVoxel(const core::Cell3i& position) {
    if (m_voxels.erase(position) == 0) {
        return false;
    }
    markDirtyAround(position);
    return true;
}

void VoxelWorld::notifyVoxelsChanged(std::span<const core::Cell3i> positions) {
    for (const core::Cell3i& position : positions) {
        markDirtyAround(position);
    }
}

void VoxelWorld::markDirtyAround(const core::Cell3i& voxel) {
    const core::Cell3i chunkCoord = chunkCoordOf(voxel);
    const core::Cell3i local = localVoxelCoord(voxel);
    markChunkDirty(chunkCoord);
    for (const core::Dir6 dir : core::kAllDir6) {
        if (isOnBorder(local, dir)) {
            markChunkDirty(core::neighborCell(chunkCoord, dir));
        }
    }
}

void VoxelWorld::markChunkDirty(const core::Cell3i& chunkCoord) {
    m_dirtyChunks.insert(chunkCoord);
    // Any mesh still being built for this chunk is now out of date.
    const auto it = m_chunks.find(chunkCoord);
    if (it != m_chunks.end()) {
        it->second.setRequestedVersion(++m_nextVersion);
    }
}

void VoxelWorld::update() {
    if (m_meshWorker) {
        m_meshWorker->waitForIdle();
        collectMeshResults();
    }
    processDirtyChunks();
}

void VoxelWorld::processDirtyChunks() {
    if (m_dirtyChunks.empty()) {
        return;
    }
    std::set<core::Cell3i, core::Cell3iLess> dirty;
    dirty.swap(m_dirtyChunks);
    for (const core::Cell3i& chunkCoord : dirty) {
        rebuildChunk(chunkCoord);
    }
}

void VoxelWorld::rebuildChunk(const core::Cell3i& chunkCoord) {
    auto snapshot = std::make_shared<const ChunkSnapshot>(ChunkSnapshot::capture(m_voxels, chunkCoord));

    auto chunkIt = m_chunks.find(chunkCoord);
    if (snapshot->empty()) {
        if (chunkIt != m_chunks.end()) {
            releaseColliders(chunkIt->second);
            m_chunks.erase(chunkIt);
            SUBVOX_LOGD("world") << "Chunk (" << chunkCoord.x << ", " << chunkCoord.y << ", " << chunkCoord.z
                                 << ") emptied and released";
        }
        return;
    }

    if (chunkIt == m_chunks.end()) {
        chunkIt = m_chunks.emplace(chunkCoord, Chunk(chunkCoord)).first;
    }
    Chunk& chunk = chunkIt->second;
    const std::uint64_t version = ++m_nextVersion;
    chunk.setRequestedVersion(version);

    rebuildColliders(chunk, *snapshot);

    if (m_meshWorker) {
        m_meshWorker->submit(ChunkMeshJob{chunkCoord, version, snapshot});
    } else {
        chunk.applyMeshes(buildChunkLodMeshes(*snapshot, m_palette, m_options.meshing), version);
    }

    SUBVOX_LOGD("world") << "Rebuilt chunk (" << chunkCoord.x << ", " << chunkCoord.y << ", " << chunkCoord.z
                         << ") v" << version << ": " << snapshot->voxelCount() << " voxels, "
                         << chunk.colliderHandles().size() << " colliders"
                         << (m_meshWorker ? ", mesh queued" : "");
}

void VoxelWorld::rebuildColliders(Chunk& chunk, const ChunkSnapshot& snapshot) {
    releaseColliders(chunk);

    const std::vector<ChunkCollider> colliders = collectChunkColliders(snapshot);
    std::vector<ColliderHandle>& handles = chunk.colliderHandles();
    handles.reserve(colliders.size());
    std::size_t rejected = 0;
    for (const ChunkCollider& collider : colliders) {
        const ColliderHandle handle = allocateColliderHandle();
        if (!m_spatialGrid.insert(handle, collider.bounds)) {
            m_freeColliderHandles.push_back(handle);
            ++rejected;
            continue;
        }
        handles.push_back(handle);
    }

    if (rejected > 0) {
        const core::Cell3i& coord = chunk.coord();
        SUBVOX_LOGW("world") << "Chunk (" << coord.x << ", " << coord.y << ", " << coord.z << ") lies outside the collision grid; "
                             << rejected << " of " << colliders.size() << " colliders rejected";
    }
}

void VoxelWorld::releaseColliders(Chunk& chunk) {
    std::vector<ColliderHandle>& handles = chunk.colliderHandles();
    for (const ColliderHandle handle : handles) {
        if (m_spatialGrid.remove(handle)) {
            m_freeColliderHandles.push_back(handle);
        }
    }
    handles.clear();
}

ColliderHandle VoxelWorld::allocateColliderHandle() {
    if (!m_freeColliderHandles.empty()) {
        const ColliderHandle handle = m_freeColliderHandles.back();
        m_freeColliderHandles.pop_back();
        return handle;
    }
    return m_nextColliderHandle++;
}

void VoxelWorld::collectMeshResults() {
    std::vector<ChunkMeshResult> results = m_meshWorker->drainCompleted();
    for (ChunkMeshResult& result : results) {
        const auto it = m_chunks.find(result.chunkCoord);
        if (it == m_chunks.end() || it->second.requestedVersion() != result.version) {
            ++m_staleMeshResults;
            SUBVOX_LOGT("world") << "Discarded stale mesh for chunk (" << result.chunkCoord.x << ", "
                                 << result.chunkCoord.y << ", " << result.chunkCoord.z << ") v" << result.version;
            continue;
        }
        it->second.applyMeshes(std::move(result.meshes), result.version);
    }
}

std::size_t VoxelWorld::updateLods(const math::Vector3& cameraPosition) {
    std::size_t changed = 0;
    for (auto& [coord, chunk] : m_chunks) {
        if (chunk.updateLod(cameraPosition, m_options.lod)) {
            ++changed;
        }
    }
    return changed;
}

void VoxelWorld::unload() {
    if (m_meshWorker) {
        m_meshWorker->discardPending();
    }
    const std::size_t voxelCount = m_voxels.size();
    const std::size_t chunkCount = m_chunks.size();

    m_voxels.clear();
    m_chunks.clear();
    m_dirtyChunks.clear();
    m_spatialGrid.clear();
    m_freeColliderHandles.clear();
    m_nextColliderHandle = 0;

    if (voxelCount > 0 || chunkCount > 0) {
        SUBVOX_LOGI("world") << "Unloaded " << voxelCount << " voxels and " << chunkCount << " chunks";
    }
}

const PlacedVoxel* VoxelWorld::voxelAt(const core::Cell3i& position) const {
    const auto it = m_voxels.find(position);
    return it == m_voxels.end() ? nullptr : &it->second;
}

const Chunk* VoxelWorld::chunkAt(const core::Cell3i& chunkCoord) const {
    const auto it = m_chunks.find(chunkCoord);
    return it == m_chunks.end() ? nullptr : &it->second;
}

std::vector<core::Cell3i> VoxelWorld::chunkCoords() const {
    std::vector<core::Cell3i> coords;
    coords.reserve(m_chunks.size());
    for (const auto& [coord, chunk] : m_chunks) {
        coords.push_back(coord);
    }
    std::sort(coords.begin(), coords.end(), core::Cell3iLess{});
    return coords;
}

bool VoxelWorld::isChunkDirty(const core::Cell3i& chunkCoord) const {
    return m_dirtyChunks.count(chunkCoord) > 0;
}

WorldStats VoxelWorld::stats() const {
    WorldStats result{};
    result.voxelCount = m_voxels.size();
    result.chunkCount = m_chunks.size();
    result.colliderCount = m_spatialGrid.entryCount();
    result.dirtyChunkCount = m_dirtyChunks.size();
    result.staleMeshResults = m_staleMeshResults;
    for (const auto& [position, voxel] : m_voxels) {
        if (voxel.shape.fellBack) {
            ++result.fallbackVoxelCount;
        }
    }
    for (const auto& [coord, chunk] : m_chunks) {
        for (std::uint32_t lod = 0; lod < kChunkLodCount; ++lod) {
            result.quadCountPerLod[lod] += chunk.lodMesh(lod).quadCount();
        }
    }
    return result;
}

} // namespace subvox::world
