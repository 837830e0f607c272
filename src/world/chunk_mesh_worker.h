#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

#include "core/grid3.h"
#include "world/chunk_mesher.h"
#include "world/occupancy_grid.h"
#include "world/palette.h"

// World ChunkMeshWorker subsystem
// Responsible for: building chunk LOD meshes off the main thread from immutable snapshots.
// Should NOT do: touch live world state, the spatial grid, or chunk render state.
namespace subvox::world {

struct ChunkMeshJob {
    core::Cell3i chunkCoord{};
    std::uint64_t version = 0;
    std::shared_ptr<const ChunkSnapshot> snapshot;
};

struct ChunkMeshResult {
    core::Cell3i chunkCoord{};
    std::uint64_t version = 0;
    ChunkLodMeshes meshes{};
};

class ChunkMeshWorker {
public:
    ChunkMeshWorker(std::size_t workerCount, const MaterialPalette& palette, MeshingOptions options = {});
    ~ChunkMeshWorker();

    ChunkMeshWorker(const ChunkMeshWorker&) = delete;
    ChunkMeshWorker& operator=(const ChunkMeshWorker&) = delete;

    // A queued job for the same chunk that has not started yet is replaced.
    void submit(ChunkMeshJob job);

    // Main thread only. Returns every result finished since the last call, in completion order.
    [[nodiscard]] std::vector<ChunkMeshResult> drainCompleted();

    // Blocks until the queue is empty and no job is running.
    void waitForIdle();

    // Drops queued jobs and undrained results. Jobs already running still finish.
    void discardPending();

    void shutdown();

    [[nodiscard]] std::size_t workerCount() const { return m_threads.size(); }
    [[nodiscard]] std::size_t pendingCount() const;

private:
    void workerLoop(std::stop_token stop);

    MaterialPalette m_palette;
    MeshingOptions m_options;

    mutable std::mutex m_mutex;
    std::condition_variable_any m_jobAvailable;
    std::condition_variable m_idle;
    std::deque<ChunkMeshJob> m_jobs;
    std::vector<ChunkMeshResult> m_completed;
    std::size_t m_inFlight = 0;
    bool m_stopping = false;

    std::vector<std::jthread> m_threads;
};

} // namespace subvox::world
