#include "world/chunk_mesh_worker.h"

#include "core/log.h"

#include <algorithm>
#include <utility>

namespace subvox::world {

ChunkMeshWorker::ChunkMeshWorker(std::size_t workerCount, const MaterialPalette& palette, MeshingOptions options)
    : m_palette(palette),
      m_options(options) {
    const std::size_t threadCount = std::max<std::size_t>(workerCount, 1u);
    m_threads.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        m_threads.emplace_back([this](std::stop_token stop) { workerLoop(stop); });
    }
    SUBVOX_LOGD("mesher") << "Mesh worker pool started with " << threadCount << " thread(s)";
}

ChunkMeshWorker::~ChunkMeshWorker() {
    shutdown();
}

void ChunkMeshWorker::submit(ChunkMeshJob job) {
    if (!job.snapshot) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            return;
        }
        const auto queued = std::find_if(m_jobs.begin(), m_jobs.end(), [&job](const ChunkMeshJob& pending) {
            return pending.chunkCoord == job.chunkCoord;
        });
        if (queued != m_jobs.end()) {
            *queued = std::move(job);
        } else {
            m_jobs.push_back(std::move(job));
        }
    }
    m_jobAvailable.notify_one();
}

std::vector<ChunkMeshResult> ChunkMeshWorker::drainCompleted() {
    std::vector<ChunkMeshResult> results;
    std::lock_guard<std::mutex> lock(m_mutex);
    results.swap(m_completed);
    return results;
}

void ChunkMeshWorker::waitForIdle() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle.wait(lock, [this]() {
        return m_stopping || (m_jobs.empty() && m_inFlight == 0);
    });
}

void ChunkMeshWorker::discardPending() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_jobs.clear();
    m_completed.clear();
}

void ChunkMeshWorker::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            return;
        }
        m_stopping = true;
        m_jobs.clear();
    }
    m_jobAvailable.notify_all();
    m_idle.notify_all();
    m_threads.clear();
}

std::size_t ChunkMeshWorker::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.size() + m_inFlight;
}

void ChunkMeshWorker::workerLoop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        ChunkMeshJob job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_jobAvailable.wait(lock, stop, [this]() {
                return m_stopping || !m_jobs.empty();
            });
            if (m_stopping || stop.stop_requested()) {
                return;
            }
            if (m_jobs.empty()) {
                continue;
            }
            job = std::move(m_jobs.front());
            m_jobs.pop_front();
            ++m_inFlight;
        }

        ChunkMeshResult result{};
        result.chunkCoord = job.chunkCoord;
        result.version = job.version;
        result.meshes = buildChunkLodMeshes(*job.snapshot, m_palette, m_options);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_completed.push_back(std::move(result));
            --m_inFlight;
        }
        m_idle.notify_all();
    }
}

} // namespace subvox::world
