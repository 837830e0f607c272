#include "world/spatial_grid.h"

#include "core/log.h"

#include <algorithm>
#include <cmath>

namespace subvox::world {

namespace {

std::optional<std::int32_t> worldToCellAxis(float value, float cellSize) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    const double cell = std::floor(static_cast<double>(value) / static_cast<double>(cellSize));
    if (cell < -static_cast<double>(kMaxSpatialCellCoordinate) ||
        cell > static_cast<double>(kMaxSpatialCellCoordinate)) {
        return std::nullopt;
    }
    return static_cast<std::int32_t>(cell);
}

// Unbounded floor of value / cellSize, or nullopt when value is not finite.
std::optional<double> rawCellAxis(float value, float cellSize) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return std::floor(static_cast<double>(value) / static_cast<double>(cellSize));
}

// Clamps [lo, hi] to the map range. Fails only when the span lies wholly outside it.
bool clampCellSpan(double lo, double hi, std::int32_t& outLo, std::int32_t& outHi) {
    const double limit = static_cast<double>(kMaxSpatialCellCoordinate);
    if (hi < -limit || lo > limit) {
        return false;
    }
    outLo = static_cast<std::int32_t>(std::max(lo, -limit));
    outHi = static_cast<std::int32_t>(std::min(hi, limit));
    return true;
}

std::uint64_t coveredCellCount(const core::Cell3i& minCell, const core::Cell3i& maxCell) {
    const std::uint64_t sizeX = static_cast<std::uint64_t>(maxCell.x - minCell.x) + 1u;
    const std::uint64_t sizeY = static_cast<std::uint64_t>(maxCell.y - minCell.y) + 1u;
    const std::uint64_t sizeZ = static_cast<std::uint64_t>(maxCell.z - minCell.z) + 1u;
    return sizeX * sizeY * sizeZ;
}

} // namespace

SpatialGrid::SpatialGrid(float cellSize)
    : m_cellSize((std::isfinite(cellSize) && cellSize > 0.0f) ? cellSize : kSpatialCellSize) {}

std::optional<core::Cell3i> SpatialGrid::worldToCell(const math::Vector3& position) const {
    const std::optional<std::int32_t> x = worldToCellAxis(position.x, m_cellSize);
    const std::optional<std::int32_t> y = worldToCellAxis(position.y, m_cellSize);
    const std::optional<std::int32_t> z = worldToCellAxis(position.z, m_cellSize);
    if (!x.has_value() || !y.has_value() || !z.has_value()) {
        return std::nullopt;
    }
    return core::Cell3i{*x, *y, *z};
}

bool SpatialGrid::cellRangeFor(const math::Aabb& box, core::Cell3i& outMin, core::Cell3i& outMax) const {
    if (!box.valid()) {
        return false;
    }
    const std::optional<core::Cell3i> minCell = worldToCell(box.min);
    const std::optional<core::Cell3i> maxCell = worldToCell(box.max);
    if (!minCell.has_value() || !maxCell.has_value()) {
        return false;
    }
    outMin = *minCell;
    outMax = *maxCell;
    return true;
}

bool SpatialGrid::queryCellRangeFor(const math::Aabb& box, core::Cell3i& outMin, core::Cell3i& outMax) const {
    if (!box.valid()) {
        return false;
    }
    const std::optional<double> minX = rawCellAxis(box.min.x, m_cellSize);
    const std::optional<double> minY = rawCellAxis(box.min.y, m_cellSize);
    const std::optional<double> minZ = rawCellAxis(box.min.z, m_cellSize);
    const std::optional<double> maxX = rawCellAxis(box.max.x, m_cellSize);
    const std::optional<double> maxY = rawCellAxis(box.max.y, m_cellSize);
    const std::optional<double> maxZ = rawCellAxis(box.max.z, m_cellSize);
    if (!minX || !minY || !minZ || !maxX || !maxY || !maxZ) {
        return false;
    }
    return clampCellSpan(*minX, *maxX, outMin.x, outMax.x) &&
           clampCellSpan(*minY, *maxY, outMin.y, outMax.y) &&
           clampCellSpan(*minZ, *maxZ, outMin.z, outMax.z);
}

bool SpatialGrid::insert(ColliderHandle handle, const math::Aabb& bounds) {
    Entry entry{};
    entry.bounds = bounds;
    if (!cellRangeFor(bounds, entry.minCell, entry.maxCell)) {
        SUBVOX_LOGT("spatial") << "Rejected collider " << handle << " with bounds ("
                               << bounds.min.x << ", " << bounds.min.y << ", " << bounds.min.z << ") - ("
                               << bounds.max.x << ", " << bounds.max.y << ", " << bounds.max.z << ")";
        return false;
    }

    const auto existing = m_entries.find(handle);
    if (existing != m_entries.end()) {
        unlinkEntry(handle, existing->second);
        m_entries.erase(existing);
    }

    for (std::int32_t y = entry.minCell.y; y <= entry.maxCell.y; ++y) {
        for (std::int32_t z = entry.minCell.z; z <= entry.maxCell.z; ++z) {
            for (std::int32_t x = entry.minCell.x; x <= entry.maxCell.x; ++x) {
                m_cells[core::Cell3i{x, y, z}].push_back(handle);
            }
        }
    }
    m_entries.emplace(handle, entry);
    return true;
}

void SpatialGrid::unlinkEntry(ColliderHandle handle, const Entry& entry) {
    for (std::int32_t y = entry.minCell.y; y <= entry.maxCell.y; ++y) {
        for (std::int32_t z = entry.minCell.z; z <= entry.maxCell.z; ++z) {
            for (std::int32_t x = entry.minCell.x; x <= entry.maxCell.x; ++x) {
                const auto cellIt = m_cells.find(core::Cell3i{x, y, z});
                if (cellIt == m_cells.end()) {
                    continue;
                }
                std::vector<ColliderHandle>& handles = cellIt->second;
                const auto handleIt = std::find(handles.begin(), handles.end(), handle);
                if (handleIt != handles.end()) {
                    *handleIt = handles.back();
                    handles.pop_back();
                }
                if (handles.empty()) {
                    m_cells.erase(cellIt);
                }
            }
        }
    }
}

bool SpatialGrid::remove(ColliderHandle handle) {
    const auto it = m_entries.find(handle);
    if (it == m_entries.end()) {
        return false;
    }
    unlinkEntry(handle, it->second);
    m_entries.erase(it);
    return true;
}

void SpatialGrid::clear() {
    m_cells.clear();
    m_entries.clear();
}

std::vector<ColliderHandle> SpatialGrid::queryAabb(const math::Vector3& min, const math::Vector3& max) const {
    return queryAabb(math::Aabb{min, max});
}

std::vector<ColliderHandle> SpatialGrid::queryAabb(const math::Aabb& box) const {
    std::vector<ColliderHandle> handles;
    queryAabb(box, handles);
    return handles;
}

void SpatialGrid::queryAabb(const math::Aabb& box, std::vector<ColliderHandle>& outHandles) const {
    outHandles.clear();
    if (m_entries.empty()) {
        return;
    }

    core::Cell3i minCell{};
    core::Cell3i maxCell{};
    if (!queryCellRangeFor(box, minCell, maxCell)) {
        return;
    }

    // Oversized boxes scan the entry table instead of walking mostly-empty cells.
    if (coveredCellCount(minCell, maxCell) > static_cast<std::uint64_t>(m_cells.size())) {
        for (const auto& [handle, entry] : m_entries) {
            if (entry.bounds.intersects(box)) {
                outHandles.push_back(handle);
            }
        }
        std::sort(outHandles.begin(), outHandles.end());
        return;
    }

    for (std::int32_t y = minCell.y; y <= maxCell.y; ++y) {
        for (std::int32_t z = minCell.z; z <= maxCell.z; ++z) {
            for (std::int32_t x = minCell.x; x <= maxCell.x; ++x) {
                const auto cellIt = m_cells.find(core::Cell3i{x, y, z});
                if (cellIt == m_cells.end()) {
                    continue;
                }
                for (const ColliderHandle handle : cellIt->second) {
                    const auto entryIt = m_entries.find(handle);
                    if (entryIt != m_entries.end() && entryIt->second.bounds.intersects(box)) {
                        outHandles.push_back(handle);
                    }
                }
            }
        }
    }

    std::sort(outHandles.begin(), outHandles.end());
    outHandles.erase(std::unique(outHandles.begin(), outHandles.end()), outHandles.end());
}

std::optional<math::Aabb> SpatialGrid::boundsOf(ColliderHandle handle) const {
    const auto it = m_entries.find(handle);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.bounds;
}

} // namespace subvox::world
