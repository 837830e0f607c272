#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "core/grid3.h"
#include "math/math.h"

// World SpatialGrid subsystem
// Responsible for: mapping fixed-size world cells to the collider handles whose bounds overlap them.
// Should NOT do: decide what a collider is, resolve collisions, or own voxel data.
namespace subvox::world {

using ColliderHandle = std::uint32_t;

constexpr float kSpatialCellSize = 1.0f;
// Cells beyond this magnitude are treated as outside the map.
constexpr std::int32_t kMaxSpatialCellCoordinate = 1 << 20;

class SpatialGrid {
public:
    explicit SpatialGrid(float cellSize = kSpatialCellSize);

    // Returns false and leaves the grid untouched for non-finite or out-of-range bounds.
    // Rejections are only traced; callers decide how loudly to report them.
    // Re-inserting an existing handle replaces its previous bounds.
    bool insert(ColliderHandle handle, const math::Aabb& bounds);
    bool remove(ColliderHandle handle);
    void clear();

    // Every handle whose bounds intersect [min, max], each reported once in ascending order.
    // Non-finite boxes and boxes entirely outside the map yield nothing.
    [[nodiscard]] std::vector<ColliderHandle> queryAabb(const math::Vector3& min, const math::Vector3& max) const;
    [[nodiscard]] std::vector<ColliderHandle> queryAabb(const math::Aabb& box) const;
    // Allocation-free variant for per-tick callers; clears outHandles first.
    void queryAabb(const math::Aabb& box, std::vector<ColliderHandle>& outHandles) const;

    [[nodiscard]] std::optional<math::Aabb> boundsOf(ColliderHandle handle) const;
    [[nodiscard]] std::optional<core::Cell3i> worldToCell(const math::Vector3& position) const;

    [[nodiscard]] std::size_t entryCount() const { return m_entries.size(); }
    [[nodiscard]] std::size_t cellCount() const { return m_cells.size(); }
    [[nodiscard]] float cellSize() const { return m_cellSize; }

private:
    struct Entry {
        math::Aabb bounds{};
        core::Cell3i minCell{};
        core::Cell3i maxCell{};
    };

    [[nodiscard]] bool cellRangeFor(const math::Aabb& box, core::Cell3i& outMin, core::Cell3i& outMax) const;
    // Like cellRangeFor, but clips a box that straddles the map edge instead of rejecting it.
    [[nodiscard]] bool queryCellRangeFor(const math::Aabb& box, core::Cell3i& outMin, core::Cell3i& outMax) const;
    void unlinkEntry(ColliderHandle handle, const Entry& entry);

    float m_cellSize = kSpatialCellSize;
    std::unordered_map<core::Cell3i, std::vector<ColliderHandle>, core::Cell3iHash> m_cells;
    std::unordered_map<ColliderHandle, Entry> m_entries;
};

} // namespace subvox::world
