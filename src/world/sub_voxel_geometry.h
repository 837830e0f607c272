#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>

// World SubVoxelGeometry subsystem
// Responsible for: the 8x8x8 occupancy of a voxel as a pure function of (pattern, rotation).
// Should NOT do: world placement, collider bookkeeping, or meshing.
namespace subvox::world {

constexpr int kSubVoxelsPerAxis = 8;
constexpr int kSubVoxelCount = kSubVoxelsPerAxis * kSubVoxelsPerAxis * kSubVoxelsPerAxis;
constexpr float kSubVoxelSize = 1.0f / static_cast<float>(kSubVoxelsPerAxis);

enum class SubVoxelPattern : std::uint8_t {
    Full = 0,
    // Thin slabs. PlatformXZ is the plain "Platform".
    PlatformXZ = 1,
    PlatformXY = 2,
    PlatformYZ = 3,
    // Stairs, named by ascending direction. StaircaseX is the plain "Staircase".
    StaircaseX = 4,
    StaircaseNegX = 5,
    StaircaseZ = 6,
    StaircaseNegZ = 7,
    Pillar = 8,
    // Neighbour-aware post and rails; see fenceGeometry().
    Fence = 9
};

constexpr std::size_t kSubVoxelPatternCount = 10;

[[nodiscard]] std::optional<SubVoxelPattern> decodePattern(std::uint8_t raw);
[[nodiscard]] std::optional<SubVoxelPattern> patternFromName(std::string_view name);
[[nodiscard]] const char* patternName(SubVoxelPattern pattern);

enum class RotationAxis : std::uint8_t {
    X = 0,
    Y = 1,
    Z = 2
};

[[nodiscard]] std::optional<RotationAxis> decodeRotationAxis(std::uint8_t raw);

// Quarter-turn rotation about one axis. The default is the identity about the vertical axis.
struct RotationState {
    RotationAxis axis = RotationAxis::Y;
    std::uint8_t quarterTurns = 0;

    constexpr bool operator==(const RotationState&) const = default;

    [[nodiscard]] static RotationState fromQuarterTurns(int turns, RotationAxis axis = RotationAxis::Y);
    // Accepts any multiple of 90, negative values included; nullopt otherwise.
    [[nodiscard]] static std::optional<RotationState> fromDegrees(std::int32_t degrees, RotationAxis axis = RotationAxis::Y);

    [[nodiscard]] int degrees() const;

    // Same axis: angles add modulo 360. Different axis: the newer rotation replaces this one.
    [[nodiscard]] RotationState compose(const RotationState& next) const;
};

struct SubVoxelCoord {
    int x = 0;
    int y = 0;
    int z = 0;

    constexpr bool operator==(const SubVoxelCoord&) const = default;
};

// Lazy, restartable walk over the set bits of a geometry in (y, z, x) order.
// Owns a copy of the 64-byte occupancy so it never dangles.
class OccupiedPositions {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = SubVoxelCoord;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = SubVoxelCoord;

        Iterator() = default;
        Iterator(const std::array<std::uint64_t, kSubVoxelsPerAxis>* layers, int layer);

        SubVoxelCoord operator*() const;
        Iterator& operator++();
        Iterator operator++(int);
        bool operator==(const Iterator& other) const;

    private:
        void skipEmptyLayers();

        const std::array<std::uint64_t, kSubVoxelsPerAxis>* m_layers = nullptr;
        int m_layer = kSubVoxelsPerAxis;
        std::uint64_t m_bits = 0;
    };

    explicit OccupiedPositions(const std::array<std::uint64_t, kSubVoxelsPerAxis>& layers);

    [[nodiscard]] Iterator begin() const;
    [[nodiscard]] Iterator end() const;

private:
    std::array<std::uint64_t, kSubVoxelsPerAxis> m_layers{};
};

// Eight Y layers, bit (z * 8 + x) of layer y marks sub-voxel (x, y, z).
class SubVoxelGeometry {
public:
    SubVoxelGeometry() = default;

    [[nodiscard]] static SubVoxelGeometry full();

    [[nodiscard]] bool isOccupied(int x, int y, int z) const;
    void setOccupied(int x, int y, int z);
    void clear(int x, int y, int z);
    void fillBox(int minX, int minY, int minZ, int maxXExclusive, int maxYExclusive, int maxZExclusive);

    [[nodiscard]] std::size_t countOccupied() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] OccupiedPositions occupiedPositions() const;
    [[nodiscard]] const std::array<std::uint64_t, kSubVoxelsPerAxis>& layers() const;

    [[nodiscard]] SubVoxelGeometry rotated(RotationAxis axis, int quarterTurns) const;
    [[nodiscard]] SubVoxelGeometry rotated(const RotationState& rotation) const;

    bool operator==(const SubVoxelGeometry&) const = default;

private:
    static bool inRange(int x, int y, int z);

    std::array<std::uint64_t, kSubVoxelsPerAxis> m_layers{};
};

struct FenceConnections {
    bool negX = false;
    bool posX = false;
    bool negZ = false;
    bool posZ = false;

    constexpr bool operator==(const FenceConnections&) const = default;
};

// Rotates a sub-voxel coordinate about the voxel centre (3.5, 3.5, 3.5).
[[nodiscard]] SubVoxelCoord rotatePoint(const SubVoxelCoord& point, RotationAxis axis, int quarterTurns);

// Unrotated base geometry. Fence yields the lone centre post.
[[nodiscard]] SubVoxelGeometry patternGeometry(SubVoxelPattern pattern);
[[nodiscard]] SubVoxelGeometry fenceGeometry(const FenceConnections& connections);

// Cached (pattern, rotation) lookup. Out-of-range enum values evaluate as Full.
// Fence ignores rotation.
[[nodiscard]] const SubVoxelGeometry& shapeGeometry(SubVoxelPattern pattern, const RotationState& rotation);

[[nodiscard]] bool isOccupied(SubVoxelPattern pattern, const RotationState& rotation, int sx, int sy, int sz);
[[nodiscard]] OccupiedPositions occupiedPositions(SubVoxelPattern pattern, const RotationState& rotation);

} // namespace subvox::world
