#include "world/sub_voxel_geometry.h"

#include <bit>

namespace subvox::world {

namespace {

constexpr std::size_t kRotationAxisCount = 3;
constexpr std::size_t kQuarterTurnCount = 4;

struct PatternNameEntry {
    std::string_view name;
    SubVoxelPattern pattern;
};

constexpr std::array<PatternNameEntry, 15> kPatternNames = {
    PatternNameEntry{"Full", SubVoxelPattern::Full},
    PatternNameEntry{"PlatformXZ", SubVoxelPattern::PlatformXZ},
    PatternNameEntry{"Platform", SubVoxelPattern::PlatformXZ},
    PatternNameEntry{"PlatformXY", SubVoxelPattern::PlatformXY},
    PatternNameEntry{"PlatformYZ", SubVoxelPattern::PlatformYZ},
    PatternNameEntry{"StaircaseX", SubVoxelPattern::StaircaseX},
    PatternNameEntry{"Staircase", SubVoxelPattern::StaircaseX},
    PatternNameEntry{"StaircaseNegX", SubVoxelPattern::StaircaseNegX},
    PatternNameEntry{"StaircaseZ", SubVoxelPattern::StaircaseZ},
    PatternNameEntry{"StaircaseNegZ", SubVoxelPattern::StaircaseNegZ},
    PatternNameEntry{"Pillar", SubVoxelPattern::Pillar},
    PatternNameEntry{"Fence", SubVoxelPattern::Fence},
    PatternNameEntry{"FenceX", SubVoxelPattern::Fence},
    PatternNameEntry{"FenceZ", SubVoxelPattern::Fence},
    PatternNameEntry{"FenceCorner", SubVoxelPattern::Fence},
};

int normalizeQuarterTurns(int turns) {
    const int wrapped = turns % 4;
    return wrapped < 0 ? wrapped + 4 : wrapped;
}

SubVoxelGeometry horizontalPlatform() {
    SubVoxelGeometry geometry;
    geometry.fillBox(0, 0, 0, 8, 1, 8);
    return geometry;
}

SubVoxelGeometry staircaseX() {
    SubVoxelGeometry geometry;
    for (int step = 0; step < kSubVoxelsPerAxis; ++step) {
        geometry.fillBox(step, 0, 0, step + 1, step + 1, kSubVoxelsPerAxis);
    }
    return geometry;
}

SubVoxelGeometry centrePost(int minY, int maxYExclusive) {
    SubVoxelGeometry geometry;
    geometry.fillBox(3, minY, 3, 5, maxYExclusive, 5);
    return geometry;
}

void addFenceRails(SubVoxelGeometry& geometry, int minX, int minZ, int maxXExclusive, int maxZExclusive) {
    // Bottom rail at y=2, top rail at y=5.
    geometry.fillBox(minX, 2, minZ, maxXExclusive, 3, maxZExclusive);
    geometry.fillBox(minX, 5, minZ, maxXExclusive, 6, maxZExclusive);
}

std::size_t shapeTableIndex(SubVoxelPattern pattern, RotationAxis axis, int quarterTurns) {
    return ((static_cast<std::size_t>(pattern) * kRotationAxisCount) + static_cast<std::size_t>(axis)) * kQuarterTurnCount +
           static_cast<std::size_t>(quarterTurns);
}

using ShapeTable = std::array<SubVoxelGeometry, kSubVoxelPatternCount * kRotationAxisCount * kQuarterTurnCount>;

ShapeTable buildShapeTable() {
    ShapeTable table{};
    for (std::size_t patternIndex = 0; patternIndex < kSubVoxelPatternCount; ++patternIndex) {
        const SubVoxelPattern pattern = static_cast<SubVoxelPattern>(patternIndex);
        const SubVoxelGeometry base = patternGeometry(pattern);
        for (std::size_t axisIndex = 0; axisIndex < kRotationAxisCount; ++axisIndex) {
            const RotationAxis axis = static_cast<RotationAxis>(axisIndex);
            for (int turns = 0; turns < static_cast<int>(kQuarterTurnCount); ++turns) {
                table[shapeTableIndex(pattern, axis, turns)] =
                    (pattern == SubVoxelPattern::Fence) ? base : base.rotated(axis, turns);
            }
        }
    }
    return table;
}

} // namespace

std::optional<SubVoxelPattern> decodePattern(std::uint8_t raw) {
    if (raw >= kSubVoxelPatternCount) {
        return std::nullopt;
    }
    return static_cast<SubVoxelPattern>(raw);
}

std::optional<SubVoxelPattern> patternFromName(std::string_view name) {
    for (const PatternNameEntry& entry : kPatternNames) {
        if (entry.name == name) {
            return entry.pattern;
        }
    }
    return std::nullopt;
}

const char* patternName(SubVoxelPattern pattern) {
    switch (pattern) {
    case SubVoxelPattern::Full: return "Full";
    case SubVoxelPattern::PlatformXZ: return "PlatformXZ";
    case SubVoxelPattern::PlatformXY: return "PlatformXY";
    case SubVoxelPattern::PlatformYZ: return "PlatformYZ";
    case SubVoxelPattern::StaircaseX: return "StaircaseX";
    case SubVoxelPattern::StaircaseNegX: return "StaircaseNegX";
    case SubVoxelPattern::StaircaseZ: return "StaircaseZ";
    case SubVoxelPattern::StaircaseNegZ: return "StaircaseNegZ";
    case SubVoxelPattern::Pillar: return "Pillar";
    case SubVoxelPattern::Fence: return "Fence";
    }
    return "Unknown";
}

std::optional<RotationAxis> decodeRotationAxis(std::uint8_t raw) {
    if (raw >= kRotationAxisCount) {
        return std::nullopt;
    }
    return static_cast<RotationAxis>(raw);
}

RotationState RotationState::fromQuarterTurns(int turns, RotationAxis axis) {
    return RotationState{axis, static_cast<std::uint8_t>(normalizeQuarterTurns(turns))};
}

std::optional<RotationState> RotationState::fromDegrees(std::int32_t degrees, RotationAxis axis) {
    if (degrees % 90 != 0) {
        return std::nullopt;
    }
    return fromQuarterTurns(static_cast<int>((degrees / 90) % 4), axis);
}

int RotationState::degrees() const {
    return static_cast<int>(quarterTurns % 4u) * 90;
}

RotationState RotationState::compose(const RotationState& next) const {
    if (axis == next.axis) {
        return fromQuarterTurns(static_cast<int>(quarterTurns) + static_cast<int>(next.quarterTurns), axis);
    }
    return fromQuarterTurns(static_cast<int>(next.quarterTurns), next.axis);
}

OccupiedPositions::Iterator::Iterator(const std::array<std::uint64_t, kSubVoxelsPerAxis>* layers, int layer)
    : m_layers(layers), m_layer(layer) {
    if (m_layers != nullptr && m_layer < kSubVoxelsPerAxis) {
        m_bits = (*m_layers)[static_cast<std::size_t>(m_layer)];
    }
    skipEmptyLayers();
}

SubVoxelCoord OccupiedPositions::Iterator::operator*() const {
    const int bit = std::countr_zero(m_bits);
    return SubVoxelCoord{bit & 7, m_layer, bit >> 3};
}

OccupiedPositions::Iterator& OccupiedPositions::Iterator::operator++() {
    m_bits &= m_bits - 1u;
    skipEmptyLayers();
    return *this;
}

OccupiedPositions::Iterator OccupiedPositions::Iterator::operator++(int) {
    Iterator previous = *this;
    ++(*this);
    return previous;
}

bool OccupiedPositions::Iterator::operator==(const Iterator& other) const {
    return m_layer == other.m_layer && m_bits == other.m_bits;
}

void OccupiedPositions::Iterator::skipEmptyLayers() {
    while (m_bits == 0u && m_layer < kSubVoxelsPerAxis) {
        ++m_layer;
        if (m_layer < kSubVoxelsPerAxis && m_layers != nullptr) {
            m_bits = (*m_layers)[static_cast<std::size_t>(m_layer)];
        }
    }
}

OccupiedPositions::OccupiedPositions(const std::array<std::uint64_t, kSubVoxelsPerAxis>& layers)
    : m_layers(layers) {}

OccupiedPositions::Iterator OccupiedPositions::begin() const {
    return Iterator(&m_layers, 0);
}

OccupiedPositions::Iterator OccupiedPositions::end() const {
    return Iterator(&m_layers, kSubVoxelsPerAxis);
}

SubVoxelGeometry SubVoxelGeometry::full() {
    SubVoxelGeometry geometry;
    geometry.m_layers.fill(~std::uint64_t{0});
    return geometry;
}

bool SubVoxelGeometry::inRange(int x, int y, int z) {
    return x >= 0 && x < kSubVoxelsPerAxis &&
           y >= 0 && y < kSubVoxelsPerAxis &&
           z >= 0 && z < kSubVoxelsPerAxis;
}

bool SubVoxelGeometry::isOccupied(int x, int y, int z) const {
    if (!inRange(x, y, z)) {
        return false;
    }
    const std::uint64_t bit = std::uint64_t{1} << static_cast<unsigned>((z * kSubVoxelsPerAxis) + x);
    return (m_layers[static_cast<std::size_t>(y)] & bit) != 0u;
}

void SubVoxelGeometry::setOccupied(int x, int y, int z) {
    if (!inRange(x, y, z)) {
        return;
    }
    m_layers[static_cast<std::size_t>(y)] |= std::uint64_t{1} << static_cast<unsigned>((z * kSubVoxelsPerAxis) + x);
}

void SubVoxelGeometry::clear(int x, int y, int z) {
    if (!inRange(x, y, z)) {
        return;
    }
    m_layers[static_cast<std::size_t>(y)] &= ~(std::uint64_t{1} << static_cast<unsigned>((z * kSubVoxelsPerAxis) + x));
}

void SubVoxelGeometry::fillBox(int minX, int minY, int minZ, int maxXExclusive, int maxYExclusive, int maxZExclusive) {
    for (int y = minY; y < maxYExclusive; ++y) {
        for (int z = minZ; z < maxZExclusive; ++z) {
            for (int x = minX; x < maxXExclusive; ++x) {
                setOccupied(x, y, z);
            }
        }
    }
}

std::size_t SubVoxelGeometry::countOccupied() const {
    std::size_t count = 0;
    for (const std::uint64_t layer : m_layers) {
        count += static_cast<std::size_t>(std::popcount(layer));
    }
    return count;
}

bool SubVoxelGeometry::empty() const {
    for (const std::uint64_t layer : m_layers) {
        if (layer != 0u) {
            return false;
        }
    }
    return true;
}

OccupiedPositions SubVoxelGeometry::occupiedPositions() const {
    return OccupiedPositions(m_layers);
}

const std::array<std::uint64_t, kSubVoxelsPerAxis>& SubVoxelGeometry::layers() const {
    return m_layers;
}

SubVoxelGeometry SubVoxelGeometry::rotated(RotationAxis axis, int quarterTurns) const {
    const int turns = normalizeQuarterTurns(quarterTurns);
    if (turns == 0) {
        return *this;
    }

    SubVoxelGeometry result;
    for (const SubVoxelCoord& point : occupiedPositions()) {
        const SubVoxelCoord rotatedPoint = rotatePoint(point, axis, turns);
        result.setOccupied(rotatedPoint.x, rotatedPoint.y, rotatedPoint.z);
    }
    return result;
}

SubVoxelGeometry SubVoxelGeometry::rotated(const RotationState& rotation) const {
    return rotated(rotation.axis, static_cast<int>(rotation.quarterTurns));
}

SubVoxelCoord rotatePoint(const SubVoxelCoord& point, RotationAxis axis, int quarterTurns) {
    // Doubled coordinates keep the 3.5 centre on the integer lattice.
    const int cx = (point.x * 2) - 7;
    const int cy = (point.y * 2) - 7;
    const int cz = (point.z * 2) - 7;

    int rx = cx;
    int ry = cy;
    int rz = cz;
    const int turns = normalizeQuarterTurns(quarterTurns);
    switch (axis) {
    case RotationAxis::X:
        if (turns == 1) { ry = -cz; rz = cy; }
        if (turns == 2) { ry = -cy; rz = -cz; }
        if (turns == 3) { ry = cz; rz = -cy; }
        break;
    case RotationAxis::Y:
        if (turns == 1) { rx = cz; rz = -cx; }
        if (turns == 2) { rx = -cx; rz = -cz; }
        if (turns == 3) { rx = -cz; rz = cx; }
        break;
    case RotationAxis::Z:
        if (turns == 1) { rx = -cy; ry = cx; }
        if (turns == 2) { rx = -cx; ry = -cy; }
        if (turns == 3) { rx = cy; ry = -cx; }
        break;
    }

    return SubVoxelCoord{(rx + 7) / 2, (ry + 7) / 2, (rz + 7) / 2};
}

SubVoxelGeometry patternGeometry(SubVoxelPattern pattern) {
    switch (pattern) {
    case SubVoxelPattern::Full:
        return SubVoxelGeometry::full();
    case SubVoxelPattern::PlatformXZ:
        return horizontalPlatform();
    case SubVoxelPattern::PlatformXY:
        return horizontalPlatform().rotated(RotationAxis::X, 1);
    case SubVoxelPattern::PlatformYZ:
        return horizontalPlatform().rotated(RotationAxis::Z, 1);
    case SubVoxelPattern::StaircaseX:
        return staircaseX();
    case SubVoxelPattern::StaircaseNegX:
        return staircaseX().rotated(RotationAxis::Y, 2);
    case SubVoxelPattern::StaircaseZ:
        return staircaseX().rotated(RotationAxis::Y, 1);
    case SubVoxelPattern::StaircaseNegZ:
        return staircaseX().rotated(RotationAxis::Y, 3);
    case SubVoxelPattern::Pillar:
        return centrePost(3, 5);
    case SubVoxelPattern::Fence:
        return fenceGeometry(FenceConnections{});
    }
    return SubVoxelGeometry::full();
}

SubVoxelGeometry fenceGeometry(const FenceConnections& connections) {
    SubVoxelGeometry geometry = centrePost(0, kSubVoxelsPerAxis);
    if (connections.negX) {
        addFenceRails(geometry, 0, 3, 3, 5);
    }
    if (connections.posX) {
        addFenceRails(geometry, 5, 3, 8, 5);
    }
    if (connections.negZ) {
        addFenceRails(geometry, 3, 0, 5, 3);
    }
    if (connections.posZ) {
        addFenceRails(geometry, 3, 5, 5, 8);
    }
    return geometry;
}

const SubVoxelGeometry& shapeGeometry(SubVoxelPattern pattern, const RotationState& rotation) {
    static const ShapeTable kShapes = buildShapeTable();

    if (static_cast<std::size_t>(pattern) >= kSubVoxelPatternCount ||
        static_cast<std::size_t>(rotation.axis) >= kRotationAxisCount) {
        return kShapes[shapeTableIndex(SubVoxelPattern::Full, RotationAxis::Y, 0)];
    }
    const int turns = static_cast<int>(rotation.quarterTurns % kQuarterTurnCount);
    return kShapes[shapeTableIndex(pattern, rotation.axis, turns)];
}

bool isOccupied(SubVoxelPattern pattern, const RotationState& rotation, int sx, int sy, int sz) {
    return shapeGeometry(pattern, rotation).isOccupied(sx, sy, sz);
}

OccupiedPositions occupiedPositions(SubVoxelPattern pattern, const RotationState& rotation) {
    return shapeGeometry(pattern, rotation).occupiedPositions();
}

} // namespace subvox::world
