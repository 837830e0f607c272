#include "world/voxel.h"

#include "core/log.h"

namespace subvox::world {

namespace {

constexpr float kVoxelHalfExtent = 0.5f;

} // namespace

VoxelRecord makeVoxelRecord(
    const core::Cell3i& position,
    SubVoxelPattern pattern,
    VoxelType type,
    RotationState rotation
) {
    VoxelRecord record{};
    record.position = position;
    record.type = type;
    record.patternTag = static_cast<std::uint8_t>(pattern);
    record.rotationAxisTag = static_cast<std::uint8_t>(rotation.axis);
    record.rotationDegrees = rotation.degrees();
    return record;
}

VoxelShape resolveVoxelShape(const VoxelRecord& record) {
    VoxelShape shape{};

    const std::optional<SubVoxelPattern> pattern = decodePattern(record.patternTag);
    if (!pattern.has_value()) {
        SUBVOX_LOGW("geometry") << "Voxel (" << record.position.x << ", " << record.position.y << ", "
                                << record.position.z << ") has unknown pattern tag "
                                << static_cast<int>(record.patternTag) << "; using Full";
        shape.fellBack = true;
        return shape;
    }

    const std::optional<RotationAxis> axis = decodeRotationAxis(record.rotationAxisTag);
    const std::optional<RotationState> rotation = axis.has_value()
        ? RotationState::fromDegrees(record.rotationDegrees, *axis)
        : std::nullopt;
    if (!rotation.has_value()) {
        SUBVOX_LOGW("geometry") << "Voxel (" << record.position.x << ", " << record.position.y << ", "
                                << record.position.z << ") has invalid rotation (axis "
                                << static_cast<int>(record.rotationAxisTag) << ", " << record.rotationDegrees
                                << " deg); using Full";
        shape.fellBack = true;
        return shape;
    }

    shape.pattern = *pattern;
    shape.rotation = *rotation;
    return shape;
}

math::Aabb voxelWorldBounds(const core::Cell3i& voxel) {
    const math::Vector3 centre{
        static_cast<float>(voxel.x),
        static_cast<float>(voxel.y),
        static_cast<float>(voxel.z)
    };
    const math::Vector3 half{kVoxelHalfExtent, kVoxelHalfExtent, kVoxelHalfExtent};
    return math::Aabb{centre - half, centre + half};
}

math::Aabb subVoxelWorldBounds(const core::Cell3i& voxel, const SubVoxelCoord& subVoxel) {
    const math::Vector3 origin = voxelWorldBounds(voxel).min;
    const math::Vector3 min{
        origin.x + (static_cast<float>(subVoxel.x) * kSubVoxelSize),
        origin.y + (static_cast<float>(subVoxel.y) * kSubVoxelSize),
        origin.z + (static_cast<float>(subVoxel.z) * kSubVoxelSize)
    };
    return math::Aabb{min, min + math::Vector3{kSubVoxelSize, kSubVoxelSize, kSubVoxelSize}};
}

} // namespace subvox::world
