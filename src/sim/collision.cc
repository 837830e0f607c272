#include "sim/collision.h"

#include <algorithm>
#include <vector>

namespace subvox::sim {

namespace {

math::Aabb horizontalQueryBox(const math::Vector3& position, float reach, float minY, float maxY) {
    return math::Aabb{
        math::Vector3{position.x - reach, minY, position.z - reach},
        math::Vector3{position.x + reach, maxY, position.z + reach}
    };
}

} // namespace

bool circleOverlapsRectXZ(const math::Vector3& centre, float radius, const math::Aabb& box) {
    const float closestX = std::clamp(centre.x, box.min.x, box.max.x);
    const float closestZ = std::clamp(centre.z, box.min.z, box.max.z);
    const float dx = centre.x - closestX;
    const float dz = centre.z - closestZ;
    return ((dx * dx) + (dz * dz)) < (radius * radius);
}

CollisionResult checkCollision(
    const world::SpatialGrid& grid,
    const math::Vector3& position,
    const Cylinder& body,
    float currentFloorY,
    const CollisionConfig& config
) {
    CollisionResult result{};
    const float bottom = position.y - body.halfHeight;
    const float top = position.y + body.halfHeight;
    const float reach = body.radius + config.queryMargin;

    std::vector<world::ColliderHandle> candidates;
    grid.queryAabb(horizontalQueryBox(position, reach, bottom, top), candidates);

    for (const world::ColliderHandle handle : candidates) {
        const std::optional<math::Aabb> box = grid.boundsOf(handle);
        if (!box.has_value()) {
            continue;
        }
        if (box->max.y <= currentFloorY + config.groundEpsilon) {
            continue;
        }
        if (!(box->min.y < top && box->max.y > bottom)) {
            continue;
        }
        if (!circleOverlapsRectXZ(position, body.radius, *box)) {
            continue;
        }

        const float rise = box->max.y - currentFloorY;
        if (rise <= config.stepHeight) {
            result.canStepUp = true;
            result.stepUpHeight = std::max(result.stepUpHeight, rise);
        } else {
            result.hasCollision = true;
        }
    }

    if (result.hasCollision) {
        result.canStepUp = false;
        result.stepUpHeight = 0.0f;
    }
    return result;
}

GroundProbe probeGround(
    const world::SpatialGrid& grid,
    const math::Vector3& currentPosition,
    const math::Vector3& proposedPosition,
    const Cylinder& body,
    const CollisionConfig& config
) {
    GroundProbe probe{};
    const float currentBottom = currentPosition.y - body.halfHeight;
    const float newBottom = proposedPosition.y - body.halfHeight;
    const float reach = body.radius + config.queryMargin;
    const float minY = std::min(currentBottom, newBottom) - config.groundEpsilon;
    const float maxY = std::max(currentBottom, newBottom) + config.groundEpsilon;

    std::vector<world::ColliderHandle> candidates;
    grid.queryAabb(horizontalQueryBox(proposedPosition, reach, minY, maxY), candidates);

    for (const world::ColliderHandle handle : candidates) {
        const std::optional<math::Aabb> box = grid.boundsOf(handle);
        if (!box.has_value() || !circleOverlapsRectXZ(proposedPosition, body.radius, *box)) {
            continue;
        }
        const float boxTop = box->max.y;
        if (currentBottom >= boxTop - config.groundEpsilon && newBottom <= boxTop + config.groundEpsilon) {
            if (!probe.grounded || boxTop > probe.groundY) {
                probe.grounded = true;
                probe.groundY = boxTop;
            }
        }
    }
    return probe;
}

GroundProbe probeCeiling(
    const world::SpatialGrid& grid,
    const math::Vector3& currentPosition,
    const math::Vector3& proposedPosition,
    const Cylinder& body,
    const CollisionConfig& config
) {
    GroundProbe probe{};
    const float currentTop = currentPosition.y + body.halfHeight;
    const float newTop = proposedPosition.y + body.halfHeight;
    const float reach = body.radius + config.queryMargin;
    const float minY = std::min(currentTop, newTop) - config.groundEpsilon;
    const float maxY = std::max(currentTop, newTop) + config.groundEpsilon;

    std::vector<world::ColliderHandle> candidates;
    grid.queryAabb(horizontalQueryBox(proposedPosition, reach, minY, maxY), candidates);

    for (const world::ColliderHandle handle : candidates) {
        const std::optional<math::Aabb> box = grid.boundsOf(handle);
        if (!box.has_value() || !circleOverlapsRectXZ(proposedPosition, body.radius, *box)) {
            continue;
        }
        const float boxBottom = box->min.y;
        if (currentTop <= boxBottom + config.groundEpsilon && newTop >= boxBottom - config.groundEpsilon) {
            if (!probe.grounded || boxBottom < probe.groundY) {
                probe.grounded = true;
                probe.groundY = boxBottom;
            }
        }
    }
    return probe;
}

} // namespace subvox::sim
