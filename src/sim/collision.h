#pragma once

#include "math/math.h"
#include "world/spatial_grid.h"

// Simulation Collision subsystem
// Responsible for: vertical-cylinder queries against the static sub-voxel boxes in the spatial grid.
// Should NOT do: integrate motion, own colliders, or resolve body-vs-body contacts.
namespace subvox::sim {

struct CollisionConfig {
    // One sub-voxel; anything taller blocks horizontal movement.
    float stepHeight = 0.125f;
    float groundEpsilon = 0.01f;
    float queryMargin = 0.05f;
    float gravity = -32.0f;
    float maxDeltaSeconds = 0.1f;
    float jumpVelocity = 8.0f;
};

// Upright cylinder centred on the body position.
struct Cylinder {
    float radius = 0.2f;
    float halfHeight = 0.4f;
};

struct CollisionResult {
    bool hasCollision = false;
    bool canStepUp = false;
    // Rise from currentFloorY to the tallest steppable box top.
    float stepUpHeight = 0.0f;
};

// Tests the cylinder at `position` against every box whose top lies above currentFloorY.
// Boxes at or below the floor are walkable ground and never block.
[[nodiscard]] CollisionResult checkCollision(
    const world::SpatialGrid& grid,
    const math::Vector3& position,
    const Cylinder& body,
    float currentFloorY,
    const CollisionConfig& config = {}
);

struct GroundProbe {
    bool grounded = false;
    float groundY = 0.0f;
};

// Downward probe for one tick of vertical travel from currentPosition to proposedPosition.
// A box counts as ground when the body bottom starts on or above its top and ends on or below it,
// both within groundEpsilon. The highest qualifying top wins.
[[nodiscard]] GroundProbe probeGround(
    const world::SpatialGrid& grid,
    const math::Vector3& currentPosition,
    const math::Vector3& proposedPosition,
    const Cylinder& body,
    const CollisionConfig& config = {}
);

// Mirror of probeGround for upward travel; reports the lowest box bottom the head would cross.
[[nodiscard]] GroundProbe probeCeiling(
    const world::SpatialGrid& grid,
    const math::Vector3& currentPosition,
    const math::Vector3& proposedPosition,
    const Cylinder& body,
    const CollisionConfig& config = {}
);

[[nodiscard]] bool circleOverlapsRectXZ(const math::Vector3& centre, float radius, const math::Aabb& box);

} // namespace subvox::sim
