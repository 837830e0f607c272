#pragma once

#include "math/math.h"
#include "sim/collision.h"
#include "world/spatial_grid.h"

// Simulation CharacterMotion subsystem
// Responsible for: per-tick kinematic movement of player and NPC cylinders against the spatial grid.
// Should NOT do: read input, drive AI, or mutate colliders.
namespace subvox::sim {

struct MotionState {
    math::Vector3 position{};
    math::Vector3 velocity{};
    bool grounded = false;
};

struct HorizontalMoveResult {
    bool movedX = false;
    bool movedZ = false;
    bool steppedUp = false;
};

[[nodiscard]] float clampDeltaSeconds(float deltaSeconds, const CollisionConfig& config = {});

void applyGravity(MotionState& state, float deltaSeconds, const CollisionConfig& config = {});

// Returns false while airborne.
bool tryJump(MotionState& state, const CollisionConfig& config = {});

// Axis-separated: the X component is resolved first, then Z from wherever X left the body.
// A blocked axis is dropped while the other still applies, which slides the body along walls.
HorizontalMoveResult moveHorizontal(
    const world::SpatialGrid& grid,
    MotionState& state,
    const Cylinder& body,
    const math::Vector3& displacement,
    const CollisionConfig& config = {}
);

// Integrates vertical velocity for one tick, landing on ground or stopping under ceilings.
void settleVertical(
    const world::SpatialGrid& grid,
    MotionState& state,
    const Cylinder& body,
    float deltaSeconds,
    const CollisionConfig& config = {}
);

// Pushes two overlapping bodies apart horizontally, half the penetration each.
// Returns true when the bodies were overlapping.
bool separateBodies(math::Vector3& positionA, const Cylinder& bodyA, math::Vector3& positionB, const Cylinder& bodyB);

} // namespace subvox::sim
