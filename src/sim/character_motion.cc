#include "sim/character_motion.h"

#include <algorithm>
#include <cmath>

namespace subvox::sim {

namespace {

constexpr float kMinSeparationDistance = 0.001f;

bool tryAxisMove(
    const world::SpatialGrid& grid,
    MotionState& state,
    const Cylinder& body,
    const math::Vector3& axisDisplacement,
    const CollisionConfig& config,
    bool& outSteppedUp
) {
    const float currentFloorY = state.position.y - body.halfHeight;
    math::Vector3 candidate = state.position + axisDisplacement;
    const CollisionResult result = checkCollision(grid, candidate, body, currentFloorY, config);
    if (result.hasCollision) {
        return false;
    }
    if (result.canStepUp) {
        candidate.y += result.stepUpHeight;
        outSteppedUp = true;
    }
    state.position = candidate;
    return true;
}

} // namespace

float clampDeltaSeconds(float deltaSeconds, const CollisionConfig& config) {
    if (!std::isfinite(deltaSeconds) || deltaSeconds <= 0.0f) {
        return 0.0f;
    }
    return std::min(deltaSeconds, config.maxDeltaSeconds);
}

void applyGravity(MotionState& state, float deltaSeconds, const CollisionConfig& config) {
    state.velocity.y += config.gravity * clampDeltaSeconds(deltaSeconds, config);
}

bool tryJump(MotionState& state, const CollisionConfig& config) {
    if (!state.grounded) {
        return false;
    }
    state.velocity.y = config.jumpVelocity;
    state.grounded = false;
    return true;
}

HorizontalMoveResult moveHorizontal(
    const world::SpatialGrid& grid,
    MotionState& state,
    const Cylinder& body,
    const math::Vector3& displacement,
    const CollisionConfig& config
) {
    HorizontalMoveResult result{};
    if (displacement.x != 0.0f) {
        result.movedX = tryAxisMove(
            grid, state, body, math::Vector3{displacement.x, 0.0f, 0.0f}, config, result.steppedUp);
    }
    if (displacement.z != 0.0f) {
        result.movedZ = tryAxisMove(
            grid, state, body, math::Vector3{0.0f, 0.0f, displacement.z}, config, result.steppedUp);
    }
    return result;
}

void settleVertical(
    const world::SpatialGrid& grid,
    MotionState& state,
    const Cylinder& body,
    float deltaSeconds,
    const CollisionConfig& config
) {
    const float dt = clampDeltaSeconds(deltaSeconds, config);
    math::Vector3 proposed = state.position;
    proposed.y += state.velocity.y * dt;

    if (state.velocity.y <= 0.0f) {
        const GroundProbe ground = probeGround(grid, state.position, proposed, body, config);
        if (ground.grounded) {
            proposed.y = ground.groundY + body.halfHeight;
            state.velocity.y = 0.0f;
            state.grounded = true;
        } else {
            state.grounded = false;
        }
    } else {
        state.grounded = false;
        const GroundProbe ceiling = probeCeiling(grid, state.position, proposed, body, config);
        if (ceiling.grounded) {
            proposed.y = ceiling.groundY - body.halfHeight;
            state.velocity.y = 0.0f;
        }
    }

    state.position = proposed;
}

bool separateBodies(math::Vector3& positionA, const Cylinder& bodyA, math::Vector3& positionB, const Cylinder& bodyB) {
    const float verticalGap = std::fabs(positionA.y - positionB.y);
    if (verticalGap >= bodyA.halfHeight + bodyB.halfHeight) {
        return false;
    }

    const float dx = positionB.x - positionA.x;
    const float dz = positionB.z - positionA.z;
    const float distance = std::sqrt((dx * dx) + (dz * dz));
    const float minDistance = bodyA.radius + bodyB.radius;
    if (distance >= minDistance) {
        return false;
    }

    float dirX = 1.0f;
    float dirZ = 0.0f;
    if (distance >= kMinSeparationDistance) {
        dirX = dx / distance;
        dirZ = dz / distance;
    }

    const float halfPush = (minDistance - distance) * 0.5f;
    positionA.x -= dirX * halfPush;
    positionA.z -= dirZ * halfPush;
    positionB.x += dirX * halfPush;
    positionB.z += dirZ * halfPush;
    return true;
}

} // namespace subvox::sim
