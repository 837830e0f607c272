#include <gtest/gtest.h>

#include "sim/character_motion.h"
#include "sim/collision.h"
#include "world/spatial_grid.h"

namespace {

subvox::math::Aabb makeBox(float minX, float minY, float minZ, float maxX, float maxY, float maxZ) {
    return subvox::math::Aabb{subvox::math::Vector3{minX, minY, minZ}, subvox::math::Vector3{maxX, maxY, maxZ}};
}

// Ledge in front of a body standing at x = 1.1 with its bottom at y = 0.
subvox::world::SpatialGrid gridWithLedge(float ledgeTop) {
    subvox::world::SpatialGrid grid;
    EXPECT_TRUE(grid.insert(1u, makeBox(1.0f, 0.0f, -0.5f, 2.0f, ledgeTop, 0.5f)));
    return grid;
}

} // namespace

TEST(Collision, BodyRestingOnBoxTopIsGroundedNotColliding) {
    subvox::world::SpatialGrid grid;
    ASSERT_TRUE(grid.insert(1u, makeBox(0.0f, 0.0f, 0.0f, 1.0f, 1.0f, 1.0f)));

    const subvox::sim::Cylinder body{};
    const subvox::math::Vector3 position{0.5f, 1.0f + body.halfHeight, 0.5f};

    const subvox::sim::CollisionResult collision = subvox::sim::checkCollision(grid, position, body, 1.0f);
    EXPECT_FALSE(collision.hasCollision);
    EXPECT_FALSE(collision.canStepUp);

    const subvox::sim::GroundProbe ground = subvox::sim::probeGround(grid, position, position, body);
    EXPECT_TRUE(ground.grounded);
    EXPECT_FLOAT_EQ(ground.groundY, 1.0f);
}

TEST(Collision, BoxTopFlushWithBottomDoesNotOverlapVertically) {
    subvox::world::SpatialGrid grid;
    ASSERT_TRUE(grid.insert(1u, makeBox(0.0f, 0.0f, 0.0f, 1.0f, 1.0f, 1.0f)));

    const subvox::sim::Cylinder body{};
    const subvox::math::Vector3 position{0.5f, 1.0f + body.halfHeight, 0.5f};
    EXPECT_FALSE(subvox::sim::checkCollision(grid, position, body, -5.0f).hasCollision);
}

TEST(Collision, LedgeWithinStepHeightCanBeStepped) {
    const subvox::world::SpatialGrid grid = gridWithLedge(0.115f);
    const subvox::sim::Cylinder body{};
    const subvox::sim::CollisionResult result =
        subvox::sim::checkCollision(grid, subvox::math::Vector3{1.1f, body.halfHeight, 0.0f}, body, 0.0f);
    EXPECT_FALSE(result.hasCollision);
    EXPECT_TRUE(result.canStepUp);
    EXPECT_NEAR(result.stepUpHeight, 0.115f, 1.0e-5f);
}

TEST(Collision, LedgeAboveStepHeightBlocks) {
    const subvox::world::SpatialGrid grid = gridWithLedge(0.135f);
    const subvox::sim::Cylinder body{};
    const subvox::sim::CollisionResult result =
        subvox::sim::checkCollision(grid, subvox::math::Vector3{1.1f, body.halfHeight, 0.0f}, body, 0.0f);
    EXPECT_TRUE(result.hasCollision);
    EXPECT_FALSE(result.canStepUp);
}

TEST(Collision, BlockingBoxOverridesSteppableBox) {
    subvox::world::SpatialGrid grid = gridWithLedge(0.1f);
    ASSERT_TRUE(grid.insert(2u, makeBox(0.9f, 0.0f, 0.0f, 1.2f, 1.0f, 0.3f)));
    const subvox::sim::Cylinder body{};
    const subvox::sim::CollisionResult result =
        subvox::sim::checkCollision(grid, subvox::math::Vector3{1.1f, body.halfHeight, 0.0f}, body, 0.0f);
    EXPECT_TRUE(result.hasCollision);
    EXPECT_FALSE(result.canStepUp);
    EXPECT_FLOAT_EQ(result.stepUpHeight, 0.0f);
}

TEST(Collision, CircleRectangleOverlapIsStrict) {
    const subvox::math::Aabb box = makeBox(0.0f, 0.0f, 0.0f, 1.0f, 1.0f, 1.0f);
    EXPECT_TRUE(subvox::sim::circleOverlapsRectXZ(subvox::math::Vector3{-0.1f, 0.0f, 0.5f}, 0.2f, box));
    EXPECT_FALSE(subvox::sim::circleOverlapsRectXZ(subvox::math::Vector3{-0.5f, 0.0f, 0.5f}, 0.2f, box));
    // Corner distance sqrt(0.02) is below 0.2.
    EXPECT_TRUE(subvox::sim::circleOverlapsRectXZ(subvox::math::Vector3{1.1f, 0.0f, 1.1f}, 0.2f, box));
    EXPECT_FALSE(subvox::sim::circleOverlapsRectXZ(subvox::math::Vector3{1.2f, 0.0f, 1.2f}, 0.2f, box));
}

TEST(Collision, GroundProbeIgnoresBoxesTheBodyStartedBelow) {
    subvox::world::SpatialGrid grid;
    ASSERT_TRUE(grid.insert(1u, makeBox(-1.0f, 0.0f, -1.0f, 1.0f, 1.0f, 1.0f)));

    const subvox::sim::Cylinder body{};
    const subvox::math::Vector3 current{0.0f, 0.5f, 0.0f};
    const subvox::math::Vector3 proposed{0.0f, 0.4f, 0.0f};
    EXPECT_FALSE(subvox::sim::probeGround(grid, current, proposed, body).grounded);
}

TEST(Collision, GroundProbePicksHighestTop) {
    subvox::world::SpatialGrid grid;
    ASSERT_TRUE(grid.insert(1u, makeBox(-1.0f, -1.0f, -1.0f, 1.0f, 0.0f, 1.0f)));
    ASSERT_TRUE(grid.insert(2u, makeBox(-0.1f, 0.0f, -0.1f, 0.1f, 0.125f, 0.1f)));

    const subvox::sim::Cylinder body{};
    const subvox::math::Vector3 current{0.0f, 0.2f + body.halfHeight, 0.0f};
    const subvox::math::Vector3 proposed{0.0f, -0.2f + body.halfHeight, 0.0f};
    const subvox::sim::GroundProbe ground = subvox::sim::probeGround(grid, current, proposed, body);
    ASSERT_TRUE(ground.grounded);
    EXPECT_FLOAT_EQ(ground.groundY, 0.125f);
}

TEST(CharacterMotion, WallBlocksOneAxisAndBodySlidesAlongIt) {
    subvox::world::SpatialGrid grid;
    ASSERT_TRUE(grid.insert(1u, makeBox(1.0f, 0.0f, -5.0f, 2.0f, 2.0f, 5.0f)));
    ASSERT_TRUE(grid.insert(2u, makeBox(-5.0f, -1.0f, -5.0f, 5.0f, 0.0f, 5.0f)));

    const subvox::sim::Cylinder body{};
    subvox::sim::MotionState state{};
    state.position = subvox::math::Vector3{0.7f, body.halfHeight, 0.0f};

    const subvox::sim::HorizontalMoveResult result =
        subvox::sim::moveHorizontal(grid, state, body, subvox::math::Vector3{0.2f, 0.0f, 0.3f});
    EXPECT_FALSE(result.movedX);
    EXPECT_TRUE(result.movedZ);
    EXPECT_FALSE(result.steppedUp);
    EXPECT_FLOAT_EQ(state.position.x, 0.7f);
    EXPECT_FLOAT_EQ(state.position.z, 0.3f);
    EXPECT_FLOAT_EQ(state.position.y, body.halfHeight);
}

TEST(CharacterMotion, MovingOntoLowLedgeStepsUp) {
    subvox::world::SpatialGrid grid;
    ASSERT_TRUE(grid.insert(1u, makeBox(1.0f, 0.0f, -1.0f, 2.0f, 0.1f, 1.0f)));
    ASSERT_TRUE(grid.insert(2u, makeBox(-5.0f, -1.0f, -5.0f, 5.0f, 0.0f, 5.0f)));

    const subvox::sim::Cylinder body{};
    subvox::sim::MotionState state{};
    state.position = subvox::math::Vector3{0.7f, body.halfHeight, 0.0f};

    const subvox::sim::HorizontalMoveResult result =
        subvox::sim::moveHorizontal(grid, state, body, subvox::math::Vector3{0.4f, 0.0f, 0.0f});
    EXPECT_TRUE(result.movedX);
    EXPECT_TRUE(result.steppedUp);
    EXPECT_NEAR(state.position.x, 1.1f, 1.0e-5f);
    EXPECT_NEAR(state.position.y, body.halfHeight + 0.1f, 1.0e-5f);
}
