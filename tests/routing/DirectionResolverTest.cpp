#include <gtest/gtest.h>
#include "../../src/routing/DirectionResolver.h"

using namespace elbow;

// =============================================================================
// Side Anchors
// =============================================================================

TEST(DirectionResolverTest, AnchorDirection_SideAnchors) {
    EXPECT_EQ(DirectionResolver::anchorDirection(anchors::TOP), Point(0.0f, -1.0f));
    EXPECT_EQ(DirectionResolver::anchorDirection(anchors::BOTTOM), Point(0.0f, 1.0f));
    EXPECT_EQ(DirectionResolver::anchorDirection(anchors::LEFT), Point(-1.0f, 0.0f));
    EXPECT_EQ(DirectionResolver::anchorDirection(anchors::RIGHT), Point(1.0f, 0.0f));
}

TEST(DirectionResolverTest, AnchorDirection_CenterAndExtendedHaveNone) {
    EXPECT_FALSE(DirectionResolver::anchorDirection(anchors::CENTER).has_value());
    EXPECT_FALSE(DirectionResolver::anchorDirection("attr-3-left").has_value());
    EXPECT_FALSE(DirectionResolver::anchorDirection("").has_value());
}

// =============================================================================
// Inference
// =============================================================================

TEST(DirectionResolverTest, Infer_DominantAxis) {
    Point origin{0.0f, 0.0f};
    EXPECT_EQ(DirectionResolver::inferDirection(origin, {10.0f, 5.0f}), Point(1.0f, 0.0f));
    EXPECT_EQ(DirectionResolver::inferDirection(origin, {-10.0f, 5.0f}), Point(-1.0f, 0.0f));
    EXPECT_EQ(DirectionResolver::inferDirection(origin, {3.0f, -10.0f}), Point(0.0f, -1.0f));
    EXPECT_EQ(DirectionResolver::inferDirection(origin, {0.0f, 100.0f}), Point(0.0f, 1.0f));
}

TEST(DirectionResolverTest, Infer_TieResolvesHorizontal) {
    Point origin{0.0f, 0.0f};
    EXPECT_EQ(DirectionResolver::inferDirection(origin, {10.0f, 10.0f}), Point(1.0f, 0.0f));
    EXPECT_EQ(DirectionResolver::inferDirection(origin, {-10.0f, 10.0f}), Point(-1.0f, 0.0f));
    EXPECT_EQ(DirectionResolver::inferDirection(origin, {-10.0f, -10.0f}), Point(-1.0f, 0.0f));
}

TEST(DirectionResolverTest, Infer_CoincidentPointsExitRight) {
    EXPECT_EQ(DirectionResolver::inferDirection({5.0f, 5.0f}, {5.0f, 5.0f}), Point(1.0f, 0.0f));
}

// =============================================================================
// Resolution
// =============================================================================

TEST(DirectionResolverTest, Resolve_SideAnchorWinsOverGeometry) {
    // Other endpoint is to the left, but the anchor says right
    Point dir = DirectionResolver::resolve(anchors::RIGHT, {0.0f, 0.0f}, {-100.0f, 0.0f});
    EXPECT_EQ(dir, Point(1.0f, 0.0f));
}

TEST(DirectionResolverTest, Resolve_CenterMissingAndCustomInfer) {
    Point from{0.0f, 0.0f};
    Point to{0.0f, -50.0f};
    EXPECT_EQ(DirectionResolver::resolve(std::nullopt, from, to), Point(0.0f, -1.0f));
    EXPECT_EQ(DirectionResolver::resolve(anchors::CENTER, from, to), Point(0.0f, -1.0f));
    EXPECT_EQ(DirectionResolver::resolve(std::string("attr-1-right"), from, to), Point(0.0f, -1.0f));
}

// =============================================================================
// Stubs
// =============================================================================

TEST(DirectionResolverTest, ExtendStub) {
    EXPECT_EQ(DirectionResolver::extendStub({0.0f, 0.0f}, {1.0f, 0.0f}, 20.0f), Point(20.0f, 0.0f));
    EXPECT_EQ(DirectionResolver::extendStub({200.0f, 100.0f}, {-1.0f, 0.0f}, 20.0f), Point(180.0f, 100.0f));
    EXPECT_EQ(DirectionResolver::extendStub({0.0f, 0.0f}, {0.0f, -1.0f}, 0.0f), Point(0.0f, 0.0f));
}

TEST(DirectionResolverTest, IsHorizontal) {
    EXPECT_TRUE(DirectionResolver::isHorizontal({1.0f, 0.0f}));
    EXPECT_TRUE(DirectionResolver::isHorizontal({-1.0f, 0.0f}));
    EXPECT_FALSE(DirectionResolver::isHorizontal({0.0f, 1.0f}));
    EXPECT_FALSE(DirectionResolver::isHorizontal({0.0f, -1.0f}));
}
