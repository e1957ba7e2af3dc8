#include <gtest/gtest.h>
#include "../../src/routing/AvoidanceFallback.h"
#include "../TestShapes.h"

using namespace elbow;
using namespace elbow::test;

// =============================================================================
// Struck Obstacles
// =============================================================================

TEST(AvoidanceFallbackTest, StruckBounds_UnitesEveryHitObstacle) {
    std::vector<Box> obstacles = {
        {100.0f, -20.0f, 150.0f, 20.0f},
        {500.0f, 500.0f, 600.0f, 600.0f},  // not on the path
        {200.0f, -40.0f, 250.0f, 10.0f},
    };
    std::vector<Point> path = {{0.0f, 0.0f}, {300.0f, 0.0f}};

    auto bounds = AvoidanceFallback::struckObstacleBounds(path, obstacles);

    ASSERT_TRUE(bounds.has_value());
    EXPECT_EQ(*bounds, Box(100.0f, -40.0f, 250.0f, 20.0f));
}

TEST(AvoidanceFallbackTest, StruckBounds_NothingHit) {
    std::vector<Box> obstacles = {{100.0f, 50.0f, 150.0f, 80.0f}};
    EXPECT_FALSE(AvoidanceFallback::struckObstacleBounds({{0.0f, 0.0f}, {300.0f, 0.0f}}, obstacles).has_value());
}

// =============================================================================
// Bypass Routes
// =============================================================================

TEST(AvoidanceFallbackTest, BypassRoutes_OrderAboveBelowLeftRight) {
    Box bounds{105.0f, -45.0f, 195.0f, 45.0f};
    auto routes = AvoidanceFallback::bypassRoutes({0.0f, 0.0f}, {300.0f, 10.0f}, bounds, 15.0f);

    ASSERT_EQ(routes.size(), 4u);
    EXPECT_EQ(routes[0], makePath({{0.0f, -60.0f}, {300.0f, -60.0f}}));
    EXPECT_EQ(routes[1], makePath({{0.0f, 60.0f}, {300.0f, 60.0f}}));
    EXPECT_EQ(routes[2], makePath({{90.0f, 0.0f}, {90.0f, 10.0f}}));
    EXPECT_EQ(routes[3], makePath({{210.0f, 0.0f}, {210.0f, 10.0f}}));
}

// =============================================================================
// Avoid
// =============================================================================

TEST(AvoidanceFallbackTest, Avoid_PicksShortestClearBypass) {
    std::vector<Box> obstacles = {{105.0f, -45.0f, 195.0f, 45.0f}};
    Waypoints rejected = {{20.0f, 0.0f}, {280.0f, 0.0f}};

    auto result = AvoidanceFallback::avoid({0.0f, 0.0f}, {300.0f, 0.0f}, rejected, obstacles, 15.0f);

    EXPECT_TRUE(result.bypassed);
    ASSERT_TRUE(result.struckBounds.has_value());
    EXPECT_EQ(*result.struckBounds, obstacles[0]);
    // Above and below tie at 420; above comes first
    EXPECT_EQ(result.waypoints, makePath({{0.0f, -60.0f}, {300.0f, -60.0f}}));
}

TEST(AvoidanceFallbackTest, Avoid_PrefersShorterSide) {
    // Obstacle sits mostly above the line, going below is shorter
    std::vector<Box> obstacles = {{105.0f, -200.0f, 195.0f, 10.0f}};
    Waypoints rejected = {{20.0f, 0.0f}, {280.0f, 0.0f}};

    auto result = AvoidanceFallback::avoid({0.0f, 0.0f}, {300.0f, 0.0f}, rejected, obstacles, 15.0f);

    EXPECT_TRUE(result.bypassed);
    EXPECT_EQ(result.waypoints, makePath({{0.0f, 25.0f}, {300.0f, 25.0f}}));
}

TEST(AvoidanceFallbackTest, Avoid_NoObstaclesReturnsInput) {
    Waypoints rejected = {{20.0f, 0.0f}, {280.0f, 0.0f}};
    auto result = AvoidanceFallback::avoid({0.0f, 0.0f}, {300.0f, 0.0f}, rejected, {}, 15.0f);

    EXPECT_FALSE(result.bypassed);
    EXPECT_FALSE(result.struckBounds.has_value());
    EXPECT_EQ(result.waypoints, rejected);
}

TEST(AvoidanceFallbackTest, Avoid_PathClearReturnsInput) {
    std::vector<Box> obstacles = {{105.0f, 100.0f, 195.0f, 200.0f}};
    Waypoints waypoints = {{20.0f, 0.0f}, {280.0f, 0.0f}};
    auto result = AvoidanceFallback::avoid({0.0f, 0.0f}, {300.0f, 0.0f}, waypoints, obstacles, 15.0f);

    EXPECT_FALSE(result.bypassed);
    EXPECT_EQ(result.waypoints, waypoints);
}

TEST(AvoidanceFallbackTest, Avoid_AllBypassesBlockedReturnsInput) {
    // The start point sits inside an obstacle, so every bypass fails its first segment
    std::vector<Box> obstacles = {
        {-10.0f, -10.0f, 10.0f, 10.0f},
        {100.0f, -50.0f, 200.0f, 50.0f},
    };
    Waypoints rejected;

    auto result = AvoidanceFallback::avoid({0.0f, 0.0f}, {300.0f, 0.0f}, rejected, obstacles, 15.0f);

    EXPECT_FALSE(result.bypassed);
    EXPECT_TRUE(result.waypoints.empty());
    ASSERT_TRUE(result.struckBounds.has_value());
    EXPECT_EQ(*result.struckBounds, Box(-10.0f, -50.0f, 200.0f, 50.0f));
}
