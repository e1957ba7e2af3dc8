#include <gtest/gtest.h>
#include "elbow/connector/ConnectorRouting.h"
#include "elbow/core/GeometryUtils.h"
#include "../TestShapes.h"

using namespace elbow;
using namespace elbow::test;

// =============================================================================
// Test Fixture
// =============================================================================

class ConnectorRoutingTest : public ::testing::Test {
protected:
    void SetUp() override {
        // a: (-50,-30)-(50,30), right anchor (50,0)
        addShape(shapes_, makeRectangle("a", 0.0f, 0.0f, 100.0f, 60.0f));
        // b: (250,70)-(350,130), left anchor (250,100)
        addShape(shapes_, makeRectangle("b", 300.0f, 100.0f, 100.0f, 60.0f));
        addShape(shapes_, makeConnector("c", {0.0f, 0.0f}, {0.0f, 0.0f},
                                        "a", anchors::RIGHT, "b", anchors::LEFT));
    }

    const Shape& connector() const { return shapes_.at("c"); }

    ShapeRegistry registry_ = ShapeRegistry::withBuiltins();
    OrthogonalRouter router_{registry_};
    ShapeMap shapes_;
};

// =============================================================================
// Endpoint Resolution
// =============================================================================

TEST_F(ConnectorRoutingTest, ResolvesAttachedAnchors) {
    EXPECT_EQ(ConnectorRouting::resolveStartPoint(connector(), shapes_, registry_), Point(50.0f, 0.0f));
    EXPECT_EQ(ConnectorRouting::resolveEndPoint(connector(), shapes_, registry_), Point(250.0f, 100.0f));
}

TEST_F(ConnectorRoutingTest, FallsBackToStoredCoordinates) {
    Shape floating = makeConnector("f", {5.0f, 6.0f}, {7.0f, 8.0f});
    EXPECT_EQ(ConnectorRouting::resolveStartPoint(floating, shapes_, registry_), Point(5.0f, 6.0f));
    EXPECT_EQ(ConnectorRouting::resolveEndPoint(floating, shapes_, registry_), Point(7.0f, 8.0f));

    Shape orphan = makeConnector("o", {5.0f, 6.0f}, {7.0f, 8.0f}, "ghost", anchors::RIGHT, "a", "attr-1-left");
    EXPECT_EQ(ConnectorRouting::resolveStartPoint(orphan, shapes_, registry_), Point(5.0f, 6.0f));
    EXPECT_EQ(ConnectorRouting::resolveEndPoint(orphan, shapes_, registry_), Point(7.0f, 8.0f));
}

TEST_F(ConnectorRoutingTest, BuildRequest_ExcludesSelfAndAttachedShapes) {
    RouteRequest request = ConnectorRouting::buildRequest(connector(), shapes_, registry_);

    EXPECT_EQ(request.startPoint, Point(50.0f, 0.0f));
    EXPECT_EQ(request.endPoint, Point(250.0f, 100.0f));
    EXPECT_EQ(request.startAnchor, anchors::RIGHT);
    EXPECT_EQ(request.endAnchor, anchors::LEFT);
    EXPECT_EQ(request.shapes, &shapes_);
    EXPECT_EQ(request.startShapeId, std::optional<ShapeId>("a"));
    EXPECT_EQ(request.endShapeId, std::optional<ShapeId>("b"));

    EXPECT_EQ(request.excludeIds.size(), 3u);
    EXPECT_EQ(request.excludeIds.count("c"), 1u);
    EXPECT_EQ(request.excludeIds.count("a"), 1u);
    EXPECT_EQ(request.excludeIds.count("b"), 1u);
}

// =============================================================================
// Waypoint Calculation
// =============================================================================

TEST_F(ConnectorRoutingTest, OrthogonalConnectorIsRouted) {
    RouteDiagnostics diag;
    auto waypoints = ConnectorRouting::calculateConnectorWaypoints(connector(), shapes_, router_, &diag);

    ASSERT_TRUE(waypoints.has_value());
    EXPECT_EQ(*waypoints, makePath({{70.0f, 0.0f}, {150.0f, 0.0f}, {150.0f, 100.0f}, {230.0f, 100.0f}}));
    EXPECT_EQ(diag.stage, RouteStage::Candidate);
    EXPECT_EQ(diag.connectedObstacles, 2u);
}

TEST_F(ConnectorRoutingTest, StraightConnectorHasNoWaypoints) {
    shapes_.at("c").routingMode = RoutingMode::Straight;
    EXPECT_FALSE(ConnectorRouting::calculateConnectorWaypoints(connector(), shapes_, router_).has_value());
}

TEST_F(ConnectorRoutingTest, DetoursAroundUnrelatedShape) {
    // Sits on the x=150 bridge of the default Z-path
    addShape(shapes_, makeRectangle("blocker", 150.0f, 50.0f, 40.0f, 40.0f));

    RouteDiagnostics diag;
    auto waypoints = ConnectorRouting::calculateConnectorWaypoints(connector(), shapes_, router_, &diag);

    ASSERT_TRUE(waypoints.has_value());
    EXPECT_NE(diag.selectedCandidate, 0);

    std::vector<Box> blocker = {Box(115.0f, 15.0f, 185.0f, 85.0f)};
    auto full = geometry::buildPolyline({50.0f, 0.0f}, *waypoints, {250.0f, 100.0f});
    EXPECT_FALSE(geometry::polylineIntersectsAny(full, blocker));
}

// =============================================================================
// Health Checks
// =============================================================================

TEST_F(ConnectorRoutingTest, Health_Connected) {
    ConnectorHealth health = ConnectorRouting::checkConnectorHealth(connector(), shapes_, registry_);

    EXPECT_TRUE(health.isHealthy);
    EXPECT_EQ(health.startStatus, ConnectionStatus::Connected);
    EXPECT_EQ(health.endStatus, ConnectionStatus::Connected);
    EXPECT_TRUE(health.issues.empty());
}

TEST_F(ConnectorRoutingTest, Health_OrphanedAndMissingAnchor) {
    Shape broken = makeConnector("x", {0.0f, 0.0f}, {0.0f, 0.0f}, "ghost", anchors::RIGHT, "b", "attr-1-left");
    ConnectorHealth health = ConnectorRouting::checkConnectorHealth(broken, shapes_, registry_);

    EXPECT_FALSE(health.isHealthy);
    EXPECT_EQ(health.startStatus, ConnectionStatus::Orphaned);
    EXPECT_EQ(health.endStatus, ConnectionStatus::MissingAnchor);
    ASSERT_EQ(health.issues.size(), 2u);
    EXPECT_EQ(health.issues[0], "Start shape \"ghost\" not found");
    EXPECT_EQ(health.issues[1], "End anchor \"attr-1-left\" not found on shape");
}

TEST_F(ConnectorRoutingTest, Health_FloatingIsHealthy) {
    Shape floating = makeConnector("f", {0.0f, 0.0f}, {10.0f, 10.0f});
    ConnectorHealth health = ConnectorRouting::checkConnectorHealth(floating, shapes_, registry_);

    EXPECT_TRUE(health.isHealthy);
    EXPECT_EQ(health.startStatus, ConnectionStatus::Floating);
    EXPECT_EQ(health.endStatus, ConnectionStatus::Floating);
}

TEST_F(ConnectorRoutingTest, Health_ShapeWithoutAnchorsAcceptsAnyAnchor) {
    addShape(shapes_, makeLine("l", {0.0f, 200.0f}, {100.0f, 200.0f}));
    Shape toLine = makeConnector("t", {0.0f, 0.0f}, {50.0f, 200.0f}, "a", anchors::BOTTOM, "l", "middle");

    ConnectorHealth health = ConnectorRouting::checkConnectorHealth(toLine, shapes_, registry_);
    EXPECT_TRUE(health.isHealthy);
    EXPECT_EQ(health.endStatus, ConnectionStatus::Connected);
}

TEST_F(ConnectorRoutingTest, FindOrphanedConnectors_InIdOrder) {
    addShape(shapes_, makeConnector("z", {0.0f, 0.0f}, {1.0f, 1.0f}, "gone"));
    addShape(shapes_, makeConnector("m", {0.0f, 0.0f}, {1.0f, 1.0f}, std::nullopt, anchors::CENTER, "gone"));

    auto orphaned = ConnectorRouting::findOrphanedConnectors(shapes_, registry_);

    ASSERT_EQ(orphaned.size(), 2u);
    EXPECT_EQ(orphaned[0].connectorId, "m");
    EXPECT_EQ(orphaned[0].health.endStatus, ConnectionStatus::Orphaned);
    EXPECT_EQ(orphaned[1].connectorId, "z");
    EXPECT_EQ(orphaned[1].health.startStatus, ConnectionStatus::Orphaned);
}

TEST(ConnectionStatusTest, Names) {
    EXPECT_STREQ(connectionStatusName(ConnectionStatus::Connected), "connected");
    EXPECT_STREQ(connectionStatusName(ConnectionStatus::Orphaned), "orphaned");
    EXPECT_STREQ(connectionStatusName(ConnectionStatus::MissingAnchor), "missing-anchor");
    EXPECT_STREQ(connectionStatusName(ConnectionStatus::Floating), "floating");
}

// =============================================================================
// Bulk Reroute
// =============================================================================

TEST_F(ConnectorRoutingTest, RerouteConnectors_UpdatesStoredWaypoints) {
    Shape straight = makeConnector("s", {0.0f, 0.0f}, {100.0f, 100.0f});
    straight.routingMode = RoutingMode::Straight;
    straight.waypoints = {{1.0f, 2.0f}};
    addShape(shapes_, straight);

    size_t rerouted = ConnectorRouting::rerouteConnectors(shapes_, router_);

    EXPECT_EQ(rerouted, 1u);
    EXPECT_EQ(shapes_.at("c").waypoints,
              makePath({{70.0f, 0.0f}, {150.0f, 0.0f}, {150.0f, 100.0f}, {230.0f, 100.0f}}));
    EXPECT_TRUE(shapes_.at("s").waypoints.empty());
}

TEST_F(ConnectorRoutingTest, RerouteConnectors_FollowsMovedShape) {
    ConnectorRouting::rerouteConnectors(shapes_, router_);
    Waypoints before = shapes_.at("c").waypoints;

    shapes_.at("b").y = 300.0f;
    ConnectorRouting::rerouteConnectors(shapes_, router_);

    EXPECT_NE(shapes_.at("c").waypoints, before);
    ASSERT_FALSE(shapes_.at("c").waypoints.empty());
    EXPECT_FLOAT_EQ(shapes_.at("c").waypoints.back().y, 300.0f);
}
