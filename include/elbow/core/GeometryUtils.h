#pragma once

#include "Types.h"

#include <vector>

namespace elbow {

/// Geometry utility functions for collision detection and path measurement
namespace geometry {

/// Check if a line segment intersects an axis-aligned box (Liang-Barsky clipping).
/// Segments that only touch the box boundary count as intersecting.
/// Axis-parallel segments (dx == 0 or dy == 0) use a direct range check
/// on the fixed coordinate instead of dividing by zero.
/// @param p1 Start point of segment
/// @param p2 End point of segment
/// @param box Box to test against
/// @return true if any part of the segment lies inside or on the box
bool segmentIntersectsBox(const Point& p1, const Point& p2, const Box& box);

/// Check if a segment intersects any box of an obstacle set
bool segmentIntersectsAny(const Point& p1, const Point& p2, const std::vector<Box>& boxes);

/// Check if any segment of a polyline intersects any box of an obstacle set
bool polylineIntersectsAny(const std::vector<Point>& points, const std::vector<Box>& boxes);

/// Sum of Euclidean segment lengths of a polyline
float polylineLength(const std::vector<Point>& points);

/// Build the full polyline start -> waypoints -> end
std::vector<Point> buildPolyline(const Point& start, const Waypoints& waypoints, const Point& end);

/// Check that every segment of a polyline is horizontal or vertical and has
/// nonzero length
/// @param tolerance Allowed deviation on the fixed axis
bool isRectilinear(const std::vector<Point>& points, float tolerance = 0.0f);

/// Count segments of a polyline hitting at least one box
int countIntersectingSegments(const std::vector<Point>& points, const std::vector<Box>& boxes);

}  // namespace geometry

/// Routing constants
namespace constants {

/// Floating-point comparison tolerance
constexpr float EPSILON = 1e-6f;

/// Default distance an endpoint is extended along its exit direction before turning
constexpr float DEFAULT_STUB_LENGTH = 20.0f;

/// Default padding around unrelated shapes
constexpr float DEFAULT_OBSTACLE_PADDING = 15.0f;

/// Default padding around the shapes a connector is attached to
constexpr float DEFAULT_CONNECTED_PADDING = 2.0f;

}  // namespace constants

}  // namespace elbow
