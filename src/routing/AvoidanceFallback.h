#pragma once

#include "elbow/core/Types.h"

#include <optional>
#include <vector>

namespace elbow {

/// Heuristic detour used when no candidate clears the obstacles.
///
/// Unites every obstacle struck by the rejected path and tries four two-corner
/// bypasses (above, below, left, right of that union, offset by the padding).
/// Termination is guaranteed; a collision-free result is not.
namespace AvoidanceFallback {

/// Outcome of a bypass attempt
struct Result {
    Waypoints waypoints;
    bool bypassed = false;          ///< True if one of the four bypasses was chosen
    std::optional<Box> struckBounds;
};

/// Union of every obstacle intersected by any segment of the polyline
/// @return nullopt if the polyline hits nothing
std::optional<Box> struckObstacleBounds(
    const std::vector<Point>& fullPath,
    const std::vector<Box>& obstacles);

/// The four bypass routes around a box, in order above, below, left, right
std::vector<Waypoints> bypassRoutes(
    const Point& start,
    const Point& end,
    const Box& bounds,
    float padding);

/// Route around the obstacles struck by `waypoints`.
/// @param start Connector start point
/// @param end Connector end point
/// @param waypoints Rejected waypoints (returned unchanged if no bypass validates)
/// @param obstacles Obstacles that both detection and bypass validation use
/// @param padding Clearance between the union box and the bypass
Result avoid(
    const Point& start,
    const Point& end,
    const Waypoints& waypoints,
    const std::vector<Box>& obstacles,
    float padding);

}  // namespace AvoidanceFallback

}  // namespace elbow
