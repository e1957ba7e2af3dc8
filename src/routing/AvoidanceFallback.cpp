#include "AvoidanceFallback.h"
#include "elbow/core/GeometryUtils.h"

#include <limits>

namespace elbow::AvoidanceFallback {

std::optional<Box> struckObstacleBounds(
    const std::vector<Point>& fullPath,
    const std::vector<Box>& obstacles) {

    std::optional<Box> combined;
    for (const auto& obstacle : obstacles) {
        bool struck = false;
        for (size_t i = 0; i + 1 < fullPath.size() && !struck; ++i) {
            struck = geometry::segmentIntersectsBox(fullPath[i], fullPath[i + 1], obstacle);
        }
        if (!struck) continue;

        combined = combined ? combined->united(obstacle) : obstacle;
    }
    return combined;
}

std::vector<Waypoints> bypassRoutes(
    const Point& start,
    const Point& end,
    const Box& bounds,
    float padding) {

    float above = bounds.minY - padding;
    float below = bounds.maxY + padding;
    float left = bounds.minX - padding;
    float right = bounds.maxX + padding;

    return {
        {{start.x, above}, {end.x, above}},
        {{start.x, below}, {end.x, below}},
        {{left, start.y}, {left, end.y}},
        {{right, start.y}, {right, end.y}},
    };
}

Result avoid(
    const Point& start,
    const Point& end,
    const Waypoints& waypoints,
    const std::vector<Box>& obstacles,
    float padding) {

    Result result;
    result.waypoints = waypoints;

    if (obstacles.empty()) {
        return result;
    }

    std::vector<Point> fullPath = geometry::buildPolyline(start, waypoints, end);
    result.struckBounds = struckObstacleBounds(fullPath, obstacles);
    if (!result.struckBounds) {
        return result;
    }

    float bestLength = std::numeric_limits<float>::infinity();
    for (auto& route : bypassRoutes(start, end, *result.struckBounds, padding)) {
        std::vector<Point> testPath = geometry::buildPolyline(start, route, end);
        if (geometry::polylineIntersectsAny(testPath, obstacles)) {
            continue;
        }

        float length = geometry::polylineLength(testPath);
        if (length < bestLength) {
            bestLength = length;
            result.waypoints = std::move(route);
            result.bypassed = true;
        }
    }

    return result;
}

}  // namespace elbow::AvoidanceFallback
