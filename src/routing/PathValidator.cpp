#include "PathValidator.h"
#include "elbow/core/GeometryUtils.h"

namespace elbow::PathValidator {

bool isValid(const std::vector<Point>& fullPath, const ObstacleSets& obstacles) {
    if (fullPath.size() < 2) {
        return true;
    }

    const size_t lastSegment = fullPath.size() - 2;
    std::vector<Box> allObstacles;  // built on first interior segment

    for (size_t i = 0; i + 1 < fullPath.size(); ++i) {
        const Point& p1 = fullPath[i];
        const Point& p2 = fullPath[i + 1];

        bool isExitSegment = (i == 0);
        bool isEntrySegment = (i == lastSegment);

        if (isExitSegment || isEntrySegment) {
            if (geometry::segmentIntersectsAny(p1, p2, obstacles.general)) {
                return false;
            }
        } else {
            if (allObstacles.empty()) {
                allObstacles = obstacles.combined();
            }
            if (geometry::segmentIntersectsAny(p1, p2, allObstacles)) {
                return false;
            }
        }
    }
    return true;
}

Selection selectShortest(
    const Point& start,
    const Point& end,
    const std::vector<Waypoints>& candidates,
    const ObstacleSets* obstacles) {

    Selection selection;

    for (size_t i = 0; i < candidates.size(); ++i) {
        std::vector<Point> fullPath = geometry::buildPolyline(start, candidates[i], end);

        if (obstacles && !isValid(fullPath, *obstacles)) {
            continue;
        }
        ++selection.validCount;

        float length = geometry::polylineLength(fullPath);
        if (length < selection.length) {
            selection.length = length;
            selection.index = i;
            selection.waypoints = candidates[i];
        }
    }

    return selection;
}

}  // namespace elbow::PathValidator
