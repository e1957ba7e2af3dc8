#include "elbow/core/GeometryUtils.h"

#include <algorithm>
#include <cmath>

namespace elbow::geometry {

bool segmentIntersectsBox(const Point& p1, const Point& p2, const Box& box) {
    float dx = p2.x - p1.x;
    float dy = p2.y - p1.y;

    float tMin = 0.0f;
    float tMax = 1.0f;

    // X slab
    if (dx != 0.0f) {
        float t1 = (box.minX - p1.x) / dx;
        float t2 = (box.maxX - p1.x) / dx;
        if (dx > 0.0f) {
            tMin = std::max(tMin, t1);
            tMax = std::min(tMax, t2);
        } else {
            tMin = std::max(tMin, t2);
            tMax = std::min(tMax, t1);
        }
    } else if (p1.x < box.minX || p1.x > box.maxX) {
        // Vertical segment outside the X range
        return false;
    }

    // Y slab
    if (dy != 0.0f) {
        float t1 = (box.minY - p1.y) / dy;
        float t2 = (box.maxY - p1.y) / dy;
        if (dy > 0.0f) {
            tMin = std::max(tMin, t1);
            tMax = std::min(tMax, t2);
        } else {
            tMin = std::max(tMin, t2);
            tMax = std::min(tMax, t1);
        }
    } else if (p1.y < box.minY || p1.y > box.maxY) {
        // Horizontal segment outside the Y range
        return false;
    }

    return tMin <= tMax;
}

bool segmentIntersectsAny(const Point& p1, const Point& p2, const std::vector<Box>& boxes) {
    return std::any_of(boxes.begin(), boxes.end(), [&](const Box& box) {
        return segmentIntersectsBox(p1, p2, box);
    });
}

bool polylineIntersectsAny(const std::vector<Point>& points, const std::vector<Box>& boxes) {
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        if (segmentIntersectsAny(points[i], points[i + 1], boxes)) {
            return true;
        }
    }
    return false;
}

float polylineLength(const std::vector<Point>& points) {
    float length = 0.0f;
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        length += points[i].distanceTo(points[i + 1]);
    }
    return length;
}

std::vector<Point> buildPolyline(const Point& start, const Waypoints& waypoints, const Point& end) {
    std::vector<Point> points;
    points.reserve(waypoints.size() + 2);
    points.push_back(start);
    points.insert(points.end(), waypoints.begin(), waypoints.end());
    points.push_back(end);
    return points;
}

bool isRectilinear(const std::vector<Point>& points, float tolerance) {
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        bool vertical = std::abs(points[i + 1].x - points[i].x) <= tolerance;
        bool horizontal = std::abs(points[i + 1].y - points[i].y) <= tolerance;
        // Exactly one axis may change; zero-length segments do not count
        if (vertical == horizontal) {
            return false;
        }
    }
    return true;
}

int countIntersectingSegments(const std::vector<Point>& points, const std::vector<Box>& boxes) {
    int count = 0;
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        if (segmentIntersectsAny(points[i], points[i + 1], boxes)) {
            ++count;
        }
    }
    return count;
}

}  // namespace elbow::geometry
