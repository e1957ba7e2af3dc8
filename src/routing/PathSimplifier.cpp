#include "PathSimplifier.h"

namespace elbow::PathSimplifier {

namespace {

/// One left-to-right pass against the last kept point
std::vector<Point> simplifyOnce(const std::vector<Point>& points) {
    std::vector<Point> result;
    result.reserve(points.size());
    result.push_back(points.front());

    for (size_t i = 1; i + 1 < points.size(); ++i) {
        const Point& prev = result.back();
        const Point& curr = points[i];
        const Point& next = points[i + 1];

        // Repeated point
        if (curr == prev) {
            continue;
        }

        bool sameX = prev.x == curr.x && curr.x == next.x;
        bool sameY = prev.y == curr.y && curr.y == next.y;

        if (!sameX && !sameY) {
            result.push_back(curr);
        }
    }

    if (result.size() > 1 && result.back() == points.back()) {
        result.pop_back();
    }
    result.push_back(points.back());
    return result;
}

}  // namespace

std::vector<Point> simplify(const std::vector<Point>& points) {
    if (points.size() < 2) {
        return points;
    }

    // A single pass is enough for candidate paths; paths that double back on
    // themselves can expose a new collinear triple, so repeat until stable.
    std::vector<Point> result = simplifyOnce(points);
    while (result.size() > 2) {
        std::vector<Point> next = simplifyOnce(result);
        if (next.size() == result.size()) {
            break;
        }
        result = std::move(next);
    }

    // Coincident stubs leave a zero-length segment
    if (result.size() == 2 && result.front() == result.back()) {
        result.pop_back();
    }
    return result;
}

}  // namespace elbow::PathSimplifier
