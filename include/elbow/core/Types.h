#pragma once

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace elbow {

using ShapeId = std::string;

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(float s) const { return {x * s, y * s}; }
    constexpr Point operator/(float s) const { return {x / s, y / s}; }

    float length() const { return std::sqrt(x * x + y * y); }
    float distanceTo(const Point& o) const { return (*this - o).length(); }

    Point normalized() const {
        float len = length();
        return len > 0.0f ? *this / len : Point{0.0f, 0.0f};
    }

    /// Rotate around the origin by angle (radians)
    Point rotated(float angle) const {
        float c = std::cos(angle);
        float s = std::sin(angle);
        return {x * c - y * s, x * s + y * c};
    }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

/// Ordered interior corners of a connector path (start/end excluded)
using Waypoints = std::vector<Point>;

/// Axis-aligned box in world coordinates.
/// Invariant: minX <= maxX and minY <= maxY.
struct Box {
    float minX = 0.0f;
    float minY = 0.0f;
    float maxX = 0.0f;
    float maxY = 0.0f;

    constexpr Box() = default;
    constexpr Box(float minX_, float minY_, float maxX_, float maxY_)
        : minX(minX_), minY(minY_), maxX(maxX_), maxY(maxY_) {}

    /// Smallest box containing both points
    static Box fromPoints(const Point& a, const Point& b) {
        return {std::min(a.x, b.x), std::min(a.y, b.y),
                std::max(a.x, b.x), std::max(a.y, b.y)};
    }

    static constexpr Box fromCenter(const Point& center, float width, float height) {
        return {center.x - width / 2, center.y - height / 2,
                center.x + width / 2, center.y + height / 2};
    }

    /// Box from top-left position and size
    static constexpr Box fromPositionSize(const Point& pos, float width, float height) {
        return {pos.x, pos.y, pos.x + width, pos.y + height};
    }

    constexpr float width() const { return maxX - minX; }
    constexpr float height() const { return maxY - minY; }
    constexpr Point center() const { return {(minX + maxX) / 2, (minY + maxY) / 2}; }

    constexpr bool containsPoint(const Point& p) const {
        return p.x >= minX && p.x <= maxX && p.y >= minY && p.y <= maxY;
    }

    constexpr bool containsBox(const Box& o) const {
        return o.minX >= minX && o.maxX <= maxX && o.minY >= minY && o.maxY <= maxY;
    }

    /// Overlap test, touching edges count as intersecting
    constexpr bool intersects(const Box& o) const {
        return minX <= o.maxX && maxX >= o.minX && minY <= o.maxY && maxY >= o.minY;
    }

    Box united(const Box& o) const {
        return {std::min(minX, o.minX), std::min(minY, o.minY),
                std::max(maxX, o.maxX), std::max(maxY, o.maxY)};
    }

    Box expandedToInclude(const Point& p) const {
        return {std::min(minX, p.x), std::min(minY, p.y),
                std::max(maxX, p.x), std::max(maxY, p.y)};
    }

    constexpr Box expanded(float padding) const {
        return {minX - padding, minY - padding, maxX + padding, maxY + padding};
    }

    constexpr bool operator==(const Box& o) const {
        return minX == o.minX && minY == o.minY && maxX == o.maxX && maxY == o.maxY;
    }
    constexpr bool operator!=(const Box& o) const { return !(*this == o); }
};

}  // namespace elbow
