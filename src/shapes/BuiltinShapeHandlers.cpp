#include "BuiltinShapeHandlers.h"

#include <array>
#include <cmath>

namespace elbow {

namespace {

/// Centre, then the four side midpoints, in shape-local coordinates
std::array<Anchor, 5> localSideAnchors(float halfWidth, float halfHeight) {
    return {{
        {anchors::CENTER, 0.0f, 0.0f},
        {anchors::TOP, 0.0f, -halfHeight},
        {anchors::RIGHT, halfWidth, 0.0f},
        {anchors::BOTTOM, 0.0f, halfHeight},
        {anchors::LEFT, -halfWidth, 0.0f},
    }};
}

std::vector<Anchor> toWorld(const std::array<Anchor, 5>& local, const Shape& shape) {
    std::vector<Anchor> result;
    result.reserve(local.size());
    Point center{shape.x, shape.y};
    for (const auto& anchor : local) {
        Point world = center + Point{anchor.x, anchor.y}.rotated(shape.rotation);
        result.push_back({anchor.position, world.x, world.y});
    }
    return result;
}

}  // namespace

Box RectangleHandler::getBounds(const Shape& shape) const {
    float hw = shape.width / 2;
    float hh = shape.height / 2;
    Point center{shape.x, shape.y};

    const std::array<Point, 4> corners = {{{-hw, -hh}, {hw, -hh}, {hw, hh}, {-hw, hh}}};

    Point first = center + corners[0].rotated(shape.rotation);
    Box bounds{first.x, first.y, first.x, first.y};
    for (size_t i = 1; i < corners.size(); ++i) {
        bounds = bounds.expandedToInclude(center + corners[i].rotated(shape.rotation));
    }

    return bounds.expanded(shape.strokeWidth / 2);
}

std::vector<Anchor> RectangleHandler::getAnchors(const Shape& shape) const {
    return toWorld(localSideAnchors(shape.width / 2, shape.height / 2), shape);
}

Box EllipseHandler::getBounds(const Shape& shape) const {
    float rx = shape.radiusX;
    float ry = shape.radiusY;
    float c = std::cos(shape.rotation);
    float s = std::sin(shape.rotation);

    // Extent of a rotated ellipse along each axis
    float halfWidth = std::sqrt(rx * rx * c * c + ry * ry * s * s);
    float halfHeight = std::sqrt(rx * rx * s * s + ry * ry * c * c);

    return Box::fromCenter({shape.x, shape.y}, 2 * halfWidth, 2 * halfHeight)
        .expanded(shape.strokeWidth / 2);
}

std::vector<Anchor> EllipseHandler::getAnchors(const Shape& shape) const {
    return toWorld(localSideAnchors(shape.radiusX, shape.radiusY), shape);
}

Box LineHandler::getBounds(const Shape& shape) const {
    return Box::fromPoints({shape.x, shape.y}, {shape.x2, shape.y2})
        .expanded(shape.strokeWidth / 2);
}

Box ConnectorHandler::getBounds(const Shape& shape) const {
    Box bounds = Box::fromPoints({shape.x, shape.y}, {shape.x2, shape.y2});
    for (const auto& wp : shape.waypoints) {
        bounds = bounds.expandedToInclude(wp);
    }
    return bounds.expanded(shape.strokeWidth / 2);
}

}  // namespace elbow
