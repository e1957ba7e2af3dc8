#pragma once

#include "elbow/shapes/IShapeHandler.h"

namespace elbow {

/// Rectangle and text boxes: centre (x, y), size (width, height), rotated about the centre
class RectangleHandler : public IShapeHandler {
public:
    Box getBounds(const Shape& shape) const override;
    bool hasAnchors() const override { return true; }
    std::vector<Anchor> getAnchors(const Shape& shape) const override;
};

/// Ellipse: centre (x, y), radii (radiusX, radiusY), rotated about the centre
class EllipseHandler : public IShapeHandler {
public:
    Box getBounds(const Shape& shape) const override;
    bool hasAnchors() const override { return true; }
    std::vector<Anchor> getAnchors(const Shape& shape) const override;
};

/// Straight line from (x, y) to (x2, y2)
class LineHandler : public IShapeHandler {
public:
    Box getBounds(const Shape& shape) const override;
};

/// Connector: endpoints plus any stored waypoints
class ConnectorHandler : public IShapeHandler {
public:
    Box getBounds(const Shape& shape) const override;
};

}  // namespace elbow
