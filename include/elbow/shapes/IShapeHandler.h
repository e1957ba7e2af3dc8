#pragma once

#include "elbow/shapes/Shape.h"

#include <vector>

namespace elbow {

/// Per-type shape behaviour needed by the router.
///
/// Only geometry queries live here: rendering, hit testing and handles
/// belong to the host editor.
class IShapeHandler {
public:
    virtual ~IShapeHandler() = default;

    /// Axis-aligned bounding box in world coordinates (stroke included)
    virtual Box getBounds(const Shape& shape) const = 0;

    /// Whether this shape type offers connector anchors at all
    virtual bool hasAnchors() const { return false; }

    /// Connector anchor points in world coordinates
    virtual std::vector<Anchor> getAnchors([[maybe_unused]] const Shape& shape) const { return {}; }
};

}  // namespace elbow
