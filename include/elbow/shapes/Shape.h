#pragma once

#include "elbow/core/Types.h"

#include <map>
#include <optional>
#include <string>

namespace elbow {

/// Anchor position identifier on a shape.
///
/// Well-known values: "top", "right", "bottom", "left", "center".
/// Shapes may define extended anchors (e.g. "attr-2-left"); those are
/// routed like "center", with the exit direction inferred.
using AnchorPosition = std::string;

namespace anchors {
inline const AnchorPosition TOP = "top";
inline const AnchorPosition BOTTOM = "bottom";
inline const AnchorPosition LEFT = "left";
inline const AnchorPosition RIGHT = "right";
inline const AnchorPosition CENTER = "center";
}  // namespace anchors

/// Built-in shape type names
namespace shape_types {
inline const std::string RECTANGLE = "rectangle";
inline const std::string ELLIPSE = "ellipse";
inline const std::string TEXT = "text";
inline const std::string LINE = "line";
inline const std::string CONNECTOR = "connector";
}  // namespace shape_types

/// Named attachment point in world coordinates
struct Anchor {
    AnchorPosition position;
    float x = 0.0f;
    float y = 0.0f;

    Point point() const { return {x, y}; }
};

/// How a connector draws its path
enum class RoutingMode {
    Straight,
    Orthogonal
};

/// Plain shape record.
///
/// Shapes carry data only; bounds and anchors come from the IShapeHandler
/// registered for `type`. (x, y) is the centre for rectangles, ellipses and
/// text, and the start point for lines and connectors.
struct Shape {
    ShapeId id;
    std::string type;

    float x = 0.0f;
    float y = 0.0f;
    float rotation = 0.0f;     ///< Radians
    float strokeWidth = 0.0f;
    bool visible = true;

    // Rectangle / text
    float width = 0.0f;
    float height = 0.0f;

    // Ellipse
    float radiusX = 0.0f;
    float radiusY = 0.0f;

    // Line / connector end point
    float x2 = 0.0f;
    float y2 = 0.0f;

    // Connector only
    std::optional<ShapeId> startShapeId;
    AnchorPosition startAnchor = anchors::CENTER;
    std::optional<ShapeId> endShapeId;
    AnchorPosition endAnchor = anchors::CENTER;
    RoutingMode routingMode = RoutingMode::Orthogonal;
    Waypoints waypoints;

    bool isConnector() const { return type == shape_types::CONNECTOR; }
};

/// Shape snapshot keyed by id (ordered so iteration is deterministic)
using ShapeMap = std::map<ShapeId, Shape>;

}  // namespace elbow
