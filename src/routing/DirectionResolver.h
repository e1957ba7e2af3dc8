#pragma once

#include "elbow/shapes/Shape.h"

#include <cmath>
#include <optional>

namespace elbow {

/// Exit/entry direction resolution and stub extension
namespace DirectionResolver {

/// Canonical unit direction of a side anchor.
/// @return nullopt for "center", extended anchors and unknown names
std::optional<Point> anchorDirection(const AnchorPosition& anchor);

/// Unit vector along the dominant axis from `from` toward `to`.
/// Ties (|dx| == |dy|, including coincident points) resolve to the horizontal axis.
Point inferDirection(const Point& from, const Point& to);

/// Direction for an endpoint: the anchor's canonical direction if it has one,
/// otherwise inferred toward the other endpoint.
Point resolve(const std::optional<AnchorPosition>& anchor, const Point& from, const Point& to);

/// True if the direction's horizontal component dominates
inline bool isHorizontal(const Point& direction) {
    return std::abs(direction.x) > std::abs(direction.y);
}

/// endpoint + direction * stubLength
inline Point extendStub(const Point& endpoint, const Point& direction, float stubLength) {
    return endpoint + direction * stubLength;
}

}  // namespace DirectionResolver

}  // namespace elbow
