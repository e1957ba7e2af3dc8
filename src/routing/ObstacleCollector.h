#pragma once

#include "elbow/routing/RoutingConfig.h"
#include "elbow/shapes/ShapeRegistry.h"

#include <optional>
#include <unordered_set>
#include <vector>

namespace elbow {

/// The two obstacle sets of one routing call
struct ObstacleSets {
    /// Every non-connector shape not excluded, padded by obstaclePadding
    std::vector<Box> general;

    /// The connector's own start/end shapes, padded by connectedPadding
    std::vector<Box> connected;

    /// general followed by connected
    std::vector<Box> combined() const;

    bool empty() const { return general.empty() && connected.empty(); }
};

/// Turns a shape snapshot into padded obstacle boxes.
///
/// Bounds come from the ShapeRegistry; a shape whose type has no handler is
/// skipped (logged at debug level) rather than failing the call.
class ObstacleCollector {
public:
    ObstacleCollector(const ShapeRegistry& registry, const RoutingConfig& config)
        : registry_(registry), config_(config) {}

    /// General obstacles, in shape-id order
    std::vector<Box> collectGeneral(
        const ShapeMap& shapes,
        const std::unordered_set<ShapeId>& excludeIds) const;

    /// Connected-shape obstacles for the connector's start and end shapes
    std::vector<Box> collectConnected(
        const ShapeMap& shapes,
        const std::optional<ShapeId>& startShapeId,
        const std::optional<ShapeId>& endShapeId) const;

    ObstacleSets collect(
        const ShapeMap& shapes,
        const std::unordered_set<ShapeId>& excludeIds,
        const std::optional<ShapeId>& startShapeId,
        const std::optional<ShapeId>& endShapeId) const;

private:
    std::optional<Box> paddedBounds(const Shape& shape, float padding) const;

    const ShapeRegistry& registry_;
    RoutingConfig config_;
};

}  // namespace elbow
