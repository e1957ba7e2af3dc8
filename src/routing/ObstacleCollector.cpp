#include "ObstacleCollector.h"
#include "elbow/common/Logger.h"

namespace elbow {

std::vector<Box> ObstacleSets::combined() const {
    std::vector<Box> all;
    all.reserve(general.size() + connected.size());
    all.insert(all.end(), general.begin(), general.end());
    all.insert(all.end(), connected.begin(), connected.end());
    return all;
}

std::optional<Box> ObstacleCollector::paddedBounds(const Shape& shape, float padding) const {
    auto bounds = registry_.boundsOf(shape);
    if (!bounds) {
        LOG_DEBUG("No handler for shape type '{}' ({}), not an obstacle", shape.type, shape.id);
        return std::nullopt;
    }
    return bounds->expanded(padding);
}

std::vector<Box> ObstacleCollector::collectGeneral(
    const ShapeMap& shapes,
    const std::unordered_set<ShapeId>& excludeIds) const {

    std::vector<Box> obstacles;
    for (const auto& [id, shape] : shapes) {
        if (excludeIds.count(id) > 0) continue;
        if (shape.isConnector()) continue;  // Connectors never block other connectors

        if (auto box = paddedBounds(shape, config_.obstaclePadding)) {
            obstacles.push_back(*box);
        }
    }
    return obstacles;
}

std::vector<Box> ObstacleCollector::collectConnected(
    const ShapeMap& shapes,
    const std::optional<ShapeId>& startShapeId,
    const std::optional<ShapeId>& endShapeId) const {

    std::vector<Box> obstacles;
    for (const auto* shapeId : {&startShapeId, &endShapeId}) {
        if (!shapeId->has_value()) continue;

        auto it = shapes.find(**shapeId);
        if (it == shapes.end() || it->second.isConnector()) continue;

        if (auto box = paddedBounds(it->second, config_.connectedPadding)) {
            obstacles.push_back(*box);
        }
    }
    return obstacles;
}

ObstacleSets ObstacleCollector::collect(
    const ShapeMap& shapes,
    const std::unordered_set<ShapeId>& excludeIds,
    const std::optional<ShapeId>& startShapeId,
    const std::optional<ShapeId>& endShapeId) const {

    ObstacleSets sets;
    sets.general = collectGeneral(shapes, excludeIds);
    sets.connected = collectConnected(shapes, startShapeId, endShapeId);
    return sets;
}

}  // namespace elbow
