#include "elbow/connector/ConnectorRouting.h"
#include "elbow/common/Logger.h"

namespace elbow {

const char* connectionStatusName(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::Orphaned: return "orphaned";
        case ConnectionStatus::MissingAnchor: return "missing-anchor";
        case ConnectionStatus::Floating: return "floating";
    }
    return "unknown";
}

namespace ConnectorRouting {

namespace {

Point resolveEndpoint(
    const std::optional<ShapeId>& shapeId,
    const AnchorPosition& anchor,
    const Point& stored,
    const ShapeMap& shapes,
    const ShapeRegistry& registry) {

    if (!shapeId) {
        return stored;
    }
    auto it = shapes.find(*shapeId);
    if (it == shapes.end()) {
        return stored;
    }
    if (auto resolved = registry.findAnchor(it->second, anchor)) {
        return resolved->point();
    }
    return stored;
}

ConnectionStatus checkEndpoint(
    const std::optional<ShapeId>& shapeId,
    const AnchorPosition& anchor,
    const char* label,
    const ShapeMap& shapes,
    const ShapeRegistry& registry,
    std::vector<std::string>& issues) {

    if (!shapeId) {
        return ConnectionStatus::Floating;
    }

    auto it = shapes.find(*shapeId);
    if (it == shapes.end()) {
        issues.push_back(fmt::format("{} shape \"{}\" not found", label, *shapeId));
        return ConnectionStatus::Orphaned;
    }

    // Shapes without anchors accept any attachment
    const IShapeHandler* handler = registry.find(it->second.type);
    if (!handler || !handler->hasAnchors()) {
        return ConnectionStatus::Connected;
    }

    if (registry.findAnchor(it->second, anchor)) {
        return ConnectionStatus::Connected;
    }

    issues.push_back(fmt::format("{} anchor \"{}\" not found on shape", label, anchor));
    return ConnectionStatus::MissingAnchor;
}

}  // namespace

Point resolveStartPoint(const Shape& connector, const ShapeMap& shapes, const ShapeRegistry& registry) {
    return resolveEndpoint(connector.startShapeId, connector.startAnchor,
                           {connector.x, connector.y}, shapes, registry);
}

Point resolveEndPoint(const Shape& connector, const ShapeMap& shapes, const ShapeRegistry& registry) {
    return resolveEndpoint(connector.endShapeId, connector.endAnchor,
                           {connector.x2, connector.y2}, shapes, registry);
}

RouteRequest buildRequest(const Shape& connector, const ShapeMap& shapes, const ShapeRegistry& registry) {
    RouteRequest request;
    request.startPoint = resolveStartPoint(connector, shapes, registry);
    request.endPoint = resolveEndPoint(connector, shapes, registry);
    request.startAnchor = connector.startAnchor;
    request.endAnchor = connector.endAnchor;
    request.shapes = &shapes;
    request.startShapeId = connector.startShapeId;
    request.endShapeId = connector.endShapeId;

    request.excludeIds.insert(connector.id);
    if (connector.startShapeId) request.excludeIds.insert(*connector.startShapeId);
    if (connector.endShapeId) request.excludeIds.insert(*connector.endShapeId);

    return request;
}

std::optional<Waypoints> calculateConnectorWaypoints(
    const Shape& connector,
    const ShapeMap& shapes,
    const OrthogonalRouter& router,
    RouteDiagnostics* diagnostics) {

    if (connector.routingMode != RoutingMode::Orthogonal) {
        return std::nullopt;
    }
    return router.route(buildRequest(connector, shapes, router.registry()), diagnostics);
}

ConnectorHealth checkConnectorHealth(const Shape& connector, const ShapeMap& shapes, const ShapeRegistry& registry) {
    ConnectorHealth health;
    health.startStatus = checkEndpoint(connector.startShapeId, connector.startAnchor, "Start",
                                       shapes, registry, health.issues);
    health.endStatus = checkEndpoint(connector.endShapeId, connector.endAnchor, "End",
                                     shapes, registry, health.issues);
    health.isHealthy = health.issues.empty();
    return health;
}

std::vector<OrphanedConnector> findOrphanedConnectors(const ShapeMap& shapes, const ShapeRegistry& registry) {
    std::vector<OrphanedConnector> orphaned;
    for (const auto& [id, shape] : shapes) {
        if (!shape.isConnector()) continue;

        ConnectorHealth health = checkConnectorHealth(shape, shapes, registry);
        if (!health.isHealthy) {
            orphaned.push_back({id, std::move(health)});
        }
    }
    return orphaned;
}

size_t rerouteConnectors(ShapeMap& shapes, const OrthogonalRouter& router) {
    // Route against a stable snapshot; results are written back afterwards
    std::vector<std::pair<ShapeId, Waypoints>> updates;

    for (const auto& [id, shape] : shapes) {
        if (!shape.isConnector()) continue;

        auto waypoints = calculateConnectorWaypoints(shape, shapes, router);
        updates.emplace_back(id, waypoints ? std::move(*waypoints) : Waypoints{});
        if (waypoints) {
            LOG_TRACE("Connector {} routed with {} waypoints", id, updates.back().second.size());
        }
    }

    size_t rerouted = 0;
    for (auto& [id, waypoints] : updates) {
        Shape& connector = shapes.at(id);
        if (connector.routingMode == RoutingMode::Orthogonal) {
            ++rerouted;
        }
        connector.waypoints = std::move(waypoints);
    }
    return rerouted;
}

}  // namespace ConnectorRouting

}  // namespace elbow
