#pragma once

#include "elbow/routing/OrthogonalRouter.h"

#include <optional>
#include <string>
#include <vector>

namespace elbow {

/// Connection state of one connector endpoint
enum class ConnectionStatus {
    Connected,      ///< Attached shape exists and offers the anchor
    Orphaned,       ///< Attached shape id not found
    MissingAnchor,  ///< Shape exists but has no anchor with that name
    Floating        ///< Not attached to any shape
};

const char* connectionStatusName(ConnectionStatus status);

/// Health report of a connector's attachments
struct ConnectorHealth {
    ConnectionStatus startStatus = ConnectionStatus::Floating;
    ConnectionStatus endStatus = ConnectionStatus::Floating;
    bool isHealthy = true;
    std::vector<std::string> issues;
};

/// Unhealthy connector found in a shape map
struct OrphanedConnector {
    ShapeId connectorId;
    ConnectorHealth health;
};

/// Connector-level helpers on top of OrthogonalRouter.
namespace ConnectorRouting {

/// Start point: the attached shape's anchor if it resolves, else the stored (x, y)
Point resolveStartPoint(const Shape& connector, const ShapeMap& shapes, const ShapeRegistry& registry);

/// End point: the attached shape's anchor if it resolves, else the stored (x2, y2)
Point resolveEndPoint(const Shape& connector, const ShapeMap& shapes, const ShapeRegistry& registry);

/// Route request for a connector: resolved endpoints, its anchors, and an
/// exclude set of the connector itself plus both attached shapes
RouteRequest buildRequest(const Shape& connector, const ShapeMap& shapes, const ShapeRegistry& registry);

/// Waypoints for an orthogonal connector
/// @return nullopt if the connector uses straight routing
std::optional<Waypoints> calculateConnectorWaypoints(
    const Shape& connector,
    const ShapeMap& shapes,
    const OrthogonalRouter& router,
    RouteDiagnostics* diagnostics = nullptr);

/// Check both attachments of a connector
ConnectorHealth checkConnectorHealth(const Shape& connector, const ShapeMap& shapes, const ShapeRegistry& registry);

/// Every connector with at least one broken attachment, in id order
std::vector<OrphanedConnector> findOrphanedConnectors(const ShapeMap& shapes, const ShapeRegistry& registry);

/// Recompute and store waypoints of every orthogonal connector in the map.
/// Straight connectors have their waypoints cleared.
/// @return Number of connectors rerouted
size_t rerouteConnectors(ShapeMap& shapes, const OrthogonalRouter& router);

}  // namespace ConnectorRouting

}  // namespace elbow
