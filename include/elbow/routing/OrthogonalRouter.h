#pragma once

#include "elbow/routing/RoutingConfig.h"
#include "elbow/shapes/ShapeRegistry.h"

#include <optional>
#include <unordered_set>

namespace elbow {

/// Inputs of a single routing call.
///
/// Built fresh by the caller for every recompute. `shapes` is a snapshot
/// reference that must stay unchanged for the duration of the call; when it
/// is null no obstacles are considered.
struct RouteRequest {
    Point startPoint;
    Point endPoint;

    /// Side anchors fix the exit direction; none/"center"/custom anchors infer it
    std::optional<AnchorPosition> startAnchor;
    std::optional<AnchorPosition> endAnchor;

    const ShapeMap* shapes = nullptr;

    /// Shapes never treated as general obstacles (should contain the connector's own id)
    std::unordered_set<ShapeId> excludeIds;

    /// Shapes the connector is attached to (minimal-padding obstacles for interior segments)
    std::optional<ShapeId> startShapeId;
    std::optional<ShapeId> endShapeId;
};

/// Which step produced the returned waypoints
enum class RouteStage {
    Candidate,    ///< Shortest obstacle-free candidate
    Fallback,     ///< Bypass around the union of struck obstacles
    Unvalidated   ///< First candidate returned as-is; may cross obstacles
};

/// Optional bookkeeping filled by OrthogonalRouter::route
struct RouteDiagnostics {
    size_t candidateCount = 0;
    size_t validCandidates = 0;
    size_t generalObstacles = 0;
    size_t connectedObstacles = 0;
    int selectedCandidate = -1;   ///< Index into the candidate menu, -1 if none validated
    RouteStage stage = RouteStage::Candidate;
    float length = 0.0f;          ///< Full path length start -> waypoints -> end
};

const char* routeStageName(RouteStage stage);

/// Rectilinear connector router.
///
/// Evaluates a fixed menu of Z- and L-shaped candidates between the two
/// stub points, keeps the shortest one that clears every obstacle, and
/// falls back to a four-way bypass around the struck obstacles when no
/// candidate is clear. Every call is independent and always yields a
/// drawable path.
///
/// Usage:
/// @code
/// auto registry = ShapeRegistry::withBuiltins();
/// OrthogonalRouter router(registry);
///
/// RouteRequest request;
/// request.startPoint = {0, 0};
/// request.startAnchor = "right";
/// request.endPoint = {200, 100};
/// request.endAnchor = "left";
/// Waypoints path = router.route(request);  // (20,0) (100,0) (100,100) (180,100)
/// @endcode
class OrthogonalRouter {
public:
    explicit OrthogonalRouter(const ShapeRegistry& registry,
                              const RoutingConfig& config = RoutingConfig::standard());

    /// Compute interior waypoints for a connector path
    /// @param request Endpoints, anchors and optional obstacle snapshot
    /// @param diagnostics Optional output describing how the result was chosen
    /// @return Waypoints excluding request.startPoint and request.endPoint
    Waypoints route(const RouteRequest& request, RouteDiagnostics* diagnostics = nullptr) const;

    const RoutingConfig& config() const { return config_; }
    const ShapeRegistry& registry() const { return registry_; }

private:
    const ShapeRegistry& registry_;
    RoutingConfig config_;
};

}  // namespace elbow
