#include "elbow/routing/OrthogonalRouter.h"
#include "elbow/common/Logger.h"
#include "elbow/core/GeometryUtils.h"

#include "AvoidanceFallback.h"
#include "CandidateGenerator.h"
#include "DirectionResolver.h"
#include "ObstacleCollector.h"
#include "PathSimplifier.h"
#include "PathValidator.h"

namespace elbow {

const char* routeStageName(RouteStage stage) {
    switch (stage) {
        case RouteStage::Candidate: return "candidate";
        case RouteStage::Fallback: return "fallback";
        case RouteStage::Unvalidated: return "unvalidated";
    }
    return "unknown";
}

OrthogonalRouter::OrthogonalRouter(const ShapeRegistry& registry, const RoutingConfig& config)
    : registry_(registry), config_(config) {}

Waypoints OrthogonalRouter::route(const RouteRequest& request, RouteDiagnostics* diagnostics) const {
    const Point& start = request.startPoint;
    const Point& end = request.endPoint;

    // Exit/entry directions and stubs
    Point startDir = DirectionResolver::resolve(request.startAnchor, start, end);
    Point endDir = DirectionResolver::resolve(request.endAnchor, end, start);

    Point startStub = DirectionResolver::extendStub(start, startDir, config_.stubLength);
    Point endStub = DirectionResolver::extendStub(end, endDir, config_.stubLength);

    // Obstacles only exist when a shape snapshot was supplied
    std::optional<ObstacleSets> obstacles;
    if (request.shapes) {
        ObstacleCollector collector(registry_, config_);
        obstacles = collector.collect(*request.shapes, request.excludeIds,
                                      request.startShapeId, request.endShapeId);
    }

    std::vector<CandidatePath> candidates = CandidateGenerator::generate(
        startStub, endStub,
        DirectionResolver::isHorizontal(startDir),
        DirectionResolver::isHorizontal(endDir));

    std::vector<Waypoints> simplified;
    simplified.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        simplified.push_back(PathSimplifier::simplify(candidate));
    }

    PathValidator::Selection selection = PathValidator::selectShortest(
        start, end, simplified, obstacles ? &*obstacles : nullptr);

    RouteStage stage = RouteStage::Candidate;
    Waypoints result;

    if (selection.index) {
        result = std::move(selection.waypoints);
    } else if (obstacles && !obstacles->general.empty()) {
        LOG_DEBUG("No clear candidate among {} ({} obstacles), trying bypass",
                  simplified.size(), obstacles->general.size());

        AvoidanceFallback::Result fallback = AvoidanceFallback::avoid(
            start, end, simplified.front(), obstacles->general, config_.obstaclePadding);

        // Bypass corners coincide when start and end share the bypass axis
        result = PathSimplifier::simplify(fallback.waypoints);
        stage = fallback.bypassed ? RouteStage::Fallback : RouteStage::Unvalidated;
    } else {
        result = simplified.front();
        stage = RouteStage::Unvalidated;
    }

    if (stage == RouteStage::Unvalidated) {
        LOG_WARN("Returning unvalidated path from ({}, {}) to ({}, {})",
                 start.x, start.y, end.x, end.y);
    }

    if (diagnostics) {
        diagnostics->candidateCount = simplified.size();
        diagnostics->validCandidates = selection.validCount;
        diagnostics->generalObstacles = obstacles ? obstacles->general.size() : 0;
        diagnostics->connectedObstacles = obstacles ? obstacles->connected.size() : 0;
        diagnostics->selectedCandidate = selection.index ? static_cast<int>(*selection.index) : -1;
        diagnostics->stage = stage;
        diagnostics->length = geometry::polylineLength(geometry::buildPolyline(start, result, end));
    }

    return result;
}

}  // namespace elbow
