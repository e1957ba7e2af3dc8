#pragma once

#include "ObstacleCollector.h"

#include <limits>
#include <optional>
#include <vector>

namespace elbow {

/// Candidate validation and shortest-path selection
namespace PathValidator {

/// Check a full polyline (start, waypoints..., end) against both obstacle sets.
///
/// The first (exit) and last (entry) segments are expected to touch the
/// connector's own shapes, so they are tested against the general set only;
/// interior segments are tested against general and connected obstacles.
bool isValid(const std::vector<Point>& fullPath, const ObstacleSets& obstacles);

/// Result of choosing among simplified candidates
struct Selection {
    std::optional<size_t> index;   ///< Winning candidate, nullopt if none validated
    Waypoints waypoints;           ///< Winning waypoints (stub points included)
    float length = std::numeric_limits<float>::infinity();
    size_t validCount = 0;
};

/// Pick the shortest valid candidate.
/// Ties keep the earliest candidate. With no obstacle sets (nullptr) every
/// candidate is valid.
/// @param start Connector start point
/// @param end Connector end point
/// @param candidates Simplified stub-to-stub candidates
/// @param obstacles Obstacle sets, or nullptr when no shapes were supplied
Selection selectShortest(
    const Point& start,
    const Point& end,
    const std::vector<Waypoints>& candidates,
    const ObstacleSets* obstacles);

}  // namespace PathValidator

}  // namespace elbow
