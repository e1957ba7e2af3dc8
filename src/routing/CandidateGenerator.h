#pragma once

#include "elbow/core/Types.h"

#include <vector>

namespace elbow {

/// Stub-to-stub polyline (first point is the start stub, last the end stub)
using CandidatePath = std::vector<Point>;

/// Fixed menu of rectilinear routing strategies between two stubs.
///
/// Menu order (the order is the tie-breaker downstream):
/// 1. Orientation-matched default (Z-path for equal orientations, L-path otherwise)
/// 2. Z-path bridged at the midpoint x
/// 3. Z-path bridged at the midpoint y
/// 4. L-path with corner (endStub.x, startStub.y)
/// 5. L-path with corner (startStub.x, endStub.y)
/// 6. Direct vertical segment, only if the stubs share x (within EPSILON)
/// 7. Direct horizontal segment, only if the stubs share y (within EPSILON)
namespace CandidateGenerator {

/// Generate all candidates
/// @param startStub Start stub point
/// @param endStub End stub point
/// @param startHorizontal True if the start exits horizontally
/// @param endHorizontal True if the end enters horizontally
std::vector<CandidatePath> generate(
    const Point& startStub,
    const Point& endStub,
    bool startHorizontal,
    bool endHorizontal);

/// Two-corner path with a perpendicular bridge at the midpoint x (horizontal
/// exits) or midpoint y (vertical exits)
CandidatePath zPath(const Point& startStub, const Point& endStub, bool horizontalExits);

/// Single-corner path at the intersection of the two stub lines
CandidatePath lPath(const Point& startStub, const Point& endStub, bool startHorizontal);

}  // namespace CandidateGenerator

}  // namespace elbow
