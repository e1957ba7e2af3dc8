#pragma once

#include "elbow/core/Types.h"

#include <vector>

namespace elbow {

namespace PathSimplifier {

/// Drop interior points that are collinear with the last kept point and their
/// successor (same x for all three, or same y for all three), and points
/// repeating the last kept one.
/// First and last points are kept unless they coincide, in which case a single
/// point remains. The pass is repeated until nothing more is removed, so
/// simplify(simplify(p)) == simplify(p).
std::vector<Point> simplify(const std::vector<Point>& points);

}  // namespace PathSimplifier

}  // namespace elbow
