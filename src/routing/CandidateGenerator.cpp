#include "CandidateGenerator.h"
#include "elbow/core/GeometryUtils.h"

#include <cmath>

namespace elbow::CandidateGenerator {

CandidatePath zPath(const Point& startStub, const Point& endStub, bool horizontalExits) {
    if (horizontalExits) {
        float midX = (startStub.x + endStub.x) / 2;
        return {startStub, {midX, startStub.y}, {midX, endStub.y}, endStub};
    }
    float midY = (startStub.y + endStub.y) / 2;
    return {startStub, {startStub.x, midY}, {endStub.x, midY}, endStub};
}

CandidatePath lPath(const Point& startStub, const Point& endStub, bool startHorizontal) {
    if (startHorizontal) {
        // Start runs horizontally, end arrives vertically
        return {startStub, {endStub.x, startStub.y}, endStub};
    }
    return {startStub, {startStub.x, endStub.y}, endStub};
}

std::vector<CandidatePath> generate(
    const Point& startStub,
    const Point& endStub,
    bool startHorizontal,
    bool endHorizontal) {

    std::vector<CandidatePath> candidates;
    candidates.reserve(7);

    if (startHorizontal == endHorizontal) {
        candidates.push_back(zPath(startStub, endStub, startHorizontal));
    } else {
        candidates.push_back(lPath(startStub, endStub, startHorizontal));
    }

    candidates.push_back(zPath(startStub, endStub, true));
    candidates.push_back(zPath(startStub, endStub, false));
    candidates.push_back(lPath(startStub, endStub, true));
    candidates.push_back(lPath(startStub, endStub, false));

    float dx = endStub.x - startStub.x;
    float dy = endStub.y - startStub.y;

    // Direct candidates end on the end stub itself so the entry segment
    // keeps the end direction's axis
    if (std::abs(dx) < constants::EPSILON) {
        candidates.push_back({startStub, endStub});
    }
    if (std::abs(dy) < constants::EPSILON) {
        candidates.push_back({startStub, endStub});
    }

    return candidates;
}

}  // namespace elbow::CandidateGenerator
