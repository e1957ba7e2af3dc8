#include "DirectionResolver.h"

#include <cmath>

namespace elbow::DirectionResolver {

std::optional<Point> anchorDirection(const AnchorPosition& anchor) {
    if (anchor == anchors::TOP) return Point{0.0f, -1.0f};
    if (anchor == anchors::BOTTOM) return Point{0.0f, 1.0f};
    if (anchor == anchors::LEFT) return Point{-1.0f, 0.0f};
    if (anchor == anchors::RIGHT) return Point{1.0f, 0.0f};
    return std::nullopt;
}

Point inferDirection(const Point& from, const Point& to) {
    float dx = to.x - from.x;
    float dy = to.y - from.y;

    if (std::abs(dx) >= std::abs(dy)) {
        return dx < 0.0f ? Point{-1.0f, 0.0f} : Point{1.0f, 0.0f};
    }
    return dy < 0.0f ? Point{0.0f, -1.0f} : Point{0.0f, 1.0f};
}

Point resolve(const std::optional<AnchorPosition>& anchor, const Point& from, const Point& to) {
    if (anchor) {
        if (auto direction = anchorDirection(*anchor)) {
            return *direction;
        }
    }
    return inferDirection(from, to);
}

}  // namespace elbow::DirectionResolver
