#pragma once

#include "elbow/core/GeometryUtils.h"

namespace elbow {

/// Tunable distances used by OrthogonalRouter
///
/// The two paddings are deliberately separate: unrelated shapes need a
/// generous clearance, while the shapes a connector is attached to only
/// need enough padding to catch a path cutting back through them.
///
/// Presets:
/// - standard(): editor defaults
/// - compact(): tighter paths for dense diagrams
/// - spacious(): wide clearances for presentation output
///
/// Usage:
/// @code
/// auto config = RoutingConfig::standard().withStubLength(30.0f);
/// OrthogonalRouter router(registry, config);
/// @endcode
struct RoutingConfig {
    /// Distance an endpoint is extended along its exit direction before the first turn
    float stubLength = constants::DEFAULT_STUB_LENGTH;

    /// Padding added around unrelated shapes (general obstacles)
    float obstaclePadding = constants::DEFAULT_OBSTACLE_PADDING;

    /// Padding added around the connector's own start/end shapes
    float connectedPadding = constants::DEFAULT_CONNECTED_PADDING;

    // === Named Presets ===

    static RoutingConfig standard();
    static RoutingConfig compact();
    static RoutingConfig spacious();

    // === Convenience Methods ===

    RoutingConfig& withStubLength(float length) {
        stubLength = length;
        return *this;
    }

    RoutingConfig& withObstaclePadding(float padding) {
        obstaclePadding = padding;
        return *this;
    }

    RoutingConfig& withConnectedPadding(float padding) {
        connectedPadding = padding;
        return *this;
    }

    bool operator==(const RoutingConfig& o) const {
        return stubLength == o.stubLength && obstaclePadding == o.obstaclePadding &&
               connectedPadding == o.connectedPadding;
    }
};

}  // namespace elbow
