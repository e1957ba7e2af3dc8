#include "elbow/routing/RoutingConfig.h"

namespace elbow {

RoutingConfig RoutingConfig::standard() {
    return RoutingConfig{};
}

RoutingConfig RoutingConfig::compact() {
    RoutingConfig config;
    config.stubLength = 10.0f;
    config.obstaclePadding = 8.0f;
    config.connectedPadding = 1.0f;
    return config;
}

RoutingConfig RoutingConfig::spacious() {
    RoutingConfig config;
    config.stubLength = 30.0f;
    config.obstaclePadding = 25.0f;
    config.connectedPadding = 4.0f;
    return config;
}

}  // namespace elbow
