#pragma once

#include "elbow/routing/RoutingConfig.h"
#include "elbow/shapes/Shape.h"

#include <string>

namespace elbow {

/// A shape snapshot plus the routing settings it should be routed with
struct Scene {
    ShapeMap shapes;
    RoutingConfig routing;
};

/// Handles JSON serialization and file I/O for scenes
///
/// Format (version 1):
/// @code
/// {"version": 1,
///  "shapes": [{"id": "a", "type": "rectangle", "x": 0, "y": 0, "width": 100, "height": 60},
///             {"id": "c", "type": "connector", "x": 0, "y": 0, "x2": 300, "y2": 0,
///              "startShapeId": "a", "startAnchor": "right", "endShapeId": null,
///              "routingMode": "orthogonal", "waypoints": [{"x": 20, "y": 0}]}],
///  "routing": {"stubLength": 20, "obstaclePadding": 15, "connectedPadding": 2}}
/// @endcode
class SceneSerializer {
public:
    /// Serialize a scene to a JSON string
    /// @param indent Pretty-print indentation (-1 for compact output)
    static std::string toJson(const Scene& scene, int indent = 2);

    /// Parse a scene
    /// @throws std::runtime_error if the text is not valid JSON or a field has the wrong type
    static Scene sceneFromJson(const std::string& json);

    /// Save scene to file
    /// @return true if save succeeded
    static bool saveToFile(const Scene& scene, const std::string& path);

    /// Load scene from file
    /// @return true if load succeeded (failures are logged)
    static bool loadFromFile(Scene& scene, const std::string& path);

    /// Serialize routing settings to a JSON object string
    static std::string toJson(const RoutingConfig& config);

    /// Parse routing settings; missing keys keep their defaults
    /// @throws std::runtime_error on invalid JSON
    static RoutingConfig routingConfigFromJson(const std::string& json);

    /// Serialize waypoints as [{"x": .., "y": ..}, ...]
    static std::string waypointsToJson(const Waypoints& waypoints);

private:
    static std::string routingModeToString(RoutingMode mode);
    static RoutingMode stringToRoutingMode(const std::string& str);
};

}  // namespace elbow
