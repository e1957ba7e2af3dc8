#pragma once

/// @file elbow.h
/// @brief Main header for the elbow connector routing library
///
/// elbow computes orthogonal (Manhattan) waypoints for connectors between
/// shapes on a 2D canvas, keeping clear of unrelated shapes.
///
/// Example usage:
/// @code
/// #include <elbow/elbow.h>
///
/// elbow::ShapeMap shapes;
/// shapes["a"] = ...;  // rectangles, ellipses, connectors
///
/// auto registry = elbow::ShapeRegistry::withBuiltins();
/// elbow::OrthogonalRouter router(registry);
/// elbow::ConnectorRouting::rerouteConnectors(shapes, router);
///
/// elbow::SvgExport svg;
/// svg.exportToFile(elbow::Scene{shapes, router.config()}, registry, "output.svg");
/// @endcode

// Core module - Geometry value types
#include "core/Types.h"
#include "core/GeometryUtils.h"

// Shapes module - Shape records and handlers
#include "shapes/Shape.h"
#include "shapes/IShapeHandler.h"
#include "shapes/ShapeRegistry.h"

// Routing module - Router and its configuration
#include "routing/RoutingConfig.h"
#include "routing/OrthogonalRouter.h"
#include "connector/ConnectorRouting.h"

// I/O and export
#include "io/SceneSerializer.h"
#include "export/IExporter.h"
#include "export/SvgExport.h"

#include <string>

namespace elbow {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace elbow
