#pragma once

#include <elbow/elbow.h>
#include <elbow/common/ILoggerBackend.h>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace elbow::cli {

/// Command line settings of elbow_route
struct RouteOptions {
    std::string scenePath;
    std::string outputPath;   ///< Empty writes the scene JSON to the output stream
    std::string svgPath;
    std::string configPath;
    std::string preset;
    std::optional<LogLevel> logLevel;
    bool showObstacles = false;
};

enum class ParseResult {
    Run,
    Help,
    Version,
    Error
};

/// Parse arguments (without the program name)
/// Errors are described on err.
ParseResult parseArgs(const std::vector<std::string>& args, RouteOptions& options, std::ostream& err);

void printUsage(const std::string& program, std::ostream& out);

/// Apply --preset, then --config, over the scene's own routing block
/// @return false for an unknown preset or an unreadable config file (logged)
bool applyRoutingOverrides(Scene& scene, const RouteOptions& options);

struct RouteSummary {
    size_t routed = 0;
    size_t straight = 0;
    size_t degraded = 0;  ///< Routed without a clear candidate
};

/// Recompute the waypoints of every connector in the scene
RouteSummary routeScene(Scene& scene, const ShapeRegistry& registry);

/// Load, route and write a scene
/// @return Process exit code
int run(const RouteOptions& options, std::ostream& out);

}  // namespace elbow::cli
