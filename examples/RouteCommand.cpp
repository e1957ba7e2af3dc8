#include "RouteCommand.h"

#include <elbow/common/Logger.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace elbow::cli {

namespace {

bool readFile(const std::string& path, std::string& content) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    content = buffer.str();
    return true;
}

}  // namespace

ParseResult parseArgs(const std::vector<std::string>& args, RouteOptions& options, std::ostream& err) {
    for (const auto& arg : args) {
        if (arg == "-h" || arg == "--help") return ParseResult::Help;
        if (arg == "--version") return ParseResult::Version;
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto needValue = [&](std::string& target) {
            if (i + 1 >= args.size()) {
                err << "Missing value for " << arg << "\n";
                return false;
            }
            target = args[++i];
            return true;
        };

        if (arg == "-o" || arg == "--output") {
            if (!needValue(options.outputPath)) return ParseResult::Error;
        } else if (arg == "--svg") {
            if (!needValue(options.svgPath)) return ParseResult::Error;
        } else if (arg == "--config") {
            if (!needValue(options.configPath)) return ParseResult::Error;
        } else if (arg == "--preset") {
            if (!needValue(options.preset)) return ParseResult::Error;
        } else if (arg == "--log-level") {
            std::string name;
            if (!needValue(name)) return ParseResult::Error;
            LogLevel level;
            if (!parseLogLevel(name, level)) {
                err << "Unknown log level: " << name << "\n";
                return ParseResult::Error;
            }
            options.logLevel = level;
        } else if (arg == "--show-obstacles") {
            options.showObstacles = true;
        } else if (!arg.empty() && arg[0] == '-') {
            err << "Unknown option: " << arg << "\n";
            return ParseResult::Error;
        } else if (options.scenePath.empty()) {
            options.scenePath = arg;
        } else {
            err << "Unexpected argument: " << arg << "\n";
            return ParseResult::Error;
        }
    }

    if (options.scenePath.empty()) {
        err << "No scene file given\n";
        return ParseResult::Error;
    }
    return ParseResult::Run;
}

void printUsage(const std::string& program, std::ostream& out) {
    out << "Usage: " << program << " <scene.json> [options]\n"
        << "\n"
        << "Routes every orthogonal connector of a scene and writes the updated scene.\n"
        << "\n"
        << "Options:\n"
        << "  -o <file>            Write scene JSON to file (default: stdout)\n"
        << "  --svg <file>         Also render the routed scene as SVG\n"
        << "  --config <file>      Routing settings JSON (overrides the scene's block)\n"
        << "  --preset <name>      standard, compact or spacious\n"
        << "  --show-obstacles     Draw padded obstacle boxes in the SVG\n"
        << "  --log-level <level>  trace, debug, info, warn, error, off\n"
        << "  --version            Print version and exit\n";
}

bool applyRoutingOverrides(Scene& scene, const RouteOptions& options) {
    if (options.preset == "compact") {
        scene.routing = RoutingConfig::compact();
    } else if (options.preset == "spacious") {
        scene.routing = RoutingConfig::spacious();
    } else if (options.preset == "standard") {
        scene.routing = RoutingConfig::standard();
    } else if (!options.preset.empty()) {
        LOG_ERROR("Unknown preset '{}'", options.preset);
        return false;
    }

    if (options.configPath.empty()) {
        return true;
    }

    std::string content;
    if (!readFile(options.configPath, content)) {
        LOG_ERROR("Cannot open {}", options.configPath);
        return false;
    }
    try {
        scene.routing = SceneSerializer::routingConfigFromJson(content);
    } catch (const std::runtime_error& e) {
        LOG_ERROR("{}: {}", options.configPath, e.what());
        return false;
    }
    return true;
}

RouteSummary routeScene(Scene& scene, const ShapeRegistry& registry) {
    OrthogonalRouter router(registry, scene.routing);
    RouteSummary summary;

    // Broken attachments still route from their stored coordinates
    for (const auto& orphan : ConnectorRouting::findOrphanedConnectors(scene.shapes, registry)) {
        for (const auto& issue : orphan.health.issues) {
            LOG_WARN("Connector {}: {}", orphan.connectorId, issue);
        }
    }

    for (auto& [id, shape] : scene.shapes) {
        if (!shape.isConnector()) continue;

        RouteDiagnostics diagnostics;
        auto waypoints = ConnectorRouting::calculateConnectorWaypoints(
            shape, scene.shapes, router, &diagnostics);
        if (!waypoints) {
            shape.waypoints.clear();
            ++summary.straight;
            LOG_DEBUG("Connector {} is straight, nothing to route", id);
            continue;
        }

        LOG_DEBUG("Connector {}: {} waypoints via {} ({}/{} candidates clear, length {:.1f})",
                  id, waypoints->size(), routeStageName(diagnostics.stage),
                  diagnostics.validCandidates, diagnostics.candidateCount, diagnostics.length);

        if (diagnostics.stage != RouteStage::Candidate) {
            ++summary.degraded;
        }
        shape.waypoints = std::move(*waypoints);
        ++summary.routed;
    }

    return summary;
}

int run(const RouteOptions& options, std::ostream& out) {
    Scene scene;
    if (!SceneSerializer::loadFromFile(scene, options.scenePath)) {
        return 1;
    }
    if (!applyRoutingOverrides(scene, options)) {
        return 1;
    }

    LOG_INFO("Loaded {} shapes from {} (stub {}, padding {}/{})",
             scene.shapes.size(), options.scenePath, scene.routing.stubLength,
             scene.routing.obstaclePadding, scene.routing.connectedPadding);

    ShapeRegistry registry = ShapeRegistry::withBuiltins();
    RouteSummary summary = routeScene(scene, registry);
    LOG_INFO("Routed {} connectors ({} without a clear candidate)", summary.routed, summary.degraded);

    if (options.outputPath.empty()) {
        out << SceneSerializer::toJson(scene) << "\n";
    } else if (!SceneSerializer::saveToFile(scene, options.outputPath)) {
        return 1;
    }

    if (!options.svgPath.empty()) {
        SvgExportOptions svgOptions;
        svgOptions.showObstacles = options.showObstacles;
        SvgExport svg(svgOptions);
        if (!svg.exportToFile(scene, registry, options.svgPath)) {
            LOG_ERROR("Cannot write {}", options.svgPath);
            return 1;
        }
        LOG_INFO("Generated: {}", options.svgPath);
    }

    return 0;
}

}  // namespace elbow::cli
