#pragma once

#include "elbow/io/SceneSerializer.h"
#include "elbow/shapes/ShapeRegistry.h"
#include "IExporter.h"

#include <ostream>
#include <string>

namespace elbow {

/// Options for SVG export
struct SvgExportOptions {
    // Canvas settings
    float padding = 20.0f;
    std::string backgroundColor = "white";

    // Shape styling
    std::string shapeFill = "#e0e0e0";
    std::string shapeStroke = "#333333";
    float shapeStrokeWidth = 1.5f;

    // Connector styling
    std::string connectorStroke = "#1f5fbf";
    float connectorStrokeWidth = 1.5f;
    std::string connectorMarkerEnd = "url(#arrowhead)";

    // Obstacle overlay (padded boxes the router avoids)
    bool showObstacles = false;
    std::string obstacleStroke = "#d04040";
    std::string obstacleStrokeDasharray = "4,3";

    // Draw small circles at waypoints
    bool showWaypoints = false;

    // Shape id labels
    bool showLabels = true;
    std::string textFill = "#000000";
    std::string fontFamily = "Arial, sans-serif";
    float fontSize = 12.0f;

    bool embedStyles = true;
};

/// Renders a routed scene to SVG for inspection
///
/// Shapes are drawn as their bounding boxes (ellipses as ellipses), connectors
/// as paths through their stored waypoints.
class SvgExport : public IExporter {
public:
    SvgExport() = default;
    explicit SvgExport(const SvgExportOptions& options);
    ~SvgExport() override = default;

    std::string exportToString(const Scene& scene, const ShapeRegistry& registry) override;
    void exportToStream(const Scene& scene, const ShapeRegistry& registry, std::ostream& out) override;
    bool exportToFile(const Scene& scene, const ShapeRegistry& registry, const std::string& filename) override;

    std::string fileExtension() const override { return "svg"; }
    std::string mimeType() const override { return "image/svg+xml"; }

    void setOptions(const SvgExportOptions& options) { options_ = options; }
    const SvgExportOptions& options() const { return options_; }

private:
    SvgExportOptions options_;

    Box computeBounds(const Scene& scene, const ShapeRegistry& registry) const;

    void writeHeader(std::ostream& out, const Box& bounds);
    void writeStyles(std::ostream& out);
    void writeMarkers(std::ostream& out);
    void writeFooter(std::ostream& out);

    void writeShape(std::ostream& out, const Shape& shape, const Box& bounds);
    void writeConnector(std::ostream& out, const Shape& connector, const Scene& scene,
                        const ShapeRegistry& registry);
    void writeObstacle(std::ostream& out, const Box& box);

    std::string escapeXml(const std::string& text);
};

}  // namespace elbow
