#include "elbow/export/SvgExport.h"
#include "elbow/connector/ConnectorRouting.h"

#include <fstream>
#include <optional>
#include <sstream>

namespace elbow {

SvgExport::SvgExport(const SvgExportOptions& options)
    : options_(options) {}

std::string SvgExport::exportToString(const Scene& scene, const ShapeRegistry& registry) {
    std::ostringstream out;
    exportToStream(scene, registry, out);
    return out.str();
}

void SvgExport::exportToStream(const Scene& scene, const ShapeRegistry& registry, std::ostream& out) {
    Box bounds = computeBounds(scene, registry);

    writeHeader(out, bounds);
    writeStyles(out);
    writeMarkers(out);

    // Shapes first so connectors are drawn on top
    for (const auto& [id, shape] : scene.shapes) {
        if (shape.isConnector() || !shape.visible) continue;
        if (auto shapeBounds = registry.boundsOf(shape)) {
            writeShape(out, shape, *shapeBounds);
        }
    }

    if (options_.showObstacles) {
        for (const auto& [id, shape] : scene.shapes) {
            if (shape.isConnector()) continue;
            if (auto shapeBounds = registry.boundsOf(shape)) {
                writeObstacle(out, shapeBounds->expanded(scene.routing.obstaclePadding));
            }
        }
    }

    for (const auto& [id, shape] : scene.shapes) {
        if (shape.isConnector() && shape.visible) {
            writeConnector(out, shape, scene, registry);
        }
    }

    writeFooter(out);
}

bool SvgExport::exportToFile(const Scene& scene, const ShapeRegistry& registry, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    exportToStream(scene, registry, file);
    return true;
}

Box SvgExport::computeBounds(const Scene& scene, const ShapeRegistry& registry) const {
    std::optional<Box> bounds;
    for (const auto& [id, shape] : scene.shapes) {
        auto shapeBounds = registry.boundsOf(shape);
        if (!shapeBounds) continue;
        if (options_.showObstacles && !shape.isConnector()) {
            shapeBounds = shapeBounds->expanded(scene.routing.obstaclePadding);
        }
        bounds = bounds ? bounds->united(*shapeBounds) : *shapeBounds;
    }
    return bounds.value_or(Box{}).expanded(options_.padding);
}

void SvgExport::writeHeader(std::ostream& out, const Box& bounds) {
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" "
        << "width=\"" << bounds.width() << "\" "
        << "height=\"" << bounds.height() << "\" "
        << "viewBox=\"" << bounds.minX << " " << bounds.minY << " "
        << bounds.width() << " " << bounds.height() << "\">\n";

    // Background
    out << "  <rect x=\"" << bounds.minX << "\" y=\"" << bounds.minY << "\" "
        << "width=\"" << bounds.width() << "\" height=\"" << bounds.height() << "\" "
        << "fill=\"" << options_.backgroundColor << "\"/>\n";
}

void SvgExport::writeStyles(std::ostream& out) {
    if (!options_.embedStyles) return;

    out << "  <style>\n";
    out << "    .shape { fill: " << options_.shapeFill << "; "
        << "stroke: " << options_.shapeStroke << "; "
        << "stroke-width: " << options_.shapeStrokeWidth << "; }\n";
    out << "    .connector { fill: none; "
        << "stroke: " << options_.connectorStroke << "; "
        << "stroke-width: " << options_.connectorStrokeWidth << "; }\n";
    out << "    .obstacle { fill: none; "
        << "stroke: " << options_.obstacleStroke << "; "
        << "stroke-dasharray: " << options_.obstacleStrokeDasharray << "; }\n";
    out << "    .waypoint { fill: " << options_.connectorStroke << "; }\n";
    out << "    .label { fill: " << options_.textFill << "; "
        << "font-family: " << options_.fontFamily << "; "
        << "font-size: " << options_.fontSize << "px; "
        << "text-anchor: middle; dominant-baseline: central; }\n";
    out << "  </style>\n";
}

void SvgExport::writeMarkers(std::ostream& out) {
    out << "  <defs>\n";
    out << "    <marker id=\"arrowhead\" markerWidth=\"10\" markerHeight=\"7\" "
        << "refX=\"9\" refY=\"3.5\" orient=\"auto\">\n";
    out << "      <polygon points=\"0 0, 10 3.5, 0 7\" fill=\""
        << options_.connectorStroke << "\"/>\n";
    out << "    </marker>\n";
    out << "  </defs>\n";
}

void SvgExport::writeFooter(std::ostream& out) {
    out << "</svg>\n";
}

void SvgExport::writeShape(std::ostream& out, const Shape& shape, const Box& bounds) {
    if (shape.type == shape_types::ELLIPSE) {
        Point center = bounds.center();
        out << "  <ellipse class=\"shape\" "
            << "cx=\"" << center.x << "\" cy=\"" << center.y << "\" "
            << "rx=\"" << bounds.width() / 2 << "\" ry=\"" << bounds.height() / 2 << "\"/>\n";
    } else if (shape.type == shape_types::LINE) {
        out << "  <line class=\"shape\" "
            << "x1=\"" << shape.x << "\" y1=\"" << shape.y << "\" "
            << "x2=\"" << shape.x2 << "\" y2=\"" << shape.y2 << "\"/>\n";
        return;
    } else {
        out << "  <rect class=\"shape\" "
            << "x=\"" << bounds.minX << "\" "
            << "y=\"" << bounds.minY << "\" "
            << "width=\"" << bounds.width() << "\" "
            << "height=\"" << bounds.height() << "\"/>\n";
    }

    if (options_.showLabels) {
        Point center = bounds.center();
        out << "  <text class=\"label\" "
            << "x=\"" << center.x << "\" "
            << "y=\"" << center.y << "\">"
            << escapeXml(shape.id) << "</text>\n";
    }
}

void SvgExport::writeConnector(std::ostream& out, const Shape& connector, const Scene& scene,
                               const ShapeRegistry& registry) {
    Point start = ConnectorRouting::resolveStartPoint(connector, scene.shapes, registry);
    Point end = ConnectorRouting::resolveEndPoint(connector, scene.shapes, registry);

    // Straight connectors ignore any stale waypoints
    Waypoints waypoints;
    if (connector.routingMode == RoutingMode::Orthogonal) {
        waypoints = connector.waypoints;
    }

    out << "  <path class=\"connector\" d=\"";
    out << "M " << start.x << " " << start.y;
    for (const auto& wp : waypoints) {
        out << " L " << wp.x << " " << wp.y;
    }
    out << " L " << end.x << " " << end.y;
    out << "\" marker-end=\"" << options_.connectorMarkerEnd << "\"/>\n";

    if (options_.showWaypoints) {
        for (const auto& wp : waypoints) {
            out << "  <circle class=\"waypoint\" cx=\"" << wp.x << "\" cy=\"" << wp.y
                << "\" r=\"2\"/>\n";
        }
    }
}

void SvgExport::writeObstacle(std::ostream& out, const Box& box) {
    out << "  <rect class=\"obstacle\" "
        << "x=\"" << box.minX << "\" "
        << "y=\"" << box.minY << "\" "
        << "width=\"" << box.width() << "\" "
        << "height=\"" << box.height() << "\"/>\n";
}

std::string SvgExport::escapeXml(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }

    return result;
}

}  // namespace elbow
