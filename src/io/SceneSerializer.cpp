#include "elbow/io/SceneSerializer.h"
#include "elbow/common/Logger.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace elbow {

namespace {

constexpr int SCENE_VERSION = 1;

json pointsToJson(const Waypoints& points) {
    json arr = json::array();
    for (const auto& p : points) {
        arr.push_back({{"x", p.x}, {"y", p.y}});
    }
    return arr;
}

Waypoints pointsFromJson(const json& arr) {
    Waypoints points;
    for (const auto& p : arr) {
        points.emplace_back(p.at("x").get<float>(), p.at("y").get<float>());
    }
    return points;
}

json optionalIdToJson(const std::optional<ShapeId>& id) {
    return id ? json(*id) : json(nullptr);
}

std::optional<ShapeId> optionalIdFromJson(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

json routingToJsonObject(const RoutingConfig& config) {
    return {
        {"stubLength", config.stubLength},
        {"obstaclePadding", config.obstaclePadding},
        {"connectedPadding", config.connectedPadding}
    };
}

RoutingConfig routingFromJsonObject(const json& j) {
    RoutingConfig config;
    config.stubLength = j.value("stubLength", config.stubLength);
    config.obstaclePadding = j.value("obstaclePadding", config.obstaclePadding);
    config.connectedPadding = j.value("connectedPadding", config.connectedPadding);
    return config;
}

}  // namespace

std::string SceneSerializer::routingModeToString(RoutingMode mode) {
    switch (mode) {
        case RoutingMode::Straight: return "straight";
        case RoutingMode::Orthogonal: return "orthogonal";
    }
    return "orthogonal";
}

RoutingMode SceneSerializer::stringToRoutingMode(const std::string& str) {
    if (str == "straight") return RoutingMode::Straight;
    return RoutingMode::Orthogonal;
}

std::string SceneSerializer::toJson(const Scene& scene, int indent) {
    json j;
    j["version"] = SCENE_VERSION;

    json shapes = json::array();
    for (const auto& [id, shape] : scene.shapes) {
        json s = {
            {"id", shape.id},
            {"type", shape.type},
            {"x", shape.x},
            {"y", shape.y},
            {"rotation", shape.rotation},
            {"strokeWidth", shape.strokeWidth},
            {"visible", shape.visible}
        };

        if (shape.type == shape_types::ELLIPSE) {
            s["radiusX"] = shape.radiusX;
            s["radiusY"] = shape.radiusY;
        } else if (shape.type == shape_types::LINE) {
            s["x2"] = shape.x2;
            s["y2"] = shape.y2;
        } else if (shape.isConnector()) {
            s["x2"] = shape.x2;
            s["y2"] = shape.y2;
            s["startShapeId"] = optionalIdToJson(shape.startShapeId);
            s["startAnchor"] = shape.startAnchor;
            s["endShapeId"] = optionalIdToJson(shape.endShapeId);
            s["endAnchor"] = shape.endAnchor;
            s["routingMode"] = routingModeToString(shape.routingMode);
            if (!shape.waypoints.empty()) {
                s["waypoints"] = pointsToJson(shape.waypoints);
            }
        } else {
            s["width"] = shape.width;
            s["height"] = shape.height;
        }

        shapes.push_back(s);
    }
    j["shapes"] = shapes;
    j["routing"] = routingToJsonObject(scene.routing);

    return j.dump(indent);
}

Scene SceneSerializer::sceneFromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        Scene scene;

        if (j.contains("shapes")) {
            for (const auto& s : j["shapes"]) {
                Shape shape;
                shape.id = s.at("id").get<std::string>();
                shape.type = s.at("type").get<std::string>();
                shape.x = s.value("x", 0.0f);
                shape.y = s.value("y", 0.0f);
                shape.rotation = s.value("rotation", 0.0f);
                shape.strokeWidth = s.value("strokeWidth", 0.0f);
                shape.visible = s.value("visible", true);
                shape.width = s.value("width", 0.0f);
                shape.height = s.value("height", 0.0f);
                shape.radiusX = s.value("radiusX", 0.0f);
                shape.radiusY = s.value("radiusY", 0.0f);
                shape.x2 = s.value("x2", 0.0f);
                shape.y2 = s.value("y2", 0.0f);

                if (shape.isConnector()) {
                    shape.startShapeId = optionalIdFromJson(s, "startShapeId");
                    shape.endShapeId = optionalIdFromJson(s, "endShapeId");
                    shape.startAnchor = s.value("startAnchor", anchors::CENTER);
                    shape.endAnchor = s.value("endAnchor", anchors::CENTER);
                    shape.routingMode = stringToRoutingMode(s.value("routingMode", std::string("orthogonal")));
                    if (s.contains("waypoints")) {
                        shape.waypoints = pointsFromJson(s["waypoints"]);
                    }
                }

                ShapeId id = shape.id;
                scene.shapes[id] = std::move(shape);
            }
        }

        if (j.contains("routing")) {
            scene.routing = routingFromJsonObject(j["routing"]);
        }

        return scene;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse scene JSON: ") + e.what());
    }
}

bool SceneSerializer::saveToFile(const Scene& scene, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open {} for writing", path);
        return false;
    }
    file << toJson(scene);
    return true;
}

bool SceneSerializer::loadFromFile(Scene& scene, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open {}", path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        scene = sceneFromJson(buffer.str());
    } catch (const std::runtime_error& e) {
        LOG_ERROR("{}: {}", path, e.what());
        return false;
    }
    return true;
}

std::string SceneSerializer::toJson(const RoutingConfig& config) {
    return routingToJsonObject(config).dump(2);
}

RoutingConfig SceneSerializer::routingConfigFromJson(const std::string& jsonStr) {
    try {
        return routingFromJsonObject(json::parse(jsonStr));
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse routing config JSON: ") + e.what());
    }
}

std::string SceneSerializer::waypointsToJson(const Waypoints& waypoints) {
    return pointsToJson(waypoints).dump();
}

}  // namespace elbow
