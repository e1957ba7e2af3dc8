#include "elbow/shapes/ShapeRegistry.h"
#include "BuiltinShapeHandlers.h"

#include <algorithm>
#include <stdexcept>

namespace elbow {

ShapeRegistry ShapeRegistry::withBuiltins() {
    ShapeRegistry registry;
    auto rectangle = std::make_shared<RectangleHandler>();
    registry.registerHandler(shape_types::RECTANGLE, rectangle);
    registry.registerHandler(shape_types::TEXT, rectangle);
    registry.registerHandler(shape_types::ELLIPSE, std::make_shared<EllipseHandler>());
    registry.registerHandler(shape_types::LINE, std::make_shared<LineHandler>());
    registry.registerHandler(shape_types::CONNECTOR, std::make_shared<ConnectorHandler>());
    return registry;
}

void ShapeRegistry::registerHandler(const std::string& type, std::shared_ptr<IShapeHandler> handler) {
    if (!handler) {
        throw std::invalid_argument("Null handler for shape type: " + type);
    }
    if (handlers_.count(type) > 0) {
        throw std::invalid_argument("Handler already registered for shape type: " + type);
    }
    handlers_.emplace(type, std::move(handler));
}

const IShapeHandler* ShapeRegistry::find(const std::string& type) const {
    auto it = handlers_.find(type);
    return it != handlers_.end() ? it->second.get() : nullptr;
}

std::vector<std::string> ShapeRegistry::registeredTypes() const {
    std::vector<std::string> types;
    types.reserve(handlers_.size());
    for (const auto& [type, handler] : handlers_) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

std::optional<Box> ShapeRegistry::boundsOf(const Shape& shape) const {
    const IShapeHandler* handler = find(shape.type);
    if (!handler) {
        return std::nullopt;
    }
    return handler->getBounds(shape);
}

std::optional<Anchor> ShapeRegistry::findAnchor(const Shape& shape, const AnchorPosition& position) const {
    const IShapeHandler* handler = find(shape.type);
    if (!handler || !handler->hasAnchors()) {
        return std::nullopt;
    }
    for (const auto& anchor : handler->getAnchors(shape)) {
        if (anchor.position == position) {
            return anchor;
        }
    }
    return std::nullopt;
}

}  // namespace elbow
