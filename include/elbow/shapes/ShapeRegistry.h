#pragma once

#include "elbow/shapes/IShapeHandler.h"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace elbow {

/// Maps shape type names to their handlers.
///
/// Usage:
/// @code
/// auto registry = ShapeRegistry::withBuiltins();
/// registry.registerHandler("diamond", std::make_shared<DiamondHandler>());
///
/// if (const IShapeHandler* handler = registry.find(shape.type)) {
///     Box bounds = handler->getBounds(shape);
/// }
/// @endcode
class ShapeRegistry {
public:
    ShapeRegistry() = default;

    /// Registry with rectangle, text, ellipse, line and connector handlers
    static ShapeRegistry withBuiltins();

    /// Register a handler for a shape type
    /// @throws std::invalid_argument if the type is already registered or handler is null
    void registerHandler(const std::string& type, std::shared_ptr<IShapeHandler> handler);

    /// Handler for a type, or nullptr if none is registered
    const IShapeHandler* find(const std::string& type) const;

    bool hasHandler(const std::string& type) const { return find(type) != nullptr; }

    /// Registered type names, sorted
    std::vector<std::string> registeredTypes() const;

    /// Bounds of a shape, or nullopt if its type has no handler
    std::optional<Box> boundsOf(const Shape& shape) const;

    /// Named anchor of a shape, or nullopt if the shape has no such anchor
    std::optional<Anchor> findAnchor(const Shape& shape, const AnchorPosition& position) const;

private:
    std::unordered_map<std::string, std::shared_ptr<IShapeHandler>> handlers_;
};

}  // namespace elbow
