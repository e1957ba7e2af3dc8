#pragma once

#include <ostream>
#include <string>

namespace elbow {

// Forward declarations
struct Scene;
class ShapeRegistry;

/// Abstract interface for scene exporters
///
/// Export formats implement this interface so callers can switch format
/// without touching routing code.
class IExporter {
public:
    virtual ~IExporter() = default;

    /// Export a routed scene to string
    virtual std::string exportToString(const Scene& scene, const ShapeRegistry& registry) = 0;

    /// Export to an output stream
    virtual void exportToStream(const Scene& scene, const ShapeRegistry& registry, std::ostream& out) = 0;

    /// Export to a file
    /// @return false if the file cannot be opened
    virtual bool exportToFile(const Scene& scene, const ShapeRegistry& registry, const std::string& filename) = 0;

    /// File extension for this format (e.g. "svg")
    virtual std::string fileExtension() const = 0;

    /// MIME type for this format (e.g. "image/svg+xml")
    virtual std::string mimeType() const = 0;
};

}  // namespace elbow
