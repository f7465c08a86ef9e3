#pragma once

#include <ostream>
#include <string>

namespace accessroute {

struct Route;

/// Abstract interface for route exporters
///
/// All route file formats (GPX, GeoJSON, ...) implement this interface
/// so tools can switch formats without special cases.
class IRouteExporter {
public:
    virtual ~IRouteExporter() = default;

    /// Export a route to string
    virtual std::string exportToString(const Route& route) = 0;

    /// Export to an output stream
    virtual void exportToStream(const Route& route, std::ostream& out) = 0;

    /// Export to a file
    /// @return false if the file could not be written
    virtual bool exportToFile(const Route& route, const std::string& filename) = 0;

    /// Get the file extension for this export format (e.g., "gpx")
    virtual std::string fileExtension() const = 0;

    /// Get the MIME type for this export format
    virtual std::string mimeType() const = 0;
};

}  // namespace accessroute
