#pragma once

#include "IRouteExporter.h"
#include "../routing/Route.h"

#include <ostream>
#include <string>

namespace accessroute {

/// Options for GPX export
struct GpxExportOptions {
    std::string creator = "AccessRoute";
    std::string trackName = "Campus route";

    /// Write a <desc> with profile, distance, time and steps
    bool includeSummary = true;
};

/// Exports a route as a GPX 1.1 track with a single segment
class GpxExport : public IRouteExporter {
public:
    /// Decimal places written for every coordinate
    static constexpr int COORDINATE_PRECISION = 7;

    GpxExport() = default;
    explicit GpxExport(const GpxExportOptions& options);
    ~GpxExport() override = default;

    std::string exportToString(const Route& route) override;
    void exportToStream(const Route& route, std::ostream& out) override;
    bool exportToFile(const Route& route, const std::string& filename) override;

    std::string fileExtension() const override { return "gpx"; }
    std::string mimeType() const override { return "application/gpx+xml"; }

    void setOptions(const GpxExportOptions& options) { options_ = options; }
    const GpxExportOptions& options() const { return options_; }

private:
    GpxExportOptions options_;

    void writeHeader(std::ostream& out);
    void writeTrack(std::ostream& out, const Route& route);
    void writeFooter(std::ostream& out);

    static std::string escapeXml(const std::string& text);
};

}  // namespace accessroute
