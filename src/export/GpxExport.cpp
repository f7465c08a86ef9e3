#include "accessroute/export/GpxExport.h"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace accessroute {

GpxExport::GpxExport(const GpxExportOptions& options) : options_(options) {}

std::string GpxExport::exportToString(const Route& route) {
    std::ostringstream ss;
    exportToStream(route, ss);
    return ss.str();
}

void GpxExport::exportToStream(const Route& route, std::ostream& out) {
    writeHeader(out);
    writeTrack(out, route);
    writeFooter(out);
}

bool GpxExport::exportToFile(const Route& route, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    exportToStream(route, file);
    return file.good();
}

void GpxExport::writeHeader(std::ostream& out) {
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<gpx version=\"1.1\" creator=\"" << escapeXml(options_.creator) << "\"\n"
        << "  xmlns=\"http://www.topografix.com/GPX/1/1\"\n"
        << "  xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\"\n"
        << "  xsi:schemaLocation=\"http://www.topografix.com/GPX/1/1 "
        << "http://www.topografix.com/GPX/1/1/gpx.xsd\">\n";
}

void GpxExport::writeTrack(std::ostream& out, const Route& route) {
    out << "  <trk>\n";
    out << "    <name>" << escapeXml(options_.trackName) << "</name>\n";

    if (options_.includeSummary && !route.profileKey.empty()) {
        std::ostringstream desc;
        desc << route.profileKey << ": " << std::fixed << std::setprecision(1)
             << route.distanceMeters << " m, " << route.durationMinutes() << " min, "
             << route.stepCount << " steps";
        out << "    <desc>" << escapeXml(desc.str()) << "</desc>\n";
    }

    out << "    <trkseg>\n";

    const auto flags = out.flags();
    const auto precision = out.precision();
    out << std::fixed << std::setprecision(COORDINATE_PRECISION);
    for (const auto& point : route.coordinates) {
        out << "      <trkpt lat=\"" << point.lat << "\" lon=\"" << point.lon << "\"></trkpt>\n";
    }
    out.flags(flags);
    out.precision(precision);

    out << "    </trkseg>\n";
    out << "  </trk>\n";
}

void GpxExport::writeFooter(std::ostream& out) {
    out << "</gpx>\n";
}

std::string GpxExport::escapeXml(const std::string& text) {
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

}  // namespace accessroute
