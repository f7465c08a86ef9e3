#include "accessroute/io/PoiCatalog.h"
#include "accessroute/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>

namespace accessroute {

namespace {

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";
constexpr std::string_view SECTION_MARK = "---";

std::string trim(const std::string& text) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
    auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::optional<double> parseCoordinate(const std::string& text) {
    const std::string value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    double result = std::strtod(value.c_str(), &end);
    if (errno != 0 || end != value.c_str() + value.size() || !std::isfinite(result)) {
        return std::nullopt;
    }
    return result;
}

bool isSection(const std::string& line) {
    return line.size() >= 2 * SECTION_MARK.size() &&
           line.compare(0, SECTION_MARK.size(), SECTION_MARK) == 0 &&
           line.compare(line.size() - SECTION_MARK.size(), SECTION_MARK.size(), SECTION_MARK) == 0;
}

}  // namespace

PoiCatalog PoiCatalog::loadFromFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw PoiLoadError("Cannot open POI catalog: " + path);
    }
    PoiCatalog catalog = parse(file);
    LOG_INFO("Loaded {} POIs in {} categories from {} ({} lines skipped)",
             catalog.size(), catalog.categories().size(), path, catalog.skipped().size());
    return catalog;
}

PoiCatalog PoiCatalog::parseString(const std::string& text) {
    std::istringstream in(text);
    return parse(in);
}

PoiCatalog PoiCatalog::parse(std::istream& in) {
    PoiCatalog catalog;
    std::string category = UNCATEGORIZED;
    std::string raw;
    size_t lineNumber = 0;

    while (std::getline(in, raw)) {
        ++lineNumber;
        if (lineNumber == 1 && raw.compare(0, UTF8_BOM.size(), UTF8_BOM) == 0) {
            raw.erase(0, UTF8_BOM.size());
        }

        const std::string line = trim(raw);
        if (line.empty()) {
            continue;
        }

        if (isSection(line)) {
            std::string name = trim(line.substr(SECTION_MARK.size(),
                                                line.size() - 2 * SECTION_MARK.size()));
            if (name.empty()) {
                catalog.skip(lineNumber, line, "empty category name");
                continue;
            }
            category = name;
            continue;
        }

        catalog.parseEntry(lineNumber, line, category);
    }

    return catalog;
}

void PoiCatalog::parseEntry(size_t lineNumber, const std::string& line, const std::string& category) {
    const auto colon = line.rfind(':');
    if (colon == std::string::npos) {
        skip(lineNumber, line, "missing ':' separator");
        return;
    }

    std::string name = trim(line.substr(0, colon));
    if (name.empty()) {
        skip(lineNumber, line, "empty name");
        return;
    }

    const std::string coordinates = line.substr(colon + 1);
    const auto comma = coordinates.find(',');
    if (comma == std::string::npos || coordinates.find(',', comma + 1) != std::string::npos) {
        skip(lineNumber, line, "expected 'latitude, longitude'");
        return;
    }

    auto lat = parseCoordinate(coordinates.substr(0, comma));
    auto lon = parseCoordinate(coordinates.substr(comma + 1));
    if (!lat || !lon) {
        skip(lineNumber, line, "invalid number");
        return;
    }

    GeoPoint position(*lat, *lon);
    if (!position.isValid()) {
        skip(lineNumber, line, "coordinates out of range");
        return;
    }

    auto existing = byName_.find(name);
    if (existing != byName_.end()) {
        skip(lineNumber, line, "duplicate name (first defined on line " +
                                   std::to_string(entries_[existing->second].lineNumber) + ")");
        return;
    }

    addCategory(category);
    byName_.emplace(name, entries_.size());
    entries_.push_back(PointOfInterest{std::move(name), category, position, lineNumber});
}

void PoiCatalog::addCategory(const std::string& category) {
    if (std::find(categories_.begin(), categories_.end(), category) == categories_.end()) {
        categories_.push_back(category);
    }
}

void PoiCatalog::skip(size_t lineNumber, const std::string& text, std::string reason) {
    LOG_WARN("POI catalog line {} skipped: {}", lineNumber, reason);
    skipped_.push_back(SkippedLine{lineNumber, text, std::move(reason)});
}

std::vector<const PointOfInterest*> PoiCatalog::inCategory(const std::string& category) const {
    std::vector<const PointOfInterest*> result;
    for (const auto& entry : entries_) {
        if (entry.category == category) {
            result.push_back(&entry);
        }
    }
    return result;
}

const PointOfInterest* PoiCatalog::find(const std::string& name) const {
    auto it = byName_.find(name);
    if (it == byName_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

}  // namespace accessroute
