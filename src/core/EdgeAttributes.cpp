#include "accessroute/core/EdgeAttributes.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <initializer_list>

namespace accessroute {
namespace tags {

namespace {

std::string normalize(std::string_view value) {
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

bool isOneOf(const std::string& value, std::initializer_list<std::string_view> options) {
    return std::find(options.begin(), options.end(), value) != options.end();
}

/// Parse a number that may be followed by a unit suffix
std::optional<double> parseNumber(std::string text, std::string_view suffix) {
    if (!suffix.empty() && text.size() >= suffix.size() &&
        text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0) {
        text.erase(text.size() - suffix.size());
    }
    std::replace(text.begin(), text.end(), ',', '.');
    if (text.empty()) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

PathClass parsePathClass(std::string_view value) {
    const std::string v = normalize(value);
    if (v.empty() || v == "unknown") return PathClass::Unknown;
    if (v == "footway" || v == "sidewalk") return PathClass::Footway;
    if (v == "path" || v == "track") return PathClass::Path;
    if (v == "pedestrian" || v == "living_street") return PathClass::Pedestrian;
    if (v == "steps") return PathClass::Steps;
    if (v == "crossing") return PathClass::Crossing;
    if (v == "corridor") return PathClass::Corridor;
    if (v == "service") return PathClass::Service;
    if (v == "residential" || v == "unclassified" || v == "tertiary") return PathClass::Residential;
    return PathClass::Other;
}

SurfaceClass parseSurface(std::string_view value) {
    const std::string v = normalize(value);
    if (isOneOf(v, {"paved", "asphalt", "concrete", "concrete:plates", "paving_stones", "tiles", "metal", "wood"})) {
        return SurfaceClass::Paved;
    }
    if (isOneOf(v, {"rough", "sett", "cobblestone", "unhewn_cobblestone", "compacted", "fine_gravel", "grass_paver"})) {
        return SurfaceClass::Rough;
    }
    if (isOneOf(v, {"unpaved", "gravel", "pebblestone", "dirt", "earth", "ground", "grass", "sand", "mud"})) {
        return SurfaceClass::Unpaved;
    }
    return SurfaceClass::Unknown;
}

WheelchairAccess parseWheelchair(std::string_view value) {
    const std::string v = normalize(value);
    if (v == "yes" || v == "designated") return WheelchairAccess::Yes;
    if (v == "limited") return WheelchairAccess::Limited;
    if (v == "no") return WheelchairAccess::No;
    return WheelchairAccess::Unknown;
}

CrossingKind parseCrossing(std::string_view value) {
    const std::string v = normalize(value);
    if (v.empty() || v == "no" || v == "none") return CrossingKind::None;
    if (isOneOf(v, {"marked", "zebra", "traffic_signals", "uncontrolled_marked"})) {
        return CrossingKind::Marked;
    }
    if (isOneOf(v, {"unmarked", "uncontrolled", "informal"})) {
        return CrossingKind::Unmarked;
    }
    return CrossingKind::Unknown;
}

std::optional<double> parseIncline(std::string_view value) {
    return parseNumber(normalize(value), "%");
}

std::optional<double> parseWidth(std::string_view value) {
    auto width = parseNumber(normalize(value), "m");
    if (!width || *width <= 0.0) {
        return std::nullopt;
    }
    return width;
}

bool parseFlag(std::string_view value) {
    const std::string v = normalize(value);
    return v == "yes" || v == "true" || v == "1";
}

const char* toString(PathClass value) {
    switch (value) {
        case PathClass::Footway: return "footway";
        case PathClass::Path: return "path";
        case PathClass::Pedestrian: return "pedestrian";
        case PathClass::Steps: return "steps";
        case PathClass::Crossing: return "crossing";
        case PathClass::Corridor: return "corridor";
        case PathClass::Service: return "service";
        case PathClass::Residential: return "residential";
        case PathClass::Other: return "other";
        case PathClass::Unknown: return "unknown";
    }
    return "unknown";
}

const char* toString(SurfaceClass value) {
    switch (value) {
        case SurfaceClass::Paved: return "paved";
        case SurfaceClass::Rough: return "rough";
        case SurfaceClass::Unpaved: return "unpaved";
        case SurfaceClass::Unknown: return "unknown";
    }
    return "unknown";
}

const char* toString(WheelchairAccess value) {
    switch (value) {
        case WheelchairAccess::Yes: return "yes";
        case WheelchairAccess::Limited: return "limited";
        case WheelchairAccess::No: return "no";
        case WheelchairAccess::Unknown: return "unknown";
    }
    return "unknown";
}

const char* toString(CrossingKind value) {
    switch (value) {
        case CrossingKind::None: return "none";
        case CrossingKind::Marked: return "marked";
        case CrossingKind::Unmarked: return "unmarked";
        case CrossingKind::Unknown: return "unknown";
    }
    return "unknown";
}

}  // namespace tags
}  // namespace accessroute
