#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace accessroute {

/// Path class of a walkable segment (OSM "highway" tag)
enum class PathClass {
    Footway,
    Path,
    Pedestrian,
    Steps,
    Crossing,
    Corridor,
    Service,
    Residential,
    Other,
    Unknown
};

/// Surface grouped by how it affects wheeled and unsteady walkers
enum class SurfaceClass {
    Paved,    ///< asphalt, concrete, paving stones
    Rough,    ///< sett, cobblestone, compacted, fine gravel
    Unpaved,  ///< gravel, dirt, grass, sand, ground
    Unknown
};

/// Wheelchair accessibility tag
enum class WheelchairAccess {
    Yes,
    Limited,
    No,
    Unknown
};

/// Pedestrian crossing kind for edges that cross a road
enum class CrossingKind {
    None,      ///< Edge is not a crossing
    Marked,    ///< Zebra, signals, or otherwise marked
    Unmarked,  ///< Uncontrolled crossing
    Unknown    ///< Crossing of unknown kind
};

/// Number of known (non-Unknown) values per category, for table sizing
constexpr std::size_t SURFACE_CLASS_COUNT = 3;
constexpr std::size_t CROSSING_KIND_COUNT = 3;

/// Physical and accessibility attributes of an edge.
/// Incline is signed in the edge's stored from->to direction.
struct EdgeAttributes {
    PathClass pathClass = PathClass::Unknown;
    SurfaceClass surface = SurfaceClass::Unknown;
    WheelchairAccess wheelchair = WheelchairAccess::Unknown;
    bool hasSteps = false;
    bool hasRamp = false;
    std::optional<double> inclinePercent;
    std::optional<double> widthMeters;
    CrossingKind crossing = CrossingKind::None;
};

/// Parsers from raw OSM-style tag values.
/// Malformed or unrecognized values map to Unknown / nullopt, never throw.
namespace tags {

PathClass parsePathClass(std::string_view value);
SurfaceClass parseSurface(std::string_view value);
WheelchairAccess parseWheelchair(std::string_view value);
CrossingKind parseCrossing(std::string_view value);

/// Accepts "5", "5%", "-3.5 %"; "up"/"down" carry no magnitude and yield nullopt
std::optional<double> parseIncline(std::string_view value);

/// Accepts "1.5", "1.5 m", "1,5m"; non-positive widths yield nullopt
std::optional<double> parseWidth(std::string_view value);

/// "yes", "true", "1" -> true; everything else false
bool parseFlag(std::string_view value);

const char* toString(PathClass value);
const char* toString(SurfaceClass value);
const char* toString(WheelchairAccess value);
const char* toString(CrossingKind value);

}  // namespace tags
}  // namespace accessroute
