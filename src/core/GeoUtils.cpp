#include "accessroute/core/GeoUtils.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace accessroute {
namespace geo {

namespace {
constexpr double toRadians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}
}

double distanceMeters(const GeoPoint& a, const GeoPoint& b) {
    const double lat1 = toRadians(a.lat);
    const double lat2 = toRadians(b.lat);
    const double dLat = lat2 - lat1;
    const double dLon = toRadians(b.lon - a.lon);

    const double sinLat = std::sin(dLat / 2.0);
    const double sinLon = std::sin(dLon / 2.0);
    double h = sinLat * sinLat + std::cos(lat1) * std::cos(lat2) * sinLon * sinLon;
    h = std::clamp(h, 0.0, 1.0);

    return 2.0 * EARTH_RADIUS_M * std::asin(std::sqrt(h));
}

double equirectangularMeters(const GeoPoint& a, const GeoPoint& b) {
    const double metersPerDegreeLon = METERS_PER_DEGREE_LAT * std::cos(toRadians(a.lat));
    const double dy = (b.lat - a.lat) * METERS_PER_DEGREE_LAT;
    const double dx = (b.lon - a.lon) * metersPerDegreeLon;
    return std::sqrt(dx * dx + dy * dy);
}

double polylineLength(const Polyline& line) {
    double total = 0.0;
    for (size_t i = 1; i < line.size(); ++i) {
        total += distanceMeters(line[i - 1], line[i]);
    }
    return total;
}

}  // namespace geo
}  // namespace accessroute
