#pragma once

#include <cstdint>
#include <vector>

namespace accessroute {

using NodeId = uint32_t;
using EdgeId = uint32_t;

constexpr NodeId INVALID_NODE = UINT32_MAX;
constexpr EdgeId INVALID_EDGE = UINT32_MAX;

/// WGS-84 coordinate in degrees
struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;

    constexpr GeoPoint() = default;
    constexpr GeoPoint(double lat_, double lon_) : lat(lat_), lon(lon_) {}

    constexpr bool isValid() const {
        return lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
    }

    constexpr bool operator==(const GeoPoint& o) const { return lat == o.lat && lon == o.lon; }
    constexpr bool operator!=(const GeoPoint& o) const { return !(*this == o); }
};

using Polyline = std::vector<GeoPoint>;

/// Axis-aligned bounding box in degrees
struct GeoBounds {
    double minLat = 0.0;
    double minLon = 0.0;
    double maxLat = 0.0;
    double maxLon = 0.0;
    bool empty = true;

    void extend(const GeoPoint& p) {
        if (empty) {
            minLat = maxLat = p.lat;
            minLon = maxLon = p.lon;
            empty = false;
            return;
        }
        if (p.lat < minLat) minLat = p.lat;
        if (p.lat > maxLat) maxLat = p.lat;
        if (p.lon < minLon) minLon = p.lon;
        if (p.lon > maxLon) maxLon = p.lon;
    }

    constexpr bool contains(const GeoPoint& p) const {
        return !empty && p.lat >= minLat && p.lat <= maxLat &&
               p.lon >= minLon && p.lon <= maxLon;
    }
};

}  // namespace accessroute
