#pragma once

#include "Types.h"

#include <numbers>

namespace accessroute {

/// Distance helpers for WGS-84 coordinates
namespace geo {

/// Mean Earth radius used by all distance functions (meters)
constexpr double EARTH_RADIUS_M = 6371008.8;

/// Meters per degree of latitude on the mean sphere
constexpr double METERS_PER_DEGREE_LAT = EARTH_RADIUS_M * std::numbers::pi / 180.0;

/// Great-circle (haversine) distance in meters
/// This is the metric for edge geometry lengths and the search heuristic,
/// so the triangle inequality holds between them.
double distanceMeters(const GeoPoint& a, const GeoPoint& b);

/// Planar approximation using the local latitude scale for longitude
/// (meters per degree lon = meters per degree lat * cos(lat)).
/// Accurate at campus scale; used for distance categories.
double equirectangularMeters(const GeoPoint& a, const GeoPoint& b);

/// Sum of great-circle lengths of successive polyline segments
double polylineLength(const Polyline& line);

}  // namespace geo
}  // namespace accessroute
