/**
 * @file geo_utils.hpp
 * @brief Great-circle math and H3 helpers used by clustering and the
 *        geometric distance fallback.
 */

#pragma once

#include "geo_types.hpp"

#include <cstdint>
#include <vector>

namespace fleetplan {
namespace geo_utils {

constexpr double kEarthRadiusKm = 6371.0;

/**
 * @brief Great-circle distance in kilometers.
 */
double haversine_km(double lat1, double lon1, double lat2, double lon2);

inline double haversine_km(const GeoPoint& a, const GeoPoint& b) {
    return haversine_km(a.lat, a.lon, b.lat, b.lon);
}

/**
 * @brief Travel time in minutes for a distance at an average speed,
 *        inflated by a city-driving buffer.
 */
double estimate_travel_minutes(double distance_km, double avg_speed_kmh, double buffer);

/**
 * @brief Arithmetic mean of the points. Empty input yields (0, 0).
 */
GeoPoint centroid(const std::vector<GeoPoint>& points);

/**
 * @brief Largest pairwise haversine distance.
 */
double diameter_km(const std::vector<GeoPoint>& points);

// ========== H3 ==========

/**
 * @brief Convert lat/lng (degrees) to an H3 cell at the given resolution.
 * @return 0 on invalid input
 */
uint64_t latlng_to_cell(double lat, double lng, int res);

/**
 * @brief All cells within grid distance k of center, center included.
 */
std::vector<uint64_t> grid_disk(uint64_t center, int k);

/**
 * @brief Average hexagon edge length at a resolution, in km.
 */
double edge_length_km(int res);

/**
 * @brief Pick the finest resolution whose cells are still coarse enough to
 *        answer a radius query with a small grid disk.
 */
int resolution_for_radius(double radius_km);

}  // namespace geo_utils
}  // namespace fleetplan
