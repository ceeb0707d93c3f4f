/**
 * @file geo_utils.cpp
 * @brief Great-circle math and H3 helpers implementation.
 */

#include "geo_utils.hpp"
#include <h3/h3api.h>
#include <algorithm>
#include <cmath>

namespace fleetplan {
namespace geo_utils {

double haversine_km(double lat1, double lon1, double lat2, double lon2) {
    double dlat = (lat2 - lat1) * M_PI / 180.0;
    double dlon = (lon2 - lon1) * M_PI / 180.0;
    double a = std::sin(dlat / 2) * std::sin(dlat / 2) +
               std::cos(lat1 * M_PI / 180.0) * std::cos(lat2 * M_PI / 180.0) *
               std::sin(dlon / 2) * std::sin(dlon / 2);
    return kEarthRadiusKm * 2 * std::asin(std::sqrt(std::min(1.0, a)));
}

double estimate_travel_minutes(double distance_km, double avg_speed_kmh, double buffer) {
    if (distance_km <= 0 || avg_speed_kmh <= 0) return 0.0;
    return distance_km / avg_speed_kmh * 60.0 * buffer;
}

GeoPoint centroid(const std::vector<GeoPoint>& points) {
    GeoPoint c;
    if (points.empty()) return c;
    for (const auto& p : points) {
        c.lat += p.lat;
        c.lon += p.lon;
    }
    c.lat /= points.size();
    c.lon /= points.size();
    return c;
}

double diameter_km(const std::vector<GeoPoint>& points) {
    double best = 0.0;
    for (size_t i = 0; i < points.size(); ++i) {
        for (size_t j = i + 1; j < points.size(); ++j) {
            best = std::max(best, haversine_km(points[i], points[j]));
        }
    }
    return best;
}

uint64_t latlng_to_cell(double lat, double lng, int res) {
    if (res < 0 || res > 15) return 0;

    LatLng ll;
    ll.lat = degsToRads(lat);
    ll.lng = degsToRads(lng);

    H3Index cell = 0;
    if (latLngToCell(&ll, res, &cell) != E_SUCCESS) {
        return 0;
    }
    return cell;
}

std::vector<uint64_t> grid_disk(uint64_t center, int k) {
    std::vector<uint64_t> result;
    if (center == 0 || k < 0) return result;

    int64_t disk_size = 0;
    if (maxGridDiskSize(k, &disk_size) != E_SUCCESS) {
        return result;
    }

    std::vector<H3Index> disk(disk_size, 0);
    if (gridDisk(center, k, disk.data()) != E_SUCCESS) {
        return result;
    }

    // gridDisk leaves zero holes near pentagons
    for (auto c : disk) {
        if (c != 0) result.push_back(c);
    }
    return result;
}

double edge_length_km(int res) {
    double km = 0.0;
    if (getHexagonEdgeLengthAvgKm(res, &km) != E_SUCCESS) {
        return 0.0;
    }
    return km;
}

int resolution_for_radius(double radius_km) {
    // Keep the disk at k <= 4 rings.
    for (int res = 10; res > 0; --res) {
        if (edge_length_km(res) * 4.0 >= radius_km) return res;
    }
    return 0;
}

}  // namespace geo_utils
}  // namespace fleetplan
