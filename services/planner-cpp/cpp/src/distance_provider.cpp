/**
 * @file distance_provider.cpp
 * @brief Distance provider implementation.
 */

#include "distance_provider.hpp"
#include "geo_utils.hpp"

#include <iostream>

namespace fleetplan {

const char* to_string(Provenance p) {
    return p == Provenance::RoadNetwork ? "road_network" : "fallback_geometric";
}

DistanceProvider::DistanceProvider(std::shared_ptr<RoadNetworkBackend> backend,
                                   DistanceProviderOptions options)
    : backend_(std::move(backend)), options_(options) {}

// ============================================================
// BACKEND STATE
// ============================================================

bool DistanceProvider::backend_usable() {
    if (!backend_) return false;
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (degraded_ && options_.service_retry_after_s > 0 &&
        std::chrono::steady_clock::now() < retry_at_) {
        return false;
    }
    return true;
}

void DistanceProvider::mark_failure(const std::string& error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!degraded_) {
        std::cerr << "Distance: road network unavailable (" << error
                  << "), falling back to haversine" << std::endl;
    }
    degraded_ = true;
    retry_at_ = std::chrono::steady_clock::now() + std::chrono::seconds(options_.service_retry_after_s);
}

void DistanceProvider::mark_success() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (degraded_) {
        std::cout << "Distance: road network available again" << std::endl;
    }
    degraded_ = false;
}

// ============================================================
// FALLBACK
// ============================================================

DistanceResult DistanceProvider::geometric_distance(const GeoPoint& a, const GeoPoint& b) const {
    DistanceResult r;
    r.distance_km = geo_utils::haversine_km(a, b);
    r.duration_min = geo_utils::estimate_travel_minutes(r.distance_km, options_.average_speed_kmh,
                                                        options_.city_buffer);
    r.provenance = Provenance::FallbackGeometric;
    return r;
}

DistanceMatrixResult DistanceProvider::geometric_matrix(const std::vector<GeoPoint>& points) const {
    DistanceMatrixResult m;
    const size_t n = points.size();
    m.size = n;
    m.distance_km.assign(n * n, 0.0);
    m.duration_min.assign(n * n, 0.0);
    m.used_road_network = false;

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (i == j) continue;
            DistanceResult r = geometric_distance(points[i], points[j]);
            m.distance_km[i * n + j] = r.distance_km;
            m.duration_min[i * n + j] = r.duration_min;
        }
    }
    return m;
}

// ============================================================
// QUERIES
// ============================================================

DistanceResult DistanceProvider::pairwise_distance(const GeoPoint& a, const GeoPoint& b) {
    if (backend_usable()) {
        RoadRouteResult r = backend_->route({a, b}, false);
        if (r.ok) {
            mark_success();
            DistanceResult out;
            out.distance_km = r.distance_m / 1000.0;
            out.duration_min = r.duration_s / 60.0;
            out.provenance = Provenance::RoadNetwork;
            return out;
        }
        mark_failure(r.error);
    }
    return geometric_distance(a, b);
}

DistanceMatrixResult DistanceProvider::matrix(const std::vector<GeoPoint>& points) {
    const size_t n = points.size();
    if (n < 2 || !backend_usable()) {
        return geometric_matrix(points);
    }

    if (backend_->supports_table()) {
        RoadTableResult t = backend_->table(points);
        if (t.ok && t.size == n) {
            mark_success();
            DistanceMatrixResult m;
            m.size = n;
            m.distance_km.resize(n * n);
            m.duration_min.resize(n * n);
            for (size_t k = 0; k < n * n; ++k) {
                m.distance_km[k] = t.distances_m[k] / 1000.0;
                m.duration_min[k] = t.durations_s[k] / 60.0;
            }
            m.used_road_network = true;
            return m;
        }
        mark_failure(t.ok ? "table size mismatch" : t.error);
        return geometric_matrix(points);
    }

    // No batch support: assemble from pairwise queries.
    DistanceMatrixResult m;
    m.size = n;
    m.distance_km.assign(n * n, 0.0);
    m.duration_min.assign(n * n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (i == j) continue;
            RoadRouteResult r = backend_->route({points[i], points[j]}, false);
            if (!r.ok) {
                // Any missing cell sends the whole matrix to the fallback.
                mark_failure(r.error);
                return geometric_matrix(points);
            }
            m.distance_km[i * n + j] = r.distance_m / 1000.0;
            m.duration_min[i * n + j] = r.duration_s / 60.0;
        }
    }
    mark_success();
    m.used_road_network = true;
    return m;
}

GeometryResult DistanceProvider::route_geometry(const std::vector<GeoPoint>& ordered_points) {
    GeometryResult out;
    if (ordered_points.size() < 2) return out;

    if (backend_usable()) {
        RoadRouteResult r = backend_->route(ordered_points, true);
        if (r.ok) {
            mark_success();
            out.polyline = std::move(r.geometry);
            out.distance_km = r.distance_m / 1000.0;
            out.duration_min = r.duration_s / 60.0;
            out.provenance = Provenance::RoadNetwork;
            return out;
        }
        mark_failure(r.error);
    }

    for (size_t i = 0; i + 1 < ordered_points.size(); ++i) {
        DistanceResult leg = geometric_distance(ordered_points[i], ordered_points[i + 1]);
        out.distance_km += leg.distance_km;
        out.duration_min += leg.duration_min;
    }
    out.provenance = Provenance::FallbackGeometric;
    return out;
}

}  // namespace fleetplan
