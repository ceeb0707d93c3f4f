/**
 * @file distance_provider.hpp
 * @brief Travel distance/duration/geometry with road-network preference and
 *        a deterministic great-circle fallback.
 *
 * Nothing here throws for service trouble: every result carries a
 * provenance flag telling the caller which source produced it.
 */

#pragma once

#include "geo_types.hpp"
#include "road_network_client.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fleetplan {

enum class Provenance {
    RoadNetwork,
    FallbackGeometric
};

const char* to_string(Provenance p);

struct DistanceResult {
    double distance_km = 0.0;
    double duration_min = 0.0;
    Provenance provenance = Provenance::FallbackGeometric;
};

/**
 * @brief N x N matrix of (distance_km, duration_min), row-major.
 */
struct DistanceMatrixResult {
    size_t size = 0;
    std::vector<double> distance_km;
    std::vector<double> duration_min;
    bool used_road_network = false;

    double distance(size_t from, size_t to) const { return distance_km[from * size + to]; }
    double duration(size_t from, size_t to) const { return duration_min[from * size + to]; }
};

/**
 * @brief Geometry through an ordered list of points. polyline is empty when
 *        the road network could not provide one.
 */
struct GeometryResult {
    Polyline polyline;
    double distance_km = 0.0;
    double duration_min = 0.0;
    Provenance provenance = Provenance::FallbackGeometric;

    bool has_geometry() const { return !polyline.empty(); }
};

struct DistanceProviderOptions {
    double average_speed_kmh = 50.0;
    double city_buffer = 1.3;
    // Seconds to bypass the backend after a failure; 0 retries every call.
    int service_retry_after_s = 30;
};

class DistanceProvider {
public:
    /**
     * @param backend road network backend; nullptr means geometric only
     */
    explicit DistanceProvider(std::shared_ptr<RoadNetworkBackend> backend = nullptr,
                              DistanceProviderOptions options = {});

    DistanceResult pairwise_distance(const GeoPoint& a, const GeoPoint& b);
    DistanceMatrixResult matrix(const std::vector<GeoPoint>& points);
    GeometryResult route_geometry(const std::vector<GeoPoint>& ordered_points);

    // ========== FALLBACK ==========

    DistanceResult geometric_distance(const GeoPoint& a, const GeoPoint& b) const;
    DistanceMatrixResult geometric_matrix(const std::vector<GeoPoint>& points) const;

    bool has_backend() const { return backend_ != nullptr; }
    const DistanceProviderOptions& options() const { return options_; }

private:
    bool backend_usable();
    void mark_failure(const std::string& error);
    void mark_success();

    std::shared_ptr<RoadNetworkBackend> backend_;
    DistanceProviderOptions options_;

    mutable std::mutex state_mutex_;
    bool degraded_ = false;
    std::chrono::steady_clock::time_point retry_at_{};
};

}  // namespace fleetplan
