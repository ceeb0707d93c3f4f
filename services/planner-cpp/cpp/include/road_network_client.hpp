/**
 * @file road_network_client.hpp
 * @brief Road-network backends: the interface the distance provider talks
 *        to and the OSRM HTTP client implementing it.
 */

#pragma once

#include "geo_types.hpp"

#include <string>
#include <vector>

namespace fleetplan {

/**
 * @brief Result of a route query through an ordered list of points.
 */
struct RoadRouteResult {
    bool ok = false;
    double distance_m = 0.0;
    double duration_s = 0.0;
    Polyline geometry;
    std::string error;
};

/**
 * @brief Result of a table (matrix) query. Row-major, size() x size().
 */
struct RoadTableResult {
    bool ok = false;
    size_t size = 0;
    std::vector<double> distances_m;
    std::vector<double> durations_s;
    std::string error;
};

/**
 * @brief Anything that can answer road distance queries.
 */
class RoadNetworkBackend {
public:
    virtual ~RoadNetworkBackend() = default;

    virtual RoadRouteResult route(const std::vector<GeoPoint>& points, bool with_geometry) = 0;
    virtual RoadTableResult table(const std::vector<GeoPoint>& points) = 0;

    // Batched matrix queries are available.
    virtual bool supports_table() const = 0;
};

struct OsrmClientOptions {
    std::string base_url = "http://localhost:5000";
    std::string profile = "driving";
    long request_timeout_ms = 5000;
    long table_timeout_ms = 10000;
};

/**
 * @brief OSRM HTTP client (route and table services) over libcurl.
 *
 * One easy handle per request, so a client can be shared across threads.
 */
class OsrmClient : public RoadNetworkBackend {
public:
    explicit OsrmClient(OsrmClientOptions options = {});

    RoadRouteResult route(const std::vector<GeoPoint>& points, bool with_geometry) override;
    RoadTableResult table(const std::vector<GeoPoint>& points) override;
    bool supports_table() const override { return true; }

    const OsrmClientOptions& options() const { return options_; }

private:
    struct HttpResponse {
        bool transport_ok = false;
        long status = 0;
        std::string body;
        std::string error;
    };

    HttpResponse http_get(const std::string& url, long timeout_ms) const;
    std::string coordinate_string(const std::vector<GeoPoint>& points) const;

    OsrmClientOptions options_;
};

}  // namespace fleetplan
