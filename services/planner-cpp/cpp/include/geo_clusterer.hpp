/**
 * @file geo_clusterer.hpp
 * @brief Partition geotagged orders into route-sized groups.
 */

#pragma once

#include "distance_provider.hpp"
#include "geo_types.hpp"
#include "spatial_index.hpp"

#include <cstdint>
#include <vector>

namespace fleetplan {

/**
 * @brief A transient group of orders that seeds one route.
 */
struct Cluster {
    std::vector<int64_t> order_ids;  // ascending
    GeoPoint centroid;
    // Could not reach the minimum size by merging.
    bool small_route = false;
    // A merge pushed the pairwise distance above the radius bound.
    bool radius_relaxed = false;

    size_t size() const { return order_ids.size(); }
};

struct ClusteringOptions {
    double max_radius_km = 10.0;
    int min_size = 3;
    int max_size = 40;
    SpatialIndexType index_type = SpatialIndexType::RTREE;
    // Link orders by road distance when a provider can supply a road matrix.
    bool road_distance = true;
};

struct ClusteringResult {
    std::vector<Cluster> clusters;
    // Orders without a geocoded point, ascending.
    std::vector<int64_t> unscheduled_order_ids;
};

/**
 * @brief Density grouping (DBSCAN, eps = max_radius_km, minPts = 1), then
 *        widest-axis bisection of oversized groups, then nearest-centroid
 *        merging of undersized ones.
 *
 * The density step links two orders when the shorter of their two road
 * distances is within eps, if provider is given, road_distance is set and
 * the matrix came from the road network. Otherwise it uses great-circle
 * distance through the spatial index.
 *
 * Every routable order ends up in exactly one cluster. Output is stable for
 * identical input: ties are broken by order id.
 */
ClusteringResult cluster_orders(const std::vector<Order>& orders,
                                const ClusteringOptions& options,
                                DistanceProvider* provider = nullptr);

}  // namespace fleetplan
