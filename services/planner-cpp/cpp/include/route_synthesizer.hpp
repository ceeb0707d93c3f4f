/**
 * @file route_synthesizer.hpp
 * @brief Turn a sequenced waypoint list into a driver itinerary with
 *        cumulative metrics, ETAs and per-segment geometry.
 *
 * Itineraries are derived data: they are recomputed from a route's
 * waypoints on demand and never persisted.
 */

#pragma once

#include "distance_provider.hpp"
#include "geo_types.hpp"

#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

namespace fleetplan {

struct ItineraryStop {
    Waypoint waypoint;
    double cumulative_distance_km = 0.0;
    double cumulative_duration_min = 0.0;
    int64_t eta = 0;  // epoch seconds
};

/**
 * @brief Leg from stops[i] to stops[i + 1].
 */
struct ItinerarySegment {
    size_t from_index = 0;
    size_t to_index = 0;
    double distance_km = 0.0;
    double duration_min = 0.0;
    Polyline polyline;
    Provenance provenance = Provenance::FallbackGeometric;
};

struct Itinerary {
    std::vector<ItineraryStop> stops;
    std::vector<ItinerarySegment> segments;
    double total_distance_km = 0.0;
    double total_duration_min = 0.0;
    // Every segment came from the road network.
    bool used_road_network = false;
    int64_t start_time = 0;
};

/**
 * @brief Build the itinerary for a depot-anchored waypoint list.
 *
 * A missing leading depot waypoint is prepended. A second depot anywhere in
 * the list throws std::invalid_argument.
 */
Itinerary synthesize(const Depot& depot,
                     const std::vector<Waypoint>& waypoints,
                     DistanceProvider& provider,
                     int64_t start_time);

/**
 * @brief FeatureCollection: one LineString per segment, one Point per stop.
 */
nlohmann::json to_geojson(const Itinerary& itinerary);

}  // namespace fleetplan
