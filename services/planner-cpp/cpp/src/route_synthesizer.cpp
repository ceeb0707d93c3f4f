/**
 * @file route_synthesizer.cpp
 * @brief Itinerary and GeoJSON construction.
 */

#include "route_synthesizer.hpp"

#include <cmath>
#include <stdexcept>

namespace fleetplan {

using json = nlohmann::json;

Itinerary synthesize(const Depot& depot,
                     const std::vector<Waypoint>& waypoints,
                     DistanceProvider& provider,
                     int64_t start_time) {
    std::vector<Waypoint> list;
    list.reserve(waypoints.size() + 1);
    if (waypoints.empty() || waypoints.front().kind != WaypointKind::Depot) {
        Waypoint w;
        w.kind = WaypointKind::Depot;
        w.point = depot.point;
        w.ref_id = depot.id;
        list.push_back(w);
    }
    list.insert(list.end(), waypoints.begin(), waypoints.end());

    for (size_t i = 1; i < list.size(); ++i) {
        if (list[i].kind == WaypointKind::Depot) {
            throw std::invalid_argument("waypoint list contains more than one depot (sequence " +
                                        std::to_string(i) + ")");
        }
    }
    renumber(list);

    Itinerary it;
    it.start_time = start_time;
    it.used_road_network = list.size() > 1;

    ItineraryStop first;
    first.waypoint = list.front();
    first.eta = start_time;
    it.stops.push_back(first);

    for (size_t i = 0; i + 1 < list.size(); ++i) {
        const GeoPoint& a = list[i].point;
        const GeoPoint& b = list[i + 1].point;
        GeometryResult geom = provider.route_geometry({a, b});

        ItinerarySegment seg;
        seg.from_index = i;
        seg.to_index = i + 1;
        seg.distance_km = geom.distance_km;
        seg.duration_min = geom.duration_min;
        seg.provenance = geom.provenance;
        seg.polyline = geom.has_geometry() ? std::move(geom.polyline) : Polyline{a, b};
        if (seg.provenance != Provenance::RoadNetwork) it.used_road_network = false;

        it.total_distance_km += seg.distance_km;
        it.total_duration_min += seg.duration_min;

        ItineraryStop stop;
        stop.waypoint = list[i + 1];
        stop.cumulative_distance_km = it.total_distance_km;
        stop.cumulative_duration_min = it.total_duration_min;
        stop.eta = start_time + static_cast<int64_t>(std::llround(it.total_duration_min * 60.0));
        it.stops.push_back(stop);
        it.segments.push_back(std::move(seg));
    }
    return it;
}

json to_geojson(const Itinerary& itinerary) {
    json features = json::array();

    for (const auto& seg : itinerary.segments) {
        json coords = json::array();
        for (const auto& p : seg.polyline) {
            // GeoJSON format: [lon, lat]
            coords.push_back({p.lon, p.lat});
        }
        features.push_back({
            {"type", "Feature"},
            {"geometry", {
                {"type", "LineString"},
                {"coordinates", coords}
            }},
            {"properties", {
                {"segment", seg.from_index},
                {"distance_km", seg.distance_km},
                {"duration_min", seg.duration_min},
                {"provenance", to_string(seg.provenance)}
            }}
        });
    }

    for (const auto& stop : itinerary.stops) {
        features.push_back({
            {"type", "Feature"},
            {"geometry", {
                {"type", "Point"},
                {"coordinates", {stop.waypoint.point.lon, stop.waypoint.point.lat}}
            }},
            {"properties", {
                {"sequence", stop.waypoint.sequence},
                {"kind", to_string(stop.waypoint.kind)},
                {"ref_id", stop.waypoint.ref_id},
                {"cumulative_distance_km", stop.cumulative_distance_km},
                {"cumulative_duration_min", stop.cumulative_duration_min},
                {"eta", stop.eta}
            }}
        });
    }

    return {
        {"type", "FeatureCollection"},
        {"features", features}
    };
}

}  // namespace fleetplan
