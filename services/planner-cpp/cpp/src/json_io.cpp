/**
 * @file json_io.cpp
 * @brief JSON encoding/decoding of domain types.
 */

#include "json_io.hpp"

#include <stdexcept>

namespace fleetplan {

using json = nlohmann::json;

namespace {

// "point": {lat, lon} or flat "lat"/"lon"; null or absent means no point.
std::optional<GeoPoint> read_point(const json& j) {
    if (j.contains("point") && !j.at("point").is_null()) {
        return j.at("point").get<GeoPoint>();
    }
    if (j.contains("lat") && j.contains("lon") && !j.at("lat").is_null() && !j.at("lon").is_null()) {
        return GeoPoint{j.at("lat").get<double>(), j.at("lon").get<double>()};
    }
    return std::nullopt;
}

std::optional<int64_t> read_optional_int(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<int64_t>();
}

json optional_to_json(const std::optional<int64_t>& v) {
    return v ? json(*v) : json(nullptr);
}

}  // namespace

void to_json(json& j, const GeoPoint& p) {
    j = {{"lat", p.lat}, {"lon", p.lon}};
}

void from_json(const json& j, GeoPoint& p) {
    p.lat = j.at("lat").get<double>();
    p.lon = j.at("lon").get<double>();
}

void to_json(json& j, const TimeWindow& w) {
    j = {{"start", optional_to_json(w.start)}, {"end", optional_to_json(w.end)}};
}

void from_json(const json& j, TimeWindow& w) {
    w.start = read_optional_int(j, "start");
    w.end = read_optional_int(j, "end");
}

void to_json(json& j, const Order& o) {
    j = {
        {"id", o.id},
        {"point", o.point ? json(*o.point) : json(nullptr)},
        {"time_window", o.time_window ? json(*o.time_window) : json(nullptr)},
        {"priority", to_string(o.priority)},
        {"status", to_string(o.status)},
        {"route_id", optional_to_json(o.route_id)},
        {"route_sequence", o.route_sequence ? json(*o.route_sequence) : json(nullptr)},
        {"parking_required", o.parking_required}
    };
}

void from_json(const json& j, Order& o) {
    o = Order{};
    o.id = j.at("id").get<int64_t>();
    o.point = read_point(j);
    if (j.contains("time_window") && !j.at("time_window").is_null()) {
        o.time_window = j.at("time_window").get<TimeWindow>();
    }
    o.priority = parse_priority(j.value("priority", "normal"));
    o.status = parse_order_status(j.value("status", "pending"));
    o.route_id = read_optional_int(j, "route_id");
    if (j.contains("route_sequence") && !j.at("route_sequence").is_null()) {
        o.route_sequence = j.at("route_sequence").get<int>();
    }
    o.parking_required = j.value("parking_required", false);
}

void to_json(json& j, const Driver& d) {
    j = {
        {"id", d.id},
        {"name", d.name},
        {"status", to_string(d.status)},
        {"position", d.position ? json(*d.position) : json(nullptr)},
        {"current_load", d.current_load}
    };
}

void from_json(const json& j, Driver& d) {
    d = Driver{};
    d.id = j.at("id").get<int64_t>();
    d.name = j.value("name", "");
    d.status = parse_driver_status(j.value("status", "available"));
    if (j.contains("position") && !j.at("position").is_null()) {
        d.position = j.at("position").get<GeoPoint>();
    } else {
        d.position = read_point(j);
    }
    d.current_load = j.value("current_load", 0);
}

void to_json(json& j, const NamedPoint& p) {
    j = {{"id", p.id}, {"name", p.name}, {"point", p.point}};
}

void from_json(const json& j, NamedPoint& p) {
    p.id = j.at("id").get<int64_t>();
    p.name = j.value("name", "");
    auto pt = read_point(j);
    if (!pt) throw std::invalid_argument("location " + std::to_string(p.id) + " has no coordinates");
    p.point = *pt;
}

void to_json(json& j, const Waypoint& w) {
    j = {
        {"kind", to_string(w.kind)},
        {"point", w.point},
        {"sequence", w.sequence},
        {"ref_id", w.ref_id}
    };
}

void from_json(const json& j, Waypoint& w) {
    w.kind = parse_waypoint_kind(j.at("kind").get<std::string>());
    w.point = j.at("point").get<GeoPoint>();
    w.sequence = j.value("sequence", 0);
    w.ref_id = j.value("ref_id", int64_t{0});
}

void to_json(json& j, const Route& r) {
    j = {
        {"id", r.id},
        {"driver_id", r.driver_id},
        {"name", r.name},
        {"color", r.color},
        {"waypoints", r.waypoints},
        {"status", to_string(r.status)},
        {"total_distance_km", r.total_distance_km},
        {"total_duration_min", r.total_duration_min},
        {"used_road_network", r.used_road_network},
        {"optimization_method", r.optimization_method},
        {"small_route", r.small_route},
        {"version", r.version},
        {"completed_stops", r.completed_stops}
    };
}

void from_json(const json& j, Route& r) {
    r = Route{};
    r.id = j.at("id").get<int64_t>();
    r.driver_id = j.value("driver_id", int64_t{0});
    r.name = j.value("name", "");
    r.color = j.value("color", "");
    if (j.contains("waypoints")) r.waypoints = j.at("waypoints").get<std::vector<Waypoint>>();
    r.status = parse_route_status(j.value("status", "planned"));
    r.total_distance_km = j.value("total_distance_km", 0.0);
    r.total_duration_min = j.value("total_duration_min", 0.0);
    r.used_road_network = j.value("used_road_network", false);
    r.optimization_method = j.value("optimization_method", "");
    r.small_route = j.value("small_route", false);
    r.version = j.value("version", uint64_t{0});
    r.completed_stops = j.value("completed_stops", 0);
}

void to_json(json& j, const PlanSummary& s) {
    j = {
        {"routes_created", s.routes_created},
        {"orders_scheduled", s.orders_scheduled},
        {"orders_unscheduled", s.orders_unscheduled},
        {"unscheduled_order_ids", s.unscheduled_order_ids},
        {"total_distance_km", s.total_distance_km},
        {"total_time_minutes", s.total_time_minutes},
        {"drivers_used", s.drivers_used},
        {"small_routes", s.small_routes},
        {"used_road_network", s.used_road_network},
        {"warnings", s.warnings}
    };
}

void to_json(json& j, const InsertionCandidate& c) {
    j = {
        {"route_id", c.route_id},
        {"insertion_index", c.insertion_index},
        {"added_distance_km", c.added_distance_km},
        {"route_version", c.route_version}
    };
}

void from_json(const json& j, InsertionCandidate& c) {
    c.route_id = j.at("route_id").get<int64_t>();
    c.insertion_index = j.at("insertion_index").get<size_t>();
    c.added_distance_km = j.value("added_distance_km", 0.0);
    c.route_version = j.at("route_version").get<uint64_t>();
}

void to_json(json& j, const Itinerary& it) {
    json stops = json::array();
    for (const auto& s : it.stops) {
        stops.push_back({
            {"waypoint", s.waypoint},
            {"cumulative_distance_km", s.cumulative_distance_km},
            {"cumulative_duration_min", s.cumulative_duration_min},
            {"eta", s.eta}
        });
    }
    json segments = json::array();
    for (const auto& seg : it.segments) {
        segments.push_back({
            {"from", seg.from_index},
            {"to", seg.to_index},
            {"distance_km", seg.distance_km},
            {"duration_min", seg.duration_min},
            {"provenance", to_string(seg.provenance)},
            {"points", seg.polyline.size()}
        });
    }
    j = {
        {"start_time", it.start_time},
        {"total_distance_km", it.total_distance_km},
        {"total_duration_min", it.total_duration_min},
        {"used_road_network", it.used_road_network},
        {"stops", stops},
        {"segments", segments}
    };
}

PlanningBatch batch_from_json(const json& body) {
    PlanningBatch batch;
    batch.depot = body.at("depot").get<Depot>();
    batch.orders = body.at("orders").get<std::vector<Order>>();
    batch.drivers = body.at("drivers").get<std::vector<Driver>>();
    if (body.contains("parking") && !body.at("parking").is_null()) {
        batch.parking = body.at("parking").get<std::vector<ParkingSpot>>();
    }
    batch.start_time = body.value("start_time", int64_t{0});
    return batch;
}

}  // namespace fleetplan
