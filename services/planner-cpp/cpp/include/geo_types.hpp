/**
 * @file geo_types.hpp
 * @brief Domain types shared by the planning engine.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fleetplan {

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
};

inline bool operator==(const GeoPoint& a, const GeoPoint& b) {
    return a.lat == b.lat && a.lon == b.lon;
}

using Polyline = std::vector<GeoPoint>;

// ========== ORDERS ==========

enum class Priority {
    Low = 0,
    Normal = 1,
    High = 2,
    Urgent = 3
};

inline int priority_rank(Priority p) { return static_cast<int>(p); }

Priority parse_priority(const std::string& s);
const char* to_string(Priority p);

enum class OrderStatus {
    Pending,
    Assigned,
    InTransit,
    Completed,
    Failed
};

OrderStatus parse_order_status(const std::string& s);
const char* to_string(OrderStatus s);

/**
 * @brief Delivery time window in epoch seconds. Either bound may be open.
 */
struct TimeWindow {
    std::optional<int64_t> start;
    std::optional<int64_t> end;
};

struct Order {
    int64_t id = 0;
    std::optional<GeoPoint> point;
    std::optional<TimeWindow> time_window;
    Priority priority = Priority::Normal;
    OrderStatus status = OrderStatus::Pending;
    std::optional<int64_t> route_id;
    std::optional<int> route_sequence;
    bool parking_required = false;
};

// ========== DRIVERS / LOCATIONS ==========

enum class DriverStatus {
    Available,
    OnRoute,
    Offline
};

DriverStatus parse_driver_status(const std::string& s);
const char* to_string(DriverStatus s);

struct Driver {
    int64_t id = 0;
    std::string name;
    DriverStatus status = DriverStatus::Available;
    std::optional<GeoPoint> position;
    int current_load = 0;
};

/**
 * @brief Named point: used for depots and parking locations.
 */
struct NamedPoint {
    int64_t id = 0;
    std::string name;
    GeoPoint point;
};

using Depot = NamedPoint;
using ParkingSpot = NamedPoint;

// ========== ROUTES ==========

enum class WaypointKind {
    Depot,
    Parking,
    Delivery
};

WaypointKind parse_waypoint_kind(const std::string& s);
const char* to_string(WaypointKind k);

/**
 * @brief A single stop. ref_id points back to the depot, parking spot or
 * order the stop was created from, depending on kind.
 */
struct Waypoint {
    WaypointKind kind = WaypointKind::Delivery;
    GeoPoint point;
    int sequence = 0;
    int64_t ref_id = 0;
};

enum class RouteStatus {
    Planned,
    InTransit,
    Completed
};

RouteStatus parse_route_status(const std::string& s);
const char* to_string(RouteStatus s);

struct Route {
    int64_t id = 0;
    int64_t driver_id = 0;
    std::string name;
    std::string color;
    std::vector<Waypoint> waypoints;
    RouteStatus status = RouteStatus::Planned;
    double total_distance_km = 0.0;
    double total_duration_min = 0.0;
    bool used_road_network = false;
    std::string optimization_method;
    bool small_route = false;
    uint64_t version = 0;
    // Waypoints already served, depot included.
    int completed_stops = 0;

    bool is_active() const {
        return status == RouteStatus::Planned || status == RouteStatus::InTransit;
    }
};

/**
 * @brief Renumber sequence indices from 0 after a structural change.
 */
void renumber(std::vector<Waypoint>& waypoints);

}  // namespace fleetplan
