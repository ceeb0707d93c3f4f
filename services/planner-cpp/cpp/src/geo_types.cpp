/**
 * @file geo_types.cpp
 * @brief String conversions for domain enums.
 */

#include "geo_types.hpp"

namespace fleetplan {

Priority parse_priority(const std::string& s) {
    if (s == "low") return Priority::Low;
    if (s == "high") return Priority::High;
    if (s == "urgent") return Priority::Urgent;
    return Priority::Normal;
}

const char* to_string(Priority p) {
    switch (p) {
        case Priority::Low: return "low";
        case Priority::Normal: return "normal";
        case Priority::High: return "high";
        case Priority::Urgent: return "urgent";
    }
    return "normal";
}

OrderStatus parse_order_status(const std::string& s) {
    if (s == "assigned") return OrderStatus::Assigned;
    if (s == "in_transit") return OrderStatus::InTransit;
    if (s == "completed") return OrderStatus::Completed;
    if (s == "failed") return OrderStatus::Failed;
    return OrderStatus::Pending;
}

const char* to_string(OrderStatus s) {
    switch (s) {
        case OrderStatus::Pending: return "pending";
        case OrderStatus::Assigned: return "assigned";
        case OrderStatus::InTransit: return "in_transit";
        case OrderStatus::Completed: return "completed";
        case OrderStatus::Failed: return "failed";
    }
    return "pending";
}

DriverStatus parse_driver_status(const std::string& s) {
    if (s == "on_route") return DriverStatus::OnRoute;
    if (s == "offline") return DriverStatus::Offline;
    return DriverStatus::Available;
}

const char* to_string(DriverStatus s) {
    switch (s) {
        case DriverStatus::Available: return "available";
        case DriverStatus::OnRoute: return "on_route";
        case DriverStatus::Offline: return "offline";
    }
    return "available";
}

WaypointKind parse_waypoint_kind(const std::string& s) {
    if (s == "depot") return WaypointKind::Depot;
    if (s == "parking") return WaypointKind::Parking;
    return WaypointKind::Delivery;
}

const char* to_string(WaypointKind k) {
    switch (k) {
        case WaypointKind::Depot: return "depot";
        case WaypointKind::Parking: return "parking";
        case WaypointKind::Delivery: return "delivery";
    }
    return "delivery";
}

RouteStatus parse_route_status(const std::string& s) {
    if (s == "in_transit") return RouteStatus::InTransit;
    if (s == "completed") return RouteStatus::Completed;
    return RouteStatus::Planned;
}

const char* to_string(RouteStatus s) {
    switch (s) {
        case RouteStatus::Planned: return "planned";
        case RouteStatus::InTransit: return "in_transit";
        case RouteStatus::Completed: return "completed";
    }
    return "planned";
}

void renumber(std::vector<Waypoint>& waypoints) {
    for (size_t i = 0; i < waypoints.size(); ++i) {
        waypoints[i].sequence = static_cast<int>(i);
    }
}

}  // namespace fleetplan
