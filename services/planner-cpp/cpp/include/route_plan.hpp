/**
 * @file route_plan.hpp
 * @brief Inputs and staged outputs of one planning batch.
 */

#pragma once

#include "geo_types.hpp"
#include "route_synthesizer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fleetplan {

struct PlanningBatch {
    Depot depot;
    std::vector<Order> orders;
    std::vector<Driver> drivers;
    std::vector<ParkingSpot> parking;
    int64_t start_time = 0;  // epoch seconds, ETAs are relative to it
};

struct OrderUpdate {
    int64_t order_id = 0;
    int64_t route_id = 0;
    int sequence = 0;
    OrderStatus status = OrderStatus::Assigned;
};

struct DriverUpdate {
    int64_t driver_id = 0;
    DriverStatus status = DriverStatus::OnRoute;
    int current_load = 0;
};

struct PlanSummary {
    int routes_created = 0;
    int orders_scheduled = 0;
    int orders_unscheduled = 0;
    std::vector<int64_t> unscheduled_order_ids;
    double total_distance_km = 0.0;
    double total_time_minutes = 0.0;
    int drivers_used = 0;
    int small_routes = 0;
    // Every route was costed on the road network.
    bool used_road_network = false;
    std::vector<std::string> warnings;
};

/**
 * @brief Everything one batch produces. Nothing here is visible outside the
 *        planner until a store commits it as a whole.
 */
struct RoutePlan {
    std::vector<Route> routes;
    // Aligned with routes; derived, not persisted.
    std::vector<Itinerary> itineraries;
    std::vector<OrderUpdate> order_updates;
    std::vector<DriverUpdate> driver_updates;
    PlanSummary summary;
};

}  // namespace fleetplan
