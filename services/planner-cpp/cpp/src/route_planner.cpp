/**
 * @file route_planner.cpp
 * @brief Planning pipeline implementation.
 */

#include "route_planner.hpp"
#include "driver_assigner.hpp"
#include "geo_clusterer.hpp"
#include "route_synthesizer.hpp"
#include "stop_sequencer.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <iomanip>
#include <iostream>
#include <optional>
#include <set>
#include <unordered_map>

namespace fleetplan {

namespace {

struct RouteWork {
    SequencedRoute sequenced;
    Itinerary itinerary;
};

}  // namespace

void merge_orders(PlanningBatch& batch, const std::vector<Order>& extra) {
    std::set<int64_t> seen;
    for (const auto& o : batch.orders) seen.insert(o.id);
    for (const auto& o : extra) {
        if (seen.insert(o.id).second) batch.orders.push_back(o);
    }
}

RoutePlanner::RoutePlanner(PlannerConfig config, std::shared_ptr<DistanceProvider> provider)
    : config_(std::move(config)), provider_(std::move(provider)) {
    if (!provider_) provider_ = std::make_shared<DistanceProvider>(nullptr, distance_options(config_));
}

RoutePlan RoutePlanner::plan(const PlanningBatch& batch,
                             const CancellationToken* token,
                             PlanStore* id_source) const {
    try {
        return run(batch, token, id_source);
    } catch (const PlanningError&) {
        throw;
    } catch (const std::exception& e) {
        throw PlanningError(std::string("planning batch failed: ") + e.what());
    }
}

RoutePlan RoutePlanner::plan_and_commit(const PlanningBatch& batch,
                                        PlanStore& store,
                                        const CancellationToken* token) const {
    RoutePlan staged = plan(batch, token, &store);
    throw_if_cancelled(token);

    std::string error;
    if (!store.commit(staged, error)) {
        std::cerr << "Planner: commit failed: " << error << std::endl;
        throw PlanningError("commit failed: " + error);
    }
    std::cout << "Planner: committed " << staged.routes.size() << " routes" << std::endl;
    return staged;
}

RoutePlan RoutePlanner::run(const PlanningBatch& batch, const CancellationToken* token, PlanStore* id_source) const {
    auto t_start = std::chrono::high_resolution_clock::now();
    throw_if_cancelled(token);

    RoutePlan plan;
    PlanSummary& summary = plan.summary;

    // ========== FILTER ==========
    std::vector<Order> planable;
    std::unordered_map<int64_t, Order> by_id;
    for (const auto& o : batch.orders) {
        if (o.status != OrderStatus::Pending || o.route_id) continue;
        if (!by_id.emplace(o.id, o).second) continue;
        planable.push_back(o);
    }

    // ========== CLUSTER ==========
    ClusteringResult clustering = cluster_orders(planable, clustering_options(config_), provider_.get());
    std::vector<int64_t> unscheduled = clustering.unscheduled_order_ids;
    throw_if_cancelled(token);

    // ========== ASSIGN ==========
    AssignmentResult assignment = assign_drivers(clustering.clusters, batch.drivers, assignment_strategy(config_));
    for (const auto& c : assignment.unassigned) {
        unscheduled.insert(unscheduled.end(), c.order_ids.begin(), c.order_ids.end());
    }
    if (!assignment.unassigned.empty()) {
        summary.warnings.push_back(std::to_string(assignment.unassigned.size()) +
                                   " cluster(s) left without an available driver");
    }
    throw_if_cancelled(token);

    const size_t n = assignment.assignments.size();
    std::vector<int64_t> route_ids;
    if (id_source) {
        route_ids = id_source->reserve_route_ids(n);
        if (route_ids.size() != n) throw PlanningError("store returned too few route ids");
    } else {
        for (size_t i = 0; i < n; ++i) route_ids.push_back(static_cast<int64_t>(i + 1));
    }

    // ========== SEQUENCE + SYNTHESIZE (parallel) ==========
    SequencerOptions seq_options = sequencer_options(config_);
    seq_options.cancel = token;

    std::vector<std::optional<RouteWork>> work(n);
    std::vector<std::exception_ptr> failures(n);
    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};

    auto worker = [&]() {
        for (;;) {
            size_t i = next.fetch_add(1);
            if (i >= n || failed.load() || (token && token->cancelled())) return;
            try {
                const Assignment& a = assignment.assignments[i];
                std::vector<DeliveryRequest> deliveries;
                deliveries.reserve(a.cluster.size());
                for (int64_t id : a.cluster.order_ids) deliveries.push_back(delivery_from(by_id.at(id)));

                RouteWork w;
                w.sequenced = sequence_stops(batch.depot, batch.parking, deliveries, *provider_, seq_options);
                w.itinerary = synthesize(batch.depot, w.sequenced.waypoints, *provider_, batch.start_time);
                work[i] = std::move(w);
            } catch (...) {
                // Rethrown on the planning thread below.
                failures[i] = std::current_exception();
                failed.store(true);
            }
        }
    };

    const size_t threads = std::min(n, static_cast<size_t>(std::max(1, config_.sequencing_threads)));
    std::vector<std::future<void>> pool;
    for (size_t t = 0; t < threads; ++t) pool.push_back(std::async(std::launch::async, worker));
    for (auto& f : pool) f.get();

    throw_if_cancelled(token);
    for (const auto& f : failures) {
        if (f) std::rethrow_exception(f);
    }

    // ========== STAGE ==========
    bool all_road = n > 0;
    for (size_t i = 0; i < n; ++i) {
        const Assignment& a = assignment.assignments[i];
        if (!work[i]) throw PlanningError("route " + a.route_name + " was not sequenced");
        RouteWork& w = *work[i];
        const CostSummary& cost = w.sequenced.summary;

        Route route;
        route.id = route_ids[i];
        route.driver_id = a.driver.id;
        route.name = a.route_name;
        route.color = a.color;
        route.waypoints = w.sequenced.waypoints;
        route.status = RouteStatus::Planned;
        route.total_distance_km = cost.total_distance_km;
        route.total_duration_min = cost.total_duration_min;
        route.used_road_network = cost.used_road_network;
        route.optimization_method = cost.optimization_method;
        route.small_route = a.cluster.small_route;
        route.version = 1;
        route.completed_stops = 0;

        for (const auto& wp : route.waypoints) {
            if (wp.kind != WaypointKind::Delivery) continue;
            OrderUpdate u;
            u.order_id = wp.ref_id;
            u.route_id = route.id;
            u.sequence = wp.sequence;
            u.status = OrderStatus::Assigned;
            plan.order_updates.push_back(u);
        }

        DriverUpdate du;
        du.driver_id = a.driver.id;
        du.status = DriverStatus::OnRoute;
        du.current_load = a.running_load;
        plan.driver_updates.push_back(du);

        if (!cost.warning.empty()) summary.warnings.push_back("route " + route.name + ": " + cost.warning);
        if (cost.unparked_deliveries > 0) {
            summary.warnings.push_back("route " + route.name + ": " + std::to_string(cost.unparked_deliveries) +
                                       " delivery(ies) without parking in walking distance");
        }
        if (a.cluster.radius_relaxed) {
            summary.warnings.push_back("route " + route.name + ": merged beyond the " +
                                       std::to_string(config_.max_radius_km) + " km radius");
        }

        summary.orders_scheduled += static_cast<int>(a.cluster.size());
        summary.total_distance_km += route.total_distance_km;
        summary.total_time_minutes += route.total_duration_min;
        if (route.small_route) summary.small_routes++;
        all_road = all_road && route.used_road_network;

        plan.routes.push_back(std::move(route));
        plan.itineraries.push_back(std::move(w.itinerary));
    }

    std::sort(unscheduled.begin(), unscheduled.end());
    summary.routes_created = static_cast<int>(plan.routes.size());
    summary.drivers_used = static_cast<int>(plan.driver_updates.size());
    summary.unscheduled_order_ids = unscheduled;
    summary.orders_unscheduled = static_cast<int>(unscheduled.size());
    summary.used_road_network = all_road;
    if (!all_road && n > 0) summary.warnings.push_back("some distances are geometric estimates");

    auto t_end = std::chrono::high_resolution_clock::now();
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t_end - t_start).count();
    std::cout << "Planner: " << summary.routes_created << " routes, " << summary.orders_scheduled
              << " orders scheduled, " << summary.orders_unscheduled << " unscheduled, "
              << std::fixed << std::setprecision(2) << summary.total_distance_km << " km in "
              << elapsed_ms << " ms" << std::defaultfloat << std::endl;
    return plan;
}

}  // namespace fleetplan
