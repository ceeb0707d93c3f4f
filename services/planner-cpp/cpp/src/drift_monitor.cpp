/**
 * @file drift_monitor.cpp
 * @brief Insertion candidates and the active route registry.
 */

#include "drift_monitor.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <utility>

namespace fleetplan {

namespace {

size_t first_insertion_index(const Route& route) {
    return static_cast<size_t>(std::max(1, route.completed_stops));
}

std::vector<int64_t> delivery_ids(const Route& route) {
    std::vector<int64_t> ids;
    for (const auto& w : route.waypoints) {
        if (w.kind == WaypointKind::Delivery) ids.push_back(w.ref_id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

InsertionResult failed(InsertionStatus status, std::string error) {
    InsertionResult result;
    result.status = status;
    result.error = std::move(error);
    return result;
}

InsertionResult accepted(const Route& route) {
    InsertionResult result;
    result.status = InsertionStatus::Accepted;
    result.route = route;
    return result;
}

}  // namespace

// ============================================================
// CANDIDATES
// ============================================================

std::vector<InsertionCandidate> find_insertion_candidates(const Order& new_order,
                                                          const std::vector<Route>& active_routes,
                                                          double max_detour_km,
                                                          DistanceProvider& provider) {
    std::vector<InsertionCandidate> out;
    if (!new_order.point) return out;
    const GeoPoint& x = *new_order.point;

    for (const Route& route : active_routes) {
        if (!route.is_active()) continue;
        const auto& wps = route.waypoints;

        for (size_t idx = first_insertion_index(route); idx < wps.size(); ++idx) {
            const GeoPoint& a = wps[idx - 1].point;
            const GeoPoint& b = wps[idx].point;
            double added = provider.pairwise_distance(a, x).distance_km +
                           provider.pairwise_distance(x, b).distance_km -
                           provider.pairwise_distance(a, b).distance_km;
            added = std::max(0.0, added);
            if (added > max_detour_km) continue;

            InsertionCandidate c;
            c.route_id = route.id;
            c.insertion_index = idx;
            c.added_distance_km = added;
            c.route_version = route.version;
            out.push_back(c);
        }
    }

    std::sort(out.begin(), out.end(), [](const InsertionCandidate& l, const InsertionCandidate& r) {
        if (l.added_distance_km != r.added_distance_km) return l.added_distance_km < r.added_distance_km;
        if (l.route_id != r.route_id) return l.route_id < r.route_id;
        return l.insertion_index < r.insertion_index;
    });
    return out;
}

const char* to_string(InsertionStatus s) {
    switch (s) {
        case InsertionStatus::Accepted: return "accepted";
        case InsertionStatus::UnknownRoute: return "unknown_route";
        case InsertionStatus::StaleVersion: return "stale_version";
        case InsertionStatus::RouteClosed: return "route_closed";
        case InsertionStatus::InvalidIndex: return "invalid_index";
        case InsertionStatus::Unroutable: return "unroutable";
        case InsertionStatus::AlreadyScheduled: return "already_scheduled";
        case InsertionStatus::InvalidUpdate: return "invalid_update";
        case InsertionStatus::NotPersisted: return "not_persisted";
    }
    return "unknown";
}

// ============================================================
// RESEQUENCING
// ============================================================

Route resequence_remaining(const Route& route,
                           const std::vector<Order>& orders,
                           const std::vector<ParkingSpot>& parking,
                           DistanceProvider& provider,
                           const SequencerOptions& options) {
    Route out = route;
    if (route.waypoints.empty()) return out;
    const size_t served = std::min(first_insertion_index(route), route.waypoints.size());

    std::map<int64_t, const Order*> by_id;
    for (const auto& o : orders) by_id[o.id] = &o;

    std::vector<DeliveryRequest> tail;
    for (size_t i = served; i < route.waypoints.size(); ++i) {
        const Waypoint& w = route.waypoints[i];
        if (w.kind != WaypointKind::Delivery) continue;
        DeliveryRequest d;
        d.order_id = w.ref_id;
        d.point = w.point;
        auto it = by_id.find(w.ref_id);
        if (it != by_id.end()) {
            d.time_window = it->second->time_window;
            d.priority = it->second->priority;
            d.parking_required = it->second->parking_required;
        }
        tail.push_back(d);
    }
    if (tail.empty()) return out;

    const Waypoint& last = route.waypoints[served - 1];
    Depot start;
    start.id = last.ref_id;
    start.point = last.point;
    SequencedRoute sequenced = sequence_stops(start, parking, tail, provider, options);

    out.waypoints.assign(route.waypoints.begin(), route.waypoints.begin() + static_cast<std::ptrdiff_t>(served));
    out.waypoints.insert(out.waypoints.end(), sequenced.waypoints.begin() + 1, sequenced.waypoints.end());
    renumber(out.waypoints);

    out.total_distance_km = sequenced.summary.total_distance_km;
    out.total_duration_min = sequenced.summary.total_duration_min;
    out.used_road_network = sequenced.summary.used_road_network;
    for (size_t i = 0; i + 1 < served; ++i) {
        DistanceResult leg = provider.pairwise_distance(route.waypoints[i].point, route.waypoints[i + 1].point);
        out.total_distance_km += leg.distance_km;
        out.total_duration_min += leg.duration_min;
        if (leg.provenance != Provenance::RoadNetwork) out.used_road_network = false;
    }
    out.optimization_method = sequenced.summary.optimization_method;
    return out;
}

// ============================================================
// REGISTRY
// ============================================================

ActiveRouteRegistry::ActiveRouteRegistry(DistanceProvider* provider) : provider_(provider) {}

void ActiveRouteRegistry::set_writer(RouteWriter writer) {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    writer_ = std::move(writer);
}

bool ActiveRouteRegistry::write(const Route& route, std::string& error) {
    RouteWriter writer;
    {
        std::lock_guard<std::mutex> lock(writer_mutex_);
        writer = writer_;
    }
    if (!writer) return true;
    return writer(route, error);
}

std::shared_ptr<ActiveRouteRegistry::Entry> ActiveRouteRegistry::find(int64_t route_id) const {
    std::lock_guard<std::mutex> lock(routes_mutex_);
    auto it = routes_.find(route_id);
    return it != routes_.end() ? it->second : nullptr;
}

void ActiveRouteRegistry::index_route(const Route& route) {
    for (const auto& w : route.waypoints) {
        if (w.kind != WaypointKind::Delivery) continue;
        auto [it, inserted] = order_routes_.emplace(w.ref_id, route.id);
        if (!inserted && it->second != route.id) {
            std::cerr << "Registry: order " << w.ref_id << " moves from route " << it->second
                      << " to route " << route.id << std::endl;
            it->second = route.id;
        }
    }
}

void ActiveRouteRegistry::unindex_route(int64_t route_id) {
    for (auto it = order_routes_.begin(); it != order_routes_.end();) {
        if (it->second == route_id) {
            it = order_routes_.erase(it);
        } else {
            ++it;
        }
    }
}

void ActiveRouteRegistry::release_claim(int64_t order_id, int64_t route_id) {
    std::lock_guard<std::mutex> lock(routes_mutex_);
    auto it = order_routes_.find(order_id);
    if (it != order_routes_.end() && it->second == route_id) order_routes_.erase(it);
}

void ActiveRouteRegistry::upsert(const Route& route) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(routes_mutex_);
        unindex_route(route.id);
        if (!route.is_active()) {
            routes_.erase(route.id);
            return;
        }
        auto& slot = routes_[route.id];
        if (!slot) slot = std::make_shared<Entry>();
        entry = slot;
        index_route(route);
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->route = route;
}

bool ActiveRouteRegistry::remove(int64_t route_id) {
    std::lock_guard<std::mutex> lock(routes_mutex_);
    unindex_route(route_id);
    return routes_.erase(route_id) > 0;
}

std::optional<Route> ActiveRouteRegistry::snapshot(int64_t route_id) const {
    auto entry = find(route_id);
    if (!entry) return std::nullopt;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->route;
}

std::vector<Route> ActiveRouteRegistry::snapshots() const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(routes_mutex_);
        for (const auto& [id, entry] : routes_) entries.push_back(entry);
    }

    std::vector<Route> out;
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->route.is_active()) out.push_back(entry->route);
    }
    return out;
}

std::optional<int64_t> ActiveRouteRegistry::route_of(int64_t order_id) const {
    std::lock_guard<std::mutex> lock(routes_mutex_);
    auto it = order_routes_.find(order_id);
    if (it == order_routes_.end()) return std::nullopt;
    return it->second;
}

InsertionResult ActiveRouteRegistry::accept_insertion(const InsertionCandidate& candidate, const Order& order) {
    if (!order.point) {
        return failed(InsertionStatus::Unroutable, "order " + std::to_string(order.id) + " has no location");
    }

    // Claim the order before touching the route so two accepts of the same
    // order cannot both succeed.
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(routes_mutex_);
        auto it = routes_.find(candidate.route_id);
        if (it == routes_.end()) {
            return failed(InsertionStatus::UnknownRoute, "route " + std::to_string(candidate.route_id) + " not found");
        }
        auto on = order_routes_.find(order.id);
        if (on != order_routes_.end()) {
            return failed(InsertionStatus::AlreadyScheduled, "order " + std::to_string(order.id) +
                                                                 " is already on route " + std::to_string(on->second));
        }
        order_routes_[order.id] = candidate.route_id;
        entry = it->second;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    Route& route = entry->route;

    auto reject = [&](InsertionStatus status, std::string error) {
        release_claim(order.id, candidate.route_id);
        return failed(status, std::move(error));
    };

    if (route.version != candidate.route_version) {
        return reject(InsertionStatus::StaleVersion,
                      "route " + std::to_string(route.id) + " is at version " + std::to_string(route.version) +
                          ", candidate was computed for " + std::to_string(candidate.route_version));
    }
    if (!route.is_active()) {
        return reject(InsertionStatus::RouteClosed,
                      "route " + std::to_string(route.id) + " is " + to_string(route.status));
    }
    if (candidate.insertion_index < first_insertion_index(route) ||
        candidate.insertion_index > route.waypoints.size()) {
        return reject(InsertionStatus::InvalidIndex,
                      "insertion index " + std::to_string(candidate.insertion_index) + " out of range");
    }

    Waypoint w;
    w.kind = WaypointKind::Delivery;
    w.point = *order.point;
    w.ref_id = order.id;

    Route updated = route;
    const size_t idx = candidate.insertion_index;
    if (provider_) {
        const GeoPoint& a = updated.waypoints[idx - 1].point;
        DistanceResult in = provider_->pairwise_distance(a, w.point);
        double delta_km = in.distance_km;
        double delta_min = in.duration_min;
        if (idx < updated.waypoints.size()) {
            const GeoPoint& b = updated.waypoints[idx].point;
            DistanceResult out = provider_->pairwise_distance(w.point, b);
            DistanceResult old = provider_->pairwise_distance(a, b);
            delta_km += out.distance_km - old.distance_km;
            delta_min += out.duration_min - old.duration_min;
        }
        updated.total_distance_km += delta_km;
        updated.total_duration_min += delta_min;
    } else {
        updated.total_distance_km += candidate.added_distance_km;
    }

    updated.waypoints.insert(updated.waypoints.begin() + static_cast<std::ptrdiff_t>(idx), w);
    renumber(updated.waypoints);
    updated.version++;

    std::string error;
    if (!write(updated, error)) {
        return reject(InsertionStatus::NotPersisted, "route " + std::to_string(route.id) + " not saved: " + error);
    }
    route = std::move(updated);

    std::cout << "Drift: order " << order.id << " inserted into route " << route.id
              << " at " << idx << " (version " << route.version << ")" << std::endl;
    return accepted(route);
}

InsertionResult ActiveRouteRegistry::update_progress(int64_t route_id, RouteStatus status, int completed_stops) {
    auto entry = find(route_id);
    if (!entry) {
        return failed(InsertionStatus::UnknownRoute, "route " + std::to_string(route_id) + " not found");
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    Route& route = entry->route;

    if (!route.is_active()) {
        return failed(InsertionStatus::RouteClosed, "route " + std::to_string(route_id) + " is " + to_string(route.status));
    }
    if (completed_stops < route.completed_stops || completed_stops > static_cast<int>(route.waypoints.size())) {
        return failed(InsertionStatus::InvalidUpdate,
                      "completed_stops " + std::to_string(completed_stops) + " outside [" +
                          std::to_string(route.completed_stops) + ", " + std::to_string(route.waypoints.size()) + "]");
    }
    if (status == RouteStatus::Planned && route.status == RouteStatus::InTransit) {
        return failed(InsertionStatus::InvalidUpdate, "route " + std::to_string(route_id) + " is already in transit");
    }

    Route updated = route;
    updated.status = status;
    updated.completed_stops = completed_stops;

    std::string error;
    if (!write(updated, error)) {
        return failed(InsertionStatus::NotPersisted, "route " + std::to_string(route_id) + " not saved: " + error);
    }
    route = std::move(updated);

    if (!route.is_active()) {
        std::lock_guard<std::mutex> routes_lock(routes_mutex_);
        unindex_route(route_id);
        routes_.erase(route_id);
        std::cout << "Registry: route " << route_id << " completed" << std::endl;
    }
    return accepted(route);
}

InsertionResult ActiveRouteRegistry::apply_resequence(const Route& resequenced, uint64_t expected_version) {
    auto entry = find(resequenced.id);
    if (!entry) {
        return failed(InsertionStatus::UnknownRoute, "route " + std::to_string(resequenced.id) + " not found");
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    Route& route = entry->route;

    if (route.version != expected_version || route.completed_stops != resequenced.completed_stops) {
        return failed(InsertionStatus::StaleVersion,
                      "route " + std::to_string(route.id) + " changed while it was being re-sequenced");
    }
    if (!route.is_active()) {
        return failed(InsertionStatus::RouteClosed, "route " + std::to_string(route.id) + " is " + to_string(route.status));
    }
    if (delivery_ids(route) != delivery_ids(resequenced)) {
        return failed(InsertionStatus::InvalidUpdate,
                      "re-sequenced route " + std::to_string(route.id) + " does not hold the same orders");
    }

    Route updated = route;
    updated.waypoints = resequenced.waypoints;
    renumber(updated.waypoints);
    updated.total_distance_km = resequenced.total_distance_km;
    updated.total_duration_min = resequenced.total_duration_min;
    updated.used_road_network = resequenced.used_road_network;
    updated.optimization_method = resequenced.optimization_method;
    updated.version++;

    std::string error;
    if (!write(updated, error)) {
        return failed(InsertionStatus::NotPersisted, "route " + std::to_string(route.id) + " not saved: " + error);
    }
    route = std::move(updated);

    std::cout << "Registry: route " << route.id << " re-sequenced (version " << route.version << ")" << std::endl;
    return accepted(route);
}

void ActiveRouteRegistry::reject_insertion(const Order& order) {
    Order pooled = order;
    pooled.status = OrderStatus::Pending;
    pooled.route_id.reset();
    pooled.route_sequence.reset();

    std::lock_guard<std::mutex> lock(pool_mutex_);
    auto it = std::find_if(pool_.begin(), pool_.end(), [&](const Order& o) { return o.id == order.id; });
    if (it != pool_.end()) {
        *it = pooled;
    } else {
        pool_.push_back(pooled);
    }
}

std::vector<Order> ActiveRouteRegistry::take_unscheduled() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    std::vector<Order> out;
    out.swap(pool_);
    return out;
}

size_t ActiveRouteRegistry::pool_size() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return pool_.size();
}

size_t ActiveRouteRegistry::size() const {
    std::lock_guard<std::mutex> lock(routes_mutex_);
    return routes_.size();
}

}  // namespace fleetplan
