/**
 * @file plan_store.cpp
 * @brief In-memory and DuckDB plan stores.
 */

#include "plan_store.hpp"

#include <algorithm>
#include <iostream>
#include <set>

namespace fleetplan {

// ============================================================
// IN-MEMORY STORE
// ============================================================

void InMemoryPlanStore::set_depot(const Depot& depot) {
    std::lock_guard<std::mutex> lock(mutex_);
    depot_ = depot;
}

void InMemoryPlanStore::put_order(const Order& order) {
    std::lock_guard<std::mutex> lock(mutex_);
    orders_[order.id] = order;
}

void InMemoryPlanStore::put_driver(const Driver& driver) {
    std::lock_guard<std::mutex> lock(mutex_);
    drivers_[driver.id] = driver;
}

void InMemoryPlanStore::put_parking(const ParkingSpot& spot) {
    std::lock_guard<std::mutex> lock(mutex_);
    parking_[spot.id] = spot;
}

bool InMemoryPlanStore::load_batch(PlanningBatch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!depot_) {
        std::cerr << "Store: no depot configured" << std::endl;
        return false;
    }
    batch.depot = *depot_;
    batch.orders.clear();
    batch.drivers.clear();
    batch.parking.clear();
    for (const auto& [id, order] : orders_) {
        if (order.status == OrderStatus::Pending && !order.route_id) batch.orders.push_back(order);
    }
    for (const auto& [id, driver] : drivers_) batch.drivers.push_back(driver);
    for (const auto& [id, spot] : parking_) batch.parking.push_back(spot);
    return true;
}

std::vector<int64_t> InMemoryPlanStore::reserve_route_ids(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int64_t> ids;
    ids.reserve(count);
    for (size_t i = 0; i < count; ++i) ids.push_back(next_route_id_++);
    return ids;
}

bool InMemoryPlanStore::commit(const RoutePlan& plan, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Validate everything first; nothing is touched on failure.
    std::set<int64_t> new_ids;
    for (const auto& route : plan.routes) {
        if (route.id <= 0 || route.id >= next_route_id_) {
            error = "route id " + std::to_string(route.id) + " was not reserved";
            return false;
        }
        if (routes_.count(route.id) || !new_ids.insert(route.id).second) {
            error = "route id " + std::to_string(route.id) + " already exists";
            return false;
        }
    }
    for (const auto& u : plan.order_updates) {
        auto it = orders_.find(u.order_id);
        if (it == orders_.end()) {
            error = "unknown order " + std::to_string(u.order_id);
            return false;
        }
        if (it->second.status != OrderStatus::Pending || it->second.route_id) {
            error = "order " + std::to_string(u.order_id) + " is no longer pending";
            return false;
        }
    }
    for (const auto& u : plan.driver_updates) {
        if (!drivers_.count(u.driver_id)) {
            error = "unknown driver " + std::to_string(u.driver_id);
            return false;
        }
    }

    for (const auto& route : plan.routes) routes_[route.id] = route;
    for (const auto& u : plan.order_updates) {
        Order& o = orders_[u.order_id];
        o.status = u.status;
        o.route_id = u.route_id;
        o.route_sequence = u.sequence;
    }
    for (const auto& u : plan.driver_updates) {
        Driver& d = drivers_[u.driver_id];
        d.status = u.status;
        d.current_load = u.current_load;
    }
    commits_++;
    return true;
}

std::vector<Route> InMemoryPlanStore::active_routes() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Route> out;
    for (const auto& [id, route] : routes_) {
        if (route.is_active()) out.push_back(route);
    }
    return out;
}

std::optional<Route> InMemoryPlanStore::find_route(int64_t route_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routes_.find(route_id);
    if (it == routes_.end()) return std::nullopt;
    return it->second;
}

bool InMemoryPlanStore::save_route(const Route& route, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routes_.find(route.id);
    if (it != routes_.end() && it->second.version > route.version) {
        error = "route " + std::to_string(route.id) + " is stored at version " +
                std::to_string(it->second.version) + ", refusing version " + std::to_string(route.version);
        return false;
    }
    routes_[route.id] = route;
    next_route_id_ = std::max(next_route_id_, route.id + 1);

    for (const auto& w : route.waypoints) {
        if (w.kind != WaypointKind::Delivery) continue;
        auto o = orders_.find(w.ref_id);
        if (o == orders_.end()) continue;
        if (o->second.status == OrderStatus::Pending) o->second.status = OrderStatus::Assigned;
        o->second.route_id = route.id;
        o->second.route_sequence = w.sequence;
    }
    return true;
}

std::vector<Order> InMemoryPlanStore::find_orders(const std::vector<int64_t>& order_ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<int64_t> wanted(order_ids.begin(), order_ids.end());
    std::vector<Order> out;
    for (int64_t id : wanted) {
        auto it = orders_.find(id);
        if (it != orders_.end()) out.push_back(it->second);
    }
    return out;
}

std::optional<Order> InMemoryPlanStore::find_order(int64_t order_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) return std::nullopt;
    return it->second;
}

std::optional<Driver> InMemoryPlanStore::find_driver(int64_t driver_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = drivers_.find(driver_id);
    if (it == drivers_.end()) return std::nullopt;
    return it->second;
}

size_t InMemoryPlanStore::route_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_.size();
}

size_t InMemoryPlanStore::commit_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commits_;
}

// ============================================================
// DUCKDB STORE
// ============================================================

#ifdef FLEETPLAN_HAVE_DUCKDB

namespace {

std::optional<GeoPoint> point_from(const duckdb::Value& lat, const duckdb::Value& lon) {
    if (lat.IsNull() || lon.IsNull()) return std::nullopt;
    return GeoPoint{lat.GetValue<double>(), lon.GetValue<double>()};
}

std::optional<int64_t> optional_int(const duckdb::Value& v) {
    if (v.IsNull()) return std::nullopt;
    return v.GetValue<int64_t>();
}

// Columns: id, lat, lon, window_start, window_end, priority, parking_required.
Order order_from_row(duckdb::DataChunk& chunk, duckdb::idx_t i) {
    Order o;
    o.id = chunk.GetValue(0, i).GetValue<int64_t>();
    o.point = point_from(chunk.GetValue(1, i), chunk.GetValue(2, i));
    auto ws = optional_int(chunk.GetValue(3, i));
    auto we = optional_int(chunk.GetValue(4, i));
    if (ws || we) o.time_window = TimeWindow{ws, we};
    auto prio = chunk.GetValue(5, i);
    o.priority = prio.IsNull() ? Priority::Normal : parse_priority(prio.ToString());
    auto parking = chunk.GetValue(6, i);
    o.parking_required = !parking.IsNull() && parking.GetValue<bool>();
    return o;
}

bool changed_one_row(duckdb::QueryResult& result) {
    auto chunk = result.Fetch();
    return chunk && chunk->size() > 0 && chunk->GetValue(0, 0).GetValue<int64_t>() == 1;
}

}  // namespace

DuckDbPlanStore::DuckDbPlanStore(std::string db_path) : db_path_(std::move(db_path)) {}

bool DuckDbPlanStore::open() {
    std::cout << "Store: opening DuckDB " << db_path_ << std::endl;
    try {
        db_ = std::make_unique<duckdb::DuckDB>(db_path_);
        con_ = std::make_unique<duckdb::Connection>(*db_);

        auto result = con_->Query(
            "CREATE TABLE IF NOT EXISTS routes ("
            "id BIGINT PRIMARY KEY, driver_id BIGINT, name VARCHAR, color VARCHAR, status VARCHAR, "
            "total_distance_km DOUBLE, total_duration_min DOUBLE, used_road_network BOOLEAN, "
            "optimization_method VARCHAR, small_route BOOLEAN, version BIGINT, completed_stops INTEGER)");
        if (result->HasError()) {
            std::cerr << "Error creating routes table: " << result->GetError() << std::endl;
            return false;
        }
        result = con_->Query(
            "CREATE TABLE IF NOT EXISTS route_waypoints ("
            "route_id BIGINT, seq INTEGER, kind VARCHAR, ref_id BIGINT, lat DOUBLE, lon DOUBLE)");
        if (result->HasError()) {
            std::cerr << "Error creating route_waypoints table: " << result->GetError() << std::endl;
            return false;
        }

        result = con_->Query("SELECT COALESCE(MAX(id), 0) FROM routes");
        if (result->HasError()) {
            std::cerr << "Error reading route ids: " << result->GetError() << std::endl;
            return false;
        }
        if (auto chunk = result->Fetch()) {
            if (chunk->size() > 0) next_route_id_ = chunk->GetValue(0, 0).GetValue<int64_t>() + 1;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "DuckDB error: " << e.what() << std::endl;
        return false;
    }
}

bool DuckDbPlanStore::load_batch(PlanningBatch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!con_) return false;

    try {
        batch.orders.clear();
        batch.drivers.clear();
        batch.parking.clear();

        auto result = con_->Query("SELECT id, name, lat, lon FROM depots ORDER BY id LIMIT 1");
        if (result->HasError()) {
            std::cerr << "Error loading depots: " << result->GetError() << std::endl;
            return false;
        }
        bool have_depot = false;
        while (auto chunk = result->Fetch()) {
            for (duckdb::idx_t i = 0; i < chunk->size(); i++) {
                batch.depot.id = chunk->GetValue(0, i).GetValue<int64_t>();
                batch.depot.name = chunk->GetValue(1, i).ToString();
                batch.depot.point = GeoPoint{chunk->GetValue(2, i).GetValue<double>(),
                                             chunk->GetValue(3, i).GetValue<double>()};
                have_depot = true;
            }
        }
        if (!have_depot) {
            std::cerr << "Store: depots table is empty" << std::endl;
            return false;
        }

        result = con_->Query(
            "SELECT id, lat, lon, window_start, window_end, priority, parking_required "
            "FROM orders WHERE status = 'pending' AND route_id IS NULL ORDER BY id");
        if (result->HasError()) {
            std::cerr << "Error loading orders: " << result->GetError() << std::endl;
            return false;
        }
        while (auto chunk = result->Fetch()) {
            for (duckdb::idx_t i = 0; i < chunk->size(); i++) {
                batch.orders.push_back(order_from_row(*chunk, i));
            }
        }

        result = con_->Query("SELECT id, name, status, lat, lon, current_load FROM drivers ORDER BY id");
        if (result->HasError()) {
            std::cerr << "Error loading drivers: " << result->GetError() << std::endl;
            return false;
        }
        while (auto chunk = result->Fetch()) {
            for (duckdb::idx_t i = 0; i < chunk->size(); i++) {
                Driver d;
                d.id = chunk->GetValue(0, i).GetValue<int64_t>();
                d.name = chunk->GetValue(1, i).IsNull() ? "" : chunk->GetValue(1, i).ToString();
                d.status = parse_driver_status(chunk->GetValue(2, i).ToString());
                d.position = point_from(chunk->GetValue(3, i), chunk->GetValue(4, i));
                auto load = chunk->GetValue(5, i);
                d.current_load = load.IsNull() ? 0 : load.GetValue<int32_t>();
                batch.drivers.push_back(std::move(d));
            }
        }

        result = con_->Query("SELECT id, name, lat, lon FROM parking_locations ORDER BY id");
        if (result->HasError()) {
            std::cerr << "Error loading parking_locations: " << result->GetError() << std::endl;
            return false;
        }
        while (auto chunk = result->Fetch()) {
            for (duckdb::idx_t i = 0; i < chunk->size(); i++) {
                ParkingSpot p;
                p.id = chunk->GetValue(0, i).GetValue<int64_t>();
                p.name = chunk->GetValue(1, i).IsNull() ? "" : chunk->GetValue(1, i).ToString();
                p.point = GeoPoint{chunk->GetValue(2, i).GetValue<double>(),
                                   chunk->GetValue(3, i).GetValue<double>()};
                batch.parking.push_back(std::move(p));
            }
        }

        std::cout << "Store: loaded " << batch.orders.size() << " pending orders, "
                  << batch.drivers.size() << " drivers, " << batch.parking.size()
                  << " parking locations" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "DuckDB error: " << e.what() << std::endl;
        return false;
    }
}

std::vector<int64_t> DuckDbPlanStore::reserve_route_ids(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int64_t> ids;
    ids.reserve(count);
    for (size_t i = 0; i < count; ++i) ids.push_back(next_route_id_++);
    return ids;
}

bool DuckDbPlanStore::write_route(const Route& route, std::string& error) {
    auto result = con_->Query("DELETE FROM route_waypoints WHERE route_id = " + std::to_string(route.id));
    if (result->HasError()) {
        error = result->GetError();
        return false;
    }

    auto insert_route = con_->Prepare(
        "INSERT OR REPLACE INTO routes VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12)");
    if (insert_route->HasError()) {
        error = insert_route->GetError();
        return false;
    }
    auto res = insert_route->Execute(
        duckdb::Value::BIGINT(route.id), duckdb::Value::BIGINT(route.driver_id),
        duckdb::Value(route.name), duckdb::Value(route.color), duckdb::Value(to_string(route.status)),
        duckdb::Value::DOUBLE(route.total_distance_km), duckdb::Value::DOUBLE(route.total_duration_min),
        duckdb::Value::BOOLEAN(route.used_road_network), duckdb::Value(route.optimization_method),
        duckdb::Value::BOOLEAN(route.small_route), duckdb::Value::BIGINT(static_cast<int64_t>(route.version)),
        duckdb::Value::INTEGER(route.completed_stops));
    if (res->HasError()) {
        error = res->GetError();
        return false;
    }

    auto insert_wp = con_->Prepare("INSERT INTO route_waypoints VALUES ($1, $2, $3, $4, $5, $6)");
    if (insert_wp->HasError()) {
        error = insert_wp->GetError();
        return false;
    }
    for (const auto& w : route.waypoints) {
        res = insert_wp->Execute(duckdb::Value::BIGINT(route.id), duckdb::Value::INTEGER(w.sequence),
                                 duckdb::Value(to_string(w.kind)), duckdb::Value::BIGINT(w.ref_id),
                                 duckdb::Value::DOUBLE(w.point.lat), duckdb::Value::DOUBLE(w.point.lon));
        if (res->HasError()) {
            error = res->GetError();
            return false;
        }
    }
    return true;
}

bool DuckDbPlanStore::commit(const RoutePlan& plan, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!con_) {
        error = "store not open";
        return false;
    }

    try {
        auto begin = con_->Query("BEGIN TRANSACTION");
        if (begin->HasError()) {
            error = begin->GetError();
            return false;
        }

        auto fail = [&](const std::string& why) {
            error = why;
            auto rb = con_->Query("ROLLBACK");
            if (rb->HasError()) std::cerr << "DuckDB rollback failed: " << rb->GetError() << std::endl;
            std::cerr << "Store: commit rolled back: " << why << std::endl;
            return false;
        };

        for (const auto& route : plan.routes) {
            std::string why;
            if (!write_route(route, why)) return fail(why);
        }

        auto update_order = con_->Prepare(
            "UPDATE orders SET status = $1, route_id = $2, route_sequence = $3 "
            "WHERE id = $4 AND status = 'pending' AND route_id IS NULL");
        if (update_order->HasError()) return fail(update_order->GetError());
        for (const auto& u : plan.order_updates) {
            auto res = update_order->Execute(duckdb::Value(to_string(u.status)), duckdb::Value::BIGINT(u.route_id),
                                             duckdb::Value::INTEGER(u.sequence), duckdb::Value::BIGINT(u.order_id));
            if (res->HasError()) return fail(res->GetError());
            if (!changed_one_row(*res)) {
                return fail("order " + std::to_string(u.order_id) + " is no longer pending");
            }
        }

        auto update_driver = con_->Prepare("UPDATE drivers SET status = $1, current_load = $2 WHERE id = $3");
        if (update_driver->HasError()) return fail(update_driver->GetError());
        for (const auto& u : plan.driver_updates) {
            auto res = update_driver->Execute(duckdb::Value(to_string(u.status)),
                                              duckdb::Value::INTEGER(u.current_load),
                                              duckdb::Value::BIGINT(u.driver_id));
            if (res->HasError()) return fail(res->GetError());
        }

        auto done = con_->Query("COMMIT");
        if (done->HasError()) return fail(done->GetError());

        std::cout << "Store: committed " << plan.routes.size() << " routes, "
                  << plan.order_updates.size() << " order updates" << std::endl;
        return true;

    } catch (const std::exception& e) {
        error = std::string("DuckDB error: ") + e.what();
        auto rb = con_->Query("ROLLBACK");
        if (rb->HasError()) std::cerr << "DuckDB rollback failed: " << rb->GetError() << std::endl;
        return false;
    }
}

bool DuckDbPlanStore::load_routes(const std::string& where, std::vector<Route>& out) {
    auto result = con_->Query(
        "SELECT id, driver_id, name, color, status, total_distance_km, total_duration_min, "
        "used_road_network, optimization_method, small_route, version, completed_stops "
        "FROM routes WHERE " + where + " ORDER BY id");
    if (result->HasError()) {
        std::cerr << "Error loading routes: " << result->GetError() << std::endl;
        return false;
    }

    std::map<int64_t, size_t> slot;
    while (auto chunk = result->Fetch()) {
        for (duckdb::idx_t i = 0; i < chunk->size(); i++) {
            Route r;
            r.id = chunk->GetValue(0, i).GetValue<int64_t>();
            r.driver_id = chunk->GetValue(1, i).GetValue<int64_t>();
            r.name = chunk->GetValue(2, i).ToString();
            r.color = chunk->GetValue(3, i).ToString();
            r.status = parse_route_status(chunk->GetValue(4, i).ToString());
            r.total_distance_km = chunk->GetValue(5, i).GetValue<double>();
            r.total_duration_min = chunk->GetValue(6, i).GetValue<double>();
            r.used_road_network = chunk->GetValue(7, i).GetValue<bool>();
            r.optimization_method = chunk->GetValue(8, i).ToString();
            r.small_route = chunk->GetValue(9, i).GetValue<bool>();
            r.version = static_cast<uint64_t>(chunk->GetValue(10, i).GetValue<int64_t>());
            r.completed_stops = chunk->GetValue(11, i).GetValue<int32_t>();
            slot[r.id] = out.size();
            out.push_back(std::move(r));
        }
    }
    if (out.empty()) return true;

    result = con_->Query(
        "SELECT route_id, seq, kind, ref_id, lat, lon FROM route_waypoints "
        "WHERE route_id IN (SELECT id FROM routes WHERE " + where + ") ORDER BY route_id, seq");
    if (result->HasError()) {
        std::cerr << "Error loading route_waypoints: " << result->GetError() << std::endl;
        return false;
    }
    while (auto chunk = result->Fetch()) {
        for (duckdb::idx_t i = 0; i < chunk->size(); i++) {
            auto it = slot.find(chunk->GetValue(0, i).GetValue<int64_t>());
            if (it == slot.end()) continue;
            Waypoint w;
            w.sequence = chunk->GetValue(1, i).GetValue<int32_t>();
            w.kind = parse_waypoint_kind(chunk->GetValue(2, i).ToString());
            w.ref_id = chunk->GetValue(3, i).GetValue<int64_t>();
            w.point = GeoPoint{chunk->GetValue(4, i).GetValue<double>(), chunk->GetValue(5, i).GetValue<double>()};
            out[it->second].waypoints.push_back(w);
        }
    }
    return true;
}

std::vector<Route> DuckDbPlanStore::active_routes() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Route> out;
    if (!con_) return out;
    try {
        if (!load_routes("status IN ('planned', 'in_transit')", out)) out.clear();
    } catch (const std::exception& e) {
        std::cerr << "DuckDB error: " << e.what() << std::endl;
        out.clear();
    }
    return out;
}

std::optional<Route> DuckDbPlanStore::find_route(int64_t route_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!con_) return std::nullopt;
    std::vector<Route> out;
    try {
        if (!load_routes("id = " + std::to_string(route_id), out) || out.empty()) return std::nullopt;
    } catch (const std::exception& e) {
        std::cerr << "DuckDB error: " << e.what() << std::endl;
        return std::nullopt;
    }
    return out.front();
}

bool DuckDbPlanStore::save_route(const Route& route, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!con_) {
        error = "store not open";
        return false;
    }
    try {
        auto begin = con_->Query("BEGIN TRANSACTION");
        if (begin->HasError()) {
            error = begin->GetError();
            return false;
        }

        auto fail = [&](const std::string& why) {
            error = why;
            auto rb = con_->Query("ROLLBACK");
            if (rb->HasError()) std::cerr << "DuckDB rollback failed: " << rb->GetError() << std::endl;
            return false;
        };

        auto stored = con_->Query("SELECT version FROM routes WHERE id = " + std::to_string(route.id));
        if (stored->HasError()) return fail(stored->GetError());
        if (auto chunk = stored->Fetch()) {
            if (chunk->size() > 0) {
                auto version = static_cast<uint64_t>(chunk->GetValue(0, 0).GetValue<int64_t>());
                if (version > route.version) {
                    return fail("route " + std::to_string(route.id) + " is stored at version " +
                                std::to_string(version) + ", refusing version " + std::to_string(route.version));
                }
            }
        }

        std::string why;
        if (!write_route(route, why)) return fail(why);

        auto update_order = con_->Prepare(
            "UPDATE orders SET status = CASE WHEN status = 'pending' THEN $1 ELSE status END, "
            "route_id = $2, route_sequence = $3 WHERE id = $4");
        if (update_order->HasError()) return fail(update_order->GetError());
        for (const auto& w : route.waypoints) {
            if (w.kind != WaypointKind::Delivery) continue;
            auto res = update_order->Execute(duckdb::Value(to_string(OrderStatus::Assigned)),
                                             duckdb::Value::BIGINT(route.id), duckdb::Value::INTEGER(w.sequence),
                                             duckdb::Value::BIGINT(w.ref_id));
            if (res->HasError()) return fail(res->GetError());
        }

        auto done = con_->Query("COMMIT");
        if (done->HasError()) return fail(done->GetError());
        next_route_id_ = std::max(next_route_id_, route.id + 1);
        return true;
    } catch (const std::exception& e) {
        error = std::string("DuckDB error: ") + e.what();
        auto rb = con_->Query("ROLLBACK");
        if (rb->HasError()) std::cerr << "DuckDB rollback failed: " << rb->GetError() << std::endl;
        return false;
    }
}

std::vector<Order> DuckDbPlanStore::find_orders(const std::vector<int64_t>& order_ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Order> out;
    if (!con_ || order_ids.empty()) return out;

    std::string ids;
    for (int64_t id : std::set<int64_t>(order_ids.begin(), order_ids.end())) {
        if (!ids.empty()) ids += ", ";
        ids += std::to_string(id);
    }

    try {
        auto result = con_->Query(
            "SELECT id, lat, lon, window_start, window_end, priority, parking_required, status, "
            "route_id, route_sequence FROM orders WHERE id IN (" + ids + ") ORDER BY id");
        if (result->HasError()) {
            std::cerr << "Error loading orders: " << result->GetError() << std::endl;
            return out;
        }
        while (auto chunk = result->Fetch()) {
            for (duckdb::idx_t i = 0; i < chunk->size(); i++) {
                Order o = order_from_row(*chunk, i);
                o.status = parse_order_status(chunk->GetValue(7, i).ToString());
                o.route_id = optional_int(chunk->GetValue(8, i));
                auto seq = optional_int(chunk->GetValue(9, i));
                if (seq) o.route_sequence = static_cast<int>(*seq);
                out.push_back(std::move(o));
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "DuckDB error: " << e.what() << std::endl;
        out.clear();
    }
    return out;
}

#endif  // FLEETPLAN_HAVE_DUCKDB

}  // namespace fleetplan
