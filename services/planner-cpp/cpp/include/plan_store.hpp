/**
 * @file plan_store.hpp
 * @brief Persistence seam for planning: batch inputs in, whole plans out.
 *
 * A commit applies every route, order update and driver update of a plan,
 * or none of them.
 */

#pragma once

#include "geo_types.hpp"
#include "route_plan.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#ifdef FLEETPLAN_HAVE_DUCKDB
#include <duckdb.hpp>
#endif

namespace fleetplan {

class PlanStore {
public:
    virtual ~PlanStore() = default;

    /**
     * @brief Fill batch with the depot, planable orders, drivers and parking.
     * @return false if the inputs could not be read
     */
    virtual bool load_batch(PlanningBatch& batch) = 0;

    /**
     * @brief Hand out count fresh route ids. Ids are never reused, even when
     *        the plan they were reserved for is not committed.
     */
    virtual std::vector<int64_t> reserve_route_ids(size_t count) = 0;

    /**
     * @brief Apply the whole plan atomically.
     * @return false (and error set) if nothing was applied
     */
    virtual bool commit(const RoutePlan& plan, std::string& error) = 0;

    virtual std::vector<Route> active_routes() = 0;

    virtual std::optional<Route> find_route(int64_t route_id) = 0;

    /**
     * @brief Replace one route changed after its plan was committed. Every
     *        order the route delivers is marked assigned to it, with its
     *        waypoint sequence, in the same write.
     * @return false (and error set) if nothing was written, including when
     *         the stored route is at a newer version
     */
    virtual bool save_route(const Route& route, std::string& error) = 0;

    /**
     * @brief Orders by id, in id order. Unknown ids are skipped.
     */
    virtual std::vector<Order> find_orders(const std::vector<int64_t>& order_ids) = 0;
};

/**
 * @brief Store kept in process memory. Used by the server when no database
 *        is configured.
 */
class InMemoryPlanStore : public PlanStore {
public:
    // ========== SEEDING ==========

    void set_depot(const Depot& depot);
    void put_order(const Order& order);
    void put_driver(const Driver& driver);
    void put_parking(const ParkingSpot& spot);

    // ========== PlanStore ==========

    bool load_batch(PlanningBatch& batch) override;
    std::vector<int64_t> reserve_route_ids(size_t count) override;
    bool commit(const RoutePlan& plan, std::string& error) override;
    std::vector<Route> active_routes() override;
    std::optional<Route> find_route(int64_t route_id) override;
    bool save_route(const Route& route, std::string& error) override;
    std::vector<Order> find_orders(const std::vector<int64_t>& order_ids) override;

    std::optional<Order> find_order(int64_t order_id) const;
    std::optional<Driver> find_driver(int64_t driver_id) const;
    size_t route_count() const;
    size_t commit_count() const;

private:
    mutable std::mutex mutex_;
    std::optional<Depot> depot_;
    std::map<int64_t, Order> orders_;
    std::map<int64_t, Driver> drivers_;
    std::map<int64_t, ParkingSpot> parking_;
    std::map<int64_t, Route> routes_;
    int64_t next_route_id_ = 1;
    size_t commits_ = 0;
};

#ifdef FLEETPLAN_HAVE_DUCKDB

/**
 * @brief Store backed by a DuckDB file.
 *
 * Reads tables orders, drivers, depots and parking_locations; writes routes
 * and route_waypoints (created on open if missing) and updates orders and
 * drivers, all inside one transaction per commit.
 */
class DuckDbPlanStore : public PlanStore {
public:
    explicit DuckDbPlanStore(std::string db_path);

    bool open();

    bool load_batch(PlanningBatch& batch) override;
    std::vector<int64_t> reserve_route_ids(size_t count) override;
    bool commit(const RoutePlan& plan, std::string& error) override;
    std::vector<Route> active_routes() override;
    std::optional<Route> find_route(int64_t route_id) override;
    bool save_route(const Route& route, std::string& error) override;
    std::vector<Order> find_orders(const std::vector<int64_t>& order_ids) override;

private:
    bool load_routes(const std::string& where, std::vector<Route>& out);
    bool write_route(const Route& route, std::string& error);

    std::string db_path_;
    std::unique_ptr<duckdb::DuckDB> db_;
    std::unique_ptr<duckdb::Connection> con_;
    std::mutex mutex_;
    int64_t next_route_id_ = 1;
};

#endif  // FLEETPLAN_HAVE_DUCKDB

}  // namespace fleetplan
