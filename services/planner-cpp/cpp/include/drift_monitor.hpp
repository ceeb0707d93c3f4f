/**
 * @file drift_monitor.hpp
 * @brief Insertion suggestions for orders that arrive after dispatch, and
 *        the registry through which active routes are mutated.
 */

#pragma once

#include "distance_provider.hpp"
#include "geo_types.hpp"
#include "stop_sequencer.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fleetplan {

/**
 * @brief Insert the order at waypoint position insertion_index of route_id,
 *        i.e. between waypoints insertion_index - 1 and insertion_index.
 */
struct InsertionCandidate {
    int64_t route_id = 0;
    size_t insertion_index = 0;
    double added_distance_km = 0.0;
    // Route version the candidate was computed against.
    uint64_t route_version = 0;
};

/**
 * @brief Rank insertion points for new_order across the given routes.
 *
 * Inactive routes and routes without a pair of waypoints past their
 * progress are skipped. Candidates above max_detour_km are dropped; the
 * rest are sorted by added distance, route id, index. Never mutates a route.
 */
std::vector<InsertionCandidate> find_insertion_candidates(const Order& new_order,
                                                          const std::vector<Route>& active_routes,
                                                          double max_detour_km,
                                                          DistanceProvider& provider);

enum class InsertionStatus {
    Accepted,
    UnknownRoute,
    StaleVersion,
    RouteClosed,
    InvalidIndex,
    Unroutable,
    AlreadyScheduled,
    InvalidUpdate,
    NotPersisted
};

const char* to_string(InsertionStatus s);

/**
 * @brief Outcome of any registry mutation, not only insertions.
 */
struct InsertionResult {
    InsertionStatus status = InsertionStatus::UnknownRoute;
    std::string error;
    // Snapshot after the change when accepted.
    std::optional<Route> route;

    bool ok() const { return status == InsertionStatus::Accepted; }
};

/**
 * @brief Persists a changed route. Runs while the route is locked and before
 *        the change is visible; returning false discards the change.
 */
using RouteWriter = std::function<bool(const Route& route, std::string& error)>;

/**
 * @brief Re-sequence the stops of route that are not served yet.
 *
 * The served prefix (at least the depot) is kept and its last stop is the
 * start point. Window, priority and parking needs come from orders when the
 * order is listed there. Existing parking stops in the tail are dropped and
 * placed again. The result carries the input version.
 */
Route resequence_remaining(const Route& route,
                           const std::vector<Order>& orders,
                           const std::vector<ParkingSpot>& parking,
                           DistanceProvider& provider,
                           const SequencerOptions& options);

/**
 * @brief Holds the live routes. Readers get copies; each route has a single
 *        writer at a time.
 *
 * Also tracks which route each scheduled order is on, so an order sits on
 * at most one active route. Routes leave the registry when completed.
 */
class ActiveRouteRegistry {
public:
    /**
     * @param provider used to update route totals on insertion; may be null
     */
    explicit ActiveRouteRegistry(DistanceProvider* provider = nullptr);

    /**
     * @brief Install the writer every later mutation goes through.
     */
    void set_writer(RouteWriter writer);

    /**
     * @brief Track route as given. A route that is no longer active is
     *        dropped instead.
     */
    void upsert(const Route& route);
    bool remove(int64_t route_id);

    std::optional<Route> snapshot(int64_t route_id) const;

    /**
     * @brief Copies of all active routes, ordered by route id.
     */
    std::vector<Route> snapshots() const;

    /**
     * @brief Apply a suggestion. Fails with StaleVersion when the route was
     *        changed after the candidate was computed.
     */
    InsertionResult accept_insertion(const InsertionCandidate& candidate, const Order& order);

    /**
     * @brief Record driver progress. Reaching Completed drops the route and
     *        frees its orders in the index.
     */
    InsertionResult update_progress(int64_t route_id, RouteStatus status, int completed_stops);

    /**
     * @brief Swap in a re-sequenced copy of a route (see
     *        resequence_remaining). Rejected as stale when the route moved
     *        on since expected_version, or when the set of orders differs.
     */
    InsertionResult apply_resequence(const Route& resequenced, uint64_t expected_version);

    /**
     * @brief Active route the order is scheduled on, if any.
     */
    std::optional<int64_t> route_of(int64_t order_id) const;

    /**
     * @brief Driver declined: the order goes back to the unscheduled pool.
     */
    void reject_insertion(const Order& order);

    /**
     * @brief Drain the pool for the next planning pass.
     */
    std::vector<Order> take_unscheduled();

    size_t pool_size() const;
    size_t size() const;

private:
    struct Entry {
        std::mutex mutex;
        Route route;
    };

    std::shared_ptr<Entry> find(int64_t route_id) const;
    bool write(const Route& route, std::string& error);

    // Callers hold routes_mutex_.
    void index_route(const Route& route);
    void unindex_route(int64_t route_id);

    void release_claim(int64_t order_id, int64_t route_id);

    DistanceProvider* provider_;

    std::mutex writer_mutex_;
    RouteWriter writer_;

    // Lock order: an entry mutex may be held while taking routes_mutex_,
    // never the reverse.
    mutable std::mutex routes_mutex_;
    std::map<int64_t, std::shared_ptr<Entry>> routes_;
    std::map<int64_t, int64_t> order_routes_;

    mutable std::mutex pool_mutex_;
    std::vector<Order> pool_;
};

}  // namespace fleetplan
