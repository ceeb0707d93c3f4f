/**
 * @file test_route_planner.cpp
 * @brief End-to-end planning batches against the in-memory store.
 */

#include "drift_monitor.hpp"
#include "route_planner.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

using namespace fleetplan;
using fleetplan::test::make_depot;
using fleetplan::test::make_driver;
using fleetplan::test::make_order;
using fleetplan::test::make_unlocated_order;

namespace {

PlannerConfig test_config() {
    PlannerConfig c;
    c.road_network_enabled = false;
    c.solver_enabled = false;
    c.min_orders_per_route = 3;
    c.max_orders_per_route = 5;
    c.max_radius_km = 10.0;
    c.sequencing_threads = 2;
    return c;
}

// Seven orders in central Berlin, two without coordinates, two drivers.
void seed(InMemoryPlanStore& store) {
    store.set_depot(make_depot(52.5200, 13.4050));
    for (int i = 0; i < 7; ++i) {
        store.put_order(make_order(i + 1, 52.5100 + 0.002 * i, 13.3900 + 0.003 * (i % 3)));
    }
    store.put_order(make_unlocated_order(20));
    store.put_order(make_unlocated_order(21));
    store.put_driver(make_driver(1, "Michael Schneider", 0));
    store.put_driver(make_driver(2, "Anna Weber", 2));
}

PlanningBatch load(InMemoryPlanStore& store) {
    PlanningBatch batch;
    EXPECT_TRUE(store.load_batch(batch));
    batch.start_time = 1700000000;
    return batch;
}

// Simulates another writer grabbing an order between planning and commit.
class RacingStore : public InMemoryPlanStore {
public:
    int64_t steal_order_id = 0;

    bool commit(const RoutePlan& plan, std::string& error) override {
        if (auto o = find_order(steal_order_id)) {
            o->status = OrderStatus::Completed;
            put_order(*o);
        }
        return InMemoryPlanStore::commit(plan, error);
    }
};

}  // namespace

TEST(RoutePlannerTest, PlanAndCommitBatch) {
    InMemoryPlanStore store;
    seed(store);
    RoutePlanner planner(test_config(), nullptr);

    RoutePlan plan = planner.plan_and_commit(load(store), store);
    const PlanSummary& s = plan.summary;

    EXPECT_EQ(s.routes_created, 2);
    EXPECT_EQ(s.orders_scheduled, 7);
    EXPECT_EQ(s.orders_unscheduled, 2);
    EXPECT_EQ(s.unscheduled_order_ids, (std::vector<int64_t>{20, 21}));
    EXPECT_EQ(s.drivers_used, 2);
    EXPECT_EQ(s.small_routes, 0);
    EXPECT_FALSE(s.used_road_network);
    EXPECT_GT(s.total_distance_km, 0.0);
    EXPECT_GT(s.total_time_minutes, 0.0);

    ASSERT_EQ(plan.routes.size(), 2u);
    ASSERT_EQ(plan.itineraries.size(), 2u);
    EXPECT_EQ(store.route_count(), 2u);
    EXPECT_EQ(store.commit_count(), 1u);

    std::set<int64_t> route_ids;
    for (const auto& r : plan.routes) {
        route_ids.insert(r.id);
        EXPECT_EQ(r.version, 1u);
        EXPECT_EQ(r.status, RouteStatus::Planned);
        EXPECT_EQ(r.optimization_method, kMethodFallback);
        ASSERT_FALSE(r.waypoints.empty());
        EXPECT_EQ(r.waypoints.front().kind, WaypointKind::Depot);
        EXPECT_TRUE(store.find_route(r.id).has_value());
    }
    EXPECT_EQ(route_ids.size(), 2u);

    for (const auto& u : plan.order_updates) {
        auto o = store.find_order(u.order_id);
        ASSERT_TRUE(o.has_value());
        EXPECT_EQ(o->status, OrderStatus::Assigned);
        EXPECT_EQ(o->route_id.value_or(0), u.route_id);
        EXPECT_EQ(o->route_sequence.value_or(-1), u.sequence);
    }
    EXPECT_EQ(plan.order_updates.size(), 7u);

    EXPECT_EQ(store.find_driver(1)->status, DriverStatus::OnRoute);
    EXPECT_EQ(store.find_driver(2)->status, DriverStatus::OnRoute);
    EXPECT_EQ(store.find_order(20)->status, OrderStatus::Pending);
}

TEST(RoutePlannerTest, EveryOrderAccountedForOnce) {
    InMemoryPlanStore store;
    seed(store);
    store.put_driver(make_driver(1, "Only Driver", 0));
    RoutePlanner planner(test_config(), nullptr);

    PlanningBatch batch = load(store);
    batch.drivers = {make_driver(1, "Only Driver", 0)};
    RoutePlan plan = planner.plan(batch);

    std::multiset<int64_t> seen(plan.summary.unscheduled_order_ids.begin(),
                                plan.summary.unscheduled_order_ids.end());
    for (const auto& r : plan.routes) {
        for (const auto& w : r.waypoints) {
            if (w.kind == WaypointKind::Delivery) seen.insert(w.ref_id);
        }
    }
    EXPECT_EQ(seen.size(), 9u);
    for (int64_t id : seen) EXPECT_EQ(seen.count(id), 1u);

    EXPECT_EQ(plan.summary.routes_created, 1);
    EXPECT_EQ(plan.summary.orders_scheduled + plan.summary.orders_unscheduled, 9);
    bool warned = std::any_of(plan.summary.warnings.begin(), plan.summary.warnings.end(),
                              [](const std::string& w) { return w.find("without an available driver") != std::string::npos; });
    EXPECT_TRUE(warned);
}

TEST(RoutePlannerTest, SecondBatchFindsNothingNew) {
    InMemoryPlanStore store;
    seed(store);
    RoutePlanner planner(test_config(), nullptr);

    RoutePlan first = planner.plan_and_commit(load(store), store);
    RoutePlan second = planner.plan_and_commit(load(store), store);

    EXPECT_EQ(second.summary.routes_created, 0);
    EXPECT_EQ(second.summary.orders_scheduled, 0);
    EXPECT_EQ(second.summary.unscheduled_order_ids, (std::vector<int64_t>{20, 21}));
    EXPECT_EQ(store.route_count(), first.routes.size());
}

TEST(RoutePlannerTest, RejectedCommitLeavesStoreUntouched) {
    RacingStore store;
    seed(store);
    store.steal_order_id = 4;
    RoutePlanner planner(test_config(), nullptr);

    EXPECT_THROW(planner.plan_and_commit(load(store), store), PlanningError);

    EXPECT_EQ(store.route_count(), 0u);
    EXPECT_EQ(store.commit_count(), 0u);
    for (int64_t id : {1, 2, 3, 5, 6, 7}) {
        EXPECT_EQ(store.find_order(id)->status, OrderStatus::Pending) << "order " << id;
        EXPECT_FALSE(store.find_order(id)->route_id.has_value());
    }
    EXPECT_EQ(store.find_driver(1)->status, DriverStatus::Available);
    EXPECT_EQ(store.find_driver(2)->current_load, 2);
}

TEST(RoutePlannerTest, CancelledBatchCommitsNothing) {
    InMemoryPlanStore store;
    seed(store);
    RoutePlanner planner(test_config(), nullptr);
    CancellationToken token;
    token.cancel();

    EXPECT_THROW(planner.plan_and_commit(load(store), store, &token), PlanCancelled);
    EXPECT_EQ(store.commit_count(), 0u);
    EXPECT_EQ(store.route_count(), 0u);
    EXPECT_EQ(store.find_order(1)->status, OrderStatus::Pending);
}

TEST(RoutePlannerTest, RouteIdsAreNotReused) {
    InMemoryPlanStore store;
    seed(store);
    RoutePlanner planner(test_config(), nullptr);

    RoutePlan staged = planner.plan(load(store), nullptr, &store);
    std::vector<int64_t> later = store.reserve_route_ids(1);

    ASSERT_EQ(later.size(), 1u);
    for (const auto& r : staged.routes) EXPECT_LT(r.id, later[0]);
}

TEST(RoutePlannerTest, ProvisionalIdsWithoutStore) {
    InMemoryPlanStore store;
    seed(store);
    RoutePlanner planner(test_config(), nullptr);

    RoutePlan plan = planner.plan(load(store));
    ASSERT_EQ(plan.routes.size(), 2u);
    EXPECT_EQ(plan.routes[0].id, 1);
    EXPECT_EQ(plan.routes[1].id, 2);
    EXPECT_EQ(store.route_count(), 0u);
}

TEST(RoutePlannerTest, OnlyPendingUnroutedOrdersArePlanned) {
    RoutePlanner planner(test_config(), nullptr);
    PlanningBatch batch;
    batch.depot = make_depot(52.52, 13.405);
    batch.drivers = {make_driver(1, "A B")};
    for (int i = 0; i < 3; ++i) batch.orders.push_back(make_order(i + 1, 52.51 + 0.001 * i, 13.40));
    Order done = make_order(10, 52.512, 13.401);
    done.status = OrderStatus::Completed;
    Order routed = make_order(11, 52.513, 13.402);
    routed.route_id = 99;
    batch.orders.push_back(done);
    batch.orders.push_back(routed);

    RoutePlan plan = planner.plan(batch);
    EXPECT_EQ(plan.summary.orders_scheduled, 3);
    EXPECT_EQ(plan.summary.orders_unscheduled, 0);
}

TEST(RoutePlannerTest, EmptyBatch) {
    RoutePlanner planner(test_config(), nullptr);
    PlanningBatch batch;
    batch.depot = make_depot(52.52, 13.405);

    RoutePlan plan = planner.plan(batch);
    EXPECT_TRUE(plan.routes.empty());
    EXPECT_EQ(plan.summary.routes_created, 0);
    EXPECT_FALSE(plan.summary.used_road_network);
}

TEST(RoutePlannerTest, MergeOrdersSkipsKnownIds) {
    PlanningBatch batch;
    batch.orders = {make_order(1, 0, 0), make_order(2, 0, 0)};
    merge_orders(batch, {make_order(2, 1, 1), make_order(3, 1, 1)});

    ASSERT_EQ(batch.orders.size(), 3u);
    EXPECT_EQ(batch.orders[1].point->lat, 0.0);
    EXPECT_EQ(batch.orders[2].id, 3);
}

TEST(PlanStoreTest, AcceptedInsertionAssignsTheOrder) {
    InMemoryPlanStore store;
    seed(store);
    RoutePlanner planner(test_config(), nullptr);
    RoutePlan plan = planner.plan_and_commit(load(store), store);
    ASSERT_FALSE(plan.routes.empty());

    DistanceProvider provider;
    ActiveRouteRegistry registry(&provider);
    registry.set_writer([&store](const Route& route, std::string& error) { return store.save_route(route, error); });
    for (const auto& r : plan.routes) registry.upsert(r);

    Order late = make_order(30, 52.515, 13.395);
    store.put_order(late);
    const Route& target = plan.routes[0];
    InsertionCandidate c;
    c.route_id = target.id;
    c.route_version = target.version;
    c.insertion_index = 1;
    ASSERT_TRUE(registry.accept_insertion(c, late).ok());

    auto stored = store.find_order(30);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, OrderStatus::Assigned);
    EXPECT_EQ(stored->route_id.value_or(0), target.id);
    EXPECT_EQ(stored->route_sequence.value_or(-1), 1);

    // Later stops moved down by one.
    auto route = store.find_route(target.id);
    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(route->version, 2u);
    for (const auto& w : route->waypoints) {
        if (w.kind != WaypointKind::Delivery) continue;
        EXPECT_EQ(store.find_order(w.ref_id)->route_sequence.value_or(-1), w.sequence) << "order " << w.ref_id;
    }

    PlanningBatch next = load(store);
    for (const auto& o : next.orders) EXPECT_NE(o.id, 30);
}

TEST(PlanStoreTest, OlderRouteVersionIsRefused) {
    InMemoryPlanStore store;
    Route r;
    r.id = 5;
    r.version = 3;
    std::string error;
    ASSERT_TRUE(store.save_route(r, error));

    r.version = 2;
    EXPECT_FALSE(store.save_route(r, error));
    EXPECT_NE(error.find("version 3"), std::string::npos);
    EXPECT_EQ(store.find_route(5)->version, 3u);

    r.version = 3;
    EXPECT_TRUE(store.save_route(r, error));
}

TEST(PlanStoreTest, FindOrdersSkipsUnknownIds) {
    InMemoryPlanStore store;
    seed(store);

    std::vector<Order> found = store.find_orders({3, 99, 1, 3});
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].id, 1);
    EXPECT_EQ(found[1].id, 3);
}

#ifdef FLEETPLAN_HAVE_ORTOOLS

TEST(RoutePlannerTest, SolverFallbackWarningReachesSummary) {
    PlannerConfig config = test_config();
    config.solver_enabled = true;
    config.solver_time_limit_ms = 1000;
    RoutePlanner planner(config, nullptr);

    PlanningBatch batch;
    batch.depot = make_depot(52.52, 13.405);
    batch.drivers = {make_driver(1, "A B")};
    Order a = make_order(1, 52.51, 13.40);
    a.time_window = TimeWindow{300, 100};
    Order b = make_order(2, 52.512, 13.401);
    b.time_window = TimeWindow{200, 50};
    batch.orders = {a, b, make_order(3, 52.513, 13.402)};

    RoutePlan plan = planner.plan(batch);

    ASSERT_EQ(plan.routes.size(), 1u);
    EXPECT_EQ(plan.routes[0].optimization_method, kMethodFallback);
    bool warned = std::any_of(plan.summary.warnings.begin(), plan.summary.warnings.end(),
                              [](const std::string& w) { return w.find("nearest neighbor") != std::string::npos; });
    EXPECT_TRUE(warned);
}

#endif  // FLEETPLAN_HAVE_ORTOOLS
