/**
 * @file test_stop_sequencer.cpp
 * @brief Visiting order, cost guard and parking insertion.
 */

#include "stop_sequencer.hpp"
#include "geo_utils.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

using namespace fleetplan;
using fleetplan::test::FakeRoadNetwork;
using fleetplan::test::make_depot;

namespace {

DeliveryRequest delivery(int64_t id, double lat, double lon, bool parking = false) {
    DeliveryRequest d;
    d.order_id = id;
    d.point = GeoPoint{lat, lon};
    d.parking_required = parking;
    return d;
}

ParkingSpot spot(int64_t id, double lat, double lon) {
    ParkingSpot p;
    p.id = id;
    p.name = "P" + std::to_string(id);
    p.point = GeoPoint{lat, lon};
    return p;
}

SequencerOptions greedy_only() {
    SequencerOptions o;
    o.solver_enabled = false;
    return o;
}

std::vector<int64_t> delivery_ids(const SequencedRoute& r) {
    std::vector<int64_t> ids;
    for (const auto& w : r.waypoints) {
        if (w.kind == WaypointKind::Delivery) ids.push_back(w.ref_id);
    }
    return ids;
}

}  // namespace

TEST(StopSequencerTest, NeverWorseThanInputOrder) {
    DistanceProvider provider;
    std::vector<DeliveryRequest> ds = {delivery(1, 0.0, 1.0), delivery(2, 0.0, 2.0), delivery(3, 1.0, 0.0)};

    for (const SequencerOptions& options : {SequencerOptions{}, greedy_only()}) {
        SequencedRoute r = sequence_stops(make_depot(0.0, 0.0), {}, ds, provider, options);

        ASSERT_EQ(r.waypoints.size(), 4u);
        EXPECT_EQ(r.waypoints[0].kind, WaypointKind::Depot);
        EXPECT_LE(r.summary.sequenced_distance_km, r.summary.naive_distance_km + 1e-9);
        EXPECT_GE(r.summary.improvement_percent, 0.0);
        EXPECT_NEAR(r.summary.naive_distance_km, 471.0, 1.0);
        EXPECT_NEAR(r.summary.total_distance_km, r.summary.sequenced_distance_km, 1e-6);
    }
}

TEST(StopSequencerTest, GreedyPicksNearestFirst) {
    DistanceProvider provider;
    std::vector<DeliveryRequest> ds = {delivery(1, 0.0, 0.3), delivery(2, 0.0, 0.1), delivery(3, 0.0, 0.2)};

    SequencedRoute r = sequence_stops(make_depot(0.0, 0.0), {}, ds, provider, greedy_only());

    EXPECT_EQ(delivery_ids(r), (std::vector<int64_t>{2, 3, 1}));
    EXPECT_EQ(r.summary.optimization_method, kMethodFallback);
    EXPECT_TRUE(r.summary.warning.empty());
    EXPECT_GT(r.summary.improvement_percent, 0.0);
    for (size_t i = 0; i < r.waypoints.size(); ++i) {
        EXPECT_EQ(r.waypoints[i].sequence, static_cast<int>(i));
    }
}

TEST(StopSequencerTest, EqualDistanceFavorsPriority) {
    DistanceProvider provider;
    DeliveryRequest east = delivery(1, 0.0, 0.1);
    DeliveryRequest west = delivery(2, 0.0, -0.1);
    west.priority = Priority::Urgent;

    SequencedRoute r = sequence_stops(make_depot(0.0, 0.0), {}, {east, west}, provider, greedy_only());
    EXPECT_EQ(delivery_ids(r).front(), 2);
}

TEST(StopSequencerTest, ParkingReusedWithinWalkingDistance) {
    DistanceProvider provider;
    std::vector<DeliveryRequest> ds = {
        delivery(1, 0.0, 0.1, true),
        delivery(2, 0.0, 0.1005, true),
        delivery(3, 0.0, 0.5, true),
    };
    std::vector<ParkingSpot> parking = {spot(7, 0.0005, 0.1)};

    SequencedRoute r = sequence_stops(make_depot(0.0, 0.0), parking, ds, provider, greedy_only());

    ASSERT_EQ(r.waypoints.size(), 5u);
    EXPECT_EQ(r.waypoints[0].kind, WaypointKind::Depot);
    EXPECT_EQ(r.waypoints[1].kind, WaypointKind::Parking);
    EXPECT_EQ(r.waypoints[1].ref_id, 7);
    EXPECT_EQ(r.waypoints[2].ref_id, 1);
    EXPECT_EQ(r.waypoints[3].ref_id, 2);
    EXPECT_EQ(r.waypoints[4].ref_id, 3);
    EXPECT_EQ(r.summary.parking_stops, 1);
    EXPECT_EQ(r.summary.unparked_deliveries, 1);

    // The parking detour counts in the totals but not in the comparison.
    EXPECT_GT(r.summary.total_distance_km, r.summary.sequenced_distance_km);
}

TEST(StopSequencerTest, NearestSpotWinsAndTiesGoToLowerId) {
    DistanceProvider provider;
    std::vector<DeliveryRequest> ds = {delivery(1, 0.0, 0.1, true)};
    std::vector<ParkingSpot> parking = {spot(9, 0.001, 0.1), spot(4, -0.001, 0.1), spot(2, 0.002, 0.1)};

    SequencedRoute r = sequence_stops(make_depot(0.0, 0.0), parking, ds, provider, greedy_only());

    ASSERT_EQ(r.waypoints.size(), 3u);
    EXPECT_EQ(r.waypoints[1].kind, WaypointKind::Parking);
    EXPECT_EQ(r.waypoints[1].ref_id, 4);
}

TEST(StopSequencerTest, OrdersWithoutParkingNeedGetNone) {
    DistanceProvider provider;
    std::vector<DeliveryRequest> ds = {delivery(1, 0.0, 0.1), delivery(2, 0.0, 0.2)};
    std::vector<ParkingSpot> parking = {spot(1, 0.0, 0.1001)};

    SequencedRoute r = sequence_stops(make_depot(0.0, 0.0), parking, ds, provider, greedy_only());
    EXPECT_EQ(r.waypoints.size(), 3u);
    EXPECT_EQ(r.summary.parking_stops, 0);
    EXPECT_EQ(r.summary.unparked_deliveries, 0);
}

TEST(StopSequencerTest, Deterministic) {
    DistanceProvider provider;
    std::vector<DeliveryRequest> ds;
    for (int i = 0; i < 8; ++i) {
        ds.push_back(delivery(i + 1, 52.50 + 0.01 * ((i * 5) % 8), 13.40 + 0.01 * ((i * 3) % 8)));
    }

    SequencedRoute a = sequence_stops(make_depot(52.52, 13.40), {}, ds, provider, greedy_only());
    SequencedRoute b = sequence_stops(make_depot(52.52, 13.40), {}, ds, provider, greedy_only());

    EXPECT_EQ(delivery_ids(a), delivery_ids(b));
    EXPECT_DOUBLE_EQ(a.summary.total_distance_km, b.summary.total_distance_km);
}

TEST(StopSequencerTest, NoDeliveriesGivesDepotOnly) {
    DistanceProvider provider;
    SequencedRoute r = sequence_stops(make_depot(52.52, 13.40, 3), {}, {}, provider, greedy_only());

    ASSERT_EQ(r.waypoints.size(), 1u);
    EXPECT_EQ(r.waypoints[0].kind, WaypointKind::Depot);
    EXPECT_EQ(r.waypoints[0].ref_id, 3);
    EXPECT_DOUBLE_EQ(r.summary.total_distance_km, 0.0);
}

TEST(StopSequencerTest, RoadNetworkDownStillSequences) {
    auto road = std::make_shared<FakeRoadNetwork>();
    road->fail = true;
    DistanceProviderOptions po;
    po.service_retry_after_s = 0;
    DistanceProvider provider(road, po);

    std::vector<DeliveryRequest> ds = {delivery(1, 52.53, 13.41), delivery(2, 52.51, 13.39)};
    SequencedRoute r = sequence_stops(make_depot(52.52, 13.40), {}, ds, provider, greedy_only());

    EXPECT_FALSE(r.summary.used_road_network);
    EXPECT_EQ(delivery_ids(r).size(), 2u);
    EXPECT_GT(r.summary.total_distance_km, 0.0);
}

TEST(StopSequencerTest, RoadNetworkTotals) {
    auto road = std::make_shared<FakeRoadNetwork>();
    DistanceProvider provider(road);

    std::vector<DeliveryRequest> ds = {delivery(1, 52.53, 13.41), delivery(2, 52.54, 13.42)};
    SequencedRoute r = sequence_stops(make_depot(52.52, 13.40), {}, ds, provider, greedy_only());

    EXPECT_TRUE(r.summary.used_road_network);
    double expected = road->leg_km(GeoPoint{52.52, 13.40}, GeoPoint{52.53, 13.41}) +
                      road->leg_km(GeoPoint{52.53, 13.41}, GeoPoint{52.54, 13.42});
    EXPECT_NEAR(r.summary.total_distance_km, expected, 1e-6);
}

TEST(StopSequencerTest, CancelledTokenThrows) {
    DistanceProvider provider;
    CancellationToken token;
    token.cancel();
    SequencerOptions options = greedy_only();
    options.cancel = &token;

    EXPECT_THROW(sequence_stops(make_depot(0.0, 0.0), {}, {delivery(1, 0.0, 0.1)}, provider, options),
                 PlanCancelled);
}

TEST(StopSequencerTest, DisabledSolverSelectsGreedy) {
    EXPECT_TRUE(std::holds_alternative<GreedyFallback>(select_strategy(greedy_only())));
}

// ========== ORDERING RULES ==========

namespace {

DeliveryRequest windowed(int64_t id, double lat, double lon, std::optional<int64_t> start, std::optional<int64_t> end) {
    DeliveryRequest d = delivery(id, lat, lon);
    d.time_window = TimeWindow{start, end};
    return d;
}

// Depot plus two deliveries: input order 1,2 costs 2 km, 2,1 costs 10 km.
DistanceMatrixResult two_stop_matrix() {
    DistanceMatrixResult m;
    m.size = 3;
    m.distance_km = {0, 1, 5,
                     1, 0, 1,
                     5, 5, 0};
    m.duration_min = m.distance_km;
    return m;
}

}  // namespace

TEST(StopSequencerTest, WindowPrecedencesNeedAStrictGap) {
    std::vector<DeliveryRequest> ds = {
        windowed(1, 0, 0, std::nullopt, 100),
        windowed(2, 0, 0, 200, std::nullopt),
        delivery(3, 0, 0),
        windowed(4, 0, 0, 50, 300),
        windowed(5, 0, 0, 100, 400),
    };

    std::vector<Precedence> p = window_precedences(ds);

    ASSERT_EQ(p.size(), 1u);
    EXPECT_EQ(p[0], (Precedence{1, 2}));
}

TEST(StopSequencerTest, RespectsPrecedences) {
    std::vector<Precedence> p = {{1, 2}, {3, 2}};
    EXPECT_TRUE(respects_precedences({1, 3, 2}, p));
    EXPECT_TRUE(respects_precedences({3, 1, 2}, p));
    EXPECT_FALSE(respects_precedences({2, 1, 3}, p));
    EXPECT_FALSE(respects_precedences({1, 2, 3}, p));
    EXPECT_TRUE(respects_precedences({2, 1}, {}));
}

TEST(StopSequencerTest, CostGuardTakesCheaperInputOrder) {
    DistanceMatrixResult m = two_stop_matrix();

    std::vector<size_t> greedy = {2, 1};
    EXPECT_TRUE(apply_cost_guard(m, greedy, false, {{2, 1}}));
    EXPECT_EQ(greedy, (std::vector<size_t>{1, 2}));

    std::vector<size_t> solved = {2, 1};
    EXPECT_TRUE(apply_cost_guard(m, solved, true, {{1, 2}}));
    EXPECT_EQ(solved, (std::vector<size_t>{1, 2}));

    std::vector<size_t> cheaper = {1, 2};
    EXPECT_FALSE(apply_cost_guard(m, cheaper, false, {}));
}

TEST(StopSequencerTest, CostGuardKeepsSolverOrderThatHonorsWindows) {
    DistanceMatrixResult m = two_stop_matrix();

    // Input order would break 2-before-1.
    std::vector<size_t> solved = {2, 1};
    EXPECT_FALSE(apply_cost_guard(m, solved, true, {{2, 1}}));
    EXPECT_EQ(solved, (std::vector<size_t>{2, 1}));
}

#ifdef FLEETPLAN_HAVE_ORTOOLS

TEST(StopSequencerTest, SolverVisitsEarlyWindowFirst) {
    DistanceProvider provider;
    std::vector<DeliveryRequest> ds = {windowed(1, 0.0, 0.2, std::nullopt, 100),
                                       windowed(2, 0.0, 0.1, 200, std::nullopt)};
    SequencerOptions options;
    options.solver_time_limit_ms = 2000;

    SequencedRoute r = sequence_stops(make_depot(0.0, 0.0), {}, ds, provider, options);

    EXPECT_EQ(r.summary.optimization_method, kMethodSolver);
    EXPECT_EQ(delivery_ids(r), (std::vector<int64_t>{1, 2}));
    EXPECT_TRUE(r.summary.warning.empty());
}

TEST(StopSequencerTest, InfeasibleWindowsFallBackWithWarning) {
    DistanceProvider provider;
    // Each window closes before the other opens: the precedences form a cycle.
    std::vector<DeliveryRequest> ds = {windowed(1, 0.0, 0.2, 300, 100),
                                       windowed(2, 0.0, 0.1, 200, 50),
                                       delivery(3, 0.1, 0.1)};
    SequencerOptions options;
    options.solver_time_limit_ms = 1000;

    SequencedRoute r = sequence_stops(make_depot(0.0, 0.0), {}, ds, provider, options);

    EXPECT_EQ(r.summary.optimization_method, kMethodFallback);
    EXPECT_FALSE(r.summary.warning.empty());
    EXPECT_NE(r.summary.warning.find("nearest neighbor"), std::string::npos);
    EXPECT_EQ(delivery_ids(r).size(), 3u);
}

#endif  // FLEETPLAN_HAVE_ORTOOLS
