/**
 * @file test_geo_clusterer.cpp
 * @brief Partition, split, merge and determinism of order clustering.
 */

#include "geo_clusterer.hpp"
#include "geo_utils.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <memory>
#include <random>

using namespace fleetplan;
using fleetplan::test::FakeRoadNetwork;
using fleetplan::test::make_order;
using fleetplan::test::make_unlocated_order;

namespace {

ClusteringOptions options(double radius, int min_size, int max_size) {
    ClusteringOptions o;
    o.max_radius_km = radius;
    o.min_size = min_size;
    o.max_size = max_size;
    return o;
}

// n orders around (lat, lon), spread over a few hundred meters.
void add_blob(std::vector<Order>& orders, int64_t first_id, int n, double lat, double lon) {
    for (int i = 0; i < n; ++i) {
        orders.push_back(make_order(first_id + i, lat + 0.001 * i, lon + 0.0015 * (i % 3)));
    }
}

std::vector<GeoPoint> points_for(const Cluster& c, const std::vector<Order>& orders) {
    std::vector<GeoPoint> pts;
    for (int64_t id : c.order_ids) {
        for (const auto& o : orders) {
            if (o.id == id) pts.push_back(*o.point);
        }
    }
    return pts;
}

}  // namespace

TEST(GeoClustererTest, SevenCloseOrdersMakeTwoClusters) {
    std::vector<Order> orders;
    add_blob(orders, 1, 7, 52.5200, 13.4000);

    ClusteringResult r = cluster_orders(orders, options(10.0, 3, 5));

    ASSERT_EQ(r.clusters.size(), 2u);
    size_t total = 0;
    for (const auto& c : r.clusters) {
        EXPECT_LE(c.size(), 5u);
        EXPECT_GE(c.size(), 3u);
        EXPECT_FALSE(c.small_route);
        total += c.size();
    }
    EXPECT_EQ(total, 7u);
    EXPECT_TRUE(r.unscheduled_order_ids.empty());
}

TEST(GeoClustererTest, OutputIsAPartition) {
    std::vector<Order> orders;
    add_blob(orders, 1, 6, 52.52, 13.40);
    add_blob(orders, 20, 4, 48.14, 11.58);
    add_blob(orders, 40, 9, 53.55, 9.99);
    orders.push_back(make_unlocated_order(99));
    orders.push_back(make_unlocated_order(50));

    ClusteringResult r = cluster_orders(orders, options(5.0, 3, 5));

    std::map<int64_t, int> seen;
    for (const auto& c : r.clusters) {
        EXPECT_TRUE(std::is_sorted(c.order_ids.begin(), c.order_ids.end()));
        for (int64_t id : c.order_ids) seen[id]++;
    }
    for (int64_t id : r.unscheduled_order_ids) seen[id]++;

    EXPECT_EQ(seen.size(), orders.size());
    for (const auto& [id, count] : seen) {
        EXPECT_EQ(count, 1) << "order " << id;
    }
    EXPECT_EQ(r.unscheduled_order_ids, (std::vector<int64_t>{50, 99}));
}

TEST(GeoClustererTest, ClustersOrderedByFirstId) {
    std::vector<Order> orders;
    add_blob(orders, 30, 3, 48.14, 11.58);
    add_blob(orders, 1, 3, 52.52, 13.40);

    ClusteringResult r = cluster_orders(orders, options(5.0, 3, 10));
    ASSERT_EQ(r.clusters.size(), 2u);
    EXPECT_EQ(r.clusters[0].order_ids.front(), 1);
    EXPECT_EQ(r.clusters[1].order_ids.front(), 30);
}

TEST(GeoClustererTest, SmallRouteWhenNoClusterHasRoom) {
    std::vector<Order> orders;
    add_blob(orders, 1, 5, 52.52, 13.40);
    orders.push_back(make_order(10, 48.14, 11.58));

    ClusteringResult r = cluster_orders(orders, options(5.0, 3, 5));

    ASSERT_EQ(r.clusters.size(), 2u);
    EXPECT_FALSE(r.clusters[0].small_route);
    EXPECT_EQ(r.clusters[1].order_ids, (std::vector<int64_t>{10}));
    EXPECT_TRUE(r.clusters[1].small_route);
}

TEST(GeoClustererTest, MergeBeyondRadiusIsFlagged) {
    std::vector<Order> orders;
    add_blob(orders, 1, 4, 52.52, 13.40);
    orders.push_back(make_order(10, 52.70, 13.40));  // ~20 km north

    ClusteringResult r = cluster_orders(orders, options(5.0, 3, 5));

    ASSERT_EQ(r.clusters.size(), 1u);
    EXPECT_EQ(r.clusters[0].size(), 5u);
    EXPECT_FALSE(r.clusters[0].small_route);
    EXPECT_TRUE(r.clusters[0].radius_relaxed);
}

TEST(GeoClustererTest, ChainsAreSplitToRadius) {
    // Each hop ~0.8 km, so density grouping links all of them.
    std::vector<Order> orders;
    for (int i = 0; i < 8; ++i) orders.push_back(make_order(i + 1, 52.50 + 0.0072 * i, 13.40));

    ClusteringResult r = cluster_orders(orders, options(1.0, 1, 40));

    ASSERT_GT(r.clusters.size(), 1u);
    for (const auto& c : r.clusters) {
        EXPECT_FALSE(c.radius_relaxed);
        EXPECT_LE(geo_utils::diameter_km(points_for(c, orders)), 1.0);
    }
}

TEST(GeoClustererTest, DeterministicForShuffledInput) {
    std::vector<Order> orders;
    add_blob(orders, 1, 7, 52.52, 13.40);
    add_blob(orders, 10, 2, 52.60, 13.50);
    add_blob(orders, 20, 12, 48.14, 11.58);

    ClusteringResult first = cluster_orders(orders, options(5.0, 3, 5));

    std::mt19937 rng(7);
    std::shuffle(orders.begin(), orders.end(), rng);
    ClusteringResult second = cluster_orders(orders, options(5.0, 3, 5));

    ASSERT_EQ(first.clusters.size(), second.clusters.size());
    for (size_t i = 0; i < first.clusters.size(); ++i) {
        EXPECT_EQ(first.clusters[i].order_ids, second.clusters[i].order_ids);
        EXPECT_EQ(first.clusters[i].small_route, second.clusters[i].small_route);
    }
}

TEST(GeoClustererTest, H3IndexAgreesWithRTree) {
    std::vector<Order> orders;
    add_blob(orders, 1, 7, 52.52, 13.40);
    add_blob(orders, 20, 4, 52.58, 13.46);

    ClusteringOptions rtree = options(3.0, 2, 6);
    ClusteringOptions h3 = rtree;
    h3.index_type = SpatialIndexType::H3;

    ClusteringResult a = cluster_orders(orders, rtree);
    ClusteringResult b = cluster_orders(orders, h3);

    ASSERT_EQ(a.clusters.size(), b.clusters.size());
    for (size_t i = 0; i < a.clusters.size(); ++i) {
        EXPECT_EQ(a.clusters[i].order_ids, b.clusters[i].order_ids);
    }
}

TEST(GeoClustererTest, DuplicateIdsCountOnce) {
    std::vector<Order> orders;
    add_blob(orders, 1, 3, 52.52, 13.40);
    orders.push_back(orders.front());

    ClusteringResult r = cluster_orders(orders, options(5.0, 1, 10));
    ASSERT_EQ(r.clusters.size(), 1u);
    EXPECT_EQ(r.clusters[0].size(), 3u);
}

TEST(GeoClustererTest, EmptyInput) {
    ClusteringResult r = cluster_orders({}, options(5.0, 3, 5));
    EXPECT_TRUE(r.clusters.empty());
    EXPECT_TRUE(r.unscheduled_order_ids.empty());
}

TEST(GeoClustererTest, RoadDistanceSplitsWhatGreatCircleJoins) {
    // About 8 km apart in a straight line, 12 km by road.
    std::vector<Order> orders = {make_order(1, 52.50, 13.40), make_order(2, 52.572, 13.40)};
    ClusteringOptions opts = options(10.0, 1, 40);

    auto road = std::make_shared<FakeRoadNetwork>();
    road->detour_factor = 1.5;
    DistanceProvider provider(road);

    EXPECT_EQ(cluster_orders(orders, opts).clusters.size(), 1u);

    ClusteringResult by_road = cluster_orders(orders, opts, &provider);
    ASSERT_EQ(by_road.clusters.size(), 2u);
    EXPECT_EQ(by_road.clusters[0].order_ids, (std::vector<int64_t>{1}));
    EXPECT_GE(road->table_calls.load(), 1);

    opts.road_distance = false;
    EXPECT_EQ(cluster_orders(orders, opts, &provider).clusters.size(), 1u);
}

TEST(GeoClustererTest, RoadNetworkDownGroupsOnGreatCircle) {
    std::vector<Order> orders = {make_order(1, 52.50, 13.40), make_order(2, 52.572, 13.40)};

    auto road = std::make_shared<FakeRoadNetwork>();
    road->detour_factor = 1.5;
    road->fail = true;
    DistanceProvider provider(road);

    EXPECT_EQ(cluster_orders(orders, options(10.0, 1, 40), &provider).clusters.size(), 1u);
}
