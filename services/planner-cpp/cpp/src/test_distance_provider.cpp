/**
 * @file test_distance_provider.cpp
 * @brief Road-network preference, fallback and back-off.
 */

#include "distance_provider.hpp"
#include "geo_utils.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

using namespace fleetplan;
using fleetplan::test::FakeRoadNetwork;

namespace {

const GeoPoint kA{52.5200, 13.4050};
const GeoPoint kB{52.5300, 13.4200};
const GeoPoint kC{52.5100, 13.3900};

DistanceProviderOptions no_backoff() {
    DistanceProviderOptions o;
    o.service_retry_after_s = 0;
    return o;
}

}  // namespace

TEST(DistanceProviderTest, GeometricWithoutBackend) {
    DistanceProvider provider;
    EXPECT_FALSE(provider.has_backend());

    DistanceResult r = provider.pairwise_distance(kA, kB);
    EXPECT_EQ(r.provenance, Provenance::FallbackGeometric);
    EXPECT_DOUBLE_EQ(r.distance_km, geo_utils::haversine_km(kA, kB));
    EXPECT_DOUBLE_EQ(r.duration_min, r.distance_km / 50.0 * 60.0 * 1.3);
}

TEST(DistanceProviderTest, RoadNetworkPreferred) {
    auto road = std::make_shared<FakeRoadNetwork>();
    DistanceProvider provider(road);

    DistanceResult r = provider.pairwise_distance(kA, kB);
    EXPECT_EQ(r.provenance, Provenance::RoadNetwork);
    EXPECT_NEAR(r.distance_km, road->leg_km(kA, kB), 1e-9);
    EXPECT_EQ(road->route_calls.load(), 1);
}

TEST(DistanceProviderTest, FailureFallsBackDeterministically) {
    auto road = std::make_shared<FakeRoadNetwork>();
    road->fail = true;
    DistanceProvider provider(road, no_backoff());

    DistanceResult first = provider.pairwise_distance(kA, kB);
    DistanceResult second = provider.pairwise_distance(kA, kB);
    DistanceResult direct = provider.geometric_distance(kA, kB);

    EXPECT_EQ(first.provenance, Provenance::FallbackGeometric);
    EXPECT_DOUBLE_EQ(first.distance_km, second.distance_km);
    EXPECT_DOUBLE_EQ(first.duration_min, second.duration_min);
    EXPECT_DOUBLE_EQ(first.distance_km, direct.distance_km);
}

TEST(DistanceProviderTest, MatrixUsesOneTableCall) {
    auto road = std::make_shared<FakeRoadNetwork>();
    DistanceProvider provider(road);

    DistanceMatrixResult m = provider.matrix({kA, kB, kC});
    ASSERT_EQ(m.size, 3u);
    EXPECT_TRUE(m.used_road_network);
    EXPECT_EQ(road->table_calls.load(), 1);
    EXPECT_EQ(road->route_calls.load(), 0);
    EXPECT_NEAR(m.distance(0, 2), road->leg_km(kA, kC), 1e-9);
    EXPECT_DOUBLE_EQ(m.distance(1, 1), 0.0);
}

TEST(DistanceProviderTest, MatrixAssembledFromPairsWithoutTable) {
    auto road = std::make_shared<FakeRoadNetwork>();
    road->table_supported = false;
    DistanceProvider provider(road);

    DistanceMatrixResult m = provider.matrix({kA, kB, kC});
    EXPECT_TRUE(m.used_road_network);
    EXPECT_EQ(road->table_calls.load(), 0);
    EXPECT_EQ(road->route_calls.load(), 6);
    EXPECT_NEAR(m.distance(2, 1), road->leg_km(kC, kB), 1e-9);
}

TEST(DistanceProviderTest, FailedMatrixIsGeometricEverywhere) {
    auto road = std::make_shared<FakeRoadNetwork>();
    road->fail = true;
    DistanceProvider provider(road, no_backoff());

    DistanceMatrixResult m = provider.matrix({kA, kB, kC});
    EXPECT_FALSE(m.used_road_network);
    EXPECT_DOUBLE_EQ(m.distance(0, 1), geo_utils::haversine_km(kA, kB));
    EXPECT_DOUBLE_EQ(m.distance(2, 0), geo_utils::haversine_km(kC, kA));
}

TEST(DistanceProviderTest, BackendSkippedDuringBackoff) {
    auto road = std::make_shared<FakeRoadNetwork>();
    road->fail = true;
    DistanceProviderOptions options;
    options.service_retry_after_s = 600;
    DistanceProvider provider(road, options);

    provider.pairwise_distance(kA, kB);
    EXPECT_EQ(road->route_calls.load(), 1);

    road->fail = false;
    DistanceResult r = provider.pairwise_distance(kA, kB);
    EXPECT_EQ(r.provenance, Provenance::FallbackGeometric);
    EXPECT_EQ(road->route_calls.load(), 1);
}

TEST(DistanceProviderTest, RecoversWithoutBackoff) {
    auto road = std::make_shared<FakeRoadNetwork>();
    road->fail = true;
    DistanceProvider provider(road, no_backoff());

    EXPECT_EQ(provider.pairwise_distance(kA, kB).provenance, Provenance::FallbackGeometric);
    road->fail = false;
    EXPECT_EQ(provider.pairwise_distance(kA, kB).provenance, Provenance::RoadNetwork);
}

TEST(DistanceProviderTest, GeometryFromRoadOrEmpty) {
    auto road = std::make_shared<FakeRoadNetwork>();
    DistanceProvider provider(road, no_backoff());

    GeometryResult g = provider.route_geometry({kA, kB, kC});
    EXPECT_TRUE(g.has_geometry());
    EXPECT_EQ(g.provenance, Provenance::RoadNetwork);

    road->fail = true;
    GeometryResult f = provider.route_geometry({kA, kB, kC});
    EXPECT_FALSE(f.has_geometry());
    EXPECT_EQ(f.provenance, Provenance::FallbackGeometric);
    EXPECT_NEAR(f.distance_km, geo_utils::haversine_km(kA, kB) + geo_utils::haversine_km(kB, kC), 1e-9);
}

TEST(DistanceProviderTest, ProvenanceNames) {
    EXPECT_STREQ(to_string(Provenance::RoadNetwork), "road_network");
    EXPECT_STREQ(to_string(Provenance::FallbackGeometric), "fallback_geometric");
}
