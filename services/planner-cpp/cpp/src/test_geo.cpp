/**
 * @file test_geo.cpp
 * @brief Great-circle helpers and the point index.
 */

#include "geo_utils.hpp"
#include "spatial_index.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace fleetplan;

TEST(GeoUtilsTest, HaversineOfSamePointIsZero) {
    EXPECT_DOUBLE_EQ(geo_utils::haversine_km(52.52, 13.40, 52.52, 13.40), 0.0);
}

TEST(GeoUtilsTest, OneDegreeAtEquator) {
    EXPECT_NEAR(geo_utils::haversine_km(0.0, 0.0, 0.0, 1.0), 111.195, 0.01);
    EXPECT_NEAR(geo_utils::haversine_km(GeoPoint{0.0, 0.0}, GeoPoint{1.0, 0.0}), 111.195, 0.01);
}

TEST(GeoUtilsTest, TravelEstimateUsesSpeedAndBuffer) {
    EXPECT_DOUBLE_EQ(geo_utils::estimate_travel_minutes(50.0, 50.0, 1.3), 78.0);
    EXPECT_DOUBLE_EQ(geo_utils::estimate_travel_minutes(0.0, 50.0, 1.3), 0.0);
}

TEST(GeoUtilsTest, CentroidAndDiameter) {
    GeoPoint c = geo_utils::centroid({{0.0, 0.0}, {2.0, 2.0}});
    EXPECT_DOUBLE_EQ(c.lat, 1.0);
    EXPECT_DOUBLE_EQ(c.lon, 1.0);

    GeoPoint empty = geo_utils::centroid({});
    EXPECT_DOUBLE_EQ(empty.lat, 0.0);
    EXPECT_DOUBLE_EQ(empty.lon, 0.0);

    double d = geo_utils::diameter_km({{0.0, 0.0}, {0.0, 0.5}, {0.0, 1.0}});
    EXPECT_NEAR(d, geo_utils::haversine_km(0.0, 0.0, 0.0, 1.0), 1e-9);
}

TEST(GeoUtilsTest, H3CellsAndDisks) {
    uint64_t cell = geo_utils::latlng_to_cell(52.52, 13.40, 8);
    EXPECT_NE(cell, 0u);

    auto disk = geo_utils::grid_disk(cell, 1);
    EXPECT_EQ(disk.size(), 7u);
    EXPECT_NE(std::find(disk.begin(), disk.end(), cell), disk.end());

    EXPECT_GT(geo_utils::edge_length_km(7), geo_utils::edge_length_km(8));
}

// ========== POINT INDEX ==========

class PointIndexTest : public ::testing::TestWithParam<SpatialIndexType> {
protected:
    // Berlin-ish points, about 0.7 km apart along a meridian plus one far away.
    std::vector<GeoPoint> points_ = {
        {52.5200, 13.4000},
        {52.5263, 13.4000},
        {52.5326, 13.4000},
        {52.6000, 13.4000},
    };
};

TEST_P(PointIndexTest, WithinReturnsSortedHits) {
    PointIndex index;
    index.build(points_, GetParam(), 1.0);
    ASSERT_TRUE(index.built());
    EXPECT_EQ(index.size(), 4u);

    auto hits = index.within(points_[0], 1.0);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].first, 0u);
    EXPECT_DOUBLE_EQ(hits[0].second, 0.0);
    EXPECT_EQ(hits[1].first, 1u);

    auto wide = index.within(points_[0], 2.0);
    ASSERT_EQ(wide.size(), 3u);
    EXPECT_EQ(wide[2].first, 2u);
}

TEST_P(PointIndexTest, NearestIsCapped) {
    PointIndex index;
    index.build(points_, GetParam(), 1.0);

    auto hits = index.nearest(GeoPoint{52.5327, 13.4000}, 1, 5.0);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].first, 2u);

    EXPECT_TRUE(index.nearest(GeoPoint{0.0, 0.0}, 3, 5.0).empty());
}

INSTANTIATE_TEST_SUITE_P(Backends, PointIndexTest,
                         ::testing::Values(SpatialIndexType::RTREE, SpatialIndexType::H3));

TEST(PointIndexBasicsTest, EmptyIndexAnswersNothing) {
    PointIndex index;
    EXPECT_TRUE(index.within(GeoPoint{0.0, 0.0}, 10.0).empty());
    index.build({}, SpatialIndexType::RTREE);
    EXPECT_TRUE(index.within(GeoPoint{0.0, 0.0}, 10.0).empty());
}

TEST(PointIndexBasicsTest, ParseIndexType) {
    EXPECT_EQ(parse_index_type("h3"), SpatialIndexType::H3);
    EXPECT_EQ(parse_index_type("rtree"), SpatialIndexType::RTREE);
    EXPECT_EQ(parse_index_type("anything"), SpatialIndexType::RTREE);
}

TEST(PointIndexBasicsTest, RTreeFindsNeighborsAcrossTheAntimeridian) {
    PointIndex index;
    index.build({{0.0, 179.99}, {0.0, -179.99}, {0.0, 170.0}}, SpatialIndexType::RTREE);

    auto east = index.within(GeoPoint{0.0, 179.99}, 5.0);
    ASSERT_EQ(east.size(), 2u);
    EXPECT_EQ(east[1].first, 1u);

    auto west = index.within(GeoPoint{0.0, -179.99}, 5.0);
    ASSERT_EQ(west.size(), 2u);
    EXPECT_EQ(west[1].first, 0u);
}

TEST(PointIndexBasicsTest, RTreeWideRadiusNearThePole) {
    // About 650 km apart, 90 degrees of longitude between them.
    PointIndex index;
    index.build({{85.0, 0.0}, {87.0, 90.0}}, SpatialIndexType::RTREE);

    auto hits = index.within(GeoPoint{85.0, 0.0}, 700.0);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[1].first, 1u);
    EXPECT_LT(hits[1].second, 700.0);
}
