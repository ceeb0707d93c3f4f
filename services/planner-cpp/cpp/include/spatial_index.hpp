/**
 * @file spatial_index.hpp
 * @brief Radius and nearest-point queries over a fixed set of points.
 *
 * Two backends: a Boost.Geometry R-tree over (lon, lat) and an H3 cell
 * bucket map searched with grid disks. Both return exact haversine
 * distances; the index only prunes candidates.
 */

#pragma once

#include "geo_types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/index/rtree.hpp>

namespace fleetplan {

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

using IndexPoint2D = bg::model::point<double, 2, bg::cs::cartesian>;
using IndexBox2D = bg::model::box<IndexPoint2D>;
using IndexRTreeValue = std::pair<IndexPoint2D, uint32_t>;

enum class SpatialIndexType {
    H3,
    RTREE
};

SpatialIndexType parse_index_type(const std::string& s);

/**
 * @brief (position in the indexed vector, distance km)
 */
using IndexHit = std::pair<uint32_t, double>;

class PointIndex {
public:
    /**
     * @brief Index the points. radius_hint_km selects the H3 resolution.
     */
    void build(const std::vector<GeoPoint>& points,
               SpatialIndexType type = SpatialIndexType::RTREE,
               double radius_hint_km = 1.0);

    /**
     * @brief All points within radius_km, sorted by distance then position.
     */
    std::vector<IndexHit> within(const GeoPoint& p, double radius_km) const;

    /**
     * @brief Up to max_candidates points within radius_km, closest first.
     */
    std::vector<IndexHit> nearest(const GeoPoint& p, size_t max_candidates, double radius_km) const;

    size_t size() const { return points_.size(); }
    bool built() const { return built_; }
    SpatialIndexType type() const { return type_; }

private:
    std::vector<uint32_t> candidates(const GeoPoint& p, double radius_km) const;

    std::vector<GeoPoint> points_;
    SpatialIndexType type_ = SpatialIndexType::RTREE;
    bool built_ = false;

    std::unique_ptr<bgi::rtree<IndexRTreeValue, bgi::quadratic<16>>> rtree_;
    std::unordered_map<uint64_t, std::vector<uint32_t>> h3_index_;
    int h3_res_ = 7;
};

}  // namespace fleetplan
