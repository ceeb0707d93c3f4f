/**
 * @file spatial_index.cpp
 * @brief R-tree / H3 point index implementation.
 */

#include "spatial_index.hpp"
#include "geo_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace fleetplan {

SpatialIndexType parse_index_type(const std::string& s) {
    return s == "h3" ? SpatialIndexType::H3 : SpatialIndexType::RTREE;
}

void PointIndex::build(const std::vector<GeoPoint>& points, SpatialIndexType type,
                       double radius_hint_km) {
    points_ = points;
    type_ = type;
    h3_index_.clear();
    rtree_.reset();

    if (type == SpatialIndexType::RTREE) {
        std::vector<IndexRTreeValue> items;
        items.reserve(points_.size());
        for (uint32_t i = 0; i < points_.size(); ++i) {
            items.push_back({IndexPoint2D(points_[i].lon, points_[i].lat), i});
        }
        rtree_ = std::make_unique<bgi::rtree<IndexRTreeValue, bgi::quadratic<16>>>(items.begin(), items.end());
    } else {
        h3_res_ = geo_utils::resolution_for_radius(radius_hint_km);
        for (uint32_t i = 0; i < points_.size(); ++i) {
            uint64_t cell = geo_utils::latlng_to_cell(points_[i].lat, points_[i].lon, h3_res_);
            h3_index_[cell].push_back(i);
        }
    }

    built_ = true;
}

std::vector<uint32_t> PointIndex::candidates(const GeoPoint& p, double radius_km) const {
    std::vector<uint32_t> out;

    if (type_ == SpatialIndexType::RTREE && rtree_) {
        // The lon span is sized at the poleward edge of the box, where a km
        // covers the most degrees. Boxes over a pole take every longitude.
        double deg_lat = radius_km / 111.0;
        double min_lat = std::max(-90.0, p.lat - deg_lat);
        double max_lat = std::min(90.0, p.lat + deg_lat);
        double edge_lat = std::max(std::fabs(min_lat), std::fabs(max_lat));
        double cos_edge = std::cos(edge_lat * M_PI / 180.0);
        double deg_lon = cos_edge > 1e-9 ? deg_lat / cos_edge : 360.0;

        std::vector<IndexBox2D> boxes;
        if (deg_lon >= 180.0) {
            boxes.emplace_back(IndexPoint2D(-180.0, min_lat), IndexPoint2D(180.0, max_lat));
        } else {
            double west = p.lon - deg_lon;
            double east = p.lon + deg_lon;
            // Split boxes that cross the antimeridian.
            if (west < -180.0) {
                boxes.emplace_back(IndexPoint2D(west + 360.0, min_lat), IndexPoint2D(180.0, max_lat));
                west = -180.0;
            }
            if (east > 180.0) {
                boxes.emplace_back(IndexPoint2D(-180.0, min_lat), IndexPoint2D(east - 360.0, max_lat));
                east = 180.0;
            }
            boxes.emplace_back(IndexPoint2D(west, min_lat), IndexPoint2D(east, max_lat));
        }

        std::vector<IndexRTreeValue> hits;
        for (const auto& box : boxes) {
            rtree_->query(bgi::intersects(box), std::back_inserter(hits));
        }
        out.reserve(hits.size());
        for (const auto& [pt, idx] : hits) {
            out.push_back(idx);
        }
        // Split boxes share their edges.
        std::sort(out.begin(), out.end());
        out.erase(std::unique(out.begin(), out.end()), out.end());
    } else {
        uint64_t origin = geo_utils::latlng_to_cell(p.lat, p.lon, h3_res_);
        if (origin == 0) return out;

        double edge = geo_utils::edge_length_km(h3_res_);
        int k = edge > 0 ? static_cast<int>(std::ceil(radius_km / edge)) + 1 : 1;

        for (uint64_t cell : geo_utils::grid_disk(origin, k)) {
            auto it = h3_index_.find(cell);
            if (it == h3_index_.end()) continue;
            out.insert(out.end(), it->second.begin(), it->second.end());
        }
    }
    return out;
}

std::vector<IndexHit> PointIndex::within(const GeoPoint& p, double radius_km) const {
    std::vector<IndexHit> results;
    if (!built_) return results;

    for (uint32_t idx : candidates(p, radius_km)) {
        double dist = geo_utils::haversine_km(p, points_[idx]);
        if (dist <= radius_km) {
            results.push_back({idx, dist});
        }
    }

    std::sort(results.begin(), results.end(), [](const IndexHit& a, const IndexHit& b) {
        if (a.second != b.second) return a.second < b.second;
        return a.first < b.first;
    });
    return results;
}

std::vector<IndexHit> PointIndex::nearest(const GeoPoint& p, size_t max_candidates,
                                          double radius_km) const {
    auto results = within(p, radius_km);
    if (results.size() > max_candidates) {
        results.resize(max_candidates);
    }
    return results;
}

}  // namespace fleetplan
