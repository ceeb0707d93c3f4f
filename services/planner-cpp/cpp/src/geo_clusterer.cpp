/**
 * @file geo_clusterer.cpp
 * @brief Density clustering with size/radius repair.
 */

#include "geo_clusterer.hpp"
#include "geo_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <numeric>
#include <unordered_set>

namespace fleetplan {

namespace {

struct Member {
    int64_t id;
    GeoPoint point;
};

using Group = std::vector<Member>;

struct WorkingCluster {
    Group members;
    GeoPoint centroid;
    bool radius_relaxed = false;

    int64_t first_id() const { return members.front().id; }
};

std::vector<GeoPoint> points_of(const Group& g) {
    std::vector<GeoPoint> pts;
    pts.reserve(g.size());
    for (const auto& m : g) pts.push_back(m.point);
    return pts;
}

void sort_by_id(Group& g) {
    std::sort(g.begin(), g.end(), [](const Member& a, const Member& b) { return a.id < b.id; });
}

// Union-find over member positions.
struct DisjointSet {
    std::vector<size_t> parent;

    explicit DisjointSet(size_t n) : parent(n) {
        std::iota(parent.begin(), parent.end(), 0);
    }

    size_t find(size_t x) {
        while (parent[x] != x) {
            parent[x] = parent[parent[x]];
            x = parent[x];
        }
        return x;
    }

    void unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        // Smaller root wins so components are keyed by their lowest id.
        if (a < b) parent[b] = a; else parent[a] = b;
    }
};

std::vector<Group> density_groups(const Group& routable, const ClusteringOptions& options,
                                  DistanceProvider* provider) {
    std::vector<GeoPoint> pts = points_of(routable);
    DisjointSet ds(routable.size());

    bool linked = false;
    if (provider && provider->has_backend() && options.road_distance && routable.size() > 1) {
        DistanceMatrixResult m = provider->matrix(pts);
        if (m.used_road_network) {
            for (size_t i = 0; i < routable.size(); ++i) {
                for (size_t j = i + 1; j < routable.size(); ++j) {
                    if (std::min(m.distance(i, j), m.distance(j, i)) <= options.max_radius_km) ds.unite(i, j);
                }
            }
            linked = true;
        } else {
            std::cerr << "Clusterer: no road matrix, grouping on great-circle distance" << std::endl;
        }
    }

    if (!linked) {
        PointIndex index;
        index.build(pts, options.index_type, options.max_radius_km);
        for (size_t i = 0; i < routable.size(); ++i) {
            for (const auto& [j, dist] : index.within(pts[i], options.max_radius_km)) {
                ds.unite(i, j);
            }
        }
    }

    std::map<size_t, Group> components;
    for (size_t i = 0; i < routable.size(); ++i) {
        components[ds.find(i)].push_back(routable[i]);
    }

    std::vector<Group> groups;
    groups.reserve(components.size());
    for (auto& [root, g] : components) {
        groups.push_back(std::move(g));
    }
    return groups;
}

bool fits(const Group& g, const ClusteringOptions& options) {
    if (g.size() > static_cast<size_t>(options.max_size)) return false;
    if (g.size() < 2) return true;
    return geo_utils::diameter_km(points_of(g)) <= options.max_radius_km;
}

void bisect_until_fit(Group g, const ClusteringOptions& options, std::vector<Group>& out) {
    if (fits(g, options)) {
        out.push_back(std::move(g));
        return;
    }

    double min_lat = 90, max_lat = -90, min_lon = 180, max_lon = -180, sum_lat = 0;
    for (const auto& m : g) {
        min_lat = std::min(min_lat, m.point.lat);
        max_lat = std::max(max_lat, m.point.lat);
        min_lon = std::min(min_lon, m.point.lon);
        max_lon = std::max(max_lon, m.point.lon);
        sum_lat += m.point.lat;
    }
    double mean_lat = sum_lat / g.size();
    double lat_span_km = (max_lat - min_lat) * 111.0;
    double lon_span_km = (max_lon - min_lon) * 111.0 * std::cos(mean_lat * M_PI / 180.0);
    bool split_on_lat = lat_span_km >= lon_span_km;

    std::sort(g.begin(), g.end(), [split_on_lat](const Member& a, const Member& b) {
        double ka = split_on_lat ? a.point.lat : a.point.lon;
        double kb = split_on_lat ? b.point.lat : b.point.lon;
        if (ka != kb) return ka < kb;
        return a.id < b.id;
    });

    size_t half = g.size() / 2;
    Group left(g.begin(), g.begin() + half);
    Group right(g.begin() + half, g.end());
    bisect_until_fit(std::move(left), options, out);
    bisect_until_fit(std::move(right), options, out);
}

void refresh(WorkingCluster& c) {
    sort_by_id(c.members);
    c.centroid = geo_utils::centroid(points_of(c.members));
}

// Merge undersized clusters into the nearest one that has room.
void merge_small(std::vector<WorkingCluster>& clusters, const ClusteringOptions& options) {
    const size_t min_size = static_cast<size_t>(options.min_size);
    const size_t max_size = static_cast<size_t>(options.max_size);

    while (true) {
        std::vector<size_t> small;
        for (size_t i = 0; i < clusters.size(); ++i) {
            if (clusters[i].members.size() < min_size) small.push_back(i);
        }
        std::sort(small.begin(), small.end(), [&clusters](size_t a, size_t b) {
            if (clusters[a].members.size() != clusters[b].members.size()) {
                return clusters[a].members.size() < clusters[b].members.size();
            }
            return clusters[a].first_id() < clusters[b].first_id();
        });

        bool merged = false;
        for (size_t s : small) {
            size_t best = clusters.size();
            double best_dist = std::numeric_limits<double>::infinity();

            for (size_t t = 0; t < clusters.size(); ++t) {
                if (t == s) continue;
                if (clusters[s].members.size() + clusters[t].members.size() > max_size) continue;
                double d = geo_utils::haversine_km(clusters[s].centroid, clusters[t].centroid);
                if (d < best_dist ||
                    (d == best_dist && best < clusters.size() &&
                     clusters[t].first_id() < clusters[best].first_id())) {
                    best = t;
                    best_dist = d;
                }
            }
            if (best == clusters.size()) continue;

            WorkingCluster& target = clusters[best];
            target.members.insert(target.members.end(), clusters[s].members.begin(), clusters[s].members.end());
            target.radius_relaxed = target.radius_relaxed || clusters[s].radius_relaxed ||
                                    geo_utils::diameter_km(points_of(target.members)) > options.max_radius_km;
            refresh(target);
            clusters.erase(clusters.begin() + s);
            merged = true;
            break;
        }
        if (!merged) break;
    }
}

}  // namespace

ClusteringResult cluster_orders(const std::vector<Order>& orders, const ClusteringOptions& in,
                                DistanceProvider* provider) {
    ClusteringOptions options = in;
    options.max_size = std::max(1, options.max_size);
    options.min_size = std::min(std::max(1, options.min_size), options.max_size);

    ClusteringResult result;

    Group routable;
    std::unordered_set<int64_t> seen;
    for (const auto& o : orders) {
        if (!seen.insert(o.id).second) continue;
        if (o.point) {
            routable.push_back({o.id, *o.point});
        } else {
            result.unscheduled_order_ids.push_back(o.id);
        }
    }
    std::sort(result.unscheduled_order_ids.begin(), result.unscheduled_order_ids.end());
    sort_by_id(routable);

    if (routable.empty()) {
        if (!orders.empty()) {
            std::cerr << "Clusterer: no orders with coordinates" << std::endl;
        }
        return result;
    }

    std::vector<Group> pieces;
    for (auto& g : density_groups(routable, options, provider)) {
        bisect_until_fit(std::move(g), options, pieces);
    }

    std::vector<WorkingCluster> working;
    working.reserve(pieces.size());
    for (auto& p : pieces) {
        WorkingCluster c;
        c.members = std::move(p);
        refresh(c);
        working.push_back(std::move(c));
    }

    merge_small(working, options);

    std::sort(working.begin(), working.end(), [](const WorkingCluster& a, const WorkingCluster& b) {
        return a.first_id() < b.first_id();
    });

    size_t small_count = 0;
    for (const auto& w : working) {
        Cluster c;
        for (const auto& m : w.members) c.order_ids.push_back(m.id);
        c.centroid = w.centroid;
        c.radius_relaxed = w.radius_relaxed;
        c.small_route = c.order_ids.size() < static_cast<size_t>(options.min_size);
        if (c.small_route) small_count++;
        result.clusters.push_back(std::move(c));
    }

    std::cout << "Clusterer: " << routable.size() << " orders into " << result.clusters.size()
              << " clusters (" << small_count << " small, "
              << result.unscheduled_order_ids.size() << " without coordinates)" << std::endl;
    return result;
}

}  // namespace fleetplan
