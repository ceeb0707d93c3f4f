/**
 * @file stop_sequencer.cpp
 * @brief Stop sequencing implementation.
 */

#include "stop_sequencer.hpp"
#include "geo_utils.hpp"
#include "ortools_solver.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <limits>
#include <utility>

namespace fleetplan {

namespace {

constexpr double kCostEpsilon = 1e-9;

struct StrategyOutcome {
    std::vector<size_t> order;
    std::string method;
    std::string warning;
};

// Nodes: 0 = depot, i = deliveries[i - 1].
std::vector<size_t> nearest_neighbor(const DistanceMatrixResult& matrix,
                                     const std::vector<DeliveryRequest>& deliveries) {
    const size_t n = deliveries.size();
    std::vector<size_t> order;
    std::vector<bool> visited(n + 1, false);
    size_t current = 0;

    while (order.size() < n) {
        size_t best = 0;
        double best_dist = std::numeric_limits<double>::infinity();
        for (size_t node = 1; node <= n; ++node) {
            if (visited[node]) continue;
            double d = matrix.distance(current, node);
            if (best == 0 || d < best_dist) {
                best = node;
                best_dist = d;
                continue;
            }
            if (d > best_dist) continue;
            // Equal distance: higher priority, then lower order id.
            const DeliveryRequest& cand = deliveries[node - 1];
            const DeliveryRequest& inc = deliveries[best - 1];
            if (priority_rank(cand.priority) > priority_rank(inc.priority) ||
                (cand.priority == inc.priority && cand.order_id < inc.order_id)) {
                best = node;
            }
        }
        visited[best] = true;
        order.push_back(best);
        current = best;
    }
    return order;
}

struct StrategyRunner {
    const DistanceMatrixResult& matrix;
    const std::vector<DeliveryRequest>& deliveries;
    const std::vector<Precedence>& precedences;
    const CancellationToken* cancel;

    StrategyOutcome operator()(const GreedyFallback&) const {
        StrategyOutcome out;
        out.order = nearest_neighbor(matrix, deliveries);
        out.method = kMethodFallback;
        return out;
    }

    StrategyOutcome operator()(const SolverBacked& s) const {
        OpenPathProblem problem;
        problem.matrix = &matrix;
        problem.priority_ranks.push_back(0);
        for (const auto& d : deliveries) problem.priority_ranks.push_back(priority_rank(d.priority));
        problem.precedences = precedences;
        problem.time_limit_ms = s.time_limit_ms;
        problem.priority_weight = s.priority_weight;
        problem.cancel = cancel;

        SolverOutcome solved = solve_open_path(problem);
        if (solved.cancelled) throw PlanCancelled();

        if (solved.solved) {
            StrategyOutcome out;
            out.order = std::move(solved.visit_order);
            out.method = kMethodSolver;
            return out;
        }

        StrategyOutcome out = (*this)(GreedyFallback{});
        out.warning = "solver " + std::string(solved.timed_out ? "timed out" : "failed") +
                      " (" + solved.error + "), used nearest neighbor";
        return out;
    }
};

struct ParkingPlacer {
    const std::vector<ParkingSpot>& spots;
    const PointIndex& index;
    double max_walk_km;
    std::optional<size_t> active;

    // Parking spot to stop at before this delivery, if a new one is needed.
    std::optional<size_t> place(const DeliveryRequest& d, bool& unparked) {
        unparked = false;
        if (!d.parking_required) {
            active.reset();
            return std::nullopt;
        }
        if (active && geo_utils::haversine_km(spots[*active].point, d.point) <= max_walk_km) {
            return std::nullopt;
        }
        auto hits = index.nearest(d.point, 1, max_walk_km);
        if (hits.empty()) {
            active.reset();
            unparked = true;
            return std::nullopt;
        }
        active = hits.front().first;
        return active;
    }
};

}  // namespace

DeliveryRequest delivery_from(const Order& order) {
    DeliveryRequest d;
    d.order_id = order.id;
    d.point = order.point.value();
    d.time_window = order.time_window;
    d.priority = order.priority;
    d.parking_required = order.parking_required;
    return d;
}

SequencingStrategy select_strategy(const SequencerOptions& options) {
    if (options.solver_enabled && solver_compiled_in()) {
        return SolverBacked{options.solver_time_limit_ms, options.priority_weight};
    }
    return GreedyFallback{};
}

double path_distance(const DistanceMatrixResult& matrix, const std::vector<size_t>& order) {
    double total = 0.0;
    size_t current = 0;
    for (size_t node : order) {
        total += matrix.distance(current, node);
        current = node;
    }
    return total;
}

std::vector<Precedence> window_precedences(const std::vector<DeliveryRequest>& deliveries) {
    std::vector<Precedence> out;
    for (size_t i = 0; i < deliveries.size(); ++i) {
        const auto& wi = deliveries[i].time_window;
        if (!wi || !wi->end) continue;
        for (size_t j = 0; j < deliveries.size(); ++j) {
            if (i == j) continue;
            const auto& wj = deliveries[j].time_window;
            if (!wj || !wj->start) continue;
            if (*wi->end < *wj->start) out.push_back({i + 1, j + 1});
        }
    }
    return out;
}

bool respects_precedences(const std::vector<size_t>& order, const std::vector<Precedence>& precedences) {
    std::vector<size_t> pos(order.size() + 1, 0);
    for (size_t k = 0; k < order.size(); ++k) pos[order[k]] = k;
    for (const auto& [a, b] : precedences) {
        if (pos[a] > pos[b]) return false;
    }
    return true;
}

bool apply_cost_guard(const DistanceMatrixResult& matrix,
                      std::vector<size_t>& chosen,
                      bool precedence_bound,
                      const std::vector<Precedence>& precedences) {
    std::vector<size_t> input(chosen.size());
    for (size_t i = 0; i < input.size(); ++i) input[i] = i + 1;

    if (path_distance(matrix, chosen) <= path_distance(matrix, input) + kCostEpsilon) return false;
    if (precedence_bound && !respects_precedences(input, precedences)) return false;
    chosen = std::move(input);
    return true;
}

SequencedRoute sequence_stops(const Depot& depot,
                              const std::vector<ParkingSpot>& parking_candidates,
                              const std::vector<DeliveryRequest>& deliveries,
                              DistanceProvider& provider,
                              const SequencerOptions& options) {
    throw_if_cancelled(options.cancel);

    SequencedRoute result;
    SequencingStrategy strategy = select_strategy(options);

    Waypoint start;
    start.kind = WaypointKind::Depot;
    start.point = depot.point;
    start.ref_id = depot.id;
    result.waypoints.push_back(start);

    if (deliveries.empty()) {
        result.summary.optimization_method =
            std::holds_alternative<SolverBacked>(strategy) ? kMethodSolver : kMethodFallback;
        return result;
    }

    std::vector<GeoPoint> points;
    points.reserve(deliveries.size() + 1);
    points.push_back(depot.point);
    for (const auto& d : deliveries) points.push_back(d.point);

    DistanceMatrixResult matrix = provider.matrix(points);
    throw_if_cancelled(options.cancel);

    std::vector<size_t> naive(deliveries.size());
    for (size_t i = 0; i < naive.size(); ++i) naive[i] = i + 1;

    auto precedences = window_precedences(deliveries);

    StrategyOutcome outcome = std::visit(StrategyRunner{matrix, deliveries, precedences, options.cancel}, strategy);

    apply_cost_guard(matrix, outcome.order, outcome.method == kMethodSolver, precedences);
    double naive_cost = path_distance(matrix, naive);
    double sequenced_cost = path_distance(matrix, outcome.order);

    // Waypoints with parking spliced in.
    std::vector<ParkingSpot> spots = parking_candidates;
    std::sort(spots.begin(), spots.end(),
              [](const ParkingSpot& a, const ParkingSpot& b) { return a.id < b.id; });
    std::vector<GeoPoint> spot_points;
    for (const auto& s : spots) spot_points.push_back(s.point);
    PointIndex parking_index;
    parking_index.build(spot_points, SpatialIndexType::RTREE);

    ParkingPlacer placer{spots, parking_index, options.parking_max_walk_km, std::nullopt};
    // Matrix node behind each waypoint; npos for parking stops.
    const size_t npos = std::numeric_limits<size_t>::max();
    std::vector<size_t> nodes = {0};

    for (size_t node : outcome.order) {
        const DeliveryRequest& d = deliveries[node - 1];
        bool unparked = false;
        if (auto spot = placer.place(d, unparked)) {
            Waypoint p;
            p.kind = WaypointKind::Parking;
            p.point = spots[*spot].point;
            p.ref_id = spots[*spot].id;
            result.waypoints.push_back(p);
            nodes.push_back(npos);
            result.summary.parking_stops++;
        }
        if (unparked) result.summary.unparked_deliveries++;

        Waypoint w;
        w.kind = WaypointKind::Delivery;
        w.point = d.point;
        w.ref_id = d.order_id;
        result.waypoints.push_back(w);
        nodes.push_back(node);
    }
    renumber(result.waypoints);

    // Totals along the final waypoint list.
    CostSummary& s = result.summary;
    s.used_road_network = matrix.used_road_network;
    for (size_t i = 0; i + 1 < result.waypoints.size(); ++i) {
        if (nodes[i] != npos && nodes[i + 1] != npos) {
            s.total_distance_km += matrix.distance(nodes[i], nodes[i + 1]);
            s.total_duration_min += matrix.duration(nodes[i], nodes[i + 1]);
        } else {
            DistanceResult leg = provider.pairwise_distance(result.waypoints[i].point, result.waypoints[i + 1].point);
            s.total_distance_km += leg.distance_km;
            s.total_duration_min += leg.duration_min;
            if (leg.provenance != Provenance::RoadNetwork) s.used_road_network = false;
        }
    }

    s.naive_distance_km = naive_cost;
    s.sequenced_distance_km = sequenced_cost;
    s.improvement_percent = naive_cost > 0 ? (naive_cost - sequenced_cost) / naive_cost * 100.0 : 0.0;
    s.optimization_method = outcome.method;
    s.warning = outcome.warning;

    if (!s.warning.empty()) {
        std::cerr << "Sequencer: " << s.warning << std::endl;
    }
    std::cout << "Sequencer: " << deliveries.size() << " deliveries via " << s.optimization_method
              << ", " << std::fixed << std::setprecision(2) << s.sequenced_distance_km << " km ("
              << std::setprecision(1) << s.improvement_percent << "% better than input order)"
              << std::defaultfloat << std::endl;
    return result;
}

}  // namespace fleetplan
