/**
 * @file stop_sequencer.hpp
 * @brief Visiting order for one route: solver-backed when available,
 *        nearest-neighbor otherwise, with parking stops spliced in.
 */

#pragma once

#include "cancellation.hpp"
#include "distance_provider.hpp"
#include "geo_types.hpp"
#include "spatial_index.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace fleetplan {

constexpr const char* kMethodSolver = "or_tools";
constexpr const char* kMethodFallback = "nearest_neighbor_fallback";

struct DeliveryRequest {
    int64_t order_id = 0;
    GeoPoint point;
    std::optional<TimeWindow> time_window;
    Priority priority = Priority::Normal;
    bool parking_required = false;
};

/**
 * @brief Build a request from a geocoded order. The order must have a point.
 */
DeliveryRequest delivery_from(const Order& order);

struct SequencerOptions {
    bool solver_enabled = true;
    int solver_time_limit_ms = 5000;
    int64_t priority_weight = 1000;
    double parking_max_walk_km = 0.3;
    const CancellationToken* cancel = nullptr;
};

struct CostSummary {
    double total_distance_km = 0.0;
    double total_duration_min = 0.0;
    // Delivery-only open paths from the depot, same matrix for both.
    double naive_distance_km = 0.0;
    double sequenced_distance_km = 0.0;
    double improvement_percent = 0.0;
    bool used_road_network = false;
    std::string optimization_method;
    std::string warning;
    int parking_stops = 0;
    int unparked_deliveries = 0;
};

struct SequencedRoute {
    std::vector<Waypoint> waypoints;
    CostSummary summary;
};

// ========== STRATEGIES ==========

struct SolverBacked {
    int time_limit_ms = 5000;
    int64_t priority_weight = 1000;
};

struct GreedyFallback {};

using SequencingStrategy = std::variant<SolverBacked, GreedyFallback>;

/**
 * @brief SolverBacked when the solver is compiled in and enabled.
 */
SequencingStrategy select_strategy(const SequencerOptions& options);

/**
 * @brief Order the deliveries of one route starting at the depot.
 *
 * Throws PlanCancelled when the options' token is cancelled. Solver
 * problems never throw; they fall back and leave a warning.
 */
SequencedRoute sequence_stops(const Depot& depot,
                              const std::vector<ParkingSpot>& parking_candidates,
                              const std::vector<DeliveryRequest>& deliveries,
                              DistanceProvider& provider,
                              const SequencerOptions& options);

/**
 * @brief Open-path length of a node order over a matrix, starting at node 0.
 */
double path_distance(const DistanceMatrixResult& matrix, const std::vector<size_t>& order);

// ========== ORDERING RULES ==========

// (a, b): matrix node a is visited before node b. Delivery i is node i + 1.
using Precedence = std::pair<size_t, size_t>;

/**
 * @brief a before b whenever a's window ends strictly before b's opens.
 */
std::vector<Precedence> window_precedences(const std::vector<DeliveryRequest>& deliveries);

bool respects_precedences(const std::vector<size_t>& order, const std::vector<Precedence>& precedences);

/**
 * @brief Replace chosen with the input order 1..n when that is strictly
 *        cheaper. A precedence-bound choice is only replaced by an input
 *        order that respects every precedence.
 * @return true if the input order was taken
 */
bool apply_cost_guard(const DistanceMatrixResult& matrix,
                      std::vector<size_t>& chosen,
                      bool precedence_bound,
                      const std::vector<Precedence>& precedences);

}  // namespace fleetplan
