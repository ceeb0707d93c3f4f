/**
 * @file ortools_solver.hpp
 * @brief Open-path stop ordering on the OR-Tools routing library.
 *
 * The library is optional at build time (FLEETPLAN_HAVE_ORTOOLS). Without
 * it, solver_compiled_in() is false and every solve reports an error so
 * the caller takes its heuristic path.
 */

#pragma once

#include "cancellation.hpp"
#include "distance_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace fleetplan {

/**
 * @brief Nodes are matrix rows; node 0 is the fixed start. The path ends
 *        wherever it is cheapest (no return leg).
 */
struct OpenPathProblem {
    const DistanceMatrixResult* matrix = nullptr;
    // Priority rank per node; node 0 is ignored.
    std::vector<int> priority_ranks;
    // (a, b): node a must be visited before node b.
    std::vector<std::pair<size_t, size_t>> precedences;
    int time_limit_ms = 5000;
    // Penalty per position of delay per priority rank.
    int64_t priority_weight = 1000;
    const CancellationToken* cancel = nullptr;
};

struct SolverOutcome {
    bool solved = false;
    bool timed_out = false;
    bool cancelled = false;
    // Visiting order of nodes 1..n-1.
    std::vector<size_t> visit_order;
    std::string error;
};

bool solver_compiled_in();

SolverOutcome solve_open_path(const OpenPathProblem& problem);

}  // namespace fleetplan
