/**
 * @file ortools_solver.cpp
 * @brief OR-Tools routing model for a single open path.
 */

#include "ortools_solver.hpp"

#include <cmath>
#include <exception>

#ifdef FLEETPLAN_HAVE_ORTOOLS
#include <ortools/constraint_solver/constraint_solver.h>
#include <ortools/constraint_solver/routing.h>
#include <ortools/constraint_solver/routing_index_manager.h>
#include <ortools/constraint_solver/routing_parameters.h>
#endif

namespace fleetplan {

#ifdef FLEETPLAN_HAVE_ORTOOLS

namespace ors = operations_research;

bool solver_compiled_in() { return true; }

SolverOutcome solve_open_path(const OpenPathProblem& problem) {
    SolverOutcome out;
    if (!problem.matrix) {
        out.error = "no cost matrix";
        return out;
    }

    const int n = static_cast<int>(problem.matrix->size);
    if (n <= 2) {
        // Nothing to order.
        for (int i = 1; i < n; ++i) out.visit_order.push_back(static_cast<size_t>(i));
        out.solved = true;
        return out;
    }

    // Extra node n is a free dummy end, which turns the tour into an open path.
    const int num_nodes = n + 1;
    std::vector<int64_t> cost(static_cast<size_t>(num_nodes) * num_nodes, 0);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            cost[i * num_nodes + j] = static_cast<int64_t>(std::llround(problem.matrix->distance(i, j) * 1000.0));
        }
    }

    try {
        const std::vector<ors::RoutingIndexManager::NodeIndex> starts = {ors::RoutingIndexManager::NodeIndex(0)};
        const std::vector<ors::RoutingIndexManager::NodeIndex> ends = {ors::RoutingIndexManager::NodeIndex(n)};
        ors::RoutingIndexManager manager(num_nodes, 1, starts, ends);
        ors::RoutingModel routing(manager);

        const int transit = routing.RegisterTransitCallback(
            [&manager, &cost, num_nodes](int64_t from_index, int64_t to_index) -> int64_t {
                const int from = manager.IndexToNode(from_index).value();
                const int to = manager.IndexToNode(to_index).value();
                return cost[from * num_nodes + to];
            });
        routing.SetArcCostEvaluatorOfAllVehicles(transit);

        // Visit position: each node left adds one.
        const int step = routing.RegisterUnaryTransitCallback([](int64_t) -> int64_t { return 1; });
        if (!routing.AddDimension(step, 0, num_nodes, true, "Position")) {
            out.error = "could not add position dimension";
            return out;
        }
        ors::RoutingDimension* position = routing.GetMutableDimension("Position");

        ors::Solver* const solver = routing.solver();
        for (const auto& [a, b] : problem.precedences) {
            const int64_t ia = manager.NodeToIndex(ors::RoutingIndexManager::NodeIndex(static_cast<int>(a)));
            const int64_t ib = manager.NodeToIndex(ors::RoutingIndexManager::NodeIndex(static_cast<int>(b)));
            solver->AddConstraint(solver->MakeLess(position->CumulVar(ia), position->CumulVar(ib)));
        }

        for (int node = 1; node < n && node < static_cast<int>(problem.priority_ranks.size()); ++node) {
            const int rank = problem.priority_ranks[node];
            if (rank <= 0) continue;
            const int64_t index = manager.NodeToIndex(ors::RoutingIndexManager::NodeIndex(node));
            position->SetCumulVarSoftUpperBound(index, 1, rank * problem.priority_weight);
        }

        if (problem.cancel) {
            const CancellationToken* token = problem.cancel;
            routing.AddSearchMonitor(solver->MakeCustomLimit([token]() { return token->cancelled(); }));
        }

        ors::RoutingSearchParameters params = ors::DefaultRoutingSearchParameters();
        params.set_first_solution_strategy(ors::FirstSolutionStrategy::PATH_CHEAPEST_ARC);
        params.set_local_search_metaheuristic(ors::LocalSearchMetaheuristic::GUIDED_LOCAL_SEARCH);
        params.mutable_time_limit()->set_seconds(problem.time_limit_ms / 1000);
        params.mutable_time_limit()->set_nanos((problem.time_limit_ms % 1000) * 1000000);

        const ors::Assignment* solution = routing.SolveWithParameters(params);

        if (problem.cancel && problem.cancel->cancelled()) {
            out.cancelled = true;
            out.error = "cancelled";
            return out;
        }
        if (!solution) {
            out.timed_out = routing.status() == ors::RoutingModel::ROUTING_FAIL_TIMEOUT;
            out.error = out.timed_out ? "no solution within time limit" : "no solution found";
            return out;
        }

        int64_t index = solution->Value(routing.NextVar(routing.Start(0)));
        while (!routing.IsEnd(index)) {
            out.visit_order.push_back(static_cast<size_t>(manager.IndexToNode(index).value()));
            index = solution->Value(routing.NextVar(index));
        }
        out.solved = out.visit_order.size() == static_cast<size_t>(n - 1);
        if (!out.solved) out.error = "solution does not visit every stop";
    } catch (const std::exception& e) {
        out.error = std::string("OR-Tools error: ") + e.what();
    }
    return out;
}

#else

bool solver_compiled_in() { return false; }

SolverOutcome solve_open_path(const OpenPathProblem&) {
    SolverOutcome out;
    out.error = "OR-Tools support not compiled in";
    return out;
}

#endif  // FLEETPLAN_HAVE_ORTOOLS

}  // namespace fleetplan
