/**
 * @file route_planner.hpp
 * @brief The planning batch pipeline: cluster, assign, sequence, synthesize,
 *        stage, commit.
 */

#pragma once

#include "cancellation.hpp"
#include "distance_provider.hpp"
#include "plan_store.hpp"
#include "planner_config.hpp"
#include "route_plan.hpp"

#include <memory>
#include <vector>

namespace fleetplan {

/**
 * @brief Append orders not already in the batch (matched by id), e.g. the
 *        ones drained from the drift pool.
 */
void merge_orders(PlanningBatch& batch, const std::vector<Order>& extra);

class RoutePlanner {
public:
    RoutePlanner(PlannerConfig config, std::shared_ptr<DistanceProvider> provider);

    /**
     * @brief Run the pipeline and stage the result.
     *
     * Only pending orders without a route take part. Route ids come from
     * id_source when given, otherwise they are provisional (1..n).
     *
     * @throws PlanCancelled if token is cancelled at any stage
     * @throws PlanningError on any other unrecoverable failure
     */
    RoutePlan plan(const PlanningBatch& batch,
                   const CancellationToken* token = nullptr,
                   PlanStore* id_source = nullptr) const;

    /**
     * @brief plan() followed by a single all-or-nothing commit.
     * @return the committed plan; its summary is the batch report
     * @throws PlanningError when the store rejects the commit
     */
    RoutePlan plan_and_commit(const PlanningBatch& batch,
                              PlanStore& store,
                              const CancellationToken* token = nullptr) const;

    const PlannerConfig& config() const { return config_; }
    DistanceProvider& provider() const { return *provider_; }

private:
    RoutePlan run(const PlanningBatch& batch, const CancellationToken* token, PlanStore* id_source) const;

    PlannerConfig config_;
    std::shared_ptr<DistanceProvider> provider_;
};

}  // namespace fleetplan
