/**
 * @file driver_assigner.hpp
 * @brief Bind clusters to drivers, one cluster per driver per batch.
 */

#pragma once

#include "geo_clusterer.hpp"
#include "geo_types.hpp"

#include <string>
#include <vector>

namespace fleetplan {

enum class AssignmentStrategy {
    Balanced,
    Sequential
};

AssignmentStrategy parse_assignment_strategy(const std::string& s);
const char* to_string(AssignmentStrategy s);

struct Assignment {
    Cluster cluster;
    Driver driver;
    // Driver load after this assignment.
    int running_load = 0;
    int route_index = 0;
    std::string route_name;
    std::string color;
};

struct AssignmentResult {
    std::vector<Assignment> assignments;
    std::vector<Cluster> unassigned;
};

/**
 * @brief Short display name from the driver's initials.
 *
 * "Michael Schneider" -> "MS", "Anna" -> "AN", "" -> "R{index+1}".
 */
std::string route_name_for(const std::string& driver_name, int route_index);

/**
 * @brief Palette color for the n-th route of a plan.
 */
const std::string& route_color(int route_index);

/**
 * @brief Assign clusters to non-offline drivers.
 *
 * Balanced: largest cluster first to the least-loaded driver (greedy, not
 * a global optimum). Sequential: clusters in input order to drivers in id
 * order. Clusters left over when drivers run out are returned unassigned.
 */
AssignmentResult assign_drivers(const std::vector<Cluster>& clusters,
                                const std::vector<Driver>& drivers,
                                AssignmentStrategy strategy = AssignmentStrategy::Balanced);

}  // namespace fleetplan
