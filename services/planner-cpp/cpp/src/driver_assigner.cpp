/**
 * @file driver_assigner.cpp
 * @brief Greedy load-balancing driver assignment.
 */

#include "driver_assigner.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <sstream>

namespace fleetplan {

namespace {

const std::vector<std::string> kRouteColors = {
    "#9b59b6",  // Purple
    "#e91e63",  // Pink
    "#00bcd4",  // Cyan
    "#4caf50",  // Green
    "#ff9800",  // Orange
    "#2196f3",  // Blue
    "#f44336",  // Red
    "#009688",  // Teal
    "#ffc107",  // Amber
    "#795548",  // Brown
    "#607d8b",  // Blue Grey
    "#9c27b0",  // Deep Purple
    "#ff5722",  // Deep Orange
    "#00acc1",  // Cyan
    "#8bc34a",  // Light Green
};

std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

}  // namespace

AssignmentStrategy parse_assignment_strategy(const std::string& s) {
    return s == "sequential" ? AssignmentStrategy::Sequential : AssignmentStrategy::Balanced;
}

const char* to_string(AssignmentStrategy s) {
    return s == AssignmentStrategy::Sequential ? "sequential" : "balanced";
}

std::string route_name_for(const std::string& driver_name, int route_index) {
    std::istringstream ss(driver_name);
    std::vector<std::string> words;
    std::string w;
    while (ss >> w) words.push_back(w);

    if (words.size() >= 2) {
        return upper(std::string(1, words[0][0]) + words[1][0]);
    }
    if (words.size() == 1) {
        return upper(words[0].substr(0, 2));
    }
    return "R" + std::to_string(route_index + 1);
}

const std::string& route_color(int route_index) {
    return kRouteColors[static_cast<size_t>(route_index) % kRouteColors.size()];
}

AssignmentResult assign_drivers(const std::vector<Cluster>& clusters,
                                const std::vector<Driver>& drivers,
                                AssignmentStrategy strategy) {
    AssignmentResult result;

    // One entry per driver id; the first listing wins.
    std::vector<Driver> candidates;
    std::set<int64_t> listed;
    for (const auto& d : drivers) {
        if (!listed.insert(d.id).second) {
            std::cerr << "Assigner: driver " << d.id << " listed twice, keeping the first entry" << std::endl;
            continue;
        }
        if (d.status != DriverStatus::Offline) candidates.push_back(d);
    }

    std::vector<size_t> cluster_order(clusters.size());
    for (size_t i = 0; i < clusters.size(); ++i) cluster_order[i] = i;

    if (strategy == AssignmentStrategy::Balanced) {
        std::stable_sort(cluster_order.begin(), cluster_order.end(), [&clusters](size_t a, size_t b) {
            if (clusters[a].size() != clusters[b].size()) return clusters[a].size() > clusters[b].size();
            return !clusters[a].order_ids.empty() && !clusters[b].order_ids.empty() &&
                   clusters[a].order_ids.front() < clusters[b].order_ids.front();
        });
    }

    // Running loads; a driver leaves the pool once used in this batch.
    std::vector<int> load(candidates.size());
    std::vector<bool> used(candidates.size(), false);
    for (size_t i = 0; i < candidates.size(); ++i) load[i] = std::max(0, candidates[i].current_load);

    for (size_t idx : cluster_order) {
        const Cluster& cluster = clusters[idx];

        size_t pick = candidates.size();
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (used[i]) continue;
            if (pick == candidates.size()) {
                pick = i;
                continue;
            }
            if (strategy == AssignmentStrategy::Balanced) {
                if (load[i] < load[pick] ||
                    (load[i] == load[pick] && candidates[i].id < candidates[pick].id)) {
                    pick = i;
                }
            } else if (candidates[i].id < candidates[pick].id) {
                pick = i;
            }
        }

        if (pick == candidates.size()) {
            result.unassigned.push_back(cluster);
            continue;
        }

        used[pick] = true;
        load[pick] += static_cast<int>(cluster.size());

        Assignment a;
        a.cluster = cluster;
        a.driver = candidates[pick];
        a.running_load = load[pick];
        a.route_index = static_cast<int>(result.assignments.size());
        a.route_name = route_name_for(a.driver.name, a.route_index);
        a.color = route_color(a.route_index);
        result.assignments.push_back(std::move(a));
    }

    if (!result.unassigned.empty()) {
        std::cerr << "Assigner: " << result.unassigned.size() << " clusters left without a driver ("
                  << candidates.size() << " drivers available)" << std::endl;
    }
    std::cout << "Assigner: " << result.assignments.size() << " clusters assigned ("
              << to_string(strategy) << ")" << std::endl;
    return result;
}

}  // namespace fleetplan
