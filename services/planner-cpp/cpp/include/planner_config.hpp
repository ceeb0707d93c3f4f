/**
 * @file planner_config.hpp
 * @brief Planner and server settings: in-code defaults, JSON config file,
 *        and the option structs handed to each component.
 */

#pragma once

#include "distance_provider.hpp"
#include "driver_assigner.hpp"
#include "geo_clusterer.hpp"
#include "road_network_client.hpp"
#include "stop_sequencer.hpp"

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace fleetplan {

struct PlannerConfig {
    // Server
    int port = 8080;
    std::string host = "0.0.0.0";

    // Road network
    std::string osrm_url = "http://localhost:5000";
    bool road_network_enabled = true;
    std::string osrm_profile = "driving";
    long request_timeout_ms = 5000;
    long table_timeout_ms = 10000;
    int service_retry_after_s = 30;
    double average_speed_kmh = 50.0;
    double city_buffer = 1.3;

    // Clustering / assignment
    double max_radius_km = 10.0;
    int min_orders_per_route = 3;
    int max_orders_per_route = 40;
    std::string index_type = "rtree";
    bool cluster_on_road_distance = true;
    std::string assignment_strategy = "balanced";

    // Sequencing
    bool solver_enabled = true;
    int solver_time_limit_ms = 5000;
    int64_t priority_weight = 1000;
    double parking_max_walk_km = 0.3;
    int sequencing_threads = 4;

    // Drift
    double max_detour_km = 5.0;

    // Empty: in-memory store
    std::string duckdb_path;
};

/**
 * @brief Overlay the keys present in j onto config. Unknown keys are
 *        ignored.
 * @return false (config untouched, error set) on a type or range error
 */
bool apply_config(const nlohmann::json& j, PlannerConfig& config, std::string& error);

/**
 * @brief Read a JSON config file and apply it.
 */
bool load_config(const std::string& config_path, PlannerConfig& config);

nlohmann::json config_to_json(const PlannerConfig& config);

// ========== COMPONENT OPTIONS ==========

OsrmClientOptions osrm_options(const PlannerConfig& config);
DistanceProviderOptions distance_options(const PlannerConfig& config);
ClusteringOptions clustering_options(const PlannerConfig& config);
SequencerOptions sequencer_options(const PlannerConfig& config);
AssignmentStrategy assignment_strategy(const PlannerConfig& config);

}  // namespace fleetplan
