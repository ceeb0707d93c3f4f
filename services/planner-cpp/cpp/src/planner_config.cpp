/**
 * @file planner_config.cpp
 * @brief Config file parsing.
 */

#include "planner_config.hpp"

#include <fstream>
#include <iostream>

namespace fleetplan {

using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& j, const char* key, T& out) {
    if (j.contains(key)) out = j.at(key).get<T>();
}

}  // namespace

bool apply_config(const json& j, PlannerConfig& config, std::string& error) {
    if (!j.is_object()) {
        error = "config must be a JSON object";
        return false;
    }

    PlannerConfig c = config;
    try {
        read_key(j, "port", c.port);
        read_key(j, "host", c.host);

        read_key(j, "osrm_url", c.osrm_url);
        read_key(j, "road_network_enabled", c.road_network_enabled);
        read_key(j, "osrm_profile", c.osrm_profile);
        read_key(j, "request_timeout_ms", c.request_timeout_ms);
        read_key(j, "table_timeout_ms", c.table_timeout_ms);
        read_key(j, "service_retry_after_s", c.service_retry_after_s);
        read_key(j, "average_speed_kmh", c.average_speed_kmh);
        read_key(j, "city_buffer", c.city_buffer);

        read_key(j, "max_radius_km", c.max_radius_km);
        read_key(j, "min_orders_per_route", c.min_orders_per_route);
        read_key(j, "max_orders_per_route", c.max_orders_per_route);
        read_key(j, "index_type", c.index_type);
        read_key(j, "cluster_on_road_distance", c.cluster_on_road_distance);
        read_key(j, "assignment_strategy", c.assignment_strategy);

        read_key(j, "solver_enabled", c.solver_enabled);
        read_key(j, "solver_time_limit_ms", c.solver_time_limit_ms);
        read_key(j, "priority_weight", c.priority_weight);
        read_key(j, "parking_max_walk_km", c.parking_max_walk_km);
        read_key(j, "sequencing_threads", c.sequencing_threads);

        read_key(j, "max_detour_km", c.max_detour_km);
        read_key(j, "duckdb_path", c.duckdb_path);
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }

    if (c.port <= 0 || c.port > 65535) {
        error = "port out of range";
        return false;
    }
    if (c.average_speed_kmh <= 0.0) {
        error = "average_speed_kmh must be positive";
        return false;
    }
    if (c.max_radius_km <= 0.0) {
        error = "max_radius_km must be positive";
        return false;
    }
    if (c.min_orders_per_route < 1 || c.max_orders_per_route < c.min_orders_per_route) {
        error = "need 1 <= min_orders_per_route <= max_orders_per_route";
        return false;
    }
    if (c.sequencing_threads < 1) {
        error = "sequencing_threads must be at least 1";
        return false;
    }
    if (c.index_type != "rtree" && c.index_type != "h3") {
        error = "index_type must be 'rtree' or 'h3'";
        return false;
    }
    if (c.assignment_strategy != "balanced" && c.assignment_strategy != "sequential") {
        error = "assignment_strategy must be 'balanced' or 'sequential'";
        return false;
    }

    config = c;
    return true;
}

bool load_config(const std::string& config_path, PlannerConfig& config) {
    std::ifstream file(config_path);
    if (!file) {
        std::cerr << "Config file not found: " << config_path << "\n";
        return false;
    }

    try {
        json j = json::parse(file);
        std::string error;
        if (!apply_config(j, config, error)) {
            std::cerr << "Error in config " << config_path << ": " << error << "\n";
            return false;
        }
        std::cout << "Loaded config from: " << config_path << "\n";
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

json config_to_json(const PlannerConfig& c) {
    return {
        {"port", c.port},
        {"host", c.host},
        {"osrm_url", c.osrm_url},
        {"road_network_enabled", c.road_network_enabled},
        {"osrm_profile", c.osrm_profile},
        {"request_timeout_ms", c.request_timeout_ms},
        {"table_timeout_ms", c.table_timeout_ms},
        {"service_retry_after_s", c.service_retry_after_s},
        {"average_speed_kmh", c.average_speed_kmh},
        {"city_buffer", c.city_buffer},
        {"max_radius_km", c.max_radius_km},
        {"min_orders_per_route", c.min_orders_per_route},
        {"max_orders_per_route", c.max_orders_per_route},
        {"index_type", c.index_type},
        {"cluster_on_road_distance", c.cluster_on_road_distance},
        {"assignment_strategy", c.assignment_strategy},
        {"solver_enabled", c.solver_enabled},
        {"solver_time_limit_ms", c.solver_time_limit_ms},
        {"priority_weight", c.priority_weight},
        {"parking_max_walk_km", c.parking_max_walk_km},
        {"sequencing_threads", c.sequencing_threads},
        {"max_detour_km", c.max_detour_km},
        {"duckdb_path", c.duckdb_path}
    };
}

OsrmClientOptions osrm_options(const PlannerConfig& c) {
    OsrmClientOptions o;
    o.base_url = c.osrm_url;
    o.profile = c.osrm_profile;
    o.request_timeout_ms = c.request_timeout_ms;
    o.table_timeout_ms = c.table_timeout_ms;
    return o;
}

DistanceProviderOptions distance_options(const PlannerConfig& c) {
    DistanceProviderOptions o;
    o.average_speed_kmh = c.average_speed_kmh;
    o.city_buffer = c.city_buffer;
    o.service_retry_after_s = c.service_retry_after_s;
    return o;
}

ClusteringOptions clustering_options(const PlannerConfig& c) {
    ClusteringOptions o;
    o.max_radius_km = c.max_radius_km;
    o.min_size = c.min_orders_per_route;
    o.max_size = c.max_orders_per_route;
    o.index_type = parse_index_type(c.index_type);
    o.road_distance = c.cluster_on_road_distance;
    return o;
}

SequencerOptions sequencer_options(const PlannerConfig& c) {
    SequencerOptions o;
    o.solver_enabled = c.solver_enabled;
    o.solver_time_limit_ms = c.solver_time_limit_ms;
    o.priority_weight = c.priority_weight;
    o.parking_max_walk_km = c.parking_max_walk_km;
    return o;
}

AssignmentStrategy assignment_strategy(const PlannerConfig& c) {
    return parse_assignment_strategy(c.assignment_strategy);
}

}  // namespace fleetplan
