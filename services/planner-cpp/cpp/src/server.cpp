/**
 * @file server.cpp
 * @brief HTTP server for the planning API using Crow framework.
 *
 * Plans batches of pending orders, serves itineraries and runs the drift
 * accept/reject workflow against the live route registry.
 */

#include "drift_monitor.hpp"
#include "json_io.hpp"
#include "ortools_solver.hpp"
#include "plan_store.hpp"
#include "planner_config.hpp"
#include "road_network_client.hpp"
#include "route_planner.hpp"
#include "route_synthesizer.hpp"
#include <crow.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <iostream>
#include <memory>
#include <mutex>

using json = nlohmann::json;
using namespace fleetplan;

// Server state
PlannerConfig g_config;
std::shared_ptr<DistanceProvider> g_provider;
std::shared_ptr<PlanStore> g_store;
// Set when the store is the in-memory one; request bodies seed it.
std::shared_ptr<InMemoryPlanStore> g_memory_store;
std::unique_ptr<ActiveRouteRegistry> g_registry;

// One planning batch at a time.
std::mutex g_plan_mutex;

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

crow::response json_response(int code, const json& body) {
    crow::response res(code, body.dump());
    res.set_header("Content-Type", "application/json");
    return res;
}

crow::response error_response(int code, const std::string& error) {
    return json_response(code, {{"success", false}, {"error", error}});
}

// Helper: Persist a route changed through the registry. Runs under the
// route's lock, so writes for one route reach the store in version order.
bool persist_route(const Route& route, std::string& error) {
    return g_store->save_route(route, error);
}

// Helper: HTTP status for a rejected registry change
int status_code(InsertionStatus status) {
    switch (status) {
        case InsertionStatus::UnknownRoute: return 404;
        case InsertionStatus::StaleVersion:
        case InsertionStatus::AlreadyScheduled:
        case InsertionStatus::RouteClosed: return 409;
        case InsertionStatus::NotPersisted: return 500;
        default: return 400;
    }
}

crow::response change_rejected(const InsertionResult& result) {
    return json_response(status_code(result.status), {
        {"success", false},
        {"status", to_string(result.status)},
        {"error", result.error}
    });
}

bool init_store() {
#ifdef FLEETPLAN_HAVE_DUCKDB
    if (!g_config.duckdb_path.empty()) {
        auto db = std::make_shared<DuckDbPlanStore>(g_config.duckdb_path);
        if (!db->open()) {
            std::cerr << "Failed to open DuckDB store: " << g_config.duckdb_path << "\n";
            return false;
        }
        g_store = db;
        return true;
    }
#else
    if (!g_config.duckdb_path.empty()) {
        std::cerr << "DuckDB support not compiled in, using in-memory store\n";
    }
#endif
    g_memory_store = std::make_shared<InMemoryPlanStore>();
    g_store = g_memory_store;
    return true;
}

int main(int argc, char* argv[]) {
    std::cout << "=== Fleet Route Planning Server ===\n\n";

    std::string config_path = "config/planner.json";  // Default config path
    bool use_config = false;

    // Config file first, flags override it.
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            use_config = true;
        } else if (arg == "--help") {
            std::cout << "Usage: fleetplan_server [options]\n"
                      << "  --config PATH      Config file (default: config/planner.json)\n"
                      << "  --port PORT        Server port (default: 8080)\n"
                      << "  --osrm URL         OSRM base URL (default: http://localhost:5000)\n"
                      << "  --no-road-network  Use great-circle estimates only\n"
                      << "  --no-solver        Always sequence with nearest neighbor\n"
                      << "  --index TYPE       Spatial index: rtree or h3 (default: rtree)\n"
                      << "  --duckdb PATH      DuckDB database for orders and routes\n";
            return 0;
        }
    }

    if (use_config && !load_config(config_path, g_config)) {
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            g_config.port = std::stoi(argv[++i]);
        } else if (arg == "--osrm" && i + 1 < argc) {
            g_config.osrm_url = argv[++i];
        } else if (arg == "--no-road-network") {
            g_config.road_network_enabled = false;
        } else if (arg == "--no-solver") {
            g_config.solver_enabled = false;
        } else if (arg == "--index" && i + 1 < argc) {
            g_config.index_type = argv[++i];
        } else if (arg == "--duckdb" && i + 1 < argc) {
            g_config.duckdb_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            ++i;
        }
    }

    std::string config_error;
    if (!apply_config(json::object(), g_config, config_error)) {
        std::cerr << "Invalid configuration: " << config_error << "\n";
        return 1;
    }

    std::shared_ptr<RoadNetworkBackend> backend;
    if (g_config.road_network_enabled) {
        backend = std::make_shared<OsrmClient>(osrm_options(g_config));
        std::cout << "  Road network: " << g_config.osrm_url << " (" << g_config.osrm_profile << ")\n";
    } else {
        std::cout << "  Road network: disabled, great-circle estimates only\n";
    }
    g_provider = std::make_shared<DistanceProvider>(backend, distance_options(g_config));

    std::cout << "  Solver: " << (solver_compiled_in() ? "OR-Tools" : "not compiled in")
              << (g_config.solver_enabled ? "" : " (disabled)") << "\n";

    if (!init_store()) {
        return 1;
    }

    g_registry = std::make_unique<ActiveRouteRegistry>(g_provider.get());
    g_registry->set_writer(persist_route);
    for (const auto& route : g_store->active_routes()) {
        g_registry->upsert(route);
    }
    std::cout << "  Active routes: " << g_registry->size() << "\n";

    // Create Crow app
    crow::SimpleApp app;

    // ============================================================
    // HEALTH ENDPOINT
    // ============================================================
    CROW_ROUTE(app, "/health")([]() {
        json response = {
            {"status", "healthy"},
            {"engine", "fleetplan"},
            {"road_network", g_config.road_network_enabled ? g_config.osrm_url : "disabled"},
            {"solver", solver_compiled_in() && g_config.solver_enabled},
            {"store", g_memory_store ? "memory" : "duckdb"},
            {"active_routes", g_registry->size()},
            {"unscheduled_pool", g_registry->pool_size()}
        };
        return json_response(200, response);
    });

    // ============================================================
    // PLAN ROUTES
    // ============================================================
    CROW_ROUTE(app, "/plan_routes").methods("POST"_method)([](const crow::request& req) {
        auto start_time = std::chrono::high_resolution_clock::now();

        try {
            json body = req.body.empty() ? json::object() : json::parse(req.body);

            // Per-request parameter overrides
            PlannerConfig config = g_config;
            if (body.contains("params")) {
                std::string error;
                if (!apply_config(body["params"], config, error)) {
                    return error_response(400, "invalid params: " + error);
                }
            }

            std::lock_guard<std::mutex> lock(g_plan_mutex);

            if (g_memory_store && body.contains("depot")) {
                PlanningBatch incoming = batch_from_json(body);
                g_memory_store->set_depot(incoming.depot);
                for (const auto& o : incoming.orders) {
                    if (!g_memory_store->find_order(o.id)) g_memory_store->put_order(o);
                }
                for (const auto& d : incoming.drivers) g_memory_store->put_driver(d);
                for (const auto& p : incoming.parking) g_memory_store->put_parking(p);
            }

            PlanningBatch batch;
            if (!g_store->load_batch(batch)) {
                return error_response(500, "could not load planning inputs");
            }
            batch.start_time = body.value("start_time", now_epoch());

            // Orders declined by drivers go back into planning.
            std::vector<Order> pooled = g_registry->take_unscheduled();
            if (g_memory_store) {
                for (const auto& o : pooled) g_memory_store->put_order(o);
                merge_orders(batch, pooled);
            } else if (!pooled.empty()) {
                std::cout << "Planner: " << pooled.size() << " declined orders stay pending in the database\n";
            }

            RoutePlanner planner(config, g_provider);
            CancellationToken token;
            RoutePlan plan = planner.plan_and_commit(batch, *g_store, &token);

            for (const auto& route : plan.routes) {
                g_registry->upsert(route);
            }

            json routes = json::array();
            for (size_t i = 0; i < plan.routes.size(); ++i) {
                json r = plan.routes[i];
                r["itinerary"] = plan.itineraries[i];
                r["geojson"] = to_geojson(plan.itineraries[i]);
                routes.push_back(r);
            }

            auto end_time = std::chrono::high_resolution_clock::now();
            double runtime_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

            json response = {
                {"success", true},
                {"routes", routes},
                {"summary", plan.summary},
                {"runtime_ms", runtime_ms}
            };
            return json_response(200, response);

        } catch (const PlanCancelled& e) {
            return error_response(409, e.what());
        } catch (const PlanningError& e) {
            return error_response(500, e.what());
        } catch (const std::exception& e) {
            return error_response(400, e.what());
        }
    });

    // ============================================================
    // ITINERARY
    // ============================================================
    CROW_ROUTE(app, "/routes/<int>/itinerary")([](const crow::request& req, int64_t route_id) {
        try {
            std::optional<Route> route = g_registry->snapshot(route_id);
            if (!route) route = g_store->find_route(route_id);
            if (!route) {
                return error_response(404, "route " + std::to_string(route_id) + " not found");
            }
            if (route->waypoints.empty() || route->waypoints.front().kind != WaypointKind::Depot) {
                return error_response(500, "route " + std::to_string(route_id) + " has no depot waypoint");
            }

            Depot depot;
            depot.id = route->waypoints.front().ref_id;
            depot.point = route->waypoints.front().point;

            int64_t start = req.url_params.get("start_time") ? std::stoll(req.url_params.get("start_time"))
                                                             : now_epoch();
            Itinerary itinerary = synthesize(depot, route->waypoints, *g_provider, start);

            json response = {
                {"success", true},
                {"route", *route},
                {"itinerary", itinerary},
                {"geojson", to_geojson(itinerary)}
            };
            return json_response(200, response);

        } catch (const std::exception& e) {
            return error_response(400, e.what());
        }
    });

    // ============================================================
    // ROUTE PROGRESS
    // ============================================================
    CROW_ROUTE(app, "/routes/<int>/progress").methods("POST"_method)([](const crow::request& req, int64_t route_id) {
        try {
            auto body = json::parse(req.body);
            RouteStatus status = parse_route_status(body.at("status").get<std::string>());
            int completed_stops = body.at("completed_stops").get<int>();

            InsertionResult result = g_registry->update_progress(route_id, status, completed_stops);
            if (!result.ok()) {
                return change_rejected(result);
            }

            json response = {
                {"success", true},
                {"route", *result.route},
                {"active_routes", g_registry->size()}
            };
            return json_response(200, response);

        } catch (const std::exception& e) {
            return error_response(400, e.what());
        }
    });

    // ============================================================
    // RE-SEQUENCE REMAINING STOPS
    // ============================================================
    CROW_ROUTE(app, "/routes/<int>/optimize").methods("POST"_method)([](const crow::request& req, int64_t route_id) {
        auto start_time = std::chrono::high_resolution_clock::now();

        try {
            PlannerConfig config = g_config;
            if (!req.body.empty()) {
                auto body = json::parse(req.body);
                if (body.contains("params")) {
                    std::string error;
                    if (!apply_config(body["params"], config, error)) {
                        return error_response(400, "invalid params: " + error);
                    }
                }
            }

            std::optional<Route> route = g_registry->snapshot(route_id);
            if (!route) {
                return error_response(404, "route " + std::to_string(route_id) + " is not active");
            }

            std::vector<int64_t> ids;
            for (const auto& w : route->waypoints) {
                if (w.kind == WaypointKind::Delivery) ids.push_back(w.ref_id);
            }
            if (ids.empty()) {
                return error_response(400, "route " + std::to_string(route_id) + " has no deliveries");
            }

            PlanningBatch inputs;
            if (!g_store->load_batch(inputs)) {
                std::cerr << "Optimize: no parking locations available for route " << route_id << "\n";
            }

            Route resequenced = resequence_remaining(*route, g_store->find_orders(ids), inputs.parking,
                                                     *g_provider, sequencer_options(config));
            InsertionResult result = g_registry->apply_resequence(resequenced, route->version);
            if (!result.ok()) {
                return change_rejected(result);
            }

            json order_ids = json::array();
            for (const auto& w : result.route->waypoints) {
                if (w.kind == WaypointKind::Delivery) order_ids.push_back(w.ref_id);
            }

            auto end_time = std::chrono::high_resolution_clock::now();
            double runtime_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

            json response = {
                {"success", true},
                {"route", *result.route},
                {"optimized_order_ids", order_ids},
                {"previous_distance_km", route->total_distance_km},
                {"runtime_ms", runtime_ms}
            };
            return json_response(200, response);

        } catch (const std::exception& e) {
            return error_response(400, e.what());
        }
    });

    // ============================================================
    // DRIFT: CANDIDATES
    // ============================================================
    CROW_ROUTE(app, "/drift/candidates").methods("POST"_method)([](const crow::request& req) {
        try {
            auto body = json::parse(req.body);
            Order order = body.at("order").get<Order>();
            double max_detour = body.value("max_detour_km", g_config.max_detour_km);

            auto candidates = find_insertion_candidates(order, g_registry->snapshots(), max_detour, *g_provider);

            json response = {
                {"success", true},
                {"order_id", order.id},
                {"max_detour_km", max_detour},
                {"candidates", candidates}
            };
            return json_response(200, response);

        } catch (const std::exception& e) {
            return error_response(400, e.what());
        }
    });

    // ============================================================
    // DRIFT: ACCEPT
    // ============================================================
    CROW_ROUTE(app, "/drift/accept").methods("POST"_method)([](const crow::request& req) {
        try {
            auto body = json::parse(req.body);
            InsertionCandidate candidate = body.get<InsertionCandidate>();
            Order order = body.at("order").get<Order>();

            InsertionResult result = g_registry->accept_insertion(candidate, order);
            if (!result.ok()) {
                return change_rejected(result);
            }

            // Orders that never went through the store are recorded now.
            if (g_memory_store && !g_memory_store->find_order(order.id)) {
                Order assigned = order;
                assigned.status = OrderStatus::Assigned;
                assigned.route_id = result.route->id;
                assigned.route_sequence = static_cast<int>(candidate.insertion_index);
                g_memory_store->put_order(assigned);
            }

            json response = {
                {"success", true},
                {"status", to_string(result.status)},
                {"route", *result.route}
            };
            return json_response(200, response);

        } catch (const std::exception& e) {
            return error_response(400, e.what());
        }
    });

    // ============================================================
    // DRIFT: REJECT
    // ============================================================
    CROW_ROUTE(app, "/drift/reject").methods("POST"_method)([](const crow::request& req) {
        try {
            auto body = json::parse(req.body);
            Order order = body.at("order").get<Order>();
            g_registry->reject_insertion(order);

            json response = {
                {"success", true},
                {"order_id", order.id},
                {"unscheduled_pool", g_registry->pool_size()}
            };
            return json_response(200, response);

        } catch (const std::exception& e) {
            return error_response(400, e.what());
        }
    });

    std::cout << "Starting Fleet Route Planning Server on " << g_config.host << ":" << g_config.port << "...\n";
    app.bindaddr(g_config.host).port(g_config.port).multithreaded().run();

    return 0;
}
