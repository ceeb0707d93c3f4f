/**
 * @file json_io.hpp
 * @brief nlohmann::json conversions for the domain types.
 *
 * Points are written as {"lat", "lon"} objects; orders, drivers and
 * locations also accept flat "lat"/"lon" members on input. Enums travel as
 * their lower-case names. Decoding throws nlohmann::json::exception on
 * missing ids or wrong types, std::invalid_argument for a depot or parking
 * location without coordinates.
 */

#pragma once

#include "drift_monitor.hpp"
#include "geo_types.hpp"
#include "route_plan.hpp"
#include "route_synthesizer.hpp"

#include <nlohmann/json.hpp>

namespace fleetplan {

void to_json(nlohmann::json& j, const GeoPoint& p);
void from_json(const nlohmann::json& j, GeoPoint& p);

void to_json(nlohmann::json& j, const TimeWindow& w);
void from_json(const nlohmann::json& j, TimeWindow& w);

void to_json(nlohmann::json& j, const Order& o);
void from_json(const nlohmann::json& j, Order& o);

void to_json(nlohmann::json& j, const Driver& d);
void from_json(const nlohmann::json& j, Driver& d);

void to_json(nlohmann::json& j, const NamedPoint& p);
void from_json(const nlohmann::json& j, NamedPoint& p);

void to_json(nlohmann::json& j, const Waypoint& w);
void from_json(const nlohmann::json& j, Waypoint& w);

void to_json(nlohmann::json& j, const Route& r);
void from_json(const nlohmann::json& j, Route& r);

void to_json(nlohmann::json& j, const PlanSummary& s);

void to_json(nlohmann::json& j, const InsertionCandidate& c);
void from_json(const nlohmann::json& j, InsertionCandidate& c);

void to_json(nlohmann::json& j, const Itinerary& it);

/**
 * @brief Decode a plan request body: {depot, orders, drivers, parking?, start_time?}.
 */
PlanningBatch batch_from_json(const nlohmann::json& body);

}  // namespace fleetplan
