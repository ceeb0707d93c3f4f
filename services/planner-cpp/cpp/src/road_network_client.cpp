/**
 * @file road_network_client.cpp
 * @brief OSRM client implementation.
 */

#include "road_network_client.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <iomanip>
#include <mutex>
#include <sstream>

using json = nlohmann::json;

namespace fleetplan {

namespace {

std::once_flag g_curl_init;

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// GeoJSON LineString coordinates are [lon, lat].
Polyline parse_geojson_line(const json& geometry) {
    Polyline line;
    if (!geometry.is_object() || !geometry.contains("coordinates")) return line;
    for (const auto& c : geometry["coordinates"]) {
        if (c.is_array() && c.size() >= 2) {
            line.push_back({c[1].get<double>(), c[0].get<double>()});
        }
    }
    return line;
}

}  // namespace

OsrmClient::OsrmClient(OsrmClientOptions options) : options_(std::move(options)) {
    std::call_once(g_curl_init, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string OsrmClient::coordinate_string(const std::vector<GeoPoint>& points) const {
    // OSRM wants lon,lat pairs separated by ';'
    std::ostringstream ss;
    ss << std::setprecision(8);
    for (size_t i = 0; i < points.size(); ++i) {
        if (i > 0) ss << ';';
        ss << points[i].lon << ',' << points[i].lat;
    }
    return ss.str();
}

OsrmClient::HttpResponse OsrmClient::http_get(const std::string& url, long timeout_ms) const {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl init failed";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_OK) {
        response.transport_ok = true;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    } else {
        response.error = curl_easy_strerror(rc);
    }
    curl_easy_cleanup(curl);
    return response;
}

RoadRouteResult OsrmClient::route(const std::vector<GeoPoint>& points, bool with_geometry) {
    RoadRouteResult result;
    if (points.size() < 2) {
        result.error = "at least two points required";
        return result;
    }

    std::string url = options_.base_url + "/route/v1/" + options_.profile + "/" +
                      coordinate_string(points) +
                      (with_geometry ? "?overview=full&geometries=geojson&steps=false"
                                     : "?overview=false&steps=false");

    HttpResponse http = http_get(url, options_.request_timeout_ms);
    if (!http.transport_ok) {
        result.error = "OSRM request error: " + http.error;
        return result;
    }
    if (http.status != 200) {
        result.error = "OSRM route request failed: HTTP " + std::to_string(http.status);
        return result;
    }

    try {
        json data = json::parse(http.body);
        if (data.value("code", "") != "Ok" || !data.contains("routes") || data["routes"].empty()) {
            result.error = "OSRM route not found: " + data.value("code", std::string("?"));
            return result;
        }
        const json& r = data["routes"][0];
        result.distance_m = r.value("distance", 0.0);
        result.duration_s = r.value("duration", 0.0);
        if (with_geometry && r.contains("geometry")) {
            result.geometry = parse_geojson_line(r["geometry"]);
        }
        result.ok = true;
    } catch (const std::exception& e) {
        result.error = std::string("OSRM parse error: ") + e.what();
    }
    return result;
}

RoadTableResult OsrmClient::table(const std::vector<GeoPoint>& points) {
    RoadTableResult result;
    const size_t n = points.size();
    if (n == 0) {
        result.ok = true;
        return result;
    }

    std::string url = options_.base_url + "/table/v1/" + options_.profile + "/" +
                      coordinate_string(points) + "?annotations=distance,duration";

    HttpResponse http = http_get(url, options_.table_timeout_ms);
    if (!http.transport_ok) {
        result.error = "OSRM table request error: " + http.error;
        return result;
    }
    if (http.status != 200) {
        result.error = "OSRM table request failed: HTTP " + std::to_string(http.status);
        return result;
    }

    try {
        json data = json::parse(http.body);
        if (data.value("code", "") != "Ok" || !data.contains("distances") || !data.contains("durations")) {
            result.error = "OSRM table not found: " + data.value("code", std::string("?"));
            return result;
        }
        const json& distances = data["distances"];
        const json& durations = data["durations"];
        if (distances.size() != n || durations.size() != n) {
            result.error = "OSRM table has wrong dimensions";
            return result;
        }

        result.size = n;
        result.distances_m.assign(n * n, 0.0);
        result.durations_s.assign(n * n, 0.0);
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = 0; j < n; ++j) {
                const json& d = distances[i][j];
                const json& t = durations[i][j];
                // null means unreachable
                if (d.is_null() || t.is_null()) {
                    result.error = "OSRM table has unreachable cells";
                    return result;
                }
                result.distances_m[i * n + j] = d.get<double>();
                result.durations_s[i * n + j] = t.get<double>();
            }
        }
        result.ok = true;
    } catch (const std::exception& e) {
        result.error = std::string("OSRM parse error: ") + e.what();
    }
    return result;
}

}  // namespace fleetplan
