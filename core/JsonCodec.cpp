#include "JsonCodec.hpp"
#include "Errors.hpp"
#include "Iso8601.hpp"
#include <cmath>

namespace routesim {

namespace {

const nlohmann::json* findField(const nlohmann::json& json, const char* name, const char* alias) {
    if (json.contains(name)) return &json.at(name);
    if (alias != nullptr && json.contains(alias)) return &json.at(alias);
    return nullptr;
}

double requireNumber(const nlohmann::json& json, const char* name, const char* alias, size_t index) {
    const auto* field = findField(json, name, alias);
    if (field == nullptr) {
        throw SchemaError("Waypoint " + std::to_string(index) + ": missing '" + name + "'");
    }
    if (!field->is_number()) {
        throw SchemaError("Waypoint " + std::to_string(index) + ": '" + name + "' must be a number");
    }
    return field->get<double>();
}

std::optional<double> optionalNumber(const nlohmann::json& json, const char* name, size_t index) {
    if (!json.contains(name) || json.at(name).is_null()) {
        return std::nullopt;
    }
    if (!json.at(name).is_number()) {
        throw SchemaError("Waypoint " + std::to_string(index) + ": '" + name + "' must be a number");
    }
    return json.at(name).get<double>();
}

} // namespace

Route JsonCodec::parseRoute(const std::string& json) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw SchemaError(std::string("Route is not valid JSON: ") + e.what());
    }
    return jsonToRoute(parsed);
}

Route JsonCodec::jsonToRoute(const nlohmann::json& json) {
    const nlohmann::json* waypoints = &json;
    if (json.is_object()) {
        if (!json.contains("waypoints")) {
            throw SchemaError("Route object has no 'waypoints' array");
        }
        waypoints = &json.at("waypoints");
    }
    if (!waypoints->is_array()) {
        throw SchemaError("'waypoints' must be an array");
    }

    Route route;
    for (size_t i = 0; i < waypoints->size(); ++i) {
        route.append(jsonToWaypoint(waypoints->at(i), i));
    }
    return route;
}

Waypoint JsonCodec::jsonToWaypoint(const nlohmann::json& json, size_t index) {
    if (!json.is_object()) {
        throw SchemaError("Waypoint " + std::to_string(index) + ": expected an object");
    }

    Coordinate coordinate;
    coordinate.lat = requireNumber(json, "latitude", "lat", index);
    coordinate.lon = requireNumber(json, "longitude", "lon", index);

    if (!json.contains("timestamp")) {
        throw SchemaError("Waypoint " + std::to_string(index) + ": missing 'timestamp'");
    }
    Timestamp timestamp;
    try {
        timestamp = jsonToTimestamp(json.at("timestamp"));
    } catch (const std::invalid_argument& e) {
        throw SchemaError("Waypoint " + std::to_string(index) + ": " + e.what());
    }

    std::string id = "wp-" + std::to_string(index + 1);
    if (json.contains("id")) {
        const auto& rawId = json.at("id");
        if (rawId.is_string()) {
            id = rawId.get<std::string>();
        } else if (rawId.is_number_integer()) {
            id = std::to_string(rawId.get<long long>());
        } else if (!rawId.is_null()) {
            throw SchemaError("Waypoint " + std::to_string(index) + ": 'id' must be a string or integer");
        }
    }

    Waypoint waypoint(id, coordinate, timestamp);

    if (auto altitude = optionalNumber(json, "altitude", index)) {
        waypoint.withAltitude(*altitude);
    }
    if (auto speed = optionalNumber(json, "speed", index)) {
        waypoint.withSpeed(*speed);
    }
    if (json.contains("sequence") && !json.at("sequence").is_null()) {
        if (!json.at("sequence").is_number_integer()) {
            throw SchemaError("Waypoint " + std::to_string(index) + ": 'sequence' must be an integer");
        }
        waypoint.withSequence(json.at("sequence").get<int>());
    }
    if (json.contains("original_address") && !json.at("original_address").is_null()) {
        if (!json.at("original_address").is_string()) {
            throw SchemaError("Waypoint " + std::to_string(index) + ": 'original_address' must be a string");
        }
        waypoint.withAddress(json.at("original_address").get<std::string>());
    }
    if (json.contains("is_parking")) {
        if (!json.at("is_parking").is_boolean()) {
            throw SchemaError("Waypoint " + std::to_string(index) + ": 'is_parking' must be a boolean");
        }
        waypoint.withParking(json.at("is_parking").get<bool>());
    }

    return waypoint;
}

Timestamp JsonCodec::jsonToTimestamp(const nlohmann::json& json) {
    if (json.is_number()) {
        return fromEpochSeconds(json.get<double>());
    }
    if (json.is_string()) {
        return parseIso8601(json.get<std::string>());
    }
    throw std::invalid_argument("timestamp must be an ISO-8601 string or epoch seconds");
}

std::vector<Timestamp> JsonCodec::jsonToTimestamps(const nlohmann::json& json) {
    if (!json.is_array()) {
        throw SchemaError("'timestamps' must be an array");
    }
    std::vector<Timestamp> timestamps;
    timestamps.reserve(json.size());
    for (size_t i = 0; i < json.size(); ++i) {
        try {
            timestamps.push_back(jsonToTimestamp(json.at(i)));
        } catch (const std::invalid_argument& e) {
            throw SchemaError("Timestamp " + std::to_string(i) + ": " + e.what());
        }
    }
    return timestamps;
}

nlohmann::json JsonCodec::coordinateToJson(const Coordinate& coordinate) {
    nlohmann::json j;
    j["latitude"] = roundTo(coordinate.lat, 6);
    j["longitude"] = roundTo(coordinate.lon, 6);
    return j;
}

nlohmann::json JsonCodec::positionToJson(const SimulatedPosition& position) {
    nlohmann::json j;
    j["position"] = coordinateToJson(position.coordinate);
    j["timestamp"] = formatIso8601(position.timestamp);
    j["interpolated"] = position.interpolated;
    j["source"] = positionSourceToString(position.source);
    j["status"] = movementStatusToString(position.status);

    j["movement_data"] = {
        {"speed_ms", roundTo(position.speed, 2)},
        {"speed_kmh", roundTo(position.speed * 3.6, 2)},
        {"bearing", roundTo(position.bearing, 1)},
        {"heading", position.heading}
    };

    const auto& p = position.progress;
    j["route_progress"] = {
        {"segment_index", p.segmentIndex},
        {"segment_progress_percent", roundTo(p.segmentProgressPercent, 2)},
        {"overall_progress_percent", roundTo(p.overallProgressPercent, 2)},
        {"completed_waypoints", p.completedWaypoints},
        {"total_waypoints", p.totalWaypoints},
        {"remaining_waypoints", p.remainingWaypoints}
    };
    j["eta"] = {
        {"seconds_to_next_waypoint", roundTo(p.secondsToNextWaypoint, 3)},
        {"seconds_to_destination", roundTo(p.secondsToDestination, 3)}
    };
    j["distance"] = {
        {"to_next_waypoint_m", std::llround(p.distanceToNextWaypointMeters)}
    };
    return j;
}

nlohmann::json JsonCodec::positionsToJson(const std::vector<SimulatedPosition>& positions) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& position : positions) {
        j.push_back(positionToJson(position));
    }
    return j;
}

nlohmann::json JsonCodec::anomalyToJson(const Anomaly& anomaly) {
    nlohmann::json j;
    j["kind"] = anomalyKindToString(anomaly.kind);
    j["waypoint_indices"] = anomaly.waypointIndices;
    j["severity"] = severityToString(anomaly.severity);
    j["message"] = anomaly.message;
    return j;
}

nlohmann::json JsonCodec::reportToJson(const AnalysisReport& report) {
    nlohmann::json j;
    j["valid"] = report.valid;
    j["total_waypoints"] = report.waypointCount;
    j["total_distance_m"] = std::llround(report.totalDistanceMeters);
    j["total_distance_km"] = roundTo(report.totalDistanceMeters / 1000.0, 3);
    j["duration_seconds"] = roundTo(report.durationSeconds, 3);

    j["speed_analysis"] = {
        {"average_speed_ms", roundTo(report.averageSpeedMps, 2)},
        {"max_speed_ms", roundTo(report.maxSpeedMps, 2)},
        {"min_speed_ms", roundTo(report.minSpeedMps, 2)},
        {"median_speed_ms", roundTo(report.medianSpeedMps, 2)},
        {"speed_distribution", {
            {"0-20_kmh", report.speedDistribution.below20Kph},
            {"20-40_kmh", report.speedDistribution.from20To40Kph},
            {"40-60_kmh", report.speedDistribution.from40To60Kph},
            {"60+_kmh", report.speedDistribution.above60Kph}
        }}
    };

    nlohmann::json anomalies = nlohmann::json::array();
    for (const auto& anomaly : report.anomalies) {
        anomalies.push_back(anomalyToJson(anomaly));
    }
    j["anomalies"] = anomalies;
    j["error_count"] = report.errorCount();
    j["warning_count"] = report.warningCount();

    nlohmann::json segments = nlohmann::json::array();
    for (const auto& s : report.segments) {
        segments.push_back({
            {"segment_number", s.index + 1},
            {"from_sequence", s.fromSequence},
            {"to_sequence", s.toSequence},
            {"distance_m", std::llround(s.distanceMeters)},
            {"duration_seconds", roundTo(s.durationSeconds, 3)},
            {"speed_ms", roundTo(s.speedMps, 2)},
            {"bearing", roundTo(s.bearing, 1)},
            {"is_parking", s.isParking}
        });
    }
    j["segments"] = segments;

    if (report.bounds) {
        j["route_bounds"] = {
            {"northeast", coordinateToJson(report.bounds->northEast)},
            {"southwest", coordinateToJson(report.bounds->southWest)},
            {"center", coordinateToJson(report.bounds->center)}
        };
    } else {
        j["route_bounds"] = nullptr;
    }

    j["parking_stops"] = report.parkingStops;
    return j;
}

double JsonCodec::roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace routesim
