#pragma once

#include "Route.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace routesim {

class JsonCodec {
public:
    static Route parseRoute(const std::string& json);
    static Route jsonToRoute(const nlohmann::json& json);
    static Waypoint jsonToWaypoint(const nlohmann::json& json, size_t index);

    static Timestamp jsonToTimestamp(const nlohmann::json& json);
    static std::vector<Timestamp> jsonToTimestamps(const nlohmann::json& json);

    static nlohmann::json coordinateToJson(const Coordinate& coordinate);
    static nlohmann::json positionToJson(const SimulatedPosition& position);
    static nlohmann::json positionsToJson(const std::vector<SimulatedPosition>& positions);
    static nlohmann::json anomalyToJson(const Anomaly& anomaly);
    static nlohmann::json reportToJson(const AnalysisReport& report);

    static double roundTo(double value, int decimals);
};

} // namespace routesim
