#include "Route.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace routesim {

Timestamp fromEpochSeconds(double seconds) {
    return Timestamp(std::chrono::milliseconds(std::llround(seconds * 1000.0)));
}

double toEpochSeconds(Timestamp ts) {
    return static_cast<double>(ts.time_since_epoch().count()) / 1000.0;
}

double secondsBetween(Timestamp from, Timestamp to) {
    return std::chrono::duration<double>(to - from).count();
}

Waypoint::Waypoint(std::string id, Coordinate coordinate, Timestamp timestamp)
    : id_(std::move(id)), coordinate_(coordinate), timestamp_(timestamp) {
    if (!std::isfinite(coordinate.lat) || !std::isfinite(coordinate.lon)) {
        throw InvalidCoordinateError("Waypoint '" + id_ + "' has a non-finite coordinate");
    }
}

bool Route::isTimeOrdered() const {
    return std::is_sorted(waypoints_.begin(), waypoints_.end(),
                          [](const Waypoint& a, const Waypoint& b) {
                              return a.timestamp() < b.timestamp();
                          });
}

Route Route::sortedByTime() const {
    std::vector<Waypoint> sorted = waypoints_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Waypoint& a, const Waypoint& b) {
                         return a.timestamp() < b.timestamp();
                     });
    return Route(std::move(sorted));
}

size_t AnalysisReport::errorCount() const {
    return static_cast<size_t>(std::count_if(anomalies.begin(), anomalies.end(),
        [](const Anomaly& a) { return a.severity == Severity::Error; }));
}

size_t AnalysisReport::warningCount() const {
    return static_cast<size_t>(std::count_if(anomalies.begin(), anomalies.end(),
        [](const Anomaly& a) { return a.severity == Severity::Warning; }));
}

std::string positionSourceToString(PositionSource source) {
    static const std::unordered_map<PositionSource, std::string> sourceMap = {
        {PositionSource::Interpolated, "INTERPOLATED"},
        {PositionSource::ExtrapolatedBefore, "EXTRAPOLATED_BEFORE"},
        {PositionSource::ExtrapolatedAfter, "EXTRAPOLATED_AFTER"},
        {PositionSource::ExactMatch, "EXACT_MATCH"}
    };

    auto it = sourceMap.find(source);
    return (it != sourceMap.end()) ? it->second : "unknown";
}

std::string movementStatusToString(MovementStatus status) {
    static const std::unordered_map<MovementStatus, std::string> statusMap = {
        {MovementStatus::Moving, "moving"},
        {MovementStatus::Parked, "parked"},
        {MovementStatus::NotStarted, "not_started"},
        {MovementStatus::Completed, "completed"}
    };

    auto it = statusMap.find(status);
    return (it != statusMap.end()) ? it->second : "unknown";
}

std::string anomalyKindToString(AnomalyKind kind) {
    static const std::unordered_map<AnomalyKind, std::string> kindMap = {
        {AnomalyKind::NonMonotonicTime, "NON_MONOTONIC_TIME"},
        {AnomalyKind::DuplicateTimestamp, "DUPLICATE_TIMESTAMP"},
        {AnomalyKind::Teleport, "TELEPORT"},
        {AnomalyKind::StationaryGap, "STATIONARY_GAP"},
        {AnomalyKind::OutOfBounds, "OUT_OF_BOUNDS"}
    };

    auto it = kindMap.find(kind);
    return (it != kindMap.end()) ? it->second : "unknown";
}

std::string severityToString(Severity severity) {
    return severity == Severity::Error ? "error" : "warning";
}

} // namespace routesim
