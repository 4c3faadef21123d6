#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace routesim {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

Timestamp fromEpochSeconds(double seconds);
double toEpochSeconds(Timestamp ts);
double secondsBetween(Timestamp from, Timestamp to);

struct Coordinate {
    double lat = 0.0;
    double lon = 0.0;

    bool operator==(const Coordinate& other) const {
        return lat == other.lat && lon == other.lon;
    }
    bool operator!=(const Coordinate& other) const { return !(*this == other); }
};

class Waypoint {
public:
    Waypoint(std::string id, Coordinate coordinate, Timestamp timestamp);

    const std::string& id() const { return id_; }
    const Coordinate& coordinate() const { return coordinate_; }
    Timestamp timestamp() const { return timestamp_; }

    const std::optional<double>& altitude() const { return altitude_; }
    const std::optional<double>& speed() const { return speed_; }
    const std::optional<int>& sequence() const { return sequence_; }
    const std::optional<std::string>& address() const { return address_; }
    bool isParking() const { return isParking_; }

    Waypoint& withAltitude(double meters) { altitude_ = meters; return *this; }
    Waypoint& withSpeed(double mps) { speed_ = mps; return *this; }
    Waypoint& withSequence(int sequence) { sequence_ = sequence; return *this; }
    Waypoint& withAddress(std::string address) { address_ = std::move(address); return *this; }
    Waypoint& withParking(bool parking) { isParking_ = parking; return *this; }

private:
    std::string id_;
    Coordinate coordinate_;
    Timestamp timestamp_;
    std::optional<double> altitude_;
    std::optional<double> speed_;
    std::optional<int> sequence_;
    std::optional<std::string> address_;
    bool isParking_ = false;
};

class Route {
public:
    Route() = default;
    explicit Route(std::vector<Waypoint> waypoints) : waypoints_(std::move(waypoints)) {}

    void append(Waypoint waypoint) { waypoints_.push_back(std::move(waypoint)); }

    const std::vector<Waypoint>& waypoints() const { return waypoints_; }
    const Waypoint& operator[](size_t index) const { return waypoints_[index]; }
    const Waypoint& front() const { return waypoints_.front(); }
    const Waypoint& back() const { return waypoints_.back(); }
    size_t size() const { return waypoints_.size(); }
    bool empty() const { return waypoints_.empty(); }

    std::vector<Waypoint>::const_iterator begin() const { return waypoints_.begin(); }
    std::vector<Waypoint>::const_iterator end() const { return waypoints_.end(); }

    // True when timestamps never decrease from one waypoint to the next.
    bool isTimeOrdered() const;

    // Copy ordered by timestamp; waypoints with equal timestamps keep their order.
    Route sortedByTime() const;

private:
    std::vector<Waypoint> waypoints_;
};

enum class PositionSource {
    Interpolated,
    ExtrapolatedBefore,
    ExtrapolatedAfter,
    ExactMatch
};

enum class MovementStatus {
    Moving,
    Parked,
    NotStarted,
    Completed
};

struct RouteProgress {
    size_t segmentIndex = 0;
    double segmentProgressPercent = 0.0;
    double overallProgressPercent = 0.0;
    size_t completedWaypoints = 0;
    size_t totalWaypoints = 0;
    size_t remainingWaypoints = 0;
    double secondsToNextWaypoint = 0.0;
    double secondsToDestination = 0.0;
    double distanceToNextWaypointMeters = 0.0;
};

struct SimulatedPosition {
    Coordinate coordinate;
    Timestamp timestamp;
    bool interpolated = false;
    double bearing = 0.0;
    double speed = 0.0;
    PositionSource source = PositionSource::Interpolated;

    std::string heading;
    MovementStatus status = MovementStatus::Parked;
    RouteProgress progress;
};

enum class AnomalyKind {
    NonMonotonicTime,
    DuplicateTimestamp,
    Teleport,
    StationaryGap,
    OutOfBounds
};

enum class Severity {
    Warning,
    Error
};

struct Anomaly {
    AnomalyKind kind;
    std::vector<size_t> waypointIndices;
    Severity severity;
    std::string message;
};

struct SegmentSummary {
    size_t index = 0;
    int fromSequence = 0;
    int toSequence = 0;
    double distanceMeters = 0.0;
    double durationSeconds = 0.0;
    double speedMps = 0.0;
    double bearing = 0.0;
    bool isParking = false;
};

struct SpeedDistribution {
    size_t below20Kph = 0;
    size_t from20To40Kph = 0;
    size_t from40To60Kph = 0;
    size_t above60Kph = 0;
};

struct RouteBounds {
    Coordinate northEast;
    Coordinate southWest;
    Coordinate center;
};

struct AnalysisReport {
    double totalDistanceMeters = 0.0;
    double durationSeconds = 0.0;
    double averageSpeedMps = 0.0;
    double maxSpeedMps = 0.0;
    std::vector<Anomaly> anomalies;
    bool valid = true;

    size_t waypointCount = 0;
    double minSpeedMps = 0.0;
    double medianSpeedMps = 0.0;
    std::vector<SegmentSummary> segments;
    SpeedDistribution speedDistribution;
    std::optional<RouteBounds> bounds;
    std::vector<size_t> parkingStops;

    size_t errorCount() const;
    size_t warningCount() const;
};

std::string positionSourceToString(PositionSource source);
std::string movementStatusToString(MovementStatus status);
std::string anomalyKindToString(AnomalyKind kind);
std::string severityToString(Severity severity);

} // namespace routesim
