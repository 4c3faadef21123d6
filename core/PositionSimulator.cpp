#include "PositionSimulator.hpp"
#include "Errors.hpp"
#include "Geo.hpp"
#include <algorithm>
#include <optional>

namespace routesim {

namespace {

// Sorted copy of the route only when the caller's route is out of order.
const Route& orderedView(const Route& route, std::optional<Route>& storage) {
    if (route.isTimeOrdered()) {
        return route;
    }
    storage = route.sortedByTime();
    return *storage;
}

} // namespace

PositionSimulator::PositionSimulator(SimulationConfig config)
    : config_(config), interpolator_(config.interpolation) {
}

SimulatedPosition PositionSimulator::simulateOne(const Route& route, Timestamp timestamp) const {
    requireWaypoints(route);

    std::optional<Route> storage;
    const Route& ordered = orderedView(route, storage);
    return simulateAt(ordered, timestamp, upperBound(ordered, timestamp));
}

std::vector<SimulatedPosition> PositionSimulator::simulateBatch(const Route& route,
                                                                const std::vector<Timestamp>& timestamps) const {
    requireWaypoints(route);

    std::optional<Route> storage;
    const Route& ordered = orderedView(route, storage);

    std::vector<SimulatedPosition> results;
    results.reserve(timestamps.size());

    bool sortedQueries = std::is_sorted(timestamps.begin(), timestamps.end());
    size_t cursor = 0;

    for (const auto& ts : timestamps) {
        size_t upper;
        if (sortedQueries) {
            while (cursor < ordered.size() && ordered[cursor].timestamp() <= ts) {
                ++cursor;
            }
            upper = cursor;
        } else {
            upper = upperBound(ordered, ts);
        }
        results.push_back(simulateAt(ordered, ts, upper));
    }

    return results;
}

SimulatedPosition PositionSimulator::simulateAt(const Route& ordered, Timestamp timestamp, size_t upper) const {
    const size_t n = ordered.size();
    const Waypoint& first = ordered.front();
    const Waypoint& last = ordered.back();

    SimulatedPosition position;
    position.timestamp = timestamp;
    position.progress.totalWaypoints = n;
    position.progress.secondsToDestination = std::max(0.0, secondsBetween(timestamp, last.timestamp()));

    if (upper == 0) {
        // Before the first sample: hold the first waypoint, report the first leg's motion
        position.coordinate = first.coordinate();
        position.source = PositionSource::ExtrapolatedBefore;
        position.status = MovementStatus::NotStarted;
        if (n >= 2) {
            auto leg = interpolator_.interpolate(ordered[0], ordered[1], first.timestamp());
            position.speed = leg.speedMps;
            position.bearing = leg.bearing;
        }
        position.progress.remainingWaypoints = n;
        position.progress.secondsToNextWaypoint = secondsBetween(timestamp, first.timestamp());
        position.heading = Geo::compassHeading(position.bearing);
        return position;
    }

    if (upper == n && timestamp > last.timestamp()) {
        position.coordinate = last.coordinate();
        position.source = PositionSource::ExtrapolatedAfter;
        position.status = MovementStatus::Completed;
        if (n >= 2) {
            auto leg = interpolator_.interpolate(ordered[n - 2], ordered[n - 1], last.timestamp());
            position.speed = leg.speedMps;
            position.bearing = leg.bearing;
            position.progress.segmentIndex = n - 2;
        }
        position.progress.segmentProgressPercent = 100.0;
        position.progress.overallProgressPercent = 100.0;
        position.progress.completedWaypoints = n;
        position.heading = Geo::compassHeading(position.bearing);
        return position;
    }

    const size_t i = upper - 1;
    const bool exact = ordered[i].timestamp() == timestamp;

    // An exact hit reports the leg leaving the waypoint, or the leg entering the last one
    size_t segment = i;
    if (exact && i + 1 >= n) {
        segment = (i > 0) ? i - 1 : i;
    }

    Interpolation leg;
    if (segment + 1 < n) {
        leg = interpolator_.interpolate(ordered[segment], ordered[segment + 1], timestamp);
    }

    if (exact) {
        position.coordinate = ordered[i].coordinate();
        position.source = PositionSource::ExactMatch;
    } else {
        position.coordinate = leg.coordinate;
        position.source = leg.source;
    }

    position.interpolated = position.source == PositionSource::Interpolated;
    position.speed = leg.speedMps;
    position.bearing = leg.bearing;
    position.heading = Geo::compassHeading(position.bearing);
    position.status = position.speed > 0.0 ? MovementStatus::Moving : MovementStatus::Parked;

    double fraction = (segment + 1 < n) ? leg.fraction : 0.0;
    if (exact) {
        fraction = (segment == i) ? 0.0 : 1.0;
        if (n == 1) fraction = 0.0;
    }

    auto& progress = position.progress;
    progress.segmentIndex = segment;
    progress.segmentProgressPercent = fraction * 100.0;
    progress.overallProgressPercent =
        (static_cast<double>(segment) + fraction) / static_cast<double>(std::max<size_t>(1, n - 1)) * 100.0;
    progress.completedWaypoints = upper;
    progress.remainingWaypoints = n - upper;
    if (segment + 1 < n) {
        progress.secondsToNextWaypoint = std::max(0.0, secondsBetween(timestamp, ordered[segment + 1].timestamp()));
        progress.distanceToNextWaypointMeters = leg.segmentDistanceMeters * (1.0 - fraction);
    }

    return position;
}

size_t PositionSimulator::upperBound(const Route& ordered, Timestamp timestamp) {
    const auto& waypoints = ordered.waypoints();
    auto it = std::upper_bound(waypoints.begin(), waypoints.end(), timestamp,
                               [](Timestamp ts, const Waypoint& w) { return ts < w.timestamp(); });
    return static_cast<size_t>(it - waypoints.begin());
}

void PositionSimulator::requireWaypoints(const Route& route) {
    if (route.empty()) {
        throw InvalidRouteError("Route has no waypoints to simulate");
    }
}

} // namespace routesim
