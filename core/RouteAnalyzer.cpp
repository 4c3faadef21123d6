#include "RouteAnalyzer.hpp"
#include "Errors.hpp"
#include "Geo.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace routesim {

namespace {

std::string formatNumber(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

AnalyzerConfig AnalyzerConfig::forProfile(const std::string& profile) {
    AnalyzerConfig config;
    if (profile == "default" || profile == "flight") {
        return config;
    }
    if (profile == "vehicle") {
        config.maxPlausibleSpeedMps = 70.0;  // ~250 km/h
        return config;
    }
    throw std::invalid_argument("Unknown analyzer profile: " + profile);
}

RouteAnalyzer::RouteAnalyzer(AnalyzerConfig config) : config_(config) {
}

AnalysisReport RouteAnalyzer::analyze(const Route& route) const {
    if (route.empty()) {
        throw InvalidRouteError("Route has no waypoints to analyze");
    }

    AnalysisReport report;
    report.waypointCount = route.size();
    report.bounds = Geo::bounds(route);

    for (size_t i = 0; i < route.size(); ++i) {
        if (route[i].isParking()) {
            report.parkingStops.push_back(i);
        }
    }

    if (route.size() < 2) {
        return report;
    }

    std::vector<double> speeds;
    for (size_t i = 0; i + 1 < route.size(); ++i) {
        analyzePair(route, i, report, speeds);
    }

    report.durationSeconds = secondsBetween(route.front().timestamp(), route.back().timestamp());
    report.averageSpeedMps = report.durationSeconds > 0.0
        ? report.totalDistanceMeters / report.durationSeconds
        : 0.0;

    if (!speeds.empty()) {
        report.minSpeedMps = *std::min_element(speeds.begin(), speeds.end());
        report.medianSpeedMps = median(speeds);
    }

    report.valid = report.errorCount() == 0;
    return report;
}

bool RouteAnalyzer::checkBounds(const Route& route, size_t i, AnalysisReport& report) const {
    const auto& c = route[i].coordinate();
    if (Geo::isValidCoordinate(c)) {
        return true;
    }
    addAnomaly(report, AnomalyKind::OutOfBounds, Severity::Error, {i},
               "Waypoint " + std::to_string(i) + " is outside valid latitude/longitude range (" +
               formatNumber(c.lat, 6) + ", " + formatNumber(c.lon, 6) + ")");
    return false;
}

void RouteAnalyzer::analyzePair(const Route& route, size_t i, AnalysisReport& report,
                                std::vector<double>& speeds) const {
    const Waypoint& from = route[i];
    const Waypoint& to = route[i + 1];

    SegmentSummary segment;
    segment.index = i;
    segment.fromSequence = from.sequence().value_or(static_cast<int>(i + 1));
    segment.toSequence = to.sequence().value_or(static_cast<int>(i + 2));
    segment.isParking = to.isParking();

    const double duration = secondsBetween(from.timestamp(), to.timestamp());
    segment.durationSeconds = std::max(0.0, duration);

    // Each waypoint is bounds-checked once: the first with pair 0, the rest as a pair's end
    const bool fromInBounds = (i == 0) ? checkBounds(route, i, report)
                                       : Geo::isValidCoordinate(from.coordinate());
    const bool toInBounds = checkBounds(route, i + 1, report);
    if (!fromInBounds || !toInBounds) {
        report.segments.push_back(segment);
        return;
    }

    const double distance = Geo::distanceMeters(from.coordinate(), to.coordinate());
    segment.distanceMeters = distance;
    segment.bearing = Geo::bearingDegrees(from.coordinate(), to.coordinate());
    report.totalDistanceMeters += distance;

    const std::vector<size_t> pair = {i, i + 1};
    const std::string label = "Waypoints " + std::to_string(i) + "->" + std::to_string(i + 1);

    if (duration < 0.0) {
        addAnomaly(report, AnomalyKind::NonMonotonicTime, Severity::Error, pair,
                   label + ": timestamp goes backwards by " + formatNumber(-duration, 3) + " s");
    } else if (duration == 0.0) {
        // An exact repeat of the previous sample is not an anomaly
        if (distance >= config_.minMovementMeters) {
            addAnomaly(report, AnomalyKind::Teleport, Severity::Error, pair,
                       label + ": moved " + formatNumber(distance, 1) + " m in zero time");
        } else if (distance > 0.0) {
            addAnomaly(report, AnomalyKind::DuplicateTimestamp, Severity::Error, pair,
                       label + ": position changed by " + formatNumber(distance, 3) +
                       " m at the same timestamp");
        }
    } else {
        const double speed = distance / duration;
        segment.speedMps = speed;
        speeds.push_back(speed);
        report.maxSpeedMps = std::max(report.maxSpeedMps, speed);
        addToDistribution(report.speedDistribution, speed);

        if (speed > config_.maxPlausibleSpeedMps) {
            addAnomaly(report, AnomalyKind::Teleport, Severity::Error, pair,
                       label + ": speed " + formatNumber(speed, 1) + " m/s exceeds plausible maximum " +
                       formatNumber(config_.maxPlausibleSpeedMps, 1) + " m/s");
        }

        if (distance < config_.minMovementMeters &&
            duration > config_.stationaryThresholdSeconds &&
            !to.isParking()) {
            addAnomaly(report, AnomalyKind::StationaryGap, Severity::Warning, pair,
                       label + ": stationary for " + formatNumber(duration, 0) + " s");
        }
    }

    report.segments.push_back(segment);
}

void RouteAnalyzer::addAnomaly(AnalysisReport& report, AnomalyKind kind, Severity severity,
                               std::vector<size_t> indices, std::string message) {
    report.anomalies.push_back(Anomaly{kind, std::move(indices), severity, std::move(message)});
}

void RouteAnalyzer::addToDistribution(SpeedDistribution& distribution, double speedMps) {
    const double kph = speedMps * 3.6;
    if (kph < 20.0) {
        ++distribution.below20Kph;
    } else if (kph < 40.0) {
        ++distribution.from20To40Kph;
    } else if (kph < 60.0) {
        ++distribution.from40To60Kph;
    } else {
        ++distribution.above60Kph;
    }
}

double RouteAnalyzer::median(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) {
        return values[mid];
    }
    return (values[mid - 1] + values[mid]) / 2.0;
}

} // namespace routesim
