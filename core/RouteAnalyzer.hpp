/**
 * @file RouteAnalyzer.hpp
 * @brief Route statistics and physical plausibility checks
 *
 * Walks a route once, pair by pair, accumulating distance and speed figures
 * and collecting every anomaly it finds. Findings never stop the pass: the
 * caller always gets a complete report.
 */

#pragma once

#include "Route.hpp"
#include <limits>
#include <string>

namespace routesim {

/**
 * @brief Thresholds for anomaly detection
 *
 * Passed per call so a vehicle route and a flight route can be judged by
 * different limits within the same process.
 */
struct AnalyzerConfig {
    double maxPlausibleSpeedMps = 340.0;        ///< Faster than this is a teleport
    double minMovementMeters = 1.0;             ///< Below this a pair counts as not moving
    double stationaryThresholdSeconds =         ///< Longest tolerated stationary gap
        std::numeric_limits<double>::infinity();

    /**
     * @brief Preset thresholds by use case
     * @param profile "default", "vehicle" or "flight"
     * @throws std::invalid_argument for an unknown profile name
     */
    static AnalyzerConfig forProfile(const std::string& profile);
};

class RouteAnalyzer {
public:
    explicit RouteAnalyzer(AnalyzerConfig config = {});

    /**
     * @brief Compute statistics and anomalies for a route
     * @param route Waypoints in recorded order; never modified
     * @return Report; valid is false iff an error-severity anomaly was found
     * @throws InvalidRouteError if the route has no waypoints
     */
    AnalysisReport analyze(const Route& route) const;

    const AnalyzerConfig& config() const { return config_; }

private:
    bool checkBounds(const Route& route, size_t i, AnalysisReport& report) const;
    void analyzePair(const Route& route, size_t i, AnalysisReport& report,
                     std::vector<double>& speeds) const;

    static void addAnomaly(AnalysisReport& report, AnomalyKind kind, Severity severity,
                           std::vector<size_t> indices, std::string message);
    static void addToDistribution(SpeedDistribution& distribution, double speedMps);
    static double median(std::vector<double> values);

    AnalyzerConfig config_;
};

} // namespace routesim
