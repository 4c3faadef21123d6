/**
 * @file RouteService.hpp
 * @brief Entry point for route analysis and position simulation
 *
 * Bundles the analyzer and the position simulator behind the four operations
 * the transport layer exposes: analyze, validate, simulate one instant and
 * simulate a batch of instants. Every call is independent; the service keeps
 * only its configuration.
 *
 * @note All operations are const and may run concurrently
 * @note Errors are logged to stderr and rethrown unchanged
 */

#pragma once

#include "Route.hpp"
#include "RouteAnalyzer.hpp"
#include "PositionSimulator.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace routesim {

/**
 * @brief Engine configuration
 *
 * Loaded from TOML and environment by the desktop front end; tests build it
 * directly.
 */
struct EngineConfig {
    AnalyzerConfig analyzer;              ///< Anomaly thresholds
    SimulationConfig simulation;          ///< Interpolation method
    bool verbose = false;                 ///< Log one line per request to stdout
};

class RouteService {
public:
    explicit RouteService(EngineConfig config = {});

    /**
     * @brief Aggregate statistics and anomalies for a route
     * @param route Route to analyze
     * @return Full report, even when anomalies are found
     * @throws InvalidRouteError for an empty route
     */
    AnalysisReport analyzeRoute(const Route& route) const;

    /**
     * @brief Analyze with thresholds for this request only
     * @param route Route to analyze
     * @param thresholds Replaces the configured thresholds for this call
     */
    AnalysisReport analyzeRoute(const Route& route, const AnalyzerConfig& thresholds) const;

    /**
     * @brief Same computation as analyzeRoute, read for its valid flag
     * @param route Route to validate
     * @return Report whose valid flag gates simulation on the caller's side
     */
    AnalysisReport validateRoute(const Route& route) const;

    /**
     * @brief Position of the tracked object at one instant
     * @throws InvalidRouteError for an empty route
     * @throws InvalidCoordinateError if the bracketing waypoints are out of range
     */
    SimulatedPosition simulatePosition(const Route& route, Timestamp timestamp) const;

    /**
     * @brief Positions for several instants, in input order
     * @throws InvalidRouteError for an empty route
     */
    std::vector<SimulatedPosition> simulatePositionsBatch(const Route& route,
                                                          const std::vector<Timestamp>& timestamps) const;

    const EngineConfig& config() const { return config_; }

private:
    AnalysisReport runAnalysis(const char* operation, const RouteAnalyzer& analyzer, const Route& route) const;
    void logInfo(const std::string& message) const;
    void logError(const char* operation, const std::exception& e) const;

    EngineConfig config_;
    RouteAnalyzer analyzer_;
    PositionSimulator simulator_;
};

} // namespace routesim
