/**
 * @file RouteService.cpp
 * @brief Request-level wrapper around the analyzer and the position simulator
 */

#include "RouteService.hpp"
#include "Iso8601.hpp"
#include <iostream>

namespace routesim {

RouteService::RouteService(EngineConfig config)
    : config_(config), analyzer_(config.analyzer), simulator_(config.simulation) {
}

AnalysisReport RouteService::analyzeRoute(const Route& route) const {
    return runAnalysis("analyze", analyzer_, route);
}

AnalysisReport RouteService::analyzeRoute(const Route& route, const AnalyzerConfig& thresholds) const {
    return runAnalysis("analyze", RouteAnalyzer(thresholds), route);
}

AnalysisReport RouteService::validateRoute(const Route& route) const {
    return runAnalysis("validate", analyzer_, route);
}

SimulatedPosition RouteService::simulatePosition(const Route& route, Timestamp timestamp) const {
    try {
        auto position = simulator_.simulateOne(route, timestamp);
        logInfo("simulate " + formatIso8601(timestamp) + " -> " +
                positionSourceToString(position.source) + " over " +
                std::to_string(route.size()) + " waypoints");
        return position;
    } catch (const std::exception& e) {
        logError("simulate", e);
        throw;
    }
}

std::vector<SimulatedPosition> RouteService::simulatePositionsBatch(const Route& route,
                                                                    const std::vector<Timestamp>& timestamps) const {
    try {
        auto positions = simulator_.simulateBatch(route, timestamps);
        logInfo("simulate batch of " + std::to_string(timestamps.size()) + " queries over " +
                std::to_string(route.size()) + " waypoints");
        return positions;
    } catch (const std::exception& e) {
        logError("simulate batch", e);
        throw;
    }
}

AnalysisReport RouteService::runAnalysis(const char* operation, const RouteAnalyzer& analyzer,
                                         const Route& route) const {
    try {
        auto report = analyzer.analyze(route);
        logInfo(std::string(operation) + " " + std::to_string(route.size()) + " waypoints: " +
                (report.valid ? "valid" : "invalid") + ", " +
                std::to_string(report.errorCount()) + " errors, " +
                std::to_string(report.warningCount()) + " warnings");
        return report;
    } catch (const std::exception& e) {
        logError(operation, e);
        throw;
    }
}

void RouteService::logInfo(const std::string& message) const {
    if (config_.verbose) {
        std::cout << "[RouteService] " << message << std::endl;
    }
}

void RouteService::logError(const char* operation, const std::exception& e) const {
    std::cerr << "[RouteService] " << operation << " failed: " << e.what() << std::endl;
}

} // namespace routesim
