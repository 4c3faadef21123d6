/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the desktop route simulator
 *
 * Reads engine settings from a small TOML file and lets environment
 * variables override them.
 *
 * Supported Sections:
 * - [analyzer]: anomaly thresholds and threshold profile
 * - [simulation]: interpolation method
 * - [logging]: request logging
 *
 * @note Simple line-based parser: one key = value per line, '#' comments
 */

#pragma once

#include <string>
#include <fstream>
#include <sstream>
#include <iostream>
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>
#include "RouteService.hpp"

namespace routesim {

/**
 * @brief TOML configuration file parser
 *
 * Parses route simulator settings into an EngineConfig. A threshold profile
 * is applied first; explicit threshold keys in the same section then
 * override the profile's values regardless of their order in the file.
 */
class TomlConfig {
public:
    using EnvGetter = std::function<std::string(const char*)>;

    /**
     * @brief Load and parse TOML configuration file
     * @param filename Path to TOML configuration file
     * @return Engine configuration; defaults if the file cannot be opened
     * @throws std::runtime_error if a value cannot be parsed
     */
    static EngineConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);

        if (!file.is_open()) {
            std::cerr << "[Config] Warning: could not open config file " << filename
                      << ", using defaults" << std::endl;
            return EngineConfig{};
        }

        return parse(file);
    }

    /**
     * @brief Parse configuration from TOML text
     * @param text TOML document
     * @return Engine configuration
     * @throws std::runtime_error if a value cannot be parsed
     */
    static EngineConfig loadFromString(const std::string& text) {
        std::istringstream in(text);
        return parse(in);
    }

    /**
     * @brief Apply environment variable overrides
     * @param config Configuration to modify in place
     * @param getEnv Lookup returning an empty string for unset variables
     * @throws std::runtime_error if a variable holds an unparseable value
     *
     * Variables: ROUTE_MAX_SPEED_MPS, ROUTE_MIN_MOVEMENT_M, ROUTE_STATIONARY_SEC,
     * ROUTE_INTERPOLATION, ROUTE_VERBOSE.
     */
    static void applyEnvironment(EngineConfig& config, const EnvGetter& getEnv) {
        std::string maxSpeed = getEnv("ROUTE_MAX_SPEED_MPS");
        std::string minMovement = getEnv("ROUTE_MIN_MOVEMENT_M");
        std::string stationary = getEnv("ROUTE_STATIONARY_SEC");
        std::string interpolation = getEnv("ROUTE_INTERPOLATION");
        std::string verbose = getEnv("ROUTE_VERBOSE");

        if (!maxSpeed.empty()) config.analyzer.maxPlausibleSpeedMps = toDouble("ROUTE_MAX_SPEED_MPS", maxSpeed);
        if (!minMovement.empty()) config.analyzer.minMovementMeters = toDouble("ROUTE_MIN_MOVEMENT_M", minMovement);
        if (!stationary.empty()) config.analyzer.stationaryThresholdSeconds = toDouble("ROUTE_STATIONARY_SEC", stationary);
        if (!interpolation.empty()) config.simulation.interpolation = toMethod("ROUTE_INTERPOLATION", interpolation);
        if (!verbose.empty()) config.verbose = toBool(verbose);
    }

private:
    static EngineConfig parse(std::istream& in) {
        EngineConfig config;

        std::string profile = "default";
        std::optional<double> maxSpeed;
        std::optional<double> minMovement;
        std::optional<double> stationary;

        std::string currentSection;
        std::string line;
        while (std::getline(in, line)) {
            // Remove comments and trim whitespace
            size_t commentPos = line.find('#');
            if (commentPos != std::string::npos) {
                line = line.substr(0, commentPos);
            }
            trim(line);

            if (line.empty()) {
                continue;
            }

            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            if (currentSection == "analyzer") {
                if (key == "profile") {
                    profile = value;
                } else if (key == "max_plausible_speed_mps") {
                    maxSpeed = toDouble(key, value);
                } else if (key == "min_movement_meters") {
                    minMovement = toDouble(key, value);
                } else if (key == "stationary_threshold_seconds") {
                    stationary = toDouble(key, value);
                } else {
                    warnUnknown(currentSection, key);
                }
            } else if (currentSection == "simulation") {
                if (key == "interpolation_method") {
                    config.simulation.interpolation = toMethod(key, value);
                } else {
                    warnUnknown(currentSection, key);
                }
            } else if (currentSection == "logging") {
                if (key == "verbose") {
                    config.verbose = toBool(value);
                } else {
                    warnUnknown(currentSection, key);
                }
            }
        }

        try {
            config.analyzer = AnalyzerConfig::forProfile(profile);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("[analyzer] profile: ") + e.what());
        }
        if (maxSpeed) config.analyzer.maxPlausibleSpeedMps = *maxSpeed;
        if (minMovement) config.analyzer.minMovementMeters = *minMovement;
        if (stationary) config.analyzer.stationaryThresholdSeconds = *stationary;

        return config;
    }

    static double toDouble(const std::string& key, const std::string& value) {
        if (value == "inf" || value == "+inf") {
            return std::numeric_limits<double>::infinity();
        }
        try {
            size_t consumed = 0;
            double result = std::stod(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
            return result;
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid number for " + key + ": '" + value + "'");
        }
    }

    static InterpolationMethod toMethod(const std::string& key, const std::string& value) {
        try {
            return stringToInterpolationMethod(value);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(key + ": " + e.what());
        }
    }

    static bool toBool(const std::string& value) {
        return value == "true" || value == "1";
    }

    static void warnUnknown(const std::string& section, const std::string& key) {
        std::cerr << "[Config] Warning: unknown key '" << key << "' in [" << section << "]" << std::endl;
    }

    /**
     * @brief Trim whitespace from both ends of string
     * @param str String to trim (modified in place)
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    /**
     * @brief Remove surrounding quotes from string value
     * @param value String value to unquote (modified in place)
     */
    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace routesim
