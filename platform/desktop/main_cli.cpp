/**
 * @file main_cli.cpp
 * @brief Command-line interface for the route simulator
 *
 * Reads a route exported by the front end (JSON, as produced by spreadsheet
 * ingestion or geocoding), then analyzes it, validates it or simulates the
 * tracked object's position at one or more instants. Results are printed as
 * JSON on stdout; diagnostics go to stderr.
 *
 * Exit codes: 0 success, 1 usage or processing error, 2 route failed validation.
 */

#include "RouteService.hpp"
#include "JsonCodec.hpp"
#include "Iso8601.hpp"
#include "IClock.hpp"
#include "Checksum.hpp"
#include "TomlConfig.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace routesim;

/**
 * @brief Display program usage information
 * @param programName Name of the executable (from argv[0])
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options] <command> [args]\n"
              << "Options:\n"
              << "  --config [file]    Configuration file (default: route_simulator.toml)\n"
              << "  --verbose          Log each request to stdout\n"
              << "  --help             Show this help message\n"
              << "\nCommands:\n"
              << "  analyze <route.json>                 Route statistics and anomalies\n"
              << "  validate <route.json>                Same report; exit code 2 if invalid\n"
              << "  simulate <route.json> [--at TIME]... Position at each TIME (default: now)\n"
              << "  checksum <file> [--algorithm ALG]    md5, sha1 or sha256 (default)\n"
              << "           [--base64]                  File holds base64 content; digest the decoded bytes\n"
              << "\nTIME is ISO-8601 (2025-08-21T14:30:15Z) or epoch seconds.\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [analyzer]\n"
              << "  profile = \"vehicle\"\n"
              << "  max_plausible_speed_mps = 70\n"
              << "  [simulation]\n"
              << "  interpolation_method = \"great_circle\"\n"
              << std::endl;
}

/**
 * @brief Safe environment variable getter for Windows
 * @param name Environment variable name
 * @return Environment variable value or empty string if not found
 */
std::string safeGetEnv(const char* name) {
#ifdef _WIN32
    char* buffer = nullptr;
    size_t size = 0;
    if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
        std::string result(buffer);
        free(buffer);
        return result;
    }
    return "";
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
#endif
}

std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path);
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

// Base64 uploads are often saved with a trailing newline.
std::string trimmedLine(const std::string& text) {
    size_t end = text.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : text.substr(0, end + 1);
}

// Numbers are epoch seconds, anything else ISO-8601.
Timestamp parseTimeArgument(const std::string& text) {
    try {
        size_t consumed = 0;
        double seconds = std::stod(text, &consumed);
        if (consumed == text.size()) {
            return fromEpochSeconds(seconds);
        }
    } catch (const std::logic_error&) {
        // not a plain number; fall through to ISO-8601
    }
    return parseIso8601(text);
}

int runSimulate(const RouteService& service, const Route& route,
                const std::vector<std::string>& times, const IClock& clock) {
    if (times.size() <= 1) {
        Timestamp at = times.empty() ? clock.now() : parseTimeArgument(times.front());
        auto position = service.simulatePosition(route, at);
        std::cout << JsonCodec::positionToJson(position).dump(2) << std::endl;
        return 0;
    }

    std::vector<Timestamp> timestamps;
    timestamps.reserve(times.size());
    for (const auto& t : times) {
        timestamps.push_back(parseTimeArgument(t));
    }
    auto positions = service.simulatePositionsBatch(route, timestamps);
    std::cout << JsonCodec::positionsToJson(positions).dump(2) << std::endl;
    return 0;
}

/**
 * @brief Main application entry point
 * @param argc Command line argument count
 * @param argv Command line argument values
 * @return Exit code (0 success, 1 error, 2 invalid route)
 */
int main(int argc, char* argv[]) {
    std::string configFile = "route_simulator.toml";
    bool verboseFlag = false;
    std::string command;
    std::string target;
    std::vector<std::string> times;
    std::string algorithm = "sha256";
    bool base64Content = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            }
        } else if (arg == "--verbose") {
            verboseFlag = true;
        } else if (arg == "--at") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for --at" << std::endl;
                return 1;
            }
            times.push_back(argv[++i]);
        } else if (arg == "--algorithm") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for --algorithm" << std::endl;
                return 1;
            }
            algorithm = argv[++i];
        } else if (arg == "--base64") {
            base64Content = true;
        } else if (command.empty() && arg[0] != '-') {
            command = arg;
        } else if (target.empty() && arg[0] != '-') {
            target = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || target.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        if (command == "checksum") {
            std::string content = readFile(target);
            std::cout << (base64Content ? Checksum::computeBase64(trimmedLine(content), algorithm)
                                        : Checksum::digestHex(content, algorithm)) << std::endl;
            return 0;
        }

        EngineConfig config = TomlConfig::loadFromFile(configFile);
        TomlConfig::applyEnvironment(config, safeGetEnv);
        if (verboseFlag) {
            config.verbose = true;
        }

        if (config.verbose) {
            std::cout << "[CLI] Max plausible speed: " << config.analyzer.maxPlausibleSpeedMps << " m/s" << std::endl;
            std::cout << "[CLI] Interpolation: " << interpolationMethodToString(config.simulation.interpolation) << std::endl;
        }

        RouteService service(config);
        Route route = JsonCodec::parseRoute(readFile(target));

        if (command == "analyze") {
            auto report = service.analyzeRoute(route);
            std::cout << JsonCodec::reportToJson(report).dump(2) << std::endl;
            return 0;
        }

        if (command == "validate") {
            auto report = service.validateRoute(route);
            std::cout << JsonCodec::reportToJson(report).dump(2) << std::endl;
            return report.valid ? 0 : 2;
        }

        if (command == "simulate") {
            SystemClock clock;
            return runSimulate(service, route, times, clock);
        }

        std::cerr << "Unknown command: " << command << std::endl;
        printUsage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
