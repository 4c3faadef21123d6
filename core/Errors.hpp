#pragma once

#include <stdexcept>
#include <string>

namespace routesim {

// Empty route handed to an operation that needs at least one waypoint.
class InvalidRouteError : public std::runtime_error {
public:
    explicit InvalidRouteError(const std::string& what) : std::runtime_error(what) {}
};

// Coordinate outside [-90, 90] / [-180, 180] or not finite.
class InvalidCoordinateError : public std::runtime_error {
public:
    explicit InvalidCoordinateError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed route record at the JSON boundary.
class SchemaError : public std::invalid_argument {
public:
    explicit SchemaError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace routesim
