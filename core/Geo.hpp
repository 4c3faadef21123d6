#pragma once

#include "Route.hpp"
#include <string>

namespace routesim {

class Geo {
public:
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;

    // Haversine distance. Throws InvalidCoordinateError for out-of-range input.
    static double distanceMeters(const Coordinate& a, const Coordinate& b);

    // Initial bearing in [0, 360). Returns 0 when the points coincide.
    static double bearingDegrees(const Coordinate& a, const Coordinate& b);

    static Coordinate destinationPoint(const Coordinate& origin, double bearingDeg, double distanceMeters);

    static bool isValidCoordinate(const Coordinate& c);
    static bool coincident(const Coordinate& a, const Coordinate& b);

    static std::string compassHeading(double bearingDeg);

    static RouteBounds bounds(const Route& route);

    static double linearInterpolate(double from, double to, double fraction);

private:
    static void requireValid(const Coordinate& c, const char* what);
    static double toRadians(double degrees);
    static double toDegrees(double radians);
    static double normalizeLongitude(double lon);
};

} // namespace routesim
