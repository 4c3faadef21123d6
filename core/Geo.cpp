#include "Geo.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <sstream>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace routesim {

namespace {
constexpr double COINCIDENT_TOLERANCE_DEG = 1e-12;
}

double Geo::distanceMeters(const Coordinate& a, const Coordinate& b) {
    requireValid(a, "distance");
    requireValid(b, "distance");

    double dLat = toRadians(b.lat - a.lat);
    double dLon = toRadians(b.lon - a.lon);

    double h = std::sin(dLat/2) * std::sin(dLat/2) +
               std::cos(toRadians(a.lat)) * std::cos(toRadians(b.lat)) *
               std::sin(dLon/2) * std::sin(dLon/2);
    // Rounding can push h past 1 for near-antipodal points
    h = std::min(1.0, std::max(0.0, h));

    double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1-h));
    return EARTH_RADIUS_METERS * c;
}

double Geo::bearingDegrees(const Coordinate& a, const Coordinate& b) {
    requireValid(a, "bearing");
    requireValid(b, "bearing");

    if (coincident(a, b)) {
        return 0.0;
    }

    double dLon = toRadians(b.lon - a.lon);
    double y = std::sin(dLon) * std::cos(toRadians(b.lat));
    double x = std::cos(toRadians(a.lat)) * std::sin(toRadians(b.lat)) -
               std::sin(toRadians(a.lat)) * std::cos(toRadians(b.lat)) * std::cos(dLon);

    double bearing = std::fmod(toDegrees(std::atan2(y, x)) + 360.0, 360.0);
    // fmod can hand back 360.0 for values a hair below zero
    return bearing >= 360.0 ? 0.0 : bearing;
}

Coordinate Geo::destinationPoint(const Coordinate& origin, double bearingDeg, double distanceMeters) {
    requireValid(origin, "destination point");

    double bearing = toRadians(bearingDeg);
    double d = distanceMeters / EARTH_RADIUS_METERS;

    double lat1 = toRadians(origin.lat);
    double lon1 = toRadians(origin.lon);

    double lat2 = std::asin(std::sin(lat1) * std::cos(d) +
                            std::cos(lat1) * std::sin(d) * std::cos(bearing));

    double lon2 = lon1 + std::atan2(std::sin(bearing) * std::sin(d) * std::cos(lat1),
                                    std::cos(d) - std::sin(lat1) * std::sin(lat2));

    return Coordinate{toDegrees(lat2), normalizeLongitude(toDegrees(lon2))};
}

bool Geo::isValidCoordinate(const Coordinate& c) {
    return std::isfinite(c.lat) && std::isfinite(c.lon) &&
           c.lat >= -90.0 && c.lat <= 90.0 &&
           c.lon >= -180.0 && c.lon <= 180.0;
}

bool Geo::coincident(const Coordinate& a, const Coordinate& b) {
    return std::abs(a.lat - b.lat) <= COINCIDENT_TOLERANCE_DEG &&
           std::abs(a.lon - b.lon) <= COINCIDENT_TOLERANCE_DEG;
}

std::string Geo::compassHeading(double bearingDeg) {
    static const std::array<const char*, 8> directions = {"N", "NE", "E", "SE", "S", "SW", "W", "NW"};

    double normalized = std::fmod(std::fmod(bearingDeg, 360.0) + 360.0, 360.0);
    auto index = static_cast<size_t>(std::floor((normalized + 22.5) / 45.0)) % directions.size();
    return directions[index];
}

RouteBounds Geo::bounds(const Route& route) {
    if (route.empty()) {
        throw InvalidRouteError("Cannot compute bounds of an empty route");
    }

    RouteBounds result;
    result.northEast = route.front().coordinate();
    result.southWest = route.front().coordinate();

    for (const auto& waypoint : route) {
        const auto& c = waypoint.coordinate();
        result.northEast.lat = std::max(result.northEast.lat, c.lat);
        result.northEast.lon = std::max(result.northEast.lon, c.lon);
        result.southWest.lat = std::min(result.southWest.lat, c.lat);
        result.southWest.lon = std::min(result.southWest.lon, c.lon);
    }

    result.center.lat = (result.northEast.lat + result.southWest.lat) / 2.0;
    result.center.lon = (result.northEast.lon + result.southWest.lon) / 2.0;
    return result;
}

double Geo::linearInterpolate(double from, double to, double fraction) {
    if (fraction <= 0.0) return from;
    if (fraction >= 1.0) return to;
    return from + (to - from) * fraction;
}

void Geo::requireValid(const Coordinate& c, const char* what) {
    if (!isValidCoordinate(c)) {
        std::ostringstream msg;
        msg << "Invalid coordinate for " << what << ": (" << c.lat << ", " << c.lon << ")";
        throw InvalidCoordinateError(msg.str());
    }
}

double Geo::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

double Geo::toDegrees(double radians) {
    return radians * 180.0 / M_PI;
}

double Geo::normalizeLongitude(double lon) {
    double normalized = std::fmod(lon + 540.0, 360.0) - 180.0;
    // Keep the antimeridian as +180 rather than folding it to -180
    if (normalized == -180.0 && lon > 0.0) {
        return 180.0;
    }
    return normalized;
}

} // namespace routesim
