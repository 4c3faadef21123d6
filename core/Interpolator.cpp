#include "Interpolator.hpp"
#include "Geo.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace routesim {

std::string interpolationMethodToString(InterpolationMethod method) {
    return method == InterpolationMethod::Linear ? "linear" : "great_circle";
}

InterpolationMethod stringToInterpolationMethod(const std::string& str) {
    static const std::unordered_map<std::string, InterpolationMethod> methodMap = {
        {"great_circle", InterpolationMethod::GreatCircle},
        {"greatcircle", InterpolationMethod::GreatCircle},
        {"slerp", InterpolationMethod::GreatCircle},
        {"linear", InterpolationMethod::Linear}
    };

    auto it = methodMap.find(str);
    if (it == methodMap.end()) {
        throw std::invalid_argument("Unknown interpolation method: " + str);
    }
    return it->second;
}

Interpolation Interpolator::interpolate(const Waypoint& w0, const Waypoint& w1, Timestamp t) const {
    Interpolation result;
    result.segmentDistanceMeters = Geo::distanceMeters(w0.coordinate(), w1.coordinate());
    result.bearing = Geo::bearingDegrees(w0.coordinate(), w1.coordinate());

    double duration = secondsBetween(w0.timestamp(), w1.timestamp());
    if (duration <= 0.0) {
        result.coordinate = w0.coordinate();
        result.fraction = 0.0;
        result.speedMps = 0.0;
        result.source = PositionSource::ExactMatch;
        result.degenerate = true;
        return result;
    }

    result.fraction = std::clamp(secondsBetween(w0.timestamp(), t) / duration, 0.0, 1.0);
    result.speedMps = result.segmentDistanceMeters / duration;

    if (result.fraction == 0.0) {
        result.coordinate = w0.coordinate();
        result.source = PositionSource::ExactMatch;
    } else if (result.fraction == 1.0) {
        result.coordinate = w1.coordinate();
        result.source = PositionSource::ExactMatch;
    } else {
        result.coordinate = pointAt(w0.coordinate(), w1.coordinate(),
                                    result.bearing, result.segmentDistanceMeters, result.fraction);
        result.source = PositionSource::Interpolated;
    }

    return result;
}

Coordinate Interpolator::pointAt(const Coordinate& from, const Coordinate& to,
                                 double bearing, double distance, double fraction) const {
    if (Geo::coincident(from, to)) {
        return from;
    }
    if (method_ == InterpolationMethod::Linear) {
        return Coordinate{Geo::linearInterpolate(from.lat, to.lat, fraction),
                          Geo::linearInterpolate(from.lon, to.lon, fraction)};
    }
    return Geo::destinationPoint(from, bearing, distance * fraction);
}

} // namespace routesim
