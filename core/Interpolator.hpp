#pragma once

#include "Route.hpp"
#include <string>

namespace routesim {

enum class InterpolationMethod {
    GreatCircle,
    Linear
};

std::string interpolationMethodToString(InterpolationMethod method);
InterpolationMethod stringToInterpolationMethod(const std::string& str);

struct Interpolation {
    Coordinate coordinate;
    double fraction = 0.0;
    double speedMps = 0.0;
    double bearing = 0.0;
    double segmentDistanceMeters = 0.0;
    PositionSource source = PositionSource::Interpolated;
    bool degenerate = false;  ///< w0 and w1 share a timestamp
};

/**
 * @brief Reconstructs the position between two consecutive waypoints
 *
 * Speed and bearing are constant across a segment: the object is assumed to
 * travel the great circle from w0 to w1 at uniform speed.
 */
class Interpolator {
public:
    explicit Interpolator(InterpolationMethod method = InterpolationMethod::GreatCircle)
        : method_(method) {}

    /**
     * @brief Position at time t on the segment w0 -> w1
     * @param w0 Segment start, w0.timestamp() <= t
     * @param w1 Segment end, t <= w1.timestamp()
     * @param t Query time; fractions outside [0, 1] are clamped
     * @return Interpolated coordinate with the segment's speed and bearing
     * @throws InvalidCoordinateError if either waypoint is out of range
     * @note A zero-duration segment yields w0's coordinate and degenerate = true
     */
    Interpolation interpolate(const Waypoint& w0, const Waypoint& w1, Timestamp t) const;

    InterpolationMethod method() const { return method_; }

private:
    Coordinate pointAt(const Coordinate& from, const Coordinate& to,
                       double bearing, double distance, double fraction) const;

    InterpolationMethod method_;
};

} // namespace routesim
