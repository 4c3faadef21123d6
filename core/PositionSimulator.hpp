/**
 * @file PositionSimulator.hpp
 * @brief Point-in-time position queries against a recorded route
 *
 * Answers "where was the object at time T?" by locating the pair of
 * waypoints that brackets T and delegating to the Interpolator. Queries
 * outside the recorded time span are pinned to the first or last waypoint.
 *
 * @note Stateless between calls; safe to share across threads
 */

#pragma once

#include "Route.hpp"
#include "Interpolator.hpp"
#include <vector>

namespace routesim {

struct SimulationConfig {
    InterpolationMethod interpolation = InterpolationMethod::GreatCircle;
};

class PositionSimulator {
public:
    explicit PositionSimulator(SimulationConfig config = {});

    /**
     * @brief Simulate the object's position at a single instant
     * @param route Recorded waypoints, expected in ascending timestamp order
     * @param timestamp Query instant
     * @return Position with source, speed, bearing and route progress
     * @throws InvalidRouteError if the route has no waypoints
     * @throws InvalidCoordinateError if a waypoint involved is out of range
     * @note Routes that are not time-ordered are simulated on a sorted copy
     */
    SimulatedPosition simulateOne(const Route& route, Timestamp timestamp) const;

    /**
     * @brief Simulate one position per query timestamp
     * @param route Recorded waypoints
     * @param timestamps Query instants, any order
     * @return Results in the same order as the input timestamps
     * @note A non-decreasing input is walked with a cursor instead of one
     *       binary search per query; the results are identical either way
     */
    std::vector<SimulatedPosition> simulateBatch(const Route& route,
                                                 const std::vector<Timestamp>& timestamps) const;

    const SimulationConfig& config() const { return config_; }

private:
    // upper is the index of the first waypoint strictly later than timestamp
    SimulatedPosition simulateAt(const Route& ordered, Timestamp timestamp, size_t upper) const;

    static size_t upperBound(const Route& ordered, Timestamp timestamp);
    static void requireWaypoints(const Route& route);

    SimulationConfig config_;
    Interpolator interpolator_;
};

} // namespace routesim
