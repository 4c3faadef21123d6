#include <gtest/gtest.h>
#include "../core/PositionSimulator.hpp"
#include "../core/Geo.hpp"
#include "../core/Errors.hpp"

using namespace routesim;

namespace {

Waypoint makeWaypoint(const std::string& id, double lat, double lon, double seconds) {
    return Waypoint(id, Coordinate{lat, lon}, fromEpochSeconds(seconds));
}

void expectSamePosition(const SimulatedPosition& a, const SimulatedPosition& b) {
    EXPECT_EQ(a.coordinate, b.coordinate);
    EXPECT_EQ(a.timestamp, b.timestamp);
    EXPECT_EQ(a.source, b.source);
    EXPECT_EQ(a.interpolated, b.interpolated);
    EXPECT_DOUBLE_EQ(a.speed, b.speed);
    EXPECT_DOUBLE_EQ(a.bearing, b.bearing);
    EXPECT_EQ(a.status, b.status);
    EXPECT_EQ(a.progress.segmentIndex, b.progress.segmentIndex);
}

} // namespace

/**
 * @brief Three-leg fixture: east along the equator, then north
 */
class PositionSimulatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        route_.append(makeWaypoint("a", 0.0, 0.0, 0));
        route_.append(makeWaypoint("b", 0.0, 0.01, 100));
        route_.append(makeWaypoint("c", 0.01, 0.01, 300));
    }

    double legMeters(size_t from) const {
        return Geo::distanceMeters(route_[from].coordinate(), route_[from + 1].coordinate());
    }

    Route route_;
    PositionSimulator simulator_;
};

TEST(PositionSimulatorScenario, IslamabadTenMinuteLeg) {
    Route route;
    route.append(makeWaypoint("1", 33.6844, 73.0479, 0));
    route.append(makeWaypoint("2", 33.6938, 73.0651, 600));

    PositionSimulator simulator;
    auto position = simulator.simulateOne(route, fromEpochSeconds(300));

    EXPECT_EQ(position.source, PositionSource::Interpolated);
    EXPECT_TRUE(position.interpolated);
    EXPECT_NEAR(position.coordinate.lat, 33.6891, 1e-4);
    EXPECT_NEAR(position.coordinate.lon, 73.0565, 1e-4);
    EXPECT_NEAR(position.speed, 3.2, 0.1);
    EXPECT_EQ(position.heading, "NE");
    EXPECT_EQ(position.status, MovementStatus::Moving);

    auto early = simulator.simulateOne(route, fromEpochSeconds(-100));
    EXPECT_EQ(early.source, PositionSource::ExtrapolatedBefore);
    EXPECT_EQ(early.coordinate, route[0].coordinate());
}

TEST_F(PositionSimulatorTest, EmptyRouteIsRejected) {
    Route empty;
    EXPECT_THROW(simulator_.simulateOne(empty, fromEpochSeconds(0)), InvalidRouteError);
    EXPECT_THROW(simulator_.simulateBatch(empty, {fromEpochSeconds(0)}), InvalidRouteError);
}

TEST_F(PositionSimulatorTest, BeforeFirstWaypointHoldsStart) {
    auto position = simulator_.simulateOne(route_, fromEpochSeconds(-50));

    EXPECT_EQ(position.source, PositionSource::ExtrapolatedBefore);
    EXPECT_FALSE(position.interpolated);
    EXPECT_EQ(position.coordinate, route_[0].coordinate());
    EXPECT_EQ(position.status, MovementStatus::NotStarted);
    EXPECT_NEAR(position.speed, legMeters(0) / 100.0, 1e-9);
    EXPECT_NEAR(position.bearing, 90.0, 1e-6);
    EXPECT_DOUBLE_EQ(position.progress.secondsToNextWaypoint, 50.0);
    EXPECT_DOUBLE_EQ(position.progress.secondsToDestination, 350.0);
    EXPECT_EQ(position.progress.remainingWaypoints, 3u);
}

TEST_F(PositionSimulatorTest, AfterLastWaypointHoldsEnd) {
    auto position = simulator_.simulateOne(route_, fromEpochSeconds(400));

    EXPECT_EQ(position.source, PositionSource::ExtrapolatedAfter);
    EXPECT_EQ(position.coordinate, route_[2].coordinate());
    EXPECT_EQ(position.status, MovementStatus::Completed);
    EXPECT_NEAR(position.speed, legMeters(1) / 200.0, 1e-9);
    EXPECT_NEAR(position.bearing, 0.0, 1e-6);
    EXPECT_DOUBLE_EQ(position.progress.overallProgressPercent, 100.0);
    EXPECT_EQ(position.progress.completedWaypoints, 3u);
    EXPECT_DOUBLE_EQ(position.progress.secondsToDestination, 0.0);
}

TEST_F(PositionSimulatorTest, ExactMatchReturnsWaypoint) {
    for (size_t i = 0; i < route_.size(); ++i) {
        auto position = simulator_.simulateOne(route_, route_[i].timestamp());
        EXPECT_EQ(position.source, PositionSource::ExactMatch) << "waypoint " << i;
        EXPECT_FALSE(position.interpolated);
        EXPECT_EQ(position.coordinate, route_[i].coordinate());
    }

    // Outgoing leg at the middle waypoint, incoming leg at the last
    auto middle = simulator_.simulateOne(route_, route_[1].timestamp());
    EXPECT_NEAR(middle.speed, legMeters(1) / 200.0, 1e-9);
    EXPECT_DOUBLE_EQ(middle.progress.overallProgressPercent, 50.0);

    auto last = simulator_.simulateOne(route_, route_[2].timestamp());
    EXPECT_NEAR(last.speed, legMeters(1) / 200.0, 1e-9);
    EXPECT_DOUBLE_EQ(last.progress.overallProgressPercent, 100.0);
    EXPECT_DOUBLE_EQ(last.progress.distanceToNextWaypointMeters, 0.0);
}

TEST_F(PositionSimulatorTest, InterpolatedProgressAndEta) {
    auto position = simulator_.simulateOne(route_, fromEpochSeconds(50));

    EXPECT_EQ(position.source, PositionSource::Interpolated);
    EXPECT_NEAR(position.coordinate.lat, 0.0, 1e-9);
    EXPECT_NEAR(position.coordinate.lon, 0.005, 1e-9);
    EXPECT_EQ(position.heading, "E");

    const auto& progress = position.progress;
    EXPECT_EQ(progress.segmentIndex, 0u);
    EXPECT_DOUBLE_EQ(progress.segmentProgressPercent, 50.0);
    EXPECT_DOUBLE_EQ(progress.overallProgressPercent, 25.0);
    EXPECT_EQ(progress.completedWaypoints, 1u);
    EXPECT_EQ(progress.remainingWaypoints, 2u);
    EXPECT_EQ(progress.totalWaypoints, 3u);
    EXPECT_DOUBLE_EQ(progress.secondsToNextWaypoint, 50.0);
    EXPECT_DOUBLE_EQ(progress.secondsToDestination, 250.0);
    EXPECT_NEAR(progress.distanceToNextWaypointMeters, legMeters(0) / 2.0, 1e-6);

    auto second = simulator_.simulateOne(route_, fromEpochSeconds(200));
    EXPECT_EQ(second.progress.segmentIndex, 1u);
    EXPECT_DOUBLE_EQ(second.progress.overallProgressPercent, 75.0);
    EXPECT_EQ(second.heading, "N");
}

TEST_F(PositionSimulatorTest, ContinuousAcrossInteriorWaypoint) {
    auto justBefore = simulator_.simulateOne(route_, route_[1].timestamp() - std::chrono::milliseconds(1));
    auto at = simulator_.simulateOne(route_, route_[1].timestamp());
    auto justAfter = simulator_.simulateOne(route_, route_[1].timestamp() + std::chrono::milliseconds(1));

    EXPECT_LT(Geo::distanceMeters(justBefore.coordinate, at.coordinate), 0.1);
    EXPECT_LT(Geo::distanceMeters(justAfter.coordinate, at.coordinate), 0.1);
}

TEST_F(PositionSimulatorTest, BatchMatchesSingleQueries) {
    std::vector<Timestamp> sorted = {
        fromEpochSeconds(-10), fromEpochSeconds(0), fromEpochSeconds(50),
        fromEpochSeconds(100), fromEpochSeconds(250), fromEpochSeconds(300), fromEpochSeconds(400)
    };
    std::vector<Timestamp> shuffled = {
        fromEpochSeconds(250), fromEpochSeconds(-10), fromEpochSeconds(100),
        fromEpochSeconds(50), fromEpochSeconds(400), fromEpochSeconds(0)
    };

    for (const auto& queries : {sorted, shuffled}) {
        auto batch = simulator_.simulateBatch(route_, queries);
        ASSERT_EQ(batch.size(), queries.size());
        for (size_t i = 0; i < queries.size(); ++i) {
            EXPECT_EQ(batch[i].timestamp, queries[i]);
            expectSamePosition(batch[i], simulator_.simulateOne(route_, queries[i]));
        }
    }

    EXPECT_TRUE(simulator_.simulateBatch(route_, {}).empty());
}

TEST_F(PositionSimulatorTest, UnorderedRouteIsSortedBeforeLookup) {
    Route shuffled;
    shuffled.append(route_[2]);
    shuffled.append(route_[0]);
    shuffled.append(route_[1]);

    auto position = simulator_.simulateOne(shuffled, fromEpochSeconds(100));
    EXPECT_EQ(position.source, PositionSource::ExactMatch);
    EXPECT_EQ(position.coordinate, route_[1].coordinate());

    expectSamePosition(simulator_.simulateOne(shuffled, fromEpochSeconds(50)),
                       simulator_.simulateOne(route_, fromEpochSeconds(50)));
}

TEST_F(PositionSimulatorTest, EqualTimestampsUseLastWaypoint) {
    Route route;
    route.append(makeWaypoint("a", 0.0, 0.0, 0));
    route.append(makeWaypoint("b", 0.0, 0.01, 100));
    route.append(makeWaypoint("b2", 0.0, 0.02, 100));
    route.append(makeWaypoint("c", 0.0, 0.03, 200));

    auto exact = simulator_.simulateOne(route, fromEpochSeconds(100));
    EXPECT_EQ(exact.source, PositionSource::ExactMatch);
    EXPECT_EQ(exact.coordinate, route[2].coordinate());

    auto before = simulator_.simulateOne(route, fromEpochSeconds(50));
    EXPECT_NEAR(before.coordinate.lon, 0.005, 1e-9);
}

TEST_F(PositionSimulatorTest, SingleWaypointRoute) {
    Route route;
    route.append(makeWaypoint("only", 10.0, 20.0, 100));

    auto before = simulator_.simulateOne(route, fromEpochSeconds(0));
    EXPECT_EQ(before.source, PositionSource::ExtrapolatedBefore);
    EXPECT_DOUBLE_EQ(before.speed, 0.0);

    auto at = simulator_.simulateOne(route, fromEpochSeconds(100));
    EXPECT_EQ(at.source, PositionSource::ExactMatch);
    EXPECT_EQ(at.coordinate, route[0].coordinate());
    EXPECT_DOUBLE_EQ(at.speed, 0.0);

    auto after = simulator_.simulateOne(route, fromEpochSeconds(200));
    EXPECT_EQ(after.source, PositionSource::ExtrapolatedAfter);
    EXPECT_EQ(after.coordinate, route[0].coordinate());
    EXPECT_DOUBLE_EQ(after.speed, 0.0);
}

TEST_F(PositionSimulatorTest, StandingStillIsParked) {
    Route route;
    route.append(makeWaypoint("a", 5.0, 5.0, 0));
    route.append(makeWaypoint("b", 5.0, 5.0, 100));

    auto position = simulator_.simulateOne(route, fromEpochSeconds(50));
    EXPECT_DOUBLE_EQ(position.speed, 0.0);
    EXPECT_EQ(position.status, MovementStatus::Parked);
    EXPECT_EQ(position.coordinate, route[0].coordinate());
}

TEST_F(PositionSimulatorTest, LinearModeFollowsCoordinates) {
    PositionSimulator linear(SimulationConfig{InterpolationMethod::Linear});
    Route route;
    route.append(makeWaypoint("a", 0.0, 0.0, 0));
    route.append(makeWaypoint("b", 10.0, 10.0, 1000));

    auto position = linear.simulateOne(route, fromEpochSeconds(500));
    EXPECT_DOUBLE_EQ(position.coordinate.lat, 5.0);
    EXPECT_DOUBLE_EQ(position.coordinate.lon, 5.0);
}
