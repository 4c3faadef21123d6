#include <gtest/gtest.h>
#include "../core/Geo.hpp"
#include "../core/Errors.hpp"
#include <cmath>

using namespace routesim;

namespace {
// One degree of arc on the model sphere
const double DEGREE_METERS = 2.0 * 3.14159265358979323846 * Geo::EARTH_RADIUS_METERS / 360.0;
}

TEST(GeoTest, DistanceIsSymmetric) {
    Coordinate london{51.5074, -0.1278};
    Coordinate paris{48.8566, 2.3522};

    double there = Geo::distanceMeters(london, paris);
    double back = Geo::distanceMeters(paris, london);

    EXPECT_NEAR(there, back, there * 1e-6);
    EXPECT_NEAR(there, 343500.0, 2000.0);
}

TEST(GeoTest, DistanceToSelfIsZero) {
    Coordinate islamabad{33.6844, 73.0479};
    EXPECT_DOUBLE_EQ(Geo::distanceMeters(islamabad, islamabad), 0.0);
}

TEST(GeoTest, OneDegreeAlongEquator) {
    EXPECT_NEAR(Geo::distanceMeters({0.0, 0.0}, {0.0, 1.0}), DEGREE_METERS, 1e-6);
    EXPECT_NEAR(Geo::distanceMeters({0.0, 0.0}, {1.0, 0.0}), DEGREE_METERS, 1e-6);
}

TEST(GeoTest, AntipodalDistanceIsHalfCircumference) {
    const double halfCircumference = 3.14159265358979323846 * Geo::EARTH_RADIUS_METERS;

    EXPECT_NEAR(Geo::distanceMeters({0.0, 0.0}, {0.0, 180.0}), halfCircumference, 1.0);
    EXPECT_NEAR(Geo::distanceMeters({-20.7, -178.3}, {20.7, 1.7}), halfCircumference, 1.0);

    // Rounding near the antipode must never leave a NaN
    for (double lat = -89.5; lat <= 89.5; lat += 0.9) {
        for (double lon = -179.9; lon <= 0.0; lon += 1.3) {
            double d = Geo::distanceMeters({lat, lon}, {-lat, lon + 180.0});
            EXPECT_FALSE(std::isnan(d)) << "lat " << lat << " lon " << lon;
            EXPECT_LE(d, halfCircumference + 1e-6);
        }
    }
}

TEST(GeoTest, BearingCardinalDirections) {
    Coordinate origin{0.0, 0.0};
    EXPECT_NEAR(Geo::bearingDegrees(origin, {1.0, 0.0}), 0.0, 1e-9);
    EXPECT_NEAR(Geo::bearingDegrees(origin, {0.0, 1.0}), 90.0, 1e-9);
    EXPECT_NEAR(Geo::bearingDegrees(origin, {-1.0, 0.0}), 180.0, 1e-9);
    EXPECT_NEAR(Geo::bearingDegrees(origin, {0.0, -1.0}), 270.0, 1e-9);
}

TEST(GeoTest, BearingStaysInRange) {
    Coordinate a{33.6844, 73.0479};
    Coordinate b{33.6938, 73.0651};
    Coordinate c{-26.2041, 28.0473};

    for (const auto& [from, to] : {std::make_pair(a, b), std::make_pair(b, a),
                                   std::make_pair(a, c), std::make_pair(c, a)}) {
        double bearing = Geo::bearingDegrees(from, to);
        EXPECT_GE(bearing, 0.0);
        EXPECT_LT(bearing, 360.0);
    }
}

TEST(GeoTest, BearingOfCoincidentPointsIsZeroAndFlagged) {
    Coordinate p{10.0, 20.0};
    EXPECT_TRUE(Geo::coincident(p, p));
    EXPECT_DOUBLE_EQ(Geo::bearingDegrees(p, p), 0.0);
    EXPECT_FALSE(Geo::coincident(p, {10.0, 20.001}));
}

TEST(GeoTest, DestinationPointInvertsDistanceAndBearing) {
    Coordinate a{33.6844, 73.0479};
    Coordinate b{33.6938, 73.0651};

    Coordinate projected = Geo::destinationPoint(a, Geo::bearingDegrees(a, b), Geo::distanceMeters(a, b));

    EXPECT_NEAR(projected.lat, b.lat, 1e-9);
    EXPECT_NEAR(projected.lon, b.lon, 1e-9);
}

TEST(GeoTest, DestinationPointEastAlongEquator) {
    Coordinate projected = Geo::destinationPoint({0.0, 0.0}, 90.0, DEGREE_METERS);
    EXPECT_NEAR(projected.lat, 0.0, 1e-9);
    EXPECT_NEAR(projected.lon, 1.0, 1e-9);
}

TEST(GeoTest, DestinationPointWrapsAcrossAntimeridian) {
    Coordinate projected = Geo::destinationPoint({0.0, 179.5}, 90.0, DEGREE_METERS);
    EXPECT_NEAR(projected.lat, 0.0, 1e-9);
    EXPECT_NEAR(projected.lon, -179.5, 1e-9);
}

TEST(GeoTest, CoordinateRangeCheck) {
    EXPECT_TRUE(Geo::isValidCoordinate({90.0, 180.0}));
    EXPECT_TRUE(Geo::isValidCoordinate({-90.0, -180.0}));
    EXPECT_FALSE(Geo::isValidCoordinate({90.5, 0.0}));
    EXPECT_FALSE(Geo::isValidCoordinate({0.0, -180.5}));
    EXPECT_FALSE(Geo::isValidCoordinate({std::nan(""), 0.0}));
}

TEST(GeoTest, PrimitivesRejectOutOfRangeArguments) {
    Coordinate valid{0.0, 0.0};
    Coordinate invalid{120.0, 0.0};

    EXPECT_THROW(Geo::distanceMeters(valid, invalid), InvalidCoordinateError);
    EXPECT_THROW(Geo::bearingDegrees(invalid, valid), InvalidCoordinateError);
    EXPECT_THROW(Geo::destinationPoint(invalid, 45.0, 100.0), InvalidCoordinateError);
}

TEST(GeoTest, CompassHeadingSectors) {
    EXPECT_EQ(Geo::compassHeading(0.0), "N");
    EXPECT_EQ(Geo::compassHeading(22.4), "N");
    EXPECT_EQ(Geo::compassHeading(22.5), "NE");
    EXPECT_EQ(Geo::compassHeading(90.0), "E");
    EXPECT_EQ(Geo::compassHeading(135.0), "SE");
    EXPECT_EQ(Geo::compassHeading(180.0), "S");
    EXPECT_EQ(Geo::compassHeading(225.0), "SW");
    EXPECT_EQ(Geo::compassHeading(270.0), "W");
    EXPECT_EQ(Geo::compassHeading(315.0), "NW");
    EXPECT_EQ(Geo::compassHeading(350.0), "N");
}

TEST(GeoTest, RouteBounds) {
    Route route;
    route.append(Waypoint("a", {33.68, 73.04}, fromEpochSeconds(0)));
    route.append(Waypoint("b", {33.70, 73.02}, fromEpochSeconds(60)));
    route.append(Waypoint("c", {33.66, 73.08}, fromEpochSeconds(120)));

    RouteBounds bounds = Geo::bounds(route);

    EXPECT_DOUBLE_EQ(bounds.northEast.lat, 33.70);
    EXPECT_DOUBLE_EQ(bounds.northEast.lon, 73.08);
    EXPECT_DOUBLE_EQ(bounds.southWest.lat, 33.66);
    EXPECT_DOUBLE_EQ(bounds.southWest.lon, 73.02);
    EXPECT_NEAR(bounds.center.lat, 33.68, 1e-12);
    EXPECT_NEAR(bounds.center.lon, 73.05, 1e-12);

    EXPECT_THROW(Geo::bounds(Route{}), InvalidRouteError);
}
