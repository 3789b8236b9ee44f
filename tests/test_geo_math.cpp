/**
 * @file test_geo_math.cpp
 * @brief Distance, interpolation and offset tests
 */

#include "core/GeoMath.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace afg;

namespace {

const Coordinate kPhilly(40.0, -75.0);
const Coordinate kNorth(40.01, -75.0);

} // namespace

TEST(GeoMathTest, DistanceToSelfIsZero) {
    EXPECT_DOUBLE_EQ(GeoMath::haversine_distance(kPhilly, kPhilly), 0.0);
}

TEST(GeoMathTest, DistanceIsSymmetric) {
    const Coordinate a(51.5007, -0.1246);
    const Coordinate b(48.8584, 2.2945);
    EXPECT_DOUBLE_EQ(GeoMath::haversine_distance(a, b), GeoMath::haversine_distance(b, a));
}

TEST(GeoMathTest, DistanceMatchesKnownValues) {
    // 0.01 degree of latitude on a 6371 km sphere
    EXPECT_NEAR(GeoMath::haversine_distance(kPhilly, kNorth), 1111.95, 0.05);
    // London to Paris
    EXPECT_NEAR(GeoMath::haversine_distance({51.5007, -0.1246}, {48.8584, 2.2945}), 341500.0, 500.0);
}

TEST(GeoMathTest, InterpolateStartsAndEndsAtEndpoints) {
    auto path = GeoMath::interpolate(kPhilly, kNorth, 50.0);
    ASSERT_GE(path.size(), 2u);
    EXPECT_EQ(path.front(), kPhilly);
    EXPECT_EQ(path.back(), kNorth);
}

TEST(GeoMathTest, InterpolateSpacingNeverExceedsInterval) {
    const Coordinate pairs[][2] = {
        {{40.0, -75.0}, {40.01, -75.0}},
        {{-33.86, 151.20}, {-33.80, 151.29}},
        {{64.8, -147.7}, {64.81, -147.6}},
        {{0.0, 179.99}, {0.001, 179.995}},
    };
    for (double interval : {7.0, 50.0, 333.0}) {
        for (const auto& pair : pairs) {
            auto path = GeoMath::interpolate(pair[0], pair[1], interval);
            for (size_t i = 1; i < path.size(); ++i) {
                EXPECT_LE(GeoMath::haversine_distance(path[i - 1], path[i]), interval + 1e-6)
                    << "interval " << interval << " segment " << i;
            }
        }
    }
}

TEST(GeoMathTest, InterpolateSegmentCountIsCeilOfDistanceOverInterval) {
    const double distance = GeoMath::haversine_distance(kPhilly, kNorth);
    auto path = GeoMath::interpolate(kPhilly, kNorth, 50.0);
    const auto segments = static_cast<size_t>(std::ceil(distance / 50.0));
    EXPECT_EQ(path.size(), segments + 1);
    EXPECT_EQ(segments, 23u);
}

TEST(GeoMathTest, InterpolateShortLegHasNoIntermediatePoints) {
    const Coordinate near(40.0001, -75.0);
    auto path = GeoMath::interpolate(kPhilly, near, 50.0);
    ASSERT_EQ(path.size(), 2u);
    EXPECT_EQ(path[0], kPhilly);
    EXPECT_EQ(path[1], near);
}

TEST(GeoMathTest, InterpolateIdenticalPointsReturnsBoth) {
    auto path = GeoMath::interpolate(kPhilly, kPhilly, 50.0);
    ASSERT_EQ(path.size(), 2u);
    EXPECT_EQ(path[0], kPhilly);
    EXPECT_EQ(path[1], kPhilly);
}

TEST(GeoMathTest, InterpolateRejectsNonPositiveInterval) {
    EXPECT_THROW(GeoMath::interpolate(kPhilly, kNorth, 0.0), InvalidParameterError);
    EXPECT_THROW(GeoMath::interpolate(kPhilly, kNorth, -5.0), InvalidParameterError);
    EXPECT_THROW(GeoMath::interpolate(kPhilly, kNorth, std::numeric_limits<double>::quiet_NaN()),
                 InvalidParameterError);
    EXPECT_THROW(GeoMath::interpolate(kPhilly, kNorth, std::numeric_limits<double>::infinity()),
                 InvalidParameterError);
}

TEST(GeoMathTest, InterpolateIsLinearInDegrees) {
    const Coordinate b(40.01, -74.98);
    auto path = GeoMath::interpolate(kPhilly, b, 100.0);
    for (const auto& p : path) {
        // Every point lies on the straight lat/lon segment
        const double t = (p.lat - kPhilly.lat) / (b.lat - kPhilly.lat);
        EXPECT_NEAR(p.lon, kPhilly.lon + t * (b.lon - kPhilly.lon), 1e-12);
    }
}

TEST(GeoMathTest, DensifyDoesNotRepeatJoints) {
    FlightPath route{{40.0, -75.0}, {40.001, -75.0}, {40.001, -74.999}};
    auto dense = GeoMath::densify(route, 1000.0);
    ASSERT_EQ(dense.size(), 3u);
    EXPECT_EQ(dense[0], route[0]);
    EXPECT_EQ(dense[1], route[1]);
    EXPECT_EQ(dense[2], route[2]);

    auto fine = GeoMath::densify(route, 20.0);
    for (size_t i = 1; i < fine.size(); ++i) {
        EXPECT_NE(fine[i - 1], fine[i]);
    }
}

TEST(GeoMathTest, DensifyPassesThroughShortPaths) {
    EXPECT_TRUE(GeoMath::densify({}, 10.0).empty());
    FlightPath single{kPhilly};
    EXPECT_EQ(GeoMath::densify(single, 10.0), single);
}

TEST(GeoMathTest, OffsetMetersMovesByRequestedDistance) {
    auto moved = GeoMath::offset_meters(kPhilly, 100.0, 0.0);
    EXPECT_NEAR(moved.lat - kPhilly.lat, 100.0 / GeoMath::METERS_PER_DEGREE, 1e-12);
    EXPECT_DOUBLE_EQ(moved.lon, kPhilly.lon);

    auto east = GeoMath::offset_meters(kPhilly, 0.0, 100.0);
    EXPECT_NEAR(GeoMath::haversine_distance(kPhilly, east), 100.0, 0.5);
    EXPECT_GT(east.lon, kPhilly.lon);
}

TEST(GeoMathTest, PathLengthSumsLegs) {
    FlightPath route{{40.0, -75.0}, {40.01, -75.0}, {40.0, -75.0}};
    EXPECT_NEAR(GeoMath::path_length(route),
                2.0 * GeoMath::haversine_distance(route[0], route[1]), 1e-9);
    EXPECT_DOUBLE_EQ(GeoMath::path_length({}), 0.0);
}

TEST(GeoMathTest, DegreeConversionsAreInverse) {
    EXPECT_DOUBLE_EQ(GeoMath::meters_to_degrees(GeoMath::METERS_PER_DEGREE), 1.0);
    EXPECT_DOUBLE_EQ(GeoMath::degrees_to_meters(GeoMath::meters_to_degrees(250.0)), 250.0);
}
