/**
 * @file test_geofence_builder.cpp
 * @brief Path buffering, protection discs, polygon shrinking and fallbacks
 */

#include "core/GeoMath.hpp"
#include "core/GeofenceBuilder.hpp"
#include "core/LocalFrame.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <limits>

using namespace afg;

namespace {

double distance_to_segment(const Eigen::Vector2d& p, const Eigen::Vector2d& a, const Eigen::Vector2d& b) {
    const Eigen::Vector2d ab = b - a;
    const double len2 = ab.squaredNorm();
    if (len2 == 0.0) {
        return (p - a).norm();
    }
    const double t = std::clamp((p - a).dot(ab) / len2, 0.0, 1.0);
    return (p - (a + t * ab)).norm();
}

double distance_to_path(const Coordinate& c, const FlightPath& path, const LocalFrame& frame) {
    const Eigen::Vector2d p = frame.to_local(c);
    if (path.size() == 1) {
        return (p - frame.to_local(path.front())).norm();
    }
    double best = std::numeric_limits<double>::max();
    for (size_t i = 1; i < path.size(); ++i) {
        best = std::min(best, distance_to_segment(p, frame.to_local(path[i - 1]),
                                                  frame.to_local(path[i])));
    }
    return best;
}

bool has_kind(const std::vector<PlanWarning>& warnings, PlanWarning::Kind kind) {
    return std::any_of(warnings.begin(), warnings.end(),
                       [kind](const PlanWarning& w) { return w.kind == kind; });
}

const FlightPath kStraight{{40.0, -75.0}, {40.01, -75.0}};

} // namespace

TEST(GeofenceBuilderTest, StraightPathGivesClosedRing) {
    GeofenceBuilder builder;
    auto result = builder.build(kStraight, 50.0);

    const auto& ring = result.geofence.polygon;
    ASSERT_GE(ring.size(), 5u);   // At least 4 distinct vertices plus closure
    EXPECT_EQ(ring.front(), ring.back());
    EXPECT_TRUE(result.geofence.inclusion);
    EXPECT_TRUE(result.warnings.empty());
}

TEST(GeofenceBuilderTest, VerticesStayAtLeastBufferFromPath) {
    GeofenceBuilder builder;
    const FlightPath bent{{40.0, -75.0}, {40.005, -75.0}, {40.005, -74.994}};
    auto result = builder.build(GeoMath::densify(bent, 50.0), 50.0);

    const LocalFrame frame = LocalFrame::centred_on(bent);
    for (const auto& vertex : result.geofence.polygon) {
        EXPECT_GE(distance_to_path(vertex, bent, frame), 50.0 - 0.5);
    }
}

TEST(GeofenceBuilderTest, FenceSpansThePath) {
    GeofenceBuilder builder;
    auto result = builder.build(kStraight, 50.0);

    double min_lat = 90.0, max_lat = -90.0;
    for (const auto& c : result.geofence.polygon) {
        min_lat = std::min(min_lat, c.lat);
        max_lat = std::max(max_lat, c.lat);
    }
    EXPECT_LT(min_lat, 40.0);
    EXPECT_GT(max_lat, 40.01);
    EXPECT_NEAR(40.0 - min_lat, GeoMath::meters_to_degrees(50.0), 1e-5);
}

TEST(GeofenceBuilderTest, SinglePointBecomesDisc) {
    GeofenceBuilder builder;
    const FlightPath point{{40.0, -75.0}};
    auto result = builder.build(point, 30.0);

    const LocalFrame frame(point.front());
    ASSERT_GE(result.geofence.polygon.size(), 5u);
    for (const auto& vertex : result.geofence.polygon) {
        EXPECT_NEAR(distance_to_path(vertex, point, frame), 30.0, 0.5);
    }
}

TEST(GeofenceBuilderTest, ExtraPointsAreProtected) {
    GeofenceBuilder builder;
    // Pad 70 m east of the start, outside the 20 m corridor
    const Coordinate pad = GeoMath::offset_meters({40.0, -75.0}, 0.0, 70.0);
    auto without = builder.build(kStraight, 20.0);
    auto with_pad = builder.build(kStraight, 20.0, {pad});

    auto max_lon = [](const FlightPath& ring) {
        double m = -180.0;
        for (const auto& c : ring) m = std::max(m, c.lon);
        return m;
    };
    EXPECT_GT(max_lon(with_pad.geofence.polygon), max_lon(without.geofence.polygon));
    EXPECT_GT(max_lon(with_pad.geofence.polygon), pad.lon);
    EXPECT_TRUE(with_pad.warnings.empty());
}

TEST(GeofenceBuilderTest, LoiterDiscIsAddedAtPathEnd) {
    GeofenceBuilder builder;
    auto plain = builder.build(kStraight, 20.0);
    auto loiter = builder.build(kStraight, 20.0, {}, 150.0);

    double plain_max = -90.0, loiter_max = -90.0;
    for (const auto& c : plain.geofence.polygon) plain_max = std::max(plain_max, c.lat);
    for (const auto& c : loiter.geofence.polygon) loiter_max = std::max(loiter_max, c.lat);
    EXPECT_NEAR(loiter_max - 40.01, GeoMath::meters_to_degrees(150.0), 1e-5);
    EXPECT_GT(loiter_max, plain_max);
}

TEST(GeofenceBuilderTest, DisjointPiecesKeepLargestWithWarning) {
    GeofenceBuilder builder;
    // Extra point 5 km away cannot touch the 50 m corridor
    const Coordinate far = GeoMath::offset_meters({40.0, -75.0}, 0.0, 5000.0);
    auto result = builder.build(kStraight, 50.0, {far});

    EXPECT_TRUE(has_kind(result.warnings, PlanWarning::Kind::GEOFENCE_MULTIPART));
    for (const auto& vertex : result.geofence.polygon) {
        EXPECT_LT(vertex.lon, -74.99);   // Corridor kept, far disc dropped
    }
}

TEST(GeofenceBuilderTest, NonPositiveBufferFallsBackToRectangle) {
    GeofenceBuilder builder;
    auto result = builder.build(kStraight, 0.0);

    EXPECT_TRUE(has_kind(result.warnings, PlanWarning::Kind::GEOFENCE_FALLBACK));
    ASSERT_EQ(result.geofence.polygon.size(), 5u);
    EXPECT_EQ(result.geofence.polygon.front(), result.geofence.polygon.back());
}

TEST(GeofenceBuilderTest, EmptyInputGivesEmptyFenceAndWarning) {
    GeofenceBuilder builder;
    auto result = builder.build({}, 50.0);
    EXPECT_TRUE(result.geofence.polygon.empty());
    EXPECT_TRUE(has_kind(result.warnings, PlanWarning::Kind::GEOFENCE_FALLBACK));
}

TEST(GeofenceBuilderTest, ShrinkKeepsPolygonInsideOriginal) {
    GeofenceBuilder builder;
    // About 555 m x 425 m
    const FlightPath area{{40.0, -75.0}, {40.005, -75.0}, {40.005, -74.995}, {40.0, -74.995}};
    auto result = builder.shrink_polygon(area, 50.0);

    EXPECT_DOUBLE_EQ(result.applied_margin_m, 50.0);
    EXPECT_TRUE(result.warnings.empty());
    ASSERT_GE(result.polygon.size(), 5u);
    EXPECT_EQ(result.polygon.front(), result.polygon.back());
    for (const auto& c : result.polygon) {
        EXPECT_GT(c.lat, 40.0 + GeoMath::meters_to_degrees(45.0));
        EXPECT_LT(c.lat, 40.005 - GeoMath::meters_to_degrees(45.0));
        EXPECT_GT(c.lon, -75.0);
        EXPECT_LT(c.lon, -74.995);
    }
}

TEST(GeofenceBuilderTest, ShrinkFallsBackToHalfMargin) {
    GeofenceBuilder builder;
    // Roughly 80 m square: a 50 m inward buffer collapses it, 25 m does not
    const Coordinate sw(40.0, -75.0);
    const Coordinate ne = GeoMath::offset_meters(sw, 80.0, 80.0);
    const FlightPath area{sw, {ne.lat, sw.lon}, ne, {sw.lat, ne.lon}};

    auto result = builder.shrink_polygon(area, 50.0);
    EXPECT_DOUBLE_EQ(result.applied_margin_m, 25.0);
    EXPECT_TRUE(has_kind(result.warnings, PlanWarning::Kind::POLYGON_SHRINK_FALLBACK));
}

TEST(GeofenceBuilderTest, ShrinkReturnsOriginalWhenTooSmall) {
    GeofenceBuilder builder;
    const Coordinate sw(40.0, -75.0);
    const Coordinate ne = GeoMath::offset_meters(sw, 20.0, 20.0);
    const FlightPath area{sw, {ne.lat, sw.lon}, ne, {sw.lat, ne.lon}};

    auto result = builder.shrink_polygon(area, 50.0);
    EXPECT_DOUBLE_EQ(result.applied_margin_m, 0.0);
    EXPECT_TRUE(has_kind(result.warnings, PlanWarning::Kind::POLYGON_SHRINK_FALLBACK));
    ASSERT_EQ(result.polygon.size(), 5u);
    EXPECT_EQ(result.polygon.front(), sw);
    EXPECT_EQ(result.polygon.back(), sw);
}

TEST(GeofenceBuilderTest, ShrinkRejectsDegenerateInput) {
    GeofenceBuilder builder;
    auto result = builder.shrink_polygon({{40.0, -75.0}, {40.01, -75.0}}, 10.0);
    EXPECT_TRUE(has_kind(result.warnings, PlanWarning::Kind::POLYGON_SHRINK_FALLBACK));
}

TEST(GeofenceBuilderTest, BoundingRectangleAddsMargins) {
    auto fence = GeofenceBuilder::bounding_rectangle({{40.0, -75.0}, {40.01, -74.99}}, 0.0003, 0.0005);
    ASSERT_EQ(fence.polygon.size(), 5u);
    EXPECT_DOUBLE_EQ(fence.polygon[0].lat, 40.0 - 0.0003);
    EXPECT_DOUBLE_EQ(fence.polygon[0].lon, -75.0 - 0.0005);
    EXPECT_DOUBLE_EQ(fence.polygon[2].lat, 40.01 + 0.0003);
    EXPECT_DOUBLE_EQ(fence.polygon[2].lon, -74.99 + 0.0005);
    EXPECT_EQ(fence.polygon.front(), fence.polygon.back());
    EXPECT_TRUE(GeofenceBuilder::bounding_rectangle({}, 1.0, 1.0).polygon.empty());
}
