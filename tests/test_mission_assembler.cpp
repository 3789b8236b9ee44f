/**
 * @file test_mission_assembler.cpp
 * @brief End to end plan generation for every scenario
 */

#include "core/GeoMath.hpp"
#include "core/MissionAssembler.hpp"
#include "core/MissionItems.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>

using namespace afg;
using afg::testing::FakeHttpClient;
using Scenario = MissionConfig::Scenario;
using Terminal = MissionConfig::TerminalAction;

namespace {

TerrainService::Config fast_config() {
    TerrainService::Config config;
    config.min_request_interval = std::chrono::milliseconds(0);
    config.backoff_base = std::chrono::milliseconds(1);
    return config;
}

std::vector<int> commands(const MissionPlan& plan) {
    std::vector<int> out;
    for (const auto& item : plan.items) {
        out.push_back(items::command_of(item));
    }
    return out;
}

size_t count_command(const MissionPlan& plan, int command) {
    const auto cmds = commands(plan);
    return static_cast<size_t>(std::count(cmds.begin(), cmds.end(), command));
}

// Ray casting on lat/lon; adequate for the small fences used here
bool inside_ring(const FlightPath& ring, const Coordinate& p) {
    bool inside = false;
    for (size_t i = 0, j = ring.size() - 1; i < ring.size(); j = i++) {
        const Coordinate& a = ring[i];
        const Coordinate& b = ring[j];
        if ((a.lat > p.lat) != (b.lat > p.lat) &&
            p.lon < (b.lon - a.lon) * (p.lat - a.lat) / (b.lat - a.lat) + a.lon) {
            inside = !inside;
        }
    }
    return inside;
}

class MissionAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<FakeHttpClient>(
            [](const std::string&) { return FakeHttpClient::elevation(100.0); });
        terrain_ = std::make_unique<TerrainService>(http_, fast_config());
    }

    MissionConfig a_to_b() const {
        MissionConfig config;
        config.scenario = Scenario::A_TO_B;
        config.start = Coordinate(40.0, -75.0);
        config.end = Coordinate(40.01, -75.0);
        config.altitude_agl_m = 100.0;
        config.interval_m = 50.0;
        return config;
    }

    MissionConfig area(Scenario scenario) const {
        MissionConfig config;
        config.scenario = scenario;
        config.start = Coordinate(39.999, -75.001);
        config.polygon = {{40.00, -75.00}, {40.01, -75.00}, {40.01, -74.99}, {40.00, -74.99}};
        return config;
    }

    MissionResult assemble(const MissionConfig& config) {
        MissionAssembler assembler(*terrain_);
        return assembler.assemble(config);
    }

    std::shared_ptr<FakeHttpClient> http_;
    std::unique_ptr<TerrainService> terrain_;
};

} // namespace

TEST_F(MissionAssemblerTest, PointToPointFollowsTerrain) {
    auto result = assemble(a_to_b());
    const auto& plan = result.plan;

    // Takeoff, 23 interpolated waypoints, land
    ASSERT_EQ(plan.items.size(), 25u);
    const auto cmds = commands(plan);
    EXPECT_EQ(cmds.front(), mav::CMD_NAV_TAKEOFF);
    EXPECT_EQ(cmds.back(), mav::CMD_NAV_LAND);
    EXPECT_EQ(count_command(plan, mav::CMD_NAV_WAYPOINT), 23u);

    const auto& takeoff = std::get<SimpleItem>(plan.items.front());
    EXPECT_DOUBLE_EQ(takeoff.params[4], 40.0);
    EXPECT_DOUBLE_EQ(takeoff.params[6], 200.0);

    double last_lat = 40.0;
    for (size_t i = 1; i + 1 < plan.items.size(); ++i) {
        const auto& wp = std::get<SimpleItem>(plan.items[i]);
        EXPECT_EQ(wp.frame, mav::FRAME_GLOBAL);
        EXPECT_DOUBLE_EQ(wp.params[6], 200.0);
        EXPECT_EQ(wp.altitude_mode, mav::ALTITUDE_MODE_TERRAIN_FRAME);
        EXPECT_GT(wp.params[4], last_lat);
        last_lat = wp.params[4];
    }
    EXPECT_DOUBLE_EQ(last_lat, 40.01);

    const auto& land = std::get<SimpleItem>(plan.items.back());
    EXPECT_DOUBLE_EQ(land.params[4], 40.01);

    EXPECT_EQ(plan.home, Coordinate(40.0, -75.0));
    EXPECT_DOUBLE_EQ(plan.home_elevation_m, 100.0);
    EXPECT_FALSE(result.terrain_degraded);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_TRUE(result.proximity_warnings.empty());
}

TEST_F(MissionAssemblerTest, ItemsAreNumberedFromOne) {
    auto result = assemble(a_to_b());
    int expected = 1;
    for (const auto& item : result.plan.items) {
        EXPECT_EQ(std::get<SimpleItem>(item).do_jump_id, expected++);
    }
}

TEST_F(MissionAssemblerTest, ConsecutivePointsRespectInterval) {
    auto config = a_to_b();
    config.interval_m = 37.0;
    auto result = assemble(config);
    for (size_t i = 1; i < result.flight_path.size(); ++i) {
        EXPECT_LE(GeoMath::haversine_distance(result.flight_path[i - 1], result.flight_path[i]),
                  37.0 + 1e-6);
    }
}

TEST_F(MissionAssemblerTest, GeofenceEnclosesRoute) {
    auto result = assemble(a_to_b());
    const auto& fence = result.plan.geofence;
    ASSERT_GE(fence.polygon.size(), 4u);
    EXPECT_TRUE(fence.inclusion);
    EXPECT_EQ(fence.polygon.front(), fence.polygon.back());

    double min_lat = 90.0, max_lat = -90.0;
    for (const auto& v : fence.polygon) {
        min_lat = std::min(min_lat, v.lat);
        max_lat = std::max(max_lat, v.lat);
    }
    EXPECT_LT(min_lat, 40.0);
    EXPECT_GT(max_lat, 40.01);
}

TEST_F(MissionAssemblerTest, FixedWingEndsWithLandingPattern) {
    auto config = a_to_b();
    config.aircraft = AircraftKind::FIXED_WING;
    auto result = assemble(config);

    ASSERT_TRUE(std::holds_alternative<LandingPatternItem>(result.plan.items.back()));
    EXPECT_EQ(result.plan.vehicle.firmware_type, 11);
    EXPECT_EQ(result.plan.vehicle.vehicle_type, 1);

    // Simple items stay consecutively numbered; the pattern carries no id
    int expected = 1;
    for (const auto& item : result.plan.items) {
        if (const auto* simple = std::get_if<SimpleItem>(&item)) {
            EXPECT_EQ(simple->do_jump_id, expected++);
        }
    }
}

TEST_F(MissionAssemblerTest, FenceContainsFixedWingLoiterCircles) {
    auto config = a_to_b();
    config.aircraft = AircraftKind::FIXED_WING;
    config.scenario = Scenario::DELIVERY;
    config.delivery_action = MissionConfig::DeliveryAction::LAND_AND_TAKEOFF;
    config.geofence_buffer_m = 20.0;
    auto result = assemble(config);
    const FlightPath& fence = result.plan.geofence.polygon;
    ASSERT_GE(fence.size(), 4u);

    size_t patterns = 0;
    for (const auto& item : result.plan.items) {
        const auto* pattern = std::get_if<LandingPatternItem>(&item);
        if (!pattern) continue;
        ++patterns;
        // Far side of the orbit, away from the touchdown point
        const double r = pattern->loiter_radius_m * 0.95;
        const double d = r / std::sqrt(2.0);
        EXPECT_TRUE(inside_ring(fence, GeoMath::offset_meters(pattern->approach_coordinate, d, d)));
        EXPECT_TRUE(inside_ring(fence, GeoMath::offset_meters(pattern->approach_coordinate, r, 0.0)));
        EXPECT_TRUE(inside_ring(fence, GeoMath::offset_meters(pattern->approach_coordinate, 0.0, r)));
    }
    EXPECT_EQ(patterns, 2u);
}

TEST_F(MissionAssemblerTest, SpeedOverridesReachThePlan) {
    auto defaults = assemble(a_to_b());
    EXPECT_DOUBLE_EQ(defaults.plan.vehicle.cruise_speed, 15.0);
    EXPECT_DOUBLE_EQ(defaults.plan.vehicle.hover_speed, 5.0);

    auto config = a_to_b();
    config.cruise_speed_mps = 22.5;
    config.hover_speed_mps = 3.0;
    auto result = assemble(config);
    EXPECT_DOUBLE_EQ(result.plan.vehicle.cruise_speed, 22.5);
    EXPECT_DOUBLE_EQ(result.plan.vehicle.hover_speed, 3.0);
}

TEST_F(MissionAssemblerTest, VtolTransitionsAfterTakeoffAndBeforeLanding) {
    auto config = a_to_b();
    config.aircraft = AircraftKind::VTOL;
    const auto cmds = commands(assemble(config).plan);
    ASSERT_GE(cmds.size(), 4u);
    EXPECT_EQ(cmds[0], mav::CMD_NAV_VTOL_TAKEOFF);
    EXPECT_EQ(cmds[1], mav::CMD_DO_VTOL_TRANSITION);
    EXPECT_EQ(cmds[cmds.size() - 2], mav::CMD_DO_VTOL_TRANSITION);
    EXPECT_EQ(cmds.back(), mav::CMD_NAV_VTOL_LAND);
}

TEST_F(MissionAssemblerTest, DeliveryReleasesAndReturns) {
    auto config = a_to_b();
    config.scenario = Scenario::DELIVERY;
    auto result = assemble(config);
    const auto cmds = commands(result.plan);

    EXPECT_EQ(count_command(result.plan, mav::CMD_DO_GRIPPER), 1u);
    EXPECT_EQ(cmds.back(), mav::CMD_NAV_LAND);
    const auto& land = std::get<SimpleItem>(result.plan.items.back());
    EXPECT_DOUBLE_EQ(land.params[4], 40.0);
    EXPECT_DOUBLE_EQ(land.params[5], -75.0);

    // Gripper follows the waypoint over the destination
    auto gripper = std::find(cmds.begin(), cmds.end(), mav::CMD_DO_GRIPPER);
    ASSERT_NE(gripper, cmds.begin());
    const auto& before = std::get<SimpleItem>(result.plan.items[gripper - cmds.begin() - 1]);
    EXPECT_DOUBLE_EQ(before.params[4], 40.01);
}

TEST_F(MissionAssemblerTest, DeliveryLandAndTakeoffDefaultsToLandAndReturn) {
    auto config = a_to_b();
    config.scenario = Scenario::DELIVERY;
    config.delivery_action = MissionConfig::DeliveryAction::LAND_AND_TAKEOFF;
    EXPECT_EQ(MissionAssembler::default_terminal_action(config), Terminal::LAND_AND_RETURN);

    auto result = assemble(config);
    EXPECT_EQ(count_command(result.plan, mav::CMD_NAV_LAND), 2u);
    EXPECT_EQ(count_command(result.plan, mav::CMD_NAV_TAKEOFF), 2u);
    EXPECT_EQ(count_command(result.plan, mav::CMD_DO_GRIPPER), 0u);
}

TEST_F(MissionAssemblerTest, MultiDeliveryReleasesAtEveryStop) {
    MissionConfig config;
    config.scenario = Scenario::MULTI_DELIVERY;
    config.start = Coordinate(40.0, -75.0);
    config.waypoints = {{40.005, -75.0}, {40.005, -74.995}, {40.0, -74.995}};
    auto result = assemble(config);

    EXPECT_EQ(count_command(result.plan, mav::CMD_DO_GRIPPER), 3u);
    const auto& land = std::get<SimpleItem>(result.plan.items.back());
    EXPECT_EQ(land.command, mav::CMD_NAV_LAND);
    EXPECT_DOUBLE_EQ(land.params[4], 40.0);
    EXPECT_DOUBLE_EQ(land.params[5], -75.0);
}

TEST_F(MissionAssemblerTest, LinearRouteLandsAtLastWaypoint) {
    MissionConfig config;
    config.scenario = Scenario::LINEAR_ROUTE;
    config.start = Coordinate(40.0, -75.0);
    config.waypoints = {{40.003, -75.0}, {40.003, -74.997}};
    auto result = assemble(config);

    const auto& land = std::get<SimpleItem>(result.plan.items.back());
    EXPECT_EQ(land.command, mav::CMD_NAV_LAND);
    EXPECT_DOUBLE_EQ(land.params[4], 40.003);
    EXPECT_DOUBLE_EQ(land.params[5], -74.997);
}

TEST_F(MissionAssemblerTest, LinearRouteReturnRetracesRoute) {
    MissionConfig config;
    config.scenario = Scenario::LINEAR_ROUTE;
    config.start = Coordinate(40.0, -75.0);
    config.waypoints = {{40.003, -75.0}, {40.003, -74.997}};
    config.terminal_action = Terminal::RETURN_TO_START;
    auto result = assemble(config);

    const auto& path = result.flight_path;
    EXPECT_NE(std::find(path.begin(), path.end(), Coordinate(40.003, -74.997)), path.end());
    EXPECT_EQ(path.back(), Coordinate(40.0, -75.0));
    // The corner is visited on the way out and on the way back
    EXPECT_EQ(std::count(path.begin(), path.end(), Coordinate(40.003, -75.0)), 2);
}

TEST_F(MissionAssemblerTest, PatrolPerimeterStaysInsideArea) {
    auto config = area(Scenario::SECURITY_PATROL);
    auto result = assemble(config);

    const auto cmds = commands(result.plan);
    EXPECT_EQ(cmds.front(), mav::CMD_NAV_TAKEOFF);
    EXPECT_EQ(cmds.back(), mav::CMD_NAV_LAND);
    EXPECT_FALSE(result.has_warning(PlanWarning::Kind::POLYGON_SHRINK_FALLBACK));

    // Points other than the start and the legs to and from it are inset
    size_t inside = 0;
    for (const auto& p : result.flight_path) {
        if (p.lat > 40.0 && p.lat < 40.01 && p.lon > -75.0 && p.lon < -74.99) {
            ++inside;
        }
    }
    EXPECT_GT(inside, result.flight_path.size() / 2);
}

TEST_F(MissionAssemblerTest, PatrolGridVisitsMorePoints) {
    auto perimeter = assemble(area(Scenario::SECURITY_PATROL));

    auto config = area(Scenario::SECURITY_PATROL);
    config.patrol_pattern = MissionConfig::PatrolPattern::GRID;
    config.interval_m = 500.0;
    auto grid = assemble(config);

    EXPECT_GT(grid.flight_path.size(), 20u);
    EXPECT_EQ(commands(grid.plan).back(), mav::CMD_NAV_LAND);
    EXPECT_NE(grid.flight_path.size(), perimeter.flight_path.size());
}

TEST_F(MissionAssemblerTest, SurveyTogglesCameraAroundTransects) {
    auto config = area(Scenario::MAPPING_SURVEY);
    config.altitude_agl_m = 100.0;
    auto result = assemble(config);
    const auto flat = items::flatten(result.plan.items);

    std::vector<size_t> triggers;
    for (size_t i = 0; i < flat.size(); ++i) {
        if (items::command_of(flat[i]) == mav::CMD_DO_SET_CAM_TRIGG_DIST) {
            triggers.push_back(i);
        }
    }
    ASSERT_EQ(triggers.size(), 2u);
    EXPECT_GT(std::get<SimpleItem>(flat[triggers[0]]).params[0], 0.0);
    EXPECT_DOUBLE_EQ(std::get<SimpleItem>(flat[triggers[1]]).params[0], 0.0);
    EXPECT_GT(triggers[1] - triggers[0], 4u);
    EXPECT_EQ(items::command_of(flat.back()), mav::CMD_NAV_LAND);
}

TEST_F(MissionAssemblerTest, SurveyIsOneComplexItem) {
    auto config = area(Scenario::MAPPING_SURVEY);
    config.altitude_agl_m = 100.0;
    config.camera.survey_angle_deg = 90.0;
    auto result = assemble(config);
    const auto& plan = result.plan;

    const SurveyPatternItem* survey = nullptr;
    for (const auto& item : plan.items) {
        if (const auto* found = std::get_if<SurveyPatternItem>(&item)) {
            ASSERT_EQ(survey, nullptr);
            survey = found;
        }
    }
    ASSERT_NE(survey, nullptr);

    EXPECT_EQ(survey->polygon, config.polygon);
    EXPECT_DOUBLE_EQ(survey->angle_deg, 90.0);
    EXPECT_DOUBLE_EQ(survey->altitude_m, 100.0);
    EXPECT_GT(survey->frontal_footprint_m, 0.0);
    EXPECT_GT(survey->camera_shots, 0);
    EXPECT_EQ(survey->transect_points.size() % 2, 0u);
    ASSERT_GE(survey->items.size(), 3u);
    EXPECT_EQ(survey->items.front().command, mav::CMD_DO_SET_CAM_TRIGG_DIST);
    EXPECT_EQ(survey->items.back().command, mav::CMD_DO_SET_CAM_TRIGG_DIST);

    // Nested items continue the mission numbering
    int expected = 1;
    for (const auto& item : items::flatten(plan.items)) {
        EXPECT_EQ(std::get<SimpleItem>(item).do_jump_id, expected++);
    }
}

TEST_F(MissionAssemblerTest, SurveyOfHugeAreaWarnsAboutTruncation) {
    auto config = area(Scenario::MAPPING_SURVEY);
    config.polygon = {{40.00, -75.00}, {40.01, -75.00}, {40.01, -74.97}, {40.00, -74.97}};
    config.altitude_agl_m = 10.0;
    config.interval_m = 1000.0;
    auto result = assemble(config);
    EXPECT_TRUE(result.has_warning(PlanWarning::Kind::SURVEY_TRUNCATED));
}

TEST_F(MissionAssemblerTest, TowerInspectionCirclesAtTwoHeights) {
    MissionConfig config;
    config.scenario = Scenario::TOWER_INSPECTION;
    config.start = Coordinate(40.0, -75.002);
    config.tower = Coordinate(40.0, -75.0);
    auto result = assemble(config);
    const auto& plan = result.plan;

    const auto cmds = commands(plan);
    EXPECT_EQ(cmds[0], mav::CMD_NAV_TAKEOFF);
    EXPECT_EQ(cmds[1], mav::CMD_DO_SET_ROI_LOCATION);
    EXPECT_EQ(cmds.back(), mav::CMD_NAV_LAND);

    const auto& takeoff = std::get<SimpleItem>(plan.items[0]);
    EXPECT_DOUBLE_EQ(*takeoff.altitude, config.tower_low_agl_m);

    size_t low = 0;
    size_t high = 0;
    for (const auto& wp : result.waypoints) {
        if (wp.kind != CommandKind::WAYPOINT) continue;
        if (wp.agl_altitude_m == config.tower_low_agl_m) ++low;
        if (wp.agl_altitude_m == config.tower_high_agl_m) ++high;
    }
    EXPECT_EQ(low, 4u);
    EXPECT_GE(high, 4u);

    // Rectangle around stations, start and tower
    const auto& fence = plan.geofence.polygon;
    ASSERT_EQ(fence.size(), 5u);
    EXPECT_EQ(fence.front(), fence.back());
}

TEST_F(MissionAssemblerTest, MissingLocationNamesTheLocation) {
    auto config = a_to_b();
    config.end.reset();
    MissionAssembler assembler(*terrain_);
    try {
        assembler.assemble(config);
        FAIL() << "Expected MissingLocationError";
    } catch (const MissingLocationError& e) {
        EXPECT_EQ(e.location_name(), "end");
        EXPECT_STREQ(e.what(), "Missing required location: end");
    }
}

TEST_F(MissionAssemblerTest, InvalidValuesThrow) {
    MissionAssembler assembler(*terrain_);

    auto config = a_to_b();
    config.interval_m = 0.0;
    EXPECT_THROW(assembler.assemble(config), InvalidParameterError);

    MissionConfig tower;
    tower.scenario = Scenario::TOWER_INSPECTION;
    tower.start = Coordinate(40.0, -75.002);
    tower.tower = Coordinate(40.0, -75.0);
    tower.terminal_action = Terminal::LAND;
    EXPECT_THROW(assembler.assemble(tower), InvalidParameterError);

    auto survey = area(Scenario::MAPPING_SURVEY);
    survey.terminal_action = Terminal::PAYLOAD_RELEASE;
    EXPECT_THROW(assembler.assemble(survey), InvalidParameterError);
}

TEST_F(MissionAssemblerTest, TerrainOutageDegradesButStillProducesPlan) {
    auto failing = std::make_shared<FakeHttpClient>(
        [](const std::string&) { return FakeHttpClient::status(503); });
    TerrainService terrain(failing, fast_config());
    MissionAssembler assembler(terrain);

    auto config = a_to_b();
    config.interval_m = 500.0;
    auto result = assembler.assemble(config);

    EXPECT_TRUE(result.terrain_degraded);
    EXPECT_TRUE(result.has_warning(PlanWarning::Kind::TERRAIN_UNAVAILABLE));
    EXPECT_FALSE(result.plan.items.empty());
    const auto& takeoff = std::get<SimpleItem>(result.plan.items.front());
    EXPECT_DOUBLE_EQ(takeoff.params[6], 100.0);
}

TEST_F(MissionAssemblerTest, LowAltitudeRaisesProximityWarnings) {
    auto config = a_to_b();
    config.altitude_agl_m = 10.0;
    auto result = assemble(config);
    EXPECT_EQ(result.proximity_warnings.size(), result.waypoints.size());
    for (const auto& warning : result.proximity_warnings) {
        EXPECT_NEAR(warning.clearance_m, 10.0, 1e-9);
        EXPECT_DOUBLE_EQ(warning.threshold_m, config.proximity_threshold_m);
    }
}

TEST(MissionAssemblerDefaults, TerminalActionPerScenario) {
    MissionConfig config;
    config.scenario = Scenario::A_TO_B;
    EXPECT_EQ(MissionAssembler::default_terminal_action(config), Terminal::LAND);
    config.scenario = Scenario::LINEAR_ROUTE;
    EXPECT_EQ(MissionAssembler::default_terminal_action(config), Terminal::LAND);
    config.scenario = Scenario::DELIVERY;
    EXPECT_EQ(MissionAssembler::default_terminal_action(config), Terminal::PAYLOAD_RELEASE);
    for (auto s : {Scenario::MULTI_DELIVERY, Scenario::SECURITY_PATROL,
                   Scenario::MAPPING_SURVEY, Scenario::TOWER_INSPECTION}) {
        config.scenario = s;
        EXPECT_EQ(MissionAssembler::default_terminal_action(config), Terminal::RETURN_TO_START);
    }
}
