/**
 * @file test_input_validator.cpp
 * @brief Configuration checks before generation
 */

#include "core/InputValidator.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace afg;
using Scenario = MissionConfig::Scenario;
using Terminal = MissionConfig::TerminalAction;

namespace {

MissionConfig valid_a_to_b() {
    MissionConfig config;
    config.scenario = Scenario::A_TO_B;
    config.start = Coordinate(40.0, -75.0);
    config.end = Coordinate(40.01, -75.0);
    return config;
}

MissionConfig valid_survey() {
    MissionConfig config;
    config.scenario = Scenario::MAPPING_SURVEY;
    config.start = Coordinate(40.0, -75.0);
    config.polygon = {{40.0, -75.0}, {40.01, -75.0}, {40.01, -74.99}};
    return config;
}

} // namespace

TEST(InputValidatorTest, AcceptsCompleteConfiguration) {
    InputValidator validator;
    auto result = validator.validate(valid_a_to_b());
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.conflicts.empty());
    EXPECT_EQ(result.format_error_message(), "");
}

TEST(InputValidatorTest, RequiredLocationsPerScenario) {
    EXPECT_EQ(InputValidator::required_locations(Scenario::A_TO_B),
              (std::vector<std::string>{"start", "end"}));
    EXPECT_EQ(InputValidator::required_locations(Scenario::TOWER_INSPECTION),
              (std::vector<std::string>{"start", "tower"}));
    EXPECT_EQ(InputValidator::required_locations(Scenario::SECURITY_PATROL),
              (std::vector<std::string>{"start", "polygon"}));
    EXPECT_EQ(InputValidator::required_locations(Scenario::MULTI_DELIVERY),
              (std::vector<std::string>{"start", "delivery points"}));
}

TEST(InputValidatorTest, ReportsEveryMissingLocation) {
    MissionConfig config;
    config.scenario = Scenario::DELIVERY;

    InputValidator validator;
    auto result = validator.validate(config);
    ASSERT_FALSE(result.is_valid);
    ASSERT_EQ(result.conflicts.size(), 2u);

    const auto* missing = result.first_missing_location();
    ASSERT_NE(missing, nullptr);
    EXPECT_EQ(missing->location_name, "start");
    EXPECT_EQ(missing->description, "Missing required location: start");
    EXPECT_EQ(result.conflicts[1].location_name, "end");
}

TEST(InputValidatorTest, PolygonNeedsThreeVertices) {
    auto config = valid_survey();
    config.polygon.pop_back();

    InputValidator validator;
    auto result = validator.validate(config);
    ASSERT_FALSE(result.is_valid);
    const auto* missing = result.first_missing_location();
    ASSERT_NE(missing, nullptr);
    EXPECT_EQ(missing->location_name, "polygon");
    EXPECT_NE(missing->description.find("only 2 vertices"), std::string::npos);
}

TEST(InputValidatorTest, RejectsNonPositiveDistances) {
    InputValidator validator;

    auto config = valid_a_to_b();
    config.interval_m = 0.0;
    auto result = validator.validate(config);
    ASSERT_FALSE(result.is_valid);
    EXPECT_EQ(result.first_missing_location(), nullptr);

    config = valid_a_to_b();
    config.geofence_buffer_m = -10.0;
    EXPECT_FALSE(validator.validate(config).is_valid);

    config = valid_a_to_b();
    config.altitude_agl_m = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(validator.validate(config).is_valid);

    config = valid_a_to_b();
    config.altitude_agl_m = 0.0;
    EXPECT_TRUE(validator.validate(config).is_valid);
}

TEST(InputValidatorTest, SpeedOverridesMustBePositive) {
    InputValidator validator;

    auto config = valid_a_to_b();
    config.cruise_speed_mps = 18.0;
    config.hover_speed_mps = 4.0;
    EXPECT_TRUE(validator.validate(config).is_valid);

    config.hover_speed_mps = 0.0;
    auto result = validator.validate(config);
    ASSERT_FALSE(result.is_valid);
    EXPECT_EQ(result.conflicts.front().description, "Vehicle speeds must be positive");

    config = valid_a_to_b();
    config.cruise_speed_mps = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(validator.validate(config).is_valid);
}

TEST(InputValidatorTest, RejectsCoordinatesOutOfRange) {
    auto config = valid_a_to_b();
    config.end = Coordinate(95.0, -75.0);

    InputValidator validator;
    auto result = validator.validate(config);
    ASSERT_FALSE(result.is_valid);
    ASSERT_EQ(result.conflicts.size(), 1u);
    ASSERT_EQ(result.conflicts[0].involved_params.size(), 1u);
    EXPECT_NE(result.conflicts[0].involved_params[0].find("--end"), std::string::npos);
}

TEST(InputValidatorTest, SurveyCameraMustProduceFootprint) {
    InputValidator validator;
    EXPECT_TRUE(validator.validate(valid_survey()).is_valid);

    auto config = valid_survey();
    config.camera.focal_length_mm = 0.0;
    EXPECT_FALSE(validator.validate(config).is_valid);

    config = valid_survey();
    config.camera.side_overlap = 1.0;
    EXPECT_FALSE(validator.validate(config).is_valid);

    // Camera values are ignored outside surveys
    auto route = valid_a_to_b();
    route.camera.focal_length_mm = 0.0;
    EXPECT_TRUE(validator.validate(route).is_valid);
}

TEST(InputValidatorTest, TerminalActionMustFitScenario) {
    InputValidator validator;

    auto survey = valid_survey();
    survey.terminal_action = Terminal::PAYLOAD_RELEASE;
    EXPECT_FALSE(validator.validate(survey).is_valid);
    survey.terminal_action = Terminal::LAND_AND_RETURN;
    EXPECT_FALSE(validator.validate(survey).is_valid);
    survey.terminal_action = Terminal::LAND;
    EXPECT_TRUE(validator.validate(survey).is_valid);

    MissionConfig tower;
    tower.scenario = Scenario::TOWER_INSPECTION;
    tower.start = Coordinate(40.0, -75.0);
    tower.tower = Coordinate(40.001, -75.0);
    EXPECT_TRUE(validator.validate(tower).is_valid);
    tower.terminal_action = Terminal::LAND;
    EXPECT_FALSE(validator.validate(tower).is_valid);
    tower.terminal_action = Terminal::RETURN_TO_START;
    EXPECT_TRUE(validator.validate(tower).is_valid);
}

TEST(InputValidatorTest, TowerPassesMustBeOrdered) {
    MissionConfig tower;
    tower.scenario = Scenario::TOWER_INSPECTION;
    tower.start = Coordinate(40.0, -75.0);
    tower.tower = Coordinate(40.001, -75.0);
    tower.tower_low_agl_m = 40.0;
    tower.tower_high_agl_m = 30.0;

    InputValidator validator;
    EXPECT_FALSE(validator.validate(tower).is_valid);
}

TEST(InputValidatorTest, ErrorMessageListsProblemsAndSuggestions) {
    MissionConfig config;
    config.scenario = Scenario::A_TO_B;
    config.interval_m = -1.0;

    InputValidator validator;
    const std::string message = validator.validate(config).format_error_message();
    EXPECT_NE(message.find("Problem 1: Missing required location: start"), std::string::npos);
    EXPECT_NE(message.find("Problem 3: Distances out of range"), std::string::npos);
    EXPECT_NE(message.find("Suggested solutions"), std::string::npos);
    EXPECT_NE(message.find("Mission generation aborted."), std::string::npos);
}
