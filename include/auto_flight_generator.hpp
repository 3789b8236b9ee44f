#pragma once

/**
 * @file auto_flight_generator.hpp
 * @brief Main header for the AutoFlightGenerator mission planner
 *
 * Terrain-following mission generation for multicopter, fixed-wing and VTOL
 * aircraft, producing QGroundControl plan documents.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <array>
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace afg {

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Invalid user-supplied value (interval, coordinate text, enum name)
 */
class InvalidParameterError : public std::runtime_error {
public:
    explicit InvalidParameterError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A location required by the selected scenario was not provided
 */
class MissingLocationError : public std::runtime_error {
public:
    explicit MissingLocationError(const std::string& location_name)
        : std::runtime_error("Missing required location: " + location_name),
          location_name_(location_name) {}

    const std::string& location_name() const { return location_name_; }

private:
    std::string location_name_;
};

// ============================================================================
// Geographic primitives
// ============================================================================

/**
 * @brief WGS84 position in decimal degrees
 */
struct Coordinate {
    double lat = 0.0;
    double lon = 0.0;

    Coordinate() = default;
    Coordinate(double latitude, double longitude) : lat(latitude), lon(longitude) {}

    bool operator==(const Coordinate& other) const = default;

    bool is_valid() const {
        return std::isfinite(lat) && std::isfinite(lon) &&
               lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
    }
};

/// Ordered positions in flight order
using FlightPath = std::vector<Coordinate>;

// ============================================================================
// Aircraft and mission items
// ============================================================================

enum class AircraftKind { MULTICOPTER, FIXED_WING, VTOL };

enum class CommandKind { TAKEOFF, WAYPOINT, LOITER, LAND, PAYLOAD_ACTION };

/**
 * @brief MAVLink command and frame codes used in generated plans
 */
namespace mav {
    constexpr int CMD_NAV_WAYPOINT = 16;
    constexpr int CMD_NAV_LOITER_TIME = 19;
    constexpr int CMD_NAV_RETURN_TO_LAUNCH = 20;
    constexpr int CMD_NAV_LAND = 21;
    constexpr int CMD_NAV_TAKEOFF = 22;
    constexpr int CMD_NAV_VTOL_TAKEOFF = 84;
    constexpr int CMD_NAV_VTOL_LAND = 85;
    constexpr int CMD_DO_SET_ROI_LOCATION = 201;
    constexpr int CMD_DO_SET_CAM_TRIGG_DIST = 206;
    constexpr int CMD_DO_GRIPPER = 211;
    constexpr int CMD_DO_VTOL_TRANSITION = 3000;

    constexpr int FRAME_GLOBAL = 0;
    constexpr int FRAME_MISSION = 2;
    constexpr int FRAME_GLOBAL_RELATIVE_ALT = 3;

    constexpr int VTOL_STATE_MC = 3;
    constexpr int VTOL_STATE_FW = 4;

    constexpr int ALTITUDE_MODE_RELATIVE = 1;
    constexpr int ALTITUDE_MODE_TERRAIN_FRAME = 3;
}

/// Placeholder for a param QGC writes as JSON null
inline constexpr double kNullParam = std::numeric_limits<double>::quiet_NaN();

/**
 * @brief A composed navigation point: position plus both altitude references
 */
struct Waypoint {
    Coordinate position;
    double agl_altitude_m = 0.0;
    double amsl_altitude_m = 0.0;
    double terrain_elevation_m = 0.0;
    int sequence = 0;
    CommandKind kind = CommandKind::WAYPOINT;
    bool terrain_degraded = false;
};

/**
 * @brief One MAVLink mission command in plan-file form
 *
 * params holds param1..param7; params[4..6] are lat, lon, alt for commands
 * that carry a position. NaN entries serialize as null.
 */
struct SimpleItem {
    int command = mav::CMD_NAV_WAYPOINT;
    int do_jump_id = 0;
    int frame = mav::FRAME_GLOBAL;
    std::array<double, 7> params{0.0, 0.0, 0.0, kNullParam, 0.0, 0.0, 0.0};
    std::optional<double> amsl_alt_above_terrain;
    std::optional<double> altitude;
    std::optional<int> altitude_mode;
    bool auto_continue = true;

    bool has_position() const {
        return frame != mav::FRAME_MISSION && std::isfinite(params[4]) && std::isfinite(params[5]);
    }
};

/**
 * @brief Fixed-wing landing pattern complex item
 */
struct LandingPatternItem {
    Coordinate land_coordinate;
    double land_altitude_m = 0.0;
    Coordinate approach_coordinate;
    double approach_altitude_m = 0.0;
    double loiter_radius_m = 75.0;
    bool loiter_clockwise = true;
    bool altitudes_are_relative = true;
    bool use_loiter_to_alt = true;
    bool value_set_is_distance = false;
    bool stop_taking_photos = true;
    bool stop_video_photos = true;
};

/**
 * @brief Camera parameters for survey footprint calculation
 *
 * Defaults describe a DJI Mini 2 class sensor.
 */
struct CameraSpec {
    double sensor_width_mm = 6.17;
    double sensor_height_mm = 4.55;
    double focal_length_mm = 4.49;
    int image_width_px = 4000;
    int image_height_px = 3000;
    double frontal_overlap = 0.8;   // 0..1
    double side_overlap = 0.8;      // 0..1
    double survey_angle_deg = 0.0;  // Transect heading, clockwise from north
};

/**
 * @brief QGC "survey" complex item
 *
 * items holds the expanded commands (camera triggers and transect waypoints)
 * that QGC writes under TransectStyleComplexItem.Items. The complex item has
 * no doJumpId of its own; the nested items are numbered in mission order.
 */
struct SurveyPatternItem {
    FlightPath polygon;              // Area vertices, open ring
    double angle_deg = 0.0;          // Transect heading, clockwise from north
    double altitude_m = 0.0;         // Distance to surface
    CameraSpec camera;
    double frontal_footprint_m = 0.0;
    double side_footprint_m = 0.0;
    double turnaround_m = 0.0;
    bool trigger_in_turnaround = true;
    bool hover_and_capture = false;
    bool refly_90_degrees = false;
    int camera_shots = 0;
    std::vector<SimpleItem> items;
    FlightPath transect_points;      // Entry and exit of every transect
};

using MissionItem = std::variant<SimpleItem, LandingPatternItem, SurveyPatternItem>;

// ============================================================================
// Plan aggregate
// ============================================================================

struct Geofence {
    FlightPath polygon;   // Closed ring: first == last when non-empty
    bool inclusion = true;
};

struct VehicleInfo {
    double cruise_speed = 15.0;
    double hover_speed = 5.0;
    int firmware_type = 12;
    int vehicle_type = 2;
};

struct MissionPlan {
    std::vector<MissionItem> items;
    Geofence geofence;
    Coordinate home;
    double home_elevation_m = 0.0;
    VehicleInfo vehicle;
    int global_plan_altitude_mode = 0;
};

/**
 * @brief Non-fatal condition detected while building a plan
 */
struct PlanWarning {
    enum class Kind {
        TERRAIN_UNAVAILABLE,
        GEOFENCE_MULTIPART,
        GEOFENCE_FALLBACK,
        POLYGON_SHRINK_FALLBACK,
        SURVEY_TRUNCATED
    };

    Kind kind;
    std::string message;
};

/**
 * @brief Waypoint whose clearance to terrain is below the safety threshold
 */
struct ProximityWarning {
    size_t waypoint_index = 0;
    Coordinate position;
    double clearance_m = 0.0;
    double threshold_m = 0.0;
};

// ============================================================================
// Mission configuration
// ============================================================================

/**
 * @brief Everything needed to generate one mission
 */
struct MissionConfig {
    enum class Scenario {
        A_TO_B,
        DELIVERY,
        MULTI_DELIVERY,
        LINEAR_ROUTE,
        SECURITY_PATROL,
        MAPPING_SURVEY,
        TOWER_INSPECTION
    };

    enum class TerminalAction {
        LAND,             // Land at the final location
        RETURN_TO_START,  // Fly back along the route and land at start
        PAYLOAD_RELEASE,  // Release payload at the final location, then return
        LAND_AND_RETURN   // Touch down at the final location, take off, return
    };

    enum class DeliveryAction { PAYLOAD, LAND_AND_TAKEOFF };

    enum class PatrolPattern { PERIMETER, GRID };

    Scenario scenario = Scenario::A_TO_B;
    AircraftKind aircraft = AircraftKind::MULTICOPTER;

    std::optional<Coordinate> start;
    std::optional<Coordinate> end;
    std::vector<Coordinate> waypoints;   // Delivery points or polyline vertices
    std::vector<Coordinate> polygon;     // Patrol or survey area
    std::optional<Coordinate> tower;

    double altitude_agl_m = 50.0;
    double interval_m = 50.0;
    double geofence_buffer_m = 50.0;

    // Unset means the scenario default
    std::optional<TerminalAction> terminal_action;
    DeliveryAction delivery_action = DeliveryAction::PAYLOAD;

    PatrolPattern patrol_pattern = PatrolPattern::PERIMETER;
    double inward_margin_m = 50.0;
    double grid_spacing_m = 111.32;

    CameraSpec camera;

    double tower_offset_m = 50.0;
    double tower_low_agl_m = 3.048;    // 10 ft
    double tower_high_agl_m = 30.48;   // 100 ft

    double proximity_threshold_m = 15.24;  // 50 ft

    // Written to the plan as cruiseSpeed / hoverSpeed (m/s); unset keeps the aircraft default
    std::optional<double> cruise_speed_mps;
    std::optional<double> hover_speed_mps;
};

} // namespace afg
