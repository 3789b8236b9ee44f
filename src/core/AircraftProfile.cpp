/**
 * @file AircraftProfile.cpp
 * @brief Per-aircraft command selection for generated missions
 */

#include "AircraftProfile.hpp"
#include "GeoMath.hpp"
#include "MissionItems.hpp"
#include <algorithm>
#include <cmath>

namespace afg {

namespace {

void append(std::vector<MissionItem>& target, const std::vector<MissionItem>& items) {
    target.insert(target.end(), items.begin(), items.end());
}

} // namespace

std::unique_ptr<AircraftProfile> AircraftProfile::create(AircraftKind kind) {
    switch (kind) {
        case AircraftKind::MULTICOPTER:
            return std::make_unique<MulticopterProfile>();
        case AircraftKind::FIXED_WING:
            return std::make_unique<FixedWingProfile>();
        case AircraftKind::VTOL:
            return std::make_unique<VtolProfile>();
    }
    throw InvalidParameterError("Unknown aircraft kind");
}

double AircraftProfile::landing_pattern_offset(double cruise_altitude_m) {
    const double offset = LANDING_BASE_OFFSET_M +
        (cruise_altitude_m - LANDING_BASE_ALTITUDE_M) * 15.0 / 3.048;
    return std::max(offset, LANDING_MIN_OFFSET_M);
}

std::vector<MissionItem> AircraftProfile::takeoff_items(const Waypoint& takeoff) const {
    std::vector<MissionItem> items{takeoff_command(takeoff)};
    append(items, after_takeoff_items());
    return items;
}

std::vector<MissionItem> AircraftProfile::landing_items(const Coordinate& point,
                                                        double cruise_agl_m) const {
    std::vector<MissionItem> items = before_hover_items();
    append(items, touchdown_items(point, cruise_agl_m));
    return items;
}

std::vector<MissionItem> AircraftProfile::delivery_items(const Coordinate& point) const {
    std::vector<MissionItem> items = before_hover_items();
    append(items, release_items(point));
    append(items, after_hover_items());
    return items;
}

std::vector<MissionItem> AircraftProfile::land_and_takeoff_items(const Waypoint& point,
                                                                 double cruise_agl_m) const {
    std::vector<MissionItem> items = landing_items(point.position, cruise_agl_m);
    append(items, takeoff_items(point));
    return items;
}

std::optional<double> AircraftProfile::loiter_radius(double cruise_agl_m) const {
    return landing_pattern_offset(cruise_agl_m);
}

std::vector<MissionItem> AircraftProfile::release_items(const Coordinate& point) const {
    return {items::loiter_time(point), items::gripper_release()};
}

// ----------------------------------------------------------------------------
// Multicopter
// ----------------------------------------------------------------------------

VehicleInfo MulticopterProfile::vehicle_info() const {
    VehicleInfo info;
    info.firmware_type = 12;
    info.vehicle_type = 2;
    return info;
}

std::optional<double> MulticopterProfile::loiter_radius(double /*cruise_agl_m*/) const {
    return std::nullopt;
}

SimpleItem MulticopterProfile::takeoff_command(const Waypoint& takeoff) const {
    return items::terrain_nav(mav::CMD_NAV_TAKEOFF, takeoff);
}

std::vector<MissionItem> MulticopterProfile::touchdown_items(const Coordinate& point,
                                                             double /*cruise_agl_m*/) const {
    return {items::land(mav::CMD_NAV_LAND, point)};
}

std::vector<MissionItem> MulticopterProfile::release_items(const Coordinate& /*point*/) const {
    return {items::gripper_release()};
}

// ----------------------------------------------------------------------------
// Fixed wing
// ----------------------------------------------------------------------------

VehicleInfo FixedWingProfile::vehicle_info() const {
    VehicleInfo info;
    info.firmware_type = 11;
    info.vehicle_type = 1;
    return info;
}

SimpleItem FixedWingProfile::takeoff_command(const Waypoint& takeoff) const {
    return items::terrain_nav(mav::CMD_NAV_TAKEOFF, takeoff, TAKEOFF_PITCH_DEG);
}

LandingPatternItem FixedWingProfile::landing_pattern(const Coordinate& point, double cruise_agl_m) {
    const double offset = landing_pattern_offset(cruise_agl_m);
    // Approach is `offset` from the land point along the NE diagonal, so the
    // loiter circle of the same radius passes over the touchdown point
    const double leg = offset / std::sqrt(2.0);

    LandingPatternItem pattern;
    pattern.land_coordinate = point;
    pattern.land_altitude_m = 0.0;
    pattern.approach_coordinate = GeoMath::offset_meters(point, leg, leg);
    pattern.approach_altitude_m = cruise_agl_m;
    pattern.loiter_radius_m = offset;
    return pattern;
}

std::vector<MissionItem> FixedWingProfile::touchdown_items(const Coordinate& point,
                                                           double cruise_agl_m) const {
    return {landing_pattern(point, cruise_agl_m)};
}

// ----------------------------------------------------------------------------
// VTOL
// ----------------------------------------------------------------------------

VehicleInfo VtolProfile::vehicle_info() const {
    VehicleInfo info;
    info.firmware_type = 12;
    info.vehicle_type = 20;
    return info;
}

SimpleItem VtolProfile::takeoff_command(const Waypoint& takeoff) const {
    return items::terrain_nav(mav::CMD_NAV_VTOL_TAKEOFF, takeoff);
}

std::vector<MissionItem> VtolProfile::touchdown_items(const Coordinate& point,
                                                      double /*cruise_agl_m*/) const {
    SimpleItem land = items::land(mav::CMD_NAV_VTOL_LAND, point);
    land.params[3] = 0.0;
    return {land};
}

std::vector<MissionItem> VtolProfile::after_takeoff_items() const {
    return {items::vtol_transition(mav::VTOL_STATE_FW)};
}

std::vector<MissionItem> VtolProfile::before_hover_items() const {
    return {items::vtol_transition(mav::VTOL_STATE_MC)};
}

std::vector<MissionItem> VtolProfile::after_hover_items() const {
    return {items::vtol_transition(mav::VTOL_STATE_FW)};
}

std::string to_string(AircraftKind kind) {
    switch (kind) {
        case AircraftKind::MULTICOPTER: return "multicopter";
        case AircraftKind::FIXED_WING:  return "fixed-wing";
        case AircraftKind::VTOL:        return "vtol";
    }
    return "unknown";
}

} // namespace afg
