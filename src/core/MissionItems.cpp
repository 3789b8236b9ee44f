/**
 * @file MissionItems.cpp
 * @brief Factories for the plan-file mission commands
 */

#include "MissionItems.hpp"

namespace afg {
namespace items {

SimpleItem terrain_nav(int command, const Waypoint& wp, double param1) {
    SimpleItem item;
    item.command = command;
    item.frame = mav::FRAME_GLOBAL;
    item.params = {param1, 0.0, 0.0, kNullParam,
                   wp.position.lat, wp.position.lon, wp.amsl_altitude_m};
    item.amsl_alt_above_terrain = wp.amsl_altitude_m;
    item.altitude = wp.agl_altitude_m;
    item.altitude_mode = mav::ALTITUDE_MODE_TERRAIN_FRAME;
    return item;
}

SimpleItem waypoint(const Waypoint& wp) {
    return terrain_nav(mav::CMD_NAV_WAYPOINT, wp);
}

SimpleItem land(int command, const Coordinate& position) {
    SimpleItem item;
    item.command = command;
    item.frame = mav::FRAME_GLOBAL_RELATIVE_ALT;
    item.params = {0.0, 0.0, 0.0, kNullParam, position.lat, position.lon, 0.0};
    item.amsl_alt_above_terrain = 0.0;
    item.altitude = 0.0;
    item.altitude_mode = mav::ALTITUDE_MODE_RELATIVE;
    return item;
}

SimpleItem vtol_transition(int target_state) {
    SimpleItem item;
    item.command = mav::CMD_DO_VTOL_TRANSITION;
    item.frame = mav::FRAME_MISSION;
    item.params = {static_cast<double>(target_state), 0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    return item;
}

SimpleItem gripper_release() {
    SimpleItem item;
    item.command = mav::CMD_DO_GRIPPER;
    item.frame = mav::FRAME_MISSION;
    // param2 = 0 is GRIPPER_ACTION_RELEASE; param1 selects gripper instance 2
    item.params = {2.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    return item;
}

SimpleItem loiter_time(const Coordinate& position) {
    SimpleItem item;
    item.command = mav::CMD_NAV_LOITER_TIME;
    item.frame = mav::FRAME_GLOBAL_RELATIVE_ALT;
    item.params = {LOITER_SECONDS, 1.0, LOITER_RADIUS_M, 1.0,
                   position.lat, position.lon, LOITER_ALTITUDE_M};
    item.amsl_alt_above_terrain = LOITER_ALTITUDE_M;
    item.altitude = LOITER_ALTITUDE_M;
    item.altitude_mode = mav::ALTITUDE_MODE_RELATIVE;
    return item;
}

SimpleItem region_of_interest(const Coordinate& target) {
    SimpleItem item;
    item.command = mav::CMD_DO_SET_ROI_LOCATION;
    item.frame = mav::FRAME_GLOBAL_RELATIVE_ALT;
    item.params = {0.0, 0.0, 0.0, kNullParam, target.lat, target.lon, 0.0};
    return item;
}

SimpleItem camera_trigger_distance(double distance_m) {
    SimpleItem item;
    item.command = mav::CMD_DO_SET_CAM_TRIGG_DIST;
    item.frame = mav::FRAME_MISSION;
    item.params = {distance_m, 0.0, distance_m > 0.0 ? 1.0 : 0.0, 0.0, 0.0, 0.0, 0.0};
    return item;
}

std::optional<Coordinate> position_of(const MissionItem& item) {
    if (const auto* simple = std::get_if<SimpleItem>(&item)) {
        if (simple->has_position()) {
            return Coordinate(simple->params[4], simple->params[5]);
        }
        return std::nullopt;
    }
    if (const auto* survey = std::get_if<SurveyPatternItem>(&item)) {
        for (const auto& nested : survey->items) {
            if (nested.has_position()) {
                return Coordinate(nested.params[4], nested.params[5]);
            }
        }
        return std::nullopt;
    }
    return std::get<LandingPatternItem>(item).land_coordinate;
}

int command_of(const MissionItem& item) {
    if (const auto* simple = std::get_if<SimpleItem>(&item)) {
        return simple->command;
    }
    if (const auto* survey = std::get_if<SurveyPatternItem>(&item)) {
        return survey->items.empty() ? mav::CMD_NAV_WAYPOINT : survey->items.front().command;
    }
    return mav::CMD_NAV_LAND;
}

std::vector<MissionItem> flatten(const std::vector<MissionItem>& list) {
    std::vector<MissionItem> flat;
    flat.reserve(list.size());
    for (const auto& item : list) {
        if (const auto* survey = std::get_if<SurveyPatternItem>(&item)) {
            flat.insert(flat.end(), survey->items.begin(), survey->items.end());
        } else {
            flat.push_back(item);
        }
    }
    return flat;
}

} // namespace items
} // namespace afg
