/**
 * @file MissionItems.hpp
 * @brief Factories for the plan-file mission commands
 *
 * doJumpId is left at 0; MissionAssembler numbers items once the list is final.
 */

#pragma once

#include "auto_flight_generator.hpp"
#include <optional>
#include <vector>

namespace afg {
namespace items {

constexpr double LOITER_ALTITUDE_M = 6.096;  // 20 ft above home
constexpr double LOITER_SECONDS = 10.0;
constexpr double LOITER_RADIUS_M = 50.0;

/**
 * @brief Terrain-frame navigation command at a composed waypoint
 *
 * params [p1, 0, 0, null, lat, lon, amsl], AltitudeMode 3.
 */
SimpleItem terrain_nav(int command, const Waypoint& wp, double param1 = 0.0);

SimpleItem waypoint(const Waypoint& wp);

/**
 * @brief Landing command at a point, relative frame, altitude 0
 */
SimpleItem land(int command, const Coordinate& position);

SimpleItem vtol_transition(int target_state);

/**
 * @brief DO_GRIPPER release
 */
SimpleItem gripper_release();

/**
 * @brief LOITER_TIME hold at 20 ft relative altitude
 */
SimpleItem loiter_time(const Coordinate& position);

SimpleItem region_of_interest(const Coordinate& target);

/**
 * @brief DO_SET_CAM_TRIGG_DIST; a distance of 0 stops triggering
 */
SimpleItem camera_trigger_distance(double distance_m);

/**
 * @brief Position carried by a mission item, if any
 */
std::optional<Coordinate> position_of(const MissionItem& item);

/**
 * @brief Command of a simple item; a survey reports its first nested command
 */
int command_of(const MissionItem& item);

/**
 * @brief The list with every survey replaced by its nested simple items
 */
std::vector<MissionItem> flatten(const std::vector<MissionItem>& list);

} // namespace items
} // namespace afg
