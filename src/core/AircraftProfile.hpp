/**
 * @file AircraftProfile.hpp
 * @brief Per-aircraft command selection for generated missions
 *
 * MissionAssembler builds the route once and asks the profile which commands
 * to emit for takeoff, landing and actions at special locations.
 */

#pragma once

#include "auto_flight_generator.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace afg {

class AircraftProfile {
public:
    static constexpr double LANDING_BASE_OFFSET_M = 75.0;
    static constexpr double LANDING_BASE_ALTITUDE_M = 15.24;  // 50 ft
    static constexpr double LANDING_MIN_OFFSET_M = 50.0;

    virtual ~AircraftProfile() = default;

    static std::unique_ptr<AircraftProfile> create(AircraftKind kind);

    /**
     * @brief Fixed-wing landing stand-off distance for a cruise altitude
     *
     * 75 m at 50 ft, growing 15 m per 10 ft of altitude, never below 50 m.
     */
    static double landing_pattern_offset(double cruise_altitude_m);

    virtual AircraftKind kind() const = 0;
    virtual std::string name() const = 0;
    virtual VehicleInfo vehicle_info() const = 0;

    /**
     * @brief Takeoff command plus anything flown immediately after it
     */
    std::vector<MissionItem> takeoff_items(const Waypoint& takeoff) const;

    /**
     * @brief Terminal landing at a point; cruise_agl_m shapes landing patterns
     */
    std::vector<MissionItem> landing_items(const Coordinate& point, double cruise_agl_m) const;

    /**
     * @brief Payload release at a delivery point
     *
     * The route's last waypoint already sits on the point; these items follow it.
     */
    std::vector<MissionItem> delivery_items(const Coordinate& point) const;

    /**
     * @brief Touch down at a point and take off again from it
     */
    std::vector<MissionItem> land_and_takeoff_items(const Waypoint& point, double cruise_agl_m) const;

    /**
     * @brief Loiter radius protected by the geofence around the final point
     */
    virtual std::optional<double> loiter_radius(double cruise_agl_m) const;

protected:
    virtual SimpleItem takeoff_command(const Waypoint& takeoff) const = 0;
    virtual std::vector<MissionItem> touchdown_items(const Coordinate& point, double cruise_agl_m) const = 0;
    virtual std::vector<MissionItem> release_items(const Coordinate& point) const;

    virtual std::vector<MissionItem> after_takeoff_items() const { return {}; }
    virtual std::vector<MissionItem> before_hover_items() const { return {}; }
    virtual std::vector<MissionItem> after_hover_items() const { return {}; }
};

class MulticopterProfile : public AircraftProfile {
public:
    AircraftKind kind() const override { return AircraftKind::MULTICOPTER; }
    std::string name() const override { return "Multicopter"; }
    VehicleInfo vehicle_info() const override;
    std::optional<double> loiter_radius(double cruise_agl_m) const override;

protected:
    SimpleItem takeoff_command(const Waypoint& takeoff) const override;
    std::vector<MissionItem> touchdown_items(const Coordinate& point, double cruise_agl_m) const override;
    std::vector<MissionItem> release_items(const Coordinate& point) const override;
};

class FixedWingProfile : public AircraftProfile {
public:
    static constexpr double TAKEOFF_PITCH_DEG = 15.0;

    AircraftKind kind() const override { return AircraftKind::FIXED_WING; }
    std::string name() const override { return "Fixed Wing"; }
    VehicleInfo vehicle_info() const override;

    /**
     * @brief Landing pattern with its approach point north-east of the land point
     */
    static LandingPatternItem landing_pattern(const Coordinate& point, double cruise_agl_m);

protected:
    SimpleItem takeoff_command(const Waypoint& takeoff) const override;
    std::vector<MissionItem> touchdown_items(const Coordinate& point, double cruise_agl_m) const override;
};

class VtolProfile : public AircraftProfile {
public:
    AircraftKind kind() const override { return AircraftKind::VTOL; }
    std::string name() const override { return "VTOL"; }
    VehicleInfo vehicle_info() const override;

protected:
    SimpleItem takeoff_command(const Waypoint& takeoff) const override;
    std::vector<MissionItem> touchdown_items(const Coordinate& point, double cruise_agl_m) const override;
    std::vector<MissionItem> after_takeoff_items() const override;
    std::vector<MissionItem> before_hover_items() const override;
    std::vector<MissionItem> after_hover_items() const override;
};

std::string to_string(AircraftKind kind);

} // namespace afg
