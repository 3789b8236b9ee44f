/**
 * @file MissionAssembler.hpp
 * @brief Turns a mission configuration into a complete MissionPlan
 */

#pragma once

#include "GeofenceBuilder.hpp"
#include "Logger.hpp"
#include "TerrainService.hpp"
#include "auto_flight_generator.hpp"
#include <vector>

namespace afg {

/**
 * @brief A generated plan plus everything the caller should know about it
 */
struct MissionResult {
    MissionPlan plan;
    FlightPath flight_path;               // Every navigation point in flight order
    std::vector<Waypoint> waypoints;      // Composed navigation points, same order
    std::vector<ProximityWarning> proximity_warnings;
    std::vector<PlanWarning> warnings;
    TerrainStats terrain_stats;
    bool terrain_degraded = false;        // Some altitudes use fallback terrain

    bool has_warning(PlanWarning::Kind kind) const;
};

/**
 * @brief Stateless mission generation pipeline
 *
 * Each assemble() call validates the configuration, builds the route for its
 * scenario, composes terrain-following altitudes, selects aircraft commands
 * through an AircraftProfile and wraps the realized path in a geofence.
 * Terrain and geometry problems degrade into warnings; only configuration
 * errors throw.
 */
class MissionAssembler {
public:
    struct Options {
        GeofenceBuilder::Options geofence;
        double tower_fence_lat_margin_deg = 0.0003;
        double tower_fence_lon_margin_deg = 0.0005;
    };

    explicit MissionAssembler(TerrainService& terrain);
    MissionAssembler(TerrainService& terrain, const Options& options);

    /**
     * @brief Generate a plan for one configuration
     *
     * @throws MissingLocationError if a location the scenario needs is absent
     * @throws InvalidParameterError for any other invalid configuration value
     */
    MissionResult assemble(const MissionConfig& config);

    /**
     * @brief Terminal action used when the configuration leaves it unset
     */
    static MissionConfig::TerminalAction default_terminal_action(const MissionConfig& config);

private:
    void validate(const MissionConfig& config) const;
    void report(const MissionResult& result, const MissionConfig& config) const;

    TerrainService& terrain_;
    Options options_;
    Logger logger_{"MissionAssembler"};
};

} // namespace afg
