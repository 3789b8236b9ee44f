/**
 * @file AltitudeComposer.hpp
 * @brief AGL to AMSL altitude composition and terrain clearance checks
 */

#pragma once

#include "Logger.hpp"
#include "TerrainService.hpp"
#include "auto_flight_generator.hpp"
#include <vector>

namespace afg {

/**
 * @brief Altitudes of one point; amsl_m is always terrain_m + agl_m
 */
struct ComposedAltitude {
    double agl_m = 0.0;
    double amsl_m = 0.0;
    double terrain_m = 0.0;
    bool degraded = false;  // terrain_m is a fallback value
};

class AltitudeComposer {
public:
    static constexpr double DEFAULT_PROXIMITY_THRESHOLD_M = 15.24;  // 50 ft

    explicit AltitudeComposer(TerrainService& terrain);

    /**
     * @brief Absolute altitude for a point flown agl_m above the ground
     *
     * agl_m is not range-checked; negative values are the caller's
     * responsibility.
     */
    ComposedAltitude compose(const Coordinate& c, double agl_m);

    /**
     * @brief Compose a whole path at one AGL using a batch terrain lookup
     */
    std::vector<Waypoint> compose_path(const FlightPath& path, double agl_m);

    /**
     * @brief Compose points with individual AGL values
     *
     * agl_values must have the same length as path.
     *
     * @throws InvalidParameterError on a length mismatch
     */
    std::vector<Waypoint> compose_path(const FlightPath& path, const std::vector<double>& agl_values);

    /**
     * @brief Flag points of a constant-AGL path closer to terrain than threshold_m
     *
     * With a single AGL the clearance of every point equals agl_m.
     */
    static std::vector<ProximityWarning> check_proximity(
        const FlightPath& path, double agl_m,
        double threshold_m = DEFAULT_PROXIMITY_THRESHOLD_M);

    /**
     * @brief Flag composed waypoints whose amsl - terrain is below threshold_m
     */
    static std::vector<ProximityWarning> check_proximity(
        const std::vector<Waypoint>& waypoints,
        double threshold_m = DEFAULT_PROXIMITY_THRESHOLD_M);

private:
    TerrainService& terrain_;
    Logger logger_{"AltitudeComposer"};
};

} // namespace afg
