/**
 * @file AltitudeComposer.cpp
 * @brief AGL to AMSL altitude composition and terrain clearance checks
 */

#include "AltitudeComposer.hpp"

namespace afg {

AltitudeComposer::AltitudeComposer(TerrainService& terrain) : terrain_(terrain) {
}

ComposedAltitude AltitudeComposer::compose(const Coordinate& c, double agl_m) {
    const TerrainLookup ground = terrain_.lookup(c);

    ComposedAltitude result;
    result.agl_m = agl_m;
    result.terrain_m = ground.elevation_m;
    result.amsl_m = ground.elevation_m + agl_m;
    result.degraded = !ground.ok();
    return result;
}

std::vector<Waypoint> AltitudeComposer::compose_path(const FlightPath& path, double agl_m) {
    return compose_path(path, std::vector<double>(path.size(), agl_m));
}

std::vector<Waypoint> AltitudeComposer::compose_path(const FlightPath& path,
                                                     const std::vector<double>& agl_values) {
    if (agl_values.size() != path.size()) {
        throw InvalidParameterError("Altitude count " + std::to_string(agl_values.size()) +
                                    " does not match path length " + std::to_string(path.size()));
    }

    const auto ground = terrain_.lookup_batch(path);

    std::vector<Waypoint> waypoints;
    waypoints.reserve(path.size());
    size_t degraded = 0;
    for (size_t i = 0; i < path.size(); ++i) {
        Waypoint wp;
        wp.position = path[i];
        wp.agl_altitude_m = agl_values[i];
        wp.terrain_elevation_m = ground[i].elevation_m;
        wp.amsl_altitude_m = ground[i].elevation_m + agl_values[i];
        wp.sequence = static_cast<int>(i);
        wp.kind = CommandKind::WAYPOINT;
        wp.terrain_degraded = !ground[i].ok();
        if (wp.terrain_degraded) {
            degraded++;
        }
        waypoints.push_back(wp);
    }

    if (degraded > 0) {
        logger_.detailed(std::to_string(degraded) + " of " + std::to_string(path.size()) +
                         " points composed with fallback terrain");
    }
    return waypoints;
}

std::vector<ProximityWarning> AltitudeComposer::check_proximity(const FlightPath& path,
                                                                double agl_m,
                                                                double threshold_m) {
    std::vector<ProximityWarning> warnings;
    if (agl_m >= threshold_m) {
        return warnings;
    }
    warnings.reserve(path.size());
    for (size_t i = 0; i < path.size(); ++i) {
        warnings.push_back(ProximityWarning{i, path[i], agl_m, threshold_m});
    }
    return warnings;
}

std::vector<ProximityWarning> AltitudeComposer::check_proximity(const std::vector<Waypoint>& waypoints,
                                                                double threshold_m) {
    std::vector<ProximityWarning> warnings;
    for (size_t i = 0; i < waypoints.size(); ++i) {
        const double clearance = waypoints[i].amsl_altitude_m - waypoints[i].terrain_elevation_m;
        if (clearance < threshold_m) {
            warnings.push_back(ProximityWarning{i, waypoints[i].position, clearance, threshold_m});
        }
    }
    return warnings;
}

} // namespace afg
