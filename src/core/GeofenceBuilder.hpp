/**
 * @file GeofenceBuilder.hpp
 * @brief Safety polygon construction around a flight path
 *
 * Buffers are computed with OGR in a local metric frame so that distances are
 * meters in every direction. Geometry failures never abort plan generation:
 * they fall back to simpler shapes and are reported as PlanWarnings.
 */

#pragma once

#include "Logger.hpp"
#include "auto_flight_generator.hpp"
#include <optional>
#include <vector>

namespace afg {

struct GeofenceResult {
    Geofence geofence;
    std::vector<PlanWarning> warnings;
};

/**
 * @brief Circle the aircraft may fly that must stay inside the fence
 */
struct LoiterCircle {
    Coordinate centre;
    double radius_m = 0.0;
};

struct ShrinkResult {
    FlightPath polygon;     // Closed ring
    double applied_margin_m = 0.0;
    std::vector<PlanWarning> warnings;
};

class GeofenceBuilder {
public:
    static constexpr double EXTRA_POINT_BUFFER_M = 60.96;  // 200 ft

    struct Options {
        double extra_point_buffer_m = EXTRA_POINT_BUFFER_M;
        int quad_segments = 16;
    };

    GeofenceBuilder();
    explicit GeofenceBuilder(const Options& options);

    /**
     * @brief Inclusion fence around a path
     *
     * Union of: the path buffered by buffer_m (a single point is buffered as a
     * disc), each extra point buffered by Options::extra_point_buffer_m, and a
     * disc of loiter_radius_m around the last path point when given, and every
     * loiter circle (a fixed-wing landing orbits its approach point). If the
     * union falls apart into several pieces the largest is kept and a
     * GEOFENCE_MULTIPART warning is added. An empty or invalid union falls back
     * to the bounding rectangle of all points grown by buffer_m.
     */
    GeofenceResult build(const FlightPath& path, double buffer_m,
                         const std::vector<Coordinate>& extra_points = {},
                         std::optional<double> loiter_radius_m = std::nullopt,
                         const std::vector<LoiterCircle>& loiters = {}) const;

    /**
     * @brief Inward buffer of an area so generated points stay inside it
     *
     * Tries margin_m, then margin_m / 2; if both collapse the area, the
     * original polygon is returned with a POLYGON_SHRINK_FALLBACK warning.
     */
    ShrinkResult shrink_polygon(const FlightPath& polygon, double margin_m) const;

    /**
     * @brief Axis-aligned rectangle around points, grown by degree margins
     */
    static Geofence bounding_rectangle(const std::vector<Coordinate>& points,
                                       double lat_margin_deg, double lon_margin_deg);

private:
    Options options_;
    Logger logger_{"GeofenceBuilder"};
};

} // namespace afg
