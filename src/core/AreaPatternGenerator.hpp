/**
 * @file AreaPatternGenerator.hpp
 * @brief Flight patterns covering a polygon: perimeter, grid and survey transects
 *
 * Patterns are computed in a LocalFrame around the polygon. Survey transects
 * are swept in a frame rotated by the survey heading and clipped to the area
 * with OGR.
 */

#pragma once

#include "Logger.hpp"
#include "auto_flight_generator.hpp"
#include <vector>

namespace afg {

/**
 * @brief Ground coverage of one photo and the derived survey spacings
 */
struct CameraFootprint {
    double frontal_m = 0.0;           // Along track
    double side_m = 0.0;              // Across track
    double transect_spacing_m = 0.0;  // side_m * (1 - side_overlap)
    double trigger_distance_m = 0.0;  // frontal_m * (1 - frontal_overlap)
};

struct Transect {
    Coordinate entry;
    Coordinate exit;
};

struct SurveyPattern {
    std::vector<Transect> transects;  // Flight order, alternating direction
    double spacing_m = 0.0;
    double trigger_distance_m = 0.0;
    bool truncated = false;           // Spacing was widened to respect MAX_TRANSECTS
};

class AreaPatternGenerator {
public:
    static constexpr size_t MAX_TRANSECTS = 100;
    static constexpr double MIN_SPACING_M = 11.132;  // 0.0001 degree

    AreaPatternGenerator() = default;

    static CameraFootprint camera_footprint(const CameraSpec& camera, double altitude_m);

    /**
     * @brief Closed loop around a ring, starting at the vertex nearest to start
     */
    static FlightPath perimeter_route(const FlightPath& ring, const Coordinate& start);

    /**
     * @brief Points on a square grid inside a polygon, in serpentine order
     *
     * Rows run west to east and alternate direction, beginning with the row
     * nearest to start.
     */
    FlightPath grid_points(const FlightPath& polygon, double spacing_m,
                           const Coordinate& start) const;

    /**
     * @brief Boustrophedon transects clipped to a polygon
     *
     * Lines run along camera.survey_angle_deg (clockwise from north) and are
     * spaced by the camera footprint at altitude_m, never closer than
     * MIN_SPACING_M. A concave area can split one sweep line into several
     * transects.
     */
    SurveyPattern survey(const FlightPath& polygon, const CameraSpec& camera,
                         double altitude_m) const;

private:
    Logger logger_{"AreaPatternGenerator"};
};

} // namespace afg
