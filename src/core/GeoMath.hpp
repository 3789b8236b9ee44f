/**
 * @file GeoMath.hpp
 * @brief Great-circle distance and waypoint interpolation
 */

#pragma once

#include "auto_flight_generator.hpp"

namespace afg {

/**
 * @brief Pure coordinate geometry, no I/O
 *
 * Interpolation is linear in latitude/longitude rather than geodesic. The
 * error is negligible below roughly 50 km and grows with leg length and
 * latitude.
 */
class GeoMath {
public:
    static constexpr double EARTH_RADIUS_M = 6371000.0;
    static constexpr double METERS_PER_DEGREE = 111320.0;

    /**
     * @brief Haversine distance between two coordinates
     * @return Distance in meters
     */
    static double haversine_distance(const Coordinate& a, const Coordinate& b);

    /**
     * @brief Points from a to b spaced no more than interval_m apart
     *
     * The leg is split into max(ceil(distance / interval_m), 1) equal
     * segments. The result starts with a and ends with b, so a == b yields
     * [a, b].
     *
     * @throws InvalidParameterError if interval_m is not positive and finite
     */
    static FlightPath interpolate(const Coordinate& a, const Coordinate& b, double interval_m);

    /**
     * @brief Interpolate every leg of a path, without repeating joint points
     */
    static FlightPath densify(const FlightPath& path, double interval_m);

    /**
     * @brief Flat-earth offset of a coordinate by metric north/east components
     */
    static Coordinate offset_meters(const Coordinate& origin, double north_m, double east_m);

    /**
     * @brief Sum of haversine legs along a path
     */
    static double path_length(const FlightPath& path);

    static double meters_to_degrees(double meters) { return meters / METERS_PER_DEGREE; }
    static double degrees_to_meters(double degrees) { return degrees * METERS_PER_DEGREE; }
};

} // namespace afg
