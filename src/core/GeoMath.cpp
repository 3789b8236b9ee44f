/**
 * @file GeoMath.cpp
 * @brief Great-circle distance and waypoint interpolation
 */

#include "GeoMath.hpp"
#include <algorithm>
#include <numbers>

namespace afg {

namespace {

constexpr double to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

} // namespace

double GeoMath::haversine_distance(const Coordinate& a, const Coordinate& b) {
    const double phi1 = to_radians(a.lat);
    const double phi2 = to_radians(b.lat);
    const double dphi = to_radians(b.lat - a.lat);
    const double dlambda = to_radians(b.lon - a.lon);

    const double h = std::sin(dphi / 2.0) * std::sin(dphi / 2.0) +
                     std::cos(phi1) * std::cos(phi2) *
                     std::sin(dlambda / 2.0) * std::sin(dlambda / 2.0);

    return 2.0 * EARTH_RADIUS_M * std::atan2(std::sqrt(h), std::sqrt(std::max(0.0, 1.0 - h)));
}

FlightPath GeoMath::interpolate(const Coordinate& a, const Coordinate& b, double interval_m) {
    if (!(interval_m > 0.0) || !std::isfinite(interval_m)) {
        throw InvalidParameterError("Waypoint interval must be positive, got " +
                                    std::to_string(interval_m));
    }

    const double distance = haversine_distance(a, b);
    const auto segments = std::max<size_t>(
        static_cast<size_t>(std::ceil(distance / interval_m)), 1);

    FlightPath points;
    points.reserve(segments + 1);
    points.push_back(a);
    for (size_t i = 1; i < segments; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(segments);
        points.emplace_back(a.lat + t * (b.lat - a.lat), a.lon + t * (b.lon - a.lon));
    }
    points.push_back(b);
    return points;
}

FlightPath GeoMath::densify(const FlightPath& path, double interval_m) {
    if (path.size() < 2) {
        return path;
    }

    FlightPath result;
    result.push_back(path.front());
    for (size_t i = 1; i < path.size(); ++i) {
        auto leg = interpolate(path[i - 1], path[i], interval_m);
        result.insert(result.end(), leg.begin() + 1, leg.end());
    }
    return result;
}

Coordinate GeoMath::offset_meters(const Coordinate& origin, double north_m, double east_m) {
    const double lat_scale = std::cos(to_radians(origin.lat));
    const double dlat = north_m / METERS_PER_DEGREE;
    // Longitude degrees shrink with latitude; poles collapse to no east offset
    const double dlon = lat_scale > 1e-9 ? east_m / (METERS_PER_DEGREE * lat_scale) : 0.0;
    return Coordinate(origin.lat + dlat, origin.lon + dlon);
}

double GeoMath::path_length(const FlightPath& path) {
    double total = 0.0;
    for (size_t i = 1; i < path.size(); ++i) {
        total += haversine_distance(path[i - 1], path[i]);
    }
    return total;
}

} // namespace afg
