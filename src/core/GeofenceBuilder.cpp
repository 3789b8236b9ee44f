/**
 * @file GeofenceBuilder.cpp
 * @brief Safety polygon construction around a flight path
 */

#include "GeofenceBuilder.hpp"
#include "GeoMath.hpp"
#include "LocalFrame.hpp"
#include "OgrGeometry.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <sstream>

namespace afg {

namespace {

FlightPath close_if_open(FlightPath ring) {
    if (!ring.empty() && !(ring.front() == ring.back())) {
        ring.push_back(ring.front());
    }
    return ring;
}

FlightPath closed_ring(const LocalFrame& frame, const OGRPolygon& polygon) {
    return close_if_open(frame.to_geographic(ogr::exterior_ring(polygon)));
}

} // namespace

GeofenceBuilder::GeofenceBuilder() : options_() {
}

GeofenceBuilder::GeofenceBuilder(const Options& options) : options_(options) {
}

GeofenceResult GeofenceBuilder::build(const FlightPath& path, double buffer_m,
                                      const std::vector<Coordinate>& extra_points,
                                      std::optional<double> loiter_radius_m,
                                      const std::vector<LoiterCircle>& loiters) const {
    GeofenceResult result;

    std::vector<Coordinate> all_points(path.begin(), path.end());
    all_points.insert(all_points.end(), extra_points.begin(), extra_points.end());
    for (const auto& loiter : loiters) {
        all_points.push_back(loiter.centre);
    }
    if (all_points.empty()) {
        result.warnings.push_back({PlanWarning::Kind::GEOFENCE_FALLBACK,
                                   "No points to build a geofence from"});
        logger_.warning(result.warnings.back().message);
        return result;
    }

    const LocalFrame frame = LocalFrame::centred_on(all_points);
    GeometryPtr fence;

    auto add = [&fence](GeometryPtr piece) -> bool {
        if (!piece) {
            return false;
        }
        if (!fence) {
            fence = std::move(piece);
            return true;
        }
        GeometryPtr merged = ogr::merge(*fence, *piece);
        if (!merged) {
            return false;
        }
        fence = std::move(merged);
        return true;
    };

    bool geometry_ok = buffer_m > 0.0;
    if (geometry_ok && !path.empty()) {
        GeometryPtr base = path.size() == 1
            ? ogr::make_point(frame.to_local(path.front()))
            : ogr::make_linestring(frame.to_local(path));
        geometry_ok = add(ogr::buffer(*base, buffer_m, options_.quad_segments));
    }

    for (const auto& point : extra_points) {
        if (!geometry_ok) break;
        auto disc = ogr::buffer(*ogr::make_point(frame.to_local(point)),
                                options_.extra_point_buffer_m, options_.quad_segments);
        geometry_ok = add(std::move(disc));
    }

    if (geometry_ok && loiter_radius_m && *loiter_radius_m > 0.0 && !path.empty()) {
        auto disc = ogr::buffer(*ogr::make_point(frame.to_local(path.back())),
                                *loiter_radius_m, options_.quad_segments);
        geometry_ok = add(std::move(disc));
    }

    for (const auto& loiter : loiters) {
        if (!geometry_ok) break;
        if (loiter.radius_m <= 0.0) continue;
        auto disc = ogr::buffer(*ogr::make_point(frame.to_local(loiter.centre)),
                                loiter.radius_m, options_.quad_segments);
        geometry_ok = add(std::move(disc));
    }

    if (geometry_ok && ogr::is_usable(fence.get())) {
        const auto parts = ogr::polygon_parts(*fence);
        const OGRPolygon* largest = ogr::largest_polygon(*fence);
        if (largest) {
            if (parts.size() > 1) {
                std::ostringstream msg;
                msg << "Geofence union produced " << parts.size()
                    << " disjoint areas; keeping the largest";
                result.warnings.push_back({PlanWarning::Kind::GEOFENCE_MULTIPART, msg.str()});
                logger_.warning(msg.str());
            }
            result.geofence.polygon = closed_ring(frame, *largest);
            result.geofence.inclusion = true;
            logger_.debug("Geofence with " + std::to_string(result.geofence.polygon.size()) +
                          " vertices");
            return result;
        }
    }

    // Fallback: rectangle around everything, grown by the buffer
    double margin_m = std::max(buffer_m, 0.0);
    for (const auto& loiter : loiters) {
        margin_m = std::max(margin_m, loiter.radius_m);
    }
    const double margin_lat = GeoMath::meters_to_degrees(margin_m);
    const double margin_lon = margin_lat /
        std::max(std::cos(frame.origin().lat * std::numbers::pi / 180.0), 1e-6);
    result.geofence = bounding_rectangle(all_points, margin_lat, margin_lon);
    result.warnings.push_back({PlanWarning::Kind::GEOFENCE_FALLBACK,
                               "Geofence buffering failed; using bounding rectangle"});
    logger_.warning(result.warnings.back().message);
    return result;
}

ShrinkResult GeofenceBuilder::shrink_polygon(const FlightPath& polygon, double margin_m) const {
    ShrinkResult result;
    result.polygon = close_if_open(polygon);

    if (polygon.size() < 3) {
        result.warnings.push_back({PlanWarning::Kind::POLYGON_SHRINK_FALLBACK,
                                   "Area has fewer than 3 vertices; not shrunk"});
        logger_.warning(result.warnings.back().message);
        return result;
    }

    const LocalFrame frame = LocalFrame::centred_on(polygon);
    GeometryPtr area = ogr::make_polygon(frame.to_local(polygon));

    for (double margin : {margin_m, margin_m / 2.0}) {
        if (!(margin > 0.0)) {
            continue;
        }
        GeometryPtr shrunk = ogr::buffer(*area, -margin, options_.quad_segments);
        if (!ogr::is_usable(shrunk.get())) {
            logger_.detailed("Inward buffer of " + std::to_string(margin) +
                             " m collapsed the area");
            continue;
        }

        const auto parts = ogr::polygon_parts(*shrunk);
        const OGRPolygon* largest = ogr::largest_polygon(*shrunk);
        if (!largest) {
            continue;
        }
        if (parts.size() > 1) {
            std::ostringstream msg;
            msg << "Inward buffer split the area into " << parts.size()
                << " pieces; keeping the largest";
            result.warnings.push_back({PlanWarning::Kind::GEOFENCE_MULTIPART, msg.str()});
            logger_.warning(msg.str());
        }
        if (margin != margin_m) {
            std::ostringstream msg;
            msg << "Area too small for a " << margin_m << " m margin; used " << margin << " m";
            result.warnings.push_back({PlanWarning::Kind::POLYGON_SHRINK_FALLBACK, msg.str()});
            logger_.warning(msg.str());
        }
        result.polygon = closed_ring(frame, *largest);
        result.applied_margin_m = margin;
        return result;
    }

    if (margin_m > 0.0) {
        result.warnings.push_back({PlanWarning::Kind::POLYGON_SHRINK_FALLBACK,
                                   "Area too small to shrink; using it unbuffered"});
        logger_.warning(result.warnings.back().message);
    }
    return result;
}

Geofence GeofenceBuilder::bounding_rectangle(const std::vector<Coordinate>& points,
                                             double lat_margin_deg, double lon_margin_deg) {
    Geofence fence;
    if (points.empty()) {
        return fence;
    }

    double min_lat = points.front().lat, max_lat = points.front().lat;
    double min_lon = points.front().lon, max_lon = points.front().lon;
    for (const auto& p : points) {
        min_lat = std::min(min_lat, p.lat);
        max_lat = std::max(max_lat, p.lat);
        min_lon = std::min(min_lon, p.lon);
        max_lon = std::max(max_lon, p.lon);
    }
    min_lat -= lat_margin_deg;
    max_lat += lat_margin_deg;
    min_lon -= lon_margin_deg;
    max_lon += lon_margin_deg;

    fence.polygon = {
        Coordinate(min_lat, min_lon),
        Coordinate(max_lat, min_lon),
        Coordinate(max_lat, max_lon),
        Coordinate(min_lat, max_lon),
        Coordinate(min_lat, min_lon)
    };
    fence.inclusion = true;
    return fence;
}

} // namespace afg
