/**
 * @file AreaPatternGenerator.cpp
 * @brief Flight patterns covering a polygon: perimeter, grid and survey transects
 */

#include "AreaPatternGenerator.hpp"
#include "GeoMath.hpp"
#include "LocalFrame.hpp"
#include "OgrGeometry.hpp"
#include <Eigen/Geometry>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace afg {

namespace {

FlightPath open_ring(const FlightPath& ring) {
    FlightPath open = ring;
    if (open.size() > 1 && open.front() == open.back()) {
        open.pop_back();
    }
    return open;
}

struct Bounds {
    Eigen::Vector2d min;
    Eigen::Vector2d max;
};

Bounds bounds_of(const std::vector<Eigen::Vector2d>& points) {
    Bounds b{points.front(), points.front()};
    for (const auto& p : points) {
        b.min = b.min.cwiseMin(p);
        b.max = b.max.cwiseMax(p);
    }
    return b;
}

} // namespace

CameraFootprint AreaPatternGenerator::camera_footprint(const CameraSpec& camera, double altitude_m) {
    CameraFootprint footprint;
    if (!(camera.focal_length_mm > 0.0)) {
        return footprint;
    }
    footprint.frontal_m = camera.sensor_width_mm * altitude_m / camera.focal_length_mm;
    footprint.side_m = camera.sensor_height_mm * altitude_m / camera.focal_length_mm;
    footprint.transect_spacing_m = footprint.side_m * (1.0 - camera.side_overlap);
    footprint.trigger_distance_m = footprint.frontal_m * (1.0 - camera.frontal_overlap);
    return footprint;
}

FlightPath AreaPatternGenerator::perimeter_route(const FlightPath& ring, const Coordinate& start) {
    const FlightPath vertices = open_ring(ring);
    if (vertices.empty()) {
        return {};
    }

    size_t nearest = 0;
    double best = GeoMath::haversine_distance(start, vertices.front());
    for (size_t i = 1; i < vertices.size(); ++i) {
        const double d = GeoMath::haversine_distance(start, vertices[i]);
        if (d < best) {
            best = d;
            nearest = i;
        }
    }

    FlightPath route;
    route.reserve(vertices.size() + 1);
    for (size_t i = 0; i < vertices.size(); ++i) {
        route.push_back(vertices[(nearest + i) % vertices.size()]);
    }
    route.push_back(route.front());
    return route;
}

FlightPath AreaPatternGenerator::grid_points(const FlightPath& polygon, double spacing_m,
                                             const Coordinate& start) const {
    const FlightPath vertices = open_ring(polygon);
    if (vertices.size() < 3 || !(spacing_m > 0.0)) {
        return {};
    }

    const LocalFrame frame = LocalFrame::centred_on(vertices);
    const auto local = frame.to_local(vertices);
    GeometryPtr area = ogr::make_polygon(local);
    const Bounds b = bounds_of(local);

    std::vector<std::vector<Eigen::Vector2d>> rows;
    for (double y = b.min.y() + spacing_m / 2.0; y <= b.max.y(); y += spacing_m) {
        std::vector<Eigen::Vector2d> row;
        for (double x = b.min.x() + spacing_m / 2.0; x <= b.max.x(); x += spacing_m) {
            const Eigen::Vector2d p(x, y);
            if (ogr::contains(*area, p)) {
                row.push_back(p);
            }
        }
        if (!row.empty()) {
            rows.push_back(std::move(row));
        }
    }

    if (rows.empty()) {
        logger_.warning("Area smaller than one grid cell; no grid points generated");
        return {};
    }

    // Begin with the row closest to the takeoff point
    const Eigen::Vector2d origin = frame.to_local(start);
    if (std::abs(rows.back().front().y() - origin.y()) < std::abs(rows.front().front().y() - origin.y())) {
        std::reverse(rows.begin(), rows.end());
    }
    const bool first_row_east = std::abs(rows.front().back().x() - origin.x()) <
                                std::abs(rows.front().front().x() - origin.x());

    FlightPath points;
    for (size_t r = 0; r < rows.size(); ++r) {
        auto& row = rows[r];
        const bool reversed = (r % 2 == 0) == first_row_east;
        if (reversed) {
            std::reverse(row.begin(), row.end());
        }
        for (const auto& p : row) {
            points.push_back(frame.to_geographic(p));
        }
    }

    logger_.debug("Grid of " + std::to_string(points.size()) + " points in " +
                  std::to_string(rows.size()) + " rows");
    return points;
}

SurveyPattern AreaPatternGenerator::survey(const FlightPath& polygon, const CameraSpec& camera,
                                           double altitude_m) const {
    SurveyPattern pattern;
    const FlightPath vertices = open_ring(polygon);
    if (vertices.size() < 3) {
        return pattern;
    }

    const CameraFootprint footprint = camera_footprint(camera, altitude_m);
    pattern.trigger_distance_m = footprint.trigger_distance_m;
    double spacing = std::max(footprint.transect_spacing_m, MIN_SPACING_M);

    // Rotating by the heading turns transects into south-north lines
    const LocalFrame frame = LocalFrame::centred_on(vertices);
    const Eigen::Rotation2Dd to_sweep(camera.survey_angle_deg * std::numbers::pi / 180.0);
    const Eigen::Rotation2Dd from_sweep = to_sweep.inverse();

    std::vector<Eigen::Vector2d> rotated;
    rotated.reserve(vertices.size());
    for (const auto& v : vertices) {
        rotated.push_back(to_sweep * frame.to_local(v));
    }
    GeometryPtr area = ogr::make_polygon(rotated);
    const Bounds b = bounds_of(rotated);

    const double width = b.max.x() - b.min.x();
    const size_t needed = static_cast<size_t>(std::floor(width / spacing)) + 1;
    if (needed > MAX_TRANSECTS) {
        spacing = width / static_cast<double>(MAX_TRANSECTS - 1);
        pattern.truncated = true;
        logger_.warning("Survey needs " + std::to_string(needed) + " transects; limited to " +
                        std::to_string(MAX_TRANSECTS) + " with " + std::to_string(spacing) +
                        " m spacing");
    }
    pattern.spacing_m = spacing;

    const double first_x = b.min.x() + std::min(spacing / 2.0, width / 2.0);
    const double overshoot = 1.0;
    bool northbound = true;

    for (double x = first_x; x <= b.max.x() && pattern.transects.size() < MAX_TRANSECTS; x += spacing) {
        GeometryPtr sweep = ogr::make_linestring({
            Eigen::Vector2d(x, b.min.y() - overshoot),
            Eigen::Vector2d(x, b.max.y() + overshoot)
        });
        GeometryPtr clipped = ogr::intersect(*area, *sweep);
        if (!clipped || clipped->IsEmpty()) {
            continue;
        }

        auto segments = ogr::line_parts(*clipped);
        std::vector<std::pair<Eigen::Vector2d, Eigen::Vector2d>> pieces;
        for (const auto& seg : segments) {
            Eigen::Vector2d a = seg.front();
            Eigen::Vector2d z = seg.back();
            if (a.y() > z.y()) std::swap(a, z);
            pieces.emplace_back(a, z);
        }
        std::sort(pieces.begin(), pieces.end(),
                  [](const auto& l, const auto& r) { return l.first.y() < r.first.y(); });
        if (!northbound) {
            std::reverse(pieces.begin(), pieces.end());
        }

        for (const auto& [south, north] : pieces) {
            if (pattern.transects.size() >= MAX_TRANSECTS) break;
            const Eigen::Vector2d entry = northbound ? south : north;
            const Eigen::Vector2d exit = northbound ? north : south;
            pattern.transects.push_back({frame.to_geographic(from_sweep * entry),
                                         frame.to_geographic(from_sweep * exit)});
        }
        northbound = !northbound;
    }

    logger_.detailed("Survey: " + std::to_string(pattern.transects.size()) + " transects, " +
                     std::to_string(pattern.spacing_m) + " m spacing, trigger every " +
                     std::to_string(pattern.trigger_distance_m) + " m");
    return pattern;
}

} // namespace afg
