/**
 * @file OgrGeometry.hpp
 * @brief Ownership and conversion helpers around OGR geometries
 *
 * All geometries here live in a LocalFrame (meters east/north), never in raw
 * degrees.
 */

#pragma once

#include <ogr_geometry.h>
#include <Eigen/Dense>
#include <memory>
#include <vector>

namespace afg {

struct OGRGeometryDeleter {
    void operator()(OGRGeometry* geometry) const {
        OGRGeometryFactory::destroyGeometry(geometry);
    }
};

using GeometryPtr = std::unique_ptr<OGRGeometry, OGRGeometryDeleter>;

namespace ogr {

/**
 * @brief Closed polygon from a ring; the closing point is added when absent
 */
GeometryPtr make_polygon(const std::vector<Eigen::Vector2d>& ring);

GeometryPtr make_linestring(const std::vector<Eigen::Vector2d>& points);

GeometryPtr make_point(const Eigen::Vector2d& point);

/**
 * @brief Buffer by distance; nullptr if OGR cannot (for example no GEOS)
 */
GeometryPtr buffer(const OGRGeometry& geometry, double distance, int quad_segments = 16);

/**
 * @brief Union of two geometries; nullptr on failure
 */
GeometryPtr merge(const OGRGeometry& a, const OGRGeometry& b);

/**
 * @brief Polygon pieces of a geometry (polygon, multipolygon or collection)
 */
std::vector<const OGRPolygon*> polygon_parts(const OGRGeometry& geometry);

/**
 * @brief Largest polygon piece by area, or nullptr when there is none
 */
const OGRPolygon* largest_polygon(const OGRGeometry& geometry);

/**
 * @brief Whether a geometry is non-null, non-empty and valid
 */
bool is_usable(const OGRGeometry* geometry);

std::vector<Eigen::Vector2d> exterior_ring(const OGRPolygon& polygon);

/**
 * @brief Intersection of two geometries; nullptr on failure
 */
GeometryPtr intersect(const OGRGeometry& a, const OGRGeometry& b);

/**
 * @brief Line pieces of a geometry (linestring, multilinestring or collection)
 *
 * Points and polygons in a collection are ignored.
 */
std::vector<std::vector<Eigen::Vector2d>> line_parts(const OGRGeometry& geometry);

bool contains(const OGRGeometry& area, const Eigen::Vector2d& point);

} // namespace ogr

} // namespace afg
