/**
 * @file OgrGeometry.cpp
 * @brief Ownership and conversion helpers around OGR geometries
 */

#include "OgrGeometry.hpp"

namespace afg {
namespace ogr {

GeometryPtr make_polygon(const std::vector<Eigen::Vector2d>& ring) {
    auto* polygon = new OGRPolygon();
    auto* outer = new OGRLinearRing();
    for (const auto& p : ring) {
        outer->addPoint(p.x(), p.y());
    }
    if (!ring.empty() && ring.front() != ring.back()) {
        outer->addPoint(ring.front().x(), ring.front().y());
    }
    polygon->addRingDirectly(outer);
    return GeometryPtr(polygon);
}

GeometryPtr make_linestring(const std::vector<Eigen::Vector2d>& points) {
    auto* line = new OGRLineString();
    for (const auto& p : points) {
        line->addPoint(p.x(), p.y());
    }
    return GeometryPtr(line);
}

GeometryPtr make_point(const Eigen::Vector2d& point) {
    return GeometryPtr(new OGRPoint(point.x(), point.y()));
}

GeometryPtr buffer(const OGRGeometry& geometry, double distance, int quad_segments) {
    return GeometryPtr(geometry.Buffer(distance, quad_segments));
}

GeometryPtr merge(const OGRGeometry& a, const OGRGeometry& b) {
    return GeometryPtr(a.Union(&b));
}

std::vector<const OGRPolygon*> polygon_parts(const OGRGeometry& geometry) {
    std::vector<const OGRPolygon*> parts;
    const auto type = wkbFlatten(geometry.getGeometryType());

    if (type == wkbPolygon) {
        parts.push_back(geometry.toPolygon());
    } else if (type == wkbMultiPolygon || type == wkbGeometryCollection) {
        const OGRGeometryCollection* collection = geometry.toGeometryCollection();
        for (int i = 0; i < collection->getNumGeometries(); ++i) {
            auto nested = polygon_parts(*collection->getGeometryRef(i));
            parts.insert(parts.end(), nested.begin(), nested.end());
        }
    }
    return parts;
}

const OGRPolygon* largest_polygon(const OGRGeometry& geometry) {
    const OGRPolygon* best = nullptr;
    double best_area = 0.0;
    for (const OGRPolygon* part : polygon_parts(geometry)) {
        const double area = part->get_Area();
        if (!best || area > best_area) {
            best = part;
            best_area = area;
        }
    }
    return best;
}

bool is_usable(const OGRGeometry* geometry) {
    return geometry != nullptr && !geometry->IsEmpty() && geometry->IsValid();
}

std::vector<Eigen::Vector2d> exterior_ring(const OGRPolygon& polygon) {
    std::vector<Eigen::Vector2d> points;
    const OGRLinearRing* ring = polygon.getExteriorRing();
    if (!ring) {
        return points;
    }
    points.reserve(ring->getNumPoints());
    for (int i = 0; i < ring->getNumPoints(); ++i) {
        points.emplace_back(ring->getX(i), ring->getY(i));
    }
    return points;
}

GeometryPtr intersect(const OGRGeometry& a, const OGRGeometry& b) {
    return GeometryPtr(a.Intersection(&b));
}

std::vector<std::vector<Eigen::Vector2d>> line_parts(const OGRGeometry& geometry) {
    std::vector<std::vector<Eigen::Vector2d>> parts;
    const auto type = wkbFlatten(geometry.getGeometryType());

    if (type == wkbLineString) {
        const OGRLineString* line = geometry.toLineString();
        std::vector<Eigen::Vector2d> points;
        points.reserve(line->getNumPoints());
        for (int i = 0; i < line->getNumPoints(); ++i) {
            points.emplace_back(line->getX(i), line->getY(i));
        }
        if (points.size() >= 2) {
            parts.push_back(std::move(points));
        }
    } else if (type == wkbMultiLineString || type == wkbGeometryCollection) {
        const OGRGeometryCollection* collection = geometry.toGeometryCollection();
        for (int i = 0; i < collection->getNumGeometries(); ++i) {
            auto nested = line_parts(*collection->getGeometryRef(i));
            parts.insert(parts.end(), nested.begin(), nested.end());
        }
    }
    return parts;
}

bool contains(const OGRGeometry& area, const Eigen::Vector2d& point) {
    OGRPoint probe(point.x(), point.y());
    return area.Contains(&probe);
}

} // namespace ogr
} // namespace afg
