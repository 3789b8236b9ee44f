/**
 * @file LocalFrame.cpp
 * @brief Equirectangular metric frame around a reference coordinate
 */

#include "LocalFrame.hpp"
#include "GeoMath.hpp"
#include <algorithm>
#include <numbers>

namespace afg {

LocalFrame::LocalFrame(const Coordinate& origin)
    : origin_(origin),
      meters_per_deg_lon_(GeoMath::METERS_PER_DEGREE *
                          std::max(std::cos(origin.lat * std::numbers::pi / 180.0), 1e-6)) {
}

LocalFrame LocalFrame::centred_on(const std::vector<Coordinate>& points) {
    if (points.empty()) {
        return LocalFrame(Coordinate());
    }
    auto [min_lat, max_lat] = std::minmax_element(points.begin(), points.end(),
        [](const Coordinate& a, const Coordinate& b) { return a.lat < b.lat; });
    auto [min_lon, max_lon] = std::minmax_element(points.begin(), points.end(),
        [](const Coordinate& a, const Coordinate& b) { return a.lon < b.lon; });
    return LocalFrame(Coordinate((min_lat->lat + max_lat->lat) / 2.0,
                                 (min_lon->lon + max_lon->lon) / 2.0));
}

Eigen::Vector2d LocalFrame::to_local(const Coordinate& c) const {
    return Eigen::Vector2d((c.lon - origin_.lon) * meters_per_deg_lon_,
                           (c.lat - origin_.lat) * GeoMath::METERS_PER_DEGREE);
}

Coordinate LocalFrame::to_geographic(const Eigen::Vector2d& p) const {
    return Coordinate(origin_.lat + p.y() / GeoMath::METERS_PER_DEGREE,
                      origin_.lon + p.x() / meters_per_deg_lon_);
}

std::vector<Eigen::Vector2d> LocalFrame::to_local(const std::vector<Coordinate>& points) const {
    std::vector<Eigen::Vector2d> local;
    local.reserve(points.size());
    for (const auto& c : points) {
        local.push_back(to_local(c));
    }
    return local;
}

std::vector<Coordinate> LocalFrame::to_geographic(const std::vector<Eigen::Vector2d>& points) const {
    std::vector<Coordinate> geographic;
    geographic.reserve(points.size());
    for (const auto& p : points) {
        geographic.push_back(to_geographic(p));
    }
    return geographic;
}

} // namespace afg
