/**
 * @file LocalFrame.hpp
 * @brief Equirectangular metric frame around a reference coordinate
 */

#pragma once

#include "auto_flight_generator.hpp"
#include <Eigen/Dense>
#include <vector>

namespace afg {

/**
 * @brief Maps WGS84 coordinates to meters east (x) / north (y) of an origin
 *
 * Uses 111,320 m per degree of latitude and the cosine of the origin latitude
 * for longitude. Distortion stays well below a percent for areas a few tens of
 * kilometers across.
 */
class LocalFrame {
public:
    explicit LocalFrame(const Coordinate& origin);

    /**
     * @brief Frame centred on the bounding-box centre of the given points
     */
    static LocalFrame centred_on(const std::vector<Coordinate>& points);

    Eigen::Vector2d to_local(const Coordinate& c) const;
    Coordinate to_geographic(const Eigen::Vector2d& p) const;

    std::vector<Eigen::Vector2d> to_local(const std::vector<Coordinate>& points) const;
    std::vector<Coordinate> to_geographic(const std::vector<Eigen::Vector2d>& points) const;

    const Coordinate& origin() const { return origin_; }

private:
    Coordinate origin_;
    double meters_per_deg_lon_;
};

} // namespace afg
