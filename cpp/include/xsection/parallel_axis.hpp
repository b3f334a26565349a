#pragma once

#include <Eigen/Dense>

namespace xsection {

/**
 * @brief Shift a second moment of area to a parallel axis
 *
 * Parallel axis theorem: I = I_c + A * d²
 *
 * @param i_centroidal Second moment about the centroidal axis [m⁴]
 * @param area Cross-sectional area [m²]
 * @param offset Distance between the centroidal axis and the target axis [m]
 * @return double Second moment about the target axis [m⁴]
 */
double parallel_axis(double i_centroidal, double area, double offset);

/**
 * @brief Rotate a section coordinate a quarter turn counter-clockwise
 *
 * (x, y) -> (-y, x). The moment about x of a rotated section equals
 * the moment about y of the original one.
 */
Eigen::Vector2d quarter_turn(const Eigen::Vector2d& point);

/**
 * @brief Accumulator for signed-area weighted centroids
 *
 * Usage:
 *   CentroidAccumulator acc;
 *   acc.add(+1.0 * a1, c1);
 *   acc.add(-1.0 * a2, c2);
 *   Eigen::Vector2d c = acc.first_moment() / acc.net_area();
 */
class CentroidAccumulator {
public:
    /**
     * @brief Add a contribution
     * @param signed_area Area with the member's sign applied [m²]
     * @param centroid Member centroid [m]
     */
    void add(double signed_area, const Eigen::Vector2d& centroid);

    double net_area() const { return net_area_; }

    /// Sum of absolute areas, used to judge whether net_area() is zero [m²]
    double gross_area() const { return gross_area_; }

    /// First moment of area (Sx about y, Sy about x packed as (Σ A·x, Σ A·y)) [m³]
    const Eigen::Vector2d& first_moment() const { return first_moment_; }

private:
    double net_area_ = 0.0;
    double gross_area_ = 0.0;
    Eigen::Vector2d first_moment_ = Eigen::Vector2d::Zero();
};

} // namespace xsection
