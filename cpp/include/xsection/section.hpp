#pragma once

#include "xsection/composite_shape.hpp"
#include "xsection/shape.hpp"
#include <string>

namespace xsection {

/**
 * @brief Centroidal cross-section properties for stress calculations
 *
 * Stores geometric properties of a cross-section in consistent units:
 * - A: Cross-sectional area [m²]
 * - Ix, Iy: Second moments of area about the centroidal x and y axes [m⁴]
 * - J: Polar moment about the centroid, Ix + Iy [m⁴]
 * - cx, cy: Centroid in the frame the section was defined in [m]
 *
 * Extreme fibre distances are measured from the centroid to the edges of
 * the bounding box of the added material, so that bending stress follows
 * as sigma = M * c / I and torsional stress in a circular shaft as
 * tau = T * r / J.
 */
class SectionProperties {
public:
    std::string name;   ///< Section name

    // Geometric properties
    double A = 0.0;     ///< Cross-sectional area [m²]
    double Ix = 0.0;    ///< Second moment about centroidal x-axis [m⁴]
    double Iy = 0.0;    ///< Second moment about centroidal y-axis [m⁴]
    double J = 0.0;     ///< Polar moment about the centroid [m⁴]
    double cx = 0.0;    ///< Centroid x-coordinate [m]
    double cy = 0.0;    ///< Centroid y-coordinate [m]

    // Distances to extreme fibres for stress calculation
    double fibre_top = 0.0;     ///< Centroid to top fibre, bending about x [m]
    double fibre_bottom = 0.0;  ///< Centroid to bottom fibre, bending about x [m]
    double fibre_right = 0.0;   ///< Centroid to right fibre, bending about y [m]
    double fibre_left = 0.0;    ///< Centroid to left fibre, bending about y [m]

    /**
     * @brief Properties of a single primitive shape
     *
     * @param shape Shape at any centroid location
     * @param name Section name, default is the shape kind
     */
    static SectionProperties from_shape(const StructuralShape& shape,
                                        const std::string& name = "");

    /**
     * @brief Properties of a composite about its own centroid
     *
     * Works on a recentred copy; the argument is not modified.
     *
     * @param composite Composite with non-zero net area
     * @param name Section name
     * @throws SectionException if the composite is degenerate
     */
    static SectionProperties from_composite(const CompositeShape& composite,
                                            const std::string& name = "composite");

    /**
     * @brief Elastic section modulus for bending about x, Ix / max(top, bottom) [m³]
     */
    double section_modulus_x() const;

    /**
     * @brief Elastic section modulus for bending about y, Iy / max(left, right) [m³]
     */
    double section_modulus_y() const;

    /**
     * @brief Polar radius of gyration, sqrt(J / A) [m]
     */
    double polar_radius_of_gyration() const;

    /**
     * @brief Set the distances to extreme fibres for stress calculations
     *
     * @param top Distance to top fibre for x-bending [m]
     * @param bot Distance to bottom fibre for x-bending [m]
     * @param right Distance to right fibre for y-bending [m]
     * @param left Distance to left fibre for y-bending [m]
     */
    void set_fibre_distances(double top, double bot, double right, double left);
};

} // namespace xsection
