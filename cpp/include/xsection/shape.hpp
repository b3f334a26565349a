#pragma once

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <map>
#include <string>
#include <variant>

namespace xsection {

class CompositeShape;

/// Solid circular section
struct Rod {
    double radius;          ///< Radius [m]
};

/// Hollow circular section
struct Pipe {
    double outer_radius;    ///< Outer radius [m]
    double thickness;       ///< Wall thickness [m]
};

/// Solid rectangular section
struct Rectangle {
    double width;           ///< Extent along x [m]
    double height;          ///< Extent along y [m]
};

/// Hollow rectangular section with a uniform wall
struct BoxBeam {
    double width;           ///< Outer extent along x [m]
    double height;          ///< Outer extent along y [m]
    double thickness;       ///< Wall thickness [m]
};

/// Doubly symmetric I-section, web along y
struct IBeam {
    double width;             ///< Flange width [m]
    double height;            ///< Overall depth [m]
    double web_thickness;     ///< Web thickness [m]
    double flange_thickness;  ///< Flange thickness [m]
};

/// Closed set of section geometries
using ShapeGeometry = std::variant<Rod, Pipe, Rectangle, BoxBeam, IBeam>;

/**
 * @brief Section family, in the same order as the ShapeGeometry alternatives
 */
enum class ShapeKind {
    Rod = 0,
    Pipe = 1,
    Rectangle = 2,
    BoxBeam = 3,
    IBeam = 4
};

/**
 * @brief Convert shape kind to string representation (e.g. "BoxBeam")
 */
std::string shape_kind_to_string(ShapeKind kind);

/**
 * @brief Primitive structural cross-section
 *
 * A section geometry plus the location of its centroid in a reference
 * frame shared with other shapes. Dimensions are fixed at construction;
 * the centroid can be moved with set_cog().
 *
 * All second moments are about the axes of the shared frame, i.e. they
 * include the parallel axis term for the stored centroid:
 *   moi_x = I_x,c + A * cy²
 *   moi_y = I_y,c + A * cx²
 *
 * Only Rod and Rectangle carry closed-form formulas. Pipe, BoxBeam and IBeam
 * are evaluated through decompose(), which expresses them as signed sums of
 * rods and rectangles. moi_y() of every shape is moi_x() of the same parts
 * turned a quarter turn; an IBeam is turned by swapping its width and height
 * roles, so a square IBeam at the origin has moi_x() == moi_y().
 *
 * Geometry is validated on construction; invalid dimensions throw
 * SectionException with ErrorCode::INVALID_GEOMETRY.
 *
 * Usage:
 *   auto beam = StructuralShape::i_beam(0.5, 0.25, 0.025, 0.05);
 *   double Ix = beam.moi_x();
 */
class StructuralShape {
public:
    /**
     * @brief Construct a shape from its geometry
     *
     * @param geometry Section dimensions
     * @param cog Centroid in the shared reference frame [m], default origin
     * @throws SectionException if the dimensions are invalid
     */
    explicit StructuralShape(ShapeGeometry geometry,
                             const Eigen::Vector2d& cog = Eigen::Vector2d::Zero());

    // Factories with the centroid at the origin

    static StructuralShape rod(double radius);
    static StructuralShape pipe(double outer_radius, double thickness);
    static StructuralShape rectangle(double width, double height);
    static StructuralShape box_beam(double width, double height, double thickness);

    /**
     * @brief Create an I-section
     *
     * @param width Flange width [m]
     * @param height Overall depth [m]
     * @param web_thickness Web thickness [m]
     * @param flange_thickness Flange thickness [m]
     */
    static StructuralShape i_beam(double width, double height,
                                  double web_thickness, double flange_thickness);

    const ShapeGeometry& geometry() const { return geometry_; }

    ShapeKind kind() const;

    std::string kind_name() const { return shape_kind_to_string(kind()); }

    /**
     * @brief Named dimensions of the shape, e.g. {"radius": 0.1}
     */
    std::map<std::string, double> dimensions() const;

    /**
     * @brief Centroid in the shared reference frame [m]
     */
    const Eigen::Vector2d& cog() const { return cog_; }

    /**
     * @brief Move the centroid; dimensions are unaffected
     */
    void set_cog(const Eigen::Vector2d& cog) { cog_ = cog; }

    void set_cog(double x, double y) { cog_ = Eigen::Vector2d(x, y); }

    /**
     * @brief Cross-sectional area [m²]
     */
    double area() const;

    /**
     * @brief Second moment of area about the frame x-axis [m⁴]
     */
    double moi_x() const;

    /**
     * @brief Second moment of area about the frame y-axis [m⁴]
     */
    double moi_y() const;

    /**
     * @brief Polar moment of inertia about the frame origin [m⁴]
     *
     * J = moi_x + moi_y
     */
    double polar_moi() const;

    /**
     * @brief Second moment about the shape's own centroidal x-axis [m⁴]
     */
    double centroidal_moi_x() const;

    /**
     * @brief Second moment about the shape's own centroidal y-axis [m⁴]
     */
    double centroidal_moi_y() const;

    /**
     * @brief Second moment about the line y = y_axis [m⁴]
     *
     * @param y_axis Location of an axis parallel to the frame x-axis [m]
     */
    double moi_x_shifted(double y_axis) const;

    /**
     * @brief Second moment about the line x = x_axis [m⁴]
     *
     * @param x_axis Location of an axis parallel to the frame y-axis [m]
     */
    double moi_y_shifted(double x_axis) const;

    /**
     * @brief Express the shape as a signed sum of rods and rectangles
     *
     * Parts are positioned at this shape's centroid. Rod and Rectangle
     * decompose to a single added copy of themselves. Voids of zero size
     * are omitted.
     *
     * - Pipe:    Rod(R) - Rod(R - t)
     * - BoxBeam: Rectangle(W, H) - Rectangle(W - 2t, H - 2t)
     * - IBeam:   Rectangle(W, H) - 2 x Rectangle((W - tw) / 2, H - 2tf),
     *            one either side of the web
     */
    CompositeShape decompose() const;

    /**
     * @brief Axis-aligned box enclosing the section at its centroid [m]
     */
    Eigen::AlignedBox2d bounding_box() const;

private:
    /**
     * @brief Decomposition, optionally turned a quarter turn about the frame origin
     *
     * When turned, widths and heights swap and every part centroid is mapped
     * through quarter_turn(), so parts(true).moi_x() == moi_y(). IBeam parts
     * are laid out as IBeam{height, width, web, flange} at the turned centroid.
     */
    CompositeShape parts(bool turned) const;

    /**
     * @brief Reject negative, non-finite or self-cancelling dimensions
     *
     * @throws SectionException with ErrorCode::INVALID_GEOMETRY
     */
    void validate() const;

    ShapeGeometry geometry_;
    Eigen::Vector2d cog_;
};

} // namespace xsection
