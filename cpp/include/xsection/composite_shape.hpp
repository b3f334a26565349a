#pragma once

#include "xsection/parallel_axis.hpp"
#include "xsection/shape.hpp"
#include "xsection/warnings.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace xsection {

/**
 * @brief Whether a composite member adds or removes material
 */
enum class Sign {
    Add = 1,
    Subtract = -1
};

/**
 * @brief Numeric factor (+1 or -1) of a member sign
 */
inline double sign_factor(Sign sign) {
    return sign == Sign::Add ? 1.0 : -1.0;
}

/**
 * @brief Configuration for composite evaluation and checks
 */
struct CompositeConfig {
    /// Net area below this fraction of the gross area is treated as zero
    double degenerate_area_tolerance = 1e-12;

    /// Net area below this fraction of the gross area triggers NEAR_ZERO_AREA
    double near_zero_area_ratio = 1e-3;
};

/**
 * @brief One signed member of a composite
 */
struct CompositeMember {
    Sign sign;
    StructuralShape shape;

    double factor() const { return sign_factor(sign); }
};

/**
 * @brief Cross-section built by adding and subtracting primitive shapes
 *
 * Properties are signed sums over the members. Each member contributes
 * its moments about the shared frame axes, so the composite moments are
 * about the frame axes too. update_cog() moves the frame origin to the
 * composite centroid, after which moi_x()/moi_y() are centroidal values.
 *
 * Members are copied in and kept in insertion order.
 *
 * Usage:
 *   CompositeShape hollow;
 *   hollow.add(StructuralShape(Rectangle{2.0, 2.0}, {2.0, 1.5}))
 *         .sub(StructuralShape(Rectangle{1.0, 1.0}, {2.0, 1.5}));
 *   Eigen::Vector2d c = hollow.calculate_cog();   // (2.0, 1.5)
 *   hollow.update_cog();                          // members now about (0, 0)
 */
class CompositeShape {
public:
    CompositeShape() = default;

    explicit CompositeShape(const CompositeConfig& config);

    /**
     * @brief Append a shape that adds material
     * @return *this, for chaining
     */
    CompositeShape& add(const StructuralShape& shape);

    /**
     * @brief Append a shape that removes material
     * @return *this, for chaining
     */
    CompositeShape& sub(const StructuralShape& shape);

    /**
     * @brief Net area, Σ sign * A_i [m²]
     */
    double area() const;

    /**
     * @brief Σ sign * moi_x_i about the frame x-axis [m⁴]
     */
    double moi_x() const;

    /**
     * @brief Σ sign * moi_y_i about the frame y-axis [m⁴]
     */
    double moi_y() const;

    /**
     * @brief moi_x + moi_y [m⁴]
     */
    double polar_moi() const;

    /**
     * @brief Signed-area weighted centroid of the members [m]
     *
     * c = Σ sign * A_i * c_i / Σ sign * A_i
     *
     * @throws SectionException with ErrorCode::DEGENERATE_COMPOSITE if the
     *         net area is zero (including an empty composite)
     */
    Eigen::Vector2d calculate_cog() const;

    /**
     * @brief Re-express every member relative to the composite centroid
     *
     * Shifts each direct member's centroid by -calculate_cog(). Shapes that
     * are decomposed internally are not affected. Calling it again is a
     * no-op up to round-off.
     *
     * @return *this, for chaining
     * @throws SectionException if the composite is degenerate
     */
    CompositeShape& update_cog();

    /**
     * @brief Check for sections that compute but are probably mistakes
     *
     * Each warning is also logged.
     */
    WarningList check() const;

    const std::vector<CompositeMember>& members() const { return members_; }

    std::size_t size() const { return members_.size(); }

    bool empty() const { return members_.empty(); }

    const CompositeConfig& config() const { return config_; }

private:
    CentroidAccumulator accumulate() const;

    std::vector<CompositeMember> members_;
    CompositeConfig config_;
};

} // namespace xsection
