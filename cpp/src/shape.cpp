#include "xsection/shape.hpp"
#include "xsection/composite_shape.hpp"
#include "xsection/errors.hpp"
#include "xsection/parallel_axis.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <utility>

namespace xsection {

namespace {

[[noreturn]] void reject(const StructuralShape& shape, const std::string& reason) {
    SectionError err = SectionError::invalid_geometry(shape.kind_name(), reason,
                                                      shape.dimensions());
    spdlog::debug("Rejected {} section: {}", shape.kind_name(), reason);
    throw SectionException(std::move(err));
}

} // namespace

std::string shape_kind_to_string(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::Rod: return "Rod";
        case ShapeKind::Pipe: return "Pipe";
        case ShapeKind::Rectangle: return "Rectangle";
        case ShapeKind::BoxBeam: return "BoxBeam";
        case ShapeKind::IBeam: return "IBeam";
        default: return "Unknown";
    }
}

StructuralShape::StructuralShape(ShapeGeometry geometry, const Eigen::Vector2d& cog)
    : geometry_(std::move(geometry)), cog_(cog) {
    validate();
}

StructuralShape StructuralShape::rod(double radius) {
    return StructuralShape(Rod{radius});
}

StructuralShape StructuralShape::pipe(double outer_radius, double thickness) {
    return StructuralShape(Pipe{outer_radius, thickness});
}

StructuralShape StructuralShape::rectangle(double width, double height) {
    return StructuralShape(Rectangle{width, height});
}

StructuralShape StructuralShape::box_beam(double width, double height, double thickness) {
    return StructuralShape(BoxBeam{width, height, thickness});
}

StructuralShape StructuralShape::i_beam(double width, double height,
                                        double web_thickness, double flange_thickness) {
    return StructuralShape(IBeam{width, height, web_thickness, flange_thickness});
}

ShapeKind StructuralShape::kind() const {
    return static_cast<ShapeKind>(geometry_.index());
}

std::map<std::string, double> StructuralShape::dimensions() const {
    switch (kind()) {
        case ShapeKind::Rod: {
            const auto& g = std::get<Rod>(geometry_);
            return {{"radius", g.radius}};
        }
        case ShapeKind::Pipe: {
            const auto& g = std::get<Pipe>(geometry_);
            return {{"outer_radius", g.outer_radius}, {"thickness", g.thickness}};
        }
        case ShapeKind::Rectangle: {
            const auto& g = std::get<Rectangle>(geometry_);
            return {{"width", g.width}, {"height", g.height}};
        }
        case ShapeKind::BoxBeam: {
            const auto& g = std::get<BoxBeam>(geometry_);
            return {{"width", g.width}, {"height", g.height}, {"thickness", g.thickness}};
        }
        case ShapeKind::IBeam: {
            const auto& g = std::get<IBeam>(geometry_);
            return {{"width", g.width}, {"height", g.height},
                    {"web_thickness", g.web_thickness},
                    {"flange_thickness", g.flange_thickness}};
        }
    }
    return {};
}

void StructuralShape::validate() const {
    for (const auto& [name, value] : dimensions()) {
        if (!std::isfinite(value) || value < 0.0) {
            reject(*this, name + " must be finite and non-negative");
        }
    }

    // Inner dimensions may reach zero (the section becomes solid) but not go negative
    switch (kind()) {
        case ShapeKind::Pipe: {
            const auto& g = std::get<Pipe>(geometry_);
            if (g.thickness > g.outer_radius) {
                reject(*this, "thickness must not exceed outer_radius");
            }
            break;
        }
        case ShapeKind::BoxBeam: {
            const auto& g = std::get<BoxBeam>(geometry_);
            if (2.0 * g.thickness > g.width || 2.0 * g.thickness > g.height) {
                reject(*this, "twice the thickness must not exceed width or height");
            }
            break;
        }
        case ShapeKind::IBeam: {
            const auto& g = std::get<IBeam>(geometry_);
            if (2.0 * g.flange_thickness > g.height) {
                reject(*this, "twice the flange_thickness must not exceed height");
            }
            if (g.web_thickness > g.width) {
                reject(*this, "web_thickness must not exceed width");
            }
            break;
        }
        default:
            break;
    }

    Eigen::AlignedBox2d extent = bounding_box();
    if (!(extent.sizes().minCoeff() > 0.0)) {
        reject(*this, "outer dimensions must be positive");
    }

    if (!(area() > 0.0)) {
        reject(*this, "section encloses no material (area is not positive)");
    }
}

double StructuralShape::area() const {
    switch (kind()) {
        case ShapeKind::Rod: {
            double r = std::get<Rod>(geometry_).radius;
            return M_PI * r * r;
        }
        case ShapeKind::Rectangle: {
            const auto& g = std::get<Rectangle>(geometry_);
            return g.width * g.height;
        }
        default:
            return parts(false).area();
    }
}

double StructuralShape::moi_x() const {
    switch (kind()) {
        case ShapeKind::Rod: {
            double r = std::get<Rod>(geometry_).radius;
            return parallel_axis(M_PI * std::pow(r, 4) / 4.0, area(), cog_.y());
        }
        case ShapeKind::Rectangle: {
            const auto& g = std::get<Rectangle>(geometry_);
            return parallel_axis(g.width * std::pow(g.height, 3) / 12.0, area(), cog_.y());
        }
        default:
            return parts(false).moi_x();
    }
}

double StructuralShape::moi_y() const {
    // Turn the section so its y-axis lies along x, then reuse moi_x.
    // I-sections are turned by swapping width and height, see parts()
    return parts(true).moi_x();
}

double StructuralShape::polar_moi() const {
    return moi_x() + moi_y();
}

double StructuralShape::centroidal_moi_x() const {
    StructuralShape local = *this;
    local.set_cog(0.0, 0.0);
    return local.moi_x();
}

double StructuralShape::centroidal_moi_y() const {
    StructuralShape local = *this;
    local.set_cog(0.0, 0.0);
    return local.moi_y();
}

double StructuralShape::moi_x_shifted(double y_axis) const {
    return parallel_axis(centroidal_moi_x(), area(), cog_.y() - y_axis);
}

double StructuralShape::moi_y_shifted(double x_axis) const {
    return parallel_axis(centroidal_moi_y(), area(), cog_.x() - x_axis);
}

CompositeShape StructuralShape::decompose() const {
    return parts(false);
}

CompositeShape StructuralShape::parts(bool turned) const {
    const Eigen::Vector2d centre = turned ? quarter_turn(cog_) : cog_;

    // Rectangle part laid out in the unturned frame, offset from the centroid
    auto rectangle_part = [&](double width, double height, const Eigen::Vector2d& offset) {
        if (turned) {
            return StructuralShape(Rectangle{height, width}, centre + quarter_turn(offset));
        }
        return StructuralShape(Rectangle{width, height}, centre + offset);
    };

    auto rod_part = [&](double radius) {
        return StructuralShape(Rod{radius}, centre);
    };

    CompositeShape result;

    switch (kind()) {
        case ShapeKind::Rod: {
            result.add(rod_part(std::get<Rod>(geometry_).radius));
            break;
        }
        case ShapeKind::Rectangle: {
            const auto& g = std::get<Rectangle>(geometry_);
            result.add(rectangle_part(g.width, g.height, Eigen::Vector2d::Zero()));
            break;
        }
        case ShapeKind::Pipe: {
            const auto& g = std::get<Pipe>(geometry_);
            double inner_radius = g.outer_radius - g.thickness;
            result.add(rod_part(g.outer_radius));
            if (inner_radius > 0.0) {
                result.sub(rod_part(inner_radius));
            }
            break;
        }
        case ShapeKind::BoxBeam: {
            const auto& g = std::get<BoxBeam>(geometry_);
            double inner_width = g.width - 2.0 * g.thickness;
            double inner_height = g.height - 2.0 * g.thickness;
            result.add(rectangle_part(g.width, g.height, Eigen::Vector2d::Zero()));
            if (inner_width > 0.0 && inner_height > 0.0) {
                result.sub(rectangle_part(inner_width, inner_height, Eigen::Vector2d::Zero()));
            }
            break;
        }
        case ShapeKind::IBeam: {
            // Turning an I-section swaps the width and height roles; the web
            // stays vertical, so a square I-section has moi_x == moi_y
            const auto& g = std::get<IBeam>(geometry_);
            double width = turned ? g.height : g.width;
            double height = turned ? g.width : g.height;
            double void_width = (width - g.web_thickness) / 2.0;
            double void_height = height - 2.0 * g.flange_thickness;
            result.add(StructuralShape(Rectangle{width, height}, centre));
            if (void_width > 0.0 && void_height > 0.0) {
                // Voids sit between the flanges, either side of the web
                double dx = (g.web_thickness + void_width) / 2.0;
                result.sub(StructuralShape(Rectangle{void_width, void_height},
                                           centre + Eigen::Vector2d(-dx, 0.0)));
                result.sub(StructuralShape(Rectangle{void_width, void_height},
                                           centre + Eigen::Vector2d(dx, 0.0)));
            }
            break;
        }
    }

    return result;
}

Eigen::AlignedBox2d StructuralShape::bounding_box() const {
    Eigen::Vector2d half;
    switch (kind()) {
        case ShapeKind::Rod: {
            double r = std::get<Rod>(geometry_).radius;
            half = Eigen::Vector2d(r, r);
            break;
        }
        case ShapeKind::Pipe: {
            double r = std::get<Pipe>(geometry_).outer_radius;
            half = Eigen::Vector2d(r, r);
            break;
        }
        case ShapeKind::Rectangle: {
            const auto& g = std::get<Rectangle>(geometry_);
            half = Eigen::Vector2d(g.width, g.height) / 2.0;
            break;
        }
        case ShapeKind::BoxBeam: {
            const auto& g = std::get<BoxBeam>(geometry_);
            half = Eigen::Vector2d(g.width, g.height) / 2.0;
            break;
        }
        case ShapeKind::IBeam: {
            const auto& g = std::get<IBeam>(geometry_);
            half = Eigen::Vector2d(g.width, g.height) / 2.0;
            break;
        }
    }
    return Eigen::AlignedBox2d(cog_ - half, cog_ + half);
}

} // namespace xsection
