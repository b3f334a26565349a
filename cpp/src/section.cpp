#include "xsection/section.hpp"
#include <algorithm>
#include <cmath>

namespace xsection {

namespace {

// Fibre distances from the centroid c to the edges of box
void assign_fibres(SectionProperties& props, const Eigen::AlignedBox2d& box,
                   const Eigen::Vector2d& c) {
    props.set_fibre_distances(box.max().y() - c.y(), c.y() - box.min().y(),
                              box.max().x() - c.x(), c.x() - box.min().x());
}

} // namespace

SectionProperties SectionProperties::from_shape(const StructuralShape& shape,
                                                const std::string& name) {
    SectionProperties props;
    props.name = name.empty() ? shape.kind_name() : name;
    props.A = shape.area();
    props.Ix = shape.centroidal_moi_x();
    props.Iy = shape.centroidal_moi_y();
    props.J = props.Ix + props.Iy;
    props.cx = shape.cog().x();
    props.cy = shape.cog().y();
    assign_fibres(props, shape.bounding_box(), shape.cog());
    return props;
}

SectionProperties SectionProperties::from_composite(const CompositeShape& composite,
                                                    const std::string& name) {
    const Eigen::Vector2d centroid = composite.calculate_cog();

    CompositeShape local = composite;
    local.update_cog();

    SectionProperties props;
    props.name = name;
    props.A = local.area();
    props.Ix = local.moi_x();
    props.Iy = local.moi_y();
    props.J = local.polar_moi();
    props.cx = centroid.x();
    props.cy = centroid.y();

    // Holes never extend the outline, so only added members bound the section
    Eigen::AlignedBox2d outline;
    for (const auto& member : local.members()) {
        if (member.sign == Sign::Add) {
            outline.extend(member.shape.bounding_box());
        }
    }
    if (!outline.isEmpty()) {
        assign_fibres(props, outline, Eigen::Vector2d::Zero());
    }
    return props;
}

double SectionProperties::section_modulus_x() const {
    return Ix / std::max(fibre_top, fibre_bottom);
}

double SectionProperties::section_modulus_y() const {
    return Iy / std::max(fibre_right, fibre_left);
}

double SectionProperties::polar_radius_of_gyration() const {
    return std::sqrt(J / A);
}

void SectionProperties::set_fibre_distances(double top, double bot, double right, double left) {
    fibre_top = top;
    fibre_bottom = bot;
    fibre_right = right;
    fibre_left = left;
}

} // namespace xsection
