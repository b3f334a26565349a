#include "xsection/parallel_axis.hpp"
#include <cmath>

namespace xsection {

double parallel_axis(double i_centroidal, double area, double offset) {
    return i_centroidal + area * offset * offset;
}

Eigen::Vector2d quarter_turn(const Eigen::Vector2d& point) {
    return Eigen::Vector2d(-point.y(), point.x());
}

void CentroidAccumulator::add(double signed_area, const Eigen::Vector2d& centroid) {
    net_area_ += signed_area;
    gross_area_ += std::abs(signed_area);
    first_moment_ += signed_area * centroid;
}

} // namespace xsection
