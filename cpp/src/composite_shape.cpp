#include "xsection/composite_shape.hpp"
#include "xsection/errors.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

namespace xsection {

CompositeShape::CompositeShape(const CompositeConfig& config)
    : config_(config) {}

CompositeShape& CompositeShape::add(const StructuralShape& shape) {
    members_.push_back(CompositeMember{Sign::Add, shape});
    return *this;
}

CompositeShape& CompositeShape::sub(const StructuralShape& shape) {
    members_.push_back(CompositeMember{Sign::Subtract, shape});
    return *this;
}

double CompositeShape::area() const {
    double total = 0.0;
    for (const auto& member : members_) {
        total += member.factor() * member.shape.area();
    }
    return total;
}

double CompositeShape::moi_x() const {
    double total = 0.0;
    for (const auto& member : members_) {
        total += member.factor() * member.shape.moi_x();
    }
    return total;
}

double CompositeShape::moi_y() const {
    double total = 0.0;
    for (const auto& member : members_) {
        total += member.factor() * member.shape.moi_y();
    }
    return total;
}

double CompositeShape::polar_moi() const {
    return moi_x() + moi_y();
}

CentroidAccumulator CompositeShape::accumulate() const {
    CentroidAccumulator acc;
    for (const auto& member : members_) {
        acc.add(member.factor() * member.shape.area(), member.shape.cog());
    }
    return acc;
}

Eigen::Vector2d CompositeShape::calculate_cog() const {
    CentroidAccumulator acc = accumulate();

    // Empty composites have gross area 0 and fall through here as well
    if (std::abs(acc.net_area()) <= config_.degenerate_area_tolerance * acc.gross_area()) {
        throw SectionException(
            SectionError::degenerate_composite(acc.net_area(), acc.gross_area(), size()));
    }

    return acc.first_moment() / acc.net_area();
}

CompositeShape& CompositeShape::update_cog() {
    const Eigen::Vector2d shift = calculate_cog();

    for (auto& member : members_) {
        member.shape.set_cog(member.shape.cog() - shift);
    }

    spdlog::debug("Moved origin of {}-member composite to its centroid ({}, {})",
                  members_.size(), shift.x(), shift.y());
    return *this;
}

WarningList CompositeShape::check() const {
    WarningList result;

    std::vector<std::size_t> subtracted;
    bool has_added = false;
    for (std::size_t i = 0; i < members_.size(); ++i) {
        if (members_[i].sign == Sign::Add) {
            has_added = true;
        } else {
            subtracted.push_back(i);
        }
    }

    if (!members_.empty() && !has_added) {
        result.add(SectionWarning::no_positive_member(subtracted));
    }

    if (has_added && !subtracted.empty()) {
        Eigen::AlignedBox2d outline;
        for (const auto& member : members_) {
            if (member.sign == Sign::Add) {
                outline.extend(member.shape.bounding_box());
            }
        }
        std::vector<std::size_t> outside;
        for (std::size_t i : subtracted) {
            if (!outline.contains(members_[i].shape.bounding_box())) {
                outside.push_back(i);
            }
        }
        if (!outside.empty()) {
            result.add(SectionWarning::hole_outside_outline(outside));
        }
    }

    CentroidAccumulator acc = accumulate();
    if (acc.net_area() < 0.0) {
        result.add(SectionWarning::negative_net_area(acc.net_area()));
    } else if (acc.gross_area() > 0.0 &&
               acc.net_area() < config_.near_zero_area_ratio * acc.gross_area()) {
        result.add(SectionWarning::near_zero_area(acc.net_area(), acc.gross_area()));
    }

    for (const auto& warning : result.warnings) {
        spdlog::warn("{}", warning.to_string());
    }

    return result;
}

} // namespace xsection
