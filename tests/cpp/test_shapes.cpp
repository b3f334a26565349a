/**
 * @file test_shapes.cpp
 * @brief C++ tests for primitive structural shapes
 *
 * Tests include:
 * - Closed-form areas and second moments at the origin
 * - Symmetry of moi_x and moi_y for symmetric sections
 * - Parallel axis behaviour when the centroid is moved
 * - Decomposition of hollow and I-sections into rods and rectangles
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "xsection/shape.hpp"
#include "xsection/composite_shape.hpp"
#include "xsection/parallel_axis.hpp"

#include <cmath>
#include <vector>

using namespace xsection;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// =============================================================================
// Closed forms
// =============================================================================

TEST_CASE("Rod of unit radius has Ix = pi/4", "[Shape][Rod][closed-form]") {
    auto rod = StructuralShape::rod(1.0);

    REQUIRE_THAT(rod.area(), WithinAbs(M_PI, 1e-14));
    REQUIRE_THAT(rod.moi_x(), WithinAbs(M_PI / 4.0, 1e-14));
    REQUIRE_THAT(rod.polar_moi(), WithinAbs(M_PI / 2.0, 1e-14));
}

TEST_CASE("Square rectangle 2x2 has Ix = 16/12", "[Shape][Rectangle][closed-form]") {
    auto rect = StructuralShape::rectangle(2.0, 2.0);

    REQUIRE_THAT(rect.area(), WithinAbs(4.0, 1e-14));
    REQUIRE_THAT(rect.moi_x(), WithinAbs(16.0 / 12.0, 1e-14));
}

TEST_CASE("Rectangle moments use width along x and height along y", "[Shape][Rectangle][closed-form]") {
    auto rect = StructuralShape::rectangle(2.0, 6.0);

    REQUIRE_THAT(rect.moi_x(), WithinAbs(2.0 * 216.0 / 12.0, 1e-12));
    REQUIRE_THAT(rect.moi_y(), WithinAbs(6.0 * 8.0 / 12.0, 1e-12));
}

TEST_CASE("Pipe R=2 t=1 has Ix = 15*pi/4", "[Shape][Pipe][closed-form]") {
    auto pipe = StructuralShape::pipe(2.0, 1.0);

    REQUIRE_THAT(pipe.area(), WithinAbs(3.0 * M_PI, 1e-12));
    REQUIRE_THAT(pipe.moi_x(), WithinAbs(15.0 * M_PI / 4.0, 1e-12));
}

TEST_CASE("Box beam 3x3 t=1 has Ix = 80/12", "[Shape][BoxBeam][closed-form]") {
    auto box = StructuralShape::box_beam(3.0, 3.0, 1.0);

    REQUIRE_THAT(box.area(), WithinAbs(8.0, 1e-12));
    REQUIRE_THAT(box.moi_x(), WithinAbs(80.0 / 12.0, 1e-12));
}

TEST_CASE("Box beam area subtracts the wall on both sides", "[Shape][BoxBeam][closed-form]") {
    auto box = StructuralShape::box_beam(0.4, 0.2, 0.01);

    double expected_area = 0.4 * 0.2 - 0.38 * 0.18;
    double expected_ix = 0.4 * std::pow(0.2, 3) / 12.0 - 0.38 * std::pow(0.18, 3) / 12.0;
    double expected_iy = 0.2 * std::pow(0.4, 3) / 12.0 - 0.18 * std::pow(0.38, 3) / 12.0;

    REQUIRE_THAT(box.area(), WithinAbs(expected_area, 1e-14));
    REQUIRE_THAT(box.moi_x(), WithinRel(expected_ix, 1e-12));
    REQUIRE_THAT(box.moi_y(), WithinRel(expected_iy, 1e-12));
}

TEST_CASE("I-beam matches hand-calculated flange and web values", "[Shape][IBeam][closed-form]") {
    const double W = 0.5, H = 0.25, tw = 0.025, tf = 0.05;
    auto beam = StructuralShape::i_beam(W, H, tw, tf);

    double expected_area = W * H - (H - 2.0 * tf) * (W - tw);
    double expected_ix = W * std::pow(H, 3) / 12.0 - (W - tw) * std::pow(H - 2.0 * tf, 3) / 12.0;
    // moi_y swaps the width and height roles: IBeam{H, W, tw, tf}
    double expected_iy = H * std::pow(W, 3) / 12.0 - (H - tw) * std::pow(W - 2.0 * tf, 3) / 12.0;

    REQUIRE_THAT(beam.area(), WithinRel(expected_area, 1e-12));
    REQUIRE_THAT(beam.moi_x(), WithinRel(expected_ix, 1e-12));
    REQUIRE_THAT(beam.moi_y(), WithinRel(expected_iy, 1e-12));
}

TEST_CASE("I-beam with flanges filling the depth equals a solid rectangle", "[Shape][IBeam][equivalence]") {
    auto beam = StructuralShape(IBeam{2.0, 2.0, 1.0, 1.0});
    auto rect = StructuralShape::rectangle(2.0, 2.0);

    REQUIRE(beam.area() == rect.area());
    REQUIRE(beam.moi_x() == rect.moi_x());
    REQUIRE(beam.moi_y() == rect.moi_y());
}

// =============================================================================
// Symmetry
// =============================================================================

TEST_CASE("Symmetric sections at the origin have equal moi_x and moi_y", "[Shape][symmetry]") {
    std::vector<StructuralShape> shapes = {
        StructuralShape::rod(1.3),
        StructuralShape::pipe(2.0, 0.3),
        StructuralShape::rectangle(2.5, 2.5),
        StructuralShape::box_beam(3.0, 3.0, 0.4),
        StructuralShape::i_beam(2.0, 2.0, 1.0, 1.0),
        StructuralShape::i_beam(2.0, 2.0, 0.2, 0.2),
        StructuralShape::i_beam(0.3, 0.3, 0.01, 0.02),
    };

    for (const auto& shape : shapes) {
        INFO(shape.kind_name());
        REQUIRE(shape.moi_x() == shape.moi_y());
    }
}

TEST_CASE("Square I-beam has equal moments about both axes", "[Shape][IBeam][symmetry]") {
    auto beam = StructuralShape::i_beam(2.0, 2.0, 0.2, 0.2);

    double expected = 2.0 * 8.0 / 12.0 - 1.8 * std::pow(1.6, 3) / 12.0;
    REQUIRE_THAT(beam.moi_x(), WithinRel(expected, 1e-12));
    REQUIRE(beam.moi_y() == beam.moi_x());
}

TEST_CASE("I-beam moi_y equals moi_x of the beam with width and height swapped", "[Shape][IBeam][symmetry]") {
    auto beam = StructuralShape(IBeam{0.5, 0.25, 0.025, 0.05}, Eigen::Vector2d(0.3, -0.1));
    auto swapped = StructuralShape(IBeam{0.25, 0.5, 0.025, 0.05}, Eigen::Vector2d(0.1, 0.3));

    REQUIRE_THAT(beam.moi_y(), WithinRel(swapped.moi_x(), 1e-12));
}

TEST_CASE("Turning a rectangle swaps its moments", "[Shape][symmetry]") {
    auto wide = StructuralShape::rectangle(3.0, 1.0);
    auto tall = StructuralShape::rectangle(1.0, 3.0);

    REQUIRE_THAT(wide.moi_y(), WithinAbs(tall.moi_x(), 1e-14));
    REQUIRE_THAT(wide.moi_x(), WithinAbs(tall.moi_y(), 1e-14));
}

// =============================================================================
// Parallel axis
// =============================================================================

TEST_CASE("Moving the centroid adds A*d^2 to each moment", "[Shape][parallel-axis]") {
    std::vector<StructuralShape> shapes = {
        StructuralShape::rod(0.3),
        StructuralShape::pipe(0.5, 0.05),
        StructuralShape::rectangle(0.2, 0.6),
        StructuralShape::box_beam(0.4, 0.3, 0.02),
        StructuralShape::i_beam(0.3, 0.6, 0.012, 0.02),
    };

    const double dx = 0.75;
    const double dy = -1.25;

    for (const auto& shape : shapes) {
        INFO(shape.kind_name());
        StructuralShape moved = shape;
        moved.set_cog(dx, dy);

        double a = shape.area();
        REQUIRE_THAT(moved.area(), WithinAbs(a, 1e-12));
        REQUIRE_THAT(moved.moi_x(), WithinRel(shape.moi_x() + a * dy * dy, 1e-10));
        REQUIRE_THAT(moved.moi_y(), WithinRel(shape.moi_y() + a * dx * dx, 1e-10));
        REQUIRE_THAT(moved.centroidal_moi_x(), WithinRel(shape.moi_x(), 1e-12));
        REQUIRE_THAT(moved.centroidal_moi_y(), WithinRel(shape.moi_y(), 1e-12));
    }
}

TEST_CASE("Shifted-axis moments are measured from the given axis", "[Shape][parallel-axis]") {
    auto rod = StructuralShape::rod(1.0);

    REQUIRE_THAT(rod.moi_x_shifted(2.0), WithinAbs(M_PI / 4.0 + M_PI * 4.0, 1e-12));
    REQUIRE_THAT(rod.moi_y_shifted(-2.0), WithinAbs(M_PI / 4.0 + M_PI * 4.0, 1e-12));

    rod.set_cog(0.0, 2.0);
    // Axis through the centroid
    REQUIRE_THAT(rod.moi_x_shifted(2.0), WithinAbs(M_PI / 4.0, 1e-12));
    REQUIRE_THAT(rod.moi_x_shifted(0.0), WithinAbs(rod.moi_x(), 1e-12));
}

TEST_CASE("parallel_axis adds A*d^2", "[parallel-axis]") {
    REQUIRE_THAT(parallel_axis(2.0, 3.0, 0.5), WithinAbs(2.75, 1e-15));
    REQUIRE_THAT(parallel_axis(2.0, 3.0, -0.5), WithinAbs(2.75, 1e-15));
}

TEST_CASE("quarter_turn maps x onto y", "[parallel-axis]") {
    Eigen::Vector2d turned = quarter_turn(Eigen::Vector2d(1.0, 2.0));
    REQUIRE(turned.x() == -2.0);
    REQUIRE(turned.y() == 1.0);
}

// =============================================================================
// Decomposition
// =============================================================================

TEST_CASE("Pipe decomposes into outer rod minus inner rod", "[Shape][decompose]") {
    auto pipe = StructuralShape(Pipe{2.0, 0.5}, Eigen::Vector2d(1.0, -1.0));
    CompositeShape parts = pipe.decompose();

    REQUIRE(parts.size() == 2);
    REQUIRE(parts.members()[0].sign == Sign::Add);
    REQUIRE(parts.members()[1].sign == Sign::Subtract);
    REQUIRE(parts.members()[0].shape.kind() == ShapeKind::Rod);
    REQUIRE(std::get<Rod>(parts.members()[1].shape.geometry()).radius == 1.5);
    REQUIRE(parts.members()[1].shape.cog() == pipe.cog());
    REQUIRE_THAT(parts.moi_x(), WithinAbs(pipe.moi_x(), 1e-12));
}

TEST_CASE("I-beam decomposes into a rectangle minus two side voids", "[Shape][decompose]") {
    auto beam = StructuralShape(IBeam{0.3, 0.6, 0.02, 0.04}, Eigen::Vector2d(0.5, 0.0));
    CompositeShape parts = beam.decompose();

    REQUIRE(parts.size() == 3);
    REQUIRE(parts.members()[0].sign == Sign::Add);

    const auto& left = parts.members()[1];
    const auto& right = parts.members()[2];
    REQUIRE(left.sign == Sign::Subtract);
    REQUIRE(right.sign == Sign::Subtract);

    const auto& void_geometry = std::get<Rectangle>(left.shape.geometry());
    REQUIRE_THAT(void_geometry.width, WithinAbs(0.14, 1e-15));
    REQUIRE_THAT(void_geometry.height, WithinAbs(0.52, 1e-15));

    // Voids straddle the web symmetrically about the centroid
    REQUIRE_THAT(left.shape.cog().x(), WithinAbs(0.5 - 0.08, 1e-15));
    REQUIRE_THAT(right.shape.cog().x(), WithinAbs(0.5 + 0.08, 1e-15));
    REQUIRE_THAT(parts.calculate_cog().x(), WithinAbs(0.5, 1e-12));
}

TEST_CASE("Zero-size voids are left out of a decomposition", "[Shape][decompose]") {
    REQUIRE(StructuralShape::i_beam(2.0, 2.0, 1.0, 1.0).decompose().size() == 1);
    REQUIRE(StructuralShape::pipe(1.0, 1.0).decompose().size() == 1);
    REQUIRE(StructuralShape::rectangle(1.0, 1.0).decompose().size() == 1);
}

TEST_CASE("I-beam moi_y includes the offset of a moved centroid", "[Shape][IBeam][parallel-axis]") {
    auto beam = StructuralShape::i_beam(0.3, 0.6, 0.02, 0.04);
    double iy = beam.moi_y();

    beam.set_cog(1.0, 0.0);
    REQUIRE_THAT(beam.moi_y(), WithinRel(iy + beam.area(), 1e-12));
    REQUIRE_THAT(beam.decompose().moi_x(), WithinRel(beam.moi_x(), 1e-12));
}

TEST_CASE("Bounding box encloses the section around its centroid", "[Shape][bounding-box]") {
    auto box = StructuralShape(BoxBeam{0.4, 0.2, 0.01}, Eigen::Vector2d(1.0, 2.0));
    Eigen::AlignedBox2d bb = box.bounding_box();

    REQUIRE_THAT(bb.min().x(), WithinAbs(0.8, 1e-15));
    REQUIRE_THAT(bb.max().x(), WithinAbs(1.2, 1e-15));
    REQUIRE_THAT(bb.min().y(), WithinAbs(1.9, 1e-15));
    REQUIRE_THAT(bb.max().y(), WithinAbs(2.1, 1e-15));

    auto pipe = StructuralShape::pipe(0.5, 0.05);
    REQUIRE_THAT(pipe.bounding_box().sizes().x(), WithinAbs(1.0, 1e-15));
}

TEST_CASE("Dimensions and kind names describe the variant", "[Shape]") {
    auto beam = StructuralShape::i_beam(0.3, 0.6, 0.02, 0.04);

    REQUIRE(beam.kind() == ShapeKind::IBeam);
    REQUIRE(beam.kind_name() == "IBeam");

    auto dims = beam.dimensions();
    REQUIRE(dims.size() == 4);
    REQUIRE(dims.at("web_thickness") == 0.02);
    REQUIRE(dims.at("flange_thickness") == 0.04);
}
