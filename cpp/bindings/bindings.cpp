#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "xsection/parallel_axis.hpp"
#include "xsection/shape.hpp"
#include "xsection/composite_shape.hpp"
#include "xsection/section.hpp"
#include "xsection/errors.hpp"
#include "xsection/warnings.hpp"

namespace py = pybind11;

/**
 * xsection C++ Python bindings module.
 * This module exposes the section property engine to Python via pybind11.
 */
PYBIND11_MODULE(_xsection_cpp, m) {
    m.doc() = "xsection C++ core module - cross-section property engine";

    // Version information
    m.attr("__version__") = "1.0.0";

    // ========================================================================
    // Errors
    // ========================================================================

    py::enum_<xsection::ErrorCode>(m, "ErrorCode",
        "Error codes for section definition failures")
        .value("OK", xsection::ErrorCode::OK, "No error")
        .value("INVALID_GEOMETRY", xsection::ErrorCode::INVALID_GEOMETRY,
               "Shape dimensions are invalid")
        .value("DEGENERATE_COMPOSITE", xsection::ErrorCode::DEGENERATE_COMPOSITE,
               "Composite has zero net area")
        .value("UNKNOWN_ERROR", xsection::ErrorCode::UNKNOWN_ERROR,
               "Unknown error")
        .export_values();

    py::class_<xsection::SectionError>(m, "SectionError",
        "Structured error information with machine-readable code and diagnostics")
        .def(py::init<>(), "Create OK (no error) status")
        .def(py::init<xsection::ErrorCode, const std::string&>(),
             py::arg("code"), py::arg("message"))
        .def_readwrite("code", &xsection::SectionError::code, "Error code")
        .def_readwrite("message", &xsection::SectionError::message, "Error message")
        .def_readwrite("shape_kind", &xsection::SectionError::shape_kind,
                       "Shape kind involved in the error")
        .def_readwrite("details", &xsection::SectionError::details,
                       "Offending parameter values (key-value pairs)")
        .def_readwrite("suggestion", &xsection::SectionError::suggestion,
                       "Suggested fix for the error")
        .def("is_ok", &xsection::SectionError::is_ok)
        .def("is_error", &xsection::SectionError::is_error)
        .def("code_string", &xsection::SectionError::code_string)
        .def("to_string", &xsection::SectionError::to_string)
        .def("__str__", &xsection::SectionError::to_string)
        .def("__repr__", [](const xsection::SectionError &e) {
            if (e.is_ok()) return std::string("<SectionError OK>");
            return "<SectionError " + e.code_string() + ": " + e.message + ">";
        });

    // SectionException surfaces in Python as ValueError with the formatted message
    py::register_exception<xsection::SectionException>(m, "SectionException", PyExc_ValueError);

    // ========================================================================
    // Warnings
    // ========================================================================

    py::enum_<xsection::WarningCode>(m, "WarningCode",
        "Warning codes for questionable composite sections")
        .value("NEAR_ZERO_AREA", xsection::WarningCode::NEAR_ZERO_AREA,
               "Net area is near zero")
        .value("NEGATIVE_NET_AREA", xsection::WarningCode::NEGATIVE_NET_AREA,
               "Subtracted shapes outweigh added shapes")
        .value("NO_POSITIVE_MEMBER", xsection::WarningCode::NO_POSITIVE_MEMBER,
               "Composite has no added members")
        .value("HOLE_OUTSIDE_OUTLINE", xsection::WarningCode::HOLE_OUTSIDE_OUTLINE,
               "Subtracted shapes extend beyond the added shapes")
        .export_values();

    py::enum_<xsection::WarningSeverity>(m, "WarningSeverity")
        .value("Low", xsection::WarningSeverity::Low)
        .value("Medium", xsection::WarningSeverity::Medium)
        .value("High", xsection::WarningSeverity::High)
        .export_values();

    py::class_<xsection::SectionWarning>(m, "SectionWarning",
        "Structured warning for a questionable composite")
        .def_readonly("code", &xsection::SectionWarning::code)
        .def_readonly("severity", &xsection::SectionWarning::severity)
        .def_readonly("message", &xsection::SectionWarning::message)
        .def_readonly("involved_members", &xsection::SectionWarning::involved_members)
        .def_readonly("details", &xsection::SectionWarning::details)
        .def_readonly("suggestion", &xsection::SectionWarning::suggestion)
        .def("to_string", &xsection::SectionWarning::to_string)
        .def("__str__", &xsection::SectionWarning::to_string);

    py::class_<xsection::WarningList>(m, "WarningList")
        .def_readonly("warnings", &xsection::WarningList::warnings)
        .def("has_warnings", &xsection::WarningList::has_warnings)
        .def("count", &xsection::WarningList::count)
        .def("contains", &xsection::WarningList::contains, py::arg("code"))
        .def("summary", &xsection::WarningList::summary)
        .def("__len__", &xsection::WarningList::count);

    // ========================================================================
    // Primitive shapes
    // ========================================================================

    py::class_<xsection::Rod>(m, "Rod", "Solid circular section")
        .def(py::init<double>(), py::arg("radius"))
        .def_readonly("radius", &xsection::Rod::radius, "Radius [m]");

    py::class_<xsection::Pipe>(m, "Pipe", "Hollow circular section")
        .def(py::init<double, double>(), py::arg("outer_radius"), py::arg("thickness"))
        .def_readonly("outer_radius", &xsection::Pipe::outer_radius, "Outer radius [m]")
        .def_readonly("thickness", &xsection::Pipe::thickness, "Wall thickness [m]");

    py::class_<xsection::Rectangle>(m, "Rectangle", "Solid rectangular section")
        .def(py::init<double, double>(), py::arg("width"), py::arg("height"))
        .def_readonly("width", &xsection::Rectangle::width, "Width [m]")
        .def_readonly("height", &xsection::Rectangle::height, "Height [m]");

    py::class_<xsection::BoxBeam>(m, "BoxBeam", "Hollow rectangular section")
        .def(py::init<double, double, double>(),
             py::arg("width"), py::arg("height"), py::arg("thickness"))
        .def_readonly("width", &xsection::BoxBeam::width, "Width [m]")
        .def_readonly("height", &xsection::BoxBeam::height, "Height [m]")
        .def_readonly("thickness", &xsection::BoxBeam::thickness, "Wall thickness [m]");

    py::class_<xsection::IBeam>(m, "IBeam", "Doubly symmetric I-section")
        .def(py::init<double, double, double, double>(),
             py::arg("width"), py::arg("height"),
             py::arg("web_thickness"), py::arg("flange_thickness"))
        .def_readonly("width", &xsection::IBeam::width, "Flange width [m]")
        .def_readonly("height", &xsection::IBeam::height, "Overall depth [m]")
        .def_readonly("web_thickness", &xsection::IBeam::web_thickness, "Web thickness [m]")
        .def_readonly("flange_thickness", &xsection::IBeam::flange_thickness,
                      "Flange thickness [m]");

    // Values stay scoped (ShapeKind.Rod) so they do not shadow the geometry classes
    py::enum_<xsection::ShapeKind>(m, "ShapeKind")
        .value("Rod", xsection::ShapeKind::Rod)
        .value("Pipe", xsection::ShapeKind::Pipe)
        .value("Rectangle", xsection::ShapeKind::Rectangle)
        .value("BoxBeam", xsection::ShapeKind::BoxBeam)
        .value("IBeam", xsection::ShapeKind::IBeam);

    py::class_<xsection::StructuralShape>(m, "StructuralShape",
        "Primitive cross-section with a centroid in a shared reference frame")
        .def(py::init<xsection::ShapeGeometry, const Eigen::Vector2d&>(),
             py::arg("geometry"), py::arg("cog") = Eigen::Vector2d(0.0, 0.0),
             "Construct from a Rod, Pipe, Rectangle, BoxBeam or IBeam")
        .def_static("rod", &xsection::StructuralShape::rod, py::arg("radius"))
        .def_static("pipe", &xsection::StructuralShape::pipe,
                    py::arg("outer_radius"), py::arg("thickness"))
        .def_static("rectangle", &xsection::StructuralShape::rectangle,
                    py::arg("width"), py::arg("height"))
        .def_static("box_beam", &xsection::StructuralShape::box_beam,
                    py::arg("width"), py::arg("height"), py::arg("thickness"))
        .def_static("i_beam", &xsection::StructuralShape::i_beam,
                    py::arg("width"), py::arg("height"),
                    py::arg("web_thickness"), py::arg("flange_thickness"))
        .def_property_readonly("geometry", &xsection::StructuralShape::geometry)
        .def("kind", &xsection::StructuralShape::kind)
        .def("kind_name", &xsection::StructuralShape::kind_name)
        .def("dimensions", &xsection::StructuralShape::dimensions)
        .def("cog", &xsection::StructuralShape::cog, "Centroid [m]")
        .def("set_cog", py::overload_cast<const Eigen::Vector2d&>(
                 &xsection::StructuralShape::set_cog), py::arg("cog"))
        .def("set_cog", py::overload_cast<double, double>(
                 &xsection::StructuralShape::set_cog), py::arg("x"), py::arg("y"))
        .def("area", &xsection::StructuralShape::area, "Area [m²]")
        .def("moi_x", &xsection::StructuralShape::moi_x, "Moment about frame x-axis [m⁴]")
        .def("moi_y", &xsection::StructuralShape::moi_y, "Moment about frame y-axis [m⁴]")
        .def("polar_moi", &xsection::StructuralShape::polar_moi, "moi_x + moi_y [m⁴]")
        .def("centroidal_moi_x", &xsection::StructuralShape::centroidal_moi_x)
        .def("centroidal_moi_y", &xsection::StructuralShape::centroidal_moi_y)
        .def("moi_x_shifted", &xsection::StructuralShape::moi_x_shifted, py::arg("y_axis"))
        .def("moi_y_shifted", &xsection::StructuralShape::moi_y_shifted, py::arg("x_axis"))
        .def("decompose", &xsection::StructuralShape::decompose,
             "Shape as a signed sum of rods and rectangles")
        .def("__repr__", [](const xsection::StructuralShape &s) {
            return "<StructuralShape " + s.kind_name() +
                   " A=" + std::to_string(s.area()) +
                   " cog=(" + std::to_string(s.cog().x()) + ", " +
                               std::to_string(s.cog().y()) + ")>";
        });

    // ========================================================================
    // Composite shapes
    // ========================================================================

    py::enum_<xsection::Sign>(m, "Sign")
        .value("Add", xsection::Sign::Add)
        .value("Subtract", xsection::Sign::Subtract)
        .export_values();

    py::class_<xsection::CompositeConfig>(m, "CompositeConfig",
        "Configuration for composite evaluation and checks")
        .def(py::init<>())
        .def_readwrite("degenerate_area_tolerance",
                       &xsection::CompositeConfig::degenerate_area_tolerance,
                       "Relative net area treated as zero")
        .def_readwrite("near_zero_area_ratio",
                       &xsection::CompositeConfig::near_zero_area_ratio,
                       "Relative net area that triggers NEAR_ZERO_AREA");

    py::class_<xsection::CompositeMember>(m, "CompositeMember")
        .def_readonly("sign", &xsection::CompositeMember::sign)
        .def_readonly("shape", &xsection::CompositeMember::shape);

    py::class_<xsection::CompositeShape>(m, "CompositeShape",
        "Cross-section built by adding and subtracting primitive shapes")
        .def(py::init<>())
        .def(py::init<const xsection::CompositeConfig&>(), py::arg("config"))
        .def("add", &xsection::CompositeShape::add, py::arg("shape"),
             py::return_value_policy::reference_internal)
        .def("sub", &xsection::CompositeShape::sub, py::arg("shape"),
             py::return_value_policy::reference_internal)
        .def("area", &xsection::CompositeShape::area, "Net area [m²]")
        .def("moi_x", &xsection::CompositeShape::moi_x)
        .def("moi_y", &xsection::CompositeShape::moi_y)
        .def("polar_moi", &xsection::CompositeShape::polar_moi)
        .def("calculate_cog", &xsection::CompositeShape::calculate_cog,
             "Signed-area weighted centroid [m]")
        .def("update_cog", &xsection::CompositeShape::update_cog,
             py::return_value_policy::reference_internal,
             "Re-express members relative to the composite centroid")
        .def("check", &xsection::CompositeShape::check)
        .def("members", &xsection::CompositeShape::members)
        .def("__len__", &xsection::CompositeShape::size)
        .def("__repr__", [](const xsection::CompositeShape &c) {
            return "<CompositeShape members=" + std::to_string(c.size()) + ">";
        });

    // ========================================================================
    // Section properties
    // ========================================================================

    py::class_<xsection::SectionProperties>(m, "SectionProperties",
        "Centroidal cross-section properties for stress calculations")
        .def_static("from_shape", &xsection::SectionProperties::from_shape,
                    py::arg("shape"), py::arg("name") = "")
        .def_static("from_composite", &xsection::SectionProperties::from_composite,
                    py::arg("composite"), py::arg("name") = "composite")
        .def_readwrite("name", &xsection::SectionProperties::name)
        .def_readwrite("A", &xsection::SectionProperties::A, "Area [m²]")
        .def_readwrite("Ix", &xsection::SectionProperties::Ix, "Centroidal Ix [m⁴]")
        .def_readwrite("Iy", &xsection::SectionProperties::Iy, "Centroidal Iy [m⁴]")
        .def_readwrite("J", &xsection::SectionProperties::J, "Polar moment [m⁴]")
        .def_readwrite("cx", &xsection::SectionProperties::cx, "Centroid x [m]")
        .def_readwrite("cy", &xsection::SectionProperties::cy, "Centroid y [m]")
        .def_readwrite("fibre_top", &xsection::SectionProperties::fibre_top)
        .def_readwrite("fibre_bottom", &xsection::SectionProperties::fibre_bottom)
        .def_readwrite("fibre_right", &xsection::SectionProperties::fibre_right)
        .def_readwrite("fibre_left", &xsection::SectionProperties::fibre_left)
        .def("section_modulus_x", &xsection::SectionProperties::section_modulus_x)
        .def("section_modulus_y", &xsection::SectionProperties::section_modulus_y)
        .def("polar_radius_of_gyration",
             &xsection::SectionProperties::polar_radius_of_gyration)
        .def("__repr__", [](const xsection::SectionProperties &s) {
            return "<SectionProperties '" + s.name + "' A=" + std::to_string(s.A) + ">";
        });

    // ========================================================================
    // Utilities
    // ========================================================================

    m.def("parallel_axis", &xsection::parallel_axis,
          py::arg("i_centroidal"), py::arg("area"), py::arg("offset"),
          "Parallel axis theorem: I_c + A * d²");
}
