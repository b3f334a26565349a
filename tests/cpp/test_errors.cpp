/**
 * @file test_errors.cpp
 * @brief C++ tests for geometry validation and structured errors/warnings
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "xsection/shape.hpp"
#include "xsection/errors.hpp"
#include "xsection/warnings.hpp"

#include <limits>

using namespace xsection;
using Catch::Matchers::ContainsSubstring;

namespace {

/**
 * @brief Construct a shape and return the error it is rejected with
 */
SectionError rejection(const ShapeGeometry& geometry) {
    try {
        StructuralShape shape(geometry);
    } catch (const SectionException& e) {
        return e.error();
    }
    return SectionError();
}

} // namespace

// =============================================================================
// Geometry validation
// =============================================================================

TEST_CASE("Pipe wall thicker than its radius is rejected", "[errors][validation]") {
    SectionError err = rejection(Pipe{1.0, 2.0});

    REQUIRE(err.code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(err.shape_kind == "Pipe");
    REQUIRE(err.details.at("outer_radius") == "1.000000");
    REQUIRE(err.details.at("thickness") == "2.000000");
}

TEST_CASE("Box beam walls must fit inside both outer dimensions", "[errors][validation]") {
    REQUIRE(rejection(BoxBeam{2.0, 1.0, 0.6}).code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(rejection(BoxBeam{1.0, 2.0, 0.6}).code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(rejection(BoxBeam{2.0, 2.0, 0.5}).is_ok());
}

TEST_CASE("I-beam flanges and web must fit inside the outline", "[errors][validation]") {
    SectionError flanges = rejection(IBeam{2.0, 2.0, 0.1, 1.5});
    REQUIRE(flanges.code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(flanges.details.count("flange_thickness") == 1);
    REQUIRE_THAT(flanges.message, ContainsSubstring("flange_thickness"));

    SectionError web = rejection(IBeam{2.0, 2.0, 3.0, 0.1});
    REQUIRE(web.code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE_THAT(web.message, ContainsSubstring("web_thickness"));
}

TEST_CASE("Negative and non-finite dimensions are rejected", "[errors][validation]") {
    REQUIRE(rejection(Rod{-1.0}).code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(rejection(Rectangle{1.0, -0.5}).code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(rejection(Rectangle{std::numeric_limits<double>::quiet_NaN(), 1.0}).code ==
            ErrorCode::INVALID_GEOMETRY);
    REQUIRE(rejection(Pipe{std::numeric_limits<double>::infinity(), 0.1}).code ==
            ErrorCode::INVALID_GEOMETRY);
}

TEST_CASE("Sections without material are rejected", "[errors][validation]") {
    REQUIRE(rejection(Rod{0.0}).code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(rejection(Rectangle{0.0, 1.0}).code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(rejection(Pipe{1.0, 0.0}).code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(rejection(BoxBeam{2.0, 1.0, 0.0}).code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(rejection(IBeam{2.0, 1.0, 0.0, 0.0}).code == ErrorCode::INVALID_GEOMETRY);

    SectionError outline = rejection(BoxBeam{0.0, 0.0, 0.0});
    REQUIRE(outline.shape_kind == "BoxBeam");
}

TEST_CASE("Sections whose inner void closes up are accepted", "[errors][validation]") {
    REQUIRE_NOTHROW(StructuralShape::pipe(1.0, 1.0));
    REQUIRE_NOTHROW(StructuralShape::box_beam(2.0, 1.0, 0.5));
    REQUIRE_NOTHROW(StructuralShape::i_beam(2.0, 2.0, 1.0, 1.0));
    REQUIRE_NOTHROW(StructuralShape::i_beam(2.0, 2.0, 2.0, 0.1));
}

TEST_CASE("Factories validate like the constructor", "[errors][validation]") {
    REQUIRE_THROWS_AS(StructuralShape::pipe(1.0, 1.5), SectionException);
    REQUIRE_THROWS_AS(StructuralShape::i_beam(1.0, 1.0, 0.1, 0.6), SectionException);
    REQUIRE_THROWS_AS(StructuralShape::rod(-0.1), SectionException);
}

// =============================================================================
// Formatting
// =============================================================================

TEST_CASE("Error string carries code, shape and parameters", "[errors][format]") {
    try {
        StructuralShape::pipe(1.0, 2.0);
        FAIL("Expected SectionException");
    } catch (const SectionException& e) {
        std::string text = e.what();
        REQUIRE_THAT(text, ContainsSubstring("[INVALID_GEOMETRY] Pipe: "));
        REQUIRE_THAT(text, ContainsSubstring("thickness = 2.000000"));
        REQUIRE_THAT(text, ContainsSubstring("Suggestion: "));
        REQUIRE(text == e.error().to_string());
    }
}

TEST_CASE("Default error is OK", "[errors][format]") {
    SectionError ok;
    REQUIRE(ok.is_ok());
    REQUIRE_FALSE(ok.is_error());
    REQUIRE(ok.to_string() == "OK");
    REQUIRE(error_code_to_string(ErrorCode::DEGENERATE_COMPOSITE) == "DEGENERATE_COMPOSITE");
}

TEST_CASE("Warning string lists severity, code and members", "[warnings][format]") {
    SectionWarning warn = SectionWarning::no_positive_member({0, 2});

    std::string text = warn.to_string();
    REQUIRE_THAT(text, ContainsSubstring("[MEDIUM] [NO_POSITIVE_MEMBER]"));
    REQUIRE_THAT(text, ContainsSubstring("Members: 0, 2"));

    WarningList list;
    list.add(warn);
    list.add(SectionWarning::negative_net_area(-1.0));
    REQUIRE(list.summary() == "2 warning(s): 1 high, 1 medium, 0 low");
}
