/**
 * @file errors.hpp
 * @brief Structured error handling for xsection.
 *
 * This file defines error codes and error structures for reporting
 * invalid section definitions in a machine-readable format. Errors are
 * raised as SectionException, which carries the structured SectionError.
 */

#ifndef XSECTION_ERRORS_HPP
#define XSECTION_ERRORS_HPP

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace xsection {

/**
 * @brief Error codes for xsection failures.
 *
 * These codes provide machine-readable error identification.
 * Each code corresponds to a specific type of failure.
 */
enum class ErrorCode {
    /// No error
    OK = 0,

    // === Geometry Errors (100-199) ===

    /// Shape dimensions are negative, non-finite, or enclose no material
    INVALID_GEOMETRY = 100,

    // === Composite Errors (200-299) ===

    /// Composite has zero net area, so its centroid is undefined
    DEGENERATE_COMPOSITE = 200,

    // === Generic Errors (900-999) ===

    /// Unknown or unspecified error
    UNKNOWN_ERROR = 999
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_GEOMETRY: return "INVALID_GEOMETRY";
        case ErrorCode::DEGENERATE_COMPOSITE: return "DEGENERATE_COMPOSITE";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information for xsection.
 *
 * Contains machine-readable error code, human-readable message,
 * and the offending parameter values for diagnostics.
 */
struct SectionError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Shape kind involved in the error (e.g. "IBeam"), empty for composites
    std::string shape_kind;

    /// Offending parameter values, keyed by parameter name
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    /**
     * @brief Default constructor creates OK status.
     */
    SectionError()
        : code(ErrorCode::OK), message("OK") {}

    /**
     * @brief Construct error with code and message.
     */
    SectionError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    bool is_ok() const { return code == ErrorCode::OK; }

    bool is_error() const { return code != ErrorCode::OK; }

    /**
     * @brief Get string representation of the error code.
     */
    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     *
     * Example:
     *   [INVALID_GEOMETRY] Pipe: thickness must not exceed outer_radius
     *     outer_radius = 1.000000
     *     thickness = 2.000000
     *     Suggestion: ...
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] ";
        if (!shape_kind.empty()) {
            result += shape_kind + ": ";
        }
        result += message;

        for (const auto& [key, value] : details) {
            result += "\n  " + key + " = " + value;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    /**
     * @brief Create error for a geometrically invalid primitive shape.
     *
     * @param shape_kind Variant name, e.g. "BoxBeam"
     * @param reason Which constraint was violated
     * @param parameters All dimensions of the shape, keyed by name
     */
    static SectionError invalid_geometry(const std::string& shape_kind,
                                         const std::string& reason,
                                         const std::map<std::string, double>& parameters) {
        SectionError err(ErrorCode::INVALID_GEOMETRY, reason);
        err.shape_kind = shape_kind;
        for (const auto& [name, value] : parameters) {
            err.details[name] = std::to_string(value);
        }
        err.suggestion = "Wall, web and flange thicknesses must be smaller than the "
                         "dimension they are subtracted from, and all dimensions must be "
                         "non-negative.";
        return err;
    }

    /**
     * @brief Create error for a composite whose net signed area is zero.
     *
     * @param net_area Signed sum of member areas [m²]
     * @param gross_area Sum of absolute member areas [m²]
     * @param member_count Number of members in the composite
     */
    static SectionError degenerate_composite(double net_area, double gross_area,
                                             std::size_t member_count) {
        SectionError err(ErrorCode::DEGENERATE_COMPOSITE,
            "Composite has zero net area; centroid is undefined");
        err.details["net_area"] = std::to_string(net_area);
        err.details["gross_area"] = std::to_string(gross_area);
        err.details["members"] = std::to_string(member_count);
        err.suggestion = "Add at least one shape, and check that subtracted shapes do not "
                         "cancel all added material.";
        return err;
    }
};

/**
 * @brief Exception thrown for section definition and evaluation failures.
 *
 * what() returns the formatted SectionError::to_string() text.
 */
class SectionException : public std::runtime_error {
public:
    explicit SectionException(SectionError error)
        : std::runtime_error(error.to_string()), error_(std::move(error)) {}

    const SectionError& error() const noexcept { return error_; }

    ErrorCode code() const noexcept { return error_.code; }

private:
    SectionError error_;
};

}  // namespace xsection

#endif  // XSECTION_ERRORS_HPP
