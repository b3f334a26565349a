/**
 * @file warnings.hpp
 * @brief Warning system for questionable composite sections.
 *
 * Warnings indicate sections whose properties can be computed but
 * which probably do not describe what the caller intended.
 */

#ifndef XSECTION_WARNINGS_HPP
#define XSECTION_WARNINGS_HPP

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace xsection {

/**
 * @brief Warning codes for questionable composite sections.
 */
enum class WarningCode {
    // === Area Warnings (100-199) ===

    /// Net area is tiny compared to the gross area of the members
    NEAR_ZERO_AREA = 100,

    /// Subtracted members outweigh added members
    NEGATIVE_NET_AREA = 101,

    // === Composition Warnings (200-299) ===

    /// Composite has members but none of them are added
    NO_POSITIVE_MEMBER = 200,

    /// A subtracted member reaches outside the outline of the added members
    HOLE_OUTSIDE_OUTLINE = 201
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Minor issue, likely acceptable
    Low = 0,

    /// Potentially problematic, review recommended
    Medium = 1,

    /// Likely indicates a modeling error
    High = 2
};

/**
 * @brief Convert warning code to string representation.
 */
inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::NEAR_ZERO_AREA: return "NEAR_ZERO_AREA";
        case WarningCode::NEGATIVE_NET_AREA: return "NEGATIVE_NET_AREA";
        case WarningCode::NO_POSITIVE_MEMBER: return "NO_POSITIVE_MEMBER";
        case WarningCode::HOLE_OUTSIDE_OUTLINE: return "HOLE_OUTSIDE_OUTLINE";
        default: return "UNKNOWN_WARNING";
    }
}

/**
 * @brief Convert severity to string representation.
 */
inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning information for xsection.
 */
struct SectionWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Indices of the composite members involved, in insertion order
    std::vector<std::size_t> involved_members;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the warning
    std::string suggestion;

    SectionWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        if (!involved_members.empty()) {
            result += "\n  Members: ";
            for (std::size_t i = 0; i < involved_members.size(); ++i) {
                if (i > 0) result += ", ";
                result += std::to_string(involved_members[i]);
            }
        }

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common warnings ===

    /**
     * @brief Create warning for a net area that nearly cancels out.
     */
    static SectionWarning near_zero_area(double net_area, double gross_area) {
        SectionWarning warn(WarningCode::NEAR_ZERO_AREA, WarningSeverity::High,
            "Net area is near zero compared to the member areas");
        warn.details["net_area"] = std::to_string(net_area) + " m²";
        warn.details["gross_area"] = std::to_string(gross_area) + " m²";
        warn.suggestion = "Centroid and recentred moments will be dominated by round-off. "
                          "Check that subtracted shapes are not duplicates of added ones";
        return warn;
    }

    /**
     * @brief Create warning for a composite with more removed than added material.
     */
    static SectionWarning negative_net_area(double net_area) {
        SectionWarning warn(WarningCode::NEGATIVE_NET_AREA, WarningSeverity::High,
            "Subtracted shapes remove more area than was added");
        warn.details["net_area"] = std::to_string(net_area) + " m²";
        warn.suggestion = "Check that holes are smaller than the shapes they are cut from";
        return warn;
    }

    /**
     * @brief Create warning for a composite built only from subtractions.
     */
    static SectionWarning no_positive_member(std::vector<std::size_t> members) {
        SectionWarning warn(WarningCode::NO_POSITIVE_MEMBER, WarningSeverity::Medium,
            "Composite has no added members");
        warn.involved_members = std::move(members);
        warn.suggestion = "Use add() for the enclosing shape and sub() for the holes";
        return warn;
    }

    /**
     * @brief Create warning for holes extending past the added material.
     *
     * Low severity: notches cut at an edge are legitimate, but the removed
     * area then counts material that was never there.
     */
    static SectionWarning hole_outside_outline(std::vector<std::size_t> members) {
        SectionWarning warn(WarningCode::HOLE_OUTSIDE_OUTLINE, WarningSeverity::Low,
            "Subtracted shapes extend beyond the bounding box of the added shapes");
        warn.involved_members = std::move(members);
        warn.suggestion = "Check hole positions, or clip the hole to the section outline";
        return warn;
    }
};

/**
 * @brief Collection of warnings from composite checks.
 */
class WarningList {
public:
    /// List of warnings
    std::vector<SectionWarning> warnings;

    void add(const SectionWarning& warning) {
        warnings.push_back(warning);
    }

    void add(SectionWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    bool has_warnings() const { return !warnings.empty(); }

    std::size_t count() const { return warnings.size(); }

    /**
     * @brief Get count of warnings by severity.
     */
    std::size_t count_by_severity(WarningSeverity severity) const {
        std::size_t count = 0;
        for (const auto& w : warnings) {
            if (w.severity == severity) ++count;
        }
        return count;
    }

    /**
     * @brief Check whether a warning with the given code is present.
     */
    bool contains(WarningCode code) const {
        for (const auto& w : warnings) {
            if (w.code == code) return true;
        }
        return false;
    }

    /**
     * @brief Get formatted summary string.
     */
    std::string summary() const {
        if (warnings.empty()) return "No warnings";

        std::string result = std::to_string(warnings.size()) + " warning(s): ";
        result += std::to_string(count_by_severity(WarningSeverity::High)) + " high, ";
        result += std::to_string(count_by_severity(WarningSeverity::Medium)) + " medium, ";
        result += std::to_string(count_by_severity(WarningSeverity::Low)) + " low";
        return result;
    }
};

}  // namespace xsection

#endif  // XSECTION_WARNINGS_HPP
