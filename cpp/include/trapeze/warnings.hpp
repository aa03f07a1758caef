/**
 * @file warnings.hpp
 * @brief Warning system for degraded input data.
 *
 * Warnings indicate input data that the engine could not use as given.
 * They never stop a check; the engine substitutes a conservative value
 * and records what it did here.
 */

#ifndef TRAPEZE_WARNINGS_HPP
#define TRAPEZE_WARNINGS_HPP

#include <string>
#include <vector>
#include <map>
#include <utility>

namespace trapeze {

/**
 * @brief Warning codes for degraded input data.
 */
enum class WarningCode {
    // === Load Warnings (100-199) ===

    /// Load entry has the wrong shape or non-numeric fields
    MALFORMED_LOAD = 100,

    /// Load magnitude is zero or negative
    NON_POSITIVE_LOAD = 101,

    /// Load position outside [0, span] was clamped
    LOAD_CLAMPED = 102,

    // === Geometry Warnings (200-299) ===

    /// Span is zero, negative or not a number
    DEGENERATE_SPAN = 200,

    /// Tier count outside 1..3 was clamped
    TIER_COUNT_CLAMPED = 201,

    /// Span too long for the configured step, deflection sampled coarser
    SAMPLING_COARSENED = 202,

    // === Property Warnings (300-399) ===

    /// Section or material property missing or invalid, default used
    MISSING_SECTION_PROPERTY = 300,

    /// Material grade not found in grade table, default yield used
    UNRECOGNIZED_GRADE = 301,

    // === Hardware Warnings (400-499) ===

    /// Rod or anchor record carries no usable tension capacity
    MISSING_CAPACITY = 400,

    /// Selected rod is smaller than the minimum size from the rod table
    ROD_BELOW_MINIMUM = 401
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Minor issue, likely acceptable
    Low = 0,

    /// Potentially problematic, review recommended
    Medium = 1,

    /// Result is driven by substituted data
    High = 2
};

/**
 * @brief Convert warning code to string representation.
 */
inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::MALFORMED_LOAD: return "MALFORMED_LOAD";
        case WarningCode::NON_POSITIVE_LOAD: return "NON_POSITIVE_LOAD";
        case WarningCode::LOAD_CLAMPED: return "LOAD_CLAMPED";
        case WarningCode::DEGENERATE_SPAN: return "DEGENERATE_SPAN";
        case WarningCode::TIER_COUNT_CLAMPED: return "TIER_COUNT_CLAMPED";
        case WarningCode::SAMPLING_COARSENED: return "SAMPLING_COARSENED";
        case WarningCode::MISSING_SECTION_PROPERTY: return "MISSING_SECTION_PROPERTY";
        case WarningCode::UNRECOGNIZED_GRADE: return "UNRECOGNIZED_GRADE";
        case WarningCode::MISSING_CAPACITY: return "MISSING_CAPACITY";
        case WarningCode::ROD_BELOW_MINIMUM: return "ROD_BELOW_MINIMUM";
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
 * @brief Structured warning information for Trapeze.
 */
struct TrapezeWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Tier the warning refers to (0 if not tier specific)
    int tier = 0;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the warning
    std::string suggestion;

    TrapezeWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        if (tier > 0) {
            result += "\n  Tier: " + std::to_string(tier);
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
     * @brief Create warning for a load entry that could not be read.
     */
    static TrapezeWarning malformed_load(int tier, size_t index, const std::string& reason) {
        TrapezeWarning warn(WarningCode::MALFORMED_LOAD, WarningSeverity::Medium,
            "Load entry skipped: " + reason);
        warn.tier = tier;
        warn.details["entry"] = std::to_string(index + 1);
        warn.suggestion = "Enter the load as a record with numeric N and x_mm fields";
        return warn;
    }

    /**
     * @brief Create warning for a zero or negative load magnitude.
     */
    static TrapezeWarning non_positive_load(int tier, size_t index, double magnitude) {
        TrapezeWarning warn(WarningCode::NON_POSITIVE_LOAD, WarningSeverity::Low,
            "Load with non-positive magnitude ignored");
        warn.tier = tier;
        warn.details["entry"] = std::to_string(index + 1);
        warn.details["N"] = std::to_string(magnitude);
        return warn;
    }

    /**
     * @brief Create warning for a load position moved onto the span.
     */
    static TrapezeWarning load_clamped(int tier, size_t index, double x_mm, double span_mm) {
        TrapezeWarning warn(WarningCode::LOAD_CLAMPED, WarningSeverity::Medium,
            "Load position outside span clamped to nearest support");
        warn.tier = tier;
        warn.details["entry"] = std::to_string(index + 1);
        warn.details["x_mm"] = std::to_string(x_mm);
        warn.details["span_mm"] = std::to_string(span_mm);
        warn.suggestion = "Check the load position against the bracket span";
        return warn;
    }

    /**
     * @brief Create warning for an unusable span.
     */
    static TrapezeWarning degenerate_span(double span_mm) {
        TrapezeWarning warn(WarningCode::DEGENERATE_SPAN, WarningSeverity::High,
            "Span is not positive; span-dependent results are zero");
        warn.details["span_mm"] = std::to_string(span_mm);
        warn.suggestion = "Enter the distance between the drop rods";
        return warn;
    }

    /**
     * @brief Create warning for a tier count outside the supported range.
     */
    static TrapezeWarning tier_count_clamped(int requested, int used) {
        TrapezeWarning warn(WarningCode::TIER_COUNT_CLAMPED, WarningSeverity::Medium,
            "Tier count clamped to supported range 1..3");
        warn.details["requested"] = std::to_string(requested);
        warn.details["used"] = std::to_string(used);
        return warn;
    }

    /**
     * @brief Create warning for a span sampled with a coarser step.
     */
    static TrapezeWarning sampling_coarsened(double span_mm, double step_mm) {
        TrapezeWarning warn(WarningCode::SAMPLING_COARSENED, WarningSeverity::Medium,
            "Span too long for the sampling step; deflection sampled coarser");
        warn.details["span_mm"] = std::to_string(span_mm);
        warn.details["step_mm"] = std::to_string(step_mm);
        warn.suggestion = "Check the span units; bracket spans are entered in mm";
        return warn;
    }

    /**
     * @brief Create warning for a missing or invalid section property.
     */
    static TrapezeWarning missing_section_property(const std::string& property_name,
                                                   double default_value) {
        TrapezeWarning warn(WarningCode::MISSING_SECTION_PROPERTY, WarningSeverity::High,
            "Profile property missing or invalid, default substituted");
        warn.details["property"] = property_name;
        warn.details["default"] = std::to_string(default_value);
        warn.suggestion = "Complete the profile record in the parts library";
        return warn;
    }

    /**
     * @brief Create warning for an unrecognized material grade.
     */
    static TrapezeWarning unrecognized_grade(const std::string& grade_label, double default_yield) {
        TrapezeWarning warn(WarningCode::UNRECOGNIZED_GRADE, WarningSeverity::Low,
            "Material grade not recognized, default yield stress used");
        warn.details["grade"] = grade_label.empty() ? "(none)" : grade_label;
        warn.details["yield_N_per_mm2"] = std::to_string(default_yield);
        return warn;
    }

    /**
     * @brief Create warning for a rod or anchor record without capacity data.
     */
    static TrapezeWarning missing_capacity(const std::string& category) {
        TrapezeWarning warn(WarningCode::MISSING_CAPACITY, WarningSeverity::Medium,
            "No tension capacity for " + category + "; check skipped");
        warn.details["check"] = category;
        warn.suggestion = "Add a tension capacity to the " + category + " record";
        return warn;
    }

    /**
     * @brief Create warning for a selected rod below the tabulated minimum.
     */
    static TrapezeWarning rod_below_minimum(const std::string& selected, const std::string& minimum) {
        TrapezeWarning warn(WarningCode::ROD_BELOW_MINIMUM, WarningSeverity::High,
            "Selected rod " + selected + " below minimum " + minimum);
        warn.details["selected"] = selected;
        warn.details["minimum"] = minimum;
        warn.suggestion = "Select rod size " + minimum + " or larger";
        return warn;
    }
};

/**
 * @brief Collection of warnings collected during a check.
 */
class WarningList {
public:
    /// List of warnings
    std::vector<TrapezeWarning> warnings;

    void add(const TrapezeWarning& warning) {
        warnings.push_back(warning);
    }

    void add(TrapezeWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

    /**
     * @brief Get count of warnings by severity.
     */
    size_t count_by_severity(WarningSeverity severity) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.severity == severity) ++count;
        }
        return count;
    }

    /**
     * @brief Get count of warnings with the given code.
     */
    size_t count_by_code(WarningCode code) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.code == code) ++count;
        }
        return count;
    }

    /**
     * @brief Get all warnings with given severity or higher.
     */
    std::vector<TrapezeWarning> get_by_min_severity(WarningSeverity min_severity) const {
        std::vector<TrapezeWarning> result;
        for (const auto& w : warnings) {
            if (static_cast<int>(w.severity) >= static_cast<int>(min_severity)) {
                result.push_back(w);
            }
        }
        return result;
    }

    void clear() { warnings.clear(); }

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

}  // namespace trapeze

#endif  // TRAPEZE_WARNINGS_HPP
