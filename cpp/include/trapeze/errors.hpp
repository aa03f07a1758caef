/**
 * @file errors.hpp
 * @brief Structured error handling for Trapeze.
 *
 * The check engine never fails on malformed domain data (see warnings.hpp).
 * Errors are reserved for programming mistakes by the caller, such as an
 * inconsistent CheckConfig, and are reported in a machine-readable format.
 */

#ifndef TRAPEZE_ERRORS_HPP
#define TRAPEZE_ERRORS_HPP

#include <string>
#include <vector>
#include <map>

namespace trapeze {

/**
 * @brief Error codes for Trapeze caller errors.
 */
enum class ErrorCode {
    /// No error
    OK = 0,

    // === Configuration Errors (100-199) ===

    /// A CheckConfig field is outside its valid range
    INVALID_CONFIG = 100,

    /// Grade table is empty or contains a non-positive yield stress
    INVALID_GRADE_TABLE = 101,

    /// Capacity key list is empty
    EMPTY_CAPACITY_KEYS = 102,

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
        case ErrorCode::INVALID_CONFIG: return "INVALID_CONFIG";
        case ErrorCode::INVALID_GRADE_TABLE: return "INVALID_GRADE_TABLE";
        case ErrorCode::EMPTY_CAPACITY_KEYS: return "EMPTY_CAPACITY_KEYS";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information for Trapeze.
 *
 * Contains machine-readable error code, human-readable message,
 * the offending configuration fields and a suggested fix.
 */
struct TrapezeError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Names of the configuration fields involved
    std::vector<std::string> involved_fields;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    /**
     * @brief Default constructor creates OK status.
     */
    TrapezeError()
        : code(ErrorCode::OK), message("OK") {}

    /**
     * @brief Construct error with code and message.
     */
    TrapezeError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    bool is_ok() const { return code == ErrorCode::OK; }

    bool is_error() const { return code != ErrorCode::OK; }

    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;

        if (!involved_fields.empty()) {
            result += "\n  Involved fields: ";
            for (size_t i = 0; i < involved_fields.size(); ++i) {
                if (i > 0) result += ", ";
                result += involved_fields[i];
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

    // === Factory methods for common errors ===

    /**
     * @brief Create error for a configuration field outside its valid range.
     */
    static TrapezeError invalid_config(const std::string& field, const std::string& value,
                                       const std::string& expected) {
        TrapezeError err(ErrorCode::INVALID_CONFIG,
            "Invalid configuration value for " + field);
        err.involved_fields.push_back(field);
        err.details["value"] = value;
        err.details["expected"] = expected;
        err.suggestion = "Set " + field + " to " + expected + ".";
        return err;
    }

    /**
     * @brief Create error for an unusable grade table.
     */
    static TrapezeError invalid_grade_table(const std::string& reason) {
        TrapezeError err(ErrorCode::INVALID_GRADE_TABLE,
            "Invalid grade table: " + reason);
        err.involved_fields.push_back("grade_table");
        err.suggestion = "Provide at least one (label, yield stress) pair with a positive yield stress.";
        return err;
    }

    /**
     * @brief Create error for an empty capacity key list.
     */
    static TrapezeError empty_capacity_keys() {
        TrapezeError err(ErrorCode::EMPTY_CAPACITY_KEYS,
            "No capacity field names configured");
        err.involved_fields.push_back("capacity_keys");
        err.suggestion = "Restore the default list, e.g. tension_capacity_N, capacity_N, tension_N.";
        return err;
    }
};

}  // namespace trapeze

#endif  // TRAPEZE_ERRORS_HPP
