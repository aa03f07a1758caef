#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace trapeze {

/**
 * @brief Dynamically typed value of one persisted or catalog field
 *
 * Mirrors what arrives from user-editable project state and from imported
 * parts catalogs: a field may be absent (monostate), a number, a flag or
 * text. Numbers are stored as double regardless of their source type.
 *
 * double precedes bool so that integer values coming through the Python
 * bindings resolve to numbers, not flags.
 */
using FieldValue = std::variant<std::monostate, double, bool, std::string>;

/**
 * @brief Named fields of one catalog row or structured load entry
 */
using Record = std::map<std::string, FieldValue>;

/**
 * @brief Interpret a field as a finite number
 *
 * Numbers are returned as-is when finite. Strings are accepted if the whole
 * trimmed text parses as a finite decimal (e.g. "1500" or " 2.5e3 ").
 * Flags, empty fields and anything else yield std::nullopt.
 */
std::optional<double> as_number(const FieldValue& value);

/**
 * @brief Interpret a field as text
 *
 * Strings are returned as-is; numbers are rendered in shortest decimal form
 * (so a numeric id 42 reads back as "42"). Other values yield std::nullopt.
 */
std::optional<std::string> as_string(const FieldValue& value);

/**
 * @brief Look up the first numeric field among candidate keys
 *
 * Keys are tried in order; the first key that is present in the record and
 * holds a numeric value wins. Keys holding non-numeric data are passed over.
 */
std::optional<double> find_number(const Record& record, const std::vector<std::string>& keys);

/**
 * @brief Look up the first non-empty text field among candidate keys
 */
std::optional<std::string> find_string(const Record& record, const std::vector<std::string>& keys);

} // namespace trapeze
