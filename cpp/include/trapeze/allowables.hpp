#pragma once

#include "trapeze/catalog.hpp"
#include "trapeze/check_config.hpp"

#include <optional>
#include <string>

namespace trapeze {

/**
 * @brief Yield stress for a grade label [N/mm²]
 *
 * Substring match against CheckConfig::grade_table in table order
 * (355, 275, 235 by default), so "S355JR" and "Grade 355" both match 355.
 *
 * @return Yield stress, or std::nullopt if no entry matches
 */
std::optional<double> yield_stress(const std::string& grade_label,
                                   const CheckConfig& config = CheckConfig());

/**
 * @brief Allowable bending stress [N/mm²]
 *
 * working_stress_factor * yield, where unrecognized grades use
 * default_yield_N_per_mm2. With the defaults: 0.6 * 235 = 141.
 *
 * This is a simple working-stress rule, not a code-calibrated resistance.
 */
double allowable_stress(const std::string& grade_label,
                        const CheckConfig& config = CheckConfig());

/**
 * @brief Deflection limit span / deflection_ratio [mm]
 *
 * Zero for a zero or unspecified span; the deflection check is skipped
 * when the limit is not positive.
 */
double deflection_limit(double span_mm, const CheckConfig& config = CheckConfig());

/**
 * @brief Deflection limit span / ratio [mm] for an explicit ratio
 *
 * Zero for a non-positive span or ratio.
 */
double deflection_limit(double span_mm, double ratio);

/**
 * @brief Deflection ratio for a profile
 *
 * The profile's deflection_limit_ratio when use_catalog_deflection_ratio is
 * set and the value is positive, otherwise config.deflection_ratio.
 */
double deflection_ratio(const Record& profile, const CheckConfig& config = CheckConfig());

} // namespace trapeze
