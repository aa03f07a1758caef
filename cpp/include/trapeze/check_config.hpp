#pragma once

#include "trapeze/errors.hpp"

#include <string>
#include <utility>
#include <vector>

namespace trapeze {

/**
 * @brief Entry of the material grade table
 *
 * A grade label matches when it contains `token` as a substring.
 */
struct GradeEntry {
    std::string token;        ///< Substring to look for, e.g. "355"
    double yield_N_per_mm2;   ///< Yield stress for a match [N/mm²]
};

/**
 * @brief Configuration for a bracket check
 *
 * All rules and constants used by the check engine. The defaults reproduce
 * the working-stress placeholder rules used by the service layer:
 * allowable bending stress = 0.6 * yield, deflection limit = span / 200,
 * one rod and one anchor per support.
 *
 * Units: forces [N], lengths [mm], stresses [N/mm²].
 */
struct CheckConfig {
    double gravity = 9.81;                 ///< Converts load [N] to mass [kg]
    double working_stress_factor = 0.6;    ///< Allowable stress / yield stress
    double deflection_ratio = 200.0;       ///< Deflection limit = span / ratio
    double default_yield_N_per_mm2 = 235.0;  ///< Yield stress of unrecognized grades

    /// Checked in order, first substring match wins
    std::vector<GradeEntry> grade_table = {
        {"355", 355.0},
        {"275", 275.0},
        {"235", 235.0}
    };

    // Section property defaults. Ixx = Zxx = 1 makes a missing section fail
    // the bending check instead of passing it.
    double default_E_N_per_mm2 = 200000.0;
    double default_Ixx_mm4 = 1.0;
    double default_Zxx_mm3 = 1.0;

    /// Rod/anchor record fields holding tension capacity [N], tried in order
    std::vector<std::string> capacity_keys = {
        "tension_capacity_N",
        "capacity_N",
        "tension_N",
        "allowable_tension_N"
    };

    /// Rods (and anchors) sharing one support reaction: 1 or 2
    int supports_per_reaction = 1;

    // Deflection sampling: step = clamp(span / sample_divisions, min, max)
    double sample_divisions = 120.0;
    double min_sample_step_mm = 10.0;
    double max_sample_step_mm = 50.0;

    /// Use the profile's allowable_stress_N_per_mm2 when it is positive
    bool use_catalog_allowable_stress = false;

    /// Use the profile's deflection_limit_ratio when it is positive
    bool use_catalog_deflection_ratio = false;

    /// Multiply rod/anchor capacity by the record's fire_reduction_factor
    bool apply_fire_reduction = false;

    /**
     * @brief Check that all fields are usable
     * @return TrapezeError with code OK, or the first problem found
     */
    TrapezeError validate() const;
};

} // namespace trapeze
