#pragma once

#include "trapeze/catalog.hpp"
#include "trapeze/check_config.hpp"
#include "trapeze/warnings.hpp"

#include <string>

namespace trapeze {

/**
 * @brief Where a resolved property value came from
 */
enum class PropertyStatus {
    Present,  ///< Positive numeric value taken from the profile record
    Missing,  ///< Field absent or empty, default substituted
    Invalid   ///< Field non-numeric, zero or negative, default substituted
};

/**
 * @brief Convert PropertyStatus to string
 */
inline std::string property_status_to_string(PropertyStatus status) {
    switch (status) {
        case PropertyStatus::Present: return "present";
        case PropertyStatus::Missing: return "missing";
        case PropertyStatus::Invalid: return "invalid";
        default: return "unknown";
    }
}

/**
 * @brief Section and material properties of the bracket channel
 *
 * Units: E [N/mm²], Ixx [mm⁴], Zxx [mm³].
 *
 * Values are always positive. When the profile lacks a property the
 * CheckConfig default is used (E = 200000, Ixx = Zxx = 1) and the status
 * records why. The evaluator fails the bending check for any status other
 * than Present and computes no deflection from a substituted E or Ixx.
 */
struct MaterialProperties {
    double E_N_per_mm2 = 200000.0;  ///< Young's modulus [N/mm²]
    double Ixx_mm4 = 1.0;           ///< Second moment of area, strong axis [mm⁴]
    double Zxx_mm3 = 1.0;           ///< Elastic section modulus, strong axis [mm³]
    std::string grade_label;        ///< Material grade text, e.g. "S355"

    PropertyStatus E_status = PropertyStatus::Missing;
    PropertyStatus Ixx_status = PropertyStatus::Missing;
    PropertyStatus Zxx_status = PropertyStatus::Missing;

    /**
     * @brief True if every property came from the profile record
     */
    bool is_complete() const {
        return E_status == PropertyStatus::Present &&
               Ixx_status == PropertyStatus::Present &&
               Zxx_status == PropertyStatus::Present;
    }
};

/**
 * @brief Resolve section properties from a profile record
 *
 * Reads E_N_per_mm2, Ixx_mm4, Zxx_mm3 and the grade (material_grade or
 * grade). Adds a MISSING_SECTION_PROPERTY warning per substituted value.
 */
MaterialProperties resolve_material_properties(const Record& profile,
                                               const CheckConfig& config,
                                               WarningList& warnings);

/**
 * @brief Resolve section properties without collecting warnings
 */
MaterialProperties resolve_material_properties(const Record& profile,
                                               const CheckConfig& config = CheckConfig());

} // namespace trapeze
