#include "trapeze/check_config.hpp"

#include <cmath>

namespace trapeze {

namespace {

bool positive(double value) {
    return std::isfinite(value) && value > 0.0;
}

} // namespace

TrapezeError CheckConfig::validate() const {
    if (!positive(gravity)) {
        return TrapezeError::invalid_config("gravity", std::to_string(gravity),
                                            "a positive value [m/s²]");
    }
    if (!positive(working_stress_factor)) {
        return TrapezeError::invalid_config("working_stress_factor",
                                            std::to_string(working_stress_factor),
                                            "a positive factor");
    }
    if (!positive(deflection_ratio)) {
        return TrapezeError::invalid_config("deflection_ratio", std::to_string(deflection_ratio),
                                            "a positive ratio");
    }
    if (!positive(default_yield_N_per_mm2)) {
        return TrapezeError::invalid_config("default_yield_N_per_mm2",
                                            std::to_string(default_yield_N_per_mm2),
                                            "a positive stress [N/mm²]");
    }
    if (grade_table.empty()) {
        return TrapezeError::invalid_grade_table("table is empty");
    }
    for (const auto& entry : grade_table) {
        if (entry.token.empty()) {
            return TrapezeError::invalid_grade_table("empty grade token");
        }
        if (!positive(entry.yield_N_per_mm2)) {
            return TrapezeError::invalid_grade_table("non-positive yield stress for " + entry.token);
        }
    }
    if (!positive(default_E_N_per_mm2) || !positive(default_Ixx_mm4) || !positive(default_Zxx_mm3)) {
        TrapezeError err = TrapezeError::invalid_config("default section properties",
                                                        "non-positive", "positive values");
        err.involved_fields = {"default_E_N_per_mm2", "default_Ixx_mm4", "default_Zxx_mm3"};
        return err;
    }
    if (capacity_keys.empty()) {
        return TrapezeError::empty_capacity_keys();
    }
    if (supports_per_reaction != 1 && supports_per_reaction != 2) {
        return TrapezeError::invalid_config("supports_per_reaction",
                                            std::to_string(supports_per_reaction), "1 or 2");
    }
    if (!positive(sample_divisions) || !positive(min_sample_step_mm) ||
        !(max_sample_step_mm >= min_sample_step_mm) || !std::isfinite(max_sample_step_mm)) {
        TrapezeError err = TrapezeError::invalid_config("sampling",
                                                        std::to_string(min_sample_step_mm) + ".." +
                                                        std::to_string(max_sample_step_mm),
                                                        "positive divisions and 0 < min step <= max step");
        err.involved_fields = {"sample_divisions", "min_sample_step_mm", "max_sample_step_mm"};
        return err;
    }
    return TrapezeError();
}

} // namespace trapeze
