#include "trapeze/allowables.hpp"

#include <cmath>

namespace trapeze {

std::optional<double> yield_stress(const std::string& grade_label, const CheckConfig& config) {
    for (const auto& entry : config.grade_table) {
        if (!entry.token.empty() && grade_label.find(entry.token) != std::string::npos) {
            return entry.yield_N_per_mm2;
        }
    }
    return std::nullopt;
}

double allowable_stress(const std::string& grade_label, const CheckConfig& config) {
    const double fy = yield_stress(grade_label, config).value_or(config.default_yield_N_per_mm2);
    return config.working_stress_factor * fy;
}

double deflection_limit(double span_mm, const CheckConfig& config) {
    return deflection_limit(span_mm, config.deflection_ratio);
}

double deflection_limit(double span_mm, double ratio) {
    if (!std::isfinite(span_mm) || span_mm <= 0.0 || !(ratio > 0.0)) {
        return 0.0;
    }
    return span_mm / ratio;
}

double deflection_ratio(const Record& profile, const CheckConfig& config) {
    if (config.use_catalog_deflection_ratio) {
        auto ratio = find_number(profile, {"deflection_limit_ratio"});
        if (ratio && *ratio > 0.0) {
            return *ratio;
        }
    }
    return config.deflection_ratio;
}

} // namespace trapeze
