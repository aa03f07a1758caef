#include "trapeze/section_properties.hpp"

namespace trapeze {

namespace {

PropertyStatus read_positive(const Record& record, const std::string& key,
                             double default_value, double& out) {
    out = default_value;

    auto it = record.find(key);
    if (it == record.end() || std::holds_alternative<std::monostate>(it->second)) {
        return PropertyStatus::Missing;
    }
    if (const auto* s = std::get_if<std::string>(&it->second)) {
        if (s->find_first_not_of(" \t\r\n") == std::string::npos) {
            return PropertyStatus::Missing;
        }
    }

    auto value = as_number(it->second);
    if (!value || *value <= 0.0) {
        return PropertyStatus::Invalid;
    }
    out = *value;
    return PropertyStatus::Present;
}

MaterialProperties resolve(const Record& profile, const CheckConfig& config,
                           WarningList* warnings) {
    MaterialProperties props;
    props.E_status = read_positive(profile, "E_N_per_mm2",
                                   config.default_E_N_per_mm2, props.E_N_per_mm2);
    props.Ixx_status = read_positive(profile, "Ixx_mm4",
                                     config.default_Ixx_mm4, props.Ixx_mm4);
    props.Zxx_status = read_positive(profile, "Zxx_mm3",
                                     config.default_Zxx_mm3, props.Zxx_mm3);

    auto grade = find_string(profile, {"material_grade", "grade"});
    props.grade_label = grade ? *grade : "";

    if (warnings) {
        if (props.E_status != PropertyStatus::Present) {
            warnings->add(TrapezeWarning::missing_section_property("E_N_per_mm2",
                                                                   props.E_N_per_mm2));
        }
        if (props.Ixx_status != PropertyStatus::Present) {
            warnings->add(TrapezeWarning::missing_section_property("Ixx_mm4", props.Ixx_mm4));
        }
        if (props.Zxx_status != PropertyStatus::Present) {
            warnings->add(TrapezeWarning::missing_section_property("Zxx_mm3", props.Zxx_mm3));
        }
    }
    return props;
}

} // namespace

MaterialProperties resolve_material_properties(const Record& profile,
                                               const CheckConfig& config,
                                               WarningList& warnings) {
    return resolve(profile, config, &warnings);
}

MaterialProperties resolve_material_properties(const Record& profile,
                                               const CheckConfig& config) {
    return resolve(profile, config, nullptr);
}

} // namespace trapeze
