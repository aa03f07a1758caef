#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "trapeze/errors.hpp"
#include "trapeze/warnings.hpp"
#include "trapeze/catalog.hpp"
#include "trapeze/check_config.hpp"
#include "trapeze/load_model.hpp"
#include "trapeze/beam_statics.hpp"
#include "trapeze/deflection.hpp"
#include "trapeze/section_properties.hpp"
#include "trapeze/allowables.hpp"
#include "trapeze/rod_sizing.hpp"
#include "trapeze/snapshot.hpp"
#include "trapeze/check_result.hpp"
#include "trapeze/check_evaluator.hpp"

namespace py = pybind11;

/**
 * Trapeze C++ Python bindings module.
 * Exposes the bracket check engine to the Python service layer.
 */
PYBIND11_MODULE(_trapeze_cpp, m) {
    m.doc() = "Trapeze C++ core module - trapeze bracket structural checks";

    m.attr("__version__") = "0.1.0";

    // ========================================================================
    // Diagnostics
    // ========================================================================

    py::enum_<trapeze::ErrorCode>(m, "ErrorCode", "Error codes for caller errors")
        .value("OK", trapeze::ErrorCode::OK)
        .value("INVALID_CONFIG", trapeze::ErrorCode::INVALID_CONFIG)
        .value("INVALID_GRADE_TABLE", trapeze::ErrorCode::INVALID_GRADE_TABLE)
        .value("EMPTY_CAPACITY_KEYS", trapeze::ErrorCode::EMPTY_CAPACITY_KEYS)
        .value("UNKNOWN_ERROR", trapeze::ErrorCode::UNKNOWN_ERROR)
        .export_values();

    py::class_<trapeze::TrapezeError>(m, "TrapezeError",
        "Structured error with code, message and suggested fix")
        .def(py::init<>())
        .def_readonly("code", &trapeze::TrapezeError::code)
        .def_readonly("message", &trapeze::TrapezeError::message)
        .def_readonly("involved_fields", &trapeze::TrapezeError::involved_fields)
        .def_readonly("details", &trapeze::TrapezeError::details)
        .def_readonly("suggestion", &trapeze::TrapezeError::suggestion)
        .def("is_ok", &trapeze::TrapezeError::is_ok)
        .def("is_error", &trapeze::TrapezeError::is_error)
        .def("code_string", &trapeze::TrapezeError::code_string)
        .def("to_string", &trapeze::TrapezeError::to_string)
        .def("__str__", &trapeze::TrapezeError::to_string);

    py::enum_<trapeze::WarningCode>(m, "WarningCode", "Warning codes for degraded input data")
        .value("MALFORMED_LOAD", trapeze::WarningCode::MALFORMED_LOAD)
        .value("NON_POSITIVE_LOAD", trapeze::WarningCode::NON_POSITIVE_LOAD)
        .value("LOAD_CLAMPED", trapeze::WarningCode::LOAD_CLAMPED)
        .value("DEGENERATE_SPAN", trapeze::WarningCode::DEGENERATE_SPAN)
        .value("TIER_COUNT_CLAMPED", trapeze::WarningCode::TIER_COUNT_CLAMPED)
        .value("SAMPLING_COARSENED", trapeze::WarningCode::SAMPLING_COARSENED)
        .value("MISSING_SECTION_PROPERTY", trapeze::WarningCode::MISSING_SECTION_PROPERTY)
        .value("UNRECOGNIZED_GRADE", trapeze::WarningCode::UNRECOGNIZED_GRADE)
        .value("MISSING_CAPACITY", trapeze::WarningCode::MISSING_CAPACITY)
        .value("ROD_BELOW_MINIMUM", trapeze::WarningCode::ROD_BELOW_MINIMUM)
        .export_values();

    py::enum_<trapeze::WarningSeverity>(m, "WarningSeverity")
        .value("Low", trapeze::WarningSeverity::Low)
        .value("Medium", trapeze::WarningSeverity::Medium)
        .value("High", trapeze::WarningSeverity::High)
        .export_values();

    py::class_<trapeze::TrapezeWarning>(m, "TrapezeWarning",
        "Structured warning about substituted or skipped input data")
        .def_readonly("code", &trapeze::TrapezeWarning::code)
        .def_readonly("severity", &trapeze::TrapezeWarning::severity)
        .def_readonly("message", &trapeze::TrapezeWarning::message)
        .def_readonly("tier", &trapeze::TrapezeWarning::tier)
        .def_readonly("details", &trapeze::TrapezeWarning::details)
        .def_readonly("suggestion", &trapeze::TrapezeWarning::suggestion)
        .def("code_string", &trapeze::TrapezeWarning::code_string)
        .def("severity_string", &trapeze::TrapezeWarning::severity_string)
        .def("__str__", &trapeze::TrapezeWarning::to_string);

    py::class_<trapeze::WarningList>(m, "WarningList", "Collection of warnings")
        .def(py::init<>())
        .def_readonly("warnings", &trapeze::WarningList::warnings)
        .def("has_warnings", &trapeze::WarningList::has_warnings)
        .def("count", &trapeze::WarningList::count)
        .def("count_by_severity", &trapeze::WarningList::count_by_severity, py::arg("severity"))
        .def("count_by_code", &trapeze::WarningList::count_by_code, py::arg("code"))
        .def("summary", &trapeze::WarningList::summary)
        .def("__len__", &trapeze::WarningList::count);

    // ========================================================================
    // Configuration
    // ========================================================================

    py::class_<trapeze::GradeEntry>(m, "GradeEntry")
        .def(py::init<>())
        .def(py::init([](const std::string& token, double fy) {
            return trapeze::GradeEntry{token, fy};
        }), py::arg("token"), py::arg("yield_N_per_mm2"))
        .def_readwrite("token", &trapeze::GradeEntry::token)
        .def_readwrite("yield_N_per_mm2", &trapeze::GradeEntry::yield_N_per_mm2);

    py::class_<trapeze::CheckConfig>(m, "CheckConfig", "Check rules and constants")
        .def(py::init<>())
        .def_readwrite("gravity", &trapeze::CheckConfig::gravity)
        .def_readwrite("working_stress_factor", &trapeze::CheckConfig::working_stress_factor)
        .def_readwrite("deflection_ratio", &trapeze::CheckConfig::deflection_ratio)
        .def_readwrite("default_yield_N_per_mm2", &trapeze::CheckConfig::default_yield_N_per_mm2)
        .def_readwrite("grade_table", &trapeze::CheckConfig::grade_table)
        .def_readwrite("default_E_N_per_mm2", &trapeze::CheckConfig::default_E_N_per_mm2)
        .def_readwrite("default_Ixx_mm4", &trapeze::CheckConfig::default_Ixx_mm4)
        .def_readwrite("default_Zxx_mm3", &trapeze::CheckConfig::default_Zxx_mm3)
        .def_readwrite("capacity_keys", &trapeze::CheckConfig::capacity_keys)
        .def_readwrite("supports_per_reaction", &trapeze::CheckConfig::supports_per_reaction)
        .def_readwrite("sample_divisions", &trapeze::CheckConfig::sample_divisions)
        .def_readwrite("min_sample_step_mm", &trapeze::CheckConfig::min_sample_step_mm)
        .def_readwrite("max_sample_step_mm", &trapeze::CheckConfig::max_sample_step_mm)
        .def_readwrite("use_catalog_allowable_stress",
                       &trapeze::CheckConfig::use_catalog_allowable_stress)
        .def_readwrite("use_catalog_deflection_ratio",
                       &trapeze::CheckConfig::use_catalog_deflection_ratio)
        .def_readwrite("apply_fire_reduction", &trapeze::CheckConfig::apply_fire_reduction)
        .def("validate", &trapeze::CheckConfig::validate);

    // ========================================================================
    // Loads and beam analysis
    // ========================================================================

    py::class_<trapeze::PointLoad>(m, "PointLoad", "Concentrated load on the bracket beam")
        .def(py::init<double, double, std::string>(),
             py::arg("magnitude_N"), py::arg("position_mm"), py::arg("label") = "")
        .def_property_readonly("magnitude_N", &trapeze::PointLoad::magnitude_N)
        .def_property_readonly("position_mm", &trapeze::PointLoad::position_mm)
        .def_property_readonly("label", &trapeze::PointLoad::label)
        .def("__repr__", [](const trapeze::PointLoad& p) {
            return "<PointLoad " + p.label() + " N=" + std::to_string(p.magnitude_N()) +
                   " x=" + std::to_string(p.position_mm()) + ">";
        });

    py::enum_<trapeze::LoadListShape>(m, "LoadListShape")
        .value("Legacy", trapeze::LoadListShape::Legacy)
        .value("Structured", trapeze::LoadListShape::Structured)
        .export_values();

    m.def("detect_load_list_shape", &trapeze::detect_load_list_shape, py::arg("raw_loads"));

    m.def("normalize_tier_loads",
          py::overload_cast<const std::vector<trapeze::RawLoadEntry>&, double>(
              &trapeze::normalize_tier_loads),
          py::arg("raw_loads"), py::arg("span_mm"),
          "Convert persisted load entries (numbers or records) into point loads");

    m.def("total_load", &trapeze::total_load, py::arg("loads"));

    py::class_<trapeze::SupportReactions>(m, "SupportReactions")
        .def(py::init<>())
        .def_readonly("left_N", &trapeze::SupportReactions::left_N)
        .def_readonly("right_N", &trapeze::SupportReactions::right_N)
        .def("governing_N", &trapeze::SupportReactions::governing_N)
        .def("sum_N", &trapeze::SupportReactions::sum_N);

    py::class_<trapeze::MomentExtreme>(m, "MomentExtreme")
        .def_readonly("x_mm", &trapeze::MomentExtreme::x_mm)
        .def_readonly("value", &trapeze::MomentExtreme::value);

    m.def("reactions", &trapeze::reactions, py::arg("span_mm"), py::arg("loads"));
    m.def("moment_at", &trapeze::moment_at, py::arg("span_mm"), py::arg("loads"), py::arg("x_mm"));
    m.def("find_max_moment", &trapeze::find_max_moment, py::arg("span_mm"), py::arg("loads"));
    m.def("max_moment", &trapeze::max_moment, py::arg("span_mm"), py::arg("loads"),
          "Maximum absolute bending moment [N·mm]");
    m.def("moment_diagram", &trapeze::moment_diagram,
          py::arg("span_mm"), py::arg("loads"), py::arg("stations"));

    m.def("sample_step", &trapeze::sample_step,
          py::arg("span_mm"), py::arg("config") = trapeze::CheckConfig());
    m.def("sampling_coarsened", &trapeze::sampling_coarsened,
          py::arg("span_mm"), py::arg("config") = trapeze::CheckConfig());
    m.def("sample_stations", &trapeze::sample_stations,
          py::arg("span_mm"), py::arg("config") = trapeze::CheckConfig());
    m.def("deflection_at", &trapeze::deflection_at,
          py::arg("span_mm"), py::arg("loads"), py::arg("E"), py::arg("I"), py::arg("x_mm"));
    m.def("max_deflection", &trapeze::max_deflection,
          py::arg("span_mm"), py::arg("loads"), py::arg("E"), py::arg("I"),
          py::arg("config") = trapeze::CheckConfig(),
          "Maximum absolute sampled deflection [mm]");
    m.def("deflection_diagram", &trapeze::deflection_diagram,
          py::arg("span_mm"), py::arg("loads"), py::arg("E"), py::arg("I"), py::arg("stations"));

    // ========================================================================
    // Section properties and allowables
    // ========================================================================

    py::enum_<trapeze::PropertyStatus>(m, "PropertyStatus")
        .value("Present", trapeze::PropertyStatus::Present)
        .value("Missing", trapeze::PropertyStatus::Missing)
        .value("Invalid", trapeze::PropertyStatus::Invalid)
        .export_values();

    py::class_<trapeze::MaterialProperties>(m, "MaterialProperties")
        .def(py::init<>())
        .def_readwrite("E_N_per_mm2", &trapeze::MaterialProperties::E_N_per_mm2)
        .def_readwrite("Ixx_mm4", &trapeze::MaterialProperties::Ixx_mm4)
        .def_readwrite("Zxx_mm3", &trapeze::MaterialProperties::Zxx_mm3)
        .def_readwrite("grade_label", &trapeze::MaterialProperties::grade_label)
        .def_readonly("E_status", &trapeze::MaterialProperties::E_status)
        .def_readonly("Ixx_status", &trapeze::MaterialProperties::Ixx_status)
        .def_readonly("Zxx_status", &trapeze::MaterialProperties::Zxx_status)
        .def("is_complete", &trapeze::MaterialProperties::is_complete);

    m.def("resolve_material_properties",
          py::overload_cast<const trapeze::Record&, const trapeze::CheckConfig&>(
              &trapeze::resolve_material_properties),
          py::arg("profile"), py::arg("config") = trapeze::CheckConfig());

    m.def("yield_stress", &trapeze::yield_stress,
          py::arg("grade_label"), py::arg("config") = trapeze::CheckConfig());
    m.def("allowable_stress", &trapeze::allowable_stress,
          py::arg("grade_label"), py::arg("config") = trapeze::CheckConfig());
    m.def("deflection_limit",
          py::overload_cast<double, const trapeze::CheckConfig&>(&trapeze::deflection_limit),
          py::arg("span_mm"), py::arg("config") = trapeze::CheckConfig());
    m.def("deflection_limit",
          py::overload_cast<double, double>(&trapeze::deflection_limit),
          py::arg("span_mm"), py::arg("ratio"));
    m.def("deflection_ratio", &trapeze::deflection_ratio,
          py::arg("profile"), py::arg("config") = trapeze::CheckConfig());

    m.def("parse_rod_size", &trapeze::parse_rod_size, py::arg("label"));
    m.def("rod_size_rank", &trapeze::rod_size_rank, py::arg("label"));
    m.def("required_rod_size", &trapeze::required_rod_size,
          py::arg("demand_per_rod_N"), py::arg("capacities"));

    // ========================================================================
    // Snapshot, library and check result
    // ========================================================================

    py::class_<trapeze::ProjectSnapshot>(m, "ProjectSnapshot")
        .def(py::init<>())
        .def_readwrite("span_mm", &trapeze::ProjectSnapshot::span_mm)
        .def_readwrite("tier_count", &trapeze::ProjectSnapshot::tier_count)
        .def_readwrite("loads", &trapeze::ProjectSnapshot::loads)
        .def_readwrite("profile_id", &trapeze::ProjectSnapshot::profile_id)
        .def_readwrite("rod_id", &trapeze::ProjectSnapshot::rod_id)
        .def_readwrite("washer_id", &trapeze::ProjectSnapshot::washer_id)
        .def_readwrite("anchor_id", &trapeze::ProjectSnapshot::anchor_id);

    py::class_<trapeze::PartsLibrary>(m, "PartsLibrary")
        .def(py::init<>())
        .def_readwrite("profile", &trapeze::PartsLibrary::profile)
        .def_readwrite("rod", &trapeze::PartsLibrary::rod)
        .def_readwrite("washer", &trapeze::PartsLibrary::washer)
        .def_readwrite("anchor", &trapeze::PartsLibrary::anchor)
        .def_readwrite("rod_capacities", &trapeze::PartsLibrary::rod_capacities);

    py::enum_<trapeze::CheckCategory>(m, "CheckCategory")
        .value("Bending", trapeze::CheckCategory::Bending)
        .value("Deflection", trapeze::CheckCategory::Deflection)
        .value("Rod", trapeze::CheckCategory::Rod)
        .value("Anchor", trapeze::CheckCategory::Anchor)
        .export_values();

    py::enum_<trapeze::CheckVerdict>(m, "CheckVerdict")
        .value("Pass", trapeze::CheckVerdict::Pass)
        .value("Fail", trapeze::CheckVerdict::Fail)
        .export_values();

    py::class_<trapeze::TierResult>(m, "TierResult")
        .def_readonly("tier", &trapeze::TierResult::tier)
        .def_readonly("reactions", &trapeze::TierResult::reactions)
        .def_readonly("max_moment_kNm", &trapeze::TierResult::max_moment_kNm)
        .def_readonly("max_moment_x_mm", &trapeze::TierResult::max_moment_x_mm)
        .def_readonly("max_deflection_mm", &trapeze::TierResult::max_deflection_mm)
        .def_readonly("weight_kg", &trapeze::TierResult::weight_kg)
        .def_readonly("load_count", &trapeze::TierResult::load_count);

    py::class_<trapeze::LibraryUsed>(m, "LibraryUsed")
        .def_readonly("profile", &trapeze::LibraryUsed::profile)
        .def_readonly("rod", &trapeze::LibraryUsed::rod)
        .def_readonly("washer", &trapeze::LibraryUsed::washer)
        .def_readonly("anchor", &trapeze::LibraryUsed::anchor)
        .def_readonly("bearing_area_multiplier", &trapeze::LibraryUsed::bearing_area_multiplier);

    py::class_<trapeze::CheckResult>(m, "CheckResult", "Outcome of a bracket check")
        .def_readonly("status", &trapeze::CheckResult::status)
        .def_readonly("governing_check", &trapeze::CheckResult::governing_check)
        .def_readonly("governing_tier", &trapeze::CheckResult::governing_tier)
        .def_readonly("tiers", &trapeze::CheckResult::tiers)
        .def_readonly("total", &trapeze::CheckResult::total)
        .def_readonly("checks", &trapeze::CheckResult::checks)
        .def_readonly("notes", &trapeze::CheckResult::notes)
        .def_readonly("warnings", &trapeze::CheckResult::warnings)
        .def_readonly("material", &trapeze::CheckResult::material)
        .def_readonly("deflection_limit_mm", &trapeze::CheckResult::deflection_limit_mm)
        .def_readonly("bending_stress_N_per_mm2", &trapeze::CheckResult::bending_stress_N_per_mm2)
        .def_readonly("allowable_stress_N_per_mm2",
                      &trapeze::CheckResult::allowable_stress_N_per_mm2)
        .def_readonly("rod_demand_N", &trapeze::CheckResult::rod_demand_N)
        .def_readonly("rod_capacity_N", &trapeze::CheckResult::rod_capacity_N)
        .def_readonly("anchor_demand_N", &trapeze::CheckResult::anchor_demand_N)
        .def_readonly("anchor_capacity_N", &trapeze::CheckResult::anchor_capacity_N)
        .def_readonly("utilization", &trapeze::CheckResult::utilization)
        .def_readonly("rod_min_size", &trapeze::CheckResult::rod_min_size)
        .def_readonly("library_used", &trapeze::CheckResult::library_used)
        .def("passed", &trapeze::CheckResult::passed)
        .def("verdict", &trapeze::CheckResult::verdict, py::arg("category"))
        .def("total_weight_kg", &trapeze::CheckResult::total_weight_kg)
        .def("to_string", &trapeze::CheckResult::to_string)
        .def("to_json", &trapeze::CheckResult::to_json)
        .def("__str__", &trapeze::CheckResult::to_string);

    py::class_<trapeze::CheckEvaluator>(m, "CheckEvaluator", "Runs the bracket checks")
        .def(py::init<trapeze::CheckConfig>(), py::arg("config") = trapeze::CheckConfig())
        .def("config", &trapeze::CheckEvaluator::config, py::return_value_policy::reference_internal)
        .def("evaluate", &trapeze::CheckEvaluator::evaluate,
             py::arg("snapshot"), py::arg("library"))
        .def("analyze_tier", &trapeze::CheckEvaluator::analyze_tier,
             py::arg("tier"), py::arg("span_mm"), py::arg("loads"), py::arg("material"))
        .def("tension_capacity", &trapeze::CheckEvaluator::tension_capacity, py::arg("record"));

    m.def("evaluate",
          py::overload_cast<const trapeze::ProjectSnapshot&, const trapeze::PartsLibrary&,
                            const trapeze::CheckConfig&>(&trapeze::evaluate),
          py::arg("snapshot"), py::arg("library"), py::arg("config") = trapeze::CheckConfig(),
          "Check a bracket snapshot against the resolved parts library");
}
