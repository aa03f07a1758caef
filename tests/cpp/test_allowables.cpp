/**
 * @file test_allowables.cpp
 * @brief C++ tests for grade lookup, section property resolution, rod sizing
 *        and configuration validation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "trapeze/allowables.hpp"
#include "trapeze/catalog.hpp"
#include "trapeze/check_config.hpp"
#include "trapeze/errors.hpp"
#include "trapeze/rod_sizing.hpp"
#include "trapeze/section_properties.hpp"
#include "trapeze/warnings.hpp"

#include <limits>
#include <map>
#include <string>

using namespace trapeze;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Catalog field lookup
// =============================================================================

TEST_CASE("Numbers are read from numeric and text fields", "[Catalog]") {
    REQUIRE(as_number(FieldValue(12.5)).value() == 12.5);
    REQUIRE(as_number(FieldValue(std::string("4000000"))).value() == 4000000.0);
    REQUIRE(as_number(FieldValue(std::string(" 2.5e3 "))).value() == 2500.0);

    REQUIRE_FALSE(as_number(FieldValue()).has_value());
    REQUIRE_FALSE(as_number(FieldValue(true)).has_value());
    REQUIRE_FALSE(as_number(FieldValue(std::string(""))).has_value());
    REQUIRE_FALSE(as_number(FieldValue(std::string("12 kN"))).has_value());
    REQUIRE_FALSE(as_number(FieldValue(std::numeric_limits<double>::infinity())).has_value());
}

TEST_CASE("Text is read from text and numeric fields", "[Catalog]") {
    REQUIRE(as_string(FieldValue(std::string("S355"))).value() == "S355");
    REQUIRE(as_string(FieldValue(42.0)).value() == "42");
    REQUIRE_FALSE(as_string(FieldValue()).has_value());
}

TEST_CASE("First present numeric key wins", "[Catalog]") {
    Record rod = {
        {"capacity_N", 1000.0},
        {"tension_capacity_N", 9000.0},
        {"tension_N", std::string("n/a")}
    };

    REQUIRE(find_number(rod, {"tension_capacity_N", "capacity_N"}).value() == 9000.0);
    REQUIRE(find_number(rod, {"tension_N", "capacity_N"}).value() == 1000.0);
    REQUIRE_FALSE(find_number(rod, {"shear_N"}).has_value());
}

TEST_CASE("Empty text does not count as present", "[Catalog]") {
    Record profile = {
        {"material_grade", std::string("")},
        {"grade", std::string("S275")}
    };

    REQUIRE(find_string(profile, {"material_grade", "grade"}).value() == "S275");
}

// =============================================================================
// Allowable derivation
// =============================================================================

TEST_CASE("Grade labels match by substring", "[Allowables][grade]") {
    REQUIRE(yield_stress("S355JR").value() == 355.0);
    REQUIRE(yield_stress("Grade 275").value() == 275.0);
    REQUIRE(yield_stress("S235").value() == 235.0);

    REQUIRE_FALSE(yield_stress("S460").has_value());
    REQUIRE_FALSE(yield_stress("").has_value());
}

TEST_CASE("Allowable stress is 0.6 times yield", "[Allowables][stress]") {
    REQUIRE_THAT(allowable_stress("S355"), WithinAbs(213.0, 1e-9));
    REQUIRE_THAT(allowable_stress("S275"), WithinAbs(165.0, 1e-9));
    REQUIRE_THAT(allowable_stress("S235"), WithinAbs(141.0, 1e-9));
}

TEST_CASE("Unrecognized grades use the conservative default", "[Allowables][stress]") {
    REQUIRE_THAT(allowable_stress("stainless"), WithinAbs(141.0, 1e-9));
    REQUIRE_THAT(allowable_stress(""), WithinAbs(141.0, 1e-9));
}

TEST_CASE("Custom working stress factor and grade table", "[Allowables][config]") {
    CheckConfig config;
    config.working_stress_factor = 0.5;
    config.grade_table = {{"460", 460.0}};

    REQUIRE_THAT(allowable_stress("S460", config), WithinAbs(230.0, 1e-9));
    REQUIRE_THAT(allowable_stress("S355", config), WithinAbs(117.5, 1e-9));
}

TEST_CASE("Deflection limit is span over 200", "[Allowables][deflection]") {
    REQUIRE_THAT(deflection_limit(1200.0), WithinAbs(6.0, 1e-12));
    REQUIRE_THAT(deflection_limit(2000.0), WithinAbs(10.0, 1e-12));
    REQUIRE(deflection_limit(0.0) == 0.0);
    REQUIRE(deflection_limit(-300.0) == 0.0);
}

TEST_CASE("Deflection limit for an explicit ratio", "[Allowables][deflection]") {
    REQUIRE_THAT(deflection_limit(2000.0, 400.0), WithinAbs(5.0, 1e-12));
    REQUIRE(deflection_limit(2000.0, 0.0) == 0.0);
    REQUIRE(deflection_limit(0.0, 400.0) == 0.0);
}

TEST_CASE("Catalog deflection ratio applies only when enabled", "[Allowables][deflection]") {
    Record profile = {{"deflection_limit_ratio", 360.0}};
    Record unusable = {{"deflection_limit_ratio", std::string("none")}};

    REQUIRE(deflection_ratio(profile) == 200.0);

    CheckConfig config;
    config.use_catalog_deflection_ratio = true;
    REQUIRE(deflection_ratio(profile, config) == 360.0);
    REQUIRE(deflection_ratio(unusable, config) == 200.0);
    REQUIRE(deflection_ratio(Record(), config) == 200.0);
}

// =============================================================================
// Section properties
// =============================================================================

TEST_CASE("Complete profile is used as given", "[SectionProperties]") {
    Record profile = {
        {"E_N_per_mm2", 205000.0},
        {"Ixx_mm4", 4.0e6},
        {"Zxx_mm3", std::string("50000")},
        {"material_grade", std::string("S355")}
    };

    WarningList warnings;
    MaterialProperties props = resolve_material_properties(profile, CheckConfig(), warnings);

    REQUIRE(props.is_complete());
    REQUIRE(props.E_N_per_mm2 == 205000.0);
    REQUIRE(props.Ixx_mm4 == 4.0e6);
    REQUIRE(props.Zxx_mm3 == 50000.0);
    REQUIRE(props.grade_label == "S355");
    REQUIRE_FALSE(warnings.has_warnings());
}

TEST_CASE("Missing and invalid properties fall back to defaults", "[SectionProperties]") {
    Record profile = {
        {"Ixx_mm4", 0.0},
        {"Zxx_mm3", std::string("abc")}
    };

    WarningList warnings;
    MaterialProperties props = resolve_material_properties(profile, CheckConfig(), warnings);

    REQUIRE_FALSE(props.is_complete());
    REQUIRE(props.E_status == PropertyStatus::Missing);
    REQUIRE(props.Ixx_status == PropertyStatus::Invalid);
    REQUIRE(props.Zxx_status == PropertyStatus::Invalid);
    REQUIRE(props.E_N_per_mm2 == 200000.0);
    REQUIRE(props.Ixx_mm4 == 1.0);
    REQUIRE(props.Zxx_mm3 == 1.0);
    REQUIRE(props.grade_label.empty());
    REQUIRE(warnings.count_by_code(WarningCode::MISSING_SECTION_PROPERTY) == 3);
}

TEST_CASE("Empty profile record resolves to defaults", "[SectionProperties]") {
    MaterialProperties props = resolve_material_properties(Record());

    REQUIRE(props.E_status == PropertyStatus::Missing);
    REQUIRE(props.Ixx_status == PropertyStatus::Missing);
    REQUIRE(props.Zxx_status == PropertyStatus::Missing);
    REQUIRE(props.Zxx_mm3 == 1.0);
}

// =============================================================================
// Rod sizing
// =============================================================================

TEST_CASE("Rod labels normalize to metric sizes", "[RodSizing]") {
    REQUIRE(parse_rod_size("M10") == "M10");
    REQUIRE(parse_rod_size("m12") == "M12");
    REQUIRE(parse_rod_size("M 16 A4-70") == "M16");
    REQUIRE(parse_rod_size("Threaded rod M8") == "M8");
    REQUIRE(parse_rod_size("3/8 UNC") == "3/8 UNC");

    REQUIRE(rod_size_rank("M6").value() == 0);
    REQUIRE(rod_size_rank("m20").value() == 5);
    REQUIRE_FALSE(rod_size_rank("M24").has_value());
}

TEST_CASE("Smallest sufficient rod is selected", "[RodSizing]") {
    std::map<std::string, double> caps = {
        {"M8", 2000.0},
        {"m10", 4000.0},
        {"M12", 6000.0}
    };

    REQUIRE(required_rod_size(1500.0, caps) == "M8");
    REQUIRE(required_rod_size(3000.0, caps) == "M10");
    REQUIRE(required_rod_size(4000.0, caps) == "M10");
    REQUIRE(required_rod_size(5000.0, caps) == "M12");
}

TEST_CASE("Largest rod is returned when none is sufficient", "[RodSizing]") {
    std::map<std::string, double> caps = {{"M8", 2000.0}};

    REQUIRE(required_rod_size(10000.0, caps) == "M20");
    REQUIRE(required_rod_size(10.0, {}) == "M20");
}

// =============================================================================
// Configuration validation
// =============================================================================

TEST_CASE("Default configuration is valid", "[CheckConfig]") {
    REQUIRE(CheckConfig().validate().is_ok());
}

TEST_CASE("Supports per reaction must be one or two", "[CheckConfig]") {
    CheckConfig config;
    config.supports_per_reaction = 2;
    REQUIRE(config.validate().is_ok());

    config.supports_per_reaction = 3;
    TrapezeError err = config.validate();
    REQUIRE(err.code == ErrorCode::INVALID_CONFIG);
    REQUIRE(err.involved_fields.front() == "supports_per_reaction");
}

TEST_CASE("Unusable tables are rejected", "[CheckConfig]") {
    CheckConfig no_grades;
    no_grades.grade_table.clear();
    REQUIRE(no_grades.validate().code == ErrorCode::INVALID_GRADE_TABLE);

    CheckConfig bad_grade;
    bad_grade.grade_table = {{"355", 0.0}};
    REQUIRE(bad_grade.validate().code == ErrorCode::INVALID_GRADE_TABLE);

    CheckConfig no_keys;
    no_keys.capacity_keys.clear();
    REQUIRE(no_keys.validate().code == ErrorCode::EMPTY_CAPACITY_KEYS);
}

TEST_CASE("Non-positive constants are rejected", "[CheckConfig]") {
    CheckConfig config;
    config.gravity = 0.0;
    REQUIRE(config.validate().code == ErrorCode::INVALID_CONFIG);

    CheckConfig sampling;
    sampling.min_sample_step_mm = 60.0;
    REQUIRE(sampling.validate().code == ErrorCode::INVALID_CONFIG);
}
