/**
 * @file test_load_model.cpp
 * @brief C++ tests for load normalization
 *
 * Tests include:
 * - Automatic positioning of legacy magnitude lists
 * - Structured records with clamping and default labels
 * - Skipping of malformed and non-positive entries
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "trapeze/load_model.hpp"
#include "trapeze/warnings.hpp"

#include <string>
#include <vector>

using namespace trapeze;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Legacy magnitude lists
// =============================================================================

TEST_CASE("Legacy loads are spread evenly between the supports", "[LoadModel][legacy]") {
    std::vector<RawLoadEntry> raw = {1000.0, 2000.0};

    auto loads = normalize_tier_loads(raw, 1200.0);

    REQUIRE(loads.size() == 2);
    REQUIRE_THAT(loads[0].magnitude_N(), WithinAbs(1000.0, 1e-12));
    REQUIRE_THAT(loads[0].position_mm(), WithinAbs(400.0, 1e-9));
    REQUIRE(loads[0].label() == "Load 1");
    REQUIRE_THAT(loads[1].magnitude_N(), WithinAbs(2000.0, 1e-12));
    REQUIRE_THAT(loads[1].position_mm(), WithinAbs(800.0, 1e-9));
    REQUIRE(loads[1].label() == "Load 2");
}

TEST_CASE("Single legacy load sits at midspan", "[LoadModel][legacy]") {
    std::vector<RawLoadEntry> raw = {750.0};

    auto loads = normalize_tier_loads(raw, 900.0);

    REQUIRE(loads.size() == 1);
    REQUIRE_THAT(loads[0].position_mm(), WithinAbs(450.0, 1e-9));
}

TEST_CASE("Legacy list drops invalid entries before positioning", "[LoadModel][legacy]") {
    std::vector<RawLoadEntry> raw = {
        500.0,
        std::string("abc"),
        -10.0,
        std::monostate{},
        std::string("750")
    };

    WarningList warnings;
    auto loads = normalize_tier_loads(raw, 900.0, 1, warnings);

    REQUIRE(loads.size() == 2);
    REQUIRE_THAT(loads[0].magnitude_N(), WithinAbs(500.0, 1e-12));
    REQUIRE_THAT(loads[0].position_mm(), WithinAbs(300.0, 1e-9));
    REQUIRE_THAT(loads[1].magnitude_N(), WithinAbs(750.0, 1e-12));
    REQUIRE_THAT(loads[1].position_mm(), WithinAbs(600.0, 1e-9));

    REQUIRE(warnings.count() == 3);
    REQUIRE(warnings.count_by_code(WarningCode::MALFORMED_LOAD) == 2);
    REQUIRE(warnings.count_by_code(WarningCode::NON_POSITIVE_LOAD) == 1);
    REQUIRE(warnings.warnings[0].tier == 1);
}

TEST_CASE("Legacy loads never land on a support", "[LoadModel][legacy]") {
    std::vector<RawLoadEntry> raw = {100.0, 100.0, 100.0, 100.0, 100.0};
    const double span = 1500.0;

    auto loads = normalize_tier_loads(raw, span);

    REQUIRE(loads.size() == 5);
    for (const auto& load : loads) {
        REQUIRE(load.position_mm() > 0.0);
        REQUIRE(load.position_mm() < span);
    }
}

// =============================================================================
// Structured records
// =============================================================================

TEST_CASE("Structured records keep their positions and labels", "[LoadModel][structured]") {
    std::vector<RawLoadEntry> raw = {
        Record{{"N", 5000.0}, {"x_mm", 1000.0}},
        Record{{"N", 0.0}, {"x_mm", 200.0}},
        Record{{"N", 100.0}, {"x_mm", 2500.0}, {"label", std::string("Pipe")}},
        Record{{"N", std::string("abc")}, {"x_mm", 5.0}},
        42.0
    };

    WarningList warnings;
    auto loads = normalize_tier_loads(raw, 2000.0, 2, warnings);

    REQUIRE(loads.size() == 2);
    REQUIRE_THAT(loads[0].magnitude_N(), WithinAbs(5000.0, 1e-12));
    REQUIRE_THAT(loads[0].position_mm(), WithinAbs(1000.0, 1e-12));
    REQUIRE(loads[0].label() == "Load 1");

    // Position clamped onto the right support
    REQUIRE_THAT(loads[1].magnitude_N(), WithinAbs(100.0, 1e-12));
    REQUIRE_THAT(loads[1].position_mm(), WithinAbs(2000.0, 1e-12));
    REQUIRE(loads[1].label() == "Pipe");

    REQUIRE(warnings.count_by_code(WarningCode::NON_POSITIVE_LOAD) == 1);
    REQUIRE(warnings.count_by_code(WarningCode::LOAD_CLAMPED) == 1);
    REQUIRE(warnings.count_by_code(WarningCode::MALFORMED_LOAD) == 2);
}

TEST_CASE("Negative positions clamp to the left support", "[LoadModel][structured]") {
    std::vector<RawLoadEntry> raw = {
        Record{{"N", 300.0}, {"x_mm", -50.0}}
    };

    auto loads = normalize_tier_loads(raw, 1000.0);

    REQUIRE(loads.size() == 1);
    REQUIRE_THAT(loads[0].position_mm(), WithinAbs(0.0, 1e-12));
}

TEST_CASE("Numeric text fields are accepted in records", "[LoadModel][structured]") {
    std::vector<RawLoadEntry> raw = {
        Record{{"N", std::string("1200")}, {"x_mm", std::string(" 300.5 ")}}
    };

    auto loads = normalize_tier_loads(raw, 1000.0);

    REQUIRE(loads.size() == 1);
    REQUIRE_THAT(loads[0].magnitude_N(), WithinAbs(1200.0, 1e-12));
    REQUIRE_THAT(loads[0].position_mm(), WithinAbs(300.5, 1e-12));
}

TEST_CASE("Records without a position are skipped", "[LoadModel][structured]") {
    std::vector<RawLoadEntry> raw = {
        Record{{"N", 1000.0}},
        Record{{"N", 1000.0}, {"x_mm", true}},
        Record{{"N", 1000.0}, {"x_mm", std::monostate{}}}
    };

    WarningList warnings;
    auto loads = normalize_tier_loads(raw, 1000.0, 1, warnings);

    REQUIRE(loads.empty());
    REQUIRE(warnings.count_by_code(WarningCode::MALFORMED_LOAD) == 3);
}

TEST_CASE("Default label follows the entry index", "[LoadModel][structured]") {
    std::vector<RawLoadEntry> raw = {
        std::string("junk"),
        Record{{"N", 10.0}, {"x_mm", 10.0}}
    };

    auto loads = normalize_tier_loads(raw, 100.0);

    REQUIRE(loads.size() == 1);
    REQUIRE(loads[0].label() == "Load 2");
}

// =============================================================================
// Shape detection and edge cases
// =============================================================================

TEST_CASE("Load list shape is decided by the presence of records", "[LoadModel][shape]") {
    REQUIRE(detect_load_list_shape({}) == LoadListShape::Legacy);
    REQUIRE(detect_load_list_shape({1.0, 2.0}) == LoadListShape::Legacy);
    REQUIRE(detect_load_list_shape({1.0, Record{{"N", 1.0}, {"x_mm", 0.0}}}) ==
            LoadListShape::Structured);
}

TEST_CASE("Empty list gives no loads", "[LoadModel][edge]") {
    WarningList warnings;
    auto loads = normalize_tier_loads({}, 1000.0, 1, warnings);

    REQUIRE(loads.empty());
    REQUIRE_FALSE(warnings.has_warnings());
    REQUIRE(total_load(loads) == 0.0);
}

TEST_CASE("Negative span is treated as zero", "[LoadModel][edge]") {
    std::vector<RawLoadEntry> raw = {
        Record{{"N", 100.0}, {"x_mm", 50.0}}
    };

    auto loads = normalize_tier_loads(raw, -500.0);

    REQUIRE(loads.size() == 1);
    REQUIRE(loads[0].position_mm() == 0.0);
}

TEST_CASE("Total load sums magnitudes", "[LoadModel]") {
    std::vector<PointLoad> loads = {
        PointLoad(100.0, 0.0, "a"),
        PointLoad(250.0, 10.0, "b")
    };

    REQUIRE_THAT(total_load(loads), WithinAbs(350.0, 1e-12));
}
