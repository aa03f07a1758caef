#pragma once

#include "trapeze/check_config.hpp"
#include "trapeze/check_result.hpp"
#include "trapeze/section_properties.hpp"
#include "trapeze/snapshot.hpp"

#include <optional>
#include <vector>

namespace trapeze {

/**
 * @brief Runs the bracket checks for a project snapshot
 *
 * Each tier is analyzed as an independent simply-supported span sharing the
 * bracket's section. The worst tier governs bending and deflection; the sum
 * of tier reactions governs rod and anchor tension.
 *
 * Checks, in governing priority order:
 * - bending:    M_max / Zxx <= allowable stress, and E, Ixx, Zxx all
 *               taken from the profile
 * - deflection: d_max <= span / 200 (skipped for zero span)
 * - rod:        reaction / supports_per_reaction <= rod tension capacity
 * - anchor:     reaction / supports_per_reaction <= anchor tension capacity
 *
 * Malformed snapshot or catalog data never throws. It is replaced by a
 * conservative value and reported in CheckResult::warnings. The evaluator
 * holds no mutable state; one instance may be shared between threads.
 *
 * Usage:
 *   CheckEvaluator evaluator;
 *   CheckResult result = evaluator.evaluate(snapshot, library);
 *   if (!result.passed()) {
 *       std::cerr << result.to_string();
 *   }
 */
class CheckEvaluator {
public:
    /**
     * @brief Construct an evaluator
     * @param config Check rules and constants
     * @throws std::invalid_argument if config.validate() reports an error
     */
    explicit CheckEvaluator(CheckConfig config = CheckConfig());

    const CheckConfig& config() const { return config_; }

    /**
     * @brief Check a bracket
     * @param snapshot Bracket geometry, loads and part selections
     * @param library Catalog rows resolved for the selections
     * @return Complete check result
     */
    CheckResult evaluate(const ProjectSnapshot& snapshot, const PartsLibrary& library) const;

    /**
     * @brief Analyze one tier
     *
     * Reactions, maximum moment and deflection, and weight of the given
     * loads. A tier without loads gives all zeros. Deflection stays zero
     * when E or Ixx was substituted.
     */
    TierResult analyze_tier(int tier, double span_mm, const std::vector<PointLoad>& loads,
                            const MaterialProperties& material) const;

    /**
     * @brief Tension capacity of a rod or anchor record [N]
     *
     * First positive value among config().capacity_keys, reduced by the
     * record's fire_reduction_factor when apply_fire_reduction is set.
     *
     * @return Capacity, or std::nullopt if the record has none
     */
    std::optional<double> tension_capacity(const Record& record) const;

private:
    CheckConfig config_;
};

/**
 * @brief Check a bracket with the default rules
 */
CheckResult evaluate(const ProjectSnapshot& snapshot, const PartsLibrary& library);

/**
 * @brief Check a bracket with custom rules
 * @throws std::invalid_argument if config is invalid
 */
CheckResult evaluate(const ProjectSnapshot& snapshot, const PartsLibrary& library,
                     const CheckConfig& config);

} // namespace trapeze
