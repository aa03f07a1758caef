#pragma once

#include "trapeze/beam_statics.hpp"
#include "trapeze/section_properties.hpp"
#include "trapeze/warnings.hpp"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trapeze {

/**
 * @brief Check categories
 */
enum class CheckCategory {
    Bending,
    Deflection,
    Rod,
    Anchor
};

/**
 * @brief Convert CheckCategory to its result key
 */
inline std::string check_category_to_string(CheckCategory category) {
    switch (category) {
        case CheckCategory::Bending: return "bending";
        case CheckCategory::Deflection: return "deflection";
        case CheckCategory::Rod: return "rod";
        case CheckCategory::Anchor: return "anchor";
        default: return "unknown";
    }
}

/**
 * @brief Categories in governing priority order
 *
 * The first failing category in this order is the governing check.
 */
inline const std::array<CheckCategory, 4>& check_priority() {
    static const std::array<CheckCategory, 4> order = {
        CheckCategory::Bending, CheckCategory::Deflection,
        CheckCategory::Rod, CheckCategory::Anchor
    };
    return order;
}

enum class CheckVerdict {
    Pass,
    Fail
};

inline std::string verdict_to_string(CheckVerdict verdict) {
    return verdict == CheckVerdict::Pass ? "PASS" : "FAIL";
}

/**
 * @brief Analysis results of one tier, or the envelope over all tiers
 *
 * For the total entry, reactions and weight are sums over tiers while
 * moment and deflection are maxima.
 */
struct TierResult {
    int tier = 0;                    ///< Tier number, 0 for the total entry
    SupportReactions reactions;      ///< Support reactions [N]
    double max_moment_kNm = 0.0;     ///< Maximum absolute moment [kN·m]
    double max_moment_x_mm = 0.0;    ///< Position of the maximum moment [mm]
    double max_deflection_mm = 0.0;  ///< Maximum absolute deflection [mm]
    double weight_kg = 0.0;          ///< Carried load expressed as mass [kg]
    int load_count = 0;              ///< Number of point loads after normalization
};

/**
 * @brief Catalog parts the check was run with
 */
struct LibraryUsed {
    std::string profile;
    std::string rod;
    std::string washer;
    std::string anchor;
    double bearing_area_multiplier = 1.0;  ///< Washer bearing multiplier, reported only
};

/**
 * @brief Outcome of a bracket check
 *
 * Produced by evaluate(). All numeric fields keep full precision; rounding
 * happens only in notes and in to_string().
 */
struct CheckResult {
    /// PASS if no check failed
    CheckVerdict status = CheckVerdict::Pass;

    /// First failing category in priority order, "none" if all pass
    std::string governing_check = "none";

    /// Tier with the largest moment, 0 if no tier carries load
    int governing_tier = 0;

    /// Per-tier results, tiers 1..tier_count in order
    std::vector<TierResult> tiers;

    /// Envelope over all tiers
    TierResult total;

    /// Verdict per category (always holds all four categories)
    std::map<CheckCategory, CheckVerdict> checks;

    /// One explanatory note per failed check
    std::vector<std::string> notes;

    /// Input data that had to be skipped or substituted
    WarningList warnings;

    /// Section properties the checks used
    MaterialProperties material;

    double deflection_limit_mm = 0.0;         ///< span / ratio [mm]
    double bending_stress_N_per_mm2 = 0.0;    ///< M_max / Zxx [N/mm²]
    double allowable_stress_N_per_mm2 = 0.0;  ///< [N/mm²]

    double rod_demand_N = 0.0;                ///< Tension per rod [N]
    std::optional<double> rod_capacity_N;     ///< Empty if not in catalog
    double anchor_demand_N = 0.0;             ///< Tension per anchor [N]
    std::optional<double> anchor_capacity_N;  ///< Empty if not in catalog

    /// demand / allowable for each category where both are known
    std::map<CheckCategory, double> utilization;

    /// Minimum rod size from the library's rod table, empty without a table
    std::string rod_min_size;

    LibraryUsed library_used;

    bool passed() const { return status == CheckVerdict::Pass; }

    /**
     * @brief Verdict of one category (PASS if not evaluated)
     */
    CheckVerdict verdict(CheckCategory category) const {
        auto it = checks.find(category);
        return it == checks.end() ? CheckVerdict::Pass : it->second;
    }

    double total_weight_kg() const { return total.weight_kg; }

    /**
     * @brief Result of tier t (1-based), nullptr if not analyzed
     */
    const TierResult* tier(int t) const {
        for (const auto& r : tiers) {
            if (r.tier == t) return &r;
        }
        return nullptr;
    }

    /**
     * @brief Short human-readable summary
     */
    std::string to_string() const;

    /**
     * @brief Serialize to JSON
     *
     * Keys follow the service layer's result schema: per-tier maps are keyed
     * "tier1".."tierN" plus "total", weights "1".."N". Output is
     * deterministic for identical results.
     */
    std::string to_json() const;
};

} // namespace trapeze
