#include "trapeze/check_evaluator.hpp"
#include "trapeze/allowables.hpp"
#include "trapeze/beam_statics.hpp"
#include "trapeze/deflection.hpp"
#include "trapeze/load_model.hpp"
#include "trapeze/rod_sizing.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace trapeze {

namespace {

constexpr int kMaxTiers = 3;

std::string fixed(double value, int digits) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(digits) << value;
    return oss.str();
}

std::string id_or(const Record& record, const std::string& key, const std::string& fallback) {
    auto id = find_string(record, {key});
    return id ? *id : fallback;
}

} // namespace

CheckEvaluator::CheckEvaluator(CheckConfig config)
    : config_(std::move(config)) {
    TrapezeError err = config_.validate();
    if (err.is_error()) {
        throw std::invalid_argument(err.to_string());
    }
}

TierResult CheckEvaluator::analyze_tier(int tier, double span_mm,
                                        const std::vector<PointLoad>& loads,
                                        const MaterialProperties& material) const {
    TierResult r;
    r.tier = tier;
    r.load_count = static_cast<int>(loads.size());
    if (loads.empty()) {
        return r;
    }

    r.reactions = reactions(span_mm, loads);

    const MomentExtreme m = find_max_moment(span_mm, loads);
    r.max_moment_kNm = m.value / 1e6;  // N·mm -> kN·m
    r.max_moment_x_mm = m.x_mm;

    // Substituted stiffness fails bending instead; no deflection from it
    if (material.E_status == PropertyStatus::Present &&
        material.Ixx_status == PropertyStatus::Present) {
        r.max_deflection_mm = max_deflection(span_mm, loads, material.E_N_per_mm2,
                                             material.Ixx_mm4, config_);
    }
    r.weight_kg = total_load(loads) / config_.gravity;
    return r;
}

std::optional<double> CheckEvaluator::tension_capacity(const Record& record) const {
    std::optional<double> capacity;
    for (const auto& key : config_.capacity_keys) {
        auto value = find_number(record, {key});
        if (value && *value > 0.0) {
            capacity = value;
            break;
        }
    }
    if (!capacity) {
        return std::nullopt;
    }

    if (config_.apply_fire_reduction) {
        auto factor = find_number(record, {"fire_reduction_factor"});
        if (factor && *factor > 0.0 && *factor <= 1.0) {
            *capacity *= *factor;
        }
    }
    return capacity;
}

CheckResult CheckEvaluator::evaluate(const ProjectSnapshot& snapshot,
                                     const PartsLibrary& library) const {
    CheckResult result;

    // Geometry
    double span = snapshot.span_mm;
    if (!std::isfinite(span) || span <= 0.0) {
        result.warnings.add(TrapezeWarning::degenerate_span(span));
        span = 0.0;
    }

    const int tier_count = std::clamp(snapshot.tier_count, 1, kMaxTiers);
    if (tier_count != snapshot.tier_count) {
        result.warnings.add(TrapezeWarning::tier_count_clamped(snapshot.tier_count, tier_count));
    }

    if (sampling_coarsened(span, config_)) {
        result.warnings.add(TrapezeWarning::sampling_coarsened(span, sample_step(span, config_)));
    }

    result.material = resolve_material_properties(library.profile, config_, result.warnings);
    const MaterialProperties& mat = result.material;

    // Per-tier analysis and envelope
    static const std::vector<RawLoadEntry> no_loads;
    for (int t = 1; t <= tier_count; ++t) {
        auto it = snapshot.loads.find(t);
        const auto& raw = it != snapshot.loads.end() ? it->second : no_loads;

        std::vector<PointLoad> loads = normalize_tier_loads(raw, span, t, result.warnings);
        TierResult r = analyze_tier(t, span, loads, mat);

        result.total.reactions.left_N += r.reactions.left_N;
        result.total.reactions.right_N += r.reactions.right_N;
        result.total.weight_kg += r.weight_kg;
        result.total.load_count += r.load_count;
        if (r.max_moment_kNm > result.total.max_moment_kNm) {
            result.total.max_moment_kNm = r.max_moment_kNm;
            result.total.max_moment_x_mm = r.max_moment_x_mm;
            result.governing_tier = t;
        }
        result.total.max_deflection_mm = std::max(result.total.max_deflection_mm,
                                                  r.max_deflection_mm);
        result.tiers.push_back(r);
    }

    for (CheckCategory category : check_priority()) {
        result.checks[category] = CheckVerdict::Pass;
    }

    // Bending
    auto fy = yield_stress(mat.grade_label, config_);
    double allowable = allowable_stress(mat.grade_label, config_);
    auto catalog_allowable = find_number(library.profile, {"allowable_stress_N_per_mm2"});
    if (config_.use_catalog_allowable_stress && catalog_allowable && *catalog_allowable > 0.0) {
        allowable = *catalog_allowable;
    } else if (!fy) {
        result.warnings.add(TrapezeWarning::unrecognized_grade(mat.grade_label,
                                                               config_.default_yield_N_per_mm2));
    }
    result.allowable_stress_N_per_mm2 = allowable;

    const double moment_Nmm = result.total.max_moment_kNm * 1e6;
    result.bending_stress_N_per_mm2 = moment_Nmm / mat.Zxx_mm3;
    result.utilization[CheckCategory::Bending] = result.bending_stress_N_per_mm2 / allowable;

    // Any substituted section property fails bending, whatever the stress
    std::string substituted;
    const std::pair<const char*, PropertyStatus> properties[] = {
        {"E_N_per_mm2", mat.E_status},
        {"Ixx_mm4", mat.Ixx_status},
        {"Zxx_mm3", mat.Zxx_status}
    };
    for (const auto& p : properties) {
        if (p.second == PropertyStatus::Present) continue;
        if (!substituted.empty()) substituted += ", ";
        substituted += std::string(p.first) + " " + property_status_to_string(p.second);
    }

    const bool overstressed = result.bending_stress_N_per_mm2 > allowable;
    if (overstressed || !substituted.empty()) {
        result.checks[CheckCategory::Bending] = CheckVerdict::Fail;
        std::string note;
        if (overstressed) {
            note = "Bending stress " + fixed(result.bending_stress_N_per_mm2, 2) +
                   " N/mm2 exceeds allowable " + fixed(allowable, 2) +
                   " N/mm2 (M = " + fixed(result.total.max_moment_kNm, 3) +
                   " kNm, Zxx = " + fixed(mat.Zxx_mm3, 1) + " mm3)";
        } else {
            note = "Bending not verified: incomplete profile section data";
        }
        if (!substituted.empty()) {
            note += "; profile " + substituted;
        }
        result.notes.push_back(note);
    }

    // Deflection
    const double ratio = deflection_ratio(library.profile, config_);
    result.deflection_limit_mm = deflection_limit(span, ratio);
    if (result.deflection_limit_mm > 0.0) {
        result.utilization[CheckCategory::Deflection] =
            result.total.max_deflection_mm / result.deflection_limit_mm;
        if (result.total.max_deflection_mm > result.deflection_limit_mm) {
            result.checks[CheckCategory::Deflection] = CheckVerdict::Fail;
            result.notes.push_back("Deflection " + fixed(result.total.max_deflection_mm, 2) +
                                   " mm exceeds limit " + fixed(result.deflection_limit_mm, 2) +
                                   " mm (span/" + fixed(ratio, 0) + ")");
        }
    }

    // Rod and anchor tension at the governing support
    const double demand = result.total.reactions.governing_N() / config_.supports_per_reaction;

    result.rod_demand_N = demand;
    result.rod_capacity_N = tension_capacity(library.rod);
    if (result.rod_capacity_N) {
        result.utilization[CheckCategory::Rod] = demand / *result.rod_capacity_N;
        if (demand > *result.rod_capacity_N) {
            result.checks[CheckCategory::Rod] = CheckVerdict::Fail;
            result.notes.push_back("Rod tension " + fixed(demand, 1) + " N exceeds capacity " +
                                   fixed(*result.rod_capacity_N, 1) + " N");
        }
    } else {
        result.warnings.add(TrapezeWarning::missing_capacity("rod"));
    }

    result.anchor_demand_N = demand;
    result.anchor_capacity_N = tension_capacity(library.anchor);
    if (result.anchor_capacity_N) {
        result.utilization[CheckCategory::Anchor] = demand / *result.anchor_capacity_N;
        if (demand > *result.anchor_capacity_N) {
            result.checks[CheckCategory::Anchor] = CheckVerdict::Fail;
            result.notes.push_back("Anchor tension " + fixed(demand, 1) + " N exceeds capacity " +
                                   fixed(*result.anchor_capacity_N, 1) + " N");
        }
    } else {
        result.warnings.add(TrapezeWarning::missing_capacity("anchor"));
    }

    // Minimum rod size from the catalog's rod table
    if (!library.rod_capacities.empty()) {
        result.rod_min_size = required_rod_size(demand, library.rod_capacities);

        auto selected_label = find_string(library.rod, {"diameter_label"});
        const std::string selected = parse_rod_size(selected_label ? *selected_label
                                                                   : snapshot.rod_id);
        auto selected_rank = rod_size_rank(selected);
        auto min_rank = rod_size_rank(result.rod_min_size);
        if (selected_rank && min_rank && *selected_rank < *min_rank) {
            result.warnings.add(TrapezeWarning::rod_below_minimum(selected, result.rod_min_size));
        }
    }

    // Verdict
    for (CheckCategory category : check_priority()) {
        if (result.checks[category] == CheckVerdict::Fail) {
            result.status = CheckVerdict::Fail;
            result.governing_check = check_category_to_string(category);
            break;
        }
    }

    result.library_used.profile = id_or(library.profile, "profile_id", snapshot.profile_id);
    result.library_used.rod = id_or(library.rod, "rod_id", snapshot.rod_id);
    result.library_used.washer = id_or(library.washer, "washer_id", snapshot.washer_id);
    result.library_used.anchor = id_or(library.anchor, "anchor_id", snapshot.anchor_id);
    auto bearing = find_number(library.washer, {"bearing_area_multiplier"});
    result.library_used.bearing_area_multiplier = (bearing && *bearing > 0.0) ? *bearing : 1.0;

    return result;
}

CheckResult evaluate(const ProjectSnapshot& snapshot, const PartsLibrary& library) {
    return CheckEvaluator().evaluate(snapshot, library);
}

CheckResult evaluate(const ProjectSnapshot& snapshot, const PartsLibrary& library,
                     const CheckConfig& config) {
    return CheckEvaluator(config).evaluate(snapshot, library);
}

} // namespace trapeze
