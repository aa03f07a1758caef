#include "trapeze/check_result.hpp"

#include <iomanip>
#include <sstream>

namespace trapeze {

namespace {

std::string json_escape(const std::string& text) {
    std::ostringstream oss;
    for (char c : text) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

std::string quoted(const std::string& text) {
    return "\"" + json_escape(text) + "\"";
}

std::string tier_key(const TierResult& r) {
    return r.tier == 0 ? "total" : "tier" + std::to_string(r.tier);
}

// Writes {"tier1": f(tier1), ..., "total": f(total)}
template <typename Fn>
void write_tier_map(std::ostringstream& oss, const CheckResult& result, Fn&& value) {
    oss << "{";
    for (const auto& r : result.tiers) {
        oss << quoted(tier_key(r)) << ": ";
        value(r);
        oss << ", ";
    }
    oss << quoted(tier_key(result.total)) << ": ";
    value(result.total);
    oss << "}";
}

void write_optional(std::ostringstream& oss, const std::optional<double>& value) {
    if (value) {
        oss << *value;
    } else {
        oss << "null";
    }
}

} // namespace

std::string CheckResult::to_string() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    oss << "Status: " << verdict_to_string(status)
        << " (governing: " << governing_check << ")\n";
    oss << "Total weight: " << total.weight_kg << " kg\n";

    for (const auto& r : tiers) {
        oss << "  Tier " << r.tier << ": R = " << std::setprecision(1)
            << r.reactions.left_N << " / " << r.reactions.right_N << " N"
            << std::setprecision(3) << ", M = " << r.max_moment_kNm << " kNm"
            << ", d = " << r.max_deflection_mm << " mm"
            << std::setprecision(2) << ", w = " << r.weight_kg << " kg\n";
    }

    for (CheckCategory category : check_priority()) {
        oss << "  " << check_category_to_string(category) << ": "
            << verdict_to_string(verdict(category)) << "\n";
    }

    for (const auto& note : notes) {
        oss << "  Note: " << note << "\n";
    }

    if (warnings.has_warnings()) {
        oss << "  " << warnings.summary() << "\n";
    }

    return oss.str();
}

std::string CheckResult::to_json() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);

    oss << "{\n";
    oss << "  \"status\": " << quoted(verdict_to_string(status)) << ",\n";
    oss << "  \"governing_check\": " << quoted(governing_check) << ",\n";
    oss << "  \"governing_tier\": " << governing_tier << ",\n";
    oss << "  \"total_weight_kg\": " << total.weight_kg << ",\n";

    oss << "  \"per_tier_weight_kg\": {";
    for (size_t i = 0; i < tiers.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << quoted(std::to_string(tiers[i].tier)) << ": " << tiers[i].weight_kg;
    }
    oss << "},\n";

    oss << "  \"checks\": {";
    for (size_t i = 0; i < check_priority().size(); ++i) {
        CheckCategory category = check_priority()[i];
        if (i > 0) oss << ", ";
        oss << quoted(check_category_to_string(category)) << ": "
            << quoted(verdict_to_string(verdict(category)));
    }
    oss << "},\n";

    oss << "  \"notes\": [";
    for (size_t i = 0; i < notes.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << quoted(notes[i]);
    }
    oss << "],\n";

    oss << "  \"warnings\": [";
    for (size_t i = 0; i < warnings.warnings.size(); ++i) {
        const auto& w = warnings.warnings[i];
        if (i > 0) oss << ", ";
        oss << "{\"code\": " << quoted(w.code_string())
            << ", \"severity\": " << quoted(w.severity_string())
            << ", \"tier\": " << w.tier
            << ", \"message\": " << quoted(w.message) << "}";
    }
    oss << "],\n";

    oss << "  \"reactions_N\": ";
    write_tier_map(oss, *this, [&oss](const TierResult& r) {
        oss << "{\"left\": " << r.reactions.left_N << ", \"right\": " << r.reactions.right_N << "}";
    });
    oss << ",\n";

    oss << "  \"max_moment_kNm\": ";
    write_tier_map(oss, *this, [&oss](const TierResult& r) { oss << r.max_moment_kNm; });
    oss << ",\n";

    oss << "  \"max_deflection_mm\": ";
    write_tier_map(oss, *this, [&oss](const TierResult& r) { oss << r.max_deflection_mm; });
    oss << ",\n";

    oss << "  \"deflection_limit_mm\": " << deflection_limit_mm << ",\n";
    oss << "  \"bending_stress_N_per_mm2\": " << bending_stress_N_per_mm2 << ",\n";
    oss << "  \"allowable_stress_N_per_mm2\": " << allowable_stress_N_per_mm2 << ",\n";
    oss << "  \"rod_demand_N\": " << rod_demand_N << ",\n";
    oss << "  \"rod_capacity_N\": ";
    write_optional(oss, rod_capacity_N);
    oss << ",\n";
    oss << "  \"anchor_demand_N\": " << anchor_demand_N << ",\n";
    oss << "  \"anchor_capacity_N\": ";
    write_optional(oss, anchor_capacity_N);
    oss << ",\n";

    oss << "  \"utilization\": {";
    bool first = true;
    for (CheckCategory category : check_priority()) {
        auto it = utilization.find(category);
        if (it == utilization.end()) continue;
        if (!first) oss << ", ";
        oss << quoted(check_category_to_string(category)) << ": " << it->second;
        first = false;
    }
    oss << "},\n";

    oss << "  \"rod_min_size\": ";
    if (rod_min_size.empty()) {
        oss << "null";
    } else {
        oss << quoted(rod_min_size);
    }
    oss << ",\n";

    oss << "  \"library_used\": {"
        << "\"profile\": " << quoted(library_used.profile)
        << ", \"rod\": " << quoted(library_used.rod)
        << ", \"washer\": " << quoted(library_used.washer)
        << ", \"anchor\": " << quoted(library_used.anchor)
        << ", \"bearing_area_multiplier\": " << library_used.bearing_area_multiplier
        << "}\n";

    oss << "}";
    return oss.str();
}

} // namespace trapeze
