#include "trapeze/load_model.hpp"

#include <algorithm>
#include <cmath>

namespace trapeze {

namespace {

std::string default_label(size_t index) {
    return "Load " + std::to_string(index + 1);
}

std::vector<PointLoad> normalize_legacy(const std::vector<RawLoadEntry>& raw_loads,
                                        double span_mm, int tier, WarningList* warnings) {
    std::vector<double> magnitudes;
    magnitudes.reserve(raw_loads.size());

    for (size_t i = 0; i < raw_loads.size(); ++i) {
        const auto& entry = raw_loads[i];
        std::optional<double> magnitude;
        if (const auto* d = std::get_if<double>(&entry)) {
            magnitude = as_number(FieldValue(*d));
        } else if (const auto* s = std::get_if<std::string>(&entry)) {
            magnitude = as_number(FieldValue(*s));
        }

        if (!magnitude) {
            if (warnings) warnings->add(TrapezeWarning::malformed_load(tier, i, "not a number"));
            continue;
        }
        if (*magnitude <= 0.0) {
            if (warnings) warnings->add(TrapezeWarning::non_positive_load(tier, i, *magnitude));
            continue;
        }
        magnitudes.push_back(*magnitude);
    }

    // Evenly spaced interior points, never on a support
    std::vector<PointLoad> loads;
    loads.reserve(magnitudes.size());
    const double n = static_cast<double>(magnitudes.size());
    for (size_t i = 0; i < magnitudes.size(); ++i) {
        double x = span_mm * static_cast<double>(i + 1) / (n + 1.0);
        loads.emplace_back(magnitudes[i], x, default_label(i));
    }
    return loads;
}

std::vector<PointLoad> normalize_structured(const std::vector<RawLoadEntry>& raw_loads,
                                            double span_mm, int tier, WarningList* warnings) {
    std::vector<PointLoad> loads;
    loads.reserve(raw_loads.size());

    for (size_t i = 0; i < raw_loads.size(); ++i) {
        const auto* record = std::get_if<Record>(&raw_loads[i]);
        if (!record) {
            if (warnings) warnings->add(TrapezeWarning::malformed_load(tier, i, "not a load record"));
            continue;
        }

        auto magnitude = find_number(*record, {"N"});
        auto x_mm = find_number(*record, {"x_mm"});
        if (!magnitude || !x_mm) {
            if (warnings) {
                warnings->add(TrapezeWarning::malformed_load(
                    tier, i, magnitude ? "missing or non-numeric x_mm" : "missing or non-numeric N"));
            }
            continue;
        }
        if (*magnitude <= 0.0) {
            if (warnings) warnings->add(TrapezeWarning::non_positive_load(tier, i, *magnitude));
            continue;
        }

        double x = std::clamp(*x_mm, 0.0, span_mm);
        if (x != *x_mm && warnings) {
            warnings->add(TrapezeWarning::load_clamped(tier, i, *x_mm, span_mm));
        }

        auto label = find_string(*record, {"label"});
        loads.emplace_back(*magnitude, x, label ? *label : default_label(i));
    }
    return loads;
}

std::vector<PointLoad> normalize(const std::vector<RawLoadEntry>& raw_loads, double span_mm,
                                 int tier, WarningList* warnings) {
    const double span = (std::isfinite(span_mm) && span_mm > 0.0) ? span_mm : 0.0;

    switch (detect_load_list_shape(raw_loads)) {
        case LoadListShape::Structured:
            return normalize_structured(raw_loads, span, tier, warnings);
        case LoadListShape::Legacy:
        default:
            return normalize_legacy(raw_loads, span, tier, warnings);
    }
}

} // namespace

LoadListShape detect_load_list_shape(const std::vector<RawLoadEntry>& raw_loads) {
    for (const auto& entry : raw_loads) {
        if (std::holds_alternative<Record>(entry)) {
            return LoadListShape::Structured;
        }
    }
    return LoadListShape::Legacy;
}

std::vector<PointLoad> normalize_tier_loads(const std::vector<RawLoadEntry>& raw_loads,
                                            double span_mm) {
    return normalize(raw_loads, span_mm, 0, nullptr);
}

std::vector<PointLoad> normalize_tier_loads(const std::vector<RawLoadEntry>& raw_loads,
                                            double span_mm, int tier, WarningList& warnings) {
    return normalize(raw_loads, span_mm, tier, &warnings);
}

double total_load(const std::vector<PointLoad>& loads) {
    double total = 0.0;
    for (const auto& load : loads) {
        total += load.magnitude_N();
    }
    return total;
}

} // namespace trapeze
