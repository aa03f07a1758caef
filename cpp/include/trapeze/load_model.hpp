#pragma once

#include "trapeze/catalog.hpp"
#include "trapeze/warnings.hpp"

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace trapeze {

/**
 * @brief Concentrated vertical load on the bracket beam
 *
 * Positions are measured from the left support. A PointLoad produced by
 * normalize_tier_loads() always has magnitude > 0 and a position inside
 * [0, span].
 */
class PointLoad {
public:
    /**
     * @brief Construct a point load
     * @param magnitude_N Load magnitude [N]
     * @param position_mm Distance from left support [mm]
     * @param label Display label, e.g. "Load 1"
     */
    PointLoad(double magnitude_N, double position_mm, std::string label)
        : magnitude_N_(magnitude_N), position_mm_(position_mm), label_(std::move(label)) {}

    double magnitude_N() const { return magnitude_N_; }
    double position_mm() const { return position_mm_; }
    const std::string& label() const { return label_; }

private:
    double magnitude_N_;
    double position_mm_;
    std::string label_;
};

/**
 * @brief One load entry as persisted in the project snapshot
 *
 * Older snapshots store a tier's loads as bare magnitudes [N]; newer ones
 * store records with fields N, x_mm and optional label. Anything else
 * (none, free text) is malformed and skipped during normalization.
 */
using RawLoadEntry = std::variant<std::monostate, double, std::string, Record>;

/**
 * @brief Input shape of a tier's load list
 */
enum class LoadListShape {
    Legacy,      ///< Bare magnitudes, positioned automatically
    Structured   ///< Records with explicit positions
};

/**
 * @brief Decide the shape of a tier's load list
 *
 * A list holding at least one Record is structured; otherwise it is legacy.
 */
LoadListShape detect_load_list_shape(const std::vector<RawLoadEntry>& raw_loads);

/**
 * @brief Convert a tier's raw load list into point loads
 *
 * Legacy lists: non-numeric and non-positive entries are dropped, then the
 * remaining n loads are placed at x_i = span * (i+1)/(n+1) and labeled
 * "Load i+1".
 *
 * Structured lists: each record needs numeric N and x_mm. Records with
 * N <= 0 are dropped and positions are clamped into [0, span]. A missing
 * label becomes "Load k" with k the entry's 1-based index.
 *
 * Malformed entries are skipped without error.
 *
 * @param raw_loads Persisted load entries for one tier
 * @param span_mm Beam span [mm]; negative spans are treated as 0
 * @return Point loads in input order (possibly empty)
 */
std::vector<PointLoad> normalize_tier_loads(const std::vector<RawLoadEntry>& raw_loads,
                                            double span_mm);

/**
 * @brief Convert a tier's raw load list, recording skipped and clamped entries
 *
 * Returns the same loads as the two-argument overload.
 *
 * @param raw_loads Persisted load entries for one tier
 * @param span_mm Beam span [mm]
 * @param tier Tier number used in warnings
 * @param warnings Receives one warning per skipped or clamped entry
 */
std::vector<PointLoad> normalize_tier_loads(const std::vector<RawLoadEntry>& raw_loads,
                                            double span_mm, int tier, WarningList& warnings);

/**
 * @brief Sum of load magnitudes [N]
 */
double total_load(const std::vector<PointLoad>& loads);

} // namespace trapeze
