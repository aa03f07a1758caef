#pragma once

#include "trapeze/catalog.hpp"
#include "trapeze/load_model.hpp"

#include <map>
#include <string>
#include <vector>

namespace trapeze {

/**
 * @brief Bracket definition taken from a saved project
 *
 * `loads` maps tier number (1..3) to that tier's persisted load entries.
 * Tiers above tier_count are ignored; missing tiers carry no load.
 */
struct ProjectSnapshot {
    double span_mm = 0.0;     ///< Distance between drop rods [mm]
    int tier_count = 1;       ///< Number of tiers, 1..3
    std::map<int, std::vector<RawLoadEntry>> loads;

    // Parts library selections
    std::string profile_id;
    std::string rod_id;
    std::string washer_id;
    std::string anchor_id;
};

/**
 * @brief Catalog rows resolved for the snapshot's selections
 *
 * Each record is empty when the selection could not be resolved.
 * `rod_capacities` optionally lists tension capacity [N] per rod size
 * (e.g. "M10" -> 8400) for minimum rod sizing.
 */
struct PartsLibrary {
    Record profile;
    Record rod;
    Record washer;
    Record anchor;
    std::map<std::string, double> rod_capacities;
};

} // namespace trapeze
