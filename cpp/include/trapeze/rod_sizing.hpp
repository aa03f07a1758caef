#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>

namespace trapeze {

/// Metric threaded rod sizes, smallest first
inline const std::array<std::string, 6>& rod_size_order() {
    static const std::array<std::string, 6> order = {"M6", "M8", "M10", "M12", "M16", "M20"};
    return order;
}

/**
 * @brief Normalize a rod label to "M<diameter>"
 *
 * "m10", "M 10" and "M10 A4-70" all give "M10". Labels without an M size
 * are returned uppercased.
 */
std::string parse_rod_size(const std::string& label);

/**
 * @brief Position of a size in rod_size_order()
 * @return Index, or std::nullopt for sizes outside the table
 */
std::optional<int> rod_size_rank(const std::string& label);

/**
 * @brief Smallest rod whose tension capacity covers the demand
 *
 * Sizes missing from `capacities`, or with non-positive capacity, are
 * skipped. When no size is sufficient the largest size (M20) is returned.
 *
 * @param demand_per_rod_N Tension per rod [N]
 * @param capacities Tension capacity per size label [N]
 */
std::string required_rod_size(double demand_per_rod_N,
                              const std::map<std::string, double>& capacities);

} // namespace trapeze
