#include "trapeze/rod_sizing.hpp"

#include <algorithm>
#include <cctype>

namespace trapeze {

std::string parse_rod_size(const std::string& label) {
    std::string upper = label;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (size_t pos = upper.find('M'); pos != std::string::npos; pos = upper.find('M', pos + 1)) {
        size_t i = pos + 1;
        while (i < upper.size() && std::isspace(static_cast<unsigned char>(upper[i]))) ++i;

        size_t start = i;
        while (i < upper.size() && std::isdigit(static_cast<unsigned char>(upper[i]))) ++i;
        if (i > start) {
            return "M" + upper.substr(start, i - start);
        }
    }
    return upper;
}

std::optional<int> rod_size_rank(const std::string& label) {
    const std::string size = parse_rod_size(label);
    const auto& order = rod_size_order();
    auto it = std::find(order.begin(), order.end(), size);
    if (it == order.end()) {
        return std::nullopt;
    }
    return static_cast<int>(it - order.begin());
}

std::string required_rod_size(double demand_per_rod_N,
                              const std::map<std::string, double>& capacities) {
    // Normalize table keys so "m10" and "M10" rows both count
    std::map<std::string, double> by_size;
    for (const auto& kv : capacities) {
        by_size[parse_rod_size(kv.first)] = kv.second;
    }

    for (const auto& size : rod_size_order()) {
        auto it = by_size.find(size);
        if (it == by_size.end() || !(it->second > 0.0)) continue;
        if (it->second >= demand_per_rod_N) {
            return size;
        }
    }
    return rod_size_order().back();
}

} // namespace trapeze
