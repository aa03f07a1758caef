#include "trapeze/beam_statics.hpp"

#include <algorithm>
#include <cmath>

namespace trapeze {

SupportReactions reactions(double span_mm, const std::vector<PointLoad>& loads) {
    SupportReactions r;
    if (!(span_mm > 0.0)) {
        return r;
    }

    const double L = span_mm;
    for (const auto& load : loads) {
        const double P = load.magnitude_N();
        const double a = load.position_mm();
        r.left_N += P * (L - a) / L;
        r.right_N += P * a / L;
    }
    return r;
}

double moment_at(double span_mm, const std::vector<PointLoad>& loads, double x_mm) {
    if (!(span_mm > 0.0)) {
        return 0.0;
    }

    const SupportReactions r = reactions(span_mm, loads);
    double M = r.left_N * x_mm;
    for (const auto& load : loads) {
        const double a = load.position_mm();
        if (a <= x_mm) {
            M -= load.magnitude_N() * (x_mm - a);
        }
    }
    return M;
}

MomentExtreme find_max_moment(double span_mm, const std::vector<PointLoad>& loads) {
    if (!(span_mm > 0.0) || loads.empty()) {
        return MomentExtreme();
    }

    std::vector<double> points;
    points.reserve(loads.size() + 2);
    points.push_back(0.0);
    points.push_back(span_mm);
    for (const auto& load : loads) {
        points.push_back(load.position_mm());
    }
    std::sort(points.begin(), points.end());

    std::vector<double> candidates;
    candidates.reserve(2 * points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        candidates.push_back(points[i]);
        if (i + 1 < points.size()) {
            candidates.push_back(0.5 * (points[i] + points[i + 1]));
        }
    }

    MomentExtreme best;
    for (double x : candidates) {
        const double value = std::abs(moment_at(span_mm, loads, x));
        if (value > best.value) {
            best = MomentExtreme(x, value);
        }
    }
    return best;
}

double max_moment(double span_mm, const std::vector<PointLoad>& loads) {
    return find_max_moment(span_mm, loads).value;
}

Eigen::VectorXd moment_diagram(double span_mm, const std::vector<PointLoad>& loads,
                               const Eigen::VectorXd& stations) {
    Eigen::VectorXd M(stations.size());
    for (Eigen::Index i = 0; i < stations.size(); ++i) {
        M(i) = moment_at(span_mm, loads, stations(i));
    }
    return M;
}

} // namespace trapeze
