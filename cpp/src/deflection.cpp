#include "trapeze/deflection.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace trapeze {

namespace {

bool degenerate(double L, double E, double I) {
    return !(L > 0.0) || !(E > 0.0) || !(I > 0.0);
}

// Deflection under a single load, valid for 0 <= x <= L
double point_load_deflection(double L, double EI, double P, double a, double x) {
    const double b = L - a;
    if (x <= a) {
        return P * b * x * (L * L - b * b - x * x) / (6.0 * L * EI);
    }
    const double xr = L - x;
    return P * a * xr * (L * L - a * a - xr * xr) / (6.0 * L * EI);
}

// Calls fn(x) for x = 0, step, 2*step, ... below L, then for L itself
template <typename Fn>
void for_each_station(double L, double step, Fn&& fn) {
    const double tol = 1e-9 * L;
    for (std::size_t i = 0; i < kMaxSampleIntervals; ++i) {
        const double xi = static_cast<double>(i) * step;
        if (xi > L - tol) break;
        fn(xi);
    }
    fn(L);
}

} // namespace

double sample_step(double span_mm, const CheckConfig& config) {
    const double L = span_mm > 0.0 ? span_mm : 0.0;
    const double lo = std::min(config.min_sample_step_mm, config.max_sample_step_mm);
    const double hi = std::max(config.min_sample_step_mm, config.max_sample_step_mm);

    double step = L / config.sample_divisions;
    if (!(step >= lo)) step = lo;
    if (step > hi) step = hi;

    const double coarsest = L / static_cast<double>(kMaxSampleIntervals);
    if (!(step >= coarsest) || !std::isfinite(step)) {
        step = coarsest;
    }
    return step;
}

bool sampling_coarsened(double span_mm, const CheckConfig& config) {
    if (!(span_mm > 0.0)) {
        return false;
    }
    return sample_step(span_mm, config) >
           std::max(config.min_sample_step_mm, config.max_sample_step_mm);
}

Eigen::VectorXd sample_stations(double span_mm, const CheckConfig& config) {
    if (!(span_mm > 0.0) || !std::isfinite(span_mm)) {
        return Eigen::VectorXd::Zero(1);
    }

    std::vector<double> x;
    for_each_station(span_mm, sample_step(span_mm, config),
                     [&x](double xi) { x.push_back(xi); });

    return Eigen::Map<Eigen::VectorXd>(x.data(), static_cast<Eigen::Index>(x.size()));
}

double deflection_at(double span_mm, const std::vector<PointLoad>& loads,
                     double E, double I, double x_mm) {
    if (degenerate(span_mm, E, I)) {
        return 0.0;
    }

    const double EI = E * I;
    double v = 0.0;
    for (const auto& load : loads) {
        v += point_load_deflection(span_mm, EI, load.magnitude_N(), load.position_mm(), x_mm);
    }
    return v;
}

double max_deflection(double span_mm, const std::vector<PointLoad>& loads,
                      double E, double I, const CheckConfig& config) {
    if (degenerate(span_mm, E, I) || loads.empty() || !std::isfinite(span_mm)) {
        return 0.0;
    }

    double v_max = 0.0;
    for_each_station(span_mm, sample_step(span_mm, config), [&](double x) {
        v_max = std::max(v_max, std::abs(deflection_at(span_mm, loads, E, I, x)));
    });
    return v_max;
}

Eigen::VectorXd deflection_diagram(double span_mm, const std::vector<PointLoad>& loads,
                                   double E, double I, const Eigen::VectorXd& stations) {
    Eigen::VectorXd v(stations.size());
    for (Eigen::Index i = 0; i < stations.size(); ++i) {
        v(i) = deflection_at(span_mm, loads, E, I, stations(i));
    }
    return v;
}

} // namespace trapeze
