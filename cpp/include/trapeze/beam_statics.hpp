#pragma once

#include "trapeze/load_model.hpp"

#include <Eigen/Dense>
#include <vector>

namespace trapeze {

/**
 * @brief Vertical support reactions of a simply-supported span
 */
struct SupportReactions {
    double left_N = 0.0;   ///< Reaction at left support [N]
    double right_N = 0.0;  ///< Reaction at right support [N]

    SupportReactions() = default;
    SupportReactions(double left, double right) : left_N(left), right_N(right) {}

    /**
     * @brief Larger of the two reactions (governs rod and anchor demand)
     */
    double governing_N() const { return left_N > right_N ? left_N : right_N; }

    double sum_N() const { return left_N + right_N; }
};

/**
 * @brief Extremum location and value
 */
struct MomentExtreme {
    double x_mm = 0.0;      ///< Position from left support [mm]
    double value = 0.0;     ///< Absolute bending moment [N·mm]

    MomentExtreme() = default;
    MomentExtreme(double pos, double val) : x_mm(pos), value(val) {}
};

/**
 * @brief Support reactions by lever-arm superposition
 *
 * For each load P at a: left += P*(L-a)/L, right += P*a/L.
 * Returns zero reactions for L <= 0 or no loads.
 *
 * @param span_mm Span L [mm]
 * @param loads Point loads
 */
SupportReactions reactions(double span_mm, const std::vector<PointLoad>& loads);

/**
 * @brief Bending moment at position x (sagging positive)
 *
 * M(x) = R_left * x - sum of P_i * (x - a_i) over loads with a_i <= x.
 *
 * @param span_mm Span L [mm]
 * @param loads Point loads
 * @param x_mm Position from left support [mm]
 * @return Moment [N·mm]
 */
double moment_at(double span_mm, const std::vector<PointLoad>& loads, double x_mm);

/**
 * @brief Location and magnitude of the maximum absolute moment
 *
 * The moment diagram under point loads is piecewise linear, so its extrema
 * lie at load positions. The candidate set is both supports, every load
 * position and the midpoint between each pair of consecutive candidates.
 * Ties resolve to the leftmost candidate.
 */
MomentExtreme find_max_moment(double span_mm, const std::vector<PointLoad>& loads);

/**
 * @brief Maximum absolute bending moment [N·mm]
 */
double max_moment(double span_mm, const std::vector<PointLoad>& loads);

/**
 * @brief Bending moment at each station [N·mm]
 * @param stations Positions from left support [mm]
 */
Eigen::VectorXd moment_diagram(double span_mm, const std::vector<PointLoad>& loads,
                               const Eigen::VectorXd& stations);

} // namespace trapeze
