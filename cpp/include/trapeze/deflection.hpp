#pragma once

#include "trapeze/check_config.hpp"
#include "trapeze/load_model.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace trapeze {

// ============================================================================
// Euler-Bernoulli deflection of a simply-supported span under point loads
// ============================================================================
//
// Single load P at a (b = L - a), position x:
//   x <= a:  v(x) = P*b*x*(L² - b² - x²) / (6*L*E*I)
//   x >  a:  same formula with x -> L - x and a <-> b
//
// Loads are superposed. Positive values are downward deflection [mm] for
// E [N/mm²] and I [mm⁴].
// ============================================================================

/// Upper bound on sampling intervals per span
constexpr std::size_t kMaxSampleIntervals = 1000000;

/**
 * @brief Sampling step along the span [mm]
 *
 * step = clamp(L / sample_divisions, min_sample_step_mm, max_sample_step_mm)
 *
 * The bounds are used in ascending order whatever order the config gives.
 * Spans that would need more than kMaxSampleIntervals intervals are sampled
 * with the coarser step L / kMaxSampleIntervals.
 */
double sample_step(double span_mm, const CheckConfig& config = CheckConfig());

/**
 * @brief True if the span is too long for the configured step bounds
 */
bool sampling_coarsened(double span_mm, const CheckConfig& config = CheckConfig());

/**
 * @brief Stations 0, step, 2*step, ... with the last station exactly at L
 *
 * Returns a single station at 0 for L <= 0. At most
 * kMaxSampleIntervals + 1 stations are returned.
 */
Eigen::VectorXd sample_stations(double span_mm, const CheckConfig& config = CheckConfig());

/**
 * @brief Deflection at x from all loads [mm]
 *
 * Returns 0 for L <= 0, E <= 0 or I <= 0.
 */
double deflection_at(double span_mm, const std::vector<PointLoad>& loads,
                     double E, double I, double x_mm);

/**
 * @brief Maximum absolute sampled deflection [mm]
 *
 * Degenerate inputs (L <= 0, E <= 0, I <= 0) yield 0.0. Missing section
 * data is a bending check concern, handled by the evaluator. Stations are
 * visited one at a time; no station vector is built.
 *
 * @param span_mm Span L [mm]
 * @param loads Point loads
 * @param E Young's modulus [N/mm²]
 * @param I Second moment of area [mm⁴]
 * @param config Supplies the sampling step rule
 */
double max_deflection(double span_mm, const std::vector<PointLoad>& loads,
                      double E, double I, const CheckConfig& config = CheckConfig());

/**
 * @brief Deflection at each station [mm]
 */
Eigen::VectorXd deflection_diagram(double span_mm, const std::vector<PointLoad>& loads,
                                   double E, double I, const Eigen::VectorXd& stations);

} // namespace trapeze
