/**
 * @file shape_curves.hpp
 * @brief Normalized pacing shapes for capital calls and distributions.
 *
 * Both shapes return weights that sum to 1.0 (or all zeros when the raw
 * weights sum to zero), so multiplying a balance by weight[q] paces it
 * across the projection horizon.
 */

#ifndef PRIVCAP_PROJECTION_SHAPE_CURVES_HPP
#define PRIVCAP_PROJECTION_SHAPE_CURVES_HPP

#include <Eigen/Dense>

namespace privcap
{
    namespace projection
    {

        /**
         * @brief Sigmoid deployment profile.
         *
         * Raw weight of period i is 1 / (1 + exp(-x_i)) with
         * x_i = (i - peak_period) / (n / steepness).
         *
         * @param n Number of periods (0 yields an empty vector)
         * @param peak_period Period at the sigmoid midpoint
         * @param steepness Higher values give a sharper ramp
         * @return Normalized weights of length n
         * @throws std::invalid_argument if n < 0 or steepness <= 0
         */
        Eigen::VectorXd generate_s_curve(int n, int peak_period, double steepness = 2.0);

        /**
         * @brief Trough-then-recovery distribution profile.
         *
         * Raw weight is 0.01 before the trough and
         * exp(((i - trough_period) / recovery_steepness) / n) from the trough on.
         *
         * @throws std::invalid_argument if n < 0 or recovery_steepness <= 0
         */
        Eigen::VectorXd generate_j_curve(int n, int trough_period, double recovery_steepness = 1.5);

    } // namespace projection
} // namespace privcap

#endif // PRIVCAP_PROJECTION_SHAPE_CURVES_HPP
