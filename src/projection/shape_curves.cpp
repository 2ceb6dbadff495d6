/**
 * @file shape_curves.cpp
 * @brief Implementation of the S-curve and J-curve pacing shapes.
 */

#include "projection/shape_curves.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace privcap
{
    namespace projection
    {

        namespace
        {

            void validate_shape_args(int n, double steepness, const char *name)
            {
                if (n < 0)
                {
                    throw std::invalid_argument(
                        "Number of periods must be non-negative, got: " + std::to_string(n));
                }
                if (!(steepness > 0.0))
                {
                    throw std::invalid_argument(
                        std::string(name) + " must be positive, got: " + std::to_string(steepness));
                }
            }

            Eigen::VectorXd normalize(const Eigen::VectorXd &raw)
            {
                double total = raw.sum();
                if (total > 0.0)
                {
                    return raw / total;
                }
                return Eigen::VectorXd::Zero(raw.size());
            }

        } // anonymous namespace

        Eigen::VectorXd generate_s_curve(int n, int peak_period, double steepness)
        {
            validate_shape_args(n, steepness, "steepness");

            Eigen::VectorXd raw(n);
            const double scale = static_cast<double>(n) / steepness;
            for (int i = 0; i < n; ++i)
            {
                double x = (i - peak_period) / scale;
                raw(i) = 1.0 / (1.0 + std::exp(-x));
            }
            return normalize(raw);
        }

        Eigen::VectorXd generate_j_curve(int n, int trough_period, double recovery_steepness)
        {
            validate_shape_args(n, recovery_steepness, "recovery_steepness");

            Eigen::VectorXd raw(n);
            for (int i = 0; i < n; ++i)
            {
                if (i < trough_period)
                {
                    raw(i) = 0.01;
                }
                else
                {
                    double x = (i - trough_period) / recovery_steepness;
                    raw(i) = std::exp(x / n);
                }
            }
            return normalize(raw);
        }

    } // namespace projection
} // namespace privcap
