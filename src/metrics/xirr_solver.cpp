/**
 * @file xirr_solver.cpp
 * @brief Implementation of the Newton-Raphson XIRR solver.
 */

#include "metrics/xirr_solver.hpp"
#include "model/date_utils.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <iostream>
#include <stdexcept>

namespace privcap
{
    namespace metrics
    {

        std::string to_string(XirrStatus status)
        {
            switch (status)
            {
            case XirrStatus::CONVERGED:
                return "converged";
            case XirrStatus::INSUFFICIENT_DATA:
                return "insufficient_data";
            case XirrStatus::SIZE_MISMATCH:
                return "size_mismatch";
            case XirrStatus::INVALID_DATE:
                return "invalid_date";
            case XirrStatus::DERIVATIVE_TOO_SMALL:
                return "derivative_too_small";
            case XirrStatus::DIVERGED:
                return "diverged";
            case XirrStatus::MAX_ITERATIONS:
                return "max_iterations";
            case XirrStatus::NUMERIC_ERROR:
                return "numeric_error";
            case XirrStatus::NOT_COMPUTED:
                return "not_computed";
            }
            return "unknown";
        }

        // ============================================================================
        // XirrOptions Implementation
        // ============================================================================

        void XirrOptions::validate() const
        {
            if (max_iterations < 1)
            {
                throw std::invalid_argument(
                    "max_iterations must be positive, got: " + std::to_string(max_iterations));
            }
            if (tolerance <= 0.0)
            {
                throw std::invalid_argument(
                    "tolerance must be positive, got: " + std::to_string(tolerance));
            }
            if (min_rate <= -1.0 || min_rate >= max_rate)
            {
                throw std::invalid_argument(
                    "Rate band must satisfy -1 < min_rate < max_rate, got: [" +
                    std::to_string(min_rate) + ", " + std::to_string(max_rate) + "]");
            }
            if (initial_guess <= -1.0)
            {
                throw std::invalid_argument(
                    "initial_guess must be greater than -1, got: " + std::to_string(initial_guess));
            }
        }

        nlohmann::json XirrOptions::to_json() const
        {
            return nlohmann::json{
                {"initial_guess", initial_guess},
                {"max_iterations", max_iterations},
                {"tolerance", tolerance},
                {"min_rate", min_rate},
                {"max_rate", max_rate},
                {"verbose", verbose}};
        }

        XirrOptions XirrOptions::from_json(const nlohmann::json &j)
        {
            XirrOptions options;
            options.initial_guess = j.value("initial_guess", options.initial_guess);
            options.max_iterations = j.value("max_iterations", options.max_iterations);
            options.tolerance = j.value("tolerance", options.tolerance);
            options.min_rate = j.value("min_rate", options.min_rate);
            options.max_rate = j.value("max_rate", options.max_rate);
            options.verbose = j.value("verbose", options.verbose);
            options.validate();
            return options;
        }

        XirrResult::XirrResult()
            : status(XirrStatus::NOT_COMPUTED),
              iterations(0)
        {
        }

        // ============================================================================
        // XirrSolver Implementation
        // ============================================================================

        XirrSolver::XirrSolver(const XirrOptions &options)
            : options_(options)
        {
            options_.validate();
        }

        XirrResult XirrSolver::solve(const std::vector<double> &cash_flows,
                                     const std::vector<std::string> &dates) const
        {
            if (cash_flows.size() < 2)
            {
                return fail(XirrStatus::INSUFFICIENT_DATA,
                            "Insufficient cash flows for IRR calculation (need at least 2, got " +
                                std::to_string(cash_flows.size()) + ")",
                            0);
            }
            if (cash_flows.size() != dates.size())
            {
                return fail(XirrStatus::SIZE_MISMATCH,
                            "Cash flows (" + std::to_string(cash_flows.size()) +
                                ") and dates (" + std::to_string(dates.size()) + ") must have the same length",
                            0);
            }

            const Eigen::Index n = static_cast<Eigen::Index>(cash_flows.size());
            Eigen::ArrayXd cf(n);
            Eigen::ArrayXd t(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                const auto &date = dates[static_cast<size_t>(i)];
                if (!model::is_valid_date(date))
                {
                    return fail(XirrStatus::INVALID_DATE, "Invalid cash flow date: '" + date + "'", 0);
                }
                cf(i) = cash_flows[static_cast<size_t>(i)];
                t(i) = model::year_fraction(dates.front(), date);
            }

            double rate = options_.initial_guess;

            for (int iteration = 0; iteration < options_.max_iterations; ++iteration)
            {
                // (1 + r)^t evaluated as exp(t * log1p(r))
                Eigen::ArrayXd growth = (t * std::log1p(rate)).exp();
                double npv = (cf / growth).sum();
                double dnpv = (-cf * t / (growth * (1.0 + rate))).sum();

                if (!std::isfinite(npv) || !std::isfinite(dnpv))
                {
                    return fail(XirrStatus::NUMERIC_ERROR,
                                "Non-finite NPV at rate " + std::to_string(rate), iteration + 1);
                }

                if (std::abs(npv) < options_.tolerance)
                {
                    XirrResult result;
                    result.rate = rate;
                    result.status = XirrStatus::CONVERGED;
                    result.iterations = iteration + 1;
                    result.message = "converged";
                    return result;
                }

                if (std::abs(dnpv) < options_.tolerance)
                {
                    return fail(XirrStatus::DERIVATIVE_TOO_SMALL,
                                "Derivative too small, IRR calculation unstable", iteration + 1);
                }

                rate -= npv / dnpv;

                if (!std::isfinite(rate))
                {
                    return fail(XirrStatus::NUMERIC_ERROR, "Newton step produced a non-finite rate", iteration + 1);
                }
                if (rate < options_.min_rate || rate > options_.max_rate)
                {
                    return fail(XirrStatus::DIVERGED,
                                "IRR calculation diverging (rate=" + std::to_string(rate) + ")", iteration + 1);
                }
            }

            return fail(XirrStatus::MAX_ITERATIONS,
                        "IRR did not converge after " + std::to_string(options_.max_iterations) + " iterations",
                        options_.max_iterations);
        }

        XirrResult XirrSolver::fail(XirrStatus status, const std::string &message, int iterations) const
        {
            if (options_.verbose)
            {
                std::cerr << "Warning: " << message << "\n";
            }

            XirrResult result;
            result.status = status;
            result.iterations = iterations;
            result.message = message;
            return result;
        }

        std::optional<double> calculate_xirr(const std::vector<double> &cash_flows,
                                             const std::vector<std::string> &dates,
                                             double initial_guess,
                                             int max_iterations,
                                             double tolerance)
        {
            XirrOptions options;
            options.initial_guess = initial_guess;
            options.max_iterations = max_iterations;
            options.tolerance = tolerance;

            try
            {
                options.validate();
            }
            catch (const std::invalid_argument &)
            {
                return std::nullopt;
            }

            return XirrSolver(options).solve(cash_flows, dates).rate;
        }

    } // namespace metrics
} // namespace privcap
