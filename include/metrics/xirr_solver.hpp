/**
 * @file xirr_solver.hpp
 * @brief Newton-Raphson internal rate of return for irregularly dated flows.
 *
 * Solves for r such that
 *
 *     sum_i cf_i / (1 + r)^(t_i) = 0
 *
 * where t_i is the Actual/365.25 year fraction of dates[i] measured from
 * dates[0]. Failure never throws: the result carries an absent rate plus a
 * status and message describing why the solve stopped.
 *
 * Usage:
 * @code
 *   XirrSolver solver;
 *   auto result = solver.solve({-100000, 121000}, {"2020-01-01", "2022-01-01"});
 *   if (result.success()) { double irr = *result.rate; }
 * @endcode
 */

#ifndef PRIVCAP_METRICS_XIRR_SOLVER_HPP
#define PRIVCAP_METRICS_XIRR_SOLVER_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace privcap
{
    namespace metrics
    {

        /**
         * @enum XirrStatus
         * @brief Outcome of an IRR solve.
         */
        enum class XirrStatus
        {
            CONVERGED,            ///< |NPV| fell below tolerance
            INSUFFICIENT_DATA,    ///< Fewer than two flows
            SIZE_MISMATCH,        ///< cash_flows and dates differ in length
            INVALID_DATE,         ///< A date is not YYYY-MM-DD
            DERIVATIVE_TOO_SMALL, ///< |dNPV/dr| below tolerance
            DIVERGED,             ///< Rate left the admissible band
            MAX_ITERATIONS,       ///< Iteration budget exhausted
            NUMERIC_ERROR,        ///< Overflow / NaN during an iteration
            NOT_COMPUTED          ///< No solve attempted (e.g. pooled ratios only)
        };

        std::string to_string(XirrStatus status);

        /**
         * @struct XirrOptions
         * @brief Solver controls.
         */
        struct XirrOptions
        {
            double initial_guess = 0.1; ///< Starting rate
            int max_iterations = 100;   ///< Newton step budget
            double tolerance = 1e-6;    ///< |NPV| convergence and |dNPV| stability threshold
            double min_rate = -0.99;    ///< Lower edge of the admissible band
            double max_rate = 10.0;     ///< Upper edge of the admissible band
            bool verbose = false;       ///< Report failures on stderr

            /**
             * @brief Validate option ranges.
             * @throws std::invalid_argument if inconsistent.
             */
            void validate() const;

            nlohmann::json to_json() const;
            static XirrOptions from_json(const nlohmann::json &j);
        };

        /**
         * @struct XirrResult
         * @brief Solved rate (if any) with diagnostics.
         */
        struct XirrResult
        {
            std::optional<double> rate; ///< Converged annual rate
            XirrStatus status;
            int iterations;             ///< Newton iterations performed
            std::string message;

            XirrResult();

            bool success() const { return status == XirrStatus::CONVERGED && rate.has_value(); }
        };

        /**
         * @class XirrSolver
         * @brief Newton-Raphson XIRR with divergence and stability guards.
         *
         * Thread safety: solve() is const and keeps no state between calls.
         */
        class XirrSolver
        {
        public:
            /**
             * @throws std::invalid_argument if options are invalid.
             */
            explicit XirrSolver(const XirrOptions &options = XirrOptions());

            /**
             * @brief Solve for the IRR.
             * @param cash_flows Signed amounts (negative = paid in).
             * @param dates Booking dates aligned with cash_flows; dates[0] is t = 0.
             * @return XirrResult; rate is empty unless status is CONVERGED.
             */
            XirrResult solve(const std::vector<double> &cash_flows,
                             const std::vector<std::string> &dates) const;

            const XirrOptions &options() const { return options_; }

        private:
            XirrOptions options_;

            XirrResult fail(XirrStatus status, const std::string &message, int iterations) const;
        };

        /**
         * @brief Convenience wrapper returning only the rate.
         *
         * Never throws: out-of-range solver settings (max_iterations < 1,
         * tolerance <= 0, initial_guess <= -1) yield an empty result, like any
         * other failed solve.
         */
        std::optional<double> calculate_xirr(const std::vector<double> &cash_flows,
                                             const std::vector<std::string> &dates,
                                             double initial_guess = 0.1,
                                             int max_iterations = 100,
                                             double tolerance = 1e-6);

    } // namespace metrics
} // namespace privcap

#endif // PRIVCAP_METRICS_XIRR_SOLVER_HPP
