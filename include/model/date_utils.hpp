/**
 * @file date_utils.hpp
 * @brief Calendar helpers for ISO (YYYY-MM-DD) date strings.
 *
 * Dates travel through the engine as plain ISO strings so that
 * lexicographic order equals chronological order. These helpers provide
 * validation, field extraction, day counts and quarter-end generation
 * without touching the system clock or the local time zone.
 */

#ifndef PRIVCAP_MODEL_DATE_UTILS_HPP
#define PRIVCAP_MODEL_DATE_UTILS_HPP

#include <string>
#include <vector>

namespace privcap
{
    namespace model
    {

        /// Day-count basis used for year fractions (Actual/365.25).
        constexpr double DAYS_PER_YEAR = 365.25;

        /**
         * @brief Check that a string is a real calendar date in YYYY-MM-DD form.
         * @param date Candidate date string.
         * @return true if the layout is correct and the day exists in that month.
         */
        bool is_valid_date(const std::string &date);

        /**
         * @brief Throw unless @p date is a valid YYYY-MM-DD date.
         * @throws std::invalid_argument naming the offending value.
         */
        void require_valid_date(const std::string &date);

        int extract_year(const std::string &date);
        int extract_month(const std::string &date);
        int extract_day(const std::string &date);

        /**
         * @brief Calendar quarter (1-4) of a date.
         */
        int quarter_of(const std::string &date);

        /**
         * @brief Number of days since 1970-01-01 in the proleptic Gregorian calendar.
         * @throws std::invalid_argument if the date is not valid.
         */
        long long days_since_epoch(const std::string &date);

        /**
         * @brief Signed day count from @p from to @p to.
         */
        long long days_between(const std::string &from, const std::string &to);

        /**
         * @brief Actual/365.25 year fraction from @p from to @p to.
         */
        double year_fraction(const std::string &from, const std::string &to);

        /**
         * @brief Format a year/month/day triple as YYYY-MM-DD.
         */
        std::string format_date(int year, int month, int day);

        /**
         * @brief January 1st of the year of @p date.
         */
        std::string year_start(const std::string &date);

        /**
         * @brief First calendar quarter-end strictly after @p date.
         *
         * 2025-12-31 -> 2026-03-31, 2026-02-10 -> 2026-03-31.
         */
        std::string next_quarter_end(const std::string &date);

        /**
         * @brief Successive quarter-end dates strictly after @p as_of.
         * @param as_of Valuation date.
         * @param count Number of quarter-ends to generate.
         * @throws std::invalid_argument if @p count is negative or @p as_of invalid.
         */
        std::vector<std::string> quarter_end_dates(const std::string &as_of, int count);

    } // namespace model
} // namespace privcap

#endif // PRIVCAP_MODEL_DATE_UTILS_HPP
