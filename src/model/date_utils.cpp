/**
 * @file date_utils.cpp
 * @brief Implementation of the ISO date helpers.
 *
 * Day counts use the days-from-civil conversion on the proleptic
 * Gregorian calendar, so results do not depend on mktime or the
 * process time zone.
 */

#include "model/date_utils.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace privcap
{
    namespace model
    {

        namespace
        {

            bool is_leap_year(int year)
            {
                return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            }

            int days_in_month(int year, int month)
            {
                static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
                if (month == 2 && is_leap_year(year))
                {
                    return 29;
                }
                return DAYS[month - 1];
            }

            long long days_from_civil(int y, int m, int d)
            {
                y -= m <= 2 ? 1 : 0;
                const long long era = (y >= 0 ? y : y - 399) / 400;
                const long long yoe = y - era * 400;
                const long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
                const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return era * 146097 + doe - 719468;
            }

        } // anonymous namespace

        bool is_valid_date(const std::string &date)
        {
            if (date.length() != 10)
                return false;
            if (date[4] != '-' || date[7] != '-')
                return false;

            for (size_t i = 0; i < date.length(); ++i)
            {
                if (i == 4 || i == 7)
                    continue;
                if (!std::isdigit(static_cast<unsigned char>(date[i])))
                    return false;
            }

            int month = std::stoi(date.substr(5, 2));
            int day = std::stoi(date.substr(8, 2));
            if (month < 1 || month > 12)
                return false;
            return day >= 1 && day <= days_in_month(std::stoi(date.substr(0, 4)), month);
        }

        void require_valid_date(const std::string &date)
        {
            if (!is_valid_date(date))
            {
                throw std::invalid_argument("Expected a YYYY-MM-DD date, got: '" + date + "'");
            }
        }

        int extract_year(const std::string &date)
        {
            require_valid_date(date);
            return std::stoi(date.substr(0, 4));
        }

        int extract_month(const std::string &date)
        {
            require_valid_date(date);
            return std::stoi(date.substr(5, 2));
        }

        int extract_day(const std::string &date)
        {
            require_valid_date(date);
            return std::stoi(date.substr(8, 2));
        }

        int quarter_of(const std::string &date)
        {
            return (extract_month(date) - 1) / 3 + 1;
        }

        long long days_since_epoch(const std::string &date)
        {
            return days_from_civil(extract_year(date), extract_month(date), extract_day(date));
        }

        long long days_between(const std::string &from, const std::string &to)
        {
            return days_since_epoch(to) - days_since_epoch(from);
        }

        double year_fraction(const std::string &from, const std::string &to)
        {
            return static_cast<double>(days_between(from, to)) / DAYS_PER_YEAR;
        }

        std::string format_date(int year, int month, int day)
        {
            char buffer[16];
            std::snprintf(buffer, sizeof buffer, "%04d-%02d-%02d", year, month, day);
            return std::string(buffer);
        }

        std::string year_start(const std::string &date)
        {
            return format_date(extract_year(date), 1, 1);
        }

        std::string next_quarter_end(const std::string &date)
        {
            int year = extract_year(date);
            int month = extract_month(date);
            int day = extract_day(date);

            int end_month = ((month - 1) / 3 + 1) * 3;
            bool on_quarter_end = month == end_month && day == days_in_month(year, month);
            if (on_quarter_end)
            {
                end_month += 3;
                if (end_month > 12)
                {
                    end_month -= 12;
                    ++year;
                }
            }
            return format_date(year, end_month, days_in_month(year, end_month));
        }

        std::vector<std::string> quarter_end_dates(const std::string &as_of, int count)
        {
            if (count < 0)
            {
                throw std::invalid_argument(
                    "Expected non-negative quarter count, got: " + std::to_string(count));
            }
            require_valid_date(as_of);

            std::vector<std::string> dates;
            dates.reserve(static_cast<size_t>(count));
            std::string current = as_of;
            for (int i = 0; i < count; ++i)
            {
                current = next_quarter_end(current);
                dates.push_back(current);
            }
            return dates;
        }

    } // namespace model
} // namespace privcap
