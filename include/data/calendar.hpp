/**
 * @file calendar.hpp
 * @brief Helpers for ISO (YYYY-MM-DD) trading dates.
 *
 * Dates are carried as strings throughout the project. Because the
 * format is fixed-width and zero-padded, lexicographic order is
 * chronological order, so dates can be compared and sorted directly.
 */

#ifndef STOCKMETRICS_DATA_CALENDAR_HPP
#define STOCKMETRICS_DATA_CALENDAR_HPP

#include <string>

namespace stockmetrics
{
    namespace calendar
    {

        /**
         * @brief Check that a string is a real calendar date in YYYY-MM-DD form.
         * @param date Date string.
         * @return true if the layout is valid and month/day are in range.
         */
        bool is_valid_date(const std::string &date);

        /** @brief Year component of a YYYY-MM-DD date. */
        int extract_year(const std::string &date);

        /** @brief Month component (1-12) of a YYYY-MM-DD date. */
        int extract_month(const std::string &date);

        /** @brief Day-of-month component of a YYYY-MM-DD date. */
        int extract_day(const std::string &date);

        /**
         * @brief Day of week, 0 = Monday ... 6 = Sunday.
         */
        int day_of_week(const std::string &date);

        /**
         * @brief Shift a date by a number of calendar days.
         * @param date Starting date.
         * @param days_offset Days to add (may be negative).
         * @return Shifted date string.
         */
        std::string add_days(const std::string &date, int days_offset);

        /**
         * @brief Next weekday strictly after the given date.
         */
        std::string next_weekday(const std::string &date);

    } // namespace calendar
} // namespace stockmetrics

#endif // STOCKMETRICS_DATA_CALENDAR_HPP
