/**
 * @file calendar.cpp
 * @brief Implementation of the YYYY-MM-DD date helpers.
 */

#include "data/calendar.hpp"

#include <cctype>
#include <ctime>
#include <stdexcept>

namespace stockmetrics
{
    namespace calendar
    {

        namespace
        {
            bool is_leap_year(int year)
            {
                return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
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

            // Noon avoids DST transitions moving the date when normalizing.
            std::tm to_tm(const std::string &date)
            {
                std::tm tm = {};
                tm.tm_year = extract_year(date) - 1900;
                tm.tm_mon = extract_month(date) - 1;
                tm.tm_mday = extract_day(date);
                tm.tm_hour = 12;
                return tm;
            }

            std::string format_tm(const std::tm &tm)
            {
                char buffer[11];
                std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
                return std::string(buffer);
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

            int month = extract_month(date);
            int day = extract_day(date);
            if (month < 1 || month > 12)
                return false;
            return day >= 1 && day <= days_in_month(extract_year(date), month);
        }

        int extract_year(const std::string &date)
        {
            if (date.length() < 4)
            {
                throw std::invalid_argument("Malformed date: '" + date + "'");
            }
            return std::stoi(date.substr(0, 4));
        }

        int extract_month(const std::string &date)
        {
            if (date.length() < 7)
            {
                throw std::invalid_argument("Malformed date: '" + date + "'");
            }
            return std::stoi(date.substr(5, 2));
        }

        int extract_day(const std::string &date)
        {
            if (date.length() < 10)
            {
                throw std::invalid_argument("Malformed date: '" + date + "'");
            }
            return std::stoi(date.substr(8, 2));
        }

        int day_of_week(const std::string &date)
        {
            std::tm tm = to_tm(date);
            std::mktime(&tm);
            // tm_wday: 0=Sun, 1=Mon ... 6=Sat
            return (tm.tm_wday + 6) % 7;
        }

        std::string add_days(const std::string &date, int days_offset)
        {
            std::tm tm = to_tm(date);
            tm.tm_mday += days_offset;
            if (std::mktime(&tm) == static_cast<std::time_t>(-1))
            {
                throw std::runtime_error("Date arithmetic failed for: " + date);
            }
            return format_tm(tm);
        }

        std::string next_weekday(const std::string &date)
        {
            std::string next = add_days(date, 1);
            while (day_of_week(next) >= 5)
            {
                next = add_days(next, 1);
            }
            return next;
        }

    } // namespace calendar
} // namespace stockmetrics
