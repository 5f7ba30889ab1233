/**
 * @file periodic_aggregator.hpp
 * @brief Monthly and yearly open/close bars with chained period returns.
 *
 * Daily rows are grouped by (symbol, year[, month]). Within a period the
 * open is taken from the chronologically first row and the close from the
 * chronologically last row. The period return compares the close with the
 * close of the immediately preceding period of the same symbol:
 *
 *     period_return = round((close / previous_close - 1) * 100, 2)
 *
 * Boundary periods that are only partially covered by the data are
 * aggregated from whatever rows exist.
 */

#ifndef STOCKMETRICS_ANALYTICS_PERIODIC_AGGREGATOR_HPP
#define STOCKMETRICS_ANALYTICS_PERIODIC_AGGREGATOR_HPP

#include "analytics/returns_calculator.hpp"

#include <string>
#include <vector>

namespace stockmetrics
{
    namespace analytics
    {

        /**
         * @struct MonthlyBar
         * @brief One calendar month of one symbol.
         */
        struct MonthlyBar
        {
            std::string symbol;
            int year;
            int month;             ///< 1-12
            double monthly_open;   ///< Open of the first trading day
            double monthly_close;  ///< Close of the last trading day
            double monthly_return; ///< Null for the symbol's first month
        };

        /**
         * @struct YearlyBar
         * @brief One calendar year of one symbol.
         */
        struct YearlyBar
        {
            std::string symbol;
            int year;
            double yearly_open;    ///< Open of the first trading day
            double yearly_close;   ///< Close of the last trading day
            double previous_close; ///< Previous year's close (null for the first year)
            double yearly_return;  ///< Null for the symbol's first year
        };

        /**
         * @class PeriodicAggregator
         * @brief Rolls daily rows into monthly and yearly bars.
         *
         * Usage:
         * @code
         *   auto monthly = PeriodicAggregator::monthly(returns.derived);
         *   auto yearly = PeriodicAggregator::yearly(returns.derived);
         * @endcode
         */
        class PeriodicAggregator
        {
        public:
            /**
             * @brief Monthly bars sorted by (symbol, year, month).
             */
            static std::vector<MonthlyBar> monthly(const std::vector<DerivedPricePoint> &rows);

            /**
             * @brief Yearly bars sorted by (symbol, year).
             */
            static std::vector<YearlyBar> yearly(const std::vector<DerivedPricePoint> &rows);

            /**
             * @brief Chained period-over-period percentage return.
             * @return Null if either close is null or previous_close is zero.
             */
            static double period_return(double previous_close, double close);
        };

    } // namespace analytics
} // namespace stockmetrics

#endif // STOCKMETRICS_ANALYTICS_PERIODIC_AGGREGATOR_HPP
