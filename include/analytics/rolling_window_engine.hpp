/**
 * @file rolling_window_engine.hpp
 * @brief Per-symbol rolling volatility and volume, with yearly summaries.
 *
 * Rolling statistics are computed independently for each symbol over its
 * date-ordered rows, so a window never spans two symbols:
 *  - rolling_volatility: sample standard deviation of daily_return
 *    (the alignment is a parameter of each call);
 *  - rolling_volume: mean volume over a trailing window, always.
 *
 * The yearly volatility summary is fed by the CENTERED volatility taken
 * within each calendar year, the correlation features by the TRAILING one.
 */

#ifndef STOCKMETRICS_ANALYTICS_ROLLING_WINDOW_ENGINE_HPP
#define STOCKMETRICS_ANALYTICS_ROLLING_WINDOW_ENGINE_HPP

#include "analytics/returns_calculator.hpp"
#include "analytics/rolling_statistics.hpp"

#include <string>
#include <vector>

namespace stockmetrics
{
    namespace analytics
    {

        /**
         * @struct RollingStat
         * @brief Rolling metrics of one symbol on one date.
         */
        struct RollingStat
        {
            std::string symbol;
            std::string date;
            double rolling_volatility; ///< Null until a full window of returns exists
            double rolling_volume;     ///< Null until a full trailing window of volume exists
        };

        /**
         * @struct YearlyVolatilitySummary
         * @brief Mean and maximum rolling volatility of one symbol in one year.
         */
        struct YearlyVolatilitySummary
        {
            std::string symbol;
            int year;
            double avg_volatility; ///< Null if no non-null volatility in the year
            double max_volatility; ///< Null if no non-null volatility in the year
        };

        /**
         * @struct VolumeSummary
         * @brief Mean and maximum daily volume of one symbol in one year.
         */
        struct VolumeSummary
        {
            std::string symbol;
            int year;
            double avg_volume;
            double max_volume;
        };

        /**
         * @class RollingWindowEngine
         * @brief Applies RollingStatistics symbol by symbol.
         *
         * Usage:
         * @code
         *   RollingWindowEngine engine(30);
         *   auto trailing = engine.compute(derived, WindowAlignment::TRAILING);
         *   auto yearly_vol = engine.yearly_volatility(derived);
         * @endcode
         */
        class RollingWindowEngine
        {
        public:
            static constexpr int DEFAULT_WINDOW = 30;

            /**
             * @param window_days Window width in observations.
             * @throws std::invalid_argument If window_days < 2.
             */
            explicit RollingWindowEngine(int window_days = DEFAULT_WINDOW);

            /**
             * @brief Rolling statistics for every derived row.
             * @param rows Derived rows of any number of symbols.
             * @param volatility_alignment Alignment of rolling_volatility.
             *        rolling_volume is always trailing.
             * @return One RollingStat per row, sorted by (symbol, date).
             */
            std::vector<RollingStat> compute(const std::vector<DerivedPricePoint> &rows,
                                             WindowAlignment volatility_alignment) const;

            /**
             * @brief Yearly mean/max of the CENTERED rolling volatility.
             *
             * The volatility is computed separately inside each (symbol, year),
             * so no window spans a year boundary.
             *
             * @return One entry per (symbol, year) present in rows.
             */
            std::vector<YearlyVolatilitySummary> yearly_volatility(
                const std::vector<DerivedPricePoint> &rows) const;

            /**
             * @brief Summarize precomputed rolling stats by (symbol, year).
             */
            static std::vector<YearlyVolatilitySummary> summarize_volatility(
                const std::vector<RollingStat> &stats);

            /**
             * @brief Yearly mean/max of daily volume.
             */
            static std::vector<VolumeSummary> yearly_volume(
                const std::vector<DerivedPricePoint> &rows);

            int window_days() const { return window_days_; }

        private:
            int window_days_;
        };

    } // namespace analytics
} // namespace stockmetrics

#endif // STOCKMETRICS_ANALYTICS_ROLLING_WINDOW_ENGINE_HPP
