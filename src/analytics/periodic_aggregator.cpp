/**
 * @file periodic_aggregator.cpp
 * @brief Implementation of the PeriodicAggregator class.
 *
 * Each symbol's rows are sorted by date before folding, so consecutive
 * rows sharing a period key form exactly one period.
 */

#include "analytics/periodic_aggregator.hpp"
#include "data/calendar.hpp"

#include <cmath>

namespace stockmetrics
{
    namespace analytics
    {

        namespace
        {
            struct PeriodSpan
            {
                int key;
                double open;
                double close;
            };

            /**
             * @brief Fold one date-ordered series into (key, open, close) spans.
             * @param key_of Maps a date to its period key; rows with equal keys
             *        are contiguous because the series is sorted.
             */
            template <typename KeyFn>
            std::vector<PeriodSpan> fold_periods(const std::vector<DerivedPricePoint> &series,
                                                 KeyFn key_of)
            {
                std::vector<PeriodSpan> spans;
                for (const auto &row : series)
                {
                    int key = key_of(row.date);
                    if (spans.empty() || spans.back().key != key)
                    {
                        spans.push_back({key, row.open, row.close});
                    }
                    else
                    {
                        spans.back().close = row.close;
                    }
                }
                return spans;
            }
        } // anonymous namespace

        std::vector<MonthlyBar> PeriodicAggregator::monthly(const std::vector<DerivedPricePoint> &rows)
        {
            std::vector<MonthlyBar> bars;

            for (const auto &entry : partition_by_symbol(rows))
            {
                auto spans = fold_periods(entry.second, [](const std::string &date)
                                          { return calendar::extract_year(date) * 100 + calendar::extract_month(date); });

                double previous_close = null_value();
                for (const auto &span : spans)
                {
                    MonthlyBar bar;
                    bar.symbol = entry.first;
                    bar.year = span.key / 100;
                    bar.month = span.key % 100;
                    bar.monthly_open = span.open;
                    bar.monthly_close = span.close;
                    bar.monthly_return = period_return(previous_close, span.close);
                    bars.push_back(bar);

                    previous_close = span.close;
                }
            }

            return bars;
        }

        std::vector<YearlyBar> PeriodicAggregator::yearly(const std::vector<DerivedPricePoint> &rows)
        {
            std::vector<YearlyBar> bars;

            for (const auto &entry : partition_by_symbol(rows))
            {
                auto spans = fold_periods(entry.second, [](const std::string &date)
                                          { return calendar::extract_year(date); });

                double previous_close = null_value();
                for (const auto &span : spans)
                {
                    YearlyBar bar;
                    bar.symbol = entry.first;
                    bar.year = span.key;
                    bar.yearly_open = span.open;
                    bar.yearly_close = span.close;
                    bar.previous_close = previous_close;
                    bar.yearly_return = period_return(previous_close, span.close);
                    bars.push_back(bar);

                    previous_close = span.close;
                }
            }

            return bars;
        }

        double PeriodicAggregator::period_return(double previous_close, double close)
        {
            if (is_null(previous_close) || is_null(close) || previous_close == 0.0)
            {
                return null_value();
            }
            return round_to((close / previous_close - 1.0) * 100.0, 2);
        }

    } // namespace analytics
} // namespace stockmetrics
