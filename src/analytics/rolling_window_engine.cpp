/**
 * @file rolling_window_engine.cpp
 * @brief Implementation of the RollingWindowEngine class.
 */

#include "analytics/rolling_window_engine.hpp"
#include "data/calendar.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

namespace stockmetrics
{
    namespace analytics
    {

        namespace
        {
            /**
             * @brief Running mean/max over the non-null values of a group.
             */
            struct NullAwareAccumulator
            {
                double sum = 0.0;
                double max = 0.0;
                int count = 0;

                void add(double value)
                {
                    if (is_null(value))
                        return;
                    max = (count == 0) ? value : std::max(max, value);
                    sum += value;
                    ++count;
                }

                double average() const { return count > 0 ? sum / count : null_value(); }
                double maximum() const { return count > 0 ? max : null_value(); }
            };

            using GroupKey = std::pair<std::string, int>; // (symbol, year)
        } // anonymous namespace

        RollingWindowEngine::RollingWindowEngine(int window_days) : window_days_(window_days)
        {
            if (window_days_ < 2)
            {
                throw std::invalid_argument(
                    "Expected window_days >= 2 for rolling statistics, got: " + std::to_string(window_days_));
            }
        }

        std::vector<RollingStat> RollingWindowEngine::compute(const std::vector<DerivedPricePoint> &rows,
                                                              WindowAlignment volatility_alignment) const
        {
            std::vector<RollingStat> stats;
            stats.reserve(rows.size());

            for (const auto &entry : partition_by_symbol(rows))
            {
                const auto &series = entry.second;

                std::vector<double> returns;
                std::vector<double> volumes;
                returns.reserve(series.size());
                volumes.reserve(series.size());
                for (const auto &row : series)
                {
                    returns.push_back(row.daily_return);
                    volumes.push_back(row.volume);
                }

                auto volatility = RollingStatistics(returns, RollingConfig(window_days_, volatility_alignment)).volatility();
                auto volume = RollingStatistics(volumes, RollingConfig(window_days_, WindowAlignment::TRAILING)).mean();

                for (size_t i = 0; i < series.size(); ++i)
                {
                    stats.push_back({entry.first, series[i].date, volatility[i], volume[i]});
                }
            }

            return stats;
        }

        std::vector<YearlyVolatilitySummary> RollingWindowEngine::yearly_volatility(
            const std::vector<DerivedPricePoint> &rows) const
        {
            // Windows are confined to one (symbol, year); a year shorter than
            // the window therefore summarizes to null.
            std::vector<RollingStat> stats;
            stats.reserve(rows.size());

            for (const auto &entry : partition_by_symbol(rows))
            {
                std::map<int, std::vector<DerivedPricePoint>> years;
                for (const auto &row : entry.second)
                {
                    years[calendar::extract_year(row.date)].push_back(row);
                }

                for (const auto &year : years)
                {
                    auto year_stats = compute(year.second, WindowAlignment::CENTERED);
                    stats.insert(stats.end(), year_stats.begin(), year_stats.end());
                }
            }

            return summarize_volatility(stats);
        }

        std::vector<YearlyVolatilitySummary> RollingWindowEngine::summarize_volatility(
            const std::vector<RollingStat> &stats)
        {
            std::map<GroupKey, NullAwareAccumulator> groups;
            for (const auto &stat : stats)
            {
                groups[GroupKey(stat.symbol, calendar::extract_year(stat.date))].add(stat.rolling_volatility);
            }

            std::vector<YearlyVolatilitySummary> summary;
            summary.reserve(groups.size());
            for (const auto &group : groups)
            {
                summary.push_back({group.first.first, group.first.second,
                                   group.second.average(), group.second.maximum()});
            }
            return summary;
        }

        std::vector<VolumeSummary> RollingWindowEngine::yearly_volume(
            const std::vector<DerivedPricePoint> &rows)
        {
            std::map<GroupKey, NullAwareAccumulator> groups;
            for (const auto &row : rows)
            {
                groups[GroupKey(row.symbol, calendar::extract_year(row.date))].add(row.volume);
            }

            std::vector<VolumeSummary> summary;
            summary.reserve(groups.size());
            for (const auto &group : groups)
            {
                summary.push_back({group.first.first, group.first.second,
                                   group.second.average(), group.second.maximum()});
            }
            return summary;
        }

    } // namespace analytics
} // namespace stockmetrics
