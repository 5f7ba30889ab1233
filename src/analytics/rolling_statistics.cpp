/**
 * @file rolling_statistics.cpp
 * @brief Implementation of the RollingStatistics class.
 *
 * Uses direct per-window computation. A running count of nulls lets each
 * position decide in O(1) whether its window is complete; only complete
 * windows are passed to the statistic.
 */

#include "analytics/rolling_statistics.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace stockmetrics
{
    namespace analytics
    {

        // ===================================================================
        // Constructors
        // ===================================================================

        RollingStatistics::RollingStatistics(const std::vector<double> &series,
                                             const RollingConfig &config)
            : series_(series), config_(config)
        {
            if (config_.window_days < 2)
            {
                throw std::invalid_argument(
                    "Expected window_days >= 2 for rolling statistics, got: " + std::to_string(config_.window_days));
            }

            null_prefix_.resize(series_.size() + 1, 0);
            for (size_t i = 0; i < series_.size(); ++i)
            {
                null_prefix_[i + 1] = null_prefix_[i] + (std::isnan(series_[i]) ? 1 : 0);
            }
        }

        // ===================================================================
        // Rolling Metrics
        // ===================================================================

        std::vector<double> RollingStatistics::volatility() const
        {
            return rolling_apply_internal(
                [](const double *data, int size) -> double
                {
                    double nd = static_cast<double>(size);
                    double sum = 0.0;
                    for (int i = 0; i < size; ++i)
                    {
                        sum += data[i];
                    }
                    double mean = sum / nd;

                    double sum_sq = 0.0;
                    for (int i = 0; i < size; ++i)
                    {
                        double diff = data[i] - mean;
                        sum_sq += diff * diff;
                    }
                    return std::sqrt(sum_sq / (nd - 1.0));
                });
        }

        std::vector<double> RollingStatistics::mean() const
        {
            return rolling_apply_internal(
                [](const double *data, int size) -> double
                {
                    double sum = 0.0;
                    for (int i = 0; i < size; ++i)
                    {
                        sum += data[i];
                    }
                    return sum / static_cast<double>(size);
                });
        }

        // ===================================================================
        // Generic Rolling Application
        // ===================================================================

        std::vector<double> RollingStatistics::apply(
            const std::function<double(const std::vector<double> &)> &func) const
        {
            return rolling_apply_internal(
                [&func](const double *data, int size) -> double
                {
                    std::vector<double> window(data, data + size);
                    return func(window);
                });
        }

        // ===================================================================
        // Accessors
        // ===================================================================

        const RollingConfig &RollingStatistics::config() const
        {
            return config_;
        }

        std::pair<long, long> RollingStatistics::window_bounds(size_t t) const
        {
            long w = config_.window_days;
            long pos = static_cast<long>(t);
            long first = (config_.alignment == WindowAlignment::TRAILING)
                             ? pos - (w - 1)
                             : pos - (w - 1) / 2;
            return std::make_pair(first, first + w - 1);
        }

        bool RollingStatistics::is_complete(size_t t) const
        {
            auto bounds = window_bounds(t);
            if (bounds.first < 0 || bounds.second >= static_cast<long>(series_.size()))
            {
                return false;
            }
            return null_prefix_[bounds.second + 1] - null_prefix_[bounds.first] == 0;
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        std::vector<double> RollingStatistics::rolling_apply_internal(
            const std::function<double(const double *, int)> &func) const
        {
            int w = config_.window_days;
            std::vector<double> result(series_.size(), std::numeric_limits<double>::quiet_NaN());

            for (size_t t = 0; t < series_.size(); ++t)
            {
                if (!is_complete(t))
                {
                    continue;
                }
                result[t] = func(series_.data() + window_bounds(t).first, w);
            }

            return result;
        }

    } // namespace analytics
} // namespace stockmetrics
