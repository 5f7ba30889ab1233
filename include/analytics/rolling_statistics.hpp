/**
 * @file rolling_statistics.hpp
 * @brief Null-aware fixed-width rolling window computations.
 *
 * Computes rolling statistics over a single, already-ordered series.
 * Output vectors have the same length as the input: result[t] holds the
 * statistic of the window attributed to position t, or NaN (null) when
 * that window is not fully inside the series or contains a null value.
 * Windows are never computed from fewer than window_days observations.
 *
 * Two alignments are supported and must be chosen explicitly:
 *  - TRAILING: window [t - W + 1, t] (right-aligned).
 *  - CENTERED: window [t - (W - 1) / 2, t + W / 2] (integer division),
 *    truncated to null at both edges of the series.
 */

#ifndef STOCKMETRICS_ANALYTICS_ROLLING_STATISTICS_HPP
#define STOCKMETRICS_ANALYTICS_ROLLING_STATISTICS_HPP

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace stockmetrics
{
    namespace analytics
    {

        /**
         * @enum WindowAlignment
         * @brief Position a window statistic is attributed to.
         */
        enum class WindowAlignment
        {
            TRAILING, ///< Last timestamp covered by the window
            CENTERED  ///< Middle of the window; null near both edges
        };

        /**
         * @struct RollingConfig
         * @brief Configuration for rolling window calculations.
         */
        struct RollingConfig
        {
            int window_days;           ///< Rolling window size in observations
            WindowAlignment alignment; ///< Where each window's value is reported

            RollingConfig(int window, WindowAlignment align)
                : window_days(window), alignment(align) {}
        };

        /**
         * @class RollingStatistics
         * @brief Computes rolling metrics over a fixed-width window.
         *
         * Usage:
         * @code
         *   RollingConfig config(30, WindowAlignment::TRAILING);
         *   RollingStatistics rolling(daily_returns, config);
         *   auto vol = rolling.volatility();
         * @endcode
         *
         * Thread safety: Instances are effectively immutable after construction.
         */
        class RollingStatistics
        {
        public:
            /**
             * @brief Construct from a series and configuration.
             * @param series Ordered observations; NaN marks a null value.
             * @param config Rolling window configuration.
             * @throws std::invalid_argument If config.window_days < 2.
             */
            RollingStatistics(const std::vector<double> &series,
                              const RollingConfig &config);

            ~RollingStatistics() = default;

            /**
             * @brief Rolling sample standard deviation (N - 1 denominator).
             * @return Vector aligned with the input series.
             */
            std::vector<double> volatility() const;

            /**
             * @brief Rolling arithmetic mean.
             * @return Vector aligned with the input series.
             */
            std::vector<double> mean() const;

            /**
             * @brief Apply a custom function to each fully-populated window.
             * @param func Receives exactly window_days values, none null.
             * @return Vector aligned with the input series.
             */
            std::vector<double> apply(
                const std::function<double(const std::vector<double> &)> &func) const;

            /** @brief Get the rolling window configuration. */
            const RollingConfig &config() const;

            /**
             * @brief Index range [first, last] of the window attributed to
             *        position t. Either bound may fall outside the series.
             */
            std::pair<long, long> window_bounds(size_t t) const;

            /**
             * @brief Whether the window at position t lies fully inside the
             *        series and holds no null value.
             */
            bool is_complete(size_t t) const;

        private:
            std::vector<double> rolling_apply_internal(
                const std::function<double(const double *, int)> &func) const;

            std::vector<double> series_;
            std::vector<int> null_prefix_; ///< null_prefix_[i] = nulls in series_[0, i)
            RollingConfig config_;
        };

    } // namespace analytics
} // namespace stockmetrics

#endif // STOCKMETRICS_ANALYTICS_ROLLING_STATISTICS_HPP
