/**
 * @file metrics_pipeline.hpp
 * @brief End-to-end sequencing of the metrics stages.
 *
 * Runs, in order:
 *   1. ReturnsCalculator      (panel -> derived rows, row issues)
 *   2. PeriodicAggregator     (monthly and yearly bars)
 *   3. RollingWindowEngine    (trailing stats, yearly volatility and volume)
 *   4. CorrelationEngine      (pooled feature matrix)
 *   5. SymbolCorrelation      (only when enabled)
 *
 * Every per-symbol stage finishes for all symbols before the correlation
 * stage pools them.
 */

#ifndef STOCKMETRICS_ANALYTICS_METRICS_PIPELINE_HPP
#define STOCKMETRICS_ANALYTICS_METRICS_PIPELINE_HPP

#include "analytics/periodic_aggregator.hpp"
#include "analytics/returns_calculator.hpp"
#include "analytics/rolling_window_engine.hpp"
#include "correlation/correlation_engine.hpp"
#include "data/data_loader.hpp"
#include "data/price_panel.hpp"

#include <optional>
#include <string>
#include <vector>

namespace stockmetrics
{
    namespace analytics
    {

        /**
         * @struct MetricsReport
         * @brief Every output table of one run.
         */
        struct MetricsReport
        {
            std::vector<DerivedPricePoint> derived;                   ///< Daily rows + daily_return
            std::vector<RowIssue> issues;                             ///< Rows excluded at row level
            std::vector<MonthlyBar> monthly;                          ///< Monthly bars
            std::vector<YearlyBar> yearly;                            ///< Yearly bars
            std::vector<RollingStat> rolling;                         ///< Trailing rolling stats
            std::vector<YearlyVolatilitySummary> yearly_volatility;   ///< From centered volatility
            std::vector<VolumeSummary> volume_summary;                ///< Yearly volume
            correlation::CorrelationMatrix correlation;               ///< Feature x feature
            size_t pooled_rows = 0;                                   ///< Feature rows before filtering
            std::optional<correlation::CorrelationMatrix> symbol_correlation; ///< Symbol x symbol, if enabled

            /**
             * @brief Write every table as CSV into a directory (created if
             *        missing). Null cells are written empty.
             * @param directory Output directory.
             * @param precision Decimal places for floating-point cells.
             * @return Paths of the files written.
             * @throws std::runtime_error If a file cannot be written.
             */
            std::vector<std::string> export_to_csv(const std::string &directory, int precision = 6) const;

            /**
             * @brief Print table sizes, issues and the correlation matrix.
             */
            void print_summary(bool verbose = false) const;
        };

        /**
         * @class MetricsPipeline
         * @brief Runs all metrics stages over a validated panel.
         *
         * Usage:
         * @code
         *   auto config = MetricsConfig::load_from_file("config.json");
         *   auto pipeline = MetricsPipeline::from_config(config);
         *   MetricsReport report = pipeline.run(panel);
         *   report.export_to_csv(config.output.directory);
         * @endcode
         */
        class MetricsPipeline
        {
        public:
            /**
             * @param window_days Rolling window width.
             * @param features Correlation feature columns, in output order.
             * @param symbol_correlation Also compute the symbol x symbol matrix.
             * @throws std::invalid_argument On window_days < 2 or an invalid
             *         feature list.
             */
            MetricsPipeline(int window_days,
                            std::vector<correlation::Feature> features,
                            bool symbol_correlation);

            /**
             * @brief Build from a loaded run configuration.
             */
            static MetricsPipeline from_config(const MetricsConfig &config);

            /**
             * @brief Run every stage.
             */
            MetricsReport run(const PricePanel &panel) const;

            int window_days() const { return rolling_.window_days(); }
            bool symbol_correlation_enabled() const { return symbol_correlation_; }

        private:
            RollingWindowEngine rolling_;
            correlation::CorrelationEngine correlation_;
            bool symbol_correlation_;
        };

    } // namespace analytics
} // namespace stockmetrics

#endif // STOCKMETRICS_ANALYTICS_METRICS_PIPELINE_HPP
