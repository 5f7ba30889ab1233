/**
 * @file correlation_engine.hpp
 * @brief Pearson correlation between derived features of the price panel.
 *
 * Builds one pooled row per (symbol, date) from an explicit feature
 * schema, drops every row with a null feature (complete-case filter) and
 * computes the pairwise Pearson correlation of the feature columns over
 * the rows of all symbols combined. The result relates features to each
 * other (e.g. volume vs. volatility); see SymbolCorrelation for the
 * symbol-vs-symbol view.
 *
 * Degenerate inputs never throw: a zero-variance column or fewer than two
 * complete rows produce NaN off-diagonal cells. The diagonal is 1.0.
 */

#pragma once

#include "analytics/returns_calculator.hpp"
#include "analytics/rolling_window_engine.hpp"

#include <Eigen/Dense>
#include <array>
#include <iosfwd>
#include <string>
#include <vector>

namespace stockmetrics
{
    namespace correlation
    {

        /**
         * @enum Feature
         * @brief Columns of the pooled feature table.
         */
        enum class Feature
        {
            CLOSE,             ///< Closing price
            DAILY_RETURN,      ///< Daily percentage return
            DAILY_RANGE,       ///< high - low
            VOLUME,            ///< Shares traded
            ROLLING_VOLUME,    ///< Trailing mean volume
            ROLLING_VOLATILITY ///< Trailing sample std of daily returns
        };

        constexpr size_t NUM_FEATURES = 6;

        /**
         * @brief Every feature, in schema order.
         */
        const std::vector<Feature> &all_features();

        /** @brief Column name of a feature, e.g. "daily_range". */
        std::string feature_name(Feature feature);

        /**
         * @brief Parse a column name.
         * @throws std::invalid_argument For names outside the schema.
         */
        Feature parse_feature(const std::string &name);

        /**
         * @struct FeatureRow
         * @brief One pooled observation.
         */
        struct FeatureRow
        {
            std::string symbol;
            std::string date;
            std::array<double, NUM_FEATURES> values; ///< Indexed by Feature

            double value(Feature feature) const
            {
                return values[static_cast<size_t>(feature)];
            }

            /**
             * @brief Whether every listed feature is finite (non-null, not infinite).
             */
            bool is_complete(const std::vector<Feature> &features) const;
        };

        /**
         * @struct CorrelationEntry
         * @brief One cell of a correlation matrix in long form.
         */
        struct CorrelationEntry
        {
            std::string row_feature;
            std::string col_feature;
            double value;
        };

        /**
         * @struct CorrelationMatrix
         * @brief Square, symmetric correlation matrix with labels.
         */
        struct CorrelationMatrix
        {
            std::vector<std::string> labels; ///< Row and column labels
            Eigen::MatrixXd values;          ///< labels.size() x labels.size()
            size_t observations = 0;         ///< Rows that entered the computation

            /**
             * @brief Look up one cell by label.
             * @throws std::invalid_argument If a label is unknown.
             */
            double at(const std::string &row, const std::string &col) const;

            /**
             * @brief Unpivot into {row, col, value} entries, row-major.
             */
            std::vector<CorrelationEntry> melt() const;

            /**
             * @brief Print the matrix as an aligned table.
             */
            void print(std::ostream &os) const;
        };

        /**
         * @class CorrelationEngine
         * @brief Feature-vs-feature correlation over the pooled panel.
         *
         * Usage:
         * @code
         *   auto trailing = rolling.compute(derived, WindowAlignment::TRAILING);
         *   auto rows = CorrelationEngine::build_features(derived, trailing);
         *   CorrelationEngine engine;
         *   CorrelationMatrix corr = engine.compute(rows);
         * @endcode
         */
        class CorrelationEngine
        {
        public:
            /**
             * @param features Columns to correlate, in output order.
             * @throws std::invalid_argument If features is empty or repeats a column.
             */
            explicit CorrelationEngine(std::vector<Feature> features = all_features());

            /**
             * @brief Join derived rows with their trailing rolling stats.
             *
             * Rows without a matching (symbol, date) stat get null rolling
             * features and are later dropped by the complete-case filter.
             */
            static std::vector<FeatureRow> build_features(
                const std::vector<analytics::DerivedPricePoint> &rows,
                const std::vector<analytics::RollingStat> &trailing_stats);

            /**
             * @brief Keep only rows with every configured feature non-null.
             */
            std::vector<FeatureRow> complete_cases(const std::vector<FeatureRow> &rows) const;

            /**
             * @brief Complete-case filter followed by pairwise Pearson correlation.
             */
            CorrelationMatrix compute(const std::vector<FeatureRow> &rows) const;

            /**
             * @brief Correlate the columns of an observations x variables matrix.
             * @param data Matrix without null cells.
             * @param labels One label per column.
             */
            static CorrelationMatrix correlate_columns(const Eigen::MatrixXd &data,
                                                       const std::vector<std::string> &labels);

            /**
             * @brief Pearson coefficient of two equally sized samples.
             * @return NaN if fewer than two observations or either sample
             *         has zero variance.
             */
            static double pearson(const Eigen::VectorXd &x, const Eigen::VectorXd &y);

            const std::vector<Feature> &features() const { return features_; }

        private:
            std::vector<Feature> features_;
        };

    } // namespace correlation
} // namespace stockmetrics
