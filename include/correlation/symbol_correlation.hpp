/**
 * @file symbol_correlation.hpp
 * @brief Symbol-vs-symbol correlation of daily returns.
 *
 * Pivots daily_return into a dates x symbols table and correlates the
 * symbol columns. Only dates on which every symbol has a non-null return
 * are used. This answers "which stocks move together" and is kept apart
 * from the pooled feature correlation, which answers a different question.
 */

#pragma once

#include "analytics/returns_calculator.hpp"
#include "correlation/correlation_engine.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace stockmetrics
{
    namespace correlation
    {

        /**
         * @struct ReturnPivot
         * @brief Wide dates x symbols return table with no null cells.
         */
        struct ReturnPivot
        {
            std::vector<std::string> dates;   ///< Complete-case dates, ascending
            std::vector<std::string> symbols; ///< Column labels, ascending
            Eigen::MatrixXd returns;          ///< dates.size() x symbols.size()
        };

        /**
         * @class SymbolCorrelation
         * @brief Correlation matrix indexed by symbol.
         */
        class SymbolCorrelation
        {
        public:
            /**
             * @brief Build the complete-case return pivot.
             */
            static ReturnPivot pivot_returns(const std::vector<analytics::DerivedPricePoint> &rows);

            /**
             * @brief Symbol x symbol Pearson matrix of daily returns.
             * @return Matrix with diagonal 1.0; NaN cells where a symbol's
             *         returns are constant or fewer than two dates survive.
             */
            static CorrelationMatrix compute(const std::vector<analytics::DerivedPricePoint> &rows);
        };

    } // namespace correlation
} // namespace stockmetrics
