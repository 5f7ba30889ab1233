/**
 * @file returns_calculator.hpp
 * @brief Per-symbol daily returns from lagged adjusted prices.
 *
 * The lag is always taken inside one symbol's date-ordered series:
 *
 *     daily_return[t] = round((adjusted[t] / adjusted[t-1] - 1) * 100, 2)
 *
 * and is null for the first valid record of each symbol. Rows whose
 * adjusted price is missing or non-positive are reported as row issues
 * and skipped, so the next valid row lags against the last valid one.
 */

#ifndef STOCKMETRICS_ANALYTICS_RETURNS_CALCULATOR_HPP
#define STOCKMETRICS_ANALYTICS_RETURNS_CALCULATOR_HPP

#include "data/price_panel.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace stockmetrics
{
    namespace analytics
    {

        /**
         * @struct DerivedPricePoint
         * @brief A price record extended with its lagged adjusted price and
         *        daily percentage return (both null for a symbol's first row).
         */
        struct DerivedPricePoint : PricePoint
        {
            double previous_adjusted; ///< Adjusted price of the previous valid row
            double daily_return;      ///< Percentage return, rounded to 2 decimals
        };

        /**
         * @enum RowIssueKind
         * @brief Reason a row was excluded from computation.
         */
        enum class RowIssueKind
        {
            INVALID_PRICE /**< Adjusted price missing, non-finite or <= 0 */
        };

        /**
         * @struct RowIssue
         * @brief A row excluded at row level; other rows are unaffected.
         */
        struct RowIssue
        {
            std::string symbol;
            std::string date;
            RowIssueKind kind;
            std::string message;
        };

        /**
         * @struct ReturnsResult
         * @brief Output of the returns stage.
         */
        struct ReturnsResult
        {
            std::vector<DerivedPricePoint> derived; ///< Valid rows, sorted by (symbol, date)
            std::vector<RowIssue> issues;           ///< Excluded rows
        };

        /**
         * @class ReturnsCalculator
         * @brief Computes grouped lag-based daily returns.
         *
         * Stateless; all methods are static.
         */
        class ReturnsCalculator
        {
        public:
            /**
             * @brief Compute daily returns for every symbol of a panel.
             * @param panel Validated price panel.
             * @return Derived rows for all valid records and the list of
             *         excluded rows.
             */
            static ReturnsResult compute(const PricePanel &panel);

            /**
             * @brief Compute daily returns for one symbol.
             * @param records Date-ordered records of a single symbol.
             * @param issues Receives one entry per excluded row. A row is
             *        excluded when any of its price fields is missing or
             *        not positive.
             * @return Derived rows for the valid records.
             * @throws std::invalid_argument If records mix symbols or are
             *         not strictly increasing in date.
             */
            static std::vector<DerivedPricePoint> compute_symbol(
                const std::vector<PricePoint> &records,
                std::vector<RowIssue> &issues);

            /**
             * @brief Percentage return between two adjusted prices, rounded
             *        to two decimals.
             */
            static double daily_return(double previous_adjusted, double adjusted);

            /**
             * @brief Whether an adjusted price can participate in a lag.
             */
            static bool is_valid_price(double adjusted);

            /**
             * @brief First of open, high, low, close and adjusted that is missing
             *        or not positive, with its value.
             * @return {nullptr, 0} when every price field is valid
             */
            static std::pair<const char *, double> invalid_price_field(const PricePoint &record);
        };

        /**
         * @brief Round half away from zero to a number of decimals.
         */
        double round_to(double value, int decimals);

        /**
         * @brief Split derived rows into per-symbol, date-ascending series.
         * @throws std::invalid_argument If a (symbol, date) key repeats.
         */
        std::map<std::string, std::vector<DerivedPricePoint>> partition_by_symbol(
            const std::vector<DerivedPricePoint> &rows);

        /**
         * @brief Human-readable name of a row issue kind.
         */
        std::string to_string(RowIssueKind kind);

    } // namespace analytics
} // namespace stockmetrics

#endif // STOCKMETRICS_ANALYTICS_RETURNS_CALCULATOR_HPP
