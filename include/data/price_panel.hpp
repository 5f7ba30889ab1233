/**
 * @file price_panel.hpp
 * @brief Validated daily OHLCV panel keyed by (symbol, date).
 *
 * The panel is the single input of the metrics pipeline. It is validated
 * once at construction (schema-level checks) and is immutable afterwards.
 * Records are held sorted by (symbol, date) so every symbol occupies one
 * contiguous, chronologically ordered range.
 *
 * @note Missing numeric values are represented as NaN.
 */

#ifndef STOCKMETRICS_DATA_PRICE_PANEL_HPP
#define STOCKMETRICS_DATA_PRICE_PANEL_HPP

#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace stockmetrics
{
    /**
     * @brief The value used for a null metric cell.
     */
    inline double null_value()
    {
        return std::numeric_limits<double>::quiet_NaN();
    }

    /**
     * @brief Check whether a metric cell is null.
     */
    inline bool is_null(double value)
    {
        return std::isnan(value);
    }

    /**
     * @class InvalidInputError
     * @brief Schema-level input error (missing column, duplicate key,
     *        malformed date). Aborts the run before any computation.
     */
    class InvalidInputError : public std::invalid_argument
    {
    public:
        explicit InvalidInputError(const std::string &message)
            : std::invalid_argument(message) {}
    };

    /**
     * @struct PricePoint
     * @brief One daily bar for one security.
     */
    struct PricePoint
    {
        std::string symbol; ///< Security identifier
        std::string date;   ///< Trading date (YYYY-MM-DD)
        double open;        ///< Opening price
        double high;        ///< Session high
        double low;         ///< Session low
        double close;       ///< Closing price
        double adjusted;    ///< Split/dividend adjusted close
        double volume;      ///< Shares traded
    };

    /**
     * @class PricePanel
     * @brief Immutable container for a multi-symbol daily price panel.
     *
     * Usage:
     * @code
     *   PricePanel panel(records);          // throws InvalidInputError
     *   for (const auto &symbol : panel.symbols())
     *   {
     *       auto series = panel.partition(symbol);   // date ascending
     *   }
     * @endcode
     */
    class PricePanel
    {
    public:
        /**
         * @brief Build and validate a panel.
         * @param records Raw records in any order.
         * @throws InvalidInputError If records is empty, a symbol is blank,
         *         a date is malformed, or a (symbol, date) key repeats.
         */
        explicit PricePanel(std::vector<PricePoint> records);

        ~PricePanel() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        /**
         * @brief All records sorted by (symbol, date).
         */
        const std::vector<PricePoint> &records() const
        {
            return records_;
        }

        /**
         * @brief Distinct symbols in ascending order.
         */
        const std::vector<std::string> &symbols() const
        {
            return symbols_;
        }

        size_t num_records() const
        {
            return records_.size();
        }

        size_t num_symbols() const
        {
            return symbols_.size();
        }

        /**
         * @brief Check whether a symbol is present.
         */
        bool has_symbol(const std::string &symbol) const;

        /**
         * @brief Date-ordered records of one symbol.
         * @throws std::invalid_argument If the symbol is not in the panel.
         */
        std::vector<PricePoint> partition(const std::string &symbol) const;

        /**
         * @brief Earliest date across all symbols.
         */
        std::string first_date() const;

        /**
         * @brief Latest date across all symbols.
         */
        std::string last_date() const;

        /** ===========================================
         *  Filtering Methods
         *  ===========================================
         */

        /**
         * @brief Keep records with start_date <= date <= end_date.
         * @throws InvalidInputError If a bound is malformed, start > end, or
         *         no record falls inside the range.
         */
        PricePanel filter_by_date(const std::string &start_date,
                                  const std::string &end_date) const;

        /**
         * @brief Keep only the given symbols.
         * @throws std::invalid_argument If a requested symbol is not present.
         */
        PricePanel select_symbols(const std::vector<std::string> &selected) const;

        /**
         * @brief Print panel dimensions and date range.
         */
        void print_summary() const;

    private:
        void validate_and_index();

        std::vector<PricePoint> records_;
        std::vector<std::string> symbols_;
        std::map<std::string, std::pair<size_t, size_t>> symbol_ranges_; ///< symbol -> [begin, end)
    };

} // namespace stockmetrics

#endif // STOCKMETRICS_DATA_PRICE_PANEL_HPP
