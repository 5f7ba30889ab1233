/**
 * @file returns_calculator.cpp
 * @brief Implementation of the ReturnsCalculator class.
 */

#include "analytics/returns_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace stockmetrics
{
    namespace analytics
    {

        // ===================================================================
        // Free helpers
        // ===================================================================

        double round_to(double value, int decimals)
        {
            if (is_null(value))
            {
                return value;
            }
            double scale = std::pow(10.0, decimals);
            return std::round(value * scale) / scale;
        }

        std::map<std::string, std::vector<DerivedPricePoint>> partition_by_symbol(
            const std::vector<DerivedPricePoint> &rows)
        {
            std::map<std::string, std::vector<DerivedPricePoint>> partitions;
            for (const auto &row : rows)
            {
                partitions[row.symbol].push_back(row);
            }

            for (auto &entry : partitions)
            {
                auto &series = entry.second;
                std::stable_sort(series.begin(), series.end(),
                                 [](const DerivedPricePoint &a, const DerivedPricePoint &b)
                                 { return a.date < b.date; });

                for (size_t i = 1; i < series.size(); ++i)
                {
                    if (series[i].date == series[i - 1].date)
                    {
                        throw std::invalid_argument(
                            "Duplicate key (" + entry.first + ", " + series[i].date + ")");
                    }
                }
            }

            return partitions;
        }

        std::string to_string(RowIssueKind kind)
        {
            switch (kind)
            {
            case RowIssueKind::INVALID_PRICE:
                return "InvalidPrice";
            }
            return "Unknown";
        }

        // ===================================================================
        // ReturnsCalculator
        // ===================================================================

        ReturnsResult ReturnsCalculator::compute(const PricePanel &panel)
        {
            ReturnsResult result;
            result.derived.reserve(panel.num_records());

            for (const auto &symbol : panel.symbols())
            {
                auto series = compute_symbol(panel.partition(symbol), result.issues);
                result.derived.insert(result.derived.end(), series.begin(), series.end());
            }

            return result;
        }

        std::vector<DerivedPricePoint> ReturnsCalculator::compute_symbol(
            const std::vector<PricePoint> &records,
            std::vector<RowIssue> &issues)
        {
            std::vector<DerivedPricePoint> derived;
            derived.reserve(records.size());

            double previous = null_value();

            for (size_t i = 0; i < records.size(); ++i)
            {
                const PricePoint &record = records[i];

                if (i > 0)
                {
                    if (record.symbol != records[0].symbol)
                    {
                        throw std::invalid_argument(
                            "Series mixes symbols " + records[0].symbol + " and " + record.symbol);
                    }
                    if (record.date <= records[i - 1].date)
                    {
                        throw std::invalid_argument(
                            "Series for " + record.symbol + " is not strictly increasing at " + record.date);
                    }
                }

                auto bad = invalid_price_field(record);
                if (bad.first != nullptr)
                {
                    std::ostringstream msg;
                    msg << bad.first << " price " << bad.second << " is not a positive number";
                    issues.push_back({record.symbol, record.date, RowIssueKind::INVALID_PRICE, msg.str()});
                    continue;
                }

                DerivedPricePoint row;
                static_cast<PricePoint &>(row) = record;
                row.previous_adjusted = previous;
                row.daily_return = is_null(previous) ? null_value() : daily_return(previous, record.adjusted);
                derived.push_back(row);

                previous = record.adjusted;
            }

            return derived;
        }

        double ReturnsCalculator::daily_return(double previous_adjusted, double adjusted)
        {
            if (!is_valid_price(previous_adjusted) || !is_valid_price(adjusted))
            {
                return null_value();
            }
            return round_to((adjusted / previous_adjusted - 1.0) * 100.0, 2);
        }

        bool ReturnsCalculator::is_valid_price(double adjusted)
        {
            return std::isfinite(adjusted) && adjusted > 0.0;
        }

        std::pair<const char *, double> ReturnsCalculator::invalid_price_field(const PricePoint &record)
        {
            const std::pair<const char *, double> fields[] = {
                {"open", record.open},
                {"high", record.high},
                {"low", record.low},
                {"close", record.close},
                {"adjusted", record.adjusted}};

            for (const auto &field : fields)
            {
                if (!is_valid_price(field.second))
                {
                    return field;
                }
            }
            return {nullptr, 0.0};
        }

    } // namespace analytics
} // namespace stockmetrics
