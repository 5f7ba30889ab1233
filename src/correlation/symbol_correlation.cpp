/**
 * @file symbol_correlation.cpp
 * @brief Implementation of SymbolCorrelation
 */

#include "correlation/symbol_correlation.hpp"

#include <map>

namespace stockmetrics
{
    namespace correlation
    {

        ReturnPivot SymbolCorrelation::pivot_returns(const std::vector<analytics::DerivedPricePoint> &rows)
        {
            auto partitions = analytics::partition_by_symbol(rows);

            ReturnPivot pivot;
            for (const auto &entry : partitions)
            {
                pivot.symbols.push_back(entry.first);
            }

            // date -> symbol -> return
            std::map<std::string, std::map<std::string, double>> by_date;
            for (const auto &entry : partitions)
            {
                for (const auto &row : entry.second)
                {
                    if (!is_null(row.daily_return))
                    {
                        by_date[row.date][entry.first] = row.daily_return;
                    }
                }
            }

            for (const auto &entry : by_date)
            {
                if (entry.second.size() == pivot.symbols.size())
                {
                    pivot.dates.push_back(entry.first);
                }
            }

            pivot.returns.resize(pivot.dates.size(), pivot.symbols.size());
            for (size_t i = 0; i < pivot.dates.size(); ++i)
            {
                const auto &returns = by_date.at(pivot.dates[i]);
                for (size_t j = 0; j < pivot.symbols.size(); ++j)
                {
                    pivot.returns(i, j) = returns.at(pivot.symbols[j]);
                }
            }

            return pivot;
        }

        CorrelationMatrix SymbolCorrelation::compute(const std::vector<analytics::DerivedPricePoint> &rows)
        {
            ReturnPivot pivot = pivot_returns(rows);
            return CorrelationEngine::correlate_columns(pivot.returns, pivot.symbols);
        }

    } // namespace correlation
} // namespace stockmetrics
