/**
 * @file price_panel.cpp
 * @brief Implementation of PricePanel
 */

#include "data/price_panel.hpp"
#include "data/calendar.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace stockmetrics
{

    // ============================================================================
    // Constructors
    // ============================================================================

    PricePanel::PricePanel(std::vector<PricePoint> records) : records_(std::move(records))
    {
        validate_and_index();
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    bool PricePanel::has_symbol(const std::string &symbol) const
    {
        return symbol_ranges_.count(symbol) != 0;
    }

    std::vector<PricePoint> PricePanel::partition(const std::string &symbol) const
    {
        auto it = symbol_ranges_.find(symbol);
        if (it == symbol_ranges_.end())
        {
            throw std::invalid_argument("Symbol not found: " + symbol);
        }
        return std::vector<PricePoint>(records_.begin() + it->second.first,
                                       records_.begin() + it->second.second);
    }

    std::string PricePanel::first_date() const
    {
        std::string first = records_.front().date;
        for (const auto &range : symbol_ranges_)
        {
            first = std::min(first, records_[range.second.first].date);
        }
        return first;
    }

    std::string PricePanel::last_date() const
    {
        std::string last = records_.front().date;
        for (const auto &range : symbol_ranges_)
        {
            last = std::max(last, records_[range.second.second - 1].date);
        }
        return last;
    }

    // ================================
    // Data Filtering
    // ================================

    PricePanel PricePanel::filter_by_date(const std::string &start_date,
                                          const std::string &end_date) const
    {
        if (!calendar::is_valid_date(start_date))
        {
            throw InvalidInputError("Invalid start date: " + start_date);
        }
        if (!calendar::is_valid_date(end_date))
        {
            throw InvalidInputError("Invalid end date: " + end_date);
        }
        if (start_date > end_date)
        {
            throw InvalidInputError("Start date must be before end date");
        }

        std::vector<PricePoint> filtered;
        for (const auto &record : records_)
        {
            if (record.date >= start_date && record.date <= end_date)
            {
                filtered.push_back(record);
            }
        }

        if (filtered.empty())
        {
            throw InvalidInputError("No records between " + start_date + " and " + end_date);
        }

        return PricePanel(std::move(filtered));
    }

    PricePanel PricePanel::select_symbols(const std::vector<std::string> &selected) const
    {
        std::vector<PricePoint> subset;
        for (const auto &symbol : selected)
        {
            auto it = symbol_ranges_.find(symbol);
            if (it == symbol_ranges_.end())
            {
                throw std::invalid_argument("Symbol not found: " + symbol);
            }
            subset.insert(subset.end(),
                          records_.begin() + it->second.first,
                          records_.begin() + it->second.second);
        }

        return PricePanel(std::move(subset));
    }

    void PricePanel::print_summary() const
    {
        std::cout << "\n=== Price Panel Summary ===\n";
        std::cout << "Dimensions: " << records_.size() << " records x "
                  << symbols_.size() << " symbols\n";
        std::cout << "Date range: " << first_date() << " to " << last_date() << "\n";
        std::cout << "Symbols: ";
        for (const auto &symbol : symbols_)
        {
            const auto &range = symbol_ranges_.at(symbol);
            std::cout << symbol << "(" << (range.second - range.first) << ") ";
        }
        std::cout << "\n==========================\n"
                  << std::endl;
    }

    // =========================
    // Private Helper Methods
    // =========================

    void PricePanel::validate_and_index()
    {
        if (records_.empty())
        {
            throw InvalidInputError("Price panel contains no records");
        }

        for (const auto &record : records_)
        {
            if (record.symbol.empty())
            {
                throw InvalidInputError("Record on " + record.date + " has an empty symbol");
            }
            if (!calendar::is_valid_date(record.date))
            {
                throw InvalidInputError("Malformed date '" + record.date + "' for symbol " + record.symbol);
            }
        }

        std::stable_sort(records_.begin(), records_.end(),
                         [](const PricePoint &a, const PricePoint &b)
                         {
                             if (a.symbol != b.symbol)
                                 return a.symbol < b.symbol;
                             return a.date < b.date;
                         });

        symbols_.clear();
        symbol_ranges_.clear();

        size_t begin = 0;
        for (size_t i = 1; i <= records_.size(); ++i)
        {
            if (i < records_.size() && records_[i].symbol == records_[begin].symbol)
            {
                if (records_[i].date == records_[i - 1].date)
                {
                    throw InvalidInputError("Duplicate key (" + records_[i].symbol + ", " + records_[i].date + ")");
                }
                continue;
            }
            symbols_.push_back(records_[begin].symbol);
            symbol_ranges_[records_[begin].symbol] = std::make_pair(begin, i);
            begin = i;
        }
    }

} // namespace stockmetrics
