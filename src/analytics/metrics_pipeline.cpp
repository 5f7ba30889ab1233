/**
 * @file metrics_pipeline.cpp
 * @brief Implementation of MetricsPipeline and MetricsReport.
 */

#include "analytics/metrics_pipeline.hpp"
#include "correlation/symbol_correlation.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace stockmetrics
{
    namespace analytics
    {

        namespace
        {
            /**
             * @brief Formats numeric cells with a fixed precision; null is empty.
             */
            class CellFormatter
            {
            public:
                explicit CellFormatter(int precision) : precision_(precision) {}

                std::string operator()(double value) const
                {
                    if (is_null(value))
                    {
                        return "";
                    }
                    std::ostringstream ss;
                    ss << std::fixed << std::setprecision(precision_) << value;
                    return ss.str();
                }

            private:
                int precision_;
            };

            std::string text(const std::string &value)
            {
                return DataLoader::quote_csv_field(value);
            }

            std::ofstream open_table(const std::filesystem::path &path, const std::string &header)
            {
                std::ofstream file(path);
                if (!file.is_open())
                {
                    throw std::runtime_error("Could not open file for writing: " + path.string());
                }
                file << header << "\n";
                return file;
            }

            void write_matrix(const std::filesystem::path &path,
                              const correlation::CorrelationMatrix &matrix,
                              const CellFormatter &cell)
            {
                std::string header = "feature";
                for (const auto &label : matrix.labels)
                {
                    header += "," + text(label);
                }

                auto file = open_table(path, header);
                for (size_t i = 0; i < matrix.labels.size(); ++i)
                {
                    file << text(matrix.labels[i]);
                    for (size_t j = 0; j < matrix.labels.size(); ++j)
                    {
                        file << "," << cell(matrix.values(i, j));
                    }
                    file << "\n";
                }
            }
        } // anonymous namespace

        // ===================================================================
        // MetricsPipeline
        // ===================================================================

        MetricsPipeline::MetricsPipeline(int window_days,
                                         std::vector<correlation::Feature> features,
                                         bool symbol_correlation)
            : rolling_(window_days), correlation_(std::move(features)), symbol_correlation_(symbol_correlation)
        {
        }

        MetricsPipeline MetricsPipeline::from_config(const MetricsConfig &config)
        {
            std::vector<correlation::Feature> features;
            for (const auto &name : config.correlation.features)
            {
                features.push_back(correlation::parse_feature(name));
            }
            return MetricsPipeline(config.rolling.window, features, config.correlation.symbol_correlation);
        }

        MetricsReport MetricsPipeline::run(const PricePanel &panel) const
        {
            MetricsReport report;

            ReturnsResult returns = ReturnsCalculator::compute(panel);
            report.derived = std::move(returns.derived);
            report.issues = std::move(returns.issues);

            report.monthly = PeriodicAggregator::monthly(report.derived);
            report.yearly = PeriodicAggregator::yearly(report.derived);

            report.rolling = rolling_.compute(report.derived, WindowAlignment::TRAILING);
            report.yearly_volatility = rolling_.yearly_volatility(report.derived);
            report.volume_summary = RollingWindowEngine::yearly_volume(report.derived);

            auto feature_rows = correlation::CorrelationEngine::build_features(report.derived, report.rolling);
            report.pooled_rows = feature_rows.size();
            report.correlation = correlation_.compute(feature_rows);

            if (symbol_correlation_)
            {
                report.symbol_correlation = correlation::SymbolCorrelation::compute(report.derived);
            }

            return report;
        }

        // ===================================================================
        // MetricsReport
        // ===================================================================

        std::vector<std::string> MetricsReport::export_to_csv(const std::string &directory, int precision) const
        {
            namespace fs = std::filesystem;

            std::error_code ec;
            fs::create_directories(directory, ec);
            if (ec)
            {
                throw std::runtime_error("Could not create output directory " + directory + ": " + ec.message());
            }

            const fs::path dir(directory);
            const CellFormatter cell(precision);
            std::vector<std::string> written;

            {
                auto path = dir / "derived_prices.csv";
                auto file = open_table(path, "symbol,date,open,high,low,close,adjusted,volume,previous_adjusted,daily_return");
                for (const auto &row : derived)
                {
                    file << text(row.symbol) << "," << row.date << ","
                         << cell(row.open) << "," << cell(row.high) << ","
                         << cell(row.low) << "," << cell(row.close) << ","
                         << cell(row.adjusted) << "," << cell(row.volume) << ","
                         << cell(row.previous_adjusted) << "," << cell(row.daily_return) << "\n";
                }
                written.push_back(path.string());
            }

            {
                auto path = dir / "monthly_bars.csv";
                auto file = open_table(path, "symbol,year,month,monthly_open,monthly_close,monthly_return");
                for (const auto &bar : monthly)
                {
                    file << text(bar.symbol) << "," << bar.year << "," << bar.month << ","
                         << cell(bar.monthly_open) << "," << cell(bar.monthly_close) << ","
                         << cell(bar.monthly_return) << "\n";
                }
                written.push_back(path.string());
            }

            {
                auto path = dir / "yearly_bars.csv";
                auto file = open_table(path, "symbol,year,yearly_open,yearly_close,previous_close,yearly_return");
                for (const auto &bar : yearly)
                {
                    file << text(bar.symbol) << "," << bar.year << ","
                         << cell(bar.yearly_open) << "," << cell(bar.yearly_close) << ","
                         << cell(bar.previous_close) << "," << cell(bar.yearly_return) << "\n";
                }
                written.push_back(path.string());
            }

            {
                auto path = dir / "rolling_stats.csv";
                auto file = open_table(path, "symbol,date,rolling_volatility,rolling_volume");
                for (const auto &stat : rolling)
                {
                    file << text(stat.symbol) << "," << stat.date << ","
                         << cell(stat.rolling_volatility) << "," << cell(stat.rolling_volume) << "\n";
                }
                written.push_back(path.string());
            }

            {
                auto path = dir / "yearly_volatility.csv";
                auto file = open_table(path, "symbol,year,avg_volatility,max_volatility");
                for (const auto &summary : yearly_volatility)
                {
                    file << text(summary.symbol) << "," << summary.year << ","
                         << cell(summary.avg_volatility) << "," << cell(summary.max_volatility) << "\n";
                }
                written.push_back(path.string());
            }

            {
                auto path = dir / "volume_summary.csv";
                auto file = open_table(path, "symbol,year,avg_volume,max_volume");
                for (const auto &summary : volume_summary)
                {
                    file << text(summary.symbol) << "," << summary.year << ","
                         << cell(summary.avg_volume) << "," << cell(summary.max_volume) << "\n";
                }
                written.push_back(path.string());
            }

            {
                auto path = dir / "correlation_matrix.csv";
                write_matrix(path, correlation, cell);
                written.push_back(path.string());
            }

            {
                auto path = dir / "correlation_long.csv";
                auto file = open_table(path, "row_feature,col_feature,value");
                for (const auto &entry : correlation.melt())
                {
                    file << text(entry.row_feature) << "," << text(entry.col_feature) << "," << cell(entry.value) << "\n";
                }
                written.push_back(path.string());
            }

            {
                auto path = dir / "row_issues.csv";
                auto file = open_table(path, "symbol,date,kind,message");
                for (const auto &issue : issues)
                {
                    file << text(issue.symbol) << "," << issue.date << "," << to_string(issue.kind)
                         << "," << text(issue.message) << "\n";
                }
                written.push_back(path.string());
            }

            if (symbol_correlation)
            {
                auto path = dir / "symbol_correlation.csv";
                write_matrix(path, *symbol_correlation, cell);
                written.push_back(path.string());
            }

            return written;
        }

        void MetricsReport::print_summary(bool verbose) const
        {
            std::cout << "\n=== Metrics Summary ===\n";
            std::cout << "Daily rows:           " << derived.size() << "\n";
            std::cout << "Excluded rows:        " << issues.size() << "\n";
            std::cout << "Monthly bars:         " << monthly.size() << "\n";
            std::cout << "Yearly bars:          " << yearly.size() << "\n";
            std::cout << "Rolling stats:        " << rolling.size() << "\n";
            std::cout << "Yearly volatility:    " << yearly_volatility.size() << "\n";
            std::cout << "Correlation rows:     " << correlation.observations
                      << " of " << pooled_rows << " (complete cases)\n";

            if (verbose && !issues.empty())
            {
                std::cout << "\nExcluded rows:\n";
                for (const auto &issue : issues)
                {
                    std::cout << "  " << std::setw(8) << std::left << issue.symbol << std::right
                              << " " << issue.date << "  " << to_string(issue.kind)
                              << ": " << issue.message << "\n";
                }
            }

            std::cout << "\nFeature correlation:\n";
            correlation.print(std::cout);

            if (symbol_correlation)
            {
                std::cout << "\nSymbol correlation (daily_return, "
                          << symbol_correlation->observations << " dates):\n";
                symbol_correlation->print(std::cout);
            }

            std::cout << "=======================\n"
                      << std::endl;
        }

    } // namespace analytics
} // namespace stockmetrics
