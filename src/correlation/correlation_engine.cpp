/**
 * @file correlation_engine.cpp
 * @brief Implementation of the CorrelationEngine class.
 */

#include "correlation/correlation_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <map>
#include <ostream>
#include <set>
#include <stdexcept>
#include <utility>

namespace stockmetrics
{
    namespace correlation
    {

        // ===================================================================
        // Feature schema
        // ===================================================================

        const std::vector<Feature> &all_features()
        {
            static const std::vector<Feature> FEATURES = {
                Feature::CLOSE,
                Feature::DAILY_RETURN,
                Feature::DAILY_RANGE,
                Feature::VOLUME,
                Feature::ROLLING_VOLUME,
                Feature::ROLLING_VOLATILITY};
            return FEATURES;
        }

        std::string feature_name(Feature feature)
        {
            switch (feature)
            {
            case Feature::CLOSE:
                return "close";
            case Feature::DAILY_RETURN:
                return "daily_return";
            case Feature::DAILY_RANGE:
                return "daily_range";
            case Feature::VOLUME:
                return "volume";
            case Feature::ROLLING_VOLUME:
                return "rolling_volume";
            case Feature::ROLLING_VOLATILITY:
                return "rolling_volatility";
            }
            return "unknown";
        }

        Feature parse_feature(const std::string &name)
        {
            for (Feature feature : all_features())
            {
                if (feature_name(feature) == name)
                {
                    return feature;
                }
            }
            throw std::invalid_argument("Unknown correlation feature: " + name);
        }

        bool FeatureRow::is_complete(const std::vector<Feature> &features) const
        {
            return std::none_of(features.begin(), features.end(),
                                [this](Feature f)
                                { return !std::isfinite(value(f)); });
        }

        // ===================================================================
        // CorrelationMatrix
        // ===================================================================

        double CorrelationMatrix::at(const std::string &row, const std::string &col) const
        {
            auto r = std::find(labels.begin(), labels.end(), row);
            auto c = std::find(labels.begin(), labels.end(), col);
            if (r == labels.end())
            {
                throw std::invalid_argument("Label not found: " + row);
            }
            if (c == labels.end())
            {
                throw std::invalid_argument("Label not found: " + col);
            }
            return values(std::distance(labels.begin(), r), std::distance(labels.begin(), c));
        }

        std::vector<CorrelationEntry> CorrelationMatrix::melt() const
        {
            std::vector<CorrelationEntry> entries;
            entries.reserve(labels.size() * labels.size());
            for (size_t i = 0; i < labels.size(); ++i)
            {
                for (size_t j = 0; j < labels.size(); ++j)
                {
                    entries.push_back({labels[i], labels[j], values(i, j)});
                }
            }
            return entries;
        }

        void CorrelationMatrix::print(std::ostream &os) const
        {
            size_t width = 8;
            for (const auto &label : labels)
            {
                width = std::max(width, label.size() + 2);
            }

            os << std::setw(width) << "";
            for (const auto &label : labels)
            {
                os << std::setw(width) << label;
            }
            os << "\n";

            for (size_t i = 0; i < labels.size(); ++i)
            {
                os << std::setw(width) << labels[i];
                for (size_t j = 0; j < labels.size(); ++j)
                {
                    if (is_null(values(i, j)))
                    {
                        os << std::setw(width) << "NA";
                    }
                    else
                    {
                        os << std::setw(width) << std::fixed << std::setprecision(3) << values(i, j);
                    }
                }
                os << "\n";
            }
        }

        // ===================================================================
        // CorrelationEngine
        // ===================================================================

        CorrelationEngine::CorrelationEngine(std::vector<Feature> features) : features_(std::move(features))
        {
            if (features_.empty())
            {
                throw std::invalid_argument("Correlation requires at least one feature");
            }
            std::set<Feature> seen(features_.begin(), features_.end());
            if (seen.size() != features_.size())
            {
                throw std::invalid_argument("Correlation feature list contains duplicates");
            }
        }

        std::vector<FeatureRow> CorrelationEngine::build_features(
            const std::vector<analytics::DerivedPricePoint> &rows,
            const std::vector<analytics::RollingStat> &trailing_stats)
        {
            std::map<std::pair<std::string, std::string>, const analytics::RollingStat *> stat_index;
            for (const auto &stat : trailing_stats)
            {
                stat_index[std::make_pair(stat.symbol, stat.date)] = &stat;
            }

            std::vector<FeatureRow> features;
            features.reserve(rows.size());

            for (const auto &entry : analytics::partition_by_symbol(rows))
            {
                for (const auto &row : entry.second)
                {
                    FeatureRow feature_row;
                    feature_row.symbol = row.symbol;
                    feature_row.date = row.date;
                    feature_row.values.fill(null_value());

                    feature_row.values[static_cast<size_t>(Feature::CLOSE)] = row.close;
                    feature_row.values[static_cast<size_t>(Feature::DAILY_RETURN)] = row.daily_return;
                    feature_row.values[static_cast<size_t>(Feature::DAILY_RANGE)] = row.high - row.low;
                    feature_row.values[static_cast<size_t>(Feature::VOLUME)] = row.volume;

                    auto it = stat_index.find(std::make_pair(row.symbol, row.date));
                    if (it != stat_index.end())
                    {
                        feature_row.values[static_cast<size_t>(Feature::ROLLING_VOLUME)] = it->second->rolling_volume;
                        feature_row.values[static_cast<size_t>(Feature::ROLLING_VOLATILITY)] = it->second->rolling_volatility;
                    }

                    features.push_back(feature_row);
                }
            }

            return features;
        }

        std::vector<FeatureRow> CorrelationEngine::complete_cases(const std::vector<FeatureRow> &rows) const
        {
            std::vector<FeatureRow> complete;
            complete.reserve(rows.size());
            for (const auto &row : rows)
            {
                if (row.is_complete(features_))
                {
                    complete.push_back(row);
                }
            }
            return complete;
        }

        CorrelationMatrix CorrelationEngine::compute(const std::vector<FeatureRow> &rows) const
        {
            auto complete = complete_cases(rows);

            Eigen::MatrixXd data(complete.size(), features_.size());
            for (size_t i = 0; i < complete.size(); ++i)
            {
                for (size_t j = 0; j < features_.size(); ++j)
                {
                    data(i, j) = complete[i].value(features_[j]);
                }
            }

            std::vector<std::string> labels;
            labels.reserve(features_.size());
            for (Feature feature : features_)
            {
                labels.push_back(feature_name(feature));
            }

            return correlate_columns(data, labels);
        }

        CorrelationMatrix CorrelationEngine::correlate_columns(const Eigen::MatrixXd &data,
                                                               const std::vector<std::string> &labels)
        {
            if (static_cast<size_t>(data.cols()) != labels.size())
            {
                throw std::invalid_argument(
                    "Label count (" + std::to_string(labels.size()) + ") must match column count (" + std::to_string(data.cols()) + ")");
            }

            const int k = static_cast<int>(data.cols());

            CorrelationMatrix result;
            result.labels = labels;
            result.observations = static_cast<size_t>(data.rows());
            result.values = Eigen::MatrixXd::Identity(k, k);

            for (int i = 0; i < k; ++i)
            {
                for (int j = i + 1; j < k; ++j)
                {
                    double r = pearson(data.col(i), data.col(j));
                    result.values(i, j) = r;
                    result.values(j, i) = r;
                }
            }

            return result;
        }

        double CorrelationEngine::pearson(const Eigen::VectorXd &x, const Eigen::VectorXd &y)
        {
            if (x.size() != y.size())
            {
                throw std::invalid_argument("Pearson samples must have equal length");
            }
            if (x.size() < 2)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }

            Eigen::ArrayXd dx = x.array() - x.mean();
            Eigen::ArrayXd dy = y.array() - y.mean();

            double sxx = (dx * dx).sum();
            double syy = (dy * dy).sum();
            if (!std::isfinite(sxx) || !std::isfinite(syy) || sxx < 1e-18 || syy < 1e-18)
            {
                return std::numeric_limits<double>::quiet_NaN();
            }

            double r = (dx * dy).sum() / std::sqrt(sxx * syy);
            if (!std::isfinite(r))
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            // Rounding can leave r a hair outside [-1, 1]
            return std::max(-1.0, std::min(1.0, r));
        }

    } // namespace correlation
} // namespace stockmetrics
